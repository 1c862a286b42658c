#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "Helpers.hpp"

#include <ctime>
#include <memory>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

const char* const kDayNames[] = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};
const char* const kDayAbbr[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
const char* const kMonthNames[] = {"January", "February", "March", "April", "May", "June", "July",
                                   "August", "September", "October", "November", "December"};
const char* const kMonthAbbr[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

std::string pad(long n, size_t width = 2, char fill = '0') {
    return pad_start(std::to_string(n), width, fill);
}

std::tm broken_down(std::time_t t, bool utc) {
    std::tm tm{};
    if (utc) gmtime_r(&t, &tm);
    else localtime_r(&t, &tm);
    return tm;
}

std::string zone_field(const std::tm& tm, const char* fmt) {
    char buf[64];
    size_t n = std::strftime(buf, sizeof buf, fmt, &tm);
    return std::string(buf, n);
}

// strftime subset; unknown specifiers are copied through unchanged.
std::string format_time(const std::string& format, std::time_t t, bool utc) {
    std::tm tm = broken_down(t, utc);
    long y = tm.tm_year + 1900;
    int m = tm.tm_mon, d = tm.tm_mday, H = tm.tm_hour, M = tm.tm_min, S = tm.tm_sec, dow = tm.tm_wday;
    int h12 = H % 12 == 0 ? 12 : H % 12;
    const char* ampm = H < 12 ? "AM" : "PM";

    std::string out;
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%' || i + 1 >= format.size()) {
            out += format[i];
            continue;
        }
        char conv = format[++i];
        switch (conv) {
            case 'Y': out += std::to_string(y); break;
            case 'y': out += pad(y % 100); break;
            case 'm': out += pad(m + 1); break;
            case 'd': out += pad(d); break;
            case 'e': out += pad(d, 2, ' '); break;
            case 'H': out += pad(H); break;
            case 'M': out += pad(M); break;
            case 'S': out += pad(S); break;
            case 'I': out += pad(h12); break;
            case 'p': out += ampm; break;
            case 'P': out += H < 12 ? "am" : "pm"; break;
            case 'A': out += kDayNames[dow]; break;
            case 'a': out += kDayAbbr[dow]; break;
            case 'B': out += kMonthNames[m]; break;
            case 'b':
            case 'h': out += kMonthAbbr[m]; break;
            case 'u': out += std::to_string(dow == 0 ? 7 : dow); break;
            case 'w': out += std::to_string(dow); break;
            case 'j': out += pad(tm.tm_yday + 1, 3); break;
            case 'Z': out += utc ? "UTC" : zone_field(tm, "%Z"); break;
            case 'z': out += utc ? "+0000" : zone_field(tm, "%z"); break;
            case 's': out += std::to_string(static_cast<long long>(t)); break;
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case '%': out += '%'; break;
            case 'F': out += std::to_string(y) + "-" + pad(m + 1) + "-" + pad(d); break;
            case 'T': out += pad(H) + ":" + pad(M) + ":" + pad(S); break;
            case 'R': out += pad(H) + ":" + pad(M); break;
            case 'D': out += pad(m + 1) + "/" + pad(d) + "/" + pad(y % 100); break;
            case 'r': out += pad(h12) + ":" + pad(M) + ":" + pad(S) + " " + ampm; break;
            case 'c':
                out += std::string(kDayAbbr[dow]) + " " + kMonthAbbr[m] + " " + pad(d, 2, ' ') + " " +
                       pad(H) + ":" + pad(M) + ":" + pad(S) + " " + std::to_string(y);
                break;
            default: out += '%'; out += conv; break;
        }
    }
    return out;
}

// Same range as a JavaScript Date: +-8.64e15 ms.
constexpr long long kMaxEpochSeconds = 8640000000000LL;

struct DateParts {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    std::optional<long> offset;   // seconds east of UTC
};

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && is_leap(y) ? 29 : days[m - 1];
}

// Date-only forms are UTC; anything else without a zone is local time.
std::optional<std::time_t> to_time(const DateParts& p, bool utc_default) {
    if (p.month < 1 || p.month > 12 || p.day < 1 || p.day > days_in_month(p.year, p.month)) return std::nullopt;
    if (p.hour > 23 || p.minute > 59 || p.second > 59) return std::nullopt;

    std::tm tm{};
    tm.tm_year = p.year - 1900;
    tm.tm_mon = p.month - 1;
    tm.tm_mday = p.day;
    tm.tm_hour = p.hour;
    tm.tm_min = p.minute;
    tm.tm_sec = p.second;
    if (p.offset) return timegm(&tm) - *p.offset;
    if (utc_default) return timegm(&tm);
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

// "+05:30", "-0800", "+02" -> seconds east of UTC.
std::optional<long> numeric_offset(char sign, const std::string& hours, const std::string& minutes) {
    if (hours.empty() || hours.size() > 2 || minutes.size() > 2) return std::nullopt;
    long h = std::stol(hours);
    long m = minutes.empty() ? 0 : std::stol(minutes);
    if (h > 23 || m > 59) return std::nullopt;
    long offset = h * 3600 + m * 60;
    return sign == '-' ? -offset : offset;
}

std::optional<long> zone_name_offset(const std::string& word) {
    static const std::pair<const char*, long> zones[] = {
        {"z", 0}, {"ut", 0}, {"utc", 0}, {"gmt", 0},
        {"est", -5}, {"edt", -4}, {"cst", -6}, {"cdt", -5},
        {"mst", -7}, {"mdt", -6}, {"pst", -8}, {"pdt", -7},
    };
    for (auto& z : zones) {
        if (word == z.first) return z.second * 3600;
    }
    return std::nullopt;
}

// Full or abbreviated (three letters or more) name -> index.
std::optional<int> name_index(const std::string& word, const char* const* names, int count) {
    if (word.size() < 3) return std::nullopt;
    for (int i = 0; i < count; ++i) {
        std::string full = to_lower(names[i]);
        if (full.compare(0, word.size(), word) == 0) return i;
    }
    return std::nullopt;
}

int expand_year(const std::string& digits) {
    int y = std::stoi(digits);
    if (digits.size() <= 2) return y < 50 ? 2000 + y : 1900 + y;
    return y;
}

std::optional<std::time_t> parse_iso(const std::string& s) {
    static const std::regex iso(
        R"(^(\d{4})(?:-(\d{2})(?:-(\d{2}))?)?(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:[.,]\d+)?)?\s*(Z|[+-]\d{2}(?::?\d{2})?)?)?$)");
    std::smatch m;
    if (!std::regex_match(s, m, iso)) return std::nullopt;

    DateParts p;
    p.year = std::stoi(m[1].str());
    if (m[2].matched) p.month = std::stoi(m[2].str());
    if (m[3].matched) p.day = std::stoi(m[3].str());
    if (m[4].matched) {
        p.hour = std::stoi(m[4].str());
        p.minute = std::stoi(m[5].str());
        if (m[6].matched) p.second = std::stoi(m[6].str());
    }
    if (m[7].matched) {
        std::string zone = m[7].str();
        if (zone == "Z") {
            p.offset = 0;
        } else {
            std::string digits;
            for (char c : zone.substr(1)) if (c != ':') digits += c;
            p.offset = numeric_offset(zone[0], digits.substr(0, 2), digits.substr(2));
            if (!p.offset) return std::nullopt;
        }
    }
    return to_time(p, !m[4].matched);
}

// Free-form dates: "Jan 15 2024", "January 15, 2024 3:04 PM", "15-Jan-2024",
// "2024/01/15 10:30", "01/15/2024", "Mon, 15 Jan 2024 10:30:00 GMT",
// "Mon Jan 15 2024 10:30:00 GMT+0200 (CEST)".
std::optional<std::time_t> parse_free_form(const std::string& s) {
    DateParts p;
    std::optional<int> year, month, day;
    std::optional<bool> pm;
    bool have_time = false;
    bool have_zone = false;

    auto digits_at = [&](size_t& j) {
        std::string d;
        while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) d += s[j++];
        return d;
    };

    size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
            ++i;
        } else if (c == '(') {
            size_t close = s.find(')', i);
            if (close == std::string::npos) return std::nullopt;
            i = close + 1;
        } else if (std::isalpha(static_cast<unsigned char>(c))) {
            std::string word;
            while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i])))
                word += static_cast<char>(std::tolower(static_cast<unsigned char>(s[i++])));
            if (word == "am" || word == "pm") {
                if (!have_time || pm) return std::nullopt;
                pm = word == "pm";
            } else if (auto zone = zone_name_offset(word)) {
                p.offset = *zone;
                have_zone = true;
            } else if (auto mon = name_index(word, kMonthNames, 12)) {
                if (month) return std::nullopt;
                month = *mon + 1;
            } else if (!name_index(word, kDayNames, 7)) {
                return std::nullopt;
            }
        } else if ((c == '+' || c == '-') && (have_time || have_zone) &&
                   i + 1 < s.size() && std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
            ++i;
            std::string hours = digits_at(i), minutes;
            if (i < s.size() && s[i] == ':') {
                ++i;
                minutes = digits_at(i);
            } else if (hours.size() == 4) {
                minutes = hours.substr(2);
                hours = hours.substr(0, 2);
            }
            auto offset = numeric_offset(c, hours, minutes);
            if (!offset) return std::nullopt;
            p.offset = *offset;
            have_zone = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            std::string first = digits_at(i);
            if (first.size() > 4) return std::nullopt;
            if (i < s.size() && s[i] == ':') {
                if (have_time || first.size() > 2) return std::nullopt;
                have_time = true;
                p.hour = std::stoi(first);
                ++i;
                std::string mm = digits_at(i);
                if (mm.size() != 2) return std::nullopt;
                p.minute = std::stoi(mm);
                if (i < s.size() && s[i] == ':') {
                    ++i;
                    std::string ss = digits_at(i);
                    if (ss.size() != 2) return std::nullopt;
                    p.second = std::stoi(ss);
                    if (i < s.size() && s[i] == '.') {
                        ++i;
                        digits_at(i);
                    }
                }
            } else if (i + 1 < s.size() && (s[i] == '/' || s[i] == '-') &&
                       std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
                // Numeric date: Y/M/D when the first part has four digits, else M/D/Y.
                const char sep = s[i];
                std::vector<std::string> parts{first};
                while (i + 1 < s.size() && s[i] == sep && std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
                    ++i;
                    parts.push_back(digits_at(i));
                }
                if (parts.size() != 3 || year || month || day) return std::nullopt;
                for (auto& part : parts) {
                    if (part.size() > 4) return std::nullopt;
                }
                if (parts[0].size() == 4) {
                    year = std::stoi(parts[0]);
                    month = std::stoi(parts[1]);
                    day = std::stoi(parts[2]);
                } else {
                    month = std::stoi(parts[0]);
                    day = std::stoi(parts[1]);
                    year = expand_year(parts[2]);
                }
            } else if (first.size() <= 2 && !day && std::stoi(first) <= 31) {
                day = std::stoi(first);
            } else if (!year) {
                year = expand_year(first);
            } else {
                return std::nullopt;
            }
        } else if (c == '-' || c == '/' || c == '.') {
            ++i;
        } else {
            return std::nullopt;
        }
    }

    if (!year || !month) return std::nullopt;
    p.year = *year;
    p.month = *month;
    p.day = day.value_or(1);
    if (pm) {
        if (p.hour < 1 || p.hour > 12) return std::nullopt;
        p.hour = p.hour % 12 + (*pm ? 12 : 0);
    }
    return to_time(p, false);
}

// @EPOCH[.frac], ISO 8601, or the free-form shapes above. Numbers too large
// for the supported range are rejected.
std::optional<std::time_t> parse_date(const std::string& text) {
    static const std::regex epoch(R"(^@([+-]?)(\d{1,16})(?:\.\d*)?$)");
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    std::smatch m;
    if (std::regex_match(s, m, epoch)) {
        long long seconds = std::stoll(m[2].str());
        if (seconds > kMaxEpochSeconds) return std::nullopt;
        return static_cast<std::time_t>(m[1].str() == "-" ? -seconds : seconds);
    }
    if (s[0] == '@') return std::nullopt;
    if (auto t = parse_iso(s)) return t;
    return parse_free_form(s);
}

}

class Date : public ICommand {
public:
    std::string name() const override { return "date"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "date [OPTIONS] [+FORMAT]";
        h.description = "Display date and time";
        h.flags = {
            {"-u", "Display UTC time"},
            {"-d DATE", "Display specified date instead of current time"},
            {"-I", "Output in ISO 8601 format (same as +%Y-%m-%dT%H:%M:%S%z)"},
        };
        h.examples = {
            {"date", "Show current date and time"},
            {"date +%Y-%m-%d", "Show date in YYYY-MM-DD format"},
            {"date +%Y%m%d", "Show date as YYYYMMDD"},
            {"date -u", "Show current UTC date and time"},
            {"date -d '2024-01-15'", "Show a specific date"},
            {"date +%s", "Show Unix timestamp"},
        };
        h.notes = {
            "-d accepts ISO 8601 (2024-01-15, 2024-01-15T10:30:00.000Z), 2024/01/15, 01/15/2024,",
            "  month names (Jan 15 2024, January 15, 2024 3:00 PM, 15-Jan-2024), RFC 2822 and @EPOCH",
            "Date-only ISO forms are UTC; other forms without a zone are local time",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext&) override {
        bool utc = false, iso = false;
        std::optional<std::string> date_arg, format;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "-u" || a == "--utc") utc = true;
            else if (a == "-I" || a == "--iso-8601") iso = true;
            else if (a == "-d" || a == "--date") {
                if (i + 1 >= args.size()) return ShellResult::fail("date: option requires an argument -- d\n");
                date_arg = args[++i];
            } else if (starts_with(a, "--date=")) date_arg = a.substr(7);
            else if (starts_with(a, "+")) format = a.substr(1);
            else return ShellResult::fail("date: invalid option -- '" + a + "'\n");
        }

        std::time_t when = std::time(nullptr);
        if (date_arg) {
            std::optional<std::time_t> parsed;
            try {
                parsed = parse_date(*date_arg);
            } catch (const std::logic_error&) {
                // stoi/stoll range errors on malformed numbers
                parsed.reset();
            }
            if (!parsed) return ShellResult::fail("date: invalid date '" + *date_arg + "'\n");
            when = *parsed;
        }

        std::string fmt = iso ? "%Y-%m-%dT%H:%M:%S%z" : format ? *format : "%a %b %e %H:%M:%S %Z %Y";
        return ShellResult::ok(format_time(fmt, when, utc) + "\n");
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_date(){ return std::make_unique<Date>(); } }
