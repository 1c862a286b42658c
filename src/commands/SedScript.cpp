#include "SedScript.hpp"
#include "RegexScan.hpp"

#include <cctype>
#include <limits>

namespace sed {

namespace {

std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

// Reads text up to the next unescaped delim starting at i; an escaped
// delimiter loses its backslash. Returns false when no delimiter closes it.
bool read_delimited(const std::string& expr, size_t& i, char delim, std::string& out) {
    while (i < expr.size()) {
        char c = expr[i];
        if (c == '\\' && i + 1 < expr.size()) {
            if (expr[i + 1] == delim) out += delim;
            else { out += c; out += expr[i + 1]; }
            i += 2;
            continue;
        }
        if (c == delim) { ++i; return true; }
        out += c;
        ++i;
    }
    return false;
}

std::regex make_regex(const std::string& pattern, bool extended, bool icase) {
    auto flags = std::regex::ECMAScript;
    if (icase) flags |= std::regex::icase;
    try {
        return std::regex(translate_pattern(pattern, extended), flags);
    } catch (const std::regex_error&) {
        throw SedError("invalid regex: '" + pattern + "'");
    }
}

std::optional<Address> parse_address(const std::string& expr, size_t& i, bool extended) {
    if (i >= expr.size()) return std::nullopt;
    if (expr[i] == '$') {
        ++i;
        Address a;
        a.kind = Address::Kind::Last;
        return a;
    }
    if (std::isdigit(static_cast<unsigned char>(expr[i]))) {
        long n = 0;
        while (i < expr.size() && std::isdigit(static_cast<unsigned char>(expr[i]))) {
            const int digit = expr[i] - '0';
            if (n > (std::numeric_limits<long>::max() - digit) / 10) throw SedError("invalid command: '" + expr + "'");
            n = n * 10 + digit;
            ++i;
        }
        Address a;
        a.kind = Address::Kind::Line;
        a.line = n;
        return a;
    }
    if (expr[i] == '/') {
        size_t j = i + 1;
        std::string pattern;
        if (!read_delimited(expr, j, '/', pattern)) throw SedError("unterminated address regex");
        i = j;
        Address a;
        a.kind = Address::Kind::Regex;
        a.regex = make_regex(pattern, extended, false);
        return a;
    }
    return std::nullopt;
}

}

std::vector<std::string> split_script(const std::string& script) {
    std::vector<std::string> parts;
    std::string cur;
    bool seen_command = false;
    size_t i = 0;
    const size_t n = script.size();

    while (i < n) {
        char c = script[i];
        if (c == ';' || c == '\n') {
            parts.push_back(cur);
            cur.clear();
            seen_command = false;
            ++i;
            continue;
        }
        if (!seen_command && c == '/') {
            // address regex, copied through its closing slash
            cur += c;
            ++i;
            while (i < n) {
                if (script[i] == '\\' && i + 1 < n) { cur += script[i]; cur += script[i + 1]; i += 2; continue; }
                cur += script[i];
                if (script[i++] == '/') break;
            }
            continue;
        }
        if (!seen_command && std::isalpha(static_cast<unsigned char>(c))) {
            seen_command = true;
            cur += c;
            ++i;
            if (c == 's' && i < n) {
                char delim = script[i];
                cur += delim;
                ++i;
                int closed = 0;
                while (i < n && closed < 2) {
                    if (script[i] == '\\' && i + 1 < n) { cur += script[i]; cur += script[i + 1]; i += 2; continue; }
                    if (script[i] == delim) ++closed;
                    cur += script[i++];
                }
            }
            continue;
        }
        cur += c;
        ++i;
    }
    if (!trim(cur).empty()) parts.push_back(cur);
    return parts;
}

std::string translate_pattern(const std::string& pattern, bool extended) {
    if (extended) return pattern;
    std::string out;
    out.reserve(pattern.size());
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size()) {
            char n = pattern[i + 1];
            if (n == '(' || n == ')' || n == '{' || n == '}' || n == '+' || n == '?' || n == '|') {
                out += n;
            } else {
                out += c;
                out += n;
            }
            ++i;
            continue;
        }
        if (c == '(' || c == ')' || c == '{' || c == '}' || c == '+' || c == '?' || c == '|') out += '\\';
        out += c;
    }
    return out;
}

std::string translate_replacement(const std::string& replacement) {
    std::string out;
    out.reserve(replacement.size() + 8);
    for (size_t i = 0; i < replacement.size(); ++i) {
        char c = replacement[i];
        if (c == '\\' && i + 1 < replacement.size()) {
            char n = replacement[++i];
            if (n == 'n') out += '\n';
            else if (n == 't') out += '\t';
            else if (n >= '1' && n <= '9') { out += '$'; out += n; }
            else if (n == '$') out += "$$";
            else out += n;
            continue;
        }
        if (c == '&') { out += "$&"; continue; }
        if (c == '$') { out += "$$"; continue; }
        out += c;
    }
    return out;
}

Command parse_command(const std::string& raw, bool extended) {
    const std::string expr = trim(raw);
    Command cmd;
    size_t i = 0;

    cmd.first = parse_address(expr, i, extended);
    if (cmd.first && i < expr.size() && expr[i] == ',') {
        ++i;
        cmd.last = parse_address(expr, i, extended);
        if (!cmd.last) throw SedError("invalid command: '" + expr + "'");
    }
    while (i < expr.size() && std::isspace(static_cast<unsigned char>(expr[i]))) ++i;
    if (i >= expr.size()) throw SedError("invalid command: '" + expr + "'");

    cmd.type = expr[i++];
    if (cmd.type == 'd' || cmd.type == 'p') {
        if (!trim(expr.substr(i)).empty()) throw SedError("invalid command: '" + expr + "'");
        return cmd;
    }
    if (cmd.type != 's' || i >= expr.size()) throw SedError("invalid command: '" + expr + "'");

    const char delim = expr[i++];
    if (delim == '\\' || delim == '\n' || std::isspace(static_cast<unsigned char>(delim))) {
        throw SedError("invalid command: '" + expr + "'");
    }
    std::string pattern, replacement;
    if (!read_delimited(expr, i, delim, pattern) || !read_delimited(expr, i, delim, replacement)) {
        throw SedError("unterminated `s' command: '" + expr + "'");
    }

    bool icase = false;
    for (; i < expr.size(); ++i) {
        char f = expr[i];
        if (f == 'g') cmd.global = true;
        else if (f == 'p') cmd.print = true;
        else if (f == 'i' || f == 'I') icase = true;
        else if (std::isspace(static_cast<unsigned char>(f))) continue;
        else throw SedError("unknown option to `s': '" + expr + "'");
    }

    cmd.pattern = make_regex(pattern, extended, icase);
    cmd.replacement = translate_replacement(replacement);
    return cmd;
}

void Script::add(const std::string& script) {
    for (auto& part : split_script(script)) {
        if (trim(part).empty()) continue;
        commands_.push_back(parse_command(part, extended_));
    }
}

bool Script::matches(const Command& cmd, long line_no, long total, const std::string& line) const {
    auto test = [&](const Address& a) {
        switch (a.kind) {
            case Address::Kind::Line: return line_no == a.line;
            case Address::Kind::Last: return line_no == total;
            case Address::Kind::Regex: return RegexScan::search(line, *a.regex);
        }
        return false;
    };
    if (!cmd.first) return true;
    if (!cmd.last) return test(*cmd.first);

    const Address& a = *cmd.first;
    const Address& b = *cmd.last;
    if (a.kind == Address::Kind::Line && b.kind == Address::Kind::Line) {
        return line_no >= a.line && line_no <= b.line;
    }
    if (a.kind == Address::Kind::Line && b.kind == Address::Kind::Last) {
        return line_no >= a.line;
    }
    // Other ranges test each bound on its own line.
    return test(a) || test(b);
}

std::string Script::run(const std::string& content, bool suppress_print) const {
    std::vector<std::string> lines;
    {
        size_t pos = 0;
        while (pos < content.size()) {
            size_t nl = content.find('\n', pos);
            if (nl == std::string::npos) { lines.push_back(content.substr(pos)); break; }
            lines.push_back(content.substr(pos, nl - pos));
            pos = nl + 1;
        }
    }

    const long total = static_cast<long>(lines.size());
    std::string out;
    for (long idx = 0; idx < total; ++idx) {
        std::string line = lines[static_cast<size_t>(idx)];
        const long line_no = idx + 1;
        bool deleted = false;

        for (const auto& cmd : commands_) {
            if (!matches(cmd, line_no, total, line)) continue;
            if (cmd.type == 's') {
                bool hit = false;
                std::string replaced = RegexScan::replace(line, *cmd.pattern, cmd.replacement, cmd.global, hit);
                if (hit) {
                    line = std::move(replaced);
                    if (cmd.print) { out += line; out += '\n'; }
                }
            } else if (cmd.type == 'd') {
                deleted = true;
                break;
            } else if (cmd.type == 'p') {
                out += line;
                out += '\n';
            }
        }

        if (!deleted && !suppress_print) {
            out += line;
            out += '\n';
        }
    }
    return out;
}

}
