#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"

#include <cstdlib>
#include <memory>
#include <set>

namespace {

// Dictionary order close to a locale collation: letters compare without case
// first, then lowercase sorts before uppercase.
int collate(const std::string& a, const std::string& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        int ca = std::tolower(static_cast<unsigned char>(a[i]));
        int cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) return ca < cb ? -1 : 1;
    }
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    for (size_t i = 0; i < n; ++i) {
        bool la = std::islower(static_cast<unsigned char>(a[i])) != 0;
        bool lb = std::islower(static_cast<unsigned char>(b[i])) != 0;
        if (la != lb) return la ? -1 : 1;
    }
    return a.compare(b);
}

// Leading number as parseFloat reads it; 0 when there is none.
double leading_number(const std::string& s) {
    const char* p = s.c_str();
    char* end = nullptr;
    double v = std::strtod(p, &end);
    if (end == p || v != v) return 0.0;
    return v;
}

std::vector<std::string> split_fields(const std::string& line, const std::optional<std::string>& sep) {
    std::vector<std::string> out;
    if (sep && !sep->empty()) {
        size_t pos = 0;
        while (true) {
            size_t at = line.find(*sep, pos);
            if (at == std::string::npos) { out.push_back(line.substr(pos)); break; }
            out.push_back(line.substr(pos, at - pos));
            pos = at + sep->size();
        }
        return out;
    }
    // whitespace runs; a leading run yields an empty first field
    std::string cur;
    bool in_space = false;
    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) { out.push_back(cur); cur.clear(); in_space = true; }
        } else {
            cur += c;
            in_space = false;
        }
    }
    out.push_back(cur);
    return out;
}

}

class Sort : public ICommand {
public:
    std::string name() const override { return "sort"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "sort [OPTIONS] [FILE...]";
        h.description = "Sort lines of text";
        h.flags = {
            {"-r", "Reverse the result"},
            {"-n", "Compare according to numeric value"},
            {"-u", "Output only unique lines"},
            {"-t SEP", "Field separator"},
            {"-k N", "Sort by field N (1-based)"},
        };
        h.examples = {
            {"sort names.txt", "Sort lines alphabetically"},
            {"sort -r names.txt", "Sort in reverse order"},
            {"sort -n numbers.txt", "Sort numerically"},
            {"find . -type f | sort", "Sort piped input"},
            {"sort -u data.txt", "Sort and remove duplicates"},
            {"sort -t \",\" -k 2 data.csv", "Sort CSV by second column"},
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool reverse = false, numeric = false, unique = false;
        std::optional<std::string> sep;
        std::optional<long> field;
        std::vector<std::string> paths;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "-t" || a == "-k") {
                if (i + 1 >= args.size()) return ShellResult::fail("sort: option requires an argument -- '" + a.substr(1) + "'");
                const auto& v = args[++i];
                if (a == "-t") sep = v;
                else if (!(field = parse_key(v))) return ShellResult::fail("sort: invalid key '" + v + "'");
                continue;
            }
            if (starts_with(a, "-t") && a.size() > 2) { sep = a.substr(2); continue; }
            if (starts_with(a, "-k") && a.size() > 2) {
                if (!(field = parse_key(a.substr(2)))) return ShellResult::fail("sort: invalid key '" + a.substr(2) + "'");
                continue;
            }
            if (a.size() > 1 && a[0] == '-') {
                for (size_t k = 1; k < a.size(); ++k) {
                    if (a[k] == 'r') reverse = true;
                    else if (a[k] == 'n') numeric = true;
                    else if (a[k] == 'u') unique = true;
                }
                continue;
            }
            paths.push_back(a);
        }

        std::vector<std::string> lines;
        if (paths.empty()) {
            if (!ctx.input) return ShellResult::fail("sort: missing file operand");
            lines = text_lines(*ctx.input);
        } else {
            for (const auto& p : paths) {
                auto content = ctx.vfs.read(p);
                if (!content) return ShellResult::fail("sort: " + p + ": No such file");
                auto part = text_lines(*content);
                lines.insert(lines.end(), part.begin(), part.end());
            }
        }

        auto key_of = [&](const std::string& line) {
            if (!field) return line;
            auto parts = split_fields(line, sep);
            size_t idx = static_cast<size_t>(*field - 1);
            return idx < parts.size() ? parts[idx] : std::string();
        };

        std::stable_sort(lines.begin(), lines.end(), [&](const std::string& a, const std::string& b) {
            auto ka = key_of(a), kb = key_of(b);
            if (numeric) return leading_number(ka) < leading_number(kb);
            return collate(ka, kb) < 0;
        });
        if (reverse) std::reverse(lines.begin(), lines.end());

        if (unique) {
            std::set<std::string> seen;
            std::vector<std::string> kept;
            for (auto& l : lines) {
                if (seen.insert(l).second) kept.push_back(l);
            }
            lines.swap(kept);
        }

        return ShellResult::ok(lines.empty() ? std::string() : join(lines, "\n") + "\n");
    }

private:
    // "2" or "2,2": the leading field number
    static std::optional<long> parse_key(const std::string& v) {
        auto comma = v.find(',');
        auto n = parse_long(comma == std::string::npos ? v : v.substr(0, comma));
        if (!n || *n < 1) return std::nullopt;
        return n;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_sort(){ return std::make_unique<Sort>(); } }
