#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"

#include <climits>
#include <memory>

static bool match_glob(const std::string& name, const std::string& pat) {
    // Very simple glob: * and ? only, no character classes
    size_t n = 0, p = 0, star = std::string::npos, match = 0;
    while (n < name.size()) {
        if (p < pat.size() && (pat[p] == '?' || pat[p] == name[n])) { ++n; ++p; }
        else if (p < pat.size() && pat[p] == '*') { star = p++; match = n; }
        else if (star != std::string::npos) { p = star + 1; n = ++match; }
        else return false;
    }
    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

class Find : public ICommand {
public:
    std::string name() const override { return "find"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "find [PATH] [-name PATTERN] [-type f|d] [-maxdepth N]";
        h.description = "Search for files in the workspace";
        h.flags = {
            {"-name PATTERN", "Match basename against PATTERN (* and ?)"},
            {"-iname PATTERN", "Like -name, ignoring case"},
            {"-o, -or", "Combine several -name patterns (any may match)"},
            {"-type f|d", "Only files (f) or directories (d)"},
            {"-maxdepth NUM", "Descend at most NUM levels below the start path"},
            {"-size [+|-]N", "File size in bytes: + greater, - less, exact otherwise"},
        };
        h.examples = {
            {"find . -name \"*.json\"", "Find all JSON files"},
            {"find . -type d", "Find all directories"},
            {"find reports -name \"*.csv\" -type f", "Find CSV files in reports"},
        };
        h.notes = {
            "Defaults to workspace root if no path given",
            "Searches recursively",
            "All paths are relative; absolute paths (starting with /) are not allowed",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        std::string base = ".";
        std::vector<std::string> patterns;
        bool icase = false;
        char type_filter = 0;
        long maxdepth = LONG_MAX;
        int size_mode = 0;  // -1: <, 0: ==, +1: >
        std::optional<long> size_filter;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            auto next = [&]() -> const std::string* {
                if (i + 1 >= args.size()) return nullptr;
                return &args[++i];
            };
            if (a == "-name" || a == "-iname") {
                auto v = next();
                if (!v) return ShellResult::fail("find: missing argument to `" + a + "'");
                if (a == "-iname") icase = true;
                patterns.push_back(*v);
            } else if (a == "-type") {
                auto v = next();
                if (!v || (*v != "f" && *v != "d")) return ShellResult::fail("find: -type expects f or d");
                type_filter = (*v)[0];
            } else if (a == "-maxdepth") {
                auto v = next();
                auto n = v ? parse_long(*v) : std::nullopt;
                if (!n || *n < 0) return ShellResult::fail("find: invalid argument to -maxdepth");
                maxdepth = *n;
            } else if (a == "-size") {
                auto v = next();
                if (!v || v->empty()) return ShellResult::fail("find: missing argument to `-size'");
                std::string s = *v;
                if (s[0] == '+' || s[0] == '-') { size_mode = s[0] == '+' ? 1 : -1; s = s.substr(1); }
                auto n = parse_long(s);
                if (!n) return ShellResult::fail("find: invalid argument `" + *v + "' to -size");
                size_filter = *n;
            } else if (a == "-o" || a == "-or") {
                // several -name patterns are OR'd
            } else if (!a.empty() && a[0] == '-') {
                return ShellResult::fail("find: unknown predicate `" + a + "'");
            } else {
                base = a;
            }
        }

        while (base.size() > 1 && base.back() == '/') base.pop_back();
        if (!ctx.vfs.exists(base)) return ShellResult::fail("find: '" + base + "': No such file or directory");

        auto accepts = [&](const std::string& path, bool is_dir) {
            if (type_filter == 'f' && is_dir) return false;
            if (type_filter == 'd' && !is_dir) return false;
            if (!patterns.empty()) {
                auto name = basename_of(path);
                if (icase) name = to_lower(name);
                bool any = false;
                for (auto& p : patterns) {
                    if (match_glob(name, icase ? to_lower(p) : p)) { any = true; break; }
                }
                if (!any) return false;
            }
            if (size_filter) {
                if (is_dir) return false;
                auto sz = ctx.vfs.size(path);
                long s = sz ? static_cast<long>(*sz) : 0;
                if (size_mode > 0 && !(s > *size_filter)) return false;
                if (size_mode < 0 && !(s < *size_filter)) return false;
                if (size_mode == 0 && s != *size_filter) return false;
            }
            return true;
        };

        std::vector<std::string> found;
        walk(ctx.vfs, base, 1, maxdepth, found, accepts);
        std::sort(found.begin(), found.end());

        std::string out;
        if (accepts(base, ctx.vfs.isDirectory(base))) out += base + "\n";
        for (auto& f : found) out += f + "\n";
        return ShellResult::ok(out);
    }

private:
    template <typename Pred>
    static void walk(const IVfs& vfs, const std::string& dir, long depth, long maxdepth,
                     std::vector<std::string>& found, Pred& accepts) {
        if (depth > maxdepth || !vfs.isDirectory(dir)) return;
        for (auto entry : vfs.list(dir)) {
            bool is_dir = !entry.empty() && entry.back() == '/';
            if (is_dir) entry.pop_back();
            std::string path = dir == "." ? entry : dir + "/" + entry;
            if (accepts(path, is_dir)) found.push_back(path);
            if (is_dir) walk(vfs, path, depth + 1, maxdepth, found, accepts);
        }
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_find(){ return std::make_unique<Find>(); } }
