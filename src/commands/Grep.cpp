#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/ShellConfig.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"
#include "RegexScan.hpp"

#include <memory>
#include <regex>
#include <set>

class Grep : public ICommand {
public:
    std::string name() const override { return "grep"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "grep [OPTIONS] PATTERN [FILE...]";
        h.description = "Search for patterns in files";
        h.flags = {
            {"-i", "Case insensitive search"},
            {"-n", "Show line numbers"},
            {"-r, -R", "Search directories recursively"},
            {"-l", "Only print names of files with matches"},
            {"-v", "Invert match (print non-matching lines)"},
            {"-E", "Extended regex (always on)"},
            {"-e PATTERN", "Use PATTERN as the pattern"},
        };
        h.examples = {
            {"grep error app.log", "Find lines containing 'error'"},
            {"grep -i todo *.md", "Case insensitive search in markdown files"},
            {"grep -rn 'function' src", "Recursive search with line numbers"},
            {"grep -l config data", "List files containing 'config'"},
            {"cat data.json | grep name", "Search piped input"},
        };
        h.notes = {
            "PATTERN is a regular expression (ECMAScript syntax)",
            "Exit code 1 means no lines matched",
            "Long lines are truncated and total output is capped",
            "Lines over 4096 characters are matched in overlapping 4096-character windows",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool icase = false, number = false, recursive = false, files_only = false, invert = false;
        std::optional<std::string> pattern;
        std::vector<std::string> paths;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "-e" && i + 1 < args.size() && !pattern) { pattern = args[++i]; continue; }
            if (a.size() > 1 && a[0] == '-' && !(a.size() > 1 && a[1] == '-')) {
                for (size_t k = 1; k < a.size(); ++k) {
                    switch (a[k]) {
                        case 'i': icase = true; break;
                        case 'n': number = true; break;
                        case 'r': case 'R': recursive = true; break;
                        case 'l': files_only = true; break;
                        case 'v': invert = true; break;
                        default: break; // -E and unknown flags
                    }
                }
                continue;
            }
            if (a.size() > 1 && a[0] == '-') continue;
            if (!pattern) pattern = a;
            else paths.push_back(a);
        }

        if (!pattern) return ShellResult::fail("grep: missing pattern");

        std::regex re;
        try {
            auto flags = std::regex::ECMAScript;
            if (icase) flags |= std::regex::icase;
            re = std::regex(*pattern, flags);
        } catch (const std::regex_error&) {
            return ShellResult::fail("grep: Invalid pattern: " + *pattern);
        }

        const Limits& limits = ctx.config.limits;
        std::string out, err;
        size_t budget_used = 0;
        bool truncated = false;
        bool matched = false;

        auto emit = [&](const std::string& line) {
            std::string text = truncate_line(line, limits.max_line_length) + "\n";
            if (budget_used + text.size() > limits.max_grep_output) {
                truncated = true;
                return;
            }
            budget_used += text.size();
            out += text;
        };

        auto scan = [&](const std::string& content, const std::string& prefix) -> bool {
            bool any = false;
            auto lines = text_lines(content);
            for (size_t i = 0; i < lines.size() && !truncated; ++i) {
                bool hit = RegexScan::search(lines[i], re) != invert;
                if (!hit) continue;
                any = true;
                if (files_only) break;
                emit(prefix + (number ? std::to_string(i + 1) + ":" : std::string()) + lines[i]);
            }
            return any;
        };

        try {
            if (paths.empty()) {
                if (ctx.input) matched = scan(*ctx.input, "");
                else if (recursive) paths.push_back(".");
            }

            const bool show_names = paths.size() > 1 || recursive;
            std::set<std::string> listed;
            for (const auto& path : paths) {
                if (truncated) break;
                std::vector<std::string> files;
                if (recursive && ctx.vfs.isDirectory(path)) {
                    std::string base = path;
                    while (base.size() > 1 && base.back() == '/') base.pop_back();
                    files = ctx.vfs.glob(base == "." ? "**/*" : base + "/**/*");
                } else {
                    files = expand_paths(ctx.vfs, path);
                    if (files.empty() || (files.size() == 1 && !ctx.vfs.exists(files[0]))) {
                        err += "grep: " + path + ": No such file or directory\n";
                        continue;
                    }
                }

                for (const auto& file : files) {
                    if (truncated) break;
                    if (ctx.vfs.isDirectory(file)) {
                        if (!recursive && path.find('*') == std::string::npos) err += "grep: " + file + ": Is a directory\n";
                        continue;
                    }
                    auto content = ctx.vfs.read(file);
                    if (!content) continue;
                    bool any = scan(*content, show_names ? file + ":" : std::string());
                    if (any) {
                        matched = true;
                        if (files_only && listed.insert(file).second) emit(file);
                    }
                }
            }
        } catch (const std::regex_error& e) {
            return ShellResult::fail(std::string("grep: regex error: ") + e.what());
        }

        if (truncated) {
            out += "[output truncated: exceeded " + std::to_string(limits.max_grep_output) + " characters]\n";
        }
        ShellResult r;
        r.exit_code = matched ? 0 : 1;
        r.out = out;
        if (!err.empty()) {
            err.pop_back();
            r.err = err;
        }
        return r;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_grep(){ return std::make_unique<Grep>(); } }
