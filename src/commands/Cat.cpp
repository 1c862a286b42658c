#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/ShellConfig.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"

#include <memory>

class Cat : public ICommand {
public:
    std::string name() const override { return "cat"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "cat [OPTIONS] [FILE...]";
        h.description = "Concatenate and print files";
        h.flags = {
            {"-n", "Show line numbers"},
            {"--offset N", "Start from line N (0-based)"},
            {"--limit N", "Max lines to show (default: 2000)"},
        };
        h.examples = {
            {"cat data.json", "Print file contents"},
            {"cat -n data.json", "Print with line numbers"},
            {"cat --offset 0 --limit 100 big.txt", "Read first 100 lines"},
            {"cat a.txt b.txt", "Concatenate multiple files"},
            {"cat *.json", "Print all JSON files"},
        };
        h.notes = {
            "Supports glob patterns (e.g. *.json)",
            "Reads from stdin when no files given and input is piped",
            "Large files require --offset/--limit for paginated access",
            "Long lines are truncated",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        if (args.empty() && ctx.input) return ShellResult::ok(*ctx.input);

        const Limits& limits = ctx.config.limits;
        bool number = false;
        std::optional<long> offset, limit;
        std::vector<std::string> paths;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "-n") { number = true; continue; }
            if (a == "--offset" || a == "--limit") {
                if (i + 1 >= args.size()) return ShellResult::fail("cat: option '" + a + "' requires an argument");
                auto v = parse_long(args[++i]);
                if (!v || *v < 0) return ShellResult::fail("cat: invalid number for " + a + ": '" + args[i] + "'");
                (a == "--offset" ? offset : limit) = *v;
                continue;
            }
            paths.push_back(a);
        }

        if (paths.empty()) return ShellResult::fail("cat: missing file operand");

        const bool paginated = offset || limit;
        std::string out;

        for (const auto& path : paths) {
            auto files = expand_paths(ctx.vfs, path);
            if (files.empty()) return ShellResult::fail("cat: " + path + ": No such file");

            for (const auto& file : files) {
                if (ctx.vfs.isDirectory(file)) return ShellResult::fail("cat: " + file + ": Is a directory");
                auto size = ctx.vfs.size(file);
                if (!size) return ShellResult::fail("cat: " + file + ": No such file");
                if (*size > limits.max_file_size && !paginated && !ctx.piped) {
                    return ShellResult::fail("cat: " + file + " (" + std::to_string(*size) + " bytes) exceeds max size ("
                        + std::to_string(limits.max_file_size) + " bytes). Use `head -n 2000 " + file
                        + "` to read the first 2000 lines, `tail -n 2000 " + file + "` for the last, or `grep \"pattern\" "
                        + file + "` to search.");
                }

                auto content = ctx.vfs.read(file);
                if (!content) return ShellResult::fail("cat: " + file + ": No such file");

                auto lines = text_lines(*content);
                const bool trailing_newline = !content->empty() && content->back() == '\n';
                const size_t total = lines.size();
                const size_t first = std::min(static_cast<size_t>(offset.value_or(0)), total);
                size_t count = total - first;
                bool cut_by_default = false;
                if (limit) {
                    count = std::min(count, static_cast<size_t>(*limit));
                } else if (!ctx.piped && count > limits.default_line_limit) {
                    count = limits.default_line_limit;
                    cut_by_default = true;
                }

                if (offset) {
                    out += "[Showing lines " + std::to_string(first + 1) + "-" + std::to_string(first + count)
                        + " of " + std::to_string(total) + "]\n";
                }

                for (size_t i = 0; i < count; ++i) {
                    if (i) out += "\n";
                    if (number) out += std::to_string(first + i + 1) + "\t";
                    out += truncate_line(lines[first + i], limits.max_line_length);
                }
                if (count > 0 && (trailing_newline || first + count < total)) out += "\n";
                if (cut_by_default) {
                    out += "[... showing first " + std::to_string(count) + " of " + std::to_string(total)
                        + " lines. Use --offset/--limit to read more]\n";
                }
            }
        }

        return ShellResult::ok(out);
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cat(){ return std::make_unique<Cat>(); } }
