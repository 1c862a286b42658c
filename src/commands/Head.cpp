#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/ShellConfig.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"

#include <memory>

class Head : public ICommand {
public:
    std::string name() const override { return "head"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "head [-n N] [FILE...]";
        h.description = "Output the first part of files";
        h.flags = {{"-n N", "Number of lines to show (default: 10)"}};
        h.examples = {
            {"head data.csv", "First 10 lines"},
            {"head -n 50 log.txt", "First 50 lines"},
            {"cat big.json | head -n 20", "First 20 lines of piped input"},
        };
        h.notes = {
            "Also accepts -NUM shorthand (e.g. head -5 file)",
            "Reads from stdin when no file given and input is piped",
            "Long lines are truncated",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        long count = 10;
        std::vector<std::string> paths;
        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "-n") {
                auto v = i + 1 < args.size() ? parse_long(args[++i]) : std::nullopt;
                if (!v || *v < 0) return ShellResult::fail("head: invalid number of lines");
                count = *v;
            } else if (a.size() > 1 && a[0] == '-') {
                auto v = parse_long(a.substr(a.compare(0, 2, "-n") == 0 ? 2 : 1));
                if (!v || *v < 0) return ShellResult::fail("head: invalid option '" + a + "'");
                count = *v;
            } else {
                paths.push_back(a);
            }
        }

        const size_t max_len = ctx.config.limits.max_line_length;
        auto take = [&](const std::string& content) {
            auto lines = text_lines(content);
            std::string out;
            for (size_t i = 0; i < lines.size() && static_cast<long>(i) < count; ++i) {
                out += truncate_line(lines[i], max_len) + "\n";
            }
            return out;
        };

        if (paths.empty()) {
            if (!ctx.input) return ShellResult::fail("head: missing file operand");
            return ShellResult::ok(take(*ctx.input));
        }

        std::string out;
        for (size_t i = 0; i < paths.size(); ++i) {
            auto content = ctx.vfs.read(paths[i]);
            if (!content) return ShellResult::fail("head: " + paths[i] + ": No such file");
            if (paths.size() > 1) out += (i ? "\n" : "") + std::string("==> ") + paths[i] + " <==\n";
            out += take(*content);
        }
        return ShellResult::ok(out);
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_head(){ return std::make_unique<Head>(); } }
