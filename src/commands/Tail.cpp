#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/ShellConfig.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"

#include <memory>

class Tail : public ICommand {
public:
    std::string name() const override { return "tail"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "tail [-n N] [FILE...]";
        h.description = "Output the last part of files";
        h.flags = {
            {"-n N", "Number of lines to show (default: 10)"},
            {"-n +N", "Output starting with line N"},
        };
        h.examples = {
            {"tail app.log", "Last 10 lines"},
            {"tail -n 100 app.log", "Last 100 lines"},
            {"tail -n +2 data.csv", "Everything after the header line"},
        };
        h.notes = {
            "Also accepts -NUM shorthand (e.g. tail -5 file)",
            "Reads from stdin when no file given and input is piped",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        long count = 10;
        bool from_start = false;
        std::vector<std::string> paths;

        auto parse_count = [&](const std::string& v) {
            std::string s = v;
            from_start = !s.empty() && s[0] == '+';
            if (from_start) s = s.substr(1);
            auto n = parse_long(s);
            if (!n || *n < 0) return false;
            count = *n;
            return true;
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "-n") {
                if (i + 1 >= args.size() || !parse_count(args[++i])) return ShellResult::fail("tail: invalid number of lines");
            } else if (a.size() > 1 && a[0] == '-') {
                if (!parse_count(a.substr(a.compare(0, 2, "-n") == 0 ? 2 : 1))) return ShellResult::fail("tail: invalid option '" + a + "'");
            } else {
                paths.push_back(a);
            }
        }

        const size_t max_len = ctx.config.limits.max_line_length;
        auto take = [&](const std::string& content) {
            auto lines = text_lines(content);
            size_t first;
            if (from_start) first = count > 0 ? static_cast<size_t>(count - 1) : 0;
            else first = lines.size() > static_cast<size_t>(count) ? lines.size() - static_cast<size_t>(count) : 0;
            std::string out;
            for (size_t i = first; i < lines.size(); ++i) out += truncate_line(lines[i], max_len) + "\n";
            return out;
        };

        if (paths.empty()) {
            if (!ctx.input) return ShellResult::fail("tail: missing file operand");
            return ShellResult::ok(take(*ctx.input));
        }

        std::string out;
        for (size_t i = 0; i < paths.size(); ++i) {
            auto content = ctx.vfs.read(paths[i]);
            if (!content) return ShellResult::fail("tail: " + paths[i] + ": No such file");
            if (paths.size() > 1) out += (i ? "\n" : "") + std::string("==> ") + paths[i] + " <==\n";
            out += take(*content);
        }
        return ShellResult::ok(out);
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_tail(){ return std::make_unique<Tail>(); } }
