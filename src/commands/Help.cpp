#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../shell/CommandRegistry.hpp"
#include "Helpers.hpp"

#include <memory>

class Help : public ICommand {
public:
    explicit Help(const CommandRegistry& registry) : registry_(registry) {}

    std::string name() const override { return "help"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "help [COMMAND]";
        h.description = "Show available commands or detailed help for a specific command";
        h.examples = {
            {"help", "List all available commands"},
            {"help curl", "Show detailed help for curl"},
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext&) override {
        if (args.empty()) {
            std::vector<std::string> lines{"Available commands:\n"};
            for (auto& entry : registry_.summaries())
                lines.push_back("  " + pad_end(entry.first, 12) + " " + entry.second);
            lines.push_back("\nRun `help <command>` for detailed usage.");
            return ShellResult::ok(join(lines, "\n") + "\n");
        }

        const ICommand* cmd = registry_.find(args[0]);
        if (!cmd) return ShellResult::fail("help: unknown command '" + args[0] + "'");

        CommandHelp h = cmd->help();
        std::vector<std::string> lines;
        lines.push_back(args[0] + " - " + h.description);
        lines.push_back("\nUsage: " + h.usage);
        if (!h.flags.empty()) {
            lines.push_back("\nFlags:");
            for (auto& f : h.flags) lines.push_back("  " + pad_end(f.flag, 20) + " " + f.description);
        }
        if (!h.examples.empty()) {
            lines.push_back("\nExamples:");
            for (auto& e : h.examples) {
                lines.push_back("  " + e.command);
                lines.push_back("      " + e.description);
            }
        }
        if (!h.notes.empty()) {
            lines.push_back("\nNotes:");
            for (auto& n : h.notes) lines.push_back("  - " + n);
        }
        return ShellResult::ok(join(lines, "\n") + "\n");
    }

private:
    const CommandRegistry& registry_;
};

namespace Builtins {
std::unique_ptr<ICommand> make_help(const CommandRegistry& registry){ return std::make_unique<Help>(registry); }
}
