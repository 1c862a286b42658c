#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/Environment.hpp"

#include <memory>

class EnvCmd : public ICommand {
public:
    std::string name() const override { return "env"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "env";
        h.description = "List available environment variables";
        h.examples = {{"env", "Show all environment variables"}};
        h.notes = {
            "Provider variables (e.g., API keys) show masked values (***)",
            "Runtime variables (set via VAR=value) show their actual values",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>&, CommandContext& ctx) override {
        std::string out;
        for (auto& kv : ctx.env.listing(ctx.env_provider)) out += kv.first + "=" + kv.second + "\n";
        return ShellResult::ok(out);
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_env(){ return std::make_unique<EnvCmd>(); } }
