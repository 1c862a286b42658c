#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"

#include <memory>

class Mkdir : public ICommand {
public:
    std::string name() const override { return "mkdir"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "mkdir [-p] DIR...";
        h.description = "Create directories";
        h.flags = {{"-p", "No error if existing; parents are created as needed"}};
        h.examples = {
            {"mkdir reports", "Create a directory"},
            {"mkdir -p reports/2024/q1", "Create nested directories"},
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool parents = false;
        std::vector<std::string> paths;
        for (const auto& a : args) {
            if (a == "-p" || a == "--parents") parents = true;
            else if (!a.empty() && a[0] == '-') continue;
            else paths.push_back(a);
        }
        if (paths.empty()) return ShellResult::fail("mkdir: missing operand");

        for (const auto& p : paths) {
            if (ctx.vfs.exists(p)) {
                if (!parents || !ctx.vfs.isDirectory(p)) return ShellResult::fail("mkdir: " + p + ": File exists");
                continue;
            }
            try {
                ctx.vfs.mkdir(p);
            } catch (const std::exception& e) {
                return ShellResult::fail(std::string("mkdir: ") + e.what());
            }
        }
        return ShellResult::ok();
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_mkdir(){ return std::make_unique<Mkdir>(); } }
