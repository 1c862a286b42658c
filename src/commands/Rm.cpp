#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"

#include <memory>

class Rm : public ICommand {
public:
    std::string name() const override { return "rm"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "rm [-r] [-f] PATH...";
        h.description = "Remove files or directories";
        h.flags = {
            {"-r, -R", "Remove directories and their contents recursively"},
            {"-f", "Ignore nonexistent files"},
        };
        h.examples = {
            {"rm notes.txt", "Remove a file"},
            {"rm -rf old", "Remove a directory tree"},
            {"rm *.tmp", "Remove matching files"},
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool recursive = false, force = false;
        std::vector<std::string> paths;
        for (const auto& a : args) {
            if (a.size() > 1 && a[0] == '-') {
                for (size_t j = 1; j < a.size(); ++j) {
                    if (a[j] == 'r' || a[j] == 'R') recursive = true;
                    else if (a[j] == 'f') force = true;
                }
                continue;
            }
            paths.push_back(a);
        }
        if (paths.empty()) return ShellResult::fail("rm: missing operand");

        for (const auto& path : paths) {
            auto files = expand_paths(ctx.vfs, path);
            if (files.empty() && !force) return ShellResult::fail("rm: " + path + ": No such file or directory");
            for (const auto& file : files) {
                if (!ctx.vfs.exists(file)) {
                    if (!force) return ShellResult::fail("rm: " + file + ": No such file or directory");
                    continue;
                }
                if (ctx.vfs.isDirectory(file) && !recursive) return ShellResult::fail("rm: " + file + ": is a directory");
                ctx.vfs.remove(file);
            }
        }
        return ShellResult::ok();
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_rm(){ return std::make_unique<Rm>(); } }
