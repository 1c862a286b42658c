#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"

#include <memory>

class Ls : public ICommand {
public:
    std::string name() const override { return "ls"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "ls [OPTIONS] [PATH...]";
        h.description = "List directory contents";
        h.flags = {
            {"-l", "Long format (type, size, name)"},
            {"-a", "Show hidden entries (starting with .)"},
        };
        h.examples = {
            {"ls", "List workspace root"},
            {"ls -la reports", "Long listing including hidden entries"},
            {"ls *.json", "List JSON files"},
        };
        h.notes = {"Directories are shown with a trailing /"};
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool opt_l = false;
        bool opt_a = false;
        std::vector<std::string> paths;
        for (const auto& a : args) {
            if (a.size() > 1 && a[0] == '-') {
                // allow combined flags, e.g., -la
                for (size_t j = 1; j < a.size(); ++j) {
                    if (a[j] == 'l') opt_l = true;
                    else if (a[j] == 'a' || a[j] == 'A') opt_a = true;
                    else if (a[j] == '1' || a[j] == 'h') continue;
                    else return ShellResult::fail(std::string("ls: unknown option -") + a[j], 2);
                }
            } else {
                paths.push_back(a);
            }
        }
        if (paths.empty()) paths.push_back(".");

        std::string out;
        for (const auto& path : paths) {
            if (path.find('*') != std::string::npos) {
                auto matches = ctx.vfs.glob(path);
                if (matches.empty()) return ShellResult::fail("ls: " + path + ": No matches found");
                for (auto& m : matches) out += format(ctx.vfs, m, m, opt_l);
                continue;
            }
            if (!ctx.vfs.exists(path)) return ShellResult::fail("ls: " + path + ": No such file or directory");
            if (!ctx.vfs.isDirectory(path)) {
                out += format(ctx.vfs, path, path, opt_l);
                continue;
            }
            for (auto& entry : ctx.vfs.list(path)) {
                if (!opt_a && !entry.empty() && entry[0] == '.') continue;
                std::string full = path == "." ? entry : path + "/" + entry;
                out += format(ctx.vfs, entry, full, opt_l);
            }
        }
        return ShellResult::ok(out);
    }

private:
    static std::string format(const IVfs& vfs, const std::string& shown, const std::string& full, bool long_format) {
        if (!long_format) return shown + "\n";
        bool is_dir = !shown.empty() && shown.back() == '/';
        std::uintmax_t size = 0;
        if (!is_dir) {
            auto s = vfs.size(full);
            if (s) size = *s;
        }
        return std::string(is_dir ? "drwxr-xr-x" : "-rw-r--r--") + " " + pad_start(std::to_string(size), 8) + " " + shown + "\n";
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_ls(){ return std::make_unique<Ls>(); } }
