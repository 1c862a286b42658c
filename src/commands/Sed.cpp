#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"
#include "SedScript.hpp"

#include <memory>

class Sed : public ICommand {
public:
    std::string name() const override { return "sed"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "sed [OPTIONS] SCRIPT [FILE...]";
        h.description = "Stream editor for filtering and transforming text";
        h.flags = {
            {"-e SCRIPT", "Add script commands (can be repeated)"},
            {"-n", "Suppress automatic printing of lines"},
            {"-i", "Edit files in-place"},
            {"-E, -r", "Use extended regular expressions"},
        };
        h.examples = {
            {"sed 's/old/new/' file.txt", "Replace first occurrence per line"},
            {"sed 's/old/new/g' file.txt", "Replace all occurrences"},
            {"sed 's/<tag>//g;s/<\\/tag>//g'", "Chain multiple substitutions with ;"},
            {"sed -e 's/a/b/' -e 's/c/d/' file.txt", "Multiple -e expressions"},
            {"sed '/pattern/d' file.txt", "Delete lines matching pattern"},
            {"sed -n '/pattern/p' file.txt", "Print only matching lines"},
            {"sed '1d' file.txt", "Delete first line"},
            {"sed '2,5d' file.txt", "Delete lines 2-5"},
            {"cat data | sed 's/foo/bar/g'", "Transform piped input"},
        };
        h.notes = {
            "Commands: s, d, p with addresses N, $, /regex/ and ranges a,b",
            "Ranges between regex addresses test each bound per line",
            "Without -E, ( ) { } + ? | are literal; use \\( \\) \\{ \\} for groups and intervals",
            "Lines over 4096 characters are matched in overlapping 4096-character windows",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool suppress = false, in_place = false, extended = false;
        std::vector<std::string> scripts;
        bool script_from_e = false;
        std::vector<std::string> paths;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "-n" || a == "--quiet" || a == "--silent") { suppress = true; continue; }
            if (a == "-i" || a == "--in-place") { in_place = true; continue; }
            if (a == "-E" || a == "-r") { extended = true; continue; }
            if (a == "-e") {
                if (i + 1 >= args.size()) return ShellResult::fail("sed: option requires an argument -- e\n");
                scripts.push_back(args[++i]);
                script_from_e = true;
                continue;
            }
            if (a.size() > 1 && a[0] == '-') continue;
            if (scripts.empty() && !script_from_e) scripts.push_back(a);
            else paths.push_back(a);
        }

        if (scripts.empty()) return ShellResult::fail("sed: no script specified\n");

        sed::Script script(extended);
        try {
            for (auto& s : scripts) script.add(s);
        } catch (const std::exception& e) {
            return ShellResult::fail(std::string("sed: ") + e.what() + "\n");
        }
        if (script.empty()) return ShellResult::fail("sed: no valid commands\n");

        if (paths.empty()) {
            if (!ctx.input) return ShellResult::fail("sed: no input files\n");
            return ShellResult::ok(script.run(*ctx.input, suppress));
        }

        std::string out;
        for (const auto& path : paths) {
            for (const auto& file : expand_paths(ctx.vfs, path)) {
                auto content = ctx.vfs.read(file);
                if (!content) return ShellResult::fail("sed: " + file + ": No such file\n");
                auto result = script.run(*content, suppress);
                if (in_place) ctx.vfs.write(file, result);
                else out += result;
            }
        }
        return ShellResult::ok(in_place ? std::string() : out);
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_sed(){ return std::make_unique<Sed>(); } }
