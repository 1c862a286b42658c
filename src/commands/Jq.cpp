#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"
#include "JqFilter.hpp"

#include <memory>

class Jq : public ICommand {
public:
    std::string name() const override { return "jq"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "jq [OPTIONS] FILTER [FILE]";
        h.description = "Process JSON data";
        h.flags = {
            {"-r", "Raw output (no quotes on strings)"},
            {"-c", "Compact output (single line)"},
        };
        h.examples = {
            {"cat data.json | jq '.items'", "Extract field"},
            {"cat data.json | jq '.items[]'", "Iterate array"},
            {"cat data.json | jq -r '.name'", "Raw string output"},
            {"cat data.json | jq '.items | length'", "Count array items"},
            {"jq '.items | select(.v > 2)' data.json", "Filter array elements"},
        };
        h.notes = {
            "Supports: field access (.foo), arrays ([]), index ([0]), keys, values, length",
            "Supports: select(.field == \"value\"), map(.field)",
            "Reads from stdin or file argument",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool raw = false, compact = false, have_filter = false;
        std::string filter = ".";
        std::vector<std::string> paths;

        for (const auto& a : args) {
            if (a == "--raw-output") { raw = true; continue; }
            if (a == "--compact-output") { compact = true; continue; }
            if (a.size() > 1 && a[0] == '-' && a[1] != '-') {
                for (size_t k = 1; k < a.size(); ++k) {
                    if (a[k] == 'r') raw = true;
                    else if (a[k] == 'c') compact = true;
                }
                continue;
            }
            if (!have_filter) { filter = a; have_filter = true; }
            else paths.push_back(a);
        }

        std::optional<std::string> input;
        if (!paths.empty()) {
            input = ctx.vfs.read(paths[0]);
            if (!input) return ShellResult::fail("jq: " + paths[0] + ": No such file");
        } else {
            input = ctx.input;
        }
        if (!input || trim(*input).empty()) return ShellResult::fail("jq: no input");

        try {
            jq::Json data = jq::Json::parse(*input);
            auto results = jq::run(data, filter);

            std::string out;
            for (const auto& item : results) {
                if (raw && item.is_string()) out += item.get<std::string>();
                else if (compact) out += item.dump();
                else out += item.dump(2);
                out += "\n";
            }
            return ShellResult::ok(out);
        } catch (const jq::Json::parse_error& e) {
            return ShellResult::fail(std::string("jq: invalid JSON input: ") + e.what());
        } catch (const std::exception& e) {
            return ShellResult::fail(std::string("jq: ") + e.what());
        }
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_jq(){ return std::make_unique<Jq>(); } }
