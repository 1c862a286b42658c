#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"

#include <memory>

class Echo : public ICommand {
public:
    std::string name() const override { return "echo"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "echo [OPTIONS] [STRING...]";
        h.description = "Display text";
        h.flags = {
            {"-n", "Do not output trailing newline"},
            {"-e", "Interpret escape sequences (\\n, \\t, \\r, \\\\)"},
        };
        h.examples = {
            {"echo 'hello world'", "Print text with newline"},
            {"echo -n hello", "Print text without newline"},
            {"echo '{}' > data.json", "Write to file via redirection"},
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext&) override {
        bool newline = true, escapes = false;
        std::string text;
        bool first = true;
        for (const auto& a : args) {
            if (a == "-n") { newline = false; continue; }
            if (a == "-e") { escapes = true; continue; }
            if (a == "-ne" || a == "-en") { newline = false; escapes = true; continue; }
            if (!first) text += ' ';
            text += a;
            first = false;
        }

        if (escapes) text = interpret(text);
        if (newline) text += '\n';
        return ShellResult::ok(text);
    }

private:
    static std::string interpret(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\\' && i + 1 < s.size()) {
                char n = s[i + 1];
                if (n == 'n') { out += '\n'; ++i; continue; }
                if (n == 't') { out += '\t'; ++i; continue; }
                if (n == 'r') { out += '\r'; ++i; continue; }
                if (n == '\\') { out += '\\'; ++i; continue; }
            }
            out += s[i];
        }
        return out;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_echo(){ return std::make_unique<Echo>(); } }
