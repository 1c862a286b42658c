#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"

#include <memory>

class Wc : public ICommand {
public:
    std::string name() const override { return "wc"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "wc [OPTIONS] [FILE...]";
        h.description = "Print line, word, and byte counts";
        h.flags = {
            {"-l", "Print line count only"},
            {"-w", "Print word count only"},
            {"-c", "Print byte count only"},
            {"-m", "Print character count only"},
        };
        h.examples = {
            {"wc file.txt", "Show all counts for file"},
            {"wc -l file.txt", "Count lines only"},
            {"cat file.txt | wc -l", "Count lines from stdin"},
        };
        h.notes = {"Lines are counted as newline characters, as POSIX wc does"};
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool lines = false, words = false, bytes = false, chars = false;
        std::vector<std::string> paths;
        for (const auto& a : args) {
            if (a.size() > 1 && a[0] == '-') {
                for (size_t k = 1; k < a.size(); ++k) {
                    switch (a[k]) {
                        case 'l': lines = true; break;
                        case 'w': words = true; break;
                        case 'c': bytes = true; break;
                        case 'm': chars = true; break;
                        default: return ShellResult::fail(std::string("wc: invalid option -- '") + a[k] + "'");
                    }
                }
                continue;
            }
            paths.push_back(a);
        }
        if (!lines && !words && !bytes && !chars) lines = words = bytes = true;

        Counts total;
        auto format = [&](const Counts& c, const std::string& label) {
            std::string out;
            if (lines) out += pad_start(std::to_string(c.lines), 8);
            if (words) out += pad_start(std::to_string(c.words), 8);
            if (chars) out += pad_start(std::to_string(c.chars), 8);
            if (bytes) out += pad_start(std::to_string(c.bytes), 8);
            if (!label.empty()) out += " " + label;
            return out + "\n";
        };

        if (paths.empty()) {
            if (!ctx.input) return ShellResult::fail("wc: missing file operand");
            return ShellResult::ok(format(count(*ctx.input), ""));
        }

        std::string out;
        for (const auto& p : paths) {
            auto content = ctx.vfs.read(p);
            if (!content) return ShellResult::fail("wc: " + p + ": No such file");
            auto c = count(*content);
            total.lines += c.lines;
            total.words += c.words;
            total.bytes += c.bytes;
            total.chars += c.chars;
            out += format(c, p);
        }
        if (paths.size() > 1) out += format(total, "total");
        return ShellResult::ok(out);
    }

private:
    struct Counts {
        size_t lines = 0, words = 0, bytes = 0, chars = 0;
    };

    static Counts count(const std::string& s) {
        Counts c;
        c.bytes = s.size();
        bool in_word = false;
        for (unsigned char ch : s) {
            if (ch == '\n') ++c.lines;
            if ((ch & 0xC0) != 0x80) ++c.chars;
            if (std::isspace(ch)) in_word = false;
            else if (!in_word) { in_word = true; ++c.words; }
        }
        return c;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_wc(){ return std::make_unique<Wc>(); } }
