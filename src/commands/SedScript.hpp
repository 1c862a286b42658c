#pragma once
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

// Parser and line engine for the sed subset: [addr[,addr]]{s,d,p}.
namespace sed {

class SedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Address {
    enum class Kind { Line, Last, Regex };
    Kind kind = Kind::Line;
    long line = 0;
    std::optional<std::regex> regex;
};

struct Command {
    char type = 's';                 // 's', 'd' or 'p'
    std::optional<Address> first;
    std::optional<Address> last;     // set for ranges
    std::optional<std::regex> pattern;
    std::string replacement;         // std::regex_replace format string
    bool global = false;
    bool print = false;              // s///p
};

// Split on ';' without breaking inside /regex/ addresses or s commands.
std::vector<std::string> split_script(const std::string& script);

// Rewrite GNU basic-regex escapes (\( \) \{ \} \+ \? \|) as ECMAScript.
std::string translate_pattern(const std::string& pattern, bool extended);

// sed replacement text -> regex_replace format (& -> $&, \1 -> $1).
std::string translate_replacement(const std::string& replacement);

// One expression; throws SedError.
Command parse_command(const std::string& expr, bool extended);

class Script {
public:
    explicit Script(bool extended = false) : extended_(extended) {}

    // Adds every ';'-separated command of one -e script; throws SedError.
    void add(const std::string& script);
    bool empty() const { return commands_.empty(); }

    std::string run(const std::string& content, bool suppress_print) const;

private:
    bool matches(const Command& cmd, long line_no, long total, const std::string& line) const;

    bool extended_;
    std::vector<Command> commands_;
};

}
