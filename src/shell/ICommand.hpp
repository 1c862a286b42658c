#pragma once
#include <string>
#include <vector>

#include "ShellResult.hpp"

class CommandContext;

struct CommandFlag {
    std::string flag;
    std::string description;
};

struct CommandExample {
    std::string command;
    std::string description;
};

struct CommandHelp {
    std::string description;   // one line, shown by `help`
    std::string usage;
    std::vector<CommandFlag> flags;
    std::vector<CommandExample> examples;
    std::vector<std::string> notes;
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual std::string name() const = 0;
    virtual CommandHelp help() const = 0;
    virtual ShellResult execute(const std::vector<std::string>& args, CommandContext& context) = 0;
};
