#pragma once
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ICommand.hpp"

// Name -> handler table. Filled while the Shell is constructed and read-only
// afterwards, so handlers may keep a const reference to it.
class CommandRegistry {
public:
    // Returns true when an existing command of the same name was replaced.
    bool add(std::unique_ptr<ICommand> cmd);

    ICommand* find(const std::string& name) const;
    bool contains(const std::string& name) const { return commands_.count(name) != 0; }
    std::size_t size() const { return commands_.size(); }

    // Sorted command names.
    std::vector<std::string> names() const;
    // Sorted (name, one-line description) pairs.
    std::vector<std::pair<std::string, std::string>> summaries() const;

private:
    std::map<std::string, std::unique_ptr<ICommand>> commands_;
};
