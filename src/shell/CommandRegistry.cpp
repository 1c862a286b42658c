#include "CommandRegistry.hpp"

#include <stdexcept>

#include "../core/Log.hpp"

bool CommandRegistry::add(std::unique_ptr<ICommand> cmd) {
    if (!cmd) throw std::invalid_argument("CommandRegistry::add: null command");
    std::string key = cmd->name();
    if (key.empty()) throw std::invalid_argument("CommandRegistry::add: command has no name");
    auto& slot = commands_[key];
    bool replaced = slot != nullptr;
    if (replaced) Log::info("command '" + key + "' replaced by host command");
    slot = std::move(cmd);
    return replaced;
}

ICommand* CommandRegistry::find(const std::string& name) const {
    auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : it->second.get();
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(commands_.size());
    for (auto& kv : commands_) out.push_back(kv.first);
    return out;
}

std::vector<std::pair<std::string, std::string>> CommandRegistry::summaries() const {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(commands_.size());
    for (auto& kv : commands_) out.emplace_back(kv.first, kv.second->help().description);
    return out;
}
