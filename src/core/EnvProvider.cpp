#include "EnvProvider.hpp"

MemoryEnvProvider::MemoryEnvProvider(std::map<std::string, std::string> vars)
    : vars_(std::move(vars)) {}

void MemoryEnvProvider::set(const std::string& name, const std::string& value) {
    vars_[name] = value;
}

std::optional<std::string> MemoryEnvProvider::get(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> MemoryEnvProvider::keys() const {
    std::vector<std::string> out;
    out.reserve(vars_.size());
    for (auto& kv : vars_) out.push_back(kv.first);
    return out;
}
