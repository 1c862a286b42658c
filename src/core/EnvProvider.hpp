#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

// Source of host-injected variables (credentials, API keys). Values resolve
// inside commands as $NAME but are never printed by `env`.
class IEnvProvider {
public:
    virtual ~IEnvProvider() = default;
    virtual std::optional<std::string> get(const std::string& name) const = 0;
    virtual std::vector<std::string> keys() const = 0;
};

class MemoryEnvProvider : public IEnvProvider {
public:
    MemoryEnvProvider() = default;
    explicit MemoryEnvProvider(std::map<std::string, std::string> vars);

    void set(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const override;
    std::vector<std::string> keys() const override;
private:
    std::map<std::string, std::string> vars_;
};
