#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class IEnvProvider;

// Runtime variables assigned inside the shell (NAME=value) or by the host.
// Lookups fall back to an optional provider whose values stay hidden.
class Environment {
public:
    std::string get(const std::string& key) const;
    std::optional<std::string> find(const std::string& key) const;
    void set(const std::string& key, const std::string& value);

    // Runtime value first, then the provider, else nullopt.
    std::optional<std::string> resolve(const std::string& key, const IEnvProvider* provider) const;

    // Substitutes $NAME and ${NAME}. Unknown names expand to nothing; a lone
    // `$` or a malformed `${` is copied through.
    std::string expand(const std::string& input, const IEnvProvider* provider) const;

    // Sorted listing for `env`: runtime values verbatim, provider-only names
    // with the value replaced by ***.
    std::vector<std::pair<std::string, std::string>> listing(const IEnvProvider* provider) const;

    static bool is_name(const std::string& key);

private:
    std::map<std::string, std::string> kv_;
};
