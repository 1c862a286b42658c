#include "Environment.hpp"
#include "EnvProvider.hpp"

#include <cctype>

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}

std::string Environment::get(const std::string& key) const {
    return find(key).value_or(std::string());
}

std::optional<std::string> Environment::find(const std::string& key) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return std::nullopt;
    return it->second;
}

void Environment::set(const std::string& key, const std::string& value) {
    kv_[key] = value;
}

std::optional<std::string> Environment::resolve(const std::string& key, const IEnvProvider* provider) const {
    if (auto v = find(key)) return v;
    if (provider) return provider->get(key);
    return std::nullopt;
}

std::string Environment::expand(const std::string& input, const IEnvProvider* provider) const {
    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '$' || i + 1 == input.size()) {
            out += input[i++];
            continue;
        }
        size_t start = i + 1;
        bool braced = input[start] == '{';
        if (braced) ++start;
        size_t end = start;
        while (end < input.size() && is_name_char(input[end])) ++end;
        if (end == start || (braced && (end == input.size() || input[end] != '}'))) {
            out += input[i++];
            continue;
        }
        out += resolve(input.substr(start, end - start), provider).value_or("");
        i = braced ? end + 1 : end;
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> Environment::listing(const IEnvProvider* provider) const {
    std::map<std::string, std::string> merged;
    if (provider) {
        for (auto& key : provider->keys()) merged[key] = "***";
    }
    for (auto& kv : kv_) merged[kv.first] = kv.second;
    return {merged.begin(), merged.end()};
}

bool Environment::is_name(const std::string& key) {
    if (key.empty()) return false;
    for (char c : key) {
        if (!is_name_char(c)) return false;
    }
    return true;
}
