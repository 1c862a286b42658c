#include "MemoryVfs.hpp"
#include "Glob.hpp"

#include <stdexcept>

std::string MemoryVfs::normalize(const std::string& path) {
    std::string out;
    out.reserve(path.size() + 1);
    if (path.empty() || path.front() != '/') out += '/';
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out += c;
    }
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

void MemoryVfs::add_parents(const std::string& path) {
    std::vector<std::string> parents;
    size_t pos = path.rfind('/');
    while (pos != std::string::npos && pos > 0) {
        parents.push_back(path.substr(0, pos));
        pos = path.rfind('/', pos - 1);
    }
    for (auto& p : parents) {
        if (files_.count(p)) throw std::runtime_error(p + ": Not a directory");
    }
    dirs_.insert(parents.begin(), parents.end());
}

std::optional<std::string> MemoryVfs::read(const std::string& path) const {
    auto it = files_.find(normalize(path));
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

void MemoryVfs::write(const std::string& path, const std::string& content) {
    auto key = normalize(path);
    if (key == "/" || dirs_.count(key)) throw std::runtime_error(key + ": Is a directory");
    add_parents(key);
    files_[key] = content;
}

bool MemoryVfs::remove(const std::string& path) {
    auto key = normalize(path);
    if (key == "/") return false;
    bool removed = files_.erase(key) > 0;
    if (dirs_.erase(key) > 0) {
        removed = true;
        const std::string prefix = key + "/";
        for (auto it = files_.lower_bound(prefix); it != files_.end() && it->first.compare(0, prefix.size(), prefix) == 0;) {
            it = files_.erase(it);
        }
        for (auto it = dirs_.lower_bound(prefix); it != dirs_.end() && it->compare(0, prefix.size(), prefix) == 0;) {
            it = dirs_.erase(it);
        }
    }
    return removed;
}

bool MemoryVfs::exists(const std::string& path) const {
    auto key = normalize(path);
    return key == "/" || files_.count(key) > 0 || dirs_.count(key) > 0;
}

std::vector<std::string> MemoryVfs::list(const std::string& path) const {
    auto key = normalize(path);
    const std::string prefix = key == "/" ? "/" : key + "/";
    std::set<std::string> names;

    for (auto it = files_.lower_bound(prefix); it != files_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        auto rest = it->first.substr(prefix.size());
        auto slash = rest.find('/');
        names.insert(slash == std::string::npos ? rest : rest.substr(0, slash) + "/");
    }
    for (auto it = dirs_.lower_bound(prefix); it != dirs_.end() && it->compare(0, prefix.size(), prefix) == 0; ++it) {
        auto rest = it->substr(prefix.size());
        auto slash = rest.find('/');
        names.insert((slash == std::string::npos ? rest : rest.substr(0, slash)) + "/");
    }
    return std::vector<std::string>(names.begin(), names.end());
}

std::vector<std::string> MemoryVfs::glob(const std::string& pattern) const {
    auto re = Glob::compile(normalize(pattern));
    std::vector<std::string> out;
    for (auto& kv : files_) {
        if (std::regex_match(kv.first, re)) out.push_back(kv.first);
    }
    return out;
}

void MemoryVfs::mkdir(const std::string& path) {
    auto key = normalize(path);
    if (key == "/") return;
    if (files_.count(key)) throw std::runtime_error(key + ": File exists");
    add_parents(key);
    dirs_.insert(key);
}

bool MemoryVfs::isDirectory(const std::string& path) const {
    auto key = normalize(path);
    return key == "/" || dirs_.count(key) > 0;
}

std::optional<std::uintmax_t> MemoryVfs::size(const std::string& path) const {
    auto it = files_.find(normalize(path));
    if (it == files_.end()) return std::nullopt;
    return static_cast<std::uintmax_t>(it->second.size());
}
