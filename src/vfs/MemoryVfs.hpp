#pragma once
#include "IVfs.hpp"

#include <map>
#include <set>

// In-process workspace: path -> content plus an explicit directory set so
// empty directories survive. The root "/" always exists.
class MemoryVfs : public IVfs {
public:
    MemoryVfs() = default;

    std::optional<std::string> read(const std::string& path) const override;
    void write(const std::string& path, const std::string& content) override;
    bool remove(const std::string& path) override;
    bool exists(const std::string& path) const override;
    std::vector<std::string> list(const std::string& path) const override;
    std::vector<std::string> glob(const std::string& pattern) const override;
    void mkdir(const std::string& path) override;
    bool isDirectory(const std::string& path) const override;
    std::optional<std::uintmax_t> size(const std::string& path) const override;

    static std::string normalize(const std::string& path);

private:
    void add_parents(const std::string& path);

    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_;
};
