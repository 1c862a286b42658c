#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Storage contract behind the shell.
//
// Backends (MemoryVfs, FolderVfs) receive internal keys: absolute,
// normalized paths such as "/data/a.json". ValidatedVfs implements the same
// interface for user-facing relative paths and translates them.
//
// list() returns the direct children of a directory; subdirectories carry a
// trailing '/'. glob() returns matching file paths, sorted; directories are
// never glob results.
class IVfs {
public:
    virtual ~IVfs() = default;

    virtual std::optional<std::string> read(const std::string& path) const = 0;
    virtual void write(const std::string& path, const std::string& content) = 0;
    virtual bool remove(const std::string& path) = 0;
    virtual bool exists(const std::string& path) const = 0;
    virtual std::vector<std::string> list(const std::string& path) const = 0;
    virtual std::vector<std::string> glob(const std::string& pattern) const = 0;
    virtual void mkdir(const std::string& path) = 0;
    virtual bool isDirectory(const std::string& path) const = 0;

    // Size in bytes of a file, nullopt when the path is not a readable file.
    virtual std::optional<std::uintmax_t> size(const std::string& path) const {
        auto data = read(path);
        if (!data) return std::nullopt;
        return static_cast<std::uintmax_t>(data->size());
    }
};
