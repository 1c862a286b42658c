#pragma once
#include "IVfs.hpp"
#include <filesystem>

// Workspace stored in a host directory. Storage keys map below root_; a key
// that would resolve outside root_ (for example through a symlink) throws.
class FolderVfs : public IVfs {
public:
    explicit FolderVfs(std::filesystem::path root);

    std::filesystem::path resolveSecure(const std::string& key) const;

    std::optional<std::string> read(const std::string& path) const override;
    void write(const std::string& path, const std::string& content) override;
    bool remove(const std::string& path) override;
    bool exists(const std::string& path) const override;
    std::vector<std::string> list(const std::string& path) const override;
    std::vector<std::string> glob(const std::string& pattern) const override;
    void mkdir(const std::string& path) override;
    bool isDirectory(const std::string& path) const override;
    std::optional<std::uintmax_t> size(const std::string& path) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};
