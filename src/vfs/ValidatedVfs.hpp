#pragma once
#include "IVfs.hpp"

#include <functional>

// Workspace view handed to commands. Accepts relative user paths, runs them
// through PathValidation (throwing PathError) and forwards storage keys to the
// backend. glob() results come back relative.
class ValidatedVfs : public IVfs {
public:
    explicit ValidatedVfs(IVfs& inner) : inner_(inner) {}

    std::optional<std::string> read(const std::string& path) const override;
    void write(const std::string& path, const std::string& content) override;
    bool remove(const std::string& path) override;
    bool exists(const std::string& path) const override;
    std::vector<std::string> list(const std::string& path) const override;
    std::vector<std::string> glob(const std::string& pattern) const override;
    void mkdir(const std::string& path) override;
    bool isDirectory(const std::string& path) const override;
    std::optional<std::uintmax_t> size(const std::string& path) const override;

    // When set, mutations are allowed only for storage keys the guard accepts.
    using WriteGuard = std::function<bool(const std::string& fs_path)>;
    void set_write_guard(WriteGuard guard) { guard_ = std::move(guard); }

    IVfs& backend() { return inner_; }

private:
    std::string checked_for_write(const std::string& path) const;

    IVfs& inner_;
    WriteGuard guard_;
};
