#include "ValidatedVfs.hpp"
#include "PathValidation.hpp"

std::string ValidatedVfs::checked_for_write(const std::string& path) const {
    auto key = PathValidation::resolve(path);
    if (guard_ && !guard_(key)) {
        throw PathError("read-only mode: cannot write to '" + path + "'");
    }
    return key;
}

std::optional<std::string> ValidatedVfs::read(const std::string& path) const {
    return inner_.read(PathValidation::resolve(path));
}

void ValidatedVfs::write(const std::string& path, const std::string& content) {
    inner_.write(checked_for_write(path), content);
}

bool ValidatedVfs::remove(const std::string& path) {
    return inner_.remove(checked_for_write(path));
}

bool ValidatedVfs::exists(const std::string& path) const {
    return inner_.exists(PathValidation::resolve(path));
}

std::vector<std::string> ValidatedVfs::list(const std::string& path) const {
    return inner_.list(PathValidation::resolve(path));
}

std::vector<std::string> ValidatedVfs::glob(const std::string& pattern) const {
    auto matches = inner_.glob(PathValidation::resolve(pattern));
    for (auto& m : matches) m = PathValidation::to_relative(m);
    return matches;
}

void ValidatedVfs::mkdir(const std::string& path) {
    inner_.mkdir(checked_for_write(path));
}

bool ValidatedVfs::isDirectory(const std::string& path) const {
    return inner_.isDirectory(PathValidation::resolve(path));
}

std::optional<std::uintmax_t> ValidatedVfs::size(const std::string& path) const {
    return inner_.size(PathValidation::resolve(path));
}
