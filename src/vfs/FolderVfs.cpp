#include "FolderVfs.hpp"
#include "Glob.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

using namespace std::filesystem;

static path canonical_or_weak(const path& p) {
    std::error_code ec;
    auto r = weakly_canonical(p, ec);
    if (ec) return p.lexically_normal();
    return r;
}

FolderVfs::FolderVfs(std::filesystem::path root) {
    std::error_code ec;
    create_directories(root, ec);
    if (ec) throw std::runtime_error("cannot create workspace root: " + ec.message());
    root_ = canonical_or_weak(root);
}

std::filesystem::path FolderVfs::resolveSecure(const std::string& key) const {
    path vfs_path = path(key).lexically_normal();
    path host = canonical_or_weak(root_ / vfs_path.relative_path());
    auto host_str = host.native();
    auto root_str = root_.native();
    bool inside = host_str.size() >= root_str.size()
        && host_str.compare(0, root_str.size(), root_str) == 0
        && (host_str.size() == root_str.size() || host_str[root_str.size()] == '/');
    if (!inside) {
        throw std::runtime_error("security: path escapes workspace root");
    }
    return host;
}

std::optional<std::string> FolderVfs::read(const std::string& p) const {
    auto host = resolveSecure(p);
    std::error_code ec;
    if (!is_regular_file(host, ec)) return std::nullopt;
    std::ifstream ifs(host, std::ios::binary);
    if (!ifs) return std::nullopt;
    std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return data;
}

void FolderVfs::write(const std::string& p, const std::string& content) {
    auto host = resolveSecure(p);
    std::error_code ec;
    create_directories(host.parent_path(), ec);
    if (ec) throw std::runtime_error(p + ": " + ec.message());
    std::ofstream ofs(host, std::ios::binary | std::ios::trunc);
    if (!ofs) throw std::runtime_error(p + ": cannot open file for writing");
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
}

bool FolderVfs::remove(const std::string& p) {
    auto host = resolveSecure(p);
    if (host == root_) return false;
    std::error_code ec;
    if (!std::filesystem::exists(symlink_status(host, ec))) return false;
    auto n = remove_all(host, ec);
    if (ec) throw std::runtime_error(p + ": " + ec.message());
    return n > 0;
}

bool FolderVfs::exists(const std::string& p) const {
    std::error_code ec;
    return std::filesystem::exists(resolveSecure(p), ec);
}

std::vector<std::string> FolderVfs::list(const std::string& p) const {
    std::vector<std::string> out;
    auto host = resolveSecure(p);
    std::error_code ec;
    if (!is_directory(host, ec)) return out;
    for (auto& de : directory_iterator(host, ec)) {
        auto name = de.path().filename().string();
        std::error_code dec;
        if (de.is_directory(dec)) name += "/";
        out.push_back(std::move(name));
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> FolderVfs::glob(const std::string& pattern) const {
    std::vector<std::string> out;
    auto re = Glob::compile(pattern);
    std::error_code ec;
    for (auto it = recursive_directory_iterator(root_, ec); !ec && it != recursive_directory_iterator(); it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        auto key = "/" + it->path().lexically_relative(root_).generic_string();
        if (std::regex_match(key, re)) out.push_back(std::move(key));
    }
    std::sort(out.begin(), out.end());
    return out;
}

void FolderVfs::mkdir(const std::string& p) {
    auto host = resolveSecure(p);
    std::error_code ec;
    create_directories(host, ec);
    if (ec) throw std::runtime_error(p + ": " + ec.message());
}

bool FolderVfs::isDirectory(const std::string& p) const {
    std::error_code ec;
    return is_directory(resolveSecure(p), ec);
}

std::optional<std::uintmax_t> FolderVfs::size(const std::string& p) const {
    auto host = resolveSecure(p);
    std::error_code ec;
    if (!is_regular_file(host, ec)) return std::nullopt;
    auto n = file_size(host, ec);
    if (ec) return std::nullopt;
    return n;
}
