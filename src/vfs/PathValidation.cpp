#include "PathValidation.hpp"

namespace PathValidation {

Result validate(const std::string& path) {
    Result r;
    if (path.empty() || path == ".") {
        r.fs_path = "/";
        return r;
    }

    std::string p = path;
    if (p.compare(0, 2, "./") == 0) p = p.substr(2);
    if (p.empty()) {
        r.fs_path = "/";
        return r;
    }

    if (p.front() == '/') {
        size_t start = p.find_first_not_of('/');
        std::string rest = start == std::string::npos ? std::string(".") : p.substr(start);
        r.error = "Absolute paths are not allowed. Use relative path instead: '" + rest + "'";
        return r;
    }

    size_t pos = 0;
    while (pos <= p.size()) {
        size_t slash = p.find('/', pos);
        if (slash == std::string::npos) slash = p.size();
        if (p.compare(pos, slash - pos, "..") == 0 && slash - pos == 2) {
            r.error = "Path traversal ('..') is not allowed";
            return r;
        }
        pos = slash + 1;
    }

    r.fs_path = "/" + p;
    return r;
}

std::string resolve(const std::string& path) {
    auto r = validate(path);
    if (!r.ok()) throw PathError(r.error);
    return r.fs_path;
}

std::string to_relative(const std::string& fs_path) {
    size_t start = fs_path.find_first_not_of('/');
    if (start == std::string::npos) return ".";
    return fs_path.substr(start);
}

}
