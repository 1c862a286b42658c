#pragma once
#include <stdexcept>
#include <string>

// Raised when a user-supplied path tries to leave the workspace.
class PathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace PathValidation {
    struct Result {
        std::string fs_path;   // storage key ("/notes.txt"), empty on error
        std::string error;
        bool ok() const { return error.empty(); }
    };

    // "." / "" -> "/", one leading "./" dropped, absolute paths and ".."
    // segments rejected, everything else prefixed with "/".
    Result validate(const std::string& path);

    // validate() or throw PathError.
    std::string resolve(const std::string& path);

    // Storage key back to the relative form users see.
    std::string to_relative(const std::string& fs_path);
}
