#pragma once
#include <string>
#include <utility>

// Outcome of a command, a stage or a whole script. exit_code 0 is success.
struct ShellResult {
    int exit_code = 0;
    std::string out;
    std::string err;

    static ShellResult ok(std::string out = std::string()) {
        return ShellResult{0, std::move(out), std::string()};
    }
    static ShellResult fail(std::string err, int code = 1) {
        return ShellResult{code, std::string(), std::move(err)};
    }
};
