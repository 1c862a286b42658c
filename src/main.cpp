#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "core/Log.hpp"
#include "core/ShellConfig.hpp"
#include "vfs/FolderVfs.hpp"
#include "vfs/MemoryVfs.hpp"
#include "shell/Shell.hpp"

static void usage(std::ostream& os) {
    os << "usage: agentsh [--dir PATH] [--config FILE] [--read-only] [--writable PATH]...\n"
          "               [--verbose] [-c SCRIPT | SCRIPT_FILE]\n"
          "\n"
          "Runs one script against a sandboxed workspace. Without --dir the workspace\n"
          "lives in memory; without -c or SCRIPT_FILE the script is read from stdin.\n";
}

static bool read_host_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

int main(int argc, char** argv) {
    std::string dir, config_path, script, script_file;
    bool have_script = false, read_only = false, verbose = false;
    std::vector<std::string> writable;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& into) {
            if (i + 1 >= argc) {
                std::cerr << "agentsh: option requires an argument: " << a << "\n";
                return false;
            }
            into = argv[++i];
            return true;
        };
        if (a == "--dir") { if (!next(dir)) return 2; }
        else if (a == "--config") { if (!next(config_path)) return 2; }
        else if (a == "--writable") { std::string p; if (!next(p)) return 2; writable.push_back(p); }
        else if (a == "--read-only") read_only = true;
        else if (a == "--verbose") verbose = true;
        else if (a == "-c") { if (!next(script)) return 2; have_script = true; }
        else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
        else if (!a.empty() && a[0] == '-') { std::cerr << "agentsh: unknown option: " << a << "\n"; usage(std::cerr); return 2; }
        else script_file = a;
    }

    Log::set_sink(&std::cerr);
    Log::set_level(verbose ? Log::Level::Debug : Log::Level::Warn);

    ShellConfig config;
    if (!config_path.empty() && !config.load(config_path)) {
        std::cerr << "agentsh: " << config.error() << "\n";
        return 2;
    }

    if (!have_script) {
        if (!script_file.empty()) {
            if (!read_host_file(script_file, script)) {
                std::cerr << "agentsh: cannot read script '" << script_file << "'\n";
                return 2;
            }
        } else {
            std::ostringstream ss;
            ss << std::cin.rdbuf();
            script = ss.str();
        }
    }

    std::unique_ptr<IVfs> storage;
    try {
        if (!dir.empty()) storage = std::make_unique<FolderVfs>(dir);
        else storage = std::make_unique<MemoryVfs>();
    } catch (const std::exception& e) {
        std::cerr << "agentsh: " << e.what() << "\n";
        return 2;
    }

    Shell shell(*storage, config);
    if (read_only) shell.set_read_only(true, writable);

    ShellResult r = shell.execute(script);
    std::cout << r.out;
    if (!r.err.empty()) {
        std::cerr << r.err;
        if (r.err.back() != '\n') std::cerr << "\n";
    }
    return r.exit_code;
}
