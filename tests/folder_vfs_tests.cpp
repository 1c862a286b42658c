#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "shell/Shell.hpp"
#include "vfs/FolderVfs.hpp"

namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path;
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("agentsh_folder_vfs_" + std::to_string(stamp));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void test_round_trip_through_host_directory() {
    TempDir tmp;
    FolderVfs vfs(tmp.path / "root");
    vfs.write("/docs/a.txt", "hello");
    assert(fs::exists(tmp.path / "root" / "docs" / "a.txt"));
    assert(vfs.read("/docs/a.txt").value() == "hello");
    assert(vfs.isDirectory("/docs"));
    assert(vfs.size("/docs/a.txt").value() == 5);
    assert(!vfs.read("/docs").has_value());
    assert(!vfs.read("/nope").has_value());
}

void test_list_and_glob() {
    TempDir tmp;
    FolderVfs vfs(tmp.path);
    vfs.write("/b.json", "{}");
    vfs.write("/a/c.json", "{}");
    vfs.mkdir("/empty");
    assert(vfs.list("/") == (std::vector<std::string>{"a/", "b.json", "empty/"}));
    assert(vfs.glob("/**/*.json") == (std::vector<std::string>{"/a/c.json", "/b.json"}));
    assert(vfs.glob("/*.json") == std::vector<std::string>{"/b.json"});
}

void test_remove_is_recursive() {
    TempDir tmp;
    FolderVfs vfs(tmp.path);
    vfs.write("/d/e/f.txt", "x");
    assert(vfs.remove("/d"));
    assert(!vfs.exists("/d"));
    assert(!vfs.remove("/d"));
}

void test_symlink_escape_is_refused() {
    TempDir tmp;
    fs::create_directories(tmp.path / "root");
    fs::create_directories(tmp.path / "outside");
    {
        std::ofstream(tmp.path / "outside" / "secret.txt") << "s";
    }
    std::error_code ec;
    fs::create_directory_symlink(tmp.path / "outside", tmp.path / "root" / "link", ec);
    if (ec) return; // filesystem without symlink support

    FolderVfs vfs(tmp.path / "root");
    bool threw = false;
    try {
        vfs.read("/link/secret.txt");
    } catch (const std::runtime_error& e) {
        threw = true;
        assert(std::string(e.what()) == "security: path escapes workspace root");
    }
    assert(threw);
}

void test_shell_over_folder_workspace() {
    TempDir tmp;
    FolderVfs storage(tmp.path);
    Shell shell(storage);
    auto r = shell.execute("echo hi > out.txt && cat out.txt");
    assert(r.exit_code == 0);
    assert(r.out == "hi\n");
    std::ifstream in(tmp.path / "out.txt");
    std::string line;
    std::getline(in, line);
    assert(line == "hi");
}

} // namespace

int main() {
    test_round_trip_through_host_directory();
    test_list_and_glob();
    test_remove_is_recursive();
    test_symlink_escape_is_refused();
    test_shell_over_folder_workspace();

    return 0;
}
