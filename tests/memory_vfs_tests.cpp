#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "vfs/MemoryVfs.hpp"
#include "vfs/ValidatedVfs.hpp"
#include "vfs/PathValidation.hpp"

namespace {

void test_write_creates_parents_and_read_returns_content() {
    MemoryVfs vfs;
    vfs.write("/a/b/c.txt", "hi");
    assert(vfs.read("/a/b/c.txt").value() == "hi");
    assert(vfs.isDirectory("/a"));
    assert(vfs.isDirectory("/a/b"));
    assert(!vfs.read("/missing").has_value());
    assert(vfs.size("/a/b/c.txt").value() == 2);
}

void test_list_marks_directories() {
    MemoryVfs vfs;
    vfs.write("/a.txt", "1");
    vfs.write("/d/b.txt", "2");
    vfs.mkdir("/empty");
    const std::vector<std::string> expected{"a.txt", "d/", "empty/"};
    assert(vfs.list("/") == expected);
    assert(vfs.list("/d") == std::vector<std::string>{"b.txt"});
}

void test_remove_cascades() {
    MemoryVfs vfs;
    vfs.write("/d/x.txt", "1");
    vfs.write("/d/e/y.txt", "2");
    vfs.write("/dd.txt", "3");
    assert(vfs.remove("/d"));
    assert(!vfs.exists("/d/x.txt"));
    assert(!vfs.exists("/d/e"));
    assert(vfs.exists("/dd.txt"));
    assert(!vfs.remove("/d"));
}

void test_glob_returns_files_only_sorted() {
    MemoryVfs vfs;
    vfs.write("/a/z.json", "{}");
    vfs.write("/a/b.json", "{}");
    vfs.write("/a/c/d.json", "{}");
    vfs.mkdir("/a/dir.json");
    assert(vfs.glob("/a/*.json") == (std::vector<std::string>{"/a/b.json", "/a/z.json"}));
    assert(vfs.glob("/a/**/*.json") == (std::vector<std::string>{"/a/b.json", "/a/c/d.json", "/a/z.json"}));
}

void test_file_directory_conflicts_throw() {
    MemoryVfs vfs;
    vfs.write("/f", "x");
    bool threw = false;
    try { vfs.mkdir("/f"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { vfs.write("/f/child", "x"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    vfs.mkdir("/dir");
    threw = false;
    try { vfs.write("/dir", "x"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);
}

void test_mkdir_is_idempotent() {
    MemoryVfs vfs;
    vfs.mkdir("/a/b/c");
    auto before = vfs.list("/a");
    vfs.mkdir("/a/b/c");
    assert(vfs.list("/a") == before);
    assert(vfs.isDirectory("/a/b/c"));
}

void test_validated_view_translates_paths() {
    MemoryVfs backend;
    ValidatedVfs vfs(backend);
    vfs.write("./notes.txt", "n");
    assert(backend.read("/notes.txt").value() == "n");
    assert(vfs.read("notes.txt").value() == "n");
    vfs.write("a/b.json", "{}");
    assert(vfs.glob("a/*.json") == std::vector<std::string>{"a/b.json"});

    bool threw = false;
    try { vfs.read("/etc/passwd"); } catch (const PathError&) { threw = true; }
    assert(threw);
}

void test_write_guard_blocks_mutations() {
    MemoryVfs backend;
    ValidatedVfs vfs(backend);
    vfs.write("keep.txt", "1");
    vfs.set_write_guard([](const std::string& key) { return key == "/plan.md"; });

    vfs.write("plan.md", "ok");
    bool threw = false;
    try {
        vfs.write("keep.txt", "2");
    } catch (const PathError& e) {
        threw = true;
        assert(std::string(e.what()) == "read-only mode: cannot write to 'keep.txt'");
    }
    assert(threw);
    assert(vfs.read("keep.txt").value() == "1");

    vfs.set_write_guard(nullptr);
    vfs.write("keep.txt", "2");
    assert(vfs.read("keep.txt").value() == "2");
}

} // namespace

int main() {
    test_write_creates_parents_and_read_returns_content();
    test_list_marks_directories();
    test_remove_cascades();
    test_glob_returns_files_only_sorted();
    test_file_directory_conflicts_throw();
    test_mkdir_is_idempotent();
    test_validated_view_translates_paths();
    test_write_guard_blocks_mutations();

    return 0;
}
