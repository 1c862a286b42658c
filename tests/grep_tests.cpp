#include <cassert>
#include <memory>
#include <string>

#include "net/IHttpClient.hpp"
#include "shell/Shell.hpp"
#include "vfs/MemoryVfs.hpp"

namespace {

class OfflineHttp : public IHttpClient {
public:
    HttpResponse send(const HttpRequest&) override { throw HttpError("offline"); }
};

struct Fixture {
    MemoryVfs storage;
    OfflineHttp http;
    ShellConfig config;
    std::unique_ptr<Shell> shell;

    Fixture() {
        storage.write("/log.txt", "INFO start\nERROR disk full\ninfo done\nERROR net down\n");
        storage.write("/src/a.cpp", "int main() {}\n// TODO fix\n");
        storage.write("/src/lib/b.cpp", "// todo later\n");
        storage.write("/src/readme.md", "TODO docs\n");
        shell = std::make_unique<Shell>(storage, config, &http);
    }
    ShellResult run(const std::string& script) { return shell->execute(script); }
};

void test_exit_codes() {
    Fixture f;
    auto hit = f.run("grep ERROR log.txt");
    assert(hit.exit_code == 0);
    assert(hit.out == "ERROR disk full\nERROR net down\n");

    auto miss = f.run("grep WARN log.txt");
    assert(miss.exit_code == 1);
    assert(miss.out.empty());

    auto bad = f.run("grep '(' log.txt");
    assert(bad.exit_code == 1);
    assert(bad.err.find("Invalid pattern") != std::string::npos);
}

void test_flags() {
    Fixture f;
    assert(f.run("grep -i info log.txt").out == "INFO start\ninfo done\n");
    assert(f.run("grep -n ERROR log.txt").out == "2:ERROR disk full\n4:ERROR net down\n");
    assert(f.run("grep -v ERROR log.txt").out == "INFO start\ninfo done\n");
    assert(f.run("grep -in 'net' log.txt").out == "4:ERROR net down\n");
    assert(f.run("grep -e -start log.txt").exit_code == 1);
}

void test_recursive_search_and_file_listing() {
    Fixture f;
    auto r = f.run("grep -rn TODO src");
    assert(r.exit_code == 0);
    assert(r.out == "src/a.cpp:2:// TODO fix\nsrc/readme.md:1:TODO docs\n");

    auto files = f.run("grep -ril todo src");
    assert(files.out == "src/a.cpp\nsrc/lib/b.cpp\nsrc/readme.md\n");

    auto glob = f.run("grep TODO src/*.cpp");
    assert(glob.out == "// TODO fix\n");
}

void test_stdin_and_missing_files() {
    Fixture f;
    assert(f.run("cat log.txt | grep -c ERROR").exit_code == 0);
    assert(f.run("cat log.txt | grep disk").out == "ERROR disk full\n");

    auto r = f.run("grep ERROR nope.txt log.txt");
    assert(r.exit_code == 0);
    assert(r.err == "grep: nope.txt: No such file or directory");
    assert(r.out == "log.txt:ERROR disk full\nlog.txt:ERROR net down\n");
}

void test_output_budget() {
    MemoryVfs storage;
    std::string big;
    for (int i = 0; i < 100; ++i) big += "match line " + std::to_string(i) + "\n";
    storage.write("/big.txt", big);
    OfflineHttp http;
    ShellConfig config;
    config.limits.max_grep_output = 100;
    Shell shell(storage, config, &http);

    auto r = shell.execute("grep match big.txt");
    assert(r.exit_code == 0);
    assert(r.out.find("[output truncated: exceeded 100 characters]\n") != std::string::npos);
    assert(r.out.size() < 200);
}

// Minified JSON on one line, well over 100k characters.
std::string long_json_line(size_t items) {
    std::string s = "{\"items\":[";
    for (size_t i = 0; i < items; ++i) {
        if (i) s += ',';
        s += "{\"id\":" + std::to_string(i) + ",\"v\":7}";
    }
    return s + "]}";
}

void test_very_long_lines() {
    MemoryVfs storage;
    const std::string line = long_json_line(8000);
    assert(line.size() > 100000);
    storage.write("/min.json", line + "\n");
    storage.write("/wide.txt", "<" + std::string(150000, 'x') + ">\n");
    OfflineHttp http;
    Shell shell(storage, ShellConfig(), &http);

    auto r = shell.execute("grep '\"id\":7999,' min.json");
    assert(r.exit_code == 0);
    assert(r.out.compare(0, 10, "{\"items\":[") == 0);
    assert(r.out.size() == 2000 + 4);

    assert(shell.execute("grep '\"id\":8000,' min.json").exit_code == 1);
    assert(shell.execute("grep '\"id\":[0-9]+,\"v\":7[}].[}]$' min.json").exit_code == 0);
    assert(shell.execute("grep '^[{]\"items' min.json").exit_code == 0);
    assert(shell.execute("grep '^[{]\"id' min.json").exit_code == 1);
    assert(shell.execute("grep '\"id\":0,\"v\":7[}]$' min.json").exit_code == 1);

    assert(shell.execute("grep 'x{3}>' wide.txt").exit_code == 0);
    assert(shell.execute("grep '<x.*' wide.txt").exit_code == 0);
    // A single match wider than the scan window is not reported.
    r = shell.execute("grep '<x*>' wide.txt");
    assert(r.exit_code == 1);
    assert(r.err.empty());
}

} // namespace

int main() {
    test_exit_codes();
    test_flags();
    test_recursive_search_and_file_listing();
    test_stdin_and_missing_files();
    test_output_budget();
    test_very_long_lines();

    return 0;
}
