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

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

struct Fixture {
    MemoryVfs storage;
    OfflineHttp http;
    std::unique_ptr<Shell> shell;

    explicit Fixture(ShellConfig config = ShellConfig()) {
        storage.write("/five.txt", "1\n2\n3\n4\n5\n");
        storage.write("/words.txt", "hello world\nfoo\n");
        shell = std::make_unique<Shell>(storage, config, &http);
    }
    ShellResult run(const std::string& script) { return shell->execute(script); }
};

void test_cat() {
    Fixture f;
    assert(f.run("cat five.txt").out == "1\n2\n3\n4\n5\n");
    assert(f.run("cat -n words.txt").out == "1\thello world\n2\tfoo\n");
    assert(f.run("cat --offset 1 --limit 2 five.txt").out == "[Showing lines 2-3 of 5]\n2\n3\n");
    assert(f.run("cat words.txt five.txt").out == "hello world\nfoo\n1\n2\n3\n4\n5\n");
    assert(f.run("echo piped | cat").out == "piped\n");

    auto missing = f.run("cat nope.txt");
    assert(missing.exit_code == 1);
    assert(missing.err == "cat: nope.txt: No such file");

    f.run("mkdir d");
    assert(f.run("cat d").err == "cat: d: Is a directory");
    assert(f.run("cat").err == "cat: missing file operand");
}

void test_cat_limits() {
    ShellConfig config;
    config.limits.default_line_limit = 3;
    config.limits.max_line_length = 5;
    Fixture f(config);

    auto r = f.run("cat five.txt");
    assert(r.out == "1\n2\n3\n[... showing first 3 of 5 lines. Use --offset/--limit to read more]\n");

    // piped output is not cut by the default limit
    assert(f.run("cat five.txt | wc -l").out == "       5\n");

    assert(f.run("cat words.txt").out == "hello...\nfoo\n");

    ShellConfig small;
    small.limits.max_file_size = 8;
    Fixture g(small);
    auto big = g.run("cat five.txt");
    assert(big.exit_code == 1);
    assert(contains(big.err, "exceeds max size (8 bytes)"));
    assert(contains(big.err, "head -n 2000 five.txt"));
    assert(g.run("cat --limit 2 five.txt").out == "1\n2\n");
    assert(g.run("cat five.txt | head -n 1").out == "1\n");
}

void test_head_and_tail() {
    Fixture f;
    assert(f.run("head -n 2 five.txt").out == "1\n2\n");
    assert(f.run("head -3 five.txt").out == "1\n2\n3\n");
    assert(f.run("head five.txt").out == "1\n2\n3\n4\n5\n");
    assert(f.run("tail -n 2 five.txt").out == "4\n5\n");
    assert(f.run("tail -1 five.txt").out == "5\n");
    assert(f.run("tail -n +4 five.txt").out == "4\n5\n");
    assert(f.run("cat five.txt | head -n 1").out == "1\n");
    assert(f.run("head -n 1 words.txt five.txt").out == "==> words.txt <==\nhello world\n\n==> five.txt <==\n1\n");
    assert(f.run("head nope.txt").err == "head: nope.txt: No such file");
    assert(f.run("tail").err == "tail: missing file operand");
}

void test_wc() {
    Fixture f;
    assert(f.run("wc words.txt").out == "       2       3      16 words.txt\n");
    assert(f.run("wc -l words.txt").out == "       2 words.txt\n");
    assert(f.run("wc -lw words.txt").out == "       2       3 words.txt\n");
    assert(f.run("echo -n 'a b' | wc -w").out == "       2\n");
    assert(f.run("wc -l words.txt five.txt").out == "       2 words.txt\n       5 five.txt\n       7 total\n");

    f.storage.write("/u.txt", "h\xc3\xa9llo");
    assert(f.run("wc -m u.txt").out == "       5 u.txt\n");
    assert(f.run("wc -c u.txt").out == "       6 u.txt\n");
    assert(f.run("wc -l u.txt").out == "       0 u.txt\n");
    assert(f.run("wc nope.txt").err == "wc: nope.txt: No such file");
}

void test_sort() {
    Fixture f;
    f.storage.write("/fruit.txt", "banana\nApple\ncherry\napple\n");
    assert(f.run("sort fruit.txt").out == "apple\nApple\nbanana\ncherry\n");
    assert(f.run("sort -r fruit.txt").out == "cherry\nbanana\nApple\napple\n");

    f.storage.write("/nums.txt", "10\n9\n100\n9\n");
    assert(f.run("sort -n nums.txt").out == "9\n9\n10\n100\n");
    assert(f.run("sort -nu nums.txt").out == "9\n10\n100\n");
    assert(f.run("sort -rn nums.txt").out == "100\n10\n9\n9\n");

    f.storage.write("/data.csv", "a,3\nb,1\nc,2\n");
    assert(f.run("sort -t , -k 2 -n data.csv").out == "b,1\nc,2\na,3\n");
    assert(f.run("sort -t, -k2 data.csv").out == "b,1\nc,2\na,3\n");

    assert(f.run("echo 'b\na' | sort").out == "a\nb\n");
    assert(f.run("sort nope.txt").err == "sort: nope.txt: No such file");
}

void test_echo() {
    Fixture f;
    assert(f.run("echo hello   world").out == "hello world\n");
    assert(f.run("echo -n hi").out == "hi");
    assert(f.run("echo -e 'a\\tb'").out == "a\tb\n");
    assert(f.run("echo").out == "\n");
}

void test_file() {
    Fixture f;
    f.storage.write("/data.json", "{\"a\":1}");
    f.storage.write("/script", "#!/usr/bin/env python3\nprint(1)\n");
    f.storage.write("/blob", "[1, 2, 3]");
    f.storage.write("/page", "<!DOCTYPE html><html></html>");
    f.storage.write("/empty.txt", "");
    f.storage.write("/main.cpp", "int main() {}\n");
    f.storage.write("/src/x.txt", "x");

    assert(f.run("file data.json").out == "data.json: JSON text data\n");
    assert(f.run("file script").out == "script: Python script text executable\n");
    assert(f.run("file blob").out == "blob: JSON text data\n");
    assert(f.run("file page").out == "page: HTML document, UTF-8 Unicode text\n");
    assert(f.run("file empty.txt").out == "empty.txt: empty\n");
    assert(f.run("file -b main.cpp").out == "C++ source, UTF-8 Unicode text\n");
    assert(f.run("file src").out == "src: directory\n");
    assert(f.run("file -i data.json").out == "data.json: application/json; charset=utf-8\n");
    assert(f.run("file -i src").out == "src: inode/directory; charset=binary\n");
    assert(f.run("file words.txt").out == "words.txt: UTF-8 Unicode text\n");

    auto r = f.run("file nope data.json");
    assert(r.exit_code == 1);
    assert(r.out == "file: nope: No such file or directory\ndata.json: JSON text data\n");
}

} // namespace

int main() {
    test_cat();
    test_cat_limits();
    test_head_and_tail();
    test_wc();
    test_sort();
    test_echo();
    test_file();

    return 0;
}
