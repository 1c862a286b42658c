#include <cassert>
#include <string>
#include <vector>

#include "net/IHttpClient.hpp"
#include "shell/Shell.hpp"
#include "vfs/MemoryVfs.hpp"

namespace {

class FakeHttp : public IHttpClient {
public:
    HttpResponse response;
    bool fail = false;
    std::vector<HttpRequest> requests;

    HttpResponse send(const HttpRequest& request) override {
        requests.push_back(request);
        if (fail) throw HttpError("Could not resolve host: nowhere.invalid");
        return response;
    }

    std::string header(const std::string& name) const {
        for (const auto& h : requests.back().headers) {
            if (h.first == name) return h.second;
        }
        return "<none>";
    }
};

HttpResponse make_response(long status, const std::string& text, const std::string& body) {
    HttpResponse r;
    r.status = status;
    r.status_text = text;
    r.body = body;
    r.headers = {{"content-type", "application/json"}};
    return r;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void test_curl_builds_request_from_config() {
    MemoryVfs storage;
    FakeHttp http;
    http.response = make_response(200, "OK", "{\"users\":[]}");
    ShellConfig config;
    config.base_url = "https://api.test/v1/";
    config.default_headers = {{"Authorization", "Bearer t0k"}, {"Accept", "application/json"}};
    config.timeout_ms = 1500;
    Shell shell(storage, config, &http);

    auto r = shell.execute("curl -s /users");
    assert(r.exit_code == 0);
    assert(r.out == "{\"users\":[]}");
    const auto& req = http.requests.back();
    assert(req.method == "GET");
    assert(req.url == "https://api.test/v1/users");
    assert(req.timeout_ms == 1500);
    assert(!req.has_body);
    assert(http.header("Authorization") == "Bearer t0k");

    shell.execute("curl -H 'Authorization: Bearer other' -H 'X-Trace:  42 ' https://elsewhere.test/x");
    assert(http.requests.back().url == "https://elsewhere.test/x");
    assert(http.header("Authorization") == "Bearer other");
    assert(http.header("X-Trace") == "42");
    assert(http.requests.back().headers.size() == 3);
}

void test_curl_methods_and_body() {
    MemoryVfs storage;
    FakeHttp http;
    http.response = make_response(201, "Created", "{}");
    Shell shell(storage, ShellConfig(), &http);

    shell.execute("curl -d '{\"k\":\"v\"}' https://api.test/items");
    assert(http.requests.back().method == "POST");
    assert(http.requests.back().has_body);
    assert(http.requests.back().body == "{\"k\":\"v\"}");

    shell.execute("curl -X PUT -d x https://api.test/items/1");
    assert(http.requests.back().method == "PUT");

    shell.execute("curl --request DELETE https://api.test/items/1");
    assert(http.requests.back().method == "DELETE");
}

void test_curl_output_and_errors() {
    MemoryVfs storage;
    FakeHttp http;
    http.response = make_response(200, "OK", "body");
    Shell shell(storage, ShellConfig(), &http);

    auto r = shell.execute("curl -i https://api.test/");
    assert(r.out == "HTTP/1.1 200 OK\ncontent-type: application/json\n\nbody");

    http.response = make_response(404, "Not Found", "{\"error\":\"missing\"}");
    r = shell.execute("curl https://api.test/nope");
    assert(r.exit_code == 1);
    assert(r.err == "curl: (22) HTTP error 404");
    assert(r.out == "{\"error\":\"missing\"}");

    http.fail = true;
    r = shell.execute("curl https://nowhere.invalid/");
    assert(r.exit_code == 1);
    assert(r.err == "curl: Could not resolve host: nowhere.invalid");

    r = shell.execute("curl -s");
    assert(r.err == "curl: no URL specified");
}

void test_curl_feeds_pipeline() {
    MemoryVfs storage;
    FakeHttp http;
    http.response = make_response(200, "OK", "{\"data\":{\"id\":7}}");
    Shell shell(storage, ShellConfig(), &http);
    auto r = shell.execute("curl -s https://api.test/ | jq .data.id");
    assert(r.out == "7\n");
    r = shell.execute("curl -s https://api.test/ > resp.json && jq -c .data resp.json");
    assert(r.out == "{\"id\":7}\n");
}

const char* kPage =
    "<html><head><title>T</title><script>track()</script><style>p{}</style></head>"
    "<body><nav>Home | About</nav><h1>Title</h1><h2>Sub &amp; more</h2>"
    "<p>Hello &amp; welcome to the page with enough content to pass.</p>"
    "<a href=\"https://x.y/docs\">docs</a><ul><li>one</li><li>two</li></ul>"
    "line<br/>break<footer>copyright</footer></body></html>";

void test_browse_converts_html() {
    MemoryVfs storage;
    FakeHttp http;
    http.response = make_response(200, "OK", kPage);
    Shell shell(storage, ShellConfig(), &http);

    auto r = shell.execute("browse https://x.y/");
    assert(r.exit_code == 0);
    assert(contains(r.out, "# Title\n"));
    assert(contains(r.out, "## Sub & more\n"));
    assert(contains(r.out, "Hello & welcome to the page"));
    assert(contains(r.out, "[docs](https://x.y/docs)"));
    assert(contains(r.out, "- one\n- two\n"));
    assert(contains(r.out, "line\nbreak"));
    assert(!contains(r.out, "track()"));
    assert(!contains(r.out, "Home | About"));
    assert(!contains(r.out, "copyright"));
    assert(!contains(r.out, "<"));
    assert(r.out.back() == '\n');

    assert(http.header("User-Agent") == "Mozilla/5.0 (compatible; ShellBrowser/1.0)");

    auto raw = shell.execute("browse --raw https://x.y/");
    assert(raw.out == std::string(kPage) + "\n");
}

void test_browse_quality_checks() {
    MemoryVfs storage;
    FakeHttp http;
    Shell shell(storage, ShellConfig(), &http);

    http.response = make_response(200, "OK", "<p>Hi</p>");
    auto thin = shell.execute("browse https://x.y/");
    assert(thin.exit_code == 1);
    assert(thin.out == "Hi\n");
    assert(contains(thin.err, "very little content (2 chars)"));

    http.response = make_response(200, "OK",
        "<p>Please enable JavaScript to continue using this website, thank you very much.</p>");
    auto blocked = shell.execute("browse https://x.y/");
    assert(blocked.exit_code == 1);
    assert(contains(blocked.err, "matched: please\\s+enable\\s+javascript"));

    http.response = make_response(503, "Service Unavailable", "down");
    auto down = shell.execute("browse https://x.y/");
    assert(down.exit_code == 1);
    assert(down.err == "browse: HTTP 503 Service Unavailable");
    assert(down.out.empty());

    assert(shell.execute("browse").err == "browse: no URL specified");
}

void test_browse_truncates_long_pages() {
    MemoryVfs storage;
    FakeHttp http;
    ShellConfig config;
    config.limits.max_browse_output = 2000;
    Shell shell(storage, config, &http);

    http.response = make_response(200, "OK", "<p>" + std::string(3000, 'a') + "</p>");
    auto r = shell.execute("browse https://x.y/");
    assert(r.exit_code == 0);
    assert(r.out == std::string(2000, 'a') + "\n\n[... truncated at 2K characters]\n");
}

} // namespace

int main() {
    test_curl_builds_request_from_config();
    test_curl_methods_and_body();
    test_curl_output_and_errors();
    test_curl_feeds_pipeline();
    test_browse_converts_html();
    test_browse_quality_checks();
    test_browse_truncates_long_pages();

    return 0;
}
