#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/ShellConfig.hpp"
#include "../net/IHttpClient.hpp"
#include "Helpers.hpp"

#include <memory>

namespace {

// Later headers replace earlier ones with the same (case-insensitive) name.
void set_header(HttpHeaders& headers, const std::string& key, const std::string& value) {
    for (auto& h : headers) {
        if (to_lower(h.first) == to_lower(key)) { h.second = value; return; }
    }
    headers.emplace_back(key, value);
}

std::string resolve_url(const std::string& base, const std::string& url) {
    if (base.empty() || starts_with(url, "http")) return url;
    std::string b = base;
    if (!b.empty() && b.back() == '/') b.pop_back();
    return b + "/" + (starts_with(url, "/") ? url.substr(1) : url);
}

}

class Curl : public ICommand {
public:
    std::string name() const override { return "curl"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "curl [OPTIONS] URL";
        h.description = "Transfer data from or to a server";
        h.flags = {
            {"-X METHOD", "Request method (GET, POST, PUT, DELETE, PATCH)"},
            {"-d DATA", "Send data in request body (sets POST if no -X)"},
            {"-H HEADER", "Add header (e.g. \"Content-Type: application/json\")"},
            {"-s", "Silent mode (suppress progress)"},
            {"-i", "Include response headers in output"},
            {"-o FILE", "Write output to file (use shell redirection instead)"},
        };
        h.examples = {
            {"curl https://api.example.com/users", "GET request"},
            {"curl -X POST https://api.com/data -d '{\"key\":\"value\"}'", "POST with JSON body"},
            {"curl -H \"Authorization: Bearer token\" https://api.com", "Request with auth header"},
            {"curl -s https://api.com | jq .data", "Fetch JSON and extract field"},
        };
        h.notes = {
            "Relative URLs resolved against configured base_url",
            "Default headers from config are included automatically",
            "Always quote URLs with special characters",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        HttpRequest req;
        req.headers = ctx.config.default_headers;
        req.timeout_ms = ctx.config.timeout_ms;
        bool explicit_method = false;
        bool include = false;
        std::string url;

        auto value_of = [&](size_t& i) -> std::optional<std::string> {
            if (i + 1 >= args.size()) return std::nullopt;
            return args[++i];
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "-X" || a == "--request") {
                auto v = value_of(i);
                if (!v) return ShellResult::fail("curl: option " + a + ": requires parameter");
                req.method = *v;
                explicit_method = true;
            } else if (a == "-d" || a == "--data") {
                auto v = value_of(i);
                if (!v) return ShellResult::fail("curl: option " + a + ": requires parameter");
                req.body = *v;
                req.has_body = true;
                if (!explicit_method) req.method = "POST";
            } else if (a == "-H" || a == "--header") {
                auto v = value_of(i);
                if (!v) return ShellResult::fail("curl: option " + a + ": requires parameter");
                auto colon = v->find(':');
                if (colon != std::string::npos && colon > 0) set_header(req.headers, trim(v->substr(0, colon)), trim(v->substr(colon + 1)));
            } else if (a == "-s" || a == "--silent") {
                // no progress output to suppress
            } else if (a == "-i" || a == "--include") {
                include = true;
            } else if (a == "-o" || a == "--output") {
                ++i;
            } else if (!starts_with(a, "-")) {
                url = a;
            }
        }

        if (url.empty()) return ShellResult::fail("curl: no URL specified");
        req.url = resolve_url(ctx.config.base_url, url);

        HttpResponse resp;
        try {
            resp = ctx.http.send(req);
        } catch (const HttpError& e) {
            return ShellResult::fail(std::string("curl: ") + e.what());
        }

        std::string out;
        if (include) {
            out += "HTTP/1.1 " + std::to_string(resp.status) + " " + resp.status_text + "\n";
            for (const auto& h : resp.headers) out += h.first + ": " + h.second + "\n";
            out += "\n";
        }
        out += resp.body;

        ShellResult r = ShellResult::ok(out);
        if (!resp.ok()) {
            r.exit_code = 1;
            r.err = "curl: (22) HTTP error " + std::to_string(resp.status);
        }
        return r;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_curl(){ return std::make_unique<Curl>(); } }
