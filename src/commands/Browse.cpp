#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../core/ShellConfig.hpp"
#include "../net/IHttpClient.hpp"
#include "Helpers.hpp"
#include "RegexScan.hpp"

#include <functional>
#include <memory>
#include <regex>

namespace {

constexpr size_t kMinContentLength = 50;

const char* const kBlockedPatterns[] = {
    R"(please\s+enable\s+javascript)",
    R"(you\s+need\s+to\s+enable\s+javascript)",
    R"(javascript\s+is\s+required)",
    R"(please\s+click\s+here\s+if\s+you\s+are\s+not\s+redirected)",
    R"(if\s+you\s+are\s+not\s+redirected)",
    R"(checking\s+(your\s+)?browser)",
    R"(verify\s+you\s+are\s+(a\s+)?human)",
    R"(captcha)",
    R"(access\s+denied)",
    R"(forbidden)",
    R"(bot\s+detected)",
    R"(unusual\s+traffic)",
    R"(automated\s+requests)",
};

using ElementRewrite = std::function<std::optional<std::string>(const std::string& open_tag, const std::string& inner)>;

bool tag_boundary(const std::string& s, size_t pos) {
    if (pos >= s.size()) return false;
    char c = s[pos];
    return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
}

// Rewrites every <tag ...>inner</tag> (case-insensitive, first closing tag
// wins). Elements the rewrite declines are copied through unchanged.
std::string rewrite_elements(const std::string& html, const std::string& tag, const ElementRewrite& rewrite) {
    const std::string lower = to_lower(html);
    const std::string open = "<" + tag;
    const std::string close = "</" + tag + ">";
    std::string out;
    out.reserve(html.size());

    size_t pos = 0;
    while (pos < html.size()) {
        size_t start = lower.find(open, pos);
        if (start == std::string::npos) break;
        size_t after_name = start + open.size();
        size_t open_end = tag_boundary(lower, after_name) ? html.find('>', after_name) : std::string::npos;
        size_t close_at = open_end == std::string::npos ? std::string::npos : lower.find(close, open_end + 1);
        if (close_at == std::string::npos) {
            out.append(html, pos, after_name - pos);
            pos = after_name;
            continue;
        }
        auto replaced = rewrite(html.substr(start, open_end + 1 - start),
                                html.substr(open_end + 1, close_at - open_end - 1));
        if (!replaced) {
            out.append(html, pos, after_name - pos);
            pos = after_name;
            continue;
        }
        out.append(html, pos, start - pos);
        out += *replaced;
        pos = close_at + close.size();
    }
    out.append(html, pos, std::string::npos);
    return out;
}

std::string replace_all_icase(const std::string& s, const std::string& needle, const std::string& with) {
    const std::string lower = to_lower(s);
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t at = lower.find(needle, pos);
        if (at == std::string::npos) break;
        out.append(s, pos, at - pos);
        out += with;
        pos = at + needle.size();
    }
    out.append(s, pos, std::string::npos);
    return out;
}

std::string replace_all(const std::string& s, const std::string& needle, const std::string& with) {
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t at = s.find(needle, pos);
        if (at == std::string::npos) break;
        out.append(s, pos, at - pos);
        out += with;
        pos = at + needle.size();
    }
    out.append(s, pos, std::string::npos);
    return out;
}

// <br>, <br/>, <br /> to newlines
std::string replace_breaks(const std::string& s) {
    const std::string lower = to_lower(s);
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t at = lower.find("<br", pos);
        if (at == std::string::npos) break;
        size_t j = at + 3;
        while (j < s.size() && std::isspace(static_cast<unsigned char>(s[j]))) ++j;
        if (j < s.size() && s[j] == '/') ++j;
        if (j < s.size() && s[j] == '>') {
            out.append(s, pos, at - pos);
            out += '\n';
            pos = j + 1;
        } else {
            out.append(s, pos, at + 3 - pos);
            pos = at + 3;
        }
    }
    out.append(s, pos, std::string::npos);
    return out;
}

std::string strip_tags(const std::string& s) {
    std::string out;
    size_t pos = 0;
    while (pos < s.size()) {
        if (s[pos] == '<') {
            size_t end = s.find('>', pos + 1);
            if (end != std::string::npos && end > pos + 1) {
                pos = end + 1;
                continue;
            }
        }
        out += s[pos++];
    }
    return out;
}

std::string collapse_whitespace(const std::string& s) {
    std::string spaced;
    for (char c : s) {
        bool blank = c == ' ' || c == '\t';
        if (blank) {
            if (spaced.empty() || spaced.back() != ' ') spaced += ' ';
        } else {
            spaced += c;
        }
    }
    spaced = replace_all(spaced, "\n ", "\n");
    spaced = replace_all(spaced, " \n", "\n");

    std::string out;
    size_t run = 0;
    for (char c : spaced) {
        run = c == '\n' ? run + 1 : 0;
        if (run <= 2) out += c;
    }
    return trim(out);
}

// Markdown-flavoured plain text: page chrome dropped, headings as '#',
// links as [text](url), list items as "- ".
std::string html_to_text(const std::string& html) {
    auto drop = [](const std::string&, const std::string&) -> std::optional<std::string> { return std::string(); };
    std::string text = html;
    for (const char* tag : {"script", "style", "nav", "footer"}) text = rewrite_elements(text, tag, drop);

    for (int level = 1; level <= 6; ++level) {
        std::string hashes(static_cast<size_t>(level), '#');
        text = rewrite_elements(text, "h" + std::to_string(level),
            [&](const std::string&, const std::string& inner) -> std::optional<std::string> {
                return "\n" + hashes + " " + inner + "\n";
            });
    }

    text = rewrite_elements(text, "a", [](const std::string& open, const std::string& inner) -> std::optional<std::string> {
        auto at = to_lower(open).find("href=\"");
        if (at == std::string::npos) return std::nullopt;
        auto end = open.find('"', at + 6);
        if (end == std::string::npos) return std::nullopt;
        return "[" + inner + "](" + open.substr(at + 6, end - at - 6) + ")";
    });

    text = rewrite_elements(text, "li", [](const std::string&, const std::string& inner) -> std::optional<std::string> {
        return "- " + inner + "\n";
    });

    text = replace_all_icase(text, "</p>", "\n\n");
    text = replace_breaks(text);
    text = replace_all_icase(text, "</div>", "\n");
    text = strip_tags(text);

    text = replace_all(text, "&amp;", "&");
    text = replace_all(text, "&lt;", "<");
    text = replace_all(text, "&gt;", ">");
    text = replace_all(text, "&quot;", "\"");
    text = replace_all(text, "&#39;", "'");
    text = replace_all(text, "&nbsp;", " ");

    return collapse_whitespace(text);
}

std::optional<std::string> low_quality_warning(const std::string& text) {
    if (text.size() < kMinContentLength) {
        return "browse: page returned very little content (" + std::to_string(text.size()) +
               " chars). The site likely requires JavaScript or blocked the request. "
               "Try a different source or use `curl` with an API endpoint instead.";
    }
    for (const char* pattern : kBlockedPatterns) {
        if (RegexScan::search(text, std::regex(pattern, std::regex::ECMAScript | std::regex::icase))) {
            return std::string("browse: page appears to require JavaScript or blocked the request (matched: ") +
                   pattern + "). Content returned is not useful. Try a different URL, use a direct API, "
                   "or try a different source for this information.";
        }
    }
    return std::nullopt;
}

}

class Browse : public ICommand {
public:
    std::string name() const override { return "browse"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "browse [OPTIONS] URL";
        h.description = "Fetch a web page and convert HTML to readable text";
        h.flags = {{"--raw", "Return raw HTML instead of converted text"}};
        h.examples = {
            {"browse https://example.com", "Fetch and convert page to text"},
            {"browse --raw https://example.com", "Fetch raw HTML"},
            {"browse https://example.com | grep \"keyword\"", "Fetch and search for keyword"},
            {"browse https://example.com > page.md", "Save page content to file"},
        };
        h.notes = {
            "Strips <script>, <style>, <nav>, <footer> tags",
            "Converts headings to # format, links to [text](url)",
            "Output is trimmed to 50K characters",
            "No JavaScript engine; sites requiring JS (search engines, SPA apps) will return errors",
            "Returns exit code 1 if the page appears blocked or has no useful content",
            "For search, use a search API via curl instead of browsing search engine pages",
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool raw = false;
        std::string url;
        for (const auto& a : args) {
            if (a == "--raw") raw = true;
            else if (!starts_with(a, "-")) url = a;
        }
        if (url.empty()) return ShellResult::fail("browse: no URL specified");

        HttpRequest req;
        req.url = url;
        req.timeout_ms = ctx.config.timeout_ms;
        req.headers = {
            {"User-Agent", "Mozilla/5.0 (compatible; ShellBrowser/1.0)"},
            {"Accept", "text/html, application/xhtml+xml, */*"},
        };

        HttpResponse resp;
        try {
            resp = ctx.http.send(req);
        } catch (const HttpError& e) {
            return ShellResult::fail(std::string("browse: ") + e.what());
        }
        if (!resp.ok()) {
            return ShellResult::fail("browse: HTTP " + std::to_string(resp.status) + " " + resp.status_text);
        }

        std::string output = raw ? resp.body : html_to_text(resp.body);
        if (!raw) {
            if (auto warning = low_quality_warning(output)) {
                ShellResult r = ShellResult::fail(*warning);
                r.out = output + "\n";
                return r;
            }
        }

        const size_t max = ctx.config.limits.max_browse_output;
        if (output.size() > max) {
            output = output.substr(0, max) + "\n\n[... truncated at " + std::to_string(max / 1000) + "K characters]";
        }
        return ShellResult::ok(output + "\n");
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_browse(){ return std::make_unique<Browse>(); } }
