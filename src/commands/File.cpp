#include "../shell/ICommand.hpp"
#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"
#include "Helpers.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>

namespace {

const std::map<std::string, std::string> kMimeByExt = {
    {"json", "application/json; charset=utf-8"},
    {"js", "application/javascript; charset=utf-8"},
    {"mjs", "application/javascript; charset=utf-8"},
    {"jsx", "application/javascript; charset=utf-8"},
    {"ts", "application/typescript; charset=utf-8"},
    {"mts", "application/typescript; charset=utf-8"},
    {"tsx", "application/typescript; charset=utf-8"},
    {"html", "text/html; charset=utf-8"},
    {"htm", "text/html; charset=utf-8"},
    {"css", "text/css; charset=utf-8"},
    {"xml", "application/xml; charset=utf-8"},
    {"svg", "image/svg+xml; charset=utf-8"},
    {"md", "text/markdown; charset=utf-8"},
    {"csv", "text/csv; charset=utf-8"},
    {"yaml", "text/yaml; charset=utf-8"},
    {"yml", "text/yaml; charset=utf-8"},
    {"toml", "application/toml; charset=utf-8"},
    {"txt", "text/plain; charset=utf-8"},
    {"sh", "text/x-shellscript; charset=utf-8"},
    {"bash", "text/x-shellscript; charset=utf-8"},
    {"py", "text/x-python; charset=utf-8"},
    {"rb", "text/x-ruby; charset=utf-8"},
    {"java", "text/x-java; charset=utf-8"},
    {"c", "text/x-c; charset=utf-8"},
    {"h", "text/x-c; charset=utf-8"},
    {"cpp", "text/x-c++; charset=utf-8"},
    {"hpp", "text/x-c++; charset=utf-8"},
    {"go", "text/x-go; charset=utf-8"},
    {"rs", "text/x-rust; charset=utf-8"},
};

const std::map<std::string, std::string> kTypeByExt = {
    {"js", "JavaScript source, UTF-8 Unicode text"},
    {"mjs", "JavaScript source, UTF-8 Unicode text"},
    {"jsx", "JavaScript source, UTF-8 Unicode text"},
    {"ts", "TypeScript source, UTF-8 Unicode text"},
    {"mts", "TypeScript source, UTF-8 Unicode text"},
    {"tsx", "TypeScript source, UTF-8 Unicode text"},
    {"py", "Python source, UTF-8 Unicode text"},
    {"rb", "Ruby source, UTF-8 Unicode text"},
    {"java", "Java source, UTF-8 Unicode text"},
    {"c", "C source, UTF-8 Unicode text"},
    {"h", "C source header, UTF-8 Unicode text"},
    {"cpp", "C++ source, UTF-8 Unicode text"},
    {"hpp", "C++ source header, UTF-8 Unicode text"},
    {"go", "Go source, UTF-8 Unicode text"},
    {"rs", "Rust source, UTF-8 Unicode text"},
    {"css", "CSS stylesheet, UTF-8 Unicode text"},
    {"md", "Markdown document, UTF-8 Unicode text"},
    {"yaml", "YAML document, UTF-8 Unicode text"},
    {"yml", "YAML document, UTF-8 Unicode text"},
    {"toml", "TOML document, UTF-8 Unicode text"},
    {"csv", "CSV text"},
    {"sh", "Bourne-Again shell script text executable"},
    {"bash", "Bourne-Again shell script text executable"},
};

// JSON is only parsed below this size
constexpr size_t kMaxJsonSniff = 65536;

// Lowercased extension of the last path segment; dotfiles have none.
std::string ext_of(const std::string& path) {
    std::string name = basename_of(path);
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return "";
    return to_lower(name.substr(dot + 1));
}

std::string trim_start(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return s.substr(i);
}

bool looks_like_json(const std::string& content) {
    auto t = trim_start(content);
    if (!starts_with(t, "{") && !starts_with(t, "[")) return false;
    if (content.size() > kMaxJsonSniff) return false;
    return nlohmann::json::accept(content);
}

bool looks_like_html(const std::string& content) {
    auto t = to_lower(trim_start(content).substr(0, 50));
    return starts_with(t, "<!doctype html") || starts_with(t, "<html");
}

bool looks_like_xml(const std::string& content) {
    return starts_with(trim_start(content), "<?xml");
}

std::string detect_mime(const std::string& path, const std::string& content) {
    auto it = kMimeByExt.find(ext_of(path));
    if (it != kMimeByExt.end()) return it->second;
    if (looks_like_json(content)) return "application/json; charset=utf-8";
    if (looks_like_html(content)) return "text/html; charset=utf-8";
    if (looks_like_xml(content)) return "application/xml; charset=utf-8";
    return "text/plain; charset=utf-8";
}

std::string detect_type(const std::string& path, const std::string& content) {
    auto ext = ext_of(path);
    if (content.empty()) return "empty";

    if (ext == "json" || (ext.empty() && looks_like_json(content))) return "JSON text data";
    if (ext == "html" || ext == "htm" || (ext.empty() && looks_like_html(content)))
        return "HTML document, UTF-8 Unicode text";
    if (ext == "svg") return "SVG Scalable Vector Graphics image";
    if (ext == "xml" || (ext.empty() && looks_like_xml(content))) return "XML document text";

    if (starts_with(content, "#!")) {
        auto first = content.substr(0, content.find('\n'));
        if (first.find("python") != std::string::npos) return "Python script text executable";
        if (first.find("node") != std::string::npos) return "Node.js script text executable";
        if (first.find("bash") != std::string::npos || first.find("/sh") != std::string::npos)
            return "Bourne-Again shell script text executable";
        if (first.find("ruby") != std::string::npos) return "Ruby script text executable";
        if (first.find("perl") != std::string::npos) return "Perl script text executable";
        return "script text executable";
    }

    auto it = kTypeByExt.find(ext);
    if (it != kTypeByExt.end()) return it->second;

    for (const auto& line : split_lines(content)) {
        if (line.size() > 500) return "UTF-8 Unicode text, with very long lines";
    }
    return "UTF-8 Unicode text";
}

}

class File : public ICommand {
public:
    std::string name() const override { return "file"; }
    CommandHelp help() const override {
        CommandHelp h;
        h.usage = "file [OPTIONS] [FILE...]";
        h.description = "Determine file type";
        h.flags = {
            {"-b", "Brief mode (do not prepend filename)"},
            {"-i", "Output MIME type string"},
        };
        h.examples = {
            {"file data.json", "Identify file type"},
            {"file -i script.ts", "Show MIME type"},
            {"file -b readme.md", "Show type without filename"},
            {"file src", "Identify directory"},
        };
        return h;
    }

    ShellResult execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool brief = false, mime = false;
        std::vector<std::string> paths;
        for (const auto& a : args) {
            if (a == "-b") brief = true;
            else if (a == "-i" || a == "--mime") mime = true;
            else if (a == "-bi" || a == "-ib") brief = mime = true;
            else if (!starts_with(a, "-")) paths.push_back(a);
        }
        if (paths.empty()) return ShellResult::fail("file: missing file operand");

        auto format = [&](const std::string& path, const std::string& type) {
            return brief ? type : path + ": " + type;
        };

        std::vector<std::string> lines;
        bool failed = false;
        for (const auto& p : paths) {
            if (!ctx.vfs.exists(p)) {
                lines.push_back("file: " + p + ": No such file or directory");
                failed = true;
                continue;
            }
            if (ctx.vfs.isDirectory(p)) {
                lines.push_back(format(p, mime ? "inode/directory; charset=binary" : "directory"));
                continue;
            }
            auto content = ctx.vfs.read(p);
            if (!content) {
                lines.push_back("file: " + p + ": No such file or directory");
                failed = true;
                continue;
            }
            lines.push_back(format(p, mime ? detect_mime(p, *content) : detect_type(p, *content)));
        }

        ShellResult r = ShellResult::ok(join(lines, "\n") + "\n");
        r.exit_code = failed ? 1 : 0;
        return r;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_file(){ return std::make_unique<File>(); } }
