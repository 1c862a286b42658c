#include "Parser.hpp"

#include <cctype>
#include <regex>
#include <stdexcept>

namespace Parser {

namespace {

struct Token {
    std::string text;
    bool op = false;
};

std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

std::vector<Token> tokenize(const std::string& line) {
    std::vector<Token> out;
    std::string cur;
    bool in_single = false, in_double = false, escape = false, quoted = false;

    auto push = [&]() {
        if (!cur.empty() || quoted) out.push_back(Token{cur, false});
        cur.clear();
        quoted = false;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escape) { cur.push_back(c); escape = false; continue; }
        if (c == '\\' && !in_single) {
            if (in_double) {
                char n = i + 1 < line.size() ? line[i + 1] : '\0';
                if (n == '"' || n == '\\' || n == '$' || n == '`') { escape = true; continue; }
                cur.push_back(c);
                continue;
            }
            if (i + 1 < line.size()) { escape = true; continue; }
            cur.push_back(c);
            continue;
        }
        if (c == '\'' && !in_double) { in_single = !in_single; quoted = true; continue; }
        if (c == '"' && !in_single) { in_double = !in_double; quoted = true; continue; }
        if (!in_single && !in_double) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') { push(); continue; }
            if (c == '>') {
                push();
                if (i + 1 < line.size() && line[i + 1] == '>') {
                    out.push_back(Token{">>", true});
                    ++i;
                } else {
                    out.push_back(Token{">", true});
                }
                continue;
            }
            if (c == '<') {
                push();
                out.push_back(Token{"<", true});
                continue;
            }
        }
        cur.push_back(c);
    }
    push();
    return out;
}

struct HeredocMarker {
    size_t pos = 0;
    size_t len = 0;
    std::string delimiter;
    bool quoted = false;
    bool strip_tabs = false;
};

// First unquoted "<<" followed by a delimiter word.
bool find_heredoc(const std::string& line, HeredocMarker& marker) {
    static const std::regex re(R"(^<<(-?)\s*(['"]?)(\w+)\2)");
    bool in_single = false, in_double = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && !in_single) { ++i; continue; }
        if (c == '\'' && !in_double) { in_single = !in_single; continue; }
        if (c == '"' && !in_single) { in_double = !in_double; continue; }
        if (in_single || in_double) continue;
        if (c == '<' && i + 1 < line.size() && line[i + 1] == '<') {
            std::smatch m;
            std::string rest = line.substr(i);
            if (std::regex_search(rest, m, re)) {
                marker.pos = i;
                marker.len = static_cast<size_t>(m.length(0));
                marker.strip_tabs = m[1].length() > 0;
                marker.quoted = m[2].length() > 0;
                marker.delimiter = m[3].str();
                return true;
            }
            ++i;
        }
    }
    return false;
}

std::vector<Pipeline> parse_line(const std::string& line) {
    std::vector<Pipeline> pipelines;
    auto parts = split_top_level(line, "&&");
    for (auto& part : parts) {
        auto part_trim = trim(part);
        if (part_trim.empty()) continue;
        Pipeline pipeline;
        auto segments = split_top_level(part_trim, "|");
        for (auto& seg : segments) {
            if (trim(seg).empty()) continue;
            auto cmd = parse_stage(seg);
            if (cmd.command.empty() && cmd.args.empty()) continue;
            pipeline.stages.push_back(std::move(cmd));
        }
        if (!pipeline.stages.empty()) pipelines.push_back(std::move(pipeline));
    }
    return pipelines;
}

}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> out;
    for (auto& t : tokenize(line)) out.push_back(std::move(t.text));
    return out;
}

std::vector<std::string> split_top_level(const std::string& line, const std::string& op) {
    std::vector<std::string> parts;
    std::string cur;
    bool in_single = false, in_double = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && !in_single && i + 1 < line.size()) {
            cur.push_back(c);
            cur.push_back(line[++i]);
            continue;
        }
        if (c == '\'' && !in_double) in_single = !in_single;
        else if (c == '"' && !in_single) in_double = !in_double;
        else if (!in_single && !in_double && line.compare(i, op.size(), op) == 0) {
            parts.push_back(cur);
            cur.clear();
            i += op.size() - 1;
            continue;
        }
        cur.push_back(c);
    }
    parts.push_back(cur);
    return parts;
}

bool has_open_quote(const std::string& text) {
    bool in_single = false, in_double = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && !in_single) { ++i; continue; }
        if (c == '\'' && !in_double) in_single = !in_single;
        else if (c == '"' && !in_single) in_double = !in_double;
    }
    return in_single || in_double;
}

ParsedCommand parse_stage(const std::string& segment) {
    static const std::regex stderr_re(R"(\s*2>\s*(?:/dev/null|&1)\s*)");
    auto cleaned = std::regex_replace(segment, stderr_re, " ");

    ParsedCommand cmd;
    auto tokens = tokenize(cleaned);
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        if (t.op) {
            if (i + 1 >= tokens.size() || tokens[i + 1].op) {
                throw std::runtime_error("syntax error: missing target for '" + t.text + "'");
            }
            const auto& target = tokens[++i].text;
            if (t.text == ">") { cmd.output_file = target; cmd.append_file.reset(); }
            else if (t.text == ">>") { cmd.append_file = target; cmd.output_file.reset(); }
            else cmd.input_file = target;
            continue;
        }
        if (cmd.command.empty() && cmd.args.empty()) cmd.command = t.text;
        else cmd.args.push_back(t.text);
    }
    return cmd;
}

std::vector<Pipeline> parse(const std::string& script) {
    std::vector<std::string> lines;
    {
        size_t start = 0;
        while (start <= script.size()) {
            size_t nl = script.find('\n', start);
            if (nl == std::string::npos) nl = script.size();
            std::string l = script.substr(start, nl - start);
            if (!l.empty() && l.back() == '\r') l.pop_back();
            lines.push_back(std::move(l));
            start = nl + 1;
        }
    }

    std::vector<Pipeline> pipelines;
    size_t i = 0;
    while (i < lines.size()) {
        // Quoted strings may span physical lines.
        std::string logical = lines[i++];
        while (has_open_quote(logical) && i < lines.size()) {
            logical += "\n";
            logical += lines[i++];
        }

        auto line = trim(logical);
        if (line.empty() || line[0] == '#') continue;

        HeredocMarker marker;
        if (!find_heredoc(line, marker)) {
            for (auto& p : parse_line(line)) pipelines.push_back(std::move(p));
            continue;
        }

        std::string body;
        while (i < lines.size()) {
            std::string l = lines[i++];
            if (trim(l) == marker.delimiter) break;
            if (marker.strip_tabs) {
                size_t k = 0;
                while (k < l.size() && l[k] == '\t') ++k;
                l = l.substr(k);
            }
            body += l;
            body += "\n";
        }

        // Locate the stage that carried the marker before removing it.
        auto prefix = line.substr(0, marker.pos);
        auto and_parts = split_top_level(prefix, "&&");
        size_t and_index = and_parts.size() - 1;
        size_t pipe_index = split_top_level(and_parts.back(), "|").size() - 1;

        auto cleaned = trim(line.substr(0, marker.pos) + " " + line.substr(marker.pos + marker.len));
        if (cleaned.empty()) continue;

        auto parsed = parse_line(cleaned);
        if (and_index < parsed.size() && pipe_index < parsed[and_index].stages.size()) {
            auto& stage = parsed[and_index].stages[pipe_index];
            stage.stdin_content = body;
            stage.heredoc_quoted = marker.quoted;
        }
        for (auto& p : parsed) pipelines.push_back(std::move(p));
    }
    return pipelines;
}

}
