#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "shell/Parser.hpp"

namespace {

void test_split_handles_quotes_and_escapes() {
    assert(Parser::split(R"(cmd 'a b' "c d")") == (std::vector<std::string>{"cmd", "a b", "c d"}));
    assert(Parser::split(R"(echo "say \"hi\"" it\'s)") == (std::vector<std::string>{"echo", "say \"hi\"", "it's"}));
    assert(Parser::split(R"(echo "a\nb")") == (std::vector<std::string>{"echo", "a\\nb"}));
    assert(Parser::split("echo '' x") == (std::vector<std::string>{"echo", "", "x"}));
    assert(Parser::split("echo '$HOME'") == (std::vector<std::string>{"echo", "$HOME"}));
}

void test_split_top_level_ignores_quoted_operators() {
    auto parts = Parser::split_top_level("echo 'a|b' | wc -l", "|");
    assert(parts.size() == 2);
    assert(parts[0] == "echo 'a|b' ");
    assert(parts[1] == " wc -l");
    assert(Parser::split_top_level("a && b && c", "&&").size() == 3);
}

void test_stage_extracts_redirections() {
    auto cmd = Parser::parse_stage(R"(cmd 'a b' "c d" > out.txt)");
    assert(cmd.command == "cmd");
    assert(cmd.args == (std::vector<std::string>{"a b", "c d"}));
    assert(cmd.output_file.value() == "out.txt");
    assert(!cmd.append_file);

    auto app = Parser::parse_stage("echo x >> log.txt");
    assert(app.append_file.value() == "log.txt");
    assert(!app.output_file);

    auto in = Parser::parse_stage("sort < names.txt");
    assert(in.command == "sort");
    assert(in.args.empty());
    assert(in.input_file.value() == "names.txt");

    auto glued = Parser::parse_stage("echo hi>out.txt");
    assert(glued.args == std::vector<std::string>{"hi"});
    assert(glued.output_file.value() == "out.txt");
}

void test_stage_drops_stderr_redirections() {
    auto cmd = Parser::parse_stage("grep x file.txt 2>/dev/null");
    assert(cmd.args == (std::vector<std::string>{"x", "file.txt"}));
    assert(!cmd.output_file);

    auto merged = Parser::parse_stage("cat a.txt 2>&1");
    assert(merged.args == std::vector<std::string>{"a.txt"});
}

void test_quoted_operator_is_literal() {
    auto cmd = Parser::parse_stage("echo 'a > b'");
    assert(cmd.args == std::vector<std::string>{"a > b"});
    assert(!cmd.output_file);
}

void test_missing_redirect_target_is_an_error() {
    bool threw = false;
    try { Parser::parse_stage("echo hi >"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);
}

void test_script_splits_and_and_pipes() {
    auto pipelines = Parser::parse("mkdir -p a && echo hi | wc -l\n# comment\n\necho done");
    assert(pipelines.size() == 3);
    assert(pipelines[0].stages.size() == 1);
    assert(pipelines[0].stages[0].command == "mkdir");
    assert(pipelines[1].stages.size() == 2);
    assert(pipelines[1].stages[1].command == "wc");
    assert(pipelines[2].stages[0].args == std::vector<std::string>{"done"});
}

void test_empty_segments_are_dropped() {
    auto pipelines = Parser::parse("echo a && && echo b");
    assert(pipelines.size() == 2);
    assert(pipelines[0].stages[0].args == std::vector<std::string>{"a"});
    assert(pipelines[1].stages[0].args == std::vector<std::string>{"b"});

    pipelines = Parser::parse("echo hi &&");
    assert(pipelines.size() == 1);
    assert(pipelines[0].stages.size() == 1);

    pipelines = Parser::parse("echo hi |");
    assert(pipelines.size() == 1);
    assert(pipelines[0].stages.size() == 1);

    pipelines = Parser::parse("echo a | | wc");
    assert(pipelines.size() == 1);
    assert(pipelines[0].stages.size() == 2);
    assert(pipelines[0].stages[1].command == "wc");

    assert(Parser::parse("&& |").empty());
}

void test_heredoc_body_attaches_to_stage() {
    auto pipelines = Parser::parse("cat << EOF\nhello\nit's fine\nEOF\necho after");
    assert(pipelines.size() == 2);
    const auto& stage = pipelines[0].stages[0];
    assert(stage.command == "cat");
    assert(stage.args.empty());
    assert(stage.stdin_content.value() == "hello\nit's fine\n");
    assert(!stage.heredoc_quoted);
    assert(pipelines[1].stages[0].command == "echo");
}

void test_heredoc_variants() {
    auto quoted = Parser::parse("cat <<'END' > out.txt\n$HOME\nEND");
    assert(quoted.size() == 1);
    assert(quoted[0].stages[0].heredoc_quoted);
    assert(quoted[0].stages[0].stdin_content.value() == "$HOME\n");
    assert(quoted[0].stages[0].output_file.value() == "out.txt");

    auto tabs = Parser::parse("cat <<-EOF\n\t\tindented\n\tEOF");
    assert(tabs[0].stages[0].stdin_content.value() == "indented\n");

    auto piped = Parser::parse("echo start && cat << EOF | wc -l\na\nb\nEOF");
    assert(piped.size() == 2);
    assert(piped[1].stages.size() == 2);
    assert(piped[1].stages[0].stdin_content.value() == "a\nb\n");
    assert(!piped[1].stages[1].stdin_content);
}

void test_multiline_quotes_join_lines() {
    auto pipelines = Parser::parse("echo 'line one\nline two'");
    assert(pipelines.size() == 1);
    assert(pipelines[0].stages[0].args == std::vector<std::string>{"line one\nline two"});

    // A quote still open at the end of input keeps the rest as one argument.
    pipelines = Parser::parse("echo 'abc\ndef");
    assert(pipelines.size() == 1);
    assert(pipelines[0].stages.size() == 1);
    assert(pipelines[0].stages[0].command == "echo");
    assert(pipelines[0].stages[0].args == std::vector<std::string>{"abc\ndef"});
}

} // namespace

int main() {
    test_split_handles_quotes_and_escapes();
    test_split_top_level_ignores_quoted_operators();
    test_stage_extracts_redirections();
    test_stage_drops_stderr_redirections();
    test_quoted_operator_is_literal();
    test_missing_redirect_target_is_an_error();
    test_script_splits_and_and_pipes();
    test_empty_segments_are_dropped();
    test_heredoc_body_attaches_to_stage();
    test_heredoc_variants();
    test_multiline_quotes_join_lines();

    return 0;
}
