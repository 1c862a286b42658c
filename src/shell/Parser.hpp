#pragma once
#include <string>
#include <vector>

#include "ParsedCommand.hpp"

namespace Parser {
    // Split a line into args, handling quotes and escapes. Unquoted '>', '>>'
    // and '<' become tokens of their own.
    std::vector<std::string> split(const std::string& line);

    // Split on an operator ("&&" or "|") outside quotes. Pieces are untrimmed
    // and empty pieces are kept.
    std::vector<std::string> split_top_level(const std::string& line, const std::string& op);

    // True when the text ends inside a single- or double-quoted string.
    bool has_open_quote(const std::string& text);

    // Tokenize one stage and pull redirections out of the arguments.
    ParsedCommand parse_stage(const std::string& segment);

    // Whole script: one Pipeline per "&&"-separated command, in order.
    // Throws std::runtime_error on syntax errors.
    std::vector<Pipeline> parse(const std::string& script);
}
