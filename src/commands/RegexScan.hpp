#pragma once
#include <cstddef>
#include <regex>
#include <string>

// Line-oriented regex helpers for grep, sed and browse.
//
// libstdc++'s matcher recurses once per character it consumes, so matching
// an unbounded line can exhaust the stack. Lines longer than kWindow are
// scanned in windows of kWindow characters that overlap by half; a match is
// therefore confined to one window, and a match longer than kWindow / 2 on
// such a line may come out shorter or be missed. `^`, `$` and `\b` still
// refer to the real line edges.
namespace RegexScan {
    constexpr std::size_t kWindow = 4096;

    // First match starting at or after `from`.
    bool find(const std::string& text, std::size_t from, const std::regex& re, std::smatch& match);

    bool search(const std::string& text, const std::regex& re);

    // Substitutes `format` (regex_replace syntax: $&, $1) for the first match,
    // or every match when `global`. `hit` reports whether anything matched.
    std::string replace(const std::string& text, const std::regex& re, const std::string& format,
                        bool global, bool& hit);
}
