#include "RegexScan.hpp"

#include <algorithm>

namespace RegexScan {

namespace {

using Iter = std::string::const_iterator;

bool search_window(const std::string& text, std::size_t first, std::size_t last,
                   const std::regex& re, std::smatch& match) {
    auto flags = std::regex_constants::match_default;
    if (first > 0) flags |= std::regex_constants::match_prev_avail;
    if (last < text.size()) flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
    Iter begin = text.begin() + static_cast<std::ptrdiff_t>(first);
    Iter end = text.begin() + static_cast<std::ptrdiff_t>(last);
    return std::regex_search(begin, end, match, re, flags);
}

}

bool find(const std::string& text, std::size_t from, const std::regex& re, std::smatch& match) {
    const std::size_t step = kWindow / 2;
    for (std::size_t start = std::min(from, text.size()); ; start += step) {
        std::size_t stop = std::min(text.size(), start + kWindow);
        if (search_window(text, start, stop, re, match)) {
            auto at = static_cast<std::size_t>(match[0].first - text.begin());
            // Matches in the back half get another look with more room.
            if (at < start + step || stop == text.size()) return true;
        }
        if (stop == text.size()) return false;
    }
}

bool search(const std::string& text, const std::regex& re) {
    std::smatch match;
    return find(text, 0, re, match);
}

std::string replace(const std::string& text, const std::regex& re, const std::string& format,
                    bool global, bool& hit) {
    hit = false;
    std::string out;
    std::size_t pos = 0;
    std::smatch match;
    while (pos <= text.size() && find(text, pos, re, match)) {
        hit = true;
        auto at = static_cast<std::size_t>(match[0].first - text.begin());
        auto end = static_cast<std::size_t>(match[0].second - text.begin());
        out.append(text, pos, at - pos);
        out += match.format(format);
        if (!global) {
            pos = end;
            break;
        }
        if (end == at) {
            if (at < text.size()) out += text[at];
            pos = at + 1;
        } else {
            pos = end;
        }
    }
    if (pos < text.size()) out.append(text, pos, std::string::npos);
    return out;
}

}
