#include "JqFilter.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <regex>

namespace jq {

namespace {

std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

bool is_ident(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Split on '|' outside quotes, parentheses and brackets.
std::vector<std::string> split_pipes(const std::string& filter) {
    std::vector<std::string> parts;
    std::string cur;
    int depth = 0;
    bool in_string = false;
    for (size_t i = 0; i < filter.size(); ++i) {
        char c = filter[i];
        if (in_string) {
            cur += c;
            if (c == '\\' && i + 1 < filter.size()) cur += filter[++i];
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') in_string = true;
        else if (c == '(' || c == '[') ++depth;
        else if (c == ')' || c == ']') {
            if (--depth < 0) throw JqError("syntax error: unbalanced '" + std::string(1, c) + "' in filter");
        } else if (c == '|' && depth == 0) {
            parts.push_back(cur);
            cur.clear();
            continue;
        }
        cur += c;
    }
    if (depth != 0 || in_string) throw JqError("syntax error: unterminated expression in filter");
    parts.push_back(cur);
    return parts;
}

void parse_path(const std::string& seg, std::vector<Step>& steps) {
    size_t i = 0;
    const size_t n = seg.size();
    if (n == 0 || seg[0] != '.') throw JqError("syntax error: unsupported filter '" + seg + "'");

    while (i < n) {
        if (seg[i] == '.') {
            ++i;
            if (i < n && is_ident(seg[i])) {
                size_t j = i;
                while (j < n && is_ident(seg[j])) ++j;
                steps.push_back(Step{Step::Kind::Field, seg.substr(i, j - i), 0});
                i = j;
            } else if (i < n && seg[i] == '"') {
                size_t j = seg.find('"', i + 1);
                if (j == std::string::npos) throw JqError("syntax error: unterminated string in '" + seg + "'");
                steps.push_back(Step{Step::Kind::Field, seg.substr(i + 1, j - i - 1), 0});
                i = j + 1;
            } else if (i < n && seg[i] != '[') {
                throw JqError("syntax error: unexpected '" + std::string(1, seg[i]) + "' in '" + seg + "'");
            }
            continue;
        }
        if (seg[i] == '[') {
            size_t close = seg.find(']', i);
            if (close == std::string::npos) throw JqError("syntax error: missing ']' in '" + seg + "'");
            auto inner = trim(seg.substr(i + 1, close - i - 1));
            if (inner.empty()) {
                steps.push_back(Step{Step::Kind::Iterate, "", 0});
            } else if (inner.size() >= 2 && inner.front() == '"' && inner.back() == '"') {
                steps.push_back(Step{Step::Kind::Field, inner.substr(1, inner.size() - 2), 0});
            } else {
                char* end = nullptr;
                long idx = std::strtol(inner.c_str(), &end, 10);
                if (end == inner.c_str() || *end != '\0') throw JqError("syntax error: invalid index '" + inner + "'");
                steps.push_back(Step{Step::Kind::Index, "", idx});
            }
            i = close + 1;
            continue;
        }
        if (seg[i] == '?') { ++i; continue; }
        throw JqError("syntax error: unexpected '" + std::string(1, seg[i]) + "' in '" + seg + "'");
    }
}

std::string type_name(const Json& v) {
    switch (v.type()) {
        case Json::value_t::null: return "null";
        case Json::value_t::boolean: return "boolean";
        case Json::value_t::string: return "string";
        case Json::value_t::array: return "array";
        case Json::value_t::object: return "object";
        default: return "number";
    }
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

Json lookup_path(const Json& item, const std::string& path) {
    const Json* cur = &item;
    static const Json null_value;
    size_t i = 0;
    while (i < path.size()) {
        if (path[i] == '.') { ++i; continue; }
        size_t j = i;
        while (j < path.size() && path[j] != '.') ++j;
        auto key = path.substr(i, j - i);
        if (!cur->is_object()) return null_value;
        auto it = cur->find(key);
        if (it == cur->end()) return null_value;
        cur = &(*it);
        i = j;
    }
    return *cur;
}

double to_number(const Json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_null()) return 0.0;
    if (v.is_string()) {
        auto s = trim(v.get<std::string>());
        if (s.empty()) return 0.0;
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (*end == '\0') return d;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

Json parse_literal(const std::string& raw) {
    auto t = trim(raw);
    if (t.size() >= 2 && t.front() == '"' && t.back() == '"') return Json(t.substr(1, t.size() - 2));
    if (t == "true") return Json(true);
    if (t == "false") return Json(false);
    if (t == "null") return Json(nullptr);
    if (!t.empty()) {
        char* end = nullptr;
        double d = std::strtod(t.c_str(), &end);
        if (*end == '\0') {
            if (std::floor(d) == d && std::fabs(d) < 9e15) return Json(static_cast<long long>(d));
            return Json(d);
        }
    }
    return Json(t);
}

bool truthy(const Json& v) {
    return !(v.is_null() || (v.is_boolean() && !v.get<bool>()));
}

void apply_step(const Json& value, const Step& step, std::vector<Json>& out) {
    if (value.is_null() && step.kind != Step::Kind::Identity) {
        out.push_back(value);
        return;
    }
    switch (step.kind) {
        case Step::Kind::Identity:
            out.push_back(value);
            return;
        case Step::Kind::Field: {
            if (!value.is_object()) { out.push_back(Json(nullptr)); return; }
            auto it = value.find(step.arg);
            out.push_back(it == value.end() ? Json(nullptr) : *it);
            return;
        }
        case Step::Kind::Iterate:
            if (!value.is_array()) throw JqError("Cannot iterate over non-array (" + type_name(value) + ")");
            for (auto& el : value) out.push_back(el);
            return;
        case Step::Kind::Index: {
            if (!value.is_array()) throw JqError("Cannot index non-array (" + type_name(value) + ")");
            long n = static_cast<long>(value.size());
            long idx = step.index < 0 ? n + step.index : step.index;
            out.push_back(idx >= 0 && idx < n ? value[static_cast<size_t>(idx)] : Json(nullptr));
            return;
        }
        case Step::Kind::Select:
            if (value.is_array()) {
                Json filtered = Json::array();
                for (auto& el : value) {
                    if (evaluate_condition(el, step.arg)) filtered.push_back(el);
                }
                out.push_back(std::move(filtered));
            } else if (evaluate_condition(value, step.arg)) {
                out.push_back(value);
            }
            return;
        case Step::Kind::Map: {
            if (!value.is_array()) throw JqError("Cannot iterate over non-array (" + type_name(value) + ")");
            auto sub = parse(step.arg);
            Json mapped = Json::array();
            for (auto& el : value) {
                for (auto& r : jq::apply(el, sub)) mapped.push_back(std::move(r));
            }
            out.push_back(std::move(mapped));
            return;
        }
        case Step::Kind::Keys: {
            Json keys = Json::array();
            if (value.is_object()) {
                for (auto it = value.begin(); it != value.end(); ++it) keys.push_back(Json(it.key()));
            } else if (value.is_array()) {
                for (size_t i = 0; i < value.size(); ++i) keys.push_back(Json(i));
            } else {
                throw JqError(type_name(value) + " has no keys");
            }
            out.push_back(std::move(keys));
            return;
        }
        case Step::Kind::Values: {
            if (value.is_object()) {
                Json vals = Json::array();
                for (auto& el : value) vals.push_back(el);
                out.push_back(std::move(vals));
            } else {
                out.push_back(value);
            }
            return;
        }
        case Step::Kind::Length:
            if (value.is_array() || value.is_object()) out.push_back(Json(value.size()));
            else if (value.is_string()) out.push_back(Json(utf8_length(value.get<std::string>())));
            else if (value.is_number_unsigned()) out.push_back(value);
            else if (value.is_number_integer()) {
                auto n = value.get<std::int64_t>();
                out.push_back(n < 0 ? Json(std::uint64_t{0} - static_cast<std::uint64_t>(n)) : Json(n));
            }
            else if (value.is_number()) out.push_back(Json(std::fabs(value.get<double>())));
            else throw JqError(type_name(value) + " has no length");
            return;
    }
}

}

std::vector<Step> parse(const std::string& filter) {
    std::vector<Step> steps;
    for (auto& raw : split_pipes(filter)) {
        auto seg = trim(raw);
        if (seg.empty()) throw JqError("syntax error: empty filter segment");
        if (seg == ".") {
            steps.push_back(Step{Step::Kind::Identity, "", 0});
        } else if (seg.compare(0, 7, "select(") == 0 && seg.back() == ')') {
            steps.push_back(Step{Step::Kind::Select, seg.substr(7, seg.size() - 8), 0});
        } else if (seg.compare(0, 4, "map(") == 0 && seg.back() == ')') {
            steps.push_back(Step{Step::Kind::Map, seg.substr(4, seg.size() - 5), 0});
        } else if (seg == "keys") {
            steps.push_back(Step{Step::Kind::Keys, "", 0});
        } else if (seg == "values") {
            steps.push_back(Step{Step::Kind::Values, "", 0});
        } else if (seg == "length") {
            steps.push_back(Step{Step::Kind::Length, "", 0});
        } else {
            parse_path(seg, steps);
        }
    }
    return steps;
}

std::vector<Json> apply(const Json& input, const std::vector<Step>& steps) {
    std::vector<Json> stream{input};
    for (const auto& step : steps) {
        std::vector<Json> next;
        for (const auto& v : stream) apply_step(v, step, next);
        stream = std::move(next);
    }
    return stream;
}

std::vector<Json> run(const Json& input, const std::string& filter) {
    return jq::apply(input, parse(filter));
}

bool evaluate_condition(const Json& item, const std::string& condition) {
    static const std::regex cmp_re(R"(^\s*(\.[\w.]*)\s*(==|!=|>=|<=|>|<)\s*(.+?)\s*$)");
    static const std::regex path_re(R"(^\s*(\.[\w.]*)\s*$)");

    std::smatch m;
    if (std::regex_match(condition, m, cmp_re)) {
        Json lhs = lookup_path(item, m[1].str());
        Json rhs = parse_literal(m[3].str());
        const std::string op = m[2].str();
        if (op == "==") return lhs == rhs;
        if (op == "!=") return lhs != rhs;
        double a = to_number(lhs), b = to_number(rhs);
        if (op == ">") return a > b;
        if (op == "<") return a < b;
        if (op == ">=") return a >= b;
        return a <= b;
    }
    if (std::regex_match(condition, m, path_re)) {
        return truthy(lookup_path(item, m[1].str()));
    }
    throw JqError("unsupported select condition: " + condition);
}

}
