#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// The jq subset: paths (.a.b, .[], .[N]), pipes, select(), map(), keys,
// values, length. Evaluation yields a stream of values.
namespace jq {

using Json = nlohmann::ordered_json;

class JqError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Step {
    enum class Kind { Identity, Field, Iterate, Index, Select, Map, Keys, Values, Length };
    Kind kind = Kind::Identity;
    std::string arg;     // field name, select condition or map sub-filter
    long index = 0;
};

std::vector<Step> parse(const std::string& filter);

std::vector<Json> apply(const Json& input, const std::vector<Step>& steps);

// parse + apply.
std::vector<Json> run(const Json& input, const std::string& filter);

// `.field OP literal` with OP in == != > < >= <=, or a bare path tested for
// truthiness.
bool evaluate_condition(const Json& item, const std::string& condition);

}
