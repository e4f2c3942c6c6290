#include "libbnx/model_types.hpp"

#include <string>

namespace libbnx {

std::string to_string(const Outcome& outcome) {
    if (outcome.is_bool()) {
        return outcome.as_bool() ? "true" : "false";
    }
    if (outcome.is_integer()) {
        return std::to_string(outcome.as_integer());
    }
    return outcome.as_string();
}

std::string to_string(const Row& row) {
    std::string result = "(";
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += to_string(row[i]);
    }
    result += ")";
    return result;
}

}  // namespace libbnx
