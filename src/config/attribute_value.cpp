#include "config/attribute_value.hpp"

#include <cmath>
#include <sstream>

namespace xcore {
namespace config {

namespace {

constexpr double MAX_EXACT_NUMBER = 9007199254740992.0; // 2^53

} // namespace

bool AttributeValue::is_finite_number() const {
    if (!is_number()) {
        return false;
    }
    double value = as_number();
    return std::isfinite(value) && std::fabs(value) <= MAX_EXACT_NUMBER;
}

std::string AttributeValue::to_string() const {
    switch (kind()) {
        case Kind::STRING:
            return as_string();
        case Kind::BOOLEAN:
            return as_bool() ? "true" : "false";
        case Kind::NUMBER: {
            std::ostringstream oss;
            oss << as_number();
            return oss.str();
        }
        case Kind::ABSENT:
        default:
            return "null";
    }
}

} // namespace config
} // namespace xcore
