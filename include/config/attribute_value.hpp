#pragma once

#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>

namespace xcore {
namespace config {

/**
 * A user attribute or condition operand: String, Boolean, Number or Absent.
 *
 * There is no coercion between kinds. A number never equals its string
 * spelling and a boolean is never a number.
 */
class AttributeValue {
public:
    enum class Kind {
        ABSENT,
        STRING,
        BOOLEAN,
        NUMBER
    };

    AttributeValue() = default;
    AttributeValue(const char* value) : value_(std::string(value)) {}
    AttributeValue(std::string value) : value_(std::move(value)) {}
    AttributeValue(bool value) : value_(value) {}

    template<typename T,
             typename std::enable_if<std::is_arithmetic<T>::value && !std::is_same<T, bool>::value, int>::type = 0>
    AttributeValue(T value) : value_(static_cast<double>(value)) {}

    Kind kind() const { return static_cast<Kind>(value_.index()); }

    bool is_absent() const { return kind() == Kind::ABSENT; }
    bool is_string() const { return kind() == Kind::STRING; }
    bool is_bool() const { return kind() == Kind::BOOLEAN; }
    bool is_number() const { return kind() == Kind::NUMBER; }

    const std::string& as_string() const { return std::get<std::string>(value_); }
    bool as_bool() const { return std::get<bool>(value_); }
    double as_number() const { return std::get<double>(value_); }

    // Numbers beyond +/-2^53 or non-finite cannot be compared reliably
    // across SDK implementations and are treated as unusable operands.
    bool is_finite_number() const;

    std::string to_string() const;

    bool operator==(const AttributeValue& other) const { return value_ == other.value_; }
    bool operator!=(const AttributeValue& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, std::string, bool, double> value_;
};

using UserAttributes = std::unordered_map<std::string, AttributeValue>;

} // namespace config
} // namespace xcore
