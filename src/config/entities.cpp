#include "config/entities.hpp"

namespace xcore {
namespace config {

const Variation* Experiment::find_variation_by_id(const std::string& variation_id) const {
    for (const auto& variation : variations) {
        if (variation.id == variation_id) {
            return &variation;
        }
    }
    return nullptr;
}

const Variation* Experiment::find_variation_by_key(const std::string& variation_key) const {
    for (const auto& variation : variations) {
        if (variation.key == variation_key) {
            return &variation;
        }
    }
    return nullptr;
}

VariableType variable_type_from_string(const std::string& type) {
    if (type == "boolean") return VariableType::BOOLEAN;
    if (type == "integer") return VariableType::INTEGER;
    if (type == "double") return VariableType::DOUBLE;
    if (type == "string") return VariableType::STRING;
    return VariableType::UNKNOWN;
}

const char* variable_type_to_string(VariableType type) {
    switch (type) {
        case VariableType::BOOLEAN: return "boolean";
        case VariableType::INTEGER: return "integer";
        case VariableType::DOUBLE: return "double";
        case VariableType::STRING: return "string";
        default: return "unknown";
    }
}

} // namespace config
} // namespace xcore
