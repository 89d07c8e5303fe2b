#pragma once

#include <nlohmann/json.hpp>

#include "config/condition_tree.hpp"

namespace xcore {
namespace config {

/**
 * Turns the loosely typed condition lists of a datafile into ConditionNode
 * trees. A list whose first element is "and", "or" or "not" applies that
 * operator to the remaining elements; any other list is an implicit "or".
 *
 * Throws common::ConfigException on structures that are neither lists,
 * condition objects nor (for audience-condition trees) audience ids.
 */
class ConditionParser {
public:
    // Audience "conditions": JSON-encoded string or already-parsed list/object
    static ConditionNode parse_audience_conditions(const nlohmann::json& conditions);

    // Experiment "audienceConditions": tree whose leaves are audience ids
    static ConditionNode parse_audience_reference_tree(const nlohmann::json& conditions);

    // Experiment "audienceIds": implicit "or" over the listed audiences
    static ConditionNode from_audience_ids(const std::vector<std::string>& audience_ids);

private:
    enum class LeafMode {
        ATTRIBUTE_CONDITION,
        AUDIENCE_ID
    };

    static ConditionNode parse_node(const nlohmann::json& node, LeafMode mode);
    static ConditionNode parse_list(const nlohmann::json& list, LeafMode mode);
    static ConditionLeaf parse_leaf(const nlohmann::json& leaf);
    static AttributeValue parse_value(const nlohmann::json& value);
};

} // namespace config
} // namespace xcore
