#pragma once

#include <string>
#include <vector>

#include "config/attribute_value.hpp"

namespace xcore {
namespace config {

enum class MatchType {
    EXACT,
    EXISTS,
    SUBSTRING,
    GREATER_THAN,
    LESS_THAN,
    UNSUPPORTED
};

// Single attribute comparison, e.g. {"name": "browser", "match": "exact", "value": "chrome"}
struct ConditionLeaf {
    std::string name;
    std::string type;
    MatchType match{MatchType::EXACT};
    std::string raw_match;
    AttributeValue value;
};

/**
 * Typed boolean condition tree.
 *
 * Built once from the datafile. Audience trees have LEAF nodes, experiment
 * audience-condition trees have AUDIENCE_REF nodes naming audiences by id.
 */
struct ConditionNode {
    enum class Kind {
        AND,
        OR,
        NOT,
        LEAF,
        AUDIENCE_REF
    };

    Kind kind{Kind::OR};
    std::vector<ConditionNode> children;
    ConditionLeaf leaf;
    std::string audience_id;

    static ConditionNode make_and(std::vector<ConditionNode> children);
    static ConditionNode make_or(std::vector<ConditionNode> children);
    static ConditionNode make_not(ConditionNode child);
    static ConditionNode make_leaf(ConditionLeaf leaf);
    static ConditionNode make_audience_ref(std::string audience_id);
};

MatchType match_type_from_string(const std::string& match);
const char* match_type_to_string(MatchType match);

} // namespace config
} // namespace xcore
