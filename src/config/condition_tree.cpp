#include "config/condition_tree.hpp"

namespace xcore {
namespace config {

ConditionNode ConditionNode::make_and(std::vector<ConditionNode> children) {
    ConditionNode node;
    node.kind = Kind::AND;
    node.children = std::move(children);
    return node;
}

ConditionNode ConditionNode::make_or(std::vector<ConditionNode> children) {
    ConditionNode node;
    node.kind = Kind::OR;
    node.children = std::move(children);
    return node;
}

ConditionNode ConditionNode::make_not(ConditionNode child) {
    ConditionNode node;
    node.kind = Kind::NOT;
    node.children.push_back(std::move(child));
    return node;
}

ConditionNode ConditionNode::make_leaf(ConditionLeaf leaf) {
    ConditionNode node;
    node.kind = Kind::LEAF;
    node.leaf = std::move(leaf);
    return node;
}

ConditionNode ConditionNode::make_audience_ref(std::string audience_id) {
    ConditionNode node;
    node.kind = Kind::AUDIENCE_REF;
    node.audience_id = std::move(audience_id);
    return node;
}

MatchType match_type_from_string(const std::string& match) {
    // A leaf without a match type is a legacy exact match
    if (match.empty() || match == "exact") return MatchType::EXACT;
    if (match == "exists") return MatchType::EXISTS;
    if (match == "substring") return MatchType::SUBSTRING;
    if (match == "gt") return MatchType::GREATER_THAN;
    if (match == "lt") return MatchType::LESS_THAN;
    return MatchType::UNSUPPORTED;
}

const char* match_type_to_string(MatchType match) {
    switch (match) {
        case MatchType::EXACT: return "exact";
        case MatchType::EXISTS: return "exists";
        case MatchType::SUBSTRING: return "substring";
        case MatchType::GREATER_THAN: return "gt";
        case MatchType::LESS_THAN: return "lt";
        default: return "unsupported";
    }
}

} // namespace config
} // namespace xcore
