#include "decision/audience_evaluator.hpp"
#include "common/logger.hpp"

namespace xcore {
namespace decision {

using config::AttributeValue;
using config::ConditionLeaf;
using config::ConditionNode;
using config::MatchType;
using config::UserAttributes;

namespace {

MatchResult from_bool(bool value) {
    return value ? MatchResult::MATCH : MatchResult::NO_MATCH;
}

} // namespace

const char* match_result_to_string(MatchResult result) {
    switch (result) {
        case MatchResult::MATCH: return "TRUE";
        case MatchResult::NO_MATCH: return "FALSE";
        case MatchResult::UNKNOWN: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

MatchResult AudienceEvaluator::evaluate(const ConditionNode& node, const UserAttributes& attributes) const {
    switch (node.kind) {
        case ConditionNode::Kind::AND:
            return evaluate_and(node, attributes);
        case ConditionNode::Kind::OR:
            return evaluate_or(node, attributes);
        case ConditionNode::Kind::NOT:
            return evaluate_not(node, attributes);
        case ConditionNode::Kind::LEAF:
            return evaluate_leaf(node.leaf, attributes);
        case ConditionNode::Kind::AUDIENCE_REF:
            return evaluate_audience(node.audience_id, attributes);
        default:
            return MatchResult::UNKNOWN;
    }
}

MatchResult AudienceEvaluator::evaluate_and(const ConditionNode& node, const UserAttributes& attributes) const {
    bool saw_unknown = false;
    for (const auto& child : node.children) {
        MatchResult result = evaluate(child, attributes);
        if (result == MatchResult::NO_MATCH) {
            return MatchResult::NO_MATCH;
        }
        if (result == MatchResult::UNKNOWN) {
            saw_unknown = true;
        }
    }
    return saw_unknown ? MatchResult::UNKNOWN : MatchResult::MATCH;
}

MatchResult AudienceEvaluator::evaluate_or(const ConditionNode& node, const UserAttributes& attributes) const {
    bool saw_unknown = false;
    for (const auto& child : node.children) {
        MatchResult result = evaluate(child, attributes);
        if (result == MatchResult::MATCH) {
            return MatchResult::MATCH;
        }
        if (result == MatchResult::UNKNOWN) {
            saw_unknown = true;
        }
    }
    return saw_unknown ? MatchResult::UNKNOWN : MatchResult::NO_MATCH;
}

MatchResult AudienceEvaluator::evaluate_not(const ConditionNode& node, const UserAttributes& attributes) const {
    if (node.children.empty()) {
        return MatchResult::UNKNOWN;
    }
    switch (evaluate(node.children.front(), attributes)) {
        case MatchResult::MATCH:
            return MatchResult::NO_MATCH;
        case MatchResult::NO_MATCH:
            return MatchResult::MATCH;
        default:
            return MatchResult::UNKNOWN;
    }
}

MatchResult AudienceEvaluator::evaluate_audience(const std::string& audience_id,
                                                 const UserAttributes& attributes) const {
    const config::Audience* audience = config_.get_audience_from_id(audience_id);
    if (!audience) {
        return MatchResult::UNKNOWN;
    }

    LOG_DEBUG("Starting to evaluate audience '{}'.", audience_id);
    MatchResult result = evaluate(audience->conditions, attributes);
    LOG_DEBUG("Audience '{}' evaluated to {}.", audience_id, match_result_to_string(result));
    return result;
}

MatchResult AudienceEvaluator::evaluate_leaf(const ConditionLeaf& leaf, const UserAttributes& attributes) const {
    if (leaf.type != CUSTOM_ATTRIBUTE_CONDITION_TYPE) {
        LOG_WARNING("Audience condition '{}' has an unknown condition type '{}'.", leaf.name, leaf.type);
        return MatchResult::UNKNOWN;
    }

    if (leaf.match == MatchType::UNSUPPORTED) {
        LOG_WARNING("Audience condition '{}' uses an unknown match type '{}'.", leaf.name, leaf.raw_match);
        return MatchResult::UNKNOWN;
    }

    auto it = attributes.find(leaf.name);
    const bool present = it != attributes.end() && !it->second.is_absent();

    if (leaf.match == MatchType::EXISTS) {
        return from_bool(present);
    }

    if (!present) {
        LOG_DEBUG("Audience condition '{}' evaluated to UNKNOWN because no value was passed for user attribute '{}'.",
                  leaf.name, leaf.name);
        return MatchResult::UNKNOWN;
    }

    switch (leaf.match) {
        case MatchType::EXACT:
            return exact_match(leaf, it->second);
        case MatchType::SUBSTRING:
            return substring_match(leaf, it->second);
        case MatchType::GREATER_THAN:
        case MatchType::LESS_THAN:
            return numeric_match(leaf, it->second);
        default:
            return MatchResult::UNKNOWN;
    }
}

MatchResult AudienceEvaluator::exact_match(const ConditionLeaf& leaf, const AttributeValue& user_value) {
    const AttributeValue& expected = leaf.value;

    if (expected.is_string() && user_value.is_string()) {
        return from_bool(expected.as_string() == user_value.as_string());
    }
    if (expected.is_bool() && user_value.is_bool()) {
        return from_bool(expected.as_bool() == user_value.as_bool());
    }
    if (expected.is_number() && user_value.is_number()) {
        if (!expected.is_finite_number() || !user_value.is_finite_number()) {
            LOG_WARNING("Audience condition '{}' compared a number outside the exact range.", leaf.name);
            return MatchResult::UNKNOWN;
        }
        return from_bool(expected.as_number() == user_value.as_number());
    }

    LOG_WARNING("Audience condition '{}' evaluated to UNKNOWN because a value of type mismatch was passed: '{}'.",
                leaf.name, user_value.to_string());
    return MatchResult::UNKNOWN;
}

MatchResult AudienceEvaluator::substring_match(const ConditionLeaf& leaf, const AttributeValue& user_value) {
    if (!leaf.value.is_string() || !user_value.is_string()) {
        LOG_WARNING("Audience condition '{}' evaluated to UNKNOWN because substring needs string operands.",
                    leaf.name);
        return MatchResult::UNKNOWN;
    }
    return from_bool(user_value.as_string().find(leaf.value.as_string()) != std::string::npos);
}

MatchResult AudienceEvaluator::numeric_match(const ConditionLeaf& leaf, const AttributeValue& user_value) {
    if (!leaf.value.is_finite_number() || !user_value.is_finite_number()) {
        LOG_WARNING("Audience condition '{}' evaluated to UNKNOWN because '{}' needs finite numeric operands.",
                    leaf.name, config::match_type_to_string(leaf.match));
        return MatchResult::UNKNOWN;
    }

    if (leaf.match == MatchType::GREATER_THAN) {
        return from_bool(user_value.as_number() > leaf.value.as_number());
    }
    return from_bool(user_value.as_number() < leaf.value.as_number());
}

bool AudienceEvaluator::user_in_experiment(const config::Experiment& experiment,
                                           const UserAttributes& attributes) const {
    if (!experiment.audience_conditions) {
        return true;
    }

    MatchResult result = evaluate(*experiment.audience_conditions, attributes);
    LOG_INFO("Audiences for experiment '{}' collectively evaluated to {}.",
             experiment.key, match_result_to_string(result));
    return result == MatchResult::MATCH;
}

} // namespace decision
} // namespace xcore
