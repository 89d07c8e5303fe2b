#pragma once

#include "config/attribute_value.hpp"
#include "config/condition_tree.hpp"
#include "config/entities.hpp"
#include "config/project_config.hpp"

namespace xcore {
namespace decision {

// Kleene three-valued result of a condition evaluation
enum class MatchResult {
    MATCH,
    NO_MATCH,
    UNKNOWN
};

const char* match_result_to_string(MatchResult result);

/**
 * Evaluates condition trees against user attributes.
 *
 * UNKNOWN is kept distinct from NO_MATCH all the way up the tree: NOT of
 * UNKNOWN is UNKNOWN, AND only short-circuits on NO_MATCH, OR only on MATCH.
 * Callers collapse to a boolean at the very top (user_in_experiment).
 */
class AudienceEvaluator {
public:
    static constexpr const char* CUSTOM_ATTRIBUTE_CONDITION_TYPE = "custom_attribute";

    explicit AudienceEvaluator(const config::ProjectConfig& config) : config_(config) {}

    MatchResult evaluate(const config::ConditionNode& node, const config::UserAttributes& attributes) const;

    MatchResult evaluate_leaf(const config::ConditionLeaf& leaf, const config::UserAttributes& attributes) const;

    // Only MATCH admits; experiments without audiences admit everyone
    bool user_in_experiment(const config::Experiment& experiment, const config::UserAttributes& attributes) const;

private:
    MatchResult evaluate_and(const config::ConditionNode& node, const config::UserAttributes& attributes) const;
    MatchResult evaluate_or(const config::ConditionNode& node, const config::UserAttributes& attributes) const;
    MatchResult evaluate_not(const config::ConditionNode& node, const config::UserAttributes& attributes) const;
    MatchResult evaluate_audience(const std::string& audience_id, const config::UserAttributes& attributes) const;

    static MatchResult exact_match(const config::ConditionLeaf& leaf, const config::AttributeValue& user_value);
    static MatchResult substring_match(const config::ConditionLeaf& leaf, const config::AttributeValue& user_value);
    static MatchResult numeric_match(const config::ConditionLeaf& leaf, const config::AttributeValue& user_value);

    const config::ProjectConfig& config_;
};

} // namespace decision
} // namespace xcore
