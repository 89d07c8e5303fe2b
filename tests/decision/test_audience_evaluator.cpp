#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>

#include "common/error_handling.hpp"
#include "config/condition_parser.hpp"
#include "config/project_config.hpp"
#include "decision/audience_evaluator.hpp"
#include "framework/mocks.hpp"
#include "framework/test_datafiles.hpp"

using namespace xcore;
using namespace xcore::decision;
using config::AttributeValue;
using config::ConditionLeaf;
using config::ConditionNode;
using config::UserAttributes;

namespace {

ConditionNode leaf(const std::string& name, const std::string& match, AttributeValue value = AttributeValue()) {
    ConditionLeaf condition;
    condition.name = name;
    condition.type = AudienceEvaluator::CUSTOM_ATTRIBUTE_CONDITION_TYPE;
    condition.raw_match = match;
    condition.match = config::match_type_from_string(match);
    condition.value = std::move(value);
    return ConditionNode::make_leaf(std::move(condition));
}

} // namespace

class AudienceEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = config::ProjectConfig::from_string(test_data::decision_datafile());
        evaluator_ = std::make_unique<AudienceEvaluator>(*config_);
        attributes_ = {{"present", "yes"}};
    }

    // Leaves with a fixed outcome against attributes_
    ConditionNode true_leaf() const { return leaf("present", "exists"); }
    ConditionNode false_leaf() const { return leaf("missing", "exists"); }
    ConditionNode unknown_leaf() const { return leaf("missing", "exact", "x"); }

    MatchResult evaluate(const ConditionNode& node) const {
        return evaluator_->evaluate(node, attributes_);
    }

    MatchResult evaluate_leaf(const ConditionNode& node, const UserAttributes& attributes) const {
        return evaluator_->evaluate(node, attributes);
    }

    test_data::LogCapture logs_;
    std::shared_ptr<const config::ProjectConfig> config_;
    std::unique_ptr<AudienceEvaluator> evaluator_;
    UserAttributes attributes_;
};

TEST_F(AudienceEvaluatorTest, LeafOutcomesUsedByOperatorTests) {
    EXPECT_EQ(evaluate(true_leaf()), MatchResult::MATCH);
    EXPECT_EQ(evaluate(false_leaf()), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate(unknown_leaf()), MatchResult::UNKNOWN);
}

TEST_F(AudienceEvaluatorTest, AndTruthTable) {
    EXPECT_EQ(evaluate(ConditionNode::make_and({true_leaf(), true_leaf()})), MatchResult::MATCH);
    EXPECT_EQ(evaluate(ConditionNode::make_and({true_leaf(), false_leaf()})), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate(ConditionNode::make_and({true_leaf(), unknown_leaf()})), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate(ConditionNode::make_and({unknown_leaf(), false_leaf()})), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate(ConditionNode::make_and({unknown_leaf(), unknown_leaf()})), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate(ConditionNode::make_and({})), MatchResult::MATCH);
}

TEST_F(AudienceEvaluatorTest, OrTruthTable) {
    EXPECT_EQ(evaluate(ConditionNode::make_or({false_leaf(), true_leaf()})), MatchResult::MATCH);
    EXPECT_EQ(evaluate(ConditionNode::make_or({false_leaf(), false_leaf()})), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate(ConditionNode::make_or({false_leaf(), unknown_leaf()})), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate(ConditionNode::make_or({unknown_leaf(), true_leaf()})), MatchResult::MATCH);
    EXPECT_EQ(evaluate(ConditionNode::make_or({})), MatchResult::NO_MATCH);
}

TEST_F(AudienceEvaluatorTest, NotKeepsUnknown) {
    EXPECT_EQ(evaluate(ConditionNode::make_not(true_leaf())), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate(ConditionNode::make_not(false_leaf())), MatchResult::MATCH);
    EXPECT_EQ(evaluate(ConditionNode::make_not(unknown_leaf())), MatchResult::UNKNOWN);

    ConditionNode empty_not;
    empty_not.kind = ConditionNode::Kind::NOT;
    EXPECT_EQ(evaluate(empty_not), MatchResult::UNKNOWN);
}

TEST_F(AudienceEvaluatorTest, AndStopsAtFirstNoMatch) {
    auto node = ConditionNode::make_and({false_leaf(), ConditionNode::make_audience_ref("does_not_exist")});

    EXPECT_EQ(evaluate(node), MatchResult::NO_MATCH);
    EXPECT_FALSE(logs_.contains("does_not_exist"));
}

TEST_F(AudienceEvaluatorTest, OrStopsAtFirstMatch) {
    auto node = ConditionNode::make_or({true_leaf(), ConditionNode::make_audience_ref("does_not_exist")});

    EXPECT_EQ(evaluate(node), MatchResult::MATCH);
    EXPECT_FALSE(logs_.contains("does_not_exist"));
}

TEST_F(AudienceEvaluatorTest, UnknownAudienceReferenceIsUnknown) {
    EXPECT_EQ(evaluate(ConditionNode::make_audience_ref("does_not_exist")), MatchResult::UNKNOWN);
    EXPECT_TRUE(logs_.contains("Audience id 'does_not_exist' is not in datafile."));
}

TEST_F(AudienceEvaluatorTest, ExactMatch) {
    EXPECT_EQ(evaluate_leaf(leaf("browser", "exact", "firefox"), {{"browser", "firefox"}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("browser", "exact", "firefox"), {{"browser", "chrome"}}), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("flag", "exact", true), {{"flag", true}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("flag", "exact", true), {{"flag", false}}), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("age", "exact", 18.0), {{"age", 18}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("age", "exact", 18.0), {{"age", 19}}), MatchResult::NO_MATCH);
}

TEST_F(AudienceEvaluatorTest, LegacyConditionWithoutMatchIsExact) {
    EXPECT_EQ(evaluate_leaf(leaf("browser", "", "firefox"), {{"browser", "firefox"}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("browser", "", "firefox"), {{"browser", "safari"}}), MatchResult::NO_MATCH);
}

TEST_F(AudienceEvaluatorTest, ExactMatchNeverCoercesKinds) {
    EXPECT_EQ(evaluate_leaf(leaf("age", "exact", 1.0), {{"age", "1"}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("age", "exact", "1"), {{"age", 1}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("flag", "exact", true), {{"flag", "true"}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("flag", "exact", true), {{"flag", 1}}), MatchResult::UNKNOWN);
}

TEST_F(AudienceEvaluatorTest, ExactMatchRejectsUnsafeNumbers) {
    const double huge = std::pow(2.0, 53) + 2.0;
    EXPECT_EQ(evaluate_leaf(leaf("n", "exact", 5.0), {{"n", huge}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("n", "exact", huge), {{"n", 5}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("n", "exact", 5.0), {{"n", std::numeric_limits<double>::infinity()}}),
              MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("n", "exact", std::pow(2.0, 53)), {{"n", std::pow(2.0, 53)}}),
              MatchResult::MATCH);
}

TEST_F(AudienceEvaluatorTest, MissingAttributeIsUnknownExceptForExists) {
    EXPECT_EQ(evaluate_leaf(leaf("browser", "exact", "firefox"), {}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("browser", "substring", "fire"), {}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("age", "gt", 18.0), {}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("browser", "exists"), {}), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("browser", "exists"), {{"browser", AttributeValue()}}), MatchResult::NO_MATCH);
}

TEST_F(AudienceEvaluatorTest, ExistsIgnoresValue) {
    EXPECT_EQ(evaluate_leaf(leaf("flag", "exists"), {{"flag", false}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("n", "exists"), {{"n", 0}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("s", "exists"), {{"s", ""}}), MatchResult::MATCH);
}

TEST_F(AudienceEvaluatorTest, SubstringMatch) {
    EXPECT_EQ(evaluate_leaf(leaf("browser", "substring", "fire"), {{"browser", "firefox"}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("browser", "substring", "chro"), {{"browser", "firefox"}}), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("browser", "substring", "1"), {{"browser", 123}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("browser", "substring", 1.0), {{"browser", "123"}}), MatchResult::UNKNOWN);
}

TEST_F(AudienceEvaluatorTest, NumericComparisons) {
    EXPECT_EQ(evaluate_leaf(leaf("age", "gt", 18.0), {{"age", 19}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("age", "gt", 18.0), {{"age", 18}}), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("age", "gt", 18.0), {{"age", 18.5}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("age", "lt", 18.0), {{"age", 17}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(leaf("age", "lt", 18.0), {{"age", 18}}), MatchResult::NO_MATCH);
}

TEST_F(AudienceEvaluatorTest, NumericComparisonsNeedFiniteNumbers) {
    EXPECT_EQ(evaluate_leaf(leaf("age", "gt", 18.0), {{"age", "19"}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("age", "gt", 18.0), {{"age", true}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("age", "gt", "18"), {{"age", 19}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("age", "lt", 18.0), {{"age", std::numeric_limits<double>::quiet_NaN()}}),
              MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("age", "lt", 18.0), {{"age", -std::numeric_limits<double>::infinity()}}),
              MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(leaf("age", "gt", 18.0), {{"age", 1e300}}), MatchResult::UNKNOWN);
}

TEST_F(AudienceEvaluatorTest, UnsupportedMatchOrTypeIsUnknown) {
    EXPECT_EQ(evaluate_leaf(leaf("browser", "regex", "fire.*"), {{"browser", "firefox"}}), MatchResult::UNKNOWN);
    EXPECT_TRUE(logs_.contains("unknown match type 'regex'"));

    ConditionLeaf third_party;
    third_party.name = "browser";
    third_party.type = "third_party_dimension";
    third_party.value = "firefox";
    EXPECT_EQ(evaluate_leaf(ConditionNode::make_leaf(third_party), {{"browser", "firefox"}}),
              MatchResult::UNKNOWN);
}

TEST_F(AudienceEvaluatorTest, ParsedListWithoutOperatorIsOr) {
    auto conditions = nlohmann::json::parse(R"([
        {"name": "browser", "type": "custom_attribute", "value": "firefox"},
        {"name": "browser", "type": "custom_attribute", "value": "safari"}
    ])");
    ConditionNode node = config::ConditionParser::parse_audience_conditions(conditions);

    EXPECT_EQ(node.kind, ConditionNode::Kind::OR);
    ASSERT_EQ(node.children.size(), 2u);
    EXPECT_EQ(evaluate_leaf(node, {{"browser", "safari"}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(node, {{"browser", "opera"}}), MatchResult::NO_MATCH);
}

TEST_F(AudienceEvaluatorTest, ParsedNestedOperators) {
    auto conditions = nlohmann::json::parse(R"(["and",
        ["not", {"name": "browser", "type": "custom_attribute", "match": "exact", "value": "ie"}],
        ["or", {"name": "age", "type": "custom_attribute", "match": "lt", "value": 13},
               {"name": "age", "type": "custom_attribute", "match": "gt", "value": 65}]
    ])");
    ConditionNode node = config::ConditionParser::parse_audience_conditions(conditions);

    EXPECT_EQ(evaluate_leaf(node, {{"browser", "firefox"}, {"age", 70}}), MatchResult::MATCH);
    EXPECT_EQ(evaluate_leaf(node, {{"browser", "ie"}, {"age", 70}}), MatchResult::NO_MATCH);
    EXPECT_EQ(evaluate_leaf(node, {{"age", 70}}), MatchResult::UNKNOWN);
    EXPECT_EQ(evaluate_leaf(node, {{"browser", "firefox"}, {"age", 30}}), MatchResult::NO_MATCH);
}

TEST_F(AudienceEvaluatorTest, UnparsableLegacyConditionsThrow) {
    EXPECT_THROW(config::ConditionParser::parse_audience_conditions(nlohmann::json("[\"and\", {")),
                 common::ConfigException);
}

TEST_F(AudienceEvaluatorTest, LegacyAudienceFromDatafile) {
    const config::Experiment* experiment = config_->get_experiment_from_key("exp_audience");
    ASSERT_NE(experiment, nullptr);

    EXPECT_TRUE(evaluator_->user_in_experiment(*experiment, {{"browser_type", "firefox"}}));
    EXPECT_FALSE(evaluator_->user_in_experiment(*experiment, {{"browser_type", "chrome"}}));
    EXPECT_FALSE(evaluator_->user_in_experiment(*experiment, {}));
}

TEST_F(AudienceEvaluatorTest, AudienceConditionsCombineTypedAudiences) {
    const config::Experiment* experiment = config_->get_experiment_from_key("exp_typed");
    ASSERT_NE(experiment, nullptr);

    EXPECT_TRUE(evaluator_->user_in_experiment(*experiment, {{"browser_type", "firefox"}, {"age", 30}}));
    EXPECT_FALSE(evaluator_->user_in_experiment(*experiment, {{"browser_type", "firefox"}, {"age", 10}}));
    EXPECT_FALSE(evaluator_->user_in_experiment(*experiment, {{"browser_type", "firefox"}}));
    EXPECT_FALSE(evaluator_->user_in_experiment(*experiment, {{"browser_type", "chrome"}, {"age", 30}}));
}

TEST_F(AudienceEvaluatorTest, NoAudienceAdmitsEveryone) {
    const config::Experiment* experiment = config_->get_experiment_from_key("exp1");
    ASSERT_NE(experiment, nullptr);

    EXPECT_TRUE(evaluator_->user_in_experiment(*experiment, {}));
    EXPECT_TRUE(evaluator_->user_in_experiment(*experiment, {{"anything", 1}}));
}

TEST(MatchResultTest, ToString) {
    EXPECT_STREQ(match_result_to_string(MatchResult::MATCH), "TRUE");
    EXPECT_STREQ(match_result_to_string(MatchResult::NO_MATCH), "FALSE");
    EXPECT_STREQ(match_result_to_string(MatchResult::UNKNOWN), "UNKNOWN");
}
