#include "decision/feature_evaluator.hpp"
#include "common/error_handling.hpp"
#include "common/logger.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>

namespace xcore {
namespace decision {

using config::ProjectConfig;
using config::UserAttributes;
using config::VariableType;

bool FeatureEvaluator::is_feature_enabled(const ProjectConfig& config,
                                          const std::string& feature_key,
                                          const std::string& user_id,
                                          const UserAttributes& attributes) const {
    auto decision = decision_service_.decide_feature(config, feature_key, user_id, attributes);
    if (!decision) {
        LOG_INFO("Feature '{}' is not enabled for user '{}'.", feature_key, user_id);
        return false;
    }

    if (decision->source == DecisionSource::ROLLOUT) {
        LOG_DEBUG("The user '{}' is not being experimented on in feature '{}'.", user_id, feature_key);
    }

    const bool enabled = decision->feature_enabled();
    LOG_INFO("Feature '{}' is {} for user '{}'.", feature_key, enabled ? "enabled" : "not enabled", user_id);
    return enabled;
}

std::vector<std::string> FeatureEvaluator::get_enabled_features(const ProjectConfig& config,
                                                                const std::string& user_id,
                                                                const UserAttributes& attributes) const {
    std::vector<std::string> enabled_features;

    for (const auto& feature : config.feature_flags()) {
        auto decision = decision_service_.get_variation_for_feature(config, feature, user_id, attributes);
        if (decision && decision->feature_enabled()) {
            enabled_features.push_back(feature.key);
        }
    }

    return enabled_features;
}

std::optional<bool> FeatureEvaluator::get_feature_variable_boolean(const ProjectConfig& config,
                                                                   const std::string& feature_key,
                                                                   const std::string& variable_key,
                                                                   const std::string& user_id,
                                                                   const UserAttributes& attributes) const {
    auto value = get_feature_variable_for_type(config, feature_key, variable_key, VariableType::BOOLEAN,
                                               user_id, attributes);
    if (!value) {
        return std::nullopt;
    }
    return *value == "true";
}

std::optional<i64> FeatureEvaluator::get_feature_variable_integer(const ProjectConfig& config,
                                                                  const std::string& feature_key,
                                                                  const std::string& variable_key,
                                                                  const std::string& user_id,
                                                                  const UserAttributes& attributes) const {
    auto value = get_feature_variable_for_type(config, feature_key, variable_key, VariableType::INTEGER,
                                               user_id, attributes);
    if (!value) {
        return std::nullopt;
    }

    i64 result = 0;
    const char* begin = value->data();
    const char* end = begin + value->size();
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (ec != std::errc() || ptr != end) {
        LOG_ERROR("Unable to cast variable value '{}' to type 'integer'.", *value);
        return std::nullopt;
    }
    return result;
}

std::optional<double> FeatureEvaluator::get_feature_variable_double(const ProjectConfig& config,
                                                                    const std::string& feature_key,
                                                                    const std::string& variable_key,
                                                                    const std::string& user_id,
                                                                    const UserAttributes& attributes) const {
    auto value = get_feature_variable_for_type(config, feature_key, variable_key, VariableType::DOUBLE,
                                               user_id, attributes);
    if (!value) {
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
    const double result = std::strtod(value->c_str(), &end);
    if (value->empty() || errno == ERANGE || end != value->c_str() + value->size()) {
        LOG_ERROR("Unable to cast variable value '{}' to type 'double'.", *value);
        return std::nullopt;
    }
    return result;
}

std::optional<std::string> FeatureEvaluator::get_feature_variable_string(const ProjectConfig& config,
                                                                         const std::string& feature_key,
                                                                         const std::string& variable_key,
                                                                         const std::string& user_id,
                                                                         const UserAttributes& attributes) const {
    return get_feature_variable_for_type(config, feature_key, variable_key, VariableType::STRING,
                                         user_id, attributes);
}

std::optional<std::string> FeatureEvaluator::get_feature_variable_for_type(const ProjectConfig& config,
                                                                           const std::string& feature_key,
                                                                           const std::string& variable_key,
                                                                           VariableType type,
                                                                           const std::string& user_id,
                                                                           const UserAttributes& attributes) const {
    try {
        common::require_input(feature_key, "feature flag key");
        common::require_input(variable_key, "variable key");
    } catch (const common::InvalidInputException& e) {
        LOG_ERROR("{}", e.what());
        return std::nullopt;
    }

    const config::FeatureFlag* feature = config.get_feature_flag_from_key(feature_key);
    if (!feature) {
        return std::nullopt;
    }

    const config::FeatureVariable* variable = config.get_feature_variable(*feature, variable_key);
    if (!variable) {
        return std::nullopt;
    }

    if (variable->type != type) {
        LOG_WARNING("Requested variable as type '{}' but variable '{}' is of type '{}'.",
                    config::variable_type_to_string(type), variable_key,
                    config::variable_type_to_string(variable->type));
        return std::nullopt;
    }

    std::string value = variable->default_value;

    auto decision = decision_service_.get_variation_for_feature(config, *feature, user_id, attributes);
    if (!decision) {
        LOG_INFO("User '{}' was not bucketed into any variation for feature flag '{}'. "
                 "Returning the default variable value '{}'.", user_id, feature_key, value);
        return value;
    }

    // The decided variation carries its own overrides; ids repeat across experiments
    const auto& usages = decision->variation->variable_values;
    auto usage = usages.find(variable->id);
    if (usage != usages.end()) {
        LOG_INFO("Got variable value '{}' for variable '{}' of feature flag '{}'.",
                 usage->second, variable_key, feature_key);
        return usage->second;
    }

    LOG_DEBUG("Variable '{}' is not used in variation '{}'. Returning the default variable value '{}'.",
              variable_key, decision->variation->key, value);
    return value;
}

} // namespace decision
} // namespace xcore
