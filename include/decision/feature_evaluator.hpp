#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "config/attribute_value.hpp"
#include "config/project_config.hpp"
#include "decision/decision_service.hpp"

namespace xcore {
namespace decision {

/**
 * Feature-level queries on top of DecisionService.
 *
 * Variable getters return the override of the decided variation when that
 * variation uses the variable, the declared default otherwise, and nullopt
 * for unknown keys, a type mismatch or an unparsable value.
 */
class FeatureEvaluator {
public:
    explicit FeatureEvaluator(const DecisionService& decision_service)
        : decision_service_(decision_service) {}

    bool is_feature_enabled(const config::ProjectConfig& config,
                            const std::string& feature_key,
                            const std::string& user_id,
                            const config::UserAttributes& attributes) const;

    // Keys of enabled features, in datafile order
    std::vector<std::string> get_enabled_features(const config::ProjectConfig& config,
                                                  const std::string& user_id,
                                                  const config::UserAttributes& attributes) const;

    std::optional<bool> get_feature_variable_boolean(const config::ProjectConfig& config,
                                                     const std::string& feature_key,
                                                     const std::string& variable_key,
                                                     const std::string& user_id,
                                                     const config::UserAttributes& attributes) const;

    std::optional<i64> get_feature_variable_integer(const config::ProjectConfig& config,
                                                    const std::string& feature_key,
                                                    const std::string& variable_key,
                                                    const std::string& user_id,
                                                    const config::UserAttributes& attributes) const;

    std::optional<double> get_feature_variable_double(const config::ProjectConfig& config,
                                                      const std::string& feature_key,
                                                      const std::string& variable_key,
                                                      const std::string& user_id,
                                                      const config::UserAttributes& attributes) const;

    std::optional<std::string> get_feature_variable_string(const config::ProjectConfig& config,
                                                           const std::string& feature_key,
                                                           const std::string& variable_key,
                                                           const std::string& user_id,
                                                           const config::UserAttributes& attributes) const;

private:
    std::optional<std::string> get_feature_variable_for_type(const config::ProjectConfig& config,
                                                             const std::string& feature_key,
                                                             const std::string& variable_key,
                                                             config::VariableType type,
                                                             const std::string& user_id,
                                                             const config::UserAttributes& attributes) const;

    const DecisionService& decision_service_;
};

} // namespace decision
} // namespace xcore
