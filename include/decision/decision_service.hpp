#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config/attribute_value.hpp"
#include "config/project_config.hpp"
#include "decision/bucketer.hpp"
#include "decision/decision.hpp"
#include "decision/forced_variation_store.hpp"
#include "decision/user_profile_service.hpp"

namespace xcore {
namespace decision {

/**
 * Decides which variation a user gets for an experiment or a feature.
 *
 * The service holds no configuration of its own: every call receives the
 * ProjectConfig snapshot to decide against, so a reload never changes the
 * rules under a decision in flight. The forced variation store and the
 * optional user profile service are caller-owned and must outlive the
 * service.
 *
 * Experiment decisions apply, in order: running status, runtime forced
 * variation, datafile whitelist, mutual-exclusion group, audience, sticky
 * profile lookup, bucketing, sticky profile save.
 */
class DecisionService {
public:
    struct Config {
        // Attribute overriding the user id as bucketing input
        std::string bucketing_id_attribute = "$opt_bucketing_id";
        bool enable_user_profiles = true;
    };

    explicit DecisionService(ForcedVariationStore& forced_variations,
                             UserProfileService* user_profiles = nullptr);

    DecisionService(ForcedVariationStore& forced_variations,
                    UserProfileService* user_profiles,
                    std::shared_ptr<const Bucketer> bucketer,
                    Config config);

    std::optional<Decision> decide_experiment(const config::ProjectConfig& config,
                                              const std::string& experiment_key,
                                              const std::string& user_id,
                                              const config::UserAttributes& attributes) const;

    std::optional<Decision> decide_feature(const config::ProjectConfig& config,
                                           const std::string& feature_key,
                                           const std::string& user_id,
                                           const config::UserAttributes& attributes) const;

    std::optional<Decision> get_variation_for_feature(const config::ProjectConfig& config,
                                                      const config::FeatureFlag& feature,
                                                      const std::string& user_id,
                                                      const config::UserAttributes& attributes) const;

    // Empty variation_key clears the entry. False for unknown experiment or variation.
    bool set_forced_variation(const config::ProjectConfig& config,
                              const std::string& experiment_key,
                              const std::string& user_id,
                              const std::string& variation_key);

    const config::Variation* get_forced_variation(const config::ProjectConfig& config,
                                                  const std::string& experiment_key,
                                                  const std::string& user_id) const;

    std::string get_bucketing_id(const std::string& user_id, const config::UserAttributes& attributes) const;

    const Config& get_config() const { return config_; }

private:
    std::optional<Decision> decide(const config::ProjectConfig& config,
                                   const config::Experiment& experiment,
                                   const std::string& user_id,
                                   const config::UserAttributes& attributes) const;

    const config::Variation* get_whitelisted_variation(const config::Experiment& experiment,
                                                       const std::string& user_id) const;

    bool passes_group_exclusion(const config::ProjectConfig& config,
                                const config::Experiment& experiment,
                                const std::string& bucketing_id,
                                const std::string& user_id) const;

    const config::Variation* get_stored_variation(const config::Experiment& experiment,
                                                  const std::string& user_id) const;

    void save_variation(const config::Experiment& experiment,
                        const config::Variation& variation,
                        const std::string& user_id) const;

    std::optional<Decision> get_variation_for_feature_experiment(const config::ProjectConfig& config,
                                                                 const config::FeatureFlag& feature,
                                                                 const std::string& user_id,
                                                                 const config::UserAttributes& attributes) const;

    std::optional<Decision> get_variation_for_feature_rollout(const config::ProjectConfig& config,
                                                              const config::FeatureFlag& feature,
                                                              const std::string& user_id,
                                                              const config::UserAttributes& attributes) const;

    ForcedVariationStore& forced_variations_;
    UserProfileService* user_profiles_;
    std::shared_ptr<const Bucketer> bucketer_;
    Config config_;
};

} // namespace decision
} // namespace xcore
