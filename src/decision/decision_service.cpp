#include "decision/decision_service.hpp"
#include "decision/audience_evaluator.hpp"
#include "common/error_handling.hpp"
#include "common/logger.hpp"

namespace xcore {
namespace decision {

using config::Experiment;
using config::FeatureFlag;
using config::ProjectConfig;
using config::UserAttributes;
using config::Variation;

const char* decision_source_to_string(DecisionSource source) {
    switch (source) {
        case DecisionSource::EXPERIMENT: return "experiment";
        case DecisionSource::ROLLOUT: return "rollout";
        default: return "unknown";
    }
}

DecisionService::DecisionService(ForcedVariationStore& forced_variations, UserProfileService* user_profiles)
    : DecisionService(forced_variations, user_profiles, std::make_shared<const Bucketer>(), Config()) {}

DecisionService::DecisionService(ForcedVariationStore& forced_variations,
                                 UserProfileService* user_profiles,
                                 std::shared_ptr<const Bucketer> bucketer,
                                 Config config)
    : forced_variations_(forced_variations),
      user_profiles_(user_profiles),
      bucketer_(bucketer ? std::move(bucketer) : std::make_shared<const Bucketer>()),
      config_(std::move(config)) {}

std::optional<Decision> DecisionService::decide_experiment(const ProjectConfig& config,
                                                           const std::string& experiment_key,
                                                           const std::string& user_id,
                                                           const UserAttributes& attributes) const {
    try {
        common::require_input(experiment_key, "experiment key");
    } catch (const common::InvalidInputException& e) {
        LOG_ERROR("{}", e.what());
        return std::nullopt;
    }

    const Experiment* experiment = config.get_experiment_from_key(experiment_key);
    if (!experiment) {
        return std::nullopt;
    }

    return decide(config, *experiment, user_id, attributes);
}

std::optional<Decision> DecisionService::decide(const ProjectConfig& config,
                                                const Experiment& experiment,
                                                const std::string& user_id,
                                                const UserAttributes& attributes) const {
    if (!experiment.is_running()) {
        LOG_INFO("Experiment '{}' is not running.", experiment.key);
        return std::nullopt;
    }

    // Runtime overrides bypass every other check
    if (const Variation* forced = get_forced_variation(config, experiment.key, user_id)) {
        return Decision{&experiment, forced, DecisionSource::EXPERIMENT};
    }

    if (const Variation* whitelisted = get_whitelisted_variation(experiment, user_id)) {
        return Decision{&experiment, whitelisted, DecisionSource::EXPERIMENT};
    }

    const std::string bucketing_id = get_bucketing_id(user_id, attributes);

    if (!passes_group_exclusion(config, experiment, bucketing_id, user_id)) {
        return std::nullopt;
    }

    AudienceEvaluator audience_evaluator(config);
    if (!audience_evaluator.user_in_experiment(experiment, attributes)) {
        LOG_INFO("User '{}' does not meet the conditions to be in experiment '{}'.", user_id, experiment.key);
        return std::nullopt;
    }

    const bool use_profiles = user_profiles_ && config_.enable_user_profiles;

    if (use_profiles) {
        if (const Variation* stored = get_stored_variation(experiment, user_id)) {
            return Decision{&experiment, stored, DecisionSource::EXPERIMENT};
        }
    }

    const Variation* variation = bucketer_->bucket(experiment, bucketing_id);
    if (!variation) {
        return std::nullopt;
    }

    if (use_profiles) {
        save_variation(experiment, *variation, user_id);
    }

    return Decision{&experiment, variation, DecisionSource::EXPERIMENT};
}

const Variation* DecisionService::get_whitelisted_variation(const Experiment& experiment,
                                                            const std::string& user_id) const {
    auto it = experiment.forced_variations.find(user_id);
    if (it == experiment.forced_variations.end()) {
        return nullptr;
    }

    const Variation* variation = experiment.find_variation_by_key(it->second);
    if (!variation) {
        LOG_ERROR("Variation key '{}' whitelisted for user '{}' is not in experiment '{}'.",
                  it->second, user_id, experiment.key);
        return nullptr;
    }

    LOG_INFO("User '{}' is whitelisted into variation '{}' of experiment '{}'.",
             user_id, variation->key, experiment.key);
    return variation;
}

bool DecisionService::passes_group_exclusion(const ProjectConfig& config,
                                             const Experiment& experiment,
                                             const std::string& bucketing_id,
                                             const std::string& user_id) const {
    if (!experiment.in_group()) {
        return true;
    }

    const config::Group* group = config.get_group_from_id(experiment.group_id);
    if (!group) {
        return false;
    }

    if (!group->is_random()) {
        return true;
    }

    auto bucketed_experiment_id = bucketer_->bucket_to_group_member(*group, bucketing_id);
    if (!bucketed_experiment_id) {
        LOG_INFO("User '{}' is in no experiment of group {}.", user_id, group->id);
        return false;
    }

    if (*bucketed_experiment_id != experiment.id) {
        LOG_INFO("User '{}' is not in experiment '{}' of group {}.", user_id, experiment.key, group->id);
        return false;
    }

    LOG_INFO("User '{}' is in experiment '{}' of group {}.", user_id, experiment.key, group->id);
    return true;
}

const Variation* DecisionService::get_stored_variation(const Experiment& experiment,
                                                       const std::string& user_id) const {
    std::optional<UserProfile> profile;
    try {
        profile = user_profiles_->lookup(user_id);
    } catch (const std::exception& e) {
        LOG_ERROR("Error while looking up user profile for user ID '{}': {}.", user_id, e.what());
        common::ErrorHandler::handle_error(e);
        return nullptr;
    }

    if (!profile) {
        LOG_DEBUG("No user profile found for user ID '{}'.", user_id);
        return nullptr;
    }

    auto variation_id = profile->variation_for(experiment.id);
    if (!variation_id) {
        LOG_DEBUG("No previously activated variation of experiment '{}' for user '{}' found in user profile.",
                  experiment.key, user_id);
        return nullptr;
    }

    const Variation* variation = experiment.find_variation_by_id(*variation_id);
    if (!variation) {
        LOG_INFO("User '{}' was previously bucketed into variation ID '{}' for experiment '{}', "
                 "but no matching variation was found. Re-bucketing user.",
                 user_id, *variation_id, experiment.id);
        return nullptr;
    }

    LOG_INFO("Found variation '{}' of experiment '{}' for user '{}' in user profile.",
             variation->key, experiment.key, user_id);
    return variation;
}

void DecisionService::save_variation(const Experiment& experiment,
                                     const Variation& variation,
                                     const std::string& user_id) const {
    try {
        if (user_profiles_->save(user_id, experiment.id, variation.id)) {
            LOG_INFO("Saved variation ID '{}' of experiment ID '{}' for user '{}'.",
                     variation.id, experiment.id, user_id);
        } else {
            LOG_ERROR("User profile service refused variation ID '{}' of experiment ID '{}' for user '{}'.",
                      variation.id, experiment.id, user_id);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error while saving user profile for user ID '{}': {}.", user_id, e.what());
        common::ErrorHandler::handle_error(e);
    }
}

std::optional<Decision> DecisionService::decide_feature(const ProjectConfig& config,
                                                        const std::string& feature_key,
                                                        const std::string& user_id,
                                                        const UserAttributes& attributes) const {
    try {
        common::require_input(feature_key, "feature flag key");
    } catch (const common::InvalidInputException& e) {
        LOG_ERROR("{}", e.what());
        return std::nullopt;
    }

    const FeatureFlag* feature = config.get_feature_flag_from_key(feature_key);
    if (!feature) {
        return std::nullopt;
    }

    return get_variation_for_feature(config, *feature, user_id, attributes);
}

std::optional<Decision> DecisionService::get_variation_for_feature(const ProjectConfig& config,
                                                                   const FeatureFlag& feature,
                                                                   const std::string& user_id,
                                                                   const UserAttributes& attributes) const {
    if (auto decision = get_variation_for_feature_experiment(config, feature, user_id, attributes)) {
        return decision;
    }

    if (auto decision = get_variation_for_feature_rollout(config, feature, user_id, attributes)) {
        LOG_INFO("User '{}' is in the rollout for feature flag '{}'.", user_id, feature.key);
        return decision;
    }

    LOG_INFO("User '{}' is not in the rollout for feature flag '{}'.", user_id, feature.key);
    return std::nullopt;
}

std::optional<Decision> DecisionService::get_variation_for_feature_experiment(
    const ProjectConfig& config,
    const FeatureFlag& feature,
    const std::string& user_id,
    const UserAttributes& attributes) const {
    if (feature.experiment_ids.empty()) {
        LOG_DEBUG("The feature flag '{}' is not used in any experiments.", feature.key);
        return std::nullopt;
    }

    for (const auto& experiment_id : feature.experiment_ids) {
        const Experiment* experiment = config.get_experiment_from_id(experiment_id);
        if (!experiment) {
            continue;
        }

        if (auto decision = decide(config, *experiment, user_id, attributes)) {
            LOG_INFO("The user '{}' is bucketed into experiment '{}' of feature '{}'.",
                     user_id, experiment->key, feature.key);
            return decision;
        }
    }

    LOG_INFO("The user '{}' is not bucketed into any of the experiments on the feature '{}'.", user_id, feature.key);
    return std::nullopt;
}

std::optional<Decision> DecisionService::get_variation_for_feature_rollout(
    const ProjectConfig& config,
    const FeatureFlag& feature,
    const std::string& user_id,
    const UserAttributes& attributes) const {
    if (feature.rollout_id.empty()) {
        LOG_DEBUG("Feature flag '{}' is not used in a rollout.", feature.key);
        return std::nullopt;
    }

    const config::Rollout* rollout = config.get_rollout_from_id(feature.rollout_id);
    if (!rollout) {
        return std::nullopt;
    }

    if (rollout->rules.empty()) {
        LOG_DEBUG("Rollout '{}' has no rules.", rollout->id);
        return std::nullopt;
    }

    AudienceEvaluator audience_evaluator(config);
    const std::string bucketing_id = get_bucketing_id(user_id, attributes);
    const size_t last_rule = rollout->rules.size() - 1;

    for (size_t index = 0; index < rollout->rules.size(); ++index) {
        const Experiment& rule = rollout->rules[index];

        if (!audience_evaluator.user_in_experiment(rule, attributes)) {
            if (index == last_rule) {
                LOG_DEBUG("User '{}' does not meet the conditions of the last rule of rollout '{}'.",
                          user_id, rollout->id);
                return std::nullopt;
            }
            LOG_DEBUG("User '{}' does not meet the conditions for targeting rule {} of rollout '{}'.",
                      user_id, index + 1, rollout->id);
            continue;
        }

        // A matching rule decides alone: no allocation here means no rollout at all
        const Variation* variation = bucketer_->bucket(rule, bucketing_id);
        if (!variation) {
            LOG_DEBUG("User '{}' meets targeting rule {} of rollout '{}' but is outside its traffic allocation.",
                      user_id, index + 1, rollout->id);
            return std::nullopt;
        }

        return Decision{&rule, variation, DecisionSource::ROLLOUT};
    }

    return std::nullopt;
}

bool DecisionService::set_forced_variation(const ProjectConfig& config,
                                           const std::string& experiment_key,
                                           const std::string& user_id,
                                           const std::string& variation_key) {
    try {
        common::require_input(experiment_key, "experiment key");
        common::require_input(user_id, "user ID");
    } catch (const common::InvalidInputException& e) {
        LOG_ERROR("{}", e.what());
        return false;
    }

    const Experiment* experiment = config.get_experiment_from_key(experiment_key);
    if (!experiment) {
        return false;
    }

    if (variation_key.empty()) {
        bool cleared = false;
        try {
            cleared = forced_variations_.clear(experiment_key, user_id);
        } catch (const std::exception& e) {
            LOG_ERROR("Error while clearing forced variation of experiment '{}' for user '{}': {}.",
                      experiment_key, user_id, e.what());
            common::ErrorHandler::handle_error(e);
            return false;
        }
        if (cleared) {
            LOG_DEBUG("Variation mapped to experiment '{}' has been removed for user '{}'.", experiment_key, user_id);
        }
        return cleared;
    }

    const Variation* variation = experiment->find_variation_by_key(variation_key);
    if (!variation) {
        LOG_ERROR("Variation key '{}' is not in experiment '{}'.", variation_key, experiment_key);
        return false;
    }

    bool stored = false;
    try {
        stored = forced_variations_.set(experiment_key, user_id, variation_key);
    } catch (const std::exception& e) {
        LOG_ERROR("Error while forcing variation '{}' of experiment '{}' for user '{}': {}.",
                  variation_key, experiment_key, user_id, e.what());
        common::ErrorHandler::handle_error(e);
        return false;
    }

    if (stored) {
        LOG_DEBUG("Set variation '{}' for experiment '{}' and user '{}' in the forced variation map.",
                  variation->id, experiment->id, user_id);
    }
    return stored;
}

const Variation* DecisionService::get_forced_variation(const ProjectConfig& config,
                                                       const std::string& experiment_key,
                                                       const std::string& user_id) const {
    std::optional<std::string> variation_key;
    try {
        variation_key = forced_variations_.get(experiment_key, user_id);
    } catch (const std::exception& e) {
        LOG_ERROR("Error while reading forced variation of experiment '{}' for user '{}': {}.",
                  experiment_key, user_id, e.what());
        common::ErrorHandler::handle_error(e);
        return nullptr;
    }

    if (!variation_key) {
        LOG_DEBUG("No experiment '{}' mapped to user '{}' in the forced variation map.", experiment_key, user_id);
        return nullptr;
    }

    // The store may predate the current snapshot; resolve against it again
    const Experiment* experiment = config.get_experiment_from_key(experiment_key);
    if (!experiment) {
        return nullptr;
    }

    const Variation* variation = experiment->find_variation_by_key(*variation_key);
    if (!variation) {
        LOG_ERROR("Forced variation '{}' of experiment '{}' no longer exists.", *variation_key, experiment_key);
        return nullptr;
    }

    LOG_DEBUG("Variation '{}' is mapped to experiment '{}' and user '{}' in the forced variation map.",
              variation->key, experiment_key, user_id);
    return variation;
}

std::string DecisionService::get_bucketing_id(const std::string& user_id, const UserAttributes& attributes) const {
    auto it = attributes.find(config_.bucketing_id_attribute);
    if (it == attributes.end() || it->second.is_absent()) {
        return user_id;
    }

    if (!it->second.is_string()) {
        LOG_WARNING("Bucketing ID attribute is not a string. Defaulted to user ID.");
        return user_id;
    }

    return it->second.as_string();
}

} // namespace decision
} // namespace xcore
