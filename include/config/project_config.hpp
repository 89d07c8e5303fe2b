#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/entities.hpp"

namespace xcore {
namespace config {

/**
 * Immutable, indexed view over a parsed datafile.
 *
 * Every entity is parsed into its typed form exactly once, here. Lookups
 * never throw: a miss is logged and reported as nullptr, std::nullopt or an
 * empty collection. A reload builds a new ProjectConfig; instances are never
 * mutated after construction and can be shared between threads freely.
 */
class ProjectConfig {
public:
    static const std::vector<std::string>& supported_versions();

    // Throw common::ConfigException (or InvalidDatafileVersionException)
    static std::shared_ptr<const ProjectConfig> from_string(const std::string& datafile);
    static std::shared_ptr<const ProjectConfig> from_json(const nlohmann::json& datafile);

    explicit ProjectConfig(const nlohmann::json& datafile);

    ProjectConfig(const ProjectConfig&) = delete;
    ProjectConfig& operator=(const ProjectConfig&) = delete;

    const std::string& version() const { return version_; }
    const std::string& revision() const { return revision_; }
    const std::string& project_id() const { return project_id_; }
    const std::string& account_id() const { return account_id_; }

    const Experiment* get_experiment_from_key(const std::string& experiment_key) const;
    const Experiment* get_experiment_from_id(const std::string& experiment_id) const;
    std::optional<std::string> get_experiment_key(const std::string& experiment_id) const;

    const Group* get_group_from_id(const std::string& group_id) const;
    const Audience* get_audience_from_id(const std::string& audience_id) const;
    const FeatureFlag* get_feature_flag_from_key(const std::string& feature_key) const;
    const Rollout* get_rollout_from_id(const std::string& rollout_id) const;
    const Event* get_event_from_key(const std::string& event_key) const;
    std::optional<std::string> get_attribute_id(const std::string& attribute_key) const;

    // Variation lookups cover both experiments and rollout rules. Variation
    // ids are only unique within one experiment, so every lookup is scoped by
    // the experiment (or rule) key; experiments win over a rule with the same key.
    const Variation* get_variation_from_id(const std::string& experiment_key, const std::string& variation_id) const;
    const Variation* get_variation_from_key(const std::string& experiment_key, const std::string& variation_key) const;
    std::optional<std::string> get_variation_id_from_key(const std::string& experiment_key,
                                                         const std::string& variation_key) const;

    // variable id -> value overrides of one variation; nullptr for an unknown variation
    const std::unordered_map<std::string, std::string>* get_variation_variable_usages(
        const std::string& experiment_key, const std::string& variation_id) const;

    const FeatureVariable* get_feature_variable(const FeatureFlag& feature, const std::string& variable_key) const;

    std::vector<std::string> get_experiment_ids_for_event(const std::string& event_key) const;

    const std::vector<FeatureFlag>& feature_flags() const { return feature_flags_; }
    const std::vector<Experiment>& experiments() const { return experiments_; }
    const std::vector<Group>& groups() const { return groups_; }

private:
    void parse_header(const nlohmann::json& datafile);
    void parse_audiences(const nlohmann::json& datafile);
    void parse_experiments(const nlohmann::json& datafile);
    void parse_features(const nlohmann::json& datafile);
    void parse_events_and_attributes(const nlohmann::json& datafile);
    void build_indices();

    static Experiment parse_experiment(const nlohmann::json& json, const std::string& group_id);
    static Variation parse_variation(const nlohmann::json& json);
    static TrafficAllocation parse_traffic_allocation(const nlohmann::json& json);
    static std::vector<std::string> parse_string_list(const nlohmann::json& json, const char* field);

    struct VariationIndex {
        std::unordered_map<std::string, const Variation*> by_id;
        std::unordered_map<std::string, const Variation*> by_key;
    };

    static void index_variations(const Experiment& experiment, VariationIndex& index);
    const VariationIndex* find_variation_index(const std::string& experiment_key) const;

    std::string version_;
    std::string revision_;
    std::string project_id_;
    std::string account_id_;

    // Entity storage; never resized after build_indices()
    std::vector<Experiment> experiments_;
    std::vector<Group> groups_;
    std::vector<Audience> audiences_;
    std::vector<FeatureFlag> feature_flags_;
    std::vector<Rollout> rollouts_;
    std::vector<Event> events_;
    std::vector<Attribute> attributes_;

    std::unordered_map<std::string, const Experiment*> experiment_key_map_;
    std::unordered_map<std::string, const Experiment*> experiment_id_map_;
    std::unordered_map<std::string, const Group*> group_id_map_;
    std::unordered_map<std::string, const Audience*> audience_id_map_;
    std::unordered_map<std::string, const FeatureFlag*> feature_key_map_;
    std::unordered_map<std::string, const Rollout*> rollout_id_map_;
    std::unordered_map<std::string, const Event*> event_key_map_;
    std::unordered_map<std::string, std::string> attribute_key_to_id_;

    // experiment key / rollout rule key -> variations of that experiment or rule
    std::unordered_map<std::string, VariationIndex> experiment_variations_;
    std::unordered_map<std::string, VariationIndex> rule_variations_;
};

} // namespace config
} // namespace xcore
