#include "config/project_config.hpp"
#include "config/condition_parser.hpp"
#include "common/error_handling.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace xcore {
namespace config {

using nlohmann::json;

namespace {

std::string string_field(const json& object, const char* field) {
    auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw common::ConfigException(std::string("field '") + field + "' must be a string");
    }
    return it->get<std::string>();
}

const json& array_field(const json& object, const char* field) {
    static const json empty = json::array();
    auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_array()) {
        throw common::ConfigException(std::string("field '") + field + "' must be an array");
    }
    return *it;
}

// Scalar datafile values (variable defaults, overrides) are carried as strings
std::string scalar_as_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

} // namespace

const std::vector<std::string>& ProjectConfig::supported_versions() {
    static const std::vector<std::string> versions{"2", "3", "4"};
    return versions;
}

std::shared_ptr<const ProjectConfig> ProjectConfig::from_string(const std::string& datafile) {
    json parsed;
    try {
        parsed = json::parse(datafile);
    } catch (const json::parse_error& e) {
        throw common::ConfigException(std::string("datafile is not valid JSON: ") + e.what());
    }
    return from_json(parsed);
}

std::shared_ptr<const ProjectConfig> ProjectConfig::from_json(const json& datafile) {
    return std::make_shared<const ProjectConfig>(datafile);
}

ProjectConfig::ProjectConfig(const json& datafile) {
    XCORE_THROW_IF(!datafile.is_object(), common::ConfigException, "datafile must be a JSON object");

    try {
        parse_header(datafile);
        parse_audiences(datafile);
        parse_experiments(datafile);
        parse_features(datafile);
        parse_events_and_attributes(datafile);
    } catch (const json::exception& e) {
        throw common::ConfigException(e.what());
    }

    build_indices();

    LOG_DEBUG("Loaded datafile revision {} with {} experiments and {} feature flags",
              revision_, experiments_.size(), feature_flags_.size());
}

void ProjectConfig::parse_header(const json& datafile) {
    version_ = string_field(datafile, "version");
    const auto& versions = supported_versions();
    if (std::find(versions.begin(), versions.end(), version_) == versions.end()) {
        throw common::InvalidDatafileVersionException(version_);
    }

    revision_ = string_field(datafile, "revision");
    project_id_ = string_field(datafile, "projectId");
    account_id_ = string_field(datafile, "accountId");
}

void ProjectConfig::parse_audiences(const json& datafile) {
    std::unordered_map<std::string, std::size_t> position;

    auto add_audience = [&](const json& audience_json) {
        Audience audience;
        audience.id = string_field(audience_json, "id");
        audience.name = string_field(audience_json, "name");

        auto conditions = audience_json.find("conditions");
        if (conditions == audience_json.end() || conditions->is_null()) {
            throw common::ConfigException("audience '" + audience.id + "' has no conditions");
        }
        audience.conditions = ConditionParser::parse_audience_conditions(*conditions);

        auto existing = position.find(audience.id);
        if (existing != position.end()) {
            audiences_[existing->second] = std::move(audience);
        } else {
            position[audience.id] = audiences_.size();
            audiences_.push_back(std::move(audience));
        }
    };

    for (const auto& audience_json : array_field(datafile, "audiences")) {
        add_audience(audience_json);
    }

    // Typed audiences replace legacy audiences sharing the same id
    for (const auto& audience_json : array_field(datafile, "typedAudiences")) {
        add_audience(audience_json);
    }
}

void ProjectConfig::parse_experiments(const json& datafile) {
    for (const auto& experiment_json : array_field(datafile, "experiments")) {
        experiments_.push_back(parse_experiment(experiment_json, string_field(experiment_json, "groupId")));
    }

    for (const auto& group_json : array_field(datafile, "groups")) {
        Group group;
        group.id = string_field(group_json, "id");
        group.policy = string_field(group_json, "policy") == "overlapping"
            ? Group::Policy::OVERLAPPING
            : Group::Policy::RANDOM;
        group.traffic_allocation = parse_traffic_allocation(array_field(group_json, "trafficAllocation"));

        for (const auto& experiment_json : array_field(group_json, "experiments")) {
            Experiment experiment = parse_experiment(experiment_json, group.id);
            group.experiment_ids.push_back(experiment.id);
            experiments_.push_back(std::move(experiment));
        }

        groups_.push_back(std::move(group));
    }

    for (const auto& rollout_json : array_field(datafile, "rollouts")) {
        Rollout rollout;
        rollout.id = string_field(rollout_json, "id");
        for (const auto& rule_json : array_field(rollout_json, "experiments")) {
            rollout.rules.push_back(parse_experiment(rule_json, ""));
        }
        rollouts_.push_back(std::move(rollout));
    }
}

void ProjectConfig::parse_features(const json& datafile) {
    for (const auto& feature_json : array_field(datafile, "featureFlags")) {
        FeatureFlag feature;
        feature.id = string_field(feature_json, "id");
        feature.key = string_field(feature_json, "key");
        feature.rollout_id = string_field(feature_json, "rolloutId");
        feature.experiment_ids = parse_string_list(feature_json, "experimentIds");

        for (const auto& variable_json : array_field(feature_json, "variables")) {
            FeatureVariable variable;
            variable.id = string_field(variable_json, "id");
            variable.key = string_field(variable_json, "key");
            variable.type = variable_type_from_string(string_field(variable_json, "type"));
            auto default_value = variable_json.find("defaultValue");
            if (default_value != variable_json.end()) {
                variable.default_value = scalar_as_string(*default_value);
            }
            feature.variables.push_back(std::move(variable));
        }

        feature_flags_.push_back(std::move(feature));
    }
}

void ProjectConfig::parse_events_and_attributes(const json& datafile) {
    for (const auto& event_json : array_field(datafile, "events")) {
        Event event;
        event.id = string_field(event_json, "id");
        event.key = string_field(event_json, "key");
        event.experiment_ids = parse_string_list(event_json, "experimentIds");
        events_.push_back(std::move(event));
    }

    for (const auto& attribute_json : array_field(datafile, "attributes")) {
        attributes_.push_back(Attribute{string_field(attribute_json, "id"), string_field(attribute_json, "key")});
    }
}

Experiment ProjectConfig::parse_experiment(const json& json_experiment, const std::string& group_id) {
    Experiment experiment;
    experiment.id = string_field(json_experiment, "id");
    experiment.key = string_field(json_experiment, "key");
    experiment.status = string_field(json_experiment, "status");
    experiment.layer_id = string_field(json_experiment, "layerId");
    experiment.group_id = group_id;
    experiment.audience_ids = parse_string_list(json_experiment, "audienceIds");

    auto audience_conditions = json_experiment.find("audienceConditions");
    if (audience_conditions != json_experiment.end() && !audience_conditions->is_null()) {
        if (!(audience_conditions->is_array() && audience_conditions->empty())) {
            experiment.audience_conditions = ConditionParser::parse_audience_reference_tree(*audience_conditions);
        }
    } else if (!experiment.audience_ids.empty()) {
        experiment.audience_conditions = ConditionParser::from_audience_ids(experiment.audience_ids);
    }

    experiment.traffic_allocation = parse_traffic_allocation(array_field(json_experiment, "trafficAllocation"));

    for (const auto& variation_json : array_field(json_experiment, "variations")) {
        experiment.variations.push_back(parse_variation(variation_json));
    }

    auto forced = json_experiment.find("forcedVariations");
    if (forced != json_experiment.end() && forced->is_object()) {
        for (const auto& [user_id, variation_key] : forced->items()) {
            experiment.forced_variations[user_id] = scalar_as_string(variation_key);
        }
    }

    return experiment;
}

Variation ProjectConfig::parse_variation(const json& json_variation) {
    Variation variation;
    variation.id = string_field(json_variation, "id");
    variation.key = string_field(json_variation, "key");

    auto enabled = json_variation.find("featureEnabled");
    variation.feature_enabled = enabled != json_variation.end() && enabled->is_boolean() && enabled->get<bool>();

    for (const auto& usage : array_field(json_variation, "variables")) {
        auto value = usage.find("value");
        variation.variable_values[string_field(usage, "id")] =
            value == usage.end() ? std::string() : scalar_as_string(*value);
    }

    return variation;
}

TrafficAllocation ProjectConfig::parse_traffic_allocation(const json& json_allocation) {
    TrafficAllocation allocation;
    i64 previous_end = -1;

    for (const auto& entry_json : json_allocation) {
        const i64 end_of_range = entry_json.at("endOfRange").get<i64>();
        if (end_of_range < 0 || end_of_range > static_cast<i64>(MAX_TRAFFIC_VALUE)) {
            throw common::ConfigException("endOfRange " + std::to_string(end_of_range) + " outside bucket space");
        }
        if (end_of_range < previous_end) {
            throw common::ConfigException("traffic allocation is not sorted by endOfRange");
        }
        previous_end = end_of_range;

        allocation.push_back(TrafficAllocationEntry{string_field(entry_json, "entityId"),
                                                    static_cast<u32>(end_of_range)});
    }

    return allocation;
}

std::vector<std::string> ProjectConfig::parse_string_list(const json& object, const char* field) {
    std::vector<std::string> values;
    for (const auto& value : array_field(object, field)) {
        values.push_back(value.get<std::string>());
    }
    return values;
}

void ProjectConfig::build_indices() {
    for (const auto& experiment : experiments_) {
        experiment_key_map_[experiment.key] = &experiment;
        experiment_id_map_[experiment.id] = &experiment;
        index_variations(experiment, experiment_variations_[experiment.key]);
    }

    for (const auto& group : groups_) {
        group_id_map_[group.id] = &group;
    }

    for (const auto& audience : audiences_) {
        audience_id_map_[audience.id] = &audience;
    }

    for (const auto& feature : feature_flags_) {
        feature_key_map_[feature.key] = &feature;
    }

    for (const auto& rollout : rollouts_) {
        rollout_id_map_[rollout.id] = &rollout;
        for (const auto& rule : rollout.rules) {
            if (experiment_variations_.count(rule.key)) {
                LOG_WARNING("Rollout rule key '{}' is also an experiment key; lookups by that key "
                            "resolve to the experiment.", rule.key);
            }
            index_variations(rule, rule_variations_[rule.key]);
        }
    }

    for (const auto& event : events_) {
        event_key_map_[event.key] = &event;
    }

    for (const auto& attribute : attributes_) {
        attribute_key_to_id_[attribute.key] = attribute.id;
    }
}

void ProjectConfig::index_variations(const Experiment& experiment, VariationIndex& index) {
    for (const auto& variation : experiment.variations) {
        index.by_id[variation.id] = &variation;
        index.by_key[variation.key] = &variation;
    }
}

const ProjectConfig::VariationIndex* ProjectConfig::find_variation_index(const std::string& experiment_key) const {
    auto experiment = experiment_variations_.find(experiment_key);
    if (experiment != experiment_variations_.end()) {
        return &experiment->second;
    }
    auto rule = rule_variations_.find(experiment_key);
    if (rule != rule_variations_.end()) {
        return &rule->second;
    }
    LOG_ERROR("Experiment key '{}' is not in datafile.", experiment_key);
    return nullptr;
}

const Experiment* ProjectConfig::get_experiment_from_key(const std::string& experiment_key) const {
    auto it = experiment_key_map_.find(experiment_key);
    if (it != experiment_key_map_.end()) {
        return it->second;
    }
    LOG_ERROR("Experiment key '{}' is not in datafile.", experiment_key);
    return nullptr;
}

const Experiment* ProjectConfig::get_experiment_from_id(const std::string& experiment_id) const {
    auto it = experiment_id_map_.find(experiment_id);
    if (it != experiment_id_map_.end()) {
        return it->second;
    }
    LOG_ERROR("Experiment id '{}' is not in datafile.", experiment_id);
    return nullptr;
}

std::optional<std::string> ProjectConfig::get_experiment_key(const std::string& experiment_id) const {
    const Experiment* experiment = get_experiment_from_id(experiment_id);
    if (experiment) {
        return experiment->key;
    }
    return std::nullopt;
}

const Group* ProjectConfig::get_group_from_id(const std::string& group_id) const {
    auto it = group_id_map_.find(group_id);
    if (it != group_id_map_.end()) {
        return it->second;
    }
    LOG_ERROR("Group id '{}' is not in datafile.", group_id);
    return nullptr;
}

const Audience* ProjectConfig::get_audience_from_id(const std::string& audience_id) const {
    auto it = audience_id_map_.find(audience_id);
    if (it != audience_id_map_.end()) {
        return it->second;
    }
    LOG_ERROR("Audience id '{}' is not in datafile.", audience_id);
    return nullptr;
}

const FeatureFlag* ProjectConfig::get_feature_flag_from_key(const std::string& feature_key) const {
    auto it = feature_key_map_.find(feature_key);
    if (it != feature_key_map_.end()) {
        return it->second;
    }
    LOG_ERROR("Feature flag key '{}' is not in datafile.", feature_key);
    return nullptr;
}

const Rollout* ProjectConfig::get_rollout_from_id(const std::string& rollout_id) const {
    auto it = rollout_id_map_.find(rollout_id);
    if (it != rollout_id_map_.end()) {
        return it->second;
    }
    LOG_ERROR("Rollout with ID '{}' is not in the datafile.", rollout_id);
    return nullptr;
}

const Event* ProjectConfig::get_event_from_key(const std::string& event_key) const {
    auto it = event_key_map_.find(event_key);
    if (it != event_key_map_.end()) {
        return it->second;
    }
    LOG_ERROR("Event key '{}' is not in datafile.", event_key);
    return nullptr;
}

std::optional<std::string> ProjectConfig::get_attribute_id(const std::string& attribute_key) const {
    auto it = attribute_key_to_id_.find(attribute_key);
    if (it != attribute_key_to_id_.end()) {
        return it->second;
    }
    // Reserved attributes are sent under their own key
    if (attribute_key.rfind("$opt_", 0) == 0) {
        return attribute_key;
    }
    LOG_ERROR("Attribute key '{}' is not in datafile.", attribute_key);
    return std::nullopt;
}

const Variation* ProjectConfig::get_variation_from_id(const std::string& experiment_key,
                                                      const std::string& variation_id) const {
    const VariationIndex* index = find_variation_index(experiment_key);
    if (!index) {
        return nullptr;
    }
    auto it = index->by_id.find(variation_id);
    if (it != index->by_id.end()) {
        return it->second;
    }
    LOG_ERROR("Variation id '{}' is not in datafile.", variation_id);
    return nullptr;
}

const Variation* ProjectConfig::get_variation_from_key(const std::string& experiment_key,
                                                       const std::string& variation_key) const {
    const VariationIndex* index = find_variation_index(experiment_key);
    if (!index) {
        return nullptr;
    }
    auto it = index->by_key.find(variation_key);
    if (it != index->by_key.end()) {
        return it->second;
    }
    LOG_ERROR("Variation key '{}' is not in datafile.", variation_key);
    return nullptr;
}

std::optional<std::string> ProjectConfig::get_variation_id_from_key(const std::string& experiment_key,
                                                                    const std::string& variation_key) const {
    const Variation* variation = get_variation_from_key(experiment_key, variation_key);
    if (variation) {
        return variation->id;
    }
    return std::nullopt;
}

const std::unordered_map<std::string, std::string>* ProjectConfig::get_variation_variable_usages(
    const std::string& experiment_key, const std::string& variation_id) const {
    const Variation* variation = get_variation_from_id(experiment_key, variation_id);
    if (variation) {
        return &variation->variable_values;
    }
    return nullptr;
}

const FeatureVariable* ProjectConfig::get_feature_variable(const FeatureFlag& feature,
                                                           const std::string& variable_key) const {
    for (const auto& variable : feature.variables) {
        if (variable.key == variable_key) {
            return &variable;
        }
    }
    LOG_ERROR("No variable key '{}' defined in datafile for feature flag '{}'.", variable_key, feature.key);
    return nullptr;
}

std::vector<std::string> ProjectConfig::get_experiment_ids_for_event(const std::string& event_key) const {
    const Event* event = get_event_from_key(event_key);
    if (event) {
        return event->experiment_ids;
    }
    return {};
}

} // namespace config
} // namespace xcore
