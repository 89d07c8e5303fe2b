#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"
#include "config/condition_tree.hpp"

namespace xcore {
namespace config {

struct TrafficAllocationEntry {
    std::string entity_id;
    u32 end_of_range{0};
};

// Sorted ascending by end_of_range
using TrafficAllocation = std::vector<TrafficAllocationEntry>;

struct Variation {
    std::string id;
    std::string key;
    bool feature_enabled{false};
    // variable id -> override value
    std::unordered_map<std::string, std::string> variable_values;
};

struct Experiment {
    std::string id;
    std::string key;
    std::string status;
    std::string layer_id;
    std::vector<std::string> audience_ids;
    // Empty when the experiment has no audience restriction
    std::optional<ConditionNode> audience_conditions;
    TrafficAllocation traffic_allocation;
    std::vector<Variation> variations;
    // user id -> variation key
    std::unordered_map<std::string, std::string> forced_variations;
    std::string group_id;

    bool is_running() const { return status == "Running"; }
    bool in_group() const { return !group_id.empty(); }

    const Variation* find_variation_by_id(const std::string& variation_id) const;
    const Variation* find_variation_by_key(const std::string& variation_key) const;
};

struct Group {
    enum class Policy {
        RANDOM,
        OVERLAPPING
    };

    std::string id;
    Policy policy{Policy::RANDOM};
    std::vector<std::string> experiment_ids;
    TrafficAllocation traffic_allocation;

    bool is_random() const { return policy == Policy::RANDOM; }
};

struct Audience {
    std::string id;
    std::string name;
    ConditionNode conditions;
};

enum class VariableType {
    BOOLEAN,
    INTEGER,
    DOUBLE,
    STRING,
    UNKNOWN
};

VariableType variable_type_from_string(const std::string& type);
const char* variable_type_to_string(VariableType type);

struct FeatureVariable {
    std::string id;
    std::string key;
    VariableType type{VariableType::STRING};
    std::string default_value;
};

struct FeatureFlag {
    std::string id;
    std::string key;
    std::string rollout_id;
    std::vector<std::string> experiment_ids;
    std::vector<FeatureVariable> variables;
};

// Rules are experiment-shaped; the last one is the "everyone else" rule
struct Rollout {
    std::string id;
    std::vector<Experiment> rules;
};

struct Event {
    std::string id;
    std::string key;
    std::vector<std::string> experiment_ids;
};

struct Attribute {
    std::string id;
    std::string key;
};

} // namespace config
} // namespace xcore
