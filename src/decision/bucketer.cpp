#include "decision/bucketer.hpp"
#include "common/logger.hpp"
#include "common/murmur_hash.hpp"

namespace xcore {
namespace decision {

namespace {

constexpr double MAX_HASH_VALUE = 4294967296.0; // 2^32

} // namespace

u32 Bucketer::bucket_value(const std::string& bucketing_id, const std::string& entity_id) const {
    return generate_bucket_value(bucketing_id + entity_id);
}

u32 Bucketer::generate_bucket_value(const std::string& bucketing_key) {
    const u32 hash = common::murmur3_32(bucketing_key, BUCKETING_HASH_SEED);
    // Dividing by 2^32 is exact and the product needs at most 46 bits, so the
    // truncation matches integer arithmetic on every platform
    const double ratio = static_cast<double>(hash) / MAX_HASH_VALUE;
    return static_cast<u32>(ratio * MAX_TRAFFIC_VALUE);
}

std::optional<std::string> Bucketer::find_bucket(u32 bucket_value, const config::TrafficAllocation& allocation) {
    for (const auto& entry : allocation) {
        if (bucket_value < entry.end_of_range) {
            if (entry.entity_id.empty()) {
                LOG_DEBUG("Bucketed into an empty traffic range.");
                return std::nullopt;
            }
            return entry.entity_id;
        }
    }
    return std::nullopt;
}

const config::Variation* Bucketer::bucket(const config::Experiment& experiment,
                                          const std::string& bucketing_id) const {
    const u32 value = bucket_value(bucketing_id, experiment.id);
    LOG_DEBUG("Assigned bucket {} to user with bucketing ID '{}'.", value, bucketing_id);

    auto variation_id = find_bucket(value, experiment.traffic_allocation);
    if (!variation_id) {
        LOG_INFO("User with bucketing ID '{}' is in no variation of experiment '{}'.", bucketing_id, experiment.key);
        return nullptr;
    }

    const config::Variation* variation = experiment.find_variation_by_id(*variation_id);
    if (!variation) {
        LOG_ERROR("Traffic allocation of experiment '{}' references unknown variation id '{}'.",
                  experiment.key, *variation_id);
        return nullptr;
    }

    LOG_INFO("User with bucketing ID '{}' is in variation '{}' of experiment '{}'.",
             bucketing_id, variation->key, experiment.key);
    return variation;
}

std::optional<std::string> Bucketer::bucket_to_group_member(const config::Group& group,
                                                            const std::string& bucketing_id) const {
    const u32 value = bucket_value(bucketing_id, group.id);
    LOG_DEBUG("Assigned bucket {} to user with bucketing ID '{}' in group '{}'.", value, bucketing_id, group.id);
    return find_bucket(value, group.traffic_allocation);
}

} // namespace decision
} // namespace xcore
