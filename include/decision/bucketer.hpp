#pragma once

#include <optional>
#include <string>

#include "common/types.hpp"
#include "config/entities.hpp"

namespace xcore {
namespace decision {

/**
 * Deterministic assignment of users to slots of the bucket space.
 *
 * bucket_value() hashes bucketing_id + entity_id with MurmurHash3 (x86,
 * 32-bit, seed 1) and scales the hash into [0, MAX_TRAFFIC_VALUE). The result
 * must match every other SDK implementation bit for bit.
 *
 * bucket_value() is virtual so tests can place users at chosen slots.
 */
class Bucketer {
public:
    Bucketer() = default;
    virtual ~Bucketer() = default;

    virtual u32 bucket_value(const std::string& bucketing_id, const std::string& entity_id) const;

    static u32 generate_bucket_value(const std::string& bucketing_key);

    // Entity of the first range whose end exceeds bucket_value; none past the
    // last range or for a slice reserved with an empty entity id.
    static std::optional<std::string> find_bucket(u32 bucket_value, const config::TrafficAllocation& allocation);

    // Variation of the experiment (or rollout rule) this user falls into
    const config::Variation* bucket(const config::Experiment& experiment, const std::string& bucketing_id) const;

    // Member experiment id of a group this user falls into
    std::optional<std::string> bucket_to_group_member(const config::Group& group,
                                                      const std::string& bucketing_id) const;
};

} // namespace decision
} // namespace xcore
