#pragma once

#include <cstdint>
#include <cstddef>

namespace xcore {

// Basic integer types
using u8 = std::uint8_t;
using u32 = std::uint32_t;
using i64 = std::int64_t;

// Size of the bucket space every traffic allocation partitions
constexpr u32 MAX_TRAFFIC_VALUE = 10000;

// Seed shared by every SDK of the family for bucketing hashes
constexpr u32 BUCKETING_HASH_SEED = 1;

} // namespace xcore
