#pragma once

#include <cstddef>
#include <string>

#include "common/types.hpp"

namespace xcore {
namespace common {

/**
 * MurmurHash3, x86 32-bit variant.
 *
 * Bucketing depends on this producing the same value as every other SDK
 * implementation for the same bytes and seed, so the block order, tail
 * handling and finalizer follow the reference algorithm exactly.
 */
u32 murmur3_32(const void* data, std::size_t length, u32 seed);

inline u32 murmur3_32(const std::string& data, u32 seed) {
    return murmur3_32(data.data(), data.size(), seed);
}

} // namespace common
} // namespace xcore
