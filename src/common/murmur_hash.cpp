#include "common/murmur_hash.hpp"

namespace xcore {
namespace common {

namespace {

constexpr u32 C1 = 0xcc9e2d51;
constexpr u32 C2 = 0x1b873593;

inline u32 rotl32(u32 x, int r) {
    return (x << r) | (x >> (32 - r));
}

inline u32 fmix32(u32 h) {
    h ^= h >> 16;
    h *= 0x85ebca6b;
    h ^= h >> 13;
    h *= 0xc2b2ae35;
    h ^= h >> 16;
    return h;
}

// Blocks are read little-endian regardless of host byte order
inline u32 load_block(const u8* p) {
    return static_cast<u32>(p[0]) |
           (static_cast<u32>(p[1]) << 8) |
           (static_cast<u32>(p[2]) << 16) |
           (static_cast<u32>(p[3]) << 24);
}

} // namespace

u32 murmur3_32(const void* data, std::size_t length, u32 seed) {
    const u8* bytes = static_cast<const u8*>(data);
    const std::size_t nblocks = length / 4;

    u32 h1 = seed;

    for (std::size_t i = 0; i < nblocks; ++i) {
        u32 k1 = load_block(bytes + i * 4);

        k1 *= C1;
        k1 = rotl32(k1, 15);
        k1 *= C2;

        h1 ^= k1;
        h1 = rotl32(h1, 13);
        h1 = h1 * 5 + 0xe6546b64;
    }

    const u8* tail = bytes + nblocks * 4;
    u32 k1 = 0;

    switch (length & 3) {
        case 3:
            k1 ^= static_cast<u32>(tail[2]) << 16;
            [[fallthrough]];
        case 2:
            k1 ^= static_cast<u32>(tail[1]) << 8;
            [[fallthrough]];
        case 1:
            k1 ^= static_cast<u32>(tail[0]);
            k1 *= C1;
            k1 = rotl32(k1, 15);
            k1 *= C2;
            h1 ^= k1;
            break;
        default:
            break;
    }

    h1 ^= static_cast<u32>(length);
    return fmix32(h1);
}

} // namespace common
} // namespace xcore
