#pragma once

#include <cstdint>
#include <string_view>

namespace townsim::core {

// SplitMix64 step; used to derive per-world seeds.
inline std::uint64_t splitmix64(std::uint64_t& x) noexcept
{
    std::uint64_t z = (x += 0x9e3779b97f4a7c15ull);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
    return z ^ (z >> 31);
}

// 64-bit finalizer (Murmur3 fmix64).
inline std::uint64_t hash64(std::uint64_t x) noexcept
{
    x ^= x >> 33; x *= 0xff51afd7ed558ccdull;
    x ^= x >> 33; x *= 0xc4ceb9fe1a85ec53ull;
    return x ^ (x >> 33);
}

// FNV-1a. Same value on every platform and build.
inline std::uint64_t hash_string(std::string_view s) noexcept
{
    std::uint64_t h = 0xcbf29ce484222325ull;
    for (unsigned char c : s)
    {
        h ^= c;
        h *= 0x100000001b3ull;
    }
    return h;
}

} // namespace townsim::core
