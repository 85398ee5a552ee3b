#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

// Compile-time tag hashing (FNV-1a) for readable domain separation.
//
// Example:
//   uint32_t s = hashCombine(dateKey, tag32("DAILY"));
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

template <std::size_t N>
constexpr uint32_t tag32(const char (&str)[N]) {
    // N includes the null terminator for string literals.
    return fnv1a32(str, (N > 0) ? (N - 1) : 0);
}

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure. Each game session owns its own instance.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    // Uniform integer in [lo, hiInclusive].
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    // Uniform index into a container of `count` elements (count must be > 0).
    std::size_t index(std::size_t count) {
        return static_cast<std::size_t>(range(0, static_cast<int>(count) - 1));
    }

    template <typename T>
    const T& pick(const std::vector<T>& v) {
        return v[index(v.size())];
    }

    // Fisher-Yates, back to front.
    template <typename T>
    void shuffle(std::vector<T>& v) {
        for (std::size_t i = v.size(); i > 1; --i) {
            const std::size_t j = index(i);
            std::swap(v[i - 1], v[j]);
        }
    }
};

// A tiny integer hash for stable variation.
inline uint32_t hash32(uint32_t x) {
    // Thomas Wang-ish mix
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}
