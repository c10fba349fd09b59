#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure. Decks are shuffled with it so a seed
// reproduces the exact same game.
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

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }
};

// A tiny integer hash for stable seed derivation.
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

// Fisher-Yates shuffle driven by the deterministic RNG.
template <typename T>
void shuffleInPlace(std::vector<T>& v, RNG& rng) {
    if (v.size() < 2) return;
    for (size_t i = v.size() - 1; i > 0; --i) {
        const size_t j = static_cast<size_t>(rng.range(0, static_cast<int>(i)));
        if (i != j) std::swap(v[i], v[j]);
    }
}
