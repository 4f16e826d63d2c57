#pragma once
// SplitMix64 PRNG (fast, stateless stepping) plus bounded sampling helpers.

#include <cstdint>
#include <limits>

namespace core {

struct SplitMix64 {
    using result_type = std::uint64_t;
    std::uint64_t state;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ULL) : state(seed) {}

    static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    inline std::uint64_t next_u64() {
        std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
    inline result_type operator()() { return next_u64(); }

    inline double next_unit_double() {
        // 53-bit mantissa
        const std::uint64_t r = next_u64();
        return (r >> 11) * (1.0 / (1ull << 53));
    }
};

// One-shot mix of a 64-bit value (per-job seed derivation).
inline std::uint64_t splitmix_hash(std::uint64_t x) {
    SplitMix64 sm(x);
    return sm.next_u64();
}

// Unbiased mapping of a 64-bit URBG output to [0, n) using Lemire's
// multiply-high method with a tiny rejection loop.
// Preconditions: n > 0.
template <class URBG>
inline std::uint64_t uniform_bounded(URBG& rng, std::uint64_t n) noexcept {
    using u128 = unsigned __int128;
    std::uint64_t x = rng();
    u128 m = (u128)x * (u128)n;
    std::uint64_t l = (std::uint64_t)m;
    if (l < n) {
        const std::uint64_t t = (-n) % n;
        while (l < t) { x = rng(); m = (u128)x * (u128)n; l = (std::uint64_t)m; }
    }
    return (std::uint64_t)(m >> 64);
}

} // namespace core
