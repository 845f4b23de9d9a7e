// ============================================================================
// Fragment 1.6 — Core: Deterministic RNG (xorshift64*) + Normal Draws
// File: cpp/engine/core/rng.hpp
// ============================================================================
//
// Same seed => same stream on every platform. std::normal_distribution is
// implementation-defined, so the normal draw is our own Box-Muller.
//
// ============================================================================

#pragma once

#include <cstdint>

namespace mcda {

class Rng64 final {
public:
    explicit Rng64(std::uint64_t seed) : s_(seed ? seed : 0x9e3779b97f4a7c15ull) {}

    std::uint64_t next_u64() noexcept {
        std::uint64_t x = s_;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        s_ = x;
        return x * 2685821657736338717ull;
    }

    // Uniform in (0,1)
    double next_u01() noexcept {
        const std::uint64_t u = next_u64();
        const std::uint64_t m = (u >> 11) | 1ull; // ensure nonzero
        return static_cast<double>(m) * (1.0 / 9007199254740992.0); // 2^53
    }

    // Standard normal N(0,1).
    double next_normal() noexcept;

    // N(mu, sigma) clamped to [lo, hi].
    double next_normal(double mu, double sigma, double lo, double hi) noexcept;

private:
    std::uint64_t s_;
};

} // namespace mcda
