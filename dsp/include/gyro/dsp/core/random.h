// ==============================================================================
// Layer 0: Core Utilities
// random.h - Seedable Pseudo-Random Number Generation
// ==============================================================================
// No allocation, no locks, no exceptions, no I/O.
// constexpr where possible, value semantics.
// Layer 0: NO dependencies on higher layers.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Gyro {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// Every noise source in the engine draws from an explicitly passed
/// generator, so time-domain results are reproducible for a given seed.
/// Period 2^32-1.
///
/// Algorithm: Marsaglia's xorshift with shifts 13, 17, 5
///
/// @note NOT cryptographically secure
///
/// @example Basic usage:
///     Xorshift32 rng(12345);
///     double noise = rng.nextBipolar();  // Returns [-1.0, 1.0]
///
class Xorshift32 {
public:
    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer.
    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate next value in bipolar range.
    /// @return Random double in range [-1.0, 1.0]
    [[nodiscard]] constexpr double nextBipolar() noexcept {
        return static_cast<double>(next()) * kToUnit * 2.0 - 1.0;
    }

    /// Generate next value in unipolar range.
    /// @return Random double in range [0.0, 1.0]
    [[nodiscard]] constexpr double nextUnipolar() noexcept {
        return static_cast<double>(next()) * kToUnit;
    }

    /// Reseed the generator.
    /// @param seedValue New seed (0 is automatically replaced with default)
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// Default seed used when 0 is passed (0 would make the generator output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1.0 / (2^32 - 1)
    static constexpr double kToUnit = 1.0 / 4294967295.0;

    uint32_t state_;
};

} // namespace DSP
} // namespace Gyro
