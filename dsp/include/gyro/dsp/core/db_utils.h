// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - dB/Linear Conversion Functions
// ==============================================================================
// No allocation, no locks, no exceptions, no I/O.
// Layer 0: NO dependencies on higher layers.
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Gyro {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence/zero gain in decibels.
/// Returned when gain is zero, negative, or NaN (e.g. a notch evaluated
/// exactly at its center, or a lowpass exactly at Nyquist).
inline constexpr double kSilenceFloorDb = -144.0;

/// Small offset added to spectral magnitudes before taking the logarithm.
inline constexpr double kSpectralFloor = 1e-10;

namespace detail {

/// Finite check on the IEEE 754 bit pattern.
/// Works even when a translation unit is compiled with -ffast-math.
[[nodiscard]] constexpr bool isFiniteBits(double x) noexcept {
    const auto bits = std::bit_cast<std::uint64_t>(x);
    return (bits & 0x7FF0000000000000ull) != 0x7FF0000000000000ull;
}

/// NaN check on the IEEE 754 bit pattern: exponent all 1s, mantissa != 0.
[[nodiscard]] constexpr bool isNaNBits(double x) noexcept {
    const auto bits = std::bit_cast<std::uint64_t>(x);
    return ((bits & 0x7FF0000000000000ull) == 0x7FF0000000000000ull) &&
           ((bits & 0x000FFFFFFFFFFFFFull) != 0);
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert decibels to linear gain.
///
/// @param dB  Decibel value
/// @return    Linear gain multiplier (>= 0)
///
/// @formula   gain = 10^(dB/20)
///
/// @note      NaN input returns 0.0
///
/// @example   dbToGain(0.0)    -> 1.0     (unity gain)
/// @example   dbToGain(-20.0)  -> 0.1     (-20 dB)
[[nodiscard]] inline double dbToGain(double dB) noexcept {
    if (detail::isNaNBits(dB)) {
        return 0.0;
    }
    return std::pow(10.0, dB / 20.0);
}

/// Convert linear gain to decibels.
///
/// @param gain  Linear gain value
/// @return      Decibel value (clamped to kSilenceFloorDb minimum)
///
/// @formula     dB = 20 * log10(gain), clamped to floor for invalid inputs
///
/// @note        Zero/negative/NaN input returns kSilenceFloorDb (-144 dB)
///
/// @example     gainToDb(1.0)   -> 0.0      (unity = 0 dB)
/// @example     gainToDb(0.5)   -> ~-6.02   (half amplitude)
/// @example     gainToDb(0.0)   -> -144.0   (silence floor)
[[nodiscard]] inline double gainToDb(double gain) noexcept {
    if (detail::isNaNBits(gain) || gain <= 0.0) {
        return kSilenceFloorDb;
    }
    const double result = 20.0 * std::log10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

/// Convert a spectral magnitude to decibels with a small additive floor.
///
/// @formula dB = 20 * log10(magnitude + 1e-10)
///
/// Unlike gainToDb() this never clamps; silence maps to -200 dB.
[[nodiscard]] inline double magnitudeToDb(double magnitude) noexcept {
    return 20.0 * std::log10(magnitude + kSpectralFloor);
}

} // namespace DSP
} // namespace Gyro
