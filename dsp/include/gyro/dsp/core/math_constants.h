// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for filter design and analysis.
// All components should import these constants instead of defining locally.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units. Double precision is used throughout the engine so
// that cascaded responses compose exactly in the log domain.
// ==============================================================================

#pragma once

namespace Gyro {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for DSP calculations
inline constexpr double kPi = 3.14159265358979323846;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr double kTwoPi = 2.0 * kPi;

/// Radians to degrees conversion factor
inline constexpr double kRadToDeg = 180.0 / kPi;

} // namespace DSP
} // namespace Gyro
