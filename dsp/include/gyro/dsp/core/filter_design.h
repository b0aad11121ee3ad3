// ==============================================================================
// Layer 0: Core Utility - Filter Design
// ==============================================================================
// Filter type catalogue, design constants and parameter helpers shared by the
// biquad and PT primitives, the response analyzer and the pipeline.
//
// Design constants follow the flight-controller gyro filter chain:
// - Low-pass flavours are a single biquad with a fixed Q
//   (Butterworth, 2-pole Bessel, Damped) or a caller supplied Q (generic)
// - The 4-pole Bessel decimation filter is two biquads with scaled cutoffs
// - PT1/PT2/PT3 are 1-3 cascaded one-pole smoothers with cutoff correction
// ==============================================================================

#pragma once

#include <gyro/dsp/core/db_utils.h>
#include <gyro/dsp/core/filter_result.h>
#include <gyro/dsp/core/logging.h>
#include <gyro/dsp/core/math_constants.h>

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Gyro {
namespace DSP {

// =============================================================================
// Filter Type Enumeration
// =============================================================================

/// @brief Filter kinds selectable for a pipeline stage or response curve.
enum class FilterType : uint8_t {
    PT1,             ///< One-pole smoother (6 dB/oct)
    PT2,             ///< Two cascaded one-pole smoothers (12 dB/oct)
    PT3,             ///< Three cascaded one-pole smoothers (18 dB/oct)
    Butterworth,     ///< Biquad lowpass, Q = 0.707106781
    Bessel,          ///< Biquad lowpass, Q = 0.577350269
    Damped,          ///< Biquad lowpass, Q = 0.5
    LowpassGeneric,  ///< Biquad lowpass with caller supplied Q
    Notch            ///< Biquad band-reject with caller supplied Q
};

/// @brief Biquad response shapes produced by the coefficient designer.
enum class BiquadResponse : uint8_t {
    Lowpass,  ///< 12 dB/oct lowpass, unity DC gain
    Notch     ///< Band-reject, zeros on the unit circle at the center frequency
};

// =============================================================================
// Constants
// =============================================================================

/// Butterworth Q (maximally flat passband)
inline constexpr double kButterworthQ = 0.707106781;

/// 2-pole Bessel Q (maximally flat group delay)
inline constexpr double kBesselQ = 0.577350269;

/// Critically damped Q
inline constexpr double kDampedQ = 0.5;

/// 4-pole Bessel decimation filter, first stage
inline constexpr double kBessel4StageACutoffScale = 1.603357516;
inline constexpr double kBessel4StageAQ = 0.805538282;

/// 4-pole Bessel decimation filter, second stage
inline constexpr double kBessel4StageBCutoffScale = 1.430171560;
inline constexpr double kBessel4StageBQ = 0.521934582;

/// Highest supported PT cascade order
inline constexpr size_t kMaxPtOrder = 3;

/// Cutoff correction per PT order, keeps -3 dB at the nominal cutoff
inline constexpr std::array<double, kMaxPtOrder> kPtCutoffCorrection = {
    1.0,
    1.553773974,
    1.961459177
};

// =============================================================================
// Stage Descriptor
// =============================================================================

/// @brief One stage of a filter chain: what to build and with which parameters.
struct StageConfig {
    FilterType type = FilterType::PT1;
    double cutoff = 100.0;   ///< Cutoff (lowpass) or center (notch) in Hz
    double q = kButterworthQ;///< Used by LowpassGeneric and Notch only
};

// =============================================================================
// FilterDesign Namespace
// =============================================================================

namespace FilterDesign {

/// @brief Number of one-pole sections of a PT type, 0 for biquad types.
[[nodiscard]] constexpr size_t ptOrder(FilterType type) noexcept {
    switch (type) {
        case FilterType::PT1: return 1;
        case FilterType::PT2: return 2;
        case FilterType::PT3: return 3;
        case FilterType::Butterworth:
        case FilterType::Bessel:
        case FilterType::Damped:
        case FilterType::LowpassGeneric:
        case FilterType::Notch:
            return 0;
    }
    return 0;
}

/// @brief True if the type is realised as a single biquad section.
[[nodiscard]] constexpr bool isBiquadType(FilterType type) noexcept {
    return ptOrder(type) == 0;
}

/// @brief Biquad response shape of a biquad type (Notch or Lowpass).
[[nodiscard]] constexpr BiquadResponse biquadResponse(FilterType type) noexcept {
    return (type == FilterType::Notch) ? BiquadResponse::Notch : BiquadResponse::Lowpass;
}

/// @brief Effective Q of a stage.
///
/// The fixed low-pass flavours ignore the requested Q; LowpassGeneric and
/// Notch use it as given. PT types have no Q and return the request unchanged.
[[nodiscard]] constexpr double effectiveQ(FilterType type, double requestedQ) noexcept {
    switch (type) {
        case FilterType::Butterworth: return kButterworthQ;
        case FilterType::Bessel:      return kBesselQ;
        case FilterType::Damped:      return kDampedQ;
        case FilterType::PT1:
        case FilterType::PT2:
        case FilterType::PT3:
        case FilterType::LowpassGeneric:
        case FilterType::Notch:
            return requestedQ;
    }
    return requestedQ;
}

/// @brief Cutoff correction constant k(order) for a PT cascade.
/// @return k for order 1-3, 0 for unsupported orders
[[nodiscard]] constexpr double ptCutoffCorrection(size_t order) noexcept {
    if (order == 0 || order > kMaxPtOrder) return 0.0;
    return kPtCutoffCorrection[order - 1];
}

/// @brief Smoothing gain of a PT cascade section.
///
/// @formula gain = (fc * k) / (fc * k + fs / 2pi), clamped to at most 1
///
/// Monotonically non-decreasing in cutoff. No validation; see PtFilter::create().
[[nodiscard]] inline double ptGain(double cutoff, double sampleRate, size_t order) noexcept {
    const double corrected = cutoff * ptCutoffCorrection(order);
    const double gamma = sampleRate / kTwoPi;
    const double gain = corrected / (corrected + gamma);
    return (gain > 1.0) ? 1.0 : gain;
}

/// @brief Validate biquad design parameters.
/// @return None, or InvalidParameter when sampleRate <= 0, cutoff outside
///         (0, sampleRate/2), Q <= 0 or any value non-finite
[[nodiscard]] inline FilterError validateBiquad(double cutoff, double sampleRate, double q) noexcept {
    if (!detail::isFiniteBits(cutoff) || !detail::isFiniteBits(sampleRate) ||
        !detail::isFiniteBits(q)) {
        return FilterError::InvalidParameter;
    }
    if (sampleRate <= 0.0 || cutoff <= 0.0 || cutoff >= sampleRate * 0.5 || q <= 0.0) {
        return FilterError::InvalidParameter;
    }
    return FilterError::None;
}

/// @brief Validate PT cascade parameters (cutoff is not limited by Nyquist).
[[nodiscard]] inline FilterError validatePt(double cutoff, double sampleRate, size_t order) noexcept {
    if (!detail::isFiniteBits(cutoff) || !detail::isFiniteBits(sampleRate)) {
        return FilterError::InvalidParameter;
    }
    if (sampleRate <= 0.0 || cutoff <= 0.0 || order == 0 || order > kMaxPtOrder) {
        return FilterError::InvalidParameter;
    }
    return FilterError::None;
}

/// @brief Notch Q from center frequency and cutoff (lower -3 dB edge).
///
/// @formula Q = center * cutoff / (center^2 - cutoff^2)
///
/// @return DivisionByZero when center == cutoff, InvalidParameter for
///         non-finite inputs or a non-positive Q
///
/// @example notchQ(150, 5) -> 750 / 22475 ~= 0.033371
[[nodiscard]] inline FilterResult<double> notchQ(double center, double cutoff) {
    if (!detail::isFiniteBits(center) || !detail::isFiniteBits(cutoff)) {
        return FilterResult<double>::failure(FilterError::InvalidParameter);
    }
    const double denominator = center * center - cutoff * cutoff;
    if (denominator == 0.0) {
        logger()->debug("notchQ: center {} Hz equals cutoff {} Hz", center, cutoff);
        return FilterResult<double>::failure(FilterError::DivisionByZero);
    }
    const double q = center * cutoff / denominator;
    if (!(q > 0.0) || !detail::isFiniteBits(q)) {
        logger()->debug("notchQ: center {} Hz, cutoff {} Hz gives Q {}", center, cutoff, q);
        return FilterResult<double>::failure(FilterError::InvalidParameter);
    }
    return FilterResult<double>::success(q);
}

/// @brief RPM notch center frequency from motor speed and blade ratio.
///
/// @formula f = rpm * ratio / 60
[[nodiscard]] inline FilterResult<double> rpmNotchFrequency(double rpm, double ratio) {
    if (!detail::isFiniteBits(rpm) || !detail::isFiniteBits(ratio) ||
        rpm < 0.0 || ratio <= 0.0) {
        return FilterResult<double>::failure(FilterError::InvalidParameter);
    }
    return FilterResult<double>::success(rpm * ratio / 60.0);
}

/// @brief The two biquad stages of the 4-pole Bessel decimation filter.
///
/// Both stages are LowpassGeneric with the fixed scaled cutoffs and Qs.
/// Stage A: cutoff * 1.603357516, Q 0.805538282.
/// Stage B: cutoff * 1.430171560, Q 0.521934582.
[[nodiscard]] constexpr std::array<StageConfig, 2> besselDecimationStages(double cutoff) noexcept {
    return {
        StageConfig{FilterType::LowpassGeneric, cutoff * kBessel4StageACutoffScale, kBessel4StageAQ},
        StageConfig{FilterType::LowpassGeneric, cutoff * kBessel4StageBCutoffScale, kBessel4StageBQ}
    };
}

} // namespace FilterDesign

} // namespace DSP
} // namespace Gyro
