// ==============================================================================
// Layer 1: DSP Primitive - Biquad Filter
// ==============================================================================
// Direct Form I biquad section with validated coefficient design for the
// lowpass and notch shapes used in the gyro filter chain.
//
// Coefficients are designed once, validated (finite, Jury-stable) and then
// applied per sample without any further checks.
//
// Formulas: Robert Bristow-Johnson's Audio EQ Cookbook
// ==============================================================================

#pragma once

#include <gyro/dsp/core/db_utils.h>
#include <gyro/dsp/core/filter_design.h>
#include <gyro/dsp/core/filter_result.h>
#include <gyro/dsp/core/logging.h>
#include <gyro/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>

namespace Gyro {
namespace DSP {

// =============================================================================
// Biquad Coefficients
// =============================================================================

/// @brief Normalized biquad filter coefficients (a0 = 1 implied).
struct BiquadCoefficients {
    double b0 = 1.0;  ///< Feedforward coefficient 0
    double b1 = 0.0;  ///< Feedforward coefficient 1
    double b2 = 0.0;  ///< Feedforward coefficient 2
    double a1 = 0.0;  ///< Feedback coefficient 1 (a0 = 1 implied)
    double a2 = 0.0;  ///< Feedback coefficient 2

    /// Design coefficients for a lowpass or notch section
    /// @param type Response shape
    /// @param cutoff Cutoff (lowpass) or center (notch) frequency in Hz, 0 < cutoff < fs/2
    /// @param sampleRate Sample rate in Hz, > 0
    /// @param Q Quality factor, > 0
    /// @return Coefficients, InvalidParameter for out-of-range arguments,
    ///         NumericInstability for non-finite or unstable results
    [[nodiscard]] static FilterResult<BiquadCoefficients> design(
        BiquadResponse type,
        double cutoff,
        double sampleRate,
        double Q
    );

    /// Design coefficients for a biquad FilterType (Butterworth, Bessel,
    /// Damped, LowpassGeneric, Notch). PT types are rejected with
    /// InvalidParameter.
    [[nodiscard]] static FilterResult<BiquadCoefficients> design(
        FilterType type,
        double cutoff,
        double sampleRate,
        double Q
    );

    /// Check if coefficients represent a stable filter
    /// @return true if both poles lie inside the unit circle
    [[nodiscard]] bool isStable() const noexcept {
        // Jury stability criterion for second-order IIR filter:
        // 1. |a2| < 1
        // 2. |a1| < 1 + a2
        return std::abs(a2) < 1.0 && std::abs(a1) < 1.0 + a2;
    }

    /// Check that every coefficient is a finite number
    [[nodiscard]] bool isFinite() const noexcept {
        return detail::isFiniteBits(b0) && detail::isFiniteBits(b1) &&
               detail::isFiniteBits(b2) && detail::isFiniteBits(a1) &&
               detail::isFiniteBits(a2);
    }

    [[nodiscard]] bool operator==(const BiquadCoefficients&) const noexcept = default;
};

// =============================================================================
// Biquad Filter Class
// =============================================================================

/// @brief Direct Form I biquad filter.
///
/// Processes samples using the difference equation:
/// @code
/// y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
/// @endcode
///
/// The filter state (two prior inputs, two prior outputs) belongs to this
/// instance alone.
class Biquad {
public:
    // =========================================================================
    // Lifecycle
    // =========================================================================

    Biquad() noexcept = default;

    /// Construct with designed coefficients
    explicit Biquad(const BiquadCoefficients& coeffs) noexcept
        : coeffs_(coeffs) {}

    /// Design coefficients and construct a filter with cleared state
    [[nodiscard]] static FilterResult<Biquad> create(
        FilterType type,
        double cutoff,
        double sampleRate,
        double Q
    ) {
        const auto coeffs = BiquadCoefficients::design(type, cutoff, sampleRate, Q);
        if (!coeffs) {
            return FilterResult<Biquad>::failure(coeffs.error);
        }
        return FilterResult<Biquad>::success(Biquad(coeffs.value));
    }

    /// Get coefficients
    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept {
        return coeffs_;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Process single sample
    /// @param input Input sample
    /// @return Filtered output sample
    [[nodiscard]] double process(double input) noexcept {
        const double output = coeffs_.b0 * input + coeffs_.b1 * x1_ + coeffs_.b2 * x2_
                            - coeffs_.a1 * y1_ - coeffs_.a2 * y2_;
        x2_ = x1_;
        x1_ = input;
        y2_ = y1_;
        y1_ = output;
        return output;
    }

    /// Process buffer of samples in-place
    void processBlock(double* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    // =========================================================================
    // State Management
    // =========================================================================

    /// Clear the whole filter state
    void reset() noexcept {
        x1_ = x2_ = 0.0;
        y1_ = y2_ = 0.0;
    }

    /// Most recent output (for analysis)
    [[nodiscard]] double lastOutput() const noexcept { return y1_; }

private:
    BiquadCoefficients coeffs_;
    double x1_ = 0.0;
    double x2_ = 0.0;
    double y1_ = 0.0;
    double y2_ = 0.0;
};

// =============================================================================
// Coefficient Calculation Implementation
// =============================================================================

inline FilterResult<BiquadCoefficients> BiquadCoefficients::design(
    BiquadResponse type,
    double cutoff,
    double sampleRate,
    double Q
) {
    if (const auto error = FilterDesign::validateBiquad(cutoff, sampleRate, Q);
        error != FilterError::None) {
        logger()->debug("biquad design rejected: cutoff {} Hz, sample rate {} Hz, Q {}",
                        cutoff, sampleRate, Q);
        return FilterResult<BiquadCoefficients>::failure(error);
    }

    const double omega = kTwoPi * cutoff / sampleRate;
    const double sinOmega = std::sin(omega);
    const double cosOmega = std::cos(omega);
    const double alpha = sinOmega / (2.0 * Q);

    double b0 = 0.0, b1 = 0.0, b2 = 0.0;
    double a1 = 0.0, a2 = 0.0;

    switch (type) {
        case BiquadResponse::Lowpass: {
            b1 = 1.0 - cosOmega;
            b0 = b1 / 2.0;
            b2 = b0;
            a1 = -2.0 * cosOmega;
            a2 = 1.0 - alpha;
            break;
        }
        case BiquadResponse::Notch: {
            b0 = 1.0;
            b1 = -2.0 * cosOmega;
            b2 = 1.0;
            a1 = b1;
            a2 = 1.0 - alpha;
            break;
        }
    }

    // Normalize coefficients (a0 = 1)
    const double a0 = 1.0 + alpha;
    BiquadCoefficients coeffs;
    coeffs.b0 = b0 / a0;
    coeffs.b1 = b1 / a0;
    coeffs.b2 = b2 / a0;
    coeffs.a1 = a1 / a0;
    coeffs.a2 = a2 / a0;

    if (!coeffs.isFinite() || !coeffs.isStable()) {
        logger()->debug("biquad design unstable: cutoff {} Hz, sample rate {} Hz, Q {}",
                        cutoff, sampleRate, Q);
        return FilterResult<BiquadCoefficients>::failure(FilterError::NumericInstability);
    }
    return FilterResult<BiquadCoefficients>::success(coeffs);
}

inline FilterResult<BiquadCoefficients> BiquadCoefficients::design(
    FilterType type,
    double cutoff,
    double sampleRate,
    double Q
) {
    if (!FilterDesign::isBiquadType(type)) {
        return FilterResult<BiquadCoefficients>::failure(FilterError::InvalidParameter);
    }
    return design(FilterDesign::biquadResponse(type), cutoff, sampleRate,
                  FilterDesign::effectiveQ(type, Q));
}

} // namespace DSP
} // namespace Gyro
