// ==============================================================================
// Layer 1: DSP Primitive - PT1/PT2/PT3 Cascaded One-Pole Lowpass
// ==============================================================================
// Exponential smoothing lowpass, cascaded 1-3 times with a single shared gain.
//
// Each section moves its state towards its input by a fixed fraction:
//   state[i] += (in[i] - state[i]) * gain
// where in[0] is the filter input and in[i] = state[i-1]. The output is the
// last section's state.
//
// The gain is computed from a corrected cutoff so that the -3 dB point of the
// whole cascade stays at the nominal cutoff:
//   gain = (fc * k) / (fc * k + fs / 2pi),  k = 1, 1.553773974, 1.961459177
//
// Transfer function of one section: H(z) = g / (1 - (1 - g) z^-1)
// ==============================================================================

#pragma once

#include <gyro/dsp/core/filter_design.h>
#include <gyro/dsp/core/filter_result.h>
#include <gyro/dsp/core/logging.h>

#include <array>
#include <cstddef>

namespace Gyro {
namespace DSP {

/// @brief One-pole lowpass cascade of order 1-3 (PT1, PT2, PT3).
///
/// @par Usage
/// @code
/// auto pt2 = PtFilter::create(100.0, 4000.0, 2);
/// if (pt2) {
///     for (auto& s : samples) s = pt2.value.process(s);
/// }
/// @endcode
class PtFilter {
public:
    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Default: order 1 with zero gain (holds its state). Use create().
    PtFilter() noexcept = default;

    /// @brief Build a PT filter with cleared state.
    /// @param cutoff Nominal -3 dB frequency in Hz (> 0, may exceed Nyquist;
    ///        the gain saturates at 1)
    /// @param sampleRate Sample rate in Hz (> 0)
    /// @param order Number of cascaded sections, 1-3
    /// @return Filter, or InvalidParameter
    [[nodiscard]] static FilterResult<PtFilter> create(double cutoff, double sampleRate, size_t order) {
        if (const auto error = FilterDesign::validatePt(cutoff, sampleRate, order);
            error != FilterError::None) {
            logger()->debug("PT{} design rejected: cutoff {} Hz, sample rate {} Hz",
                            order, cutoff, sampleRate);
            return FilterResult<PtFilter>::failure(error);
        }
        PtFilter filter;
        filter.order_ = order;
        filter.gain_ = FilterDesign::ptGain(cutoff, sampleRate, order);
        return FilterResult<PtFilter>::success(filter);
    }

    /// @brief Build from a PT FilterType (PT1, PT2, PT3).
    [[nodiscard]] static FilterResult<PtFilter> create(FilterType type, double cutoff, double sampleRate) {
        const size_t order = FilterDesign::ptOrder(type);
        if (order == 0) {
            return FilterResult<PtFilter>::failure(FilterError::InvalidParameter);
        }
        return create(cutoff, sampleRate, order);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Process a single sample through all sections
    [[nodiscard]] double process(double input) noexcept {
        double previous = input;
        for (size_t i = 0; i < order_; ++i) {
            state_[i] += (previous - state_[i]) * gain_;
            previous = state_[i];
        }
        return previous;
    }

    /// Process buffer of samples in-place
    void processBlock(double* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// Clear all section states
    void reset() noexcept {
        state_.fill(0.0);
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] double gain() const noexcept { return gain_; }

    [[nodiscard]] size_t order() const noexcept { return order_; }

private:
    size_t order_ = 1;
    double gain_ = 0.0;
    std::array<double, kMaxPtOrder> state_{};
};

} // namespace DSP
} // namespace Gyro
