// ==============================================================================
// Layer 2: DSP Processor - Frequency Response Analyzer
// ==============================================================================
// Analytic magnitude/phase response of the filter chain building blocks,
// evaluated on a fixed frequency grid that depends only on the sample rate:
//
//   f_i = 1 + i * (fs / 2000),  for every i with f_i <= fs / 2
//
// so curves computed independently at the same rate always align point for
// point and can be cascaded by simple addition (dB and degrees).
//
// Transfer functions are evaluated at z^-1 = e^(-j w), w = 2 pi f / fs:
//   Biquad:  H = (b0 + b1 z^-1 + b2 z^-2) / (1 + a1 z^-1 + a2 z^-2)
//   PT(N):   H = (g / (1 - (1 - g) z^-1))^N
// ==============================================================================

#pragma once

#include <gyro/dsp/core/db_utils.h>
#include <gyro/dsp/core/filter_design.h>
#include <gyro/dsp/core/filter_result.h>
#include <gyro/dsp/core/math_constants.h>
#include <gyro/dsp/primitives/biquad.h>
#include <gyro/dsp/primitives/pt_filter.h>

#include <cmath>
#include <complex>
#include <cstddef>
#include <vector>

namespace Gyro {
namespace DSP {

/// @brief Magnitude (dB) and phase (degrees) over the response grid.
struct ResponseCurve {
    std::vector<double> frequencies;   ///< Hz, ascending
    std::vector<double> magnitudesDb;  ///< 20 log10 |H|, floored at kSilenceFloorDb
    std::vector<double> phasesDeg;     ///< arg(H) in degrees, (-180, 180] per stage

    [[nodiscard]] size_t size() const noexcept { return frequencies.size(); }
    [[nodiscard]] bool empty() const noexcept { return frequencies.empty(); }
};

namespace FrequencyResponse {

/// Grid step is sampleRate / kGridDivisions
inline constexpr double kGridDivisions = 2000.0;

/// First grid frequency in Hz
inline constexpr double kGridStartHz = 1.0;

/// @brief Response grid for a sample rate (empty for invalid rates).
[[nodiscard]] inline std::vector<double> grid(double sampleRate) {
    std::vector<double> frequencies;
    if (!detail::isFiniteBits(sampleRate) || sampleRate <= 0.0) {
        return frequencies;
    }
    const double step = sampleRate / kGridDivisions;
    const double nyquist = sampleRate * 0.5;
    frequencies.reserve(static_cast<size_t>(kGridDivisions / 2.0) + 1);
    for (size_t i = 0;; ++i) {
        // Index times step rather than accumulation: no drift at the top end
        const double f = kGridStartHz + static_cast<double>(i) * step;
        if (f > nyquist) break;
        frequencies.push_back(f);
    }
    return frequencies;
}

/// @brief Complex response of a biquad at one frequency.
[[nodiscard]] inline std::complex<double> evaluate(const BiquadCoefficients& coeffs,
                                                   double frequency, double sampleRate) noexcept {
    const double omega = kTwoPi * frequency / sampleRate;
    const std::complex<double> z1 = std::polar(1.0, -omega);
    const std::complex<double> z2 = z1 * z1;
    const std::complex<double> numerator = coeffs.b0 + coeffs.b1 * z1 + coeffs.b2 * z2;
    const std::complex<double> denominator = 1.0 + coeffs.a1 * z1 + coeffs.a2 * z2;
    return numerator / denominator;
}

/// @brief Complex response of an N-section PT cascade with the given gain.
[[nodiscard]] inline std::complex<double> evaluatePt(double gain, size_t order,
                                                     double frequency, double sampleRate) noexcept {
    const double omega = kTwoPi * frequency / sampleRate;
    const std::complex<double> z1 = std::polar(1.0, -omega);
    const std::complex<double> section = gain / (1.0 - (1.0 - gain) * z1);
    std::complex<double> h{1.0, 0.0};
    for (size_t i = 0; i < order; ++i) {
        h *= section;
    }
    return h;
}

/// @brief Complex response of a PT filter at one frequency.
[[nodiscard]] inline std::complex<double> evaluate(const PtFilter& filter,
                                                   double frequency, double sampleRate) noexcept {
    return evaluatePt(filter.gain(), filter.order(), frequency, sampleRate);
}

/// @brief Biquad magnitude in dB at one frequency.
[[nodiscard]] inline double magnitudeDbAt(const BiquadCoefficients& coeffs,
                                          double frequency, double sampleRate) noexcept {
    return gainToDb(std::abs(evaluate(coeffs, frequency, sampleRate)));
}

/// @brief PT filter magnitude in dB at one frequency.
[[nodiscard]] inline double magnitudeDbAt(const PtFilter& filter,
                                          double frequency, double sampleRate) noexcept {
    return gainToDb(std::abs(evaluate(filter, frequency, sampleRate)));
}

/// @brief Fill a curve by evaluating `transfer(f)` on the grid.
template <typename Transfer>
[[nodiscard]] FilterResult<ResponseCurve> sampleGrid(double sampleRate, Transfer&& transfer) {
    ResponseCurve curve;
    curve.frequencies = grid(sampleRate);
    if (curve.empty()) {
        return FilterResult<ResponseCurve>::failure(FilterError::InvalidParameter);
    }
    curve.magnitudesDb.reserve(curve.size());
    curve.phasesDeg.reserve(curve.size());
    for (const double f : curve.frequencies) {
        const std::complex<double> h = transfer(f);
        curve.magnitudesDb.push_back(gainToDb(std::abs(h)));
        curve.phasesDeg.push_back(std::atan2(h.imag(), h.real()) * kRadToDeg);
    }
    return FilterResult<ResponseCurve>::success(std::move(curve));
}

/// @brief Response of explicit biquad coefficients.
[[nodiscard]] inline FilterResult<ResponseCurve> compute(const BiquadCoefficients& coeffs,
                                                         double sampleRate) {
    return sampleGrid(sampleRate, [&](double f) { return evaluate(coeffs, f, sampleRate); });
}

/// @brief Response of a designed PT filter.
[[nodiscard]] inline FilterResult<ResponseCurve> compute(const PtFilter& filter, double sampleRate) {
    return sampleGrid(sampleRate, [&](double f) { return evaluate(filter, f, sampleRate); });
}

/// @brief Design a filter of the given type and return its response.
/// @return Curve, or the design error (InvalidParameter, NumericInstability)
[[nodiscard]] inline FilterResult<ResponseCurve> compute(FilterType type, double cutoff,
                                                         double sampleRate, double Q) {
    if (FilterDesign::isBiquadType(type)) {
        const auto coeffs = BiquadCoefficients::design(type, cutoff, sampleRate, Q);
        if (!coeffs) {
            return FilterResult<ResponseCurve>::failure(coeffs.error);
        }
        return compute(coeffs.value, sampleRate);
    }
    const auto filter = PtFilter::create(type, cutoff, sampleRate);
    if (!filter) {
        return FilterResult<ResponseCurve>::failure(filter.error);
    }
    return compute(filter.value, sampleRate);
}

/// @brief Identity curve: 0 dB and 0 degrees on the whole grid.
[[nodiscard]] inline FilterResult<ResponseCurve> flat(double sampleRate) {
    return sampleGrid(sampleRate, [](double) { return std::complex<double>{1.0, 0.0}; });
}

/// @brief Response of two filters in series.
///
/// Magnitudes (dB) and phases (degrees) add point-wise. Phases are not
/// re-wrapped.
///
/// @return Combined curve, or InvalidParameter if the grids differ
[[nodiscard]] inline FilterResult<ResponseCurve> cascade(const ResponseCurve& a, const ResponseCurve& b) {
    if (a.frequencies != b.frequencies ||
        a.magnitudesDb.size() != a.size() || b.magnitudesDb.size() != b.size() ||
        a.phasesDeg.size() != a.size() || b.phasesDeg.size() != b.size()) {
        return FilterResult<ResponseCurve>::failure(FilterError::InvalidParameter);
    }
    ResponseCurve combined;
    combined.frequencies = a.frequencies;
    combined.magnitudesDb.resize(a.size());
    combined.phasesDeg.resize(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        combined.magnitudesDb[i] = a.magnitudesDb[i] + b.magnitudesDb[i];
        combined.phasesDeg[i] = a.phasesDeg[i] + b.phasesDeg[i];
    }
    return FilterResult<ResponseCurve>::success(std::move(combined));
}

} // namespace FrequencyResponse

} // namespace DSP
} // namespace Gyro
