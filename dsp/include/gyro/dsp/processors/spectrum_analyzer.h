// ==============================================================================
// Layer 2: DSP Processor - Spectrum Analyzer
// ==============================================================================
// One-shot magnitude spectrum of a finite buffer plus local-maximum peak
// detection inside a frequency band (the input of the dynamic notch stage).
//
// For a buffer of n samples the spectrum has n/2 bins:
//   frequency[k] = k * fs / n
//   magnitude[k] = 20 log10(|sum_i x[i] e^(-2 pi j k i / n)| / n + 1e-10)
//
// Power-of-two lengths inside the FFT size range go through the pffft backed
// FFT primitive; every other length uses the direct O(n^2) DFT.
// ==============================================================================

#pragma once

#include <gyro/dsp/core/db_utils.h>
#include <gyro/dsp/core/filter_result.h>
#include <gyro/dsp/core/logging.h>
#include <gyro/dsp/core/math_constants.h>
#include <gyro/dsp/primitives/fft.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <utility>
#include <vector>

namespace Gyro {
namespace DSP {

// =============================================================================
// Types
// =============================================================================

/// @brief Inclusive frequency range used to restrict peak search.
struct FrequencyBand {
    double minHz = 100.0;
    double maxHz = 600.0;

    [[nodiscard]] bool isValid() const noexcept {
        return detail::isFiniteBits(minHz) && detail::isFiniteBits(maxHz) && minHz <= maxHz;
    }

    [[nodiscard]] bool contains(double frequency) const noexcept {
        return frequency >= minHz && frequency <= maxHz;
    }
};

/// @brief One detected spectral peak.
struct SpectralPeak {
    double frequency = 0.0;    ///< Hz
    double magnitudeDb = 0.0;  ///< Bin magnitude in dB
};

/// @brief Magnitude spectrum, DC up to (excluding) Nyquist.
struct SpectrumResult {
    std::vector<double> frequencies;
    std::vector<double> magnitudesDb;
    std::vector<SpectralPeak> peaks;   ///< Strongest in-band peaks (band-limited analyze() only)

    [[nodiscard]] size_t size() const noexcept { return frequencies.size(); }
};

// =============================================================================
// SpectrumAnalyzer
// =============================================================================

namespace SpectrumAnalyzer {

/// @brief Direct DFT magnitude (unnormalised) of bins 0 .. n/2-1.
[[nodiscard]] inline std::vector<double> dftMagnitudes(const std::vector<double>& signal) {
    const size_t n = signal.size();
    const size_t numBins = n / 2;
    std::vector<double> magnitudes(numBins, 0.0);
    for (size_t k = 0; k < numBins; ++k) {
        double real = 0.0;
        double imag = 0.0;
        for (size_t i = 0; i < n; ++i) {
            // (k * i) mod n keeps the angle small for large buffers
            const double angle = -kTwoPi * static_cast<double>((k * i) % n) / static_cast<double>(n);
            real += signal[i] * std::cos(angle);
            imag += signal[i] * std::sin(angle);
        }
        magnitudes[k] = std::sqrt(real * real + imag * imag);
    }
    return magnitudes;
}

/// @brief FFT magnitude (unnormalised) of bins 0 .. n/2-1.
/// @return Empty if the length is not a supported FFT size
[[nodiscard]] inline std::vector<double> fftMagnitudes(const std::vector<double>& signal) {
    FFT fft;
    fft.prepare(signal.size());
    if (!fft.isPrepared()) {
        return {};
    }
    std::vector<std::complex<double>> bins(fft.numBins());
    fft.forward(signal.data(), bins.data());

    std::vector<double> magnitudes(signal.size() / 2);
    for (size_t k = 0; k < magnitudes.size(); ++k) {
        magnitudes[k] = std::abs(bins[k]);
    }
    return magnitudes;
}

/// @brief Magnitude spectrum in dB.
/// @return n/2 bins, InvalidParameter for an empty buffer or invalid rate,
///         NumericInstability if the buffer holds NaN or infinity or a bin
///         magnitude overflows
[[nodiscard]] inline FilterResult<SpectrumResult> analyze(const std::vector<double>& signal,
                                                          double sampleRate) {
    using Result = FilterResult<SpectrumResult>;
    if (signal.empty() || !detail::isFiniteBits(sampleRate) || sampleRate <= 0.0) {
        return Result::failure(FilterError::InvalidParameter);
    }
    if (!std::all_of(signal.begin(), signal.end(), [](double x) { return detail::isFiniteBits(x); })) {
        logger()->warn("spectrum: input buffer contains non-finite samples");
        return Result::failure(FilterError::NumericInstability);
    }

    const size_t n = signal.size();
    std::vector<double> magnitudes;
    if (isSupportedFFTSize(n)) {
        magnitudes = fftMagnitudes(signal);
    }
    if (magnitudes.size() != n / 2) {
        magnitudes = dftMagnitudes(signal);
    }
    if (!std::all_of(magnitudes.begin(), magnitudes.end(), [](double m) { return detail::isFiniteBits(m); })) {
        logger()->warn("spectrum: bin magnitude overflow ({} samples)", n);
        return Result::failure(FilterError::NumericInstability);
    }

    SpectrumResult result;
    result.frequencies.resize(n / 2);
    result.magnitudesDb.resize(n / 2);
    const double scale = 1.0 / static_cast<double>(n);
    for (size_t k = 0; k < n / 2; ++k) {
        result.frequencies[k] = static_cast<double>(k) * sampleRate / static_cast<double>(n);
        result.magnitudesDb[k] = magnitudeToDb(magnitudes[k] * scale);
    }
    return Result::success(std::move(result));
}

/// @brief Strongest local maxima inside a band.
///
/// Index i (1 <= i <= n-2) is a peak when its magnitude is strictly greater
/// than both neighbours and its frequency lies in the band. Peaks are ordered
/// by descending magnitude (ties keep ascending frequency order) and the
/// first `count` are returned.
///
/// @return Peaks, or InvalidParameter for mismatched sizes or an invalid band
[[nodiscard]] inline FilterResult<std::vector<SpectralPeak>> detectPeaks(
    const std::vector<double>& frequencies,
    const std::vector<double>& magnitudes,
    const FrequencyBand& band,
    size_t count
) {
    using Result = FilterResult<std::vector<SpectralPeak>>;
    if (frequencies.size() != magnitudes.size() || !band.isValid()) {
        return Result::failure(FilterError::InvalidParameter);
    }

    std::vector<SpectralPeak> peaks;
    const size_t n = magnitudes.size();
    for (size_t i = 1; i + 1 < n; ++i) {
        if (magnitudes[i] > magnitudes[i - 1] && magnitudes[i] > magnitudes[i + 1] &&
            band.contains(frequencies[i])) {
            peaks.push_back({frequencies[i], magnitudes[i]});
        }
    }

    std::stable_sort(peaks.begin(), peaks.end(), [](const SpectralPeak& a, const SpectralPeak& b) {
        return a.magnitudeDb > b.magnitudeDb;
    });
    if (peaks.size() > count) {
        peaks.resize(count);
    }
    return Result::success(std::move(peaks));
}

/// @brief Peak search on an analyzed spectrum.
[[nodiscard]] inline FilterResult<std::vector<SpectralPeak>> detectPeaks(
    const SpectrumResult& spectrum,
    const FrequencyBand& band,
    size_t count
) {
    return detectPeaks(spectrum.frequencies, spectrum.magnitudesDb, band, count);
}

/// @brief Spectrum with its strongest `count` peaks inside `band` filled in.
[[nodiscard]] inline FilterResult<SpectrumResult> analyze(const std::vector<double>& signal,
                                                          double sampleRate,
                                                          const FrequencyBand& band,
                                                          size_t count) {
    auto spectrum = analyze(signal, sampleRate);
    if (!spectrum) {
        return spectrum;
    }
    auto peaks = detectPeaks(spectrum.value, band, count);
    if (!peaks) {
        return FilterResult<SpectrumResult>::failure(peaks.error);
    }
    spectrum.value.peaks = std::move(peaks.value);
    return spectrum;
}

} // namespace SpectrumAnalyzer

} // namespace DSP
} // namespace Gyro
