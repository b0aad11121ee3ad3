// ==============================================================================
// Layer 1: DSP Primitive - Test Signal Generators
// ==============================================================================
// Canonical input sequences for exercising the filter chain: white noise,
// unit step, sine, linear chirp and a synthetic "realistic" gyro trace
// (body motion + rotor vibration + sensor noise).
//
// All randomness comes from a caller supplied Xorshift32, so a given seed
// always reproduces the same sequence.
// ==============================================================================

#pragma once

#include <gyro/dsp/core/db_utils.h>
#include <gyro/dsp/core/filter_result.h>
#include <gyro/dsp/core/math_constants.h>
#include <gyro/dsp/core/random.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Gyro {
namespace DSP {

// =============================================================================
// Signal Selection
// =============================================================================

/// @brief Input signal shapes.
enum class SignalKind : uint8_t {
    Noise,      ///< Uniform white noise in [-amplitude, amplitude]
    Step,       ///< 0 before stepTime, 1 from stepTime on
    Sine,       ///< amplitude * sin(2 pi f t)
    Chirp,      ///< Linear frequency sweep with integrated phase
    Realistic   ///< 50 Hz motion + 120 Hz rotor line + noise
};

/// Realistic gyro trace: body motion frequency
inline constexpr double kRealisticBaseHz = 50.0;

/// Realistic gyro trace: rotor vibration frequency and relative amplitude
inline constexpr double kRealisticRotorHz = 120.0;
inline constexpr double kRealisticRotorAmplitude = 0.3;

/// Realistic gyro trace: sensor noise amplitude
inline constexpr double kRealisticNoiseAmplitude = 0.1;

/// @brief Parameters of one generated input sequence.
struct SignalConfig {
    SignalKind kind = SignalKind::Sine;
    size_t length = 1000;          ///< Number of samples
    double sampleRate = 4000.0;    ///< Hz
    double amplitude = 1.0;        ///< Noise and sine amplitude
    double frequency = 100.0;      ///< Sine frequency in Hz
    double stepTime = 0.1;         ///< Step onset in seconds
    double chirpStartHz = 10.0;    ///< Chirp start frequency
    double chirpEndHz = 500.0;     ///< Chirp end frequency
    double noiseLevel = 0.0;       ///< Extra additive noise amplitude (fraction, 0.05 = 5 %)

    /// @brief Check ranges: non-empty, positive rate, finite non-negative levels
    [[nodiscard]] bool isValid() const noexcept {
        if (length == 0) return false;
        if (!detail::isFiniteBits(sampleRate) || sampleRate <= 0.0) return false;
        if (!detail::isFiniteBits(amplitude) || !detail::isFiniteBits(frequency) ||
            !detail::isFiniteBits(stepTime) || !detail::isFiniteBits(chirpStartHz) ||
            !detail::isFiniteBits(chirpEndHz) || !detail::isFiniteBits(noiseLevel)) {
            return false;
        }
        return noiseLevel >= 0.0 && amplitude >= 0.0;
    }
};

// =============================================================================
// Generators
// =============================================================================

namespace SignalGenerators {

/// @brief Uniform white noise in [-amplitude, amplitude].
[[nodiscard]] inline std::vector<double> whiteNoise(size_t length, double amplitude, Xorshift32& rng) {
    std::vector<double> signal(length);
    for (auto& sample : signal) {
        sample = rng.nextBipolar() * amplitude;
    }
    return signal;
}

/// @brief Sine: amplitude * sin(2 pi f i / fs).
[[nodiscard]] inline std::vector<double> sine(size_t length, double frequency, double sampleRate,
                                              double amplitude = 1.0) {
    std::vector<double> signal(length);
    const double increment = kTwoPi * frequency / sampleRate;
    for (size_t i = 0; i < length; ++i) {
        signal[i] = amplitude * std::sin(increment * static_cast<double>(i));
    }
    return signal;
}

/// @brief Index of the first sample at or after stepTime, clamped to [0, length].
///
/// A step beyond the buffer (or a NaN time) yields `length`, i.e. no ones.
[[nodiscard]] inline size_t stepIndex(double stepTime, double sampleRate, size_t length) noexcept {
    const double index = std::floor(stepTime * sampleRate);
    if (detail::isNaNBits(index) || index >= static_cast<double>(length)) return length;
    return (index <= 0.0) ? 0 : static_cast<size_t>(index);
}

/// @brief Unit step: 0 before stepTime, 1 at and after it.
[[nodiscard]] inline std::vector<double> step(size_t length, double stepTime, double sampleRate) {
    std::vector<double> signal(length, 0.0);
    for (size_t i = stepIndex(stepTime, sampleRate, length); i < length; ++i) {
        signal[i] = 1.0;
    }
    return signal;
}

/// @brief Linear chirp from startHz to endHz over the buffer duration.
///
/// Phase is the integral of the instantaneous frequency
/// f(t) = f0 + (f1 - f0) t / T:
///   phi(t) = 2 pi (f0 t + (f1 - f0) t^2 / (2 T))
/// evaluated in closed form per sample, so no phase error accumulates.
[[nodiscard]] inline std::vector<double> chirp(size_t length, double startHz, double endHz,
                                               double sampleRate, double amplitude = 1.0) {
    std::vector<double> signal(length);
    const double duration = static_cast<double>(length) / sampleRate;
    const double sweepRate = (endHz - startHz) / duration;
    for (size_t i = 0; i < length; ++i) {
        const double t = static_cast<double>(i) / sampleRate;
        const double phase = kTwoPi * (startHz * t + 0.5 * sweepRate * t * t);
        signal[i] = amplitude * std::sin(phase);
    }
    return signal;
}

/// @brief Synthetic gyro trace: body motion + rotor line + noise.
[[nodiscard]] inline std::vector<double> realistic(size_t length, double sampleRate, Xorshift32& rng) {
    std::vector<double> signal(length);
    for (size_t i = 0; i < length; ++i) {
        const double t = static_cast<double>(i) / sampleRate;
        const double body = std::sin(kTwoPi * kRealisticBaseHz * t);
        const double rotor = kRealisticRotorAmplitude * std::sin(kTwoPi * kRealisticRotorHz * t);
        signal[i] = body + rotor + rng.nextBipolar() * kRealisticNoiseAmplitude;
    }
    return signal;
}

/// @brief Add uniform noise of the given amplitude in place.
inline void addNoise(std::vector<double>& signal, double amplitude, Xorshift32& rng) {
    for (auto& sample : signal) {
        sample += rng.nextBipolar() * amplitude;
    }
}

/// @brief Sample times t_i = i / fs.
[[nodiscard]] inline std::vector<double> timeAxis(size_t length, double sampleRate) {
    std::vector<double> time(length);
    for (size_t i = 0; i < length; ++i) {
        time[i] = static_cast<double>(i) / sampleRate;
    }
    return time;
}

/// @brief Generate the configured signal, plus optional extra noise.
/// @return Samples, or InvalidParameter if !config.isValid()
[[nodiscard]] inline FilterResult<std::vector<double>> generate(const SignalConfig& config, Xorshift32& rng) {
    using Result = FilterResult<std::vector<double>>;
    if (!config.isValid()) {
        return Result::failure(FilterError::InvalidParameter);
    }

    std::vector<double> signal;
    switch (config.kind) {
        case SignalKind::Noise:
            signal = whiteNoise(config.length, config.amplitude, rng);
            break;
        case SignalKind::Step:
            signal = step(config.length, config.stepTime, config.sampleRate);
            break;
        case SignalKind::Sine:
            signal = sine(config.length, config.frequency, config.sampleRate, config.amplitude);
            break;
        case SignalKind::Chirp:
            signal = chirp(config.length, config.chirpStartHz, config.chirpEndHz, config.sampleRate);
            break;
        case SignalKind::Realistic:
            signal = realistic(config.length, config.sampleRate, rng);
            break;
    }

    if (config.noiseLevel > 0.0) {
        addNoise(signal, config.noiseLevel, rng);
    }
    return Result::success(std::move(signal));
}

} // namespace SignalGenerators

} // namespace DSP
} // namespace Gyro
