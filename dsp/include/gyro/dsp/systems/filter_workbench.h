// ==============================================================================
// Layer 3: System Component - Filter Workbench
// ==============================================================================
// Ready-made analysis scenarios for tuning a gyro filter chain. Each view is
// a pure computation returning curves and time series; nothing is plotted.
//
// - Decimation:    4-pole Bessel response + step response
// - RPM notch:     notch at rpm * ratio / 60, response + rotor sine response
// - Low-pass pair: two low-pass flavours, alone and in series
// - Notch pair:    two notches with Q from center/cutoff, alone and in series
// - Dynamic notch: spectrum peaks in a band, combined notch response
// - Pipeline:      any input through the default gyro chain, with spectra
// ==============================================================================

#pragma once

#include <gyro/dsp/core/db_utils.h>
#include <gyro/dsp/core/filter_design.h>
#include <gyro/dsp/core/filter_result.h>
#include <gyro/dsp/core/logging.h>
#include <gyro/dsp/core/random.h>
#include <gyro/dsp/primitives/signal_generators.h>
#include <gyro/dsp/processors/frequency_response.h>
#include <gyro/dsp/processors/spectrum_analyzer.h>
#include <gyro/dsp/systems/filter_pipeline.h>

#include <cstddef>
#include <vector>

namespace Gyro {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

/// Noise amplitude added to the rotor sine in the RPM notch view
inline constexpr double kRpmViewNoiseAmplitude = 0.2;

/// @brief Parameters of every workbench view.
struct WorkbenchConfig {
    double sampleRate = 4000.0;
    size_t numSamples = 1000;
    double stepTime = 0.1;                 ///< Step onset in seconds

    // Decimation
    double decimationCutoff = kDefaultDecimationCutoff;

    // RPM notch
    double motorRpm = 7200.0;
    double rpmRatio = 1.0;                 ///< Harmonic / blade ratio
    double rpmNotchQ = kDefaultRpmNotchQ;

    // Low-pass pair
    StageConfig lowpass1{FilterType::PT1, kDefaultLowpass1Hz, kButterworthQ};
    StageConfig lowpass2{FilterType::PT1, kDefaultLowpass2Hz, kButterworthQ};

    // Notch pair (Q derived from center and lower cutoff)
    double notch1Center = 150.0;
    double notch1Cutoff = 100.0;
    double notch2Center = 250.0;
    double notch2Cutoff = 200.0;

    // Dynamic notch
    size_t dynamicNotchCount = 3;
    double dynamicNotchQ = 3.0;
    FrequencyBand dynamicNotchBand{};
    SignalKind dynamicNotchSignal = SignalKind::Realistic;

    // Full pipeline input
    SignalKind pipelineSignal = SignalKind::Sine;
    double pipelineSignalFrequency = 100.0;
    double pipelineNoiseLevel = 0.0;       ///< Fraction (0.05 = 5 %)

    [[nodiscard]] bool isValid() const noexcept {
        return detail::isFiniteBits(sampleRate) && sampleRate > 0.0 && numSamples > 0 &&
               detail::isFiniteBits(stepTime) && dynamicNotchBand.isValid() &&
               detail::isFiniteBits(pipelineNoiseLevel) && pipelineNoiseLevel >= 0.0;
    }

    /// @brief Signal settings shared by the pipeline and dynamic notch views.
    [[nodiscard]] SignalConfig signalConfig(SignalKind kind) const noexcept {
        SignalConfig signal;
        signal.kind = kind;
        signal.length = numSamples;
        signal.sampleRate = sampleRate;
        signal.stepTime = stepTime;
        signal.frequency = pipelineSignalFrequency;
        signal.noiseLevel = pipelineNoiseLevel;
        return signal;
    }
};

// =============================================================================
// View Results
// =============================================================================

/// @brief Input and output of a time-domain run, on a shared time axis.
struct TimeSeriesPair {
    std::vector<double> time;    ///< Seconds, t_i = i / fs
    std::vector<double> input;
    std::vector<double> output;
};

struct DecimationView {
    ResponseCurve response;      ///< Both Bessel stages in series
    TimeSeriesPair step;
};

struct RpmNotchView {
    double notchFrequency = 0.0;
    ResponseCurve response;
    TimeSeriesPair rotor;        ///< Rotor sine + noise through the notch
};

struct LowpassPairView {
    ResponseCurve first;
    ResponseCurve second;
    ResponseCurve cascaded;
    TimeSeriesPair firstStep;
    TimeSeriesPair secondStep;
    TimeSeriesPair cascadedStep;
};

struct NotchPairView {
    double firstQ = 0.0;
    double secondQ = 0.0;
    ResponseCurve first;
    ResponseCurve second;
    ResponseCurve cascaded;
    TimeSeriesPair firstTime;    ///< Sine at the first center
    TimeSeriesPair secondTime;   ///< Sine at the second center
    TimeSeriesPair cascadedTime; ///< Sine at the first center through both
};

struct DynamicNotchView {
    SpectrumResult spectrum;     ///< Includes the detected in-band peaks
    ResponseCurve response;      ///< Flat when no peak was found
};

struct PipelineView {
    TimeSeriesPair signal;
    SpectrumResult inputSpectrum;
    SpectrumResult outputSpectrum;
    ResponseCurve response;
};

// =============================================================================
// FilterWorkbench
// =============================================================================

namespace FilterWorkbench {

/// @brief Run `input` through a fresh pipeline and pair it with its output.
[[nodiscard]] inline FilterResult<TimeSeriesPair> timeResponse(const PipelineConfig& config,
                                                               std::vector<double> input,
                                                               double sampleRate) {
    auto output = FilterPipeline::run(config, input, sampleRate);
    if (!output) {
        return FilterResult<TimeSeriesPair>::failure(output.error);
    }
    TimeSeriesPair pair;
    pair.time = SignalGenerators::timeAxis(input.size(), sampleRate);
    pair.input = std::move(input);
    pair.output = std::move(output.value);
    return FilterResult<TimeSeriesPair>::success(std::move(pair));
}

/// @brief Analytic response of a stage list.
[[nodiscard]] inline FilterResult<ResponseCurve> chainResponse(const PipelineConfig& config,
                                                               double sampleRate) {
    auto pipeline = FilterPipeline::create(config, sampleRate);
    if (!pipeline) {
        return FilterResult<ResponseCurve>::failure(pipeline.error);
    }
    return pipeline.value.response();
}

/// @brief 4-pole Bessel decimation filter: response and step response.
[[nodiscard]] inline FilterResult<DecimationView> decimation(const WorkbenchConfig& config) {
    using Result = FilterResult<DecimationView>;
    if (!config.isValid()) {
        return Result::failure(FilterError::InvalidParameter);
    }

    const auto stages = FilterDesign::besselDecimationStages(config.decimationCutoff);
    PipelineConfig chain;
    chain.stages.assign(stages.begin(), stages.end());

    auto response = chainResponse(chain, config.sampleRate);
    if (!response) {
        return Result::failure(response.error);
    }
    auto step = timeResponse(chain,
                             SignalGenerators::step(config.numSamples, config.stepTime, config.sampleRate),
                             config.sampleRate);
    if (!step) {
        return Result::failure(step.error);
    }
    return Result::success({std::move(response.value), std::move(step.value)});
}

/// @brief RPM notch: response and filtered rotor vibration.
[[nodiscard]] inline FilterResult<RpmNotchView> rpmNotch(const WorkbenchConfig& config, Xorshift32& rng) {
    using Result = FilterResult<RpmNotchView>;
    if (!config.isValid()) {
        return Result::failure(FilterError::InvalidParameter);
    }
    const auto frequency = FilterDesign::rpmNotchFrequency(config.motorRpm, config.rpmRatio);
    if (!frequency) {
        return Result::failure(frequency.error);
    }

    const PipelineConfig chain{{StageConfig{FilterType::Notch, frequency.value, config.rpmNotchQ}}};
    auto response = chainResponse(chain, config.sampleRate);
    if (!response) {
        return Result::failure(response.error);
    }

    auto input = SignalGenerators::sine(config.numSamples, frequency.value, config.sampleRate);
    SignalGenerators::addNoise(input, kRpmViewNoiseAmplitude, rng);
    auto rotor = timeResponse(chain, std::move(input), config.sampleRate);
    if (!rotor) {
        return Result::failure(rotor.error);
    }

    RpmNotchView view;
    view.notchFrequency = frequency.value;
    view.response = std::move(response.value);
    view.rotor = std::move(rotor.value);
    return Result::success(std::move(view));
}

/// @brief Two low-pass stages alone and in series, with step responses.
[[nodiscard]] inline FilterResult<LowpassPairView> lowpassPair(const WorkbenchConfig& config) {
    using Result = FilterResult<LowpassPairView>;
    if (!config.isValid()) {
        return Result::failure(FilterError::InvalidParameter);
    }

    const PipelineConfig first{{config.lowpass1}};
    const PipelineConfig second{{config.lowpass2}};
    const PipelineConfig both{{config.lowpass1, config.lowpass2}};
    const auto step = SignalGenerators::step(config.numSamples, config.stepTime, config.sampleRate);

    LowpassPairView view;
    const auto analyze = [&](const PipelineConfig& chain, ResponseCurve& curve,
                             TimeSeriesPair& time) -> FilterError {
        auto response = chainResponse(chain, config.sampleRate);
        if (!response) {
            return response.error;
        }
        auto stepResponse = timeResponse(chain, step, config.sampleRate);
        if (!stepResponse) {
            return stepResponse.error;
        }
        curve = std::move(response.value);
        time = std::move(stepResponse.value);
        return FilterError::None;
    };

    for (const auto error : {analyze(first, view.first, view.firstStep),
                             analyze(second, view.second, view.secondStep),
                             analyze(both, view.cascaded, view.cascadedStep)}) {
        if (error != FilterError::None) {
            return Result::failure(error);
        }
    }
    return Result::success(std::move(view));
}

/// @brief Two notches (Q from center/cutoff) alone and in series.
[[nodiscard]] inline FilterResult<NotchPairView> notchPair(const WorkbenchConfig& config) {
    using Result = FilterResult<NotchPairView>;
    if (!config.isValid()) {
        return Result::failure(FilterError::InvalidParameter);
    }
    const auto q1 = FilterDesign::notchQ(config.notch1Center, config.notch1Cutoff);
    if (!q1) {
        return Result::failure(q1.error);
    }
    const auto q2 = FilterDesign::notchQ(config.notch2Center, config.notch2Cutoff);
    if (!q2) {
        return Result::failure(q2.error);
    }

    const StageConfig notch1{FilterType::Notch, config.notch1Center, q1.value};
    const StageConfig notch2{FilterType::Notch, config.notch2Center, q2.value};
    const PipelineConfig first{{notch1}};
    const PipelineConfig second{{notch2}};
    const PipelineConfig both{{notch1, notch2}};

    NotchPairView view;
    view.firstQ = q1.value;
    view.secondQ = q2.value;

    auto firstResponse = chainResponse(first, config.sampleRate);
    auto secondResponse = chainResponse(second, config.sampleRate);
    auto cascadedResponse = chainResponse(both, config.sampleRate);
    for (const auto* r : {&firstResponse, &secondResponse, &cascadedResponse}) {
        if (!*r) {
            return Result::failure(r->error);
        }
    }
    view.first = std::move(firstResponse.value);
    view.second = std::move(secondResponse.value);
    view.cascaded = std::move(cascadedResponse.value);

    const auto sine1 = SignalGenerators::sine(config.numSamples, config.notch1Center, config.sampleRate);
    const auto sine2 = SignalGenerators::sine(config.numSamples, config.notch2Center, config.sampleRate);
    auto firstTime = timeResponse(first, sine1, config.sampleRate);
    auto secondTime = timeResponse(second, sine2, config.sampleRate);
    auto cascadedTime = timeResponse(both, sine1, config.sampleRate);
    for (const auto* t : {&firstTime, &secondTime, &cascadedTime}) {
        if (!*t) {
            return Result::failure(t->error);
        }
    }
    view.firstTime = std::move(firstTime.value);
    view.secondTime = std::move(secondTime.value);
    view.cascadedTime = std::move(cascadedTime.value);
    return Result::success(std::move(view));
}

/// @brief Notches placed on the strongest in-band spectral peaks.
///
/// The combined response starts from the flat identity curve, so with no
/// peak in band the result is 0 dB everywhere.
[[nodiscard]] inline FilterResult<DynamicNotchView> dynamicNotch(const WorkbenchConfig& config,
                                                                 const std::vector<double>& signal) {
    using Result = FilterResult<DynamicNotchView>;
    if (!config.isValid()) {
        return Result::failure(FilterError::InvalidParameter);
    }

    auto spectrum = SpectrumAnalyzer::analyze(signal, config.sampleRate, config.dynamicNotchBand,
                                              config.dynamicNotchCount);
    if (!spectrum) {
        return Result::failure(spectrum.error);
    }

    auto combined = FrequencyResponse::flat(config.sampleRate);
    for (const auto& peak : spectrum.value.peaks) {
        if (!combined) break;
        const auto notch = FrequencyResponse::compute(FilterType::Notch, peak.frequency,
                                                      config.sampleRate, config.dynamicNotchQ);
        if (!notch) {
            logger()->warn("dynamic notch at {} Hz rejected ({})", peak.frequency, toString(notch.error));
            return Result::failure(notch.error);
        }
        combined = FrequencyResponse::cascade(combined.value, notch.value);
    }
    if (!combined) {
        return Result::failure(combined.error);
    }

    DynamicNotchView view;
    view.spectrum = std::move(spectrum.value);
    view.response = std::move(combined.value);
    return Result::success(std::move(view));
}

/// @brief Dynamic notch view on the configured input signal.
[[nodiscard]] inline FilterResult<DynamicNotchView> dynamicNotch(const WorkbenchConfig& config, Xorshift32& rng) {
    if (!config.isValid()) {
        return FilterResult<DynamicNotchView>::failure(FilterError::InvalidParameter);
    }
    const auto signal = SignalGenerators::generate(config.signalConfig(config.dynamicNotchSignal), rng);
    if (!signal) {
        return FilterResult<DynamicNotchView>::failure(signal.error);
    }
    return dynamicNotch(config, signal.value);
}

/// @brief Configured input through the default gyro chain.
[[nodiscard]] inline FilterResult<PipelineView> pipeline(const WorkbenchConfig& config, Xorshift32& rng) {
    using Result = FilterResult<PipelineView>;
    if (!config.isValid()) {
        return Result::failure(FilterError::InvalidParameter);
    }

    auto input = SignalGenerators::generate(config.signalConfig(config.pipelineSignal), rng);
    if (!input) {
        return Result::failure(input.error);
    }

    const auto chain = PipelineConfig::defaultGyroChain();
    auto response = chainResponse(chain, config.sampleRate);
    if (!response) {
        return Result::failure(response.error);
    }
    auto signal = timeResponse(chain, std::move(input.value), config.sampleRate);
    if (!signal) {
        return Result::failure(signal.error);
    }
    auto inputSpectrum = SpectrumAnalyzer::analyze(signal.value.input, config.sampleRate);
    if (!inputSpectrum) {
        return Result::failure(inputSpectrum.error);
    }
    auto outputSpectrum = SpectrumAnalyzer::analyze(signal.value.output, config.sampleRate);
    if (!outputSpectrum) {
        return Result::failure(outputSpectrum.error);
    }

    PipelineView view;
    view.signal = std::move(signal.value);
    view.inputSpectrum = std::move(inputSpectrum.value);
    view.outputSpectrum = std::move(outputSpectrum.value);
    view.response = std::move(response.value);
    return Result::success(std::move(view));
}

} // namespace FilterWorkbench

} // namespace DSP
} // namespace Gyro
