// ==============================================================================
// Layer 3: System Tests - Filter Workbench
// ==============================================================================
// Tests for: dsp/include/gyro/dsp/systems/filter_workbench.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <gyro/dsp/core/random.h>
#include <gyro/dsp/processors/frequency_response.h>
#include <gyro/dsp/systems/filter_workbench.h>

#include "statistical_utils.h"

#include <cmath>
#include <vector>

using Catch::Approx;
using namespace Gyro::DSP;
using namespace Gyro::DSP::TestUtils;

/// Grid index of a frequency on the 4 kHz response grid (f = 1 + 2i)
inline size_t gridIndex4k(double frequency) {
    return static_cast<size_t>((frequency - 1.0) / 2.0);
}

/// Require c == a + b point-wise
inline void requireCascade(const ResponseCurve& c, const ResponseCurve& a, const ResponseCurve& b) {
    REQUIRE(c.size() == a.size());
    REQUIRE(c.size() == b.size());
    for (size_t i = 0; i < c.size(); ++i) {
        REQUIRE(c.magnitudesDb[i] == Approx(a.magnitudesDb[i] + b.magnitudesDb[i]).margin(1e-9));
        REQUIRE(c.phasesDeg[i] == Approx(a.phasesDeg[i] + b.phasesDeg[i]).margin(1e-9));
    }
}

TEST_CASE("WorkbenchConfig defaults", "[workbench][config]") {
    const WorkbenchConfig config;
    REQUIRE(config.isValid());
    REQUIRE(config.sampleRate == 4000.0);
    REQUIRE(config.numSamples == 1000);
    REQUIRE(config.stepTime == 0.1);

    WorkbenchConfig bad;
    bad.numSamples = 0;
    REQUIRE_FALSE(bad.isValid());
    REQUIRE(FilterWorkbench::decimation(bad).error == FilterError::InvalidParameter);
}

// ==============================================================================
// Decimation
// ==============================================================================

TEST_CASE("Decimation view cascades both Bessel stages", "[workbench][decimation]") {
    const WorkbenchConfig config;
    const auto view = FilterWorkbench::decimation(config);
    REQUIRE(view);

    const auto stages = FilterDesign::besselDecimationStages(200.0);
    const auto a = FrequencyResponse::compute(stages[0].type, stages[0].cutoff, 4000.0, stages[0].q);
    const auto b = FrequencyResponse::compute(stages[1].type, stages[1].cutoff, 4000.0, stages[1].q);
    REQUIRE(a);
    REQUIRE(b);
    requireCascade(view.value.response, a.value, b.value);
    REQUIRE(view.value.response.magnitudesDb.front() == Approx(0.0).margin(1e-3));
}

TEST_CASE("Decimation step response rises from 0 to 1 after the step", "[workbench][decimation]") {
    const auto view = FilterWorkbench::decimation(WorkbenchConfig{});
    REQUIRE(view);

    const auto& step = view.value.step;
    REQUIRE(step.time.size() == 1000);
    REQUIRE(step.input.size() == 1000);
    REQUIRE(step.output.size() == 1000);
    REQUIRE(step.time[400] == Approx(0.1));
    REQUIRE(step.input[399] == 0.0);
    REQUIRE(step.input[400] == 1.0);
    REQUIRE(step.output[399] == 0.0);
    REQUIRE(step.output[999] == Approx(1.0).margin(1e-3));
}

// ==============================================================================
// RPM notch
// ==============================================================================

TEST_CASE("RPM notch view centres the notch on rpm * ratio / 60", "[workbench][rpm]") {
    WorkbenchConfig config;
    config.motorRpm = 7200.0;
    config.rpmRatio = 1.0;
    Xorshift32 rng(1);

    const auto view = FilterWorkbench::rpmNotch(config, rng);
    REQUIRE(view);
    REQUIRE(view.value.notchFrequency == Approx(120.0));

    // 119 and 121 Hz straddle the notch on the grid
    REQUIRE(view.value.response.magnitudesDb[gridIndex4k(121.0)] < -6.0);
    REQUIRE(view.value.response.magnitudesDb[gridIndex4k(1001.0)] == Approx(0.0).margin(0.1));

    // Once the notch has settled only the 0.2 amplitude noise is left
    const auto& rotor = view.value.rotor;
    const double inputRms = StatisticalUtils::computeRMS(rotor.input, 600);
    const double outputRms = StatisticalUtils::computeRMS(rotor.output, 600);
    REQUIRE(inputRms > 0.6);
    REQUIRE(outputRms < 0.3);
}

TEST_CASE("RPM notch view rejects unusable motor settings", "[workbench][rpm][validation]") {
    Xorshift32 rng(1);

    WorkbenchConfig zeroRatio;
    zeroRatio.rpmRatio = 0.0;
    REQUIRE(FilterWorkbench::rpmNotch(zeroRatio, rng).error == FilterError::InvalidParameter);

    WorkbenchConfig aboveNyquist;
    aboveNyquist.motorRpm = 150000.0;  // 2500 Hz
    REQUIRE(FilterWorkbench::rpmNotch(aboveNyquist, rng).error == FilterError::InvalidParameter);
}

// ==============================================================================
// Low-pass pair
// ==============================================================================

TEST_CASE("Low-pass pair view cascades its two filters", "[workbench][lowpass]") {
    WorkbenchConfig config;
    config.lowpass1 = {FilterType::PT2, 180.0, kButterworthQ};
    config.lowpass2 = {FilterType::Butterworth, 250.0, 3.0};

    const auto view = FilterWorkbench::lowpassPair(config);
    REQUIRE(view);
    requireCascade(view.value.cascaded, view.value.first, view.value.second);

    const auto& first = view.value.firstStep.output;
    const auto& cascaded = view.value.cascadedStep.output;
    REQUIRE(first.size() == 1000);
    // The second filter adds delay
    REQUIRE(cascaded[405] < first[405]);
    REQUIRE(first.back() == Approx(1.0).margin(1e-3));
    REQUIRE(cascaded.back() == Approx(1.0).margin(1e-2));
}

TEST_CASE("Low-pass pair view propagates design errors", "[workbench][lowpass][validation]") {
    WorkbenchConfig config;
    config.lowpass2 = {FilterType::Damped, 2500.0, kDampedQ};
    REQUIRE(FilterWorkbench::lowpassPair(config).error == FilterError::InvalidParameter);
}

// ==============================================================================
// Notch pair
// ==============================================================================

TEST_CASE("Notch pair view derives Q from center and cutoff", "[workbench][notch]") {
    const WorkbenchConfig config;
    const auto view = FilterWorkbench::notchPair(config);
    REQUIRE(view);

    REQUIRE(view.value.firstQ == Approx(FilterDesign::notchQ(150.0, 100.0).value));
    REQUIRE(view.value.secondQ == Approx(FilterDesign::notchQ(250.0, 200.0).value));
    requireCascade(view.value.cascaded, view.value.first, view.value.second);

    // Sine at each centre is removed once the notch has settled
    REQUIRE(StatisticalUtils::computeRMS(view.value.firstTime.output, 500) < 0.01);
    REQUIRE(StatisticalUtils::computeRMS(view.value.secondTime.output, 500) < 0.01);
    REQUIRE(StatisticalUtils::computeRMS(view.value.cascadedTime.output, 500) < 0.01);
    REQUIRE(view.value.cascadedTime.input == view.value.firstTime.input);
}

TEST_CASE("Notch pair view reports center == cutoff", "[workbench][notch][validation]") {
    WorkbenchConfig config;
    config.notch2Cutoff = config.notch2Center;
    REQUIRE(FilterWorkbench::notchPair(config).error == FilterError::DivisionByZero);
}

// ==============================================================================
// Dynamic notch
// ==============================================================================

TEST_CASE("Dynamic notch finds the rotor line of a realistic trace", "[workbench][dynamic]") {
    const WorkbenchConfig config;  // Realistic input, band 100-600 Hz, 3 notches
    Xorshift32 rng(1);

    const auto view = FilterWorkbench::dynamicNotch(config, rng);
    REQUIRE(view);
    REQUIRE(view.value.spectrum.size() == 500);
    REQUIRE_FALSE(view.value.spectrum.peaks.empty());
    REQUIRE(view.value.spectrum.peaks.size() <= 3);
    REQUIRE(view.value.spectrum.peaks[0].frequency == Approx(120.0));
    for (const auto& peak : view.value.spectrum.peaks) {
        REQUIRE(config.dynamicNotchBand.contains(peak.frequency));
    }
    REQUIRE(view.value.response.magnitudesDb[gridIndex4k(121.0)] < -10.0);
}

TEST_CASE("Dynamic notch response is the cascade of one notch per peak", "[workbench][dynamic]") {
    const WorkbenchConfig config;
    Xorshift32 rng(7);
    const auto view = FilterWorkbench::dynamicNotch(config, rng);
    REQUIRE(view);

    auto expected = FrequencyResponse::flat(4000.0);
    for (const auto& peak : view.value.spectrum.peaks) {
        const auto notch = FrequencyResponse::compute(FilterType::Notch, peak.frequency, 4000.0,
                                                      config.dynamicNotchQ);
        REQUIRE(notch);
        expected = FrequencyResponse::cascade(expected.value, notch.value);
        REQUIRE(expected);
    }
    REQUIRE(view.value.response.magnitudesDb == expected.value.magnitudesDb);
}

TEST_CASE("Dynamic notch with no notches is flat", "[workbench][dynamic]") {
    WorkbenchConfig config;
    config.dynamicNotchCount = 0;
    const auto signal = SignalGenerators::sine(1000, 200.0, 4000.0);

    const auto view = FilterWorkbench::dynamicNotch(config, signal);
    REQUIRE(view);
    REQUIRE(view.value.spectrum.peaks.empty());
    for (const double m : view.value.response.magnitudesDb) {
        REQUIRE(m == 0.0);
    }
}

// ==============================================================================
// Full pipeline
// ==============================================================================

TEST_CASE("Pipeline view runs the default chain", "[workbench][pipeline]") {
    WorkbenchConfig config;
    config.pipelineSignal = SignalKind::Chirp;
    Xorshift32 rng(11);

    const auto view = FilterWorkbench::pipeline(config, rng);
    REQUIRE(view);

    REQUIRE(view.value.signal.input.size() == 1000);
    REQUIRE(view.value.signal.output.size() == 1000);
    REQUIRE(view.value.inputSpectrum.size() == 500);
    REQUIRE(view.value.outputSpectrum.size() == 500);

    const auto pipeline = FilterPipeline::create(PipelineConfig::defaultGyroChain(), 4000.0);
    REQUIRE(pipeline);
    const auto response = pipeline.value.response();
    REQUIRE(response);
    REQUIRE(view.value.response.magnitudesDb == response.value.magnitudesDb);

    // Chain is low-pass: energy above 600 Hz drops
    double inputHigh = 0.0;
    double outputHigh = 0.0;
    for (size_t k = 150; k < 500; ++k) {
        inputHigh += std::pow(10.0, view.value.inputSpectrum.magnitudesDb[k] / 10.0);
        outputHigh += std::pow(10.0, view.value.outputSpectrum.magnitudesDb[k] / 10.0);
    }
    REQUIRE(outputHigh < inputHigh);
}

TEST_CASE("Pipeline view is reproducible for a seed", "[workbench][pipeline][determinism]") {
    WorkbenchConfig config;
    config.pipelineSignal = SignalKind::Realistic;
    config.pipelineNoiseLevel = 0.05;

    Xorshift32 a(123);
    Xorshift32 b(123);
    const auto first = FilterWorkbench::pipeline(config, a);
    const auto second = FilterWorkbench::pipeline(config, b);
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(first.value.signal.output == second.value.signal.output);
}
