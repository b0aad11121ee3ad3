// ==============================================================================
// Layer 3: System Tests - Filter Pipeline
// ==============================================================================
// Tests for: dsp/include/gyro/dsp/systems/filter_pipeline.h
//
// Test Categories:
// - [construction]: stage design and error propagation
// - [processing]: sample flow through the stages
// - [response]: analytic response of the whole chain
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <gyro/dsp/primitives/signal_generators.h>
#include <gyro/dsp/processors/frequency_response.h>
#include <gyro/dsp/systems/filter_pipeline.h>

#include "statistical_utils.h"

#include <cmath>
#include <limits>
#include <variant>
#include <vector>

using Catch::Approx;
using namespace Gyro::DSP;
using namespace Gyro::DSP::TestUtils;

static constexpr double kTestSampleRate = 4000.0;

// ==============================================================================
// Construction
// ==============================================================================

TEST_CASE("Default gyro chain has the seven expected stages", "[pipeline][construction]") {
    const auto config = PipelineConfig::defaultGyroChain();
    REQUIRE(config.stages.size() == 7);

    REQUIRE(config.stages[0].type == FilterType::LowpassGeneric);
    REQUIRE(config.stages[0].cutoff == Approx(200.0 * kBessel4StageACutoffScale));
    REQUIRE(config.stages[1].q == Approx(kBessel4StageBQ));
    REQUIRE(config.stages[2].type == FilterType::Notch);
    REQUIRE(config.stages[2].cutoff == 120.0);
    REQUIRE(config.stages[2].q == 20.0);
    REQUIRE(config.stages[3].type == FilterType::PT1);
    REQUIRE(config.stages[3].cutoff == 200.0);
    REQUIRE(config.stages[4].cutoff == 150.0);
    REQUIRE(config.stages[5].cutoff == 150.0);
    REQUIRE(config.stages[5].q == 5.0);
    REQUIRE(config.stages[6].cutoff == 250.0);
    REQUIRE(config.stages[6].q == 8.0);

    const auto pipeline = FilterPipeline::create(config, kTestSampleRate);
    REQUIRE(pipeline);
    REQUIRE(pipeline.value.numStages() == 7);
    REQUIRE(std::holds_alternative<Biquad>(pipeline.value.stages()[0]));
    REQUIRE(std::holds_alternative<PtFilter>(pipeline.value.stages()[3]));
}

TEST_CASE("A failing stage aborts pipeline construction", "[pipeline][construction][validation]") {
    PipelineConfig config;
    config.stages = {
        {FilterType::PT1, 100.0, kButterworthQ},
        {FilterType::Butterworth, 2500.0, kButterworthQ},  // above Nyquist
    };
    const auto pipeline = FilterPipeline::create(config, kTestSampleRate);
    REQUIRE_FALSE(pipeline);
    REQUIRE(pipeline.error == FilterError::InvalidParameter);

    REQUIRE(FilterPipeline::run(config, {1.0, 2.0}, kTestSampleRate).error == FilterError::InvalidParameter);
}

TEST_CASE("Empty pipeline passes samples through unchanged", "[pipeline][construction]") {
    const auto output = FilterPipeline::run(PipelineConfig{}, {0.5, -1.0, 2.0}, kTestSampleRate);
    REQUIRE(output);
    REQUIRE(output.value == std::vector<double>{0.5, -1.0, 2.0});
}

// ==============================================================================
// Processing
// ==============================================================================

TEST_CASE("Pipeline output equals the stages applied in order", "[pipeline][processing]") {
    PipelineConfig config;
    config.stages = {
        {FilterType::Bessel, 300.0, kBesselQ},
        {FilterType::PT2, 150.0, kButterworthQ},
        {FilterType::Notch, 250.0, 8.0},
    };
    Xorshift32 rng(5);
    const auto input = SignalGenerators::whiteNoise(1000, 1.0, rng);

    const auto output = FilterPipeline::run(config, input, kTestSampleRate);
    REQUIRE(output);
    REQUIRE(output.value.size() == input.size());

    auto bessel = Biquad::create(FilterType::Bessel, 300.0, kTestSampleRate, kBesselQ).value;
    auto pt2 = PtFilter::create(FilterType::PT2, 150.0, kTestSampleRate).value;
    auto notch = Biquad::create(FilterType::Notch, 250.0, kTestSampleRate, 8.0).value;
    for (size_t i = 0; i < input.size(); ++i) {
        const double expected = notch.process(pt2.process(bessel.process(input[i])));
        REQUIRE(output.value[i] == expected);
    }
}

TEST_CASE("Independent pipelines do not share state", "[pipeline][processing]") {
    const auto config = PipelineConfig::defaultGyroChain();
    auto a = FilterPipeline::create(config, kTestSampleRate);
    auto b = FilterPipeline::create(config, kTestSampleRate);
    REQUIRE(a);
    REQUIRE(b);

    for (int i = 0; i < 100; ++i) {
        (void)a.value.process(1.0);
    }
    const auto fresh = FilterPipeline::create(config, kTestSampleRate);
    auto reference = fresh.value;
    REQUIRE(b.value.process(0.3) == reference.process(0.3));
}

TEST_CASE("Pipeline reset restores the initial state", "[pipeline][processing]") {
    auto pipeline = FilterPipeline::create(PipelineConfig::defaultGyroChain(), kTestSampleRate);
    REQUIRE(pipeline);

    const double first = pipeline.value.process(1.0);
    for (int i = 0; i < 50; ++i) {
        (void)pipeline.value.process(0.5);
    }
    pipeline.value.reset();
    REQUIRE(pipeline.value.process(1.0) == first);
}

TEST_CASE("processBlock rejects non-finite samples", "[pipeline][processing][validation]") {
    auto pipeline = FilterPipeline::create(PipelineConfig::defaultGyroChain(), kTestSampleRate);
    REQUIRE(pipeline);

    const std::vector<double> bad = {0.0, 1.0, std::numeric_limits<double>::infinity()};
    const auto result = pipeline.value.processBlock(bad);
    REQUIRE(result.error == FilterError::NumericInstability);

    const std::vector<double> nan = {std::numeric_limits<double>::quiet_NaN()};
    REQUIRE(FilterPipeline::run(PipelineConfig::defaultGyroChain(), nan, kTestSampleRate).error ==
            FilterError::NumericInstability);
}

TEST_CASE("processBlock reports output overflow from finite input", "[pipeline][processing][validation]") {
    // Resonant low-pass (gain ~10 at 100 Hz) driven near the double limit
    const PipelineConfig config{{StageConfig{FilterType::LowpassGeneric, 100.0, 10.0}}};
    const auto input = SignalGenerators::sine(1000, 100.0, kTestSampleRate, 1e307);

    REQUIRE(FilterPipeline::run(config, input, kTestSampleRate).error == FilterError::NumericInstability);

    SECTION("reset recovers a usable pipeline") {
        auto pipeline = FilterPipeline::create(config, kTestSampleRate);
        REQUIRE(pipeline);
        REQUIRE(pipeline.value.processBlock(input).error == FilterError::NumericInstability);
        pipeline.value.reset();
        const auto output = pipeline.value.processBlock(SignalGenerators::sine(1000, 100.0, kTestSampleRate));
        REQUIRE(output);
        REQUIRE(output.value.size() == 1000);
    }
}

TEST_CASE("Default chain passes DC and removes the rotor line", "[pipeline][processing]") {
    const auto config = PipelineConfig::defaultGyroChain();

    SECTION("step settles at 1") {
        const auto output = FilterPipeline::run(config, std::vector<double>(4000, 1.0), kTestSampleRate);
        REQUIRE(output);
        REQUIRE(output.value.back() == Approx(1.0).margin(1e-3));
    }

    SECTION("120 Hz sine is strongly attenuated once settled") {
        const auto input = SignalGenerators::sine(8000, 120.0, kTestSampleRate);
        const auto output = FilterPipeline::run(config, input, kTestSampleRate);
        REQUIRE(output);
        REQUIRE(StatisticalUtils::computeRMS(output.value, 6000) < 0.01);
    }
}

// ==============================================================================
// Response
// ==============================================================================

TEST_CASE("Pipeline response is the cascade of its stage responses", "[pipeline][response]") {
    PipelineConfig config;
    config.stages = {
        {FilterType::PT1, 200.0, kButterworthQ},
        {FilterType::Notch, 150.0, 5.0},
    };
    auto pipeline = FilterPipeline::create(config, kTestSampleRate);
    REQUIRE(pipeline);

    const auto response = pipeline.value.response();
    const auto pt1 = FrequencyResponse::compute(FilterType::PT1, 200.0, kTestSampleRate, kButterworthQ);
    const auto notch = FrequencyResponse::compute(FilterType::Notch, 150.0, kTestSampleRate, 5.0);
    REQUIRE(response);
    REQUIRE(pt1);
    REQUIRE(notch);

    for (size_t i = 0; i < response.value.size(); ++i) {
        REQUIRE(response.value.magnitudesDb[i] ==
                Approx(pt1.value.magnitudesDb[i] + notch.value.magnitudesDb[i]).margin(1e-9));
        REQUIRE(response.value.phasesDeg[i] ==
                Approx(pt1.value.phasesDeg[i] + notch.value.phasesDeg[i]).margin(1e-9));
    }
}

TEST_CASE("Empty pipeline response is flat", "[pipeline][response]") {
    const auto pipeline = FilterPipeline::create(PipelineConfig{}, kTestSampleRate);
    REQUIRE(pipeline);
    const auto response = pipeline.value.response();
    REQUIRE(response);
    REQUIRE(response.value.size() == 1000);
    for (const double m : response.value.magnitudesDb) {
        REQUIRE(m == 0.0);
    }
}
