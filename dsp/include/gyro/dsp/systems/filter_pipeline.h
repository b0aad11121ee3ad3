// ==============================================================================
// Layer 3: System Component - Filter Pipeline
// ==============================================================================
// Ordered chain of stateful filter stages (PT cascades and biquads) built
// from a list of stage descriptors. Every sample passes through all stages
// in declared order.
//
// The default gyro chain mirrors a flight controller's gyro path:
//   4-pole Bessel decimation @ 200 Hz -> RPM notch 120 Hz (Q 20)
//   -> PT1 200 Hz -> PT1 150 Hz -> notch 150 Hz (Q 5) -> notch 250 Hz (Q 8)
// ==============================================================================

#pragma once

#include <gyro/dsp/core/db_utils.h>
#include <gyro/dsp/core/filter_design.h>
#include <gyro/dsp/core/filter_result.h>
#include <gyro/dsp/core/logging.h>
#include <gyro/dsp/primitives/biquad.h>
#include <gyro/dsp/primitives/pt_filter.h>
#include <gyro/dsp/processors/frequency_response.h>

#include <algorithm>
#include <cstddef>
#include <variant>
#include <vector>

namespace Gyro {
namespace DSP {

// =============================================================================
// Default Gyro Chain Constants
// =============================================================================

inline constexpr double kDefaultDecimationCutoff = 200.0;
inline constexpr double kDefaultRpmNotchHz = 120.0;
inline constexpr double kDefaultRpmNotchQ = 20.0;
inline constexpr double kDefaultLowpass1Hz = 200.0;
inline constexpr double kDefaultLowpass2Hz = 150.0;
inline constexpr double kDefaultNotch1Hz = 150.0;
inline constexpr double kDefaultNotch1Q = 5.0;
inline constexpr double kDefaultNotch2Hz = 250.0;
inline constexpr double kDefaultNotch2Q = 8.0;

// =============================================================================
// PipelineConfig
// =============================================================================

/// @brief Stage list of a pipeline, in processing order.
struct PipelineConfig {
    std::vector<StageConfig> stages;

    /// @brief The default gyro chain (seven stages).
    [[nodiscard]] static PipelineConfig defaultGyroChain() {
        PipelineConfig config;
        const auto decimation = FilterDesign::besselDecimationStages(kDefaultDecimationCutoff);
        config.stages.assign(decimation.begin(), decimation.end());
        config.stages.push_back({FilterType::Notch, kDefaultRpmNotchHz, kDefaultRpmNotchQ});
        config.stages.push_back({FilterType::PT1, kDefaultLowpass1Hz, kButterworthQ});
        config.stages.push_back({FilterType::PT1, kDefaultLowpass2Hz, kButterworthQ});
        config.stages.push_back({FilterType::Notch, kDefaultNotch1Hz, kDefaultNotch1Q});
        config.stages.push_back({FilterType::Notch, kDefaultNotch2Hz, kDefaultNotch2Q});
        return config;
    }
};

/// One designed stage with its own state
using FilterStage = std::variant<PtFilter, Biquad>;

// =============================================================================
// FilterPipeline
// =============================================================================

/// @brief Owning chain of designed filter stages.
///
/// @par Usage
/// @code
/// auto pipeline = FilterPipeline::create(PipelineConfig::defaultGyroChain(), 4000.0);
/// if (!pipeline) return;
/// auto output = pipeline.value.processBlock(samples);
/// @endcode
class FilterPipeline {
public:
    FilterPipeline() noexcept = default;

    // =========================================================================
    // Construction
    // =========================================================================

    /// @brief Design every stage in order; the first failing stage aborts.
    /// @return Pipeline with cleared state, or the failing stage's error
    [[nodiscard]] static FilterResult<FilterPipeline> create(const PipelineConfig& config,
                                                             double sampleRate) {
        using Result = FilterResult<FilterPipeline>;
        FilterPipeline pipeline;
        pipeline.sampleRate_ = sampleRate;
        pipeline.stages_.reserve(config.stages.size());

        for (size_t i = 0; i < config.stages.size(); ++i) {
            const StageConfig& stage = config.stages[i];
            auto designed = designStage(stage, sampleRate);
            if (!designed) {
                logger()->warn("pipeline stage {} rejected: cutoff {} Hz, Q {}, sample rate {} Hz ({})",
                               i, stage.cutoff, stage.q, sampleRate, toString(designed.error));
                return Result::failure(designed.error);
            }
            pipeline.stages_.push_back(std::move(designed.value));
        }

        logger()->debug("pipeline built: {} stages at {} Hz", pipeline.stages_.size(), sampleRate);
        return Result::success(std::move(pipeline));
    }

    /// @brief Build a fresh pipeline and filter a whole buffer through it.
    [[nodiscard]] static FilterResult<std::vector<double>> run(const PipelineConfig& config,
                                                               const std::vector<double>& input,
                                                               double sampleRate) {
        auto pipeline = create(config, sampleRate);
        if (!pipeline) {
            return FilterResult<std::vector<double>>::failure(pipeline.error);
        }
        return pipeline.value.processBlock(input);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Feed one sample through all stages in order.
    [[nodiscard]] double process(double input) noexcept {
        double signal = input;
        for (auto& stage : stages_) {
            signal = std::visit([signal](auto& filter) noexcept { return filter.process(signal); }, stage);
        }
        return signal;
    }

    /// @brief Filter a buffer, continuing from the current state.
    /// @return One output per input, or NumericInstability if any input
    ///         sample is NaN or infinite (state untouched in that case) or
    ///         if the output overflowed (state is then unusable; reset())
    [[nodiscard]] FilterResult<std::vector<double>> processBlock(const std::vector<double>& input) {
        using Result = FilterResult<std::vector<double>>;
        const auto isFinite = [](double x) { return detail::isFiniteBits(x); };
        if (!std::all_of(input.begin(), input.end(), isFinite)) {
            logger()->warn("pipeline input contains non-finite samples");
            return Result::failure(FilterError::NumericInstability);
        }
        std::vector<double> output(input.size());
        std::transform(input.begin(), input.end(), output.begin(),
                       [this](double x) { return process(x); });

        // Checked once per block so process() stays branch-free
        if (!std::all_of(output.begin(), output.end(), isFinite)) {
            logger()->warn("pipeline output overflowed ({} stages, {} samples)",
                           stages_.size(), input.size());
            return Result::failure(FilterError::NumericInstability);
        }
        return Result::success(std::move(output));
    }

    /// @brief Clear the state of every stage.
    void reset() noexcept {
        for (auto& stage : stages_) {
            std::visit([](auto& filter) noexcept { filter.reset(); }, stage);
        }
    }

    // =========================================================================
    // Analysis
    // =========================================================================

    /// @brief Analytic response of the whole chain (cascade of all stages).
    ///
    /// An empty pipeline returns the flat identity curve.
    [[nodiscard]] FilterResult<ResponseCurve> response() const {
        auto combined = FrequencyResponse::flat(sampleRate_);
        for (const auto& stage : stages_) {
            if (!combined) break;
            const auto curve = std::visit(
                [this](const auto& filter) { return FrequencyResponse::compute(stageAnalysisTarget(filter), sampleRate_); },
                stage);
            if (!curve) {
                return curve;
            }
            combined = FrequencyResponse::cascade(combined.value, curve.value);
        }
        return combined;
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] size_t numStages() const noexcept { return stages_.size(); }

    [[nodiscard]] const std::vector<FilterStage>& stages() const noexcept { return stages_; }

private:
    [[nodiscard]] static FilterResult<FilterStage> designStage(const StageConfig& stage, double sampleRate) {
        using Result = FilterResult<FilterStage>;
        if (FilterDesign::isBiquadType(stage.type)) {
            auto biquad = Biquad::create(stage.type, stage.cutoff, sampleRate, stage.q);
            if (!biquad) {
                return Result::failure(biquad.error);
            }
            return Result::success(FilterStage{biquad.value});
        }
        auto pt = PtFilter::create(stage.type, stage.cutoff, sampleRate);
        if (!pt) {
            return Result::failure(pt.error);
        }
        return Result::success(FilterStage{pt.value});
    }

    // Biquads are analysed through their coefficients, PT filters directly
    [[nodiscard]] static const BiquadCoefficients& stageAnalysisTarget(const Biquad& filter) noexcept {
        return filter.coefficients();
    }

    [[nodiscard]] static const PtFilter& stageAnalysisTarget(const PtFilter& filter) noexcept {
        return filter;
    }

    std::vector<FilterStage> stages_;
    double sampleRate_ = 0.0;
};

} // namespace DSP
} // namespace Gyro
