// ==============================================================================
// Gyro Filter Workbench
// ==============================================================================
// Command-line front end for the workbench views. Computes one view and
// writes its curves and time series as CSV blocks to stdout; diagnostics go
// to stderr through the engine logger.
//
// Usage:
//   gyro_filter_workbench --view pipeline --signal chirp --noise 5
//   gyro_filter_workbench --view notch --notch1-center 150 --notch1-cutoff 100
//
// Views: decimation, rpm, lowpass, notch, dynamic, pipeline
// ==============================================================================

#include <gyro/dsp/core/filter_design.h>
#include <gyro/dsp/core/filter_result.h>
#include <gyro/dsp/core/logging.h>
#include <gyro/dsp/core/random.h>
#include <gyro/dsp/primitives/signal_generators.h>
#include <gyro/dsp/systems/filter_workbench.h>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace Gyro::DSP;

namespace {

// ==============================================================================
// Argument Parsing
// ==============================================================================

struct Options {
    std::string view = "pipeline";
    uint32_t seed = 1;
    bool verbose = false;
    WorkbenchConfig config;
};

std::optional<FilterType> parseFilterType(const std::string& name) {
    static const std::map<std::string, FilterType> kTypes = {
        {"pt1", FilterType::PT1},
        {"pt2", FilterType::PT2},
        {"pt3", FilterType::PT3},
        {"butterworth", FilterType::Butterworth},
        {"bessel", FilterType::Bessel},
        {"damped", FilterType::Damped},
    };
    const auto it = kTypes.find(name);
    if (it == kTypes.end()) return std::nullopt;
    return it->second;
}

std::optional<SignalKind> parseSignalKind(const std::string& name) {
    static const std::map<std::string, SignalKind> kKinds = {
        {"noise", SignalKind::Noise},
        {"step", SignalKind::Step},
        {"sine", SignalKind::Sine},
        {"chirp", SignalKind::Chirp},
        {"realistic", SignalKind::Realistic},
    };
    const auto it = kKinds.find(name);
    if (it == kKinds.end()) return std::nullopt;
    return it->second;
}

std::optional<double> parseNumber(const std::string& text) {
    try {
        size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

/// Upper bound for buffer lengths and notch counts taken from the command line
constexpr double kMaxSamples = 1 << 20;

/// Whole number in [0, maxValue], or nothing
std::optional<double> parseCount(double value, double maxValue) {
    if (!(value >= 0.0) || value > maxValue || std::floor(value) != value) return std::nullopt;
    return value;
}

/// Apply one --key value pair. Returns false for unknown keys or bad values.
bool applyOption(Options& options, const std::string& key, const std::string& value) {
    WorkbenchConfig& c = options.config;

    if (key == "view") {
        options.view = value;
        return true;
    }
    if (key == "signal" || key == "dynamic-signal") {
        const auto kind = parseSignalKind(value);
        if (!kind) return false;
        (key == "signal" ? c.pipelineSignal : c.dynamicNotchSignal) = *kind;
        return true;
    }
    if (key == "lpf1-type" || key == "lpf2-type") {
        const auto type = parseFilterType(value);
        if (!type) return false;
        (key == "lpf1-type" ? c.lowpass1 : c.lowpass2).type = *type;
        return true;
    }

    const auto number = parseNumber(value);
    if (!number) return false;
    const double v = *number;

    const std::map<std::string, double*> numeric = {
        {"sample-rate", &c.sampleRate},
        {"step-time", &c.stepTime},
        {"decimation-cutoff", &c.decimationCutoff},
        {"rpm", &c.motorRpm},
        {"rpm-ratio", &c.rpmRatio},
        {"rpm-q", &c.rpmNotchQ},
        {"lpf1-cutoff", &c.lowpass1.cutoff},
        {"lpf2-cutoff", &c.lowpass2.cutoff},
        {"notch1-center", &c.notch1Center},
        {"notch1-cutoff", &c.notch1Cutoff},
        {"notch2-center", &c.notch2Center},
        {"notch2-cutoff", &c.notch2Cutoff},
        {"dyn-q", &c.dynamicNotchQ},
        {"dyn-min", &c.dynamicNotchBand.minHz},
        {"dyn-max", &c.dynamicNotchBand.maxHz},
        {"signal-freq", &c.pipelineSignalFrequency},
    };
    if (const auto it = numeric.find(key); it != numeric.end()) {
        *it->second = v;
        return true;
    }

    if (key == "noise") {
        if (v < 0.0) return false;
        // Percent on the command line, fraction in the config
        c.pipelineNoiseLevel = v / 100.0;
        return true;
    }

    const std::map<std::string, std::pair<size_t*, double>> counts = {
        {"samples", {&c.numSamples, kMaxSamples}},
        {"dyn-count", {&c.dynamicNotchCount, kMaxSamples}},
    };
    if (const auto it = counts.find(key); it != counts.end()) {
        const auto count = parseCount(v, it->second.second);
        if (!count) return false;
        *it->second.first = static_cast<size_t>(*count);
        return true;
    }
    if (key == "seed") {
        const auto seed = parseCount(v, static_cast<double>(std::numeric_limits<uint32_t>::max()));
        if (!seed) return false;
        options.seed = static_cast<uint32_t>(*seed);
        return true;
    }
    return false;
}

std::optional<Options> parseArguments(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
            logger()->error("unexpected argument '{}'", arg);
            return std::nullopt;
        }
        const std::string key = arg.substr(2);
        const std::string value = argv[++i];
        if (!applyOption(options, key, value)) {
            logger()->error("invalid option --{} {}", key, value);
            return std::nullopt;
        }
    }
    return options;
}

// ==============================================================================
// CSV Output
// ==============================================================================

void writeCurve(const std::string& name, const ResponseCurve& curve) {
    std::cout << "# " << name << "\nfrequency_hz,magnitude_db,phase_deg\n";
    for (size_t i = 0; i < curve.size(); ++i) {
        std::cout << curve.frequencies[i] << ',' << curve.magnitudesDb[i] << ','
                  << curve.phasesDeg[i] << '\n';
    }
    std::cout << '\n';
}

void writeSeries(const std::string& name, const TimeSeriesPair& series) {
    std::cout << "# " << name << "\ntime_s,input,output\n";
    for (size_t i = 0; i < series.time.size(); ++i) {
        std::cout << series.time[i] << ',' << series.input[i] << ',' << series.output[i] << '\n';
    }
    std::cout << '\n';
}

void writeSpectrum(const std::string& name, const SpectrumResult& spectrum) {
    std::cout << "# " << name << "\nfrequency_hz,magnitude_db\n";
    for (size_t i = 0; i < spectrum.size(); ++i) {
        std::cout << spectrum.frequencies[i] << ',' << spectrum.magnitudesDb[i] << '\n';
    }
    std::cout << '\n';
}

template <typename T>
bool report(const std::string& view, const FilterResult<T>& result) {
    if (!result) {
        logger()->error("{} view failed: {}", view, toString(result.error));
        return false;
    }
    logger()->info("{} view computed", view);
    return true;
}

// ==============================================================================
// Views
// ==============================================================================

bool runView(const Options& options) {
    const WorkbenchConfig& config = options.config;
    Xorshift32 rng(options.seed);
    const std::string& view = options.view;

    if (view == "decimation") {
        const auto result = FilterWorkbench::decimation(config);
        if (!report(view, result)) return false;
        writeCurve("bessel decimation response", result.value.response);
        writeSeries("bessel decimation step response", result.value.step);
        return true;
    }
    if (view == "rpm") {
        const auto result = FilterWorkbench::rpmNotch(config, rng);
        if (!report(view, result)) return false;
        logger()->info("rpm notch at {:.2f} Hz", result.value.notchFrequency);
        writeCurve("rpm notch response", result.value.response);
        writeSeries("rpm notch rotor response", result.value.rotor);
        return true;
    }
    if (view == "lowpass") {
        const auto result = FilterWorkbench::lowpassPair(config);
        if (!report(view, result)) return false;
        writeCurve("lpf1 response", result.value.first);
        writeCurve("lpf2 response", result.value.second);
        writeCurve("lpf cascaded response", result.value.cascaded);
        writeSeries("lpf1 step response", result.value.firstStep);
        writeSeries("lpf2 step response", result.value.secondStep);
        writeSeries("lpf cascaded step response", result.value.cascadedStep);
        return true;
    }
    if (view == "notch") {
        const auto result = FilterWorkbench::notchPair(config);
        if (!report(view, result)) return false;
        logger()->info("notch Q values: {:.4f}, {:.4f}", result.value.firstQ, result.value.secondQ);
        writeCurve("notch1 response", result.value.first);
        writeCurve("notch2 response", result.value.second);
        writeCurve("notch cascaded response", result.value.cascaded);
        writeSeries("notch1 time response", result.value.firstTime);
        writeSeries("notch2 time response", result.value.secondTime);
        writeSeries("notch cascaded time response", result.value.cascadedTime);
        return true;
    }
    if (view == "dynamic") {
        const auto result = FilterWorkbench::dynamicNotch(config, rng);
        if (!report(view, result)) return false;
        writeSpectrum("dynamic notch input spectrum", result.value.spectrum);
        std::cout << "# detected peaks\nfrequency_hz,magnitude_db\n";
        for (const auto& peak : result.value.spectrum.peaks) {
            std::cout << peak.frequency << ',' << peak.magnitudeDb << '\n';
        }
        std::cout << '\n';
        writeCurve("dynamic notch response", result.value.response);
        return true;
    }
    if (view == "pipeline") {
        const auto result = FilterWorkbench::pipeline(config, rng);
        if (!report(view, result)) return false;
        writeSeries("pipeline time response", result.value.signal);
        writeSpectrum("pipeline input spectrum", result.value.inputSpectrum);
        writeSpectrum("pipeline output spectrum", result.value.outputSpectrum);
        writeCurve("pipeline response", result.value.response);
        return true;
    }

    logger()->error("unknown view '{}'", view);
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    const auto options = parseArguments(argc, argv);
    if (!options) {
        std::cerr << "usage: gyro_filter_workbench [--view decimation|rpm|lowpass|notch|dynamic|pipeline]"
                     " [--key value ...] [--verbose]\n";
        return EXIT_FAILURE;
    }

    setLogLevel(options->verbose ? spdlog::level::debug : spdlog::level::info);
    return runView(*options) ? EXIT_SUCCESS : EXIT_FAILURE;
}
