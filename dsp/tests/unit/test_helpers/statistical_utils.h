// ==============================================================================
// Test Helper: Statistical Utilities
// ==============================================================================
// Summary statistics for asserting on noisy signals without depending on the
// exact random sequence.
//
// This is TEST INFRASTRUCTURE, not production DSP code.
//
// Namespace: Gyro::DSP::TestUtils::StatisticalUtils
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Gyro {
namespace DSP {
namespace TestUtils {

namespace StatisticalUtils {

/// @brief Arithmetic mean, 0 for an empty buffer
[[nodiscard]] inline double computeMean(const std::vector<double>& data) noexcept {
    if (data.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const double x : data) {
        sum += x;
    }
    return sum / static_cast<double>(data.size());
}

/// @brief Sample variance using Bessel's correction (n-1 denominator)
[[nodiscard]] inline double computeVariance(const std::vector<double>& data, double mean) noexcept {
    if (data.size() <= 1) {
        return 0.0;
    }
    double sumSquaredDiff = 0.0;
    for (const double x : data) {
        const double diff = x - mean;
        sumSquaredDiff += diff * diff;
    }
    return sumSquaredDiff / static_cast<double>(data.size() - 1);
}

[[nodiscard]] inline double computeStdDev(const std::vector<double>& data, double mean) noexcept {
    return std::sqrt(computeVariance(data, mean));
}

/// @brief Root mean square over [begin, end)
[[nodiscard]] inline double computeRMS(const std::vector<double>& data,
                                       size_t begin = 0, size_t end = static_cast<size_t>(-1)) noexcept {
    end = std::min(end, data.size());
    if (begin >= end) {
        return 0.0;
    }
    double sumSquares = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sumSquares += data[i] * data[i];
    }
    return std::sqrt(sumSquares / static_cast<double>(end - begin));
}

/// @brief Largest absolute value
[[nodiscard]] inline double computePeakAbs(const std::vector<double>& data) noexcept {
    double peak = 0.0;
    for (const double x : data) {
        peak = std::max(peak, std::abs(x));
    }
    return peak;
}

} // namespace StatisticalUtils

} // namespace TestUtils
} // namespace DSP
} // namespace Gyro
