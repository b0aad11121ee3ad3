// ==============================================================================
// Layer 0: Core Utility - Filter Error Codes and Result Type
// ==============================================================================
// Error reporting for filter design, analysis and pipeline construction.
//
// The library never throws. Operations that can fail return FilterResult<T>,
// which carries either a value or a FilterError code. Validation happens when
// coefficients, filters or pipelines are created, never per sample.
// ==============================================================================

#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

namespace Gyro {
namespace DSP {

// =============================================================================
// FilterError
// =============================================================================

/// @brief Reasons a design, analysis or pipeline operation can fail.
enum class FilterError : uint8_t {
    None,                ///< Success
    InvalidParameter,    ///< Non-positive rate/Q, cutoff >= Nyquist, empty buffer, ...
    DivisionByZero,      ///< Notch Q formula with center == cutoff
    NumericInstability   ///< Non-finite or unstable coefficients, non-finite samples
};

/// @brief Stable name of an error code (for logs and tool output).
[[nodiscard]] constexpr std::string_view toString(FilterError error) noexcept {
    switch (error) {
        case FilterError::None:               return "None";
        case FilterError::InvalidParameter:   return "InvalidParameter";
        case FilterError::DivisionByZero:     return "DivisionByZero";
        case FilterError::NumericInstability: return "NumericInstability";
    }
    return "Unknown";
}

// =============================================================================
// FilterResult
// =============================================================================

/// @brief Value-or-error result of a fallible operation.
///
/// @code
/// auto coeffs = BiquadCoefficients::design(BiquadResponse::Lowpass, 100.0, 4000.0, kButterworthQ);
/// if (!coeffs) {
///     logger()->warn("design failed: {}", toString(coeffs.error));
///     return;
/// }
/// Biquad filter(coeffs.value);
/// @endcode
template <typename T>
struct FilterResult {
    T value{};                              ///< Valid only when error == None
    FilterError error = FilterError::None;  ///< Failure reason

    [[nodiscard]] static FilterResult success(T v) {
        return FilterResult{std::move(v), FilterError::None};
    }

    [[nodiscard]] static FilterResult failure(FilterError e) {
        return FilterResult{T{}, e};
    }

    /// @brief True if the operation succeeded
    [[nodiscard]] bool ok() const noexcept { return error == FilterError::None; }

    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }
};

} // namespace DSP
} // namespace Gyro
