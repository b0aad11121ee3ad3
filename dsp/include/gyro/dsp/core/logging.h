// ==============================================================================
// Layer 0: Core Utility - Logging
// ==============================================================================
// Shared spdlog logger for the non-realtime parts of the engine (coefficient
// design, pipeline construction, workbench scenarios, tools).
//
// Per-sample processing paths never log.
// ==============================================================================

#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace Gyro {
namespace DSP {

/// Name under which the engine logger is registered with spdlog
inline constexpr const char* kLoggerName = "gyro-dsp";

/// @brief Engine logger (created on first use, stderr colour sink).
///
/// Default level is warn so that library users only see failures unless they
/// opt in with setLogLevel().
[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

/// @brief Change the engine log level.
inline void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace DSP
} // namespace Gyro
