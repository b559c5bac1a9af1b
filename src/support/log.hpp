//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/log.hpp
// Purpose: Levelled diagnostic logging shared by the unwinder and finalizers.
// Key invariants: Messages below the active level are never formatted or written.
//                 Output lines have the form "[LEVEL] HH:MM:SS [component] message".
// Ownership/Lifetime: Process-wide level held in an atomic; no other state.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace scopeline::support
{

/// @brief Severity levels ordered from most to least verbose.
enum class LogLevel : int32_t
{
    Debug = 0, ///< Detailed unwind tracing.
    Info = 1,  ///< General informational messages (default threshold).
    Warn = 2,  ///< Suspicious but tolerated conditions.
    Error = 3, ///< Failures such as fatal faults or throwing finalizers.
    Off = 4,   ///< Disable all logging.
};

/// @brief Stable upper-case name for @p level.
constexpr std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Off:
            return "OFF";
    }
    return "OFF";
}

/// @brief Parse a level from text such as "debug", "WARN" or "2".
/// @return Parsed level, or std::nullopt for unrecognised input.
std::optional<LogLevel> parseLogLevel(std::string_view text);

/// @brief Current threshold. Initialised from SCOPELINE_LOG_LEVEL on first use.
LogLevel logLevel();

/// @brief Replace the current threshold.
void setLogLevel(LogLevel level);

/// @brief Check whether a message at @p level would be written.
bool logEnabled(LogLevel level);

/// @brief Write one line to stderr when @p level is enabled.
/// @param level Message severity.
/// @param component Short subsystem tag, e.g. "unwind" or "finalizer".
/// @param message Message text without trailing newline.
void log(LogLevel level, std::string_view component, std::string_view message);

} // namespace scopeline::support
