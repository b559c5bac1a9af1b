//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the levelled stderr logger.  The threshold is read lazily from the
// SCOPELINE_LOG_LEVEL environment variable and may be replaced at runtime.
// Each message is assembled into a single buffer before it is written so lines
// from concurrent threads (for example a background finalizer sweep) do not
// interleave mid-line.
//
//===----------------------------------------------------------------------===//

#include "support/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>

namespace scopeline::support
{

namespace
{

constexpr int32_t kUninitialised = -1;

std::atomic<int32_t> gLevel{kUninitialised};

/// @brief Resolve the initial threshold from the environment.
/// @details Falls back to Info when the variable is absent or malformed.
LogLevel initialLevel()
{
    if (const char *env = std::getenv("SCOPELINE_LOG_LEVEL"))
    {
        if (auto parsed = parseLogLevel(env))
            return *parsed;
    }
    return LogLevel::Info;
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(),
                   lowered.end(),
                   lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "debug" || lowered == "0")
        return LogLevel::Debug;
    if (lowered == "info" || lowered == "1")
        return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning" || lowered == "2")
        return LogLevel::Warn;
    if (lowered == "error" || lowered == "3")
        return LogLevel::Error;
    if (lowered == "off" || lowered == "none" || lowered == "4")
        return LogLevel::Off;
    return std::nullopt;
}

LogLevel logLevel()
{
    int32_t raw = gLevel.load(std::memory_order_relaxed);
    if (raw == kUninitialised)
    {
        int32_t resolved = static_cast<int32_t>(initialLevel());
        // Another thread may have raced us; keep whichever value landed first.
        if (!gLevel.compare_exchange_strong(raw, resolved, std::memory_order_relaxed))
            return static_cast<LogLevel>(raw);
        return static_cast<LogLevel>(resolved);
    }
    return static_cast<LogLevel>(raw);
}

void setLogLevel(LogLevel level)
{
    gLevel.store(static_cast<int32_t>(level), std::memory_order_relaxed);
}

bool logEnabled(LogLevel level)
{
    if (level == LogLevel::Off)
        return false;
    return static_cast<int32_t>(level) >= static_cast<int32_t>(logLevel());
}

void log(LogLevel level, std::string_view component, std::string_view message)
{
    if (!logEnabled(level))
        return;

    std::time_t now = std::time(nullptr);
    std::tm parts{};
    localtime_r(&now, &parts);
    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &parts);

    std::string line;
    line.reserve(32 + component.size() + message.size());
    line.push_back('[');
    line.append(toString(level));
    line.append("] ");
    line.append(stamp);
    if (!component.empty())
    {
        line.append(" [");
        line.append(component);
        line.push_back(']');
    }
    line.push_back(' ');
    line.append(message);
    line.push_back('\n');
    std::fwrite(line.data(), 1, line.size(), stderr);
}

} // namespace scopeline::support
