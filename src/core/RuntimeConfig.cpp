//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements environment overrides for RuntimeConfig.  Values are matched case
// insensitively; anything unrecognised preserves the compiled-in default.
//
//===----------------------------------------------------------------------===//

#include "core/RuntimeConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace scopeline::core
{

namespace
{

std::string lowered(const char *raw)
{
    std::string v{raw};
    std::transform(v.begin(),
                   v.end(),
                   v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

/// @brief Parse a decimal integer occupying the whole string.
bool parseWhole(const char *raw, long long &out)
{
    char *end = nullptr;
    long long n = std::strtoll(raw, &end, 10);
    if (end == raw || !end || *end != '\0')
        return false;
    out = n;
    return true;
}

} // namespace

RuntimeConfig RuntimeConfig::fromEnvironment()
{
    RuntimeConfig config;
    config.applyEnvironment();
    return config;
}

void RuntimeConfig::applyEnvironment()
{
    if (const char *envPolicy = std::getenv("SCOPELINE_FATAL_POLICY"))
    {
        const std::string v = lowered(envPolicy);
        if (v == "terminate")
            fatalPolicy = FatalPolicy::Terminate;
        else if (v == "throw")
            fatalPolicy = FatalPolicy::Throw;
    }
    if (const char *envCode = std::getenv("SCOPELINE_FATAL_EXIT_CODE"))
    {
        long long n = 0;
        if (parseWhole(envCode, n) && n >= 0 && n <= 255)
            fatalExitCode = static_cast<int>(n);
    }
    if (const char *envDepth = std::getenv("SCOPELINE_MAX_DEPTH"))
    {
        long long n = 0;
        if (parseWhole(envDepth, n) && n >= 0)
            maxDepth = static_cast<std::size_t>(n);
    }
    if (const char *envTrace = std::getenv("SCOPELINE_TRACE_UNWIND"))
    {
        const std::string v = lowered(envTrace);
        // Accept 1/true/on to enable; 0/false/off to disable.
        if (v == "0" || v == "false" || v == "off")
            traceUnwind = false;
        else if (v == "1" || v == "true" || v == "on")
            traceUnwind = true;
    }
}

} // namespace scopeline::core
