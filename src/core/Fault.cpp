//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements fault description helpers, supersede bookkeeping, and the fatal
// report formatter.  The report layout follows the single-line trap format of
// the interpreter diagnostics, followed by one indented line for the unwind path
// and one per superseded fault.
//
//===----------------------------------------------------------------------===//

#include "core/Fault.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>

namespace scopeline::core
{

namespace detail
{

/// @brief Describe a payload of a type with no textual form.
/// @details Demangles the type name when the ABI supports it.
std::string describeUnknown(const std::type_info &type)
{
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
    std::string name = (status == 0 && demangled) ? std::string(demangled.get()) : type.name();
    return "<value of type " + name + ">";
}

} // namespace detail

std::string RuntimeFault::description() const
{
    std::string text(toString(kind));
    if (!message.empty())
    {
        text.append(": ");
        text.append(message);
    }
    return text;
}

void supersede(ActiveFault &next, ActiveFault previous)
{
    next.superseded.push_back(SupersededFault{std::move(previous.payload), std::move(previous.path)});
    for (auto &older : previous.superseded)
        next.superseded.push_back(std::move(older));
}

std::string formatUnwindPath(const std::vector<std::string> &path)
{
    if (path.empty())
        return "<none>";
    std::string text;
    for (size_t i = 0; i < path.size(); ++i)
    {
        if (i)
            text.append(" -> ");
        text.append(path[i]);
    }
    return text;
}

std::string formatFaultReport(const ActiveFault &fault)
{
    const std::string_view origin =
        fault.origin.empty() ? std::string_view("<unknown>") : std::string_view(fault.origin);

    std::string result;
    result.reserve(96 + origin.size());
    result.append("Fault @");
    result.append(origin);
    result.append(": ");
    result.append(fault.payload.description());
    result.append("\n  unwind: ");
    result.append(formatUnwindPath(fault.path));
    for (const auto &old : fault.superseded)
    {
        result.append("\n  superseded: ");
        result.append(old.payload.description());
        result.append(" (unwind: ");
        result.append(formatUnwindPath(old.path));
        result.push_back(')');
    }
    return result;
}

UnrecoveredFault::UnrecoveredFault(ActiveFault fault)
    : std::runtime_error(formatFaultReport(fault)), fault_(std::move(fault))
{
}

std::string RecoveredFault::description() const
{
    return "recovered fault: " + payload.description();
}

support::Error faultToError(FaultPayload payload)
{
    if (const auto *err = payload.get<support::Error>())
    {
        if (*err)
            return *err;
    }
    return support::Error(RecoveredFault{std::move(payload)});
}

} // namespace scopeline::core
