//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the non-template parts of the error value protocol: message and
// wrapping constructors, description access, and chain traversal by identity.
//
//===----------------------------------------------------------------------===//

#include "support/Error.hpp"

namespace scopeline::support
{

Error Error::message(std::string text)
{
    return Error(MessageError{std::move(text)});
}

Error Error::wrap(Error cause, std::string context)
{
    return Error(WrappedError{std::move(context), std::move(cause)});
}

std::string Error::description() const
{
    if (!model_)
        return std::string();
    return model_->description();
}

std::type_index Error::kind() const noexcept
{
    if (!model_)
        return std::type_index(typeid(void));
    return model_->type();
}

Error Error::unwrap() const
{
    if (!model_)
        return Error();
    return model_->unwrap();
}

std::string WrappedError::description() const
{
    if (!cause)
        return context;
    if (context.empty())
        return cause.description();
    return context + ": " + cause.description();
}

/// @brief Identity search along the unwrap chain.
/// @details Two empty errors compare equal, so searching for the "no error"
///          value only matches an empty @p err.
bool errorIs(const Error &err, const Error &target)
{
    if (!target)
        return !err;
    for (Error cur = err; cur; cur = cur.unwrap())
    {
        if (cur == target)
            return true;
    }
    return false;
}

} // namespace scopeline::support
