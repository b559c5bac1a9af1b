//===----------------------------------------------------------------------===//
//
// Part of the Scopeline project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/ErrorValueTests.cpp
// Purpose: Validate the error value protocol: descriptions, kind checks,
//          identity comparison, wrapping, Expected results and fault conversion.
// Key invariants: Errors are ordinary values; they never unwind on their own.
// Ownership/Lifetime: Values are local to each test.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "core/CallStack.hpp"
#include "support/Error.hpp"
#include "support/Expected.hpp"

#include <stdexcept>
#include <string>

using scopeline::support::Error;
using scopeline::support::errorAs;
using scopeline::support::errorIs;
using scopeline::support::Expected;
using scopeline::support::isErrorValue;
using scopeline::support::MessageError;
using scopeline::support::WrappedError;

namespace
{
struct NotFound
{
    std::string path;

    std::string description() const
    {
        return "not found: " + path;
    }
};

struct QueryFailed
{
    std::string query;
    Error cause;

    std::string description() const
    {
        return "query '" + query + "' failed";
    }

    Error unwrap() const
    {
        return cause;
    }
};

struct NoDescription
{
    int code = 0;
};

static_assert(isErrorValue<NotFound>);
static_assert(isErrorValue<QueryFailed>);
static_assert(isErrorValue<MessageError>);
static_assert(!isErrorValue<NoDescription>);
static_assert(!isErrorValue<int>);

Expected<int> parsePort(const std::string &text)
{
    if (text.empty())
        return Error::message("empty port");
    return std::stoi(text);
}

Expected<void> openConfig(const std::string &path)
{
    if (path != "app.conf")
        return Error(NotFound{path});
    return {};
}
} // namespace

TEST(ErrorValue, DefaultErrorMeansNoError)
{
    Error none;
    EXPECT_TRUE(none.isNone());
    EXPECT_FALSE(static_cast<bool>(none));
    EXPECT_EQ(none.description(), "");
    EXPECT_EQ(none.kind(), std::type_index(typeid(void)));
    EXPECT_TRUE(none.unwrap().isNone());
}

TEST(ErrorValue, DescribesUserDefinedKind)
{
    Error err = NotFound{"/etc/app.conf"};
    ASSERT_FALSE(err.isNone());
    EXPECT_EQ(err.description(), "not found: /etc/app.conf");
    EXPECT_TRUE(err.is<NotFound>());
    EXPECT_FALSE(err.is<MessageError>());
    EXPECT_EQ(err.kind(), std::type_index(typeid(NotFound)));
}

TEST(ErrorValue, DowncastReturnsNullOnMismatch)
{
    Error err = Error::message("boom");
    ASSERT_NE(err.as<MessageError>(), nullptr);
    EXPECT_EQ(err.as<MessageError>()->text, "boom");
    EXPECT_EQ(err.as<NotFound>(), nullptr);
}

TEST(ErrorValue, ComparesByIdentity)
{
    const Error eof = Error::message("end of input");
    const Error copy = eof;
    const Error lookalike = Error::message("end of input");
    EXPECT_EQ(eof, copy);
    EXPECT_NE(eof, lookalike);
    EXPECT_EQ(Error(), Error());
}

TEST(ErrorValue, WrapAddsContextAndKeepsCause)
{
    const Error root = NotFound{"db.sqlite"};
    const Error wrapped = Error::wrap(root, "opening store");
    EXPECT_EQ(wrapped.description(), "opening store: not found: db.sqlite");
    EXPECT_TRUE(wrapped.is<WrappedError>());
    EXPECT_EQ(wrapped.unwrap(), root);
}

TEST(ErrorValue, ErrorIsWalksUnwrapChain)
{
    const Error root = Error::message("timeout");
    const Error middle = QueryFailed{"SELECT 1", root};
    const Error outer = Error::wrap(middle, "loading users");

    EXPECT_TRUE(errorIs(outer, root));
    EXPECT_TRUE(errorIs(outer, middle));
    EXPECT_TRUE(errorIs(outer, outer));
    EXPECT_FALSE(errorIs(outer, Error::message("timeout")));
    EXPECT_FALSE(errorIs(outer, Error()));
    EXPECT_TRUE(errorIs(Error(), Error()));
}

TEST(ErrorValue, ErrorAsFindsFirstMatchingKind)
{
    const Error outer = Error::wrap(QueryFailed{"SELECT 1", NotFound{"users"}}, "loading users");

    const QueryFailed *query = errorAs<QueryFailed>(outer);
    ASSERT_NE(query, nullptr);
    EXPECT_EQ(query->query, "SELECT 1");

    const NotFound *missing = errorAs<NotFound>(outer);
    ASSERT_NE(missing, nullptr);
    EXPECT_EQ(missing->path, "users");

    EXPECT_EQ(errorAs<NoDescription>(outer), nullptr);
}

TEST(ErrorValue, ExpectedCarriesValueOrError)
{
    Expected<int> ok = parsePort("8080");
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), 8080);
    EXPECT_TRUE(ok.error().isNone());

    Expected<int> bad = parsePort("");
    ASSERT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().description(), "empty port");

    EXPECT_THROW(Expected<int>{Error()}, std::invalid_argument);
}

TEST(ErrorValue, ExpectedVoidReportsOutcome)
{
    EXPECT_TRUE(openConfig("app.conf").hasValue());

    Expected<void> failed = openConfig("other.conf");
    ASSERT_FALSE(failed);
    ASSERT_NE(failed.error().as<NotFound>(), nullptr);
    EXPECT_EQ(failed.error().as<NotFound>()->path, "other.conf");
}

TEST(ErrorValue, ErrorsDoNotUnwindWhenReturned)
{
    scopeline::core::RuntimeConfig config;
    config.fatalPolicy = scopeline::core::FatalPolicy::Throw;
    scopeline::core::CallStack stack(config);

    bool cleaned = false;
    const Expected<void> result = stack.invoke("parse",
                                               [&](scopeline::core::Scope &scope) -> Expected<void>
                                               {
                                                   scope.defer([&] { cleaned = true; });
                                                   return Error::message("bad input");
                                               });
    EXPECT_TRUE(cleaned);
    EXPECT_EQ(stack.depth(), 0u);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().description(), "bad input");
}

TEST(ErrorValue, ErrorPayloadRaisedAndRecoveredKeepsIdentity)
{
    scopeline::core::RuntimeConfig config;
    config.fatalPolicy = scopeline::core::FatalPolicy::Throw;
    scopeline::core::CallStack stack(config);

    const Error sentinel = Error::message("connection reset");
    Error recovered;
    stack.invoke("io",
                 [&](scopeline::core::Scope &scope)
                 {
                     scope.defer(
                         [&]
                         {
                             if (auto payload = scope.recover())
                                 recovered = scopeline::core::faultToError(*payload);
                         });
                     scope.raise(sentinel);
                 });
    EXPECT_EQ(recovered, sentinel);
    EXPECT_TRUE(errorIs(Error::wrap(recovered, "reading"), sentinel));
}

TEST(ErrorValue, NonErrorPayloadBecomesRecoveredFault)
{
    const Error err = scopeline::core::faultToError(scopeline::core::FaultPayload(404));
    const auto *fault = err.as<scopeline::core::RecoveredFault>();
    ASSERT_NE(fault, nullptr);
    EXPECT_TRUE(fault->payload.holds<int>());
    EXPECT_EQ(err.description(), "recovered fault: 404");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
