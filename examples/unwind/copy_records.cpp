// File: examples/unwind/copy_records.cpp
// Purpose: Demonstrate deferred cleanup, fault recovery at a call boundary and
//          conversion of the recovered fault into an error value.

#include "scopeline/Scopeline.hpp"

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace
{

struct Channel
{
    std::string name;
    bool open = false;
};

void closeChannel(Channel *channel)
{
    channel->open = false;
    std::cout << "closed " << channel->name << "\n";
}

// Copies records; raises on the record marked as corrupt.
scopeline::Expected<int> copyRecords(scopeline::CallStack &stack,
                                     std::mutex &journal,
                                     const std::vector<std::string> &records)
{
    scopeline::Error failure;
    Channel source{"source", false};
    Channel sink{"sink", false};
    const int copied = stack.invoke("copyRecords",
                                    [&](scopeline::Scope &scope) -> int
                                    {
                                        scope.defer(
                                            [&]
                                            {
                                                if (auto payload = scope.recover())
                                                    failure = scopeline::faultToError(*payload);
                                            });

                                        source.open = true;
                                        scope.defer(closeChannel, &source);
                                        sink.open = true;
                                        scope.defer(closeChannel, &sink);

                                        int count = 0;
                                        for (const auto &record : records)
                                        {
                                            stack.invoke("append",
                                                         [&](scopeline::Scope &inner)
                                                         {
                                                             scopeline::lockAndDefer(inner, journal);
                                                             if (record == "corrupt")
                                                                 inner.raise(scopeline::Error::message(
                                                                     "corrupt record after " +
                                                                     std::to_string(count)));
                                                             ++count;
                                                         });
                                        }
                                        return count;
                                    });
    if (failure)
        return scopeline::Error::wrap(failure, "copying records");
    return copied;
}

} // namespace

int main()
{
    scopeline::RuntimeConfig config = scopeline::RuntimeConfig::fromEnvironment();
    scopeline::CallStack stack(config);
    std::mutex journal;

    auto good = copyRecords(stack, journal, {"a", "b", "c"});
    std::cout << "copied " << good.value() << " record(s)\n";

    auto bad = copyRecords(stack, journal, {"a", "corrupt", "c"});
    if (!bad)
        std::cout << "error: " << bad.error().description() << "\n";

    // Journal lock was released on the fault path.
    if (!journal.try_lock())
        return 1;
    journal.unlock();
    return 0;
}
