// File: examples/finalizers/tracked_handles.cpp
// Purpose: Demonstrate finalizers releasing OS-style handles when their owning
//          objects become unreachable on a tracking heap.

#include "scopeline/Scopeline.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace
{

struct Socket
{
    explicit Socket(int fd) : fd(fd) {}

    scopeline::StableHandle<int> fd;
};

void closeDescriptor(int fd)
{
    std::cout << "finalizer closed fd " << fd << "\n";
}

} // namespace

int main()
{
    scopeline::TrackingHeap heap;

    Socket *listener = heap.allocateRooted<Socket>(3);
    scopeline::bindFinalizer(heap.registry(), listener, listener->fd, closeDescriptor);

    for (int fd = 10; fd < 13; ++fd)
    {
        Socket *client = heap.allocate<Socket>(fd);
        scopeline::bindFinalizer(heap.registry(), client, client->fd, closeDescriptor);
    }

    heap.startBackgroundSweep(std::chrono::milliseconds(10));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    heap.stopBackgroundSweep();
    std::cout << "live objects: " << heap.liveCount() << "\n";

    // Closing explicitly turns the finalizer into a no-op.
    listener->fd.release(closeDescriptor);
    return 0;
}
