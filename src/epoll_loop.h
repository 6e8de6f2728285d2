#pragma once
#include <sys/epoll.h>
#include <cstdint>

// Waits for readiness on one descriptor with a timeout. The serial port
// uses it so a read or a stalled write never blocks longer than the caller
// allows.
class EpollLoop {
public:
    EpollLoop();
    ~EpollLoop();

    EpollLoop(const EpollLoop &) = delete;
    EpollLoop &operator=(const EpollLoop &) = delete;

    // Registers `fd` for `events`, or switches the interest set when `fd`
    // is already watched. False on failure (errno set).
    bool watch(int fd, uint32_t events);
    void unwatch();

    // Ready event bits, 0 on timeout or signal, -1 on error (errno set).
    int64_t wait(int timeout_ms);

private:
    int epoll_fd_{-1};
    int watched_fd_{-1};
};
