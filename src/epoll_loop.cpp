#include "epoll_loop.h"
#include <unistd.h>
#include <cerrno>
#include <stdexcept>

EpollLoop::EpollLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw std::runtime_error("Failed to create epoll fd");
    }
}

EpollLoop::~EpollLoop() {
    unwatch();
    close(epoll_fd_);
}

bool EpollLoop::watch(int fd, uint32_t events) {
    if (watched_fd_ >= 0 && watched_fd_ != fd) {
        unwatch();
    }
    epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;
    int op = watched_fd_ == fd ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
    if (epoll_ctl(epoll_fd_, op, fd, &ev) != 0) {
        return false;
    }
    watched_fd_ = fd;
    return true;
}

void EpollLoop::unwatch() {
    if (watched_fd_ < 0) {
        return;
    }
    // fails harmlessly when the descriptor is already closed
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, watched_fd_, nullptr);
    watched_fd_ = -1;
}

int64_t EpollLoop::wait(int timeout_ms) {
    if (watched_fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    epoll_event ev{};
    int n = epoll_wait(epoll_fd_, &ev, 1, timeout_ms);
    if (n < 0) {
        // a signal is a cancellation point, not a failure
        return errno == EINTR ? 0 : -1;
    }
    return n == 0 ? 0 : static_cast<int64_t>(ev.events);
}
