#include "kernel/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace mycelium::kernel {

Reactor::Reactor() = default;

Reactor::~Reactor() {
    for (int fd : timers_) {
        close(fd);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll: {}", strerror(errno));
        return false;
    }
    spdlog::debug("Reactor ready (epoll_fd={})", epoll_fd_);
    return true;
}

bool Reactor::add(int fd, uint32_t events, EventCallback callback) {
    if (epoll_fd_ < 0) {
        spdlog::error("Reactor not initialized, cannot watch fd {}", fd);
        return false;
    }
    if (callbacks_.count(fd) > 0) {
        spdlog::warn("fd {} is already watched", fd);
        return false;
    }

    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("Failed to watch fd {}: {}", fd, strerror(errno));
        return false;
    }

    callbacks_[fd] = std::move(callback);
    spdlog::debug("Watching fd {} (events=0x{:x})", fd, events);
    return true;
}

int Reactor::add_timer(int interval_ms, TimerCallback callback) {
    int fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        spdlog::error("Failed to create timerfd: {}", strerror(errno));
        return -1;
    }

    struct itimerspec spec;
    std::memset(&spec, 0, sizeof(spec));
    spec.it_interval.tv_sec = interval_ms / 1000;
    spec.it_interval.tv_nsec = static_cast<long>(interval_ms % 1000) * 1000000L;
    spec.it_value = spec.it_interval;

    if (timerfd_settime(fd, 0, &spec, nullptr) < 0) {
        spdlog::error("Failed to arm timerfd: {}", strerror(errno));
        close(fd);
        return -1;
    }

    bool added = add(fd, EPOLLIN, [callback = std::move(callback)](int tfd, uint32_t) {
        uint64_t expirations = 0;
        if (read(tfd, &expirations, sizeof(expirations)) == sizeof(expirations)) {
            callback();
        }
    });
    if (!added) {
        close(fd);
        return -1;
    }

    timers_.push_back(fd);
    spdlog::debug("Armed timer fd {} ({}ms)", fd, interval_ms);
    return fd;
}

bool Reactor::remove(int fd) {
    if (callbacks_.erase(fd) == 0) {
        return false;
    }

    // EBADF/ENOENT: the owner already closed the fd
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0 && errno != ENOENT && errno != EBADF) {
        spdlog::warn("Failed to unwatch fd {}: {}", fd, strerror(errno));
    }

    auto timer = std::find(timers_.begin(), timers_.end(), fd);
    if (timer != timers_.end()) {
        timers_.erase(timer);
        close(fd);
    }
    spdlog::debug("Stopped watching fd {}", fd);
    return true;
}

int Reactor::poll(int timeout_ms) {
    constexpr int kMaxEvents = 64;
    struct epoll_event ready[kMaxEvents];

    int n = epoll_wait(epoll_fd_, ready, kMaxEvents, timeout_ms);
    if (n < 0) {
        // Signals (SIGINT/SIGTERM) land here on the way to shutdown
        if (errno == EINTR) {
            return 0;
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    for (int i = 0; i < n; i++) {
        int fd = ready[i].data.fd;
        auto it = callbacks_.find(fd);
        if (it == callbacks_.end()) {
            continue;   // removed by an earlier callback in this batch
        }
        // Copy: the callback may remove its own fd
        EventCallback callback = it->second;
        callback(fd, ready[i].events);
    }

    return n;
}

} // namespace mycelium::kernel
