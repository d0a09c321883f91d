#pragma once
#include <functional>
#include <unordered_map>
#include <cstdint>
#include <vector>

namespace mycelium::kernel {

// Event callback: (fd, events) -> void
using EventCallback = std::function<void(int fd, uint32_t events)>;

// Periodic timer callback
using TimerCallback = std::function<void()>;

// Single-threaded epoll loop driving the kernel's sockets and timers
class Reactor {
public:
    Reactor();
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    // Initialize epoll
    bool init();

    // Watch fd; false if it is already watched or epoll refuses it
    bool add(int fd, uint32_t events, EventCallback callback);

    // Arm a periodic timerfd (returns the fd, -1 on failure). The reactor owns the fd.
    int add_timer(int interval_ms, TimerCallback callback);

    // Stop watching fd; timers armed by add_timer are closed too.
    // False if fd was not watched.
    bool remove(int fd);

    // Run one iteration of event loop
    // timeout_ms: -1 = block forever, 0 = return immediately
    int poll(int timeout_ms = -1);

    size_t watched() const { return callbacks_.size(); }

private:
    int epoll_fd_ = -1;
    std::unordered_map<int, EventCallback> callbacks_;
    std::vector<int> timers_;
};

} // namespace mycelium::kernel
