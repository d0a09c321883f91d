#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>
#include "kernel/envelope.hpp"

namespace mycelium::kernel {

enum class PushResult {
    ACCEPTED,
    FULL,    // capacity reached; the caller applies backpressure
    CLOSED   // owner stopped or was removed
};

// Bounded, priority-ordered queue of envelopes for one agent.
// Higher priority first; equal priority keeps enqueue order.
// Only the bus pushes; only the owning runtime pops.
class Mailbox {
public:
    explicit Mailbox(size_t capacity);

    // Non-copyable
    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    PushResult push(const Envelope& envelope);

    // Blocks up to timeout. Returns nullopt on timeout, close, or interrupt().
    std::optional<Envelope> pop(std::chrono::milliseconds timeout);
    std::optional<Envelope> try_pop();

    // Wake a blocked pop() without closing the mailbox
    void interrupt();

    // Reject further pushes and hand back everything still queued
    std::vector<Envelope> close_and_drain();
    void reopen();

    bool closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    struct Entry {
        Envelope envelope;
        uint64_t seq;
    };

    struct Order {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.envelope.priority != b.envelope.priority) {
                return a.envelope.priority < b.envelope.priority;
            }
            return a.seq > b.seq;
        }
    };

    Envelope take_top();

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, Order> queue_;
    uint64_t next_seq_ = 0;
    bool closed_ = false;
    bool wake_ = false;
};

} // namespace mycelium::kernel
