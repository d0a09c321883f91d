#include "kernel/mailbox.hpp"

namespace mycelium::kernel {

Mailbox::Mailbox(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

PushResult Mailbox::push(const Envelope& envelope) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return PushResult::CLOSED;
        }
        if (queue_.size() >= capacity_) {
            return PushResult::FULL;
        }
        queue_.push(Entry{envelope, next_seq_++});
    }
    cv_.notify_one();
    return PushResult::ACCEPTED;
}

std::optional<Envelope> Mailbox::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() {
        return !queue_.empty() || closed_ || wake_;
    });

    if (wake_) {
        wake_ = false;
        return std::nullopt;
    }
    if (closed_ || queue_.empty()) {
        return std::nullopt;
    }
    return take_top();
}

std::optional<Envelope> Mailbox::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || queue_.empty()) {
        return std::nullopt;
    }
    return take_top();
}

void Mailbox::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_ = true;
    }
    cv_.notify_all();
}

std::vector<Envelope> Mailbox::close_and_drain() {
    std::vector<Envelope> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        drained.reserve(queue_.size());
        while (!queue_.empty()) {
            drained.push_back(take_top());
        }
    }
    cv_.notify_all();
    return drained;
}

void Mailbox::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
    wake_ = false;
}

bool Mailbox::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Mailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// Caller holds mutex_
Envelope Mailbox::take_top() {
    Envelope envelope = queue_.top().envelope;
    queue_.pop();
    return envelope;
}

} // namespace mycelium::kernel
