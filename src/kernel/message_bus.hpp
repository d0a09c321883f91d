#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "kernel/dead_letter.hpp"
#include "kernel/envelope.hpp"
#include "kernel/errors.hpp"
#include "kernel/registry.hpp"

namespace mycelium::kernel {

struct DeliveryFailure {
    std::string recipient;
    ErrorCode error = ErrorCode::NONE;
};

// Per-recipient outcome of a send. Failures are independent per recipient.
struct SendResult {
    size_t delivered = 0;
    std::vector<DeliveryFailure> failures;

    bool success() const { return delivered > 0 && failures.empty(); }

    // First failure code, NONE when everything was delivered
    ErrorCode first_error() const {
        return failures.empty() ? ErrorCode::NONE : failures.front().error;
    }
};

// Best-effort local delivery into registry mailboxes.
// Anything that cannot be delivered is recorded in the dead-letter store.
class MessageBus {
public:
    MessageBus(Registry& registry, DeadLetterStore& dead_letters);

    // Non-copyable
    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    SendResult send(const Envelope& envelope);

    // One copy (same id) to every registered agent of the tier
    SendResult broadcast(Tier tier, const Envelope& envelope);

    Registry& registry() { return registry_; }
    DeadLetterStore& dead_letters() { return dead_letters_; }

    uint64_t delivered_count() const { return delivered_count_; }
    uint64_t failed_count() const { return failed_count_; }

private:
    ErrorCode deliver(const Envelope& envelope, const std::string& recipient, int64_t now_ms);
    ErrorCode push_to(Mailbox& mailbox, const Envelope& envelope, const std::string& recipient);

    Registry& registry_;
    DeadLetterStore& dead_letters_;
    std::atomic<uint64_t> delivered_count_{0};
    std::atomic<uint64_t> failed_count_{0};
};

} // namespace mycelium::kernel
