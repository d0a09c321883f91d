#include "kernel/message_bus.hpp"
#include "util/clock.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mycelium::kernel {

MessageBus::MessageBus(Registry& registry, DeadLetterStore& dead_letters)
    : registry_(registry)
    , dead_letters_(dead_letters) {}

SendResult MessageBus::send(const Envelope& envelope) {
    SendResult result;
    if (envelope.recipients.empty()) {
        dead_letters_.record(envelope, "", DeadLetterReason::UNDELIVERABLE, "no recipients");
        result.failures.push_back(DeliveryFailure{"", ErrorCode::UNKNOWN_RECIPIENT});
        failed_count_++;
        return result;
    }

    int64_t now_ms = util::wall_now_ms();
    std::vector<std::string> seen;
    seen.reserve(envelope.recipients.size());

    for (const auto& recipient : envelope.recipients) {
        // Recipients form an ordered set
        if (std::find(seen.begin(), seen.end(), recipient) != seen.end()) {
            continue;
        }
        seen.push_back(recipient);

        ErrorCode error = deliver(envelope, recipient, now_ms);
        if (error == ErrorCode::NONE) {
            result.delivered++;
            delivered_count_++;
        } else {
            result.failures.push_back(DeliveryFailure{recipient, error});
            failed_count_++;
        }
    }
    return result;
}

SendResult MessageBus::broadcast(Tier tier, const Envelope& envelope) {
    Envelope copy = envelope;
    copy.recipients = registry_.find_by_tier(tier);
    if (copy.recipients.empty()) {
        spdlog::debug("Broadcast {} to tier {}: no agents registered",
            envelope.id, runtime::tier_to_string(tier));
        return SendResult{};
    }
    return send(copy);
}

ErrorCode MessageBus::deliver(const Envelope& envelope, const std::string& recipient, int64_t now_ms) {
    if (envelope.is_expired(now_ms)) {
        dead_letters_.record(envelope, recipient, DeadLetterReason::EXPIRED, "ttl elapsed before enqueue");
        return ErrorCode::EXPIRED;
    }

    auto mailbox = registry_.mailbox_for(recipient);
    if (!mailbox) {
        dead_letters_.record(envelope, recipient, DeadLetterReason::UNKNOWN_RECIPIENT);
        return ErrorCode::UNKNOWN_RECIPIENT;
    }

    // Mailbox ordering assumes the priority band
    if (envelope.priority != clamp_priority(envelope.priority)) {
        Envelope clamped = envelope;
        clamped.priority = clamp_priority(envelope.priority);
        return push_to(*mailbox, clamped, recipient);
    }
    return push_to(*mailbox, envelope, recipient);
}

ErrorCode MessageBus::push_to(Mailbox& mailbox, const Envelope& envelope, const std::string& recipient) {
    switch (mailbox.push(envelope)) {
        case PushResult::ACCEPTED:
            return ErrorCode::NONE;
        case PushResult::FULL:
            dead_letters_.record(envelope, recipient, DeadLetterReason::MAILBOX_FULL,
                "capacity " + std::to_string(mailbox.capacity()));
            return ErrorCode::MAILBOX_FULL;
        case PushResult::CLOSED:
            dead_letters_.record(envelope, recipient, DeadLetterReason::AGENT_STOPPED);
            return ErrorCode::AGENT_STOPPED;
    }
    return ErrorCode::UNAVAILABLE;
}

} // namespace mycelium::kernel
