#include "kernel/dead_letter.hpp"
#include "util/clock.hpp"
#include <spdlog/spdlog.h>

namespace mycelium::kernel {

const char* dead_letter_reason_to_string(DeadLetterReason reason) {
    switch (reason) {
        case DeadLetterReason::UNKNOWN_RECIPIENT: return "UnknownRecipient";
        case DeadLetterReason::EXPIRED: return "Expired";
        case DeadLetterReason::AGENT_REMOVED: return "AgentRemoved";
        case DeadLetterReason::AGENT_STOPPED: return "AgentStopped";
        case DeadLetterReason::MAILBOX_FULL: return "MailboxFull";
        case DeadLetterReason::ABANDONED: return "Abandoned";
        case DeadLetterReason::UNDELIVERABLE: return "Undeliverable";
    }
    return "Unknown";
}

DeadLetterStore::DeadLetterStore(size_t max_records)
    : max_records_(max_records > 0 ? max_records : 1) {}

void DeadLetterStore::record(const Envelope& envelope, const std::string& recipient,
                             DeadLetterReason reason, const std::string& detail) {
    spdlog::warn("Dead letter: envelope {} ({}) from '{}' to '{}': {}{}{}",
        envelope.id, message_kind_to_string(envelope.kind), envelope.sender, recipient,
        dead_letter_reason_to_string(reason), detail.empty() ? "" : " - ", detail);

    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(DeadLetterRecord{envelope, recipient, reason, util::wall_now_ms(), detail});
    totals_[static_cast<int>(reason)]++;

    while (records_.size() > max_records_) {
        records_.pop_front();
        evicted_++;
    }
}

std::vector<DeadLetterRecord> DeadLetterStore::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {records_.begin(), records_.end()};
}

std::vector<DeadLetterRecord> DeadLetterStore::records_for(DeadLetterReason reason) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeadLetterRecord> matches;
    for (const auto& rec : records_) {
        if (rec.reason == reason) {
            matches.push_back(rec);
        }
    }
    return matches;
}

size_t DeadLetterStore::count_for_envelope(const std::string& envelope_id,
                                           DeadLetterReason reason) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& rec : records_) {
        if (rec.reason == reason && rec.envelope.id == envelope_id) {
            count++;
        }
    }
    return count;
}

uint64_t DeadLetterStore::total(DeadLetterReason reason) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = totals_.find(static_cast<int>(reason));
    return it == totals_.end() ? 0 : it->second;
}

size_t DeadLetterStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

uint64_t DeadLetterStore::evicted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

void DeadLetterStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    totals_.clear();
    evicted_ = 0;
}

} // namespace mycelium::kernel
