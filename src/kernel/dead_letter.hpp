#pragma once
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/envelope.hpp"

namespace mycelium::kernel {

enum class DeadLetterReason {
    UNKNOWN_RECIPIENT,
    EXPIRED,
    AGENT_REMOVED,
    AGENT_STOPPED,
    MAILBOX_FULL,
    ABANDONED,
    UNDELIVERABLE
};

const char* dead_letter_reason_to_string(DeadLetterReason reason);

struct DeadLetterRecord {
    Envelope envelope;
    std::string recipient;
    DeadLetterReason reason;
    int64_t recorded_at_ms = 0;
    std::string detail;
};

// Shared store of envelopes that never reached a handler.
// Retains at most max_records (oldest evicted); per-reason totals are kept
// for the whole lifetime regardless of eviction.
class DeadLetterStore {
public:
    explicit DeadLetterStore(size_t max_records = 10000);

    void record(const Envelope& envelope, const std::string& recipient,
                DeadLetterReason reason, const std::string& detail = "");

    std::vector<DeadLetterRecord> records() const;
    std::vector<DeadLetterRecord> records_for(DeadLetterReason reason) const;
    size_t count_for_envelope(const std::string& envelope_id, DeadLetterReason reason) const;

    uint64_t total(DeadLetterReason reason) const;
    size_t size() const;
    uint64_t evicted() const;
    void clear();

private:
    const size_t max_records_;
    mutable std::mutex mutex_;
    std::deque<DeadLetterRecord> records_;
    std::unordered_map<int, uint64_t> totals_;
    uint64_t evicted_ = 0;
};

} // namespace mycelium::kernel
