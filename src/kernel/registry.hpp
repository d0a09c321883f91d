#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/dead_letter.hpp"
#include "kernel/errors.hpp"
#include "kernel/mailbox.hpp"
#include "runtime/agent/types.hpp"

namespace mycelium::kernel {

using runtime::AgentIdentity;
using runtime::AgentState;
using runtime::Tier;

// Liveness view of one agent. Mutated only through the health-report path.
struct AgentHealth {
    int64_t last_heartbeat_ms = 0;
    AgentState state = AgentState::CREATED;
    uint32_t failure_count = 0;   // failures within the rolling window
};

// What the owner of a registration holds
struct AgentHandle {
    std::string id;
    std::shared_ptr<Mailbox> mailbox;
};

struct RegisterResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;
    AgentHandle handle;
};

// An agent whose heartbeat exceeded the staleness threshold
struct StaleAgent {
    std::string id;
    std::string parent_id;
    int64_t last_heartbeat_ms = 0;
    int64_t stale_ms = 0;
};

/**
 * Capability-indexed directory of live agents.
 *
 * Explicitly constructed and passed by reference. Every index mutation
 * completes under one critical section; the registry lock is never held
 * while a mailbox lock is taken.
 */
class Registry {
public:
    Registry(DeadLetterStore& dead_letters,
             size_t default_mailbox_capacity = 1024,
             int64_t failure_window_ms = 60000);

    // Non-copyable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // mailbox_capacity == 0 uses the default capacity
    RegisterResult register_agent(const AgentIdentity& identity,
                                  const std::string& parent_id = "",
                                  size_t mailbox_capacity = 0);

    // Removes all index entries and dead-letters pending envelopes as AGENT_REMOVED.
    // Returns the number of envelopes dead-lettered.
    size_t unregister(const std::string& id);

    bool contains(const std::string& id) const;
    std::vector<std::string> find_by_capability(const std::string& capability) const;
    std::vector<std::string> find_by_tier(Tier tier) const;
    std::shared_ptr<Mailbox> mailbox_for(const std::string& id) const;
    std::optional<AgentIdentity> lookup(const std::string& id) const;
    std::optional<AgentHealth> health(const std::string& id) const;
    std::string parent_of(const std::string& id) const;
    std::vector<std::string> children_of(const std::string& id) const;
    std::vector<AgentIdentity> snapshot() const;
    size_t size() const;

    // ========================================================================
    // Health-report path
    // ========================================================================

    void heartbeat(const std::string& id, int64_t now_ms);
    void report_state(const std::string& id, AgentState state);
    void report_outcome(const std::string& id, bool success, int64_t now_ms);

    // Live agents whose heartbeat is older than threshold_ms. Each agent is
    // returned once per stale episode; a fresh heartbeat re-arms it.
    std::vector<StaleAgent> collect_stale(int64_t now_ms, int64_t threshold_ms);

    DeadLetterStore& dead_letters() { return dead_letters_; }

private:
    struct Entry {
        AgentIdentity identity;
        std::string parent_id;
        std::shared_ptr<Mailbox> mailbox;
        AgentHealth health;
        std::deque<int64_t> failures;
        bool stale_notified = false;
    };

    void prune_failures(Entry& entry, int64_t now_ms) const;

    DeadLetterStore& dead_letters_;
    const size_t default_mailbox_capacity_;
    const int64_t failure_window_ms_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> agents_;
    std::vector<std::string> order_;
};

} // namespace mycelium::kernel
