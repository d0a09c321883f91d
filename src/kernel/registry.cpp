#include "kernel/registry.hpp"
#include "util/clock.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mycelium::kernel {

Registry::Registry(DeadLetterStore& dead_letters,
                   size_t default_mailbox_capacity,
                   int64_t failure_window_ms)
    : dead_letters_(dead_letters)
    , default_mailbox_capacity_(default_mailbox_capacity > 0 ? default_mailbox_capacity : 1)
    , failure_window_ms_(failure_window_ms) {}

RegisterResult Registry::register_agent(const AgentIdentity& identity,
                                        const std::string& parent_id,
                                        size_t mailbox_capacity) {
    RegisterResult result;
    if (identity.id.empty()) {
        result.error = ErrorCode::INVALID_IDENTITY;
        result.message = "agent id required";
        return result;
    }

    size_t capacity = mailbox_capacity > 0 ? mailbox_capacity : default_mailbox_capacity_;
    auto mailbox = std::make_shared<Mailbox>(capacity);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (agents_.count(identity.id) > 0) {
            result.error = ErrorCode::DUPLICATE_IDENTITY;
            result.message = "agent '" + identity.id + "' already registered";
            return result;
        }

        Entry entry;
        entry.identity = identity;
        entry.parent_id = parent_id;
        entry.mailbox = mailbox;
        entry.health.last_heartbeat_ms = util::wall_now_ms();
        agents_.emplace(identity.id, std::move(entry));
        order_.push_back(identity.id);
    }

    spdlog::debug("Registered agent '{}' (tier={}, parent='{}', mailbox={})",
        identity.id, runtime::tier_to_string(identity.tier), parent_id, capacity);

    result.success = true;
    result.handle = AgentHandle{identity.id, mailbox};
    return result;
}

size_t Registry::unregister(const std::string& id) {
    std::shared_ptr<Mailbox> mailbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(id);
        if (it == agents_.end()) {
            return 0;
        }
        mailbox = it->second.mailbox;
        agents_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    // Outside the registry lock: draining takes the mailbox lock
    auto pending = mailbox->close_and_drain();
    for (const auto& envelope : pending) {
        dead_letters_.record(envelope, id, DeadLetterReason::AGENT_REMOVED);
    }

    spdlog::debug("Unregistered agent '{}' ({} pending envelopes dead-lettered)", id, pending.size());
    return pending.size();
}

bool Registry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.count(id) > 0;
}

std::vector<std::string> Registry::find_by_capability(const std::string& capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> matches;
    for (const auto& id : order_) {
        if (agents_.at(id).identity.has_capability(capability)) {
            matches.push_back(id);
        }
    }
    return matches;
}

std::vector<std::string> Registry::find_by_tier(Tier tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> matches;
    for (const auto& id : order_) {
        if (agents_.at(id).identity.tier == tier) {
            matches.push_back(id);
        }
    }
    return matches;
}

std::shared_ptr<Mailbox> Registry::mailbox_for(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return nullptr;
    }
    return it->second.mailbox;
}

std::optional<AgentIdentity> Registry::lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second.identity;
}

std::optional<AgentHealth> Registry::health(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second.health;
}

std::string Registry::parent_of(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return {};
    }
    return it->second.parent_id;
}

std::vector<std::string> Registry::children_of(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> children;
    for (const auto& child_id : order_) {
        if (agents_.at(child_id).parent_id == id) {
            children.push_back(child_id);
        }
    }
    return children;
}

std::vector<AgentIdentity> Registry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentIdentity> identities;
    identities.reserve(order_.size());
    for (const auto& id : order_) {
        identities.push_back(agents_.at(id).identity);
    }
    return identities;
}

size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

// ============================================================================
// Health-report path
// ============================================================================

void Registry::heartbeat(const std::string& id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return;
    }
    it->second.health.last_heartbeat_ms = now_ms;
    it->second.stale_notified = false;
}

void Registry::report_state(const std::string& id, AgentState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return;
    }
    it->second.health.state = state;
}

void Registry::report_outcome(const std::string& id, bool success, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return;
    }
    auto& entry = it->second;
    if (!success) {
        entry.failures.push_back(now_ms);
    }
    prune_failures(entry, now_ms);
}

std::vector<StaleAgent> Registry::collect_stale(int64_t now_ms, int64_t threshold_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StaleAgent> stale;
    for (const auto& id : order_) {
        auto& entry = agents_.at(id);
        if (!runtime::is_live_state(entry.health.state) || entry.stale_notified) {
            continue;
        }
        int64_t age = now_ms - entry.health.last_heartbeat_ms;
        if (age > threshold_ms) {
            entry.stale_notified = true;
            stale.push_back(StaleAgent{id, entry.parent_id, entry.health.last_heartbeat_ms, age});
        }
    }
    return stale;
}

// Caller holds mutex_
void Registry::prune_failures(Entry& entry, int64_t now_ms) const {
    while (!entry.failures.empty() && now_ms - entry.failures.front() > failure_window_ms_) {
        entry.failures.pop_front();
    }
    entry.health.failure_count = static_cast<uint32_t>(entry.failures.size());
}

} // namespace mycelium::kernel
