#include "supervisor/agent_pool.hpp"
#include <algorithm>

namespace mycelium::supervisor {

AgentPool::AgentPool(std::string capability, size_t max_size)
    : capability_(std::move(capability))
    , max_size_(max_size > 0 ? max_size : 1) {}

bool AgentPool::add(const std::string& id) {
    if (full() || contains(id)) {
        return false;
    }
    members_.push_back(id);
    return true;
}

bool AgentPool::remove(const std::string& id) {
    auto it = std::find(members_.begin(), members_.end(), id);
    if (it == members_.end()) {
        return false;
    }
    size_t index = static_cast<size_t>(it - members_.begin());
    members_.erase(it);
    busy_.erase(id);
    if (index < cursor_) {
        cursor_--;
    }
    if (cursor_ >= members_.size()) {
        cursor_ = 0;
    }
    return true;
}

bool AgentPool::contains(const std::string& id) const {
    return std::find(members_.begin(), members_.end(), id) != members_.end();
}

std::optional<std::string> AgentPool::next_idle(const Eligible& eligible) {
    const size_t count = members_.size();
    for (size_t i = 0; i < count; i++) {
        size_t index = (cursor_ + i) % count;
        const auto& id = members_[index];
        if (busy_.count(id) > 0) {
            continue;
        }
        if (eligible && !eligible(id)) {
            continue;
        }
        cursor_ = (index + 1) % count;
        return id;
    }
    return std::nullopt;
}

void AgentPool::mark_busy(const std::string& id) {
    if (!contains(id)) {
        return;
    }
    busy_.insert(id);
    max_busy_observed_ = std::max(max_busy_observed_, busy_.size());
}

void AgentPool::mark_idle(const std::string& id) {
    busy_.erase(id);
}

bool AgentPool::is_busy(const std::string& id) const {
    return busy_.count(id) > 0;
}

} // namespace mycelium::supervisor
