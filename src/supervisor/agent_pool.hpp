#pragma once
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace mycelium::supervisor {

// Bounded set of interchangeable children of one capability with
// idle/busy accounting. Owned by one supervisor; not thread-safe.
class AgentPool {
public:
    using Eligible = std::function<bool(const std::string& id)>;

    AgentPool(std::string capability, size_t max_size);

    bool add(const std::string& id);
    bool remove(const std::string& id);
    bool contains(const std::string& id) const;

    // Round-robin over idle members accepted by `eligible`
    std::optional<std::string> next_idle(const Eligible& eligible);

    void mark_busy(const std::string& id);
    void mark_idle(const std::string& id);
    bool is_busy(const std::string& id) const;

    const std::string& capability() const { return capability_; }
    const std::vector<std::string>& members() const { return members_; }
    size_t size() const { return members_.size(); }
    size_t max_size() const { return max_size_; }
    size_t busy_count() const { return busy_.size(); }
    size_t idle_count() const { return members_.size() - busy_.size(); }
    bool full() const { return members_.size() >= max_size_; }
    size_t max_busy_observed() const { return max_busy_observed_; }

private:
    std::string capability_;
    size_t max_size_;
    std::vector<std::string> members_;
    std::unordered_set<std::string> busy_;
    size_t cursor_ = 0;
    size_t max_busy_observed_ = 0;
};

} // namespace mycelium::supervisor
