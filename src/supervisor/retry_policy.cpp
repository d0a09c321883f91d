#include "supervisor/retry_policy.hpp"
#include <algorithm>

namespace mycelium::supervisor {

const char* retry_owner_to_string(RetryOwner owner) {
    switch (owner) {
        case RetryOwner::SUPERVISOR: return "supervisor";
        case RetryOwner::ESCALATE: return "escalate";
    }
    return "unknown";
}

std::optional<RetryOwner> retry_owner_from_string(const std::string& str) {
    if (str == "supervisor") return RetryOwner::SUPERVISOR;
    if (str == "escalate") return RetryOwner::ESCALATE;
    return std::nullopt;
}

RetryPolicy::RetryPolicy(RetryConfig config)
    : config_(config) {}

int64_t RetryPolicy::delay_for(uint32_t attempt) const {
    if (attempt == 0) {
        return 0;
    }
    int64_t delay = std::max<int64_t>(config_.base_delay_ms, 1);
    for (uint32_t i = 1; i < attempt && delay < config_.max_delay_ms; i++) {
        delay *= 2;
    }
    return std::min(delay, config_.max_delay_ms);
}

bool RetryPolicy::should_retry(bool retryable, uint32_t retries_so_far) const {
    return retryable &&
           config_.owner == RetryOwner::SUPERVISOR &&
           retries_so_far < config_.max_retries;
}

} // namespace mycelium::supervisor
