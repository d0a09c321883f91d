#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace mycelium::supervisor {

// Who retries a retryable child failure
enum class RetryOwner {
    SUPERVISOR,   // retry here up to max_retries, then escalate
    ESCALATE      // forward the failure upward immediately
};

const char* retry_owner_to_string(RetryOwner owner);
std::optional<RetryOwner> retry_owner_from_string(const std::string& str);

struct RetryConfig {
    uint32_t max_retries = 3;
    int64_t base_delay_ms = 100;
    int64_t max_delay_ms = 10000;
    RetryOwner owner = RetryOwner::SUPERVISOR;
};

class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {});

    // Delay before retry number `attempt` (1-based): base * 2^(attempt-1), capped
    int64_t delay_for(uint32_t attempt) const;

    bool should_retry(bool retryable, uint32_t retries_so_far) const;

    const RetryConfig& config() const { return config_; }

private:
    RetryConfig config_;
};

} // namespace mycelium::supervisor
