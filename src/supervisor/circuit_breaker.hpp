#pragma once
#include <cstdint>
#include <string>
#include "util/clock.hpp"

namespace mycelium::supervisor {

enum class BreakerState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

const char* breaker_state_to_string(BreakerState state);

struct BreakerConfig {
    uint32_t failure_threshold = 3;   // consecutive failures before opening
    int64_t open_timeout_ms = 5000;   // time spent OPEN before one trial
};

// Breaker for one (supervisor, child) pair. Owned and driven by the
// supervisor's thread only.
class CircuitBreaker {
public:
    explicit CircuitBreaker(BreakerConfig config = {});

    // Admission check for a route. In OPEN past the timeout this moves to
    // HALF_OPEN and claims the single trial.
    bool allow(util::TimePoint now);

    // Same decision as allow() without claiming anything
    bool would_allow(util::TimePoint now) const;

    void record_success();
    void record_failure(util::TimePoint now);

    BreakerState state() const { return state_; }
    uint32_t consecutive_failures() const { return consecutive_failures_; }
    util::TimePoint open_until() const { return open_until_; }
    uint32_t times_opened() const { return times_opened_; }

private:
    void open(util::TimePoint now);

    BreakerConfig config_;
    BreakerState state_ = BreakerState::CLOSED;
    uint32_t consecutive_failures_ = 0;
    util::TimePoint open_until_{};
    bool trial_in_flight_ = false;
    uint32_t times_opened_ = 0;
};

} // namespace mycelium::supervisor
