#include "supervisor/circuit_breaker.hpp"
#include <chrono>

namespace mycelium::supervisor {

const char* breaker_state_to_string(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED: return "closed";
        case BreakerState::OPEN: return "open";
        case BreakerState::HALF_OPEN: return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(BreakerConfig config)
    : config_(config) {
    if (config_.failure_threshold == 0) {
        config_.failure_threshold = 1;
    }
}

bool CircuitBreaker::allow(util::TimePoint now) {
    switch (state_) {
        case BreakerState::CLOSED:
            return true;
        case BreakerState::OPEN:
            if (now < open_until_) {
                return false;
            }
            state_ = BreakerState::HALF_OPEN;
            trial_in_flight_ = true;
            return true;
        case BreakerState::HALF_OPEN:
            if (trial_in_flight_) {
                return false;
            }
            trial_in_flight_ = true;
            return true;
    }
    return false;
}

bool CircuitBreaker::would_allow(util::TimePoint now) const {
    switch (state_) {
        case BreakerState::CLOSED:
            return true;
        case BreakerState::OPEN:
            return now >= open_until_;
        case BreakerState::HALF_OPEN:
            return !trial_in_flight_;
    }
    return false;
}

void CircuitBreaker::record_success() {
    state_ = BreakerState::CLOSED;
    consecutive_failures_ = 0;
    trial_in_flight_ = false;
}

void CircuitBreaker::record_failure(util::TimePoint now) {
    consecutive_failures_++;

    switch (state_) {
        case BreakerState::CLOSED:
            if (consecutive_failures_ >= config_.failure_threshold) {
                open(now);
            }
            break;
        case BreakerState::HALF_OPEN:
            // Failed trial: the open timeout starts over
            open(now);
            break;
        case BreakerState::OPEN:
            break;
    }
}

void CircuitBreaker::open(util::TimePoint now) {
    state_ = BreakerState::OPEN;
    open_until_ = now + std::chrono::milliseconds(config_.open_timeout_ms);
    trial_in_flight_ = false;
    times_opened_++;
}

} // namespace mycelium::supervisor
