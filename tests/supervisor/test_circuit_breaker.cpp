#include "supervisor/circuit_breaker.hpp"

#include <catch2/catch.hpp>

using namespace mycelium::supervisor;
using namespace std::chrono_literals;

TEST_CASE("Breaker opens after consecutive failures", "[supervisor][breaker]") {
    CircuitBreaker breaker(BreakerConfig{3, 1000});
    auto now = mycelium::util::steady_now();

    breaker.record_failure(now);
    breaker.record_failure(now);
    REQUIRE(breaker.state() == BreakerState::CLOSED);
    REQUIRE(breaker.allow(now));

    breaker.record_failure(now);
    REQUIRE(breaker.state() == BreakerState::OPEN);
    REQUIRE(breaker.times_opened() == 1);
    REQUIRE_FALSE(breaker.allow(now));
    REQUIRE_FALSE(breaker.allow(now + 999ms));
}

TEST_CASE("A success resets the failure streak", "[supervisor][breaker]") {
    CircuitBreaker breaker(BreakerConfig{2, 1000});
    auto now = mycelium::util::steady_now();

    breaker.record_failure(now);
    breaker.record_success();
    breaker.record_failure(now);
    REQUIRE(breaker.state() == BreakerState::CLOSED);
    REQUIRE(breaker.consecutive_failures() == 1);
}

TEST_CASE("Half-open admits exactly one trial", "[supervisor][breaker]") {
    CircuitBreaker breaker(BreakerConfig{1, 500});
    auto now = mycelium::util::steady_now();
    breaker.record_failure(now);
    REQUIRE(breaker.state() == BreakerState::OPEN);

    auto later = now + 500ms;
    REQUIRE(breaker.would_allow(later));
    REQUIRE(breaker.state() == BreakerState::OPEN);

    REQUIRE(breaker.allow(later));
    REQUIRE(breaker.state() == BreakerState::HALF_OPEN);
    REQUIRE_FALSE(breaker.would_allow(later));
    REQUIRE_FALSE(breaker.allow(later));

    SECTION("trial success closes") {
        breaker.record_success();
        REQUIRE(breaker.state() == BreakerState::CLOSED);
        REQUIRE(breaker.allow(later));
    }
    SECTION("trial failure reopens with a fresh timeout") {
        breaker.record_failure(later);
        REQUIRE(breaker.state() == BreakerState::OPEN);
        REQUIRE(breaker.times_opened() == 2);
        REQUIRE_FALSE(breaker.allow(later + 499ms));
        REQUIRE(breaker.allow(later + 500ms));
    }
}

TEST_CASE("Breaker states have names", "[supervisor][breaker]") {
    REQUIRE(std::string(breaker_state_to_string(BreakerState::HALF_OPEN)) == "half_open");
    REQUIRE(CircuitBreaker(BreakerConfig{0, 10}).allow(mycelium::util::steady_now()));
}
