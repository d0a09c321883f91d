#include "kernel/config.hpp"
#include "util/logger.hpp"

#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>

using namespace mycelium::kernel;
using json = nlohmann::json;

TEST_CASE("Default configuration is valid and runs one echo domain", "[config]") {
    auto config = default_config();
    REQUIRE(validate_config(config).empty());
    REQUIRE(config.supervisors.size() == 1);
    REQUIRE(config.supervisors[0].id == "echo-supervisor");
    REQUIRE(config.supervisors[0].capability == "echo");
    REQUIRE(config.coordinator.id == "coordinator");
    REQUIRE(config.gateway.id == "gateway");
    REQUIRE_FALSE(config.bridge.enabled);
}

TEST_CASE("Nested keys override defaults", "[config]") {
    json j = {
        {"log_level", "debug"},
        {"bus", {{"default_mailbox_capacity", 64}}},
        {"runtime", {{"poll_interval_ms", 20}, {"heartbeat_interval_ms", 200}}},
        {"health", {{"stale_after_ms", 1000}}},
        {"coordinator", {
            {"silence_threshold_ms", 4000},
            {"thresholds", {{"min_success_rate", 0.5}}},
            {"alternates", {{"search", "cached-search"}}}
        }},
        {"supervisors", json::array({
            {
                {"id", "search-sup"},
                {"capability", "search"},
                {"max_pool_size", 4},
                {"initial_pool_size", 1},
                {"breaker", {{"failure_threshold", 5}, {"open_timeout_ms", 250}}},
                {"retry", {{"max_retries", 1}, {"base_delay_ms", 10}, {"max_delay_ms", 40}, {"owner", "escalate"}}},
                {"aggregation", {{"every_n_reports", 3}, {"keepalive", false}}}
            }
        })},
        {"gateway", {{"priority", 7}, {"startup_goals", json::array({{{"capability", "search"}, {"action", "find"}}})}}}
    };

    auto result = config_from_json(j);
    REQUIRE(result.success);
    const auto& config = result.config;
    REQUIRE(config.log_level == "debug");
    REQUIRE(config.bus.default_mailbox_capacity == 64);
    REQUIRE(config.runtime.poll_interval_ms == 20);
    REQUIRE(config.health.stale_after_ms == 1000);
    REQUIRE(config.coordinator.silence_threshold_ms == 4000);
    REQUIRE(config.coordinator.thresholds.min_success_rate == Approx(0.5));
    REQUIRE(config.coordinator.alternates.at("search") == "cached-search");

    REQUIRE(config.supervisors.size() == 1);
    const auto& sup = config.supervisors[0];
    REQUIRE(sup.id == "search-sup");
    REQUIRE(sup.max_pool_size == 4);
    REQUIRE(sup.breaker.failure_threshold == 5);
    REQUIRE(sup.breaker.open_timeout_ms == 250);
    REQUIRE(sup.retry.owner == mycelium::supervisor::RetryOwner::ESCALATE);
    REQUIRE(sup.retry.max_delay_ms == 40);
    REQUIRE(sup.aggregation.every_n_reports == 3);
    REQUIRE_FALSE(sup.aggregation.keepalive);

    REQUIRE(config.gateway.priority == 7);
    REQUIRE(config.gateway.startup_goals.size() == 1);
}

TEST_CASE("Bridge settings parse remote identities", "[config][ipc]") {
    json j = {{"bridge", {
        {"enabled", true},
        {"mode", "connect"},
        {"socket_path", "/tmp/peer.sock"},
        {"remote_agents", json::array({{{"id", "remote-sup"}, {"capabilities", json::array({"ocr"})}, {"tier", "tactical"}}})}
    }}};

    auto result = config_from_json(j);
    REQUIRE(result.success);
    REQUIRE(result.config.bridge.enabled);
    REQUIRE_FALSE(result.config.bridge.listen);
    REQUIRE(result.config.bridge.socket_path == "/tmp/peer.sock");
    REQUIRE(result.config.bridge.remote_agents.size() == 1);
    REQUIRE(result.config.bridge.remote_agents[0].tier == mycelium::runtime::Tier::TACTICAL);
    REQUIRE(result.config.bridge.remote_agents[0].has_capability("ocr"));
}

TEST_CASE("Invalid configurations are rejected with a reason", "[config]") {
    SECTION("wrong types") {
        auto result = config_from_json(json{{"bus", {{"default_mailbox_capacity", "lots"}}}});
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.error.empty());
    }
    SECTION("not an object") {
        REQUIRE_FALSE(config_from_json(json::array()).success);
    }
    SECTION("unknown retry owner") {
        auto result = config_from_json(json{{"supervisors", json::array({
            {{"id", "s"}, {"capability", "c"}, {"retry", {{"owner", "nobody"}}}}})}});
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error.find("nobody") != std::string::npos);
    }
    SECTION("unknown tier") {
        auto result = config_from_json(json{{"bridge", {{"remote_agents", json::array({{{"id", "r"}, {"tier", "middle"}}})}}}});
        REQUIRE_FALSE(result.success);
    }
}

TEST_CASE("Validation enforces cross-field rules", "[config]") {
    auto config = default_config();

    SECTION("stale threshold must exceed heartbeat") {
        config.health.stale_after_ms = config.runtime.heartbeat_interval_ms;
        REQUIRE_FALSE(validate_config(config).empty());
    }
    SECTION("success rate within [0, 1]") {
        config.coordinator.thresholds.min_success_rate = 1.5;
        REQUIRE_FALSE(validate_config(config).empty());
    }
    SECTION("gateway priority range") {
        config.gateway.priority = 11;
        REQUIRE_FALSE(validate_config(config).empty());
    }
    SECTION("ids are unique across the hierarchy") {
        config.supervisors[0].id = "coordinator";
        REQUIRE(validate_config(config).find("duplicate") != std::string::npos);
    }
    SECTION("initial pool fits the maximum") {
        config.supervisors[0].initial_pool_size = 9;
        config.supervisors[0].max_pool_size = 8;
        REQUIRE_FALSE(validate_config(config).empty());
    }
    SECTION("retry delays are ordered") {
        config.supervisors[0].retry.base_delay_ms = 500;
        config.supervisors[0].retry.max_delay_ms = 100;
        REQUIRE_FALSE(validate_config(config).empty());
    }
    SECTION("remote ids must not collide when the bridge is on") {
        config.bridge.enabled = true;
        config.bridge.remote_agents.push_back({"echo-supervisor", {"echo"}, mycelium::runtime::Tier::TACTICAL});
        REQUIRE_FALSE(validate_config(config).empty());
    }
}

TEST_CASE("load_config reports unreadable and malformed files", "[config]") {
    REQUIRE_FALSE(load_config("/nonexistent/mycelium.json").success);

    const std::string path = "mycelium_config_test.json";
    {
        std::ofstream out(path);
        out << "{ \"log_level\": ";
    }
    auto broken = load_config(path);
    REQUIRE_FALSE(broken.success);
    REQUIRE(broken.error.find("invalid JSON") != std::string::npos);

    {
        std::ofstream out(path);
        out << R"({"log_level": "warn", "gateway": {"id": "edge"}})";
    }
    auto loaded = load_config(path);
    REQUIRE(loaded.success);
    REQUIRE(loaded.config.log_level == "warn");
    REQUIRE(loaded.config.gateway.id == "edge");
    std::remove(path.c_str());
}

TEST_CASE("Log level names map onto spdlog levels", "[config]") {
    REQUIRE(mycelium::util::log_level_from_string("debug") == spdlog::level::debug);
    REQUIRE(mycelium::util::log_level_from_string("warn") == spdlog::level::warn);
    REQUIRE(mycelium::util::log_level_from_string("off") == spdlog::level::off);
    REQUIRE(mycelium::util::log_level_from_string("chatty") == spdlog::level::info);
}
