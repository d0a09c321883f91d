#include "common/test_agents.hpp"
#include "kernel/kernel.hpp"

#include <catch2/catch.hpp>

using namespace mycelium;
using namespace mycelium::testing;

namespace {

kernel::KernelConfig fast_config() {
    auto config = kernel::default_config();
    config.runtime = fast_runtime();
    return config;
}

std::optional<kernel::ReportView> goal_result(kernel::Kernel& k, const std::string& key) {
    auto report = k.gateway().await_report(key, 3000);
    if (!report) {
        return std::nullopt;
    }
    return kernel::parse_report(report->payload);
}

} // namespace

TEST_CASE("Kernel builds the hierarchy", "[kernel]") {
    kernel::Kernel k(fast_config());
    REQUIRE(k.init());

    auto& registry = k.registry();
    REQUIRE(registry.contains("coordinator"));
    REQUIRE(registry.contains("echo-supervisor"));
    REQUIRE(registry.contains("gateway"));
    REQUIRE(registry.parent_of("echo-supervisor") == "coordinator");
    REQUIRE(registry.children_of("echo-supervisor").size() == 2);
    REQUIRE(registry.find_by_tier(runtime::Tier::TACTICAL) == std::vector<std::string>{"echo-supervisor"});

    REQUIRE(k.runtime_for("coordinator") != nullptr);
    REQUIRE(k.runtime_for("echo-supervisor")->state() == runtime::AgentState::RUNNING);
    REQUIRE(k.runtime_for("nobody") == nullptr);
    REQUIRE(k.health_tick() == 0);

    k.teardown();
    REQUIRE(k.runtime_for("coordinator") == nullptr);
    REQUIRE_FALSE(registry.contains("echo-supervisor"));
    REQUIRE_FALSE(registry.contains("echo-supervisor.echo-1"));
}

TEST_CASE("Goals flow down the hierarchy and back", "[kernel]") {
    kernel::Kernel k(fast_config());
    REQUIRE(k.init());

    SECTION("single step") {
        auto key = k.submit_goal({{"capability", "echo"}, {"action", "echo"}, {"params", {{"text", "hi"}}}});
        REQUIRE_FALSE(key.empty());
        auto result = goal_result(k, key);
        REQUIRE(result.has_value());
        REQUIRE(result->ok());
        REQUIRE(result->data["text"] == "hi");
    }

    SECTION("two steps") {
        auto key = k.submit_goal({{"steps", json::array({
            {{"capability", "echo"}, {"action", "echo"}, {"params", {{"text", "abc"}}}},
            {{"capability", "echo"}, {"action", "reverse"}, {"params", {{"text", "abc"}}}}})}});
        auto result = goal_result(k, key);
        REQUIRE(result.has_value());
        REQUIRE(result->ok());
        REQUIRE(result->data["steps"][0]["text"] == "abc");
        REQUIRE(result->data["steps"][1]["text"] == "cba");
    }

    SECTION("unknown action") {
        auto key = k.submit_goal({{"capability", "echo"}, {"action", "shout"}});
        auto result = goal_result(k, key);
        REQUIRE(result.has_value());
        REQUIRE(result->error_code == "invalid_directive");
    }

    SECTION("no supervisor for the capability") {
        auto key = k.submit_goal({{"capability", "ocr"}, {"action", "scan"}});
        auto result = goal_result(k, key);
        REQUIRE(result.has_value());
        REQUIRE(result->error_code == "no_capable_supervisor");
    }
}

TEST_CASE("Kernel refuses a domain without a factory", "[kernel]") {
    auto config = fast_config();
    supervisor::SupervisorConfig ocr;
    ocr.id = "ocr-supervisor";
    ocr.capability = "ocr";
    config.supervisors.push_back(ocr);

    kernel::Kernel k(config);
    REQUIRE_FALSE(k.init());
    REQUIRE_FALSE(k.registry().contains("ocr-supervisor"));
}
