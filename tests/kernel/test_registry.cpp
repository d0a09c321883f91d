#include "kernel/registry.hpp"

#include <catch2/catch.hpp>

using namespace mycelium::kernel;
using mycelium::runtime::AgentIdentity;
using mycelium::runtime::AgentState;
using mycelium::runtime::Tier;

TEST_CASE("Registering indexes an agent by id, capability and tier", "[bus][registry]") {
    DeadLetterStore dead_letters;
    Registry registry(dead_letters, 8);

    auto result = registry.register_agent(AgentIdentity{"sup", {"echo", "text"}, Tier::TACTICAL}, "coord");
    REQUIRE(result.success);
    REQUIRE(result.handle.id == "sup");
    REQUIRE(result.handle.mailbox != nullptr);
    REQUIRE(result.handle.mailbox->capacity() == 8);

    REQUIRE(registry.contains("sup"));
    REQUIRE(registry.find_by_capability("text") == std::vector<std::string>{"sup"});
    REQUIRE(registry.find_by_tier(Tier::TACTICAL) == std::vector<std::string>{"sup"});
    REQUIRE(registry.find_by_tier(Tier::STRATEGIC).empty());
    REQUIRE(registry.parent_of("sup") == "coord");
    REQUIRE(registry.children_of("coord") == std::vector<std::string>{"sup"});
    REQUIRE(registry.lookup("sup")->tier == Tier::TACTICAL);
    REQUIRE(registry.health("sup")->state == AgentState::CREATED);
}

TEST_CASE("Duplicate and empty identities are rejected", "[bus][registry]") {
    DeadLetterStore dead_letters;
    Registry registry(dead_letters);

    REQUIRE(registry.register_agent(AgentIdentity{"w1", {"echo"}, Tier::EXECUTION}).success);

    auto duplicate = registry.register_agent(AgentIdentity{"w1", {"other"}, Tier::EXECUTION});
    REQUIRE_FALSE(duplicate.success);
    REQUIRE(duplicate.error == ErrorCode::DUPLICATE_IDENTITY);
    REQUIRE(registry.find_by_capability("other").empty());

    auto empty = registry.register_agent(AgentIdentity{"", {"echo"}, Tier::EXECUTION});
    REQUIRE_FALSE(empty.success);
    REQUIRE(empty.error == ErrorCode::INVALID_IDENTITY);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Unregistering dead-letters every pending envelope", "[bus][registry]") {
    DeadLetterStore dead_letters;
    Registry registry(dead_letters);
    auto handle = registry.register_agent(AgentIdentity{"w1", {"echo"}, Tier::EXECUTION}).handle;

    for (int i = 0; i < 4; i++) {
        handle.mailbox->push(make_envelope(MessageKind::DIRECTIVE, "sup", {"w1"}));
    }

    REQUIRE(registry.unregister("w1") == 4);
    REQUIRE_FALSE(registry.contains("w1"));
    REQUIRE(registry.find_by_capability("echo").empty());
    REQUIRE(registry.mailbox_for("w1") == nullptr);
    REQUIRE(handle.mailbox->closed());
    REQUIRE(dead_letters.total(DeadLetterReason::AGENT_REMOVED) == 4);

    REQUIRE(registry.unregister("w1") == 0);
}

TEST_CASE("Capability lookups keep registration order", "[bus][registry]") {
    DeadLetterStore dead_letters;
    Registry registry(dead_letters);
    registry.register_agent(AgentIdentity{"b", {"echo"}, Tier::EXECUTION});
    registry.register_agent(AgentIdentity{"a", {"echo"}, Tier::EXECUTION});
    registry.register_agent(AgentIdentity{"c", {"echo"}, Tier::EXECUTION});

    REQUIRE(registry.find_by_capability("echo") == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("Stale agents are reported once per episode", "[bus][registry][health]") {
    DeadLetterStore dead_letters;
    Registry registry(dead_letters);
    registry.register_agent(AgentIdentity{"w1", {"echo"}, Tier::EXECUTION}, "sup");
    registry.register_agent(AgentIdentity{"idle", {"echo"}, Tier::EXECUTION}, "sup");

    registry.report_state("w1", AgentState::RUNNING);
    registry.heartbeat("w1", 1000);
    registry.heartbeat("idle", 1000);

    // CREATED agents are not expected to heartbeat
    auto stale = registry.collect_stale(5000, 2000);
    REQUIRE(stale.size() == 1);
    REQUIRE(stale[0].id == "w1");
    REQUIRE(stale[0].parent_id == "sup");
    REQUIRE(stale[0].stale_ms == 4000);

    REQUIRE(registry.collect_stale(6000, 2000).empty());

    registry.heartbeat("w1", 6000);
    REQUIRE(registry.collect_stale(7000, 2000).empty());
    REQUIRE(registry.collect_stale(9000, 2000).size() == 1);
}

TEST_CASE("Failure counts use a rolling window", "[bus][registry][health]") {
    DeadLetterStore dead_letters;
    Registry registry(dead_letters, 16, 1000);
    registry.register_agent(AgentIdentity{"w1", {"echo"}, Tier::EXECUTION});

    registry.report_outcome("w1", false, 100);
    registry.report_outcome("w1", false, 200);
    registry.report_outcome("w1", true, 300);
    REQUIRE(registry.health("w1")->failure_count == 2);

    registry.report_outcome("w1", true, 1150);
    REQUIRE(registry.health("w1")->failure_count == 1);
    registry.report_outcome("w1", true, 5000);
    REQUIRE(registry.health("w1")->failure_count == 0);
}
