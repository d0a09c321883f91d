#include "kernel/message_bus.hpp"

#include <catch2/catch.hpp>

using namespace mycelium::kernel;
using mycelium::runtime::AgentIdentity;
using mycelium::runtime::Tier;
using json = nlohmann::json;

namespace {

struct BusFixture {
    DeadLetterStore dead_letters;
    Registry registry{dead_letters, 4};
    MessageBus bus{registry, dead_letters};

    std::shared_ptr<Mailbox> add(const std::string& id, Tier tier = Tier::EXECUTION, size_t capacity = 0) {
        return registry.register_agent(AgentIdentity{id, {"echo"}, tier}, "", capacity).handle.mailbox;
    }
};

} // namespace

TEST_CASE("Send delivers one copy per distinct recipient", "[bus]") {
    BusFixture f;
    auto a = f.add("a");
    auto b = f.add("b");

    auto result = f.bus.send(make_envelope(MessageKind::EVENT, "x", {"a", "b", "a"}));
    REQUIRE(result.success());
    REQUIRE(result.delivered == 2);
    REQUIRE(a->size() == 1);
    REQUIRE(b->size() == 1);
    REQUIRE(f.bus.delivered_count() == 2);
}

TEST_CASE("Per-recipient failures do not block the others", "[bus]") {
    BusFixture f;
    auto a = f.add("a");

    auto envelope = make_envelope(MessageKind::DIRECTIVE, "x", {"ghost", "a"});
    auto result = f.bus.send(envelope);
    REQUIRE_FALSE(result.success());
    REQUIRE(result.delivered == 1);
    REQUIRE(result.failures.size() == 1);
    REQUIRE(result.failures[0].recipient == "ghost");
    REQUIRE(result.first_error() == ErrorCode::UNKNOWN_RECIPIENT);
    REQUIRE(a->size() == 1);
    REQUIRE(f.dead_letters.count_for_envelope(envelope.id, DeadLetterReason::UNKNOWN_RECIPIENT) == 1);
}

TEST_CASE("Expired envelopes are dead-lettered instead of enqueued", "[bus][ttl]") {
    BusFixture f;
    auto a = f.add("a");

    auto envelope = make_envelope(MessageKind::DIRECTIVE, "x", {"a"});
    envelope.ttl_ms = 50;
    envelope.created_at_ms -= 100;

    auto result = f.bus.send(envelope);
    REQUIRE(result.first_error() == ErrorCode::EXPIRED);
    REQUIRE(a->size() == 0);
    REQUIRE(f.dead_letters.count_for_envelope(envelope.id, DeadLetterReason::EXPIRED) == 1);
}

TEST_CASE("Out-of-band priorities are clamped on delivery", "[bus]") {
    BusFixture f;
    auto a = f.add("a");

    auto top = make_envelope(MessageKind::EVENT, "x", {"a"}, json::object(), kMaxPriority);
    auto loud = make_envelope(MessageKind::EVENT, "x", {"a"});
    loud.priority = 50;
    auto sunk = make_envelope(MessageKind::EVENT, "x", {"a"});
    sunk.priority = -7;
    auto floor = make_envelope(MessageKind::EVENT, "x", {"a"}, json::object(), kMinPriority);

    REQUIRE(f.bus.send(top).success());
    REQUIRE(f.bus.send(loud).success());
    REQUIRE(f.bus.send(floor).success());
    REQUIRE(f.bus.send(sunk).success());

    auto first = a->try_pop();
    auto second = a->try_pop();
    auto third = a->try_pop();
    auto fourth = a->try_pop();
    REQUIRE(first->id == top.id);
    REQUIRE(second->id == loud.id);
    REQUIRE(second->priority == kMaxPriority);
    REQUIRE(third->id == floor.id);
    REQUIRE(fourth->id == sunk.id);
    REQUIRE(fourth->priority == kMinPriority);
}

TEST_CASE("A full mailbox is reported as backpressure", "[bus]") {
    BusFixture f;
    auto a = f.add("a", Tier::EXECUTION, 1);

    REQUIRE(f.bus.send(make_envelope(MessageKind::EVENT, "x", {"a"})).success());
    auto second = f.bus.send(make_envelope(MessageKind::EVENT, "x", {"a"}));
    REQUIRE(second.first_error() == ErrorCode::MAILBOX_FULL);
    REQUIRE(f.dead_letters.total(DeadLetterReason::MAILBOX_FULL) == 1);
}

TEST_CASE("Closed mailboxes and empty recipient lists are dead-lettered", "[bus]") {
    BusFixture f;
    auto a = f.add("a");
    a->close_and_drain();

    REQUIRE(f.bus.send(make_envelope(MessageKind::EVENT, "x", {"a"})).first_error() == ErrorCode::AGENT_STOPPED);
    REQUIRE(f.dead_letters.total(DeadLetterReason::AGENT_STOPPED) == 1);

    REQUIRE_FALSE(f.bus.send(make_envelope(MessageKind::EVENT, "x", {})).success());
    REQUIRE(f.dead_letters.total(DeadLetterReason::UNDELIVERABLE) == 1);
}

TEST_CASE("Broadcast reaches every agent of one tier", "[bus]") {
    BusFixture f;
    auto s1 = f.add("s1", Tier::TACTICAL);
    auto s2 = f.add("s2", Tier::TACTICAL);
    auto w1 = f.add("w1", Tier::EXECUTION);

    auto alert = make_envelope(MessageKind::EVENT, "coord", {}, {{"event", "system-alert"}});
    auto result = f.bus.broadcast(Tier::TACTICAL, alert);
    REQUIRE(result.delivered == 2);
    REQUIRE(s1->try_pop()->id == alert.id);
    REQUIRE(s2->try_pop()->id == alert.id);
    REQUIRE(w1->size() == 0);

    REQUIRE(f.bus.broadcast(Tier::STRATEGIC, alert).delivered == 0);
}

TEST_CASE("Dead letters keep totals past eviction", "[bus][dead_letter]") {
    DeadLetterStore store(2);
    for (int i = 0; i < 5; i++) {
        store.record(make_envelope(MessageKind::EVENT, "x", {"y"}), "y", DeadLetterReason::EXPIRED);
    }
    store.record(make_envelope(MessageKind::EVENT, "x", {"y"}), "y", DeadLetterReason::ABANDONED, "gave up");

    REQUIRE(store.size() == 2);
    REQUIRE(store.evicted() == 4);
    REQUIRE(store.total(DeadLetterReason::EXPIRED) == 5);
    REQUIRE(store.total(DeadLetterReason::ABANDONED) == 1);
    REQUIRE(store.records_for(DeadLetterReason::ABANDONED).front().detail == "gave up");
    REQUIRE(std::string(dead_letter_reason_to_string(DeadLetterReason::AGENT_REMOVED)) == "AgentRemoved");

    store.clear();
    REQUIRE(store.size() == 0);
    REQUIRE(store.total(DeadLetterReason::EXPIRED) == 0);
}
