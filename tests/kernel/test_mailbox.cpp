#include "kernel/mailbox.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <thread>

using namespace mycelium::kernel;
using namespace std::chrono_literals;

namespace {

Envelope numbered(int n, int priority = kDefaultPriority) {
    auto envelope = make_envelope(MessageKind::EVENT, "test", {"box"}, {{"n", n}}, priority);
    return envelope;
}

} // namespace

TEST_CASE("Equal priority envelopes leave in enqueue order", "[bus][mailbox]") {
    Mailbox mailbox(16);
    for (int i = 0; i < 5; i++) {
        REQUIRE(mailbox.push(numbered(i)) == PushResult::ACCEPTED);
    }
    for (int i = 0; i < 5; i++) {
        auto envelope = mailbox.try_pop();
        REQUIRE(envelope.has_value());
        REQUIRE(envelope->payload["n"] == i);
    }
    REQUIRE_FALSE(mailbox.try_pop().has_value());
}

TEST_CASE("Higher priority is dequeued first", "[bus][mailbox]") {
    Mailbox mailbox(16);
    mailbox.push(numbered(1, 2));
    mailbox.push(numbered(2, 9));
    mailbox.push(numbered(3, 5));
    mailbox.push(numbered(4, 9));

    std::vector<int> order;
    while (auto envelope = mailbox.try_pop()) {
        order.push_back(envelope->payload["n"].get<int>());
    }
    REQUIRE(order == std::vector<int>{2, 4, 3, 1});
}

TEST_CASE("A full mailbox refuses instead of blocking", "[bus][mailbox]") {
    Mailbox mailbox(2);
    REQUIRE(mailbox.push(numbered(1)) == PushResult::ACCEPTED);
    REQUIRE(mailbox.push(numbered(2)) == PushResult::ACCEPTED);
    REQUIRE(mailbox.push(numbered(3)) == PushResult::FULL);
    REQUIRE(mailbox.size() == 2);
    REQUIRE(mailbox.capacity() == 2);
}

TEST_CASE("Closing drains everything and rejects later pushes", "[bus][mailbox]") {
    Mailbox mailbox(8);
    mailbox.push(numbered(1));
    mailbox.push(numbered(2));

    auto drained = mailbox.close_and_drain();
    REQUIRE(drained.size() == 2);
    REQUIRE(mailbox.closed());
    REQUIRE(mailbox.push(numbered(3)) == PushResult::CLOSED);
    REQUIRE_FALSE(mailbox.pop(10ms).has_value());

    mailbox.reopen();
    REQUIRE(mailbox.push(numbered(4)) == PushResult::ACCEPTED);
}

TEST_CASE("pop waits for a producer and interrupt wakes it", "[bus][mailbox]") {
    Mailbox mailbox(8);

    std::thread producer([&mailbox]() {
        std::this_thread::sleep_for(20ms);
        mailbox.push(numbered(7));
    });
    auto envelope = mailbox.pop(2000ms);
    producer.join();
    REQUIRE(envelope.has_value());
    REQUIRE(envelope->payload["n"] == 7);

    std::thread waker([&mailbox]() {
        std::this_thread::sleep_for(20ms);
        mailbox.interrupt();
    });
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(mailbox.pop(5000ms).has_value());
    waker.join();
    REQUIRE(std::chrono::steady_clock::now() - start < 4000ms);
}

TEST_CASE("Zero capacity is treated as one slot", "[bus][mailbox]") {
    Mailbox mailbox(0);
    REQUIRE(mailbox.capacity() == 1);
    REQUIRE(mailbox.push(numbered(1)) == PushResult::ACCEPTED);
    REQUIRE(mailbox.push(numbered(2)) == PushResult::FULL);
}
