#include "common/test_agents.hpp"
#include "ipc/bridge.hpp"
#include "ipc/envelope_codec.hpp"
#include "ipc/protocol.hpp"
#include "ipc/socket_server.hpp"

#include <catch2/catch.hpp>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace mycelium;
using namespace mycelium::testing;

namespace {

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void write_all(int fd, const std::vector<uint8_t>& bytes) {
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = send(fd, bytes.data() + written, bytes.size() - written, MSG_NOSIGNAL);
        REQUIRE(n > 0);
        written += static_cast<size_t>(n);
    }
}

// Read one frame from the peer end, waiting up to timeout_ms
std::optional<Envelope> read_envelope(int fd, int timeout_ms = 2000) {
    std::vector<uint8_t> buffer;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        auto frame = ipc::decode_frame(buffer.data(), buffer.size());
        if (frame.status == ipc::FrameStatus::COMPLETE) {
            return ipc::deserialize_envelope(frame.payload);
        }
        if (frame.status == ipc::FrameStatus::INVALID) {
            return std::nullopt;
        }

        pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, 20) <= 0) {
            continue;
        }
        uint8_t chunk[4096];
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            return std::nullopt;
        }
        buffer.insert(buffer.end(), chunk, chunk + n);
    }
    return std::nullopt;
}

// A bridge on one end of a socket pair; the test plays the peer on the other
struct BridgeFixture {
    kernel::DeadLetterStore dead_letters;
    kernel::Registry registry{dead_letters};
    kernel::MessageBus bus{registry, dead_letters};
    kernel::Endpoint client{bus, "client"};
    std::unique_ptr<ipc::RemoteBridge> bridge;
    int peer = -1;

    BridgeFixture() {
        int fds[2];
        REQUIRE(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        set_nonblocking(fds[0]);
        peer = fds[1];
        bridge = std::make_unique<ipc::RemoteBridge>(bus, fds[0], fast_runtime());
    }

    ~BridgeFixture() {
        bridge.reset();
        if (peer >= 0) {
            close(peer);
        }
    }
};

} // namespace

TEST_CASE_METHOD(BridgeFixture, "Remote identities are mirrored as proxies", "[ipc][bridge]") {
    runtime::AgentIdentity remote{"ocr-remote", {"ocr"}, runtime::Tier::EXECUTION};
    REQUIRE(bridge->expose(remote));
    REQUIRE(registry.contains("ocr-remote"));
    REQUIRE(registry.find_by_capability("ocr") == std::vector<std::string>{"ocr-remote"});
    REQUIRE(bridge->proxies() == std::vector<std::string>{"ocr-remote"});

    REQUIRE_FALSE(bridge->expose(remote));

    bridge->close();
    REQUIRE_FALSE(registry.contains("ocr-remote"));
    REQUIRE_FALSE(bridge->is_open());
    REQUIRE_FALSE(bridge->expose({"other", {"x"}, runtime::Tier::EXECUTION}));
}

TEST_CASE_METHOD(BridgeFixture, "Envelopes to a proxy cross the socket narrowed to it", "[ipc][bridge]") {
    REQUIRE(bridge->expose({"ocr-remote", {"ocr"}, runtime::Tier::EXECUTION}));
    Inbox audit(registry, {"audit", {"audit"}, runtime::Tier::EXECUTION});

    auto directive = client.make_directive("ocr-remote", "scan", {{"page", 4}});
    directive.recipients.push_back("audit");
    REQUIRE(client.submit(directive).success());

    auto sent = read_envelope(peer);
    REQUIRE(sent.has_value());
    REQUIRE(sent->id == directive.id);
    REQUIRE(sent->sender == "client");
    REQUIRE(sent->recipients == std::vector<std::string>{"ocr-remote"});
    REQUIRE(sent->payload["params"]["page"] == 4);
    REQUIRE(audit.next(100).has_value());
    REQUIRE(wait_until([&] { return bridge->frames_sent() == 1; }));
}

TEST_CASE_METHOD(BridgeFixture, "Inbound frames are sent onto the local bus", "[ipc][bridge]") {
    REQUIRE(bridge->expose({"ocr-remote", {"ocr"}, runtime::Tier::EXECUTION}));
    auto directive = client.submit("ocr-remote", "scan");
    REQUIRE(read_envelope(peer).has_value());

    auto report = kernel::derive_envelope(directive, MessageKind::REPORT, "ocr-remote", {"client"},
        kernel::make_success_payload({{"words", 120}}));
    auto frame = ipc::encode_frame(ipc::serialize_envelope(report));

    // Split mid-header so the bridge has to buffer
    write_all(peer, std::vector<uint8_t>(frame.begin(), frame.begin() + 5));
    REQUIRE(bridge->on_readable());
    REQUIRE(bridge->frames_received() == 0);

    write_all(peer, std::vector<uint8_t>(frame.begin() + 5, frame.end()));
    REQUIRE(bridge->on_readable());
    REQUIRE(bridge->frames_received() == 1);

    auto received = client.await_report(directive.correlation_key(), 500);
    REQUIRE(received.has_value());
    REQUIRE(received->sender == "ocr-remote");
    REQUIRE(received->payload["data"]["words"] == 120);
}

TEST_CASE_METHOD(BridgeFixture, "Malformed and corrupt input", "[ipc][bridge]") {
    SECTION("undecodable envelope is dropped, stream survives") {
        write_all(peer, ipc::encode_frame("{\"id\": 3}"));
        REQUIRE(bridge->on_readable());
        REQUIRE(bridge->frames_received() == 1);
        REQUIRE(bridge->frames_dropped() == 1);
    }

    SECTION("bad magic ends the stream") {
        write_all(peer, std::vector<uint8_t>(16, 0xAB));
        REQUIRE_FALSE(bridge->on_readable());
        REQUIRE(bridge->frames_dropped() == 1);
    }

    SECTION("peer hangup") {
        close(peer);
        peer = -1;
        REQUIRE_FALSE(bridge->on_readable());
    }
}

TEST_CASE_METHOD(BridgeFixture, "Writes fail once the peer is gone", "[ipc][bridge]") {
    REQUIRE(bridge->expose({"ocr-remote", {"ocr"}, runtime::Tier::EXECUTION}));
    close(peer);
    peer = -1;

    auto event = kernel::make_envelope(MessageKind::EVENT, "client", {"ocr-remote"},
        kernel::make_event_payload("ping", json::object()));
    REQUIRE_FALSE(bridge->write_envelope(event));
    REQUIRE(bridge->frames_sent() == 0);
}

TEST_CASE("Socket server accepts bridge peers", "[ipc][bridge]") {
    const std::string path = "/tmp/mycelium_bridge_test.sock";
    ipc::SocketServer server(path);
    REQUIRE(server.init());
    REQUIRE(server.get_server_fd() >= 0);
    REQUIRE(server.accept_connection() < 0);

    int client_fd = ipc::connect_unix(path);
    REQUIRE(client_fd >= 0);

    int accepted = -1;
    REQUIRE(wait_until([&] {
        accepted = server.accept_connection();
        return accepted >= 0;
    }, 1000));

    write_all(client_fd, ipc::encode_frame("hello"));
    pollfd pfd{accepted, POLLIN, 0};
    REQUIRE(poll(&pfd, 1, 1000) == 1);

    uint8_t buffer[64];
    ssize_t n = recv(accepted, buffer, sizeof(buffer), 0);
    REQUIRE(n == static_cast<ssize_t>(ipc::HEADER_SIZE + 5));
    auto frame = ipc::decode_frame(buffer, static_cast<size_t>(n));
    REQUIRE(frame.payload == "hello");

    close(client_fd);
    close(accepted);
    server.stop();
    REQUIRE(ipc::connect_unix(path) < 0);
}
