#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "kernel/envelope.hpp"
#include "kernel/message_bus.hpp"
#include "runtime/agent/agent_runtime.hpp"
#include "runtime/agent/types.hpp"

namespace mycelium::ipc {

/**
 * Carries envelopes between the local bus and one peer process over a
 * connected stream socket.
 *
 * Remote identities are mirrored locally as proxies: each proxy is a
 * registered agent whose runtime writes every envelope it receives to the
 * socket, narrowed to the proxied id. Inbound frames are decoded and sent
 * onto the local bus unchanged.
 */
class RemoteBridge {
public:
    // Takes ownership of fd
    RemoteBridge(kernel::MessageBus& bus, int fd, runtime::RuntimeConfig proxy_config = {});
    ~RemoteBridge();

    // Non-copyable
    RemoteBridge(const RemoteBridge&) = delete;
    RemoteBridge& operator=(const RemoteBridge&) = delete;

    // Register a proxy for a remote identity and start its runtime
    bool expose(const runtime::AgentIdentity& remote);

    // Drain the socket and forward complete frames. False once the peer is
    // gone or the stream is corrupt; the caller then closes the bridge.
    bool on_readable();

    // Thread-safe; called from proxy runtimes
    bool write_envelope(const kernel::Envelope& envelope);

    // Stop proxies, unregister them and close the socket
    void close();

    int fd() const { return fd_; }
    bool is_open() const;
    std::vector<std::string> proxies() const;

    uint64_t frames_received() const { return frames_received_; }
    uint64_t frames_sent() const { return frames_sent_; }
    uint64_t frames_dropped() const { return frames_dropped_; }

private:
    void forward(const std::string& payload);

    kernel::MessageBus& bus_;
    int fd_;
    runtime::RuntimeConfig proxy_config_;

    mutable std::mutex write_mutex_;
    bool open_ = true;
    std::vector<uint8_t> recv_buffer_;
    std::vector<std::unique_ptr<runtime::AgentRuntime>> proxies_;

    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> frames_dropped_{0};
};

} // namespace mycelium::ipc
