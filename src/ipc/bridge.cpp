#include "ipc/bridge.hpp"
#include "ipc/envelope_codec.hpp"
#include "ipc/protocol.hpp"
#include "runtime/agent/errors.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace mycelium::ipc {

namespace {

constexpr int kWriteWaitMs = 1000;

// Local stand-in for a remote identity: everything it receives goes to the peer
class ProxyAgent : public runtime::Agent {
public:
    explicit ProxyAgent(RemoteBridge& bridge) : bridge_(bridge) {}

    void on_directive(runtime::AgentContext& ctx, const kernel::Envelope& directive) override {
        forward(ctx, directive);
        // The remote agent sends the terminal report itself
        ctx.defer_report();
    }

    void on_report(runtime::AgentContext& ctx, const kernel::Envelope& report) override {
        forward(ctx, report);
    }

    void on_query(runtime::AgentContext& ctx, const kernel::Envelope& query) override {
        forward(ctx, query);
    }

    void on_coordinate(runtime::AgentContext& ctx, const kernel::Envelope& proposal) override {
        forward(ctx, proposal);
    }

    void on_event(runtime::AgentContext& ctx, const kernel::Envelope& event) override {
        forward(ctx, event);
    }

private:
    void forward(runtime::AgentContext& ctx, const kernel::Envelope& envelope) {
        kernel::Envelope narrowed = envelope;
        narrowed.recipients = {ctx.id()};
        if (!bridge_.write_envelope(narrowed)) {
            throw runtime::TransientError("bridge peer for '" + ctx.id() + "' is unreachable");
        }
    }

    RemoteBridge& bridge_;
};

} // anonymous namespace

RemoteBridge::RemoteBridge(kernel::MessageBus& bus, int fd, runtime::RuntimeConfig proxy_config)
    : bus_(bus)
    , fd_(fd)
    , proxy_config_(proxy_config) {}

RemoteBridge::~RemoteBridge() {
    close();
}

bool RemoteBridge::expose(const runtime::AgentIdentity& remote) {
    if (!is_open()) {
        return false;
    }

    auto registration = bus_.registry().register_agent(remote);
    if (!registration.success) {
        spdlog::warn("Bridge could not expose '{}': {}", remote.id, registration.message);
        return false;
    }

    auto proxy = std::make_unique<runtime::AgentRuntime>(
        std::make_unique<ProxyAgent>(*this), remote, "",
        registration.handle.mailbox, bus_, proxy_config_);

    if (!proxy->start() || !proxy->wait_ready(proxy_config_.ready_timeout_ms)) {
        spdlog::error("Bridge proxy for '{}' failed to start", remote.id);
        proxy->stop();
        bus_.registry().unregister(remote.id);
        return false;
    }

    spdlog::info("Bridge exposing remote agent '{}' (tier={})",
        remote.id, runtime::tier_to_string(remote.tier));
    proxies_.push_back(std::move(proxy));
    return true;
}

bool RemoteBridge::on_readable() {
    if (!is_open()) {
        return false;
    }

    bool peer_open = true;
    uint8_t chunk[4096];
    while (true) {
        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n > 0) {
            recv_buffer_.insert(recv_buffer_.end(), chunk, chunk + n);
            continue;
        }
        if (n == 0) {
            peer_open = false;
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::warn("Bridge read failed (fd={}): {}", fd_, strerror(errno));
            peer_open = false;
        }
        break;
    }

    size_t offset = 0;
    while (offset < recv_buffer_.size()) {
        auto frame = decode_frame(recv_buffer_.data() + offset, recv_buffer_.size() - offset);
        if (frame.status == FrameStatus::INCOMPLETE) {
            break;
        }
        if (frame.status == FrameStatus::INVALID) {
            spdlog::warn("Bridge stream corrupt (fd={}), dropping {} buffered bytes",
                fd_, recv_buffer_.size() - offset);
            frames_dropped_++;
            recv_buffer_.clear();
            return false;
        }
        offset += frame.consumed;
        frames_received_++;
        forward(frame.payload);
    }
    recv_buffer_.erase(recv_buffer_.begin(), recv_buffer_.begin() + offset);

    return peer_open;
}

void RemoteBridge::forward(const std::string& payload) {
    std::string error;
    auto envelope = deserialize_envelope(payload, &error);
    if (!envelope) {
        frames_dropped_++;
        spdlog::warn("Dropping malformed bridge frame: {}", error);
        return;
    }

    auto result = bus_.send(*envelope);
    if (!result.success()) {
        spdlog::debug("Bridged envelope {} from '{}' not fully delivered: {}",
            envelope->id, envelope->sender, kernel::error_code_to_string(result.first_error()));
    }
}

bool RemoteBridge::write_envelope(const kernel::Envelope& envelope) {
    auto frame = encode_frame(serialize_envelope(envelope));

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!open_) {
        return false;
    }

    size_t written = 0;
    while (written < frame.size()) {
        ssize_t n = send(fd_, frame.data() + written, frame.size() - written, MSG_NOSIGNAL);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd_, POLLOUT, 0};
            if (::poll(&pfd, 1, kWriteWaitMs) > 0) {
                continue;
            }
        }
        spdlog::warn("Bridge write failed (fd={}): {}", fd_, strerror(errno));
        return false;
    }

    frames_sent_++;
    return true;
}

void RemoteBridge::close() {
    for (auto& proxy : proxies_) {
        proxy->stop();
        bus_.registry().unregister(proxy->id());
    }
    proxies_.clear();

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (open_) {
        open_ = false;
        ::close(fd_);
        spdlog::debug("Bridge closed (fd={})", fd_);
    }
}

bool RemoteBridge::is_open() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return open_;
}

std::vector<std::string> RemoteBridge::proxies() const {
    std::vector<std::string> ids;
    for (const auto& proxy : proxies_) {
        ids.push_back(proxy->id());
    }
    return ids;
}

} // namespace mycelium::ipc
