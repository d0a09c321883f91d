#include "kernel/endpoint.hpp"
#include "kernel/payloads.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace mycelium::kernel {

Endpoint::Endpoint(MessageBus& bus, std::string id, size_t mailbox_capacity)
    : bus_(bus)
    , id_(std::move(id)) {
    runtime::AgentIdentity identity{id_, {}, runtime::Tier::EXECUTION};
    auto result = bus_.registry().register_agent(identity, "", mailbox_capacity);
    if (!result.success) {
        error_ = result.message;
        spdlog::error("Endpoint '{}' could not register: {}", id_, result.message);
        return;
    }
    mailbox_ = result.handle.mailbox;
}

Endpoint::~Endpoint() {
    if (mailbox_) {
        bus_.registry().unregister(id_);
    }
}

Envelope Endpoint::make_directive(const std::string& recipient, const std::string& action,
                                  nlohmann::json params, int priority) const {
    auto directive = make_envelope(MessageKind::DIRECTIVE, id_, {recipient},
                                   make_directive_payload(action, std::move(params)), priority);
    directive.requires_response = true;
    return directive;
}

SendResult Endpoint::submit(const Envelope& directive) {
    if (directive.kind != MessageKind::DIRECTIVE) {
        SendResult refused;
        refused.failures.push_back(DeliveryFailure{"", ErrorCode::INVALID_DIRECTIVE});
        return refused;
    }
    Envelope outgoing = directive;
    outgoing.sender = id_;
    return bus_.send(outgoing);
}

Envelope Endpoint::submit(const std::string& recipient, const std::string& action,
                          nlohmann::json params, int priority) {
    auto directive = make_directive(recipient, action, std::move(params), priority);
    auto result = submit(directive);
    if (!result.success()) {
        spdlog::warn("Endpoint '{}' could not submit to '{}': {}", id_, recipient,
            error_code_to_string(result.first_error()));
    }
    return directive;
}

std::optional<Envelope> Endpoint::await_report(const std::string& correlation_id, int timeout_ms) {
    for (auto it = stash_.begin(); it != stash_.end(); ++it) {
        if (it->correlation_key() == correlation_id) {
            Envelope found = *it;
            stash_.erase(it);
            return found;
        }
    }
    if (!mailbox_) {
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }

        auto envelope = mailbox_->pop(std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
        if (!envelope) {
            if (mailbox_->closed()) {
                return std::nullopt;
            }
            continue;
        }
        if (envelope->correlation_key() == correlation_id) {
            return envelope;
        }
        stash_.push_back(std::move(*envelope));
    }
}

std::optional<Envelope> Endpoint::next(int timeout_ms) {
    if (!stash_.empty()) {
        Envelope front = std::move(stash_.front());
        stash_.pop_front();
        return front;
    }
    if (!mailbox_) {
        return std::nullopt;
    }
    return mailbox_->pop(std::chrono::milliseconds(timeout_ms));
}

size_t Endpoint::available() const {
    return stash_.size() + (mailbox_ ? mailbox_->size() : 0);
}

} // namespace mycelium::kernel
