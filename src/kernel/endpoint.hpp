#pragma once
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "kernel/envelope.hpp"
#include "kernel/message_bus.hpp"

namespace mycelium::kernel {

// Externally driven identity at the gateway boundary. Submits directives and
// collects the correlated reports; it never touches pools or supervisor state.
class Endpoint {
public:
    Endpoint(MessageBus& bus, std::string id, size_t mailbox_capacity = 0);
    ~Endpoint();

    // Non-copyable
    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;

    bool ok() const { return mailbox_ != nullptr; }
    const std::string& error() const { return error_; }
    const std::string& id() const { return id_; }

    Envelope make_directive(const std::string& recipient,
                            const std::string& action,
                            nlohmann::json params = nlohmann::json::object(),
                            int priority = kDefaultPriority) const;

    // Only directives are accepted
    SendResult submit(const Envelope& directive);

    // Build and submit; the returned envelope's correlation_key() identifies the report
    Envelope submit(const std::string& recipient,
                    const std::string& action,
                    nlohmann::json params = nlohmann::json::object(),
                    int priority = kDefaultPriority);

    std::optional<Envelope> await_report(const std::string& correlation_id, int timeout_ms);
    std::optional<Envelope> next(int timeout_ms);
    size_t available() const;

private:
    MessageBus& bus_;
    std::string id_;
    std::string error_;
    std::shared_ptr<Mailbox> mailbox_;
    std::deque<Envelope> stash_;
};

} // namespace mycelium::kernel
