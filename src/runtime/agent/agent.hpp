#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "kernel/envelope.hpp"
#include "kernel/errors.hpp"
#include "kernel/message_bus.hpp"
#include "runtime/agent/types.hpp"

namespace mycelium::runtime {

using kernel::Envelope;
using kernel::MessageKind;

/**
 * Per-agent view of the bus handed to every handler.
 *
 * Tracks the directive currently being handled so that exactly one terminal
 * report is emitted for it. A handler that answers later (supervisors waiting
 * on children) calls defer_report() and reports through the same helpers once
 * the result is known.
 */
class AgentContext {
public:
    AgentContext(AgentIdentity identity, std::string parent_id, kernel::MessageBus& bus);

    const std::string& id() const { return identity_.id; }
    const std::string& parent_id() const { return parent_id_; }
    const AgentIdentity& identity() const { return identity_; }
    kernel::MessageBus& bus() { return bus_; }
    kernel::Registry& registry() { return bus_.registry(); }

    // Envelope with this agent as sender
    kernel::SendResult send(Envelope envelope);
    kernel::SendResult send_to(const std::string& recipient,
                               MessageKind kind,
                               nlohmann::json payload,
                               int priority = kernel::kDefaultPriority);

    // Correlated answer to cause.sender
    kernel::SendResult reply(const Envelope& cause, MessageKind kind, nlohmann::json payload);

    // Terminal reports for a directive. A second report for the directive
    // being handled is refused with DUPLICATE_REPORT.
    kernel::SendResult report_success(const Envelope& directive,
                                      nlohmann::json data,
                                      nlohmann::json metrics = nlohmann::json::object());
    kernel::SendResult report_failure(const Envelope& directive,
                                      const std::string& error_code,
                                      const std::string& message,
                                      bool retryable,
                                      nlohmann::json metrics = nlohmann::json::object());
    kernel::SendResult report_failure(const Envelope& directive,
                                      kernel::ErrorCode code,
                                      const std::string& message,
                                      bool retryable,
                                      nlohmann::json metrics = nlohmann::json::object());

    kernel::SendResult emit_event(const std::string& recipient,
                                  const std::string& name,
                                  nlohmann::json fields = nlohmann::json::object(),
                                  int priority = 8);

    // The terminal report for the current directive will be sent later
    void defer_report() { deferred_ = true; }

    // Used by the runtime around each envelope
    void begin(const Envelope& envelope);
    void end();
    bool settled() const { return reported_ || deferred_; }
    bool reported_failure() const { return reported_ && failed_; }
    bool handling_directive() const { return current_directive_.has_value(); }
    void reset();

private:
    kernel::SendResult send_report(const Envelope& directive, nlohmann::json payload, bool failed);
    nlohmann::json with_default_metrics(const Envelope& directive,
                                        nlohmann::json metrics,
                                        const nlohmann::json& body) const;

    AgentIdentity identity_;
    std::string parent_id_;
    kernel::MessageBus& bus_;

    std::optional<std::string> current_directive_;
    bool reported_ = false;
    bool failed_ = false;
    bool deferred_ = false;
};

// Single agent interface: five message handlers plus lifecycle hooks.
// All handlers of one agent run on its runtime thread, one envelope at a time.
class Agent {
public:
    virtual ~Agent() = default;

    // One-time setup while INITIALIZING; false stops the agent
    virtual bool on_initialize(AgentContext& ctx) { (void)ctx; return true; }
    virtual void on_stop(AgentContext& ctx) { (void)ctx; }

    // Called after every mailbox poll, with or without an envelope
    virtual void on_tick(AgentContext& ctx) { (void)ctx; }

    // Must lead to exactly one terminal report
    virtual void on_directive(AgentContext& ctx, const Envelope& directive) = 0;

    virtual void on_report(AgentContext& ctx, const Envelope& report) { (void)ctx; (void)report; }
    virtual void on_query(AgentContext& ctx, const Envelope& query);
    virtual void on_coordinate(AgentContext& ctx, const Envelope& proposal) { (void)ctx; (void)proposal; }
    virtual void on_event(AgentContext& ctx, const Envelope& event) { (void)ctx; (void)event; }
};

enum class DispatchStatus {
    HANDLED,
    HANDLER_ERROR,   // recoverable exception escaped a handler
    FATAL            // FatalAgentError escaped a handler
};

struct DispatchOutcome {
    DispatchStatus status = DispatchStatus::HANDLED;
    std::string error;
    bool reported_failure = false;
};

// Route one envelope to its handler. Exceptions are converted: a directive
// that escaped with an error gets a failed report; one that returned without
// reporting gets MISSING_REPORT.
DispatchOutcome dispatch_envelope(Agent& agent, AgentContext& ctx, const Envelope& envelope);

} // namespace mycelium::runtime
