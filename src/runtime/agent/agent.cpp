#include "runtime/agent/agent.hpp"
#include "kernel/payloads.hpp"
#include "runtime/agent/errors.hpp"
#include "util/clock.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace mycelium::runtime {

// ============================================================================
// AgentContext
// ============================================================================

AgentContext::AgentContext(AgentIdentity identity, std::string parent_id, kernel::MessageBus& bus)
    : identity_(std::move(identity))
    , parent_id_(std::move(parent_id))
    , bus_(bus) {}

kernel::SendResult AgentContext::send(Envelope envelope) {
    envelope.sender = identity_.id;
    return bus_.send(envelope);
}

kernel::SendResult AgentContext::send_to(const std::string& recipient, MessageKind kind,
                                         json payload, int priority) {
    return bus_.send(kernel::make_envelope(kind, identity_.id, {recipient}, std::move(payload), priority));
}

kernel::SendResult AgentContext::reply(const Envelope& cause, MessageKind kind, json payload) {
    return bus_.send(kernel::derive_envelope(cause, kind, identity_.id, {cause.sender}, std::move(payload)));
}

kernel::SendResult AgentContext::report_success(const Envelope& directive, json data, json metrics) {
    metrics = with_default_metrics(directive, std::move(metrics), data);
    return send_report(directive, kernel::make_success_payload(std::move(data), std::move(metrics)), false);
}

kernel::SendResult AgentContext::report_failure(const Envelope& directive, const std::string& error_code,
                                                const std::string& message, bool retryable, json metrics) {
    metrics = with_default_metrics(directive, std::move(metrics), json());
    return send_report(directive,
        kernel::make_failure_payload(error_code, message, retryable, std::move(metrics)), true);
}

kernel::SendResult AgentContext::report_failure(const Envelope& directive, kernel::ErrorCode code,
                                                const std::string& message, bool retryable, json metrics) {
    return report_failure(directive, kernel::error_code_to_string(code), message, retryable, std::move(metrics));
}

kernel::SendResult AgentContext::emit_event(const std::string& recipient, const std::string& name,
                                            json fields, int priority) {
    return send_to(recipient, MessageKind::EVENT,
                   kernel::make_event_payload(name, std::move(fields)), priority);
}

void AgentContext::begin(const Envelope& envelope) {
    reset();
    if (envelope.kind == MessageKind::DIRECTIVE) {
        current_directive_ = envelope.id;
    }
}

void AgentContext::end() {
    reset();
}

void AgentContext::reset() {
    current_directive_.reset();
    reported_ = false;
    failed_ = false;
    deferred_ = false;
}

kernel::SendResult AgentContext::send_report(const Envelope& directive, json payload, bool failed) {
    if (current_directive_ && *current_directive_ == directive.id) {
        if (reported_) {
            spdlog::warn("Agent '{}' tried to report twice for directive {}", identity_.id, directive.id);
            kernel::SendResult refused;
            refused.failures.push_back(
                kernel::DeliveryFailure{directive.sender, kernel::ErrorCode::DUPLICATE_REPORT});
            return refused;
        }
        reported_ = true;
        failed_ = failed;
    }
    return reply(directive, MessageKind::REPORT, std::move(payload));
}

json AgentContext::with_default_metrics(const Envelope& directive, json metrics, const json& body) const {
    if (!metrics.is_object()) {
        metrics = json::object();
    }
    if (!metrics.contains("latency_ms")) {
        metrics["latency_ms"] = util::wall_now_ms() - directive.created_at_ms;
    }
    if (!metrics.contains("size_bytes")) {
        metrics["size_bytes"] = body.is_null() ? 0 : body.dump().size();
    }
    return metrics;
}

// ============================================================================
// Agent defaults and dispatch
// ============================================================================

void Agent::on_query(AgentContext& ctx, const Envelope& query) {
    ctx.reply(query, MessageKind::REPORT,
        kernel::make_failure_payload("unsupported", "agent does not answer queries", false));
}

namespace {

void dispatch_by_kind(Agent& agent, AgentContext& ctx, const Envelope& envelope) {
    switch (envelope.kind) {
        case MessageKind::DIRECTIVE:
            agent.on_directive(ctx, envelope);
            break;
        case MessageKind::REPORT:
            agent.on_report(ctx, envelope);
            break;
        case MessageKind::QUERY:
            agent.on_query(ctx, envelope);
            break;
        case MessageKind::COORDINATE:
            agent.on_coordinate(ctx, envelope);
            break;
        case MessageKind::EVENT:
            agent.on_event(ctx, envelope);
            break;
    }
}

} // namespace

DispatchOutcome dispatch_envelope(Agent& agent, AgentContext& ctx, const Envelope& envelope) {
    DispatchOutcome outcome;
    const bool is_directive = envelope.kind == MessageKind::DIRECTIVE;
    ctx.begin(envelope);

    try {
        dispatch_by_kind(agent, ctx, envelope);
    } catch (const FatalAgentError& e) {
        outcome.status = DispatchStatus::FATAL;
        outcome.error = e.what();
        spdlog::error("Agent '{}' fatal error on {} {}: {}",
            ctx.id(), kernel::message_kind_to_string(envelope.kind), envelope.id, e.what());
        if (is_directive && !ctx.settled()) {
            ctx.report_failure(envelope, kernel::ErrorCode::HANDLER_FATAL, e.what(), true);
        }
    } catch (const AgentError& e) {
        outcome.status = DispatchStatus::HANDLER_ERROR;
        outcome.error = e.what();
        spdlog::warn("Agent '{}' handler error ({}): {}", ctx.id(), e.code(), e.what());
        if (is_directive && !ctx.settled()) {
            ctx.report_failure(envelope, e.code(), e.what(), e.retryable());
        }
    } catch (const std::exception& e) {
        outcome.status = DispatchStatus::HANDLER_ERROR;
        outcome.error = e.what();
        spdlog::warn("Agent '{}' handler error: {}", ctx.id(), e.what());
        if (is_directive && !ctx.settled()) {
            ctx.report_failure(envelope, kernel::ErrorCode::HANDLER_ERROR, e.what(), false);
        }
    }

    if (is_directive && !ctx.settled()) {
        spdlog::warn("Agent '{}' returned from directive {} without a report", ctx.id(), envelope.id);
        ctx.report_failure(envelope, kernel::ErrorCode::MISSING_REPORT,
            "handler returned without reporting", false);
    }

    outcome.reported_failure = ctx.reported_failure();
    ctx.end();
    return outcome;
}

} // namespace mycelium::runtime
