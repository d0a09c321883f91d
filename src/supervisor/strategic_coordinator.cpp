#include "supervisor/strategic_coordinator.hpp"
#include "kernel/payloads.hpp"
#include "runtime/agent/types.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace mycelium::supervisor {

using kernel::ErrorCode;
using kernel::MessageKind;

namespace {

GoalStep parse_step(const json& step) {
    if (!step.is_object()) {
        throw std::invalid_argument("goal step must be an object");
    }
    GoalStep parsed;
    parsed.capability = step.value("capability", std::string());
    parsed.action = step.value("action", std::string());
    if (parsed.capability.empty() || parsed.action.empty()) {
        throw std::invalid_argument("goal step needs a capability and an action");
    }
    if (step.contains("params")) {
        if (!step["params"].is_object()) {
            throw std::invalid_argument("goal step params must be an object");
        }
        parsed.params = step["params"];
    }
    return parsed;
}

} // namespace

std::vector<GoalStep> decompose_goal(const json& goal) {
    if (!goal.is_object()) {
        throw std::invalid_argument("goal payload must be an object");
    }

    std::vector<GoalStep> steps;
    if (goal.contains("steps")) {
        if (!goal["steps"].is_array() || goal["steps"].empty()) {
            throw std::invalid_argument("goal steps must be a non-empty array");
        }
        for (const auto& step : goal["steps"]) {
            steps.push_back(parse_step(step));
        }
    } else {
        steps.push_back(parse_step(goal));
    }
    return steps;
}

StrategicCoordinator::StrategicCoordinator(CoordinatorConfig config,
                                           GoalDecomposer decomposer,
                                           util::ClockFn clock)
    : config_(std::move(config))
    , decomposer_(decomposer ? std::move(decomposer) : GoalDecomposer(decompose_goal))
    , clock_(clock ? std::move(clock) : util::ClockFn(util::steady_now)) {}

// ============================================================================
// Agent handlers
// ============================================================================

bool StrategicCoordinator::on_initialize(AgentContext& ctx) {
    last_sweep_ = clock_();
    spdlog::info("Coordinator {} ready (silence threshold {}ms, {} alternates)",
        ctx.id(), config_.silence_threshold_ms, config_.alternates.size());
    return true;
}

void StrategicCoordinator::on_tick(AgentContext& ctx) {
    auto now = clock_();
    if (util::elapsed_ms(last_sweep_, now) >= config_.sweep_interval_ms) {
        last_sweep_ = now;
        health_sweep(ctx, now);
    }
}

void StrategicCoordinator::on_directive(AgentContext& ctx, const Envelope& goal) {
    const std::string& key = goal.correlation_key();
    if (goals_.count(key) > 0) {
        ctx.report_failure(goal, ErrorCode::INVALID_DIRECTIVE,
            "goal '" + key + "' already in flight", false);
        return;
    }

    std::vector<GoalStep> steps;
    try {
        steps = decomposer_(goal.payload);
    } catch (const std::exception& e) {
        ctx.report_failure(goal, ErrorCode::INVALID_DIRECTIVE, e.what(), false);
        return;
    }
    if (steps.empty()) {
        ctx.report_failure(goal, ErrorCode::INVALID_DIRECTIVE, "goal has no steps", false);
        return;
    }

    // Every step needs a supervisor before anything is sent
    std::vector<std::string> targets;
    for (const auto& step : steps) {
        auto supervisor = supervisor_for(ctx, step.capability);
        if (!supervisor) {
            spdlog::warn("Coordinator {}: no supervisor for capability '{}'", ctx.id(), step.capability);
            ctx.report_failure(goal, ErrorCode::NO_CAPABLE_SUPERVISOR,
                "no supervisor for capability '" + step.capability + "'", false);
            return;
        }
        targets.push_back(*supervisor);
    }

    Goal record;
    record.original = goal;
    record.results.resize(steps.size());
    record.remaining = steps.size();
    goals_.emplace(key, std::move(record));
    ctx.defer_report();

    for (size_t i = 0; i < steps.size(); i++) {
        auto directive = kernel::derive_envelope(goal, MessageKind::DIRECTIVE, ctx.id(), {targets[i]},
            kernel::make_directive_payload(steps[i].action, steps[i].params));
        if (steps.size() > 1) {
            directive.correlation_id = key + "/step-" + std::to_string(i + 1);
        }
        if (goal.ttl_ms) {
            directive.ttl_ms = std::max<int64_t>(*goal.remaining_ttl_ms(util::wall_now_ms()), 0);
        }
        directive.requires_response = true;

        const std::string step_key = directive.correlation_key();
        steps_[step_key] = StepRef{key, i, targets[i], steps[i].capability};

        auto sent = ctx.bus().send(directive);
        if (!sent.success()) {
            ErrorCode error = sent.first_error();
            ctx.report_failure(goal, error,
                "step " + std::to_string(i + 1) + " undeliverable to " + targets[i],
                kernel::is_retryable_routing_fault(error));
            finish_goal(key);
            return;
        }
        spdlog::debug("Coordinator {} routed {} ({}) to {}", ctx.id(), step_key,
            steps[i].capability, targets[i]);
    }
}

void StrategicCoordinator::on_report(AgentContext& ctx, const Envelope& report) {
    auto view = kernel::parse_report(report.payload);
    if (!view) {
        spdlog::warn("Coordinator {} got malformed report from {}", ctx.id(), report.sender);
        return;
    }

    if (watches_.count(report.sender) > 0 || ctx.registry().parent_of(report.sender) == ctx.id()) {
        note_activity(report.sender, clock_());
    }

    if (view->type == kernel::kReportSummary) {
        on_aggregated_report(ctx, report.sender, view->data);
        return;
    }
    if (view->type == kernel::kReportCapacity) {
        capacity_reductions_++;
        spdlog::warn("Coordinator {}: capacity reduced at {}: {}", ctx.id(), report.sender,
            view->data.dump());
        return;
    }

    const std::string& key = report.correlation_key();
    if (steps_.count(key) > 0) {
        on_step_report(ctx, report);
        return;
    }
    if (control_ids_.erase(key) > 0) {
        spdlog::debug("Coordinator {}: {} acknowledged control directive ({})", ctx.id(),
            report.sender, view->ok() ? "ok" : view->message);
        return;
    }
    spdlog::debug("Coordinator {} ignoring report {} from {}", ctx.id(), key, report.sender);
}

void StrategicCoordinator::on_query(AgentContext& ctx, const Envelope& query) {
    auto view = kernel::parse_directive(query.payload);
    if (view && view->action == kQueryStatus) {
        ctx.reply(query, MessageKind::REPORT, kernel::make_success_payload(status_snapshot()));
        return;
    }
    ctx.reply(query, MessageKind::REPORT,
        kernel::make_failure_payload(ErrorCode::INVALID_DIRECTIVE, "unsupported query", false));
}

void StrategicCoordinator::on_event(AgentContext& ctx, const Envelope& event) {
    std::string name = kernel::event_name(event.payload);
    if (name == kernel::kEventAgentUnhealthy || name == kernel::kEventAgentFatal) {
        std::string supervisor_id = event.payload.value("agent_id", std::string());
        auto& watch = watches_[supervisor_id];
        if (!watch.alerted) {
            watch.alerted = true;
            raise_alert(ctx, supervisor_id, name);
        }
        return;
    }
    spdlog::debug("Coordinator {} ignoring event '{}' from {}", ctx.id(), name, event.sender);
}

// ============================================================================
// Reallocation and health
// ============================================================================

void StrategicCoordinator::on_aggregated_report(AgentContext& ctx, const std::string& supervisor_id,
                                                const json& summary) {
    auto& watch = watches_[supervisor_id];
    watch.last_summary = summary;

    AggregateSummary parsed = AggregateSummary::from_json(summary);
    if (parsed.count == 0) {
        return;
    }

    const auto& limits = config_.thresholds;
    size_t queue_depth = summary.value("queue_depth", size_t{0});
    std::string capability = summary.value("capability", std::string());

    if (parsed.success_rate < limits.min_success_rate) {
        std::string reason = "success rate " + std::to_string(parsed.success_rate) +
            " below " + std::to_string(limits.min_success_rate);
        auto alternate = config_.alternates.find(capability);
        if (alternate != config_.alternates.end() && !alternate->second.empty()) {
            issue_control(ctx, supervisor_id, ControlAction::PREFER_ALTERNATE,
                json{{"capability", alternate->second}}, reason);
        } else {
            issue_control(ctx, supervisor_id, ControlAction::REDUCE_CONCURRENCY, json::object(), reason);
        }
        return;
    }

    if (parsed.avg_latency_ms > limits.max_avg_latency_ms) {
        issue_control(ctx, supervisor_id, ControlAction::REDUCE_CONCURRENCY, json::object(),
            "average latency " + std::to_string(parsed.avg_latency_ms) + "ms");
        return;
    }
    if (queue_depth > limits.max_queue_depth) {
        issue_control(ctx, supervisor_id, ControlAction::REDUCE_CONCURRENCY, json::object(),
            "queue depth " + std::to_string(queue_depth));
    }
}

void StrategicCoordinator::health_sweep(AgentContext& ctx, util::TimePoint now) {
    std::unordered_set<std::string> live;
    for (const auto& id : ctx.registry().find_by_tier(runtime::Tier::TACTICAL)) {
        live.insert(id);
        auto it = watches_.find(id);
        if (it == watches_.end()) {
            // First sighting starts the silence clock
            watches_[id].last_seen = now;
            continue;
        }

        auto& watch = it->second;
        int64_t silent_ms = util::elapsed_ms(watch.last_seen, now);
        if (silent_ms > config_.silence_threshold_ms && !watch.alerted) {
            watch.alerted = true;
            raise_alert(ctx, id, "silent for " + std::to_string(silent_ms) + "ms");
        }
    }

    for (auto it = watches_.begin(); it != watches_.end();) {
        if (live.count(it->first) == 0) {
            it = watches_.erase(it);
        } else {
            ++it;
        }
    }
}

json StrategicCoordinator::status_snapshot() const {
    auto now = clock_();
    json status;
    status["id"] = config_.id;
    status["goals_in_flight"] = goals_.size();
    status["steps_in_flight"] = steps_.size();
    status["alerts_raised"] = alerts_raised_;
    status["capacity_reductions"] = capacity_reductions_;
    status["controls_issued"] = issued_.size();

    json supervisors = json::object();
    for (const auto& [id, watch] : watches_) {
        json entry;
        entry["silent_ms"] = util::elapsed_ms(watch.last_seen, now);
        entry["alerted"] = watch.alerted;
        entry["last_summary"] = watch.last_summary;
        supervisors[id] = entry;
    }
    status["supervisors"] = supervisors;
    return status;
}

// ============================================================================
// Internals
// ============================================================================

std::optional<std::string> StrategicCoordinator::supervisor_for(AgentContext& ctx,
                                                                const std::string& capability) const {
    for (const auto& id : ctx.registry().find_by_capability(capability)) {
        auto identity = ctx.registry().lookup(id);
        if (identity && identity->tier == runtime::Tier::TACTICAL) {
            return id;
        }
    }
    return std::nullopt;
}

void StrategicCoordinator::on_step_report(AgentContext& ctx, const Envelope& report) {
    const std::string step_key = report.correlation_key();
    auto step_it = steps_.find(step_key);
    if (step_it->second.supervisor != report.sender) {
        spdlog::debug("Coordinator {}: report for {} from unexpected sender {}", ctx.id(), step_key,
            report.sender);
        return;
    }

    StepRef step = step_it->second;
    steps_.erase(step_it);

    auto goal_it = goals_.find(step.goal_key);
    if (goal_it == goals_.end()) {
        return;
    }
    Goal& goal = goal_it->second;

    auto view = kernel::parse_report(report.payload);
    if (!view->ok()) {
        std::string message = goal.results.size() > 1
            ? "step " + std::to_string(step.index + 1) + " (" + step.capability + "): " + view->message
            : view->message;
        ctx.report_failure(goal.original, view->error_code, message, view->retryable);
        finish_goal(step.goal_key);
        return;
    }

    goal.results[step.index] = view->data;
    if (--goal.remaining > 0) {
        return;
    }

    if (goal.results.size() == 1) {
        ctx.report_success(goal.original, goal.results.front(), json{{"steps", 1}});
    } else {
        json results = json::array();
        for (auto& result : goal.results) {
            results.push_back(std::move(result));
        }
        ctx.report_success(goal.original, json{{"steps", results}},
            json{{"steps", goal.results.size()}});
    }
    finish_goal(step.goal_key);
}

void StrategicCoordinator::finish_goal(const std::string& goal_key) {
    goals_.erase(goal_key);
    for (auto it = steps_.begin(); it != steps_.end();) {
        if (it->second.goal_key == goal_key) {
            it = steps_.erase(it);
        } else {
            ++it;
        }
    }
}

void StrategicCoordinator::issue_control(AgentContext& ctx, const std::string& supervisor_id,
                                         ControlAction action, json params, const std::string& reason) {
    auto now = clock_();
    auto& watch = watches_[supervisor_id];
    if (watch.last_reallocation &&
        util::elapsed_ms(*watch.last_reallocation, now) < config_.reallocation_cooldown_ms) {
        spdlog::debug("Coordinator {}: {} for {} suppressed by cooldown ({})", ctx.id(),
            control_actions().name(action), supervisor_id, reason);
        return;
    }
    watch.last_reallocation = now;

    const auto& name = control_actions().name(action);
    auto directive = kernel::make_envelope(MessageKind::DIRECTIVE, ctx.id(), {supervisor_id},
        kernel::make_directive_payload(name, params), 8);
    directive.requires_response = true;
    control_ids_.insert(directive.id);

    spdlog::warn("Coordinator {}: {} -> {} ({})", ctx.id(), name, supervisor_id, reason);
    if (!ctx.bus().send(directive).success()) {
        control_ids_.erase(directive.id);
    }
    issued_.push_back(IssuedControl{supervisor_id, action, std::move(params), reason});
}

void StrategicCoordinator::raise_alert(AgentContext& ctx, const std::string& supervisor_id,
                                       const std::string& reason) {
    alerts_raised_++;
    spdlog::error("Coordinator {}: critical fault in supervisor {}: {}", ctx.id(), supervisor_id, reason);

    json fields;
    fields["supervisor"] = supervisor_id;
    fields["reason"] = reason;
    fields["severity"] = "critical";
    fields["action"] = control_actions().name(ControlAction::SYSTEM_ALERT);

    auto alert = kernel::make_envelope(MessageKind::EVENT, ctx.id(), {},
        kernel::make_event_payload(kernel::kEventSystemAlert, fields), kernel::kMaxPriority);
    ctx.bus().broadcast(runtime::Tier::TACTICAL, alert);
}

void StrategicCoordinator::note_activity(const std::string& supervisor_id, util::TimePoint now) {
    auto& watch = watches_[supervisor_id];
    watch.last_seen = now;
    watch.alerted = false;
}

} // namespace mycelium::supervisor
