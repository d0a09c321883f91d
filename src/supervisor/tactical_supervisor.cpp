#include "supervisor/tactical_supervisor.hpp"
#include "kernel/dead_letter.hpp"
#include "kernel/payloads.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace mycelium::supervisor {

using kernel::MessageKind;

TacticalSupervisor::TacticalSupervisor(SupervisorConfig config,
                                       runtime::AgentFactory factory,
                                       runtime::RuntimeConfig child_runtime,
                                       util::ClockFn clock)
    : config_(std::move(config))
    , factory_(std::move(factory))
    , child_runtime_(child_runtime)
    , clock_(clock ? std::move(clock) : util::ClockFn(util::steady_now))
    , pool_(config_.capability, config_.max_pool_size)
    , retry_policy_(config_.retry)
    , aggregator_(config_.aggregation, clock_()) {
    if (config_.capabilities.empty()) {
        config_.capabilities.push_back(config_.capability);
    }
}

TacticalSupervisor::~TacticalSupervisor() = default;

// ============================================================================
// Agent handlers
// ============================================================================

bool TacticalSupervisor::on_initialize(AgentContext& ctx) {
    if (!factory_) {
        spdlog::error("Supervisor {} has no factory for '{}'", ctx.id(), config_.capability);
        return false;
    }

    for (size_t i = 0; i < config_.initial_pool_size; i++) {
        runtime::AgentSpec spec;
        spec.capabilities = {config_.capability};
        spec.config = config_.child_config;

        auto result = spawn_child(ctx, spec);
        if (!result.success) {
            spdlog::error("Supervisor {} failed to spawn initial child: {}", ctx.id(), result.message);
            stopping_ = true;
            auto members = pool_.members();
            for (const auto& id : members) {
                retire_child(ctx, id, "initialization failed");
            }
            return false;
        }
    }

    spdlog::info("Supervisor {} ready: {} x '{}' (max {})",
        ctx.id(), pool_.size(), config_.capability, config_.max_pool_size);
    return true;
}

void TacticalSupervisor::on_stop(AgentContext& ctx) {
    stopping_ = true;

    for (auto& [key, job] : jobs_) {
        ctx.report_failure(job.original, ErrorCode::AGENT_STOPPED, "supervisor stopping", true);
        stats_.failed++;
    }
    jobs_.clear();
    pending_.clear();
    retries_.clear();

    std::vector<std::string> ids;
    ids.reserve(children_.size());
    for (const auto& entry : children_) {
        ids.push_back(entry.first);
    }
    for (const auto& id : ids) {
        retire_child(ctx, id, "supervisor stopping");
    }

    spdlog::info("Supervisor {} stopped (routed={}, succeeded={}, failed={}, retries={})",
        ctx.id(), stats_.routed, stats_.succeeded, stats_.failed, stats_.retries);
}

void TacticalSupervisor::on_tick(AgentContext& ctx) {
    dispatch_due_retries(ctx);
    pump_pending(ctx);

    if (aggregator_.due(clock_())) {
        send_summary(ctx);
    }
}

void TacticalSupervisor::on_directive(AgentContext& ctx, const Envelope& directive) {
    auto view = kernel::parse_directive(directive.payload);
    if (view) {
        auto action = control_actions().parse(view->action);
        if (action) {
            handle_control(ctx, directive, *action, view->params);
            return;
        }
    }

    RouteResult result = route(ctx, directive);
    if (result.success) {
        ctx.defer_report();
        return;
    }

    spdlog::debug("Supervisor {} rejected directive {}: {} ({})", ctx.id(), directive.id,
        kernel::error_code_to_string(result.error), result.message);
    ctx.report_failure(directive, result.error, result.message,
                       kernel::is_retryable_routing_fault(result.error));
}

void TacticalSupervisor::on_report(AgentContext& ctx, const Envelope& report) {
    if (children_.count(report.sender) > 0) {
        on_child_report(ctx, report);
        return;
    }
    forward_relay_report(ctx, report);
}

void TacticalSupervisor::on_query(AgentContext& ctx, const Envelope& query) {
    auto view = kernel::parse_directive(query.payload);
    if (view && view->action == kQueryStatus) {
        ctx.reply(query, MessageKind::REPORT, kernel::make_success_payload(status_snapshot()));
        return;
    }
    ctx.reply(query, MessageKind::REPORT,
        kernel::make_failure_payload(ErrorCode::INVALID_DIRECTIVE, "unsupported query", false));
}

void TacticalSupervisor::on_event(AgentContext& ctx, const Envelope& event) {
    std::string name = kernel::event_name(event.payload);

    if (name == kernel::kEventAgentUnhealthy || name == kernel::kEventAgentFatal) {
        std::string child_id;
        if (event.payload.contains("agent_id") && event.payload["agent_id"].is_string()) {
            child_id = event.payload["agent_id"].get<std::string>();
        }
        on_child_unhealthy(ctx, child_id, name);
    } else if (name == kernel::kEventSystemAlert) {
        handle_system_alert(event.payload);
    } else {
        spdlog::debug("Supervisor {} ignoring event '{}' from {}", ctx.id(), name, event.sender);
    }
}

// ============================================================================
// Operations
// ============================================================================

SpawnResult TacticalSupervisor::spawn_child(AgentContext& ctx, const runtime::AgentSpec& spec) {
    SpawnResult result;
    if (pool_.full()) {
        result.error = ErrorCode::POOL_FULL;
        result.message = "pool at max size " + std::to_string(pool_.max_size());
        return result;
    }

    runtime::AgentSpec child_spec = spec;
    if (child_spec.id.empty()) {
        child_spec.id = next_child_id();
    }
    if (std::find(child_spec.capabilities.begin(), child_spec.capabilities.end(),
                  config_.capability) == child_spec.capabilities.end()) {
        child_spec.capabilities.push_back(config_.capability);
    }

    std::string error;
    auto agent = make_child(child_spec, error);
    if (!agent) {
        result.error = ErrorCode::UNAVAILABLE;
        result.message = "cannot create child '" + child_spec.id + "': " + error;
        return result;
    }

    runtime::AgentIdentity identity{child_spec.id, child_spec.capabilities, runtime::Tier::EXECUTION};
    auto registration = ctx.registry().register_agent(identity, ctx.id(), config_.child_mailbox_capacity);
    if (!registration.success) {
        result.error = registration.error;
        result.message = registration.message;
        return result;
    }

    auto child = std::make_unique<runtime::AgentRuntime>(
        std::move(agent), identity, ctx.id(), registration.handle.mailbox, ctx.bus(), child_runtime_);
    if (!child->start()) {
        ctx.registry().unregister(identity.id);
        result.error = ErrorCode::UNAVAILABLE;
        result.message = "child '" + identity.id + "' failed to start";
        return result;
    }

    pool_.add(identity.id);
    breakers_.emplace(identity.id, CircuitBreaker(config_.breaker));
    specs_[identity.id] = child_spec;
    children_[identity.id] = std::move(child);

    spdlog::info("Supervisor {} spawned child {} ({})", ctx.id(), identity.id, config_.capability);
    result.success = true;
    result.id = identity.id;
    return result;
}

RouteResult TacticalSupervisor::route(AgentContext& ctx, const Envelope& directive) {
    RouteResult result;

    auto view = kernel::parse_directive(directive.payload);
    if (!view) {
        result.error = ErrorCode::INVALID_DIRECTIVE;
        result.message = "directive payload requires a non-empty action";
        return result;
    }
    if (stopping_) {
        result.error = ErrorCode::AGENT_STOPPED;
        result.message = "supervisor stopping";
        return result;
    }

    const std::string& key = directive.correlation_key();
    if (jobs_.count(key) > 0) {
        result.error = ErrorCode::INVALID_DIRECTIVE;
        result.message = "correlation id '" + key + "' already in flight";
        return result;
    }

    auto now = clock_();
    Job job;
    job.original = directive;
    job.key = key;
    job.pinned = view->target;

    // Explicit target if named
    if (job.pinned) {
        if (!pool_.contains(*job.pinned)) {
            result.error = ErrorCode::UNKNOWN_RECIPIENT;
            result.message = "'" + *job.pinned + "' is not in the " + config_.capability + " pool";
            return result;
        }
        if (!breakers_.at(*job.pinned).would_allow(now)) {
            if (!preferred_alternate_.empty()) {
                return relay(ctx, job, ErrorCode::CIRCUIT_OPEN);
            }
            result.error = ErrorCode::CIRCUIT_OPEN;
            result.message = "circuit open for '" + *job.pinned + "'";
            return result;
        }
    }

    // Idle pool member, round-robin
    auto child = pick_child(job.pinned, now);
    if (child) {
        auto& stored = jobs_.emplace(key, std::move(job)).first->second;
        result.success = true;
        result.assigned_to = *child;
        dispatch_job(ctx, stored, *child);
        return result;
    }

    ErrorCode fault = ErrorCode::NONE;
    if (!job.pinned && all_breakers_blocked(now)) {
        fault = ErrorCode::CIRCUIT_OPEN;
        result.message = "circuit open for every '" + config_.capability + "' child";
    } else if (pool_.size() > 0 && pending_.size() < config_.max_queue_depth) {
        // Bounded queue
        jobs_.emplace(key, std::move(job));
        pending_.push_back(key);
        stats_.queued++;
        result.success = true;
        result.queued = true;
        return result;
    } else {
        fault = ErrorCode::POOL_EXHAUSTED;
        result.message = pool_.size() == 0
            ? "no '" + config_.capability + "' children available"
            : "pool busy and queue full (" + std::to_string(pending_.size()) + ")";
    }

    if (!preferred_alternate_.empty()) {
        return relay(ctx, job, fault);
    }
    result.error = fault;
    return result;
}

void TacticalSupervisor::on_child_report(AgentContext& ctx, const Envelope& report) {
    auto view = kernel::parse_report(report.payload);
    if (!view) {
        spdlog::warn("Supervisor {} got malformed report from {}", ctx.id(), report.sender);
        return;
    }

    const std::string& child_id = report.sender;
    const std::string key = report.correlation_key();
    auto owner = child_jobs_.find(child_id);
    bool current = owner != child_jobs_.end() && owner->second == key;

    // Late report for abandoned work. Its outcome still settles the breaker,
    // which may be holding its half-open trial for this job.
    if (abandoned_.count(key) > 0) {
        if (current) {
            settle_breaker(child_id, view->ok());
            release_child(child_id);
            abandoned_.erase(key);
        }
        stats_.discarded_reports++;
        spdlog::debug("Supervisor {} discarded report for abandoned {}", ctx.id(), key);
        pump_pending(ctx);
        return;
    }

    auto it = jobs_.find(key);
    if (!current || it == jobs_.end() || it->second.assigned != child_id) {
        stats_.discarded_reports++;
        spdlog::debug("Supervisor {} discarded stale report {} from {}", ctx.id(), key, child_id);
        return;
    }

    auto now = clock_();
    Job& job = it->second;
    int64_t latency_ms = util::elapsed_ms(job.dispatched_at, now);
    if (view->metrics.contains("latency_ms") && view->metrics["latency_ms"].is_number_integer()) {
        latency_ms = view->metrics["latency_ms"].get<int64_t>();
    }

    aggregator_.record(view->ok(), latency_ms);
    release_child(child_id);

    if (view->ok()) {
        breakers_.at(child_id).record_success();

        json metrics = view->metrics;
        metrics.erase("latency_ms");
        metrics["child_latency_ms"] = latency_ms;
        metrics["attempts"] = job.retries + 1;
        metrics["child"] = child_id;
        ctx.report_success(job.original, view->data, metrics);

        stats_.succeeded++;
        jobs_.erase(it);
    } else {
        handle_failure(ctx, key, child_id, view->error_code, view->message, view->retryable);
    }

    pump_pending(ctx);
}

void TacticalSupervisor::on_child_unhealthy(AgentContext& ctx, const std::string& child_id,
                                            const std::string& reason) {
    auto it = children_.find(child_id);
    if (it == children_.end() || !pool_.contains(child_id)) {
        spdlog::debug("Supervisor {} ignoring {} for unknown child '{}'", ctx.id(), reason, child_id);
        return;
    }

    auto now = clock_();
    fail_in_flight(ctx, child_id, reason);

    if (!within_restart_budget(child_id, now)) {
        spdlog::warn("Child {} exceeded {} restarts in {}ms", child_id,
            config_.max_restarts, config_.restart_window_ms);
        retire_child(ctx, child_id, "restart budget exhausted");
        return;
    }

    std::string error;
    auto fresh = make_child(specs_.at(child_id), error);
    if (!fresh) {
        spdlog::error("Supervisor {} cannot rebuild child {}: {}", ctx.id(), child_id, error);
        retire_child(ctx, child_id, "restart failed: " + error);
        return;
    }
    if (!it->second->restart(std::move(fresh))) {
        spdlog::error("Supervisor {} failed to restart child {}", ctx.id(), child_id);
        retire_child(ctx, child_id, "restart failed");
        return;
    }

    stats_.restarts++;
    spdlog::info("Supervisor {} restarted child {} in place ({})", ctx.id(), child_id, reason);
    pump_pending(ctx);
}

bool TacticalSupervisor::abandon(AgentContext& ctx, const std::string& correlation_id) {
    auto it = jobs_.find(correlation_id);
    if (it == jobs_.end()) {
        return false;
    }

    Job& job = it->second;
    ctx.bus().dead_letters().record(job.original, ctx.id(), kernel::DeadLetterReason::ABANDONED,
        "abandoned after " + std::to_string(job.retries) + " retries");

    // A child or relay target still owes a report; it will be discarded
    if (!job.assigned.empty() || !job.relay_target.empty()) {
        abandoned_.insert(correlation_id);
    }

    ctx.report_failure(job.original, ErrorCode::ABANDONED, "directive abandoned", false);
    stats_.abandoned++;

    jobs_.erase(it);
    pending_.erase(std::remove(pending_.begin(), pending_.end(), correlation_id), pending_.end());
    retries_.erase(std::remove_if(retries_.begin(), retries_.end(),
        [&](const PendingRetry& retry) { return retry.key == correlation_id; }), retries_.end());

    spdlog::info("Supervisor {} abandoned {}", ctx.id(), correlation_id);
    return true;
}

void TacticalSupervisor::retire_child(AgentContext& ctx, const std::string& child_id,
                                      const std::string& reason) {
    auto it = children_.find(child_id);
    if (it == children_.end()) {
        return;
    }

    fail_in_flight(ctx, child_id, "retired");

    pool_.remove(child_id);
    breakers_.erase(child_id);
    restarts_.erase(child_id);
    specs_.erase(child_id);
    release_child(child_id);

    std::unique_ptr<runtime::AgentRuntime> child = std::move(it->second);
    children_.erase(it);

    if (child->halt(child_runtime_.stop_timeout_ms)) {
        child->stop();
    } else {
        spdlog::warn("Child {} still busy in a handler, detaching from pool", child_id);
        stalled_.push_back(std::move(child));
    }
    ctx.registry().unregister(child_id);

    stats_.retired++;
    spdlog::info("Supervisor {} retired child {} ({}), pool size {}",
        ctx.id(), child_id, reason, pool_.size());

    if (!stopping_) {
        report_capacity(ctx, child_id, reason);
    }
}

// ============================================================================
// Introspection
// ============================================================================

std::optional<BreakerState> TacticalSupervisor::breaker_state(const std::string& child_id) const {
    auto it = breakers_.find(child_id);
    if (it == breakers_.end()) {
        return std::nullopt;
    }
    return it->second.state();
}

const CircuitBreaker* TacticalSupervisor::breaker(const std::string& child_id) const {
    auto it = breakers_.find(child_id);
    return it == breakers_.end() ? nullptr : &it->second;
}

size_t TacticalSupervisor::concurrency_limit() const {
    size_t limit = pool_.size();
    if (config_.max_concurrency > 0) {
        limit = std::min(limit, config_.max_concurrency);
    }
    if (concurrency_override_ > 0) {
        limit = std::min(limit, concurrency_override_);
    }
    return limit;
}

runtime::AgentRuntime* TacticalSupervisor::child_runtime(const std::string& child_id) {
    auto it = children_.find(child_id);
    return it == children_.end() ? nullptr : it->second.get();
}

json TacticalSupervisor::status_snapshot() const {
    json status;
    status["id"] = config_.id;
    status["capability"] = config_.capability;
    status["pool_size"] = pool_.size();
    status["max_pool_size"] = pool_.max_size();
    status["busy"] = pool_.busy_count();
    status["idle"] = pool_.idle_count();
    status["queue_depth"] = pending_.size();
    status["in_flight"] = child_jobs_.size();
    status["pending_retries"] = retries_.size();
    status["active_jobs"] = jobs_.size();
    status["concurrency_limit"] = concurrency_limit();
    status["preferred_alternate"] = preferred_alternate_;

    json children = json::object();
    for (const auto& id : pool_.members()) {
        json child;
        auto breaker_it = breakers_.find(id);
        if (breaker_it != breakers_.end()) {
            child["breaker"] = breaker_state_to_string(breaker_it->second.state());
            child["consecutive_failures"] = breaker_it->second.consecutive_failures();
        }
        auto runtime_it = children_.find(id);
        if (runtime_it != children_.end()) {
            child["state"] = runtime::agent_state_to_string(runtime_it->second->state());
            child["restarts"] = runtime_it->second->restart_count();
            child["processed"] = runtime_it->second->processed_count();
        }
        child["busy"] = pool_.is_busy(id);
        children[id] = child;
    }
    status["children"] = children;

    status["stats"] = {
        {"routed", stats_.routed},
        {"queued", stats_.queued},
        {"retries", stats_.retries},
        {"succeeded", stats_.succeeded},
        {"failed", stats_.failed},
        {"relayed", stats_.relayed},
        {"abandoned", stats_.abandoned},
        {"discarded_reports", stats_.discarded_reports},
        {"restarts", stats_.restarts},
        {"retired", stats_.retired},
        {"summaries_sent", stats_.summaries_sent}
    };
    status["totals"] = {
        {"count", aggregator_.total_count()},
        {"successes", aggregator_.total_successes()},
        {"failures", aggregator_.total_failures()}
    };
    return status;
}

// ============================================================================
// Control directives
// ============================================================================

void TacticalSupervisor::handle_control(AgentContext& ctx, const Envelope& directive,
                                        ControlAction action, const json& params) {
    const auto& name = control_actions().name(action);
    json data;
    data["action"] = name;

    switch (action) {
        case ControlAction::REDUCE_CONCURRENCY: {
            size_t current = concurrency_limit();
            size_t limit = params.value("limit", current / 2);
            concurrency_override_ = std::max<size_t>(limit, 1);
            data["concurrency_limit"] = concurrency_limit();
            spdlog::warn("Supervisor {} concurrency reduced to {}", ctx.id(), concurrency_limit());
            break;
        }
        case ControlAction::RESTORE_CONCURRENCY:
            concurrency_override_ = 0;
            data["concurrency_limit"] = concurrency_limit();
            spdlog::info("Supervisor {} concurrency restored to {}", ctx.id(), concurrency_limit());
            pump_pending(ctx);
            break;
        case ControlAction::PREFER_ALTERNATE:
            preferred_alternate_ = params.value("capability", std::string());
            data["capability"] = preferred_alternate_;
            spdlog::info("Supervisor {} prefers alternate '{}'", ctx.id(), preferred_alternate_);
            break;
        case ControlAction::ABANDON: {
            std::string correlation_id = params.value("correlation_id", std::string());
            if (!abandon(ctx, correlation_id)) {
                ctx.report_failure(directive, ErrorCode::INVALID_DIRECTIVE,
                    "no work in flight for correlation id '" + correlation_id + "'", false);
                return;
            }
            data["correlation_id"] = correlation_id;
            break;
        }
        case ControlAction::SYSTEM_ALERT:
            handle_system_alert(params);
            break;
        case ControlAction::CAPACITY_REDUCED:
            ctx.report_failure(directive, ErrorCode::INVALID_DIRECTIVE,
                name + " is reported upward, not accepted", false);
            return;
    }

    ctx.report_success(directive, data);
}

void TacticalSupervisor::handle_system_alert(const json& details) {
    stats_.alerts_received++;
    spdlog::error("Supervisor {} received system alert: {}", config_.id, details.dump());
}

// ============================================================================
// Routing internals
// ============================================================================

std::optional<std::string> TacticalSupervisor::pick_child(const std::optional<std::string>& pinned,
                                                          util::TimePoint now) {
    if (pool_.busy_count() >= concurrency_limit()) {
        return std::nullopt;
    }

    if (pinned) {
        if (!pool_.contains(*pinned) || pool_.is_busy(*pinned)) {
            return std::nullopt;
        }
        if (!breakers_.at(*pinned).allow(now)) {
            return std::nullopt;
        }
        return pinned;
    }

    auto child = pool_.next_idle([&](const std::string& id) {
        return breakers_.at(id).would_allow(now);
    });
    if (child) {
        // Claims the half-open trial when there is one
        breakers_.at(*child).allow(now);
    }
    return child;
}

bool TacticalSupervisor::all_breakers_blocked(util::TimePoint now) const {
    if (pool_.size() == 0) {
        return false;
    }
    for (const auto& id : pool_.members()) {
        if (breakers_.at(id).would_allow(now)) {
            return false;
        }
    }
    return true;
}

bool TacticalSupervisor::dispatch_job(AgentContext& ctx, Job& job, const std::string& child_id) {
    Envelope directive = kernel::derive_envelope(job.original, MessageKind::DIRECTIVE, ctx.id(),
                                                 {child_id}, job.original.payload);
    directive.requires_response = true;
    if (job.original.ttl_ms) {
        directive.ttl_ms = std::max<int64_t>(*job.original.remaining_ttl_ms(util::wall_now_ms()), 0);
    }

    const std::string key = job.key;
    pool_.mark_busy(child_id);
    job.assigned = child_id;
    job.dispatched_at = clock_();
    child_jobs_[child_id] = key;

    auto sent = ctx.bus().send(directive);
    if (!sent.success()) {
        spdlog::warn("Supervisor {} could not deliver {} to {}: {}", ctx.id(), key, child_id,
            kernel::error_code_to_string(sent.first_error()));
        handle_failure(ctx, key, child_id, kernel::error_code_to_string(sent.first_error()),
            "delivery to child failed", true);
        return false;
    }

    stats_.routed++;
    spdlog::debug("Supervisor {} routed {} to {} (attempt {})", ctx.id(), key, child_id, job.retries + 1);
    return true;
}

RouteResult TacticalSupervisor::relay(AgentContext& ctx, Job& job, ErrorCode cause) {
    RouteResult result;
    result.error = cause;

    std::string target;
    for (const auto& id : ctx.registry().find_by_capability(preferred_alternate_)) {
        if (id == ctx.id()) {
            continue;
        }
        auto identity = ctx.registry().lookup(id);
        if (identity && identity->tier == runtime::Tier::TACTICAL) {
            target = id;
            break;
        }
    }
    if (target.empty()) {
        result.message = std::string(kernel::error_code_to_string(cause)) +
            " and no supervisor for alternate '" + preferred_alternate_ + "'";
        return result;
    }

    json payload = job.original.payload;
    payload.erase("target");
    Envelope directive = kernel::derive_envelope(job.original, MessageKind::DIRECTIVE, ctx.id(),
                                                 {target}, payload);
    directive.requires_response = true;
    if (job.original.ttl_ms) {
        directive.ttl_ms = std::max<int64_t>(*job.original.remaining_ttl_ms(util::wall_now_ms()), 0);
    }

    auto sent = ctx.bus().send(directive);
    if (!sent.success()) {
        result.message = "relay to '" + target + "' failed: " +
            kernel::error_code_to_string(sent.first_error());
        return result;
    }

    job.relay_target = target;
    const std::string key = job.key;
    jobs_.emplace(key, std::move(job));
    stats_.relayed++;
    spdlog::info("Supervisor {} relayed {} to alternate {} ({})", ctx.id(), key, target,
        kernel::error_code_to_string(cause));

    result.success = true;
    result.error = ErrorCode::NONE;
    result.relayed = true;
    result.assigned_to = target;
    return result;
}

void TacticalSupervisor::pump_pending(AgentContext& ctx) {
    if (pending_.empty()) {
        return;
    }

    auto now = clock_();
    std::vector<std::string> keys(pending_.begin(), pending_.end());
    for (const auto& key : keys) {
        if (pool_.busy_count() >= concurrency_limit()) {
            break;
        }

        auto it = jobs_.find(key);
        if (it == jobs_.end()) {
            pending_.erase(std::remove(pending_.begin(), pending_.end(), key), pending_.end());
            continue;
        }
        if (job_expired(ctx, key)) {
            continue;
        }

        auto child = pick_child(it->second.pinned, now);
        if (!child) {
            continue;
        }
        pending_.erase(std::remove(pending_.begin(), pending_.end(), key), pending_.end());
        dispatch_job(ctx, it->second, *child);
    }
}

void TacticalSupervisor::dispatch_due_retries(AgentContext& ctx) {
    if (retries_.empty()) {
        return;
    }

    auto now = clock_();
    std::vector<std::string> due;
    for (auto it = retries_.begin(); it != retries_.end();) {
        if (it->due <= now) {
            due.push_back(it->key);
            it = retries_.erase(it);
        } else {
            ++it;
        }
    }

    std::vector<std::string> waiting;
    for (const auto& key : due) {
        auto it = jobs_.find(key);
        if (it == jobs_.end() || job_expired(ctx, key)) {
            continue;
        }
        auto child = pick_child(it->second.pinned, now);
        if (child) {
            dispatch_job(ctx, it->second, *child);
        } else {
            waiting.push_back(key);
        }
    }

    // Retries go ahead of newly queued work, within the same queue bound
    std::vector<std::string> queued;
    for (const auto& key : waiting) {
        if (pending_.size() + queued.size() >= config_.max_queue_depth) {
            fail_job(ctx, key, kernel::error_code_to_string(ErrorCode::POOL_EXHAUSTED),
                "retry found no idle child and the queue is full (" +
                std::to_string(pending_.size() + queued.size()) + ")", true);
            continue;
        }
        queued.push_back(key);
    }
    pending_.insert(pending_.begin(), queued.begin(), queued.end());
}

void TacticalSupervisor::handle_failure(AgentContext& ctx, const std::string& key,
                                        const std::string& child_id, const std::string& error_code,
                                        const std::string& message, bool retryable) {
    auto now = clock_();
    bool breaker_open = false;

    if (!child_id.empty()) {
        release_child(child_id);
        auto breaker_it = breakers_.find(child_id);
        if (breaker_it != breakers_.end()) {
            BreakerState before = breaker_it->second.state();
            breaker_it->second.record_failure(now);
            breaker_open = breaker_it->second.state() == BreakerState::OPEN;
            if (breaker_open && before != BreakerState::OPEN) {
                spdlog::warn("Circuit opened for {} after {} consecutive failures",
                    child_id, breaker_it->second.consecutive_failures());
            }
        }
    }

    auto it = jobs_.find(key);
    if (it == jobs_.end()) {
        return;
    }
    Job& job = it->second;
    job.assigned.clear();

    if (!stopping_ && !breaker_open && retry_policy_.should_retry(retryable, job.retries)) {
        job.retries++;
        int64_t delay_ms = retry_policy_.delay_for(job.retries);
        retries_.push_back(PendingRetry{key, now + std::chrono::milliseconds(delay_ms)});
        retry_log_.push_back(RetryRecord{key, job.retries, delay_ms});
        stats_.retries++;
        spdlog::debug("Supervisor {} retrying {} in {}ms (retry {}/{}): {}", ctx.id(), key, delay_ms,
            job.retries, retry_policy_.config().max_retries, message);
        return;
    }

    const RetryConfig& retry = retry_policy_.config();
    if (retryable && retry.owner == RetryOwner::SUPERVISOR &&
        retry.max_retries > 0 && job.retries >= retry.max_retries) {
        fail_job(ctx, key, kernel::error_code_to_string(ErrorCode::RETRIES_EXHAUSTED),
            "gave up after " + std::to_string(job.retries) + " retries: " + message, false);
        return;
    }
    fail_job(ctx, key, error_code, message, retryable);
}

void TacticalSupervisor::fail_job(AgentContext& ctx, const std::string& key, const std::string& error_code,
                                  const std::string& message, bool retryable) {
    auto it = jobs_.find(key);
    if (it == jobs_.end()) {
        return;
    }

    json metrics;
    metrics["attempts"] = it->second.retries + 1;
    ctx.report_failure(it->second.original, error_code, message, retryable, metrics);
    stats_.failed++;

    jobs_.erase(it);
    pending_.erase(std::remove(pending_.begin(), pending_.end(), key), pending_.end());
    retries_.erase(std::remove_if(retries_.begin(), retries_.end(),
        [&](const PendingRetry& retry) { return retry.key == key; }), retries_.end());
}

bool TacticalSupervisor::job_expired(AgentContext& ctx, const std::string& key) {
    auto it = jobs_.find(key);
    if (it == jobs_.end()) {
        return true;
    }
    if (!it->second.original.is_expired(util::wall_now_ms())) {
        return false;
    }

    ctx.bus().dead_letters().record(it->second.original, ctx.id(), kernel::DeadLetterReason::EXPIRED,
        "ttl elapsed while waiting for a child");
    fail_job(ctx, key, kernel::error_code_to_string(ErrorCode::EXPIRED),
        "directive expired before dispatch", false);
    return true;
}

void TacticalSupervisor::settle_breaker(const std::string& child_id, bool success) {
    auto it = breakers_.find(child_id);
    if (it == breakers_.end()) {
        return;
    }
    if (success) {
        it->second.record_success();
    } else {
        it->second.record_failure(clock_());
    }
}

void TacticalSupervisor::release_child(const std::string& child_id) {
    pool_.mark_idle(child_id);
    child_jobs_.erase(child_id);
}

void TacticalSupervisor::fail_in_flight(AgentContext& ctx, const std::string& child_id,
                                        const std::string& reason) {
    auto it = child_jobs_.find(child_id);
    if (it == child_jobs_.end()) {
        return;
    }

    const std::string key = it->second;
    if (abandoned_.erase(key) > 0) {
        settle_breaker(child_id, false);
        release_child(child_id);
        return;
    }
    handle_failure(ctx, key, child_id, "child_restarted", "child " + child_id + ": " + reason, true);
}

void TacticalSupervisor::forward_relay_report(AgentContext& ctx, const Envelope& report) {
    const std::string key = report.correlation_key();
    if (abandoned_.erase(key) > 0) {
        stats_.discarded_reports++;
        return;
    }

    auto it = jobs_.find(key);
    if (it == jobs_.end() || it->second.relay_target != report.sender) {
        stats_.discarded_reports++;
        spdlog::debug("Supervisor {} ignoring unsolicited report from {}", ctx.id(), report.sender);
        return;
    }

    auto view = kernel::parse_report(report.payload);
    if (view && view->ok()) {
        stats_.succeeded++;
    } else {
        stats_.failed++;
    }
    ctx.reply(it->second.original, MessageKind::REPORT, report.payload);
    jobs_.erase(it);
}

void TacticalSupervisor::send_summary(AgentContext& ctx) {
    AggregateSummary summary = aggregator_.flush(clock_());
    if (ctx.parent_id().empty()) {
        return;
    }

    json data = summary.to_json();
    data["supervisor"] = ctx.id();
    data["capability"] = config_.capability;
    data["queue_depth"] = pending_.size();
    data["in_flight"] = child_jobs_.size();
    data["pool_size"] = pool_.size();
    data["busy"] = pool_.busy_count();

    json payload = kernel::make_success_payload(data);
    payload["type"] = kernel::kReportSummary;
    ctx.send_to(ctx.parent_id(), MessageKind::REPORT, payload);
    stats_.summaries_sent++;
}

void TacticalSupervisor::report_capacity(AgentContext& ctx, const std::string& child_id,
                                         const std::string& reason) {
    if (ctx.parent_id().empty()) {
        return;
    }

    json data;
    data["action"] = control_actions().name(ControlAction::CAPACITY_REDUCED);
    data["supervisor"] = ctx.id();
    data["capability"] = config_.capability;
    data["retired"] = child_id;
    data["reason"] = reason;
    data["pool_size"] = pool_.size();

    json payload = kernel::make_success_payload(data);
    payload["type"] = kernel::kReportCapacity;
    ctx.send_to(ctx.parent_id(), MessageKind::REPORT, payload, 8);
}

bool TacticalSupervisor::within_restart_budget(const std::string& child_id, util::TimePoint now) {
    auto& history = restarts_[child_id];
    while (!history.empty() &&
           util::elapsed_ms(history.front(), now) > config_.restart_window_ms) {
        history.pop_front();
    }
    if (history.size() >= config_.max_restarts) {
        return false;
    }
    history.push_back(now);
    return true;
}

std::unique_ptr<runtime::Agent> TacticalSupervisor::make_child(const runtime::AgentSpec& spec,
                                                               std::string& error) {
    try {
        auto agent = factory_(spec);
        if (!agent) {
            error = "factory returned no agent";
        }
        return agent;
    } catch (const std::exception& e) {
        error = e.what();
        return nullptr;
    }
}

std::string TacticalSupervisor::next_child_id() {
    return config_.id + "." + config_.capability + "-" + std::to_string(++spawn_counter_);
}

} // namespace mycelium::supervisor
