#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/envelope.hpp"
#include "kernel/errors.hpp"
#include "runtime/agent/agent.hpp"
#include "runtime/agent/agent_runtime.hpp"
#include "runtime/agent/factory.hpp"
#include "supervisor/agent_pool.hpp"
#include "supervisor/circuit_breaker.hpp"
#include "supervisor/control.hpp"
#include "supervisor/report_aggregator.hpp"
#include "supervisor/retry_policy.hpp"
#include "util/clock.hpp"

namespace mycelium::supervisor {

using kernel::Envelope;
using kernel::ErrorCode;
using runtime::AgentContext;

struct SupervisorConfig {
    std::string id;
    std::string capability;                 // capability of the pooled children
    std::vector<std::string> capabilities;  // advertised by the supervisor; defaults to {capability}
    size_t initial_pool_size = 2;
    size_t max_pool_size = 8;
    size_t max_queue_depth = 64;
    size_t max_concurrency = 0;             // 0 = whole pool
    BreakerConfig breaker;
    RetryConfig retry;
    AggregationConfig aggregation;
    uint32_t max_restarts = 3;              // per child within restart_window_ms
    int64_t restart_window_ms = 300000;
    size_t child_mailbox_capacity = 256;
    nlohmann::json child_config = nlohmann::json::object();
};

struct SpawnResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;
    std::string id;
};

struct RouteResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;
    std::string assigned_to;   // child id, or the relay target
    bool queued = false;
    bool relayed = false;
};

struct SupervisorStats {
    uint64_t routed = 0;
    uint64_t queued = 0;
    uint64_t retries = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t relayed = 0;
    uint64_t abandoned = 0;
    uint64_t discarded_reports = 0;
    uint64_t restarts = 0;
    uint64_t retired = 0;
    uint64_t summaries_sent = 0;
    uint64_t alerts_received = 0;
};

struct RetryRecord {
    std::string correlation_id;
    uint32_t attempt = 0;
    int64_t delay_ms = 0;
};

/**
 * Tactical tier: owns a pool of execution agents of one capability.
 *
 * Routes directives to idle children (round-robin), queues up to a bounded
 * depth, retries retryable failures with exponential backoff, keeps one
 * circuit breaker per child, aggregates child reports into periodic
 * summaries for its parent, and restarts unhealthy children within a
 * restart budget.
 *
 * Runs as an ordinary agent; every method below is called from the
 * supervisor's own runtime thread.
 */
class TacticalSupervisor : public runtime::Agent {
public:
    TacticalSupervisor(SupervisorConfig config,
                       runtime::AgentFactory factory,
                       runtime::RuntimeConfig child_runtime = {},
                       util::ClockFn clock = util::steady_now);
    ~TacticalSupervisor() override;

    // ========================================================================
    // Agent handlers
    // ========================================================================

    bool on_initialize(AgentContext& ctx) override;
    void on_stop(AgentContext& ctx) override;
    void on_tick(AgentContext& ctx) override;
    void on_directive(AgentContext& ctx, const Envelope& directive) override;
    void on_report(AgentContext& ctx, const Envelope& report) override;
    void on_query(AgentContext& ctx, const Envelope& query) override;
    void on_event(AgentContext& ctx, const Envelope& event) override;

    // ========================================================================
    // Operations
    // ========================================================================

    SpawnResult spawn_child(AgentContext& ctx, const runtime::AgentSpec& spec);
    RouteResult route(AgentContext& ctx, const Envelope& directive);
    void on_child_report(AgentContext& ctx, const Envelope& report);
    void on_child_unhealthy(AgentContext& ctx, const std::string& child_id, const std::string& reason);
    bool abandon(AgentContext& ctx, const std::string& correlation_id);
    void retire_child(AgentContext& ctx, const std::string& child_id, const std::string& reason);

    // ========================================================================
    // Introspection
    // ========================================================================

    const SupervisorConfig& config() const { return config_; }
    const AgentPool& pool() const { return pool_; }
    std::optional<BreakerState> breaker_state(const std::string& child_id) const;
    const CircuitBreaker* breaker(const std::string& child_id) const;
    size_t queue_depth() const { return pending_.size(); }
    size_t in_flight_count() const { return child_jobs_.size(); }
    size_t pending_retry_count() const { return retries_.size(); }
    size_t active_jobs() const { return jobs_.size(); }
    size_t concurrency_limit() const;
    const std::string& preferred_alternate() const { return preferred_alternate_; }
    const SupervisorStats& stats() const { return stats_; }
    const std::vector<RetryRecord>& retry_log() const { return retry_log_; }
    const ReportAggregator& aggregator() const { return aggregator_; }
    runtime::AgentRuntime* child_runtime(const std::string& child_id);
    nlohmann::json status_snapshot() const;

private:
    struct Job {
        Envelope original;                  // as received from upstream
        std::string key;                    // original.correlation_key()
        uint32_t retries = 0;
        std::string assigned;               // child holding it; empty while waiting
        std::optional<std::string> pinned;  // explicit target from the directive
        util::TimePoint dispatched_at{};
        std::string relay_target;           // set when relayed to an alternate supervisor
    };

    struct PendingRetry {
        std::string key;
        util::TimePoint due;
    };

    // Control directives
    void handle_control(AgentContext& ctx, const Envelope& directive,
                        ControlAction action, const nlohmann::json& params);
    void handle_system_alert(const nlohmann::json& details);

    // Routing internals
    std::optional<std::string> pick_child(const std::optional<std::string>& pinned, util::TimePoint now);
    bool all_breakers_blocked(util::TimePoint now) const;
    bool dispatch_job(AgentContext& ctx, Job& job, const std::string& child_id);
    RouteResult relay(AgentContext& ctx, Job& job, ErrorCode cause);
    void pump_pending(AgentContext& ctx);
    void dispatch_due_retries(AgentContext& ctx);
    void handle_failure(AgentContext& ctx, const std::string& key, const std::string& child_id,
                        const std::string& error_code, const std::string& message, bool retryable);
    void fail_job(AgentContext& ctx, const std::string& key, const std::string& error_code,
                  const std::string& message, bool retryable);
    bool job_expired(AgentContext& ctx, const std::string& key);
    // Record a report outcome that no longer belongs to a live job
    void settle_breaker(const std::string& child_id, bool success);
    void release_child(const std::string& child_id);
    void fail_in_flight(AgentContext& ctx, const std::string& child_id, const std::string& reason);
    void forward_relay_report(AgentContext& ctx, const Envelope& report);
    void send_summary(AgentContext& ctx);
    void report_capacity(AgentContext& ctx, const std::string& child_id, const std::string& reason);
    bool within_restart_budget(const std::string& child_id, util::TimePoint now);
    std::unique_ptr<runtime::Agent> make_child(const runtime::AgentSpec& spec, std::string& error);
    std::string next_child_id();

    SupervisorConfig config_;
    runtime::AgentFactory factory_;
    runtime::RuntimeConfig child_runtime_;
    util::ClockFn clock_;

    AgentPool pool_;
    RetryPolicy retry_policy_;
    ReportAggregator aggregator_;

    std::unordered_map<std::string, std::unique_ptr<runtime::AgentRuntime>> children_;
    std::unordered_map<std::string, runtime::AgentSpec> specs_;
    std::unordered_map<std::string, CircuitBreaker> breakers_;
    std::unordered_map<std::string, std::deque<util::TimePoint>> restarts_;
    std::vector<std::unique_ptr<runtime::AgentRuntime>> stalled_;

    std::unordered_map<std::string, Job> jobs_;
    std::unordered_map<std::string, std::string> child_jobs_;   // child id -> job key
    std::deque<std::string> pending_;
    std::vector<PendingRetry> retries_;
    std::unordered_set<std::string> abandoned_;

    size_t concurrency_override_ = 0;
    std::string preferred_alternate_;
    uint64_t spawn_counter_ = 0;
    bool stopping_ = false;

    SupervisorStats stats_;
    std::vector<RetryRecord> retry_log_;
};

} // namespace mycelium::supervisor
