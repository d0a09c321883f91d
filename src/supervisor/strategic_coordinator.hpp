#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/envelope.hpp"
#include "runtime/agent/agent.hpp"
#include "supervisor/control.hpp"
#include "supervisor/report_aggregator.hpp"
#include "util/clock.hpp"

namespace mycelium::supervisor {

using kernel::Envelope;
using runtime::AgentContext;

struct CoordinatorThresholds {
    double min_success_rate = 0.8;
    double max_avg_latency_ms = 5000.0;
    size_t max_queue_depth = 32;
};

struct CoordinatorConfig {
    std::string id = "coordinator";
    CoordinatorThresholds thresholds;
    int64_t silence_threshold_ms = 30000;
    int64_t sweep_interval_ms = 1000;
    int64_t reallocation_cooldown_ms = 10000;
    // capability -> capability to fail over to
    std::unordered_map<std::string, std::string> alternates;
};

// One domain directive produced from a goal
struct GoalStep {
    std::string capability;
    std::string action;
    nlohmann::json params = nlohmann::json::object();
};

// Throws std::invalid_argument for goals it cannot decompose
using GoalDecomposer = std::function<std::vector<GoalStep>(const nlohmann::json& goal)>;

// {"capability", "action", "params"} or {"steps": [{...}, ...]}
std::vector<GoalStep> decompose_goal(const nlohmann::json& goal);

struct IssuedControl {
    std::string supervisor;
    ControlAction action;
    nlohmann::json params;
    std::string reason;
};

/**
 * Strategic tier: the root supervisor.
 *
 * Decomposes goals into domain directives routed to the tactical supervisor
 * advertising each capability, reacts to aggregated summaries that breach
 * thresholds with reallocation directives, and broadcasts a system alert
 * when a supervisor goes silent. It never recovers supervisors itself.
 */
class StrategicCoordinator : public runtime::Agent {
public:
    explicit StrategicCoordinator(CoordinatorConfig config = {},
                                  GoalDecomposer decomposer = decompose_goal,
                                  util::ClockFn clock = util::steady_now);

    bool on_initialize(AgentContext& ctx) override;
    void on_tick(AgentContext& ctx) override;
    void on_directive(AgentContext& ctx, const Envelope& goal) override;
    void on_report(AgentContext& ctx, const Envelope& report) override;
    void on_query(AgentContext& ctx, const Envelope& query) override;
    void on_event(AgentContext& ctx, const Envelope& event) override;

    void on_aggregated_report(AgentContext& ctx, const std::string& supervisor_id,
                              const nlohmann::json& summary);
    void health_sweep(AgentContext& ctx, util::TimePoint now);

    // Introspection
    const CoordinatorConfig& config() const { return config_; }
    size_t goals_in_flight() const { return goals_.size(); }
    const std::vector<IssuedControl>& issued_controls() const { return issued_; }
    uint64_t alerts_raised() const { return alerts_raised_; }
    uint64_t capacity_reductions() const { return capacity_reductions_; }
    nlohmann::json status_snapshot() const;

private:
    struct Goal {
        Envelope original;
        std::vector<nlohmann::json> results;
        size_t remaining = 0;
    };

    struct StepRef {
        std::string goal_key;
        size_t index = 0;
        std::string supervisor;
        std::string capability;
    };

    struct SupervisorWatch {
        util::TimePoint last_seen{};
        bool alerted = false;
        nlohmann::json last_summary;
        std::optional<util::TimePoint> last_reallocation;
    };

    std::optional<std::string> supervisor_for(AgentContext& ctx, const std::string& capability) const;
    void on_step_report(AgentContext& ctx, const Envelope& report);
    void finish_goal(const std::string& goal_key);
    void issue_control(AgentContext& ctx, const std::string& supervisor_id, ControlAction action,
                       nlohmann::json params, const std::string& reason);
    void raise_alert(AgentContext& ctx, const std::string& supervisor_id, const std::string& reason);
    void note_activity(const std::string& supervisor_id, util::TimePoint now);

    CoordinatorConfig config_;
    GoalDecomposer decomposer_;
    util::ClockFn clock_;

    std::unordered_map<std::string, Goal> goals_;
    std::unordered_map<std::string, StepRef> steps_;
    std::unordered_set<std::string> control_ids_;
    std::unordered_map<std::string, SupervisorWatch> watches_;
    util::TimePoint last_sweep_{};

    std::vector<IssuedControl> issued_;
    uint64_t alerts_raised_ = 0;
    uint64_t capacity_reductions_ = 0;
};

} // namespace mycelium::supervisor
