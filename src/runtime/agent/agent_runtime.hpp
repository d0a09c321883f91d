#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "kernel/mailbox.hpp"
#include "kernel/message_bus.hpp"
#include "runtime/agent/agent.hpp"
#include "runtime/agent/types.hpp"

namespace mycelium::runtime {

struct RuntimeConfig {
    int poll_interval_ms = 100;        // mailbox wait per loop iteration
    int heartbeat_interval_ms = 1000;  // upper bound between heartbeats
    int ready_timeout_ms = 5000;       // how long spawners wait for RUNNING
    int stop_timeout_ms = 5000;        // how long restart waits for the old worker
};

/**
 * Execution unit for one agent: a dedicated thread draining the agent's
 * mailbox strictly one envelope at a time.
 *
 * State machine: CREATED -> INITIALIZING -> RUNNING <-> DEGRADED -> STOPPED.
 * STOPPED is terminal for a worker; restart() replaces the agent object and
 * starts a new worker under the same identity and mailbox.
 */
class AgentRuntime {
public:
    AgentRuntime(std::unique_ptr<Agent> agent,
                 AgentIdentity identity,
                 std::string parent_id,
                 std::shared_ptr<kernel::Mailbox> mailbox,
                 kernel::MessageBus& bus,
                 RuntimeConfig config = {});
    ~AgentRuntime();

    // Non-copyable
    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    // Lifecycle
    bool start();
    bool wait_ready(int timeout_ms);
    void stop();
    bool restart(std::unique_ptr<Agent> fresh);

    // Ask the worker to exit and wait up to timeout_ms. False if the worker is
    // still inside a handler; the runtime then keeps its thread until stop().
    bool halt(int timeout_ms);

    // Status
    AgentState state() const;
    const std::string& id() const { return identity_.id; }
    const AgentIdentity& identity() const { return identity_; }
    uint64_t processed_count() const { return processed_count_; }
    uint32_t restart_count() const { return restart_count_; }
    std::string last_error() const;
    bool halted() const;

    // Only safe while the worker is not running, or from the agent's own thread
    Agent& agent() { return *agent_; }

private:
    void run_loop();
    void process(const kernel::Envelope& envelope);
    void enter_fatal(const std::string& error);
    void set_state(AgentState new_state);
    void set_last_error(const std::string& error);
    void heartbeat();
    void drain_as_stopped();

    std::unique_ptr<Agent> agent_;
    AgentIdentity identity_;
    std::string parent_id_;
    std::shared_ptr<kernel::Mailbox> mailbox_;
    kernel::MessageBus& bus_;
    RuntimeConfig config_;
    AgentContext ctx_;

    std::thread worker_;
    std::atomic<bool> stop_requested_{false};
    bool worker_finished_ = true;
    bool stop_hook_called_ = false;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    AgentState state_ = AgentState::CREATED;
    std::string last_error_;

    std::atomic<uint64_t> processed_count_{0};
    std::atomic<uint32_t> restart_count_{0};
    int64_t last_heartbeat_ms_ = 0;
};

} // namespace mycelium::runtime
