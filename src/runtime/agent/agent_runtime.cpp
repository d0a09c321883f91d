#include "runtime/agent/agent_runtime.hpp"
#include "kernel/payloads.hpp"
#include "util/clock.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace mycelium::runtime {

// ============================================================================
// AgentRuntime Implementation
// ============================================================================

AgentRuntime::AgentRuntime(std::unique_ptr<Agent> agent,
                           AgentIdentity identity,
                           std::string parent_id,
                           std::shared_ptr<kernel::Mailbox> mailbox,
                           kernel::MessageBus& bus,
                           RuntimeConfig config)
    : agent_(std::move(agent))
    , identity_(std::move(identity))
    , parent_id_(std::move(parent_id))
    , mailbox_(std::move(mailbox))
    , bus_(bus)
    , config_(config)
    , ctx_(identity_, parent_id_, bus) {
    spdlog::debug("AgentRuntime created: {} (tier={})", identity_.id, tier_to_string(identity_.tier));
}

AgentRuntime::~AgentRuntime() {
    stop();
}

bool AgentRuntime::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != AgentState::CREATED) {
            spdlog::warn("Agent {} cannot start from state {}", identity_.id, agent_state_to_string(state_));
            return false;
        }
        worker_finished_ = false;
    }

    stop_requested_ = false;
    stop_hook_called_ = false;
    set_state(AgentState::INITIALIZING);
    worker_ = std::thread([this]() { run_loop(); });
    return true;
}

bool AgentRuntime::wait_ready(int timeout_ms) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return state_ != AgentState::CREATED && state_ != AgentState::INITIALIZING;
    });
    return state_ == AgentState::RUNNING || state_ == AgentState::DEGRADED;
}

void AgentRuntime::stop() {
    if (worker_.joinable()) {
        stop_requested_ = true;
        mailbox_->interrupt();
        worker_.join();
    }

    if (state() == AgentState::STOPPED) {
        return;
    }

    // Worker is gone; lifecycle hooks may run on this thread
    if (state() != AgentState::CREATED && !stop_hook_called_) {
        stop_hook_called_ = true;
        try {
            agent_->on_stop(ctx_);
        } catch (const std::exception& e) {
            spdlog::warn("Agent {} on_stop failed: {}", identity_.id, e.what());
        }
    }

    set_state(AgentState::STOPPED);
    drain_as_stopped();
    spdlog::info("Agent {} stopped ({} envelopes processed)", identity_.id, processed_count_.load());
}

bool AgentRuntime::restart(std::unique_ptr<Agent> fresh) {
    if (!fresh) {
        spdlog::error("Agent {} restart without a replacement agent", identity_.id);
        return false;
    }
    if (!halt(config_.stop_timeout_ms)) {
        spdlog::error("Agent {} did not stop within {}ms, restart abandoned",
            identity_.id, config_.stop_timeout_ms);
        return false;
    }

    if (state() != AgentState::STOPPED && state() != AgentState::CREATED && !stop_hook_called_) {
        stop_hook_called_ = true;
        try {
            agent_->on_stop(ctx_);
        } catch (const std::exception& e) {
            spdlog::warn("Agent {} on_stop failed: {}", identity_.id, e.what());
        }
    }

    agent_ = std::move(fresh);
    ctx_.reset();
    mailbox_->reopen();
    set_last_error("");
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = AgentState::CREATED;
    }
    restart_count_++;

    spdlog::info("Restarting agent {} (restart #{})", identity_.id, restart_count_.load());
    if (!start()) {
        return false;
    }
    return wait_ready(config_.ready_timeout_ms);
}

AgentState AgentRuntime::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string AgentRuntime::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

bool AgentRuntime::halted() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return worker_finished_;
}

// ============================================================================
// Worker
// ============================================================================

void AgentRuntime::run_loop() {
    bool initialized = false;
    try {
        initialized = agent_->on_initialize(ctx_);
    } catch (const std::exception& e) {
        set_last_error(e.what());
        spdlog::error("Agent {} failed to initialize: {}", identity_.id, e.what());
    }

    if (!initialized) {
        stop_hook_called_ = true;
        set_state(AgentState::STOPPED);
        drain_as_stopped();
    } else {
        set_state(AgentState::RUNNING);
        heartbeat();

        while (!stop_requested_) {
            auto envelope = mailbox_->pop(std::chrono::milliseconds(config_.poll_interval_ms));
            if (stop_requested_) {
                break;
            }
            // A closed mailbox means the identity was unregistered under us
            if (!envelope && mailbox_->closed()) {
                spdlog::info("Agent {} mailbox closed, stopping", identity_.id);
                stop_hook_called_ = true;
                try {
                    agent_->on_stop(ctx_);
                } catch (const std::exception& e) {
                    spdlog::warn("Agent {} on_stop failed: {}", identity_.id, e.what());
                }
                set_state(AgentState::STOPPED);
                break;
            }

            if (envelope) {
                process(*envelope);
                if (state() == AgentState::STOPPED) {
                    break;
                }
            }

            // Heartbeat after every envelope, at least once per interval otherwise
            int64_t now_ms = util::wall_now_ms();
            if (envelope || now_ms - last_heartbeat_ms_ >= config_.heartbeat_interval_ms) {
                heartbeat();
            }

            try {
                agent_->on_tick(ctx_);
            } catch (const std::exception& e) {
                spdlog::warn("Agent {} tick failed: {}", identity_.id, e.what());
            }
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    worker_finished_ = true;
    state_cv_.notify_all();
}

void AgentRuntime::process(const kernel::Envelope& envelope) {
    // TTL is checked again immediately before dispatch
    if (envelope.is_expired(util::wall_now_ms())) {
        bus_.dead_letters().record(envelope, identity_.id, kernel::DeadLetterReason::EXPIRED,
            "ttl elapsed before dispatch");
        // The sender still waits for the directive's terminal report
        if (envelope.kind == kernel::MessageKind::DIRECTIVE && !envelope.sender.empty()) {
            auto report = kernel::derive_envelope(envelope, kernel::MessageKind::REPORT, identity_.id,
                {envelope.sender},
                kernel::make_failure_payload(kernel::ErrorCode::EXPIRED, "ttl elapsed before dispatch", false));
            auto sent = bus_.send(report);
            if (!sent.success()) {
                spdlog::warn("Agent {} could not report expiry of {} to {}: {}", identity_.id,
                    envelope.correlation_key(), envelope.sender,
                    kernel::error_code_to_string(sent.first_error()));
            }
        }
        return;
    }

    DispatchOutcome outcome = dispatch_envelope(*agent_, ctx_, envelope);
    processed_count_++;

    if (envelope.kind == kernel::MessageKind::DIRECTIVE) {
        bus_.registry().report_outcome(identity_.id,
            outcome.status == DispatchStatus::HANDLED && !outcome.reported_failure,
            util::wall_now_ms());
    }

    switch (outcome.status) {
        case DispatchStatus::FATAL:
            enter_fatal(outcome.error);
            break;
        case DispatchStatus::HANDLER_ERROR:
            set_last_error(outcome.error);
            if (state() == AgentState::RUNNING) {
                set_state(AgentState::DEGRADED);
            }
            break;
        case DispatchStatus::HANDLED:
            if (state() == AgentState::DEGRADED && !outcome.reported_failure) {
                set_state(AgentState::RUNNING);
            }
            break;
    }
}

void AgentRuntime::enter_fatal(const std::string& error) {
    set_last_error(error);
    set_state(AgentState::STOPPED);

    stop_hook_called_ = true;
    try {
        agent_->on_stop(ctx_);
    } catch (const std::exception& e) {
        spdlog::warn("Agent {} on_stop failed: {}", identity_.id, e.what());
    }

    if (!parent_id_.empty()) {
        nlohmann::json fields;
        fields["agent_id"] = identity_.id;
        fields["error"] = error;
        ctx_.emit_event(parent_id_, kernel::kEventAgentFatal, fields, kernel::kMaxPriority);
    }
    drain_as_stopped();
}

void AgentRuntime::set_state(AgentState new_state) {
    AgentState old_state;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        old_state = state_;
        state_ = new_state;
    }
    state_cv_.notify_all();

    if (old_state != new_state) {
        spdlog::debug("Agent {}: {} -> {}", identity_.id,
            agent_state_to_string(old_state), agent_state_to_string(new_state));
        bus_.registry().report_state(identity_.id, new_state);
    }
}

void AgentRuntime::set_last_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = error;
}

void AgentRuntime::heartbeat() {
    last_heartbeat_ms_ = util::wall_now_ms();
    bus_.registry().heartbeat(identity_.id, last_heartbeat_ms_);
}

void AgentRuntime::drain_as_stopped() {
    auto pending = mailbox_->close_and_drain();
    for (const auto& envelope : pending) {
        bus_.dead_letters().record(envelope, identity_.id, kernel::DeadLetterReason::AGENT_STOPPED);
    }
}

bool AgentRuntime::halt(int timeout_ms) {
    if (!worker_.joinable()) {
        return true;
    }

    stop_requested_ = true;
    mailbox_->interrupt();

    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (!state_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                [this]() { return worker_finished_; })) {
            return false;
        }
    }
    worker_.join();
    return true;
}

} // namespace mycelium::runtime
