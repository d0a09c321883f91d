#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/dead_letter.hpp"
#include "kernel/endpoint.hpp"
#include "kernel/message_bus.hpp"
#include "kernel/payloads.hpp"
#include "kernel/registry.hpp"
#include "runtime/agent/agent.hpp"
#include "runtime/agent/agent_runtime.hpp"
#include "runtime/agent/errors.hpp"
#include "runtime/agent/factory.hpp"
#include "supervisor/tactical_supervisor.hpp"
#include "util/clock.hpp"

namespace mycelium::testing {

using json = nlohmann::json;
using kernel::Envelope;
using kernel::MessageKind;

// Poll pred every few milliseconds until it holds or timeout_ms passes
template <typename Pred>
bool wait_until(Pred pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

inline runtime::RuntimeConfig fast_runtime() {
    runtime::RuntimeConfig config;
    config.poll_interval_ms = 5;
    config.heartbeat_interval_ms = 20;
    config.ready_timeout_ms = 2000;
    config.stop_timeout_ms = 2000;
    return config;
}

// Monotonic clock moved by hand
class ManualClock {
public:
    util::TimePoint now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(int64_t ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::milliseconds(ms);
    }

    util::ClockFn fn() {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex mutex_;
    util::TimePoint now_ = util::SteadyClock::now();
};

// Envelopes observed by test agents, shared across restarts
class EnvelopeLog {
public:
    void add(const Envelope& envelope) {
        std::lock_guard<std::mutex> lock(mutex_);
        envelopes_.push_back(envelope);
    }

    std::vector<Envelope> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return envelopes_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return envelopes_.size();
    }

    size_t count(MessageKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& envelope : envelopes_) {
            if (envelope.kind == kind) {
                n++;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Envelope> envelopes_;
};

// Records everything; answers directives with the given behaviour
using DirectiveScript = std::function<void(runtime::AgentContext&, const Envelope&)>;

inline DirectiveScript succeed(json data = {{"ok", true}}) {
    return [data](runtime::AgentContext& ctx, const Envelope& directive) {
        ctx.report_success(directive, data);
    };
}

inline DirectiveScript fail_with(const std::string& code, bool retryable) {
    return [code, retryable](runtime::AgentContext& ctx, const Envelope& directive) {
        ctx.report_failure(directive, code, "scripted failure", retryable);
    };
}

class RecordingAgent : public runtime::Agent {
public:
    RecordingAgent(std::shared_ptr<EnvelopeLog> log, DirectiveScript script = succeed())
        : log_(std::move(log))
        , script_(std::move(script)) {}

    bool on_initialize(runtime::AgentContext&) override {
        return initialize_ok;
    }

    void on_stop(runtime::AgentContext&) override {
        stopped = true;
    }

    void on_directive(runtime::AgentContext& ctx, const Envelope& directive) override {
        log_->add(directive);
        script_(ctx, directive);
    }

    void on_report(runtime::AgentContext&, const Envelope& report) override { log_->add(report); }
    void on_coordinate(runtime::AgentContext&, const Envelope& proposal) override { log_->add(proposal); }
    void on_event(runtime::AgentContext&, const Envelope& event) override { log_->add(event); }

    void on_query(runtime::AgentContext& ctx, const Envelope& query) override {
        log_->add(query);
        ctx.reply(query, MessageKind::REPORT, kernel::make_success_payload({{"pong", true}}));
    }

    bool initialize_ok = true;
    std::atomic<bool> stopped{false};

private:
    std::shared_ptr<EnvelopeLog> log_;
    DirectiveScript script_;
};

// Factory whose children share one log and one script
inline runtime::AgentFactory recording_factory(std::shared_ptr<EnvelopeLog> log,
                                               DirectiveScript script = succeed()) {
    return [log, script](const runtime::AgentSpec&) {
        return std::make_unique<RecordingAgent>(log, script);
    };
}

// Holds every directive until release() is called
class Gate {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        waiting_++;
        cv_.wait(lock, [this]() { return open_; });
        waiting_--;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    int waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    int waiting_ = 0;
};

inline DirectiveScript gated(std::shared_ptr<Gate> gate, DirectiveScript then = succeed()) {
    return [gate, then](runtime::AgentContext& ctx, const Envelope& directive) {
        gate->wait();
        then(ctx, directive);
    };
}

// A registered identity whose mailbox the test reads directly
class Inbox {
public:
    Inbox(kernel::Registry& registry, runtime::AgentIdentity identity, const std::string& parent_id = "")
        : registry_(registry)
        , id_(identity.id) {
        auto result = registry_.register_agent(identity, parent_id);
        mailbox_ = result.handle.mailbox;
    }

    ~Inbox() {
        registry_.unregister(id_);
    }

    std::optional<Envelope> next(int timeout_ms = 1000) {
        return mailbox_->pop(std::chrono::milliseconds(timeout_ms));
    }

    std::vector<Envelope> drain() {
        std::vector<Envelope> all;
        while (auto envelope = mailbox_->try_pop()) {
            all.push_back(std::move(*envelope));
        }
        return all;
    }

    size_t size() const { return mailbox_->size(); }
    const std::string& id() const { return id_; }

private:
    kernel::Registry& registry_;
    std::string id_;
    std::shared_ptr<kernel::Mailbox> mailbox_;
};

// Reports with the given payload "type" among envelopes
inline std::vector<Envelope> reports_of_type(const std::vector<Envelope>& envelopes, const std::string& type) {
    std::vector<Envelope> matches;
    for (const auto& envelope : envelopes) {
        if (envelope.kind == MessageKind::REPORT && envelope.payload.value("type", std::string()) == type) {
            matches.push_back(envelope);
        }
    }
    return matches;
}

/**
 * Runs a TacticalSupervisor on the test thread. The test plays the
 * supervisor's runtime loop: pump() drains its mailbox through
 * dispatch_envelope and then ticks, so every supervisor call happens here
 * while the children run on real runtimes.
 */
class SupervisorHarness {
public:
    SupervisorHarness(supervisor::SupervisorConfig config, runtime::AgentFactory factory)
        : registry_(dead_letters_)
        , bus_(registry_, dead_letters_)
        , parent_(registry_, runtime::AgentIdentity{"parent", {"coordination"}, runtime::Tier::STRATEGIC})
        , client_(bus_, "client") {
        if (config.id.empty()) {
            config.id = "sup";
        }
        id_ = config.id;
        runtime::AgentIdentity identity{config.id, {config.capability}, runtime::Tier::TACTICAL};
        auto registration = registry_.register_agent(identity, "parent");
        mailbox_ = registration.handle.mailbox;
        supervisor_ = std::make_unique<supervisor::TacticalSupervisor>(
            config, std::move(factory), fast_runtime(), clock.fn());
        ctx_ = std::make_unique<runtime::AgentContext>(identity, "parent", bus_);
    }

    ~SupervisorHarness() {
        if (started_) {
            supervisor_->on_stop(*ctx_);
        }
    }

    bool start() {
        started_ = supervisor_->on_initialize(*ctx_);
        return started_;
    }

    // Hand an envelope to the supervisor as its runtime would
    runtime::DispatchOutcome deliver(const Envelope& envelope) {
        return runtime::dispatch_envelope(*supervisor_, *ctx_, envelope);
    }

    // One loop iteration: everything queued, then on_tick
    size_t pump(int wait_ms = 2) {
        size_t handled = 0;
        auto first = mailbox_->pop(std::chrono::milliseconds(wait_ms));
        if (first) {
            deliver(*first);
            handled++;
            while (auto envelope = mailbox_->try_pop()) {
                deliver(*envelope);
                handled++;
            }
        }
        supervisor_->on_tick(*ctx_);
        return handled;
    }

    Envelope directive(const std::string& action, json params = json::object(), int priority = 5) {
        auto envelope = client_.make_directive(id_, action, std::move(params), priority);
        return envelope;
    }

    // Build a directive from the client and hand it straight to the supervisor
    Envelope submit(const std::string& action, json params = json::object(), int priority = 5) {
        auto envelope = directive(action, std::move(params), priority);
        deliver(envelope);
        return envelope;
    }

    // Pump until the client holds the report for `directive`
    std::optional<Envelope> await_report(const Envelope& directive, int timeout_ms = 3000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            pump();
            auto report = client_.await_report(directive.correlation_key(), 1);
            if (report) {
                return report;
            }
        }
        return std::nullopt;
    }

    // Pump until pred holds
    template <typename Pred>
    bool pump_until(Pred pred, int timeout_ms = 3000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            pump();
            if (pred()) {
                return true;
            }
        }
        return pred();
    }

    supervisor::TacticalSupervisor& sup() { return *supervisor_; }
    runtime::AgentContext& ctx() { return *ctx_; }
    kernel::Registry& registry() { return registry_; }
    kernel::MessageBus& bus() { return bus_; }
    kernel::DeadLetterStore& dead_letters() { return dead_letters_; }
    Inbox& parent() { return parent_; }
    kernel::Endpoint& client() { return client_; }
    const std::string& id() const { return id_; }

    ManualClock clock;

private:
    kernel::DeadLetterStore dead_letters_;
    kernel::Registry registry_;
    kernel::MessageBus bus_;
    Inbox parent_;
    kernel::Endpoint client_;
    std::string id_;
    std::shared_ptr<kernel::Mailbox> mailbox_;
    std::unique_ptr<supervisor::TacticalSupervisor> supervisor_;
    std::unique_ptr<runtime::AgentContext> ctx_;
    bool started_ = false;
};

} // namespace mycelium::testing
