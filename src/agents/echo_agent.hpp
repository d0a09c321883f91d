#pragma once
#include <string>
#include "runtime/agent/action_table.hpp"
#include "runtime/agent/agent.hpp"
#include "runtime/agent/factory.hpp"

namespace mycelium::agents {

enum class EchoAction {
    ECHO,
    REVERSE
};

const runtime::ActionTable<EchoAction>& echo_actions();

constexpr const char* kEchoCapability = "echo";

/**
 * Sample execution agent.
 *
 *   echo    {"text": ...} -> {"text": ...}
 *   reverse {"text": ...} -> {"text": reversed}
 *
 * An optional "delay_ms" param (or AgentSpec config key) simulates slow work.
 */
class EchoAgent : public runtime::Agent {
public:
    explicit EchoAgent(int delay_ms = 0) : delay_ms_(delay_ms) {}

    void on_directive(runtime::AgentContext& ctx, const runtime::Envelope& directive) override;

    uint64_t handled() const { return handled_; }

private:
    int delay_ms_;
    uint64_t handled_ = 0;
};

// Factory registry with every built-in execution agent
runtime::AgentFactoryRegistry default_factories();

} // namespace mycelium::agents
