#include "agents/echo_agent.hpp"
#include "kernel/payloads.hpp"
#include "runtime/agent/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <thread>

namespace mycelium::agents {

namespace {

constexpr int kMaxDelayMs = 60000;

} // anonymous namespace

const runtime::ActionTable<EchoAction>& echo_actions() {
    static const runtime::ActionTable<EchoAction> table{
        {EchoAction::ECHO, "echo"},
        {EchoAction::REVERSE, "reverse"}
    };
    return table;
}

void EchoAgent::on_directive(runtime::AgentContext& ctx, const runtime::Envelope& directive) {
    auto view = kernel::parse_directive(directive.payload);
    if (!view) {
        throw runtime::AgentError(kernel::ErrorCode::INVALID_DIRECTIVE, "directive has no action");
    }

    auto action = echo_actions().parse(view->action);
    if (!action) {
        throw runtime::AgentError(kernel::ErrorCode::INVALID_DIRECTIVE,
            "unknown action '" + view->action + "'");
    }

    std::string text = view->params.value("text", "");
    int delay_ms = std::clamp(view->params.value("delay_ms", delay_ms_), 0, kMaxDelayMs);
    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    if (*action == EchoAction::REVERSE) {
        std::reverse(text.begin(), text.end());
    }

    handled_++;
    spdlog::debug("[{}] {} '{}'", ctx.id(), view->action, text);
    ctx.report_success(directive, {{"text", text}});
}

runtime::AgentFactoryRegistry default_factories() {
    runtime::AgentFactoryRegistry factories;
    factories.add(kEchoCapability, [](const runtime::AgentSpec& spec) {
        return std::make_unique<EchoAgent>(spec.config.value("delay_ms", 0));
    });
    return factories;
}

} // namespace mycelium::agents
