#include "kernel/health_monitor.hpp"
#include "kernel/payloads.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace mycelium::kernel {

HealthMonitor::HealthMonitor(MessageBus& bus, HealthMonitorConfig config)
    : bus_(bus)
    , config_(config) {}

size_t HealthMonitor::tick(int64_t now_ms) {
    auto stale = bus_.registry().collect_stale(now_ms, config_.stale_after_ms);
    size_t emitted = 0;

    for (const auto& agent : stale) {
        if (agent.parent_id.empty()) {
            spdlog::warn("Agent '{}' stale for {}ms and has no supervisor", agent.id, agent.stale_ms);
            continue;
        }

        json fields;
        fields["agent_id"] = agent.id;
        fields["last_heartbeat_ms"] = agent.last_heartbeat_ms;
        fields["stale_ms"] = agent.stale_ms;

        auto event = make_envelope(MessageKind::EVENT, kSenderId, {agent.parent_id},
                                   make_event_payload(kEventAgentUnhealthy, fields),
                                   kEventPriority);
        spdlog::warn("Agent '{}' unhealthy (no heartbeat for {}ms), notifying '{}'",
            agent.id, agent.stale_ms, agent.parent_id);

        if (bus_.send(event).success()) {
            emitted++;
        }
    }

    events_emitted_ += emitted;
    return emitted;
}

} // namespace mycelium::kernel
