#pragma once
#include <cstdint>
#include <string>
#include "kernel/message_bus.hpp"

namespace mycelium::kernel {

struct HealthMonitorConfig {
    int64_t stale_after_ms = 15000;
    int64_t tick_interval_ms = 1000;
};

// Periodic liveness check over the registry. Each stale agent produces one
// "agent-unhealthy" event to its parent per stale episode.
class HealthMonitor {
public:
    static constexpr const char* kSenderId = "health-monitor";
    static constexpr int kEventPriority = 8;

    HealthMonitor(MessageBus& bus, HealthMonitorConfig config = {});

    // Returns the number of unhealthy events emitted
    size_t tick(int64_t now_ms);

    const HealthMonitorConfig& config() const { return config_; }
    uint64_t events_emitted() const { return events_emitted_; }

private:
    MessageBus& bus_;
    HealthMonitorConfig config_;
    uint64_t events_emitted_ = 0;
};

} // namespace mycelium::kernel
