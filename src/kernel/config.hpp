#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/envelope.hpp"
#include "kernel/health_monitor.hpp"
#include "runtime/agent/agent_runtime.hpp"
#include "runtime/agent/types.hpp"
#include "supervisor/strategic_coordinator.hpp"
#include "supervisor/tactical_supervisor.hpp"

namespace mycelium::kernel {

struct BusConfig {
    size_t default_mailbox_capacity = 1024;
    int64_t failure_window_ms = 60000;
    size_t dead_letter_max_records = 10000;
};

// Goals submitted through the kernel's gateway endpoint
struct GatewayConfig {
    std::string id = "gateway";
    int priority = kDefaultPriority;
    std::vector<nlohmann::json> startup_goals;
};

struct BridgeConfig {
    bool enabled = false;
    std::string socket_path = "/tmp/mycelium.sock";
    bool listen = true;                                 // false: connect to a listening peer
    std::vector<runtime::AgentIdentity> remote_agents;  // mirrored as local proxies
};

// Kernel configuration
struct KernelConfig {
    std::string log_level = "info";
    BusConfig bus;
    runtime::RuntimeConfig runtime;
    HealthMonitorConfig health;
    supervisor::CoordinatorConfig coordinator;
    std::vector<supervisor::SupervisorConfig> supervisors;
    GatewayConfig gateway;
    BridgeConfig bridge;
};

// Defaults plus one "echo" supervisor
KernelConfig default_config();

struct ConfigResult {
    bool success = false;
    KernelConfig config;
    std::string error;
};

// Every key is optional. A missing "supervisors" key keeps the default echo domain.
ConfigResult config_from_json(const nlohmann::json& j);
ConfigResult load_config(const std::string& path);

// Empty string when valid
std::string validate_config(const KernelConfig& config);

} // namespace mycelium::kernel
