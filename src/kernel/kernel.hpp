/**
 * Mycelium Kernel
 *
 * Owns and wires every subsystem:
 * - Reactor (epoll loop for the health timer and the bridge socket)
 * - Registry, DeadLetterStore and MessageBus
 * - HealthMonitor
 * - Strategic coordinator and one tactical supervisor per domain
 * - Gateway endpoint and the optional remote bridge
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/config.hpp"
#include "runtime/agent/factory.hpp"

namespace mycelium::ipc {
class RemoteBridge;
class SocketServer;
} // namespace mycelium::ipc

namespace mycelium::runtime {
class AgentRuntime;
} // namespace mycelium::runtime

namespace mycelium::kernel {

class DeadLetterStore;
class Endpoint;
class HealthMonitor;
class MessageBus;
class Reactor;
class Registry;

class Kernel {
public:
    using Config = KernelConfig;

    // Injected parts; a registry or bus must be built on the injected
    // dead-letter store / registry
    struct Dependencies {
        std::unique_ptr<Reactor> reactor;
        std::unique_ptr<DeadLetterStore> dead_letters;
        std::unique_ptr<Registry> registry;
        std::unique_ptr<MessageBus> bus;
    };

    Kernel();
    explicit Kernel(const Config& config);
    Kernel(const Config& config, runtime::AgentFactoryRegistry factories);
    Kernel(const Config& config, runtime::AgentFactoryRegistry factories, Dependencies deps);
    ~Kernel();

    // Non-copyable
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Build the hierarchy and open the bridge
    bool init();

    // Run the kernel (blocks until shutdown)
    void run();

    // Request shutdown
    void shutdown();

    // Stop every agent and close the bridge; idempotent
    void teardown();

    // Check if running
    bool is_running() const { return running_; }

    // Submit a goal to the coordinator through the gateway. Returns the
    // correlation key, empty if it could not be delivered.
    std::string submit_goal(const nlohmann::json& goal);

    // Run one health-monitor pass
    size_t health_tick();

    MessageBus& bus() { return *bus_; }
    Registry& registry() { return *registry_; }
    DeadLetterStore& dead_letters() { return *dead_letters_; }
    Endpoint& gateway() { return *gateway_; }
    runtime::AgentRuntime* runtime_for(const std::string& id);
    ipc::RemoteBridge* bridge() { return bridge_.get(); }

    // Get config
    const Config& get_config() const { return config_; }

private:
    bool start_agent(std::unique_ptr<runtime::Agent> agent,
                     const runtime::AgentIdentity& identity,
                     const std::string& parent_id);
    bool open_bridge(int fd);
    void close_bridge();
    void drain_gateway();

    // Event handlers
    void on_server_event(int fd, uint32_t events);
    void on_bridge_event(int fd, uint32_t events);

    Config config_;
    runtime::AgentFactoryRegistry factories_;
    std::atomic<bool> running_{false};
    bool torn_down_ = false;

    std::unique_ptr<Reactor> reactor_;
    std::unique_ptr<DeadLetterStore> dead_letters_;
    std::unique_ptr<Registry> registry_;
    std::unique_ptr<MessageBus> bus_;
    std::unique_ptr<HealthMonitor> health_monitor_;
    std::unique_ptr<Endpoint> gateway_;
    std::unique_ptr<ipc::SocketServer> socket_server_;
    std::unique_ptr<ipc::RemoteBridge> bridge_;

    // Coordinator first, then supervisors in configuration order
    std::vector<std::unique_ptr<runtime::AgentRuntime>> runtimes_;
    std::unordered_set<std::string> pending_goals_;
};

} // namespace mycelium::kernel
