#include "kernel/kernel.hpp"
#include "agents/echo_agent.hpp"
#include "ipc/bridge.hpp"
#include "ipc/socket_server.hpp"
#include "kernel/dead_letter.hpp"
#include "kernel/endpoint.hpp"
#include "kernel/health_monitor.hpp"
#include "kernel/message_bus.hpp"
#include "kernel/payloads.hpp"
#include "kernel/reactor.hpp"
#include "kernel/registry.hpp"
#include "runtime/agent/agent_runtime.hpp"
#include "supervisor/strategic_coordinator.hpp"
#include "supervisor/tactical_supervisor.hpp"
#include "util/clock.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <unistd.h>
#include <csignal>

using json = nlohmann::json;

namespace mycelium::kernel {

// Global kernel pointer for signal handling
static Kernel* g_kernel = nullptr;

static void signal_handler(int signum) {
    spdlog::info("Received signal {}, shutting down...", signum);
    if (g_kernel) {
        g_kernel->shutdown();
    }
}

Kernel::Kernel()
    : Kernel(default_config()) {}

Kernel::Kernel(const Config& config)
    : Kernel(config, agents::default_factories()) {}

Kernel::Kernel(const Config& config, runtime::AgentFactoryRegistry factories)
    : Kernel(config, std::move(factories), Dependencies{}) {}

Kernel::Kernel(const Config& config, runtime::AgentFactoryRegistry factories, Dependencies deps)
    : config_(config)
    , factories_(std::move(factories))
{
    reactor_ = std::move(deps.reactor);
    dead_letters_ = std::move(deps.dead_letters);
    registry_ = std::move(deps.registry);
    bus_ = std::move(deps.bus);

    if (!reactor_) {
        reactor_ = std::make_unique<Reactor>();
    }
    if (!dead_letters_) {
        dead_letters_ = std::make_unique<DeadLetterStore>(config_.bus.dead_letter_max_records);
    }
    if (!registry_) {
        registry_ = std::make_unique<Registry>(*dead_letters_,
            config_.bus.default_mailbox_capacity, config_.bus.failure_window_ms);
    }
    if (!bus_) {
        bus_ = std::make_unique<MessageBus>(*registry_, *dead_letters_);
    }

    health_monitor_ = std::make_unique<HealthMonitor>(*bus_, config_.health);
}

Kernel::~Kernel() {
    teardown();
    if (g_kernel == this) {
        g_kernel = nullptr;
    }
}

bool Kernel::init() {
    spdlog::info("Initializing Mycelium Kernel...");

    // Initialize reactor
    if (!reactor_->init()) {
        spdlog::error("Failed to initialize reactor");
        return false;
    }

    gateway_ = std::make_unique<Endpoint>(*bus_, config_.gateway.id);
    if (!gateway_->ok()) {
        spdlog::error("Failed to register gateway: {}", gateway_->error());
        return false;
    }

    // Strategic tier
    runtime::AgentIdentity coordinator_identity{
        config_.coordinator.id, {"coordination"}, runtime::Tier::STRATEGIC};
    if (!start_agent(std::make_unique<supervisor::StrategicCoordinator>(config_.coordinator),
                     coordinator_identity, "")) {
        return false;
    }

    // Tactical tier, one supervisor per domain
    for (const auto& sup : config_.supervisors) {
        auto factory = factories_.find(sup.capability);
        if (!factory) {
            spdlog::error("No agent factory for capability '{}' (supervisor {})", sup.capability, sup.id);
            return false;
        }

        runtime::AgentIdentity identity{
            sup.id,
            sup.capabilities.empty() ? std::vector<std::string>{sup.capability} : sup.capabilities,
            runtime::Tier::TACTICAL};
        auto agent = std::make_unique<supervisor::TacticalSupervisor>(sup, factory, config_.runtime);
        if (!start_agent(std::move(agent), identity, config_.coordinator.id)) {
            return false;
        }
    }

    // Periodic health pass
    int timer_fd = reactor_->add_timer(static_cast<int>(config_.health.tick_interval_ms),
        [this]() { health_tick(); });
    if (timer_fd < 0) {
        spdlog::error("Failed to arm health timer");
        return false;
    }

    // Remote bridge
    if (config_.bridge.enabled) {
        if (config_.bridge.listen) {
            socket_server_ = std::make_unique<ipc::SocketServer>(config_.bridge.socket_path);
            if (!socket_server_->init()) {
                spdlog::error("Failed to initialize bridge socket");
                return false;
            }
            reactor_->add(socket_server_->get_server_fd(), EPOLLIN, [this](int fd, uint32_t events) {
                on_server_event(fd, events);
            });
        } else {
            int fd = ipc::connect_unix(config_.bridge.socket_path);
            if (fd < 0 || !open_bridge(fd)) {
                spdlog::error("Failed to connect bridge to {}", config_.bridge.socket_path);
                return false;
            }
        }
    }

    // Set up signal handlers
    g_kernel = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    for (const auto& goal : config_.gateway.startup_goals) {
        submit_goal(goal);
    }

    spdlog::info("Kernel initialized successfully");
    spdlog::info("Supervisors: {}", config_.supervisors.size());
    spdlog::info("Bridge: {}", config_.bridge.enabled ? config_.bridge.socket_path : "disabled");
    return true;
}

void Kernel::run() {
    running_ = true;
    spdlog::info("Mycelium Kernel v0.1.0 running");
    spdlog::info("Press Ctrl+C to exit");

    while (running_) {
        int n = reactor_->poll(100);
        if (n < 0) {
            spdlog::error("Reactor error, exiting");
            break;
        }

        drain_gateway();
    }

    spdlog::info("Kernel shutting down...");
    teardown();
    spdlog::info("Kernel stopped");
}

void Kernel::shutdown() {
    running_ = false;
}

void Kernel::teardown() {
    if (torn_down_) {
        return;
    }
    torn_down_ = true;

    close_bridge();
    if (socket_server_) {
        socket_server_->stop();
    }

    // Supervisors first so they retire their children, then the coordinator
    for (auto it = runtimes_.rbegin(); it != runtimes_.rend(); ++it) {
        (*it)->stop();
        registry_->unregister((*it)->id());
    }
    runtimes_.clear();

    gateway_.reset();
}

std::string Kernel::submit_goal(const json& goal) {
    if (!gateway_ || !gateway_->ok()) {
        return "";
    }

    auto directive = make_envelope(MessageKind::DIRECTIVE, gateway_->id(),
        {config_.coordinator.id}, goal, config_.gateway.priority);
    directive.requires_response = true;

    auto result = gateway_->submit(directive);
    if (!result.success()) {
        spdlog::warn("Goal {} not delivered: {}", directive.id,
            error_code_to_string(result.first_error()));
        return "";
    }

    pending_goals_.insert(directive.correlation_key());
    spdlog::info("Submitted goal {}", directive.correlation_key());
    return directive.correlation_key();
}

size_t Kernel::health_tick() {
    return health_monitor_->tick(util::wall_now_ms());
}

runtime::AgentRuntime* Kernel::runtime_for(const std::string& id) {
    for (auto& agent_runtime : runtimes_) {
        if (agent_runtime->id() == id) {
            return agent_runtime.get();
        }
    }
    return nullptr;
}

bool Kernel::start_agent(std::unique_ptr<runtime::Agent> agent,
                         const runtime::AgentIdentity& identity,
                         const std::string& parent_id) {
    auto registration = registry_->register_agent(identity, parent_id);
    if (!registration.success) {
        spdlog::error("Failed to register {}: {}", identity.id, registration.message);
        return false;
    }

    auto agent_runtime = std::make_unique<runtime::AgentRuntime>(std::move(agent), identity, parent_id,
        registration.handle.mailbox, *bus_, config_.runtime);
    if (!agent_runtime->start() || !agent_runtime->wait_ready(config_.runtime.ready_timeout_ms)) {
        spdlog::error("Agent {} failed to start: {}", identity.id, agent_runtime->last_error());
        agent_runtime->stop();
        registry_->unregister(identity.id);
        return false;
    }

    spdlog::info("Started {} agent {}", runtime::tier_to_string(identity.tier), identity.id);
    runtimes_.push_back(std::move(agent_runtime));
    return true;
}

// ============================================================================
// Gateway
// ============================================================================

void Kernel::drain_gateway() {
    while (gateway_ && gateway_->available() > 0) {
        auto envelope = gateway_->next(0);
        if (!envelope) {
            break;
        }

        const std::string& key = envelope->correlation_key();
        if (pending_goals_.erase(key) == 0) {
            spdlog::debug("Gateway ignoring {} envelope {}",
                message_kind_to_string(envelope->kind), envelope->id);
            continue;
        }

        auto report = parse_report(envelope->payload);
        if (!report) {
            spdlog::warn("Goal {} answered with a malformed report", key);
        } else if (report->ok()) {
            spdlog::info("Goal {} completed: {}", key, report->data.dump());
        } else {
            spdlog::warn("Goal {} failed: {} ({})", key, report->error_code, report->message);
        }
    }
}

// ============================================================================
// Bridge
// ============================================================================

bool Kernel::open_bridge(int fd) {
    if (bridge_) {
        spdlog::warn("Bridge already connected, refusing fd {}", fd);
        close(fd);
        return false;
    }

    bridge_ = std::make_unique<ipc::RemoteBridge>(*bus_, fd, config_.runtime);
    for (const auto& remote : config_.bridge.remote_agents) {
        bridge_->expose(remote);
    }

    if (!reactor_->add(fd, EPOLLIN | EPOLLHUP | EPOLLERR, [this](int bfd, uint32_t events) {
            on_bridge_event(bfd, events);
        })) {
        bridge_.reset();
        return false;
    }

    spdlog::info("Bridge connected (fd={}, {} proxies)", fd, bridge_->proxies().size());
    return true;
}

void Kernel::close_bridge() {
    if (!bridge_) {
        return;
    }
    reactor_->remove(bridge_->fd());
    bridge_->close();
    bridge_.reset();
    spdlog::info("Bridge disconnected");
}

void Kernel::on_server_event(int fd, uint32_t events) {
    (void)fd;
    if (events & EPOLLIN) {
        // Accept new connections
        while (true) {
            int client_fd = socket_server_->accept_connection();
            if (client_fd < 0) {
                break;
            }
            open_bridge(client_fd);
        }
    }
}

void Kernel::on_bridge_event(int fd, uint32_t events) {
    (void)fd;
    if (!bridge_) {
        return;
    }

    // Read before acting on a hangup so trailing frames are delivered
    bool alive = true;
    if (events & EPOLLIN) {
        alive = bridge_->on_readable();
    }
    if (!alive || (events & (EPOLLHUP | EPOLLERR))) {
        close_bridge();
    }
}

} // namespace mycelium::kernel
