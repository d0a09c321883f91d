#include "kernel/config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <unordered_set>

using json = nlohmann::json;

namespace mycelium::kernel {

namespace {

supervisor::SupervisorConfig echo_supervisor() {
    supervisor::SupervisorConfig config;
    config.id = "echo-supervisor";
    config.capability = "echo";
    return config;
}

template <typename T>
T read_or(const json& j, const char* key, T fallback) {
    if (!j.is_object() || !j.contains(key)) {
        return fallback;
    }
    return j.at(key).get<T>();
}

std::vector<std::string> read_strings(const json& j, const char* key) {
    std::vector<std::string> values;
    if (j.contains(key)) {
        for (const auto& value : j.at(key)) {
            values.push_back(value.get<std::string>());
        }
    }
    return values;
}

supervisor::SupervisorConfig parse_supervisor(const json& j) {
    supervisor::SupervisorConfig config;
    config.id = read_or<std::string>(j, "id", "");
    config.capability = read_or<std::string>(j, "capability", "");
    config.capabilities = read_strings(j, "capabilities");
    config.initial_pool_size = read_or(j, "initial_pool_size", config.initial_pool_size);
    config.max_pool_size = read_or(j, "max_pool_size", config.max_pool_size);
    config.max_queue_depth = read_or(j, "max_queue_depth", config.max_queue_depth);
    config.max_concurrency = read_or(j, "max_concurrency", config.max_concurrency);
    config.max_restarts = read_or(j, "max_restarts", config.max_restarts);
    config.restart_window_ms = read_or(j, "restart_window_ms", config.restart_window_ms);
    config.child_mailbox_capacity = read_or(j, "child_mailbox_capacity", config.child_mailbox_capacity);
    config.child_config = read_or(j, "child_config", config.child_config);

    if (j.contains("breaker")) {
        const auto& b = j["breaker"];
        config.breaker.failure_threshold = read_or(b, "failure_threshold", config.breaker.failure_threshold);
        config.breaker.open_timeout_ms = read_or(b, "open_timeout_ms", config.breaker.open_timeout_ms);
    }

    if (j.contains("retry")) {
        const auto& r = j["retry"];
        config.retry.max_retries = read_or(r, "max_retries", config.retry.max_retries);
        config.retry.base_delay_ms = read_or(r, "base_delay_ms", config.retry.base_delay_ms);
        config.retry.max_delay_ms = read_or(r, "max_delay_ms", config.retry.max_delay_ms);
        if (r.contains("owner")) {
            auto name = r["owner"].get<std::string>();
            auto owner = supervisor::retry_owner_from_string(name);
            if (!owner) {
                throw std::invalid_argument("unknown retry owner '" + name + "'");
            }
            config.retry.owner = *owner;
        }
    }

    if (j.contains("aggregation")) {
        const auto& a = j["aggregation"];
        config.aggregation.every_n_reports = read_or(a, "every_n_reports", config.aggregation.every_n_reports);
        config.aggregation.window_ms = read_or(a, "window_ms", config.aggregation.window_ms);
        config.aggregation.keepalive = read_or(a, "keepalive", config.aggregation.keepalive);
    }

    return config;
}

runtime::AgentIdentity parse_identity(const json& j) {
    runtime::AgentIdentity identity;
    identity.id = read_or<std::string>(j, "id", "");
    identity.capabilities = read_strings(j, "capabilities");
    auto tier_name = read_or<std::string>(j, "tier", "execution");
    auto tier = runtime::tier_from_string(tier_name);
    if (!tier) {
        throw std::invalid_argument("unknown tier '" + tier_name + "'");
    }
    identity.tier = *tier;
    return identity;
}

} // anonymous namespace

KernelConfig default_config() {
    KernelConfig config;
    config.supervisors.push_back(echo_supervisor());
    return config;
}

ConfigResult config_from_json(const json& j) {
    ConfigResult result;
    result.config = default_config();
    auto& config = result.config;

    if (!j.is_object()) {
        result.error = "configuration must be a JSON object";
        return result;
    }

    try {
        config.log_level = read_or(j, "log_level", config.log_level);

        if (j.contains("bus")) {
            const auto& b = j["bus"];
            config.bus.default_mailbox_capacity = read_or(b, "default_mailbox_capacity", config.bus.default_mailbox_capacity);
            config.bus.failure_window_ms = read_or(b, "failure_window_ms", config.bus.failure_window_ms);
            config.bus.dead_letter_max_records = read_or(b, "dead_letter_max_records", config.bus.dead_letter_max_records);
        }

        if (j.contains("runtime")) {
            const auto& r = j["runtime"];
            config.runtime.poll_interval_ms = read_or(r, "poll_interval_ms", config.runtime.poll_interval_ms);
            config.runtime.heartbeat_interval_ms = read_or(r, "heartbeat_interval_ms", config.runtime.heartbeat_interval_ms);
            config.runtime.ready_timeout_ms = read_or(r, "ready_timeout_ms", config.runtime.ready_timeout_ms);
            config.runtime.stop_timeout_ms = read_or(r, "stop_timeout_ms", config.runtime.stop_timeout_ms);
        }

        if (j.contains("health")) {
            const auto& h = j["health"];
            config.health.stale_after_ms = read_or(h, "stale_after_ms", config.health.stale_after_ms);
            config.health.tick_interval_ms = read_or(h, "tick_interval_ms", config.health.tick_interval_ms);
        }

        if (j.contains("coordinator")) {
            const auto& c = j["coordinator"];
            auto& coordinator = config.coordinator;
            coordinator.id = read_or(c, "id", coordinator.id);
            coordinator.silence_threshold_ms = read_or(c, "silence_threshold_ms", coordinator.silence_threshold_ms);
            coordinator.sweep_interval_ms = read_or(c, "sweep_interval_ms", coordinator.sweep_interval_ms);
            coordinator.reallocation_cooldown_ms = read_or(c, "reallocation_cooldown_ms", coordinator.reallocation_cooldown_ms);
            if (c.contains("thresholds")) {
                const auto& t = c["thresholds"];
                coordinator.thresholds.min_success_rate = read_or(t, "min_success_rate", coordinator.thresholds.min_success_rate);
                coordinator.thresholds.max_avg_latency_ms = read_or(t, "max_avg_latency_ms", coordinator.thresholds.max_avg_latency_ms);
                coordinator.thresholds.max_queue_depth = read_or(t, "max_queue_depth", coordinator.thresholds.max_queue_depth);
            }
            if (c.contains("alternates")) {
                for (const auto& [capability, alternate] : c["alternates"].items()) {
                    coordinator.alternates[capability] = alternate.get<std::string>();
                }
            }
        }

        if (j.contains("supervisors")) {
            config.supervisors.clear();
            for (const auto& s : j["supervisors"]) {
                config.supervisors.push_back(parse_supervisor(s));
            }
        }

        if (j.contains("gateway")) {
            const auto& g = j["gateway"];
            config.gateway.id = read_or(g, "id", config.gateway.id);
            config.gateway.priority = read_or(g, "priority", config.gateway.priority);
            if (g.contains("startup_goals")) {
                for (const auto& goal : g["startup_goals"]) {
                    config.gateway.startup_goals.push_back(goal);
                }
            }
        }

        if (j.contains("bridge")) {
            const auto& b = j["bridge"];
            config.bridge.enabled = read_or(b, "enabled", config.bridge.enabled);
            config.bridge.socket_path = read_or(b, "socket_path", config.bridge.socket_path);
            config.bridge.listen = read_or<std::string>(b, "mode", "listen") != "connect";
            if (b.contains("remote_agents")) {
                for (const auto& remote : b["remote_agents"]) {
                    config.bridge.remote_agents.push_back(parse_identity(remote));
                }
            }
        }
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }

    result.error = validate_config(config);
    result.success = result.error.empty();
    return result;
}

ConfigResult load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigResult result;
        result.error = "cannot open config file: " + path;
        return result;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        ConfigResult result;
        result.error = "invalid JSON in " + path + ": " + e.what();
        return result;
    }

    auto result = config_from_json(j);
    if (result.success) {
        spdlog::debug("Loaded configuration from {}", path);
    }
    return result;
}

std::string validate_config(const KernelConfig& config) {
    if (config.bus.default_mailbox_capacity == 0) {
        return "bus.default_mailbox_capacity must be positive";
    }
    if (config.bus.dead_letter_max_records == 0) {
        return "bus.dead_letter_max_records must be positive";
    }
    if (config.bus.failure_window_ms <= 0) {
        return "bus.failure_window_ms must be positive";
    }
    if (config.runtime.poll_interval_ms <= 0 || config.runtime.heartbeat_interval_ms <= 0) {
        return "runtime intervals must be positive";
    }
    if (config.health.stale_after_ms <= 0 || config.health.tick_interval_ms <= 0) {
        return "health intervals must be positive";
    }
    if (config.health.stale_after_ms <= config.runtime.heartbeat_interval_ms) {
        return "health.stale_after_ms must exceed runtime.heartbeat_interval_ms";
    }

    const auto& thresholds = config.coordinator.thresholds;
    if (thresholds.min_success_rate < 0.0 || thresholds.min_success_rate > 1.0) {
        return "coordinator.thresholds.min_success_rate must be within [0, 1]";
    }
    if (config.coordinator.id.empty()) {
        return "coordinator.id must not be empty";
    }

    if (config.gateway.priority < kMinPriority || config.gateway.priority > kMaxPriority) {
        return "gateway.priority must be within [" + std::to_string(kMinPriority) + ", " +
            std::to_string(kMaxPriority) + "]";
    }
    if (config.gateway.id.empty()) {
        return "gateway.id must not be empty";
    }

    std::unordered_set<std::string> ids{config.coordinator.id, config.gateway.id};
    if (ids.size() != 2) {
        return "gateway.id and coordinator.id must differ";
    }

    for (const auto& sup : config.supervisors) {
        if (sup.id.empty() || sup.capability.empty()) {
            return "every supervisor needs an id and a capability";
        }
        if (!ids.insert(sup.id).second) {
            return "duplicate agent id '" + sup.id + "'";
        }
        if (sup.max_pool_size == 0) {
            return "supervisor '" + sup.id + "': max_pool_size must be positive";
        }
        if (sup.initial_pool_size > sup.max_pool_size) {
            return "supervisor '" + sup.id + "': initial_pool_size exceeds max_pool_size";
        }
        if (sup.child_mailbox_capacity == 0) {
            return "supervisor '" + sup.id + "': child_mailbox_capacity must be positive";
        }
        if (sup.breaker.failure_threshold == 0) {
            return "supervisor '" + sup.id + "': breaker.failure_threshold must be positive";
        }
        if (sup.retry.base_delay_ms < 0 || sup.retry.max_delay_ms < sup.retry.base_delay_ms) {
            return "supervisor '" + sup.id + "': retry delays are inconsistent";
        }
    }

    if (config.bridge.enabled) {
        if (config.bridge.socket_path.empty()) {
            return "bridge.socket_path must not be empty";
        }
        for (const auto& remote : config.bridge.remote_agents) {
            if (remote.id.empty()) {
                return "bridge.remote_agents entries need an id";
            }
            if (!ids.insert(remote.id).second) {
                return "duplicate agent id '" + remote.id + "'";
            }
        }
    }

    return "";
}

} // namespace mycelium::kernel
