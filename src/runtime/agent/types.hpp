#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mycelium::runtime {

// Position of an agent in the supervision hierarchy
enum class Tier {
    EXECUTION,   // leaf worker
    TACTICAL,    // owns a pool of execution agents
    STRATEGIC    // root coordinator
};

const char* tier_to_string(Tier tier);
std::optional<Tier> tier_from_string(const std::string& str);

// Lifecycle: CREATED -> INITIALIZING -> RUNNING <-> DEGRADED -> STOPPED (terminal)
enum class AgentState {
    CREATED,
    INITIALIZING,
    RUNNING,
    DEGRADED,
    STOPPED
};

const char* agent_state_to_string(AgentState state);
std::optional<AgentState> agent_state_from_string(const std::string& str);

// States in which an agent is expected to heartbeat
inline bool is_live_state(AgentState state) {
    return state == AgentState::INITIALIZING ||
           state == AgentState::RUNNING ||
           state == AgentState::DEGRADED;
}

// Immutable after registration
struct AgentIdentity {
    std::string id;
    std::vector<std::string> capabilities;
    Tier tier = Tier::EXECUTION;

    bool has_capability(const std::string& capability) const;
};

// What a supervisor hands to a factory when spawning a child
struct AgentSpec {
    std::string id;
    std::vector<std::string> capabilities;
    nlohmann::json config = nlohmann::json::object();
};

} // namespace mycelium::runtime
