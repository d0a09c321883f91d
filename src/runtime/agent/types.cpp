#include "runtime/agent/types.hpp"
#include <algorithm>

namespace mycelium::runtime {

const char* tier_to_string(Tier tier) {
    switch (tier) {
        case Tier::EXECUTION: return "execution";
        case Tier::TACTICAL: return "tactical";
        case Tier::STRATEGIC: return "strategic";
    }
    return "unknown";
}

std::optional<Tier> tier_from_string(const std::string& str) {
    if (str == "execution") return Tier::EXECUTION;
    if (str == "tactical") return Tier::TACTICAL;
    if (str == "strategic") return Tier::STRATEGIC;
    return std::nullopt;
}

const char* agent_state_to_string(AgentState state) {
    switch (state) {
        case AgentState::CREATED: return "created";
        case AgentState::INITIALIZING: return "initializing";
        case AgentState::RUNNING: return "running";
        case AgentState::DEGRADED: return "degraded";
        case AgentState::STOPPED: return "stopped";
    }
    return "unknown";
}

std::optional<AgentState> agent_state_from_string(const std::string& str) {
    if (str == "created") return AgentState::CREATED;
    if (str == "initializing") return AgentState::INITIALIZING;
    if (str == "running") return AgentState::RUNNING;
    if (str == "degraded") return AgentState::DEGRADED;
    if (str == "stopped") return AgentState::STOPPED;
    return std::nullopt;
}

bool AgentIdentity::has_capability(const std::string& capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

} // namespace mycelium::runtime
