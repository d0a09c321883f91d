#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "runtime/agent/agent.hpp"

namespace mycelium::runtime {

using AgentFactory = std::function<std::unique_ptr<Agent>(const AgentSpec&)>;

// Capability -> factory for the agents a supervisor spawns.
// Filled at startup, read-only afterwards.
class AgentFactoryRegistry {
public:
    // Returns false if the capability already has a factory
    bool add(const std::string& capability, AgentFactory factory);

    // Empty function when no factory is registered
    AgentFactory find(const std::string& capability) const;
    bool contains(const std::string& capability) const;
    std::vector<std::string> capabilities() const;

private:
    std::unordered_map<std::string, AgentFactory> factories_;
    std::vector<std::string> order_;
};

} // namespace mycelium::runtime
