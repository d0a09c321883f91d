#include "runtime/agent/factory.hpp"
#include <spdlog/spdlog.h>

namespace mycelium::runtime {

bool AgentFactoryRegistry::add(const std::string& capability, AgentFactory factory) {
    if (capability.empty() || !factory) {
        spdlog::error("Agent factory requires a capability and a callable");
        return false;
    }
    if (factories_.count(capability) > 0) {
        spdlog::warn("Agent factory for '{}' already registered", capability);
        return false;
    }
    factories_.emplace(capability, std::move(factory));
    order_.push_back(capability);
    return true;
}

AgentFactory AgentFactoryRegistry::find(const std::string& capability) const {
    auto it = factories_.find(capability);
    if (it == factories_.end()) {
        return {};
    }
    return it->second;
}

bool AgentFactoryRegistry::contains(const std::string& capability) const {
    return factories_.count(capability) > 0;
}

std::vector<std::string> AgentFactoryRegistry::capabilities() const {
    return order_;
}

} // namespace mycelium::runtime
