#pragma once
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mycelium::runtime {

// Closed set of action names for one capability, validated at construction.
// Agents parse directive actions through it instead of comparing strings.
template <typename E>
class ActionTable {
public:
    ActionTable(std::initializer_list<std::pair<E, const char*>> entries) {
        for (const auto& [action, name] : entries) {
            if (name == nullptr || *name == '\0') {
                throw std::invalid_argument("action name must not be empty");
            }
            for (const auto& [existing_action, existing_name] : entries_) {
                if (existing_name == name) {
                    throw std::invalid_argument("duplicate action name: " + existing_name);
                }
                if (existing_action == action) {
                    throw std::invalid_argument("action registered twice: " + existing_name);
                }
            }
            entries_.emplace_back(action, name);
        }
        if (entries_.empty()) {
            throw std::invalid_argument("action table must not be empty");
        }
    }

    std::optional<E> parse(const std::string& name) const {
        for (const auto& [action, action_name] : entries_) {
            if (action_name == name) {
                return action;
            }
        }
        return std::nullopt;
    }

    const std::string& name(E action) const {
        for (const auto& [entry_action, action_name] : entries_) {
            if (entry_action == action) {
                return action_name;
            }
        }
        throw std::out_of_range("action not in table");
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.push_back(entry.second);
        }
        return result;
    }

    size_t size() const { return entries_.size(); }

private:
    std::vector<std::pair<E, std::string>> entries_;
};

} // namespace mycelium::runtime
