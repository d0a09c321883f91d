#pragma once
#include "runtime/agent/action_table.hpp"

namespace mycelium::supervisor {

// Directives exchanged between the coordinator and tactical supervisors
enum class ControlAction {
    REDUCE_CONCURRENCY,
    RESTORE_CONCURRENCY,
    PREFER_ALTERNATE,
    ABANDON,
    SYSTEM_ALERT,
    CAPACITY_REDUCED
};

inline const runtime::ActionTable<ControlAction>& control_actions() {
    static const runtime::ActionTable<ControlAction> table{
        {ControlAction::REDUCE_CONCURRENCY, "reduce_concurrency"},
        {ControlAction::RESTORE_CONCURRENCY, "restore_concurrency"},
        {ControlAction::PREFER_ALTERNATE, "prefer_alternate"},
        {ControlAction::ABANDON, "abandon"},
        {ControlAction::SYSTEM_ALERT, "system_alert"},
        {ControlAction::CAPACITY_REDUCED, "capacity_reduced"},
    };
    return table;
}

// Query action answered by supervisors and the coordinator
constexpr const char* kQueryStatus = "status";

} // namespace mycelium::supervisor
