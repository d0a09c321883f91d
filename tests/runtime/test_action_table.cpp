#include "runtime/agent/action_table.hpp"
#include "supervisor/control.hpp"
#include "agents/echo_agent.hpp"

#include <catch2/catch.hpp>

using mycelium::runtime::ActionTable;

namespace {

enum class Op { READ, WRITE, DELETE };

} // namespace

TEST_CASE("Action tables parse known names only", "[runtime][actions]") {
    ActionTable<Op> table{{Op::READ, "read"}, {Op::WRITE, "write"}};

    REQUIRE(table.parse("read") == std::optional<Op>(Op::READ));
    REQUIRE(table.parse("write") == std::optional<Op>(Op::WRITE));
    REQUIRE_FALSE(table.parse("delete").has_value());
    REQUIRE_FALSE(table.parse("READ").has_value());
    REQUIRE(table.name(Op::WRITE) == "write");
    REQUIRE(table.names() == std::vector<std::string>{"read", "write"});
    REQUIRE_THROWS_AS(table.name(Op::DELETE), std::out_of_range);
}

TEST_CASE("Malformed action tables are rejected at construction", "[runtime][actions]") {
    REQUIRE_THROWS_AS((ActionTable<Op>{{Op::READ, "read"}, {Op::WRITE, "read"}}), std::invalid_argument);
    REQUIRE_THROWS_AS((ActionTable<Op>{{Op::READ, "read"}, {Op::READ, "fetch"}}), std::invalid_argument);
    REQUIRE_THROWS_AS((ActionTable<Op>{{Op::READ, ""}}), std::invalid_argument);
    REQUIRE_THROWS_AS((ActionTable<Op>{}), std::invalid_argument);
}

TEST_CASE("Built-in tables name their actions", "[runtime][actions]") {
    using mycelium::supervisor::ControlAction;
    const auto& control = mycelium::supervisor::control_actions();
    REQUIRE(control.size() == 6);
    REQUIRE(control.parse("reduce_concurrency") == std::optional<ControlAction>(ControlAction::REDUCE_CONCURRENCY));
    REQUIRE(control.name(ControlAction::PREFER_ALTERNATE) == "prefer_alternate");

    const auto& echo = mycelium::agents::echo_actions();
    REQUIRE(echo.names() == std::vector<std::string>{"echo", "reverse"});
}
