#include "sqlite_fixture.hpp"

#include "sextant/navigation/navigation_state_machine.hpp"
#include "sextant/value/value_format.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using sextant::backend::QueryErrc;
using sextant::navigation::Intent;
using sextant::navigation::NavigationEvent;
using sextant::navigation::NavigationStateMachine;
using sextant::navigation::ViewState;
using sextant::testing::SqliteFixture;

namespace {

constexpr std::chrono::seconds kIdleTimeout{10};

std::vector<std::string> first_column(const NavigationStateMachine& machine)
{
    std::vector<std::string> names;
    const auto snapshot = machine.snapshot();
    if (!snapshot.contents) {
        return names;
    }
    for (const auto row : snapshot.visible_rows) {
        names.push_back(sextant::value::format_value(snapshot.contents->rows()[row].front()));
    }
    return names;
}

void step(NavigationStateMachine& machine, const Intent& intent)
{
    machine.dispatch(intent);
    REQUIRE(machine.wait_until_idle(kIdleTimeout));
}

}  // namespace

TEST_CASE("SQLite profile can be browsed from connection to rows", "[scenario][sqlite]")
{
    SqliteFixture fixture{};
    std::vector<NavigationEvent> events;

    NavigationStateMachine::Config config{};
    config.task_runner_config.worker_threads = 2U;
    config.event_logger = [&events](const NavigationEvent& event) { events.push_back(event); };
    NavigationStateMachine machine{{fixture.profile()}, nullptr, config};

    step(machine, Intent::enter(0U));
    REQUIRE(machine.state() == ViewState::DatabaseList);
    CHECK(first_column(machine) == std::vector<std::string>{"shop.db"});

    step(machine, Intent::enter());
    REQUIRE(machine.state() == ViewState::SchemaList);
    CHECK(first_column(machine) == std::vector<std::string>{"main", "test_schema", "edge_cases"});

    step(machine, Intent::enter_named("test_schema"));
    REQUIRE(machine.state() == ViewState::TableList);
    CHECK(first_column(machine) == std::vector<std::string>{"orders"});

    step(machine, Intent::enter_named("orders"));
    REQUIRE(machine.state() == ViewState::ColumnList);
    CHECK(first_column(machine)
          == std::vector<std::string>{"id", "order_date", "customer_id", "total_amount", "status", "notes"});

    step(machine, Intent::enter());
    auto snapshot = machine.snapshot();
    REQUIRE(snapshot.state == ViewState::RowBrowser);
    REQUIRE(snapshot.contents);
    CHECK(snapshot.contents->row_count() == 7U);
    CHECK(snapshot.breadcrumb == std::vector<std::string>{"shop", "shop.db", "test_schema", "orders", "rows"});

    const auto& rows = snapshot.contents->rows();
    const auto order_six = std::find_if(rows.begin(), rows.end(), [](const sextant::value::Row& row) {
        return row.front() == sextant::value::Value::int64(6);
    });
    REQUIRE(order_six != rows.end());
    CHECK((*order_six)[1] == sextant::value::Value::null());

    machine.dispatch(Intent::back());
    machine.dispatch(Intent::back());
    CHECK(machine.state() == ViewState::TableList);

    machine.dispatch(Intent::disconnect());
    REQUIRE(machine.wait_until_idle(kIdleTimeout));
    CHECK(machine.state() == ViewState::ConnectionList);
    CHECK_FALSE(machine.connected());
    CHECK_FALSE(events.empty());
}

TEST_CASE("SQLite profile runs queries from the editor", "[scenario][sqlite]")
{
    SqliteFixture fixture{};
    NavigationStateMachine machine{{fixture.profile()}, nullptr, NavigationStateMachine::Config{}};

    step(machine, Intent::enter(0U));
    REQUIRE(machine.connected());

    step(machine, Intent::run_query("SELECT status, count(*) AS n FROM test_schema.orders GROUP BY status ORDER BY status"));
    auto snapshot = machine.snapshot();
    REQUIRE(snapshot.state == ViewState::ResultView);
    REQUIRE(snapshot.contents);
    CHECK(first_column(machine) == std::vector<std::string>{"cancelled", "delivered", "pending", "shipped"});

    step(machine, Intent::open_query_editor());
    CHECK(machine.state() == ViewState::QueryEditor);

    step(machine, Intent::run_query("SELEC status FROM test_schema.orders"));
    snapshot = machine.snapshot();
    CHECK(snapshot.state == ViewState::QueryEditor);
    REQUIRE(snapshot.error);
    CHECK(snapshot.error->code == QueryErrc::SyntaxError);
    CHECK_FALSE(snapshot.contents);
}
