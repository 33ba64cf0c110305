#include "fake_backend.hpp"

#include "sextant/credential/credential_resolver.hpp"
#include "sextant/navigation/navigation_state_machine.hpp"
#include "sextant/value/value_format.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using sextant::backend::BackendKind;
using sextant::backend::CatalogErrc;
using sextant::backend::ConnectionErrc;
using sextant::backend::ConnectionProfile;
using sextant::backend::CredentialPolicy;
using sextant::backend::QueryErrc;
using sextant::backend::SchemaRef;
using sextant::credential::CredentialResolver;
using sextant::credential::InMemoryCredentialStore;
using sextant::navigation::EventOutcome;
using sextant::navigation::Intent;
using sextant::navigation::IntentKind;
using sextant::navigation::NavigationEvent;
using sextant::navigation::NavigationSnapshot;
using sextant::navigation::NavigationStateMachine;
using sextant::navigation::RequestSlot;
using sextant::navigation::ViewState;
using sextant::testing::FakeBackend;
using sextant::testing::FakeCatalog;
using sextant::testing::ManualTaskRunner;
using sextant::testing::make_column;
using sextant::value::Row;
using sextant::value::Value;

namespace {

constexpr const char* kNumbersQuery = "SELECT n FROM numbers;";

ConnectionProfile shop_profile()
{
    ConnectionProfile profile{};
    profile.id = "pg-shop";
    profile.name = "shop-db";
    profile.backend_kind = BackendKind::Postgres;
    profile.host = "localhost";
    profile.username = "app";
    profile.database = "shop";
    profile.default_schema = "sales";
    return profile;
}

std::shared_ptr<FakeCatalog> shop_catalog()
{
    auto catalog = std::make_shared<FakeCatalog>();
    catalog->databases = {"shop", "analytics"};
    catalog->schemas["shop"] = {SchemaRef{"shop", "public", "postgres"}, SchemaRef{"shop", "sales", "app"}};
    catalog->schemas["analytics"] = {SchemaRef{"analytics", "public", "postgres"}};

    FakeCatalog::Table customers{};
    customers.ref.name = "customers";
    customers.columns = {make_column("id", "int4", true), make_column("name", "text")};
    catalog->add_table("shop", "public", customers);

    FakeCatalog::Table orders{};
    orders.ref.name = "orders";
    orders.columns = {make_column("id", "int4", true), make_column("status", "text"), make_column("total", "numeric")};
    for (std::int64_t id = 1; id <= 4; ++id) {
        orders.rows.push_back(Row{Value::int64(id), Value::text(id % 2 == 0 ? "shipped" : "pending"), Value::decimal("10.50")});
    }
    catalog->add_table("shop", "public", orders);

    FakeCatalog::Table summary{};
    summary.ref.name = "order_summary";
    summary.ref.kind = sextant::backend::TableKind::View;
    summary.columns = {make_column("status", "text"), make_column("count", "int8")};
    catalog->add_table("shop", "public", summary);

    FakeCatalog::ScriptedQuery numbers{};
    numbers.columns = {make_column("n", "int4")};
    numbers.rows = {Row{Value::int64(1)}, Row{Value::int64(2)}, Row{Value::int64(3)}};
    catalog->queries[kNumbersQuery] = numbers;

    FakeCatalog::ScriptedQuery failing{};
    failing.error = sextant::backend::make_backend_error(QueryErrc::RuntimeError, "division by zero", "22012");
    catalog->queries["SELECT 1/0;"] = failing;
    return catalog;
}

// Owns everything the state machine borrows. Queued work is run before the
// machine is torn down so its destructor never waits on a task nobody runs.
struct Harness final {
    explicit Harness(std::vector<ConnectionProfile> profiles = {shop_profile()},
                     NavigationStateMachine::Config config = {})
        : machine{std::move(profiles), &resolver, configure(std::move(config))}
    {
    }

    ~Harness()
    {
        runner.run_all();
    }

    Harness(const Harness&) = delete;
    Harness& operator=(const Harness&) = delete;

    NavigationStateMachine::Config configure(NavigationStateMachine::Config config)
    {
        config.task_runner = &runner;
        config.backend_factory = sextant::testing::fake_factory(catalog, control);
        config.event_logger = [this](const NavigationEvent& event) { events.push_back(event); };
        return config;
    }

    void dispatch(const Intent& intent)
    {
        machine.dispatch(intent);
    }

    void settle()
    {
        runner.run_all();
        machine.pump();
    }

    void step(const Intent& intent)
    {
        dispatch(intent);
        settle();
    }

    void connect()
    {
        step(Intent::enter(0U));
        REQUIRE(machine.state() == ViewState::DatabaseList);
    }

    [[nodiscard]] std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        const auto snapshot = machine.snapshot();
        if (!snapshot.contents) {
            return out;
        }
        for (const auto row : snapshot.visible_rows) {
            out.push_back(sextant::value::format_value(snapshot.contents->rows()[row].front()));
        }
        return out;
    }

    [[nodiscard]] std::string selected_name() const
    {
        const auto snapshot = machine.snapshot();
        if (!snapshot.contents || !snapshot.selection) {
            return {};
        }
        const auto row = snapshot.visible_rows[*snapshot.selection];
        return sextant::value::format_value(snapshot.contents->rows()[row].front());
    }

    [[nodiscard]] std::size_t count(EventOutcome outcome) const
    {
        return static_cast<std::size_t>(std::count_if(events.begin(), events.end(), [outcome](const NavigationEvent& event) {
            return event.outcome == outcome;
        }));
    }

    ManualTaskRunner runner{};
    std::shared_ptr<FakeCatalog> catalog = shop_catalog();
    std::shared_ptr<FakeBackend::Control> control = std::make_shared<FakeBackend::Control>();
    InMemoryCredentialStore store{};
    CredentialResolver resolver{&store, [](const ConnectionProfile&, sextant::credential::PromptReason) {
                                    return std::optional<std::string>{"typed-secret"};
                                }};
    std::vector<NavigationEvent> events{};
    NavigationStateMachine machine;
};

}  // namespace

TEST_CASE("State machine starts at the connection list", "[navigation][state_machine]")
{
    Harness harness{};
    const auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::ConnectionList);
    CHECK_FALSE(snapshot.loading);
    CHECK_FALSE(snapshot.error);
    CHECK(snapshot.breadcrumb.empty());
    CHECK(harness.names() == std::vector<std::string>{"shop-db"});
    CHECK_FALSE(harness.machine.connected());
}

TEST_CASE("Connecting opens the database list", "[navigation][state_machine]")
{
    Harness harness{};
    harness.dispatch(Intent::enter(0U));

    CHECK(harness.machine.loading());
    CHECK(harness.machine.snapshot().loading_slot == RequestSlot::Navigation);
    CHECK(harness.machine.state() == ViewState::ConnectionList);
    CHECK(harness.runner.pending() == 1U);

    harness.settle();
    const auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::DatabaseList);
    CHECK_FALSE(snapshot.loading);
    CHECK(snapshot.breadcrumb == std::vector<std::string>{"shop-db"});
    CHECK(snapshot.environment_label == "dev");
    CHECK(harness.names() == std::vector<std::string>{"shop", "analytics"});
    CHECK(harness.machine.connected());
    REQUIRE(harness.machine.active_profile() != nullptr);
    CHECK(harness.machine.active_profile()->id == "pg-shop");

    REQUIRE_FALSE(harness.events.empty());
    const auto& applied = harness.events.back();
    CHECK(applied.outcome == EventOutcome::Applied);
    CHECK(applied.correlation_id == "nav-1");
    CHECK(applied.from_state == ViewState::ConnectionList);
    CHECK(applied.to_state == ViewState::DatabaseList);
}

TEST_CASE("Entering walks from databases down to rows", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();

    harness.step(Intent::enter_named("shop"));
    CHECK(harness.machine.state() == ViewState::SchemaList);
    CHECK(harness.names() == std::vector<std::string>{"public", "sales"});
    CHECK(harness.selected_name() == "sales");

    harness.step(Intent::enter_named("public"));
    CHECK(harness.machine.state() == ViewState::TableList);
    CHECK(harness.names() == std::vector<std::string>{"customers", "orders", "order_summary"});

    harness.step(Intent::enter_named("orders"));
    CHECK(harness.machine.state() == ViewState::ColumnList);
    CHECK(harness.names() == std::vector<std::string>{"id", "status", "total"});

    harness.step(Intent::enter());
    const auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::RowBrowser);
    REQUIRE(snapshot.contents);
    CHECK(snapshot.contents->row_count() == 4U);
    CHECK(snapshot.breadcrumb == std::vector<std::string>{"shop-db", "shop", "public", "orders", "rows"});
    CHECK(harness.catalog->browse_calls.load() == 1);
}

TEST_CASE("Back returns to the parent level", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();
    harness.step(Intent::enter_named("shop"));
    harness.step(Intent::enter_named("public"));

    harness.dispatch(Intent::back());
    CHECK(harness.machine.state() == ViewState::SchemaList);
    harness.dispatch(Intent::back());
    CHECK(harness.machine.state() == ViewState::DatabaseList);
    CHECK(harness.machine.connected());
}

TEST_CASE("Back from the database list disconnects", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();

    harness.dispatch(Intent::back());
    CHECK(harness.machine.state() == ViewState::ConnectionList);
    CHECK_FALSE(harness.machine.connected());
    CHECK(harness.machine.active_profile() == nullptr);
    CHECK(harness.machine.snapshot().environment_label.empty());

    harness.settle();
    CHECK(harness.catalog->close_calls.load() == 1);
    CHECK(harness.machine.in_flight() == 0U);
}

TEST_CASE("A superseded response never reaches the view", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();

    harness.dispatch(Intent::enter_named("shop"));
    harness.dispatch(Intent::enter_named("analytics"));
    CHECK(harness.runner.pending() == 2U);

    SECTION("older response arrives first")
    {
        REQUIRE(harness.runner.run_next());
        harness.machine.pump();
        CHECK(harness.machine.state() == ViewState::DatabaseList);
        CHECK(harness.machine.loading());

        REQUIRE(harness.runner.run_next());
        harness.machine.pump();
    }

    SECTION("older response arrives last")
    {
        REQUIRE(harness.runner.run_last());
        harness.machine.pump();
        CHECK(harness.machine.state() == ViewState::SchemaList);

        REQUIRE(harness.runner.run_next());
        harness.machine.pump();
    }

    const auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::SchemaList);
    CHECK(snapshot.breadcrumb.back() == "analytics");
    CHECK(harness.names() == std::vector<std::string>{"public"});
    CHECK_FALSE(snapshot.error);
    CHECK(harness.count(EventOutcome::Stale) == 1U);
    CHECK(harness.machine.telemetry().stale_responses_dropped == 1U);
}

TEST_CASE("Revisiting a level is served from the cache", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();
    harness.step(Intent::enter_named("shop"));
    harness.dispatch(Intent::back());

    harness.dispatch(Intent::enter_named("shop"));
    CHECK(harness.machine.state() == ViewState::SchemaList);
    CHECK_FALSE(harness.machine.loading());
    CHECK(harness.runner.pending() == 0U);
    CHECK(harness.catalog->list_schema_calls.load() == 1);
    CHECK(harness.count(EventOutcome::CacheHit) == 1U);
    CHECK(harness.machine.telemetry().cache_hits == 1U);
    CHECK(harness.selected_name() == "sales");
}

TEST_CASE("Refresh refetches the level and everything beneath it", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();
    harness.step(Intent::enter_named("shop"));
    harness.dispatch(Intent::back());

    harness.step(Intent::refresh());
    CHECK(harness.machine.state() == ViewState::DatabaseList);
    CHECK(harness.catalog->list_database_calls.load() == 2);

    harness.step(Intent::enter_named("shop"));
    CHECK(harness.catalog->list_schema_calls.load() == 2);
}

TEST_CASE("Refresh keeps the selected entry by key", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();
    harness.step(Intent::enter_named("shop"));
    harness.step(Intent::enter_named("public"));

    harness.dispatch(Intent::select(1U));
    REQUIRE(harness.selected_name() == "orders");

    {
        std::lock_guard guard{harness.catalog->mutex};
        FakeCatalog::Table accounts{};
        accounts.ref.database = "shop";
        accounts.ref.schema = "public";
        accounts.ref.name = "accounts";
        auto& tables = harness.catalog->tables["shop.public"];
        tables.insert(tables.begin(), accounts);
    }

    harness.step(Intent::refresh());
    CHECK(harness.machine.state() == ViewState::TableList);
    CHECK(harness.names() == std::vector<std::string>{"accounts", "customers", "orders", "order_summary"});
    CHECK(harness.selected_name() == "orders");
    CHECK(harness.machine.snapshot().selection == 2U);
}

TEST_CASE("Refresh leaves levels whose name merely starts the same cached", "[navigation][state_machine]")
{
    Harness harness{};
    harness.catalog->databases.push_back("shop2");
    harness.catalog->schemas["shop2"] = {SchemaRef{"shop2", "public", "app"}};
    harness.connect();

    harness.step(Intent::enter_named("shop2"));
    harness.dispatch(Intent::back());
    harness.step(Intent::enter_named("shop"));
    harness.step(Intent::refresh());
    CHECK(harness.catalog->list_schema_calls.load() == 3);

    harness.dispatch(Intent::back());
    harness.dispatch(Intent::enter_named("shop2"));
    CHECK(harness.machine.state() == ViewState::SchemaList);
    CHECK(harness.runner.pending() == 0U);
    CHECK(harness.catalog->list_schema_calls.load() == 3);
}

TEST_CASE("A database with an empty name is not confused with the database list", "[navigation][state_machine]")
{
    Harness harness{};
    harness.catalog->databases.push_back("");
    harness.catalog->schemas[""] = {SchemaRef{"", "main", ""}};
    harness.connect();

    harness.step(Intent::enter(2U));
    CHECK(harness.machine.state() == ViewState::SchemaList);
    CHECK(harness.names() == std::vector<std::string>{"main"});
    CHECK(harness.catalog->list_schema_calls.load() == 1);
}

TEST_CASE("Filter and selection intents act on the visible list", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();
    harness.step(Intent::enter_named("shop"));
    harness.step(Intent::enter_named("public"));

    harness.dispatch(Intent::filter("ORDER"));
    CHECK(harness.names() == std::vector<std::string>{"orders", "order_summary"});
    CHECK(harness.machine.snapshot().filter == "ORDER");

    harness.dispatch(Intent::move_selection(1));
    CHECK(harness.selected_name() == "order_summary");

    harness.dispatch(Intent::select(7U));
    CHECK(harness.events.back().outcome == EventOutcome::Rejected);

    harness.dispatch(Intent::enter_named("customers"));
    const auto snapshot = harness.machine.snapshot();
    REQUIRE(snapshot.error);
    CHECK(snapshot.error->code == CatalogErrc::NotFound);
    CHECK(snapshot.state == ViewState::TableList);
}

TEST_CASE("Query results appear only after the run completes", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();

    harness.dispatch(Intent::run_query(kNumbersQuery));
    auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::QueryEditor);
    CHECK(snapshot.loading_slot == RequestSlot::Query);
    CHECK_FALSE(snapshot.contents);
    CHECK(snapshot.editor_text == kNumbersQuery);

    harness.settle();
    snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::ResultView);
    REQUIRE(snapshot.contents);
    CHECK(snapshot.contents->row_count() == 3U);
    CHECK(snapshot.breadcrumb == std::vector<std::string>{"shop-db", "query", "result"});
    CHECK(harness.machine.telemetry().requests_by_slot[static_cast<std::size_t>(RequestSlot::Query)] == 1U);
}

TEST_CASE("Cancelling a running query leaves the editor without rows", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();

    harness.dispatch(Intent::run_query(kNumbersQuery));
    harness.dispatch(Intent::cancel());
    CHECK_FALSE(harness.machine.loading());
    CHECK(harness.events.back().outcome == EventOutcome::Cancelled);

    harness.settle();
    const auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::QueryEditor);
    CHECK_FALSE(snapshot.contents);
    CHECK_FALSE(snapshot.error);
    CHECK(harness.machine.telemetry().cancellations == 1U);
    CHECK(harness.machine.in_flight() == 0U);
}

TEST_CASE("Cancelling a re-run drops the old result", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();
    harness.step(Intent::run_query(kNumbersQuery));
    REQUIRE(harness.machine.state() == ViewState::ResultView);

    harness.dispatch(Intent::run_query(kNumbersQuery));
    harness.dispatch(Intent::cancel());
    CHECK(harness.machine.state() == ViewState::QueryEditor);

    harness.settle();
    CHECK(harness.machine.state() == ViewState::QueryEditor);
    CHECK_FALSE(harness.machine.snapshot().contents);
}

TEST_CASE("Re-running from the result view replaces the result in place", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();
    harness.step(Intent::run_query(kNumbersQuery));

    {
        std::lock_guard guard{harness.catalog->mutex};
        harness.catalog->queries[kNumbersQuery].rows.push_back(Row{Value::int64(4)});
    }
    harness.step(Intent::refresh());

    const auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::ResultView);
    REQUIRE(snapshot.contents);
    CHECK(snapshot.contents->row_count() == 4U);
    CHECK(snapshot.breadcrumb.size() == 3U);
}

TEST_CASE("A failed re-run drops the old result", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();
    harness.step(Intent::run_query(kNumbersQuery));
    REQUIRE(harness.machine.state() == ViewState::ResultView);

    harness.step(Intent::run_query("SELECT 1/0;"));
    const auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::QueryEditor);
    CHECK_FALSE(snapshot.contents);
    CHECK(snapshot.editor_text == "SELECT 1/0;");
    CHECK(snapshot.breadcrumb == std::vector<std::string>{"shop-db", "query"});
    REQUIRE(snapshot.error);
    CHECK(snapshot.error->code == QueryErrc::RuntimeError);
    CHECK(snapshot.error->state == ViewState::QueryEditor);
}

TEST_CASE("Queries run in the database the view is in", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();
    harness.step(Intent::enter_named("shop"));
    harness.dispatch(Intent::back());
    harness.step(Intent::enter_named("analytics"));
    harness.dispatch(Intent::back());
    harness.dispatch(Intent::enter_named("shop"));
    REQUIRE(harness.count(EventOutcome::CacheHit) == 1U);

    harness.step(Intent::run_query(kNumbersQuery));
    CHECK(harness.machine.snapshot().breadcrumb == std::vector<std::string>{"shop-db", "shop", "query", "result"});
    REQUIRE_FALSE(harness.catalog->query_databases.empty());
    CHECK(harness.catalog->query_databases.back() == "shop");
}

TEST_CASE("Query errors raise a banner on the editor", "[navigation][state_machine]")
{
    Harness harness{};
    harness.connect();

    harness.step(Intent::run_query("SELECT 1/0;"));
    auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::QueryEditor);
    REQUIRE(snapshot.error);
    CHECK(snapshot.error->code == QueryErrc::RuntimeError);
    CHECK(snapshot.error->sqlstate == "22012");
    CHECK(snapshot.error->message == "division by zero");
    CHECK(snapshot.error->state == ViewState::QueryEditor);
    CHECK(harness.count(EventOutcome::Failed) == 1U);

    harness.dispatch(Intent::dismiss_error());
    CHECK_FALSE(harness.machine.snapshot().error);
}

TEST_CASE("Queries need a connection", "[navigation][state_machine]")
{
    Harness harness{};
    harness.dispatch(Intent::run_query(kNumbersQuery));

    const auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::ConnectionList);
    REQUIRE(snapshot.error);
    CHECK(snapshot.error->code == ConnectionErrc::Closed);
    CHECK(harness.runner.pending() == 0U);
}

TEST_CASE("Invalid profiles are rejected before any connect attempt", "[navigation][state_machine]")
{
    auto profile = shop_profile();
    profile.host.clear();
    Harness harness{std::vector<ConnectionProfile>{profile}};

    harness.dispatch(Intent::enter(0U));
    const auto snapshot = harness.machine.snapshot();
    REQUIRE(snapshot.error);
    CHECK(snapshot.error->code == ConnectionErrc::InvalidProfile);
    CHECK(snapshot.error->message == "host is required");
    CHECK(harness.runner.pending() == 0U);
    CHECK(harness.control->connects == 0);
}

TEST_CASE("Connect failures surface as a banner on the connection list", "[navigation][state_machine]")
{
    Harness harness{};
    harness.control->connect_error = sextant::backend::make_backend_error(ConnectionErrc::NetworkUnreachable, "could not connect to server");

    harness.step(Intent::enter(0U));
    const auto snapshot = harness.machine.snapshot();
    CHECK(snapshot.state == ViewState::ConnectionList);
    REQUIRE(snapshot.error);
    CHECK(snapshot.error->code == ConnectionErrc::NetworkUnreachable);
    CHECK_FALSE(harness.machine.connected());
    CHECK(harness.machine.telemetry().errors == 1U);
}

TEST_CASE("Back at the connection list abandons a pending connect", "[navigation][state_machine]")
{
    Harness harness{};
    harness.dispatch(Intent::enter(0U));
    harness.dispatch(Intent::back());
    CHECK(harness.events.back().outcome == EventOutcome::Cancelled);
    CHECK_FALSE(harness.machine.loading());

    harness.settle();
    CHECK(harness.machine.state() == ViewState::ConnectionList);
    CHECK_FALSE(harness.machine.connected());
    CHECK_FALSE(harness.machine.snapshot().error);
}

TEST_CASE("A connect that finished after Back is closed on the task runner", "[navigation][state_machine]")
{
    Harness harness{};
    harness.dispatch(Intent::enter(0U));
    REQUIRE(harness.runner.run_next());
    harness.dispatch(Intent::back());
    REQUIRE(harness.events.back().outcome == EventOutcome::Cancelled);

    harness.machine.pump();
    CHECK_FALSE(harness.machine.connected());
    CHECK(harness.catalog->close_calls.load() == 0);
    CHECK(harness.runner.pending() == 1U);
    CHECK(harness.machine.in_flight() == 1U);

    harness.settle();
    CHECK(harness.catalog->close_calls.load() == 1);
    CHECK(harness.machine.in_flight() == 0U);
}

TEST_CASE("Prompted secrets are stored after a successful connect", "[navigation][state_machine][credential]")
{
    Harness harness{};
    harness.control->requires_secret = true;

    harness.connect();
    REQUIRE(harness.control->received.size() == 1U);
    CHECK(harness.control->received.front().username == "app");
    CHECK(harness.control->received.front().secret == "typed-secret");
    CHECK(harness.store.contains("pg-shop"));
}

TEST_CASE("Rejected credentials are reported and forgotten", "[navigation][state_machine][credential]")
{
    Harness harness{};
    harness.control->requires_secret = true;
    harness.control->connect_error = sextant::backend::make_backend_error(ConnectionErrc::AuthFailed, "password authentication failed", "28P01");
    REQUIRE_FALSE(harness.store.set("pg-shop", "wrong"));

    harness.step(Intent::enter(0U));
    REQUIRE(harness.control->received.size() == 1U);
    CHECK(harness.control->received.front().secret == "wrong");

    const auto snapshot = harness.machine.snapshot();
    REQUIRE(snapshot.error);
    CHECK(snapshot.error->code == ConnectionErrc::AuthFailed);
    CHECK_THAT(snapshot.error->message, Catch::Matchers::StartsWith("invalid credentials: "));
    CHECK_FALSE(harness.store.contains("pg-shop"));
}

TEST_CASE("Never-save profiles leave nothing in the store", "[navigation][state_machine][credential]")
{
    auto profile = shop_profile();
    profile.credential_policy = CredentialPolicy::NeverSave;
    Harness harness{std::vector<ConnectionProfile>{profile}};
    harness.control->requires_secret = true;

    harness.connect();
    CHECK(harness.store.size() == 0U);
}

TEST_CASE("Profiles cannot be replaced while connected", "[navigation][state_machine]")
{
    Harness harness{};
    auto other = shop_profile();
    other.name = "other";

    harness.machine.set_profiles({shop_profile(), other});
    CHECK(harness.names() == std::vector<std::string>{"shop-db", "other"});

    harness.step(Intent::enter_named("other"));
    REQUIRE(harness.machine.active_profile() != nullptr);
    CHECK(harness.machine.active_profile()->name == "other");

    harness.machine.set_profiles({shop_profile()});
    harness.dispatch(Intent::disconnect());
    CHECK(harness.names() == std::vector<std::string>{"shop-db", "other"});
}

TEST_CASE("Thread pool runner drives the same navigation", "[navigation][state_machine]")
{
    auto catalog = shop_catalog();
    auto control = std::make_shared<FakeBackend::Control>();

    NavigationStateMachine::Config config{};
    config.backend_factory = sextant::testing::fake_factory(catalog, control);
    NavigationStateMachine machine{{shop_profile()}, nullptr, config};

    machine.dispatch(Intent::enter(0U));
    REQUIRE(machine.wait_until_idle(std::chrono::seconds{5}));
    CHECK(machine.state() == ViewState::DatabaseList);

    machine.dispatch(Intent::enter_named("shop"));
    REQUIRE(machine.wait_until_idle(std::chrono::seconds{5}));
    CHECK(machine.state() == ViewState::SchemaList);

    machine.dispatch(Intent::run_query(kNumbersQuery));
    REQUIRE(machine.wait_until_idle(std::chrono::seconds{5}));
    const auto snapshot = machine.snapshot();
    CHECK(snapshot.state == ViewState::ResultView);
    REQUIRE(snapshot.contents);
    CHECK(snapshot.contents->row_count() == 3U);
}
