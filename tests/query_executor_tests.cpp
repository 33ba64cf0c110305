#include "fake_backend.hpp"

#include "sextant/query/query_executor.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using sextant::backend::CancellationSource;
using sextant::backend::ConnectionProfile;
using sextant::backend::QueryErrc;
using sextant::query::QueryExecutor;
using sextant::testing::FakeCatalog;
using sextant::testing::FakeSession;
using sextant::testing::make_column;
using sextant::value::Row;
using sextant::value::Value;

namespace {

std::shared_ptr<FakeCatalog> catalog_with_numbers(std::int64_t count)
{
    auto catalog = std::make_shared<FakeCatalog>();
    FakeCatalog::ScriptedQuery numbers{};
    numbers.columns = {make_column("n", "int4")};
    for (std::int64_t n = 1; n <= count; ++n) {
        numbers.rows.push_back(Row{Value::int64(n)});
    }
    catalog->queries["SELECT n FROM numbers;"] = numbers;

    FakeCatalog::ScriptedQuery failing{};
    failing.error = sextant::backend::make_backend_error(QueryErrc::RuntimeError, "division by zero", "22012");
    catalog->queries["SELECT 1/0;"] = failing;

    FakeCatalog::ScriptedQuery update{};
    update.command_tag = "UPDATE";
    update.rows = {Row{}, Row{}};
    catalog->queries["UPDATE t SET x = 1;"] = update;

    FakeCatalog::Table orders{};
    orders.ref.name = "orders";
    orders.columns = {make_column("id", "int4", true), make_column("status", "text")};
    for (std::int64_t id = 1; id <= 5; ++id) {
        orders.rows.push_back(Row{Value::int64(id), Value::text("pending")});
    }
    catalog->add_table("shop", "public", orders);
    return catalog;
}

std::shared_ptr<FakeSession> open_session(const std::shared_ptr<FakeCatalog>& catalog)
{
    return std::make_shared<FakeSession>(catalog, ConnectionProfile{});
}

}  // namespace

TEST_CASE("Executor publishes the full result after the run", "[query][executor]")
{
    auto catalog = catalog_with_numbers(10);
    QueryExecutor::Config config{};
    config.batch_size = 3U;
    QueryExecutor executor{open_session(catalog), config};

    std::vector<std::uint64_t> progress;
    CancellationSource source{};
    auto outcome = executor.run("SELECT n FROM numbers;", source.token(), [&progress](std::uint64_t rows) {
        progress.push_back(rows);
    });

    REQUIRE(outcome.success());
    CHECK(outcome.result->row_count() == 10U);
    CHECK(outcome.result->command_tag() == "SELECT");
    CHECK_FALSE(outcome.result->truncated());
    CHECK(outcome.metrics.rows_received == 10U);
    CHECK(outcome.metrics.batches == 4U);
    CHECK(progress == std::vector<std::uint64_t>{3U, 6U, 9U, 10U});
    CHECK_THAT(outcome.metrics.correlation_id, Catch::Matchers::StartsWith("query-"));
}

TEST_CASE("Executor rejects empty SQL without touching the session", "[query][executor]")
{
    auto catalog = catalog_with_numbers(1);
    QueryExecutor executor{open_session(catalog)};
    CancellationSource source{};

    auto outcome = executor.run("  -- nothing here\n", source.token());
    CHECK(outcome.error.code == QueryErrc::SyntaxError);
    CHECK_FALSE(outcome.result);
    CHECK(catalog->query_calls.load() == 0);
}

TEST_CASE("Cancelled run yields no rows", "[query][executor]")
{
    auto catalog = catalog_with_numbers(10);
    QueryExecutor executor{open_session(catalog)};

    auto handle = executor.prepare();
    QueryExecutor::cancel(handle);
    CHECK(handle.cancelled());

    auto outcome = executor.run("SELECT n FROM numbers;", handle);
    CHECK(outcome.cancelled());
    CHECK_FALSE(outcome.success());
    CHECK_FALSE(outcome.result);
}

TEST_CASE("Cancel between batches discards what was staged", "[query][executor]")
{
    auto catalog = catalog_with_numbers(10);
    QueryExecutor::Config config{};
    config.batch_size = 2U;
    QueryExecutor executor{open_session(catalog), config};

    CancellationSource source{};
    auto outcome = executor.run("SELECT n FROM numbers;", source.token(), [&source](std::uint64_t rows) {
        if (rows >= 4U) {
            source.cancel();
        }
    });

    CHECK(outcome.cancelled());
    CHECK_FALSE(outcome.result);
    CHECK(outcome.metrics.rows_received == 4U);
}

TEST_CASE("Executor stops at max_rows and marks the result truncated", "[query][executor]")
{
    auto catalog = catalog_with_numbers(25);
    QueryExecutor::Config config{};
    config.batch_size = 10U;
    config.max_rows = 15U;
    QueryExecutor executor{open_session(catalog), config};

    CancellationSource source{};
    auto outcome = executor.run("SELECT n FROM numbers;", source.token());
    REQUIRE(outcome.success());
    CHECK(outcome.result->row_count() == 15U);
    CHECK(outcome.result->truncated());
    CHECK(outcome.result->rows().back().front() == Value::int64(15));
}

TEST_CASE("Backend errors pass through with their SQLSTATE", "[query][executor]")
{
    auto catalog = catalog_with_numbers(1);
    QueryExecutor executor{open_session(catalog)};
    CancellationSource source{};

    auto outcome = executor.run("SELECT 1/0;", source.token());
    CHECK(outcome.error.code == QueryErrc::RuntimeError);
    CHECK(outcome.error.sqlstate == "22012");
    CHECK(outcome.error.message == "division by zero");
    CHECK_FALSE(outcome.result);
}

TEST_CASE("Statements without rows report their command", "[query][executor]")
{
    auto catalog = catalog_with_numbers(1);
    QueryExecutor executor{open_session(catalog)};
    CancellationSource source{};

    auto outcome = executor.run("UPDATE t SET x = 1;", source.token());
    REQUIRE(outcome.success());
    CHECK(outcome.result->column_count() == 0U);
    CHECK(outcome.result->command_tag() == "UPDATE");
    CHECK(outcome.result->rows_affected() == 2U);
}

TEST_CASE("A statement without rows does not relabel an earlier result set", "[query][executor]")
{
    auto catalog = catalog_with_numbers(3);
    QueryExecutor executor{open_session(catalog)};
    CancellationSource source{};

    auto outcome = executor.run("SELECT n FROM numbers; UPDATE t SET x = 1;", source.token());
    REQUIRE(outcome.success());
    CHECK(outcome.result->row_count() == 3U);
    CHECK(outcome.result->command_tag() == "SELECT");
    CHECK(outcome.result->rows_affected() == 3U);
}

TEST_CASE("Queries run in the requested database", "[query][executor]")
{
    auto catalog = catalog_with_numbers(1);
    QueryExecutor executor{open_session(catalog)};
    CancellationSource source{};

    REQUIRE(executor.run(sextant::backend::DatabaseRef{"analytics"}, "SELECT n FROM numbers;", source.token()).success());
    REQUIRE(executor.run("SELECT n FROM numbers;", source.token()).success());
    CHECK(executor.session()->current_database() == "analytics");
    CHECK(catalog->query_databases == std::vector<std::string>{"analytics", "analytics"});
}

TEST_CASE("Closed session fails fast", "[query][executor]")
{
    auto catalog = catalog_with_numbers(1);
    auto session = open_session(catalog);
    session->close();
    QueryExecutor executor{session};
    CancellationSource source{};

    auto outcome = executor.run("SELECT n FROM numbers;", source.token());
    CHECK(outcome.error.code == sextant::backend::ConnectionErrc::Closed);

    QueryExecutor detached{nullptr};
    CHECK(detached.run("SELECT n FROM numbers;", source.token()).error.code == sextant::backend::ConnectionErrc::Closed);
}

TEST_CASE("Browse returns keyed rows up to the limit", "[query][executor]")
{
    auto catalog = catalog_with_numbers(1);
    QueryExecutor executor{open_session(catalog)};
    CancellationSource source{};

    sextant::backend::TableRef table{};
    table.database = "shop";
    table.schema = "public";
    table.name = "orders";

    auto outcome = executor.browse(table, 3U, source.token());
    REQUIRE(outcome.success());
    CHECK(outcome.result->row_count() == 3U);
    CHECK(outcome.result->primary_key_columns() == std::vector<std::size_t>{0U});
    CHECK(catalog->browse_calls.load() == 1);
}
