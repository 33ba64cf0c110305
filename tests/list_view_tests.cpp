#include "sextant/navigation/list_view.hpp"

#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using sextant::navigation::ListView;
using sextant::value::ColumnDescriptor;
using sextant::value::QueryResult;
using sextant::value::Row;
using sextant::value::Value;

namespace {

std::shared_ptr<const QueryResult> tables(const std::vector<std::string>& names)
{
    ColumnDescriptor name{};
    name.name = "name";
    ColumnDescriptor kind{};
    kind.name = "kind";

    QueryResult result{{name, kind}};
    for (const auto& entry : names) {
        const auto is_view = entry.find("_view") != std::string::npos;
        (void)result.append_row(Row{Value::text(entry), Value::text(is_view ? "view" : "table")});
    }
    return std::make_shared<const QueryResult>(std::move(result));
}

}  // namespace

TEST_CASE("New list selects its first row", "[navigation][list_view]")
{
    ListView list{tables({"customers", "orders"}), {0U}};
    CHECK(list.visible_rows() == std::vector<std::size_t>{0U, 1U});
    CHECK(list.selection() == 0U);
    CHECK(list.selected_key() == "customers");
}

TEST_CASE("Empty list has no selection", "[navigation][list_view]")
{
    ListView list{tables({}), {0U}};
    CHECK(list.visible_rows().empty());
    CHECK_FALSE(list.selection());
    CHECK(list.selected() == nullptr);

    list.move_selection(3);
    CHECK_FALSE(list.selection());
    CHECK_FALSE(list.select(0U));
}

TEST_CASE("Selection moves within bounds", "[navigation][list_view]")
{
    ListView list{tables({"a", "b", "c"}), {0U}};
    list.move_selection(1);
    CHECK(list.selected_key() == "b");
    list.move_selection(10);
    CHECK(list.selection() == 2U);
    list.move_selection(-10);
    CHECK(list.selection() == 0U);

    CHECK(list.select(2U));
    CHECK(list.selected_row() == 2U);
    CHECK_FALSE(list.select(3U));
    CHECK(list.selection() == 2U);
}

TEST_CASE("Filter matches any cell without regard to case", "[navigation][list_view]")
{
    ListView list{tables({"customers", "orders", "order_view"}), {0U}};
    list.set_filter("ORDER");
    CHECK(list.visible_rows() == std::vector<std::size_t>{1U, 2U});

    list.set_filter("VIEW");
    CHECK(list.visible_rows() == std::vector<std::size_t>{2U});
    CHECK(list.selected_key() == "order_view");

    list.set_filter("");
    CHECK(list.visible_rows().size() == 3U);
    CHECK(list.filter().empty());
}

TEST_CASE("Filter keeps the selected entry when it stays visible", "[navigation][list_view]")
{
    ListView list{tables({"customers", "orders", "order_view"}), {0U}};
    REQUIRE(list.select(1U));
    list.set_filter("order");
    CHECK(list.selected_key() == "orders");
    CHECK(list.selection() == 0U);

    list.set_filter("customer");
    CHECK(list.selected_key() == "customers");
}

TEST_CASE("Replacing the source keeps the selection by key", "[navigation][list_view]")
{
    ListView list{tables({"customers", "orders", "products"}), {0U}};
    REQUIRE(list.select(1U));
    REQUIRE(list.selected_key() == "orders");

    list.set_source(tables({"accounts", "customers", "orders", "products"}), {0U});
    CHECK(list.selected_key() == "orders");
    CHECK(list.selection() == 2U);

    list.set_source(tables({"accounts", "products"}), {0U});
    CHECK(list.selection() == 0U);
    CHECK(list.selected_key() == "accounts");
}

TEST_CASE("Rows without key columns are identified by every cell", "[navigation][list_view]")
{
    ListView list{tables({"orders"}), {}};
    CHECK(list.row_key(0U) == "orders\x1f" "table");
    CHECK(list.find_key("orders\x1f" "table") == 0U);
    CHECK_FALSE(list.find_key("orders"));
    CHECK(list.row_key(5U).empty());
}
