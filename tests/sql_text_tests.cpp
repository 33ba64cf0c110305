#include "sextant/query/sql_text.hpp"

#include <catch2/catch_test_macros.hpp>

using sextant::query::has_executable_text;
using sextant::query::statement_complete;

TEST_CASE("trim strips surrounding whitespace", "[query][sql_text]")
{
    CHECK(sextant::query::trim("  SELECT 1;\n\t") == "SELECT 1;");
    CHECK(sextant::query::trim(" \n ").empty());
}

TEST_CASE("Whitespace and comments are not executable", "[query][sql_text]")
{
    CHECK_FALSE(has_executable_text(""));
    CHECK_FALSE(has_executable_text("   \n\t"));
    CHECK_FALSE(has_executable_text("-- just a note\n  /* and a block */  "));
    CHECK(has_executable_text("/* lead */ SELECT 1"));
    CHECK(has_executable_text("''"));
}

TEST_CASE("A statement is complete once terminated outside quotes", "[query][sql_text]")
{
    CHECK(statement_complete("SELECT 1;"));
    CHECK(statement_complete("SELECT 1;  -- trailing note"));
    CHECK(statement_complete("SELECT 'a;b';\n"));
    CHECK(statement_complete("SELECT \"weird;name\" FROM t;"));
    CHECK(statement_complete("SELECT 'it''s';"));

    CHECK_FALSE(statement_complete("SELECT 1"));
    CHECK_FALSE(statement_complete("SELECT 'open;"));
    CHECK_FALSE(statement_complete("SELECT (1;"));
    CHECK_FALSE(statement_complete("SELECT 1; /* unclosed"));
    CHECK_FALSE(statement_complete("SELECT 1 -- ;"));
}
