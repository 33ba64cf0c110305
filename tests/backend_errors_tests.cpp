#include "sextant/backend/backend_errors.hpp"
#include "sextant/credential/credential_errors.hpp"

#include <string>
#include <system_error>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using sextant::backend::BackendError;
using sextant::backend::CatalogErrc;
using sextant::backend::ConnectionErrc;
using sextant::backend::QueryErrc;
using sextant::backend::make_backend_error;

TEST_CASE("Error taxonomy codes carry their own categories", "[backend][errors]")
{
    const std::error_code connection = ConnectionErrc::Timeout;
    const std::error_code catalog = CatalogErrc::PermissionDenied;
    const std::error_code query = QueryErrc::SyntaxError;

    CHECK(connection.category() == sextant::backend::connection_error_category());
    CHECK(catalog.category() == sextant::backend::catalog_error_category());
    CHECK(query.category() == sextant::backend::query_error_category());

    CHECK(std::string{connection.category().name()} == "sextant.connection");
    CHECK(connection.message() == "connection timed out");
    CHECK(catalog.message() == "permission denied");
    CHECK(query.message() == "syntax error");

    CHECK(connection != std::error_code{CatalogErrc::PermissionDenied});
}

TEST_CASE("Success values are falsy", "[backend][errors]")
{
    CHECK_FALSE(std::error_code{ConnectionErrc::Success});
    CHECK_FALSE(BackendError{});
    CHECK(make_backend_error(QueryErrc::RuntimeError, "boom"));
}

TEST_CASE("BackendError describe joins message and SQLSTATE", "[backend][errors]")
{
    const auto error = make_backend_error(QueryErrc::RuntimeError, "division by zero", "22012");
    CHECK(error.describe() == "query failed: division by zero (SQLSTATE 22012)");

    const auto bare = make_backend_error(ConnectionErrc::Closed);
    CHECK(bare.describe() == "connection closed");
    CHECK(BackendError{}.describe() == "success");
}

TEST_CASE("Cancellation is recognized only by its query code", "[backend][errors]")
{
    CHECK(sextant::backend::is_cancellation(make_backend_error(QueryErrc::Cancelled)));
    CHECK_FALSE(sextant::backend::is_cancellation(make_backend_error(ConnectionErrc::Timeout)));
    CHECK_FALSE(sextant::backend::is_cancellation(BackendError{}));
}

TEST_CASE("Credential errors have their own category", "[credential][errors]")
{
    const std::error_code error = sextant::credential::CredentialErrc::PromptCancelled;
    CHECK(error.category() == sextant::credential::credential_error_category());
    CHECK_THAT(std::string{error.category().name()}, Catch::Matchers::ContainsSubstring("credential"));
}
