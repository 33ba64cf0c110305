#include "sextant/backend/backend_errors.hpp"
#include "sextant/backend/connection_profile.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

using sextant::backend::AttachedDatabase;
using sextant::backend::BackendKind;
using sextant::backend::ConnectionErrc;
using sextant::backend::ConnectionProfile;
using sextant::backend::CredentialPolicy;
using sextant::backend::EnvironmentTag;
using sextant::backend::validate_profile;

namespace {

ConnectionProfile postgres_profile()
{
    ConnectionProfile profile{};
    profile.id = "pg-local";
    profile.name = "local";
    profile.backend_kind = BackendKind::Postgres;
    profile.host = "localhost";
    profile.username = "postgres";
    return profile;
}

ConnectionProfile sqlite_profile()
{
    ConnectionProfile profile{};
    profile.id = "sqlite-test";
    profile.name = "test";
    profile.backend_kind = BackendKind::Sqlite;
    profile.file_path = "/tmp/test.db";
    return profile;
}

}  // namespace

TEST_CASE("Complete profiles validate", "[backend][profile]")
{
    CHECK_FALSE(validate_profile(postgres_profile()));
    CHECK_FALSE(validate_profile(sqlite_profile()));
}

TEST_CASE("Postgres profile needs host and user", "[backend][profile]")
{
    auto profile = postgres_profile();
    profile.host.clear();
    std::string reason;
    CHECK(validate_profile(profile, &reason) == ConnectionErrc::InvalidProfile);
    CHECK(reason == "host is required");

    profile = postgres_profile();
    profile.username.clear();
    CHECK(validate_profile(profile, &reason) == ConnectionErrc::InvalidProfile);
    CHECK(reason == "user is required");
}

TEST_CASE("Profile name is required", "[backend][profile]")
{
    auto profile = sqlite_profile();
    profile.name.clear();
    std::string reason;
    CHECK(validate_profile(profile, &reason) == ConnectionErrc::InvalidProfile);
    CHECK(reason == "connection name is required");
}

TEST_CASE("SQLite profile needs a path and sane attachments", "[backend][profile]")
{
    auto profile = sqlite_profile();
    profile.file_path.clear();
    CHECK(validate_profile(profile) == ConnectionErrc::InvalidProfile);

    profile = sqlite_profile();
    profile.attached_databases.push_back(AttachedDatabase{"main", "/tmp/other.db"});
    std::string reason;
    CHECK(validate_profile(profile, &reason) == ConnectionErrc::InvalidProfile);
    CHECK(reason == "attached database alias 'main' is reserved");

    profile = sqlite_profile();
    profile.attached_databases.push_back(AttachedDatabase{"test_schema", ""});
    CHECK(validate_profile(profile) == ConnectionErrc::InvalidProfile);

    profile = sqlite_profile();
    profile.attached_databases.push_back(AttachedDatabase{"test_schema", "/tmp/test_schema.db"});
    CHECK_FALSE(validate_profile(profile));
}

TEST_CASE("Profile enums round-trip through their names", "[backend][profile]")
{
    CHECK(sextant::backend::to_string(BackendKind::Sqlite) == "sqlite");
    CHECK(sextant::backend::to_string(EnvironmentTag::Prod) == "prod");
    CHECK(sextant::backend::to_string(CredentialPolicy::NeverSave) == "never-save");

    CHECK(sextant::backend::parse_environment_tag("staging") == EnvironmentTag::Staging);
    CHECK_FALSE(sextant::backend::parse_environment_tag("production"));
    CHECK(sextant::backend::parse_credential_policy("prompt-always") == CredentialPolicy::PromptAlways);
    CHECK_FALSE(sextant::backend::parse_credential_policy("sometimes"));
}

TEST_CASE("describe_target fills in server defaults", "[backend][profile]")
{
    CHECK(sextant::backend::describe_target(postgres_profile()) == "postgres@localhost:5432/postgres");

    auto profile = postgres_profile();
    profile.port = 6543U;
    profile.database = "shop";
    CHECK(sextant::backend::describe_target(profile) == "postgres@localhost:6543/shop");

    CHECK(sextant::backend::describe_target(sqlite_profile()) == "/tmp/test.db");
}
