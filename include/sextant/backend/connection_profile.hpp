#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sextant::backend {

enum class BackendKind : std::uint8_t {
    Postgres = 0,
    Sqlite
};

enum class EnvironmentTag : std::uint8_t {
    Dev = 0,
    Staging,
    Prod
};

enum class CredentialPolicy : std::uint8_t {
    Store = 0,
    PromptAlways,
    NeverSave
};

// An extra SQLite database file exposed as a schema under its alias.
struct AttachedDatabase final {
    std::string alias{};
    std::filesystem::path file_path{};

    bool operator==(const AttachedDatabase&) const = default;
};

struct ConnectionProfile final {
    std::string id{};
    std::string name{};
    BackendKind backend_kind = BackendKind::Postgres;
    std::string host{};
    std::uint16_t port = 0U;
    std::filesystem::path file_path{};
    std::string username{};
    std::string database{};
    std::string default_schema{};
    std::vector<AttachedDatabase> attached_databases{};
    EnvironmentTag environment = EnvironmentTag::Dev;
    CredentialPolicy credential_policy = CredentialPolicy::Store;

    bool operator==(const ConnectionProfile&) const = default;
};

inline constexpr std::uint16_t kDefaultPostgresPort = 5432U;
inline constexpr std::string_view kDefaultPostgresDatabase = "postgres";

// Checks the fields the backend needs before any credential or network
// work happens. The reason, when requested, names the first missing field.
[[nodiscard]] std::error_code validate_profile(const ConnectionProfile& profile, std::string* reason = nullptr);

[[nodiscard]] std::string_view to_string(BackendKind kind) noexcept;
[[nodiscard]] std::string_view to_string(EnvironmentTag tag) noexcept;
[[nodiscard]] std::string_view to_string(CredentialPolicy policy) noexcept;

[[nodiscard]] std::optional<EnvironmentTag> parse_environment_tag(std::string_view text) noexcept;
[[nodiscard]] std::optional<CredentialPolicy> parse_credential_policy(std::string_view text) noexcept;

// user@host:port/database for servers, the file path for SQLite.
[[nodiscard]] std::string describe_target(const ConnectionProfile& profile);

}  // namespace sextant::backend
