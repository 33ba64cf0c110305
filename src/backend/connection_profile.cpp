#include "sextant/backend/connection_profile.hpp"

#include "sextant/backend/backend_errors.hpp"

namespace sextant::backend {

namespace {

std::error_code reject(std::string* reason, std::string_view text)
{
    if (reason != nullptr) {
        *reason = std::string{text};
    }
    return make_error_code(ConnectionErrc::InvalidProfile);
}

}  // namespace

std::error_code validate_profile(const ConnectionProfile& profile, std::string* reason)
{
    if (profile.name.empty()) {
        return reject(reason, "connection name is required");
    }

    switch (profile.backend_kind) {
    case BackendKind::Postgres:
        if (profile.host.empty()) {
            return reject(reason, "host is required");
        }
        if (profile.username.empty()) {
            return reject(reason, "user is required");
        }
        break;
    case BackendKind::Sqlite:
        if (profile.file_path.empty()) {
            return reject(reason, "database file path is required");
        }
        for (const auto& attached : profile.attached_databases) {
            if (attached.alias.empty() || attached.file_path.empty()) {
                return reject(reason, "attached databases need an alias and a path");
            }
            if (attached.alias == "main" || attached.alias == "temp") {
                return reject(reason, "attached database alias '" + attached.alias + "' is reserved");
            }
        }
        break;
    default:
        return reject(reason, "unknown backend kind");
    }

    return {};
}

std::string_view to_string(BackendKind kind) noexcept
{
    switch (kind) {
    case BackendKind::Postgres:
        return "postgres";
    case BackendKind::Sqlite:
        return "sqlite";
    default:
        return "unknown";
    }
}

std::string_view to_string(EnvironmentTag tag) noexcept
{
    switch (tag) {
    case EnvironmentTag::Dev:
        return "dev";
    case EnvironmentTag::Staging:
        return "staging";
    case EnvironmentTag::Prod:
        return "prod";
    default:
        return "unknown";
    }
}

std::string_view to_string(CredentialPolicy policy) noexcept
{
    switch (policy) {
    case CredentialPolicy::Store:
        return "store";
    case CredentialPolicy::PromptAlways:
        return "prompt-always";
    case CredentialPolicy::NeverSave:
        return "never-save";
    default:
        return "unknown";
    }
}

std::optional<EnvironmentTag> parse_environment_tag(std::string_view text) noexcept
{
    if (text == "dev") {
        return EnvironmentTag::Dev;
    }
    if (text == "staging") {
        return EnvironmentTag::Staging;
    }
    if (text == "prod") {
        return EnvironmentTag::Prod;
    }
    return std::nullopt;
}

std::optional<CredentialPolicy> parse_credential_policy(std::string_view text) noexcept
{
    if (text == "store") {
        return CredentialPolicy::Store;
    }
    if (text == "prompt-always") {
        return CredentialPolicy::PromptAlways;
    }
    if (text == "never-save") {
        return CredentialPolicy::NeverSave;
    }
    return std::nullopt;
}

std::string describe_target(const ConnectionProfile& profile)
{
    if (profile.backend_kind == BackendKind::Sqlite) {
        return profile.file_path.string();
    }

    std::string target;
    if (!profile.username.empty()) {
        target += profile.username + "@";
    }
    target += profile.host;
    target += ":" + std::to_string(profile.port == 0U ? kDefaultPostgresPort : profile.port);
    target += "/";
    target += profile.database.empty() ? std::string{kDefaultPostgresDatabase} : profile.database;
    return target;
}

}  // namespace sextant::backend
