#pragma once

#include "sextant/backend/backend.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace sextant::backend {

enum class PostgresOperation : std::uint8_t {
    Connect = 0,
    Catalog,
    Query
};

class PostgresBackend final : public Backend {
public:
    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Postgres; }
    [[nodiscard]] bool requires_secret() const noexcept override { return true; }

    [[nodiscard]] BackendError connect(const ConnectionProfile& profile,
                                       const Credentials& credentials,
                                       const ConnectOptions& options,
                                       const CancellationToken& token,
                                       std::unique_ptr<Session>& session) override;
};

// Maps a server SQLSTATE onto the error taxonomy of the operation that failed.
[[nodiscard]] std::error_code postgres_error_code(std::string_view sqlstate, PostgresOperation operation) noexcept;

// Classifies a libpq connection failure message, which carries no SQLSTATE.
[[nodiscard]] std::error_code postgres_connect_error_code(std::string_view message) noexcept;

[[nodiscard]] std::string quote_postgres_identifier(std::string_view identifier);

}  // namespace sextant::backend
