#pragma once

#include "sextant/backend/backend.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace sextant::backend {

// A SQLite file is one database; its main schema and every attached file
// appear as schemas.
class SqliteBackend final : public Backend {
public:
    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Sqlite; }
    [[nodiscard]] bool requires_secret() const noexcept override { return false; }

    [[nodiscard]] BackendError connect(const ConnectionProfile& profile,
                                       const Credentials& credentials,
                                       const ConnectOptions& options,
                                       const CancellationToken& token,
                                       std::unique_ptr<Session>& session) override;
};

[[nodiscard]] std::error_code sqlite_error_code(int result_code, std::string_view message, bool catalog) noexcept;

[[nodiscard]] std::string quote_sqlite_identifier(std::string_view identifier);

}  // namespace sextant::backend
