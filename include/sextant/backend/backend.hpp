#pragma once

#include "sextant/backend/backend_errors.hpp"
#include "sextant/backend/cancellation.hpp"
#include "sextant/backend/catalog_refs.hpp"
#include "sextant/backend/connection_profile.hpp"
#include "sextant/value/query_result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sextant::backend {

struct Credentials final {
    std::string username{};
    std::string secret{};
};

struct ConnectOptions final {
    std::chrono::milliseconds timeout{std::chrono::seconds{10}};
    std::string application_name{"sextant"};
};

struct StreamOptions final {
    std::size_t batch_size = 256U;
};

inline constexpr std::size_t kDefaultBrowseLimit = 100U;

// Receives a query's output as it streams. on_columns may arrive more than
// once for multi-statement text; each call starts a new result set.
class RowSink {
public:
    virtual ~RowSink() = default;

    virtual void on_columns(std::vector<value::ColumnDescriptor> columns) = 0;
    // Returning false asks the backend to stop fetching; that is not an error.
    [[nodiscard]] virtual bool on_batch(std::vector<value::Row> rows) = 0;
    virtual void on_command(std::string command_tag, std::optional<std::uint64_t> rows_affected) = 0;
};

// One open connection. Operations are serialized internally; cancel_all and
// close may be called from any thread.
class Session {
public:
    virtual ~Session() = default;

    [[nodiscard]] virtual const ConnectionProfile& profile() const noexcept = 0;
    [[nodiscard]] virtual std::string current_database() const = 0;
    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    [[nodiscard]] virtual BackendError list_databases(std::vector<DatabaseRef>& databases,
                                                      const CancellationToken& token) = 0;
    [[nodiscard]] virtual BackendError list_schemas(const DatabaseRef& database,
                                                    std::vector<SchemaRef>& schemas,
                                                    const CancellationToken& token) = 0;
    [[nodiscard]] virtual BackendError list_tables(const SchemaRef& schema,
                                                   std::vector<TableRef>& tables,
                                                   const CancellationToken& token) = 0;
    [[nodiscard]] virtual BackendError list_columns(const TableRef& table,
                                                    std::vector<value::ColumnDescriptor>& columns,
                                                    const CancellationToken& token) = 0;

    // An empty database name runs in whatever database the session is on.
    [[nodiscard]] virtual BackendError execute_query(const DatabaseRef& database,
                                                     std::string_view sql,
                                                     const StreamOptions& options,
                                                     RowSink& sink,
                                                     const CancellationToken& token) = 0;
    [[nodiscard]] virtual BackendError browse_rows(const TableRef& table,
                                                   std::size_t limit,
                                                   const StreamOptions& options,
                                                   RowSink& sink,
                                                   const CancellationToken& token) = 0;

    // Interrupts whatever operation is running right now.
    virtual void cancel_all() noexcept = 0;
    virtual void close() noexcept = 0;
};

class Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual BackendKind kind() const noexcept = 0;
    [[nodiscard]] virtual bool requires_secret() const noexcept = 0;

    [[nodiscard]] virtual BackendError connect(const ConnectionProfile& profile,
                                               const Credentials& credentials,
                                               const ConnectOptions& options,
                                               const CancellationToken& token,
                                               std::unique_ptr<Session>& session) = 0;
};

using BackendFactory = std::function<std::unique_ptr<Backend>(BackendKind)>;

// The one place a backend kind is turned into an implementation.
[[nodiscard]] std::unique_ptr<Backend> make_backend(BackendKind kind);

}  // namespace sextant::backend
