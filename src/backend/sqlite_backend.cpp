#include "sextant/backend/sqlite_backend.hpp"

#include "sextant/backend/primary_key_sink.hpp"
#include "sextant/value/value_codec.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <utility>
#include <vector>

namespace sextant::backend {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

bool contains(std::string_view haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string_view::npos;
}

std::string_view column_text(sqlite3_stmt* statement, int column)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(statement, column));
    if (text == nullptr) {
        return {};
    }
    return {text, static_cast<std::size_t>(sqlite3_column_bytes(statement, column))};
}

value::RawCell read_cell(sqlite3_stmt* statement, int column)
{
    switch (sqlite3_column_type(statement, column)) {
    case SQLITE_INTEGER:
        return value::RawCell::from_integer(sqlite3_column_int64(statement, column));
    case SQLITE_FLOAT:
        return value::RawCell::from_real(sqlite3_column_double(statement, column));
    case SQLITE_TEXT:
        return value::RawCell::from_text(column_text(statement, column));
    case SQLITE_BLOB: {
        const auto* blob = static_cast<const char*>(sqlite3_column_blob(statement, column));
        const auto size = static_cast<std::size_t>(sqlite3_column_bytes(statement, column));
        return value::RawCell::from_blob(blob == nullptr ? std::string_view{} : std::string_view{blob, size});
    }
    case SQLITE_NULL:
    default:
        return value::RawCell::null();
    }
}

std::string leading_keyword(std::string_view sql)
{
    std::size_t index = 0U;
    while (index < sql.size() && std::isspace(static_cast<unsigned char>(sql[index])) != 0) {
        ++index;
    }
    std::string keyword;
    while (index < sql.size() && std::isalpha(static_cast<unsigned char>(sql[index])) != 0) {
        keyword.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(sql[index]))));
        ++index;
    }
    return keyword;
}

BackendError cancelled_error()
{
    return make_backend_error(QueryErrc::Cancelled, "operation cancelled");
}

class SqliteSession final : public Session {
public:
    SqliteSession(ConnectionProfile profile, sqlite3* database)
        : profile_{std::move(profile)}
        , database_{database}
    {
    }

    ~SqliteSession() override
    {
        close();
    }

    SqliteSession(const SqliteSession&) = delete;
    SqliteSession& operator=(const SqliteSession&) = delete;

    [[nodiscard]] const ConnectionProfile& profile() const noexcept override
    {
        return profile_;
    }

    [[nodiscard]] std::string current_database() const override
    {
        return database_name();
    }

    [[nodiscard]] bool is_open() const noexcept override
    {
        return open_.load(std::memory_order_acquire);
    }

    [[nodiscard]] BackendError list_databases(std::vector<DatabaseRef>& databases, const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = check_open(token)) {
            return error;
        }
        databases.clear();
        databases.push_back(DatabaseRef{database_name()});
        return {};
    }

    [[nodiscard]] BackendError list_schemas(const DatabaseRef& database,
                                            std::vector<SchemaRef>& schemas,
                                            const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = check_known_database(database.name, token)) {
            return error;
        }

        std::vector<std::vector<value::Value>> rows;
        if (auto error = fetch("PRAGMA database_list", {}, token, rows)) {
            return error;
        }

        schemas.clear();
        for (const auto& row : rows) {
            const auto* name = row.size() > 1U ? row[1].get_if<value::TextValue>() : nullptr;
            if (name == nullptr || name->text == "temp") {
                continue;
            }
            schemas.push_back(SchemaRef{database.name, name->text, {}});
        }
        return {};
    }

    [[nodiscard]] BackendError list_tables(const SchemaRef& schema,
                                           std::vector<TableRef>& tables,
                                           const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = check_known_database(schema.database, token)) {
            return error;
        }
        if (!schema_attached(schema.name, token)) {
            return make_backend_error(CatalogErrc::NotFound, "no such schema: " + schema.name);
        }

        const auto sql = "SELECT name, type FROM " + quote_sqlite_identifier(schema.name)
                         + ".sqlite_master WHERE type IN ('table', 'view') AND name NOT LIKE 'sqlite_%' ORDER BY name";
        std::vector<std::vector<value::Value>> rows;
        if (auto error = fetch(sql, {}, token, rows)) {
            return error;
        }

        tables.clear();
        for (const auto& row : rows) {
            const auto* name = row[0].get_if<value::TextValue>();
            const auto* type = row[1].get_if<value::TextValue>();
            if (name == nullptr) {
                continue;
            }
            TableRef table{};
            table.database = schema.database;
            table.schema = schema.name;
            table.name = name->text;
            table.kind = type != nullptr && type->text == "view" ? TableKind::View : TableKind::Table;
            tables.push_back(std::move(table));
        }
        return {};
    }

    [[nodiscard]] BackendError list_columns(const TableRef& table,
                                            std::vector<value::ColumnDescriptor>& columns,
                                            const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = check_known_database(table.database, token)) {
            return error;
        }
        return table_info(table, token, columns);
    }

    [[nodiscard]] BackendError execute_query(const DatabaseRef& database,
                                             std::string_view sql,
                                             const StreamOptions& options,
                                             RowSink& sink,
                                             const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = check_known_database(database.name, token)) {
            return error;
        }
        return stream(sql, options, sink, token, false);
    }

    [[nodiscard]] BackendError browse_rows(const TableRef& table,
                                           std::size_t limit,
                                           const StreamOptions& options,
                                           RowSink& sink,
                                           const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = check_known_database(table.database, token)) {
            return error;
        }

        std::vector<value::ColumnDescriptor> columns;
        if (auto error = table_info(table, token, columns)) {
            return error;
        }

        std::vector<std::string> keys;
        std::string sql = "SELECT * FROM " + quote_sqlite_identifier(table.schema) + "."
                          + quote_sqlite_identifier(table.name);
        for (const auto& column : columns) {
            if (!column.primary_key) {
                continue;
            }
            sql += keys.empty() ? " ORDER BY " : ", ";
            sql += quote_sqlite_identifier(column.name);
            keys.push_back(column.name);
        }
        sql += " LIMIT " + std::to_string(limit);

        PrimaryKeySink keyed{sink, std::move(keys)};
        return stream(sql, options, keyed, token, true);
    }

    void cancel_all() noexcept override
    {
        interrupt();
    }

    void close() noexcept override
    {
        interrupt();
        std::lock_guard operation{operation_mutex_};
        sqlite3* database = nullptr;
        {
            std::lock_guard guard{state_mutex_};
            database = std::exchange(database_, nullptr);
        }
        if (database != nullptr) {
            (void)sqlite3_close_v2(database);
        }
        open_.store(false, std::memory_order_release);
    }

private:
    void interrupt() noexcept
    {
        std::lock_guard guard{state_mutex_};
        if (database_ != nullptr) {
            sqlite3_interrupt(database_);
        }
    }

    [[nodiscard]] std::string database_name() const
    {
        return profile_.file_path.filename().string();
    }

    [[nodiscard]] BackendError check_open(const CancellationToken& token) const
    {
        if (database_ == nullptr || !is_open()) {
            return make_backend_error(ConnectionErrc::Closed, "session is closed");
        }
        if (token.is_cancelled()) {
            return cancelled_error();
        }
        return {};
    }

    [[nodiscard]] BackendError check_known_database(const std::string& name, const CancellationToken& token) const
    {
        if (auto error = check_open(token)) {
            return error;
        }
        if (!name.empty() && name != database_name()) {
            return make_backend_error(CatalogErrc::NotFound, "unknown database: " + name);
        }
        return {};
    }

    [[nodiscard]] BackendError error_from(int result_code, bool catalog) const
    {
        if (result_code == SQLITE_INTERRUPT) {
            return cancelled_error();
        }
        std::string message = sqlite3_errmsg(database_);
        return make_backend_error(sqlite_error_code(result_code, message, catalog), std::move(message));
    }

    [[nodiscard]] bool schema_attached(const std::string& schema, const CancellationToken& token)
    {
        std::vector<std::vector<value::Value>> rows;
        if (fetch("PRAGMA database_list", {}, token, rows)) {
            return false;
        }
        return std::any_of(rows.begin(), rows.end(), [&schema](const std::vector<value::Value>& row) {
            const auto* name = row.size() > 1U ? row[1].get_if<value::TextValue>() : nullptr;
            return name != nullptr && name->text == schema;
        });
    }

    [[nodiscard]] BackendError table_info(const TableRef& table,
                                          const CancellationToken& token,
                                          std::vector<value::ColumnDescriptor>& columns)
    {
        const auto sql = "PRAGMA " + quote_sqlite_identifier(table.schema) + ".table_info("
                         + quote_sqlite_identifier(table.name) + ")";
        std::vector<std::vector<value::Value>> rows;
        if (auto error = fetch(sql, {}, token, rows)) {
            return error;
        }
        if (rows.empty()) {
            return make_backend_error(CatalogErrc::NotFound, "no such table: " + table.schema + "." + table.name);
        }

        columns.clear();
        for (const auto& row : rows) {
            // cid, name, type, notnull, dflt_value, pk
            value::ColumnDescriptor column{};
            const auto* cid = row[0].get_if<std::int64_t>();
            const auto* name = row[1].get_if<value::TextValue>();
            const auto* type = row[2].get_if<value::TextValue>();
            const auto* not_null = row[3].get_if<std::int64_t>();
            const auto* default_text = row[4].get_if<value::TextValue>();
            const auto* key_position = row[5].get_if<std::int64_t>();

            column.ordinal = cid != nullptr ? static_cast<std::size_t>(*cid) + 1U : columns.size() + 1U;
            column.name = name != nullptr ? name->text : std::string{};
            column.native_type = type != nullptr ? type->text : std::string{};
            column.nullable = not_null == nullptr || *not_null == 0;
            if (default_text != nullptr) {
                column.default_expression = default_text->text;
            }
            if (key_position != nullptr && *key_position > 0) {
                column.primary_key = true;
            }
            columns.push_back(std::move(column));
        }
        return {};
    }

    // Runs a statement and keeps every row. Catalog pragmas are small enough
    // to materialize.
    [[nodiscard]] BackendError fetch(const std::string& sql,
                                     const std::vector<std::string>& params,
                                     const CancellationToken& token,
                                     std::vector<std::vector<value::Value>>& rows)
    {
        const auto registration = token.on_cancel([this]() { interrupt(); });
        sqlite3_stmt* raw = nullptr;
        const auto prepared = sqlite3_prepare_v2(database_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);
        StatementPtr statement{raw, &sqlite3_finalize};
        if (prepared != SQLITE_OK) {
            return error_from(prepared, true);
        }
        for (std::size_t index = 0U; index < params.size(); ++index) {
            sqlite3_bind_text(statement.get(),
                              static_cast<int>(index) + 1,
                              params[index].c_str(),
                              static_cast<int>(params[index].size()),
                              SQLITE_TRANSIENT);
        }

        const auto columns = sqlite3_column_count(statement.get());
        while (true) {
            const auto step = sqlite3_step(statement.get());
            if (step == SQLITE_DONE) {
                break;
            }
            if (step != SQLITE_ROW) {
                return error_from(step, true);
            }
            std::vector<value::Value> row;
            row.reserve(static_cast<std::size_t>(columns));
            for (int column = 0; column < columns; ++column) {
                row.push_back(value::decode_sqlite_cell(read_cell(statement.get(), column), {}));
            }
            rows.push_back(std::move(row));
        }
        if (token.is_cancelled()) {
            return cancelled_error();
        }
        return {};
    }

    // Executes the text statement by statement. Each row-returning statement
    // opens a new result set in the sink, so the last one wins.
    [[nodiscard]] BackendError stream(std::string_view sql,
                                      const StreamOptions& options,
                                      RowSink& sink,
                                      const CancellationToken& token,
                                      bool catalog)
    {
        const auto registration = token.on_cancel([this]() { interrupt(); });
        const auto batch_size = std::max<std::size_t>(1U, options.batch_size);
        const std::string text{sql};
        const char* cursor = text.c_str();
        const char* const end = text.c_str() + text.size();

        while (cursor < end) {
            if (token.is_cancelled()) {
                return cancelled_error();
            }

            sqlite3_stmt* raw = nullptr;
            const char* tail = nullptr;
            const auto prepared =
                sqlite3_prepare_v2(database_, cursor, static_cast<int>(end - cursor), &raw, &tail);
            StatementPtr statement{raw, &sqlite3_finalize};
            if (prepared != SQLITE_OK) {
                return error_from(prepared, catalog);
            }
            const std::string_view statement_text{cursor, static_cast<std::size_t>((tail != nullptr ? tail : end) - cursor)};
            cursor = tail != nullptr ? tail : end;
            if (!statement) {
                continue;
            }

            const auto column_count = sqlite3_column_count(statement.get());
            if (column_count == 0) {
                const auto step = sqlite3_step(statement.get());
                if (step != SQLITE_DONE && step != SQLITE_ROW) {
                    return error_from(step, catalog);
                }
                auto keyword = leading_keyword(statement_text);
                std::optional<std::uint64_t> affected;
                if (keyword == "INSERT" || keyword == "UPDATE" || keyword == "DELETE" || keyword == "REPLACE") {
                    affected = static_cast<std::uint64_t>(sqlite3_changes(database_));
                }
                sink.on_command(std::move(keyword), affected);
                continue;
            }

            std::vector<value::ColumnDescriptor> columns;
            columns.reserve(static_cast<std::size_t>(column_count));
            for (int column = 0; column < column_count; ++column) {
                value::ColumnDescriptor descriptor{};
                descriptor.name = sqlite3_column_name(statement.get(), column);
                const char* declared = sqlite3_column_decltype(statement.get(), column);
                descriptor.native_type = declared != nullptr ? declared : "";
                descriptor.ordinal = static_cast<std::size_t>(column) + 1U;
                columns.push_back(std::move(descriptor));
            }
            sink.on_columns(columns);

            std::vector<value::Row> batch;
            std::uint64_t delivered = 0U;
            while (true) {
                const auto step = sqlite3_step(statement.get());
                if (step == SQLITE_DONE) {
                    break;
                }
                if (step != SQLITE_ROW) {
                    return error_from(step, catalog);
                }

                value::Row row;
                row.reserve(columns.size());
                for (int column = 0; column < column_count; ++column) {
                    row.push_back(value::decode_sqlite_cell(read_cell(statement.get(), column),
                                                            columns[static_cast<std::size_t>(column)].native_type));
                }
                batch.push_back(std::move(row));
                ++delivered;

                if (batch.size() >= batch_size) {
                    if (token.is_cancelled()) {
                        return cancelled_error();
                    }
                    if (!sink.on_batch(std::move(batch))) {
                        return {};
                    }
                    batch.clear();
                }
            }

            if (token.is_cancelled()) {
                return cancelled_error();
            }
            if (!batch.empty() && !sink.on_batch(std::move(batch))) {
                return {};
            }
            sink.on_command("SELECT", delivered);
        }
        return {};
    }

    const ConnectionProfile profile_;
    mutable std::mutex operation_mutex_{};
    mutable std::mutex state_mutex_{};
    sqlite3* database_ = nullptr;
    std::atomic<bool> open_{true};
};

BackendError open_error(sqlite3* database, int result_code, const std::string& path)
{
    std::string message = database != nullptr ? sqlite3_errmsg(database) : sqlite3_errstr(result_code);
    if (result_code == SQLITE_CANTOPEN) {
        return make_backend_error(ConnectionErrc::NetworkUnreachable, "unable to open " + path + ": " + message);
    }
    return make_backend_error(sqlite_error_code(result_code, message, false), std::move(message));
}

}  // namespace

BackendError SqliteBackend::connect(const ConnectionProfile& profile,
                                    const Credentials&,
                                    const ConnectOptions& options,
                                    const CancellationToken& token,
                                    std::unique_ptr<Session>& session)
{
    std::string reason;
    if (validate_profile(profile, &reason) || profile.backend_kind != BackendKind::Sqlite) {
        return make_backend_error(ConnectionErrc::InvalidProfile, reason.empty() ? "not a sqlite profile" : reason);
    }
    if (token.is_cancelled()) {
        return cancelled_error();
    }

    const auto path = profile.file_path.string();
    sqlite3* database = nullptr;
    const auto opened = sqlite3_open_v2(path.c_str(), &database, SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX, nullptr);
    if (opened != SQLITE_OK) {
        auto error = open_error(database, opened, path);
        sqlite3_close_v2(database);
        return error;
    }
    auto opened_session = std::make_unique<SqliteSession>(profile, database);

    sqlite3_busy_timeout(database, static_cast<int>(options.timeout.count()));
    sqlite3_extended_result_codes(database, 0);

    // The header is only read on first use; touching the schema exposes files
    // that are not databases.
    const auto probe = sqlite3_exec(database, "SELECT count(*) FROM sqlite_master", nullptr, nullptr, nullptr);
    if (probe != SQLITE_OK) {
        std::string message = sqlite3_errmsg(database);
        return make_backend_error(sqlite_error_code(probe, message, false), std::move(message));
    }

    for (const auto& attached : profile.attached_databases) {
        std::error_code status;
        if (!std::filesystem::exists(attached.file_path, status)) {
            return make_backend_error(ConnectionErrc::NetworkUnreachable,
                                      "attached database not found: " + attached.file_path.string());
        }

        const auto sql = "ATTACH DATABASE ?1 AS " + quote_sqlite_identifier(attached.alias);
        sqlite3_stmt* raw = nullptr;
        const auto prepared = sqlite3_prepare_v2(database, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);
        StatementPtr statement{raw, &sqlite3_finalize};
        if (prepared != SQLITE_OK) {
            std::string message = sqlite3_errmsg(database);
            return make_backend_error(ConnectionErrc::Unsupported, std::move(message));
        }
        const auto attached_path = attached.file_path.string();
        sqlite3_bind_text(statement.get(), 1, attached_path.c_str(), static_cast<int>(attached_path.size()), SQLITE_TRANSIENT);
        const auto step = sqlite3_step(statement.get());
        if (step != SQLITE_DONE) {
            std::string message = sqlite3_errmsg(database);
            return make_backend_error(sqlite_error_code(step, message, false), std::move(message));
        }
    }

    session = std::move(opened_session);
    return {};
}

std::error_code sqlite_error_code(int result_code, std::string_view message, bool catalog) noexcept
{
    switch (result_code & 0xFF) {
    case SQLITE_INTERRUPT:
        return make_error_code(QueryErrc::Cancelled);
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
        return make_error_code(ConnectionErrc::Unsupported);
    case SQLITE_CANTOPEN:
        return make_error_code(ConnectionErrc::NetworkUnreachable);
    case SQLITE_AUTH:
    case SQLITE_PERM:
    case SQLITE_READONLY:
        return catalog ? make_error_code(CatalogErrc::PermissionDenied) : make_error_code(QueryErrc::RuntimeError);
    default:
        break;
    }

    if (catalog) {
        if (contains(message, "no such table") || contains(message, "unknown database")) {
            return make_error_code(CatalogErrc::NotFound);
        }
        return make_error_code(CatalogErrc::Failed);
    }
    if (contains(message, "syntax error") || contains(message, "incomplete input")) {
        return make_error_code(QueryErrc::SyntaxError);
    }
    return make_error_code(QueryErrc::RuntimeError);
}

std::string quote_sqlite_identifier(std::string_view identifier)
{
    std::string quoted{"\""};
    for (const auto ch : identifier) {
        if (ch == '"') {
            quoted += '"';
        }
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

}  // namespace sextant::backend
