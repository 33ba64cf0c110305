#include "sextant/backend/postgres_backend.hpp"

#include "sextant/backend/primary_key_sink.hpp"
#include "sextant/value/value_codec.hpp"

#include <libpq-fe.h>
#include <poll.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace sextant::backend {

namespace {

using Clock = std::chrono::steady_clock;
using ConnectionPtr = std::unique_ptr<PGconn, decltype(&PQfinish)>;
using ResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;
using CancelPtr = std::unique_ptr<PGcancel, decltype(&PQfreeCancel)>;
using TextRow = std::vector<std::optional<std::string>>;

constexpr std::chrono::milliseconds kPollSlice{100};

constexpr std::string_view kListDatabasesSql =
    "SELECT datname FROM pg_catalog.pg_database "
    "WHERE datistemplate = false AND datallowconn "
    "ORDER BY datname";

constexpr std::string_view kListSchemasSql =
    "SELECT schema_name, COALESCE(schema_owner, '') FROM information_schema.schemata "
    "WHERE schema_name NOT IN ('information_schema', 'pg_catalog', 'pg_toast') "
    "AND schema_name NOT LIKE 'pg_temp_%' AND schema_name NOT LIKE 'pg_toast_temp_%' "
    "ORDER BY schema_name";

constexpr std::string_view kListTablesSql =
    "SELECT t.table_name, t.table_type, "
    "COALESCE(pg_size_pretty(pg_total_relation_size(format('%I.%I', t.table_schema, t.table_name)::regclass)), '') "
    "FROM information_schema.tables t "
    "WHERE t.table_schema = $1 AND t.table_type IN ('BASE TABLE', 'VIEW') "
    "ORDER BY t.table_name";

constexpr std::string_view kListColumnsSql =
    "SELECT c.column_name, c.udt_name, c.is_nullable, c.ordinal_position, c.column_default, pgd.description, "
    "EXISTS (SELECT 1 FROM pg_catalog.pg_index i "
    "        WHERE i.indrelid = cls.oid AND i.indisprimary AND a.attnum = ANY(i.indkey)), "
    "COALESCE(a.atttypid, 0) "
    "FROM information_schema.columns c "
    "JOIN pg_catalog.pg_namespace n ON n.nspname = c.table_schema "
    "JOIN pg_catalog.pg_class cls ON cls.relname = c.table_name AND cls.relnamespace = n.oid "
    "LEFT JOIN pg_catalog.pg_attribute a ON a.attrelid = cls.oid AND a.attname = c.column_name "
    "LEFT JOIN pg_catalog.pg_description pgd ON pgd.objoid = cls.oid AND pgd.objsubid = c.ordinal_position "
    "WHERE c.table_schema = $1 AND c.table_name = $2 "
    "ORDER BY c.ordinal_position";

constexpr std::string_view kPrimaryKeySql =
    "SELECT a.attname FROM pg_catalog.pg_index i "
    "JOIN pg_catalog.pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = ANY(i.indkey) "
    "WHERE i.indrelid = format('%I.%I', $1::text, $2::text)::regclass AND i.indisprimary "
    "ORDER BY array_position(i.indkey::int2[], a.attnum)";

constexpr std::string_view kTypeNamesSql = "SELECT oid, typname FROM pg_catalog.pg_type";

bool contains(std::string_view haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string_view::npos;
}

std::string trim_message(const char* message)
{
    if (message == nullptr) {
        return {};
    }
    std::string text{message};
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::string result_field(const PGresult* result, int field)
{
    const char* value = PQresultErrorField(result, field);
    return value != nullptr ? std::string{value} : std::string{};
}

BackendError error_from_result(const PGresult* result, PostgresOperation operation)
{
    auto sqlstate = result_field(result, PG_DIAG_SQLSTATE);
    auto message = result_field(result, PG_DIAG_MESSAGE_PRIMARY);
    if (message.empty()) {
        message = trim_message(PQresultErrorMessage(result));
    }
    return make_backend_error(postgres_error_code(sqlstate, operation), std::move(message), std::move(sqlstate));
}

BackendError connection_lost(PGconn* connection)
{
    return make_backend_error(ConnectionErrc::Closed, trim_message(PQerrorMessage(connection)));
}

BackendError cancelled_error()
{
    return make_backend_error(QueryErrc::Cancelled, "operation cancelled");
}

template <typename Number>
std::optional<Number> parse_number(std::string_view text)
{
    Number number{};
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, number);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return number;
}

// Blocks until the next result can be read without blocking. Cancellation is
// delivered server side, so the wait ends when the server answers.
bool wait_until_ready(PGconn* connection)
{
    while (PQisBusy(connection) != 0) {
        pollfd descriptor{};
        descriptor.fd = PQsocket(connection);
        descriptor.events = POLLIN;
        if (descriptor.fd < 0) {
            return false;
        }
        const auto rc = ::poll(&descriptor, 1, static_cast<int>(kPollSlice.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (PQconsumeInput(connection) == 0) {
            return false;
        }
    }
    return true;
}

BackendError open_connection(const ConnectionProfile& profile,
                             const Credentials& credentials,
                             const ConnectOptions& options,
                             const std::string& database,
                             const CancellationToken& token,
                             ConnectionPtr& connection)
{
    const auto port = std::to_string(profile.port == 0U ? kDefaultPostgresPort : profile.port);
    const auto timeout_seconds = std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count();
    const auto connect_timeout = std::to_string(std::max<long long>(1, timeout_seconds));
    const auto& user = credentials.username.empty() ? profile.username : credentials.username;

    const char* keywords[] = {"host", "port", "user", "password", "dbname", "application_name", "connect_timeout", nullptr};
    const char* values[] = {profile.host.c_str(),
                            port.c_str(),
                            user.c_str(),
                            credentials.secret.c_str(),
                            database.c_str(),
                            options.application_name.c_str(),
                            connect_timeout.c_str(),
                            nullptr};

    ConnectionPtr pending{PQconnectStartParams(keywords, values, 0), &PQfinish};
    if (!pending) {
        return make_backend_error(ConnectionErrc::NetworkUnreachable, "unable to allocate a connection");
    }
    if (PQstatus(pending.get()) == CONNECTION_BAD) {
        auto message = trim_message(PQerrorMessage(pending.get()));
        return make_backend_error(postgres_connect_error_code(message), std::move(message));
    }

    const auto deadline = Clock::now() + options.timeout;
    PostgresPollingStatusType status = PGRES_POLLING_WRITING;
    while (status != PGRES_POLLING_OK) {
        if (status == PGRES_POLLING_FAILED) {
            auto message = trim_message(PQerrorMessage(pending.get()));
            return make_backend_error(postgres_connect_error_code(message), std::move(message));
        }
        if (token.is_cancelled()) {
            return cancelled_error();
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            return make_backend_error(ConnectionErrc::Timeout,
                                      "no response from " + describe_target(profile) + " within "
                                          + std::to_string(options.timeout.count()) + " ms");
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        pollfd descriptor{};
        descriptor.fd = PQsocket(pending.get());
        descriptor.events = status == PGRES_POLLING_READING ? POLLIN : POLLOUT;
        const auto rc = ::poll(&descriptor, 1, static_cast<int>(std::min(remaining, kPollSlice).count()));
        if (rc < 0 && errno != EINTR) {
            return make_backend_error(ConnectionErrc::NetworkUnreachable, "socket wait failed");
        }
        if (rc <= 0) {
            continue;
        }
        status = PQconnectPoll(pending.get());
    }

    connection = std::move(pending);
    return {};
}

class PostgresSession final : public Session {
public:
    PostgresSession(ConnectionProfile profile, Credentials credentials, ConnectOptions options, std::string database)
        : profile_{std::move(profile)}
        , credentials_{std::move(credentials)}
        , options_{std::move(options)}
        , database_{std::move(database)}
    {
    }

    ~PostgresSession() override
    {
        close();
    }

    PostgresSession(const PostgresSession&) = delete;
    PostgresSession& operator=(const PostgresSession&) = delete;

    void adopt(ConnectionPtr connection, std::string database)
    {
        {
            std::lock_guard guard{state_mutex_};
            cancel_ = CancelPtr{PQgetCancel(connection.get()), &PQfreeCancel};
            database_ = std::move(database);
        }
        connection_ = std::move(connection);
        open_.store(true, std::memory_order_release);
        load_type_names();
    }

    [[nodiscard]] const ConnectionProfile& profile() const noexcept override
    {
        return profile_;
    }

    [[nodiscard]] std::string current_database() const override
    {
        std::lock_guard guard{state_mutex_};
        return database_;
    }

    [[nodiscard]] bool is_open() const noexcept override
    {
        return open_.load(std::memory_order_acquire);
    }

    [[nodiscard]] BackendError list_databases(std::vector<DatabaseRef>& databases, const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        std::vector<TextRow> rows;
        if (auto error = fetch_rows(kListDatabasesSql, {}, token, rows)) {
            return error;
        }

        databases.clear();
        for (auto& row : rows) {
            databases.push_back(DatabaseRef{row[0].value_or(std::string{})});
        }
        return {};
    }

    [[nodiscard]] BackendError list_schemas(const DatabaseRef& database,
                                            std::vector<SchemaRef>& schemas,
                                            const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = ensure_database(database.name, token)) {
            return error;
        }

        std::vector<TextRow> rows;
        if (auto error = fetch_rows(kListSchemasSql, {}, token, rows)) {
            return error;
        }

        schemas.clear();
        for (auto& row : rows) {
            schemas.push_back(SchemaRef{database.name, row[0].value_or(std::string{}), row[1].value_or(std::string{})});
        }
        return {};
    }

    [[nodiscard]] BackendError list_tables(const SchemaRef& schema,
                                           std::vector<TableRef>& tables,
                                           const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = ensure_database(schema.database, token)) {
            return error;
        }

        std::vector<TextRow> rows;
        if (auto error = fetch_rows(kListTablesSql, {schema.name}, token, rows)) {
            return error;
        }

        tables.clear();
        for (auto& row : rows) {
            TableRef table{};
            table.database = schema.database;
            table.schema = schema.name;
            table.name = row[0].value_or(std::string{});
            table.kind = row[1].value_or(std::string{}) == "VIEW" ? TableKind::View : TableKind::Table;
            table.size = row[2].value_or(std::string{});
            tables.push_back(std::move(table));
        }
        return {};
    }

    [[nodiscard]] BackendError list_columns(const TableRef& table,
                                            std::vector<value::ColumnDescriptor>& columns,
                                            const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = ensure_database(table.database, token)) {
            return error;
        }

        std::vector<TextRow> rows;
        if (auto error = fetch_rows(kListColumnsSql, {table.schema, table.name}, token, rows)) {
            return error;
        }
        if (rows.empty()) {
            return make_backend_error(CatalogErrc::NotFound,
                                      "relation " + table.schema + "." + table.name + " does not exist");
        }

        columns.clear();
        for (auto& row : rows) {
            value::ColumnDescriptor column{};
            column.name = row[0].value_or(std::string{});
            column.native_type = row[1].value_or(std::string{});
            column.nullable = row[2].value_or(std::string{"YES"}) == "YES";
            column.ordinal = parse_number<std::size_t>(row[3].value_or(std::string{})).value_or(columns.size() + 1U);
            column.default_expression = std::move(row[4]);
            column.description = std::move(row[5]);
            column.primary_key = row[6].value_or(std::string{"f"}) == "t";
            column.native_type_id = parse_number<std::uint32_t>(row[7].value_or(std::string{})).value_or(0U);
            columns.push_back(std::move(column));
        }
        return {};
    }

    [[nodiscard]] BackendError execute_query(const DatabaseRef& database,
                                             std::string_view sql,
                                             const StreamOptions& options,
                                             RowSink& sink,
                                             const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = ensure_database(database.name, token)) {
            return error;
        }
        return stream(sql, options, sink, token, PostgresOperation::Query);
    }

    [[nodiscard]] BackendError browse_rows(const TableRef& table,
                                           std::size_t limit,
                                           const StreamOptions& options,
                                           RowSink& sink,
                                           const CancellationToken& token) override
    {
        std::lock_guard operation{operation_mutex_};
        if (auto error = ensure_database(table.database, token)) {
            return error;
        }

        std::vector<TextRow> key_rows;
        std::vector<std::string> keys;
        if (!fetch_rows(kPrimaryKeySql, {table.schema, table.name}, token, key_rows)) {
            for (auto& row : key_rows) {
                if (row[0]) {
                    keys.push_back(std::move(*row[0]));
                }
            }
        }
        if (token.is_cancelled()) {
            return cancelled_error();
        }

        std::string sql = "SELECT * FROM " + quote_postgres_identifier(table.schema) + "."
                          + quote_postgres_identifier(table.name);
        for (std::size_t index = 0U; index < keys.size(); ++index) {
            sql += index == 0U ? " ORDER BY " : ", ";
            sql += quote_postgres_identifier(keys[index]);
        }
        sql += " LIMIT " + std::to_string(limit);

        PrimaryKeySink keyed{sink, std::move(keys)};
        return stream(sql, options, keyed, token, PostgresOperation::Catalog);
    }

    void cancel_all() noexcept override
    {
        send_cancel();
    }

    void close() noexcept override
    {
        send_cancel();
        std::lock_guard operation{operation_mutex_};
        {
            std::lock_guard guard{state_mutex_};
            cancel_.reset();
        }
        connection_.reset();
        open_.store(false, std::memory_order_release);
    }

private:
    void send_cancel() noexcept
    {
        std::lock_guard guard{state_mutex_};
        if (!cancel_) {
            return;
        }
        std::array<char, 256> error_buffer{};
        // A failed cancel request leaves the statement running to completion.
        (void)PQcancel(cancel_.get(), error_buffer.data(), static_cast<int>(error_buffer.size()));
    }

    [[nodiscard]] CancellationRegistration watch(const CancellationToken& token)
    {
        return token.on_cancel([this]() { send_cancel(); });
    }

    [[nodiscard]] BackendError check_open() const
    {
        if (!connection_ || !is_open()) {
            return make_backend_error(ConnectionErrc::Closed, "session is closed");
        }
        if (PQstatus(connection_.get()) == CONNECTION_BAD) {
            return connection_lost(connection_.get());
        }
        return {};
    }

    // A request for another database moves the session to it with the
    // credentials used for the original connect.
    [[nodiscard]] BackendError ensure_database(const std::string& database, const CancellationToken& token)
    {
        if (auto error = check_open()) {
            return error;
        }
        if (database.empty() || database == current_database()) {
            return {};
        }

        ConnectionPtr fresh{nullptr, &PQfinish};
        auto error = open_connection(profile_, credentials_, options_, database, token, fresh);
        if (error) {
            if (error.code != QueryErrc::Cancelled && contains(error.message, "does not exist")) {
                error.code = make_error_code(CatalogErrc::NotFound);
            }
            return error;
        }
        adopt(std::move(fresh), database);
        return {};
    }

    void load_type_names()
    {
        std::vector<TextRow> rows;
        if (fetch_rows(kTypeNamesSql, {}, CancellationToken{}, rows)) {
            return;
        }
        type_names_.clear();
        for (auto& row : rows) {
            const auto oid = parse_number<std::uint32_t>(row[0].value_or(std::string{}));
            if (oid && row[1]) {
                type_names_.emplace(*oid, std::move(*row[1]));
            }
        }
    }

    [[nodiscard]] std::string type_name(std::uint32_t oid) const
    {
        if (const auto found = type_names_.find(oid); found != type_names_.end()) {
            return found->second;
        }
        const auto builtin = value::postgres_builtin_type_name(oid);
        return builtin.empty() ? std::to_string(oid) : std::string{builtin};
    }

    [[nodiscard]] BackendError fetch_rows(std::string_view sql,
                                          const std::vector<std::string>& params,
                                          const CancellationToken& token,
                                          std::vector<TextRow>& rows)
    {
        if (auto error = check_open()) {
            return error;
        }
        if (token.is_cancelled()) {
            return cancelled_error();
        }

        auto* connection = connection_.get();
        const auto registration = watch(token);
        const std::string text{sql};
        std::vector<const char*> values;
        values.reserve(params.size());
        for (const auto& param : params) {
            values.push_back(param.c_str());
        }

        if (PQsendQueryParams(connection,
                              text.c_str(),
                              static_cast<int>(values.size()),
                              nullptr,
                              values.empty() ? nullptr : values.data(),
                              nullptr,
                              nullptr,
                              0)
            == 0) {
            return connection_lost(connection);
        }

        BackendError failure{};
        while (true) {
            if (!wait_until_ready(connection)) {
                return connection_lost(connection);
            }
            ResultPtr result{PQgetResult(connection), &PQclear};
            if (!result) {
                break;
            }

            const auto status = PQresultStatus(result.get());
            if (status == PGRES_TUPLES_OK) {
                const auto tuples = PQntuples(result.get());
                const auto fields = PQnfields(result.get());
                for (int row = 0; row < tuples; ++row) {
                    TextRow values_row;
                    values_row.reserve(static_cast<std::size_t>(fields));
                    for (int field = 0; field < fields; ++field) {
                        if (PQgetisnull(result.get(), row, field) != 0) {
                            values_row.emplace_back();
                        } else {
                            values_row.emplace_back(std::string{PQgetvalue(result.get(), row, field),
                                                                static_cast<std::size_t>(PQgetlength(result.get(), row, field))});
                        }
                    }
                    rows.push_back(std::move(values_row));
                }
            } else if (status != PGRES_COMMAND_OK && !failure) {
                failure = error_from_result(result.get(), PostgresOperation::Catalog);
            }
        }

        if (token.is_cancelled()) {
            return cancelled_error();
        }
        return failure;
    }

    [[nodiscard]] std::vector<value::ColumnDescriptor> describe(const PGresult* result) const
    {
        std::vector<value::ColumnDescriptor> columns;
        const auto fields = PQnfields(result);
        columns.reserve(static_cast<std::size_t>(fields));
        for (int field = 0; field < fields; ++field) {
            value::ColumnDescriptor column{};
            column.name = PQfname(result, field);
            column.native_type_id = static_cast<std::uint32_t>(PQftype(result, field));
            column.native_type = type_name(column.native_type_id);
            column.ordinal = static_cast<std::size_t>(field) + 1U;
            columns.push_back(std::move(column));
        }
        return columns;
    }

    [[nodiscard]] static value::Row decode_row(const PGresult* result,
                                               int row,
                                               const std::vector<value::ColumnDescriptor>& columns)
    {
        value::Row decoded;
        decoded.reserve(columns.size());
        for (std::size_t index = 0U; index < columns.size(); ++index) {
            const auto field = static_cast<int>(index);
            std::optional<std::string_view> text;
            if (PQgetisnull(result, row, field) == 0) {
                text = std::string_view{PQgetvalue(result, row, field),
                                        static_cast<std::size_t>(PQgetlength(result, row, field))};
            }
            decoded.push_back(value::decode_postgres_text(columns[index].native_type_id, text, columns[index].native_type));
        }
        return decoded;
    }

    // Streams every result of the statement text in single-row mode. Once the
    // sink declines more rows the statement is cancelled server side and the
    // remaining results are drained without being delivered.
    [[nodiscard]] BackendError stream(std::string_view sql,
                                      const StreamOptions& options,
                                      RowSink& sink,
                                      const CancellationToken& token,
                                      PostgresOperation operation)
    {
        if (auto error = check_open()) {
            return error;
        }
        if (token.is_cancelled()) {
            return cancelled_error();
        }

        auto* connection = connection_.get();
        const auto registration = watch(token);
        const std::string text{sql};
        if (PQsendQuery(connection, text.c_str()) == 0) {
            return connection_lost(connection);
        }
        (void)PQsetSingleRowMode(connection);

        const auto batch_size = std::max<std::size_t>(1U, options.batch_size);
        std::vector<value::ColumnDescriptor> columns;
        std::vector<value::Row> batch;
        bool announced = false;
        bool stopped = false;
        BackendError failure{};

        const auto deliver = [&]() {
            if (batch.empty() || stopped) {
                batch.clear();
                return;
            }
            if (token.is_cancelled() || !sink.on_batch(std::move(batch))) {
                stopped = true;
                send_cancel();
            }
            batch.clear();
        };

        while (true) {
            if (!wait_until_ready(connection)) {
                return connection_lost(connection);
            }
            ResultPtr result{PQgetResult(connection), &PQclear};
            if (!result) {
                break;
            }

            switch (PQresultStatus(result.get())) {
            case PGRES_SINGLE_TUPLE:
                if (stopped || failure) {
                    break;
                }
                if (!announced) {
                    columns = describe(result.get());
                    sink.on_columns(columns);
                    announced = true;
                }
                batch.push_back(decode_row(result.get(), 0, columns));
                if (batch.size() >= batch_size) {
                    deliver();
                }
                break;
            case PGRES_TUPLES_OK: {
                if (!stopped && !failure) {
                    if (!announced) {
                        columns = describe(result.get());
                        sink.on_columns(columns);
                    }
                    const auto tuples = PQntuples(result.get());
                    for (int row = 0; row < tuples; ++row) {
                        batch.push_back(decode_row(result.get(), row, columns));
                        if (batch.size() >= batch_size) {
                            deliver();
                        }
                    }
                    deliver();
                    if (!stopped) {
                        sink.on_command(PQcmdStatus(result.get()), parse_number<std::uint64_t>(PQcmdTuples(result.get())));
                    }
                }
                announced = false;
                columns.clear();
                break;
            }
            case PGRES_COMMAND_OK:
                if (!stopped && !failure) {
                    sink.on_command(PQcmdStatus(result.get()), parse_number<std::uint64_t>(PQcmdTuples(result.get())));
                }
                break;
            case PGRES_EMPTY_QUERY:
                break;
            default: {
                auto error = error_from_result(result.get(), operation);
                if (stopped && error.code == QueryErrc::Cancelled) {
                    break;
                }
                if (!failure) {
                    failure = std::move(error);
                }
                break;
            }
            }
        }

        if (token.is_cancelled()) {
            return cancelled_error();
        }
        return failure;
    }

    const ConnectionProfile profile_;
    const Credentials credentials_;
    const ConnectOptions options_;

    mutable std::mutex operation_mutex_{};
    mutable std::mutex state_mutex_{};
    ConnectionPtr connection_{nullptr, &PQfinish};
    CancelPtr cancel_{nullptr, &PQfreeCancel};
    std::string database_{};
    std::map<std::uint32_t, std::string> type_names_{};
    std::atomic<bool> open_{false};
};

}  // namespace

BackendError PostgresBackend::connect(const ConnectionProfile& profile,
                                      const Credentials& credentials,
                                      const ConnectOptions& options,
                                      const CancellationToken& token,
                                      std::unique_ptr<Session>& session)
{
    std::string reason;
    if (validate_profile(profile, &reason) || profile.backend_kind != BackendKind::Postgres) {
        return make_backend_error(ConnectionErrc::InvalidProfile, reason.empty() ? "not a postgres profile" : reason);
    }

    const auto database = profile.database.empty() ? std::string{kDefaultPostgresDatabase} : profile.database;
    ConnectionPtr connection{nullptr, &PQfinish};
    if (auto error = open_connection(profile, credentials, options, database, token, connection)) {
        return error;
    }

    auto opened = std::make_unique<PostgresSession>(profile, credentials, options, database);
    opened->adopt(std::move(connection), database);
    session = std::move(opened);
    return {};
}

std::error_code postgres_error_code(std::string_view sqlstate, PostgresOperation operation) noexcept
{
    if (sqlstate == "57014") {
        return make_error_code(QueryErrc::Cancelled);
    }
    if (sqlstate == "28P01" || sqlstate == "28000") {
        return make_error_code(ConnectionErrc::AuthFailed);
    }
    if (sqlstate.substr(0U, 2U) == "08" || sqlstate == "57P01") {
        return make_error_code(operation == PostgresOperation::Connect ? ConnectionErrc::NetworkUnreachable
                                                                       : ConnectionErrc::Closed);
    }

    switch (operation) {
    case PostgresOperation::Connect:
        return make_error_code(ConnectionErrc::NetworkUnreachable);
    case PostgresOperation::Catalog:
        if (sqlstate == "42501") {
            return make_error_code(CatalogErrc::PermissionDenied);
        }
        if (sqlstate == "3D000" || sqlstate == "3F000" || sqlstate == "42P01") {
            return make_error_code(CatalogErrc::NotFound);
        }
        return make_error_code(CatalogErrc::Failed);
    case PostgresOperation::Query:
    default:
        if (sqlstate == "42601") {
            return make_error_code(QueryErrc::SyntaxError);
        }
        return make_error_code(QueryErrc::RuntimeError);
    }
}

std::error_code postgres_connect_error_code(std::string_view message) noexcept
{
    if (contains(message, "password authentication failed") || contains(message, "no password supplied")
        || contains(message, "authentication failed")) {
        return make_error_code(ConnectionErrc::AuthFailed);
    }
    if (contains(message, "timeout expired")) {
        return make_error_code(ConnectionErrc::Timeout);
    }
    if (contains(message, "invalid connection option") || contains(message, "invalid URI")) {
        return make_error_code(ConnectionErrc::Unsupported);
    }
    return make_error_code(ConnectionErrc::NetworkUnreachable);
}

std::string quote_postgres_identifier(std::string_view identifier)
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
