#include "sextant/backend/backend.hpp"

#include "sextant/backend/postgres_backend.hpp"
#include "sextant/backend/primary_key_sink.hpp"
#include "sextant/backend/sqlite_backend.hpp"

#include <algorithm>
#include <utility>

namespace sextant::backend {

std::unique_ptr<Backend> make_backend(BackendKind kind)
{
    switch (kind) {
    case BackendKind::Postgres:
        return std::make_unique<PostgresBackend>();
    case BackendKind::Sqlite:
        return std::make_unique<SqliteBackend>();
    default:
        return nullptr;
    }
}

PrimaryKeySink::PrimaryKeySink(RowSink& inner, std::vector<std::string> key_columns)
    : inner_{inner}
    , key_columns_{std::move(key_columns)}
{
}

void PrimaryKeySink::on_columns(std::vector<value::ColumnDescriptor> columns)
{
    for (auto& column : columns) {
        column.primary_key = std::find(key_columns_.begin(), key_columns_.end(), column.name) != key_columns_.end();
    }
    inner_.on_columns(std::move(columns));
}

bool PrimaryKeySink::on_batch(std::vector<value::Row> rows)
{
    return inner_.on_batch(std::move(rows));
}

void PrimaryKeySink::on_command(std::string command_tag, std::optional<std::uint64_t> rows_affected)
{
    inner_.on_command(std::move(command_tag), rows_affected);
}

}  // namespace sextant::backend
