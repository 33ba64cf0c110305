#include "sextant/navigation/catalog_listing.hpp"

#include <string>
#include <utility>

namespace sextant::navigation {

namespace {

value::ColumnDescriptor text_column(std::string name, std::size_t ordinal, bool nullable = false)
{
    value::ColumnDescriptor column{};
    column.name = std::move(name);
    column.native_type = "text";
    column.nullable = nullable;
    column.ordinal = ordinal;
    return column;
}

value::ColumnDescriptor bool_column(std::string name, std::size_t ordinal)
{
    auto column = text_column(std::move(name), ordinal);
    column.native_type = "boolean";
    return column;
}

value::Value optional_text(const std::string& text)
{
    return text.empty() ? value::Value::null() : value::Value::text(text);
}

}  // namespace

std::error_code profiles_table(const std::vector<backend::ConnectionProfile>& profiles, value::QueryResult& out)
{
    value::QueryResult result{{text_column("name", 1U),
                               text_column("backend", 2U),
                               text_column("target", 3U),
                               text_column("environment", 4U)}};
    for (const auto& profile : profiles) {
        if (auto error = result.append_row({value::Value::text(profile.name),
                                           value::Value::text(std::string{backend::to_string(profile.backend_kind)}),
                                           value::Value::text(backend::describe_target(profile)),
                                           value::Value::text(std::string{backend::to_string(profile.environment)})})) {
            return error;
        }
    }
    out = std::move(result);
    return {};
}

std::error_code databases_table(const std::vector<backend::DatabaseRef>& databases, value::QueryResult& out)
{
    value::QueryResult result{{text_column("name", 1U)}};
    for (const auto& database : databases) {
        if (auto error = result.append_row({value::Value::text(database.name)})) {
            return error;
        }
    }
    out = std::move(result);
    return {};
}

std::error_code schemas_table(const std::vector<backend::SchemaRef>& schemas, value::QueryResult& out)
{
    value::QueryResult result{{text_column("name", 1U), text_column("owner", 2U, true)}};
    for (const auto& schema : schemas) {
        if (auto error = result.append_row({value::Value::text(schema.name), optional_text(schema.owner)})) {
            return error;
        }
    }
    out = std::move(result);
    return {};
}

std::error_code tables_table(const std::vector<backend::TableRef>& tables, value::QueryResult& out)
{
    value::QueryResult result{{text_column("name", 1U), text_column("kind", 2U), text_column("size", 3U, true)}};
    for (const auto& table : tables) {
        if (auto error = result.append_row({value::Value::text(table.name),
                                           value::Value::text(std::string{backend::to_string(table.kind)}),
                                           optional_text(table.size)})) {
            return error;
        }
    }
    out = std::move(result);
    return {};
}

std::error_code columns_table(const std::vector<value::ColumnDescriptor>& columns, value::QueryResult& out)
{
    value::QueryResult result{{text_column("name", 1U),
                               text_column("type", 2U),
                               bool_column("nullable", 3U),
                               bool_column("primary_key", 4U),
                               text_column("default", 5U, true),
                               text_column("description", 6U, true)}};
    for (const auto& column : columns) {
        if (auto error = result.append_row({value::Value::text(column.name),
                                           value::Value::text(column.native_type),
                                           value::Value::boolean(column.nullable),
                                           value::Value::boolean(column.primary_key),
                                           column.default_expression ? value::Value::text(*column.default_expression) : value::Value::null(),
                                           column.description ? value::Value::text(*column.description) : value::Value::null()})) {
            return error;
        }
    }
    out = std::move(result);
    return {};
}

}  // namespace sextant::navigation
