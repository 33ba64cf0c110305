#pragma once

#include "sextant/backend/catalog_refs.hpp"
#include "sextant/backend/connection_profile.hpp"
#include "sextant/value/query_result.hpp"

#include <system_error>
#include <vector>

namespace sextant::navigation {

// Catalog levels rendered as results so every list shares one view. The
// first column is always the entry's name and serves as its key.
[[nodiscard]] std::error_code profiles_table(const std::vector<backend::ConnectionProfile>& profiles, value::QueryResult& out);
[[nodiscard]] std::error_code databases_table(const std::vector<backend::DatabaseRef>& databases, value::QueryResult& out);
[[nodiscard]] std::error_code schemas_table(const std::vector<backend::SchemaRef>& schemas, value::QueryResult& out);
[[nodiscard]] std::error_code tables_table(const std::vector<backend::TableRef>& tables, value::QueryResult& out);
[[nodiscard]] std::error_code columns_table(const std::vector<value::ColumnDescriptor>& columns, value::QueryResult& out);

}  // namespace sextant::navigation
