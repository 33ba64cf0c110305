#include "sextant/value/query_result.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace sextant::value {

QueryResult::QueryResult(std::vector<ColumnDescriptor> columns)
    : columns_{std::move(columns)}
{
}

std::error_code QueryResult::append_row(Row row)
{
    if (row.size() != columns_.size()) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    rows_.push_back(std::move(row));
    return {};
}

std::error_code QueryResult::append_rows(std::vector<Row>&& rows)
{
    const auto misaligned = std::any_of(rows.begin(), rows.end(), [this](const Row& row) {
        return row.size() != columns_.size();
    });
    if (misaligned) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    rows_.reserve(rows_.size() + rows.size());
    std::move(rows.begin(), rows.end(), std::back_inserter(rows_));
    rows.clear();
    return {};
}

void QueryResult::clear_rows() noexcept
{
    rows_.clear();
    truncated_ = false;
}

std::optional<std::size_t> QueryResult::find_column(std::string_view name) const noexcept
{
    for (std::size_t index = 0U; index < columns_.size(); ++index) {
        if (columns_[index].name == name) {
            return index;
        }
    }
    return std::nullopt;
}

std::vector<std::size_t> QueryResult::primary_key_columns() const
{
    std::vector<std::size_t> keys;
    for (std::size_t index = 0U; index < columns_.size(); ++index) {
        if (columns_[index].primary_key) {
            keys.push_back(index);
        }
    }
    return keys;
}

void QueryResult::set_command(std::string command_tag, std::optional<std::uint64_t> rows_affected)
{
    command_tag_ = std::move(command_tag);
    rows_affected_ = rows_affected;
}

}  // namespace sextant::value
