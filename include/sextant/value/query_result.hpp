#pragma once

#include "sextant/value/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sextant::value {

struct ColumnDescriptor final {
    std::string name{};
    std::string native_type{};
    std::uint32_t native_type_id = 0U;
    bool nullable = true;
    std::size_t ordinal = 0U;
    bool primary_key = false;
    std::optional<std::string> default_expression{};
    std::optional<std::string> description{};

    bool operator==(const ColumnDescriptor&) const = default;
};

using Row = std::vector<Value>;

struct RowBatch final {
    std::uint64_t sequence = 0U;
    std::vector<Row> rows{};
};

class QueryResult final {
public:
    QueryResult() = default;
    explicit QueryResult(std::vector<ColumnDescriptor> columns);

    [[nodiscard]] const std::vector<ColumnDescriptor>& columns() const noexcept { return columns_; }
    [[nodiscard]] const std::vector<Row>& rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t column_count() const noexcept { return columns_.size(); }
    [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    // Rejects a row whose width differs from the column count.
    [[nodiscard]] std::error_code append_row(Row row);
    [[nodiscard]] std::error_code append_rows(std::vector<Row>&& rows);
    void clear_rows() noexcept;

    [[nodiscard]] std::optional<std::size_t> find_column(std::string_view name) const noexcept;
    [[nodiscard]] std::vector<std::size_t> primary_key_columns() const;

    [[nodiscard]] const std::string& command_tag() const noexcept { return command_tag_; }
    [[nodiscard]] std::optional<std::uint64_t> rows_affected() const noexcept { return rows_affected_; }
    void set_command(std::string command_tag, std::optional<std::uint64_t> rows_affected);

    [[nodiscard]] bool truncated() const noexcept { return truncated_; }
    void set_truncated(bool truncated) noexcept { truncated_ = truncated; }

private:
    std::vector<ColumnDescriptor> columns_{};
    std::vector<Row> rows_{};
    std::string command_tag_{};
    std::optional<std::uint64_t> rows_affected_{};
    bool truncated_ = false;
};

}  // namespace sextant::value
