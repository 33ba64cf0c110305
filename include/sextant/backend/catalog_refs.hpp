#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sextant::backend {

struct DatabaseRef final {
    std::string name{};

    bool operator==(const DatabaseRef&) const = default;
};

struct SchemaRef final {
    std::string database{};
    std::string name{};
    std::string owner{};

    bool operator==(const SchemaRef&) const = default;
};

enum class TableKind : std::uint8_t {
    Table = 0,
    View
};

struct TableRef final {
    std::string database{};
    std::string schema{};
    std::string name{};
    TableKind kind = TableKind::Table;
    std::string size{};

    bool operator==(const TableRef&) const = default;
};

[[nodiscard]] inline std::string_view to_string(TableKind kind) noexcept
{
    return kind == TableKind::View ? "view" : "table";
}

}  // namespace sextant::backend
