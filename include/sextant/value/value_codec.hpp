#pragma once

#include "sextant/value/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sextant::value {

enum class TypeSystem : std::uint8_t {
    Postgres = 0,
    Sqlite
};

// How a backend identifies the type of a cell: Postgres supplies an OID plus
// its pg_type name, SQLite supplies the column's declared type.
struct NativeType final {
    TypeSystem system = TypeSystem::Sqlite;
    std::uint32_t id = 0U;
    std::string_view name{};
};

enum class CellStorage : std::uint8_t {
    Null = 0,
    Integer,
    Real,
    Text,
    Blob
};

// A raw cell as it came off the wire or out of a statement. Text and blob
// payloads are borrowed and must outlive the decode call.
struct RawCell final {
    CellStorage storage = CellStorage::Null;
    std::int64_t integer = 0;
    double real = 0.0;
    std::string_view payload{};

    [[nodiscard]] static RawCell null() noexcept { return RawCell{}; }
    [[nodiscard]] static RawCell from_integer(std::int64_t number) noexcept
    {
        return RawCell{CellStorage::Integer, number, 0.0, {}};
    }
    [[nodiscard]] static RawCell from_real(double number) noexcept { return RawCell{CellStorage::Real, 0, number, {}}; }
    [[nodiscard]] static RawCell from_text(std::string_view text) noexcept { return RawCell{CellStorage::Text, 0, 0.0, text}; }
    [[nodiscard]] static RawCell from_blob(std::string_view bytes) noexcept { return RawCell{CellStorage::Blob, 0, 0.0, bytes}; }
};

// Total over every cell a backend produces: anything that cannot be
// understood decodes to an Unparsed value instead of failing.
[[nodiscard]] Value decode(const NativeType& type, const RawCell& cell);

// Postgres text-format cell. A nullopt text is SQL NULL.
[[nodiscard]] Value decode_postgres_text(std::uint32_t type_oid,
                                         std::optional<std::string_view> text,
                                         std::string_view type_name = {});

[[nodiscard]] Value decode_sqlite_cell(const RawCell& cell, std::string_view declared_type);

// The kind a non-null cell of the given Postgres type decodes to.
[[nodiscard]] ValueKind postgres_value_kind(std::uint32_t type_oid) noexcept;

// Built-in pg_type names for the OIDs the codec understands; empty when unknown.
[[nodiscard]] std::string_view postgres_builtin_type_name(std::uint32_t type_oid) noexcept;

}  // namespace sextant::value
