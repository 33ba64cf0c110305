#include "sextant/value/value_codec.hpp"

#include "sextant/value/pg_text_parser.hpp"
#include "sextant/value/pg_type_oids.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <utility>
#include <vector>

namespace sextant::value {

namespace {

enum class SqliteHint : std::uint8_t {
    None = 0,
    Bool,
    Integer,
    Real,
    Decimal,
    Text,
    Blob,
    Date,
    Time,
    Timestamp,
    Uuid,
    Json
};

std::string to_upper(std::string_view text)
{
    std::string upper;
    upper.reserve(text.size());
    for (const auto ch : text) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return upper;
}

bool contains(std::string_view haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string_view::npos;
}

// Declared-type affinity in the spirit of SQLite's own rules, extended with
// the conventional names applications use for richer types.
SqliteHint classify_declared_type(std::string_view declared_type)
{
    const auto upper = to_upper(declared_type);
    if (upper.empty()) {
        return SqliteHint::None;
    }
    if (contains(upper, "BOOL")) {
        return SqliteHint::Bool;
    }
    if (contains(upper, "DATETIME") || contains(upper, "TIMESTAMP")) {
        return SqliteHint::Timestamp;
    }
    if (contains(upper, "DATE")) {
        return SqliteHint::Date;
    }
    if (contains(upper, "TIME")) {
        return SqliteHint::Time;
    }
    if (contains(upper, "UUID") || contains(upper, "GUID")) {
        return SqliteHint::Uuid;
    }
    if (contains(upper, "JSON")) {
        return SqliteHint::Json;
    }
    if (contains(upper, "DEC") || contains(upper, "NUMERIC") || contains(upper, "MONEY")) {
        return SqliteHint::Decimal;
    }
    if (contains(upper, "INT")) {
        return SqliteHint::Integer;
    }
    if (contains(upper, "CHAR") || contains(upper, "CLOB") || contains(upper, "TEXT")) {
        return SqliteHint::Text;
    }
    if (contains(upper, "BLOB")) {
        return SqliteHint::Blob;
    }
    if (contains(upper, "REAL") || contains(upper, "FLOA") || contains(upper, "DOUB")) {
        return SqliteHint::Real;
    }
    return SqliteHint::None;
}

std::optional<std::int64_t> parse_int64(std::string_view text)
{
    std::int64_t number = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return number;
}

std::optional<double> parse_double(std::string_view text)
{
    double number = 0.0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return number;
}

std::string shortest_text(double number)
{
    std::array<char, 64> buffer{};
    const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number);
    if (ec != std::errc{}) {
        return {};
    }
    return std::string{buffer.data(), ptr};
}

int hex_digit(char ch) noexcept
{
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

bool is_octal(char ch) noexcept
{
    return ch >= '0' && ch <= '7';
}

// bytea output in either the hex (\x0102) or the legacy escape format.
std::optional<std::vector<std::byte>> decode_bytea(std::string_view text)
{
    std::vector<std::byte> bytes;
    if (text.size() >= 2U && text[0] == '\\' && text[1] == 'x') {
        const auto hex = text.substr(2U);
        if (hex.size() % 2U != 0U) {
            return std::nullopt;
        }
        bytes.reserve(hex.size() / 2U);
        for (std::size_t index = 0U; index < hex.size(); index += 2U) {
            const auto high = hex_digit(hex[index]);
            const auto low = hex_digit(hex[index + 1U]);
            if (high < 0 || low < 0) {
                return std::nullopt;
            }
            bytes.push_back(static_cast<std::byte>((high << 4) | low));
        }
        return bytes;
    }

    bytes.reserve(text.size());
    for (std::size_t index = 0U; index < text.size(); ++index) {
        const auto ch = text[index];
        if (ch != '\\') {
            bytes.push_back(static_cast<std::byte>(ch));
            continue;
        }
        if (index + 1U < text.size() && text[index + 1U] == '\\') {
            bytes.push_back(static_cast<std::byte>('\\'));
            ++index;
            continue;
        }
        if (index + 3U < text.size() && is_octal(text[index + 1U]) && is_octal(text[index + 2U])
            && is_octal(text[index + 3U])) {
            const auto octet = ((text[index + 1U] - '0') << 6) | ((text[index + 2U] - '0') << 3) | (text[index + 3U] - '0');
            bytes.push_back(static_cast<std::byte>(octet & 0xFF));
            index += 3U;
            continue;
        }
        return std::nullopt;
    }
    return bytes;
}

std::optional<bool> parse_bool(std::string_view text)
{
    if (text == "t" || text == "true" || text == "TRUE" || text == "1") {
        return true;
    }
    if (text == "f" || text == "false" || text == "FALSE" || text == "0") {
        return false;
    }
    return std::nullopt;
}

std::string type_label(std::uint32_t type_oid, std::string_view type_name)
{
    if (!type_name.empty()) {
        return std::string{type_name};
    }
    const auto builtin = postgres_builtin_type_name(type_oid);
    if (!builtin.empty()) {
        return std::string{builtin};
    }
    return "oid " + std::to_string(type_oid);
}

std::optional<Value> build_array(const pgtext::ArrayNode& node, std::uint32_t element_oid)
{
    const auto nested = std::any_of(node.children.begin(), node.children.end(), [](const pgtext::ArrayNode& child) {
        return child.kind == pgtext::ArrayNodeKind::Nested;
    });
    const auto element_kind = nested ? ValueKind::Array : postgres_value_kind(element_oid);

    std::vector<Value> elements;
    elements.reserve(node.children.size());
    for (const auto& child : node.children) {
        switch (child.kind) {
        case pgtext::ArrayNodeKind::Null:
            elements.push_back(Value::null());
            break;
        case pgtext::ArrayNodeKind::Nested: {
            auto inner = build_array(child, element_oid);
            if (!inner) {
                return std::nullopt;
            }
            elements.push_back(std::move(*inner));
            break;
        }
        case pgtext::ArrayNodeKind::Scalar: {
            if (nested) {
                return std::nullopt;
            }
            auto element = decode_postgres_text(element_oid, std::string_view{child.text});
            if (element.kind() != element_kind) {
                return std::nullopt;
            }
            elements.push_back(std::move(element));
            break;
        }
        }
    }
    return Value::array(element_kind, std::move(elements));
}

Value decode_postgres_array(std::uint32_t array_oid,
                            std::uint32_t element_oid,
                            std::string_view text,
                            std::string_view type_name)
{
    const auto root = pgtext::parse_array_literal(text);
    if (!root) {
        return Value::unparsed(std::string{text}, type_label(array_oid, type_name));
    }
    auto decoded = build_array(*root, element_oid);
    if (!decoded) {
        return Value::unparsed(std::string{text}, type_label(array_oid, type_name));
    }
    return std::move(*decoded);
}

Value decode_sqlite_text(std::string_view text, SqliteHint hint)
{
    switch (hint) {
    case SqliteHint::Bool:
        if (const auto flag = parse_bool(text)) {
            return Value::boolean(*flag);
        }
        break;
    case SqliteHint::Decimal:
        if (pgtext::is_decimal_text(text)) {
            return Value::decimal(std::string{text});
        }
        break;
    case SqliteHint::Date:
        if (const auto parts = pgtext::parse_date(text)) {
            return Value::date(pgtext::to_iso8601(*parts));
        }
        break;
    case SqliteHint::Time:
        if (const auto parts = pgtext::parse_time(text)) {
            return Value::time(pgtext::to_iso8601(*parts), !parts->zone.empty());
        }
        break;
    case SqliteHint::Timestamp:
        if (const auto parts = pgtext::parse_timestamp(text)) {
            if (parts->zone.empty()) {
                return Value::timestamp(pgtext::to_iso8601(*parts));
            }
            return Value::timestamp_tz(pgtext::to_iso8601(*parts));
        }
        break;
    case SqliteHint::Uuid:
        if (auto canonical = pgtext::canonical_uuid(text)) {
            return Value::uuid(std::move(*canonical));
        }
        break;
    case SqliteHint::Json:
        return Value::json(std::string{text});
    default:
        break;
    }
    return Value::text(std::string{text});
}

Value bytes_from(std::string_view payload)
{
    std::vector<std::byte> data(payload.size());
    std::transform(payload.begin(), payload.end(), data.begin(), [](char ch) { return static_cast<std::byte>(ch); });
    return Value::bytes(std::move(data));
}

}  // namespace

ValueKind postgres_value_kind(std::uint32_t type_oid) noexcept
{
    switch (type_oid) {
    case pg_oid::kBool:
        return ValueKind::Bool;
    case pg_oid::kInt2:
    case pg_oid::kInt4:
    case pg_oid::kInt8:
    case pg_oid::kOid:
        return ValueKind::Int64;
    case pg_oid::kNumeric:
        return ValueKind::Decimal;
    case pg_oid::kFloat4:
    case pg_oid::kFloat8:
        return ValueKind::Float64;
    case pg_oid::kText:
    case pg_oid::kVarchar:
    case pg_oid::kBpchar:
    case pg_oid::kChar:
    case pg_oid::kName:
    case pg_oid::kXml:
    case pg_oid::kUnknown:
    case pg_oid::kMoney:
    case pg_oid::kInterval:
        return ValueKind::Text;
    case pg_oid::kBytea:
        return ValueKind::Bytes;
    case pg_oid::kDate:
        return ValueKind::Date;
    case pg_oid::kTime:
    case pg_oid::kTimeTz:
        return ValueKind::Time;
    case pg_oid::kTimestamp:
        return ValueKind::Timestamp;
    case pg_oid::kTimestampTz:
        return ValueKind::TimestampTz;
    case pg_oid::kUuid:
        return ValueKind::Uuid;
    case pg_oid::kJson:
    case pg_oid::kJsonb:
        return ValueKind::Json;
    default:
        return pg_oid::array_element(type_oid) ? ValueKind::Array : ValueKind::Unparsed;
    }
}

std::string_view postgres_builtin_type_name(std::uint32_t type_oid) noexcept
{
    switch (type_oid) {
    case pg_oid::kBool:
        return "bool";
    case pg_oid::kBytea:
        return "bytea";
    case pg_oid::kChar:
        return "char";
    case pg_oid::kName:
        return "name";
    case pg_oid::kInt8:
        return "int8";
    case pg_oid::kInt2:
        return "int2";
    case pg_oid::kInt4:
        return "int4";
    case pg_oid::kText:
        return "text";
    case pg_oid::kOid:
        return "oid";
    case pg_oid::kJson:
        return "json";
    case pg_oid::kXml:
        return "xml";
    case pg_oid::kFloat4:
        return "float4";
    case pg_oid::kFloat8:
        return "float8";
    case pg_oid::kUnknown:
        return "unknown";
    case pg_oid::kMoney:
        return "money";
    case pg_oid::kBpchar:
        return "bpchar";
    case pg_oid::kVarchar:
        return "varchar";
    case pg_oid::kDate:
        return "date";
    case pg_oid::kTime:
        return "time";
    case pg_oid::kTimestamp:
        return "timestamp";
    case pg_oid::kTimestampTz:
        return "timestamptz";
    case pg_oid::kInterval:
        return "interval";
    case pg_oid::kTimeTz:
        return "timetz";
    case pg_oid::kNumeric:
        return "numeric";
    case pg_oid::kUuid:
        return "uuid";
    case pg_oid::kJsonb:
        return "jsonb";
    case pg_oid::kBoolArray:
        return "_bool";
    case pg_oid::kInt2Array:
        return "_int2";
    case pg_oid::kInt4Array:
        return "_int4";
    case pg_oid::kInt8Array:
        return "_int8";
    case pg_oid::kTextArray:
        return "_text";
    case pg_oid::kVarcharArray:
        return "_varchar";
    case pg_oid::kNumericArray:
        return "_numeric";
    case pg_oid::kUuidArray:
        return "_uuid";
    case pg_oid::kJsonbArray:
        return "_jsonb";
    default:
        return {};
    }
}

Value decode_postgres_text(std::uint32_t type_oid, std::optional<std::string_view> text, std::string_view type_name)
{
    if (!text) {
        return Value::null();
    }

    const auto raw = *text;
    const auto unparsed = [&]() { return Value::unparsed(std::string{raw}, type_label(type_oid, type_name)); };

    switch (type_oid) {
    case pg_oid::kBool:
        if (const auto flag = parse_bool(raw)) {
            return Value::boolean(*flag);
        }
        return unparsed();
    case pg_oid::kInt2:
    case pg_oid::kInt4:
    case pg_oid::kInt8:
    case pg_oid::kOid:
        if (const auto number = parse_int64(raw)) {
            return Value::int64(*number);
        }
        return unparsed();
    case pg_oid::kFloat4:
    case pg_oid::kFloat8:
        if (const auto number = parse_double(raw)) {
            return Value::float64(*number);
        }
        return unparsed();
    case pg_oid::kNumeric:
        if (pgtext::is_decimal_text(raw)) {
            return Value::decimal(std::string{raw});
        }
        return unparsed();
    case pg_oid::kText:
    case pg_oid::kVarchar:
    case pg_oid::kBpchar:
    case pg_oid::kChar:
    case pg_oid::kName:
    case pg_oid::kXml:
    case pg_oid::kUnknown:
    case pg_oid::kMoney:
    case pg_oid::kInterval:
        return Value::text(std::string{raw});
    case pg_oid::kBytea:
        if (auto bytes = decode_bytea(raw)) {
            return Value::bytes(std::move(*bytes));
        }
        return unparsed();
    case pg_oid::kJson:
    case pg_oid::kJsonb:
        return Value::json(std::string{raw});
    case pg_oid::kDate:
        if (pgtext::is_infinity(raw)) {
            return Value::date(std::string{raw});
        }
        if (const auto parts = pgtext::parse_date(raw)) {
            return Value::date(pgtext::to_iso8601(*parts));
        }
        return unparsed();
    case pg_oid::kTime:
    case pg_oid::kTimeTz:
        if (const auto parts = pgtext::parse_time(raw)) {
            return Value::time(pgtext::to_iso8601(*parts), type_oid == pg_oid::kTimeTz);
        }
        return unparsed();
    case pg_oid::kTimestamp:
    case pg_oid::kTimestampTz: {
        const auto with_zone = type_oid == pg_oid::kTimestampTz;
        if (pgtext::is_infinity(raw)) {
            return with_zone ? Value::timestamp_tz(std::string{raw}) : Value::timestamp(std::string{raw});
        }
        if (const auto parts = pgtext::parse_timestamp(raw)) {
            auto iso = pgtext::to_iso8601(*parts);
            return with_zone ? Value::timestamp_tz(std::move(iso)) : Value::timestamp(std::move(iso));
        }
        return unparsed();
    }
    case pg_oid::kUuid:
        if (auto canonical = pgtext::canonical_uuid(raw)) {
            return Value::uuid(std::move(*canonical));
        }
        return unparsed();
    default:
        break;
    }

    if (const auto element_oid = pg_oid::array_element(type_oid)) {
        return decode_postgres_array(type_oid, *element_oid, raw, type_name);
    }
    return unparsed();
}

Value decode_sqlite_cell(const RawCell& cell, std::string_view declared_type)
{
    const auto hint = classify_declared_type(declared_type);

    switch (cell.storage) {
    case CellStorage::Null:
        return Value::null();
    case CellStorage::Integer:
        if (hint == SqliteHint::Bool && (cell.integer == 0 || cell.integer == 1)) {
            return Value::boolean(cell.integer == 1);
        }
        if (hint == SqliteHint::Decimal) {
            return Value::decimal(std::to_string(cell.integer));
        }
        if (hint == SqliteHint::Json) {
            return Value::json(std::to_string(cell.integer));
        }
        return Value::int64(cell.integer);
    case CellStorage::Real:
        if (hint == SqliteHint::Decimal) {
            auto digits = shortest_text(cell.real);
            if (pgtext::is_decimal_text(digits)) {
                return Value::decimal(std::move(digits));
            }
        }
        if (hint == SqliteHint::Json) {
            return Value::json(shortest_text(cell.real));
        }
        return Value::float64(cell.real);
    case CellStorage::Text:
        return decode_sqlite_text(cell.payload, hint);
    case CellStorage::Blob:
        if (hint == SqliteHint::Uuid && cell.payload.size() == 16U) {
            static constexpr char kHex[] = "0123456789abcdef";
            std::string hex;
            for (const auto ch : cell.payload) {
                const auto octet = static_cast<unsigned char>(ch);
                hex.push_back(kHex[octet >> 4U]);
                hex.push_back(kHex[octet & 0x0FU]);
            }
            if (auto canonical = pgtext::canonical_uuid(hex)) {
                return Value::uuid(std::move(*canonical));
            }
        }
        return bytes_from(cell.payload);
    }
    return Value::unparsed(std::string{cell.payload}, std::string{declared_type});
}

Value decode(const NativeType& type, const RawCell& cell)
{
    if (type.system == TypeSystem::Sqlite) {
        return decode_sqlite_cell(cell, type.name);
    }

    switch (cell.storage) {
    case CellStorage::Null:
        return Value::null();
    case CellStorage::Text:
        return decode_postgres_text(type.id, cell.payload, type.name);
    case CellStorage::Blob:
        return bytes_from(cell.payload);
    case CellStorage::Integer:
        return Value::int64(cell.integer);
    case CellStorage::Real:
        return Value::float64(cell.real);
    }
    return Value::unparsed(std::string{cell.payload}, type_label(type.id, type.name));
}

}  // namespace sextant::value
