#include "sextant/value/value.hpp"

#include <algorithm>
#include <utility>

namespace sextant::value {

std::string_view value_kind_name(ValueKind kind) noexcept
{
    switch (kind) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Bool:
        return "bool";
    case ValueKind::Int64:
        return "int64";
    case ValueKind::Decimal:
        return "decimal";
    case ValueKind::Float64:
        return "float64";
    case ValueKind::Text:
        return "text";
    case ValueKind::Bytes:
        return "bytes";
    case ValueKind::Date:
        return "date";
    case ValueKind::Time:
        return "time";
    case ValueKind::Timestamp:
        return "timestamp";
    case ValueKind::TimestampTz:
        return "timestamptz";
    case ValueKind::Uuid:
        return "uuid";
    case ValueKind::Json:
        return "json";
    case ValueKind::Array:
        return "array";
    case ValueKind::Unparsed:
    default:
        return "unparsed";
    }
}

std::size_t DecimalValue::scale() const noexcept
{
    const auto point = digits.find('.');
    if (point == std::string::npos) {
        return 0U;
    }
    return digits.size() - point - 1U;
}

bool ArrayValue::operator==(const ArrayValue& other) const
{
    return element_kind == other.element_kind
           && std::equal(elements.begin(), elements.end(), other.elements.begin(), other.elements.end());
}

Value::Value(Storage storage)
    : storage_{std::move(storage)}
{
}

Value Value::null()
{
    return Value{};
}

Value Value::boolean(bool flag)
{
    return Value{Storage{std::in_place_type<bool>, flag}};
}

Value Value::int64(std::int64_t number)
{
    return Value{Storage{std::in_place_type<std::int64_t>, number}};
}

Value Value::decimal(std::string digits)
{
    return Value{Storage{DecimalValue{std::move(digits)}}};
}

Value Value::float64(double number)
{
    return Value{Storage{std::in_place_type<double>, number}};
}

Value Value::text(std::string text)
{
    return Value{Storage{TextValue{std::move(text)}}};
}

Value Value::bytes(std::vector<std::byte> data)
{
    BytesValue payload{};
    payload.length = data.size();
    payload.data = std::move(data);
    return Value{Storage{std::move(payload)}};
}

Value Value::date(std::string iso)
{
    return Value{Storage{DateValue{std::move(iso)}}};
}

Value Value::time(std::string iso, bool has_timezone)
{
    return Value{Storage{TimeValue{std::move(iso), has_timezone}}};
}

Value Value::timestamp(std::string iso)
{
    return Value{Storage{TimestampValue{std::move(iso)}}};
}

Value Value::timestamp_tz(std::string iso)
{
    return Value{Storage{TimestampTzValue{std::move(iso)}}};
}

Value Value::uuid(std::string canonical)
{
    return Value{Storage{UuidValue{std::move(canonical)}}};
}

Value Value::json(std::string raw)
{
    return Value{Storage{JsonValue{std::move(raw)}}};
}

Value Value::array(ValueKind element_kind, std::vector<Value> elements)
{
    ArrayValue payload{};
    payload.element_kind = element_kind;
    payload.elements = std::move(elements);
    return Value{Storage{std::move(payload)}};
}

Value Value::unparsed(std::string raw, std::string type_name)
{
    return Value{Storage{UnparsedValue{std::move(raw), std::move(type_name)}}};
}

bool Value::has_timezone() const noexcept
{
    if (kind() == ValueKind::TimestampTz) {
        return true;
    }
    if (const auto* time_value = get_if<TimeValue>()) {
        return time_value->has_timezone;
    }
    return false;
}

}  // namespace sextant::value
