#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sextant::value {

enum class ValueKind : std::uint8_t {
    Null = 0,
    Bool,
    Int64,
    Decimal,
    Float64,
    Text,
    Bytes,
    Date,
    Time,
    Timestamp,
    TimestampTz,
    Uuid,
    Json,
    Array,
    Unparsed
};

[[nodiscard]] std::string_view value_kind_name(ValueKind kind) noexcept;

class Value;

struct NullValue final {
    bool operator==(const NullValue&) const = default;
};

// Exact decimal text as produced by the source, e.g. "-123.4567" or "NaN".
struct DecimalValue final {
    std::string digits{};

    [[nodiscard]] std::size_t scale() const noexcept;
    bool operator==(const DecimalValue&) const = default;
};

struct TextValue final {
    std::string text{};

    bool operator==(const TextValue&) const = default;
};

struct BytesValue final {
    std::vector<std::byte> data{};
    std::size_t length = 0U;

    bool operator==(const BytesValue&) const = default;
};

struct DateValue final {
    std::string iso{};

    bool operator==(const DateValue&) const = default;
};

struct TimeValue final {
    std::string iso{};
    bool has_timezone = false;

    bool operator==(const TimeValue&) const = default;
};

struct TimestampValue final {
    std::string iso{};

    bool operator==(const TimestampValue&) const = default;
};

struct TimestampTzValue final {
    std::string iso{};

    bool operator==(const TimestampTzValue&) const = default;
};

struct UuidValue final {
    std::string canonical{};

    bool operator==(const UuidValue&) const = default;
};

struct JsonValue final {
    std::string raw{};

    bool operator==(const JsonValue&) const = default;
};

struct ArrayValue final {
    ValueKind element_kind = ValueKind::Null;
    std::vector<Value> elements{};

    bool operator==(const ArrayValue& other) const;
};

// A cell whose native type is not understood; the raw text is kept for display.
struct UnparsedValue final {
    std::string raw{};
    std::string type_name{};

    bool operator==(const UnparsedValue&) const = default;
};

class Value final {
public:
    // Alternative order matches ValueKind.
    using Storage = std::variant<NullValue,
                                 bool,
                                 std::int64_t,
                                 DecimalValue,
                                 double,
                                 TextValue,
                                 BytesValue,
                                 DateValue,
                                 TimeValue,
                                 TimestampValue,
                                 TimestampTzValue,
                                 UuidValue,
                                 JsonValue,
                                 ArrayValue,
                                 UnparsedValue>;

    Value() = default;

    [[nodiscard]] static Value null();
    [[nodiscard]] static Value boolean(bool flag);
    [[nodiscard]] static Value int64(std::int64_t number);
    [[nodiscard]] static Value decimal(std::string digits);
    [[nodiscard]] static Value float64(double number);
    [[nodiscard]] static Value text(std::string text);
    [[nodiscard]] static Value bytes(std::vector<std::byte> data);
    [[nodiscard]] static Value date(std::string iso);
    [[nodiscard]] static Value time(std::string iso, bool has_timezone);
    [[nodiscard]] static Value timestamp(std::string iso);
    [[nodiscard]] static Value timestamp_tz(std::string iso);
    [[nodiscard]] static Value uuid(std::string canonical);
    [[nodiscard]] static Value json(std::string raw);
    [[nodiscard]] static Value array(ValueKind element_kind, std::vector<Value> elements);
    [[nodiscard]] static Value unparsed(std::string raw, std::string type_name);

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(storage_.index()); }
    [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::Null; }
    [[nodiscard]] bool has_timezone() const noexcept;

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept
    {
        return std::get_if<T>(&storage_);
    }

    bool operator==(const Value& other) const = default;

private:
    explicit Value(Storage storage);

    Storage storage_{};
};

static_assert(std::variant_size_v<Value::Storage> == static_cast<std::size_t>(ValueKind::Unparsed) + 1U,
              "Value storage must cover every ValueKind");

}  // namespace sextant::value
