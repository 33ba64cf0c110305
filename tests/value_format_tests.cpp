#include "sextant/value/value_format.hpp"

#include <cstddef>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using sextant::value::BytesStyle;
using sextant::value::FormatOptions;
using sextant::value::Value;
using sextant::value::ValueKind;
using sextant::value::format_value;

namespace {

Value sample_bytes(std::size_t count)
{
    std::vector<std::byte> data;
    for (std::size_t index = 0U; index < count; ++index) {
        data.push_back(static_cast<std::byte>(index + 1U));
    }
    return Value::bytes(std::move(data));
}

}  // namespace

TEST_CASE("Scalars render in their display form", "[value][format]")
{
    CHECK(format_value(Value::null()) == "NULL");
    CHECK(format_value(Value::boolean(true)) == "true");
    CHECK(format_value(Value::int64(-42)) == "-42");
    CHECK(format_value(Value::float64(0.1)) == "0.1");
    CHECK(format_value(Value::decimal("150.00")) == "150.00");
    CHECK(format_value(Value::uuid("a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11")) == "a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11");
    CHECK(format_value(Value::timestamp_tz("2024-01-15T10:30:00+00:00")) == "2024-01-15T10:30:00+00:00");
}

TEST_CASE("Bytes render as a summary unless hex is requested", "[value][format]")
{
    const auto bytes = sample_bytes(4U);
    CHECK(format_value(bytes) == "<4 bytes>");

    FormatOptions preview{};
    preview.bytes_preview = 2U;
    CHECK(format_value(bytes, preview) == "\\x0102... <4 bytes>");

    FormatOptions hex{};
    hex.bytes_style = BytesStyle::Hex;
    CHECK(format_value(bytes, hex) == "\\x01020304");

    CHECK(format_value(Value::bytes({})) == "<0 bytes>");
}

TEST_CASE("Long text is bounded when a limit is set", "[value][format]")
{
    FormatOptions options{};
    options.max_text_length = 5U;
    CHECK(format_value(Value::text("abcdefgh"), options) == "abcde...");
    CHECK(format_value(Value::text("abc"), options) == "abc");
    CHECK(format_value(Value::text("abcdefgh")) == "abcdefgh");
    CHECK(format_value(Value::json("{\"key\":1}"), options) == "{\"key...");
}

TEST_CASE("Arrays and unparsed values render readably", "[value][format]")
{
    const auto array = Value::array(ValueKind::Int64, {Value::int64(1), Value::null(), Value::int64(3)});
    CHECK(format_value(array) == "[1, NULL, 3]");
    CHECK(format_value(Value::array(ValueKind::Text, {})) == "[]");
    CHECK(format_value(Value::unparsed("(1,2)", "point")) == "(1,2)");
}

TEST_CASE("format_hex honours the byte limit", "[value][format]")
{
    const auto bytes = sample_bytes(3U);
    const auto* payload = bytes.get_if<sextant::value::BytesValue>();
    REQUIRE(payload != nullptr);
    CHECK(sextant::value::format_hex(*payload) == "\\x010203");
    CHECK(sextant::value::format_hex(*payload, 1U) == "\\x01");
}

TEST_CASE("Value kinds have stable names", "[value][format]")
{
    using sextant::value::value_kind_name;

    CHECK(value_kind_name(Value::null().kind()) == "null");
    CHECK(value_kind_name(Value::decimal("12.50").kind()) == "decimal");
    CHECK(value_kind_name(sample_bytes(2U).kind()) == "bytes");
    CHECK(value_kind_name(ValueKind::TimestampTz) == "timestamptz");
    CHECK(value_kind_name(ValueKind::Unparsed) == "unparsed");
}
