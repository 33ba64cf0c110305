#include "sextant/value/value_format.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <type_traits>
#include <variant>

namespace sextant::value {

namespace {

std::string format_double(double number)
{
    std::array<char, 64> buffer{};
    const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number);
    if (ec != std::errc{}) {
        return "NaN";
    }
    return std::string{buffer.data(), ptr};
}

std::string bounded(std::string text, std::size_t max_length)
{
    if (max_length == 0U || text.size() <= max_length) {
        return text;
    }
    text.resize(max_length);
    text += "...";
    return text;
}

std::string format_bytes(const BytesValue& bytes, const FormatOptions& options)
{
    if (options.bytes_style == BytesStyle::Hex) {
        return format_hex(bytes);
    }

    const auto summary = "<" + std::to_string(bytes.length) + " bytes>";
    if (options.bytes_preview == 0U || bytes.data.empty()) {
        return summary;
    }
    auto preview = format_hex(bytes, options.bytes_preview);
    if (bytes.data.size() > options.bytes_preview) {
        preview += "...";
    }
    return preview + " " + summary;
}

}  // namespace

std::string format_hex(const BytesValue& bytes, std::size_t limit)
{
    static constexpr char kHex[] = "0123456789abcdef";
    const auto count = limit == 0U ? bytes.data.size() : std::min(limit, bytes.data.size());

    std::string text{"\\x"};
    text.reserve(2U + count * 2U);
    for (std::size_t index = 0U; index < count; ++index) {
        const auto octet = std::to_integer<unsigned>(bytes.data[index]);
        text.push_back(kHex[(octet >> 4U) & 0x0FU]);
        text.push_back(kHex[octet & 0x0FU]);
    }
    return text;
}

std::string format_value(const Value& value, const FormatOptions& options)
{
    return std::visit(
        [&options](const auto& payload) -> std::string {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, NullValue>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                return payload ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::to_string(payload);
            } else if constexpr (std::is_same_v<T, DecimalValue>) {
                return payload.digits;
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(payload);
            } else if constexpr (std::is_same_v<T, TextValue>) {
                return bounded(payload.text, options.max_text_length);
            } else if constexpr (std::is_same_v<T, BytesValue>) {
                return format_bytes(payload, options);
            } else if constexpr (std::is_same_v<T, DateValue> || std::is_same_v<T, TimeValue>
                                 || std::is_same_v<T, TimestampValue> || std::is_same_v<T, TimestampTzValue>) {
                return payload.iso;
            } else if constexpr (std::is_same_v<T, UuidValue>) {
                return payload.canonical;
            } else if constexpr (std::is_same_v<T, JsonValue>) {
                return bounded(payload.raw, options.max_text_length);
            } else if constexpr (std::is_same_v<T, ArrayValue>) {
                std::string text{"["};
                for (std::size_t index = 0U; index < payload.elements.size(); ++index) {
                    if (index != 0U) {
                        text += ", ";
                    }
                    text += format_value(payload.elements[index], options);
                }
                text += ']';
                return text;
            } else {
                return bounded(payload.raw, options.max_text_length);
            }
        },
        value.storage());
}

}  // namespace sextant::value
