#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sextant::value::pgtext {

enum class ArrayNodeKind : std::uint8_t {
    Null = 0,
    Scalar,
    Nested
};

struct ArrayNode final {
    ArrayNodeKind kind = ArrayNodeKind::Nested;
    std::string text{};
    std::vector<ArrayNode> children{};
};

struct TemporalParts final {
    std::string date{};
    std::string time{};
    std::string zone{};
    bool before_common_era = false;
};

// Returns the outermost array node, or nullopt when the text is not an array literal.
[[nodiscard]] std::optional<ArrayNode> parse_array_literal(std::string_view text);

[[nodiscard]] std::optional<TemporalParts> parse_timestamp(std::string_view text);
[[nodiscard]] std::optional<TemporalParts> parse_date(std::string_view text);
[[nodiscard]] std::optional<TemporalParts> parse_time(std::string_view text);

// "Z" -> "+00:00", "+05" -> "+05:00", "-0330" -> "-03:30".
[[nodiscard]] std::string normalize_zone(std::string_view zone);

// Joins parts into YYYY-MM-DDTHH:MM:SS[.ffffff][+HH:MM][ BC].
[[nodiscard]] std::string to_iso8601(const TemporalParts& parts);

[[nodiscard]] bool is_infinity(std::string_view text);
[[nodiscard]] bool is_decimal_text(std::string_view text);

// Lower-case hyphenated form, or nullopt when the text is not a UUID.
[[nodiscard]] std::optional<std::string> canonical_uuid(std::string_view text);

}  // namespace sextant::value::pgtext
