#pragma once

#include "sextant/value/value.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace sextant::value {

enum class BytesStyle : std::uint8_t {
    Summary = 0,
    Hex
};

struct FormatOptions final {
    BytesStyle bytes_style = BytesStyle::Summary;
    std::size_t bytes_preview = 0U;
    std::size_t max_text_length = 0U;
};

// Display form of a value. Null renders as NULL, decimals keep their exact
// digits, arrays render as [a, b]. Summary bytes render as <N bytes>, with an
// optional hex preview of the first bytes_preview bytes.
[[nodiscard]] std::string format_value(const Value& value, const FormatOptions& options = {});

[[nodiscard]] std::string format_hex(const BytesValue& bytes, std::size_t limit = 0U);

}  // namespace sextant::value
