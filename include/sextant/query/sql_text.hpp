#pragma once

#include <string>
#include <string_view>

namespace sextant::query {

[[nodiscard]] std::string trim(std::string_view text);

// True when the text holds something other than whitespace and comments.
[[nodiscard]] bool has_executable_text(std::string_view text);

// True once the text ends with a statement terminator outside quotes,
// comments and parentheses (trailing whitespace and comments allowed).
[[nodiscard]] bool statement_complete(std::string_view text);

}  // namespace sextant::query
