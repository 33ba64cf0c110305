#include "sextant/value/pg_text_parser.hpp"

#include "sextant/value/pg_text_grammar.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sextant::value::pgtext {

namespace {

struct ArrayParseState final {
    std::vector<ArrayNode> stack{};
    std::optional<ArrayNode> root{};
};

std::string_view trim_trailing(std::string_view text)
{
    const auto last = text.find_last_not_of(" \t\r\n");
    if (last == std::string_view::npos) {
        return {};
    }
    return text.substr(0U, last + 1U);
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0U; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::tolower(left) != std::tolower(right)) {
            return false;
        }
    }
    return true;
}

void attach_child(ArrayParseState& state, ArrayNode node)
{
    if (!state.stack.empty()) {
        state.stack.back().children.push_back(std::move(node));
    }
}

template <typename Rule>
struct array_action {
    template <typename Input>
    static void apply(const Input&, ArrayParseState&)
    {
    }
};

template <>
struct array_action<array_open> {
    template <typename Input>
    static void apply(const Input&, ArrayParseState& state)
    {
        state.stack.push_back(ArrayNode{ArrayNodeKind::Nested, {}, {}});
    }
};

template <>
struct array_action<array_close> {
    template <typename Input>
    static void apply(const Input&, ArrayParseState& state)
    {
        if (state.stack.empty()) {
            return;
        }
        auto node = std::move(state.stack.back());
        state.stack.pop_back();
        if (state.stack.empty()) {
            state.root = std::move(node);
        } else {
            attach_child(state, std::move(node));
        }
    }
};

template <>
struct array_action<quoted_body> {
    template <typename Input>
    static void apply(const Input& in, ArrayParseState& state)
    {
        const auto raw = in.string();
        std::string text;
        text.reserve(raw.size());
        for (std::size_t index = 0U; index < raw.size(); ++index) {
            if (raw[index] == '\\' && index + 1U < raw.size()) {
                ++index;
            }
            text.push_back(raw[index]);
        }
        attach_child(state, ArrayNode{ArrayNodeKind::Scalar, std::move(text), {}});
    }
};

template <>
struct array_action<unquoted_element> {
    template <typename Input>
    static void apply(const Input& in, ArrayParseState& state)
    {
        const auto text = trim_trailing(in.string_view());
        if (iequals(text, "NULL")) {
            attach_child(state, ArrayNode{ArrayNodeKind::Null, {}, {}});
            return;
        }
        attach_child(state, ArrayNode{ArrayNodeKind::Scalar, std::string{text}, {}});
    }
};

template <typename Rule>
struct temporal_action {
    template <typename Input>
    static void apply(const Input&, TemporalParts&)
    {
    }
};

template <>
struct temporal_action<date_part> {
    template <typename Input>
    static void apply(const Input& in, TemporalParts& parts)
    {
        parts.date = in.string();
    }
};

template <>
struct temporal_action<time_part> {
    template <typename Input>
    static void apply(const Input& in, TemporalParts& parts)
    {
        parts.time = in.string();
    }
};

template <>
struct temporal_action<zone> {
    template <typename Input>
    static void apply(const Input& in, TemporalParts& parts)
    {
        parts.zone = in.string();
    }
};

template <>
struct temporal_action<era_bc> {
    template <typename Input>
    static void apply(const Input&, TemporalParts& parts)
    {
        parts.before_common_era = true;
    }
};

template <typename Grammar, template <typename> class Action, typename State>
bool parse_with(std::string_view text, const char* source, State& state)
{
    pegtl::memory_input in(text, source);
    try {
        return pegtl::parse<Grammar, Action>(in, state);
    } catch (const pegtl::parse_error&) {
        return false;
    }
}

template <typename Grammar>
bool matches(std::string_view text, const char* source)
{
    pegtl::memory_input in(text, source);
    try {
        return pegtl::parse<Grammar>(in);
    } catch (const pegtl::parse_error&) {
        return false;
    }
}

template <typename Grammar>
std::optional<TemporalParts> parse_temporal(std::string_view text, const char* source)
{
    TemporalParts parts{};
    if (!parse_with<Grammar, temporal_action>(text, source, parts)) {
        return std::nullopt;
    }
    return parts;
}

}  // namespace

std::optional<ArrayNode> parse_array_literal(std::string_view text)
{
    ArrayParseState state{};
    if (!parse_with<array_grammar, array_action>(text, "pg_array", state) || !state.root) {
        return std::nullopt;
    }
    return std::move(state.root);
}

std::optional<TemporalParts> parse_timestamp(std::string_view text)
{
    return parse_temporal<timestamp_grammar>(text, "pg_timestamp");
}

std::optional<TemporalParts> parse_date(std::string_view text)
{
    return parse_temporal<date_grammar>(text, "pg_date");
}

std::optional<TemporalParts> parse_time(std::string_view text)
{
    return parse_temporal<time_grammar>(text, "pg_time");
}

std::string normalize_zone(std::string_view zone)
{
    if (zone.empty()) {
        return {};
    }
    if (zone == "Z" || zone == "z") {
        return "+00:00";
    }

    std::string digits;
    for (const auto ch : zone.substr(1U)) {
        if (ch != ':') {
            digits.push_back(ch);
        }
    }

    std::string normalized{zone.front()};
    normalized += digits.substr(0U, 2U);
    normalized += ':';
    normalized += digits.size() >= 4U ? digits.substr(2U, 2U) : std::string{"00"};
    if (digits.size() >= 6U) {
        normalized += ':';
        normalized += digits.substr(4U, 2U);
    }
    return normalized;
}

std::string to_iso8601(const TemporalParts& parts)
{
    std::string iso = parts.date;
    if (!parts.time.empty()) {
        if (!iso.empty()) {
            iso += 'T';
        }
        iso += parts.time;
        // HH:MM carries no seconds field
        if (parts.time.size() == 5U) {
            iso += ":00";
        }
    }
    iso += normalize_zone(parts.zone);
    if (parts.before_common_era) {
        iso += " BC";
    }
    return iso;
}

bool is_infinity(std::string_view text)
{
    return matches<infinity_grammar>(text, "pg_infinity");
}

bool is_decimal_text(std::string_view text)
{
    return matches<decimal_grammar>(text, "pg_numeric");
}

std::optional<std::string> canonical_uuid(std::string_view text)
{
    if (!matches<uuid_grammar>(text, "pg_uuid")) {
        return std::nullopt;
    }

    std::string hex;
    hex.reserve(32U);
    for (const auto ch : text) {
        if (std::isxdigit(static_cast<unsigned char>(ch)) != 0) {
            hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    if (hex.size() != 32U) {
        return std::nullopt;
    }

    std::string canonical;
    canonical.reserve(36U);
    for (std::size_t index = 0U; index < hex.size(); ++index) {
        if (index == 8U || index == 12U || index == 16U || index == 20U) {
            canonical.push_back('-');
        }
        canonical.push_back(hex[index]);
    }
    return canonical;
}

}  // namespace sextant::value::pgtext
