#include "sextant/tools/navigation_log_formatter.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace {

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

}  // namespace

namespace sextant::tools {

std::string format_navigation_event_json(const sextant::navigation::NavigationEvent& event)
{
    std::string json;
    json.reserve(384U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_string_field = [&](const char* name, std::string_view value) {
        append_field(name);
        append_json_string(json, value);
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    auto append_timestamp_field = [&](const char* name, std::chrono::system_clock::time_point tp) {
        const auto text = format_timestamp_iso(tp);
        append_field(name);
        if (text.empty()) {
            json.append("null");
        } else {
            append_json_string(json, text);
        }
    };

    append_string_field("correlation_id", event.correlation_id);
    append_string_field("intent", sextant::navigation::to_string(event.intent));
    append_string_field("slot", sextant::navigation::to_string(event.slot));
    append_number_field("sequence", event.sequence);
    append_string_field("from", sextant::navigation::to_string(event.from_state));
    append_string_field("to", sextant::navigation::to_string(event.to_state));
    append_string_field("outcome", sextant::navigation::to_string(event.outcome));
    append_string_field("detail", event.detail);

    append_field("error");
    if (event.error) {
        json.push_back('{');
        json.append("\"category\":");
        append_json_string(json, event.error.category().name());
        json.append(",\"code\":");
        json.append(std::to_string(event.error.value()));
        json.append(",\"message\":");
        append_json_string(json, event.error.message());
        json.push_back('}');
    } else {
        json.append("null");
    }

    append_number_field("rows", event.rows);
    append_number_field("duration_ms", event.duration_ms);
    append_timestamp_field("started_at", event.started_at);
    append_timestamp_field("finished_at", event.finished_at);

    json.push_back('}');
    return json;
}

}  // namespace sextant::tools
