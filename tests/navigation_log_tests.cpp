#include "sextant/tools/navigation_log_formatter.hpp"

#include "sextant/backend/backend_errors.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <string>

using sextant::navigation::EventOutcome;
using sextant::navigation::IntentKind;
using sextant::navigation::NavigationEvent;
using sextant::navigation::RequestSlot;
using sextant::navigation::ViewState;
using sextant::tools::format_navigation_event_json;
using Catch::Matchers::ContainsSubstring;

namespace {

NavigationEvent applied_event()
{
    NavigationEvent event{};
    event.correlation_id = "nav-7";
    event.intent = IntentKind::Enter;
    event.slot = RequestSlot::Navigation;
    event.sequence = 7U;
    event.from_state = ViewState::DatabaseList;
    event.to_state = ViewState::SchemaList;
    event.outcome = EventOutcome::Applied;
    event.rows = 3U;
    return event;
}

}  // namespace

TEST_CASE("Navigation log lines carry every field in order", "[tools][navigation_log]")
{
    const auto json = format_navigation_event_json(applied_event());

    CHECK_THAT(json, Catch::Matchers::StartsWith("{\"correlation_id\":\"nav-7\",\"intent\":\"enter\",\"slot\":\"navigation\","));
    CHECK_THAT(json, ContainsSubstring("\"sequence\":7,\"from\":\"databases\",\"to\":\"schemas\",\"outcome\":\"applied\""));
    CHECK_THAT(json, ContainsSubstring("\"detail\":\"\",\"error\":null,\"rows\":3,"));
    CHECK_THAT(json, Catch::Matchers::EndsWith("\"started_at\":null,\"finished_at\":null}"));
    CHECK(json.find('\n') == std::string::npos);
}

TEST_CASE("Navigation log reports errors with their category", "[tools][navigation_log]")
{
    auto event = applied_event();
    event.slot = RequestSlot::Query;
    event.intent = IntentKind::RunQuery;
    event.outcome = EventOutcome::Cancelled;
    event.error = sextant::backend::QueryErrc::Cancelled;

    const auto json = format_navigation_event_json(event);
    CHECK_THAT(json, ContainsSubstring("\"intent\":\"run_query\",\"slot\":\"query\""));
    CHECK_THAT(json, ContainsSubstring("\"outcome\":\"cancelled\""));
    CHECK_THAT(json, ContainsSubstring("\"error\":{\"category\":\"sextant.query\",\"code\":3,\"message\":\"query cancelled\"}"));
}

TEST_CASE("Navigation log escapes detail text", "[tools][navigation_log]")
{
    auto event = applied_event();
    event.detail = "no entry named \"a\\b\"\n\x01";

    const auto json = format_navigation_event_json(event);
    CHECK_THAT(json, ContainsSubstring("\"detail\":\"no entry named \\\"a\\\\b\\\"\\n\\u0001\""));
}

TEST_CASE("Navigation log timestamps are UTC with microseconds", "[tools][navigation_log]")
{
    auto event = applied_event();
    event.started_at = std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}};
    event.finished_at = event.started_at + std::chrono::milliseconds{250};
    event.duration_ms = 250.0;

    const auto json = format_navigation_event_json(event);
    CHECK_THAT(json, ContainsSubstring("\"duration_ms\":250.000000"));
    CHECK_THAT(json, ContainsSubstring("\"started_at\":\"2023-11-14T22:13:20.000000Z\""));
    CHECK_THAT(json, ContainsSubstring("\"finished_at\":\"2023-11-14T22:13:20.250000Z\""));
}
