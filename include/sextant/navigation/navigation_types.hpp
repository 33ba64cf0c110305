#pragma once

#include "sextant/value/query_result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sextant::navigation {

enum class ViewState : std::uint8_t {
    ConnectionList = 0,
    DatabaseList,
    SchemaList,
    TableList,
    ColumnList,
    RowBrowser,
    QueryEditor,
    ResultView
};

// Requests in different slots never supersede each other.
enum class RequestSlot : std::uint8_t {
    Navigation = 0,
    Query,
    Count
};

enum class IntentKind : std::uint8_t {
    Enter = 0,
    Back,
    Refresh,
    RunQuery,
    Cancel,
    OpenQueryEditor,
    Select,
    MoveSelection,
    Filter,
    DismissError,
    Disconnect
};

[[nodiscard]] std::string_view to_string(ViewState state) noexcept;
[[nodiscard]] std::string_view to_string(RequestSlot slot) noexcept;
[[nodiscard]] std::string_view to_string(IntentKind kind) noexcept;

struct Intent final {
    IntentKind kind = IntentKind::Enter;
    // Position in the visible list; Enter without one uses the selection.
    std::optional<std::size_t> index{};
    std::string text{};
    std::int64_t delta = 0;

    [[nodiscard]] static Intent enter();
    [[nodiscard]] static Intent enter(std::size_t index);
    // Enters the visible entry whose key column equals the name.
    [[nodiscard]] static Intent enter_named(std::string name);
    [[nodiscard]] static Intent back();
    [[nodiscard]] static Intent refresh();
    [[nodiscard]] static Intent run_query(std::string sql);
    [[nodiscard]] static Intent cancel();
    [[nodiscard]] static Intent open_query_editor();
    [[nodiscard]] static Intent select(std::size_t index);
    [[nodiscard]] static Intent move_selection(std::int64_t delta);
    [[nodiscard]] static Intent filter(std::string text);
    [[nodiscard]] static Intent dismiss_error();
    [[nodiscard]] static Intent disconnect();
};

struct ErrorBanner final {
    std::error_code code{};
    std::string message{};
    std::string sqlstate{};
    ViewState state = ViewState::ConnectionList;
};

// Read-only view of the state machine handed to the renderer.
struct NavigationSnapshot final {
    ViewState state = ViewState::ConnectionList;
    bool loading = false;
    std::optional<RequestSlot> loading_slot{};
    std::uint64_t rows_received = 0U;
    std::optional<ErrorBanner> error{};
    std::vector<std::string> breadcrumb{};
    std::string environment_label{};
    std::string editor_text{};

    std::shared_ptr<const value::QueryResult> contents{};
    // Row indices into contents that pass the filter, in display order.
    std::vector<std::size_t> visible_rows{};
    // Position within visible_rows.
    std::optional<std::size_t> selection{};
    std::string filter{};
};

enum class EventOutcome : std::uint8_t {
    Applied = 0,
    CacheHit,
    Stale,
    Cancelled,
    Failed,
    Rejected
};

[[nodiscard]] std::string_view to_string(EventOutcome outcome) noexcept;

// One record per handled intent or completed request.
struct NavigationEvent final {
    std::string correlation_id{};
    IntentKind intent = IntentKind::Enter;
    RequestSlot slot = RequestSlot::Navigation;
    std::uint64_t sequence = 0U;
    ViewState from_state = ViewState::ConnectionList;
    ViewState to_state = ViewState::ConnectionList;
    EventOutcome outcome = EventOutcome::Applied;
    std::string detail{};
    std::error_code error{};
    std::uint64_t rows = 0U;
    double duration_ms = 0.0;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

}  // namespace sextant::navigation
