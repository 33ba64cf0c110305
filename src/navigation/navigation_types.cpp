#include "sextant/navigation/navigation_types.hpp"

#include <utility>

namespace sextant::navigation {

std::string_view to_string(ViewState state) noexcept
{
    switch (state) {
    case ViewState::ConnectionList:
        return "connections";
    case ViewState::DatabaseList:
        return "databases";
    case ViewState::SchemaList:
        return "schemas";
    case ViewState::TableList:
        return "tables";
    case ViewState::ColumnList:
        return "columns";
    case ViewState::RowBrowser:
        return "rows";
    case ViewState::QueryEditor:
        return "editor";
    case ViewState::ResultView:
        return "result";
    default:
        return "unknown";
    }
}

std::string_view to_string(RequestSlot slot) noexcept
{
    switch (slot) {
    case RequestSlot::Navigation:
        return "navigation";
    case RequestSlot::Query:
        return "query";
    default:
        return "unknown";
    }
}

std::string_view to_string(IntentKind kind) noexcept
{
    switch (kind) {
    case IntentKind::Enter:
        return "enter";
    case IntentKind::Back:
        return "back";
    case IntentKind::Refresh:
        return "refresh";
    case IntentKind::RunQuery:
        return "run_query";
    case IntentKind::Cancel:
        return "cancel";
    case IntentKind::OpenQueryEditor:
        return "open_query_editor";
    case IntentKind::Select:
        return "select";
    case IntentKind::MoveSelection:
        return "move_selection";
    case IntentKind::Filter:
        return "filter";
    case IntentKind::DismissError:
        return "dismiss_error";
    case IntentKind::Disconnect:
        return "disconnect";
    default:
        return "unknown";
    }
}

std::string_view to_string(EventOutcome outcome) noexcept
{
    switch (outcome) {
    case EventOutcome::Applied:
        return "applied";
    case EventOutcome::CacheHit:
        return "cache_hit";
    case EventOutcome::Stale:
        return "stale";
    case EventOutcome::Cancelled:
        return "cancelled";
    case EventOutcome::Failed:
        return "failed";
    case EventOutcome::Rejected:
        return "rejected";
    default:
        return "unknown";
    }
}

Intent Intent::enter()
{
    return Intent{IntentKind::Enter};
}

Intent Intent::enter(std::size_t index)
{
    Intent intent{IntentKind::Enter};
    intent.index = index;
    return intent;
}

Intent Intent::enter_named(std::string name)
{
    Intent intent{IntentKind::Enter};
    intent.text = std::move(name);
    return intent;
}

Intent Intent::back()
{
    return Intent{IntentKind::Back};
}

Intent Intent::refresh()
{
    return Intent{IntentKind::Refresh};
}

Intent Intent::run_query(std::string sql)
{
    Intent intent{IntentKind::RunQuery};
    intent.text = std::move(sql);
    return intent;
}

Intent Intent::cancel()
{
    return Intent{IntentKind::Cancel};
}

Intent Intent::open_query_editor()
{
    return Intent{IntentKind::OpenQueryEditor};
}

Intent Intent::select(std::size_t index)
{
    Intent intent{IntentKind::Select};
    intent.index = index;
    return intent;
}

Intent Intent::move_selection(std::int64_t delta)
{
    Intent intent{IntentKind::MoveSelection};
    intent.delta = delta;
    return intent;
}

Intent Intent::filter(std::string text)
{
    Intent intent{IntentKind::Filter};
    intent.text = std::move(text);
    return intent;
}

Intent Intent::dismiss_error()
{
    return Intent{IntentKind::DismissError};
}

Intent Intent::disconnect()
{
    return Intent{IntentKind::Disconnect};
}

}  // namespace sextant::navigation
