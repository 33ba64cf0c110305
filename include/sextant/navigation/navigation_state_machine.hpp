#pragma once

#include "sextant/backend/backend.hpp"
#include "sextant/credential/credential_resolver.hpp"
#include "sextant/navigation/list_view.hpp"
#include "sextant/navigation/navigation_telemetry.hpp"
#include "sextant/navigation/navigation_types.hpp"
#include "sextant/navigation/task_runner.hpp"
#include "sextant/query/query_executor.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sextant::navigation {

// Owns the session and every piece of visible state. dispatch, pump and
// snapshot belong to the interactive loop; backend work runs on the task
// runner and comes back through a mailbox that pump drains.
class NavigationStateMachine final {
public:
    struct Config final {
        std::size_t batch_size = 256U;
        std::size_t max_result_rows = 10'000U;
        std::size_t browse_row_limit = backend::kDefaultBrowseLimit;
        backend::ConnectOptions connect_options{};
        // Borrowed when set; otherwise a pool is created from task_runner_config.
        TaskRunner* task_runner = nullptr;
        TaskRunnerConfig task_runner_config{};
        backend::BackendFactory backend_factory{};
        std::function<void(const NavigationEvent&)> event_logger{};
    };

    // The resolver, when given, must outlive the state machine.
    NavigationStateMachine(std::vector<backend::ConnectionProfile> profiles,
                           credential::CredentialResolver* resolver,
                           Config config);
    ~NavigationStateMachine();

    NavigationStateMachine(const NavigationStateMachine&) = delete;
    NavigationStateMachine& operator=(const NavigationStateMachine&) = delete;

    void dispatch(const Intent& intent);

    // Applies every completion that has arrived; returns how many were taken.
    std::size_t pump();

    // Pumps until nothing is in flight or the timeout passes.
    [[nodiscard]] bool wait_until_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] NavigationSnapshot snapshot() const;
    [[nodiscard]] NavigationTelemetrySnapshot telemetry() const noexcept { return telemetry_.snapshot(); }

    [[nodiscard]] bool connected() const noexcept { return session_ != nullptr; }
    [[nodiscard]] const backend::ConnectionProfile* active_profile() const noexcept;
    [[nodiscard]] ViewState state() const noexcept;
    [[nodiscard]] bool loading() const noexcept;
    [[nodiscard]] std::size_t in_flight() const noexcept { return outstanding_; }

    // Replaces the connection list. Ignored while connected.
    void set_profiles(std::vector<backend::ConnectionProfile> profiles);

    struct Completion;
    class Mailbox;

private:
    enum class RequestKind : std::uint8_t {
        Connect = 0,
        ListDatabases,
        ListSchemas,
        ListTables,
        ListColumns,
        BrowseRows,
        RunQuery,
        Close
    };

    struct Frame final {
        ViewState state = ViewState::ConnectionList;
        std::string label{};
        std::optional<backend::DatabaseRef> database{};
        std::optional<backend::SchemaRef> schema{};
        std::optional<backend::TableRef> table{};
        std::string sql{};
        ListView list{};
    };

    struct PendingRequest final {
        RequestKind kind = RequestKind::Connect;
        RequestSlot slot = RequestSlot::Navigation;
        std::size_t profile_index = 0U;
        IntentKind intent = IntentKind::Enter;
        backend::CancellationSource cancellation{};
        // Replaces the current frame's contents instead of pushing target.
        bool refresh = false;
        // Cancelled because a newer request was issued.
        bool superseded = false;
        Frame target{};
        std::string cache_key{};
        std::string correlation_id{};
        ViewState from_state = ViewState::ConnectionList;
        std::chrono::system_clock::time_point started_at{};
        std::chrono::steady_clock::time_point started{};
        std::shared_ptr<std::atomic<std::uint64_t>> progress{};
    };

    struct CacheEntry final {
        std::shared_ptr<const value::QueryResult> result{};
        std::vector<std::size_t> key_columns{};
    };

    [[nodiscard]] Frame& current() noexcept { return frames_.back(); }
    [[nodiscard]] const Frame& current() const noexcept { return frames_.back(); }

    void handle_enter(const Intent& intent);
    void handle_back(const Intent& intent);
    void handle_refresh(const Intent& intent);
    void handle_run_query(const Intent& intent);
    void handle_cancel(const Intent& intent);
    void handle_open_editor(const Intent& intent);
    void handle_disconnect(const Intent& intent);

    void connect(const Intent& intent, std::size_t profile_index);
    void open_child(const Intent& intent, Frame child, RequestKind kind);
    void issue(const Intent& intent, PendingRequest request);
    [[nodiscard]] TaskRunner::Task make_task(std::uint64_t sequence, const PendingRequest& request) const;

    void apply(Completion completion);
    void apply_success(PendingRequest& request, Completion& completion);

    // Returns the number of requests that were cancelled.
    std::size_t cancel_in_flight();
    void close_session();
    void post_close(std::shared_ptr<backend::Session> session);
    void reset_to_connection_list();
    void rebuild_connection_list();
    void push(Frame frame);
    void pop();

    void preselect_default_schema(Frame& frame) const;
    void raise(const backend::BackendError& error);
    void record(const Intent& intent, EventOutcome outcome, std::string detail = {});
    void record(NavigationEvent event) const;

    [[nodiscard]] static std::string path_key(const Frame& frame);

    std::vector<backend::ConnectionProfile> profiles_{};
    credential::CredentialResolver* resolver_ = nullptr;
    Config config_{};

    std::unique_ptr<TaskRunner> owned_runner_{};
    TaskRunner* runner_ = nullptr;
    std::shared_ptr<Mailbox> mailbox_{};

    std::vector<Frame> frames_{};
    std::optional<ErrorBanner> error_{};
    std::optional<std::size_t> active_profile_{};
    std::shared_ptr<backend::Session> session_{};
    std::shared_ptr<query::QueryExecutor> executor_{};
    std::map<std::string, CacheEntry> cache_{};
    std::string editor_text_{};

    std::uint64_t next_sequence_ = 1U;
    std::array<std::optional<std::uint64_t>, static_cast<std::size_t>(RequestSlot::Count)> active_{};
    std::map<std::uint64_t, PendingRequest> pending_{};
    std::size_t outstanding_ = 0U;
    std::uint64_t next_intent_ = 1U;

    NavigationTelemetry telemetry_{};
};

}  // namespace sextant::navigation
