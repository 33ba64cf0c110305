#include "sextant/navigation/navigation_state_machine.hpp"

#include "sextant/navigation/catalog_listing.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace sextant::navigation {

struct NavigationStateMachine::Completion final {
    std::uint64_t sequence = 0U;
    RequestKind kind = RequestKind::Connect;
    backend::BackendError error{};
    std::unique_ptr<backend::Session> session{};
    std::shared_ptr<const value::QueryResult> result{};
    std::vector<std::size_t> key_columns{};
    std::uint64_t rows = 0U;
    std::string detail{};
};

class NavigationStateMachine::Mailbox final {
public:
    void post(Completion completion)
    {
        {
            std::scoped_lock lock(mutex_);
            queue_.push_back(std::move(completion));
        }
        cv_.notify_all();
    }

    [[nodiscard]] std::deque<Completion> take()
    {
        std::scoped_lock lock(mutex_);
        return std::exchange(queue_, {});
    }

    // False when the deadline passed with nothing posted.
    [[nodiscard]] bool wait_until(std::chrono::steady_clock::time_point deadline)
    {
        std::unique_lock lock(mutex_);
        return cv_.wait_until(lock, deadline, [this]() { return !queue_.empty(); });
    }

    void wait()
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty(); });
    }

private:
    std::mutex mutex_{};
    std::condition_variable cv_{};
    std::deque<Completion> queue_{};
};

namespace {

constexpr char kPathRoot = '\x1e';
constexpr char kPathSeparator = '\x1f';

double elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

std::string cell_text(const value::Row& row, std::size_t column)
{
    if (column >= row.size()) {
        return {};
    }
    if (const auto* text = row[column].get_if<value::TextValue>()) {
        return text->text;
    }
    return {};
}

// Resolves the secret, opens the session and applies the credential policy.
// The resolver and the backend never run at the same time for one profile.
backend::BackendError open_session(const backend::ConnectionProfile& profile,
                                   const backend::BackendFactory& factory,
                                   credential::CredentialResolver* resolver,
                                   const backend::ConnectOptions& options,
                                   const backend::CancellationToken& token,
                                   std::unique_ptr<backend::Session>& session,
                                   std::string& detail)
{
    auto driver = factory ? factory(profile.backend_kind) : backend::make_backend(profile.backend_kind);
    if (!driver) {
        return backend::make_backend_error(backend::ConnectionErrc::Unsupported,
                                           "no backend for " + std::string{backend::to_string(profile.backend_kind)});
    }

    const bool uses_secret = driver->requires_secret() && resolver != nullptr;
    credential::CredentialResolution resolution{};
    backend::Credentials credentials{profile.username, {}};
    if (uses_secret) {
        resolution = resolver->resolve(profile);
        if (!resolution.resolved()) {
            return backend::make_backend_error(resolution.error, "password entry cancelled");
        }
        credentials = resolution.credentials;
        if (resolution.store_unavailable) {
            detail = "credential store unavailable";
        }
    }

    if (token.is_cancelled()) {
        return backend::make_backend_error(backend::QueryErrc::Cancelled, "connect cancelled");
    }

    auto error = driver->connect(profile, credentials, options, token, session);
    if (error) {
        if (uses_secret
            && resolver->on_connect_failed(profile, resolution, error) == credential::CredentialErrc::InvalidCredential) {
            error.message = "invalid credentials: " + error.message;
        }
        return error;
    }

    if (uses_secret) {
        if (auto store_error = resolver->on_connect_succeeded(profile, resolution)) {
            detail = "password not saved: " + store_error.message();
        }
    }
    return {};
}

template <typename Entry, typename Fetch, typename Render>
backend::BackendError load_listing(Fetch&& fetch, Render&& render, std::shared_ptr<const value::QueryResult>& out)
{
    std::vector<Entry> entries;
    if (auto error = fetch(entries)) {
        return error;
    }

    value::QueryResult listing;
    if (auto error = render(entries, listing)) {
        return backend::make_backend_error(error, "catalog listing could not be built");
    }
    out = std::make_shared<const value::QueryResult>(std::move(listing));
    return {};
}

}  // namespace

NavigationStateMachine::NavigationStateMachine(std::vector<backend::ConnectionProfile> profiles,
                                               credential::CredentialResolver* resolver,
                                               Config config)
    : profiles_{std::move(profiles)}
    , resolver_{resolver}
    , config_{std::move(config)}
    , mailbox_{std::make_shared<Mailbox>()}
{
    if (config_.task_runner != nullptr) {
        runner_ = config_.task_runner;
    } else {
        owned_runner_ = create_thread_pool_task_runner(config_.task_runner_config);
        runner_ = owned_runner_.get();
    }

    Frame root{};
    root.state = ViewState::ConnectionList;
    frames_.push_back(std::move(root));
    rebuild_connection_list();
}

NavigationStateMachine::~NavigationStateMachine()
{
    cancel_in_flight();
    if (session_) {
        session_->cancel_all();
    }

    // Every posted task reports back exactly once; wait for all of them.
    while (outstanding_ > 0U) {
        mailbox_->wait();
        for (auto& completion : mailbox_->take()) {
            --outstanding_;
            if (completion.session) {
                completion.session->close();
            }
        }
    }

    if (session_) {
        session_->close();
    }
    if (owned_runner_) {
        owned_runner_->shutdown();
    }
}

void NavigationStateMachine::dispatch(const Intent& intent)
{
    telemetry_.record_intent();

    switch (intent.kind) {
    case IntentKind::Enter:
        handle_enter(intent);
        break;
    case IntentKind::Back:
        handle_back(intent);
        break;
    case IntentKind::Refresh:
        handle_refresh(intent);
        break;
    case IntentKind::RunQuery:
        handle_run_query(intent);
        break;
    case IntentKind::Cancel:
        handle_cancel(intent);
        break;
    case IntentKind::OpenQueryEditor:
        handle_open_editor(intent);
        break;
    case IntentKind::Disconnect:
        handle_disconnect(intent);
        break;
    case IntentKind::Select:
        if (intent.index && current().list.select(*intent.index)) {
            record(intent, EventOutcome::Applied);
        } else {
            record(intent, EventOutcome::Rejected, "no such entry");
        }
        break;
    case IntentKind::MoveSelection:
        current().list.move_selection(intent.delta);
        record(intent, EventOutcome::Applied);
        break;
    case IntentKind::Filter:
        current().list.set_filter(intent.text);
        record(intent, EventOutcome::Applied, intent.text);
        break;
    case IntentKind::DismissError:
        error_.reset();
        record(intent, EventOutcome::Applied);
        break;
    default:
        record(intent, EventOutcome::Rejected, "unknown intent");
        break;
    }
}

std::size_t NavigationStateMachine::pump()
{
    auto completions = mailbox_->take();
    const auto taken = completions.size();
    for (auto& completion : completions) {
        apply(std::move(completion));
    }
    return taken;
}

bool NavigationStateMachine::wait_until_idle(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        pump();
        if (outstanding_ == 0U) {
            return true;
        }
        if (!mailbox_->wait_until(deadline)) {
            pump();
            return outstanding_ == 0U;
        }
    }
}

NavigationSnapshot NavigationStateMachine::snapshot() const
{
    NavigationSnapshot snapshot{};
    const auto& frame = current();
    snapshot.state = frame.state;
    snapshot.error = error_;
    snapshot.editor_text = editor_text_;

    for (std::size_t slot = 0; slot < active_.size(); ++slot) {
        if (!active_[slot]) {
            continue;
        }
        snapshot.loading = true;
        if (!snapshot.loading_slot) {
            snapshot.loading_slot = static_cast<RequestSlot>(slot);
        }
        const auto found = pending_.find(*active_[slot]);
        if (found != pending_.end() && found->second.progress) {
            snapshot.rows_received = found->second.progress->load(std::memory_order_relaxed);
        }
    }

    for (std::size_t index = 1; index < frames_.size(); ++index) {
        snapshot.breadcrumb.push_back(frames_[index].label);
    }
    if (const auto* profile = active_profile()) {
        snapshot.environment_label = std::string{backend::to_string(profile->environment)};
    }

    snapshot.contents = frame.list.source();
    snapshot.visible_rows = frame.list.visible_rows();
    snapshot.selection = frame.list.selection();
    snapshot.filter = frame.list.filter();
    return snapshot;
}

const backend::ConnectionProfile* NavigationStateMachine::active_profile() const noexcept
{
    if (!active_profile_ || *active_profile_ >= profiles_.size()) {
        return nullptr;
    }
    return &profiles_[*active_profile_];
}

ViewState NavigationStateMachine::state() const noexcept
{
    return current().state;
}

bool NavigationStateMachine::loading() const noexcept
{
    return std::any_of(active_.begin(), active_.end(), [](const auto& sequence) { return sequence.has_value(); });
}

void NavigationStateMachine::set_profiles(std::vector<backend::ConnectionProfile> profiles)
{
    if (session_) {
        return;
    }
    profiles_ = std::move(profiles);
    rebuild_connection_list();
}

void NavigationStateMachine::handle_enter(const Intent& intent)
{
    auto& frame = current();

    if (frame.state == ViewState::ColumnList) {
        Frame child{};
        child.state = ViewState::RowBrowser;
        child.label = "rows";
        child.database = frame.database;
        child.schema = frame.schema;
        child.table = frame.table;
        open_child(intent, std::move(child), RequestKind::BrowseRows);
        return;
    }
    if (frame.state == ViewState::RowBrowser || frame.state == ViewState::QueryEditor
        || frame.state == ViewState::ResultView) {
        record(intent, EventOutcome::Rejected, "nothing to enter");
        return;
    }

    std::optional<std::size_t> position = intent.index;
    if (!position && !intent.text.empty()) {
        position = frame.list.find_key(intent.text);
        if (!position) {
            raise(backend::make_backend_error(backend::CatalogErrc::NotFound, "no entry named " + intent.text));
            record(intent, EventOutcome::Rejected, intent.text);
            return;
        }
    }
    if (!position) {
        position = frame.list.selection();
    }
    if (!position || !frame.list.select(*position)) {
        record(intent, EventOutcome::Rejected, "no such entry");
        return;
    }

    const auto row_index = *frame.list.selected_row();
    const auto& row = *frame.list.selected();
    const auto name = cell_text(row, 0U);

    Frame child{};
    child.label = name;
    child.database = frame.database;
    child.schema = frame.schema;

    switch (frame.state) {
    case ViewState::ConnectionList:
        connect(intent, row_index);
        return;
    case ViewState::DatabaseList:
        child.state = ViewState::SchemaList;
        child.database = backend::DatabaseRef{name};
        open_child(intent, std::move(child), RequestKind::ListSchemas);
        return;
    case ViewState::SchemaList:
        child.state = ViewState::TableList;
        child.schema = backend::SchemaRef{frame.database ? frame.database->name : std::string{}, name, cell_text(row, 1U)};
        open_child(intent, std::move(child), RequestKind::ListTables);
        return;
    case ViewState::TableList: {
        child.state = ViewState::ColumnList;
        backend::TableRef table{};
        table.database = frame.database ? frame.database->name : std::string{};
        table.schema = frame.schema ? frame.schema->name : std::string{};
        table.name = name;
        table.kind = cell_text(row, 1U) == "view" ? backend::TableKind::View : backend::TableKind::Table;
        table.size = cell_text(row, 2U);
        child.table = std::move(table);
        open_child(intent, std::move(child), RequestKind::ListColumns);
        return;
    }
    default:
        record(intent, EventOutcome::Rejected, "nothing to enter");
        return;
    }
}

void NavigationStateMachine::handle_back(const Intent& intent)
{
    switch (current().state) {
    case ViewState::ConnectionList:
        if (cancel_in_flight() == 0U) {
            record(intent, EventOutcome::Rejected, "already at the connection list");
            return;
        }
        record(intent, EventOutcome::Cancelled);
        return;
    case ViewState::DatabaseList:
        handle_disconnect(intent);
        return;
    default:
        pop();
        record(intent, EventOutcome::Applied);
        return;
    }
}

void NavigationStateMachine::handle_refresh(const Intent& intent)
{
    const auto& frame = current();

    PendingRequest request{};
    request.refresh = true;
    request.target = frame;
    request.cache_key = path_key(frame);

    switch (frame.state) {
    case ViewState::ConnectionList:
        rebuild_connection_list();
        record(intent, EventOutcome::Applied);
        return;
    case ViewState::QueryEditor:
        record(intent, EventOutcome::Rejected, "nothing to refresh");
        return;
    case ViewState::DatabaseList:
        request.kind = RequestKind::ListDatabases;
        break;
    case ViewState::SchemaList:
        request.kind = RequestKind::ListSchemas;
        break;
    case ViewState::TableList:
        request.kind = RequestKind::ListTables;
        break;
    case ViewState::ColumnList:
        request.kind = RequestKind::ListColumns;
        break;
    case ViewState::RowBrowser:
        request.kind = RequestKind::BrowseRows;
        break;
    case ViewState::ResultView:
        request.kind = RequestKind::RunQuery;
        request.slot = RequestSlot::Query;
        break;
    default:
        record(intent, EventOutcome::Rejected, "nothing to refresh");
        return;
    }

    // The refreshed level and everything fetched beneath it are stale.
    if (!request.cache_key.empty()) {
        for (auto it = cache_.lower_bound(request.cache_key);
             it != cache_.end() && it->first.starts_with(request.cache_key);) {
            it = cache_.erase(it);
        }
    }
    issue(intent, std::move(request));
}

void NavigationStateMachine::handle_run_query(const Intent& intent)
{
    if (!session_) {
        raise(backend::make_backend_error(backend::ConnectionErrc::Closed, "not connected"));
        record(intent, EventOutcome::Rejected, "not connected");
        return;
    }

    editor_text_ = intent.text;
    if (current().state != ViewState::QueryEditor && current().state != ViewState::ResultView) {
        Frame editor{};
        editor.state = ViewState::QueryEditor;
        editor.label = "query";
        editor.database = current().database;
        editor.schema = current().schema;
        editor.table = current().table;
        push(std::move(editor));
    }

    PendingRequest request{};
    request.kind = RequestKind::RunQuery;
    request.slot = RequestSlot::Query;
    if (current().state == ViewState::ResultView) {
        request.refresh = true;
        request.target = current();
    } else {
        request.target.state = ViewState::ResultView;
        request.target.label = "result";
        request.target.database = current().database;
        request.target.schema = current().schema;
    }
    request.target.sql = intent.text;
    issue(intent, std::move(request));
}

void NavigationStateMachine::handle_cancel(const Intent& intent)
{
    const auto query_running = std::any_of(pending_.begin(), pending_.end(), [](const auto& entry) {
        return entry.second.kind == RequestKind::RunQuery && !entry.second.cancellation.is_cancelled();
    });

    if (cancel_in_flight() == 0U) {
        record(intent, EventOutcome::Rejected, "nothing to cancel");
        return;
    }

    // A re-run from the result view leaves nothing of the old result behind.
    if (query_running && current().state == ViewState::ResultView) {
        pop();
    }
    record(intent, EventOutcome::Cancelled);
}

void NavigationStateMachine::handle_open_editor(const Intent& intent)
{
    if (!session_) {
        raise(backend::make_backend_error(backend::ConnectionErrc::Closed, "not connected"));
        record(intent, EventOutcome::Rejected, "not connected");
        return;
    }

    switch (current().state) {
    case ViewState::QueryEditor:
        record(intent, EventOutcome::Rejected, "editor already open");
        return;
    case ViewState::ResultView:
        pop();
        record(intent, EventOutcome::Applied);
        return;
    default: {
        Frame editor{};
        editor.state = ViewState::QueryEditor;
        editor.label = "query";
        editor.database = current().database;
        editor.schema = current().schema;
        editor.table = current().table;
        push(std::move(editor));
        record(intent, EventOutcome::Applied);
        return;
    }
    }
}

void NavigationStateMachine::handle_disconnect(const Intent& intent)
{
    cancel_in_flight();
    if (!session_) {
        record(intent, EventOutcome::Rejected, "not connected");
        return;
    }
    close_session();
    reset_to_connection_list();
    record(intent, EventOutcome::Applied);
}

void NavigationStateMachine::connect(const Intent& intent, std::size_t profile_index)
{
    const auto& profile = profiles_[profile_index];
    std::string reason;
    if (auto error = backend::validate_profile(profile, &reason)) {
        telemetry_.record_error();
        raise(backend::make_backend_error(error, reason));
        record(intent, EventOutcome::Rejected, reason);
        return;
    }

    PendingRequest request{};
    request.kind = RequestKind::Connect;
    request.profile_index = profile_index;
    request.target.state = ViewState::DatabaseList;
    request.target.label = profile.name;
    request.cache_key = path_key(request.target);
    issue(intent, std::move(request));
}

void NavigationStateMachine::open_child(const Intent& intent, Frame child, RequestKind kind)
{
    const auto key = path_key(child);
    if (const auto cached = cache_.find(key); !key.empty() && cached != cache_.end()) {
        child.list.set_source(cached->second.result, cached->second.key_columns);
        preselect_default_schema(child);
        telemetry_.record_cache_hit();
        push(std::move(child));
        record(intent, EventOutcome::CacheHit, key);
        return;
    }

    PendingRequest request{};
    request.kind = kind;
    request.target = std::move(child);
    request.cache_key = key;
    issue(intent, std::move(request));
}

void NavigationStateMachine::issue(const Intent& intent, PendingRequest request)
{
    if (request.kind != RequestKind::Connect && !session_) {
        raise(backend::make_backend_error(backend::ConnectionErrc::Closed, "not connected"));
        record(intent, EventOutcome::Rejected, "not connected");
        return;
    }

    for (auto& [sequence, pending] : pending_) {
        if (!pending.cancellation.is_cancelled()) {
            pending.superseded = true;
        }
    }
    cancel_in_flight();

    const auto sequence = next_sequence_++;
    const auto slot = request.slot;
    request.intent = intent.kind;
    request.correlation_id = "nav-" + std::to_string(sequence);
    request.from_state = current().state;
    request.started_at = std::chrono::system_clock::now();
    request.started = std::chrono::steady_clock::now();
    request.progress = std::make_shared<std::atomic<std::uint64_t>>(0U);

    auto task = make_task(sequence, request);
    pending_.emplace(sequence, std::move(request));
    active_[static_cast<std::size_t>(slot)] = sequence;
    ++outstanding_;
    telemetry_.record_request(slot);

    if (!runner_->post(std::move(task))) {
        --outstanding_;
        pending_.erase(sequence);
        active_[static_cast<std::size_t>(slot)].reset();
        telemetry_.record_error();
        raise(backend::make_backend_error(backend::ConnectionErrc::Closed, "task runner is shut down"));
        record(intent, EventOutcome::Failed, "task runner is shut down");
    }
}

TaskRunner::Task NavigationStateMachine::make_task(std::uint64_t sequence, const PendingRequest& request) const
{
    auto mailbox = mailbox_;
    auto token = request.cancellation.token();
    auto session = session_;
    auto executor = executor_;
    auto progress = request.progress;
    const auto kind = request.kind;
    const auto& target = request.target;

    const auto report = [progress](std::uint64_t rows) { progress->store(rows, std::memory_order_relaxed); };

    switch (kind) {
    case RequestKind::Connect:
        return [mailbox,
                token,
                sequence,
                profile = profiles_[request.profile_index],
                factory = config_.backend_factory,
                resolver = resolver_,
                options = config_.connect_options]() {
            Completion completion{sequence, RequestKind::Connect};
            std::unique_ptr<backend::Session> opened;
            completion.error = open_session(profile, factory, resolver, options, token, opened, completion.detail);
            if (!completion.error) {
                completion.error = load_listing<backend::DatabaseRef>(
                    [&](std::vector<backend::DatabaseRef>& databases) { return opened->list_databases(databases, token); },
                    databases_table,
                    completion.result);
                if (completion.error) {
                    opened->close();
                } else {
                    completion.key_columns = {0U};
                    completion.session = std::move(opened);
                }
            }
            mailbox->post(std::move(completion));
        };
    case RequestKind::ListDatabases:
        return [mailbox, token, sequence, session]() {
            Completion completion{sequence, RequestKind::ListDatabases};
            completion.error = load_listing<backend::DatabaseRef>(
                [&](std::vector<backend::DatabaseRef>& databases) { return session->list_databases(databases, token); },
                databases_table,
                completion.result);
            completion.key_columns = {0U};
            mailbox->post(std::move(completion));
        };
    case RequestKind::ListSchemas:
        return [mailbox, token, sequence, session, database = target.database.value_or(backend::DatabaseRef{})]() {
            Completion completion{sequence, RequestKind::ListSchemas};
            completion.error = load_listing<backend::SchemaRef>(
                [&](std::vector<backend::SchemaRef>& schemas) { return session->list_schemas(database, schemas, token); },
                schemas_table,
                completion.result);
            completion.key_columns = {0U};
            mailbox->post(std::move(completion));
        };
    case RequestKind::ListTables:
        return [mailbox, token, sequence, session, schema = target.schema.value_or(backend::SchemaRef{})]() {
            Completion completion{sequence, RequestKind::ListTables};
            completion.error = load_listing<backend::TableRef>(
                [&](std::vector<backend::TableRef>& tables) { return session->list_tables(schema, tables, token); },
                tables_table,
                completion.result);
            completion.key_columns = {0U};
            mailbox->post(std::move(completion));
        };
    case RequestKind::ListColumns:
        return [mailbox, token, sequence, session, table = target.table.value_or(backend::TableRef{})]() {
            Completion completion{sequence, RequestKind::ListColumns};
            completion.error = load_listing<value::ColumnDescriptor>(
                [&](std::vector<value::ColumnDescriptor>& columns) { return session->list_columns(table, columns, token); },
                columns_table,
                completion.result);
            completion.key_columns = {0U};
            mailbox->post(std::move(completion));
        };
    case RequestKind::BrowseRows:
        return [mailbox,
                token,
                sequence,
                executor,
                report,
                table = target.table.value_or(backend::TableRef{}),
                limit = config_.browse_row_limit]() {
            Completion completion{sequence, RequestKind::BrowseRows};
            auto outcome = executor->browse(table, limit, token, report);
            completion.error = std::move(outcome.error);
            completion.rows = outcome.metrics.rows_received;
            completion.detail = outcome.metrics.correlation_id;
            if (!completion.error && outcome.result) {
                completion.key_columns = outcome.result->primary_key_columns();
                completion.result = std::make_shared<const value::QueryResult>(std::move(*outcome.result));
            }
            mailbox->post(std::move(completion));
        };
    case RequestKind::RunQuery:
    default:
        return [mailbox,
                token,
                sequence,
                executor,
                report,
                database = target.database.value_or(backend::DatabaseRef{}),
                sql = target.sql]() {
            Completion completion{sequence, RequestKind::RunQuery};
            auto outcome = executor->run(database, sql, token, report);
            completion.error = std::move(outcome.error);
            completion.rows = outcome.metrics.rows_received;
            completion.detail = outcome.metrics.correlation_id;
            if (!completion.error && outcome.result) {
                completion.key_columns = outcome.result->primary_key_columns();
                completion.result = std::make_shared<const value::QueryResult>(std::move(*outcome.result));
            }
            mailbox->post(std::move(completion));
        };
    }
}

void NavigationStateMachine::apply(Completion completion)
{
    --outstanding_;
    if (completion.kind == RequestKind::Close) {
        return;
    }

    const auto found = pending_.find(completion.sequence);
    if (found == pending_.end()) {
        if (completion.session) {
            post_close(std::move(completion.session));
        }
        return;
    }
    auto request = std::move(found->second);
    pending_.erase(found);

    NavigationEvent event{};
    event.correlation_id = request.correlation_id;
    event.intent = request.intent;
    event.slot = request.slot;
    event.sequence = completion.sequence;
    event.from_state = request.from_state;
    event.rows = completion.rows;
    event.detail = completion.detail;
    event.error = completion.error.code;
    event.started_at = request.started_at;
    event.finished_at = std::chrono::system_clock::now();
    event.duration_ms = elapsed_ms(request.started);

    auto& active = active_[static_cast<std::size_t>(request.slot)];
    if (active != completion.sequence) {
        // Superseded or cancelled: the response never reaches visible state.
        if (completion.session) {
            post_close(std::move(completion.session));
        }
        telemetry_.record_stale();
        event.outcome = request.superseded ? EventOutcome::Stale : EventOutcome::Cancelled;
        event.to_state = current().state;
        record(std::move(event));
        return;
    }
    active.reset();

    if (completion.error) {
        // A failed re-run leaves nothing of the old result behind.
        if (request.kind == RequestKind::RunQuery && request.refresh && current().state == ViewState::ResultView) {
            pop();
        }
        if (backend::is_cancellation(completion.error)) {
            event.outcome = EventOutcome::Cancelled;
        } else {
            telemetry_.record_error();
            raise(completion.error);
            event.outcome = EventOutcome::Failed;
            event.detail = completion.error.message;
        }
        event.to_state = current().state;
        record(std::move(event));
        return;
    }

    apply_success(request, completion);
    telemetry_.record_applied(completion.rows);
    event.outcome = EventOutcome::Applied;
    event.to_state = current().state;
    record(std::move(event));
}

void NavigationStateMachine::apply_success(PendingRequest& request, Completion& completion)
{
    error_.reset();

    if (!request.cache_key.empty() && request.kind != RequestKind::BrowseRows && request.kind != RequestKind::RunQuery) {
        cache_[request.cache_key] = CacheEntry{completion.result, completion.key_columns};
    }

    if (request.kind == RequestKind::Connect) {
        session_ = std::shared_ptr<backend::Session>{std::move(completion.session)};
        query::QueryExecutor::Config executor_config{};
        executor_config.batch_size = config_.batch_size;
        executor_config.max_rows = config_.max_result_rows;
        executor_ = std::make_shared<query::QueryExecutor>(session_, std::move(executor_config));
        active_profile_ = request.profile_index;
    }

    if (request.refresh) {
        auto& frame = current();
        frame.sql = request.target.sql;
        frame.list.set_source(completion.result, std::move(completion.key_columns));
        return;
    }

    auto frame = std::move(request.target);
    frame.list.set_source(completion.result, std::move(completion.key_columns));
    preselect_default_schema(frame);
    push(std::move(frame));
}

std::size_t NavigationStateMachine::cancel_in_flight()
{
    std::size_t cancelled = 0U;
    for (auto& [sequence, request] : pending_) {
        if (!request.cancellation.is_cancelled()) {
            request.cancellation.cancel();
            telemetry_.record_cancellation();
            ++cancelled;
        }
    }
    active_.fill(std::nullopt);
    return cancelled;
}

void NavigationStateMachine::close_session()
{
    if (!session_) {
        return;
    }

    auto session = std::exchange(session_, nullptr);
    executor_.reset();
    cache_.clear();
    active_profile_.reset();
    session->cancel_all();
    post_close(std::move(session));
}

// Closing waits for the session's running operation, so it happens off the
// interactive loop.
void NavigationStateMachine::post_close(std::shared_ptr<backend::Session> session)
{
    auto mailbox = mailbox_;
    ++outstanding_;
    const auto posted = runner_->post([mailbox, session]() {
        session->close();
        Completion completion{};
        completion.kind = RequestKind::Close;
        mailbox->post(std::move(completion));
    });
    if (!posted) {
        --outstanding_;
        session->close();
    }
}

void NavigationStateMachine::reset_to_connection_list()
{
    frames_.erase(frames_.begin() + 1, frames_.end());
    error_.reset();
}

void NavigationStateMachine::rebuild_connection_list()
{
    value::QueryResult listing;
    if (auto error = profiles_table(profiles_, listing)) {
        raise(backend::make_backend_error(error, "connection list could not be built"));
        return;
    }
    frames_.front().list.set_source(std::make_shared<const value::QueryResult>(std::move(listing)), {0U});
}

void NavigationStateMachine::push(Frame frame)
{
    cancel_in_flight();
    frames_.push_back(std::move(frame));
    error_.reset();
}

void NavigationStateMachine::pop()
{
    cancel_in_flight();
    if (frames_.size() > 1U) {
        frames_.pop_back();
    }
    error_.reset();
}

void NavigationStateMachine::preselect_default_schema(Frame& frame) const
{
    const auto* profile = active_profile();
    if (frame.state != ViewState::SchemaList || profile == nullptr || profile->default_schema.empty()) {
        return;
    }
    if (const auto position = frame.list.find_key(profile->default_schema)) {
        (void)frame.list.select(*position);
    }
}

void NavigationStateMachine::raise(const backend::BackendError& error)
{
    ErrorBanner banner{};
    banner.code = error.code;
    banner.message = error.message.empty() ? error.code.message() : error.message;
    banner.sqlstate = error.sqlstate;
    banner.state = current().state;
    error_ = std::move(banner);
}

void NavigationStateMachine::record(const Intent& intent, EventOutcome outcome, std::string detail)
{
    NavigationEvent event{};
    event.correlation_id = "intent-" + std::to_string(next_intent_++);
    event.intent = intent.kind;
    event.slot = intent.kind == IntentKind::RunQuery ? RequestSlot::Query : RequestSlot::Navigation;
    event.from_state = current().state;
    event.to_state = current().state;
    event.outcome = outcome;
    event.detail = std::move(detail);
    if (error_) {
        event.error = error_->code;
    }
    event.started_at = std::chrono::system_clock::now();
    event.finished_at = event.started_at;
    record(std::move(event));
}

void NavigationStateMachine::record(NavigationEvent event) const
{
    if (config_.event_logger) {
        config_.event_logger(event);
    }
}

// Every part is terminated, so one key starts with another only when it lies
// beneath that level.
std::string NavigationStateMachine::path_key(const Frame& frame)
{
    std::string key(1U, kPathRoot);
    const auto append = [&](const std::string& part) {
        key.append(part);
        key.push_back(kPathSeparator);
    };

    switch (frame.state) {
    case ViewState::DatabaseList:
        return key;
    case ViewState::SchemaList:
        append(frame.database ? frame.database->name : std::string{});
        return key;
    case ViewState::TableList:
        append(frame.database ? frame.database->name : std::string{});
        append(frame.schema ? frame.schema->name : std::string{});
        return key;
    case ViewState::ColumnList:
        append(frame.database ? frame.database->name : std::string{});
        append(frame.schema ? frame.schema->name : std::string{});
        append(frame.table ? frame.table->name : std::string{});
        return key;
    default:
        return {};
    }
}

}  // namespace sextant::navigation
