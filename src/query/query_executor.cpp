#include "sextant/query/query_executor.hpp"

#include "sextant/query/sql_text.hpp"

#include <utility>
#include <vector>

namespace sextant::query {

namespace {

// Collects streamed output privately; nothing is visible until the run ends.
class StagingSink final : public backend::RowSink {
public:
    StagingSink(std::size_t max_rows,
                const backend::CancellationToken& token,
                const QueryExecutor::ProgressCallback& progress,
                QueryRunMetrics& metrics)
        : max_rows_{max_rows}
        , token_{token}
        , progress_{progress}
        , metrics_{metrics}
    {
    }

    void on_columns(std::vector<value::ColumnDescriptor> columns) override
    {
        staged_ = value::QueryResult{std::move(columns)};
        has_rows_ = true;
        statement_has_rows_ = true;
    }

    bool on_batch(std::vector<value::Row> rows) override
    {
        if (token_.is_cancelled()) {
            return false;
        }

        ++metrics_.batches;
        bool keep_going = true;
        if (max_rows_ != 0U && staged_.row_count() + rows.size() > max_rows_) {
            rows.resize(max_rows_ - staged_.row_count());
            staged_.set_truncated(true);
            keep_going = false;
        }

        const auto accepted = rows.size();
        if (auto error = staged_.append_rows(std::move(rows))) {
            misaligned_ = true;
            return false;
        }
        metrics_.rows_received += accepted;
        if (progress_) {
            progress_(metrics_.rows_received);
        }
        return keep_going;
    }

    void on_command(std::string command_tag, std::optional<std::uint64_t> rows_affected) override
    {
        // A later statement without rows does not replace an earlier result set.
        const bool returned_rows = std::exchange(statement_has_rows_, false);
        if (has_rows_ && !returned_rows) {
            return;
        }
        staged_.set_command(std::move(command_tag), rows_affected);
    }

    [[nodiscard]] bool misaligned() const noexcept { return misaligned_; }
    [[nodiscard]] value::QueryResult take() { return std::move(staged_); }

private:
    std::size_t max_rows_ = 0U;
    const backend::CancellationToken& token_;
    const QueryExecutor::ProgressCallback& progress_;
    QueryRunMetrics& metrics_;
    value::QueryResult staged_{};
    bool has_rows_ = false;
    bool statement_has_rows_ = false;
    bool misaligned_ = false;
};

double elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

QueryExecutor::QueryExecutor(std::shared_ptr<backend::Session> session)
    : QueryExecutor(std::move(session), Config{})
{
}

QueryExecutor::QueryExecutor(std::shared_ptr<backend::Session> session, Config config)
    : session_{std::move(session)}
    , config_{std::move(config)}
{
}

QueryHandle QueryExecutor::prepare() noexcept
{
    return QueryHandle{next_run_.fetch_add(1U, std::memory_order_relaxed)};
}

void QueryExecutor::cancel(const QueryHandle& handle) noexcept
{
    handle.cancel();
}

template <typename Operation>
QueryOutcome QueryExecutor::execute(const backend::CancellationToken& token,
                                    const ProgressCallback& progress,
                                    Operation&& operation)
{
    QueryOutcome outcome{};
    outcome.metrics.correlation_id =
        config_.correlation_prefix + "-" + std::to_string(next_run_.fetch_add(1U, std::memory_order_relaxed));
    outcome.metrics.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    const auto finish = [&]() {
        outcome.metrics.finished_at = std::chrono::system_clock::now();
        outcome.metrics.duration_ms = elapsed_ms(start);
    };

    if (!session_ || !session_->is_open()) {
        outcome.error = backend::make_backend_error(backend::ConnectionErrc::Closed, "not connected");
        finish();
        return outcome;
    }

    StagingSink sink{config_.max_rows, token, progress, outcome.metrics};
    backend::StreamOptions options{};
    options.batch_size = config_.batch_size;

    auto error = operation(*session_, options, sink);
    finish();

    if (token.is_cancelled()) {
        outcome.error = backend::make_backend_error(backend::QueryErrc::Cancelled, "query cancelled");
        return outcome;
    }
    if (error) {
        outcome.error = std::move(error);
        return outcome;
    }
    if (sink.misaligned()) {
        outcome.error = backend::make_backend_error(backend::QueryErrc::RuntimeError, "row width does not match columns");
        return outcome;
    }

    outcome.result = sink.take();
    return outcome;
}

QueryOutcome QueryExecutor::run(std::string_view sql, const backend::CancellationToken& token, const ProgressCallback& progress)
{
    return run(backend::DatabaseRef{}, sql, token, progress);
}

QueryOutcome QueryExecutor::run(const backend::DatabaseRef& database,
                                std::string_view sql,
                                const backend::CancellationToken& token,
                                const ProgressCallback& progress)
{
    if (!has_executable_text(sql)) {
        QueryOutcome outcome{};
        outcome.metrics.correlation_id =
            config_.correlation_prefix + "-" + std::to_string(next_run_.fetch_add(1U, std::memory_order_relaxed));
        outcome.metrics.started_at = std::chrono::system_clock::now();
        outcome.metrics.finished_at = outcome.metrics.started_at;
        outcome.error = backend::make_backend_error(backend::QueryErrc::SyntaxError, "empty query");
        return outcome;
    }

    return execute(token, progress, [&database, sql, &token](backend::Session& session, const backend::StreamOptions& options, backend::RowSink& sink) {
        return session.execute_query(database, sql, options, sink, token);
    });
}

QueryOutcome QueryExecutor::run(std::string_view sql, const QueryHandle& handle, const ProgressCallback& progress)
{
    return run(sql, handle.token(), progress);
}

QueryOutcome QueryExecutor::browse(const backend::TableRef& table,
                                   std::size_t limit,
                                   const backend::CancellationToken& token,
                                   const ProgressCallback& progress)
{
    return execute(token, progress, [&table, limit, &token](backend::Session& session, const backend::StreamOptions& options, backend::RowSink& sink) {
        return session.browse_rows(table, limit, options, sink, token);
    });
}

}  // namespace sextant::query
