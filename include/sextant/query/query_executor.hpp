#pragma once

#include "sextant/backend/backend.hpp"
#include "sextant/value/query_result.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sextant::query {

// Identifies one run and carries its cancellation source.
class QueryHandle final {
public:
    QueryHandle() = default;
    explicit QueryHandle(std::uint64_t id) noexcept
        : id_{id}
    {
    }

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] backend::CancellationToken token() const noexcept { return source_.token(); }
    [[nodiscard]] bool cancelled() const noexcept { return source_.is_cancelled(); }
    void cancel() const noexcept { source_.cancel(); }

private:
    std::uint64_t id_ = 0U;
    backend::CancellationSource source_{};
};

struct QueryRunMetrics final {
    std::string correlation_id{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
    double duration_ms = 0.0;
    std::uint64_t rows_received = 0U;
    std::uint64_t batches = 0U;
};

struct QueryOutcome final {
    backend::BackendError error{};
    std::optional<value::QueryResult> result{};
    QueryRunMetrics metrics{};

    [[nodiscard]] bool success() const noexcept { return !error && result.has_value(); }
    [[nodiscard]] bool cancelled() const noexcept { return backend::is_cancellation(error); }
};

// Runs SQL through a session, buffering streamed batches and publishing the
// result only once the statement completed. A cancelled or failed run never
// yields partial rows.
class QueryExecutor final {
public:
    struct Config final {
        std::size_t batch_size = 256U;
        std::size_t max_rows = 10'000U;
        std::string correlation_prefix{"query"};
    };

    // Receives the running row count after every accepted batch.
    using ProgressCallback = std::function<void(std::uint64_t rows_received)>;

    explicit QueryExecutor(std::shared_ptr<backend::Session> session);
    QueryExecutor(std::shared_ptr<backend::Session> session, Config config);

    [[nodiscard]] QueryHandle prepare() noexcept;

    [[nodiscard]] QueryOutcome run(std::string_view sql,
                                   const backend::CancellationToken& token,
                                   const ProgressCallback& progress = {});
    // Runs in the given database; an empty name keeps the session's current one.
    [[nodiscard]] QueryOutcome run(const backend::DatabaseRef& database,
                                   std::string_view sql,
                                   const backend::CancellationToken& token,
                                   const ProgressCallback& progress = {});
    [[nodiscard]] QueryOutcome run(std::string_view sql, const QueryHandle& handle, const ProgressCallback& progress = {});

    [[nodiscard]] QueryOutcome browse(const backend::TableRef& table,
                                      std::size_t limit,
                                      const backend::CancellationToken& token,
                                      const ProgressCallback& progress = {});

    static void cancel(const QueryHandle& handle) noexcept;

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<backend::Session>& session() const noexcept { return session_; }

private:
    template <typename Operation>
    QueryOutcome execute(const backend::CancellationToken& token, const ProgressCallback& progress, Operation&& operation);

    std::shared_ptr<backend::Session> session_{};
    Config config_{};
    std::atomic<std::uint64_t> next_run_{1U};
};

}  // namespace sextant::query
