#include "sextant/navigation/navigation_telemetry.hpp"

namespace sextant::navigation {

void NavigationTelemetry::record_intent() noexcept
{
    intents_.fetch_add(1U, std::memory_order_relaxed);
}

void NavigationTelemetry::record_request(RequestSlot slot) noexcept
{
    requests_issued_.fetch_add(1U, std::memory_order_relaxed);
    const auto index = static_cast<std::size_t>(slot);
    if (index < slot_count) {
        requests_by_slot_[index].fetch_add(1U, std::memory_order_relaxed);
    }
}

void NavigationTelemetry::record_applied(std::uint64_t rows) noexcept
{
    responses_applied_.fetch_add(1U, std::memory_order_relaxed);
    rows_received_.fetch_add(rows, std::memory_order_relaxed);
}

void NavigationTelemetry::record_stale() noexcept
{
    stale_responses_dropped_.fetch_add(1U, std::memory_order_relaxed);
}

void NavigationTelemetry::record_cancellation() noexcept
{
    cancellations_.fetch_add(1U, std::memory_order_relaxed);
}

void NavigationTelemetry::record_error() noexcept
{
    errors_.fetch_add(1U, std::memory_order_relaxed);
}

void NavigationTelemetry::record_cache_hit() noexcept
{
    cache_hits_.fetch_add(1U, std::memory_order_relaxed);
}

NavigationTelemetrySnapshot NavigationTelemetry::snapshot() const noexcept
{
    NavigationTelemetrySnapshot snapshot{};
    snapshot.intents = intents_.load(std::memory_order_relaxed);
    snapshot.requests_issued = requests_issued_.load(std::memory_order_relaxed);
    snapshot.responses_applied = responses_applied_.load(std::memory_order_relaxed);
    snapshot.stale_responses_dropped = stale_responses_dropped_.load(std::memory_order_relaxed);
    snapshot.cancellations = cancellations_.load(std::memory_order_relaxed);
    snapshot.errors = errors_.load(std::memory_order_relaxed);
    snapshot.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < slot_count; ++i) {
        snapshot.requests_by_slot[i] = requests_by_slot_[i].load(std::memory_order_relaxed);
    }
    snapshot.rows_received = rows_received_.load(std::memory_order_relaxed);
    return snapshot;
}

void NavigationTelemetry::reset() noexcept
{
    intents_.store(0U, std::memory_order_relaxed);
    requests_issued_.store(0U, std::memory_order_relaxed);
    responses_applied_.store(0U, std::memory_order_relaxed);
    stale_responses_dropped_.store(0U, std::memory_order_relaxed);
    cancellations_.store(0U, std::memory_order_relaxed);
    errors_.store(0U, std::memory_order_relaxed);
    cache_hits_.store(0U, std::memory_order_relaxed);
    for (auto& counter : requests_by_slot_) {
        counter.store(0U, std::memory_order_relaxed);
    }
    rows_received_.store(0U, std::memory_order_relaxed);
}

}  // namespace sextant::navigation
