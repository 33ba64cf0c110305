#pragma once

#include "sextant/navigation/navigation_types.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace sextant::navigation {

struct NavigationTelemetrySnapshot final {
    std::uint64_t intents = 0U;
    std::uint64_t requests_issued = 0U;
    std::uint64_t responses_applied = 0U;
    std::uint64_t stale_responses_dropped = 0U;
    std::uint64_t cancellations = 0U;
    std::uint64_t errors = 0U;
    std::uint64_t cache_hits = 0U;
    std::array<std::uint64_t, static_cast<std::size_t>(RequestSlot::Count)> requests_by_slot{};
    std::uint64_t rows_received = 0U;
};

class NavigationTelemetry final {
public:
    void record_intent() noexcept;
    void record_request(RequestSlot slot) noexcept;
    void record_applied(std::uint64_t rows) noexcept;
    void record_stale() noexcept;
    void record_cancellation() noexcept;
    void record_error() noexcept;
    void record_cache_hit() noexcept;

    [[nodiscard]] NavigationTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static constexpr std::size_t slot_count = static_cast<std::size_t>(RequestSlot::Count);

    std::atomic<std::uint64_t> intents_{0U};
    std::atomic<std::uint64_t> requests_issued_{0U};
    std::atomic<std::uint64_t> responses_applied_{0U};
    std::atomic<std::uint64_t> stale_responses_dropped_{0U};
    std::atomic<std::uint64_t> cancellations_{0U};
    std::atomic<std::uint64_t> errors_{0U};
    std::atomic<std::uint64_t> cache_hits_{0U};
    std::array<std::atomic<std::uint64_t>, slot_count> requests_by_slot_{};
    std::atomic<std::uint64_t> rows_received_{0U};
};

}  // namespace sextant::navigation
