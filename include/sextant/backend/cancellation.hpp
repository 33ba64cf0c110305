#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace sextant::backend {

namespace detail {
class CancellationState;
}  // namespace detail

// Unregisters a cancel callback on destruction. Once destroyed, the callback
// is guaranteed not to be running on another thread.
class CancellationRegistration final {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id) noexcept;
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    void reset() noexcept;

private:
    std::shared_ptr<detail::CancellationState> state_{};
    std::uint64_t id_ = 0U;
};

class CancellationToken final {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept;
    [[nodiscard]] bool can_be_cancelled() const noexcept { return state_ != nullptr; }

    // Runs the callback when the token is cancelled, or immediately when it
    // already is. Callbacks must not throw.
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) noexcept;

    std::shared_ptr<detail::CancellationState> state_{};
};

class CancellationSource final {
public:
    CancellationSource();

    void cancel() const noexcept;
    [[nodiscard]] bool is_cancelled() const noexcept;
    [[nodiscard]] CancellationToken token() const noexcept;

    // Cancels this source whenever the parent token is cancelled.
    [[nodiscard]] CancellationRegistration link(const CancellationToken& parent) const;

private:
    std::shared_ptr<detail::CancellationState> state_{};
};

}  // namespace sextant::backend
