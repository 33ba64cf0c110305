#include "sextant/backend/cancellation.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace sextant::backend {

namespace detail {

class CancellationState final {
public:
    [[nodiscard]] bool cancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Zero means the state is already cancelled and the callback was not kept.
    std::uint64_t add(std::function<void()>& callback)
    {
        std::lock_guard guard{mutex_};
        if (cancelled_.load(std::memory_order_relaxed)) {
            return 0U;
        }
        const auto id = next_id_++;
        callbacks_.emplace(id, std::move(callback));
        return id;
    }

    void remove(std::uint64_t id) noexcept
    {
        std::unique_lock lock{mutex_};
        callbacks_.erase(id);
        if (running_ && runner_ != std::this_thread::get_id()) {
            idle_cv_.wait(lock, [this]() { return !running_; });
        }
    }

    void cancel() noexcept
    {
        std::map<std::uint64_t, std::function<void()>> pending;
        {
            std::lock_guard guard{mutex_};
            if (cancelled_.load(std::memory_order_relaxed)) {
                return;
            }
            cancelled_.store(true, std::memory_order_release);
            pending.swap(callbacks_);
            running_ = true;
            runner_ = std::this_thread::get_id();
        }

        for (auto& [id, callback] : pending) {
            if (callback) {
                callback();
            }
        }

        {
            std::lock_guard guard{mutex_};
            running_ = false;
        }
        idle_cv_.notify_all();
    }

private:
    mutable std::mutex mutex_{};
    std::condition_variable idle_cv_{};
    std::atomic<bool> cancelled_{false};
    std::map<std::uint64_t, std::function<void()>> callbacks_{};
    std::uint64_t next_id_ = 1U;
    bool running_ = false;
    std::thread::id runner_{};
};

}  // namespace detail

CancellationRegistration::CancellationRegistration(std::shared_ptr<detail::CancellationState> state,
                                                   std::uint64_t id) noexcept
    : state_{std::move(state)}
    , id_{id}
{
}

CancellationRegistration::~CancellationRegistration()
{
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_{std::move(other.state_)}
    , id_{std::exchange(other.id_, 0U)}
{
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept
{
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0U);
    }
    return *this;
}

void CancellationRegistration::reset() noexcept
{
    if (state_ && id_ != 0U) {
        state_->remove(id_);
    }
    state_.reset();
    id_ = 0U;
}

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state) noexcept
    : state_{std::move(state)}
{
}

bool CancellationToken::is_cancelled() const noexcept
{
    return state_ && state_->cancelled();
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const
{
    if (!state_) {
        return {};
    }
    const auto id = state_->add(callback);
    if (id == 0U) {
        if (callback) {
            callback();
        }
        return {};
    }
    return CancellationRegistration{state_, id};
}

CancellationSource::CancellationSource()
    : state_{std::make_shared<detail::CancellationState>()}
{
}

void CancellationSource::cancel() const noexcept
{
    state_->cancel();
}

bool CancellationSource::is_cancelled() const noexcept
{
    return state_->cancelled();
}

CancellationToken CancellationSource::token() const noexcept
{
    return CancellationToken{state_};
}

CancellationRegistration CancellationSource::link(const CancellationToken& parent) const
{
    auto state = state_;
    return parent.on_cancel([state]() { state->cancel(); });
}

}  // namespace sextant::backend
