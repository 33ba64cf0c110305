#include "sextant/navigation/task_runner.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace sextant::navigation {

namespace {

class ThreadPoolTaskRunner final : public TaskRunner {
public:
    explicit ThreadPoolTaskRunner(const TaskRunnerConfig& config)
        : config_{config}
    {
        config_.queue_depth = std::max<std::size_t>(1U, config_.queue_depth);
        const auto worker_count = std::max<std::size_t>(1U, config_.worker_threads);
        for (std::size_t index = 0; index < worker_count; ++index) {
            workers_.emplace_back([this]() { worker_loop(); });
        }
    }

    ~ThreadPoolTaskRunner() override
    {
        shutdown();
    }

    bool post(Task task) override
    {
        if (!task) {
            return false;
        }

        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return queue_.size() < config_.queue_depth || !running_; });
            if (!running_) {
                return false;
            }
            queue_.push_back(std::move(task));
        }
        queue_cv_.notify_all();
        return true;
    }

    void shutdown() override
    {
        {
            std::scoped_lock lock(queue_mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
        }
        queue_cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
                worker.join();
            }
        }
    }

    std::size_t pending() const override
    {
        std::scoped_lock lock(queue_mutex_);
        return queue_.size() + active_;
    }

private:
    void worker_loop()
    {
        while (true) {
            Task task;
            {
                std::unique_lock lock(queue_mutex_);
                queue_cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });
                if (!running_ && queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop_front();
                ++active_;
            }
            // Wakes a poster waiting for room.
            queue_cv_.notify_all();

            task();

            {
                std::scoped_lock lock(queue_mutex_);
                --active_;
            }
        }
    }

    TaskRunnerConfig config_{};
    std::vector<std::thread> workers_{};
    std::deque<Task> queue_{};
    mutable std::mutex queue_mutex_{};
    std::condition_variable queue_cv_{};
    std::size_t active_ = 0U;
    bool running_ = true;
};

}  // namespace

std::unique_ptr<TaskRunner> create_thread_pool_task_runner(const TaskRunnerConfig& config)
{
    return std::make_unique<ThreadPoolTaskRunner>(config);
}

}  // namespace sextant::navigation
