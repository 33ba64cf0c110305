#pragma once

#include <cstddef>
#include <functional>
#include <memory>

namespace sextant::navigation {

struct TaskRunnerConfig final {
    std::size_t worker_threads = 2U;
    std::size_t queue_depth = 64U;
};

// Runs backend work off the interactive loop.
class TaskRunner {
public:
    using Task = std::function<void()>;

    virtual ~TaskRunner() = default;

    // Blocks while the queue is full. Returns false once the runner is shut
    // down; the task is then dropped without running.
    [[nodiscard]] virtual bool post(Task task) = 0;

    // Runs every queued task, then joins the workers.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual std::size_t pending() const = 0;
};

[[nodiscard]] std::unique_ptr<TaskRunner> create_thread_pool_task_runner(const TaskRunnerConfig& config = {});

}  // namespace sextant::navigation
