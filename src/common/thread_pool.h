#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used to fan detection signals out in parallel

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <absl/status/statusor.h>

namespace ipishield {

/// @brief A fixed-size thread pool
///
/// Tasks run to completion even when the caller stops waiting on their
/// future, so anything a task touches must be owned by the task itself.
class ThreadPool {
public:
    /// @brief Create a thread pool with the specified number of threads
    /// @param num_threads Number of worker threads (0 = hardware concurrency)
    /// @param name Name used in log lines
    explicit ThreadPool(size_t num_threads = 0, std::string name = "ipishield-pool");

    /// @brief Destructor drains queued tasks, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a callable and get a future for its result
    /// @return FailedPrecondition if the pool is shutting down
    template <typename F>
    auto Submit(F&& f) -> absl::StatusOr<std::future<std::invoke_result_t<F>>>;

    size_t Size() const { return workers_.size(); }

    /// @brief Number of queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Block until every submitted task has finished
    void Wait();

    bool IsStopped() const { return stop_.load(std::memory_order_acquire); }

    const std::string& Name() const { return name_; }

private:
    absl::Status Enqueue(std::function<void()> task);
    void WorkerLoop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    std::atomic<bool> stop_{false};
    size_t active_tasks_ = 0;  // guarded by mutex_
};

template <typename F>
auto ThreadPool::Submit(F&& f) -> absl::StatusOr<std::future<std::invoke_result_t<F>>> {
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    auto status = Enqueue([task]() { (*task)(); });
    if (!status.ok()) {
        return status;
    }
    return result;
}

}  // namespace ipishield
