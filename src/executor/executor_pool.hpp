//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// executor/executor_pool.hpp
//
// Worker thread pool running one task per in-flight request
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <queue>
#include <future>
#include <type_traits>

namespace mcpd_server {

class ExecutorPool {
public:
    using Task = std::function<void()>;

    explicit ExecutorPool(size_t thread_count = 0);
    ~ExecutorPool();

    // Non-copyable
    ExecutorPool(const ExecutorPool&) = delete;
    ExecutorPool& operator=(const ExecutorPool&) = delete;

    void Start();

    // Stop accepting tasks, finish the running ones and drop the queue
    void Stop();

    // Returns false if the pool is stopped and the task was dropped
    bool Submit(Task task);

    template<typename F, typename... Args>
    auto SubmitWithFuture(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = task->get_future();

        if (!Submit([task]() { (*task)(); })) {
            // Dropped: the future reports broken_promise
            task.reset();
        }

        return result;
    }

    size_t Size() const { return thread_count_; }

    size_t PendingTasks() const;

    // Tasks currently executing on a worker
    size_t ActiveTasks() const { return active_tasks_; }

    bool IsRunning() const { return running_; }

private:
    void Worker();

private:
    size_t thread_count_;

    std::vector<std::thread> workers_;

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<size_t> active_tasks_;
};

} // namespace mcpd_server
