#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace neo {

class ThreadPool {
public:
    // max_queue_size == 0 means the queue is unbounded
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency(), size_t max_queue_size = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit a task; throws std::runtime_error if the pool is stopped or full
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<typename std::invoke_result_t<F, Args...>>;

    // Detached submission. Returns false instead of throwing when the task cannot be queued.
    bool try_submit(std::function<void()> task);

    // Wait for all tasks to complete
    void wait_for_all();

    size_t thread_count() const { return threads_.size(); }
    size_t pending_tasks() const;
    size_t active_tasks() const { return active_tasks_.load(); }
    size_t max_queue_size() const { return max_queue_size_; }

    bool is_running() const { return !stop_; }

    // Stops intake, runs what is already queued, joins the workers
    void shutdown();

private:
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    size_t max_queue_size_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_tasks_{0};
    std::condition_variable finished_condition_;

    void worker_thread();
    bool enqueue_locked(std::function<void()> task);
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<typename std::invoke_result_t<F, Args...>> {
    using return_type = typename std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (stop_) {
            throw std::runtime_error("Cannot submit task to stopped ThreadPool");
        }

        if (!enqueue_locked([task]() { (*task)(); })) {
            throw std::runtime_error("ThreadPool queue is full");
        }
    }

    condition_.notify_one();
    return result;
}

} // namespace neo
