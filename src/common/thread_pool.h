#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used to parse independent log files in parallel

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace pglogstats {

/// @brief A fixed set of worker threads draining a FIFO task queue
///
/// Tasks run in submission order across workers; results come back through
/// std::future. The destructor drains the queue before joining.
class ThreadPool {
public:
    /// @param num_threads Number of worker threads (0: hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// @brief Submit a task for execution
    /// @return Future holding the task result or the exception it threw
    template <typename F>
    auto Submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    size_t Size() const { return workers_.size(); }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

template <typename F>
auto ThreadPool::Submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("Cannot submit task to stopped thread pool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

}  // namespace pglogstats
