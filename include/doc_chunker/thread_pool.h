#pragma once

#include <atomic>
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

namespace doc_chunker {

// Fixed-size worker pool. Documents are independent, so batch processing
// hands one document to each task and collects the futures in order.
class ThreadPool {
public:
    // A request for zero workers is served by a single worker
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool is shutting down
    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    // Blocks until the queue is drained and no task is running
    void wait_idle();

    size_t size() const { return workers_.size(); }
    size_t pending() const;
    size_t running() const { return running_.load(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;
    bool stopping_ = false;
    std::atomic<size_t> running_{0};
};

template <typename F>
auto ThreadPool::submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;

    auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
    std::future<Result> future = packaged->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("submit on stopped ThreadPool");
        }
        queue_.emplace([packaged]() { (*packaged)(); });
    }
    work_available_.notify_one();
    return future;
}

} // namespace doc_chunker
