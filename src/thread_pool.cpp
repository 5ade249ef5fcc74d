#include "doc_chunker/thread_pool.h"
#include <algorithm>

namespace doc_chunker {

ThreadPool::ThreadPool(size_t num_threads) {
    const size_t count = std::max<size_t>(1, num_threads);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();

    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

            // Remaining work is drained before shutdown
            if (stopping_ && queue_.empty()) {
                return;
            }

            task = std::move(queue_.front());
            queue_.pop();
            ++running_;
        }

        // packaged_task stores exceptions in the future
        task();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
        }
        idle_.notify_all();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace doc_chunker
