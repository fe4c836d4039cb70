#include "mcphub/worker_pool.hpp"
#include "mcphub/error.hpp"
#include <algorithm>

namespace mcphub {

WorkerPool::WorkerPool(std::size_t threads)
    : size_(std::max<std::size_t>(threads, 1)) {
    threads_.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
        threads_.emplace_back([this] { run(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !tasks_.empty() || !running_; });
            if (!running_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

void WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            throw McpError("Worker pool is shut down");
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && threads_.empty()) return;
        running_ = false;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

} // namespace mcphub
