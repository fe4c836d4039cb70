#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace mcphub {

/// Fixed-size thread pool. Blocking peer calls run here so the caller can
/// wait on the returned future with a deadline.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue `fn`; its result or exception is delivered through the future.
    /// Throws McpError after shutdown().
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> fut = task->get_future();
        post([task] { (*task)(); });
        return fut;
    }

    /// Finish queued tasks and join every worker. Idempotent.
    void shutdown();

    [[nodiscard]] std::size_t size() const { return size_; }

private:
    void post(std::function<void()> task);
    void run();

    std::size_t size_;
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{true};
};

} // namespace mcphub
