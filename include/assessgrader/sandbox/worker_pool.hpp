#pragma once

#include <assessgrader/common/class_traits.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace assessgrader {

/// Fixed set of threads draining a bounded FIFO of tasks
class WorkerPool : NonMovable
{
public:
    WorkerPool(std::size_t num_workers, std::size_t max_queue);

    /// Stops accepting work, lets the workers finish what is queued, and joins them
    ~WorkerPool();

    /// Queue ``func`` for execution. Returns nullopt if the queue is full or the pool is shutting down
    template <typename Func>
    std::optional<std::future<std::invoke_result_t<Func>>> submit(Func&& func) {
        using R = std::invoke_result_t<Func>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Func>(func));
        auto future = task->get_future();

        {
            std::scoped_lock lock{mutex_};

            if (stopping_ || queue_.size() >= max_queue_) {
                return std::nullopt;
            }

            queue_.emplace_back([task] { (*task)(); });
        }

        cv_.notify_one();

        return future;
    }

    std::size_t queued() const;

    std::size_t num_workers() const { return workers_.size(); }

private:
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    std::size_t max_queue_;
    bool stopping_ = false;

    // Last, so the threads are joined before the queue they use goes away
    std::vector<std::jthread> workers_;
};

} // namespace assessgrader
