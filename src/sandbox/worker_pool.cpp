#include "sandbox/worker_pool.hpp"

#include "logging.hpp"

#include <libassert/assert.hpp>

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>

namespace assessgrader {

WorkerPool::WorkerPool(std::size_t num_workers, std::size_t max_queue)
    : max_queue_{max_queue} {
    ASSERT(num_workers > 0);

    workers_.reserve(num_workers);
    for (std::size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }

    LOG_DEBUG("Started worker pool with {} workers, queue limit {}", num_workers, max_queue);
}

WorkerPool::~WorkerPool() {
    {
        std::scoped_lock lock{mutex_};
        stopping_ = true;
    }

    cv_.notify_all();

    // jthread destructors join once the queue is drained
}

std::size_t WorkerPool::queued() const {
    std::scoped_lock lock{mutex_};
    return queue_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock lock{mutex_};
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

            if (queue_.empty()) {
                // stopping_ and nothing left to do
                return;
            }

            task = std::move(queue_.front());
            queue_.pop_front();
        }

        // packaged_task stores any exception in the future
        task();
    }
}

} // namespace assessgrader
