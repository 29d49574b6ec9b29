#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "modelsmith/error.h"

namespace modelsmith
{

/**
 * @brief A fixed set of worker threads draining a bounded FIFO of task ids.
 *
 * The pool knows nothing about task state. It hands each id to the processor
 * exactly once, in admission order. Exceptions thrown by the processor are not
 * caught.
 */
class worker_pool
{
public:
    using task_processor = std::function<void(const std::string& task_id)>;

    worker_pool(std::size_t thread_count, std::size_t capacity, task_processor processor);
    ~worker_pool();

    // non-copyable, non-movable
    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;
    worker_pool(worker_pool&&) = delete;
    worker_pool& operator=(worker_pool&&) = delete;

    // Fails with queue_full at capacity and with unavailable after close().
    [[nodiscard]] std::expected<void, error> enqueue(std::string task_id);

    // Removes a queued id; false when a worker already took it (or it was never queued).
    [[nodiscard]] bool remove(const std::string& task_id);

    [[nodiscard]] std::vector<std::string> pending() const;

    // Stops admission and returns the ids that were still queued. Running ids finish normally.
    std::vector<std::string> close();
    void join();
    void shutdown();
    [[nodiscard]] bool is_shutdown() const noexcept;

private:
    void worker_loop();

    task_processor processor_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    std::vector<std::thread> workers_;
    bool shutting_down_{false};
};

} // namespace modelsmith
