#include "modelsmith/worker_pool.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace modelsmith
{

worker_pool::worker_pool(std::size_t thread_count, std::size_t capacity, task_processor processor)
    : processor_(std::move(processor))
    , capacity_(capacity)
{
    if (!processor_)
    {
        throw std::invalid_argument("task_processor must not be empty");
    }

    if (thread_count == 0)
    {
        throw std::invalid_argument("thread_count must be at least 1");
    }

    if (capacity == 0)
    {
        throw std::invalid_argument("capacity must be at least 1");
    }

    workers_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i)
    {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

worker_pool::~worker_pool()
{
    shutdown();
}

std::expected<void, error> worker_pool::enqueue(std::string task_id)
{
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_)
        {
            return std::unexpected(error{error_code::unavailable, "Worker pool is shut down"});
        }
        if (queue_.size() >= capacity_)
        {
            return std::unexpected(
                error{error_code::queue_full, "Task queue is full (" + std::to_string(capacity_) + " pending)"});
        }
        queue_.push_back(std::move(task_id));
    }

    cv_.notify_one();
    return {};
}

bool worker_pool::remove(const std::string& task_id)
{
    std::lock_guard lock(mutex_);
    const auto it = std::ranges::find(queue_, task_id);
    if (it == queue_.end())
    {
        return false;
    }
    queue_.erase(it);
    return true;
}

std::vector<std::string> worker_pool::pending() const
{
    std::lock_guard lock(mutex_);
    return {queue_.begin(), queue_.end()};
}

std::vector<std::string> worker_pool::close()
{
    std::vector<std::string> drained;
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
        drained.assign(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
        queue_.clear();
    }

    cv_.notify_all();
    return drained;
}

void worker_pool::join()
{
    for (auto& worker : workers_)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    workers_.clear();
}

void worker_pool::shutdown()
{
    static_cast<void>(close());
    join();
}

bool worker_pool::is_shutdown() const noexcept
{
    std::lock_guard lock(mutex_);
    return shutting_down_;
}

void worker_pool::worker_loop()
{
    while (true)
    {
        std::string next;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [&] { return shutting_down_ || !queue_.empty(); });

            if (queue_.empty())
            {
                break;
            }

            next = std::move(queue_.front());
            queue_.pop_front();
        }

        processor_(next);
    }
}

} // namespace modelsmith
