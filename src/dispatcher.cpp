#include "modelsmith/dispatcher.h"

#include <exception>
#include <stdexcept>
#include <utility>

#include "modelsmith/logger.h"

namespace modelsmith
{

dispatcher::dispatcher(std::size_t thread_count)
{
    if (thread_count == 0)
    {
        throw std::invalid_argument("thread_count must be at least 1");
    }

    threads_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i)
    {
        threads_.emplace_back([this]() { run_loop(); });
    }
}

dispatcher::~dispatcher()
{
    shutdown();
}

bool dispatcher::post(std::string label, work_item item)
{
    if (!item)
    {
        return false;
    }

    {
        std::lock_guard lock(mutex_);
        if (shutting_down_)
        {
            return false;
        }
        queue_.push_back(queued_item{std::move(label), std::move(item)});
    }

    cv_.notify_one();
    return true;
}

void dispatcher::shutdown()
{
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_)
        {
            return;
        }
        shutting_down_ = true;
    }

    cv_.notify_all();

    for (auto& thread : threads_)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
    threads_.clear();
}

void dispatcher::run_loop()
{
    while (true)
    {
        queued_item next;
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

        try
        {
            next.item();
        }
        catch (const std::exception& ex)
        {
            log::warn("Dispatched work '" + next.label + "' failed: " + ex.what());
        }
    }
}

} // namespace modelsmith
