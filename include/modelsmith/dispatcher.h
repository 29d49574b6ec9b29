#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace modelsmith
{

/**
 * @brief Runs fire-and-forget work (callbacks, cleanup) off the worker path.
 *
 * Work items run in submission order per thread. A work item that throws is
 * logged and dropped; it never affects the caller that posted it.
 */
class dispatcher
{
public:
    using work_item = std::function<void()>;

    explicit dispatcher(std::size_t thread_count = 1);
    ~dispatcher();

    // non-copyable, non-movable
    dispatcher(const dispatcher&) = delete;
    dispatcher& operator=(const dispatcher&) = delete;
    dispatcher(dispatcher&&) = delete;
    dispatcher& operator=(dispatcher&&) = delete;

    // Returns false once shutdown has started; the item is not run then.
    bool post(std::string label, work_item item);

    // Runs everything already posted, then joins the threads.
    void shutdown();

private:
    struct queued_item
    {
        std::string label;
        work_item item;
    };

    void run_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<queued_item> queue_;
    std::vector<std::thread> threads_;
    bool shutting_down_{false};
};

} // namespace modelsmith
