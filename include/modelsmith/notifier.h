#pragma once

#include <atomic>
#include <cstddef>
#include <memory>

#include <nlohmann/json.hpp>

#include "modelsmith/callback_transport.h"
#include "modelsmith/task.h"

namespace modelsmith
{

/**
 * @brief Best-effort completion callbacks.
 *
 * One delivery attempt per terminal task; a failed delivery is logged and
 * dropped. Callers run ::modelsmith::notifier::notify on a dispatcher thread.
 */
class notifier
{
public:
    explicit notifier(std::shared_ptr<callback_transport> transport);

    // Returns true when a callback was delivered. Snapshots without a callback_url are skipped.
    bool notify(const task_snapshot& snapshot);

    static nlohmann::json payload(const task_snapshot& snapshot);

    [[nodiscard]] std::size_t delivered() const noexcept
    {
        return delivered_.load();
    }
    [[nodiscard]] std::size_t dropped() const noexcept
    {
        return dropped_.load();
    }

private:
    std::shared_ptr<callback_transport> transport_;
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> dropped_{0};
};

} // namespace modelsmith
