#pragma once

#include <expected>
#include <filesystem>
#include <mutex>
#include <vector>

#include "modelsmith/error.h"
#include "modelsmith/task.h"

namespace modelsmith
{

/**
 * @brief Append-only JSON Lines record of terminal tasks.
 *
 * One line per terminal task. The file survives restarts; records read back
 * with ::modelsmith::history_store::load carry historical = true.
 */
class history_store
{
public:
    explicit history_store(std::filesystem::path path);

    std::expected<void, error> append(const task_snapshot& snapshot);

    // Oldest first. Malformed lines are skipped with a warning.
    [[nodiscard]] std::expected<std::vector<task_snapshot>, error> load() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return path_;
    }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

} // namespace modelsmith
