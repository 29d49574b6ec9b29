#include "task_log.h"

#include <fstream>
#include <iterator>
#include <system_error>

#include "modelsmith/json_utils.h"

namespace modelsmith
{

task_log_book::task_log_book(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path task_log_book::path_for(const std::string& task_id) const
{
    return root_ / ("task_" + task_id + ".log");
}

std::shared_ptr<std::mutex> task_log_book::lock_for(const std::string& task_id) const
{
    {
        std::shared_lock lock(locks_mutex_);
        if (const auto it = locks_.find(task_id); it != locks_.end())
        {
            return it->second;
        }
    }

    std::unique_lock lock(locks_mutex_);
    auto& entry = locks_[task_id];
    if (!entry)
    {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

std::expected<std::string, error> task_log_book::create(const std::string& task_id)
{
    const auto task_mutex = lock_for(task_id);
    std::lock_guard lock(*task_mutex);

    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec)
    {
        return std::unexpected(error{error_code::io, "Failed to create log directory: " + ec.message()});
    }

    const auto path = path_for(task_id);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        return std::unexpected(error{error_code::io, "Failed to create task log " + path.string()});
    }
    return path.string();
}

void task_log_book::append(const std::string& task_id, log::level severity, std::string_view message)
{
    const auto path = path_for(task_id);
    std::string line = "[" + utils::format_timestamp(task_clock::now()) + "] [" +
                       std::string{log::level_name(severity)} + "] " + std::string{message} + "\n";

    const auto task_mutex = lock_for(task_id);
    std::lock_guard lock(*task_mutex);
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (out)
    {
        out << line;
    }
    if (!out)
    {
        log::warn("Failed to append to task log " + path.string());
    }
}

std::expected<std::string, error> task_log_book::read(const std::string& task_id) const
{
    const auto path = path_for(task_id);

    const auto task_mutex = lock_for(task_id);
    std::lock_guard lock(*task_mutex);
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return std::unexpected(error{error_code::not_found, "No log for task " + task_id});
    }
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace modelsmith
