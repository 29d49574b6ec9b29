#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "modelsmith/error.h"
#include "modelsmith/logger.h"

namespace modelsmith
{

// Per-task append-only log files named "task_<id>.log" below one directory.
// Writers to different tasks never wait on each other.
class task_log_book
{
public:
    explicit task_log_book(std::filesystem::path root);

    // Creates (or truncates) the task's log and returns its reference.
    std::expected<std::string, error> create(const std::string& task_id);

    // Failures are reported on the process log; task logs never fail a task.
    void append(const std::string& task_id, log::level severity, std::string_view message);

    [[nodiscard]] std::expected<std::string, error> read(const std::string& task_id) const;
    [[nodiscard]] std::filesystem::path path_for(const std::string& task_id) const;

private:
    std::shared_ptr<std::mutex> lock_for(const std::string& task_id) const;

    std::filesystem::path root_;
    mutable std::shared_mutex locks_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace modelsmith
