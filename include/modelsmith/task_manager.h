/**
 * @file task_manager.h
 * @brief Registry, queue, worker pool and state machine for conversion tasks.
 *
 * ::modelsmith::task_manager is the only writer of task state. Submissions are
 * validated synchronously and queued in FIFO order; a fixed number of worker
 * threads run the ::modelsmith::conversion_engine. Terminal tasks are appended
 * to a history file and announced through the notifier and the cleanup hook,
 * both dispatched off the worker threads.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "modelsmith/conversion_engine.h"
#include "modelsmith/conversion_options.h"
#include "modelsmith/error.h"
#include "modelsmith/model_bundle.h"
#include "modelsmith/notifier.h"
#include "modelsmith/task.h"

namespace modelsmith
{

class dispatcher;
class history_store;
class task_log_book;
class worker_pool;

struct submit_options
{
    std::optional<std::string> task_id{};
    std::optional<std::string> callback_url{};
};

struct task_manager_config
{
    std::size_t worker_count{4};
    std::size_t queue_capacity{64};
    std::size_t dispatcher_threads{1};
    std::filesystem::path logs_root;
    std::filesystem::path history_path;
};

// Invoked once per task that ends FAILED or CANCELLED, on a dispatcher thread.
using cleanup_hook = std::function<void(const task_snapshot& snapshot, const model_bundle& bundle)>;

class task_manager
{
public:
    static std::expected<std::unique_ptr<task_manager>, error> create(task_manager_config config,
                                                                      std::shared_ptr<conversion_engine> engine,
                                                                      std::shared_ptr<notifier> notifications = {},
                                                                      cleanup_hook cleanup = {});

    /**
     * @brief Validates and queues a conversion.
     *
     * Never waits for execution. On error no task is left behind.
     * @return The task id (client supplied or a generated UUID).
     */
    [[nodiscard]] std::expected<std::string, error> submit(model_bundle bundle,
                                                           conversion_options options,
                                                           submit_options extra = {});

    [[nodiscard]] std::expected<task_snapshot, error> get(const std::string& task_id) const;

    // Newest first, including records of earlier runs not shadowed by a live task.
    [[nodiscard]] std::vector<task_snapshot> list(task_filter filter = {}) const;

    /**
     * @brief Requests cancellation.
     *
     * A PENDING task is cancelled immediately and never reaches the engine.
     * A RUNNING task only gets its cancel token set; the engine observes it at
     * its next checkpoint. Repeating the call on a RUNNING task succeeds.
     */
    std::expected<void, error> cancel(const std::string& task_id);

    // Terminal tasks, newest first.
    [[nodiscard]] std::vector<task_snapshot> history() const;

    [[nodiscard]] std::expected<std::string, error> read_log(const std::string& task_id) const;

    // Stops admission, cancels queued tasks, signals running ones and waits for the workers.
    void shutdown();

    task_manager(const task_manager&) = delete;
    task_manager& operator=(const task_manager&) = delete;
    task_manager(task_manager&&) = delete;
    task_manager& operator=(task_manager&&) = delete;
    ~task_manager();

private:
    struct task_record;

    task_manager(task_manager_config config,
                 std::shared_ptr<conversion_engine> engine,
                 std::shared_ptr<notifier> notifications,
                 cleanup_hook cleanup,
                 std::unique_ptr<history_store> history,
                 std::vector<task_snapshot> past);

    [[nodiscard]] std::shared_ptr<task_record> find(const std::string& task_id) const;
    [[nodiscard]] const task_snapshot* find_past(const std::string& task_id) const;

    void process(const std::string& task_id);
    std::optional<task_snapshot> cancel_pending(task_record& record);
    void finalize(const task_record& record, const task_snapshot& snapshot);

    task_manager_config config_;
    std::shared_ptr<conversion_engine> engine_;
    std::shared_ptr<notifier> notifier_;
    cleanup_hook cleanup_;
    std::unique_ptr<task_log_book> logs_;
    std::unique_ptr<history_store> history_;
    const std::vector<task_snapshot> past_;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<task_record>> tasks_;

    std::atomic_bool stopping_{false};
    std::unique_ptr<dispatcher> dispatcher_;
    std::unique_ptr<worker_pool> pool_;
};

} // namespace modelsmith
