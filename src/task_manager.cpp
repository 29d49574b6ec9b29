#include "modelsmith/task_manager.h"

#include <algorithm>
#include <mutex>
#include <ranges>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "history_store.h"
#include "modelsmith/dispatcher.h"
#include "modelsmith/logger.h"
#include "modelsmith/worker_pool.h"
#include "task_log.h"
#include "uuid.h"

namespace modelsmith
{

struct task_manager::task_record
{
    task_record(std::string task_id,
                model_bundle task_bundle,
                conversion_options task_options,
                std::optional<std::string> url,
                std::string log)
        : id(std::move(task_id))
        , bundle(std::move(task_bundle))
        , options(std::move(task_options))
        , callback_url(std::move(url))
        , log_ref(std::move(log))
        , created_at(task_clock::now())
    {
    }

    const std::string id;
    const model_bundle bundle;
    const conversion_options options;
    const std::optional<std::string> callback_url;
    const std::string log_ref;
    const task_clock::time_point created_at;
    std::atomic_bool cancel_token{false};

    // Guards everything below.
    mutable std::mutex mutex;
    task_state state{task_state::pending};
    float progress{0.0f};
    std::optional<task_clock::time_point> started_at{};
    std::optional<task_clock::time_point> finished_at{};
    std::optional<std::string> result_ref{};
    std::optional<std::string> error{};
    bool engine_invoked{false};

    void transition(task_state to)
    {
        if (!is_valid_transition(state, to))
        {
            throw std::logic_error("Illegal transition of task " + id + " from " + std::string{to_string(state)} +
                                   " to " + std::string{to_string(to)});
        }
        state = to;
    }

    [[nodiscard]] task_snapshot snapshot_locked() const
    {
        task_snapshot snapshot;
        snapshot.id = id;
        snapshot.state = state;
        snapshot.progress = progress;
        snapshot.created_at = created_at;
        snapshot.started_at = started_at;
        snapshot.finished_at = finished_at;
        snapshot.result_ref = result_ref;
        snapshot.error = error;
        snapshot.format = bundle.format;
        snapshot.primary_file = bundle.primary_file().name;
        snapshot.callback_url = callback_url;
        snapshot.log_ref = log_ref;
        return snapshot;
    }

    [[nodiscard]] task_snapshot snapshot() const
    {
        std::lock_guard lock(mutex);
        return snapshot_locked();
    }
};

namespace
{
std::unexpected<error> fail(error_code code, std::string message)
{
    return std::unexpected(error{code, std::move(message)});
}

void sort_newest_first(std::vector<task_snapshot>& snapshots)
{
    std::ranges::stable_sort(snapshots,
                             [](const task_snapshot& lhs, const task_snapshot& rhs)
                             { return lhs.created_at > rhs.created_at; });
}

bool is_callback_url(const std::string& url)
{
    return url.starts_with("http://") || url.starts_with("https://");
}
} // namespace

std::expected<std::unique_ptr<task_manager>, error> task_manager::create(task_manager_config config,
                                                                         std::shared_ptr<conversion_engine> engine,
                                                                         std::shared_ptr<notifier> notifications,
                                                                         cleanup_hook cleanup)
{
    if (!engine)
    {
        return fail(error_code::validation, "conversion_engine is required");
    }
    if (config.worker_count == 0)
    {
        return fail(error_code::validation, "worker_count must be at least 1");
    }
    if (config.queue_capacity == 0)
    {
        return fail(error_code::validation, "queue_capacity must be at least 1");
    }
    if (config.dispatcher_threads == 0)
    {
        return fail(error_code::validation, "dispatcher_threads must be at least 1");
    }
    if (config.logs_root.empty())
    {
        return fail(error_code::validation, "logs_root is required");
    }
    if (config.history_path.empty())
    {
        return fail(error_code::validation, "history_path is required");
    }

    auto history = std::make_unique<history_store>(config.history_path);
    auto past = history->load();
    if (!past)
    {
        return std::unexpected(past.error());
    }
    log::info("Loaded " + std::to_string(past->size()) + " historical task(s) from " + config.history_path.string());

    return std::unique_ptr<task_manager>(new task_manager(std::move(config),
                                                          std::move(engine),
                                                          std::move(notifications),
                                                          std::move(cleanup),
                                                          std::move(history),
                                                          std::move(past.value())));
}

task_manager::task_manager(task_manager_config config,
                           std::shared_ptr<conversion_engine> engine,
                           std::shared_ptr<notifier> notifications,
                           cleanup_hook cleanup,
                           std::unique_ptr<history_store> history,
                           std::vector<task_snapshot> past)
    : config_(std::move(config))
    , engine_(std::move(engine))
    , notifier_(std::move(notifications))
    , cleanup_(std::move(cleanup))
    , logs_(std::make_unique<task_log_book>(config_.logs_root))
    , history_(std::move(history))
    , past_(std::move(past))
    , dispatcher_(std::make_unique<dispatcher>(config_.dispatcher_threads))
    , pool_(std::make_unique<worker_pool>(config_.worker_count,
                                          config_.queue_capacity,
                                          [this](const std::string& task_id) { process(task_id); }))
{
}

task_manager::~task_manager()
{
    shutdown();
}

std::expected<std::string, error> task_manager::submit(model_bundle bundle,
                                                       conversion_options options,
                                                       submit_options extra)
{
    if (auto valid = validate_bundle(bundle); !valid)
    {
        return std::unexpected(valid.error());
    }
    if (auto valid = options.validate(); !valid)
    {
        return std::unexpected(valid.error());
    }
    if (extra.callback_url && !is_callback_url(*extra.callback_url))
    {
        return fail(error_code::validation, "callback_url must be an http(s) URL");
    }
    if (extra.task_id && !utils::is_safe_identifier(*extra.task_id))
    {
        return fail(error_code::validation, "task_id may only contain letters, digits, '-', '_' and '.'");
    }
    if (stopping_.load())
    {
        return fail(error_code::unavailable, "Task manager is shutting down");
    }

    const auto task_id = extra.task_id.value_or(utils::make_uuid());

    std::unique_lock lock(registry_mutex_);
    if (tasks_.contains(task_id))
    {
        return fail(error_code::duplicate_task, "Task " + task_id + " already exists");
    }

    auto log_ref = logs_->create(task_id);
    if (!log_ref)
    {
        return std::unexpected(log_ref.error());
    }

    auto record = std::make_shared<task_record>(
        task_id, std::move(bundle), std::move(options), std::move(extra.callback_url), std::move(log_ref.value()));

    // The record becomes visible to workers together with the queue entry.
    if (auto queued = pool_->enqueue(task_id); !queued)
    {
        std::error_code ec;
        std::filesystem::remove(logs_->path_for(task_id), ec);
        return std::unexpected(queued.error());
    }
    tasks_.emplace(task_id, record);
    lock.unlock();

    logs_->append(task_id,
                  log::level::info,
                  "Task submitted: format " + std::string{to_string(record->bundle.format)} + ", primary file " +
                      record->bundle.primary_file().name + ", target " + record->options.target_platform);
    logs_->append(task_id, log::level::debug, "Options: " + record->options.to_json().dump());
    log::info("Task " + task_id + " queued");
    return task_id;
}

std::shared_ptr<task_manager::task_record> task_manager::find(const std::string& task_id) const
{
    std::shared_lock lock(registry_mutex_);
    const auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : it->second;
}

const task_snapshot* task_manager::find_past(const std::string& task_id) const
{
    const auto it =
        std::find_if(past_.rbegin(), past_.rend(), [&](const task_snapshot& past) { return past.id == task_id; });
    return it == past_.rend() ? nullptr : &*it;
}

std::expected<task_snapshot, error> task_manager::get(const std::string& task_id) const
{
    if (const auto record = find(task_id))
    {
        return record->snapshot();
    }
    if (const auto* past = find_past(task_id))
    {
        return *past;
    }
    return fail(error_code::not_found, "Task " + task_id + " not found");
}

std::vector<task_snapshot> task_manager::list(task_filter filter) const
{
    std::vector<std::shared_ptr<task_record>> records;
    {
        std::shared_lock lock(registry_mutex_);
        records.reserve(tasks_.size());
        for (const auto& record : tasks_ | std::views::values)
        {
            records.push_back(record);
        }
    }

    const auto matches = [&](const task_snapshot& snapshot)
    { return !filter.state || snapshot.state == *filter.state; };

    std::vector<task_snapshot> snapshots;
    std::unordered_map<std::string, bool> live;
    for (const auto& record : records)
    {
        live.emplace(record->id, true);
        if (auto snapshot = record->snapshot(); matches(snapshot))
        {
            snapshots.push_back(std::move(snapshot));
        }
    }

    for (const auto& past : past_ | std::views::reverse)
    {
        // Only the newest record per id, and never one a live task shadows.
        if (!live.emplace(past.id, false).second)
        {
            continue;
        }
        if (matches(past))
        {
            snapshots.push_back(past);
        }
    }

    sort_newest_first(snapshots);
    return snapshots;
}

std::vector<task_snapshot> task_manager::history() const
{
    auto snapshots = list();
    std::erase_if(snapshots, [](const task_snapshot& snapshot) { return !is_terminal(snapshot.state); });
    std::ranges::stable_sort(snapshots,
                             [](const task_snapshot& lhs, const task_snapshot& rhs)
                             {
                                 return lhs.finished_at.value_or(lhs.created_at) >
                                        rhs.finished_at.value_or(rhs.created_at);
                             });
    return snapshots;
}

std::expected<std::string, error> task_manager::read_log(const std::string& task_id) const
{
    if (!find(task_id) && !find_past(task_id))
    {
        return fail(error_code::not_found, "Task " + task_id + " not found");
    }
    return logs_->read(task_id);
}

std::expected<void, error> task_manager::cancel(const std::string& task_id)
{
    const auto record = find(task_id);
    if (!record)
    {
        if (find_past(task_id))
        {
            return fail(error_code::already_terminal, "Task " + task_id + " already finished");
        }
        return fail(error_code::not_found, "Task " + task_id + " not found");
    }

    std::optional<task_snapshot> cancelled;
    {
        std::lock_guard lock(record->mutex);
        if (is_terminal(record->state))
        {
            return fail(error_code::already_terminal,
                        "Task " + task_id + " is already " + std::string{to_string(record->state)});
        }

        if (record->state == task_state::running)
        {
            if (!record->cancel_token.exchange(true))
            {
                logs_->append(task_id, log::level::warn, "Cancellation requested");
                log::info("Cancellation requested for running task " + task_id);
            }
            return {};
        }

        cancelled = cancel_pending(*record);
    }

    if (cancelled)
    {
        finalize(*record, *cancelled);
    }
    return {};
}

std::optional<task_snapshot> task_manager::cancel_pending(task_record& record)
{
    if (record.state != task_state::pending)
    {
        return std::nullopt;
    }

    record.cancel_token.store(true);
    // A worker may already hold the id; it finds the task CANCELLED and skips it.
    static_cast<void>(pool_->remove(record.id));
    record.transition(task_state::cancelled);
    record.finished_at = task_clock::now();
    return record.snapshot_locked();
}

void task_manager::process(const std::string& task_id)
{
    const auto record = find(task_id);
    if (!record)
    {
        throw std::logic_error("Dequeued unknown task " + task_id);
    }

    std::optional<task_snapshot> skipped;
    {
        std::lock_guard lock(record->mutex);
        if (record->state != task_state::pending)
        {
            return;
        }
        if (record->engine_invoked)
        {
            throw std::logic_error("Task " + task_id + " dequeued twice");
        }
        if (record->cancel_token.load())
        {
            record->transition(task_state::cancelled);
            record->finished_at = task_clock::now();
            skipped = record->snapshot_locked();
        }
        else
        {
            record->transition(task_state::running);
            record->started_at = task_clock::now();
            record->engine_invoked = true;
        }
    }

    if (skipped)
    {
        finalize(*record, *skipped);
        return;
    }

    logs_->append(task_id, log::level::info, "Conversion started");
    log::info("Task " + task_id + " running");

    const conversion_engine::progress_callback on_progress = [this, &record](float percent, const std::string& message)
    {
        if (percent >= 0.0f)
        {
            std::lock_guard lock(record->mutex);
            if (record->state != task_state::running)
            {
                return;
            }
            record->progress = std::max(record->progress, std::clamp(percent, 0.0f, 100.0f));
        }

        if (!message.empty())
        {
            logs_->append(record->id, log::level::info, message);
        }
    };

    std::expected<std::string, std::string> outcome;
    try
    {
        outcome = engine_->convert(record->bundle, record->options, on_progress, record->cancel_token);
    }
    catch (const std::exception& ex)
    {
        outcome = std::unexpected(std::string{"Conversion engine failed: "} + ex.what());
    }
    catch (...)
    {
        outcome = std::unexpected(std::string{"Conversion engine failed: unknown error"});
    }

    task_snapshot snapshot;
    {
        std::lock_guard lock(record->mutex);
        if (outcome)
        {
            record->transition(task_state::completed);
            record->progress = 100.0f;
            record->result_ref = outcome.value();
        }
        else if (record->cancel_token.load())
        {
            record->transition(task_state::cancelled);
        }
        else
        {
            record->transition(task_state::failed);
            record->error = outcome.error();
        }
        record->finished_at = task_clock::now();
        snapshot = record->snapshot_locked();
    }

    if (!outcome && snapshot.state == task_state::cancelled)
    {
        logs_->append(task_id, log::level::info, "Engine stopped after cancellation: " + outcome.error());
    }
    finalize(*record, snapshot);
}

void task_manager::finalize(const task_record& record, const task_snapshot& snapshot)
{
    switch (snapshot.state)
    {
    case task_state::completed:
        logs_->append(record.id, log::level::info, "Conversion completed: " + snapshot.result_ref.value_or(""));
        break;
    case task_state::failed:
        logs_->append(record.id, log::level::error, "Conversion failed: " + snapshot.error.value_or(""));
        break;
    default:
        logs_->append(record.id, log::level::warn, "Task cancelled");
        break;
    }
    log::info("Task " + record.id + " " + std::string{to_string(snapshot.state)});

    if (auto appended = history_->append(snapshot); !appended)
    {
        log::error("Failed to record task " + record.id + " in history: " + appended.error().message);
    }

    if (notifier_ && snapshot.callback_url)
    {
        if (!dispatcher_->post("notify " + record.id, [n = notifier_, snapshot] { n->notify(snapshot); }))
        {
            log::warn("Dropped callback for task " + record.id + ": dispatcher stopped");
        }
    }

    if (cleanup_ && (snapshot.state == task_state::failed || snapshot.state == task_state::cancelled))
    {
        if (!dispatcher_->post("cleanup " + record.id,
                               [hook = cleanup_, snapshot, bundle = record.bundle] { hook(snapshot, bundle); }))
        {
            log::warn("Skipped cleanup for task " + record.id + ": dispatcher stopped");
        }
    }
}

void task_manager::shutdown()
{
    if (stopping_.exchange(true))
    {
        return;
    }

    log::info("Task manager shutting down");
    for (const auto& task_id : pool_->close())
    {
        const auto record = find(task_id);
        if (!record)
        {
            continue;
        }

        std::optional<task_snapshot> cancelled;
        {
            std::lock_guard lock(record->mutex);
            cancelled = cancel_pending(*record);
        }
        if (cancelled)
        {
            finalize(*record, *cancelled);
        }
    }

    {
        std::shared_lock lock(registry_mutex_);
        for (const auto& record : tasks_ | std::views::values)
        {
            record->cancel_token.store(true);
        }
    }

    pool_->join();
    dispatcher_->shutdown();
}

} // namespace modelsmith
