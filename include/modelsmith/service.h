/**
 * @file service.h
 * @brief High-level submission API for modelsmith conversions.
 *
 * ::modelsmith::service wires the content store, the input classifier, the
 * task manager and the notifier together. Front ends (the HTTP daemon, tests)
 * only talk to this class.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "modelsmith/callback_transport.h"
#include "modelsmith/content_store.h"
#include "modelsmith/conversion_engine.h"
#include "modelsmith/conversion_options.h"
#include "modelsmith/error.h"
#include "modelsmith/model_bundle.h"
#include "modelsmith/task.h"

namespace modelsmith
{

class task_manager;

struct uploaded_file
{
    std::string name;
    std::string bytes;
};

struct conversion_request
{
    std::vector<uploaded_file> files;
    nlohmann::json options{}; // overrides applied on top of the configured defaults
    std::optional<std::string> task_id{};
    std::optional<std::string> callback_url{};
};

struct submission
{
    std::string task_id;
    model_bundle bundle;
};

struct artifact
{
    std::string file_name;
    std::string bytes;
};

struct runtime_config
{
    // Holds store/, logs/, work/ and history.jsonl.
    std::filesystem::path data_root;
    std::size_t worker_count{4};
    std::size_t queue_capacity{64};
    std::string converter_command{};
    conversion_options defaults{};

    // Replace the external converter or the HTTP callbacks (mainly for tests).
    std::shared_ptr<conversion_engine> engine{};
    std::shared_ptr<callback_transport> transport{};
};

class service
{
public:
    static std::expected<std::unique_ptr<service>, error> create(runtime_config runtime);

    /**
     * @brief Stores the uploads, classifies them and queues a task.
     *
     * Stored uploads are removed again when the request is rejected.
     */
    [[nodiscard]] std::expected<submission, error> submit(conversion_request request) const;

    [[nodiscard]] std::expected<task_snapshot, error> get(const std::string& task_id) const;
    [[nodiscard]] std::vector<task_snapshot> list(task_filter filter = {}) const;
    std::expected<void, error> cancel(const std::string& task_id) const;
    [[nodiscard]] std::vector<task_snapshot> history() const;
    [[nodiscard]] std::expected<std::string, error> read_log(const std::string& task_id) const;

    // The converted file of a COMPLETED task.
    [[nodiscard]] std::expected<artifact, error> fetch_artifact(const std::string& task_id) const;

    [[nodiscard]] const conversion_options& defaults() const noexcept
    {
        return defaults_;
    }

    void shutdown() const;

    service(const service&) = delete;
    service& operator=(const service&) = delete;
    service(service&&) = delete;
    service& operator=(service&&) = delete;
    ~service();

private:
    service(std::shared_ptr<content_store> store, std::unique_ptr<task_manager> manager, conversion_options defaults);

    void discard(const std::vector<std::string>& refs) const;

    std::shared_ptr<content_store> store_;
    std::unique_ptr<task_manager> manager_;
    conversion_options defaults_;
};

} // namespace modelsmith
