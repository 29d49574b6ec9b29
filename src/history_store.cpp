#include "history_store.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "modelsmith/json_utils.h"
#include "modelsmith/logger.h"

namespace
{
using modelsmith::task_snapshot;
using modelsmith::utils::from_epoch_ms;
using modelsmith::utils::to_epoch_ms;

nlohmann::json to_record(const task_snapshot& snapshot)
{
    nlohmann::json record;
    record["id"] = snapshot.id;
    record["state"] = std::string{modelsmith::to_string(snapshot.state)};
    record["progress"] = snapshot.progress;
    record["created_at_ms"] = to_epoch_ms(snapshot.created_at);
    if (snapshot.started_at)
    {
        record["started_at_ms"] = to_epoch_ms(*snapshot.started_at);
    }
    if (snapshot.finished_at)
    {
        record["finished_at_ms"] = to_epoch_ms(*snapshot.finished_at);
    }
    if (snapshot.result_ref)
    {
        record["result_ref"] = *snapshot.result_ref;
    }
    if (snapshot.error)
    {
        record["error"] = *snapshot.error;
    }
    record["format"] = std::string{modelsmith::to_string(snapshot.format)};
    record["primary_file"] = snapshot.primary_file;
    if (snapshot.callback_url)
    {
        record["callback_url"] = *snapshot.callback_url;
    }
    record["log_ref"] = snapshot.log_ref;
    return record;
}

std::optional<task_snapshot> from_record(const nlohmann::json& record)
{
    const auto state = modelsmith::parse_task_state(record.value("state", std::string{}));
    const auto format = modelsmith::parse_model_format(record.value("format", std::string{}));
    if (!state || !format || !record.contains("id") || !record.contains("created_at_ms"))
    {
        return std::nullopt;
    }

    task_snapshot snapshot;
    snapshot.id = record.at("id").get<std::string>();
    snapshot.state = *state;
    snapshot.progress = record.value("progress", 0.0f);
    snapshot.created_at = from_epoch_ms(record.at("created_at_ms").get<std::int64_t>());
    if (record.contains("started_at_ms"))
    {
        snapshot.started_at = from_epoch_ms(record.at("started_at_ms").get<std::int64_t>());
    }
    if (record.contains("finished_at_ms"))
    {
        snapshot.finished_at = from_epoch_ms(record.at("finished_at_ms").get<std::int64_t>());
    }
    if (record.contains("result_ref"))
    {
        snapshot.result_ref = record.at("result_ref").get<std::string>();
    }
    if (record.contains("error"))
    {
        snapshot.error = record.at("error").get<std::string>();
    }
    snapshot.format = *format;
    snapshot.primary_file = record.value("primary_file", std::string{});
    if (record.contains("callback_url"))
    {
        snapshot.callback_url = record.at("callback_url").get<std::string>();
    }
    snapshot.log_ref = record.value("log_ref", std::string{});
    snapshot.historical = true;
    return snapshot;
}
} // namespace

namespace modelsmith
{

history_store::history_store(std::filesystem::path path) : path_(std::move(path)) {}

std::expected<void, error> history_store::append(const task_snapshot& snapshot)
{
    if (!is_terminal(snapshot.state))
    {
        return std::unexpected(error{error_code::validation, "Only terminal tasks belong in history"});
    }

    const auto line = to_record(snapshot).dump();

    std::lock_guard lock(mutex_);
    std::error_code ec;
    if (path_.has_parent_path())
    {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec)
        {
            return std::unexpected(error{error_code::io, "Failed to create history directory: " + ec.message()});
        }
    }

    std::ofstream out(path_, std::ios::binary | std::ios::app);
    if (!out)
    {
        return std::unexpected(error{error_code::io, "Failed to open history file " + path_.string()});
    }
    out << line << '\n';
    out.flush();
    if (!out)
    {
        return std::unexpected(error{error_code::io, "Failed while writing history file " + path_.string()});
    }
    return {};
}

std::expected<std::vector<task_snapshot>, error> history_store::load() const
{
    std::lock_guard lock(mutex_);

    std::vector<task_snapshot> records;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
    {
        return records;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in)
    {
        return std::unexpected(error{error_code::io, "Failed to open history file " + path_.string()});
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line))
    {
        ++line_number;
        if (line.empty())
        {
            continue;
        }

        try
        {
            if (auto snapshot = from_record(nlohmann::json::parse(line)))
            {
                records.push_back(std::move(*snapshot));
                continue;
            }
        }
        catch (const nlohmann::json::exception& ex)
        {
            log::warn("History line " + std::to_string(line_number) + " is not valid JSON: " + ex.what());
            continue;
        }
        log::warn("History line " + std::to_string(line_number) + " is missing required fields");
    }
    return records;
}

} // namespace modelsmith
