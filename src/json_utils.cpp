#include "modelsmith/json_utils.h"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace modelsmith::utils
{
std::expected<nlohmann::json, std::string> load_json_file(const std::filesystem::path& path,
                                                          std::optional<std::string> expected_extension)
{
    if (expected_extension.has_value() && path.extension() != expected_extension.value())
    {
        return std::unexpected("Unexpected file extension: " + path.string());
    }

    std::ifstream input(path);
    if (!input)
    {
        return std::unexpected("Unable to open JSON file: " + path.string());
    }

    try
    {
        nlohmann::json doc;
        input >> doc;
        return doc;
    }
    catch (const nlohmann::json::exception& err)
    {
        return std::unexpected(std::string{"Failed to parse JSON file: "} + err.what());
    }
}

std::string format_timestamp(task_clock::time_point time)
{
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;
    const auto seconds = task_clock::to_time_t(time);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return out.str();
}

std::int64_t to_epoch_ms(task_clock::time_point time)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

task_clock::time_point from_epoch_ms(std::int64_t ms)
{
    return task_clock::time_point{std::chrono::duration_cast<task_clock::duration>(std::chrono::milliseconds{ms})};
}

nlohmann::json snapshot_to_json(const task_snapshot& snapshot)
{
    const auto optional_time = [](const std::optional<task_clock::time_point>& time)
    { return time ? nlohmann::json(format_timestamp(*time)) : nlohmann::json(nullptr); };
    const auto optional_string = [](const std::optional<std::string>& value)
    { return value ? nlohmann::json(*value) : nlohmann::json(nullptr); };

    nlohmann::json body;
    body["task_id"] = snapshot.id;
    body["status"] = std::string{to_string(snapshot.state)};
    body["progress"] = snapshot.progress;
    body["created_at"] = format_timestamp(snapshot.created_at);
    body["started_at"] = optional_time(snapshot.started_at);
    body["completed_at"] = optional_time(snapshot.finished_at);
    body["result_ref"] = optional_string(snapshot.result_ref);
    body["error_message"] = optional_string(snapshot.error);
    body["model_type"] = std::string{to_string(snapshot.format)};
    body["primary_file"] = snapshot.primary_file;
    body["is_historical"] = snapshot.historical;
    return body;
}
} // namespace modelsmith::utils
