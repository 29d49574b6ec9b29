#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "modelsmith/model_bundle.h"
#include "modelsmith/task.h"

namespace modelsmith::utils
{
std::expected<nlohmann::json, std::string> load_json_file(const std::filesystem::path& path,
                                                          std::optional<std::string> expected_extension = ".json");

// ISO-8601 UTC with millisecond precision, e.g. "2024-05-01T08:30:00.125Z".
std::string format_timestamp(task_clock::time_point time);

std::int64_t to_epoch_ms(task_clock::time_point time);
task_clock::time_point from_epoch_ms(std::int64_t ms);

// Shape returned to API clients and callback targets.
nlohmann::json snapshot_to_json(const task_snapshot& snapshot);
} // namespace modelsmith::utils
