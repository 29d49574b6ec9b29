#include "modelsmith/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

#include "modelsmith/json_utils.h"

namespace modelsmith::log
{
namespace
{
std::mutex g_write_mutex;
std::atomic<int> g_level{-1};

level level_from_env() noexcept
{
    if (const auto* value = std::getenv("MODELSMITH_LOG_LEVEL"))
    {
        if (const auto parsed = parse_level(value))
        {
            return *parsed;
        }
    }
    return level::info;
}
} // namespace

void set_level(level threshold) noexcept
{
    g_level.store(static_cast<int>(threshold));
}

level current_level() noexcept
{
    auto value = g_level.load();
    if (value < 0)
    {
        value = static_cast<int>(level_from_env());
        g_level.store(value);
    }
    return static_cast<level>(value);
}

std::optional<level> parse_level(std::string_view name)
{
    std::string lower{name};
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "error")
    {
        return level::error;
    }
    if (lower == "warn" || lower == "warning")
    {
        return level::warn;
    }
    if (lower == "info")
    {
        return level::info;
    }
    if (lower == "debug" || lower == "trace")
    {
        return level::debug;
    }
    return std::nullopt;
}

std::string_view level_name(level severity) noexcept
{
    switch (severity)
    {
    case level::error:
        return "ERROR";
    case level::warn:
        return "WARN ";
    case level::info:
        return "INFO ";
    case level::debug:
        return "DEBUG";
    }
    return "?????";
}

void write(level severity, std::string_view message) noexcept
{
    if (static_cast<int>(severity) > static_cast<int>(current_level()))
    {
        return;
    }

    try
    {
        std::ostringstream line;
        line << '[' << utils::format_timestamp(task_clock::now()) << "] [" << level_name(severity) << "] [T"
             << std::this_thread::get_id() << "] " << message << '\n';

        std::lock_guard lock(g_write_mutex);
        std::cerr << line.str();
    }
    catch (const std::exception&)
    {
        // Nowhere left to report a failing log sink.
    }
}
} // namespace modelsmith::log
