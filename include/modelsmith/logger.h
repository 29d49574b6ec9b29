/**
 * @file logger.h
 * @brief Process-wide leveled logging to stderr.
 *
 * The threshold comes from MODELSMITH_LOG_LEVEL (error, warn, info, debug)
 * unless ::modelsmith::log::set_level is called.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace modelsmith::log
{

enum class level : std::uint8_t
{
    error = 0,
    warn = 1,
    info = 2,
    debug = 3
};

void set_level(level threshold) noexcept;
[[nodiscard]] level current_level() noexcept;
std::optional<level> parse_level(std::string_view name);
std::string_view level_name(level severity) noexcept;

void write(level severity, std::string_view message) noexcept;

inline void error(std::string_view message) noexcept
{
    write(level::error, message);
}
inline void warn(std::string_view message) noexcept
{
    write(level::warn, message);
}
inline void info(std::string_view message) noexcept
{
    write(level::info, message);
}
inline void debug(std::string_view message) noexcept
{
    write(level::debug, message);
}

} // namespace modelsmith::log
