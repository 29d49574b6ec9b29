/**
 * @file error.h
 * @brief Error values returned across the modelsmith API.
 */
#pragma once

#include <string>
#include <string_view>

namespace modelsmith
{

enum class error_code
{
    ambiguous_input,
    unsupported_format,
    missing_role,
    validation,
    queue_full,
    not_found,
    already_terminal,
    duplicate_task,
    unavailable,
    io
};

struct error
{
    error_code code{error_code::validation};
    std::string message{};
};

constexpr std::string_view to_string(error_code code)
{
    switch (code)
    {
    case error_code::ambiguous_input:
        return "ambiguous_input";
    case error_code::unsupported_format:
        return "unsupported_format";
    case error_code::missing_role:
        return "missing_role";
    case error_code::validation:
        return "validation";
    case error_code::queue_full:
        return "queue_full";
    case error_code::not_found:
        return "not_found";
    case error_code::already_terminal:
        return "already_terminal";
    case error_code::duplicate_task:
        return "duplicate_task";
    case error_code::unavailable:
        return "unavailable";
    case error_code::io:
        return "io";
    }
    return "unknown";
}

// Classification failures are rejected before a task exists.
constexpr bool is_classification_error(error_code code) noexcept
{
    return code == error_code::ambiguous_input || code == error_code::unsupported_format ||
           code == error_code::missing_role;
}

} // namespace modelsmith
