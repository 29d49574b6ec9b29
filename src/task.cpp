#include "modelsmith/task.h"

#include <array>
#include <utility>

namespace
{
constexpr std::array<std::pair<modelsmith::task_state, std::string_view>, 5> k_state_names{{
    {modelsmith::task_state::pending, "pending"},
    {modelsmith::task_state::running, "running"},
    {modelsmith::task_state::completed, "completed"},
    {modelsmith::task_state::failed, "failed"},
    {modelsmith::task_state::cancelled, "cancelled"},
}};
} // namespace

namespace modelsmith
{

std::string_view to_string(task_state state)
{
    for (const auto& [value, name] : k_state_names)
    {
        if (value == state)
        {
            return name;
        }
    }
    return "unknown";
}

std::optional<task_state> parse_task_state(std::string_view value)
{
    for (const auto& [state, name] : k_state_names)
    {
        if (name == value)
        {
            return state;
        }
    }
    return std::nullopt;
}

} // namespace modelsmith
