/**
 * @file task.h
 * @brief Task lifecycle states and the snapshot shape handed to callers.
 *
 * Snapshots are copies; holding one never blocks the task manager.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "modelsmith/model_bundle.h"

namespace modelsmith
{

using task_clock = std::chrono::system_clock;

enum class task_state
{
    pending,
    running,
    completed,
    failed,
    cancelled
};

std::string_view to_string(task_state state);
std::optional<task_state> parse_task_state(std::string_view value);

constexpr bool is_terminal(task_state state) noexcept
{
    return state == task_state::completed || state == task_state::failed || state == task_state::cancelled;
}

// PENDING -> RUNNING -> {COMPLETED, FAILED, CANCELLED}, PENDING -> CANCELLED.
constexpr bool is_valid_transition(task_state from, task_state to) noexcept
{
    switch (from)
    {
    case task_state::pending:
        return to == task_state::running || to == task_state::cancelled;
    case task_state::running:
        return to == task_state::completed || to == task_state::failed || to == task_state::cancelled;
    default:
        return false;
    }
}

struct task_snapshot
{
    std::string id;
    task_state state{task_state::pending};
    float progress{0.0f};
    task_clock::time_point created_at{};
    std::optional<task_clock::time_point> started_at{};
    std::optional<task_clock::time_point> finished_at{};
    std::optional<std::string> result_ref{};
    std::optional<std::string> error{};
    model_format format{model_format::onnx};
    std::string primary_file{};
    std::optional<std::string> callback_url{};
    std::string log_ref{};
    bool historical{false}; // loaded from an earlier run's history

    bool operator==(const task_snapshot&) const = default;
};

struct task_filter
{
    std::optional<task_state> state{};
};

} // namespace modelsmith
