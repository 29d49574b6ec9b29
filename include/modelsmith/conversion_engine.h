/**
 * @file conversion_engine.h
 * @brief Interface for the routine that turns a model bundle into an artifact.
 *
 * The task manager treats the engine as a black box. Implementations must
 * poll the cancel token at bounded intervals and return an error once they
 * observe it.
 */
#pragma once

#include <atomic>
#include <expected>
#include <functional>
#include <string>

#include "modelsmith/conversion_options.h"
#include "modelsmith/model_bundle.h"

namespace modelsmith
{

struct conversion_engine
{
    // A negative percent carries a log line without a progress update.
    using progress_callback = std::function<void(float percent, const std::string& message)>;

    virtual ~conversion_engine() = default;

    // Returns the content reference of the produced artifact, or the failure detail.
    virtual std::expected<std::string, std::string> convert(const model_bundle& bundle,
                                                            const conversion_options& options,
                                                            const progress_callback& on_progress,
                                                            const std::atomic_bool& cancel_token) = 0;
};

} // namespace modelsmith
