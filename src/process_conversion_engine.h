#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "modelsmith/content_store.h"
#include "modelsmith/conversion_engine.h"

namespace modelsmith
{

/**
 * @brief Runs an external converter command once per conversion.
 *
 * The command receives the path of a job description (JSON) as its last
 * argument, reports progress as "PROGRESS <percent> [message]" lines on
 * stdout and writes the artifact to the job's "output" path.
 */
class process_conversion_engine final : public conversion_engine
{
  public:
    process_conversion_engine(std::string command,
                              std::shared_ptr<filesystem_content_store> store,
                              std::filesystem::path work_root,
                              std::chrono::milliseconds kill_grace = std::chrono::seconds{5});

    std::expected<std::string, std::string> convert(const model_bundle& bundle,
                                                    const conversion_options& options,
                                                    const progress_callback& on_progress,
                                                    const std::atomic_bool& cancel_token) override;

  private:
    std::string command_;
    std::shared_ptr<filesystem_content_store> store_;
    std::filesystem::path work_root_;
    std::chrono::milliseconds kill_grace_;
};

} // namespace modelsmith
