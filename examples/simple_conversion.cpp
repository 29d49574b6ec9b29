#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

#include "modelsmith/service.h"

namespace
{
const std::filesystem::path kDataRoot = "build/modelsmith_example";

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}
} // namespace

// Usage: simple_conversion "<converter command>" <model file> [companion files...]
int main(int argc, char** argv)
{
    using namespace modelsmith;

    if (argc < 3)
    {
        std::cerr << "Usage: " << argv[0] << " <converter command> <model file> [more files...]" << std::endl;
        return 1;
    }

    runtime_config runtime;
    runtime.data_root = kDataRoot;
    runtime.worker_count = 1;
    runtime.converter_command = argv[1];
    runtime.defaults.target_platform = "rk3588";

    auto get_service = service::create(std::move(runtime));
    if (!get_service)
    {
        std::cerr << "Failed to create modelsmith service: " << get_service.error().message << std::endl;
        return 1;
    }
    auto& modelsmith_service = *get_service;

    conversion_request request;
    for (int i = 2; i < argc; ++i)
    {
        const std::filesystem::path path{argv[i]};
        request.files.push_back(uploaded_file{path.filename().string(), read_file(path)});
    }
    request.options = {{"optimization_level", 3}};

    const auto submitted = modelsmith_service->submit(std::move(request));
    if (!submitted)
    {
        std::cerr << "Failed to submit task: " << submitted.error().message << std::endl;
        return 1;
    }
    std::cout << std::format("Task {} accepted as {} ({})",
                             submitted->task_id,
                             to_string(submitted->bundle.format),
                             submitted->bundle.primary_file().name)
              << std::endl;

    float last_progress = -1.0f;
    while (true)
    {
        const auto snapshot = modelsmith_service->get(submitted->task_id);
        if (!snapshot)
        {
            std::cerr << "Lost track of task: " << snapshot.error().message << std::endl;
            return 1;
        }
        if (snapshot->progress != last_progress)
        {
            last_progress = snapshot->progress;
            std::cout << std::format("{:<9} {:>5.1f}%", to_string(snapshot->state), snapshot->progress) << std::endl;
        }
        if (is_terminal(snapshot->state))
        {
            if (snapshot->state != task_state::completed)
            {
                std::cerr << "Conversion " << to_string(snapshot->state) << ": " << snapshot->error.value_or("")
                          << std::endl;
                return 1;
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    const auto artifact = modelsmith_service->fetch_artifact(submitted->task_id);
    if (!artifact)
    {
        std::cerr << "Failed to fetch artifact: " << artifact.error().message << std::endl;
        return 1;
    }

    const auto output = std::filesystem::current_path() / artifact->file_name;
    std::ofstream(output, std::ios::binary) << artifact->bytes;
    std::cout << "RKNN model written to: " << output << std::endl;
    return 0;
}
