#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <nlohmann/json.hpp>

#include "modelsmith/json_utils.h"
#include "modelsmith/logger.h"
#include "server.h"

namespace
{
// Every field stays unset unless given on the command line, so flags can override the config file.
struct options
{
    std::optional<std::string> bind_address{};
    std::optional<std::uint16_t> port{};
    std::optional<std::filesystem::path> data_root{};
    std::optional<std::size_t> workers{};
    std::optional<std::size_t> queue_capacity{};
    std::optional<std::string> converter{};
    std::optional<std::size_t> max_upload_mb{};
    std::optional<std::string> log_level{};
    std::optional<std::filesystem::path> config_file{};
    bool help{false};
};

std::filesystem::path default_root()
{
    if (const auto env = std::getenv("MODELSMITH_HOME"))
    {
        return std::filesystem::path{env};
    }
    if (const auto home = std::getenv("HOME"))
    {
        return std::filesystem::path{home} / ".modelsmith";
    }
    return std::filesystem::current_path() / ".modelsmith";
}

void print_usage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [--bind-address ADDR] [--port PORT] [--data-root PATH] [--workers N]\n"
              << "             [--queue-capacity N] [--converter COMMAND] [--max-upload-mb N]\n"
              << "             [--log-level LEVEL] [--config FILE]\n\n"
              << "Defaults: bind 0.0.0.0, port 8080, data under $HOME/.modelsmith (or $MODELSMITH_HOME), 4 workers,\n"
              << "queue capacity 64, uploads up to 500 MB. Flags override values from the config file.\n";
}

std::optional<std::size_t> parse_count(const std::string& value, std::string_view name)
{
    try
    {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed == 0)
        {
            std::cerr << name << " must be a positive integer\n";
            return std::nullopt;
        }
        return parsed;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Invalid " << name << " value: " << ex.what() << "\n";
        return std::nullopt;
    }
}

std::optional<std::uint16_t> parse_port(const std::string& value)
{
    const auto parsed = parse_count(value, "--port");
    if (!parsed || *parsed > 65535)
    {
        std::cerr << "Port must be between 1 and 65535\n";
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(*parsed);
}

std::optional<options> parse_args(int argc, char* argv[])
{
    options opts{};

    auto parse_value = [](std::string_view arg, std::string_view name) -> std::optional<std::string_view>
    {
        if (arg == name)
        {
            return std::string_view{}; // value should follow
        }
        std::string prefix{name};
        prefix.push_back('=');
        if (arg.rfind(prefix, 0) == 0)
        {
            return arg.substr(prefix.size());
        }
        return std::nullopt;
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
            return opts;
        }

        std::optional<std::string> value;
        std::string_view flag;
        for (const std::string_view name : {"--bind-address",
                                            "--port",
                                            "--data-root",
                                            "--workers",
                                            "--queue-capacity",
                                            "--converter",
                                            "--max-upload-mb",
                                            "--log-level",
                                            "--config"})
        {
            if (const auto v = parse_value(arg, name))
            {
                flag = name;
                if (v->empty())
                {
                    if (i + 1 >= argc)
                    {
                        std::cerr << "Missing value for " << name << "\n";
                        return std::nullopt;
                    }
                    value = argv[++i];
                }
                else
                {
                    value = std::string{*v};
                }
                break;
            }
        }

        if (!value)
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }

        if (flag == "--bind-address")
        {
            opts.bind_address = *value;
        }
        else if (flag == "--port")
        {
            if (!(opts.port = parse_port(*value)))
            {
                return std::nullopt;
            }
        }
        else if (flag == "--data-root")
        {
            opts.data_root = std::filesystem::path{*value};
        }
        else if (flag == "--workers")
        {
            if (!(opts.workers = parse_count(*value, flag)))
            {
                return std::nullopt;
            }
        }
        else if (flag == "--queue-capacity")
        {
            if (!(opts.queue_capacity = parse_count(*value, flag)))
            {
                return std::nullopt;
            }
        }
        else if (flag == "--converter")
        {
            opts.converter = *value;
        }
        else if (flag == "--max-upload-mb")
        {
            if (!(opts.max_upload_mb = parse_count(*value, flag)))
            {
                return std::nullopt;
            }
        }
        else if (flag == "--log-level")
        {
            opts.log_level = *value;
        }
        else
        {
            opts.config_file = std::filesystem::path{*value};
        }
    }

    return opts;
}

// Fills the unset fields of opts from the config file. Returns false on a malformed file.
bool apply_config_file(options& opts, modelsmith::conversion_options& defaults)
{
    if (!opts.config_file)
    {
        return true;
    }

    auto doc = modelsmith::utils::load_json_file(*opts.config_file);
    if (!doc)
    {
        std::cerr << doc.error() << "\n";
        return false;
    }

    try
    {
        if (!opts.bind_address && doc->contains("bind_address"))
        {
            opts.bind_address = doc->at("bind_address").get<std::string>();
        }
        if (!opts.port && doc->contains("port"))
        {
            const auto port = doc->at("port").get<int>();
            if (port <= 0 || port > 65535)
            {
                std::cerr << "Port must be between 1 and 65535\n";
                return false;
            }
            opts.port = static_cast<std::uint16_t>(port);
        }
        if (!opts.data_root && doc->contains("data_root"))
        {
            opts.data_root = std::filesystem::path{doc->at("data_root").get<std::string>()};
        }
        if (!opts.workers && doc->contains("workers"))
        {
            opts.workers = doc->at("workers").get<std::size_t>();
        }
        if (!opts.queue_capacity && doc->contains("queue_capacity"))
        {
            opts.queue_capacity = doc->at("queue_capacity").get<std::size_t>();
        }
        if (!opts.converter && doc->contains("converter"))
        {
            opts.converter = doc->at("converter").get<std::string>();
        }
        if (!opts.max_upload_mb && doc->contains("max_upload_mb"))
        {
            opts.max_upload_mb = doc->at("max_upload_mb").get<std::size_t>();
        }
        if (!opts.log_level && doc->contains("log_level"))
        {
            opts.log_level = doc->at("log_level").get<std::string>();
        }
    }
    catch (const nlohmann::json::exception& ex)
    {
        std::cerr << "Invalid config file " << *opts.config_file << ": " << ex.what() << "\n";
        return false;
    }

    if (doc->contains("defaults"))
    {
        auto merged = defaults.merge_json(doc->at("defaults"));
        if (!merged)
        {
            std::cerr << "Invalid defaults in " << *opts.config_file << ": " << merged.error().message << "\n";
            return false;
        }
        defaults = std::move(merged.value());
    }
    return true;
}

volatile std::sig_atomic_t g_signal_status;

void signal_handler(int signal)
{
    g_signal_status = signal;
}

} // namespace

int main(int argc, char* argv[])
{
    auto parsed = parse_args(argc, argv);
    if (!parsed)
    {
        print_usage(argv[0]);
        return 1;
    }
    if (parsed->help)
    {
        print_usage(argv[0]);
        return 0;
    }

    modelsmith::conversion_options defaults{};
    if (!apply_config_file(*parsed, defaults))
    {
        return 1;
    }

    if (parsed->log_level)
    {
        const auto level = modelsmith::log::parse_level(*parsed->log_level);
        if (!level)
        {
            std::cerr << "Unknown log level: " << *parsed->log_level << "\n";
            return 1;
        }
        modelsmith::log::set_level(*level);
    }

    const auto data_root = parsed->data_root.value_or(default_root());
    std::error_code ec;
    std::filesystem::create_directories(data_root, ec);
    if (ec)
    {
        std::cerr << "Failed to create data directory at " << data_root << ": " << ec.message() << "\n";
        return 1;
    }

    if (!parsed->converter || parsed->converter->empty())
    {
        std::cerr << "A converter command is required (--converter or \"converter\" in the config file)\n";
        print_usage(argv[0]);
        return 1;
    }

    modelsmith::http::config cfg;
    cfg.bind_address = parsed->bind_address.value_or("0.0.0.0");
    cfg.port = parsed->port.value_or(8080);
    cfg.max_upload_bytes = parsed->max_upload_mb.value_or(500) * 1024 * 1024;
    cfg.runtime.data_root = data_root;
    cfg.runtime.worker_count = parsed->workers.value_or(4);
    cfg.runtime.queue_capacity = parsed->queue_capacity.value_or(64);
    cfg.runtime.converter_command = *parsed->converter;
    cfg.runtime.defaults = std::move(defaults);

    auto svc = modelsmith::service::create(cfg.runtime);
    if (!svc)
    {
        std::cerr << "Failed to start conversion service: " << svc.error().message << "\n";
        return 1;
    }

    modelsmith::http::server srv(cfg, std::move(svc.value()));
    srv.start();

    std::cout << "modelsmithd listening on " << cfg.bind_address << ":" << cfg.port << "\n";
    std::cout << "data_root=" << cfg.runtime.data_root << "\n";
    std::cout << "workers=" << cfg.runtime.worker_count << " queue_capacity=" << cfg.runtime.queue_capacity << "\n";
    std::cout << "converter=" << cfg.runtime.converter_command << "\n";
    std::cout << "Press Ctrl+C to stop\n";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    while (!g_signal_status)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    srv.stop();
    return 0;
}
