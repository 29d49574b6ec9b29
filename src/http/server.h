#pragma once

#include <atomic>
// clang-format off
#include <exception>
#include <functional>
#include <crow.h>
#include <crow/middlewares/cors.h>
// clang-format on
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "modelsmith/service.h"

namespace modelsmith::http
{

struct config
{
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{8080};
    std::size_t max_upload_bytes{500ULL * 1024 * 1024};
    runtime_config runtime{};
};

/**
 * @brief REST front end for task submission, status, logs and downloads.
 */
class server
{
public:
    explicit server(config cfg);
    // Serves an existing service instead of creating one from cfg.runtime.
    server(config cfg, std::unique_ptr<service> svc);
    ~server();

    server(const server&) = delete;
    server& operator=(const server&) = delete;
    server(server&&) = delete;
    server& operator=(server&&) = delete;

    void start();
    void stop();

private:
    void run();
    void register_routes();
    crow::response handle_post_task(const crow::request& req) const;
    crow::response handle_list_tasks(const crow::request& req) const;
    crow::response handle_get_task(const std::string& id) const;
    crow::response handle_delete_task(const std::string& id) const;
    crow::response handle_task_log(const std::string& id) const;
    crow::response handle_history() const;
    crow::response handle_download(const std::string& id) const;

    config config_{};
    std::unique_ptr<service> svc_;
    crow::App<crow::CORSHandler> app_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    friend class server_test_hook;
};

} // namespace modelsmith::http
