#include "server.h"

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "modelsmith/json_utils.h"
#include "modelsmith/logger.h"

namespace modelsmith::http
{

namespace
{
constexpr std::string_view k_version = "0.1.0";

crow::response json_response(int code, const nlohmann::json& body)
{
    crow::response response{code, body.dump()};
    response.set_header("Content-Type", "application/json");
    return response;
}

int status_for(error_code code)
{
    switch (code)
    {
    case error_code::ambiguous_input:
    case error_code::unsupported_format:
    case error_code::missing_role:
    case error_code::validation:
        return crow::status::BAD_REQUEST;
    case error_code::not_found:
        return crow::status::NOT_FOUND;
    case error_code::already_terminal:
    case error_code::duplicate_task:
        return crow::status::CONFLICT;
    case error_code::queue_full:
    case error_code::unavailable:
        return crow::status::SERVICE_UNAVAILABLE;
    case error_code::io:
        return crow::status::INTERNAL_SERVER_ERROR;
    }
    return crow::status::INTERNAL_SERVER_ERROR;
}

crow::response error_response(int code, std::string_view kind, const std::string& message)
{
    return json_response(code, {{"error", std::string{kind}}, {"message", message}});
}

crow::response error_response(const error& err)
{
    return error_response(status_for(err.code), to_string(err.code), err.message);
}

crow::response service_unavailable()
{
    return error_response(crow::status::SERVICE_UNAVAILABLE, "unavailable", "service not ready");
}

nlohmann::json task_list(const std::vector<task_snapshot>& snapshots)
{
    auto tasks = nlohmann::json::array();
    for (const auto& snapshot : snapshots)
    {
        tasks.push_back(utils::snapshot_to_json(snapshot));
    }
    return {{"tasks", tasks}, {"total", snapshots.size()}};
}

std::optional<std::string> header_param(const crow::multipart::part& part, const std::string& key)
{
    const auto& [_, params] = crow::multipart::get_header_object(part.headers, "Content-Disposition");
    if (const auto it = params.find(key); it != params.end())
    {
        return it->second;
    }
    return std::nullopt;
}
} // namespace

server::server(config cfg) : config_(std::move(cfg)) {}

server::server(config cfg, std::unique_ptr<service> svc) : config_(std::move(cfg)), svc_(std::move(svc)) {}

server::~server()
{
    stop();
}

void server::start()
{
    if (running_.exchange(true))
    {
        return;
    }

    if (!svc_)
    {
        if (auto created = service::create(config_.runtime); created)
        {
            svc_ = std::move(*created);
        }
        else
        {
            log::error("Failed to start conversion service: " + created.error().message);
        }
    }

    thread_ = std::thread([this] { run(); });
}

void server::stop()
{
    if (!running_.exchange(false))
    {
        return;
    }

    app_.stop();

    if (thread_.joinable())
    {
        thread_.join();
    }

    if (svc_)
    {
        svc_->shutdown();
    }
}

void server::run()
{
    register_routes();
    app_.loglevel(crow::LogLevel::Warning);
    app_.bindaddr(config_.bind_address).port(config_.port).multithreaded().run();
}

crow::response server::handle_post_task(const crow::request& req) const
{
    if (!svc_)
    {
        return service_unavailable();
    }

    if (req.body.size() > config_.max_upload_bytes)
    {
        return error_response(crow::status::PAYLOAD_TOO_LARGE,
                              "validation",
                              "upload exceeds " + std::to_string(config_.max_upload_bytes) + " bytes");
    }

    if (const auto content_type = req.get_header_value("Content-Type");
        content_type.find("multipart/form-data") == std::string::npos)
    {
        return error_response(crow::status::BAD_REQUEST, "validation", "multipart/form-data required");
    }

    crow::multipart::message msg(req);
    conversion_request request;

    for (const auto& [name, part] : msg.part_map)
    {
        if (name == "config")
        {
            if (part.body.empty())
            {
                continue;
            }
            try
            {
                request.options = nlohmann::json::parse(part.body);
            }
            catch (const nlohmann::json::parse_error& ex)
            {
                return error_response(
                    crow::status::BAD_REQUEST, "validation", std::string{"invalid config JSON: "} + ex.what());
            }
            continue;
        }
        if (name == "callback_url")
        {
            if (!part.body.empty())
            {
                request.callback_url = part.body;
            }
            continue;
        }
        if (name == "task_id")
        {
            if (!part.body.empty())
            {
                request.task_id = part.body;
            }
            continue;
        }

        const auto filename = header_param(part, "filename");
        if (name.find("file") != std::string::npos && filename && !filename->empty())
        {
            request.files.push_back(uploaded_file{*filename, part.body});
        }
    }

    if (request.files.empty())
    {
        return error_response(crow::status::BAD_REQUEST, "validation", "at least one file field is required");
    }

    auto submitted = svc_->submit(std::move(request));
    if (!submitted)
    {
        return error_response(submitted.error());
    }

    nlohmann::json files = nlohmann::json::object();
    for (const auto& [role, file] : submitted->bundle.roles)
    {
        files[role] = file.name;
    }

    nlohmann::json body;
    body["task_id"] = submitted->task_id;
    body["status"] = std::string{to_string(task_state::pending)};
    body["model_type"] = std::string{to_string(submitted->bundle.format)};
    body["primary_file"] = submitted->bundle.primary_file().name;
    body["files"] = files;
    return json_response(crow::status::ACCEPTED, body);
}

crow::response server::handle_list_tasks(const crow::request& req) const
{
    if (!svc_)
    {
        return service_unavailable();
    }

    task_filter filter;
    if (const char* status = req.url_params.get("status"))
    {
        filter.state = parse_task_state(status);
        if (!filter.state)
        {
            return error_response(crow::status::BAD_REQUEST, "validation", std::string{"unknown status: "} + status);
        }
    }
    return json_response(crow::status::OK, task_list(svc_->list(filter)));
}

crow::response server::handle_get_task(const std::string& id) const
{
    if (!svc_)
    {
        return service_unavailable();
    }

    const auto snapshot = svc_->get(id);
    if (!snapshot)
    {
        return error_response(snapshot.error());
    }
    return json_response(crow::status::OK, utils::snapshot_to_json(*snapshot));
}

crow::response server::handle_delete_task(const std::string& id) const
{
    if (!svc_)
    {
        return service_unavailable();
    }

    if (const auto cancelled = svc_->cancel(id); !cancelled)
    {
        return error_response(cancelled.error());
    }

    nlohmann::json body{{"task_id", id}, {"message", "cancellation requested"}};
    if (const auto snapshot = svc_->get(id))
    {
        body["status"] = std::string{to_string(snapshot->state)};
    }
    return json_response(crow::status::OK, body);
}

crow::response server::handle_task_log(const std::string& id) const
{
    if (!svc_)
    {
        return service_unavailable();
    }

    const auto text = svc_->read_log(id);
    if (!text)
    {
        return error_response(text.error());
    }
    crow::response response{crow::status::OK, *text};
    response.set_header("Content-Type", "text/plain; charset=utf-8");
    return response;
}

crow::response server::handle_history() const
{
    if (!svc_)
    {
        return service_unavailable();
    }
    return json_response(crow::status::OK, task_list(svc_->history()));
}

crow::response server::handle_download(const std::string& id) const
{
    if (!svc_)
    {
        return service_unavailable();
    }

    auto file = svc_->fetch_artifact(id);
    if (!file)
    {
        if (file.error().code == error_code::validation)
        {
            return error_response(crow::status::CONFLICT, "not_completed", file.error().message);
        }
        return error_response(file.error());
    }

    crow::response response{crow::status::OK, std::move(file->bytes)};
    response.set_header("Content-Type", "application/octet-stream");
    response.set_header("Content-Disposition", "attachment; filename=\"" + file->file_name + "\"");
    return response;
}

void server::register_routes()
{
    CROW_ROUTE(app_, "/health")(
        []
        {
            return json_response(crow::status::OK, {{"status", "healthy"}, {"version", std::string{k_version}}});
        });

    CROW_ROUTE(app_, "/api/tasks")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST)(
            [&](const crow::request& request)
            {
                if (request.method == crow::HTTPMethod::POST)
                {
                    return handle_post_task(request);
                }
                return handle_list_tasks(request);
            });

    CROW_ROUTE(app_, "/api/tasks/<string>")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::DELETE)(
            [&](const crow::request& request, const std::string& task_id)
            {
                if (request.method == crow::HTTPMethod::DELETE)
                {
                    return handle_delete_task(task_id);
                }
                return handle_get_task(task_id);
            });

    CROW_ROUTE(app_, "/api/tasks/<string>/logs")([&](const std::string& task_id) { return handle_task_log(task_id); });

    CROW_ROUTE(app_, "/api/history")([&] { return handle_history(); });

    CROW_ROUTE(app_, "/api/download/<string>")([&](const std::string& task_id) { return handle_download(task_id); });
}

} // namespace modelsmith::http
