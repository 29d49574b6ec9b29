// clang-format off
#include <exception>
#include <asio.hpp>
// clang-format on
#include <chrono>
#include <cstddef>
#include <curl/curl.h>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "http/server.h"
#include "support/fake_engine.h"
#include "support/fake_transport.h"
#include "support/task_helpers.h"
#include "support/temp_dir.h"

namespace
{

std::uint16_t pick_ephemeral_port()
{
    asio::io_context io;
    const asio::ip::tcp::acceptor acceptor(io, {asio::ip::make_address("127.0.0.1"), 0});
    return acceptor.local_endpoint().port();
}

struct http_response
{
    long status{0};
    std::string body;
};

std::optional<http_response> http_get(const std::string& url)
{
    CURL* curl = curl_easy_init();
    if (!curl)
    {
        return std::nullopt;
    }

    std::string buffer;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(
        curl,
        CURLOPT_WRITEFUNCTION,
        +[](char* ptr, std::size_t size, std::size_t nmemb, void* userdata)
        {
            const auto total = size * nmemb;
            auto* out = static_cast<std::string*>(userdata);
            out->append(ptr, total);
            return total;
        });
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 500L);

    if (const auto rc = curl_easy_perform(curl); rc != CURLE_OK)
    {
        curl_easy_cleanup(curl);
        return std::nullopt;
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);
    return http_response{status, std::move(buffer)};
}

class curl_global_guard
{
public:
    curl_global_guard()
    {
        curl_global_init(CURL_GLOBAL_ALL);
    }
    ~curl_global_guard()
    {
        curl_global_cleanup();
    }
};

struct form_part
{
    std::string name;
    std::optional<std::string> filename;
    std::string body;
};

crow::request multipart_request(const std::vector<form_part>& parts)
{
    std::string body;
    for (const auto& part : parts)
    {
        body += "--BOUNDARY\r\n";
        body += "Content-Disposition: form-data; name=\"" + part.name + "\"";
        if (part.filename)
        {
            body += "; filename=\"" + *part.filename + "\"";
        }
        body += "\r\n";
        body += "Content-Type: application/octet-stream\r\n\r\n";
        body += part.body;
        body += "\r\n";
    }
    body += "--BOUNDARY--\r\n";

    crow::request req;
    req.body = std::move(body);
    req.add_header("Content-Type", "multipart/form-data; boundary=BOUNDARY");
    return req;
}

// Service over a temp data root whose engine stores "rknn:<primary file>" as the artifact.
struct service_env
{
    explicit service_env(modelsmith::test::fake_engine::behavior gate_behavior = {})
    {
        auto created = modelsmith::filesystem_content_store::create(dir.path / "store");
        if (!created)
        {
            throw std::runtime_error(created.error().message);
        }
        auto store = std::make_shared<modelsmith::filesystem_content_store>(std::move(created.value()));

        engine = std::make_shared<modelsmith::test::fake_engine>(
            [store, gate_behavior](const modelsmith::model_bundle& bundle,
                                   const modelsmith::conversion_options& options,
                                   const modelsmith::conversion_engine::progress_callback& on_progress,
                                   const std::atomic_bool& cancel_token) -> std::expected<std::string, std::string>
            {
                if (gate_behavior)
                {
                    if (auto waited = gate_behavior(bundle, options, on_progress, cancel_token); !waited)
                    {
                        return waited;
                    }
                }
                auto ref = store->put("rknn:" + bundle.primary_file().name, "model.rknn");
                if (!ref)
                {
                    return std::unexpected(ref.error().message);
                }
                return ref.value();
            });
    }

    std::unique_ptr<modelsmith::service> make_service() const
    {
        modelsmith::runtime_config runtime;
        runtime.data_root = dir.path;
        runtime.worker_count = 1;
        runtime.engine = engine;
        runtime.transport = std::make_shared<modelsmith::test::fake_transport>();
        auto created = modelsmith::service::create(std::move(runtime));
        if (!created)
        {
            throw std::runtime_error(created.error().message);
        }
        return std::move(created.value());
    }

    modelsmith::test::temp_dir dir{"modelsmith-http"};
    std::shared_ptr<modelsmith::test::fake_engine> engine;
};

nlohmann::json body_of(const crow::response& resp)
{
    return nlohmann::json::parse(resp.body);
}
} // namespace

namespace modelsmith::http
{
class server_test_hook
{
public:
    static crow::response post_task(const server& srv, const crow::request& req)
    {
        return srv.handle_post_task(req);
    }

    static crow::response list_tasks(const server& srv, const crow::request& req)
    {
        return srv.handle_list_tasks(req);
    }

    static crow::response get_task(const server& srv, const std::string& id)
    {
        return srv.handle_get_task(id);
    }

    static crow::response delete_task(const server& srv, const std::string& id)
    {
        return srv.handle_delete_task(id);
    }

    static crow::response task_log(const server& srv, const std::string& id)
    {
        return srv.handle_task_log(id);
    }

    static crow::response history(const server& srv)
    {
        return srv.handle_history();
    }

    static crow::response download(const server& srv, const std::string& id)
    {
        return srv.handle_download(id);
    }

    static const service& svc(const server& srv)
    {
        return *srv.svc_;
    }
};
} // namespace modelsmith::http

using modelsmith::http::server_test_hook;

TEST(http_server_test, health_endpoint_reports_version)
{
    curl_global_guard curl_guard;
    const auto port = pick_ephemeral_port();
    service_env env;

    modelsmith::http::config cfg;
    cfg.bind_address = "127.0.0.1";
    cfg.port = port;

    modelsmith::http::server server(cfg, env.make_service());
    server.start();

    const auto base = "http://127.0.0.1:" + std::to_string(port);

    std::optional<http_response> resp;
    for (int attempt = 0; attempt < 10 && !resp; ++attempt)
    {
        resp = http_get(base + "/health");
        if (!resp)
            std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    const auto missing = http_get(base + "/api/tasks/does-not-exist");

    server.stop();

    ASSERT_TRUE(resp.has_value()) << "Server did not respond to /health";
    EXPECT_EQ(resp->status, 200);
    EXPECT_NE(resp->body.find(R"("status":"healthy")"), std::string::npos);
    EXPECT_NE(resp->body.find(R"("version":"0.1.0")"), std::string::npos);

    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->status, 404);

    const auto resp_after_stop = http_get(base + "/health");
    EXPECT_FALSE(resp_after_stop.has_value()) << "Server responded to /health after stop";
}

TEST(http_server_test, post_task_rejects_missing_file)
{
    service_env env;
    modelsmith::http::server srv({}, env.make_service());

    const auto resp = server_test_hook::post_task(srv, multipart_request({{"config", std::nullopt, "{}"}}));
    EXPECT_EQ(resp.code, crow::status::BAD_REQUEST);
    EXPECT_EQ(body_of(resp).at("error"), "validation");
}

TEST(http_server_test, post_task_rejects_non_multipart)
{
    service_env env;
    modelsmith::http::server srv({}, env.make_service());

    crow::request req;
    req.body = R"({"file":"model.onnx"})";
    req.add_header("Content-Type", "application/json");

    const auto resp = server_test_hook::post_task(srv, req);
    EXPECT_EQ(resp.code, crow::status::BAD_REQUEST);
}

TEST(http_server_test, post_task_rejects_bad_config_json)
{
    service_env env;
    modelsmith::http::server srv({}, env.make_service());

    const auto resp = server_test_hook::post_task(
        srv, multipart_request({{"file", "model.onnx", "onnx"}, {"config", "config.json", "not-json"}}));
    EXPECT_EQ(resp.code, crow::status::BAD_REQUEST);
    EXPECT_TRUE(env.engine->calls().empty());
}

TEST(http_server_test, post_task_rejects_large_upload)
{
    service_env env;
    modelsmith::http::config cfg;
    cfg.max_upload_bytes = 64;
    modelsmith::http::server srv(cfg, env.make_service());

    const auto resp =
        server_test_hook::post_task(srv, multipart_request({{"file", "model.onnx", std::string(1024, 'x')}}));
    EXPECT_EQ(resp.code, crow::status::PAYLOAD_TOO_LARGE);
}

TEST(http_server_test, post_task_maps_classification_errors)
{
    service_env env;
    modelsmith::http::server srv({}, env.make_service());

    const auto ambiguous = server_test_hook::post_task(
        srv, multipart_request({{"files", "a.onnx", "a"}, {"files", "b.tflite", "b"}}));
    EXPECT_EQ(ambiguous.code, crow::status::BAD_REQUEST);
    EXPECT_EQ(body_of(ambiguous).at("error"), "ambiguous_input");

    const auto missing = server_test_hook::post_task(srv, multipart_request({{"file", "yolov4.cfg", "[net]"}}));
    EXPECT_EQ(missing.code, crow::status::BAD_REQUEST);
    EXPECT_EQ(body_of(missing).at("error"), "missing_role");

    const auto unsupported = server_test_hook::post_task(srv, multipart_request({{"file", "model.bin", "?"}}));
    EXPECT_EQ(unsupported.code, crow::status::BAD_REQUEST);
    EXPECT_EQ(body_of(unsupported).at("error"), "unsupported_format");
}

TEST(http_server_test, post_task_accepts_caffe_pair_and_completes)
{
    service_env env;
    modelsmith::http::server srv({}, env.make_service());

    const auto resp = server_test_hook::post_task(
        srv,
        multipart_request({{"file1", "mobilenet.prototxt", "layer {}"},
                           {"file2", "mobilenet.caffemodel", "weights"},
                           {"config", std::nullopt, R"({"target_platform":"rk3566"})"},
                           {"task_id", std::nullopt, "caffe-1"}}));
    ASSERT_EQ(resp.code, crow::status::ACCEPTED) << resp.body;

    const auto body = body_of(resp);
    EXPECT_EQ(body.at("task_id"), "caffe-1");
    EXPECT_EQ(body.at("status"), "pending");
    EXPECT_EQ(body.at("model_type"), "caffe");
    EXPECT_EQ(body.at("primary_file"), "mobilenet.prototxt");
    EXPECT_EQ(body.at("files").at("weights"), "mobilenet.caffemodel");

    ASSERT_TRUE(modelsmith::test::wait_for_state(
        server_test_hook::svc(srv), "caffe-1", modelsmith::task_state::completed));

    const auto task = server_test_hook::get_task(srv, "caffe-1");
    EXPECT_EQ(task.code, crow::status::OK);
    EXPECT_EQ(body_of(task).at("status"), "completed");

    const auto download = server_test_hook::download(srv, "caffe-1");
    EXPECT_EQ(download.code, crow::status::OK);
    EXPECT_EQ(download.body, "rknn:mobilenet.prototxt");
    EXPECT_EQ(download.get_header_value("Content-Disposition"), "attachment; filename=\"model.rknn\"");

    const auto log = server_test_hook::task_log(srv, "caffe-1");
    EXPECT_EQ(log.code, crow::status::OK);
    EXPECT_NE(log.body.find("Conversion completed"), std::string::npos);

    const auto history = server_test_hook::history(srv);
    EXPECT_EQ(body_of(history).at("total"), 1);

    const auto again = server_test_hook::delete_task(srv, "caffe-1");
    EXPECT_EQ(again.code, crow::status::CONFLICT);
    EXPECT_EQ(body_of(again).at("error"), "already_terminal");

    const auto duplicate = server_test_hook::post_task(
        srv, multipart_request({{"file", "model.onnx", "onnx"}, {"task_id", std::nullopt, "caffe-1"}}));
    EXPECT_EQ(duplicate.code, crow::status::CONFLICT);
}

TEST(http_server_test, pending_task_can_be_cancelled_and_has_no_download)
{
    modelsmith::test::gate gate;
    service_env env(modelsmith::test::wait_on(gate));
    modelsmith::http::server srv({}, env.make_service());

    const auto first = server_test_hook::post_task(srv, multipart_request({{"file", "first.onnx", "a"}}));
    ASSERT_EQ(first.code, crow::status::ACCEPTED);
    ASSERT_TRUE(env.engine->wait_for_calls(1));
    const auto running_id = body_of(first).at("task_id").get<std::string>();

    const auto second = server_test_hook::post_task(srv, multipart_request({{"file", "second.onnx", "b"}}));
    ASSERT_EQ(second.code, crow::status::ACCEPTED);
    const auto pending_id = body_of(second).at("task_id").get<std::string>();

    const auto not_ready = server_test_hook::download(srv, running_id);
    EXPECT_EQ(not_ready.code, crow::status::CONFLICT);
    EXPECT_EQ(body_of(not_ready).at("error"), "not_completed");

    const auto cancelled = server_test_hook::delete_task(srv, pending_id);
    EXPECT_EQ(cancelled.code, crow::status::OK);
    EXPECT_EQ(body_of(cancelled).at("status"), "cancelled");

    crow::request pending_only;
    pending_only.url_params = crow::query_string("?status=cancelled");
    const auto listed = server_test_hook::list_tasks(srv, pending_only);
    EXPECT_EQ(listed.code, crow::status::OK);
    EXPECT_EQ(body_of(listed).at("total"), 1);
    EXPECT_EQ(body_of(listed).at("tasks").at(0).at("task_id"), pending_id);

    crow::request bad_filter;
    bad_filter.url_params = crow::query_string("?status=exploded");
    EXPECT_EQ(server_test_hook::list_tasks(srv, bad_filter).code, crow::status::BAD_REQUEST);

    gate.open();
}

TEST(http_server_test, unknown_task_returns_not_found)
{
    service_env env;
    modelsmith::http::server srv({}, env.make_service());

    EXPECT_EQ(server_test_hook::get_task(srv, "nope").code, crow::status::NOT_FOUND);
    EXPECT_EQ(server_test_hook::delete_task(srv, "nope").code, crow::status::NOT_FOUND);
    EXPECT_EQ(server_test_hook::task_log(srv, "nope").code, crow::status::NOT_FOUND);
    EXPECT_EQ(server_test_hook::download(srv, "nope").code, crow::status::NOT_FOUND);
}

TEST(http_server_test, service_unavailable_when_no_service)
{
    modelsmith::http::config cfg;
    modelsmith::http::server srv(cfg);

    const auto resp = server_test_hook::post_task(srv, multipart_request({{"file", "model.onnx", "onnx"}}));
    EXPECT_EQ(resp.code, crow::status::SERVICE_UNAVAILABLE);
}
