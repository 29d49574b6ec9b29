#pragma once

#include "modelsmith/callback_transport.h"

#include <chrono>

namespace modelsmith
{
class http_callback_transport final : public callback_transport
{
  public:
    explicit http_callback_transport(std::chrono::seconds timeout = std::chrono::seconds{10});
    ~http_callback_transport() override;

    http_callback_transport(const http_callback_transport&) = delete;
    http_callback_transport& operator=(const http_callback_transport&) = delete;

    std::expected<void, std::string> deliver(std::string_view url, const nlohmann::json& payload) override;

  private:
    std::chrono::seconds timeout_;
};
} // namespace modelsmith
