/**
 * @file callback_transport.h
 * @brief Interface for delivering completion callbacks.
 *
 * The default ::modelsmith::http_callback_transport POSTs the payload as JSON.
 * Implement this interface to route notifications elsewhere (a message
 * queue, a test recorder).
 */
#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace modelsmith
{

struct callback_transport
{
    virtual ~callback_transport() = default;
    virtual std::expected<void, std::string> deliver(std::string_view url, const nlohmann::json& payload) = 0;
};

} // namespace modelsmith
