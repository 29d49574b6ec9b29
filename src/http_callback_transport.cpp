#include "modelsmith/http_callback_transport.h"

#include <curl/curl.h>

namespace modelsmith
{
namespace
{
// Response bodies are not interesting; only the status code is.
size_t discard_callback(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/)
{
    return size * nmemb;
}
} // namespace

http_callback_transport::http_callback_transport(std::chrono::seconds timeout) : timeout_(timeout)
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

http_callback_transport::~http_callback_transport()
{
    curl_global_cleanup();
}

std::expected<void, std::string> http_callback_transport::deliver(std::string_view url, const nlohmann::json& payload)
{
    if (!url.starts_with("http://") && !url.starts_with("https://"))
    {
        return std::unexpected("Unsupported callback URL: " + std::string(url));
    }

    CURL* handle = curl_easy_init();
    if (!handle)
    {
        return std::unexpected("Failed to initialize libcurl");
    }

    const auto body = payload.dump();
    const std::string target(url);

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(handle, CURLOPT_URL, target.c_str());
    curl_easy_setopt(handle, CURLOPT_POST, 1L);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, discard_callback);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

    const auto result = curl_easy_perform(handle);
    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(handle);

    if (result != CURLE_OK)
    {
        return std::unexpected(std::string{"curl error: "} + curl_easy_strerror(result));
    }
    if (status < 200 || status >= 300)
    {
        return std::unexpected("Callback endpoint answered HTTP " + std::to_string(status));
    }
    return {};
}

} // namespace modelsmith
