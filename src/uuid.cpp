#include "uuid.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <random>

namespace modelsmith::utils
{
namespace
{
std::mt19937_64& generator()
{
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::mutex g_generator_mutex;
} // namespace

std::string make_uuid()
{
    std::array<std::uint8_t, 16> bytes{};
    {
        std::lock_guard lock(g_generator_mutex);
        std::uniform_int_distribution<int> dist(0, 255);
        std::ranges::generate(bytes, [&] { return static_cast<std::uint8_t>(dist(generator())); });
    }

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    constexpr auto hex = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
        {
            id += '-';
        }
        id += hex[bytes[i] >> 4];
        id += hex[bytes[i] & 0x0F];
    }
    return id;
}

bool is_safe_identifier(const std::string& value)
{
    if (value.empty() || value.size() > 128)
    {
        return false;
    }
    return std::ranges::all_of(value,
                               [](unsigned char c)
                               { return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.'; }) &&
           value != "." && value != "..";
}
} // namespace modelsmith::utils
