#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

#include "modelsmith/content_store.h"
#include "uuid.h"

namespace
{
using modelsmith::error;
using modelsmith::error_code;

constexpr std::size_t k_max_name_length = 100;

std::string sanitize_name(std::string_view hint)
{
    if (const auto slash = hint.find_last_of("/\\"); slash != std::string_view::npos)
    {
        hint.remove_prefix(slash + 1);
    }

    std::string name;
    name.reserve(hint.size());
    for (const char c : hint)
    {
        const auto uc = static_cast<unsigned char>(c);
        name += (std::isalnum(uc) != 0 || c == '.' || c == '-' || c == '_') ? c : '_';
    }

    if (name.empty() || name == "." || name == "..")
    {
        return "blob";
    }
    if (name.size() > k_max_name_length)
    {
        // Keep the tail so the extension survives.
        name.erase(0, name.size() - k_max_name_length);
    }
    return name;
}

std::unexpected<error> io_error(std::string message)
{
    return std::unexpected(error{error_code::io, std::move(message)});
}
} // namespace

namespace modelsmith
{

filesystem_content_store::filesystem_content_store(std::filesystem::path root) : root_(std::move(root)) {}

std::expected<filesystem_content_store, error> filesystem_content_store::create(std::filesystem::path root)
{
    if (root.empty())
    {
        return std::unexpected(error{error_code::validation, "content store root is required"});
    }

    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec)
    {
        return io_error("Failed to create content store root: " + ec.message());
    }

    auto absolute = std::filesystem::absolute(root, ec);
    if (ec)
    {
        return io_error("Failed to resolve content store root: " + ec.message());
    }
    return filesystem_content_store{absolute.lexically_normal()};
}

std::expected<std::filesystem::path, error> filesystem_content_store::allocate(std::string_view name_hint,
                                                                                std::string& ref) const
{
    const auto id = utils::make_uuid();
    const auto name = sanitize_name(name_hint);

    std::error_code ec;
    std::filesystem::create_directories(root_ / id, ec);
    if (ec)
    {
        return io_error("Failed to create object directory: " + ec.message());
    }

    ref = id + "/" + name;
    return root_ / id / name;
}

std::expected<std::filesystem::path, error> filesystem_content_store::resolve(std::string_view ref) const
{
    const auto slash = ref.find('/');
    if (slash == std::string_view::npos)
    {
        return std::unexpected(error{error_code::not_found, "Unknown content reference: " + std::string{ref}});
    }

    const std::string id{ref.substr(0, slash)};
    const std::string name{ref.substr(slash + 1)};
    if (!utils::is_safe_identifier(id) || !utils::is_safe_identifier(name))
    {
        return std::unexpected(error{error_code::not_found, "Unknown content reference: " + std::string{ref}});
    }
    return root_ / id / name;
}

std::expected<std::string, error> filesystem_content_store::put(std::string_view bytes, std::string_view name_hint)
{
    std::string ref;
    auto path = allocate(name_hint, ref);
    if (!path)
    {
        return std::unexpected(path.error());
    }

    std::ofstream output(*path, std::ios::binary);
    if (!output)
    {
        return io_error("Unable to open object file: " + path->string());
    }
    output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    output.close();
    if (!output)
    {
        return io_error("Failed to write object file: " + path->string());
    }
    return ref;
}

std::expected<std::string, error> filesystem_content_store::put_file(const std::filesystem::path& source,
                                                                     std::string_view name_hint)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec))
    {
        return std::unexpected(error{error_code::not_found, "No such file: " + source.string()});
    }

    std::string ref;
    auto path = allocate(name_hint.empty() ? source.filename().string() : name_hint, ref);
    if (!path)
    {
        return std::unexpected(path.error());
    }

    std::filesystem::rename(source, *path, ec);
    if (ec)
    {
        // Cross-device moves fail with EXDEV; fall back to a copy.
        ec.clear();
        std::filesystem::copy_file(source, *path, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
        {
            return io_error("Failed to store " + source.string() + ": " + ec.message());
        }
        std::filesystem::remove(source, ec);
    }
    return ref;
}

std::expected<std::string, error> filesystem_content_store::get(std::string_view ref) const
{
    auto path = locate(ref);
    if (!path)
    {
        return std::unexpected(path.error());
    }

    std::ifstream input(*path, std::ios::binary);
    if (!input)
    {
        return io_error("Unable to open object file: " + path->string());
    }
    return std::string{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

std::expected<void, error> filesystem_content_store::remove(std::string_view ref)
{
    auto path = resolve(ref);
    if (!path)
    {
        return std::unexpected(path.error());
    }

    std::error_code ec;
    if (!std::filesystem::exists(*path, ec))
    {
        return std::unexpected(error{error_code::not_found, "Unknown content reference: " + std::string{ref}});
    }

    std::filesystem::remove_all(path->parent_path(), ec);
    if (ec)
    {
        return io_error("Failed to remove " + std::string{ref} + ": " + ec.message());
    }
    return {};
}

std::expected<std::filesystem::path, error> filesystem_content_store::locate(std::string_view ref) const
{
    auto path = resolve(ref);
    if (!path)
    {
        return std::unexpected(path.error());
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(*path, ec))
    {
        return std::unexpected(error{error_code::not_found, "Unknown content reference: " + std::string{ref}});
    }
    return *path;
}

} // namespace modelsmith
