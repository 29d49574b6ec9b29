/**
 * @file content_store.h
 * @brief Byte storage for uploaded model files and produced artifacts.
 *
 * Implement ::modelsmith::content_store to back uploads with something other
 * than the local filesystem. References are opaque strings; only the store
 * that issued a reference can resolve it.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "modelsmith/error.h"

namespace modelsmith
{

struct content_store
{
    virtual ~content_store() = default;

    // Stores @p bytes and returns a new reference. @p name_hint only shapes the reference.
    virtual std::expected<std::string, error> put(std::string_view bytes, std::string_view name_hint) = 0;
    virtual std::expected<std::string, error> get(std::string_view ref) const = 0;
    virtual std::expected<void, error> remove(std::string_view ref) = 0;
};

/**
 * @brief Stores each object as a file below a root directory.
 *
 * A reference has the form "<id>/<name>", where the name is the sanitized
 * basename of the hint. Engines that need real paths use
 * ::modelsmith::filesystem_content_store::locate.
 */
class filesystem_content_store final : public content_store
{
public:
    static std::expected<filesystem_content_store, error> create(std::filesystem::path root);

    std::expected<std::string, error> put(std::string_view bytes, std::string_view name_hint) override;
    std::expected<std::string, error> get(std::string_view ref) const override;
    std::expected<void, error> remove(std::string_view ref) override;

    // Moves an existing file into the store (copying across filesystems).
    std::expected<std::string, error> put_file(const std::filesystem::path& source, std::string_view name_hint);
    [[nodiscard]] std::expected<std::filesystem::path, error> locate(std::string_view ref) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept
    {
        return root_;
    }

private:
    explicit filesystem_content_store(std::filesystem::path root);

    std::expected<std::filesystem::path, error> allocate(std::string_view name_hint, std::string& ref) const;
    std::expected<std::filesystem::path, error> resolve(std::string_view ref) const;

    std::filesystem::path root_;
};

} // namespace modelsmith
