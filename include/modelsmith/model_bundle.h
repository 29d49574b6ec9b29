/**
 * @file model_bundle.h
 * @brief Model formats and the role-labelled file set that represents one
 *        convertible model.
 *
 * Bundles are produced by ::modelsmith::classify and never change afterwards.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "modelsmith/error.h"

namespace modelsmith
{

enum class model_format
{
    onnx,
    tflite,
    pytorch,
    caffe,
    darknet,
    tensorflow_frozen,
    tensorflow_savedmodel,
    tensorflow_checkpoint
};

struct model_format_info
{
    model_format format;
    std::string_view key;          // stable wire key, e.g. "tensorflow_savedmodel"
    std::string_view label;        // human readable label
    std::string_view primary_role; // role shown as the bundle's primary file
};

std::string_view to_string(model_format format);
std::optional<model_format> parse_model_format(std::string_view key);
const model_format_info& format_info(model_format format);

// Role names for sharded weights, e.g. shard_role("data", 1) == "data:1".
std::string shard_role(std::string_view prefix, std::size_t index);

/**
 * @brief Roles a bundle of @p format must carry.
 *
 * @p shard_count only matters for the TensorFlow SavedModel and checkpoint
 * formats, whose weights are split into numbered shards.
 */
std::vector<std::string> required_roles(model_format format, std::size_t shard_count = 1);
std::vector<std::string> optional_roles(model_format format);

struct bundle_file
{
    std::string name; // name as uploaded
    std::string ref;  // content store reference

    bool operator==(const bundle_file&) const = default;
};

struct model_bundle
{
    model_format format{model_format::onnx};
    std::map<std::string, bundle_file> roles;
    std::string primary_role;

    [[nodiscard]] const bundle_file& primary_file() const;
    [[nodiscard]] std::size_t shard_count() const;
    [[nodiscard]] std::vector<std::string> refs() const;
};

// Checks that the bundle's roles are exactly the format's required set plus
// optional roles.
std::expected<void, error> validate_bundle(const model_bundle& bundle);

} // namespace modelsmith
