#include "modelsmith/model_bundle.h"

#include <algorithm>
#include <array>
#include <ranges>
#include <stdexcept>
#include <unordered_set>

namespace
{
using modelsmith::model_format;
using modelsmith::model_format_info;

constexpr std::array k_formats{
    model_format_info{model_format::onnx, "onnx", "ONNX", "model"},
    model_format_info{model_format::tflite, "tflite", "TensorFlow Lite", "model"},
    model_format_info{model_format::pytorch, "pytorch", "PyTorch", "model"},
    model_format_info{model_format::caffe, "caffe", "Caffe", "graph"},
    model_format_info{model_format::darknet, "darknet", "Darknet", "config"},
    model_format_info{model_format::tensorflow_frozen, "tensorflow_frozen", "TensorFlow frozen graph", "graph"},
    model_format_info{model_format::tensorflow_savedmodel, "tensorflow_savedmodel", "TensorFlow SavedModel", "graph"},
    model_format_info{model_format::tensorflow_checkpoint, "tensorflow_checkpoint", "TensorFlow checkpoint", "graph"}};

constexpr std::string_view k_checkpoint_shard_prefix = "data";
constexpr std::string_view k_savedmodel_shard_prefix = "variables_data";

std::string_view shard_prefix(model_format format)
{
    switch (format)
    {
    case model_format::tensorflow_checkpoint:
        return k_checkpoint_shard_prefix;
    case model_format::tensorflow_savedmodel:
        return k_savedmodel_shard_prefix;
    default:
        return {};
    }
}
} // namespace

namespace modelsmith
{

std::string_view to_string(model_format format)
{
    return format_info(format).key;
}

std::optional<model_format> parse_model_format(std::string_view key)
{
    const auto it = std::ranges::find_if(k_formats, [key](const model_format_info& info) { return info.key == key; });
    if (it == k_formats.end())
    {
        return std::nullopt;
    }
    return it->format;
}

const model_format_info& format_info(model_format format)
{
    const auto it =
        std::ranges::find_if(k_formats, [format](const model_format_info& info) { return info.format == format; });
    if (it == k_formats.end())
    {
        throw std::logic_error("model format missing from format table");
    }
    return *it;
}

std::string shard_role(std::string_view prefix, std::size_t index)
{
    std::string role{prefix};
    role.push_back(':');
    role += std::to_string(index);
    return role;
}

std::vector<std::string> required_roles(model_format format, std::size_t shard_count)
{
    switch (format)
    {
    case model_format::onnx:
    case model_format::tflite:
    case model_format::pytorch:
        return {"model"};
    case model_format::caffe:
        return {"graph", "weights"};
    case model_format::darknet:
        return {"config", "weights"};
    case model_format::tensorflow_frozen:
        return {"graph"};
    case model_format::tensorflow_savedmodel:
    case model_format::tensorflow_checkpoint:
    {
        std::vector<std::string> roles{"graph",
                                       format == model_format::tensorflow_savedmodel ? "variables_index" : "index"};
        const auto prefix = shard_prefix(format);
        for (std::size_t i = 0; i < std::max<std::size_t>(shard_count, 1); ++i)
        {
            roles.push_back(shard_role(prefix, i));
        }
        return roles;
    }
    }
    return {};
}

std::vector<std::string> optional_roles(model_format format)
{
    if (format == model_format::tensorflow_checkpoint)
    {
        return {"alias"};
    }
    return {};
}

const bundle_file& model_bundle::primary_file() const
{
    const auto it = roles.find(primary_role);
    if (it == roles.end())
    {
        throw std::logic_error("bundle has no file for its primary role");
    }
    return it->second;
}

std::size_t model_bundle::shard_count() const
{
    const auto prefix = shard_prefix(format);
    if (prefix.empty())
    {
        return 1;
    }

    std::size_t count = 0;
    for (const auto& role : roles | std::views::keys)
    {
        if (role.size() > prefix.size() && role.starts_with(prefix) && role[prefix.size()] == ':')
        {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> model_bundle::refs() const
{
    std::vector<std::string> result;
    result.reserve(roles.size());
    for (const auto& file : roles | std::views::values)
    {
        result.push_back(file.ref);
    }
    return result;
}

std::expected<void, error> validate_bundle(const model_bundle& bundle)
{
    const auto required = required_roles(bundle.format, bundle.shard_count());
    for (const auto& role : required)
    {
        const auto it = bundle.roles.find(role);
        if (it == bundle.roles.end())
        {
            return std::unexpected(error{error_code::missing_role,
                                         "Bundle of format " + std::string{to_string(bundle.format)} +
                                             " is missing role: " + role});
        }
        if (it->second.ref.empty())
        {
            return std::unexpected(error{error_code::validation, "Bundle role has no content reference: " + role});
        }
    }

    const auto optional = optional_roles(bundle.format);
    const std::unordered_set<std::string> allowed = [&]
    {
        std::unordered_set<std::string> set(required.begin(), required.end());
        set.insert(optional.begin(), optional.end());
        return set;
    }();

    for (const auto& role : bundle.roles | std::views::keys)
    {
        if (!allowed.contains(role))
        {
            return std::unexpected(error{error_code::ambiguous_input,
                                         "Unexpected role for format " + std::string{to_string(bundle.format)} +
                                             ": " + role});
        }
    }

    if (bundle.primary_role != format_info(bundle.format).primary_role)
    {
        return std::unexpected(error{error_code::validation, "Bundle primary role does not match its format"});
    }
    return {};
}

} // namespace modelsmith
