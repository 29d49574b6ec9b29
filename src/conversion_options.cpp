#include "modelsmith/conversion_options.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>

#include "modelsmith/json_utils.h"

namespace
{
using modelsmith::channel_values;
using modelsmith::error;
using modelsmith::error_code;

std::unexpected<error> invalid(std::string message)
{
    return std::unexpected(error{error_code::validation, std::move(message)});
}

template <std::size_t N>
bool one_of(const std::array<std::string_view, N>& allowed, std::string_view value)
{
    return std::ranges::find(allowed, value) != allowed.end();
}

template <std::size_t N>
std::string joined(const std::array<std::string_view, N>& values)
{
    std::string result;
    for (const auto value : values)
    {
        if (!result.empty())
        {
            result += ", ";
        }
        result += value;
    }
    return result;
}

std::expected<bool, error> read_bool(const nlohmann::json& doc, const char* key, bool current)
{
    if (!doc.contains(key))
    {
        return current;
    }
    if (!doc.at(key).is_boolean())
    {
        return invalid(std::string{key} + " must be a boolean");
    }
    return doc.at(key).get<bool>();
}

std::expected<std::string, error> read_string(const nlohmann::json& doc, const char* key, std::string current)
{
    if (!doc.contains(key))
    {
        return current;
    }
    if (!doc.at(key).is_string())
    {
        return invalid(std::string{key} + " must be a string");
    }
    return doc.at(key).get<std::string>();
}

std::expected<channel_values, error> read_channel_values(const nlohmann::json& doc,
                                                         const char* key,
                                                         channel_values current)
{
    if (!doc.contains(key))
    {
        return current;
    }

    const auto& value = doc.at(key);
    if (!value.is_array() || value.empty())
    {
        return invalid(std::string{key} + " must be a non-empty array");
    }

    const auto read_row = [key](const nlohmann::json& row) -> std::expected<std::vector<double>, error>
    {
        std::vector<double> numbers;
        numbers.reserve(row.size());
        for (const auto& entry : row)
        {
            if (!entry.is_number())
            {
                return invalid(std::string{key} + " entries must be numbers");
            }
            numbers.push_back(entry.get<double>());
        }
        return numbers;
    };

    channel_values rows;
    if (value.front().is_array())
    {
        for (const auto& row : value)
        {
            if (!row.is_array())
            {
                return invalid(std::string{key} + " must not mix numbers and arrays");
            }
            auto parsed = read_row(row);
            if (!parsed)
            {
                return std::unexpected(parsed.error());
            }
            rows.push_back(std::move(parsed).value());
        }
    }
    else
    {
        auto parsed = read_row(value);
        if (!parsed)
        {
            return std::unexpected(parsed.error());
        }
        rows.push_back(std::move(parsed).value());
    }
    return rows;
}

std::expected<std::vector<std::vector<std::int64_t>>, error> read_input_sizes(
    const nlohmann::json& doc,
    const char* key,
    std::vector<std::vector<std::int64_t>> current)
{
    if (!doc.contains(key))
    {
        return current;
    }

    const auto& value = doc.at(key);
    if (!value.is_array())
    {
        return invalid("input_size_list must be an array of arrays");
    }

    std::vector<std::vector<std::int64_t>> sizes;
    for (const auto& row : value)
    {
        if (!row.is_array())
        {
            return invalid("input_size_list must be an array of arrays");
        }
        std::vector<std::int64_t> dims;
        for (const auto& dim : row)
        {
            if (!dim.is_number_integer())
            {
                return invalid("input_size_list dimensions must be integers");
            }
            dims.push_back(dim.get<std::int64_t>());
        }
        sizes.push_back(std::move(dims));
    }
    return sizes;
}

// Overwrites @p field when @p doc carries @p key; leaves it untouched on error.
template <typename T, typename Reader>
std::expected<void, error> assign(const nlohmann::json& doc, const char* key, T& field, Reader reader)
{
    auto value = reader(doc, key, field);
    if (!value)
    {
        return std::unexpected(value.error());
    }
    field = std::move(value).value();
    return {};
}

nlohmann::json channel_values_to_json(const channel_values& values)
{
    auto rows = nlohmann::json::array();
    for (const auto& row : values)
    {
        rows.push_back(row);
    }
    return rows;
}
} // namespace

namespace modelsmith
{

bool is_supported_platform(std::string_view platform)
{
    return one_of(k_target_platforms, platform);
}

std::expected<void, error> conversion_options::validate() const
{
    if (!is_supported_platform(target_platform))
    {
        return invalid("Unsupported target_platform: " + target_platform + " (expected one of " +
                       joined(k_target_platforms) + ")");
    }

    if (do_quantization && (!dataset || dataset->empty()))
    {
        return invalid("dataset is required when do_quantization is enabled");
    }

    if (!one_of(k_quantized_dtypes, quantized_dtype))
    {
        return invalid("Unsupported quantized_dtype: " + quantized_dtype);
    }
    if (!one_of(k_quantized_algorithms, quantized_algorithm))
    {
        return invalid("Unsupported quantized_algorithm: " + quantized_algorithm);
    }
    if (!one_of(k_quantized_methods, quantized_method))
    {
        return invalid("Unsupported quantized_method: " + quantized_method);
    }
    if (!one_of(k_float_dtypes, float_dtype))
    {
        return invalid("Unsupported float_dtype: " + float_dtype);
    }

    if (optimization_level < 0 || optimization_level > 3)
    {
        return invalid("optimization_level must be between 0 and 3");
    }

    if (mean_values.empty() || std_values.empty())
    {
        return invalid("mean_values and std_values must not be empty");
    }
    if (mean_values.size() != std_values.size())
    {
        return invalid("mean_values and std_values must describe the same number of inputs");
    }
    for (std::size_t i = 0; i < mean_values.size(); ++i)
    {
        if (mean_values[i].empty() || mean_values[i].size() != std_values[i].size())
        {
            return invalid("mean_values and std_values must have the same non-zero width for input " +
                           std::to_string(i));
        }
        const bool bad_std = std::ranges::any_of(std_values[i], [](double v) { return v == 0.0 || !std::isfinite(v); });
        const bool bad_mean = std::ranges::any_of(mean_values[i], [](double v) { return !std::isfinite(v); });
        if (bad_std || bad_mean)
        {
            return invalid("std_values must be finite and non-zero, mean_values must be finite");
        }
    }

    for (const auto& dims : input_size_list)
    {
        if (dims.empty() || std::ranges::any_of(dims, [](std::int64_t d) { return d <= 0; }))
        {
            return invalid("input_size_list dimensions must be positive");
        }
    }

    if (batch_size && *batch_size < 1)
    {
        return invalid("batch_size must be at least 1");
    }

    return {};
}

std::expected<conversion_options, error> conversion_options::merge_json(const nlohmann::json& overrides) const
{
    if (overrides.is_null())
    {
        return *this;
    }
    if (!overrides.is_object())
    {
        return invalid("conversion options must be a JSON object");
    }

    conversion_options merged = *this;

    const std::expected<void, error> reads[] = {
        assign(overrides, "target_platform", merged.target_platform, read_string),
        assign(overrides, "do_quantization", merged.do_quantization, read_bool),
        assign(overrides, "quantized_dtype", merged.quantized_dtype, read_string),
        assign(overrides, "quantized_algorithm", merged.quantized_algorithm, read_string),
        assign(overrides, "quantized_method", merged.quantized_method, read_string),
        assign(overrides, "float_dtype", merged.float_dtype, read_string),
        assign(overrides, "mean_values", merged.mean_values, read_channel_values),
        assign(overrides, "std_values", merged.std_values, read_channel_values),
        assign(overrides, "input_size_list", merged.input_size_list, read_input_sizes),
        assign(overrides, "single_core_mode", merged.single_core_mode, read_bool),
        assign(overrides, "compress_weight", merged.compress_weight, read_bool),
        assign(overrides, "model_pruning", merged.model_pruning, read_bool),
        assign(overrides, "remove_weight", merged.remove_weight, read_bool),
    };
    for (const auto& read : reads)
    {
        if (!read)
        {
            return std::unexpected(read.error());
        }
    }

    if (overrides.contains("dataset"))
    {
        const auto& value = overrides.at("dataset");
        if (value.is_null())
        {
            merged.dataset.reset();
        }
        else if (value.is_string())
        {
            merged.dataset = value.get<std::string>();
        }
        else
        {
            return invalid("dataset must be a string");
        }
    }

    if (overrides.contains("optimization_level"))
    {
        if (!overrides.at("optimization_level").is_number_integer())
        {
            return invalid("optimization_level must be an integer");
        }
        const auto level = overrides.at("optimization_level").get<std::int64_t>();
        if (level < 0 || level > 3)
        {
            return invalid("optimization_level must be between 0 and 3");
        }
        merged.optimization_level = static_cast<int>(level);
    }

    // "rknn_batch_size" is the converter's own spelling.
    for (const auto* key : {"batch_size", "rknn_batch_size"})
    {
        if (!overrides.contains(key))
        {
            continue;
        }
        const auto& value = overrides.at(key);
        if (value.is_null())
        {
            merged.batch_size.reset();
        }
        else if (value.is_number_integer())
        {
            const auto size = value.get<std::int64_t>();
            if (size < 1 || size > std::numeric_limits<int>::max())
            {
                return invalid(std::string{key} + " must be between 1 and " +
                               std::to_string(std::numeric_limits<int>::max()));
            }
            merged.batch_size = static_cast<int>(size);
        }
        else
        {
            return invalid(std::string{key} + " must be an integer");
        }
    }

    return merged;
}

nlohmann::json conversion_options::to_json() const
{
    nlohmann::json doc;
    doc["target_platform"] = target_platform;
    doc["do_quantization"] = do_quantization;
    doc["dataset"] = dataset ? nlohmann::json(*dataset) : nlohmann::json(nullptr);
    doc["quantized_dtype"] = quantized_dtype;
    doc["quantized_algorithm"] = quantized_algorithm;
    doc["quantized_method"] = quantized_method;
    doc["float_dtype"] = float_dtype;
    doc["optimization_level"] = optimization_level;
    doc["mean_values"] = channel_values_to_json(mean_values);
    doc["std_values"] = channel_values_to_json(std_values);
    doc["input_size_list"] = input_size_list;
    doc["batch_size"] = batch_size ? nlohmann::json(*batch_size) : nlohmann::json(nullptr);
    doc["single_core_mode"] = single_core_mode;
    doc["compress_weight"] = compress_weight;
    doc["model_pruning"] = model_pruning;
    doc["remove_weight"] = remove_weight;
    return doc;
}

std::expected<conversion_options, error> conversion_options::from_json(const nlohmann::json& doc)
{
    return conversion_options{}.merge_json(doc);
}

std::expected<conversion_options, error> conversion_options::from_file(const std::filesystem::path& path)
{
    auto doc = utils::load_json_file(path);
    if (!doc)
    {
        return std::unexpected(error{error_code::io, doc.error()});
    }
    return from_json(*doc);
}

} // namespace modelsmith
