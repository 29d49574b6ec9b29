/**
 * @file conversion_options.h
 * @brief Per-task conversion settings and their validation.
 *
 * Applications keep a default ::modelsmith::conversion_options (usually loaded
 * from the daemon config) and overlay each request's JSON on top of it with
 * ::modelsmith::conversion_options::merge_json.
 */
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "modelsmith/error.h"

namespace modelsmith
{

inline constexpr std::array<std::string_view, 11> k_target_platforms{
    "rk3562", "rk3566", "rk3568", "rk3576", "rk3588", "rv1103", "rv1103b", "rv1106", "rv1106b", "rv1126b", "rk2118"};

inline constexpr std::array<std::string_view, 5> k_quantized_dtypes{"w8a8", "w8a16", "w16a16i", "w16a16i_dfp", "w4a16"};
inline constexpr std::array<std::string_view, 3> k_quantized_algorithms{"normal", "mmse", "kl_divergence"};
inline constexpr std::array<std::string_view, 2> k_quantized_methods{"layer", "channel"};
inline constexpr std::array<std::string_view, 1> k_float_dtypes{"float16"};

bool is_supported_platform(std::string_view platform);

// One row per model input. A flat list in JSON becomes a single row.
using channel_values = std::vector<std::vector<double>>;

struct conversion_options
{
    std::string target_platform{"rk3588"};
    bool do_quantization{false};
    std::optional<std::string> dataset{};
    std::string quantized_dtype{"w8a8"};
    std::string quantized_algorithm{"normal"};
    std::string quantized_method{"channel"};
    std::string float_dtype{"float16"};
    int optimization_level{3};
    channel_values mean_values{{0.0, 0.0, 0.0}};
    channel_values std_values{{255.0, 255.0, 255.0}};
    std::vector<std::vector<std::int64_t>> input_size_list{{1, 3, 224, 224}};
    std::optional<int> batch_size{};
    bool single_core_mode{false};
    bool compress_weight{false};
    bool model_pruning{false};
    bool remove_weight{false};

    /**
     * @brief Checks every value against the supported ranges.
     *
     * Mean/std values are only checked structurally; whether their width
     * matches the model's input channels is the converter's concern.
     */
    [[nodiscard]] std::expected<void, error> validate() const;

    // Returns a copy with the keys present in @p overrides applied. Unknown keys are ignored.
    [[nodiscard]] std::expected<conversion_options, error> merge_json(const nlohmann::json& overrides) const;

    [[nodiscard]] nlohmann::json to_json() const;

    static std::expected<conversion_options, error> from_json(const nlohmann::json& doc);
    static std::expected<conversion_options, error> from_file(const std::filesystem::path& path);
};

} // namespace modelsmith
