#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "modelsmith/conversion_options.h"
#include "support/temp_dir.h"

namespace modelsmith
{
TEST(conversion_options_test, defaults_are_valid)
{
    const conversion_options options;
    EXPECT_TRUE(options.validate().has_value());
    EXPECT_EQ(options.target_platform, "rk3588");
    EXPECT_EQ(options.quantized_dtype, "w8a8");
    EXPECT_EQ(options.optimization_level, 3);
    EXPECT_FALSE(options.do_quantization);
}

TEST(conversion_options_test, merge_overrides_present_keys_only)
{
    const conversion_options base;
    const auto merged = base.merge_json(nlohmann::json{{"target_platform", "rk3566"},
                                                       {"mean_values", {127.5, 127.5, 127.5}},
                                                       {"std_values", nlohmann::json::array({nlohmann::json::array({128, 128, 128})})},
                                                       {"unknown_key", 42}});
    ASSERT_TRUE(merged.has_value()) << merged.error().message;
    EXPECT_EQ(merged->target_platform, "rk3566");
    EXPECT_EQ(merged->mean_values, (channel_values{{127.5, 127.5, 127.5}}));
    EXPECT_EQ(merged->std_values, (channel_values{{128.0, 128.0, 128.0}}));
    EXPECT_EQ(merged->quantized_algorithm, base.quantized_algorithm);
    EXPECT_TRUE(merged->validate().has_value());
}

TEST(conversion_options_test, wrong_types_are_validation_errors)
{
    const conversion_options base;
    for (const auto& doc : {nlohmann::json{{"do_quantization", "yes"}},
                            nlohmann::json{{"optimization_level", 1.5}},
                            nlohmann::json{{"mean_values", "0,0,0"}},
                            nlohmann::json{{"input_size_list", {1, 3, 224, 224}}},
                            nlohmann::json::array()})
    {
        const auto merged = base.merge_json(doc);
        ASSERT_FALSE(merged.has_value()) << doc.dump();
        EXPECT_EQ(merged.error().code, error_code::validation);
    }
}

TEST(conversion_options_test, rejects_unknown_platform)
{
    conversion_options options;
    options.target_platform = "rk9999";
    const auto result = options.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::validation);
    EXPECT_NE(result.error().message.find("rk9999"), std::string::npos);
}

TEST(conversion_options_test, quantization_requires_dataset)
{
    conversion_options options;
    options.do_quantization = true;
    EXPECT_FALSE(options.validate().has_value());

    options.dataset = "./dataset.txt";
    EXPECT_TRUE(options.validate().has_value());
}

TEST(conversion_options_test, rejects_malformed_normalization)
{
    conversion_options options;
    options.std_values = {{255.0, 0.0, 255.0}};
    EXPECT_FALSE(options.validate().has_value());

    options.std_values = {{255.0, 255.0}};
    EXPECT_FALSE(options.validate().has_value());

    options.std_values = {{255.0, 255.0, 255.0}, {1.0, 1.0, 1.0}};
    EXPECT_FALSE(options.validate().has_value());
}

TEST(conversion_options_test, rejects_out_of_range_values)
{
    conversion_options options;
    options.optimization_level = 4;
    EXPECT_FALSE(options.validate().has_value());

    options = conversion_options{};
    options.quantized_dtype = "int8";
    EXPECT_FALSE(options.validate().has_value());

    options = conversion_options{};
    options.batch_size = 0;
    EXPECT_FALSE(options.validate().has_value());

    options = conversion_options{};
    options.input_size_list = {{1, 3, 0, 224}};
    EXPECT_FALSE(options.validate().has_value());
}

TEST(conversion_options_test, oversized_integers_are_rejected_not_narrowed)
{
    const auto level = conversion_options{}.merge_json(nlohmann::json{{"optimization_level", 4294967299LL}});
    ASSERT_FALSE(level.has_value());
    EXPECT_EQ(level.error().code, error_code::validation);

    const auto batch = conversion_options{}.merge_json(nlohmann::json{{"batch_size", 4294967297LL}});
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, error_code::validation);

    const auto negative = conversion_options{}.merge_json(nlohmann::json{{"rknn_batch_size", -4294967295LL}});
    EXPECT_FALSE(negative.has_value());
}

TEST(conversion_options_test, batch_size_accepts_converter_spelling)
{
    const auto merged = conversion_options{}.merge_json(nlohmann::json{{"rknn_batch_size", 8}});
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->batch_size, 8);
}

TEST(conversion_options_test, to_json_reloads_identically)
{
    conversion_options options;
    options.target_platform = "rv1106";
    options.do_quantization = true;
    options.dataset = "calib.txt";
    options.quantized_algorithm = "kl_divergence";

    const auto reloaded = conversion_options::from_json(options.to_json());
    ASSERT_TRUE(reloaded.has_value()) << reloaded.error().message;
    EXPECT_EQ(reloaded->to_json(), options.to_json());
}

TEST(conversion_options_test, from_file_reports_io_errors)
{
    const test::temp_dir dir("modelsmith-options");
    const auto missing = conversion_options::from_file(dir.path / "missing.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::io);

    const auto path = dir.path / "options.json";
    std::ofstream(path) << R"({"target_platform": "rk3562", "optimization_level": 1})";
    const auto loaded = conversion_options::from_file(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded->target_platform, "rk3562");
    EXPECT_EQ(loaded->optimization_level, 1);
}
} // namespace modelsmith
