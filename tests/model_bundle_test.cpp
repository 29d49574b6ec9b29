#include <gtest/gtest.h>

#include "modelsmith/model_bundle.h"

namespace modelsmith
{
TEST(model_bundle_test, required_roles_per_format)
{
    EXPECT_EQ(required_roles(model_format::onnx), std::vector<std::string>{"model"});
    EXPECT_EQ(required_roles(model_format::caffe), (std::vector<std::string>{"graph", "weights"}));
    EXPECT_EQ(required_roles(model_format::darknet), (std::vector<std::string>{"config", "weights"}));
    EXPECT_EQ(required_roles(model_format::tensorflow_checkpoint, 2),
              (std::vector<std::string>{"graph", "index", "data:0", "data:1"}));
    EXPECT_EQ(required_roles(model_format::tensorflow_savedmodel),
              (std::vector<std::string>{"graph", "variables_index", "variables_data:0"}));
    EXPECT_EQ(optional_roles(model_format::tensorflow_checkpoint), std::vector<std::string>{"alias"});
    EXPECT_TRUE(optional_roles(model_format::caffe).empty());
}

TEST(model_bundle_test, format_keys_round_trip)
{
    for (const auto format : {model_format::onnx,
                              model_format::tflite,
                              model_format::pytorch,
                              model_format::caffe,
                              model_format::darknet,
                              model_format::tensorflow_frozen,
                              model_format::tensorflow_savedmodel,
                              model_format::tensorflow_checkpoint})
    {
        EXPECT_EQ(parse_model_format(to_string(format)), format);
    }
    EXPECT_FALSE(parse_model_format("keras").has_value());
}

TEST(model_bundle_test, validate_rejects_missing_and_extra_roles)
{
    model_bundle caffe;
    caffe.format = model_format::caffe;
    caffe.primary_role = "graph";
    caffe.roles.emplace("graph", bundle_file{"net.prototxt", "r1"});

    auto result = validate_bundle(caffe);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::missing_role);

    caffe.roles.emplace("weights", bundle_file{"net.caffemodel", "r2"});
    EXPECT_TRUE(validate_bundle(caffe).has_value());

    caffe.roles.emplace("labels", bundle_file{"labels.txt", "r3"});
    result = validate_bundle(caffe);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::ambiguous_input);
}

TEST(model_bundle_test, validate_requires_every_shard)
{
    model_bundle checkpoint;
    checkpoint.format = model_format::tensorflow_checkpoint;
    checkpoint.primary_role = "graph";
    checkpoint.roles.emplace("graph", bundle_file{"m.meta", "r1"});
    checkpoint.roles.emplace("index", bundle_file{"m.index", "r2"});
    checkpoint.roles.emplace("data:0", bundle_file{"m.data-00000-of-00003", "r3"});
    checkpoint.roles.emplace("data:2", bundle_file{"m.data-00002-of-00003", "r4"});

    const auto result = validate_bundle(checkpoint);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::missing_role);
    EXPECT_NE(result.error().message.find("data:1"), std::string::npos);
}

TEST(model_bundle_test, validate_checks_primary_role)
{
    model_bundle bundle;
    bundle.format = model_format::onnx;
    bundle.primary_role = "graph";
    bundle.roles.emplace("model", bundle_file{"m.onnx", "r1"});

    const auto result = validate_bundle(bundle);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::validation);
}
} // namespace modelsmith
