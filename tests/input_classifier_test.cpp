#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "modelsmith/input_classifier.h"

namespace
{
std::vector<modelsmith::input_file> files(std::initializer_list<std::string> names)
{
    std::vector<modelsmith::input_file> result;
    for (const auto& name : names)
    {
        result.push_back(modelsmith::input_file{name, "ref/" + name});
    }
    return result;
}
} // namespace

namespace modelsmith
{
TEST(input_classifier_test, classifies_single_file_formats)
{
    const std::vector<std::pair<std::string, model_format>> cases{
        {"resnet50.onnx", model_format::onnx},
        {"mobilenet.TFLITE", model_format::tflite},
        {"yolov5s.pt", model_format::pytorch},
        {"net.pth", model_format::pytorch},
        {"frozen_inference_graph.pb", model_format::tensorflow_frozen},
    };

    for (const auto& [name, format] : cases)
    {
        const auto bundle = classify(files({name}));
        ASSERT_TRUE(bundle.has_value()) << name << ": " << bundle.error().message;
        EXPECT_EQ(bundle->format, format) << name;
        EXPECT_EQ(bundle->primary_role, format == model_format::tensorflow_frozen ? "graph" : "model");
        EXPECT_EQ(bundle->primary_file().name, name);
        EXPECT_EQ(bundle->primary_file().ref, "ref/" + name);
    }
}

TEST(input_classifier_test, uses_basename_of_uploaded_path)
{
    const auto bundle = classify(files({"uploads/nested\\model.onnx"}));
    ASSERT_TRUE(bundle.has_value());
    EXPECT_EQ(bundle->format, model_format::onnx);
    EXPECT_EQ(bundle->primary_file().name, "uploads/nested\\model.onnx");
}

TEST(input_classifier_test, caffe_pair_ignores_readme)
{
    const auto bundle = classify(files({"net.prototxt", "net.caffemodel", "readme.txt"}));
    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    EXPECT_EQ(bundle->format, model_format::caffe);
    ASSERT_EQ(bundle->roles.size(), 2U);
    EXPECT_EQ(bundle->roles.at("graph").name, "net.prototxt");
    EXPECT_EQ(bundle->roles.at("weights").name, "net.caffemodel");
    EXPECT_EQ(bundle->primary_file().name, "net.prototxt");
}

TEST(input_classifier_test, two_complete_caffe_models_are_ambiguous)
{
    const auto bundle = classify(files({"a.prototxt", "a.caffemodel", "b.prototxt", "b.caffemodel"}));
    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, error_code::ambiguous_input);
}

TEST(input_classifier_test, caffe_pairs_differently_named_files)
{
    const auto bundle = classify(files({"deploy.prototxt", "weights_iter_1000.caffemodel"}));
    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    EXPECT_EQ(bundle->roles.at("graph").name, "deploy.prototxt");
    EXPECT_EQ(bundle->roles.at("weights").name, "weights_iter_1000.caffemodel");
}

TEST(input_classifier_test, complete_pair_with_stray_file_is_ambiguous)
{
    const auto bundle = classify(files({"net.prototxt", "net.caffemodel", "other.caffemodel"}));
    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, error_code::ambiguous_input);
}

TEST(input_classifier_test, darknet_without_weights_is_missing_role)
{
    const auto bundle = classify(files({"yolov3.cfg", "coco.names"}));
    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, error_code::missing_role);
    EXPECT_NE(bundle.error().message.find("weights"), std::string::npos);
}

TEST(input_classifier_test, darknet_pair)
{
    const auto bundle = classify(files({"yolov4-tiny.cfg", "yolov4-tiny.weights", "coco.names"}));
    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    EXPECT_EQ(bundle->format, model_format::darknet);
    EXPECT_EQ(bundle->primary_role, "config");
    EXPECT_EQ(bundle->roles.at("weights").name, "yolov4-tiny.weights");
}

TEST(input_classifier_test, two_single_file_models_are_ambiguous)
{
    const auto bundle = classify(files({"a.onnx", "b.tflite"}));
    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, error_code::ambiguous_input);
}

TEST(input_classifier_test, mixed_families_are_ambiguous)
{
    const auto bundle = classify(files({"model.onnx", "net.prototxt", "net.caffemodel"}));
    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, error_code::ambiguous_input);
}

TEST(input_classifier_test, unknown_extension_is_unsupported)
{
    const auto bundle = classify(files({"model.onnx", "archive.zip"}));
    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, error_code::unsupported_format);
    EXPECT_NE(bundle.error().message.find("archive.zip"), std::string::npos);
}

TEST(input_classifier_test, empty_or_inert_only_input_is_unsupported)
{
    EXPECT_EQ(classify({}).error().code, error_code::unsupported_format);
    EXPECT_EQ(classify(files({"README", "notes.md"})).error().code, error_code::unsupported_format);
}

TEST(input_classifier_test, checkpoint_with_shards_and_alias)
{
    const auto bundle = classify(files({"model.ckpt.meta",
                                        "model.ckpt.index",
                                        "model.ckpt.data-00000-of-00002",
                                        "model.ckpt.data-00001-of-00002",
                                        "model.ckpt",
                                        "checkpoint"}));
    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    EXPECT_EQ(bundle->format, model_format::tensorflow_checkpoint);
    EXPECT_EQ(bundle->roles.size(), 5U);
    EXPECT_EQ(bundle->roles.at("graph").name, "model.ckpt.meta");
    EXPECT_EQ(bundle->roles.at("data:1").name, "model.ckpt.data-00001-of-00002");
    EXPECT_EQ(bundle->roles.at("alias").name, "model.ckpt");
    EXPECT_TRUE(validate_bundle(*bundle).has_value());
}

TEST(input_classifier_test, checkpoint_missing_shard_names_role)
{
    const auto bundle = classify(
        files({"model.ckpt.meta", "model.ckpt.index", "model.ckpt.data-00000-of-00002"}));
    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, error_code::missing_role);
    EXPECT_NE(bundle.error().message.find("data:1"), std::string::npos);
}

TEST(input_classifier_test, savedmodel_layout)
{
    const auto bundle = classify(files({"saved_model.pb",
                                        "variables/variables.index",
                                        "variables/variables.data-00000-of-00001"}));
    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    EXPECT_EQ(bundle->format, model_format::tensorflow_savedmodel);
    EXPECT_EQ(bundle->roles.at("graph").name, "saved_model.pb");
    EXPECT_EQ(bundle->roles.at("variables_index").name, "variables/variables.index");
    EXPECT_EQ(bundle->roles.at("variables_data:0").name, "variables/variables.data-00000-of-00001");
}

TEST(input_classifier_test, savedmodel_without_index_is_missing_role)
{
    const auto bundle = classify(files({"saved_model.pb", "variables.data-00000-of-00001"}));
    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, error_code::missing_role);
}

TEST(input_classifier_test, savedmodel_with_extra_model_is_ambiguous)
{
    const auto bundle = classify(
        files({"saved_model.pb", "variables.index", "variables.data-00000-of-00001", "other.onnx"}));
    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, error_code::ambiguous_input);
}

TEST(input_classifier_test, inert_file_detection)
{
    EXPECT_TRUE(is_inert_file("README"));
    EXPECT_TRUE(is_inert_file("docs/LICENSE"));
    EXPECT_TRUE(is_inert_file("labels.txt"));
    EXPECT_TRUE(is_inert_file(".DS_Store"));
    EXPECT_FALSE(is_inert_file("model.onnx"));
    EXPECT_FALSE(is_inert_file("model.ckpt"));
}
} // namespace modelsmith
