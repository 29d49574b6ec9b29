#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#include "modelsmith/content_store.h"
#include "support/temp_dir.h"

namespace modelsmith
{
TEST(content_store_test, put_then_get_returns_the_same_bytes)
{
    test::temp_dir dir;
    auto store = filesystem_content_store::create(dir.path / "store");
    ASSERT_TRUE(store.has_value()) << store.error().message;

    const std::string bytes{"\x08\x01\x12\x00onnx", 8};
    const auto ref = store->put(bytes, "resnet50.onnx");
    ASSERT_TRUE(ref.has_value()) << ref.error().message;
    EXPECT_TRUE(ref->ends_with("/resnet50.onnx"));

    const auto loaded = store->get(*ref);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, bytes);
}

TEST(content_store_test, equal_names_get_distinct_references)
{
    test::temp_dir dir;
    auto store = filesystem_content_store::create(dir.path);
    ASSERT_TRUE(store.has_value());

    const auto first = store->put("a", "model.onnx");
    const auto second = store->put("b", "model.onnx");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);
    EXPECT_EQ(store->get(*first).value(), "a");
    EXPECT_EQ(store->get(*second).value(), "b");
}

TEST(content_store_test, name_hints_are_reduced_to_a_safe_basename)
{
    test::temp_dir dir;
    auto store = filesystem_content_store::create(dir.path);
    ASSERT_TRUE(store.has_value());

    const auto ref = store->put("x", "../../etc/pass wd");
    ASSERT_TRUE(ref.has_value());
    EXPECT_TRUE(ref->ends_with("/pass_wd"));

    const auto path = store->locate(*ref);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->parent_path().parent_path(), store->root());
}

TEST(content_store_test, long_names_keep_their_extension)
{
    test::temp_dir dir;
    auto store = filesystem_content_store::create(dir.path);
    ASSERT_TRUE(store.has_value());

    const auto ref = store->put("x", std::string(300, 'a') + ".tflite");
    ASSERT_TRUE(ref.has_value());
    EXPECT_TRUE(ref->ends_with(".tflite"));
    EXPECT_LE(ref->size() - ref->find('/') - 1, 100U);
}

TEST(content_store_test, remove_deletes_the_object)
{
    test::temp_dir dir;
    auto store = filesystem_content_store::create(dir.path);
    ASSERT_TRUE(store.has_value());

    const auto ref = store->put("weights", "yolo.weights");
    ASSERT_TRUE(ref.has_value());
    ASSERT_TRUE(store->remove(*ref).has_value());

    const auto missing = store->get(*ref);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::not_found);

    const auto again = store->remove(*ref);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::not_found);
}

TEST(content_store_test, unsafe_references_are_not_found)
{
    test::temp_dir dir;
    auto store = filesystem_content_store::create(dir.path);
    ASSERT_TRUE(store.has_value());

    for (const auto* ref : {"", "no-slash", "../x", "id/../../etc", "id/.."})
    {
        const auto result = store->get(ref);
        ASSERT_FALSE(result.has_value()) << ref;
        EXPECT_EQ(result.error().code, error_code::not_found) << ref;
    }
}

TEST(content_store_test, put_file_moves_the_source_into_the_store)
{
    test::temp_dir dir;
    auto store = filesystem_content_store::create(dir.path / "store");
    ASSERT_TRUE(store.has_value());

    const auto source = dir.path / "out.rknn";
    {
        std::ofstream out(source, std::ios::binary);
        out << "rknn";
    }

    const auto ref = store->put_file(source, "");
    ASSERT_TRUE(ref.has_value()) << ref.error().message;
    EXPECT_TRUE(ref->ends_with("/out.rknn"));
    EXPECT_FALSE(std::filesystem::exists(source));
    EXPECT_EQ(store->get(*ref).value(), "rknn");

    const auto missing = store->put_file(dir.path / "absent.rknn", "absent.rknn");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::not_found);
}

TEST(content_store_test, create_requires_a_root)
{
    const auto store = filesystem_content_store::create({});
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error().code, error_code::validation);
}
} // namespace modelsmith
