//
// Created by gregorian-rayne on 2/14/26.
//

#include "pinch/types.hpp"
#include "pinch/utils/file_utils.hpp"
#include "pinch/utils/json_utils.hpp"

#include <gtest/gtest.h>

namespace pinch
{
    class FileUtilsTest : public ::testing::Test {
    protected:
        void SetUp() override {
            root_ = fs::temp_directory_path() / "pinch_file_utils_test";
            fs::remove_all(root_);
        }

        void TearDown() override {
            fs::remove_all(root_);
        }

        fs::path root_;
    };

    TEST_F(FileUtilsTest, WriteCreatesParentsAndReadsBack) {
        const auto path = root_ / "nested" / "graph.dot";
        ASSERT_TRUE(file_utils::write_file(path, "digraph {}\n").is_ok());

        const auto content = file_utils::read_file(path);
        ASSERT_TRUE(content.is_ok());
        EXPECT_EQ(content.value(), "digraph {}\n");
    }

    TEST_F(FileUtilsTest, ReadMissingFileIsNotFound) {
        const auto content = file_utils::read_file(root_ / "missing.json");
        ASSERT_TRUE(content.is_err());
        EXPECT_EQ(content.error().code(), ErrorCode::NotFound);
    }

    TEST_F(FileUtilsTest, ReadDirectoryIsNotFound) {
        fs::create_directories(root_);
        EXPECT_TRUE(file_utils::read_file(root_).is_err());
    }

    TEST(FileUtilsHiddenTest, DotEntriesAreHidden) {
        EXPECT_TRUE(file_utils::is_hidden(".build"));
        EXPECT_TRUE(file_utils::is_hidden("app/.git"));
        EXPECT_FALSE(file_utils::is_hidden("Sources"));
        EXPECT_FALSE(file_utils::is_hidden(".."));
        EXPECT_FALSE(file_utils::is_hidden("."));
    }

    TEST(JsonUtilsTest, ParseReportsSyntaxErrors) {
        const auto ok = json_utils::parse(R"({"pins": []})");
        ASSERT_TRUE(ok.is_ok());
        EXPECT_TRUE(ok.value().contains("pins"));

        const auto bad = json_utils::parse("{\"pins\": [");
        ASSERT_TRUE(bad.is_err());
        EXPECT_EQ(bad.error().code(), ErrorCode::ParseError);
    }

    TEST(JsonUtilsTest, GetOrFallsBackOnMissingOrMistypedKeys) {
        const auto doc = json_utils::json::parse(R"({"critical": 25, "name": "core"})");
        EXPECT_EQ(json_utils::get_or<int>(doc, "critical", 20), 25);
        EXPECT_EQ(json_utils::get_or<int>(doc, "high", 10), 10);
        EXPECT_EQ(json_utils::get_or<int>(doc, "name", 5), 5);
        EXPECT_EQ(json_utils::get_or<int>(json_utils::json::array(), "critical", 7), 7);
    }

    TEST_F(FileUtilsTest, ReadJsonFile) {
        ASSERT_TRUE(file_utils::write_file(root_ / "pinch.json", R"({"risk": {"critical": 30}})").is_ok());
        const auto doc = json_utils::read_file(root_ / "pinch.json");
        ASSERT_TRUE(doc.is_ok());
        EXPECT_EQ(doc.value()["risk"]["critical"], 30);

        const auto missing = json_utils::read_file(root_ / "absent.json");
        ASSERT_TRUE(missing.is_err());
        EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
    }

}  // namespace pinch
