//
// Created by gregorian-rayne on 2/14/26.
//

#include "pinch/utils/path_utils.hpp"

#include <gtest/gtest.h>

namespace pinch::path_utils
{
    TEST(PathUtilsTest, NormalizeResolvesDotComponents) {
        EXPECT_EQ(normalize("a/./b/../c"), fs::path("a/c"));
        EXPECT_EQ(normalize("../x/y"), fs::path("../x/y"));
        EXPECT_EQ(normalize(""), fs::path("."));
    }

    TEST(PathUtilsTest, NormalizeKeepsLeadingParentReferences) {
        EXPECT_EQ(normalize("../../lib"), fs::path("../../lib"));
        EXPECT_EQ(normalize("a/../../lib"), fs::path("../lib"));
    }

#ifndef _WIN32
    TEST(PathUtilsTest, RelativeToRootStripsTheRoot) {
        EXPECT_EQ(relative_to_root("/work/app/Packages/Core", "/work/app"), "Packages/Core");
        EXPECT_EQ(relative_to_root("/work/app", "/work/app"), ".");
        EXPECT_EQ(relative_to_root("/work/app/./Core/../Net", "/work/app"), "Net");
    }

    TEST(PathUtilsTest, RelativeToRootKeepsPathsOutsideTheRoot) {
        EXPECT_EQ(relative_to_root("/work/shared/Kit", "/work/app"), "../shared/Kit");
    }

    TEST(PathUtilsTest, CanonicalKeyMergesSpellings) {
        const auto root = fs::temp_directory_path() / "pinch_path_utils_test";
        fs::remove_all(root);
        fs::create_directories(root / "b");

        const auto key = canonical_key(root / "b");
        EXPECT_EQ(canonical_key(root / "a" / ".." / "b"), key);
        EXPECT_EQ(canonical_key(root / "b" / ""), key);
        EXPECT_NE(key.back(), '/');

        fs::remove_all(root);
    }
#endif

    TEST(PathUtilsTest, RelativeToRootNormalizesRelativeInput) {
        EXPECT_EQ(relative_to_root("./Core/../Net", ""), "Net");
        EXPECT_EQ(relative_to_root("Core", "/ignored"), "Core");
    }

}  // namespace pinch::path_utils
