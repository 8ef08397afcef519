//
// Created by gregorian-rayne on 2/14/26.
//

#include "pinch/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <set>

namespace pinch::string_utils
{
    TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
        EXPECT_EQ(trim("  Alamofire \t\n"), "Alamofire");
        EXPECT_EQ(trim_left("  a b "), "a b ");
        EXPECT_EQ(trim_right("  a b "), "  a b");
    }

    TEST(StringUtilsTest, TrimOfBlankIsEmpty) {
        EXPECT_TRUE(trim("").empty());
        EXPECT_TRUE(trim(" \t ").empty());
    }

    TEST(StringUtilsTest, ToLowerOnlyTouchesAscii) {
        EXPECT_EQ(to_lower("SwiftNIO-SSL"), "swiftnio-ssl");
        EXPECT_EQ(to_lower("already"), "already");
    }

    TEST(StringUtilsTest, EndsWith) {
        EXPECT_TRUE(ends_with("App.xcodeproj", ".xcodeproj"));
        EXPECT_FALSE(ends_with("proj", ".xcodeproj"));
        EXPECT_TRUE(ends_with("anything", ""));
    }

    TEST(StringUtilsTest, JoinUsesDelimiterBetweenParts) {
        const std::vector<std::string> parts{"module:a", "module:b", "module:c"};
        EXPECT_EQ(join(parts, " -> "), "module:a -> module:b -> module:c");
        EXPECT_EQ(join(std::vector<std::string>{"solo"}, ", "), "solo");
        EXPECT_EQ(join(std::vector<std::string>{}, ", "), "");
    }

    TEST(StringUtilsTest, JoinAcceptsOrderedSets) {
        const std::set<std::string> parts{"b", "a"};
        EXPECT_EQ(join(parts, ","), "a,b");
    }

}  // namespace pinch::string_utils
