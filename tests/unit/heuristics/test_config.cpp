//
// Created by gregorian-rayne on 2/13/26.
//

#include "pinch/heuristics/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace pinch::heuristics
{
    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "pinch_config_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            fs::remove_all(temp_dir_);
        }

        [[nodiscard]] fs::path write(const std::string& content) const {
            const auto path = temp_dir_ / "pinch.json";
            std::ofstream file(path);
            file << content;
            return path;
        }

        fs::path temp_dir_;
    };

    TEST_F(ConfigTest, Defaults) {
        const auto config = PinchConfig::defaults();

        EXPECT_EQ(config.risk.critical, 20u);
        EXPECT_EQ(config.risk.high, 10u);
        EXPECT_EQ(config.risk.medium, 5u);
        EXPECT_DOUBLE_EQ(config.scoring.depth_weight, 0.2);
        EXPECT_EQ(config.report.top_n, 10u);
        EXPECT_TRUE(validate(config).is_ok());
    }

    TEST_F(ConfigTest, LoadsPartialOverrides) {
        const auto path = write(R"({"risk": {"critical": 50}, "scoring": {"depth_weight": 0.5}})");

        const auto config = load_config(path);
        ASSERT_TRUE(config.is_ok()) << config.error();
        EXPECT_EQ(config.value().risk.critical, 50u);
        EXPECT_EQ(config.value().risk.high, 10u);
        EXPECT_DOUBLE_EQ(config.value().scoring.depth_weight, 0.5);
        EXPECT_EQ(config.value().report.top_n, 10u);
    }

    TEST_F(ConfigTest, LoadsReportSection) {
        const auto config = load_config(write(R"({"report": {"top_n": 3}})"));

        ASSERT_TRUE(config.is_ok());
        EXPECT_EQ(config.value().report.top_n, 3u);
    }

    TEST_F(ConfigTest, RejectsUnorderedThresholds) {
        const auto config = load_config(write(R"({"risk": {"critical": 5, "high": 10}})"));

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, RejectsNegativeCount) {
        const auto config = load_config(write(R"({"risk": {"medium": -1}})"));

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, RejectsNonNumericWeight) {
        const auto config = load_config(write(R"({"scoring": {"depth_weight": "heavy"}})"));

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, RejectsNonObjectRoot) {
        EXPECT_TRUE(load_config(write("[1, 2, 3]")).is_err());
    }

    TEST_F(ConfigTest, MalformedJsonIsAParseError) {
        const auto config = load_config(write("{ not json"));

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ParseError);
    }

    TEST_F(ConfigTest, MissingFile) {
        EXPECT_TRUE(load_config(temp_dir_ / "absent.json").is_err());
    }

    TEST_F(ConfigTest, ValidateRejectsNegativeWeight) {
        auto config = PinchConfig::defaults();
        config.scoring.depth_weight = -0.1;
        EXPECT_TRUE(validate(config).is_err());
    }

    TEST_F(ConfigTest, RiskLevelNames) {
        EXPECT_STREQ(to_string(RiskLevel::Critical), "Critical");
        EXPECT_STREQ(to_string(RiskLevel::Low), "Low");
    }

}  // namespace pinch::heuristics
