//
// Created by gregorian-rayne on 2/14/26.
//

#include "pinch/resolve/package_resolver.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace pinch::resolve
{
    TEST(ParseResolvedPackageTest, ParsesNestedTree) {
        const std::string output = R"({
            "identity": "Core", "name": "Core", "url": "/src/core", "version": "unspecified",
            "dependencies": [
                {"identity": "swift-nio", "name": "swift-nio", "dependencies": [
                    {"identity": "swift-atomics", "name": "swift-atomics", "dependencies": []}
                ]},
                {"identity": "swift-log", "name": "swift-log"}
            ]
        })";

        const auto package = parse_resolved_package(output);
        ASSERT_TRUE(package.is_ok()) << package.error();

        const auto& root = package.value();
        EXPECT_EQ(root.identity, "core");
        EXPECT_EQ(root.name, "Core");
        ASSERT_EQ(root.dependencies.size(), 2u);
        EXPECT_EQ(root.dependencies[0].identity, "swift-nio");
        ASSERT_EQ(root.dependencies[0].dependencies.size(), 1u);
        EXPECT_EQ(root.dependencies[0].dependencies[0].identity, "swift-atomics");
        EXPECT_TRUE(root.dependencies[1].dependencies.empty());
    }

    TEST(ParseResolvedPackageTest, IdentityAndNameFallBackOnEachOther) {
        const auto package = parse_resolved_package(R"({"name": " SnapKit ", "dependencies": [{"identity": "x"}]})");

        ASSERT_TRUE(package.is_ok());
        EXPECT_EQ(package.value().identity, "snapkit");
        EXPECT_EQ(package.value().dependencies[0].name, "x");
    }

    TEST(ParseResolvedPackageTest, RejectsAnonymousPackage) {
        const auto package = parse_resolved_package(R"({"dependencies": []})");

        ASSERT_TRUE(package.is_err());
        EXPECT_EQ(package.error().code(), ErrorCode::ParseError);
    }

    TEST(ParseResolvedPackageTest, RejectsAnonymousChild) {
        EXPECT_TRUE(parse_resolved_package(R"({"identity": "a", "dependencies": [{"version": "1"}]})").is_err());
    }

    TEST(ParseResolvedPackageTest, RejectsGarbage) {
        EXPECT_TRUE(parse_resolved_package("error: no Package.swift found").is_err());
    }

#ifndef _WIN32
    class CommandPackageResolverTest : public ::testing::Test {
    protected:
        void SetUp() override {
            dir_ = fs::temp_directory_path() / "pinch_resolver_test";
            fs::create_directories(dir_);
        }

        void TearDown() override {
            fs::remove_all(dir_);
        }

        fs::path dir_;
    };

    TEST_F(CommandPackageResolverTest, DefaultCommand) {
        const CommandPackageResolver resolver;
        EXPECT_EQ(resolver.command(), CommandPackageResolver::kDefaultCommand);
        EXPECT_EQ(resolver.name(), "command");
    }

    TEST_F(CommandPackageResolverTest, ParsesCommandOutput) {
        const CommandPackageResolver resolver(
            R"(printf '{"identity":"core","name":"Core","dependencies":[{"identity":"swift-log"}]}')");

        const auto package = resolver.resolve({"core", dir_});
        ASSERT_TRUE(package.is_ok()) << package.error();
        EXPECT_EQ(package.value().name, "Core");
        ASSERT_EQ(package.value().dependencies.size(), 1u);
    }

    TEST_F(CommandPackageResolverTest, RunsInRootDirectory) {
        const CommandPackageResolver resolver(
            R"cmd(printf '{"identity":"%s"}' "$(basename "$(pwd)")")cmd");

        const auto package = resolver.resolve({"", dir_});
        ASSERT_TRUE(package.is_ok()) << package.error();
        EXPECT_EQ(package.value().identity, "pinch_resolver_test");
    }

    TEST_F(CommandPackageResolverTest, NonZeroExitIsResolutionError) {
        const CommandPackageResolver resolver("echo 'manifest is broken' >&2; exit 3");

        const auto package = resolver.resolve({"core", dir_});
        ASSERT_TRUE(package.is_err());
        EXPECT_EQ(package.error().code(), ErrorCode::ResolutionError);
        EXPECT_NE(package.error().message().find("3"), std::string::npos);
        EXPECT_NE(package.error().message().find("manifest is broken"), std::string::npos);
    }

    TEST_F(CommandPackageResolverTest, MalformedOutputIsResolutionError) {
        const CommandPackageResolver resolver("echo not-json");

        const auto package = resolver.resolve({"core", dir_});
        ASSERT_TRUE(package.is_err());
        EXPECT_EQ(package.error().code(), ErrorCode::ResolutionError);
    }

    TEST_F(CommandPackageResolverTest, MissingDirectoryFails) {
        const CommandPackageResolver resolver("echo '{}'");

        EXPECT_TRUE(resolver.resolve({"core", dir_ / "absent"}).is_err());
    }
#endif

}  // namespace pinch::resolve
