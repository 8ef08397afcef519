//
// Created by gregorian-rayne on 2/13/26.
//

#include "pinch/sources/source_parser.hpp"

#include <gtest/gtest.h>

namespace pinch::sources
{
    TEST(PackageResolvedTest, ParsesVersion2Pins) {
        const std::string content = R"({
            "pins": [
                {"identity": "alamofire", "kind": "remoteSourceControl",
                 "location": "https://github.com/Alamofire/Alamofire.git",
                 "state": {"revision": "abc", "version": "5.8.1"}},
                {"identity": "snapkit", "kind": "remoteSourceControl",
                 "location": "https://github.com/SnapKit/SnapKit.git",
                 "state": {"version": "5.6.0"}}
            ],
            "version": 2
        })";

        const auto info = parse_package_resolved(content, "/src/ios/App/Package.resolved");
        ASSERT_TRUE(info.is_ok()) << info.error();
        EXPECT_EQ(info.value().name, "App");
        EXPECT_EQ(info.value().path, fs::path("/src/ios/App"));
        EXPECT_EQ(info.value().source, model::RecordSource::Lockfile);
        EXPECT_EQ(info.value().dependencies, (std::vector<std::string>{"alamofire", "snapkit"}));
        EXPECT_TRUE(info.value().explicit_dependencies.empty());
    }

    TEST(PackageResolvedTest, ParsesVersion1Pins) {
        const std::string content = R"({
            "object": {
                "pins": [
                    {"package": "Kingfisher", "repositoryURL": "https://github.com/onevcat/Kingfisher.git",
                     "state": {"version": "7.0.0"}}
                ]
            },
            "version": 1
        })";

        const auto info = parse_package_resolved(content, "/src/Widget/Package.resolved");
        ASSERT_TRUE(info.is_ok());
        EXPECT_EQ(info.value().dependencies, std::vector<std::string>{"Kingfisher"});
    }

    TEST(PackageResolvedTest, XcodeBundleNamesTheRecord) {
        const std::string content = R"({"pins": [{"identity": "lottie-ios"}], "version": 2})";
        const fs::path path =
            "/src/Shop/Shop.xcodeproj/project.xcworkspace/xcshareddata/swiftpm/Package.resolved";

        const auto info = parse_package_resolved(content, path);
        ASSERT_TRUE(info.is_ok());
        EXPECT_EQ(info.value().name, "Shop");
        EXPECT_EQ(info.value().path, fs::path("/src/Shop/Shop.xcodeproj"));
    }

    TEST(PackageResolvedTest, SkipsPinsWithoutName) {
        const std::string content = R"({"pins": [{"identity": ""}, {"location": "x"}, 42, {"identity": "ok"}]})";

        const auto info = parse_package_resolved(content, "/src/App/Package.resolved");
        ASSERT_TRUE(info.is_ok());
        EXPECT_EQ(info.value().dependencies, std::vector<std::string>{"ok"});
    }

    TEST(PackageResolvedTest, MissingPinsIsAnError) {
        const auto info = parse_package_resolved(R"({"version": 2})", "/src/App/Package.resolved");

        ASSERT_TRUE(info.is_err());
        EXPECT_EQ(info.error().code(), ErrorCode::ParseError);
    }

    TEST(PackageResolvedTest, MalformedJsonIsAnError) {
        EXPECT_TRUE(parse_package_resolved("{pins", "/src/App/Package.resolved").is_err());
    }

    TEST(RecordsFileTest, ParsesRecordsObject) {
        const std::string content = R"({
            "records": [
                {"name": "App", "path": "apps/app", "source": "project",
                 "dependencies": ["Core", "Alamofire"], "explicitDependencies": ["Alamofire"],
                 "subTargets": [{"name": "AppUI", "packageDependencies": ["SnapKit"],
                                 "targetDependencies": ["AppCore"]}]},
                {"name": "Core", "explicitDependencies": ["Core"]}
            ]
        })";

        const auto parsed = RecordsFileParser{}.parse_content(content, "/src/repo/deps/all.deps.json");
        ASSERT_TRUE(parsed.is_ok()) << parsed.error();
        const auto& records = parsed.value().records;
        ASSERT_EQ(records.size(), 2u);

        EXPECT_EQ(records[0].name, "App");
        EXPECT_EQ(records[0].path, fs::path("/src/repo/deps/apps/app"));
        EXPECT_EQ(records[0].source, model::RecordSource::ProjectFile);
        EXPECT_EQ(records[0].dependencies, (std::vector<std::string>{"Core", "Alamofire"}));
        EXPECT_TRUE(records[0].explicit_dependencies.contains("Alamofire"));
        ASSERT_EQ(records[0].sub_targets.size(), 1u);
        EXPECT_EQ(records[0].sub_targets[0].name, "AppUI");
        EXPECT_EQ(records[0].sub_targets[0].target_dependencies, std::vector<std::string>{"AppCore"});

        EXPECT_EQ(records[1].path, fs::path("/src/repo/deps"));
        EXPECT_EQ(records[1].source, model::RecordSource::Unknown);
    }

    TEST(RecordsFileTest, AcceptsTopLevelArray) {
        const auto parsed = RecordsFileParser{}.parse_content(
            R"([{"name": "App", "path": "/abs/app"}])", "/src/x.deps.json");

        ASSERT_TRUE(parsed.is_ok());
        ASSERT_EQ(parsed.value().records.size(), 1u);
        EXPECT_EQ(parsed.value().records[0].path, fs::path("/abs/app"));
    }

    TEST(RecordsFileTest, BadRecordBecomesWarning) {
        const auto parsed = RecordsFileParser{}.parse_content(
            R"({"records": [{"path": "no-name"}, {"name": "Good"}]})", "/src/x.deps.json");

        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(parsed.value().records.size(), 1u);
        ASSERT_EQ(parsed.value().warnings.size(), 1u);
        EXPECT_NE(parsed.value().warnings[0].find("record 0"), std::string::npos);
    }

    TEST(RecordsFileTest, MissingRecordsArrayIsAnError) {
        EXPECT_TRUE(RecordsFileParser{}.parse_content(R"({"items": []})", "/src/x.deps.json").is_err());
    }

    TEST(SourceRegistryTest, FindsParserByFileName) {
        const auto& registry = SourceRegistry::instance();

        const auto* lockfile = registry.find_parser_for_file("/a/b/Package.resolved");
        ASSERT_NE(lockfile, nullptr);
        EXPECT_EQ(lockfile->name(), "Package.resolved");

        const auto* records = registry.find_parser_for_file("/a/b/team.deps.json");
        ASSERT_NE(records, nullptr);
        EXPECT_EQ(records->name(), "records");

        EXPECT_EQ(registry.find_parser_for_file("/a/b/Package.swift"), nullptr);
        EXPECT_EQ(registry.find_parser_for_file("/a/b/package.json"), nullptr);
        EXPECT_GE(registry.list_parsers().size(), 2u);
    }

}  // namespace pinch::sources
