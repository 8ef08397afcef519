//
// Created by gregorian-rayne on 2/14/26.
//

#include "pinch/model/dependency_info.hpp"

#include <gtest/gtest.h>

namespace pinch::model
{
    TEST(DependencyInfoTest, ReadsFullRecord) {
        const auto j = nlohmann::json::parse(R"({
            "path": "Packages/Core",
            "name": "Core",
            "source": "manifest",
            "dependencies": ["Alamofire", 7, "Kingfisher"],
            "explicitDependencies": ["Alamofire", "Alamofire"],
            "subTargets": [
                {"name": "CoreUI", "packageDependencies": ["Kingfisher"], "targetDependencies": ["CoreKit"]},
                {"packageDependencies": ["ignored"]},
                {"name": "CoreKit"}
            ]
        })");

        const auto info = j.get<DependencyInfo>();
        EXPECT_EQ(info.name, "Core");
        EXPECT_EQ(info.path, fs::path("Packages/Core"));
        EXPECT_EQ(info.source, RecordSource::PackageManifest);
        EXPECT_EQ(info.dependencies, (std::vector<std::string>{"Alamofire", "Kingfisher"}));
        EXPECT_EQ(info.explicit_dependencies, (std::set<std::string>{"Alamofire"}));

        ASSERT_EQ(info.sub_targets.size(), 2u);
        EXPECT_EQ(info.sub_targets[0].name, "CoreUI");
        EXPECT_EQ(info.sub_targets[0].target_dependencies, (std::vector<std::string>{"CoreKit"}));
        EXPECT_TRUE(info.sub_targets[1].package_dependencies.empty());
    }

    TEST(DependencyInfoTest, MissingArraysDefaultToEmpty) {
        const auto info = nlohmann::json::parse(R"({"name": "App"})").get<DependencyInfo>();
        EXPECT_TRUE(info.path.empty());
        EXPECT_EQ(info.source, RecordSource::Unknown);
        EXPECT_TRUE(info.dependencies.empty());
        EXPECT_TRUE(info.explicit_dependencies.empty());
        EXPECT_TRUE(info.sub_targets.empty());
    }

    TEST(DependencyInfoTest, MissingNameThrows) {
        const auto j = nlohmann::json::parse(R"({"dependencies": ["A"]})");
        EXPECT_THROW((void)j.get<DependencyInfo>(), nlohmann::json::exception);
    }

    TEST(DependencyInfoTest, WritesCamelCaseKeys) {
        DependencyInfo info;
        info.name = "App";
        info.path = "apps/App";
        info.source = RecordSource::ProjectFile;
        info.dependencies = {"Core"};
        info.explicit_dependencies = {"Core"};

        const nlohmann::json j = info;
        EXPECT_EQ(j["path"], "apps/App");
        EXPECT_EQ(j["source"], "project");
        EXPECT_TRUE(j.contains("explicitDependencies"));
        EXPECT_TRUE(j["subTargets"].is_array());
    }

    TEST(RecordSourceTest, UnknownTextMapsToUnknown) {
        EXPECT_EQ(parse_record_source("lockfile"), RecordSource::Lockfile);
        EXPECT_EQ(parse_record_source("workspace"), RecordSource::WorkspaceIndex);
        EXPECT_EQ(parse_record_source("podfile"), RecordSource::Unknown);
        EXPECT_STREQ(to_string(RecordSource::WorkspaceIndex), "workspace");
    }

}  // namespace pinch::model
