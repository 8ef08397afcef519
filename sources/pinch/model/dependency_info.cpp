//
// Created by gregorian-rayne on 2/4/26.
//

#include "pinch/model/dependency_info.hpp"
#include "pinch/utils/json_utils.hpp"

namespace pinch::model {

    namespace {

        std::vector<std::string> string_array(const nlohmann::json& j, const char* key) {
            std::vector<std::string> result;
            if (!j.contains(key) || !j.at(key).is_array()) {
                return result;
            }
            for (const auto& item : j.at(key)) {
                if (item.is_string()) {
                    result.push_back(item.get<std::string>());
                }
            }
            return result;
        }

    }  // namespace

    const char* to_string(const RecordSource source) noexcept {
        switch (source) {
            case RecordSource::Unknown:         return "unknown";
            case RecordSource::ProjectFile:     return "project";
            case RecordSource::PackageManifest: return "manifest";
            case RecordSource::Lockfile:        return "lockfile";
            case RecordSource::WorkspaceIndex:  return "workspace";
        }
        return "unknown";
    }

    RecordSource parse_record_source(const std::string_view text) noexcept {
        if (text == "project") return RecordSource::ProjectFile;
        if (text == "manifest") return RecordSource::PackageManifest;
        if (text == "lockfile") return RecordSource::Lockfile;
        if (text == "workspace") return RecordSource::WorkspaceIndex;
        return RecordSource::Unknown;
    }

    void to_json(nlohmann::json& j, const SubTarget& target) {
        j = nlohmann::json{
            {"name", target.name},
            {"packageDependencies", target.package_dependencies},
            {"targetDependencies", target.target_dependencies}
        };
    }

    void from_json(const nlohmann::json& j, SubTarget& target) {
        target.name = j.at("name").get<std::string>();
        target.package_dependencies = string_array(j, "packageDependencies");
        target.target_dependencies = string_array(j, "targetDependencies");
    }

    void to_json(nlohmann::json& j, const DependencyInfo& info) {
        j = nlohmann::json{
            {"path", info.path.generic_string()},
            {"name", info.name},
            {"source", to_string(info.source)},
            {"dependencies", info.dependencies},
            {"explicitDependencies", info.explicit_dependencies},
            {"subTargets", info.sub_targets}
        };
    }

    void from_json(const nlohmann::json& j, DependencyInfo& info) {
        info.name = j.at("name").get<std::string>();
        info.path = json_utils::get_or<std::string>(j, "path", "");
        info.source = parse_record_source(json_utils::get_or<std::string>(j, "source", ""));
        info.dependencies = string_array(j, "dependencies");

        const auto explicit_deps = string_array(j, "explicitDependencies");
        info.explicit_dependencies = std::set<std::string>(explicit_deps.begin(), explicit_deps.end());

        info.sub_targets.clear();
        if (j.contains("subTargets") && j.at("subTargets").is_array()) {
            for (const auto& item : j.at("subTargets")) {
                if (item.is_object() && item.contains("name") && item.at("name").is_string()) {
                    info.sub_targets.push_back(item.get<SubTarget>());
                }
            }
        }
    }

}  // namespace pinch::model
