//
// Created by gregorian-rayne on 2/4/26.
//

#ifndef PINCH_DEPENDENCY_INFO_HPP
#define PINCH_DEPENDENCY_INFO_HPP

/**
 * @file dependency_info.hpp
 * @brief Normalized record produced by the source parsers.
 *
 * One DependencyInfo describes one discovered container (project,
 * package manifest, lockfile directory). The graph builder only reads
 * these records, it never looks at the files they came from.
 */

#include "pinch/types.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pinch::model {

    /**
     * Where a record was discovered. Used for diagnostics only.
     */
    enum class RecordSource {
        Unknown,
        ProjectFile,
        PackageManifest,
        Lockfile,
        WorkspaceIndex
    };

    [[nodiscard]] const char* to_string(RecordSource source) noexcept;
    [[nodiscard]] RecordSource parse_record_source(std::string_view text) noexcept;

    /**
     * A nested build unit of a container.
     */
    struct SubTarget {
        std::string name;
        std::vector<std::string> package_dependencies;  // Packages this target imports
        std::vector<std::string> target_dependencies;   // Sibling targets in the same container
    };

    struct DependencyInfo {
        fs::path path;                                  // Disambiguator, never part of a module id
        std::string name;                               // Case-preserving display name
        std::vector<std::string> dependencies;          // Ordered, may lack explicit/transient info
        std::set<std::string> explicit_dependencies;    // Authoritative explicit set
        std::vector<SubTarget> sub_targets;
        RecordSource source = RecordSource::Unknown;
    };

    void to_json(nlohmann::json& j, const SubTarget& target);
    void from_json(const nlohmann::json& j, SubTarget& target);

    void to_json(nlohmann::json& j, const DependencyInfo& info);

    /**
     * Reads a record. Missing arrays default to empty; a missing or
     * non-string "name" throws nlohmann::json::exception.
     */
    void from_json(const nlohmann::json& j, DependencyInfo& info);

}  // namespace pinch::model

#endif //PINCH_DEPENDENCY_INFO_HPP
