//
// Created by gregorian-rayne on 2/4/26.
//

#include "pinch/graph/identity.hpp"
#include "pinch/utils/string_utils.hpp"

namespace pinch::graph {

    namespace {

        constexpr std::string_view kContainerPrefix = "container:";
        constexpr std::string_view kTargetPrefix = "target:";

    }  // namespace

    std::string normalize_name(const std::string_view name) {
        return string_utils::to_lower(string_utils::trim(name));
    }

    std::string module_id(const std::string_view name) {
        return "module:" + normalize_name(name);
    }

    std::string container_id(const std::string_view name,
                             const std::string_view relative_dir,
                             const std::string_view absolute_dir,
                             const bool disambiguate,
                             const IdScheme scheme) {
        if (scheme == IdScheme::Legacy && !absolute_dir.empty()) {
            return std::string(kContainerPrefix) + std::string(absolute_dir);
        }

        std::string id = std::string(kContainerPrefix) + normalize_name(name);
        if (disambiguate) {
            id += "@";
            id += relative_dir;
        }
        return id;
    }

    std::string sub_target_id(std::string_view container, const std::string_view target) {
        // Own prefix: a disambiguated container id may itself contain '/'
        if (container.starts_with(kContainerPrefix)) {
            container.remove_prefix(kContainerPrefix.size());
        }
        std::string id(kTargetPrefix);
        id += container;
        id += "/";
        id += string_utils::trim(target);
        return id;
    }

}  // namespace pinch::graph
