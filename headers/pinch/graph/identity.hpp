//
// Created by gregorian-rayne on 2/4/26.
//

#ifndef PINCH_IDENTITY_HPP
#define PINCH_IDENTITY_HPP

/**
 * @file identity.hpp
 * @brief Node identifier derivation.
 *
 * Ids are composed from (kind namespace, normalized name, relative path):
 *
 *   module:<name>                 internal and external modules
 *   container:<name>              stable, unique container name
 *   container:<name>@<rel/dir>    stable, name shared by several containers
 *   container:<abs/dir>           legacy
 *   target:<container rest>/<Sub> sub-targets, e.g. target:app@ios/app/AppUI
 *
 * Modules share one namespace so an external-looking reference and the
 * local package it turns out to be merge into one node. Containers live
 * in their own namespace and never collide with a same-named module.
 */

#include "pinch/graph/graph.hpp"

#include <string>
#include <string_view>

namespace pinch::graph {

    /**
     * Case-insensitive module identity: trimmed and lower-cased.
     */
    [[nodiscard]] std::string normalize_name(std::string_view name);

    [[nodiscard]] std::string module_id(std::string_view name);

    /**
     * @param relative_dir  Record directory relative to the scan root.
     * @param absolute_dir  Record directory as discovered (legacy only).
     * @param disambiguate  True when another container shares the name.
     */
    [[nodiscard]] std::string container_id(std::string_view name,
                                           std::string_view relative_dir,
                                           std::string_view absolute_dir,
                                           bool disambiguate,
                                           IdScheme scheme);

    /**
     * "target:<container id without its prefix>/<target>". The prefix keeps
     * a sub-target from colliding with a container whose relative dir
     * happens to extend the owner's, e.g. app@a plus target b versus app@a/b.
     */
    [[nodiscard]] std::string sub_target_id(std::string_view container, std::string_view target);

}  // namespace pinch::graph

#endif //PINCH_IDENTITY_HPP
