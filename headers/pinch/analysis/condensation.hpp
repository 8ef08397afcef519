//
// Created by gregorian-rayne on 2/6/26.
//

#ifndef PINCH_CONDENSATION_HPP
#define PINCH_CONDENSATION_HPP

/**
 * @file condensation.hpp
 * @brief Strongly connected components and the condensation DAG.
 *
 * Both are computed over every node of the graph and every edge whose
 * endpoints exist. Dangling edges contribute nothing.
 */

#include "pinch/graph/graph.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace pinch::analysis {

    /**
     * Result of SCC detection.
     *
     * Components come out in reverse topological order: a component is
     * listed after every component it can reach. Members are sorted.
     */
    struct ComponentSet {
        std::vector<std::vector<std::string>> components;
        std::map<std::string, std::size_t> component_of;
    };

    /**
     * Tarjan's algorithm with an explicit stack. Linear in nodes + edges
     * and safe on arbitrarily long dependency chains.
     */
    [[nodiscard]] ComponentSet strongly_connected_components(const graph::Graph& graph);

    /**
     * The DAG obtained by collapsing each SCC into one vertex.
     */
    struct Condensation {
        std::vector<std::vector<std::string>> components;
        std::map<std::string, std::size_t> component_of;

        /// Component -> components it depends on, no self loops
        std::vector<std::set<std::size_t>> successors;

        /// Component -> components depending on it, no self loops
        std::vector<std::set<std::size_t>> predecessors;

        [[nodiscard]] std::size_t size() const noexcept { return components.size(); }

        /**
         * Node count of a set of components.
         */
        [[nodiscard]] std::size_t member_count(const std::set<std::size_t>& ids) const;

        /**
         * Longest path (in edges) from each component to a sink.
         */
        [[nodiscard]] std::vector<std::size_t> depths() const;

        /**
         * Components reachable from start, start excluded.
         *
         * @param forward Follow successors when true, predecessors otherwise.
         */
        [[nodiscard]] std::set<std::size_t> reachable(std::size_t start, bool forward) const;
    };

    [[nodiscard]] Condensation condense(const graph::Graph& graph);

}  // namespace pinch::analysis

#endif //PINCH_CONDENSATION_HPP
