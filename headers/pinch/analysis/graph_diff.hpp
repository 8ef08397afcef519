//
// Created by gregorian-rayne on 2/6/26.
//

#ifndef PINCH_GRAPH_DIFF_HPP
#define PINCH_GRAPH_DIFF_HPP

/**
 * @file graph_diff.hpp
 * @brief Set difference of two graph snapshots.
 *
 * Nodes are compared by id and edges by their "from->to" key. Both
 * snapshots must have been built with the same BuildFlags; otherwise
 * every id difference is a false positive. Use same_construction() to
 * check before diffing.
 */

#include "pinch/graph/graph.hpp"

#include <string>
#include <vector>

namespace pinch::analysis {

    struct GraphDiff {
        std::vector<std::string> added_nodes;
        std::vector<std::string> removed_nodes;
        std::vector<std::string> added_edges;
        std::vector<std::string> removed_edges;

        [[nodiscard]] bool empty() const noexcept {
            return added_nodes.empty() && removed_nodes.empty() &&
                   added_edges.empty() && removed_edges.empty();
        }

        /**
         * The diff in the opposite direction.
         */
        [[nodiscard]] GraphDiff invert() const {
            return GraphDiff{removed_nodes, added_nodes, removed_edges, added_edges};
        }

        bool operator==(const GraphDiff&) const = default;
    };

    /**
     * added = to - from, removed = from - to, all sorted.
     */
    [[nodiscard]] GraphDiff diff(const graph::Graph& from, const graph::Graph& to);

    [[nodiscard]] bool same_construction(const graph::Graph& a, const graph::Graph& b) noexcept;

}  // namespace pinch::analysis

#endif //PINCH_GRAPH_DIFF_HPP
