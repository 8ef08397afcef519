//
// Created by gregorian-rayne on 2/6/26.
//

#include "pinch/analysis/graph_diff.hpp"

#include <algorithm>
#include <iterator>

namespace pinch::analysis {

    namespace {

        /**
         * Keys of the edges a renderer would emit; dangling edges are not
         * part of the graph's visible shape.
         */
        std::vector<std::string> edge_keys(const graph::Graph& graph) {
            std::vector<std::string> keys;
            for (const auto& edge : graph.edges()) {
                if (graph.has_node(edge.from) && graph.has_node(edge.to)) {
                    keys.push_back(edge.key());
                }
            }
            std::ranges::sort(keys);
            return keys;
        }

        std::vector<std::string> difference(const std::vector<std::string>& a,
                                            const std::vector<std::string>& b) {
            std::vector<std::string> result;
            std::ranges::set_difference(a, b, std::back_inserter(result));
            return result;
        }

    }  // namespace

    GraphDiff diff(const graph::Graph& from, const graph::Graph& to) {
        const auto from_nodes = from.node_ids();
        const auto to_nodes = to.node_ids();
        const auto from_edges = edge_keys(from);
        const auto to_edges = edge_keys(to);

        GraphDiff result;
        result.added_nodes = difference(to_nodes, from_nodes);
        result.removed_nodes = difference(from_nodes, to_nodes);
        result.added_edges = difference(to_edges, from_edges);
        result.removed_edges = difference(from_edges, to_edges);
        return result;
    }

    bool same_construction(const graph::Graph& a, const graph::Graph& b) noexcept {
        return a.flags() == b.flags();
    }

}  // namespace pinch::analysis
