//
// Created by gregorian-rayne on 2/6/26.
//

#ifndef PINCH_PINCH_POINT_ANALYZER_HPP
#define PINCH_PINCH_POINT_ANALYZER_HPP

/**
 * @file pinch_point_analyzer.hpp
 * @brief Pinch-point scoring over the condensation DAG.
 *
 * Metrics are computed per strongly connected component and inherited by
 * every member, so members of a cycle never count each other as
 * dependents and diamonds are counted once:
 *
 * - dependency_depth: longest path from the node's component to a sink
 * - transitive_dependents / _dependencies: nodes in other components
 *   reachable backward / forward
 * - direct_*: nodes in the immediately adjacent components
 * - impact_score = transitive_dependents * (1 + depth * depth_weight)
 * - vulnerability_score = transitive_dependencies
 *
 * analyze() is a pure function of the graph and never fails.
 */

#include "pinch/graph/graph.hpp"
#include "pinch/heuristics/config.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pinch::analysis {

    struct PinchPointInfo {
        std::string id;
        std::string name;
        graph::NodeKind kind = graph::NodeKind::ExternalModule;

        std::size_t direct_dependents = 0;
        std::size_t transitive_dependents = 0;
        std::size_t direct_dependencies = 0;
        std::size_t transitive_dependencies = 0;
        std::size_t dependency_depth = 0;
        std::size_t cycle_size = 1;

        double impact_score = 0.0;
        double vulnerability_score = 0.0;
        heuristics::RiskLevel risk = heuristics::RiskLevel::Low;
    };

    struct PinchPointReport {
        /// One entry per candidate node, ordered by id
        std::vector<PinchPointInfo> points;
        std::size_t max_depth = 0;

        /// Candidate-containing components with more than one member
        std::vector<std::vector<std::string>> cycles;

        /// Lookup by node id, nullptr if the node was not a candidate
        [[nodiscard]] const PinchPointInfo* find(const std::string& id) const;
    };

    /**
     * Scores every candidate node.
     *
     * Candidates are all non-transient nodes, restricted to non-external
     * nodes when internal_only is set. Components and reachability always
     * use the full graph.
     */
    [[nodiscard]] PinchPointReport analyze(
        const graph::Graph& graph,
        bool internal_only,
        const heuristics::PinchConfig& config = heuristics::PinchConfig::defaults()
    );

    /**
     * Highest impact first; ties by name, then id.
     */
    [[nodiscard]] std::vector<PinchPointInfo> top_by_impact(const PinchPointReport& report, std::size_t n);

    /**
     * Highest vulnerability first; ties by name, then id.
     */
    [[nodiscard]] std::vector<PinchPointInfo> top_by_vulnerability(const PinchPointReport& report, std::size_t n);

    /**
     * Cycles ordered by size descending, then by first member.
     */
    [[nodiscard]] std::vector<std::vector<std::string>> find_cycles(const PinchPointReport& report);

    struct RiskSummary {
        std::size_t critical = 0;
        std::size_t high = 0;
        std::size_t medium = 0;
        std::size_t low = 0;

        [[nodiscard]] std::size_t total() const noexcept {
            return critical + high + medium + low;
        }
    };

    [[nodiscard]] RiskSummary summarize(const PinchPointReport& report);

}  // namespace pinch::analysis

#endif //PINCH_PINCH_POINT_ANALYZER_HPP
