//
// Created by gregorian-rayne on 2/6/26.
//

#include "pinch/analysis/pinch_point_analyzer.hpp"
#include "pinch/analysis/condensation.hpp"

#include <algorithm>
#include <optional>
#include <tuple>

namespace pinch::analysis {

    namespace {

        bool is_candidate(const graph::GraphNode& node, const bool internal_only) {
            if (node.is_transient) {
                return false;
            }
            return !(internal_only && node.kind == graph::NodeKind::ExternalModule);
        }

        /**
         * Metrics shared by all members of one component.
         */
        struct ComponentMetrics {
            std::size_t direct_dependents = 0;
            std::size_t transitive_dependents = 0;
            std::size_t direct_dependencies = 0;
            std::size_t transitive_dependencies = 0;
        };

        template<typename Score>
        std::vector<PinchPointInfo> top_by(const PinchPointReport& report, const std::size_t n, Score score) {
            std::vector<PinchPointInfo> ranked = report.points;
            std::ranges::sort(ranked, [&](const PinchPointInfo& a, const PinchPointInfo& b) {
                const double sa = score(a);
                const double sb = score(b);
                if (sa != sb) {
                    return sa > sb;
                }
                return std::tie(a.name, a.id) < std::tie(b.name, b.id);
            });
            if (ranked.size() > n) {
                ranked.resize(n);
            }
            return ranked;
        }

    }  // namespace

    const PinchPointInfo* PinchPointReport::find(const std::string& id) const {
        const auto it = std::ranges::lower_bound(points, id, {}, &PinchPointInfo::id);
        if (it == points.end() || it->id != id) {
            return nullptr;
        }
        return &*it;
    }

    PinchPointReport analyze(const graph::Graph& graph, const bool internal_only,
                             const heuristics::PinchConfig& config) {
        PinchPointReport report;
        const Condensation condensation = condense(graph);
        const auto depths = condensation.depths();

        std::vector<std::optional<ComponentMetrics>> metrics(condensation.size());
        std::vector<bool> has_candidate(condensation.size(), false);

        for (const auto& node : graph.nodes()) {
            if (!is_candidate(node, internal_only)) {
                continue;
            }

            const std::size_t component = condensation.component_of.at(node.id);
            has_candidate[component] = true;

            if (!metrics[component]) {
                ComponentMetrics m;
                m.direct_dependents = condensation.member_count(condensation.predecessors[component]);
                m.direct_dependencies = condensation.member_count(condensation.successors[component]);
                m.transitive_dependents = condensation.member_count(condensation.reachable(component, false));
                m.transitive_dependencies = condensation.member_count(condensation.reachable(component, true));
                metrics[component] = m;
            }
            const ComponentMetrics& m = *metrics[component];

            PinchPointInfo info;
            info.id = node.id;
            info.name = node.name;
            info.kind = node.kind;
            info.direct_dependents = m.direct_dependents;
            info.transitive_dependents = m.transitive_dependents;
            info.direct_dependencies = m.direct_dependencies;
            info.transitive_dependencies = m.transitive_dependencies;
            info.dependency_depth = depths[component];
            info.cycle_size = condensation.components[component].size();
            info.impact_score = static_cast<double>(m.transitive_dependents) *
                                (1.0 + static_cast<double>(depths[component]) * config.scoring.depth_weight);
            info.vulnerability_score = static_cast<double>(m.transitive_dependencies);
            info.risk = heuristics::classify_risk(m.transitive_dependents, config.risk);

            report.points.push_back(std::move(info));
        }

        for (std::size_t i = 0; i < condensation.size(); ++i) {
            if (!has_candidate[i]) {
                continue;
            }
            report.max_depth = std::max(report.max_depth, depths[i]);
            if (condensation.components[i].size() > 1) {
                report.cycles.push_back(condensation.components[i]);
            }
        }

        return report;
    }

    std::vector<PinchPointInfo> top_by_impact(const PinchPointReport& report, const std::size_t n) {
        return top_by(report, n, [](const PinchPointInfo& p) { return p.impact_score; });
    }

    std::vector<PinchPointInfo> top_by_vulnerability(const PinchPointReport& report, const std::size_t n) {
        return top_by(report, n, [](const PinchPointInfo& p) { return p.vulnerability_score; });
    }

    std::vector<std::vector<std::string>> find_cycles(const PinchPointReport& report) {
        auto cycles = report.cycles;
        std::ranges::sort(cycles, [](const auto& a, const auto& b) {
            if (a.size() != b.size()) {
                return a.size() > b.size();
            }
            return a.front() < b.front();
        });
        return cycles;
    }

    RiskSummary summarize(const PinchPointReport& report) {
        RiskSummary summary;
        for (const auto& point : report.points) {
            switch (point.risk) {
                case heuristics::RiskLevel::Critical: ++summary.critical; break;
                case heuristics::RiskLevel::High:     ++summary.high; break;
                case heuristics::RiskLevel::Medium:   ++summary.medium; break;
                case heuristics::RiskLevel::Low:      ++summary.low; break;
            }
        }
        return summary;
    }

}  // namespace pinch::analysis
