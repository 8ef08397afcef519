//
// Created by gregorian-rayne on 2/12/26.
//

#include "pinch/analysis/pinch_point_analyzer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace pinch::analysis
{
    using graph::NodeKind;
    using heuristics::RiskLevel;

    class PinchPointAnalyzerTest : public ::testing::Test {
    protected:
        void add(const std::string& id, const NodeKind kind = NodeKind::InternalModule,
                 const bool transient = false) {
            graph_.add_node(id, id, kind, transient);
        }

        void link(const std::string& from, const std::string& to) {
            if (!graph_.has_node(from)) add(from);
            if (!graph_.has_node(to)) add(to);
            graph_.add_edge(from, to);
        }

        void build_diamond() {
            link("app", "ui");
            link("app", "net");
            link("ui", "core");
            link("net", "core");
        }

        graph::Graph graph_;
    };

    TEST_F(PinchPointAnalyzerTest, EmptyGraph) {
        const auto report = analyze(graph_, false);

        EXPECT_TRUE(report.points.empty());
        EXPECT_EQ(report.max_depth, 0u);
        EXPECT_TRUE(report.cycles.empty());
    }

    TEST_F(PinchPointAnalyzerTest, DiamondCounts) {
        build_diamond();
        const auto report = analyze(graph_, false);

        const auto* core = report.find("core");
        ASSERT_NE(core, nullptr);
        EXPECT_EQ(core->direct_dependents, 2u);
        EXPECT_EQ(core->transitive_dependents, 3u);
        EXPECT_EQ(core->direct_dependencies, 0u);
        EXPECT_EQ(core->dependency_depth, 0u);
        EXPECT_DOUBLE_EQ(core->impact_score, 3.0);

        const auto* app = report.find("app");
        ASSERT_NE(app, nullptr);
        EXPECT_EQ(app->transitive_dependents, 0u);
        EXPECT_EQ(app->transitive_dependencies, 3u);
        EXPECT_EQ(app->dependency_depth, 2u);
        EXPECT_DOUBLE_EQ(app->vulnerability_score, 3.0);

        EXPECT_EQ(report.max_depth, 2u);
    }

    TEST_F(PinchPointAnalyzerTest, DiamondIsCountedOnce) {
        link("root", "b");
        link("root", "c");
        link("b", "d");
        link("c", "d");

        const auto report = analyze(graph_, false);

        EXPECT_EQ(report.find("root")->transitive_dependencies, 3u);
        EXPECT_EQ(report.find("d")->transitive_dependents, 3u);
        EXPECT_EQ(report.find("d")->direct_dependents, 2u);
    }

    TEST_F(PinchPointAnalyzerTest, ImpactWeighsDepth) {
        build_diamond();
        const auto report = analyze(graph_, false);

        const auto* ui = report.find("ui");
        ASSERT_NE(ui, nullptr);
        EXPECT_EQ(ui->transitive_dependents, 1u);
        EXPECT_DOUBLE_EQ(ui->impact_score, 1.0 * (1.0 + 1.0 * 0.2));

        auto config = heuristics::PinchConfig::defaults();
        config.scoring.depth_weight = 0.0;
        const auto flat = analyze(graph_, false, config);
        EXPECT_DOUBLE_EQ(flat.find("ui")->impact_score, 1.0);
    }

    TEST_F(PinchPointAnalyzerTest, CycleMembersShareMetrics) {
        link("a", "b");
        link("b", "a");
        link("c", "a");

        const auto report = analyze(graph_, false);

        const auto* a = report.find("a");
        const auto* b = report.find("b");
        ASSERT_NE(a, nullptr);
        ASSERT_NE(b, nullptr);
        EXPECT_EQ(a->cycle_size, 2u);
        EXPECT_EQ(b->cycle_size, 2u);
        EXPECT_EQ(a->direct_dependents, 1u);
        EXPECT_EQ(a->transitive_dependents, 1u);
        EXPECT_EQ(b->transitive_dependents, 1u);
        EXPECT_DOUBLE_EQ(a->impact_score, b->impact_score);

        const auto* c = report.find("c");
        ASSERT_NE(c, nullptr);
        EXPECT_EQ(c->cycle_size, 1u);
        EXPECT_EQ(c->direct_dependencies, 2u);
        EXPECT_EQ(c->transitive_dependencies, 2u);
        EXPECT_EQ(c->dependency_depth, 1u);
        EXPECT_EQ(report.max_depth, 1u);

        ASSERT_EQ(report.cycles.size(), 1u);
        EXPECT_EQ(report.cycles[0], (std::vector<std::string>{"a", "b"}));
    }

    TEST_F(PinchPointAnalyzerTest, TransientNodesAreNotCandidates) {
        link("app", "lib");
        add("deep", NodeKind::ExternalModule, true);
        graph_.add_edge("lib", "deep");

        const auto report = analyze(graph_, false);

        EXPECT_EQ(report.find("deep"), nullptr);
        ASSERT_NE(report.find("lib"), nullptr);
        EXPECT_EQ(report.find("lib")->transitive_dependencies, 1u);
    }

    TEST_F(PinchPointAnalyzerTest, InternalOnlySkipsExternalModules) {
        add("container:app", NodeKind::Container);
        add("module:core", NodeKind::InternalModule);
        add("module:log", NodeKind::ExternalModule);
        graph_.add_edge("container:app", "module:core");
        graph_.add_edge("module:core", "module:log");

        const auto all = analyze(graph_, false);
        const auto internal = analyze(graph_, true);

        EXPECT_EQ(all.points.size(), 3u);
        ASSERT_EQ(internal.points.size(), 2u);
        EXPECT_EQ(internal.find("module:log"), nullptr);
        EXPECT_EQ(internal.find("module:core")->transitive_dependencies, 1u);
        EXPECT_EQ(internal.max_depth, 2u);
    }

    TEST_F(PinchPointAnalyzerTest, RiskTiers) {
        const heuristics::RiskThresholds thresholds;

        EXPECT_EQ(heuristics::classify_risk(25, thresholds), RiskLevel::Critical);
        EXPECT_EQ(heuristics::classify_risk(20, thresholds), RiskLevel::Critical);
        EXPECT_EQ(heuristics::classify_risk(19, thresholds), RiskLevel::High);
        EXPECT_EQ(heuristics::classify_risk(10, thresholds), RiskLevel::High);
        EXPECT_EQ(heuristics::classify_risk(9, thresholds), RiskLevel::Medium);
        EXPECT_EQ(heuristics::classify_risk(5, thresholds), RiskLevel::Medium);
        EXPECT_EQ(heuristics::classify_risk(4, thresholds), RiskLevel::Low);
        EXPECT_EQ(heuristics::classify_risk(0, thresholds), RiskLevel::Low);
    }

    TEST_F(PinchPointAnalyzerTest, HubWithManyDependentsIsCritical) {
        for (int i = 0; i < 20; ++i) {
            link("feature" + std::to_string(i), "hub");
        }

        const auto report = analyze(graph_, false);
        EXPECT_EQ(report.find("hub")->risk, RiskLevel::Critical);
        EXPECT_EQ(report.find("feature0")->risk, RiskLevel::Low);

        const auto summary = summarize(report);
        EXPECT_EQ(summary.critical, 1u);
        EXPECT_EQ(summary.low, 20u);
        EXPECT_EQ(summary.total(), report.points.size());
    }

    TEST_F(PinchPointAnalyzerTest, RankingBreaksTiesByName) {
        graph_.add_node("module:b", "Beta", NodeKind::InternalModule, false);
        graph_.add_node("module:a", "Alpha", NodeKind::InternalModule, false);
        graph_.add_node("module:z", "Zeta", NodeKind::InternalModule, false);
        add("app", NodeKind::Container);
        graph_.add_edge("app", "module:b");
        graph_.add_edge("app", "module:a");
        graph_.add_edge("app", "module:z");

        const auto report = analyze(graph_, false);
        const auto top = top_by_impact(report, 4);

        ASSERT_EQ(top.size(), 4u);
        EXPECT_EQ(top[0].name, "Alpha");
        EXPECT_EQ(top[1].name, "Beta");
        EXPECT_EQ(top[2].name, "Zeta");
        EXPECT_EQ(top[3].name, "app");
    }

    TEST_F(PinchPointAnalyzerTest, TopTruncates) {
        build_diamond();
        const auto report = analyze(graph_, false);

        EXPECT_EQ(top_by_impact(report, 1).size(), 1u);
        EXPECT_EQ(top_by_impact(report, 1)[0].id, "core");
        EXPECT_EQ(top_by_vulnerability(report, 1)[0].id, "app");
        EXPECT_EQ(top_by_impact(report, 100).size(), 4u);
    }

    TEST_F(PinchPointAnalyzerTest, FindCyclesLargestFirst) {
        link("a", "b");
        link("b", "a");
        link("x", "y");
        link("y", "z");
        link("z", "x");

        const auto report = analyze(graph_, false);
        const auto cycles = find_cycles(report);

        ASSERT_EQ(cycles.size(), 2u);
        EXPECT_EQ(cycles[0].size(), 3u);
        EXPECT_EQ(cycles[1], (std::vector<std::string>{"a", "b"}));
    }

    TEST_F(PinchPointAnalyzerTest, PointsAreOrderedById) {
        build_diamond();
        const auto report = analyze(graph_, false);

        ASSERT_EQ(report.points.size(), 4u);
        EXPECT_TRUE(std::ranges::is_sorted(report.points, {}, &PinchPointInfo::id));
        EXPECT_EQ(report.find("nope"), nullptr);
    }

}  // namespace pinch::analysis
