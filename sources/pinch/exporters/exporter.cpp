//
// Created by gregorian-rayne on 2/8/26.
//

#include "pinch/exporters/exporter.hpp"
#include "pinch/version.hpp"
#include "pinch/utils/file_utils.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace pinch::exporters {

    namespace {

        using json = nlohmann::json;

        bool edge_visible(const graph::Graph& graph, const graph::Edge& edge) {
            return graph.has_node(edge.from) && graph.has_node(edge.to);
        }

        json flags_to_json(const graph::BuildFlags& flags) {
            return {
                {"includeSubTargets", flags.include_sub_targets},
                {"hideTransient", flags.hide_transient},
                {"augment", flags.augment},
                {"idScheme", graph::to_string(flags.id_scheme)}
            };
        }

        json point_to_json(const analysis::PinchPointInfo& point) {
            return {
                {"id", point.id},
                {"name", point.name},
                {"kind", graph::to_string(point.kind)},
                {"directDependents", point.direct_dependents},
                {"transitiveDependents", point.transitive_dependents},
                {"directDependencies", point.direct_dependencies},
                {"transitiveDependencies", point.transitive_dependencies},
                {"dependencyDepth", point.dependency_depth},
                {"cycleSize", point.cycle_size},
                {"impactScore", point.impact_score},
                {"vulnerabilityScore", point.vulnerability_score},
                {"risk", heuristics::to_string(point.risk)}
            };
        }

        void print_rule(std::ostream& out, const char c = '=') {
            out << std::string(60, c) << "\n";
        }

        bool is_project(const graph::NodeKind kind) {
            return kind == graph::NodeKind::Container || kind == graph::NodeKind::InternalModule;
        }

        bool is_module(const graph::NodeKind kind) {
            return kind == graph::NodeKind::InternalModule || kind == graph::NodeKind::ExternalModule;
        }

        std::set<std::string> used_modules(const graph::Graph& graph, const std::string& project) {
            std::set<std::string> modules;
            for (const auto& next : graph.successors(project)) {
                const auto* node = graph.find_node(next);
                if (is_module(node->kind)) {
                    modules.insert(next);
                } else if (node->kind == graph::NodeKind::SubTarget) {
                    for (const auto& imported : graph.successors(next)) {
                        if (is_module(graph.find_node(imported)->kind)) {
                            modules.insert(imported);
                        }
                    }
                }
            }
            return modules;
        }

        const std::string& display_name(const graph::Graph& graph, const std::string& id) {
            return graph.find_node(id)->name;
        }

    }  // namespace

    const char* to_string(const ExportFormat format) noexcept {
        switch (format) {
            case ExportFormat::JSON:  return "json";
            case ExportFormat::DOT:   return "dot";
            case ExportFormat::Stats: return "stats";
            case ExportFormat::Tree:  return "tree";
        }
        return "json";
    }

    std::optional<ExportFormat> parse_export_format(const std::string_view text) noexcept {
        if (text == "json") return ExportFormat::JSON;
        if (text == "dot") return ExportFormat::DOT;
        if (text == "stats") return ExportFormat::Stats;
        if (text == "tree") return ExportFormat::Tree;
        return std::nullopt;
    }

    // ============================================================================
    // IGraphExporter
    // ============================================================================

    Result<std::string, Error> IGraphExporter::export_to_string(const graph::Graph& graph,
                                                                const ExportOptions& options) const {
        std::ostringstream oss;
        if (auto result = export_to_stream(oss, graph, options); result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }
        return Result<std::string, Error>::success(oss.str());
    }

    Result<void, Error> IGraphExporter::export_to_file(const fs::path& path,
                                                       const graph::Graph& graph,
                                                       const ExportOptions& options) const {
        auto content = export_to_string(graph, options);
        if (content.is_err()) {
            return Result<void, Error>::failure(content.error());
        }
        return file_utils::write_file(path, content.value());
    }

    // ============================================================================
    // JSON
    // ============================================================================

    json graph_to_json(const graph::Graph& graph, const ExportOptions& options) {
        json output;
        output["schemaVersion"] = graph.schema_version();

        if (options.include_metadata) {
            output["generator"] = {
                {"name", PROJECT_SHORT_NAME},
                {"version", VERSION_STRING}
            };
        }
        output["flags"] = flags_to_json(graph.flags());

        json nodes = json::array();
        for (const auto& node : graph.nodes()) {
            nodes.push_back({
                {"id", node.id},
                {"name", node.name},
                {"kind", graph::to_string(node.kind)},
                {"transient", node.is_transient},
                {"layer", node.layer}
            });
        }
        output["nodes"] = nodes;

        json edges = json::array();
        for (const auto& edge : graph.edges()) {
            if (edge_visible(graph, edge)) {
                edges.push_back({{"from", edge.from}, {"to", edge.to}});
            }
        }
        output["edges"] = edges;

        return output;
    }

    json analysis_to_json(const analysis::PinchPointReport& report, const heuristics::PinchConfig& config) {
        json output;
        output["maxDepth"] = report.max_depth;
        output["thresholds"] = {
            {"critical", config.risk.critical},
            {"high", config.risk.high},
            {"medium", config.risk.medium},
            {"depthWeight", config.scoring.depth_weight}
        };

        const auto summary = analysis::summarize(report);
        output["summary"] = {
            {"nodes", summary.total()},
            {"critical", summary.critical},
            {"high", summary.high},
            {"medium", summary.medium},
            {"low", summary.low}
        };

        json points = json::array();
        for (const auto& point : analysis::top_by_impact(report, report.points.size())) {
            points.push_back(point_to_json(point));
        }
        output["points"] = points;
        output["cycles"] = analysis::find_cycles(report);

        return output;
    }

    json diff_to_json(const analysis::GraphDiff& diff, const graph::BuildFlags& flags) {
        return {
            {"schemaVersion", graph::schema_version(flags.id_scheme)},
            {"flags", flags_to_json(flags)},
            {"addedNodes", diff.added_nodes},
            {"removedNodes", diff.removed_nodes},
            {"addedEdges", diff.added_edges},
            {"removedEdges", diff.removed_edges}
        };
    }

    Result<void, Error> JsonExporter::export_to_stream(std::ostream& stream,
                                                       const graph::Graph& graph,
                                                       const ExportOptions& options) const {
        try {
            stream << graph_to_json(graph, options).dump(options.pretty_print ? 2 : -1) << "\n";
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write JSON output"));
        }
        return Result<void, Error>::success();
    }

    // ============================================================================
    // DOT
    // ============================================================================

    std::string escape_dot_identifier(const std::string_view text) {
        std::string result = "\"";
        for (const char c : text) {
            if (c == '"' || c == '\\') {
                result += '\\';
            }
            result += c;
        }
        result += '"';
        return result;
    }

    Result<void, Error> DotExporter::export_to_stream(std::ostream& stream,
                                                      const graph::Graph& graph,
                                                      const ExportOptions& options) const {
        stream << "digraph DependencyGraph {\n";
        if (options.include_metadata) {
            stream << "  // " << PROJECT_SHORT_NAME << " " << VERSION_STRING
                   << ", schema " << graph.schema_version() << "\n";
        }
        stream << "  rankdir=TB;\n";
        stream << "  node [shape=box, style=rounded];\n\n";

        for (const auto& node : graph.nodes()) {
            std::string style = "rounded";
            std::string fill;

            switch (node.kind) {
                case graph::NodeKind::Container:
                    fill = "lightblue";
                    break;
                case graph::NodeKind::InternalModule:
                    fill = "lightgreen";
                    break;
                case graph::NodeKind::SubTarget:
                case graph::NodeKind::ExternalModule:
                    break;
            }
            if (!fill.empty()) {
                style += ",filled";
            }
            if (node.is_transient) {
                style += ",dashed";
            }

            stream << "  " << escape_dot_identifier(node.id)
                   << " [label=" << escape_dot_identifier(node.name);
            if (style != "rounded") {
                stream << ", style=\"" << style << "\"";
            }
            if (!fill.empty()) {
                stream << ", fillcolor=\"" << fill << "\"";
            }
            stream << "];\n";
        }

        stream << "\n";
        for (const auto& edge : graph.edges()) {
            if (!edge_visible(graph, edge)) {
                continue;
            }
            stream << "  " << escape_dot_identifier(edge.from)
                   << " -> " << escape_dot_identifier(edge.to) << ";\n";
        }
        stream << "}\n";

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write DOT output"));
        }
        return Result<void, Error>::success();
    }

    // ============================================================================
    // Stats
    // ============================================================================

    GraphStatistics compute_statistics(const graph::Graph& graph) {
        GraphStatistics stats;
        for (const auto& node : graph.nodes()) {
            switch (node.kind) {
                case graph::NodeKind::Container:      ++stats.containers; break;
                case graph::NodeKind::SubTarget:      ++stats.sub_targets; break;
                case graph::NodeKind::InternalModule: ++stats.internal_modules; break;
                case graph::NodeKind::ExternalModule: ++stats.external_modules; break;
            }
            if (node.is_transient) {
                ++stats.transient_nodes;
            }
            if (graph.predecessors(node.id).size() > 1) {
                ++stats.shared_dependencies;
            }
            stats.layers = std::max(stats.layers, node.layer + 1);
        }
        for (const auto& edge : graph.edges()) {
            if (edge_visible(graph, edge)) {
                ++stats.edges;
            }
        }
        return stats;
    }

    Result<void, Error> StatsExporter::export_to_stream(std::ostream& stream,
                                                        const graph::Graph& graph,
                                                        const ExportOptions&) const {
        const auto stats = compute_statistics(graph);

        stream << "\n";
        print_rule(stream);
        stream << "STATISTICS\n";
        print_rule(stream);
        stream << "Total containers:     " << stats.containers << "\n";
        stream << "Total sub-targets:    " << stats.sub_targets << "\n";
        stream << "Internal modules:     " << stats.internal_modules << "\n";
        stream << "External modules:     " << stats.external_modules << "\n";
        stream << "Transient nodes:      " << stats.transient_nodes << "\n";
        stream << "Shared dependencies:  " << stats.shared_dependencies << "\n";
        stream << "Total edges:          " << stats.edges << "\n";
        stream << "Layers:               " << stats.layers << "\n";
        stream << "Id scheme:            " << graph::to_string(graph.flags().id_scheme)
               << " (schema " << graph.schema_version() << ")\n";
        print_rule(stream);

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write statistics"));
        }
        return Result<void, Error>::success();
    }

    // ============================================================================
    // Tree
    // ============================================================================

    std::map<std::string, std::set<std::string>> dependency_users(const graph::Graph& graph) {
        std::map<std::string, std::set<std::string>> users;
        for (const auto& node : graph.nodes()) {
            if (!is_project(node.kind)) {
                continue;
            }
            for (const auto& dep_id : used_modules(graph, node.id)) {
                users[dep_id].insert(node.id);
            }
        }
        return users;
    }

    Result<void, Error> TreeExporter::export_to_stream(std::ostream& stream,
                                                       const graph::Graph& graph,
                                                       const ExportOptions&) const {
        const auto users = dependency_users(graph);

        stream << "\n";
        print_rule(stream);
        stream << "DEPENDENCY GRAPH\n";
        print_rule(stream);

        std::size_t projects = 0;
        for (const auto& node : graph.nodes()) {
            if (!is_project(node.kind)) {
                continue;
            }
            ++projects;
            stream << "\n+- " << node.name << "\n";
            stream << "|  Id: " << node.id << "\n";
            stream << "|\n";

            const auto modules = used_modules(graph, node.id);
            if (modules.empty()) {
                stream << "|  (no dependencies)\n";
            }
            std::size_t index = 0;
            for (const auto& dep_id : modules) {
                const bool last = ++index == modules.size();
                stream << "|  " << (last ? "`-- " : "+-- ") << display_name(graph, dep_id);
                if (const auto count = users.at(dep_id).size(); count > 1) {
                    stream << " [shared by " << count << " projects]";
                }
                stream << "\n";
            }
        }

        std::size_t shared = 0;
        for (const auto& [dep_id, projects_using] : users) {
            if (projects_using.size() < 2) {
                continue;
            }
            if (shared++ == 0) {
                stream << "\n";
                print_rule(stream);
                stream << "SHARED DEPENDENCIES\n";
                print_rule(stream);
            }

            std::vector<std::string> names;
            for (const auto& project : projects_using) {
                names.push_back(display_name(graph, project));
            }
            std::ranges::sort(names);

            stream << "\n* " << display_name(graph, dep_id) << "\n";
            for (std::size_t i = 0; i < names.size(); ++i) {
                stream << "  " << (i + 1 == names.size() ? "`-- " : "+-- ") << names[i] << "\n";
            }
        }

        stream << "\n";
        print_rule(stream);
        stream << "STATISTICS\n";
        print_rule(stream);
        stream << "Total projects:            " << projects << "\n";
        stream << "Total unique dependencies: " << users.size() << "\n";
        stream << "Shared dependencies:       " << shared << "\n";
        print_rule(stream);

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write dependency tree"));
        }
        return Result<void, Error>::success();
    }

    // ============================================================================
    // Factory
    // ============================================================================

    std::unique_ptr<IGraphExporter> ExporterFactory::create(const ExportFormat format) {
        switch (format) {
            case ExportFormat::JSON:  return std::make_unique<JsonExporter>();
            case ExportFormat::DOT:   return std::make_unique<DotExporter>();
            case ExportFormat::Stats: return std::make_unique<StatsExporter>();
            case ExportFormat::Tree:  return std::make_unique<TreeExporter>();
        }
        return std::make_unique<JsonExporter>();
    }

}  // namespace pinch::exporters
