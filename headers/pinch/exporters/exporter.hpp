//
// Created by gregorian-rayne on 2/8/26.
//

#ifndef PINCH_EXPORTER_HPP
#define PINCH_EXPORTER_HPP

/**
 * @file exporter.hpp
 * @brief Renderers for graphs, analysis reports and diffs.
 *
 * Graph formats:
 * - JSON: versioned schema. schemaVersion is 2 for stable ids and 1 for
 *   legacy (absolute path) ids
 * - DOT: Graphviz, containers and internal modules highlighted, transient
 *   nodes dashed
 * - Stats: plain-text summary
 * - Tree: each project with its dependencies, then which projects share
 *   each shared dependency
 *
 * Every renderer drops edges whose endpoints are not nodes.
 */

#include "pinch/result.hpp"
#include "pinch/error.hpp"
#include "pinch/types.hpp"
#include "pinch/graph/graph.hpp"
#include "pinch/analysis/pinch_point_analyzer.hpp"
#include "pinch/analysis/graph_diff.hpp"
#include "pinch/heuristics/config.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>

namespace pinch::exporters {

    enum class ExportFormat {
        JSON,
        DOT,
        Stats,
        Tree
    };

    [[nodiscard]] const char* to_string(ExportFormat format) noexcept;
    [[nodiscard]] std::optional<ExportFormat> parse_export_format(std::string_view text) noexcept;

    struct ExportOptions {
        bool pretty_print = true;       // Indented JSON
        bool include_metadata = true;   // Generator name and version
    };

    class IGraphExporter {
    public:
        virtual ~IGraphExporter() = default;

        [[nodiscard]] virtual ExportFormat format() const noexcept = 0;
        [[nodiscard]] virtual std::string_view file_extension() const noexcept = 0;

        [[nodiscard]] virtual Result<void, Error> export_to_stream(
            std::ostream& stream,
            const graph::Graph& graph,
            const ExportOptions& options
        ) const = 0;

        [[nodiscard]] Result<std::string, Error> export_to_string(
            const graph::Graph& graph,
            const ExportOptions& options
        ) const;

        [[nodiscard]] Result<void, Error> export_to_file(
            const fs::path& path,
            const graph::Graph& graph,
            const ExportOptions& options
        ) const;
    };

    class JsonExporter final : public IGraphExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::JSON; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".json"; }
        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream, const graph::Graph& graph, const ExportOptions& options) const override;
    };

    class DotExporter final : public IGraphExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::DOT; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".dot"; }
        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream, const graph::Graph& graph, const ExportOptions& options) const override;
    };

    class StatsExporter final : public IGraphExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::Stats; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".txt"; }
        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream, const graph::Graph& graph, const ExportOptions& options) const override;
    };

    class TreeExporter final : public IGraphExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::Tree; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".txt"; }
        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream, const graph::Graph& graph, const ExportOptions& options) const override;
    };

    class ExporterFactory {
    public:
        [[nodiscard]] static std::unique_ptr<IGraphExporter> create(ExportFormat format);
    };

    /**
     * Graph counts used by the stats renderer.
     */
    struct GraphStatistics {
        std::size_t containers = 0;
        std::size_t sub_targets = 0;
        std::size_t internal_modules = 0;
        std::size_t external_modules = 0;
        std::size_t transient_nodes = 0;
        std::size_t shared_dependencies = 0;   // Nodes with more than one dependent
        std::size_t edges = 0;                 // Non-dangling only
        std::size_t layers = 0;
    };

    [[nodiscard]] GraphStatistics compute_statistics(const graph::Graph& graph);

    /**
     * Module id -> ids of the projects (containers and internal modules)
     * that use it. A container uses what its sub-targets import.
     */
    [[nodiscard]] std::map<std::string, std::set<std::string>> dependency_users(const graph::Graph& graph);

    /**
     * Quotes a string as a DOT identifier.
     */
    [[nodiscard]] std::string escape_dot_identifier(std::string_view text);

    [[nodiscard]] nlohmann::json graph_to_json(const graph::Graph& graph, const ExportOptions& options = {});

    [[nodiscard]] nlohmann::json analysis_to_json(const analysis::PinchPointReport& report,
                                                  const heuristics::PinchConfig& config);

    [[nodiscard]] nlohmann::json diff_to_json(const analysis::GraphDiff& diff,
                                              const graph::BuildFlags& flags);

}  // namespace pinch::exporters

#endif //PINCH_EXPORTER_HPP
