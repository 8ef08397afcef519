//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef PINCH_GRAPH_LOADER_HPP
#define PINCH_GRAPH_LOADER_HPP

/**
 * @file graph_loader.hpp
 * @brief Scan + build pipeline shared by the graph, analyze and diff commands.
 */

#include "pinch/cli/commands/command.hpp"
#include "pinch/graph/graph_builder.hpp"
#include "pinch/resolve/resolution_cache.hpp"
#include "pinch/sources/scanner.hpp"
#include "pinch/result.hpp"
#include "pinch/error.hpp"

#include <memory>
#include <vector>

namespace pinch::cli
{
    /**
     * Construction flags every graph-producing command accepts.
     */
    [[nodiscard]] std::vector<ArgDef> graph_arguments();

    /**
     * Builds BuildOptions from the construction flags. scan_root is left
     * empty; load_graph() fills it in per scan.
     */
    [[nodiscard]] Result<graph::BuildOptions, Error> build_options_from(const ParsedArgs& args);

    struct LoadedGraph {
        sources::ScanResult scan;
        graph::BuildReport report;
    };

    /**
     * Scans root and builds its graph. A scan that finds no records returns
     * an empty scan and an empty graph, not an error.
     */
    [[nodiscard]] Result<LoadedGraph, Error> load_graph(
        const fs::path& root,
        graph::BuildOptions options,
        std::shared_ptr<resolve::ResolutionCache> cache
    );

    struct GraphPair {
        LoadedGraph from;
        LoadedGraph to;
        std::size_t resolver_invocations = 0;
    };

    /**
     * Loads both sides of a diff. Each side resolves through its own
     * cache: a package root in one checkout says nothing about the same
     * identity in the other.
     */
    [[nodiscard]] Result<GraphPair, Error> load_graph_pair(
        const fs::path& from_root,
        const fs::path& to_root,
        const graph::BuildOptions& options
    );

}  // namespace pinch::cli

#endif //PINCH_GRAPH_LOADER_HPP
