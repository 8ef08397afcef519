//
// Created by gregorian-rayne on 2/5/26.
//

#ifndef PINCH_GRAPH_BUILDER_HPP
#define PINCH_GRAPH_BUILDER_HPP

/**
 * @file graph_builder.hpp
 * @brief Merges dependency records into one Graph.
 *
 * The builder works in three passes over the records, which it first
 * puts into a canonical order (normalized name, then relative path):
 *
 * 1. Classification. Self-declared records (name listed in their own
 *    explicit dependencies) are internal modules. All explicit
 *    dependencies are unioned into a global explicit set, and container
 *    names shared by several directories are marked for disambiguation.
 * 2. Merge. Each record adds its own node and its dependency edges. With
 *    sub-targets enabled, packages hang off the sub-targets that import
 *    them instead of off the container.
 * 3. Augmentation (optional). Every internal module root is resolved
 *    through a PackageResolver and its tree is folded in. Resolutions go
 *    through a shared ResolutionCache, so each canonical root costs at
 *    most one resolver call per cache lifetime.
 *
 * Failures of a single record or root end up in BuildReport::warnings;
 * build() itself never fails.
 */

#include "pinch/graph/graph.hpp"
#include "pinch/model/dependency_info.hpp"
#include "pinch/resolve/package_resolver.hpp"
#include "pinch/resolve/resolution_cache.hpp"
#include "pinch/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pinch::graph {

    struct BuildOptions {
        BuildFlags flags;

        /// Record paths are made relative to this directory for ids
        fs::path scan_root;

        /// Parallel resolver invocations during augmentation
        unsigned int resolve_jobs = 1;

        /// Required when flags.augment is set
        std::shared_ptr<resolve::PackageResolver> resolver;
    };

    struct BuildReport {
        Graph graph;
        std::vector<std::string> warnings;
        std::size_t records_merged = 0;
        std::size_t roots_resolved = 0;
        std::size_t augmentation_failures = 0;
    };

    class GraphBuilder {
    public:
        /**
         * @param cache Shared resolution cache. A private one is created
         *              when null.
         */
        explicit GraphBuilder(BuildOptions options,
                              std::shared_ptr<resolve::ResolutionCache> cache = nullptr);

        [[nodiscard]] BuildReport build(const std::vector<model::DependencyInfo>& records) const;

        [[nodiscard]] const BuildOptions& options() const noexcept { return options_; }

        [[nodiscard]] const std::shared_ptr<resolve::ResolutionCache>& cache() const noexcept {
            return cache_;
        }

    private:
        BuildOptions options_;
        std::shared_ptr<resolve::ResolutionCache> cache_;
    };

}  // namespace pinch::graph

#endif //PINCH_GRAPH_BUILDER_HPP
