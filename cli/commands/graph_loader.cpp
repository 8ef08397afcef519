//
// Created by gregorian-rayne on 2/9/26.
//

#include "pinch/cli/commands/graph_loader.hpp"
#include "pinch/resolve/package_resolver.hpp"

namespace pinch::cli
{
    std::vector<ArgDef> graph_arguments() {
        return {
            {"show-targets", 't', "Add sub-target nodes and route package edges through them", false, false, "", ""},
            {"hide-transient", 0, "Drop dependencies nothing declares explicitly", false, false, "", ""},
            {"augment", 'a', "Add package-to-package edges reported by the package manager", false, false, "", ""},
            {"resolve-command", 0, "Command printing the resolved dependency tree as JSON", false, true,
             resolve::CommandPackageResolver::kDefaultCommand, "CMD"},
            {"resolve-jobs", 'j', "Parallel resolution commands", false, true, "1", "N"},
            {"legacy-ids", 0, "Use absolute-path container ids (schema version 1)", false, false, "", ""}
        };
    }

    Result<graph::BuildOptions, Error> build_options_from(const ParsedArgs& args) {
        graph::BuildOptions options;
        options.flags.include_sub_targets = args.get_flag("show-targets");
        options.flags.hide_transient = args.get_flag("hide-transient");
        options.flags.augment = args.get_flag("augment");
        options.flags.id_scheme = args.get_flag("legacy-ids") ? graph::IdScheme::Legacy
                                                               : graph::IdScheme::Stable;

        const auto jobs = args.get("resolve-jobs") ? args.get_int("resolve-jobs") : std::optional<int>(1);
        if (!jobs || *jobs < 1) {
            return Result<graph::BuildOptions, Error>::failure(
                Error::invalid_argument("--resolve-jobs must be a positive integer")
            );
        }
        options.resolve_jobs = static_cast<unsigned int>(*jobs);

        if (options.flags.augment) {
            const auto command = args.get_or("resolve-command", resolve::CommandPackageResolver::kDefaultCommand);
            if (command.empty()) {
                return Result<graph::BuildOptions, Error>::failure(
                    Error::invalid_argument("--resolve-command must not be empty")
                );
            }
            options.resolver = std::make_shared<resolve::CommandPackageResolver>(command);
        }

        return Result<graph::BuildOptions, Error>::success(std::move(options));
    }

    Result<LoadedGraph, Error> load_graph(const fs::path& root,
                                          graph::BuildOptions options,
                                          std::shared_ptr<resolve::ResolutionCache> cache) {
        auto scan = sources::scan_directory(root);
        if (scan.is_err()) {
            return Result<LoadedGraph, Error>::failure(scan.error());
        }

        LoadedGraph loaded;
        loaded.scan = std::move(scan).value();

        options.scan_root = loaded.scan.root;
        const graph::GraphBuilder builder(std::move(options), std::move(cache));
        loaded.report = builder.build(loaded.scan.records);

        return Result<LoadedGraph, Error>::success(std::move(loaded));
    }

    Result<GraphPair, Error> load_graph_pair(const fs::path& from_root,
                                             const fs::path& to_root,
                                             const graph::BuildOptions& options) {
        const auto from_cache = std::make_shared<resolve::ResolutionCache>();
        const auto to_cache = std::make_shared<resolve::ResolutionCache>();

        auto from = load_graph(from_root, options, from_cache);
        if (from.is_err()) {
            return Result<GraphPair, Error>::failure(from.error());
        }
        auto to = load_graph(to_root, options, to_cache);
        if (to.is_err()) {
            return Result<GraphPair, Error>::failure(to.error());
        }

        GraphPair pair;
        pair.from = std::move(from).value();
        pair.to = std::move(to).value();
        pair.resolver_invocations = from_cache->invocation_count() + to_cache->invocation_count();
        return Result<GraphPair, Error>::success(std::move(pair));
    }

}  // namespace pinch::cli
