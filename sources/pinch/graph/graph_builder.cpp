//
// Created by gregorian-rayne on 2/5/26.
//

#include "pinch/graph/graph_builder.hpp"
#include "pinch/graph/identity.hpp"
#include "pinch/utils/path_utils.hpp"
#include "pinch/utils/string_utils.hpp"
#include "pinch/utils/parallel.hpp"

#include <algorithm>
#include <map>
#include <queue>
#include <set>
#include <tuple>

namespace pinch::graph {

    namespace {

        using model::DependencyInfo;
        using resolve::ResolutionCache;
        using resolve::ResolutionRoot;
        using resolve::ResolvedPackage;

        /**
         * A record with everything the merge needs precomputed.
         */
        struct PreparedRecord {
            const DependencyInfo* info = nullptr;
            std::string display_name;
            std::string normalized;
            std::string relative_dir;
            std::string absolute_dir;
            bool internal = false;
            std::string node_id;
        };

        /**
         * Result of the classification pass.
         */
        struct Classification {
            std::set<std::string> internal_modules;
            std::set<std::string> explicit_names;
            std::map<std::string, std::set<std::string>> container_dirs;
            std::map<std::string, std::string> owner_names;

            [[nodiscard]] bool is_internal(const std::string& normalized) const {
                return internal_modules.contains(normalized);
            }

            [[nodiscard]] bool is_transient(const std::string& normalized) const {
                return !explicit_names.contains(normalized) && !internal_modules.contains(normalized);
            }

            [[nodiscard]] bool container_shared(const std::string& normalized) const {
                const auto it = container_dirs.find(normalized);
                return it != container_dirs.end() && it->second.size() > 1;
            }
        };

        bool declares_itself(const DependencyInfo& info, const std::string& normalized) {
            return std::ranges::any_of(info.explicit_dependencies, [&](const std::string& dep) {
                return normalize_name(dep) == normalized;
            });
        }

        /**
         * dependencies followed by explicit entries not already listed,
         * deduplicated on the normalized name. excluded is the module's own
         * name for internal records and empty for containers, whose ids
         * never collide with a module.
         */
        std::vector<std::string> dependency_names(const DependencyInfo& info, const std::string& excluded) {
            std::vector<std::string> result;
            std::set<std::string> seen{excluded};

            const auto take = [&](const std::string& name) {
                const auto normalized = normalize_name(name);
                if (normalized.empty()) {
                    return;
                }
                if (seen.insert(normalized).second) {
                    result.emplace_back(string_utils::trim(name));
                }
            };

            for (const auto& dep : info.dependencies) {
                take(dep);
            }
            for (const auto& dep : info.explicit_dependencies) {
                take(dep);
            }
            return result;
        }

        /**
         * Adds a module node for a dependency reference. The id comes from
         * key; display is only used when no record owns the module.
         */
        std::string add_module(Graph& graph, const Classification& classes,
                               const std::string& key, const std::string& display,
                               const bool transient) {
            const auto normalized = normalize_name(key);
            const auto id = module_id(normalized);

            const auto owner = classes.owner_names.find(id);
            const NodeKind kind = classes.is_internal(normalized) ? NodeKind::InternalModule
                                                                  : NodeKind::ExternalModule;
            graph.add_node(id, owner != classes.owner_names.end() ? owner->second : display, kind, transient);
            return id;
        }

        std::string add_module(Graph& graph, const Classification& classes,
                               const std::string& name, const bool transient) {
            return add_module(graph, classes, name, name, transient);
        }

        void merge_sub_targets(Graph& graph, const Classification& classes,
                               const PreparedRecord& record,
                               const std::vector<std::string>& dependencies,
                               std::vector<std::string>& warnings) {
            const auto& info = *record.info;

            std::map<std::string, std::string> sibling_ids;
            for (const auto& target : info.sub_targets) {
                const auto name = std::string(string_utils::trim(target.name));
                if (name.empty()) {
                    continue;
                }
                sibling_ids.emplace(name, sub_target_id(record.node_id, name));
            }

            std::set<std::string> imported;
            for (const auto& target : info.sub_targets) {
                const auto name = std::string(string_utils::trim(target.name));
                if (name.empty()) {
                    continue;
                }
                const auto& target_id = sibling_ids.at(name);
                graph.add_node(target_id, name, NodeKind::SubTarget, false);
                graph.add_edge(record.node_id, target_id);

                for (const auto& sibling : target.target_dependencies) {
                    const auto it = sibling_ids.find(std::string(string_utils::trim(sibling)));
                    if (it == sibling_ids.end()) {
                        warnings.push_back("target '" + name + "' of " + record.display_name +
                                           " depends on unknown target '" + sibling + "'");
                        continue;
                    }
                    if (it->second != target_id) {
                        graph.add_edge(target_id, it->second);
                    }
                }

                for (const auto& package : target.package_dependencies) {
                    const auto normalized = normalize_name(package);
                    if (normalized.empty() || (record.internal && normalized == record.normalized)) {
                        continue;
                    }
                    imported.insert(normalized);
                    const auto id = add_module(graph, classes, std::string(string_utils::trim(package)),
                                               classes.is_transient(normalized));
                    graph.add_edge(target_id, id);
                }
            }

            // The container keeps only the dependencies no target imports.
            for (const auto& dep : dependencies) {
                const auto normalized = normalize_name(dep);
                if (imported.contains(normalized)) {
                    continue;
                }
                const auto id = add_module(graph, classes, dep, classes.is_transient(normalized));
                graph.add_edge(record.node_id, id);
            }
        }

        /**
         * Folds a resolved tree under its root node.
         *
         * Breadth first, so every module is expanded at its shallowest
         * depth. Depth-1 children are explicit. With hide_transient the
         * walk does not expand below depth 2.
         */
        void merge_resolution(Graph& graph, const Classification& classes,
                              const std::string& root_id, const ResolvedPackage& package,
                              const bool hide_transient) {
            struct Frame {
                std::string parent;
                const ResolvedPackage* node;
                std::size_t depth;
            };

            std::queue<Frame> pending;
            std::set<std::string> expanded{root_id};
            for (const auto& child : package.dependencies) {
                pending.push({root_id, &child, 1});
            }

            while (!pending.empty()) {
                const Frame frame = pending.front();
                pending.pop();

                const auto normalized = normalize_name(frame.node->identity);
                if (normalized.empty()) {
                    continue;
                }
                const bool transient = frame.depth > 1 && classes.is_transient(normalized);
                const auto& display = frame.node->name.empty() ? frame.node->identity : frame.node->name;
                const auto id = add_module(graph, classes, frame.node->identity, display, transient);
                if (id != frame.parent) {
                    graph.add_edge(frame.parent, id);
                }

                if (hide_transient && frame.depth >= 2) {
                    continue;
                }
                if (!expanded.insert(id).second) {
                    continue;
                }
                for (const auto& child : frame.node->dependencies) {
                    pending.push({id, &child, frame.depth + 1});
                }
            }
        }

    }  // namespace

    GraphBuilder::GraphBuilder(BuildOptions options, std::shared_ptr<resolve::ResolutionCache> cache)
        : options_(std::move(options))
        , cache_(cache ? std::move(cache) : std::make_shared<resolve::ResolutionCache>()) {}

    BuildReport GraphBuilder::build(const std::vector<model::DependencyInfo>& records) const {
        BuildReport report;
        report.graph.set_flags(options_.flags);
        Graph& graph = report.graph;

        // Canonical order
        std::vector<PreparedRecord> prepared;
        prepared.reserve(records.size());
        for (const auto& info : records) {
            PreparedRecord record;
            record.info = &info;
            record.display_name = std::string(string_utils::trim(info.name));
            record.normalized = normalize_name(info.name);
            if (record.normalized.empty()) {
                report.warnings.push_back("skipping record without a name at " + info.path.string());
                continue;
            }
            record.relative_dir = path_utils::relative_to_root(info.path, options_.scan_root);
            if (options_.flags.id_scheme == IdScheme::Legacy && !info.path.empty()) {
                record.absolute_dir = path_utils::canonical_key(info.path);
            }
            record.internal = declares_itself(info, record.normalized);
            prepared.push_back(std::move(record));
        }

        std::ranges::sort(prepared, [](const PreparedRecord& a, const PreparedRecord& b) {
            return std::tie(a.normalized, a.relative_dir, a.display_name) <
                   std::tie(b.normalized, b.relative_dir, b.display_name);
        });

        // Pass 1: classification
        Classification classes;
        for (const auto& record : prepared) {
            for (const auto& dep : record.info->explicit_dependencies) {
                if (auto normalized = normalize_name(dep); !normalized.empty()) {
                    classes.explicit_names.insert(std::move(normalized));
                }
            }
            if (record.internal) {
                classes.internal_modules.insert(record.normalized);
            } else {
                classes.container_dirs[record.normalized].insert(record.relative_dir);
            }
        }

        for (auto& record : prepared) {
            if (record.internal) {
                record.node_id = module_id(record.normalized);
            } else {
                record.node_id = container_id(record.normalized, record.relative_dir, record.absolute_dir,
                                              classes.container_shared(record.normalized),
                                              options_.flags.id_scheme);
            }
            auto [it, inserted] = classes.owner_names.emplace(record.node_id, record.display_name);
            if (!inserted && record.display_name < it->second) {
                it->second = record.display_name;
            }
        }

        // Pass 2: merge
        for (const auto& record : prepared) {
            const NodeKind kind = record.internal ? NodeKind::InternalModule : NodeKind::Container;
            graph.add_node(record.node_id, classes.owner_names.at(record.node_id), kind, false);

            const auto dependencies = dependency_names(*record.info, record.internal ? record.normalized : "");
            if (options_.flags.include_sub_targets && !record.info->sub_targets.empty()) {
                merge_sub_targets(graph, classes, record, dependencies, report.warnings);
            } else {
                for (const auto& dep : dependencies) {
                    const auto id = add_module(graph, classes, dep, classes.is_transient(normalize_name(dep)));
                    graph.add_edge(record.node_id, id);
                }
            }
            ++report.records_merged;
        }

        // Pass 3: augmentation
        if (options_.flags.augment) {
            if (!options_.resolver) {
                report.warnings.push_back("augmentation requested without a package resolver");
            } else {
                std::vector<ResolutionRoot> roots;
                std::vector<std::string> root_ids;
                for (const auto& record : prepared) {
                    if (!record.internal) {
                        continue;
                    }
                    roots.push_back({record.normalized, record.info->path});
                    root_ids.push_back(record.node_id);
                }

                const auto& resolver = *options_.resolver;
                const auto resolve_one = [this, &resolver](const ResolutionRoot& root) {
                    return cache_->get_or_resolve(root, resolver);
                };

                std::vector<ResolutionCache::Outcome> outcomes;
                if (options_.resolve_jobs > 1 && roots.size() > 1) {
                    const auto workers = static_cast<unsigned int>(
                        std::min<std::size_t>(options_.resolve_jobs, roots.size()));
                    parallel::ThreadPool pool(workers);
                    outcomes = parallel::map(roots, resolve_one, pool);
                } else {
                    outcomes.reserve(roots.size());
                    for (const auto& root : roots) {
                        outcomes.push_back(resolve_one(root));
                    }
                }

                for (std::size_t i = 0; i < outcomes.size(); ++i) {
                    const auto& outcome = outcomes[i];
                    if (outcome.is_err()) {
                        ++report.augmentation_failures;
                        report.warnings.push_back("augmentation skipped for " + roots[i].directory.string() +
                                                  ": " + outcome.error().message());
                        continue;
                    }
                    ++report.roots_resolved;
                    merge_resolution(graph, classes, root_ids[i], outcome.value(),
                                     options_.flags.hide_transient);
                }
            }
        }

        if (options_.flags.hide_transient) {
            graph = graph.without_transient();
        }
        graph.compute_layers();

        return report;
    }

}  // namespace pinch::graph
