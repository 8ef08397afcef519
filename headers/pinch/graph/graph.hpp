//
// Created by gregorian-rayne on 2/4/26.
//

#ifndef PINCH_GRAPH_HPP
#define PINCH_GRAPH_HPP

/**
 * @file graph.hpp
 * @brief Module dependency graph.
 *
 * The graph is the hand-off point between the builder, the analyzers and
 * the exporters. Its only mutation surface is add_node() and add_edge(),
 * both idempotent:
 * - Re-adding a node joins the kinds through upgrade_kind() and clears
 *   the transient flag when the new observation is explicit.
 * - Re-adding an edge is a no-op (no multi-edges).
 *
 * Because both joins are commutative, the final graph does not depend on
 * the order observations arrive in.
 */

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pinch::graph {

    /**
     * What a node represents.
     */
    enum class NodeKind {
        Container,       // Top-level buildable unit
        SubTarget,       // Nested build unit, id "container/subtarget"
        InternalModule,  // Locally owned, editable module
        ExternalModule   // Remote module, not owned
    };

    inline constexpr std::size_t kNodeKindCount = 4;

    [[nodiscard]] const char* to_string(NodeKind kind) noexcept;
    [[nodiscard]] std::optional<NodeKind> parse_node_kind(std::string_view text) noexcept;

    /**
     * Joins the kind a node already has with a newly observed kind.
     *
     * Backed by a total 4x4 table. ExternalModule -> InternalModule and
     * Container -> InternalModule are upgrades; no observation ever moves
     * a node away from InternalModule.
     */
    [[nodiscard]] NodeKind upgrade_kind(NodeKind current, NodeKind observed) noexcept;

    /**
     * Identifier discipline used while building.
     *
     * Legacy ids embed absolute container paths; stable ids only use
     * scan-root relative paths and are reproducible across machines.
     */
    enum class IdScheme {
        Legacy,
        Stable
    };

    [[nodiscard]] const char* to_string(IdScheme scheme) noexcept;

    /**
     * JSON schema version renderers must stamp for a scheme.
     */
    [[nodiscard]] int schema_version(IdScheme scheme) noexcept;

    /**
     * Construction flags. Two graphs are only comparable when these match.
     */
    struct BuildFlags {
        bool include_sub_targets = false;
        bool hide_transient = false;
        bool augment = false;
        IdScheme id_scheme = IdScheme::Stable;

        bool operator==(const BuildFlags&) const = default;
    };

    struct GraphNode {
        std::string id;
        std::string name;           // Display name, case preserved
        NodeKind kind = NodeKind::ExternalModule;
        bool is_transient = false;
        std::size_t layer = 0;      // BFS distance from a root, rendering only
    };

    /**
     * "from depends on to".
     */
    struct Edge {
        std::string from;
        std::string to;

        [[nodiscard]] std::string key() const {
            return from + "->" + to;
        }

        auto operator<=>(const Edge&) const = default;
    };

    class Graph {
    public:
        Graph() = default;
        explicit Graph(BuildFlags flags) : flags_(flags) {}

        /**
         * Adds a node or merges the observation into an existing one.
         *
         * @param transient True if this observation did not see the node
         *                  declared explicitly.
         * @return The merged node.
         */
        const GraphNode& add_node(const std::string& id, const std::string& name,
                                  NodeKind kind, bool transient);

        /**
         * Adds from -> to. Endpoints are not created; an edge whose
         * endpoint never becomes a node dangles and is ignored by analysis.
         *
         * @return True if the edge was not present before.
         */
        bool add_edge(const std::string& from, const std::string& to);

        [[nodiscard]] bool has_node(const std::string& id) const;
        [[nodiscard]] bool has_edge(const std::string& from, const std::string& to) const;

        /**
         * Returns the node or nullptr.
         */
        [[nodiscard]] const GraphNode* find_node(const std::string& id) const;

        /**
         * All nodes ordered by id.
         */
        [[nodiscard]] std::vector<GraphNode> nodes() const;

        [[nodiscard]] std::vector<std::string> node_ids() const;

        /**
         * All edges ordered by (from, to), dangling edges included.
         */
        [[nodiscard]] std::vector<Edge> edges() const;

        /**
         * Outgoing neighbours that exist as nodes, ordered by id.
         */
        [[nodiscard]] std::vector<std::string> successors(const std::string& id) const;

        /**
         * Incoming neighbours that exist as nodes, ordered by id.
         */
        [[nodiscard]] std::vector<std::string> predecessors(const std::string& id) const;

        [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
        [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }

        /**
         * Edges with at least one endpoint that is not a node.
         */
        [[nodiscard]] std::size_t dangling_edge_count() const;

        /**
         * Assigns each node its BFS distance from the nearest root.
         *
         * Roots are nodes without incoming edges. Nodes only reachable
         * through a cycle are seeded from their smallest id.
         */
        void compute_layers();

        /**
         * Copy containing only nodes accepted by keep. Edges whose
         * endpoints were dropped (or never existed) are removed.
         */
        [[nodiscard]] Graph filtered(const std::function<bool(const GraphNode&)>& keep) const;

        [[nodiscard]] Graph without_transient() const;

        [[nodiscard]] const BuildFlags& flags() const noexcept { return flags_; }
        void set_flags(const BuildFlags& flags) noexcept { flags_ = flags; }

        [[nodiscard]] int schema_version() const noexcept {
            return graph::schema_version(flags_.id_scheme);
        }

    private:
        std::map<std::string, GraphNode> nodes_;
        std::map<std::string, std::set<std::string>> successors_;
        std::map<std::string, std::set<std::string>> predecessors_;
        std::size_t edge_count_ = 0;
        BuildFlags flags_;
    };

}  // namespace pinch::graph

#endif //PINCH_GRAPH_HPP
