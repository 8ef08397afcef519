//
// Created by gregorian-rayne on 2/4/26.
//

#include "pinch/graph/graph.hpp"

#include <algorithm>
#include <array>
#include <queue>
#include <ranges>

namespace pinch::graph {

    namespace {

        constexpr std::size_t index_of(const NodeKind kind) noexcept {
            return static_cast<std::size_t>(kind);
        }

        using K = NodeKind;

        /**
         * kUpgrade[current][observed]. Precedence is
         * InternalModule > Container > SubTarget > ExternalModule, so the
         * table is symmetric and every row is idempotent on its diagonal.
         */
        constexpr std::array<std::array<NodeKind, kNodeKindCount>, kNodeKindCount> kUpgrade = {{
            //               Container            SubTarget            InternalModule       ExternalModule
            /* Container */ {{K::Container,       K::Container,        K::InternalModule,   K::Container}},
            /* SubTarget */ {{K::Container,       K::SubTarget,        K::InternalModule,   K::SubTarget}},
            /* Internal  */ {{K::InternalModule,  K::InternalModule,   K::InternalModule,   K::InternalModule}},
            /* External  */ {{K::Container,       K::SubTarget,        K::InternalModule,   K::ExternalModule}},
        }};

    }  // namespace

    // ============================================================================
    // Kinds and schemes
    // ============================================================================

    const char* to_string(const NodeKind kind) noexcept {
        switch (kind) {
            case NodeKind::Container:      return "container";
            case NodeKind::SubTarget:      return "target";
            case NodeKind::InternalModule: return "internal";
            case NodeKind::ExternalModule: return "external";
        }
        return "external";
    }

    std::optional<NodeKind> parse_node_kind(const std::string_view text) noexcept {
        if (text == "container") return NodeKind::Container;
        if (text == "target") return NodeKind::SubTarget;
        if (text == "internal") return NodeKind::InternalModule;
        if (text == "external") return NodeKind::ExternalModule;
        return std::nullopt;
    }

    NodeKind upgrade_kind(const NodeKind current, const NodeKind observed) noexcept {
        return kUpgrade[index_of(current)][index_of(observed)];
    }

    const char* to_string(const IdScheme scheme) noexcept {
        switch (scheme) {
            case IdScheme::Legacy: return "legacy";
            case IdScheme::Stable: return "stable";
        }
        return "stable";
    }

    int schema_version(const IdScheme scheme) noexcept {
        return scheme == IdScheme::Stable ? 2 : 1;
    }

    // ============================================================================
    // Graph Implementation
    // ============================================================================

    const GraphNode& Graph::add_node(const std::string& id, const std::string& name,
                                     const NodeKind kind, const bool transient) {
        const auto it = nodes_.find(id);
        if (it == nodes_.end()) {
            GraphNode node;
            node.id = id;
            node.name = name;
            node.kind = kind;
            node.is_transient = transient;
            return nodes_.emplace(id, std::move(node)).first->second;
        }

        GraphNode& node = it->second;
        const NodeKind merged = upgrade_kind(node.kind, kind);

        // The display name comes from the strongest observation; ties keep
        // the smallest spelling so arrival order never shows.
        if (merged != node.kind && merged == kind) {
            node.name = name;
        } else if (kind == node.kind && name < node.name) {
            node.name = name;
        }
        node.kind = merged;

        if (!transient) {
            node.is_transient = false;
        }
        return node;
    }

    bool Graph::add_edge(const std::string& from, const std::string& to) {
        if (!successors_[from].insert(to).second) {
            return false;
        }
        predecessors_[to].insert(from);
        ++edge_count_;
        return true;
    }

    bool Graph::has_node(const std::string& id) const {
        return nodes_.contains(id);
    }

    bool Graph::has_edge(const std::string& from, const std::string& to) const {
        const auto it = successors_.find(from);
        return it != successors_.end() && it->second.contains(to);
    }

    const GraphNode* Graph::find_node(const std::string& id) const {
        const auto it = nodes_.find(id);
        return it == nodes_.end() ? nullptr : &it->second;
    }

    std::vector<GraphNode> Graph::nodes() const {
        std::vector<GraphNode> result;
        result.reserve(nodes_.size());
        for (const auto& node : nodes_ | std::views::values) {
            result.push_back(node);
        }
        return result;
    }

    std::vector<std::string> Graph::node_ids() const {
        std::vector<std::string> result;
        result.reserve(nodes_.size());
        for (const auto& id : nodes_ | std::views::keys) {
            result.push_back(id);
        }
        return result;
    }

    std::vector<Edge> Graph::edges() const {
        std::vector<Edge> result;
        result.reserve(edge_count_);
        for (const auto& [from, targets] : successors_) {
            for (const auto& to : targets) {
                result.push_back({from, to});
            }
        }
        return result;
    }

    std::vector<std::string> Graph::successors(const std::string& id) const {
        std::vector<std::string> result;
        if (const auto it = successors_.find(id); it != successors_.end()) {
            for (const auto& succ : it->second) {
                if (nodes_.contains(succ)) {
                    result.push_back(succ);
                }
            }
        }
        return result;
    }

    std::vector<std::string> Graph::predecessors(const std::string& id) const {
        std::vector<std::string> result;
        if (const auto it = predecessors_.find(id); it != predecessors_.end()) {
            for (const auto& pred : it->second) {
                if (nodes_.contains(pred)) {
                    result.push_back(pred);
                }
            }
        }
        return result;
    }

    std::size_t Graph::dangling_edge_count() const {
        std::size_t count = 0;
        for (const auto& [from, targets] : successors_) {
            const bool from_known = nodes_.contains(from);
            for (const auto& to : targets) {
                if (!from_known || !nodes_.contains(to)) {
                    ++count;
                }
            }
        }
        return count;
    }

    void Graph::compute_layers() {
        std::set<std::string> visited;
        std::queue<std::pair<std::string, std::size_t>> queue;

        const auto run_bfs = [&] {
            while (!queue.empty()) {
                auto [id, layer] = queue.front();
                queue.pop();

                nodes_.at(id).layer = layer;
                for (const auto& succ : successors(id)) {
                    if (visited.insert(succ).second) {
                        queue.emplace(succ, layer + 1);
                    }
                }
            }
        };

        for (const auto& id : nodes_ | std::views::keys) {
            if (predecessors(id).empty()) {
                visited.insert(id);
                queue.emplace(id, 0);
            }
        }
        run_bfs();

        for (const auto& id : nodes_ | std::views::keys) {
            if (visited.insert(id).second) {
                queue.emplace(id, 0);
                run_bfs();
            }
        }
    }

    Graph Graph::filtered(const std::function<bool(const GraphNode&)>& keep) const {
        Graph result(flags_);
        for (const auto& [id, node] : nodes_) {
            if (keep(node)) {
                result.nodes_.emplace(id, node);
            }
        }
        for (const auto& [from, targets] : successors_) {
            if (!result.nodes_.contains(from)) {
                continue;
            }
            for (const auto& to : targets) {
                if (result.nodes_.contains(to)) {
                    result.add_edge(from, to);
                }
            }
        }
        return result;
    }

    Graph Graph::without_transient() const {
        return filtered([](const GraphNode& node) { return !node.is_transient; });
    }

}  // namespace pinch::graph
