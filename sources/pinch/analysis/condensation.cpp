//
// Created by gregorian-rayne on 2/6/26.
//

#include "pinch/analysis/condensation.hpp"

#include <algorithm>
#include <limits>
#include <queue>
#include <stack>

namespace pinch::analysis {

    ComponentSet strongly_connected_components(const graph::Graph& graph) {
        ComponentSet result;

        const auto nodes = graph.node_ids();
        const std::size_t n = nodes.size();

        std::map<std::string, std::size_t> position;
        for (std::size_t i = 0; i < n; ++i) {
            position.emplace(nodes[i], i);
        }

        std::vector<std::vector<std::size_t>> adjacency(n);
        for (std::size_t i = 0; i < n; ++i) {
            for (const auto& succ : graph.successors(nodes[i])) {
                adjacency[i].push_back(position.at(succ));
            }
        }

        constexpr std::size_t kUnvisited = std::numeric_limits<std::size_t>::max();
        std::vector<std::size_t> indices(n, kUnvisited);
        std::vector<std::size_t> lowlinks(n, 0);
        std::vector<bool> on_stack(n, false);
        std::stack<std::size_t> stack;
        std::size_t index = 0;

        // (node, next successor to visit)
        std::vector<std::pair<std::size_t, std::size_t>> calls;

        const auto enter = [&](const std::size_t node) {
            indices[node] = index;
            lowlinks[node] = index;
            ++index;
            stack.push(node);
            on_stack[node] = true;
            calls.emplace_back(node, 0);
        };

        for (std::size_t root = 0; root < n; ++root) {
            if (indices[root] != kUnvisited) {
                continue;
            }
            enter(root);

            while (!calls.empty()) {
                const std::size_t node = calls.back().first;
                const std::size_t next = calls.back().second;

                if (next < adjacency[node].size()) {
                    ++calls.back().second;
                    const std::size_t dep = adjacency[node][next];
                    if (indices[dep] == kUnvisited) {
                        enter(dep);
                    } else if (on_stack[dep]) {
                        lowlinks[node] = std::min(lowlinks[node], indices[dep]);
                    }
                    continue;
                }

                if (lowlinks[node] == indices[node]) {
                    std::vector<std::string> component;
                    std::size_t w;
                    do {
                        w = stack.top();
                        stack.pop();
                        on_stack[w] = false;
                        component.push_back(nodes[w]);
                    } while (w != node);

                    std::ranges::sort(component);
                    const std::size_t id = result.components.size();
                    for (const auto& member : component) {
                        result.component_of.emplace(member, id);
                    }
                    result.components.push_back(std::move(component));
                }

                calls.pop_back();
                if (!calls.empty()) {
                    const std::size_t parent = calls.back().first;
                    lowlinks[parent] = std::min(lowlinks[parent], lowlinks[node]);
                }
            }
        }

        return result;
    }

    Condensation condense(const graph::Graph& graph) {
        auto [components, component_of] = strongly_connected_components(graph);

        Condensation result;
        result.successors.resize(components.size());
        result.predecessors.resize(components.size());

        for (const auto& edge : graph.edges()) {
            const auto from = component_of.find(edge.from);
            const auto to = component_of.find(edge.to);
            if (from == component_of.end() || to == component_of.end()) {
                continue;
            }
            if (from->second == to->second) {
                continue;
            }
            result.successors[from->second].insert(to->second);
            result.predecessors[to->second].insert(from->second);
        }

        result.components = std::move(components);
        result.component_of = std::move(component_of);
        return result;
    }

    std::size_t Condensation::member_count(const std::set<std::size_t>& ids) const {
        std::size_t count = 0;
        for (const auto id : ids) {
            count += components[id].size();
        }
        return count;
    }

    std::vector<std::size_t> Condensation::depths() const {
        // Components are in reverse topological order, so every successor
        // of component i has a smaller index and is already settled.
        std::vector<std::size_t> depth(components.size(), 0);
        for (std::size_t i = 0; i < components.size(); ++i) {
            for (const auto succ : successors[i]) {
                depth[i] = std::max(depth[i], depth[succ] + 1);
            }
        }
        return depth;
    }

    std::set<std::size_t> Condensation::reachable(const std::size_t start, const bool forward) const {
        std::set<std::size_t> visited;
        std::queue<std::size_t> queue;
        queue.push(start);

        const auto& adjacency = forward ? successors : predecessors;
        while (!queue.empty()) {
            const std::size_t current = queue.front();
            queue.pop();
            for (const auto next : adjacency[current]) {
                if (next != start && visited.insert(next).second) {
                    queue.push(next);
                }
            }
        }
        return visited;
    }

}  // namespace pinch::analysis
