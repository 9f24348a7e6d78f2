#include "graph/dependency_graph.hpp"

#include "registry/registry.hpp"

#include <algorithm>
#include <functional>
#include <set>

namespace devkit::graph {

std::string node_id(const std::string& package, const std::string& command) {
    return package + ":" + command;
}

Result<std::string, ReferenceError> normalize_reference(const std::string& ref,
                                                        const std::string& command) {
    if (ref.empty()) {
        return ReferenceError{"empty reference"};
    }
    auto colon = ref.find(':');
    if (colon == std::string::npos) {
        return node_id(ref, command);
    }
    if (ref.find(':', colon + 1) != std::string::npos) {
        return ReferenceError{"expected 'package' or 'package:command'"};
    }
    if (colon == 0) {
        return ReferenceError{"missing package name"};
    }
    if (colon + 1 == ref.size()) {
        return ReferenceError{"missing command name"};
    }
    return ref;
}

// ============================================================================
// Construction
// ============================================================================

DependencyGraph DependencyGraph::build(const registry::CommandRegistry& registry) {
    DependencyGraph graph;
    for (const auto& entry : registry.entries()) {
        auto id = node_id(entry.package->name, *entry.command);
        auto& edges = graph.nodes_[id];
        for (const auto& ref : entry.entry->deps()) {
            auto normalized = normalize_reference(ref, *entry.command);
            if (is_err(normalized)) {
                graph.malformed_.push_back(MalformedReference{id, ref, unwrap_err(normalized).reason});
                continue;
            }
            edges.push_back(Edge{ref, unwrap(normalized)});
        }
    }
    return graph;
}

void DependencyGraph::add_node(const std::string& id, const std::vector<std::string>& deps) {
    auto& edges = nodes_[id];
    for (const auto& dep : deps) {
        edges.push_back(Edge{dep, dep});
    }
}

std::vector<std::string> DependencyGraph::dependencies(const std::string& id) const {
    std::vector<std::string> result;
    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        for (const auto& edge : it->second) {
            result.push_back(edge.target);
        }
    }
    return result;
}

std::vector<std::string> DependencyGraph::node_ids() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<MissingReference> DependencyGraph::missing_references() const {
    std::vector<MissingReference> missing;
    for (const auto& [id, edges] : nodes_) {
        for (const auto& edge : edges) {
            if (!contains(edge.target)) {
                missing.push_back(MissingReference{id, edge.ref, edge.target});
            }
        }
    }
    return missing;
}

// ============================================================================
// Cycle Detection
// ============================================================================

/// Iterative DFS over the adjacency map.
///
/// Each stack frame holds a node and the index of the next edge to follow.
/// A node reached again while still on the active path closes a cycle; the
/// cycle is the path suffix from that node's first occurrence.
std::vector<std::vector<std::string>> DependencyGraph::find_cycles() const {
    enum class Mark { Unvisited, Active, Done };

    std::map<std::string, Mark> marks;
    for (const auto& [id, _] : nodes_) {
        marks[id] = Mark::Unvisited;
    }

    std::vector<std::vector<std::string>> cycles;
    std::set<std::vector<std::string>> seen; // rotation-normalized cycles

    struct Frame {
        const std::string* node;
        size_t next_edge;
    };

    for (const auto& [start, _] : nodes_) {
        if (marks[start] != Mark::Unvisited) {
            continue;
        }

        std::vector<Frame> stack;
        std::vector<std::string> path;
        stack.push_back(Frame{&start, 0});
        path.push_back(start);
        marks[start] = Mark::Active;

        while (!stack.empty()) {
            auto& frame = stack.back();
            const auto& edges = nodes_.at(*frame.node);

            if (frame.next_edge >= edges.size()) {
                marks[*frame.node] = Mark::Done;
                stack.pop_back();
                path.pop_back();
                continue;
            }

            const auto& target = edges[frame.next_edge++].target;
            auto mark_it = marks.find(target);
            if (mark_it == marks.end() || mark_it->second == Mark::Done) {
                continue;
            }

            if (mark_it->second == Mark::Active) {
                auto first = std::find(path.begin(), path.end(), target);
                std::vector<std::string> cycle(first, path.end());

                auto key = cycle;
                std::rotate(key.begin(), std::min_element(key.begin(), key.end()), key.end());
                if (seen.insert(key).second) {
                    cycle.push_back(target);
                    cycles.push_back(std::move(cycle));
                }
                continue;
            }

            auto node_it = nodes_.find(target);
            mark_it->second = Mark::Active;
            stack.push_back(Frame{&node_it->first, 0});
            path.push_back(target);
        }
    }

    return cycles;
}

std::string format_cycle(const std::vector<std::string>& cycle) {
    std::string result;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) {
            result += " -> ";
        }
        result += cycle[i];
    }
    return result;
}

// ============================================================================
// Blocking and Ordering
// ============================================================================

std::map<std::string, std::string> DependencyGraph::blocked_nodes() const {
    std::map<std::string, std::string> blocked;

    for (const auto& bad : malformed_) {
        blocked.emplace(bad.from, bad.ref);
    }
    for (const auto& missing : missing_references()) {
        blocked.emplace(missing.from, missing.target);
    }
    for (const auto& cycle : find_cycles()) {
        auto description = format_cycle(cycle);
        for (size_t i = 0; i + 1 < cycle.size(); ++i) {
            blocked.emplace(cycle[i], description);
        }
    }

    // Propagate to dependents. Cycle members are already blocked, so the
    // recursion below never revisits a node on its own path.
    std::set<std::string> clear;
    std::function<const std::string*(const std::string&)> reason =
        [&](const std::string& id) -> const std::string* {
        auto it = blocked.find(id);
        if (it != blocked.end()) {
            return &it->second;
        }
        if (clear.count(id) != 0) {
            return nullptr;
        }
        auto node = nodes_.find(id);
        if (node != nodes_.end()) {
            for (const auto& edge : node->second) {
                if (const auto* why = reason(edge.target)) {
                    auto [pos, _] = blocked.emplace(id, *why);
                    return &pos->second;
                }
            }
        }
        clear.insert(id);
        return nullptr;
    };

    for (const auto& [id, _] : nodes_) {
        reason(id);
    }
    return blocked;
}

std::vector<std::string> DependencyGraph::dependency_order(const std::string& root) const {
    std::vector<std::string> order;
    if (!contains(root)) {
        return order;
    }

    std::set<std::string> visited;
    std::set<std::string> active;

    std::function<void(const std::string&)> visit = [&](const std::string& id) {
        if (visited.count(id) != 0 || active.count(id) != 0) {
            return;
        }
        active.insert(id);
        for (const auto& edge : nodes_.at(id)) {
            if (contains(edge.target)) {
                visit(edge.target);
            }
        }
        active.erase(id);
        visited.insert(id);
        order.push_back(id);
    };

    visit(root);
    return order;
}

} // namespace devkit::graph
