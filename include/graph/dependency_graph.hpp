//! # Command Dependency Graph
//!
//! One node per declared command, keyed `"package:command"`, with an edge to
//! every normalized dependency reference.
//!
//! ## References
//!
//! | Declared   | In `web:build`  | Normalized  |
//! |------------|-----------------|-------------|
//! | `api:gen`  |                 | `api:gen`   |
//! | `api`      |                 | `api:build` |
//! | `a:b:c`    |                 | malformed   |
//! | `:gen`     |                 | malformed   |
//!
//! The graph keeps edges to targets that do not exist so validation can
//! report them; traversal helpers skip such edges.

#ifndef DEVKIT_GRAPH_DEPENDENCY_GRAPH_HPP
#define DEVKIT_GRAPH_DEPENDENCY_GRAPH_HPP

#include "common.hpp"

#include <map>
#include <string>
#include <vector>

namespace devkit::registry {
class CommandRegistry;
}

namespace devkit::graph {

/// "package:command"
std::string node_id(const std::string& package, const std::string& command);

/// Why a dependency reference could not be normalized.
struct ReferenceError {
    std::string reason;
};

/// Normalizes a dependency reference declared by `command`. A bare package
/// name expands to `package:<command>`.
Result<std::string, ReferenceError> normalize_reference(const std::string& ref,
                                                        const std::string& command);

/// An edge whose target has no command entry.
struct MissingReference {
    std::string from;   ///< Node declaring the dependency
    std::string ref;    ///< Reference as written
    std::string target; ///< Normalized target node
};

/// A reference that could not be normalized.
struct MalformedReference {
    std::string from;
    std::string ref;
    std::string reason;
};

class DependencyGraph {
public:
    /// Graph over every (package, command, entry) in the registry.
    static DependencyGraph build(const registry::CommandRegistry& registry);

    /// Adds a node with already-normalized dependency targets.
    void add_node(const std::string& id, const std::vector<std::string>& deps);

    bool contains(const std::string& id) const {
        return nodes_.count(id) != 0;
    }

    /// Normalized dependency targets of `id`, including missing ones.
    std::vector<std::string> dependencies(const std::string& id) const;

    /// Node ids in sorted order.
    std::vector<std::string> node_ids() const;

    size_t size() const {
        return nodes_.size();
    }

    std::vector<MissingReference> missing_references() const;

    const std::vector<MalformedReference>& malformed_references() const {
        return malformed_;
    }

    /// Every distinct cycle as a path that starts and ends at the same node,
    /// e.g. {a:build, b:build, a:build}. Rotations of one cycle are reported once.
    std::vector<std::vector<std::string>> find_cycles() const;

    /// Nodes that cannot run, mapped to the node (or cycle) blocking them:
    /// nodes with a missing or malformed reference, cycle members, and every
    /// node that depends on one of those.
    std::map<std::string, std::string> blocked_nodes() const;

    /// `root` and everything it depends on, dependencies first (DFS post-order).
    /// Missing targets are omitted; back edges of a cycle are not followed.
    std::vector<std::string> dependency_order(const std::string& root) const;

private:
    struct Edge {
        std::string ref;
        std::string target;
    };

    std::map<std::string, std::vector<Edge>> nodes_;
    std::vector<MalformedReference> malformed_;
};

/// "a:build -> b:build -> a:build"
std::string format_cycle(const std::vector<std::string>& cycle);

} // namespace devkit::graph

#endif // DEVKIT_GRAPH_DEPENDENCY_GRAPH_HPP
