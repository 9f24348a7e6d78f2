//! # Workspace Validation
//!
//! Collects every configuration problem in one pass. Errors block execution
//! of the commands they affect; warnings are informational.
//!
//! | Check                          | Severity |
//! |--------------------------------|----------|
//! | Invalid workspace glob pattern | error    |
//! | Malformed dependency reference | error    |
//! | Dependency not found           | error    |
//! | Circular dependency            | error    |
//! | Port used by several services  | warning  |
//! | No packages found              | warning  |

#ifndef DEVKIT_GRAPH_VALIDATE_HPP
#define DEVKIT_GRAPH_VALIDATE_HPP

#include "graph/dependency_graph.hpp"

#include <string>
#include <vector>

namespace devkit::config {
struct WorkspaceConfig;
}

namespace devkit::registry {
class CommandRegistry;
}

namespace devkit::graph {

struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool is_valid() const {
        return errors.empty();
    }

    void add_error(std::string message) {
        errors.push_back(std::move(message));
    }

    void add_warning(std::string message) {
        warnings.push_back(std::move(message));
    }

    void merge(const ValidationReport& other);
};

/// Reference existence and acyclicity of a built graph.
ValidationReport validate_graph(const DependencyGraph& graph);

/// Graph checks over the registry's command tables.
ValidationReport validate(const registry::CommandRegistry& registry);

/// Graph checks plus workspace patterns, service ports and package count.
ValidationReport validate(const config::WorkspaceConfig& workspace,
                          const registry::CommandRegistry& registry);

} // namespace devkit::graph

#endif // DEVKIT_GRAPH_VALIDATE_HPP
