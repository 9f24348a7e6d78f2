#include "graph/validate.hpp"

#include "config/config.hpp"
#include "log/log.hpp"
#include "registry/registry.hpp"

#include <map>

namespace devkit::graph {

void ValidationReport::merge(const ValidationReport& other) {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
}

ValidationReport validate_graph(const DependencyGraph& graph) {
    ValidationReport report;

    for (const auto& bad : graph.malformed_references()) {
        report.add_error("Malformed dependency '" + bad.ref + "' in " + bad.from + " - " +
                         bad.reason);
    }
    for (const auto& missing : graph.missing_references()) {
        report.add_error("Invalid dependency '" + missing.ref + "' in " + missing.from +
                         " - dependency not found");
    }
    for (const auto& cycle : graph.find_cycles()) {
        report.add_error("Circular dependency detected: " + format_cycle(cycle));
    }

    return report;
}

ValidationReport validate(const registry::CommandRegistry& registry) {
    return validate_graph(DependencyGraph::build(registry));
}

ValidationReport validate(const config::WorkspaceConfig& workspace,
                          const registry::CommandRegistry& registry) {
    ValidationReport report;

    for (const auto& pattern : workspace.global.package_patterns) {
        if (auto problem = config::check_glob_pattern(pattern)) {
            report.add_error("Invalid glob pattern '" + pattern + "': " + *problem);
        }
    }

    report.merge(validate(registry));

    std::map<int64_t, std::vector<std::string>> by_port;
    for (const auto& [service, port] : workspace.global.service_ports) {
        by_port[port].push_back(service);
    }
    for (const auto& [port, services] : by_port) {
        if (services.size() < 2) {
            continue;
        }
        std::string names;
        for (const auto& service : services) {
            if (!names.empty()) {
                names += ", ";
            }
            names += service;
        }
        report.add_warning("Port " + std::to_string(port) + " is used by multiple services: " +
                           names);
    }

    if (workspace.packages.empty()) {
        report.add_warning(
            "No packages found. Check your workspace patterns in .dev/config.toml");
    }

    DEVKIT_LOG_DEBUG("validate", report.errors.size() << " errors, " << report.warnings.size()
                                                      << " warnings");
    return report;
}

} // namespace devkit::graph
