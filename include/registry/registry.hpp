//! # Command Registry
//!
//! Per-package tables of declarative commands, built once from loaded
//! configuration and read-only afterwards.
//!
//! ## Lookups
//!
//! | Method              | Returns                                      |
//! |---------------------|----------------------------------------------|
//! | `package(name)`     | The package node, or nullptr                 |
//! | `get(pkg, cmd)`     | The command entry, or nullptr                |
//! | `packages_with(cmd)`| Packages defining `cmd`, by package name     |
//! | `command_names()`   | Every distinct command name, sorted          |
//! | `entries()`         | All (package, command, entry) triples        |

#ifndef DEVKIT_REGISTRY_REGISTRY_HPP
#define DEVKIT_REGISTRY_REGISTRY_HPP

#include "common.hpp"
#include "registry/command_entry.hpp"

#include <map>
#include <string>
#include <vector>

namespace devkit::config {
struct PackageConfig;
}

namespace devkit::registry {

/// A package and its command table.
struct PackageNode {
    fs::path path;
    std::string name;
    std::map<std::string, CommandEntry> commands;

    const CommandEntry* find(const std::string& command) const {
        auto it = commands.find(command);
        return it == commands.end() ? nullptr : &it->second;
    }
};

/// One command of one package, as seen by the graph builder.
struct EntryRef {
    const PackageNode* package;
    const std::string* command;
    const CommandEntry* entry;
};

class CommandRegistry {
public:
    CommandRegistry() = default;

    /// Builds the registry from loaded package configs. A later package with
    /// an already-registered name is ignored (and logged).
    static CommandRegistry from_packages(const std::vector<config::PackageConfig>& packages);

    /// Adds a package. Returns false if a package with that name already exists.
    bool add(PackageNode node);

    const PackageNode* package(const std::string& name) const;

    const CommandEntry* get(const std::string& package, const std::string& command) const;

    std::vector<const PackageNode*> packages_with(const std::string& command) const;

    std::vector<std::string> command_names() const;

    std::vector<EntryRef> entries() const;

    const std::map<std::string, PackageNode>& packages() const {
        return packages_;
    }

    bool empty() const {
        return packages_.empty();
    }

private:
    std::map<std::string, PackageNode> packages_;
};

} // namespace devkit::registry

#endif // DEVKIT_REGISTRY_REGISTRY_HPP
