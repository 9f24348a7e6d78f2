//! # Command Catalog Model
//!
//! Types describing a command found by discovery.
//!
//! | Type                  | Description                                   |
//! |-----------------------|-----------------------------------------------|
//! | `Category`            | Menu grouping (build, test, quality, ...)     |
//! | `CommandScope`        | Workspace, one package, or global             |
//! | `ExecutionDescriptor` | Program, arguments and working directory      |
//! | `DiscoveredCommand`   | Immutable catalog entry                       |
//!
//! A command is data only: the executor interprets its descriptor, so a
//! catalog can be listed, filtered and compared without running anything.

#ifndef DEVKIT_CATALOG_COMMAND_HPP
#define DEVKIT_CATALOG_COMMAND_HPP

#include "common.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devkit::catalog {

// ============================================================================
// Category
// ============================================================================

enum class Category {
    Build,
    Test,
    Quality,
    Services,
    Database,
    Dev,
    Deploy,
    Git,
    Dependencies,
    Scripts,
    Other
};

/// Human-readable category name (e.g., "Development" for Dev).
const char* category_label(Category category);

/// Lower-case identifier (e.g., "dev"), as used in ids and JSON output.
const char* category_name(Category category);

/// Parses a lower-case category identifier.
std::optional<Category> parse_category(std::string_view name);

/// Categories in menu display order.
const std::array<Category, 11>& category_display_order();

// ============================================================================
// CommandScope
// ============================================================================

/// Where a command applies.
class CommandScope {
public:
    enum class Kind { Workspace, Package, Global };

    static CommandScope workspace() {
        return CommandScope(Kind::Workspace, {});
    }
    static CommandScope package(std::string name) {
        return CommandScope(Kind::Package, std::move(name));
    }
    static CommandScope global() {
        return CommandScope(Kind::Global, {});
    }

    Kind kind() const {
        return kind_;
    }

    /// Package name; empty unless kind() is Package.
    const std::string& package_name() const {
        return package_;
    }

    /// "workspace", the package name, or "global".
    std::string label() const;

    bool operator==(const CommandScope& other) const = default;

private:
    CommandScope(Kind kind, std::string package) : kind_(kind), package_(std::move(package)) {}

    Kind kind_;
    std::string package_;
};

// ============================================================================
// ExecutionDescriptor
// ============================================================================

/// How to run a command: no shell is involved unless `program` is one.
struct ExecutionDescriptor {
    std::string program;
    std::vector<std::string> args;
    fs::path working_dir;

    /// Shell-like rendering for display, quoting arguments that need it.
    std::string to_string() const;

    bool operator==(const ExecutionDescriptor& other) const = default;
};

// ============================================================================
// DiscoveredCommand
// ============================================================================

/// A catalog entry. Immutable once built.
class DiscoveredCommand {
public:
    DiscoveredCommand(std::string id, std::string label, std::string description,
                      std::string source, Category category, CommandScope scope,
                      ExecutionDescriptor execution);

    const std::string& id() const {
        return id_;
    }
    const std::string& label() const {
        return label_;
    }
    const std::string& description() const {
        return description_;
    }
    /// File or tool the command came from (e.g., "package.json", "scripts/deploy.sh").
    const std::string& source() const {
        return source_;
    }
    Category category() const {
        return category_;
    }
    const CommandScope& scope() const {
        return scope_;
    }
    const ExecutionDescriptor& execution() const {
        return execution_;
    }

    bool operator==(const DiscoveredCommand& other) const = default;

private:
    std::string id_;
    std::string label_;
    std::string description_;
    std::string source_;
    Category category_;
    CommandScope scope_;
    ExecutionDescriptor execution_;
};

/// Fluent builder for DiscoveredCommand. Scope defaults to global.
class CommandBuilder {
public:
    CommandBuilder(std::string id, std::string label, Category category)
        : id_(std::move(id)), label_(std::move(label)), category_(category) {}

    CommandBuilder& description(std::string desc) {
        description_ = std::move(desc);
        return *this;
    }
    CommandBuilder& source(std::string source) {
        source_ = std::move(source);
        return *this;
    }
    CommandBuilder& scope(CommandScope scope) {
        scope_ = std::move(scope);
        return *this;
    }
    CommandBuilder& run(std::string program, std::vector<std::string> args, fs::path cwd) {
        execution_ = ExecutionDescriptor{std::move(program), std::move(args), std::move(cwd)};
        return *this;
    }

    DiscoveredCommand build() const {
        return DiscoveredCommand(id_, label_, description_, source_, category_, scope_,
                                 execution_);
    }

private:
    std::string id_;
    std::string label_;
    Category category_;
    std::string description_;
    std::string source_;
    CommandScope scope_ = CommandScope::global();
    ExecutionDescriptor execution_;
};

/// Category for a command or script name, by keyword:
/// build/compile, test, lint/check/format, deploy/release/publish,
/// dev/serve/watch/start, clean/install/setup; anything else is Scripts.
Category categorize_name(std::string_view name);

} // namespace devkit::catalog

#endif // DEVKIT_CATALOG_COMMAND_HPP
