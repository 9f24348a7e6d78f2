//! # Discovery Providers
//!
//! One provider per ecosystem. Each answers two questions about a repository:
//!
//! - `is_available`: is this ecosystem present? (file checks and a search-path
//!   lookup only)
//! - `discover`: which commands does it offer? (reads manifests, never runs
//!   anything)
//!
//! | Provider           | Looks at                              | Ids                     |
//! |--------------------|---------------------------------------|-------------------------|
//! | `NpmProvider`      | `package.json` at root and packages   | `npm.<pkg>.<script>`    |
//! | `CargoProvider`    | `Cargo.toml` at root                  | `cargo.<action>.all`    |
//! | `MakefileProvider` | `Makefile`, `makefile`, `GNUmakefile` | `make.<target>`         |
//! | `ScriptProvider`   | `bin/`, `scripts/`, `.dev/scripts/`, `tools/` | `script.<dir>.<file>` |
//! | `ComposeProvider`  | `docker-compose.yml` and variants     | `compose.<action>`      |
//!
//! Providers hold no state; output is sorted by id so repeated calls on an
//! unchanged tree return identical lists.

#ifndef DEVKIT_DISCOVERY_PROVIDER_HPP
#define DEVKIT_DISCOVERY_PROVIDER_HPP

#include "catalog/command.hpp"
#include "common.hpp"
#include "core/context.hpp"

#include <optional>
#include <string>
#include <vector>

namespace devkit::discovery {

using catalog::DiscoveredCommand;

/// Commands found by one provider, or why it could not read its inputs.
using DiscoverResult = Result<std::vector<DiscoveredCommand>, std::string>;

/// Capability interface implemented by every provider.
class CommandProvider {
public:
    virtual ~CommandProvider() = default;

    virtual const char* name() const = 0;

    virtual bool is_available(const Context& ctx) const = 0;

    virtual DiscoverResult discover(const Context& ctx) const = 0;
};

/// Stable sort by id.
void sort_commands(std::vector<DiscoveredCommand>& commands);

// ============================================================================
// Package Scripts (npm / pnpm / yarn)
// ============================================================================

class NpmProvider : public CommandProvider {
public:
    const char* name() const override {
        return "npm";
    }
    bool is_available(const Context& ctx) const override;
    DiscoverResult discover(const Context& ctx) const override;
};

/// "pnpm", "yarn" or "npm", from the lock and workspace files at `repo`.
const char* detect_package_manager(const fs::path& repo);

// ============================================================================
// Cargo
// ============================================================================

class CargoProvider : public CommandProvider {
public:
    const char* name() const override {
        return "cargo";
    }
    bool is_available(const Context& ctx) const override;
    DiscoverResult discover(const Context& ctx) const override;
};

// ============================================================================
// Makefile Targets
// ============================================================================

struct MakeTarget {
    std::string name;
    std::string description; ///< Joined preceding comment lines; may be empty
};

/// Extracts runnable targets from Makefile text, in file order, first
/// definition of each name only.
///
/// A target line is unindented, has a ':' before any '=', is not a ':=' or
/// '::=' assignment, does not start with '.' or '_', and has no `$(`/`${` in
/// its target list. Contiguous '#' lines directly above it (a blank line
/// resets them) form the description. `define`..`endef` bodies are skipped.
std::vector<MakeTarget> parse_makefile_targets(const std::string& content);

class MakefileProvider : public CommandProvider {
public:
    const char* name() const override {
        return "make";
    }
    bool is_available(const Context& ctx) const override;
    DiscoverResult discover(const Context& ctx) const override;
};

// ============================================================================
// Executable Scripts
// ============================================================================

/// Directories searched for scripts, relative to the repository root.
const std::vector<std::string>& script_directories();

/// Description from the first 20 lines of a script: a `# Description:` line
/// if any, else the first plain `# ` comment between 11 and 99 characters
/// that is not a shebang or an interpreter path.
std::optional<std::string> extract_script_description(const fs::path& script);

class ScriptProvider : public CommandProvider {
public:
    const char* name() const override {
        return "scripts";
    }
    bool is_available(const Context& ctx) const override;
    DiscoverResult discover(const Context& ctx) const override;
};

// ============================================================================
// Compose Services
// ============================================================================

/// Compose file names, in lookup order.
const std::vector<std::string>& compose_file_names();

/// Service names declared under `services:` in compose YAML, sorted.
Result<std::vector<std::string>, std::string> parse_compose_services(const std::string& yaml);

class ComposeProvider : public CommandProvider {
public:
    const char* name() const override {
        return "compose";
    }
    bool is_available(const Context& ctx) const override;
    DiscoverResult discover(const Context& ctx) const override;
};

} // namespace devkit::discovery

#endif // DEVKIT_DISCOVERY_PROVIDER_HPP
