//! # Workspace Configuration
//!
//! Loads the global `.dev/config.toml` and every package's `dev.toml`.
//!
//! ## Files
//!
//! | File                     | Contents                                    |
//! |--------------------------|---------------------------------------------|
//! | `.dev/config.toml`       | Project name, workspace globs, ports, vars  |
//! | `<package>/dev.toml`     | The package's `[cmd]` table                 |
//!
//! ## Global Config
//!
//! ```toml
//! [project]
//! name = "acme"
//!
//! [workspaces]
//! packages = ["packages/*", "apps/*"]
//! exclude = ["legacy"]
//!
//! [services]
//! postgres = 5432
//!
//! [vars]
//! env = "staging"
//! ```
//!
//! Both files are optional. A missing global config yields the defaults
//! (workspace pattern `packages/*`); a package without `dev.toml` has an
//! empty command table.

#ifndef DEVKIT_CONFIG_CONFIG_HPP
#define DEVKIT_CONFIG_CONFIG_HPP

#include "common.hpp"
#include "config/toml.hpp"
#include "registry/command_entry.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace devkit::config {

/// Error loading or interpreting a configuration file.
struct ConfigError {
    fs::path path;
    std::string message;
    int line = 0; ///< 1-based; 0 when unknown

    /// "path:line: message"
    std::string to_string() const;
};

/// Contents of `.dev/config.toml`.
struct GlobalConfig {
    std::string project_name;
    std::vector<std::string> package_patterns = {"packages/*"};
    std::vector<std::string> exclude;
    std::map<std::string, int64_t> service_ports;
    std::map<std::string, std::string> vars;
};

/// A package directory matched by a workspace pattern.
struct PackageConfig {
    fs::path path;
    std::string dir_name;
    std::string name; ///< Inferred: Cargo.toml, then package.json, then dir_name
    std::map<std::string, registry::CommandEntry> commands;
};

/// Global config plus every package, sorted by package name.
struct WorkspaceConfig {
    fs::path repo_root;
    GlobalConfig global;
    std::vector<PackageConfig> packages;

    const PackageConfig* find_package(const std::string& name) const;
};

// ============================================================================
// Loading
// ============================================================================

/// Loads the whole workspace rooted at `repo_root`.
///
/// Packages are the directories matched by `[workspaces] packages`, minus
/// those whose directory name matches an `exclude` pattern. A syntactically
/// invalid workspace pattern is skipped here and reported by validation.
/// When two directories infer the same package name, the first (in pattern
/// order, then path order) wins.
Result<WorkspaceConfig, ConfigError> load_workspace(const fs::path& repo_root);

/// Interprets a parsed global config document.
Result<GlobalConfig, ConfigError> parse_global_config(const TomlDocument& doc,
                                                      const fs::path& path);

/// Interprets the `[cmd]` table of a parsed `dev.toml`.
///
/// `[cmd] name = "..."` yields a Simple entry. `[cmd.name]` (or an inline
/// table) yields a Full entry: `default` is required, `deps` must be a string
/// array, and every other string key is a variant.
Result<std::map<std::string, registry::CommandEntry>, ConfigError>
parse_package_commands(const TomlDocument& doc, const fs::path& path);

/// Package name from `Cargo.toml`, then `package.json` (without an `@scope/`
/// prefix), then the directory name.
std::string infer_package_name(const fs::path& package_dir);

/// Checks a workspace glob pattern. Returns a description of the problem, or
/// nullopt when the pattern is usable.
std::optional<std::string> check_glob_pattern(const std::string& pattern);

/// Repository root: `DEVKIT_REPO_ROOT` if set and existing, otherwise the
/// first of `start` and its ancestors that holds `.git` or `.dev`.
Result<fs::path, std::string> find_repo_root(const fs::path& start);

/// Reads a whole file.
Result<std::string, ConfigError> read_file(const fs::path& path);

} // namespace devkit::config

#endif // DEVKIT_CONFIG_CONFIG_HPP
