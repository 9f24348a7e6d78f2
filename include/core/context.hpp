//! # Execution Context
//!
//! State shared by discovery and execution for one devkit session: the
//! repository root, the loaded workspace configuration, and the directories
//! searched for executables.

#ifndef DEVKIT_CORE_CONTEXT_HPP
#define DEVKIT_CORE_CONTEXT_HPP

#include "common.hpp"
#include "config/config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace devkit {

struct Context {
    fs::path repo;
    bool quiet = false;
    config::WorkspaceConfig config;
    std::vector<fs::path> search_path;

    /// Context for `config`, searching the directories of the `PATH`
    /// environment variable.
    static Context create(config::WorkspaceConfig config, bool quiet = false);

    /// First executable regular file called `name` in the search path.
    std::optional<fs::path> find_executable(const std::string& name) const;

    bool has_executable(const std::string& name) const {
        return find_executable(name).has_value();
    }

    /// True if `relative` exists under the repository root.
    bool repo_has(const fs::path& relative) const;
};

/// Splits a `PATH`-style list on ':', dropping empty entries.
std::vector<fs::path> split_search_path(const std::string& path_var);

} // namespace devkit

#endif // DEVKIT_CORE_CONTEXT_HPP
