//! # Task Executor
//!
//! Runs one named command across the packages that define it, after
//! everything that command depends on.
//!
//! ## Run Steps
//!
//! 1. Candidates: packages defining the command, narrowed by `packages`.
//! 2. Plan: each candidate's dependency closure in DFS post-order; a node
//!    shared by several candidates appears once.
//! 3. Each node's command string is its `variant` (or default), with `{var}`
//!    placeholders filled from `variables`, then `[vars]`, then the
//!    environment.
//! 4. Execution through `/bin/sh -c` in the package directory, with
//!    `DEVKIT_PACKAGE` and `DEVKIT_COMMAND` set.
//!
//! ## Modes
//!
//! | Mode       | Behavior                                                  |
//! |------------|-----------------------------------------------------------|
//! | Sequential | Plan order, one process at a time                         |
//! | Parallel   | Waves of nodes whose dependencies finished; each wave is  |
//! |            | launched together and joined before the next is computed  |
//!
//! A node whose dependency failed or was skipped is skipped with `due_to` set
//! to the node that originally failed, unless `continue_on_failure` is set.
//! Nodes blocked by a validation error (missing reference, cycle) are always
//! skipped. Results are recorded by the coordinating thread only and are
//! returned in plan order in both modes.

#ifndef DEVKIT_EXEC_EXECUTOR_HPP
#define DEVKIT_EXEC_EXECUTOR_HPP

#include "exec/process.hpp"
#include "exec/task_result.hpp"
#include "exec/template.hpp"
#include "graph/dependency_graph.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace devkit::registry {
class CommandRegistry;
}

namespace devkit::exec {

struct RunOptions {
    bool parallel = false;
    std::optional<std::string> variant;
    std::vector<std::string> packages; ///< Empty means every package
    bool capture = false;
    bool continue_on_failure = false;
    VarTable variables; ///< Overrides config vars
};

class TaskExecutor {
public:
    /// `config_vars` is the workspace `[vars]` table; `env` the environment
    /// consulted after both variable tables.
    TaskExecutor(const registry::CommandRegistry& registry, ProcessRunner& runner,
                 VarTable config_vars = {}, VarTable env = environment_variables());

    std::vector<TaskResult> run(const std::string& command, const RunOptions& options);

    /// The ordered node list `run` would visit, without running anything.
    std::vector<std::string> plan(const std::string& command, const RunOptions& options) const;

private:
    /// A node ready to launch, or the failure that prevents it.
    struct Prepared {
        std::string package;
        std::string command;
        std::optional<ProcessRequest> request;
        std::string command_line;
        std::string error;
    };

    const registry::CommandRegistry& registry_;
    ProcessRunner& runner_;
    VarTable config_vars_;
    VarTable env_;
    graph::DependencyGraph graph_;
    std::map<std::string, std::string> blocked_;

    Prepared prepare(const std::string& node, const RunOptions& options,
                     const VarTable& variables) const;

    TaskResult finish(const Prepared& prepared, const ProcessResult& process) const;

    static TaskResult skipped(const std::string& node, const std::string& due_to);

    /// Root cause blocking `node` given results so far, or nullopt if it may run.
    std::optional<std::string> skip_reason(const std::string& node,
                                           const std::map<std::string, TaskResult>& done,
                                           const RunOptions& options) const;

    std::vector<TaskResult> run_sequential(const std::vector<std::string>& plan,
                                           const RunOptions& options,
                                           const VarTable& variables);

    std::vector<TaskResult> run_parallel(const std::vector<std::string>& plan,
                                         const RunOptions& options, const VarTable& variables);
};

} // namespace devkit::exec

#endif // DEVKIT_EXEC_EXECUTOR_HPP
