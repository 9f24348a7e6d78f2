//! # CLI Commands
//!
//! | Function        | Command                 |
//! |-----------------|-------------------------|
//! | `cmd_list`      | `devkit list`           |
//! | `cmd_validate`  | `devkit validate`       |
//! | `cmd_run`       | `devkit run <command>`  |
//! | `cmd_vars`      | `devkit vars <command>` |
//!
//! Each returns the process exit code.

#ifndef DEVKIT_CLI_COMMANDS_HPP
#define DEVKIT_CLI_COMMANDS_HPP

#include "core/context.hpp"
#include "exec/executor.hpp"
#include "registry/registry.hpp"

#include <string>

namespace devkit::cli {

/// Loaded state shared by the commands of one invocation.
struct Session {
    Context ctx;
    registry::CommandRegistry registry;
};

/// Finds the repository root from the current directory and loads it.
Result<Session, std::string> open_session(bool quiet);

int cmd_list(Session& session);

int cmd_validate(const Session& session);

int cmd_run(const Session& session, const std::string& command, const exec::RunOptions& options);

int cmd_vars(const Session& session, const std::string& command);

void print_usage();

void print_version();

} // namespace devkit::cli

#endif // DEVKIT_CLI_COMMANDS_HPP
