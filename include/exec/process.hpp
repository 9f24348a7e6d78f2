//! # Process Execution
//!
//! The executor's only contact with the operating system. `ProcessRunner` is
//! abstract so tests can substitute a recording fake.
//!
//! ## POSIX Implementation
//!
//! `PosixProcessRunner` uses fork + execvpe. The child changes into the
//! working directory and receives the parent environment plus `extra_env`.
//! With `capture` set, stdout and stderr are read through pipes while the
//! child runs; otherwise the child inherits the parent's streams.
//!
//! There is no timeout. A child killed by a signal is reported as failed with
//! exit code 128 + signal number.

#ifndef DEVKIT_EXEC_PROCESS_HPP
#define DEVKIT_EXEC_PROCESS_HPP

#include "common.hpp"
#include "exec/template.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace devkit::exec {

struct ProcessRequest {
    std::string program;
    std::vector<std::string> args;
    fs::path working_dir;
    VarTable extra_env;
    bool capture = false;
};

struct ProcessResult {
    bool launched = false; ///< False if the process could not be started
    int exit_code = -1;
    int signal = 0; ///< Terminating signal, 0 if the child exited normally
    std::string stdout_output;
    std::string stderr_output;
    int64_t duration_us = 0;
    std::string error; ///< Why launching failed

    bool success() const {
        return launched && exit_code == 0 && signal == 0;
    }
};

/// Runs one process to completion. Implementations must be safe to call from
/// several threads at once.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const ProcessRequest& request) = 0;
};

class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const ProcessRequest& request) override;
};

} // namespace devkit::exec

#endif // DEVKIT_EXEC_PROCESS_HPP
