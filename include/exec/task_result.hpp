//! # Task Results
//!
//! Outcome records produced by the executor, plus aggregation helpers.
//!
//! | Outcome     | Meaning                                            |
//! |-------------|----------------------------------------------------|
//! | `Succeeded` | The process exited with status 0                   |
//! | `Failed`    | Non-zero exit, signal, launch or template failure  |
//! | `Skipped`   | Never ran; `due_to` names the blocking node        |

#ifndef DEVKIT_EXEC_TASK_RESULT_HPP
#define DEVKIT_EXEC_TASK_RESULT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace devkit::exec {

enum class Outcome { Succeeded, Failed, Skipped };

const char* outcome_name(Outcome outcome);

struct TaskResult {
    std::string package;
    std::string command;
    Outcome outcome = Outcome::Succeeded;
    int exit_code = 0;         ///< Meaningful for Failed; -1 if nothing ran
    std::string due_to;        ///< Set for Skipped
    std::string error;         ///< Template or launch failure detail
    std::string command_line;  ///< Resolved command, empty if resolution failed
    std::string stdout_output; ///< Only with capture enabled
    std::string stderr_output;
    int64_t duration_us = 0;

    /// "package:command"
    std::string node() const {
        return package + ":" + command;
    }

    bool succeeded() const {
        return outcome == Outcome::Succeeded;
    }
};

struct RunSummary {
    size_t succeeded = 0;
    size_t failed = 0;
    size_t skipped = 0;

    size_t total() const {
        return succeeded + failed + skipped;
    }

    /// True when every task succeeded (vacuously true for an empty run).
    bool all_succeeded() const {
        return failed == 0 && skipped == 0;
    }
};

RunSummary summarize(const std::vector<TaskResult>& results);

/// One line per task followed by a totals line.
std::string format_results(const std::vector<TaskResult>& results);

} // namespace devkit::exec

#endif // DEVKIT_EXEC_TASK_RESULT_HPP
