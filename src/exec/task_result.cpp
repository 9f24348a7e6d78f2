#include "exec/task_result.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace devkit::exec {

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
    case Outcome::Succeeded:
        return "ok";
    case Outcome::Failed:
        return "failed";
    case Outcome::Skipped:
        return "skipped";
    }
    return "unknown";
}

RunSummary summarize(const std::vector<TaskResult>& results) {
    RunSummary summary;
    for (const auto& result : results) {
        switch (result.outcome) {
        case Outcome::Succeeded:
            ++summary.succeeded;
            break;
        case Outcome::Failed:
            ++summary.failed;
            break;
        case Outcome::Skipped:
            ++summary.skipped;
            break;
        }
    }
    return summary;
}

std::string format_results(const std::vector<TaskResult>& results) {
    std::ostringstream oss;
    size_t width = 0;
    for (const auto& result : results) {
        width = std::max(width, result.node().size());
    }

    for (const auto& result : results) {
        oss << "  " << std::left << std::setw(8) << outcome_name(result.outcome) << ' '
            << std::setw(static_cast<int>(width)) << result.node();
        switch (result.outcome) {
        case Outcome::Succeeded:
            oss << "  " << std::fixed << std::setprecision(2)
                << static_cast<double>(result.duration_us) / 1e6 << "s";
            break;
        case Outcome::Failed:
            if (!result.error.empty()) {
                oss << "  " << result.error;
            } else {
                oss << "  exit code " << result.exit_code;
            }
            break;
        case Outcome::Skipped:
            oss << "  due to " << result.due_to;
            break;
        }
        oss << '\n';
    }

    auto summary = summarize(results);
    oss << summary.succeeded << " succeeded, " << summary.failed << " failed, " << summary.skipped
        << " skipped\n";
    return oss.str();
}

} // namespace devkit::exec
