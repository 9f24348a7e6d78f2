#include "exec/executor.hpp"

#include "log/log.hpp"
#include "registry/registry.hpp"

#include <algorithm>
#include <set>
#include <thread>

namespace devkit::exec {

namespace {

std::pair<std::string, std::string> split_node(const std::string& node) {
    auto colon = node.find(':');
    if (colon == std::string::npos) {
        return {node, ""};
    }
    return {node.substr(0, colon), node.substr(colon + 1)};
}

} // namespace

TaskExecutor::TaskExecutor(const registry::CommandRegistry& registry, ProcessRunner& runner,
                           VarTable config_vars, VarTable env)
    : registry_(registry), runner_(runner), config_vars_(std::move(config_vars)),
      env_(std::move(env)), graph_(graph::DependencyGraph::build(registry)),
      blocked_(graph_.blocked_nodes()) {}

std::vector<std::string> TaskExecutor::plan(const std::string& command,
                                            const RunOptions& options) const {
    for (const auto& name : options.packages) {
        if (!registry_.package(name)) {
            DEVKIT_LOG_WARN("exec", "Unknown package '" << name << "' in package filter");
        }
    }

    std::vector<std::string> order;
    std::set<std::string> seen;
    for (const auto* pkg : registry_.packages_with(command)) {
        if (!options.packages.empty() &&
            std::find(options.packages.begin(), options.packages.end(), pkg->name) ==
                options.packages.end()) {
            continue;
        }
        for (const auto& node : graph_.dependency_order(graph::node_id(pkg->name, command))) {
            if (seen.insert(node).second) {
                order.push_back(node);
            }
        }
    }
    return order;
}

std::vector<TaskResult> TaskExecutor::run(const std::string& command, const RunOptions& options) {
    auto nodes = plan(command, options);
    if (nodes.empty()) {
        DEVKIT_LOG_INFO("exec", "No package defines '" << command << "'");
        return {};
    }

    VarTable variables = config_vars_;
    for (const auto& [key, value] : options.variables) {
        variables[key] = value;
    }

    DEVKIT_LOG_DEBUG("exec", "Running '" << command << "': " << nodes.size() << " tasks, "
                                         << (options.parallel ? "parallel" : "sequential"));
    return options.parallel ? run_parallel(nodes, options, variables)
                            : run_sequential(nodes, options, variables);
}

// ============================================================================
// Task Preparation
// ============================================================================

TaskExecutor::Prepared TaskExecutor::prepare(const std::string& node, const RunOptions& options,
                                             const VarTable& variables) const {
    auto [package, command] = split_node(node);
    Prepared prepared;
    prepared.package = package;
    prepared.command = command;

    const auto* pkg = registry_.package(package);
    const auto* entry = pkg ? pkg->find(command) : nullptr;
    if (!entry) {
        prepared.error = "no command entry for " + node;
        return prepared;
    }

    const std::string& tmpl = options.variant ? entry->variant(*options.variant)
                                              : entry->default_command();
    auto resolved = resolve(tmpl, variables, env_);
    if (is_err(resolved)) {
        prepared.error = unwrap_err(resolved).to_string();
        return prepared;
    }

    prepared.command_line = unwrap(resolved);
    ProcessRequest request;
    request.program = "/bin/sh";
    request.args = {"-c", prepared.command_line};
    request.working_dir = pkg->path;
    request.extra_env = {{"DEVKIT_PACKAGE", package}, {"DEVKIT_COMMAND", command}};
    request.capture = options.capture;
    prepared.request = std::move(request);
    return prepared;
}

TaskResult TaskExecutor::finish(const Prepared& prepared, const ProcessResult& process) const {
    TaskResult result;
    result.package = prepared.package;
    result.command = prepared.command;
    result.command_line = prepared.command_line;
    result.stdout_output = process.stdout_output;
    result.stderr_output = process.stderr_output;
    result.duration_us = process.duration_us;
    result.exit_code = process.exit_code;

    if (!process.launched) {
        result.outcome = Outcome::Failed;
        result.exit_code = -1;
        result.error = "failed to launch: " + process.error;
    } else if (process.success()) {
        result.outcome = Outcome::Succeeded;
    } else {
        result.outcome = Outcome::Failed;
        if (process.signal != 0) {
            result.error = "terminated by signal " + std::to_string(process.signal);
        }
    }

    if (result.succeeded()) {
        DEVKIT_LOG_INFO("exec", result.node() << " succeeded");
    } else {
        DEVKIT_LOG_ERROR("exec", result.node() << " failed with exit code " << result.exit_code);
    }
    return result;
}

static TaskResult unprepared(const std::string& package, const std::string& command,
                             const std::string& error) {
    TaskResult result;
    result.package = package;
    result.command = command;
    result.outcome = Outcome::Failed;
    result.exit_code = -1;
    result.error = error;
    DEVKIT_LOG_ERROR("exec", result.node() << ": " << error);
    return result;
}

TaskResult TaskExecutor::skipped(const std::string& node, const std::string& due_to) {
    auto [package, command] = split_node(node);
    TaskResult result;
    result.package = package;
    result.command = command;
    result.outcome = Outcome::Skipped;
    result.exit_code = -1;
    result.due_to = due_to;
    DEVKIT_LOG_WARN("exec", "Skipping " << node << " due to " << due_to);
    return result;
}

std::optional<std::string>
TaskExecutor::skip_reason(const std::string& node, const std::map<std::string, TaskResult>& done,
                          const RunOptions& options) const {
    auto blocked = blocked_.find(node);
    if (blocked != blocked_.end()) {
        return blocked->second;
    }
    if (options.continue_on_failure) {
        return std::nullopt;
    }
    for (const auto& dep : graph_.dependencies(node)) {
        auto it = done.find(dep);
        if (it == done.end() || it->second.succeeded()) {
            continue;
        }
        return it->second.outcome == Outcome::Skipped ? it->second.due_to : dep;
    }
    return std::nullopt;
}

// ============================================================================
// Sequential Execution
// ============================================================================

std::vector<TaskResult> TaskExecutor::run_sequential(const std::vector<std::string>& plan,
                                                     const RunOptions& options,
                                                     const VarTable& variables) {
    std::vector<TaskResult> results;
    std::map<std::string, TaskResult> done;

    // The plan is in post-order, so every dependency is settled before its dependents.
    for (const auto& node : plan) {
        TaskResult result;
        if (auto reason = skip_reason(node, done, options)) {
            result = skipped(node, *reason);
        } else {
            auto prepared = prepare(node, options, variables);
            if (!prepared.request) {
                result = unprepared(prepared.package, prepared.command, prepared.error);
            } else {
                DEVKIT_LOG_INFO("exec", "Running " << node << ": " << prepared.command_line);
                result = finish(prepared, runner_.run(*prepared.request));
            }
        }
        done.emplace(node, result);
        results.push_back(std::move(result));
    }
    return results;
}

// ============================================================================
// Parallel Execution
// ============================================================================

std::vector<TaskResult> TaskExecutor::run_parallel(const std::vector<std::string>& plan,
                                                   const RunOptions& options,
                                                   const VarTable& variables) {
    std::map<std::string, TaskResult> done;
    std::vector<std::string> pending = plan;
    int wave_number = 0;

    auto record = [&](const std::string& node, TaskResult result) {
        done.emplace(node, std::move(result));
    };

    while (!pending.empty()) {
        std::vector<std::string> wave;
        std::vector<std::string> waiting;
        size_t skipped_count = 0;

        for (const auto& node : pending) {
            if (blocked_.count(node) != 0) {
                record(node, skipped(node, blocked_.at(node)));
                ++skipped_count;
                continue;
            }
            bool ready = true;
            for (const auto& dep : graph_.dependencies(node)) {
                if (graph_.contains(dep) && done.count(dep) == 0) {
                    ready = false;
                    break;
                }
            }
            if (!ready) {
                waiting.push_back(node);
            } else if (auto reason = skip_reason(node, done, options)) {
                record(node, skipped(node, *reason));
                ++skipped_count;
            } else {
                wave.push_back(node);
            }
        }

        if (wave.empty()) {
            if (skipped_count == 0) {
                for (const auto& node : waiting) {
                    record(node, skipped(node, "unsatisfiable dependencies"));
                }
                break;
            }
            pending = std::move(waiting);
            continue;
        }

        ++wave_number;
        DEVKIT_LOG_DEBUG("exec", "Wave " << wave_number << ": " << wave.size() << " tasks");

        std::vector<Prepared> prepared;
        prepared.reserve(wave.size());
        for (const auto& node : wave) {
            prepared.push_back(prepare(node, options, variables));
        }

        // Each thread writes only its own slot; results are appended after join.
        std::vector<ProcessResult> outputs(wave.size());
        std::vector<std::thread> threads;
        for (size_t i = 0; i < wave.size(); ++i) {
            if (!prepared[i].request) {
                continue;
            }
            DEVKIT_LOG_INFO("exec", "Running " << wave[i] << ": " << prepared[i].command_line);
            threads.emplace_back(
                [this, &outputs, &prepared, i] { outputs[i] = runner_.run(*prepared[i].request); });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        for (size_t i = 0; i < wave.size(); ++i) {
            if (!prepared[i].request) {
                record(wave[i],
                       unprepared(prepared[i].package, prepared[i].command, prepared[i].error));
            } else {
                record(wave[i], finish(prepared[i], outputs[i]));
            }
        }

        pending = std::move(waiting);
    }

    // Blocked nodes are settled before their dependencies run; report in plan order.
    std::vector<TaskResult> results;
    results.reserve(done.size());
    for (const auto& node : plan) {
        auto it = done.find(node);
        if (it != done.end()) {
            results.push_back(std::move(it->second));
        }
    }
    return results;
}

} // namespace devkit::exec
