//! # Task Executor Tests
//!
//! The executor runs against a recording ProcessRunner, so ordering, skip
//! propagation and wave scheduling are checked without spawning processes.

#include "exec/executor.hpp"
#include "registry/registry.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>

using namespace devkit;
using namespace devkit::exec;
using devkit::registry::CommandEntry;
using devkit::registry::CommandRegistry;
using devkit::registry::PackageNode;

namespace {

/// Records every request and answers with a preset exit code per package.
class RecordingRunner : public ProcessRunner {
public:
    std::map<std::string, int> exit_codes;  ///< By DEVKIT_PACKAGE; default 0
    std::chrono::milliseconds delay{0};

    ProcessResult run(const ProcessRequest& request) override {
        std::string package = request.extra_env.at("DEVKIT_PACKAGE");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            started_.push_back(package);
        }

        int now = ++running_;
        int prev = max_running_.load();
        while (now > prev && !max_running_.compare_exchange_weak(prev, now)) {
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        --running_;

        ProcessResult result;
        result.launched = true;
        auto it = exit_codes.find(package);
        result.exit_code = it == exit_codes.end() ? 0 : it->second;
        if (request.capture) {
            result.stdout_output = "out from " + package + "\n";
        }
        result.duration_us = 1000;
        return result;
    }

    std::vector<ProcessRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<std::string> started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    int max_running() const {
        return max_running_.load();
    }

private:
    mutable std::mutex mutex_;
    std::vector<ProcessRequest> requests_;
    std::vector<std::string> started_;
    std::atomic<int> running_{0};
    std::atomic<int> max_running_{0};
};

std::vector<std::string> nodes(const std::vector<TaskResult>& results) {
    std::vector<std::string> out;
    for (const auto& result : results) {
        out.push_back(result.node());
    }
    return out;
}

} // namespace

class TaskExecutorTest : public ::testing::Test {
protected:
    CommandRegistry registry;
    RecordingRunner runner;
    VarTable config_vars;
    VarTable env;

    void add(const std::string& name, std::map<std::string, CommandEntry> commands) {
        registry.add(PackageNode{"/repo/packages/" + name, name, std::move(commands)});
    }

    std::vector<TaskResult> run(const std::string& command, const RunOptions& options = {}) {
        TaskExecutor executor(registry, runner, config_vars, env);
        return executor.run(command, options);
    }

    /// a depends on b, b depends on c
    void add_chain() {
        add("a", {{"build", CommandEntry::full("build a", {"b"})}});
        add("b", {{"build", CommandEntry::full("build b", {"c"})}});
        add("c", {{"build", CommandEntry::simple("build c")}});
    }
};

// ============================================================================
// Ordering
// ============================================================================

TEST_F(TaskExecutorTest, DependencyRunsFirst) {
    add("web", {{"build", CommandEntry::simple("make build")}});
    add("api", {{"build", CommandEntry::full("cargo build", {"web"})}});

    auto results = run("build");

    EXPECT_EQ(nodes(results), (std::vector<std::string>{"web:build", "api:build"}));
    for (const auto& result : results) {
        EXPECT_EQ(result.outcome, Outcome::Succeeded) << result.node();
    }
    EXPECT_EQ(runner.started(), (std::vector<std::string>{"web", "api"}));
}

TEST_F(TaskExecutorTest, ChainOrder) {
    add_chain();
    TaskExecutor executor(registry, runner, config_vars, env);

    EXPECT_EQ(executor.plan("build", {}),
              (std::vector<std::string>{"c:build", "b:build", "a:build"}));
    EXPECT_EQ(nodes(executor.run("build", {})),
              (std::vector<std::string>{"c:build", "b:build", "a:build"}));
}

TEST_F(TaskExecutorTest, SharedDependencyRunsOnce) {
    add("core", {{"build", CommandEntry::simple("build core")}});
    add("ui", {{"build", CommandEntry::full("build ui", {"core"})}});
    add("web", {{"build", CommandEntry::full("build web", {"core", "ui"})}});

    auto results = run("build");
    EXPECT_EQ(nodes(results), (std::vector<std::string>{"core:build", "ui:build", "web:build"}));
    EXPECT_EQ(runner.requests().size(), 3u);
}

TEST_F(TaskExecutorTest, CrossCommandDependency) {
    add("db", {{"migrate", CommandEntry::simple("sqlx migrate run")}});
    add("api", {{"test", CommandEntry::full("cargo test", {"db:migrate"})}});

    auto results = run("test");
    EXPECT_EQ(nodes(results), (std::vector<std::string>{"db:migrate", "api:test"}));
}

TEST_F(TaskExecutorTest, NoPackageDefinesCommand) {
    add("web", {{"build", CommandEntry::simple("make build")}});

    EXPECT_TRUE(run("deploy").empty());
    EXPECT_TRUE(runner.requests().empty());
}

// ============================================================================
// Failure Propagation
// ============================================================================

TEST_F(TaskExecutorTest, FailedDependencySkipsDependents) {
    add_chain();
    runner.exit_codes["c"] = 2;

    auto results = run("build");
    ASSERT_EQ(results.size(), 3u);

    EXPECT_EQ(results[0].node(), "c:build");
    EXPECT_EQ(results[0].outcome, Outcome::Failed);
    EXPECT_EQ(results[0].exit_code, 2);

    EXPECT_EQ(results[1].outcome, Outcome::Skipped);
    EXPECT_EQ(results[1].due_to, "c:build");
    EXPECT_EQ(results[2].outcome, Outcome::Skipped);
    EXPECT_EQ(results[2].due_to, "c:build");

    EXPECT_EQ(runner.requests().size(), 1u);
}

TEST_F(TaskExecutorTest, IndependentBranchStillRuns) {
    add("broken", {{"build", CommandEntry::simple("false")}});
    add("app", {{"build", CommandEntry::full("build app", {"broken"})}});
    add("other", {{"build", CommandEntry::simple("build other")}});
    runner.exit_codes["broken"] = 1;

    auto results = run("build");
    auto summary = summarize(results);
    EXPECT_EQ(summary.succeeded, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_FALSE(summary.all_succeeded());

    auto started = runner.started();
    EXPECT_NE(std::find(started.begin(), started.end(), "other"), started.end());
}

TEST_F(TaskExecutorTest, ContinueOnFailureRunsDependents) {
    add_chain();
    runner.exit_codes["c"] = 1;

    RunOptions options;
    options.continue_on_failure = true;
    auto results = run("build", options);

    EXPECT_EQ(results[0].outcome, Outcome::Failed);
    EXPECT_EQ(results[1].outcome, Outcome::Succeeded);
    EXPECT_EQ(results[2].outcome, Outcome::Succeeded);
}

TEST_F(TaskExecutorTest, MissingDependencyBlocksNode) {
    add("api", {{"build", CommandEntry::full("cargo build", {"ghost"})}});
    add("web", {{"build", CommandEntry::simple("vite build")}});

    auto results = run("build");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].node(), "api:build");
    EXPECT_EQ(results[0].outcome, Outcome::Skipped);
    EXPECT_EQ(results[0].due_to, "ghost:build");
    EXPECT_EQ(results[1].outcome, Outcome::Succeeded);
}

TEST_F(TaskExecutorTest, CycleMembersSkipped) {
    add("a", {{"build", CommandEntry::full("x", {"b"})}});
    add("b", {{"build", CommandEntry::full("x", {"a"})}});

    auto results = run("build");
    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results) {
        EXPECT_EQ(result.outcome, Outcome::Skipped);
        EXPECT_EQ(result.due_to, "a:build -> b:build -> a:build");
    }
    EXPECT_TRUE(runner.requests().empty());
}

// ============================================================================
// Variants and Templates
// ============================================================================

TEST_F(TaskExecutorTest, VariantSelection) {
    add("api", {{"build", CommandEntry::full("cargo build", {},
                                             {{"release", "cargo build --release"}})}});
    add("web", {{"build", CommandEntry::simple("vite build")}});

    RunOptions options;
    options.variant = "release";
    auto results = run("build", options);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].command_line, "cargo build --release");
    // Packages without the variant fall back to the default
    EXPECT_EQ(results[1].command_line, "vite build");
}

TEST_F(TaskExecutorTest, RequestShape) {
    add("web", {{"build", CommandEntry::simple("vite build")}});

    run("build");
    auto requests = runner.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].program, "/bin/sh");
    EXPECT_EQ(requests[0].args, (std::vector<std::string>{"-c", "vite build"}));
    EXPECT_EQ(requests[0].working_dir, fs::path("/repo/packages/web"));
    EXPECT_EQ(requests[0].extra_env.at("DEVKIT_COMMAND"), "build");
    EXPECT_FALSE(requests[0].capture);
}

TEST_F(TaskExecutorTest, TemplateVariablePrecedence) {
    add("api", {{"deploy", CommandEntry::simple("deploy {app} to {env} as {USER}")}});
    config_vars = {{"app", "api"}, {"env", "staging"}};
    env = {{"env", "prod"}, {"USER", "ci"}};

    RunOptions options;
    options.variables = {{"env", "canary"}};
    auto results = run("deploy", options);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].command_line, "deploy api to canary as ci");
}

TEST_F(TaskExecutorTest, MissingTemplateVariableFailsTask) {
    add("api", {{"deploy", CommandEntry::simple("deploy {app} to {env}")}});
    config_vars = {{"app", "api"}};

    auto results = run("deploy");
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, Outcome::Failed);
    EXPECT_EQ(results[0].exit_code, -1);
    EXPECT_EQ(results[0].error,
              "Missing template variables: env. Set them in your config or environment.");
    EXPECT_TRUE(runner.requests().empty());
}

// ============================================================================
// Options
// ============================================================================

TEST_F(TaskExecutorTest, PackageFilterStillRunsDependencies) {
    add_chain();
    add("z", {{"build", CommandEntry::simple("build z")}});

    RunOptions options;
    options.packages = {"b"};
    auto results = run("build", options);

    EXPECT_EQ(nodes(results), (std::vector<std::string>{"c:build", "b:build"}));
}

TEST_F(TaskExecutorTest, CaptureCollectsOutput) {
    add("web", {{"build", CommandEntry::simple("vite build")}});

    RunOptions options;
    options.capture = true;
    auto results = run("build", options);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].stdout_output, "out from web\n");
    EXPECT_TRUE(runner.requests()[0].capture);
}

// ============================================================================
// Parallel Execution
// ============================================================================

TEST_F(TaskExecutorTest, ParallelRunsIndependentNodesTogether) {
    add("a", {{"build", CommandEntry::simple("build a")}});
    add("b", {{"build", CommandEntry::simple("build b")}});
    add("c", {{"build", CommandEntry::simple("build c")}});
    runner.delay = std::chrono::milliseconds(50);

    RunOptions options;
    options.parallel = true;
    auto results = run("build", options);

    EXPECT_EQ(nodes(results), (std::vector<std::string>{"a:build", "b:build", "c:build"}));
    EXPECT_EQ(summarize(results).succeeded, 3u);
    EXPECT_GE(runner.max_running(), 2);
}

TEST_F(TaskExecutorTest, ParallelRespectsDependencies) {
    add("core", {{"build", CommandEntry::simple("build core")}});
    add("ui", {{"build", CommandEntry::full("build ui", {"core"})}});
    add("web", {{"build", CommandEntry::full("build web", {"core"})}});
    add("app", {{"build", CommandEntry::full("build app", {"ui", "web"})}});

    RunOptions options;
    options.parallel = true;
    auto results = run("build", options);

    auto order = nodes(results);
    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order.front(), "core:build");
    EXPECT_EQ(order.back(), "app:build");

    auto started = runner.started();
    EXPECT_EQ(started.front(), "core");
    EXPECT_EQ(started.back(), "app");
}

TEST_F(TaskExecutorTest, ParallelFailureSkipsDependents) {
    add_chain();
    add("solo", {{"build", CommandEntry::simple("build solo")}});
    runner.exit_codes["c"] = 1;

    RunOptions options;
    options.parallel = true;
    auto results = run("build", options);

    std::map<std::string, TaskResult> by_node;
    for (const auto& result : results) {
        by_node.emplace(result.node(), result);
    }
    ASSERT_EQ(by_node.size(), 4u);
    EXPECT_EQ(by_node.at("c:build").outcome, Outcome::Failed);
    EXPECT_EQ(by_node.at("b:build").outcome, Outcome::Skipped);
    EXPECT_EQ(by_node.at("a:build").due_to, "c:build");
    EXPECT_EQ(by_node.at("solo:build").outcome, Outcome::Succeeded);
}

TEST_F(TaskExecutorTest, ParallelBlockedNodeReportedAfterItsDependencies) {
    // d:y waits on d:x (runnable) and a:y (not defined anywhere)
    add("c", {{"x", CommandEntry::simple("make x")}});
    add("d", {{"x", CommandEntry::full("make x", {"c"})},
              {"y", CommandEntry::full("make y", {"d:x", "a"})}});

    RunOptions options;
    options.parallel = true;
    auto parallel = run("y", options);

    ASSERT_EQ(nodes(parallel), (std::vector<std::string>{"c:x", "d:x", "d:y"}));
    EXPECT_EQ(parallel[0].outcome, Outcome::Succeeded);
    EXPECT_EQ(parallel[1].outcome, Outcome::Succeeded);
    EXPECT_EQ(parallel[2].outcome, Outcome::Skipped);
    EXPECT_EQ(parallel[2].due_to, "a:y");

    EXPECT_EQ(nodes(run("y")), nodes(parallel));
}

TEST_F(TaskExecutorTest, ParallelCycleWithRunnableDependency) {
    add("base", {{"build", CommandEntry::simple("build base")}});
    add("p", {{"build", CommandEntry::full("x", {"q", "base"})}});
    add("q", {{"build", CommandEntry::full("x", {"p"})}});

    RunOptions options;
    options.parallel = true;
    auto results = run("build", options);

    ASSERT_EQ(nodes(results), (std::vector<std::string>{"base:build", "q:build", "p:build"}));
    EXPECT_EQ(results[0].outcome, Outcome::Succeeded);
    EXPECT_EQ(results[1].outcome, Outcome::Skipped);
    EXPECT_EQ(results[2].due_to, "p:build -> q:build -> p:build");
}

// ============================================================================
// Result Formatting
// ============================================================================

TEST(TaskResultTest, SummaryAndFormatting) {
    TaskResult ok;
    ok.package = "web";
    ok.command = "build";
    ok.duration_us = 1500000;

    TaskResult failed;
    failed.package = "api";
    failed.command = "build";
    failed.outcome = Outcome::Failed;
    failed.exit_code = 2;

    TaskResult skipped;
    skipped.package = "app";
    skipped.command = "build";
    skipped.outcome = Outcome::Skipped;
    skipped.due_to = "api:build";

    auto text = format_results({ok, failed, skipped});
    EXPECT_NE(text.find("ok       web:build  1.50s"), std::string::npos) << text;
    EXPECT_NE(text.find("exit code 2"), std::string::npos);
    EXPECT_NE(text.find("due to api:build"), std::string::npos);
    EXPECT_NE(text.find("1 succeeded, 1 failed, 1 skipped"), std::string::npos);

    EXPECT_TRUE(summarize({}).all_succeeded());
    EXPECT_EQ(summarize({ok, failed, skipped}).total(), 3u);
    EXPECT_STREQ(outcome_name(Outcome::Skipped), "skipped");
}
