#include "cli/commands.hpp"

#include "discovery/engine.hpp"
#include "exec/template.hpp"
#include "graph/validate.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace devkit::cli {

Result<Session, std::string> open_session(bool quiet) {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        return "cannot determine current directory: " + ec.message();
    }

    auto root = config::find_repo_root(cwd);
    if (is_err(root)) {
        return unwrap_err(root);
    }

    auto workspace = config::load_workspace(unwrap(root));
    if (is_err(workspace)) {
        return unwrap_err(workspace).to_string();
    }

    Session session{Context::create(std::move(unwrap(workspace)), quiet), {}};
    session.registry = registry::CommandRegistry::from_packages(session.ctx.config.packages);
    DEVKIT_LOG_DEBUG("cli", "Repository " << session.ctx.repo.string() << ", "
                                          << session.ctx.config.packages.size() << " packages");
    return session;
}

// ============================================================================
// list
// ============================================================================

int cmd_list(Session& session) {
    auto engine = discovery::DiscoveryEngine::with_default_providers();
    const auto& commands = engine.discover(session.ctx);

    size_t width = 0;
    for (const auto& cmd : commands) {
        width = std::max(width, cmd.id().size());
    }

    for (auto category : catalog::category_display_order()) {
        auto group = discovery::commands_in_category(commands, category);
        if (group.empty()) {
            continue;
        }
        std::cout << catalog::category_label(category) << ":\n";
        for (const auto* cmd : group) {
            std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << cmd->id()
                      << "  " << cmd->description() << "\n";
        }
        std::cout << "\n";
    }

    auto names = session.registry.command_names();
    if (!names.empty()) {
        std::cout << "Package commands:\n";
        for (const auto& name : names) {
            std::cout << "  " << name << " (";
            bool first = true;
            for (const auto* pkg : session.registry.packages_with(name)) {
                std::cout << (first ? "" : ", ") << pkg->name;
                first = false;
            }
            std::cout << ")\n";
        }
    }

    if (commands.empty() && names.empty() && !session.ctx.quiet) {
        std::cout << "No commands found in " << session.ctx.repo.string() << "\n";
    }
    return 0;
}

// ============================================================================
// validate
// ============================================================================

int cmd_validate(const Session& session) {
    auto report = graph::validate(session.ctx.config, session.registry);

    for (const auto& error : report.errors) {
        std::cerr << "error: " << error << "\n";
    }
    for (const auto& warning : report.warnings) {
        std::cerr << "warning: " << warning << "\n";
    }

    if (!report.is_valid()) {
        std::cerr << report.errors.size() << " error(s) found\n";
        return 1;
    }
    if (!session.ctx.quiet) {
        std::cout << "Configuration is valid.\n";
    }
    return 0;
}

// ============================================================================
// run
// ============================================================================

int cmd_run(const Session& session, const std::string& command,
            const exec::RunOptions& options) {
    auto report = graph::validate(session.registry);
    for (const auto& error : report.errors) {
        std::cerr << "error: " << error << "\n";
    }

    exec::PosixProcessRunner runner;
    exec::TaskExecutor executor(session.registry, runner, session.ctx.config.global.vars);
    auto results = executor.run(command, options);

    if (results.empty()) {
        std::cerr << "No package defines a '" << command << "' command.\n";
        return 1;
    }

    if (options.capture) {
        for (const auto& result : results) {
            if (result.stdout_output.empty() && result.stderr_output.empty()) {
                continue;
            }
            std::string output = result.stdout_output + result.stderr_output;
            std::cout << "==> " << result.node() << " <==\n" << output;
            if (output.back() != '\n') {
                std::cout << "\n";
            }
        }
    }

    auto summary = exec::summarize(results);
    if (!session.ctx.quiet || !summary.all_succeeded()) {
        std::cout << exec::format_results(results);
    }
    return summary.all_succeeded() ? 0 : 1;
}

// ============================================================================
// vars
// ============================================================================

int cmd_vars(const Session& session, const std::string& command) {
    auto packages = session.registry.packages_with(command);
    if (packages.empty()) {
        std::cerr << "No package defines a '" << command << "' command.\n";
        return 1;
    }

    auto env = exec::environment_variables();
    const auto& config_vars = session.ctx.config.global.vars;

    auto describe = [&](const std::string& label, const std::string& tmpl) {
        auto names = exec::extract_variable_names(tmpl);
        std::cout << "  " << label << ": ";
        if (names.empty()) {
            std::cout << "(none)\n";
            return;
        }
        bool first = true;
        for (const auto& name : names) {
            const char* origin = config_vars.count(name) ? "config"
                                 : env.count(name)       ? "env"
                                                         : "missing";
            std::cout << (first ? "" : ", ") << name << " [" << origin << "]";
            first = false;
        }
        std::cout << "\n";
    };

    for (const auto* pkg : packages) {
        const auto* entry = pkg->find(command);
        std::cout << pkg->name << ":" << command << "\n";
        describe("default", entry->default_command());
        for (const auto& variant : entry->variant_names()) {
            describe(variant, entry->variant(variant));
        }
    }
    return 0;
}

// ============================================================================
// Usage
// ============================================================================

void print_usage() {
    std::cout << "devkit " << VERSION << "\n\n";
    std::cout << "Usage: devkit <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  list              List discovered and declared commands\n";
    std::cout << "  validate          Check workspace configuration and dependencies\n";
    std::cout << "  run <command>     Run a declared command across packages\n";
    std::cout << "  vars <command>    Show template variables used by a command\n\n";
    std::cout << "Run options:\n";
    std::cout << "  --parallel            Run independent tasks concurrently\n";
    std::cout << "  --variant=<name>      Use a command variant (e.g. release)\n";
    std::cout << "  --package=<name>      Only run in this package (repeatable)\n";
    std::cout << "  --var=<key>=<value>   Set a template variable (repeatable)\n";
    std::cout << "  --capture             Capture task output and print it afterwards\n";
    std::cout << "  --keep-going          Run dependents even if a dependency fails\n\n";
    std::cout << "Global options:\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -V, --version         Show version\n";
    std::cout << "  -q                    Quiet: only errors\n";
    std::cout << "  -v, -vv, -vvv         More log output (info, debug, trace)\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels, e.g. exec=debug,*=warn\n";
    std::cout << "  --log-file=<path>     Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>    text or json\n\n";
    std::cout << "Environment:\n";
    std::cout << "  DEVKIT_REPO_ROOT      Repository root (default: nearest .git or .dev)\n";
    std::cout << "  DEVKIT_LOG            Log level or filter when no option is given\n";
}

void print_version() {
    std::cout << "devkit " << VERSION << "\n";
}

} // namespace devkit::cli
