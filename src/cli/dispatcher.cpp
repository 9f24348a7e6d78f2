//! # CLI Command Dispatcher
//!
//! Entry point for the `devkit` binary: sets up logging, parses arguments and
//! routes to a command handler.
//!
//! ```text
//! devkit_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ list           → cmd_list()
//!   ├─ validate       → cmd_validate()
//!   ├─ run <cmd>      → cmd_run()
//!   └─ vars <cmd>     → cmd_vars()
//! ```
//!
//! Logging options (`--log-*`, `-v`, `-q`) may appear anywhere and are
//! removed before command arguments are parsed.

#include "cli/commands.hpp"
#include "cli/driver.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace devkit::cli {

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

/// Parses `run` options. Returns false (after printing why) on a bad option.
static bool parse_run_options(const std::vector<std::string>& args, exec::RunOptions& options) {
    for (const auto& arg : args) {
        if (arg == "--parallel" || arg == "-p") {
            options.parallel = true;
        } else if (arg == "--capture") {
            options.capture = true;
        } else if (arg == "--keep-going" || arg == "-k") {
            options.continue_on_failure = true;
        } else if (starts_with(arg, "--variant=")) {
            options.variant = arg.substr(10);
        } else if (starts_with(arg, "--package=")) {
            options.packages.push_back(arg.substr(10));
        } else if (starts_with(arg, "--var=")) {
            auto pair = arg.substr(6);
            auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "error: expected --var=<key>=<value>, got '" << arg << "'\n";
                return false;
            }
            options.variables[pair.substr(0, eq)] = pair.substr(eq + 1);
        } else {
            std::cerr << "error: unknown option '" << arg << "' for run\n";
            return false;
        }
    }
    return true;
}

int devkit_main(int argc, char* argv[]) {
    auto log_config = log::parse_log_options(argc, argv);
    log::Logger::init(log_config);
    bool quiet = log_config.level >= log::LogLevel::Error;

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!log::is_log_option(arg)) {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty()) {
        print_usage();
        return 0;
    }

    const std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command != "list" && command != "validate" && command != "run" && command != "vars") {
        std::cerr << "error: unknown command '" << command << "'\n";
        std::cerr << "Run 'devkit --help' for usage information.\n";
        return 1;
    }

    if ((command == "run" || command == "vars") && (rest.empty() || starts_with(rest[0], "-"))) {
        std::cerr << "Usage: devkit " << command << " <command>"
                  << (command == "run" ? " [options]" : "") << "\n";
        return 1;
    }

    exec::RunOptions run_options;
    if (command == "run" && !parse_run_options({rest.begin() + 1, rest.end()}, run_options)) {
        return 1;
    }

    auto session = open_session(quiet);
    if (is_err(session)) {
        DEVKIT_LOG_ERROR("cli", unwrap_err(session));
        std::cerr << "error: " << unwrap_err(session) << "\n";
        return 1;
    }
    auto& s = unwrap(session);

    int rc = 0;
    if (command == "list") {
        rc = cmd_list(s);
    } else if (command == "validate") {
        rc = cmd_validate(s);
    } else if (command == "run") {
        rc = cmd_run(s, rest[0], run_options);
    } else {
        rc = cmd_vars(s, rest[0]);
    }

    log::Logger::instance().flush();
    return rc;
}

} // namespace devkit::cli
