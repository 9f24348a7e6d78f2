//! # devkit Entry Point
//!
//! Delegates to the CLI driver, which parses arguments, loads the workspace
//! and dispatches to a subcommand.
//!
//! ```bash
//! devkit list                       # Discovered and declared commands
//! devkit validate                   # Check references and cycles
//! devkit run build --parallel       # Run "build" across packages
//! devkit run deploy --variant=prod  # Run a variant
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return devkit::cli::devkit_main(argc, argv);
}
