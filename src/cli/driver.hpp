//! # CLI Driver
//!
//! Declares the entry point called by `main()`.

#ifndef DEVKIT_CLI_DRIVER_HPP
#define DEVKIT_CLI_DRIVER_HPP

namespace devkit::cli {

/// Runs the devkit CLI and returns the process exit code.
int devkit_main(int argc, char* argv[]);

} // namespace devkit::cli

#endif // DEVKIT_CLI_DRIVER_HPP
