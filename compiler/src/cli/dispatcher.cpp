//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the Kindred compiler CLI.
//! It configures logging, then routes to the command handler.
//!
//! ## Architecture
//!
//! ```text
//! kindred_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ make           → run_make()
//!   └─ clean          → run_clean()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags (`-v`, `-q`, `--log-level=...`) are accepted anywhere on
//! the command line and consumed before dispatch.

#include "commands/cmd_make.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

/// Main entry point for the Kindred compiler CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                        |
/// |------|------------------------------------------------|
/// | 0    | Success                                        |
/// | 1    | Diagnostics, toolchain failure or bad usage    |
///
/// ## Examples
///
/// ```bash
/// kindred make                       # Compile main.kin into build/
/// kindred make --mode Debug          # Unoptimized build
/// kindred make --source app.kin -v   # Other source, info logging
/// kindred clean                      # Remove build/
/// ```
int kindred_main(int argc, char* argv[]) {
    using namespace kindred;

    auto log_config = log::parse_log_options(argc, argv);
    log_config.colors = cli::stderr_is_terminal();
    log::Logger::init(log_config);

    // The command is the first argument that is not a logging flag
    std::string command;
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty() && !log::is_log_option(arg)) {
            command = arg;
        } else {
            rest.push_back(arg);
        }
    }

    if (command.empty() || command == "--help" || command == "-h" || command == "help") {
        cli::print_usage();
        return cli::EXIT_SUCCESS_CODE;
    }

    if (command == "--version" || command == "-V") {
        cli::print_version();
        return cli::EXIT_SUCCESS_CODE;
    }

    int status = cli::EXIT_FAILURE_CODE;
    if (command == "make") {
        status = cli::run_make(rest);
    } else if (command == "clean") {
        status = cli::run_clean(rest);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run 'kindred --help' for usage.\n";
    }

    log::Logger::instance().flush();
    return status;
}
