//! # Kindred Compiler Entry Point
//!
//! This file is the main entry point for the Kindred compiler. It simply
//! delegates to the CLI driver which handles all command parsing and
//! execution.
//!
//! ## Usage
//!
//! ```bash
//! kindred make                 # Compile main.kin into build/
//! kindred make --mode Debug    # Unoptimized build
//! kindred clean                # Remove build/
//! ```
//!
//! ## See Also
//!
//! - `cli/dispatcher.cpp` - Command dispatching logic
//! - `driver/driver.hpp` - The `compile`/`clean` core

#include "cli/driver.hpp"

/// Main entry point for the Kindred compiler.
///
/// @return Exit code: 0 for success, non-zero for errors
int main(int argc, char* argv[]) {
    return kindred_main(argc, argv);
}
