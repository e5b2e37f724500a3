//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function              | Description                           |
//! |-----------------------|---------------------------------------|
//! | `print_diagnostics()` | Render diagnostics to stderr          |
//! | `stderr_is_terminal()`| Decide whether to color output        |
//! | `print_usage()`       | Print CLI help text                   |
//! | `print_version()`     | Print compiler version                |

#pragma once
#include "diag/diagnostic.hpp"

#include <string>
#include <vector>

namespace kindred::cli {

// Diagnostics
void print_diagnostics(const std::vector<diag::Diagnostic>& diagnostics, bool snippets);
bool stderr_is_terminal();

// Help text
void print_usage();
void print_version();

} // namespace kindred::cli
