//! # Make and Clean Commands
//!
//! | Function             | Description                                   |
//! |----------------------|-----------------------------------------------|
//! | `parse_make_args()`  | Parse `make` flags                            |
//! | `resolve_options()`  | Defaults, then `kindred.toml`, then flags     |
//! | `run_make()`         | Compile and report diagnostics                |
//! | `parse_clean_args()` | Parse `clean` flags                           |
//! | `run_clean()`        | Remove the build directory                    |
//!
//! ## Exit Codes
//!
//! - `EXIT_SUCCESS_CODE (0)`: Success, or nothing to clean
//! - `EXIT_FAILURE_CODE (1)`: Any diagnostic, bad flag or filesystem error

#pragma once
#include "common.hpp"
#include "driver/options.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kindred::cli {

constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_FAILURE_CODE = 1;

// Flags given on the command line; unset ones fall back to the manifest
struct MakeArgs {
    std::optional<std::string> source;
    std::optional<std::string> out;
    std::optional<backend::OptimizationMode> mode;
    std::optional<std::string> linker;
    std::optional<int> timeout;
    bool keep_ir = false;
    bool snippets = false;
};

// Accepts `--flag value` and `--flag=value`; logging flags are skipped
Result<MakeArgs, std::string> parse_make_args(const std::vector<std::string>& args);

// Reads `kindred.toml` from `project_dir` when present; an empty
// `project_dir` is the working directory and keeps paths relative
Result<driver::CompileOptions, std::string>
resolve_options(const MakeArgs& args, const std::filesystem::path& project_dir);

int run_make(const std::vector<std::string>& args);

// The `--out` directory, if one was given
Result<std::optional<std::string>, std::string>
parse_clean_args(const std::vector<std::string>& args);

int run_clean(const std::vector<std::string>& args);

} // namespace kindred::cli
