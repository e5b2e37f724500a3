//! # Executable Emitter
//!
//! Turns generated LLVM IR into a native executable.
//!
//! ## Steps
//!
//! | Step | Output                    | Tool                       |
//! |------|---------------------------|----------------------------|
//! | 1    | `<out>/<name>.ll`         | file write                 |
//! | 2    | `<out>/<name>.o`          | LLVM C API (`LLVMBackend`) |
//! | 3    | `<out>/<name>`            | system linker (`cc`)       |
//!
//! The linker is located before anything is written. The executable is
//! linked to `<name>.tmp` and renamed over `<name>` only when the linker
//! succeeds, so a failed build never leaves a partial artifact.

#ifndef KINDRED_BACKEND_EMITTER_HPP
#define KINDRED_BACKEND_EMITTER_HPP

#include "common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kindred::backend {

/// Build mode of a compile.
enum class OptimizationMode {
    Debug,   ///< `default<O0>`
    Release, ///< `default<O2>`
};

[[nodiscard]] auto optimization_mode_name(OptimizationMode mode) -> std::string_view;

/// Parses `Debug`/`Release` (case-insensitive).
[[nodiscard]] auto parse_optimization_mode(std::string_view text)
    -> std::optional<OptimizationMode>;

enum class BuildErrorKind {
    ToolchainNotFound,
    ToolchainFailure,
    Timeout,
    BackendFailure,
    OutputFailure,
};

[[nodiscard]] auto build_error_kind_name(BuildErrorKind kind) -> std::string_view;

struct BuildError {
    BuildErrorKind kind;
    std::string message;
    int exit_code = 0;           ///< Set for ToolchainFailure
    std::string captured_stderr; ///< Linker stderr for ToolchainFailure
};

struct EmitOptions {
    std::filesystem::path output_directory = "build";
    std::string artifact_name = "main";
    OptimizationMode mode = OptimizationMode::Release;
    std::string linker = "cc";
    int timeout_seconds = 120;
    bool keep_intermediates = false; ///< Keep `.ll` and `.o` after a successful link
};

/// Writes, compiles and links `llvm_ir`; returns the executable path.
[[nodiscard]] auto emit_executable(const std::string& llvm_ir, const EmitOptions& options)
    -> Result<std::filesystem::path, BuildError>;

} // namespace kindred::backend

#endif // KINDRED_BACKEND_EMITTER_HPP
