//! # LLVM Backend
//!
//! Compiles LLVM IR text to a native object file through the LLVM C API,
//! in process.
//!
//! ## Usage
//!
//! ```cpp
//! LLVMBackend backend;
//! if (!backend.initialize()) {
//!     report(backend.get_last_error());
//! }
//!
//! LLVMCompileOptions opts;
//! opts.optimization_level = 2;
//! auto result = backend.compile_ir_to_object(ir_string, output_path, opts);
//! ```
//!
//! ## Pipeline
//!
//! parse -> verify -> `default<ON>` pass pipeline -> object emission. A
//! module that fails verification is rejected before any pass runs.

#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace kindred::backend {

/// Options for LLVM IR compilation.
struct LLVMCompileOptions {
    /// Optimization level (0-3).
    int optimization_level = 0;

    /// Target triple. Empty means the host.
    std::string target_triple;

    /// Generate position-independent code. Needed to link as a PIE.
    bool position_independent = true;
};

/// Result of LLVM IR compilation.
struct LLVMCompileResult {
    bool success = false;

    /// Path to the generated object file.
    fs::path object_file;

    /// Error message if compilation failed.
    std::string error_message;
};

/// LLVM Backend for direct IR compilation.
///
/// Owns one LLVM context for its lifetime. Not thread safe; use one backend
/// per compile.
class LLVMBackend {
public:
    LLVMBackend();
    ~LLVMBackend();

    // Non-copyable
    LLVMBackend(const LLVMBackend&) = delete;
    LLVMBackend& operator=(const LLVMBackend&) = delete;

    /// Registers the native target and creates the context.
    ///
    /// @return true if initialization succeeded
    [[nodiscard]] auto initialize() -> bool;

    [[nodiscard]] auto is_initialized() const -> bool {
        return initialized_;
    }

    /// Compile LLVM IR text to an object file.
    ///
    /// @param ir_content The LLVM IR text content
    /// @param output_path Path for the output object file
    /// @param options Compilation options
    [[nodiscard]] auto compile_ir_to_object(const std::string& ir_content,
                                            const fs::path& output_path,
                                            const LLVMCompileOptions& options) -> LLVMCompileResult;

    /// Get the default target triple for the host.
    [[nodiscard]] auto get_default_target_triple() const -> std::string;

    [[nodiscard]] auto get_last_error() const -> const std::string& {
        return last_error_;
    }

private:
    bool initialized_ = false;
    std::string last_error_;

    // LLVMContextRef
    void* context_ = nullptr;
};

/// Get the LLVM version string the compiler was built against.
[[nodiscard]] auto get_llvm_version() -> std::string;

} // namespace kindred::backend
