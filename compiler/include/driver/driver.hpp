//! # Compilation Pipeline
//!
//! The compiler core as the CLI sees it: two entry points and the front-end
//! analysis they share.
//!
//! ```
//! compile(options) -> Result<executable path, diagnostics>
//! clean(build_dir) -> Result<removed anything, IoError>
//! ```
//!
//! ## Stage Policy
//!
//! | Stage     | Runs when                    | Errors            |
//! |-----------|------------------------------|-------------------|
//! | Lexer     | always                       | collected         |
//! | Parser    | always                       | collected         |
//! | Resolver  | always, on the partial AST   | collected         |
//! | Checker   | always, on the partial AST   | collected         |
//! | Lowering  | front end reported nothing   | none              |
//! | Codegen   | front end reported nothing   | fatal             |
//! | Emitter   | codegen succeeded            | fatal             |
//!
//! A missing or unreadable source is fatal before any stage runs.

#ifndef KINDRED_DRIVER_DRIVER_HPP
#define KINDRED_DRIVER_DRIVER_HPP

#include "common.hpp"
#include "diag/diagnostic.hpp"
#include "driver/options.hpp"
#include "lexer/source.hpp"
#include "parser/ast.hpp"
#include "resolve/resolver.hpp"
#include "types/checker.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace kindred::driver {

using Diagnostics = std::vector<diag::Diagnostic>;

/// A filesystem failure outside the pipeline proper.
struct IoError {
    std::string message;
    std::filesystem::path path;
};

/// Output of the four front-end stages over one source.
///
/// Spans inside `program` point into the analyzed `Source`, which must
/// outlive this value. `diagnostics` are owned copies.
struct FrontendResult {
    parser::Program program;
    resolve::Resolution resolution;
    types::CheckResult check;
    Diagnostics diagnostics; ///< Lex, parse, name, type; in that order

    [[nodiscard]] auto ok() const -> bool {
        return diagnostics.empty();
    }
};

/// Runs lexer, parser, resolver and type checker.
[[nodiscard]] auto analyze(const lexer::Source& source) -> FrontendResult;

/// Runs the whole pipeline up to LLVM IR text.
[[nodiscard]] auto generate_llvm_ir(const lexer::Source& source)
    -> Result<std::string, Diagnostics>;

/// Compiles `options.source_path` into an executable in
/// `options.output_directory`.
///
/// On failure no executable is left behind and every collected diagnostic
/// is returned.
[[nodiscard]] auto compile(const CompileOptions& options)
    -> Result<std::filesystem::path, Diagnostics>;

/// Removes `build_dir` and everything in it.
///
/// Succeeds with `false` when there is nothing to remove. Refuses to remove
/// a path that is not a directory.
[[nodiscard]] auto clean(const std::filesystem::path& build_dir) -> Result<bool, IoError>;

} // namespace kindred::driver

#endif // KINDRED_DRIVER_DRIVER_HPP
