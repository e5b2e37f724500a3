//! # Diagnostics
//!
//! Every stage reports errors in its own type (`LexError`, `ParseError`,
//! `NameError`, `TypeError`, `CodegenError`, `BuildError`, `IoError`). The
//! driver converts them into `Diagnostic`, the one shape the CLI prints.
//!
//! ## Rendering
//!
//! ```text
//! main.kin:3:18: TypeError::Mismatch: expected `Int`, found `Bool`
//! build: BuildError::ToolchainNotFound: linker `cc` not found in PATH
//! ```
//!
//! With snippets enabled the offending source line follows, underlined:
//!
//! ```text
//!     3 | var x: Int = true;
//!       |              ^^^^
//! ```
//!
//! A `Diagnostic` owns its strings, so it outlives the `Source` it came from.

#ifndef KINDRED_DIAG_DIAGNOSTIC_HPP
#define KINDRED_DIAG_DIAGNOSTIC_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kindred::diag {

/// Stage that produced a diagnostic.
enum class Stage {
    Lex,
    Parse,
    Name,
    Type,
    Codegen,
    Build,
    Io,
};

/// `LexError`, `ParseError`, ...
[[nodiscard]] auto stage_name(Stage stage) -> std::string_view;

/// Owned copy of a span's start position.
struct Position {
    uint32_t line = 0;
    uint32_t column = 0;
    uint32_t length = 0;
};

struct Diagnostic {
    Stage stage;
    std::string kind; ///< Variant name within the stage, e.g. `Mismatch`
    std::string message;
    std::string file;
    std::optional<Position> position;
    std::string source_line; ///< Text of the line at `position`, if known

    /// `Stage::Kind`, e.g. `TypeError::Mismatch`.
    [[nodiscard]] auto error_kind() const -> std::string;

    /// The one-line form without snippet.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Builds a diagnostic located at `span`, copying `line_text` for snippets.
[[nodiscard]] auto make_diagnostic(Stage stage, std::string kind, std::string message,
                                   const SourceSpan& span, std::string_view line_text = {})
    -> Diagnostic;

/// Builds a span-less diagnostic attributed to `file`.
[[nodiscard]] auto make_diagnostic(Stage stage, std::string kind, std::string message,
                                   std::string file) -> Diagnostic;

struct RenderOptions {
    bool snippets = false;
    bool colors = false;
};

/// Renders diagnostics for a terminal or a log.
class DiagnosticRenderer {
public:
    explicit DiagnosticRenderer(RenderOptions options = {}) : options_(options) {}

    [[nodiscard]] auto render(const Diagnostic& diagnostic) const -> std::string;

    /// Renders all diagnostics, one block per entry, followed by a summary
    /// line when there is more than one.
    [[nodiscard]] auto render_all(const std::vector<Diagnostic>& diagnostics) const
        -> std::string;

private:
    RenderOptions options_;

    [[nodiscard]] auto render_snippet(const Diagnostic& diagnostic) const -> std::string;
};

} // namespace kindred::diag

#endif // KINDRED_DIAG_DIAGNOSTIC_HPP
