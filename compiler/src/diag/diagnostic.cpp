//! # Diagnostic Rendering
//!
//! One-line rendering plus the optional caret snippet.

#include "diag/diagnostic.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace kindred::diag {

namespace {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightBlue = "\033[94m";
};

} // namespace

auto stage_name(Stage stage) -> std::string_view {
    switch (stage) {
    case Stage::Lex:
        return "LexError";
    case Stage::Parse:
        return "ParseError";
    case Stage::Name:
        return "NameError";
    case Stage::Type:
        return "TypeError";
    case Stage::Codegen:
        return "CodegenError";
    case Stage::Build:
        return "BuildError";
    case Stage::Io:
        return "IoError";
    }
    return "Error";
}

auto Diagnostic::error_kind() const -> std::string {
    return std::string(stage_name(stage)) + "::" + kind;
}

auto Diagnostic::to_string() const -> std::string {
    std::ostringstream out;
    out << file;
    if (position) {
        out << ":" << position->line << ":" << position->column;
    }
    out << ": " << error_kind() << ": " << message;
    return out.str();
}

auto make_diagnostic(Stage stage, std::string kind, std::string message, const SourceSpan& span,
                     std::string_view line_text) -> Diagnostic {
    uint32_t length = span.start.length;
    if (span.end.line == span.start.line && span.end.offset + span.end.length > span.start.offset) {
        length = span.end.offset + span.end.length - span.start.offset;
    }
    return Diagnostic{
        .stage = stage,
        .kind = std::move(kind),
        .message = std::move(message),
        .file = std::string(span.start.file),
        .position = Position{.line = span.start.line,
                             .column = span.start.column,
                             .length = std::max<uint32_t>(length, 1)},
        .source_line = std::string(line_text),
    };
}

auto make_diagnostic(Stage stage, std::string kind, std::string message, std::string file)
    -> Diagnostic {
    return Diagnostic{
        .stage = stage,
        .kind = std::move(kind),
        .message = std::move(message),
        .file = std::move(file),
        .position = std::nullopt,
        .source_line = {},
    };
}

// ============================================================================
// Renderer
// ============================================================================

auto DiagnosticRenderer::render(const Diagnostic& diagnostic) const -> std::string {
    std::ostringstream out;
    if (options_.colors) {
        out << Colors::Bold << diagnostic.file;
        if (diagnostic.position) {
            out << ":" << diagnostic.position->line << ":" << diagnostic.position->column;
        }
        out << ": " << Colors::BrightRed << diagnostic.error_kind() << Colors::Reset
            << Colors::Bold << ": " << diagnostic.message << Colors::Reset;
    } else {
        out << diagnostic.to_string();
    }
    out << "\n";

    if (options_.snippets) {
        out << render_snippet(diagnostic);
    }
    return out.str();
}

auto DiagnosticRenderer::render_snippet(const Diagnostic& diagnostic) const -> std::string {
    if (!diagnostic.position || diagnostic.source_line.empty()) {
        return "";
    }

    const auto& pos = *diagnostic.position;
    int line_width = std::max(static_cast<int>(std::to_string(pos.line).length()), 4);
    const char* gutter = options_.colors ? Colors::BrightBlue : "";
    const char* marker = options_.colors ? Colors::BrightRed : "";
    const char* reset = options_.colors ? Colors::Reset : "";

    std::ostringstream out;
    out << gutter << std::setw(line_width) << pos.line << " | " << reset
        << diagnostic.source_line << "\n";

    size_t start_col = pos.column > 0 ? pos.column - 1 : 0;
    size_t end_col = std::min(start_col + pos.length, diagnostic.source_line.length() + 1);
    if (end_col <= start_col) {
        end_col = start_col + 1;
    }

    out << gutter << std::setw(line_width) << "" << " | " << reset;
    for (size_t i = 0; i < start_col; ++i) {
        // Keep tabs so the caret lines up with the echoed line.
        bool tab = i < diagnostic.source_line.size() && diagnostic.source_line[i] == '\t';
        out << (tab ? '\t' : ' ');
    }
    out << marker << std::string(end_col - start_col, '^') << reset << "\n";
    return out.str();
}

auto DiagnosticRenderer::render_all(const std::vector<Diagnostic>& diagnostics) const
    -> std::string {
    std::string text;
    for (const auto& diagnostic : diagnostics) {
        text += render(diagnostic);
    }
    if (diagnostics.size() > 1) {
        text += std::to_string(diagnostics.size()) + " errors reported\n";
    }
    return text;
}

} // namespace kindred::diag
