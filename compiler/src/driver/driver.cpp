//! # Compilation Pipeline Implementation
//!
//! Converts every stage's native error type into a `diag::Diagnostic` at
//! the stage boundary, so callers deal with one error type.

#include "driver/driver.hpp"

#include "backend/emitter.hpp"
#include "codegen/ir_codegen.hpp"
#include "ir/lowering.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

namespace kindred::driver {

namespace {

auto located(const lexer::Source& source, diag::Stage stage, std::string_view kind,
             const std::string& message, const SourceSpan& span) -> diag::Diagnostic {
    return diag::make_diagnostic(stage, std::string(kind), message, span,
                                 source.line(span.start.line));
}

auto build_diagnostic(const backend::BuildError& error, const std::string& file)
    -> diag::Diagnostic {
    std::string message = error.message;
    if (!error.captured_stderr.empty()) {
        std::string captured = error.captured_stderr;
        while (!captured.empty() && (captured.back() == '\n' || captured.back() == '\r')) {
            captured.pop_back();
        }
        message += "\n" + captured;
    }
    return diag::make_diagnostic(diag::Stage::Build,
                                 std::string(backend::build_error_kind_name(error.kind)),
                                 std::move(message), file);
}

} // namespace

// ============================================================================
// Front End
// ============================================================================

auto analyze(const lexer::Source& source) -> FrontendResult {
    FrontendResult result;
    std::string name = std::filesystem::path(source.filename()).stem().string();

    {
        log::StageTimer timer("driver", "parse");
        lexer::Lexer lex(source);
        parser::Parser parser(lex);
        auto parsed = parser.parse_program(name);
        result.program = std::move(parsed.program);

        for (const auto& error : lex.errors()) {
            result.diagnostics.push_back(located(source, diag::Stage::Lex,
                                                 lexer::lex_error_kind_name(error.kind),
                                                 error.message, error.span));
        }
        for (const auto& error : parsed.errors) {
            result.diagnostics.push_back(
                located(source, diag::Stage::Parse, "Syntax", error.message, error.span));
        }
        KINDRED_LOG_DEBUG("driver", "Parsed " << result.program.decls.size() << " declarations, "
                                              << lex.errors().size() << " lex errors, "
                                              << parsed.errors.size() << " parse errors");
    }

    {
        log::StageTimer timer("driver", "resolve");
        result.resolution = resolve::resolve(result.program);
        for (const auto& error : result.resolution.errors) {
            result.diagnostics.push_back(located(source, diag::Stage::Name,
                                                 resolve::name_error_kind_name(error.kind),
                                                 error.message, error.span));
        }
    }

    {
        log::StageTimer timer("driver", "type check");
        result.check = types::check(result.program, result.resolution);
        for (const auto& error : result.check.errors) {
            result.diagnostics.push_back(located(source, diag::Stage::Type,
                                                 types::type_error_kind_name(error.kind),
                                                 error.message, error.span));
        }
    }

    return result;
}

auto generate_llvm_ir(const lexer::Source& source) -> Result<std::string, Diagnostics> {
    auto frontend = analyze(source);
    if (!frontend.ok()) {
        KINDRED_LOG_DEBUG("driver", "Front end reported " << frontend.diagnostics.size()
                                                          << " errors; skipping codegen");
        return std::move(frontend.diagnostics);
    }

    ir::Module module;
    {
        log::StageTimer timer("driver", "lower");
        module = ir::lower(frontend.program, frontend.resolution, frontend.check.types);
    }

    log::StageTimer timer("driver", "codegen");
    codegen::IrCodegen generator;
    auto generated = generator.generate(module);
    if (is_err(generated)) {
        const auto& error = unwrap_err(generated);
        return Diagnostics{diag::make_diagnostic(
            diag::Stage::Codegen, std::string(codegen::codegen_error_kind_name(error.kind)),
            error.message, std::string(source.filename()))};
    }
    return std::move(unwrap(generated));
}

// ============================================================================
// Entry Points
// ============================================================================

auto compile(const CompileOptions& options) -> Result<std::filesystem::path, Diagnostics> {
    log::StageTimer timer("driver", "compile");
    std::string file = options.source_path.string();
    KINDRED_LOG_INFO("driver", "Compiling " << file << " ("
                                            << backend::optimization_mode_name(
                                                   options.optimization_mode)
                                            << ")");

    std::error_code ec;
    if (!std::filesystem::exists(options.source_path, ec)) {
        return Diagnostics{diag::make_diagnostic(diag::Stage::Io, "NotFound",
                                                 "source file does not exist", file)};
    }
    auto loaded = lexer::Source::from_file(options.source_path);
    if (is_err(loaded)) {
        return Diagnostics{
            diag::make_diagnostic(diag::Stage::Io, "ReadFailure", unwrap_err(loaded), file)};
    }
    const auto& source = unwrap(loaded);

    auto llvm_ir = generate_llvm_ir(source);
    if (is_err(llvm_ir)) {
        return std::move(unwrap_err(llvm_ir));
    }

    backend::EmitOptions emit_options;
    emit_options.output_directory = options.output_directory;
    emit_options.artifact_name = options.artifact_name.empty()
                                     ? options.source_path.stem().string()
                                     : options.artifact_name;
    emit_options.mode = options.optimization_mode;
    emit_options.linker = options.linker;
    emit_options.timeout_seconds = options.timeout_seconds;
    emit_options.keep_intermediates = options.keep_intermediates;

    auto built = backend::emit_executable(unwrap(llvm_ir), emit_options);
    if (is_err(built)) {
        return Diagnostics{build_diagnostic(unwrap_err(built), file)};
    }
    return unwrap(built);
}

auto clean(const std::filesystem::path& build_dir) -> Result<bool, IoError> {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(build_dir, ec);
    if (ec || !std::filesystem::exists(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return IoError{.message = "cannot inspect: " + ec.message(), .path = build_dir};
        }
        KINDRED_LOG_DEBUG("driver", "Nothing to clean at " << build_dir.string());
        return false;
    }
    if (!std::filesystem::is_directory(status)) {
        return IoError{.message = "not a directory", .path = build_dir};
    }

    auto removed = std::filesystem::remove_all(build_dir, ec);
    if (ec) {
        return IoError{.message = "cannot remove: " + ec.message(), .path = build_dir};
    }
    KINDRED_LOG_INFO("driver", "Removed " << build_dir.string() << " (" << removed << " entries)");
    return true;
}

} // namespace kindred::driver
