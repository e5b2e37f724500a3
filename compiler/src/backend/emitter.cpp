//! # Executable Emitter Implementation

#include "backend/emitter.hpp"

#include "backend/llvm_backend.hpp"
#include "backend/process.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace kindred::backend {

auto optimization_mode_name(OptimizationMode mode) -> std::string_view {
    switch (mode) {
    case OptimizationMode::Debug:
        return "Debug";
    case OptimizationMode::Release:
        return "Release";
    }
    return "Release";
}

auto parse_optimization_mode(std::string_view text) -> std::optional<OptimizationMode> {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") {
        return OptimizationMode::Debug;
    }
    if (lower == "release") {
        return OptimizationMode::Release;
    }
    return std::nullopt;
}

auto build_error_kind_name(BuildErrorKind kind) -> std::string_view {
    switch (kind) {
    case BuildErrorKind::ToolchainNotFound:
        return "ToolchainNotFound";
    case BuildErrorKind::ToolchainFailure:
        return "ToolchainFailure";
    case BuildErrorKind::Timeout:
        return "Timeout";
    case BuildErrorKind::BackendFailure:
        return "BackendFailure";
    case BuildErrorKind::OutputFailure:
        return "OutputFailure";
    }
    return "Unknown";
}

namespace {

auto output_failure(const std::string& message) -> BuildError {
    return BuildError{.kind = BuildErrorKind::OutputFailure, .message = message};
}

auto write_text(const std::filesystem::path& path, const std::string& content) -> bool {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << content;
    out.close();
    return !out.fail();
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        KINDRED_LOG_DEBUG("backend", "Could not remove " << path.string() << ": " << ec.message());
    }
}

} // namespace

auto emit_executable(const std::string& llvm_ir, const EmitOptions& options)
    -> Result<std::filesystem::path, BuildError> {
    log::StageTimer timer("backend", "emit");

    // Fatal before any file is touched
    auto linker = find_program(options.linker);
    if (!linker) {
        return BuildError{.kind = BuildErrorKind::ToolchainNotFound,
                          .message = "linker `" + options.linker + "` not found on PATH"};
    }

    std::error_code ec;
    std::filesystem::create_directories(options.output_directory, ec);
    if (ec) {
        return output_failure("cannot create output directory `" +
                              options.output_directory.string() + "`: " + ec.message());
    }

    auto base = options.output_directory / options.artifact_name;
    auto ll_path = std::filesystem::path(base.string() + ".ll");
    auto obj_path = std::filesystem::path(base.string() + ".o");
    auto tmp_path = std::filesystem::path(base.string() + ".tmp");
    const auto& exe_path = base;

    if (!write_text(ll_path, llvm_ir)) {
        remove_quietly(ll_path);
        return output_failure("cannot write `" + ll_path.string() + "`");
    }
    KINDRED_LOG_DEBUG("backend", "Wrote " << ll_path.string() << " (" << llvm_ir.size()
                                          << " bytes)");

    // Failures leave only what `keep_intermediates` asks for
    auto discard_intermediates = [&] {
        if (!options.keep_intermediates) {
            remove_quietly(ll_path);
            remove_quietly(obj_path);
        }
    };

    LLVMBackend llvm;
    if (!llvm.initialize()) {
        discard_intermediates();
        return BuildError{.kind = BuildErrorKind::BackendFailure, .message = llvm.get_last_error()};
    }
    LLVMCompileOptions compile_opts;
    compile_opts.optimization_level = options.mode == OptimizationMode::Debug ? 0 : 2;
    auto compiled = llvm.compile_ir_to_object(llvm_ir, obj_path, compile_opts);
    if (!compiled.success) {
        remove_quietly(obj_path);
        discard_intermediates();
        return BuildError{.kind = BuildErrorKind::BackendFailure,
                          .message = compiled.error_message};
    }

    std::vector<std::string> args = {obj_path.string(), "-o", tmp_path.string()};
    KINDRED_LOG_DEBUG("backend", "Linking with " << linker->string());
    auto linked = run_process(linker->string(), args, options.timeout_seconds);

    if (!linked.launched) {
        remove_quietly(tmp_path);
        discard_intermediates();
        return BuildError{.kind = BuildErrorKind::ToolchainNotFound,
                          .message = linked.stderr_output};
    }
    if (linked.timed_out) {
        remove_quietly(tmp_path);
        discard_intermediates();
        return BuildError{.kind = BuildErrorKind::Timeout,
                          .message = "linker `" + options.linker + "` did not finish within " +
                                     std::to_string(options.timeout_seconds) + "s"};
    }
    if (linked.exit_code != 0) {
        remove_quietly(tmp_path);
        discard_intermediates();
        return BuildError{.kind = BuildErrorKind::ToolchainFailure,
                          .message = "linker `" + options.linker + "` exited with status " +
                                     std::to_string(linked.exit_code),
                          .exit_code = linked.exit_code,
                          .captured_stderr = linked.stderr_output};
    }

    std::filesystem::rename(tmp_path, exe_path, ec);
    if (ec) {
        remove_quietly(tmp_path);
        discard_intermediates();
        return output_failure("cannot move executable to `" + exe_path.string() +
                              "`: " + ec.message());
    }

    discard_intermediates();

    KINDRED_LOG_INFO("backend", "Built " << exe_path.string() << " ("
                                         << optimization_mode_name(options.mode) << ")");
    return exe_path;
}

} // namespace kindred::backend
