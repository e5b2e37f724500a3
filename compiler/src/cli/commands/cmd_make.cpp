//! # Make and Clean Commands
//!
//! Thin wrappers over `driver::compile` and `driver::clean`: they assemble
//! `CompileOptions`, call the core, and turn the result into an exit code.

#include "cmd_make.hpp"

#include "../utils.hpp"
#include "driver/driver.hpp"
#include "driver/manifest.hpp"
#include "log/log.hpp"

#include <charconv>
#include <iostream>

namespace kindred::cli {

namespace {

// Splits `--flag=value`; otherwise takes the next argument as the value
bool take_value(const std::vector<std::string>& args, size_t& i, const std::string& flag,
                std::string& value) {
    const std::string& arg = args[i];
    if (arg == flag) {
        if (i + 1 >= args.size()) {
            return false;
        }
        value = args[++i];
        return true;
    }
    value = arg.substr(flag.size() + 1);
    return true;
}

bool matches(const std::string& arg, const std::string& flag) {
    return arg == flag || arg.rfind(flag + "=", 0) == 0;
}

} // namespace

Result<MakeArgs, std::string> parse_make_args(const std::vector<std::string>& args) {
    MakeArgs parsed;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;

        if (log::is_log_option(arg)) {
            continue;
        }

        if (arg == "--keep-ir") {
            parsed.keep_ir = true;
        } else if (arg == "--snippets") {
            parsed.snippets = true;
        } else if (arg == "--release") {
            parsed.mode = backend::OptimizationMode::Release;
        } else if (arg == "--debug") {
            parsed.mode = backend::OptimizationMode::Debug;
        } else if (matches(arg, "--mode")) {
            if (!take_value(args, i, "--mode", value)) {
                return std::string("--mode requires a value");
            }
            parsed.mode = backend::parse_optimization_mode(value);
            if (!parsed.mode) {
                return "unknown mode `" + value + "`; expected Release or Debug";
            }
        } else if (matches(arg, "--source")) {
            if (!take_value(args, i, "--source", value) || value.empty()) {
                return std::string("--source requires a file");
            }
            parsed.source = value;
        } else if (matches(arg, "--out")) {
            if (!take_value(args, i, "--out", value) || value.empty()) {
                return std::string("--out requires a directory");
            }
            parsed.out = value;
        } else if (matches(arg, "--linker")) {
            if (!take_value(args, i, "--linker", value) || value.empty()) {
                return std::string("--linker requires a command");
            }
            parsed.linker = value;
        } else if (matches(arg, "--timeout")) {
            if (!take_value(args, i, "--timeout", value)) {
                return std::string("--timeout requires a number of seconds");
            }
            int seconds = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
            if (ec != std::errc() || end != value.data() + value.size() || seconds <= 0) {
                return "invalid timeout `" + value + "`";
            }
            parsed.timeout = seconds;
        } else {
            return "unknown option `" + arg + "`";
        }
    }

    return parsed;
}

Result<driver::CompileOptions, std::string>
resolve_options(const MakeArgs& args, const std::filesystem::path& project_dir) {
    driver::CompileOptions options;

    auto manifest_path = project_dir / driver::MANIFEST_FILE;
    std::error_code ec;
    if (std::filesystem::exists(manifest_path, ec)) {
        auto manifest = driver::Manifest::load(manifest_path);
        if (is_err(manifest)) {
            return unwrap_err(manifest);
        }
        unwrap(manifest).apply_to(options, project_dir);
    } else {
        options.source_path = project_dir / driver::DEFAULT_SOURCE;
        options.output_directory = project_dir / driver::DEFAULT_OUTPUT_DIR;
    }

    // Command-line paths are relative to the working directory
    if (args.source) {
        options.source_path = *args.source;
    }
    if (args.out) {
        options.output_directory = *args.out;
    }
    if (args.mode) {
        options.optimization_mode = *args.mode;
    }
    if (args.linker) {
        options.linker = *args.linker;
    }
    if (args.timeout) {
        options.timeout_seconds = *args.timeout;
    }
    options.keep_intermediates = args.keep_ir;

    return options;
}

int run_make(const std::vector<std::string>& args) {
    auto parsed = parse_make_args(args);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Usage: kindred make [--mode Release|Debug] [--source FILE] [--out DIR]\n";
        return EXIT_FAILURE_CODE;
    }
    const auto& make_args = unwrap(parsed);

    auto options = resolve_options(make_args, {});
    if (is_err(options)) {
        std::cerr << "error: " << unwrap_err(options) << "\n";
        return EXIT_FAILURE_CODE;
    }

    auto result = driver::compile(unwrap(options));
    if (is_err(result)) {
        print_diagnostics(unwrap_err(result), make_args.snippets);
        return EXIT_FAILURE_CODE;
    }

    KINDRED_LOG_INFO("cli", "Wrote " << unwrap(result).string());
    return EXIT_SUCCESS_CODE;
}

Result<std::optional<std::string>, std::string>
parse_clean_args(const std::vector<std::string>& args) {
    std::optional<std::string> out;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;

        if (log::is_log_option(arg)) {
            continue;
        }
        if (matches(arg, "--out")) {
            if (!take_value(args, i, "--out", value) || value.empty()) {
                return std::string("--out requires a directory");
            }
            out = value;
            continue;
        }
        return "unknown option `" + arg + "`";
    }

    return out;
}

int run_clean(const std::vector<std::string>& args) {
    auto parsed = parse_clean_args(args);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Usage: kindred clean [--out DIR]\n";
        return EXIT_FAILURE_CODE;
    }

    std::filesystem::path build_dir;

    std::error_code ec;
    auto manifest_path = std::filesystem::path(driver::MANIFEST_FILE);
    if (std::filesystem::exists(manifest_path, ec)) {
        auto manifest = driver::Manifest::load(manifest_path);
        if (is_err(manifest)) {
            std::cerr << "error: " << unwrap_err(manifest) << "\n";
            return EXIT_FAILURE_CODE;
        }
        driver::CompileOptions options;
        unwrap(manifest).apply_to(options, {});
        build_dir = options.output_directory;
    } else {
        build_dir = driver::DEFAULT_OUTPUT_DIR;
    }

    if (const auto& out = unwrap(parsed)) {
        build_dir = *out;
    }

    auto result = driver::clean(build_dir);
    if (is_err(result)) {
        const auto& error = unwrap_err(result);
        std::cerr << error.path.string() << ": IoError: " << error.message << "\n";
        return EXIT_FAILURE_CODE;
    }
    return EXIT_SUCCESS_CODE;
}

} // namespace kindred::cli
