//! # Compile Options
//!
//! The explicit configuration of one compile. Built by the CLI from
//! defaults, then `kindred.toml`, then command-line flags; the pipeline
//! reads nothing else.

#ifndef KINDRED_DRIVER_OPTIONS_HPP
#define KINDRED_DRIVER_OPTIONS_HPP

#include "backend/emitter.hpp"

#include <filesystem>
#include <string>

namespace kindred::driver {

/// Source file used when neither the manifest nor the command line names one.
constexpr const char* DEFAULT_SOURCE = "main.kin";

/// Output directory used when neither the manifest nor the command line names one.
constexpr const char* DEFAULT_OUTPUT_DIR = "build";

struct CompileOptions {
    std::filesystem::path source_path = DEFAULT_SOURCE;
    std::filesystem::path output_directory = DEFAULT_OUTPUT_DIR;
    backend::OptimizationMode optimization_mode = backend::OptimizationMode::Release;

    /// Executable name inside `output_directory`. Empty means the source stem.
    std::string artifact_name;

    std::string linker = "cc";
    int timeout_seconds = 120;

    /// Keep `<name>.ll` and `<name>.o` next to the executable.
    bool keep_intermediates = false;
};

} // namespace kindred::driver

#endif // KINDRED_DRIVER_OPTIONS_HPP
