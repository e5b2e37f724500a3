//! # Subprocess Execution
//!
//! Runs an external tool (the system linker) as a blocking child process
//! with a deadline, capturing its output.
//!
//! - **Unix**: fork + execvp with pipe-based output capture; the child is
//!   killed with SIGKILL when the deadline passes

#ifndef KINDRED_BACKEND_PROCESS_HPP
#define KINDRED_BACKEND_PROCESS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kindred::backend {

/// Outcome of one child process.
struct ProcessResult {
    bool launched = false;  ///< False when fork or exec failed
    bool timed_out = false; ///< Killed after the deadline
    int exit_code = -1;     ///< -1 unless the child exited normally
    std::string stdout_output;
    std::string stderr_output;
    int64_t duration_us = 0;
};

/// Runs `program` with `args` and waits at most `timeout_seconds`.
///
/// `program` is looked up on `PATH` when it has no slash. Output of both
/// streams is drained while the child runs, so a chatty tool cannot block
/// on a full pipe.
[[nodiscard]] auto run_process(const std::string& program, const std::vector<std::string>& args,
                               int timeout_seconds) -> ProcessResult;

/// Locates an executable the way `execvp` would.
///
/// A name containing `/` is checked directly; anything else is searched on
/// `PATH`. Returns nothing when no executable file is found.
[[nodiscard]] auto find_program(const std::string& program) -> std::optional<std::filesystem::path>;

} // namespace kindred::backend

#endif // KINDRED_BACKEND_PROCESS_HPP
