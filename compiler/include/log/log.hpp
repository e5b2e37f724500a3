//! # Kindred Logging
//!
//! Structured, module-tagged logging for the compiler pipeline:
//! - 6 severity levels plus `Off`
//! - Module tags (`lexer`, `parser`, `resolve`, `types`, `ir`, `codegen`,
//!   `backend`, `driver`, `cli`) for per-stage filtering
//! - Console, file, memory and fan-out sinks
//! - Mutex-protected dispatch
//! - Compile-time level elision via `KINDRED_MIN_LOG_LEVEL`
//!
//! ## Usage
//!
//! ```cpp
//! KINDRED_LOG_INFO("driver", "Compiling " << source << " -> " << output);
//! KINDRED_LOG_DEBUG("codegen", "Emitting function " << name);
//! ```

#ifndef KINDRED_LOG_LOG_HPP
#define KINDRED_LOG_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kindred::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Stage progress and counts
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Conditions that stop the pipeline
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a level name, case-insensitively. Unknown names map to `Info`.
[[nodiscard]] auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string module;
    std::string message;
    const char* file; ///< `__FILE__` of the call site
    int line;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record as a single text line (without trailing newline).
[[nodiscard]] auto format_text(const LogRecord& record, bool colors) -> std::string;

/// Renders a record as a single JSON object (without trailing newline).
[[nodiscard]] auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract log output destination.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a capable terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a file. Flushes eagerly on `Error` and above.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Keeps records in memory. Used by tests to observe pipeline logging.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    /// Returns a copy of every record written so far.
    [[nodiscard]] auto records() const -> std::vector<LogRecord>;

    /// Returns true if some record from `module` contains `needle`.
    [[nodiscard]] auto contains(std::string_view module, std::string_view needle) const -> bool;

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

/// Fans each record out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    [[nodiscard]] auto size() const -> size_t {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter.
///
/// Parses specifications such as `"codegen=trace,parser=debug,*=warn"`.
/// A bare module name (`"codegen"`) enables everything from that module;
/// `*` sets the level for unlisted modules.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level any module (or the default) lets through.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Module filter, empty for none
    std::string log_file;    ///< Extra file output, empty for none
    bool console = true;
    bool colors = true;
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger.
///
/// The only shared state in the compiler. Usable before `init()`, in which
/// case it logs warnings and above to the console.
class Logger {
public:
    /// Replaces sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Subsequent records are dropped until one is added.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Stage Timer
// ============================================================================

/// Logs how long a scope took, at debug level, when it is destroyed.
///
/// ```cpp
/// {
///     log::StageTimer timer("driver", "type check");
///     ...
/// } // "type check finished in 3 ms"
/// ```
class StageTimer {
public:
    StageTimer(std::string_view module, std::string_view stage);
    ~StageTimer();

    StageTimer(const StageTimer&) = delete;
    auto operator=(const StageTimer&) -> StageTimer& = delete;

    /// Milliseconds elapsed since construction.
    [[nodiscard]] auto elapsed_ms() const -> int64_t;

private:
    std::string module_;
    std::string stage_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Helpers
// ============================================================================

/// Current local time as `HH:MM:SS.mmm`.
[[nodiscard]] auto get_timestamp() -> std::string;

/// Milliseconds since the Unix epoch.
[[nodiscard]] auto epoch_ms() -> int64_t;

/// Parse logging options from argv.
///
/// Recognizes `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-v/-vv/-vvv`, `--verbose` and `-q/--quiet`. Without any of those the
/// `KINDRED_LOG` environment variable is consulted: a value containing `=` or
/// `,` is a filter specification, anything else a level name.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Returns true for arguments consumed by `parse_log_options`.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef KINDRED_MIN_LOG_LEVEL
#define KINDRED_MIN_LOG_LEVEL 0
#endif

/// Internal macro; use the level-specific macros below.
#define KINDRED_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= KINDRED_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::kindred::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define KINDRED_LOG_TRACE(module, msg)                                                             \
    KINDRED_LOG_IMPL(::kindred::log::LogLevel::Trace, module, msg)
#define KINDRED_LOG_DEBUG(module, msg)                                                             \
    KINDRED_LOG_IMPL(::kindred::log::LogLevel::Debug, module, msg)
#define KINDRED_LOG_INFO(module, msg) KINDRED_LOG_IMPL(::kindred::log::LogLevel::Info, module, msg)
#define KINDRED_LOG_WARN(module, msg) KINDRED_LOG_IMPL(::kindred::log::LogLevel::Warn, module, msg)
#define KINDRED_LOG_ERROR(module, msg)                                                             \
    KINDRED_LOG_IMPL(::kindred::log::LogLevel::Error, module, msg)
#define KINDRED_LOG_FATAL(module, msg)                                                             \
    KINDRED_LOG_IMPL(::kindred::log::LogLevel::Fatal, module, msg)

} // namespace kindred::log

#endif // KINDRED_LOG_LOG_HPP
