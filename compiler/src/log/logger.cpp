//! # Logger Implementation
//!
//! Implements the Logger singleton, the sinks, LogFilter and StageTimer.

#include "log/log.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#include <unistd.h>

namespace kindred::log {

// ============================================================================
// Levels
// ============================================================================

auto level_name(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

auto parse_level(std::string_view s) -> LogLevel {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "fatal")
        return LogLevel::Fatal;
    if (lower == "off")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Formatting
// ============================================================================

static auto level_color(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        return "";
    }
    return "";
}

/// True when stderr is a terminal that understands ANSI escapes.
static auto detect_terminal_colors() -> bool {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string_view(term) != "dumb";
}

auto format_text(const LogRecord& record, bool colors) -> std::string {
    std::ostringstream oss;
    oss << get_timestamp() << " ";
    if (colors) {
        oss << level_color(record.level);
    }
    oss << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message;
    return oss.str();
}

auto format_json(const LogRecord& record) -> std::string {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":\"" << record.module << "\",\"msg\":\"";

    for (char c : record.message) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            oss << c;
        }
    }

    oss << "\"}";
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    // One insertion per record keeps lines intact when several sinks share stderr.
    std::string line =
        format_ == LogFormat::JSON ? format_json(record) : format_text(record, colors_enabled_);
    line += '\n';
    std::cerr << line;
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record, false))
          << "\n";

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// MemorySink
// ============================================================================

void MemorySink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

auto MemorySink::records() const -> std::vector<LogRecord> {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

auto MemorySink::contains(std::string_view module, std::string_view needle) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.module == module && record.message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// MultiSink
// ============================================================================

void MultiSink::write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void MultiSink::flush() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = token.substr(eq + 1);
            if (mod == "*") {
                default_level_ = parse_level(lvl);
            } else {
                module_levels_[std::string(mod)] = parse_level(lvl);
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        if (level < min)
            min = level;
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;
    logger.filter_ = LogFilter();

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // A spec without "*=level" falls back to the requested global level.
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        logger.level_ = logger.filter_.min_level();
    } else {
        logger.filter_.set_default_level(config.level);
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level < level_)
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record{
        .level = level,
        .module = std::string(module),
        .message = message,
        .file = file,
        .line = line,
        .timestamp_ms = epoch_ms(),
    };
    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

// ============================================================================
// StageTimer
// ============================================================================

StageTimer::StageTimer(std::string_view module, std::string_view stage)
    : module_(module), stage_(stage), start_(std::chrono::steady_clock::now()) {
    KINDRED_LOG_TRACE(module_, stage_ << " started");
}

StageTimer::~StageTimer() {
    KINDRED_LOG_DEBUG(module_, stage_ << " finished in " << elapsed_ms() << " ms");
}

auto StageTimer::elapsed_ms() const -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 start_)
        .count();
}

// ============================================================================
// Time Helpers
// ============================================================================

auto get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace kindred::log
