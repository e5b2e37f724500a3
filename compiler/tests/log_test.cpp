//! # Logger Unit Tests
//!
//! Tests for the Kindred logging system: LogFilter parsing, text and JSON
//! formatting, FileSink I/O, level and module filtering, command-line
//! option parsing, and thread safety.

#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace kindred::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, const std::string& module, const std::string& message)
    -> LogRecord {
    return LogRecord{.level = level,
                     .module = module,
                     .message = message,
                     .file = "test.cpp",
                     .line = 42,
                     .timestamp_ms = 1700000000000};
}

auto read_lines(const fs::path& path) -> std::vector<std::string> {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("codegen=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "codegen"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "codegen"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "codegen"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "backend"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "backend"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("resolve");
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "resolve"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "types"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("lexer=off,*=trace");
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "parser"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("codegen=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilterKeepsDefault) {
    filter.parse("");
    EXPECT_EQ(filter.default_level(), LogLevel::Info);
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "driver"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "driver"));
}

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelHelpersTest, LevelNameRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        EXPECT_EQ(parse_level(level_name(level)), level);
    }
}

TEST(LogLevelHelpersTest, ParseLevelCaseInsensitive) {
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextLine) {
    auto line = format_text(make_record(LogLevel::Info, "driver", "Compiling main.kin"), false);
    // HH:MM:SS.mmm prefix
    ASSERT_GT(line.size(), 13u);
    EXPECT_EQ(line[2], ':');
    EXPECT_EQ(line[8], '.');
    EXPECT_EQ(line.substr(12), " INFO  [driver] Compiling main.kin");
}

TEST(LogFormatTest, TextLineWithColors) {
    auto line = format_text(make_record(LogLevel::Error, "backend", "link failed"), true);
    EXPECT_NE(line.find("\033[31m"), std::string::npos);
    EXPECT_NE(line.find("[backend] link failed"), std::string::npos);
}

TEST(LogFormatTest, JsonLine) {
    auto line = format_json(make_record(LogLevel::Warn, "cli", "say \"hi\"\n\tnow\\"));
    EXPECT_EQ(line, "{\"ts\":1700000000000,\"level\":\"WARN\",\"module\":\"cli\","
                    "\"msg\":\"say \\\"hi\\\"\\n\\tnow\\\\\"}");
}

// ============================================================================
// Sinks
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path path_;

    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("kindred_log_" +
                 std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                 ".log");
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }
};

TEST_F(FileSinkTest, WritesTextLines) {
    {
        FileSink sink(path_.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "driver", "first"));
        sink.write(make_record(LogLevel::Error, "driver", "second"));
    }
    auto lines = read_lines(path_);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[driver] first"), std::string::npos);
    EXPECT_NE(lines[1].find("ERROR [driver] second"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(path_.string(), false);
        sink.write(make_record(LogLevel::Info, "a", "one"));
    }
    {
        FileSink sink(path_.string(), true);
        sink.write(make_record(LogLevel::Info, "a", "two"));
    }
    EXPECT_EQ(read_lines(path_).size(), 2u);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(path_.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Debug, "types", "checked"));
    }
    auto lines = read_lines(path_);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].front(), '{');
    EXPECT_EQ(lines[0].back(), '}');
    EXPECT_NE(lines[0].find("\"module\":\"types\""), std::string::npos);
}

TEST(MemorySinkTest, RecordsAndSearches) {
    MemorySink sink;
    sink.write(make_record(LogLevel::Debug, "parser", "Parsed 3 declarations"));
    sink.write(make_record(LogLevel::Debug, "lexer", "Produced 12 tokens"));

    EXPECT_EQ(sink.records().size(), 2u);
    EXPECT_TRUE(sink.contains("parser", "3 declarations"));
    EXPECT_FALSE(sink.contains("lexer", "declarations"));
}

TEST(MultiSinkTest, FansOutToAllChildren) {
    auto first = std::make_unique<MemorySink>();
    auto second = std::make_unique<MemorySink>();
    auto* first_ptr = first.get();
    auto* second_ptr = second.get();

    MultiSink multi;
    multi.add(std::move(first));
    multi.add(std::move(second));
    multi.add(std::make_unique<NullSink>());
    EXPECT_EQ(multi.size(), 3u);

    multi.write(make_record(LogLevel::Info, "cli", "hello"));
    EXPECT_EQ(first_ptr->records().size(), 1u);
    EXPECT_EQ(second_ptr->records().size(), 1u);
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    MemorySink* sink_ = nullptr;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        Logger::init(config);
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        Logger::init(LogConfig{});
    }
};

TEST_F(LoggerTest, DebugHiddenAtWarnLevel) {
    KINDRED_LOG_DEBUG("driver", "hidden");
    KINDRED_LOG_WARN("driver", "shown " << 1);
    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "shown 1");
    EXPECT_EQ(records[0].level, LogLevel::Warn);
}

TEST_F(LoggerTest, AllHiddenAtOff) {
    Logger::instance().set_level(LogLevel::Off);
    KINDRED_LOG_FATAL("driver", "nothing");
    EXPECT_TRUE(sink_->records().empty());
}

TEST_F(LoggerTest, ModuleFilter) {
    Logger::instance().set_filter("codegen=trace,*=error");
    KINDRED_LOG_TRACE("codegen", "emitting");
    KINDRED_LOG_INFO("parser", "skipped");
    EXPECT_TRUE(sink_->contains("codegen", "emitting"));
    EXPECT_FALSE(sink_->contains("parser", "skipped"));
}

TEST_F(LoggerTest, StageTimerReportsCompletion) {
    Logger::instance().set_level(LogLevel::Trace);
    {
        StageTimer timer("types", "check");
        EXPECT_GE(timer.elapsed_ms(), 0);
    }
    EXPECT_TRUE(sink_->contains("types", "check started"));
    EXPECT_TRUE(sink_->contains("types", "check finished in"));
}

TEST_F(LoggerTest, ConcurrentLogging) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < kPerThread; ++i) {
                KINDRED_LOG_ERROR("thread", "worker " << t << " message " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(sink_->records().size(), static_cast<size_t>(kThreads * kPerThread));
}

// ============================================================================
// Command-Line Options
// ============================================================================

namespace {

auto parse_args(std::vector<std::string> args) -> LogConfig {
    args.insert(args.begin(), "kindred");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_log_options(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(LogOptionsTest, VerbosityLevels) {
    EXPECT_EQ(parse_args({"make", "-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse_args({"-vv", "make"}).level, LogLevel::Debug);
    EXPECT_EQ(parse_args({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse_args({"-q"}).level, LogLevel::Error);
}

TEST(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    EXPECT_EQ(parse_args({"-vvv", "--log-level=warn"}).level, LogLevel::Warn);
}

TEST(LogOptionsTest, FilterFileAndFormat) {
    auto config =
        parse_args({"--log-filter=codegen=debug", "--log-file=out.log", "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "codegen=debug");
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_FALSE(is_log_option("--verbosely"));
    EXPECT_FALSE(is_log_option("-x"));
    EXPECT_FALSE(is_log_option("--debug"));
    EXPECT_FALSE(is_log_option("make"));
}
