//! # Logger Unit Tests
//!
//! Tests for the logging system: LogFilter parsing, sink formatting,
//! FileSink I/O, the logging macros, thread safety and CLI option parsing.

#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace domainfix::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string_view module, const std::string& message)
    -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = epoch_ms();
    return record;
}

} // anonymous namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("rules=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "rules"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "rules"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "rules"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "lint"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lint"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("lexer=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "rules"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("rules");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "rules"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lint"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("rules=trace,lint=info,cli=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "rules"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "lint"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lint"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "lexer"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("rules=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelFilteringTest, AllHiddenAtOff) {
    LogFilter filter;
    filter.set_default_level(LogLevel::Off);

    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "any"));
    EXPECT_FALSE(filter.should_log(LogLevel::Error, "any"));
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "any"));
}

// ============================================================================
// Capture Sink
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
};

// ============================================================================
// Console Formatting
// ============================================================================

TEST(ConsoleSinkTest, TextFormatContainsLevelAndModule) {
    std::ostringstream out;
    ConsoleSink sink(out, false);
    sink.write(make_record(LogLevel::Info, "lint", "Checking 3 file(s)"));

    std::string text = out.str();
    EXPECT_NE(text.find("INFO  [lint] Checking 3 file(s)\n"), std::string::npos);
    EXPECT_EQ(text.find('\033'), std::string::npos);
}

TEST(ConsoleSinkTest, ColorsWrapLevelName) {
    std::ostringstream out;
    ConsoleSink sink(out, true);
    sink.write(make_record(LogLevel::Error, "lint", "boom"));

    EXPECT_NE(out.str().find("\033[31mERROR\033[0m"), std::string::npos);
}

TEST(ConsoleSinkTest, JsonFormatOutput) {
    std::ostringstream out;
    ConsoleSink sink(out, false);
    sink.set_format(LogFormat::JSON);

    auto record = make_record(LogLevel::Warn, "rules", "say \"hi\"");
    record.timestamp_ms = 1234567890;
    sink.write(record);

    EXPECT_EQ(out.str(), "{\"ts\":1234567890,\"level\":\"WARN\",\"module\":\"rules\","
                         "\"msg\":\"say \\\"hi\\\"\"}\n");
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "domainfix_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "lint", "file sink test"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[lint]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonEscapesSpecialCharacters) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "escape", "line1\nline2\ttab\\"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("line1\\nline2\\ttab\\\\"), std::string::npos);
}

// ============================================================================
// Logger and Macros
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        logger.add_sink(std::move(sink));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(LogLevel::Warn);
    }
};

TEST_F(LoggerTest, MacrosRespectLevel) {
    Logger::instance().set_level(LogLevel::Info);

    DOMAINFIX_LOG_DEBUG("rules", "hidden");
    DOMAINFIX_LOG_INFO("lint", "Checking " << 2 << " file(s)");
    DOMAINFIX_LOG_ERROR("lint", "broken");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Info);
    EXPECT_EQ(capture->records[0].module, "lint");
    EXPECT_EQ(capture->records[0].message, "Checking 2 file(s)");
    EXPECT_EQ(capture->records[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, ModuleFilterEnablesTrace) {
    Logger::instance().set_level(LogLevel::Warn);
    Logger::instance().set_filter("rules=trace,*=warn");

    DOMAINFIX_LOG_TRACE("rules", "call at 4");
    DOMAINFIX_LOG_TRACE("lexer", "hidden");
    DOMAINFIX_LOG_WARN("lexer", "shown");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].module, "rules");
    EXPECT_EQ(capture->records[1].message, "shown");

    Logger::instance().set_filter("");
}

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "test", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// CLI Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "domainfix");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, ExplicitLevel) {
    EXPECT_EQ(parse({"--log-level=debug"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, Verbosity) {
    EXPECT_EQ(parse({"lint", "-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    // An explicit level wins over -v
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FileFilterAndFormat) {
    auto config = parse({"--log-file=run.log", "--log-filter=rules=trace", "--log-format=json",
                         "--no-color"});
    EXPECT_EQ(config.log_file, "run.log");
    EXPECT_EQ(config.filter_spec, "rules=trace");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_FALSE(config.colors);
}

TEST_F(LogOptionsTest, StopsAtDoubleDash) {
    auto config = parse({"lint", "--log-level=info", "--", "-q", "--log-file=x.log", "-vvv"});
    EXPECT_EQ(config.level, LogLevel::Info);
    EXPECT_TRUE(config.log_file.empty());
}

TEST(IsLogOptionTest, RecognizesLoggingOptions) {
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("--verbose"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("--fix"));
    EXPECT_FALSE(is_log_option("-h"));
    EXPECT_FALSE(is_log_option("-"));
}

// ============================================================================
// Level Helpers
// ============================================================================

TEST(LogLevelHelpersTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelHelpersTest, ParseLevel) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("garbage"), LogLevel::Info);
}

TEST(TimestampTest, GetTimestampFormat) {
    std::string ts = get_timestamp();
    EXPECT_EQ(ts.size(), 12u);
    EXPECT_EQ(ts[2], ':');
    EXPECT_EQ(ts[8], '.');
}
