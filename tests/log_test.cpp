//! # Logger Unit Tests
//!
//! Tests for the todo logging library: LogFilter parsing, record
//! formatting, ConsoleSink and FileSink output, level and module filtering,
//! command-line option parsing and thread safety.

#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace todo::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    return LogRecord{.level = level,
                     .module = module,
                     .message = std::move(message),
                     .file = __FILE__,
                     .line = __LINE__,
                     .timestamp_ms = 1234567890};
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
    filter.parse("parser=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "parser"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "config"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("lexer=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "parser"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // A bare module name enables Trace for it
    filter.parse("links");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "links"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("lexer=trace,parser=info,config=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "cli"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("lexer=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, MinLevelDefaultOnly) {
    filter.set_default_level(LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST_F(LogFilterTest, AllHiddenAtOff) {
    filter.set_default_level(LogLevel::Off);
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "any"));
}

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelHelpersTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelHelpersTest, ParseLevel) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("garbage"), LogLevel::Info);
}

// ============================================================================
// Formatting and Sinks
// ============================================================================

TEST(LogFormatTest, TextLine) {
    auto line = format_record(make_record(LogLevel::Warn, "config", "unknown key"), LogFormat::Text);
    // HH:MM:SS.mmm prefix, then the padded level
    EXPECT_EQ(line.substr(12), " WARN  [config] unknown key\n");
}

TEST(LogFormatTest, JsonLineEscapes) {
    auto line = format_record(make_record(LogLevel::Info, "cli", "a\"b\\c\nd"), LogFormat::JSON);
    EXPECT_EQ(line, "{\"ts\":1234567890,\"level\":\"INFO\",\"module\":\"cli\","
                    "\"msg\":\"a\\\"b\\\\c\\nd\"}\n");
}

TEST(ConsoleSinkTest, WritesToStream) {
    std::ostringstream out;
    ConsoleSink sink(true, out);
    EXPECT_FALSE(sink.colors_enabled());

    sink.write(make_record(LogLevel::Error, "links", "handler failed"));
    EXPECT_NE(out.str().find("ERROR [links] handler failed"), std::string::npos);
}

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "todo_log_test.log";
        fs::remove(temp_file);
    }

    void TearDown() override {
        fs::remove(temp_file);
    }

    auto read_file() -> std::string {
        std::ifstream f(temp_file);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, AppendsAcrossSinks) {
    {
        FileSink sink(temp_file.string());
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string());
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    auto content = read_file();
    EXPECT_NE(content.find("[m1] first"), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"second\""), std::string::npos);
}

// ============================================================================
// Logger
// ============================================================================

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>& records) : records_(records) {}

    void write(const LogRecord& record) override {
        records_.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

private:
    std::vector<Entry>& records_;
};

class LoggerTest : public ::testing::Test {
protected:
    std::vector<CaptureSink::Entry> records;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_unique<CaptureSink>(records));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        logger.set_level(LogLevel::Warn);
    }
};

TEST_F(LoggerTest, MacrosRespectLevel) {
    Logger::instance().set_level(LogLevel::Info);

    TODO_LOG_DEBUG("parser", "hidden");
    TODO_LOG_INFO("parser", "Parsed " << 3 << " headings");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Info);
    EXPECT_EQ(records[0].module, "parser");
    EXPECT_EQ(records[0].message, "Parsed 3 headings");
}

TEST_F(LoggerTest, ModuleFilter) {
    Logger::instance().set_filter("links=debug,*=error");

    TODO_LOG_DEBUG("links", "shown");
    TODO_LOG_DEBUG("config", "hidden");
    TODO_LOG_ERROR("config", "shown too");

    EXPECT_EQ(records.size(), 2u);
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
                logger.log(LogLevel::Info, "test", "thread-" + std::to_string(t), __FILE__,
                           __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// Command-Line Options
// ============================================================================

TEST(LogOptionsTest, RecognizesOptions) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--log-filter=parser=trace"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_FALSE(is_log_option("-h"));
    EXPECT_FALSE(is_log_option("--width=40"));
    EXPECT_FALSE(is_log_option("show"));
}

TEST(LogOptionsTest, ParsesLevelAndFormat) {
    std::vector<std::string> args = {"todo", "show", "--log-level=debug", "--log-format=json",
                                     "--log-file=/tmp/todo.log"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    auto config = parse_log_options(static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.log_file, "/tmp/todo.log");
}

TEST(LogOptionsTest, VerbosityFlags) {
    std::vector<std::string> args = {"todo", "-vv", "check", "a.todo"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    auto config = parse_log_options(static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(config.level, LogLevel::Debug);
}
