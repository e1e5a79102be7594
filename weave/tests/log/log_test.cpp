//! # Logger Unit Tests
//!
//! Module filters, record formatting, the macros, `WEAVE_LOG`
//! configuration and concurrent logging.

#include "log/log.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace weave::log;

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ModuleAndDefault) {
    filter.parse("resolve=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "resolve"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "resolve"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "emit"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "emit"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("graph=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Error, "graph"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "resolve"));
}

TEST_F(LogFilterTest, BareModuleName) {
    filter.parse("transition");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "transition"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "module"));
}

TEST_F(LogFilterTest, DefaultIsWarn) {
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "resolve"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "resolve"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("resolve=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);

    filter.parse("*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST(LogLevelTest, NamesAndParsing) {
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("Info"), LogLevel::Info);
    EXPECT_EQ(parse_level("OFF"), LogLevel::Off);
    EXPECT_EQ(parse_level("loud"), LogLevel::Warn);
}

// ============================================================================
// Formatting
// ============================================================================

static LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
    return LogRecord{level, module, std::move(message), 1700000000123};
}

TEST(LogFormatTest, TextHasLevelModuleAndMessage) {
    auto line = format_text(make_record(LogLevel::Warn, "resolve", "unresolved 'left-pad'"));
    EXPECT_NE(line.find(".123 WARN  [resolve] unresolved 'left-pad'"), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesMessage) {
    auto line = format_json(make_record(LogLevel::Error, "emit", "write \"a\"\nfailed"));
    EXPECT_EQ(line, "{\"ts\":1700000000123,\"level\":\"ERROR\",\"module\":\"emit\","
                    "\"msg\":\"write \\\"a\\\"\\nfailed\"}");
}

// ============================================================================
// Logger and Macros
// ============================================================================

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>* records) : records_(records) {}

    void write(const LogRecord& record) override {
        records_->push_back({record.level, std::string(record.module), record.message});
    }

private:
    std::vector<Entry>* records_;
};

class LoggerTest : public ::testing::Test {
protected:
    std::vector<CaptureSink::Entry> records;

    void SetUp() override {
        Logger::instance().set_sink(std::make_unique<CaptureSink>(&records));
    }

    void TearDown() override {
        Logger::instance().configure(LogConfig{});
    }
};

TEST_F(LoggerTest, MacrosRespectLevel) {
    Logger::instance().set_filter("*=info");

    WEAVE_LOG_DEBUG("resolve", "hidden");
    WEAVE_LOG_INFO("resolve", "shown " << 42);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Info);
    EXPECT_EQ(records[0].module, "resolve");
    EXPECT_EQ(records[0].message, "shown 42");
}

TEST_F(LoggerTest, ModuleFilterOverridesDefault) {
    Logger::instance().set_filter("graph=trace,*=error");

    WEAVE_LOG_TRACE("graph", "node");
    WEAVE_LOG_WARN("emit", "hidden");
    WEAVE_LOG_ERROR("emit", "shown");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].module, "graph");
    EXPECT_EQ(records[1].message, "shown");
}

TEST_F(LoggerTest, MessageNotBuiltWhenFiltered) {
    Logger::instance().set_filter("*=error");
    int evaluated = 0;
    auto count = [&evaluated]() {
        ++evaluated;
        return "x";
    };

    WEAVE_LOG_DEBUG("query", count());
    EXPECT_EQ(evaluated, 0);
    EXPECT_TRUE(records.empty());
}

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.set_filter("*=trace");

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                WEAVE_LOG_INFO("query", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// WEAVE_LOG Configuration
// ============================================================================

class LogConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("WEAVE_LOG");
        unsetenv("WEAVE_LOG_FORMAT");
    }
};

TEST_F(LogConfigTest, UnsetMeansWarnText) {
    unsetenv("WEAVE_LOG");
    unsetenv("WEAVE_LOG_FORMAT");
    auto config = log_config_from_env();
    EXPECT_EQ(config.filter_spec, "*=warn");
    EXPECT_EQ(config.format, LogFormat::Text);
}

TEST_F(LogConfigTest, SingleLevelAppliesToEveryModule) {
    setenv("WEAVE_LOG", "debug", 1);
    EXPECT_EQ(log_config_from_env().filter_spec, "*=debug");
}

TEST_F(LogConfigTest, FilterSpecIsKept) {
    setenv("WEAVE_LOG", "resolve=trace,*=warn", 1);
    EXPECT_EQ(log_config_from_env().filter_spec, "resolve=trace,*=warn");
}

TEST_F(LogConfigTest, JsonFormat) {
    setenv("WEAVE_LOG_FORMAT", "json", 1);
    EXPECT_EQ(log_config_from_env().format, LogFormat::JSON);
}
