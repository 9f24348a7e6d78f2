//! # Logger Unit Tests
//!
//! LogFilter parsing, record formatting, CLI option parsing, level filtering
//! through the singleton, and concurrent logging.

#include "log/log.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace devkit::log;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("discovery=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "discovery"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "discovery"));

    EXPECT_TRUE(filter.should_log(LogLevel::Info, "exec"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "exec"));
}

TEST_F(LogFilterTest, BareModuleEnablesTrace) {
    filter.parse("graph");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "graph"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "config"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("exec=off,*=trace");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "exec"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "config"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("exec=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextContainsLevelModuleAndMessage) {
    LogRecord record{LogLevel::Warn, "config", "bad pattern", __FILE__, __LINE__, 0};
    auto text = format_text(record);

    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("[config] bad pattern"), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesMessage) {
    LogRecord record{LogLevel::Error, "exec", "say \"hi\"\n", __FILE__, __LINE__, 42};
    auto json = format_json(record);

    EXPECT_EQ(json, R"({"ts":42,"level":"ERROR","module":"exec","msg":"say \"hi\"\n"})");
}

// ============================================================================
// CLI Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("DEVKIT_LOG");
    }

    LogConfig parse(std::vector<std::string> args) {
        args.insert(args.begin(), "devkit");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultIsWarn) {
    auto config = parse({"list"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
}

TEST_F(LogOptionsTest, QuietWins) {
    EXPECT_EQ(parse({"-q", "-vv"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitOptions) {
    auto config = parse({"--log-level=debug", "--log-filter=exec=trace",
                         "--log-file=/tmp/devkit.log", "--log-format=json"});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "exec=trace");
    EXPECT_EQ(config.log_file, "/tmp/devkit.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("DEVKIT_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);

    setenv("DEVKIT_LOG", "graph=trace,*=warn", 1);
    EXPECT_EQ(parse({}).filter_spec, "graph=trace,*=warn");

    // CLI level takes precedence over the environment
    EXPECT_EQ(parse({"-v"}).filter_spec, "");
    unsetenv("DEVKIT_LOG");
}

TEST(LogOptionTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_FALSE(is_log_option("-p"));
    EXPECT_FALSE(is_log_option("--parallel"));
    EXPECT_FALSE(is_log_option("-"));
}

// ============================================================================
// Logger Singleton
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<CaptureSink::Buffer> records;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Info;
        Logger::init(config);
        auto sink = std::make_unique<CaptureSink>();
        records = sink->buffer();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        Logger::init(LogConfig{});
    }
};

TEST_F(LoggerTest, MacroRespectsLevel) {
    DEVKIT_LOG_DEBUG("exec", "hidden");
    DEVKIT_LOG_INFO("exec", "shown " << 3);

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].module, "exec");
    EXPECT_EQ((*records)[0].message, "shown 3");
    EXPECT_EQ((*records)[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, FilterOverridesModule) {
    Logger::instance().set_filter("graph=trace,*=error");

    DEVKIT_LOG_TRACE("graph", "visiting");
    DEVKIT_LOG_WARN("config", "dropped");

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].message, "visiting");
}

TEST_F(LoggerTest, ConcurrentLogging) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([] {
            for (int i = 0; i < 50; ++i) {
                DEVKIT_LOG_INFO("exec", "message " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(records->size(), 200u);
}
