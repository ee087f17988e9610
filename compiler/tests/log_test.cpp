//! # Logger Unit Tests
//!
//! LogFilter parsing, level filtering, FileSink I/O, CaptureSink, CLI option
//! parsing, and concurrent logging through the singleton.

#include "log/log.hpp"
#include "support/log_capture.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace kir::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("opt=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "opt"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "opt"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "opt"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "regalloc"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "regalloc"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // Bare module name enables Trace for it
    filter.parse("ssa");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "ssa"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "driver"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("verify=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "verify"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "opt"));
}

TEST_F(LogFilterTest, OnlyOneModuleShown) {
    filter.parse("regalloc=trace,*=off");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "regalloc"));
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "opt"));
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "backend"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("opt=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, MinLevelDefaultOnly) {
    filter.set_default_level(LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

TEST(LogLevelTest, AllHiddenAtOff) {
    LogFilter filter;
    filter.set_default_level(LogLevel::Off);

    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "any"));
    EXPECT_FALSE(filter.should_log(LogLevel::Error, "any"));
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "any"));
}

// ============================================================================
// Sinks
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "kir_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    auto read_file(const fs::path& path) -> std::string {
        std::ifstream f(path);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    static auto make_record(LogLevel level, const std::string& module, const std::string& message)
        -> LogRecord {
        return LogRecord{level, module, message, __FILE__, __LINE__, epoch_ms()};
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "driver", "file sink test"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[driver]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "opt", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "opt", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST(MultiSinkTest, FansOutToEveryChild) {
    auto first = std::make_unique<CaptureSink>();
    auto second = std::make_unique<CaptureSink>();
    auto first_records = first->records();
    auto second_records = second->records();

    MultiSink multi;
    multi.add(std::move(first));
    multi.add(std::move(second));
    multi.add(std::make_unique<NullSink>());
    EXPECT_EQ(multi.size(), 3u);

    multi.write(LogRecord{LogLevel::Warn, "ssa", "hello", __FILE__, __LINE__, 0});
    ASSERT_EQ(first_records->size(), 1u);
    ASSERT_EQ(second_records->size(), 1u);
    EXPECT_EQ((*first_records)[0].message, "hello");
}

// ============================================================================
// Logger Singleton
// ============================================================================

TEST(LoggerTest, MacroReachesCaptureSink) {
    kir::test::LogCapture capture(LogLevel::Debug);

    KIR_LOG_DEBUG("opt", "refused " << 3 << " candidates");
    KIR_LOG_TRACE("opt", "below the level");

    ASSERT_EQ(capture.records().size(), 1u);
    EXPECT_EQ(capture.records()[0].module, "opt");
    EXPECT_EQ(capture.records()[0].message, "refused 3 candidates");
    EXPECT_TRUE(capture.contains("opt", "refused"));
}

TEST(LoggerTest, FilterLimitsModules) {
    kir::test::LogCapture capture(LogLevel::Trace);
    Logger::instance().set_filter("regalloc=debug,*=off");

    KIR_LOG_DEBUG("regalloc", "kept");
    KIR_LOG_ERROR("opt", "dropped");

    ASSERT_EQ(capture.records().size(), 1u);
    EXPECT_EQ(capture.records()[0].message, "kept");
}

TEST(LoggerTest, ConcurrentLogging) {
    kir::test::LogCapture capture(LogLevel::Trace);
    auto& logger = Logger::instance();

    constexpr int num_threads = 8;
    constexpr int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "regalloc", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture.records().size()), num_threads * messages_per_thread);
}

// ============================================================================
// CLI Options
// ============================================================================

TEST(LogOptionsTest, ParsesLevelFilterAndFile) {
    char prog[] = "kirc";
    char level[] = "--log-level=debug";
    char filter[] = "--log-filter=opt=trace";
    char file[] = "--log-file=out.log";
    char* argv[] = {prog, level, filter, file};

    auto config = parse_log_options(4, argv);
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "opt=trace");
    EXPECT_EQ(config.log_file, "out.log");
}

TEST(LogOptionsTest, VerbosityFlags) {
    char prog[] = "kirc";
    char vv[] = "-vv";
    char* argv[] = {prog, vv};
    EXPECT_EQ(parse_log_options(2, argv).level, LogLevel::Debug);

    char q[] = "-q";
    char* quiet_argv[] = {prog, q};
    EXPECT_EQ(parse_log_options(2, quiet_argv).level, LogLevel::Error);
}
