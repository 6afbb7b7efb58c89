// BALLOT - Logging Tests
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include <gtest/gtest.h>

#include "ballot/util/logging.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace ballot {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Trace);

        sink_ = std::make_shared<CallbackSink>([this](const LogEntry& entry) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(entry);
        });
        logger.AddSink(sink_);
    }

    void TearDown() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
    }

    std::vector<LogEntry> Entries() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
    std::mutex mutex_;
};

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, NamesRoundTrip) {
    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                           LogLevel::Warn, LogLevel::Error, LogLevel::Fatal,
                           LogLevel::Off}) {
        auto parsed = LogLevelFromString(LogLevelToString(level));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, level);
    }
}

TEST(LogLevelTest, AcceptsAliasesAndCase) {
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("Debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_FALSE(LogLevelFromString("loud").has_value());
}

// ============================================================================
// Logger
// ============================================================================

TEST_F(LoggingTest, StreamMacroDeliversEntry) {
    LOG_INFO(LogCategory::TALLY) << "voted " << 3;

    auto entries = Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].category, "tally");
    EXPECT_EQ(entries[0].message, "voted 3");
    EXPECT_GT(entries[0].line, 0);
}

TEST_F(LoggingTest, PrintfMacroDeliversEntry) {
    LogWarnF(LogCategory::DB, "write failed: %s (%d)", "disk", 5);

    auto entries = Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Warn);
    EXPECT_EQ(entries[0].message, "write failed: disk (5)");
}

TEST_F(LoggingTest, LevelFiltersMessages) {
    Logger::Instance().SetLevel(LogLevel::Warn);

    LOG_DEBUG(LogCategory::BALLOT) << "hidden";
    LOG_INFO(LogCategory::BALLOT) << "hidden";
    LOG_ERROR(LogCategory::BALLOT) << "shown";

    auto entries = Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "shown");
}

TEST_F(LoggingTest, StreamArgumentsNotEvaluatedWhenFiltered) {
    Logger::Instance().SetLevel(LogLevel::Error);

    int calls = 0;
    auto expensive = [&calls]() { return ++calls; };
    LOG_DEBUG(LogCategory::BALLOT) << expensive();

    EXPECT_EQ(calls, 0);
}

TEST_F(LoggingTest, CategoriesGateDebugOnly) {
    Logger& logger = Logger::Instance();
    logger.DisableCategory(LogCategory::DB);
    logger.EnableCategory(LogCategory::TALLY);

    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::DB));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::TALLY));

    LOG_DEBUG(LogCategory::DB) << "db debug";
    LOG_DEBUG(LogCategory::TALLY) << "tally debug";
    LOG_ERROR(LogCategory::DB) << "db error";

    auto entries = Entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "tally debug");
    EXPECT_EQ(entries[1].message, "db error");
}

TEST_F(LoggingTest, ConfigureSelectsCategories) {
    LogOptions options;
    options.level = LogLevel::Debug;
    options.categories = {"ledger"};
    options.printToConsole = false;
    Logger::Instance().Configure(options);

    // Configure replaced the sinks
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::LEDGER));
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::DEFAULT));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::TALLY));

    options.categories = {"all"};
    Logger::Instance().Configure(options);
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::TALLY));
}

TEST_F(LoggingTest, OffIsNeverLogged) {
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Off, LogCategory::BALLOT));
}

TEST_F(LoggingTest, RemoveSinkStopsDelivery) {
    Logger::Instance().RemoveSink(sink_);
    LOG_ERROR(LogCategory::BALLOT) << "nobody listens";
    EXPECT_TRUE(Entries().empty());
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, FieldsInOrder) {
    LogEntry entry;
    entry.level = LogLevel::Error;
    entry.category = "tally";
    entry.message = "boom";
    entry.file = "/src/voting/tally.cpp";
    entry.line = 42;

    LogFormat format{false, true, true, false, true};
    EXPECT_EQ(FormatLogEntry(entry, format), "[ERROR] [tally] tally.cpp:42 boom");
}

TEST(LogFormatTest, DefaultCategoryIsNotPrinted) {
    LogEntry entry;
    entry.level = LogLevel::Info;
    entry.category = LogCategory::DEFAULT;
    entry.message = "plain";

    LogFormat format{false, true, true, false, false};
    EXPECT_EQ(FormatLogEntry(entry, format), "[INFO ] plain");
}

TEST(LogFormatTest, Basename) {
    EXPECT_EQ(GetBasename("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(GetBasename("c.cpp"), "c.cpp");
}

// ============================================================================
// File Sink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        dir_ = std::filesystem::temp_directory_path() /
               ("ballot_log_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static LogEntry Entry(const std::string& message) {
        LogEntry entry;
        entry.level = LogLevel::Info;
        entry.category = "ballot";
        entry.message = message;
        return entry;
    }

    std::filesystem::path dir_;
};

TEST_F(FileSinkTest, WritesLines) {
    FileSink::Config cfg;
    cfg.path = (dir_ / "ballot.log").string();
    cfg.format = LogFormat{false, false, false, false, false};

    {
        FileSink sink(cfg);
        ASSERT_TRUE(sink.IsOpen());
        sink.Write(Entry("first"));
        sink.Write(Entry("second"));
        EXPECT_EQ(sink.GetCurrentSize(), std::string("first\nsecond\n").size());
    }

    std::ifstream in(cfg.path);
    std::string a, b;
    std::getline(in, a);
    std::getline(in, b);
    EXPECT_EQ(a, "first");
    EXPECT_EQ(b, "second");
}

TEST_F(FileSinkTest, RotatesWhenFull) {
    FileSink::Config cfg;
    cfg.path = (dir_ / "ballot.log").string();
    cfg.format = LogFormat{false, false, false, false, false};
    cfg.maxSize = 8;
    cfg.maxFiles = 2;

    FileSink sink(cfg);
    sink.Write(Entry("0123456789"));
    sink.Write(Entry("next"));
    sink.Flush();

    EXPECT_TRUE(std::filesystem::exists(cfg.path + ".1"));
    EXPECT_EQ(sink.GetCurrentSize(), std::string("next\n").size());
}

TEST_F(FileSinkTest, UnwritablePathIsNotOpen) {
    FileSink::Config cfg;
    cfg.path = (dir_ / "missing" / "ballot.log").string();
    FileSink sink(cfg);
    EXPECT_FALSE(sink.IsOpen());
}

} // namespace test
} // namespace util
} // namespace ballot
