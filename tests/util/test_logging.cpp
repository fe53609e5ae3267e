// AGORA - Logging Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>

#include "agora/util/logging.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace agora {
namespace util {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }
};

TEST_F(LoggingTest, LogLevelNames) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST_F(LoggingTest, AddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LevelGate) {
    auto& logger = Logger::Instance();
    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::GOV));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::GOV));

    logger.SetLevel(LogLevel::Off);
    EXPECT_FALSE(logger.WillLog(LogLevel::Error, LogCategory::GOV));
}

TEST_F(LoggingTest, CategoryFiltering) {
    auto& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::STAKING);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::STAKING));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::GOV));

    logger.DisableCategory(LogCategory::STAKING);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::STAKING));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::GOV));
}

TEST_F(LoggingTest, MacrosReachCallbackSink) {
    std::vector<LogEntry> captured;
    Logger::Instance().AddSink(std::make_shared<CallbackSink>(
        [&captured](const LogEntry& entry) { captured.push_back(entry); },
        LogLevel::Trace));

    LOG_INFO(LogCategory::GOV) << "poll " << 1 << " passed";
    LOG_DEBUG(LogCategory::GOV) << "filtered by level";

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].message, "poll 1 passed");
    EXPECT_EQ(captured[0].category, LogCategory::GOV);
    EXPECT_EQ(captured[0].level, LogLevel::Info);
    EXPECT_EQ(GetBasename(captured[0].file), "test_logging.cpp");
}

TEST_F(LoggingTest, DisabledMacroDoesNotEvaluateArguments) {
    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };

    LOG_TRACE(LogCategory::GOV) << count();
    EXPECT_EQ(evaluated, 0);

    LOG_WARN(LogCategory::GOV) << count();
    EXPECT_EQ(evaluated, 1);
}

TEST_F(LoggingTest, FileSinkAppends) {
    auto path = std::filesystem::temp_directory_path() / "agora_logging_test.log";
    std::filesystem::remove(path);

    auto sink = std::make_shared<FileSink>(LogLevel::Info);
    ASSERT_TRUE(sink->Open(path.string()));
    EXPECT_TRUE(sink->IsOpen());
    Logger::Instance().AddSink(sink);

    LOG_ERROR(LogCategory::DB) << "batch write failed";
    Logger::Instance().Flush();
    sink->Close();

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("[ERROR]"), std::string::npos);
    EXPECT_NE(line.find("[db]"), std::string::npos);
    EXPECT_NE(line.find("batch write failed"), std::string::npos);

    std::filesystem::remove(path);
}

TEST_F(LoggingTest, Basename) {
    EXPECT_EQ(GetBasename("/a/b/engine.cpp"), "engine.cpp");
    EXPECT_EQ(GetBasename("engine.cpp"), "engine.cpp");
}

} // namespace
} // namespace util
} // namespace agora
