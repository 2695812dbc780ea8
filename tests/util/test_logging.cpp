// PROPSHARE - Logging Tests
// Copyright (c) 2024 PROPSHARE Developers
// MIT License

#include <gtest/gtest.h>

#include "propshare/util/logging.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace propshare {
namespace util {
namespace test {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> CaptureSink(LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { captured_.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }

    std::vector<LogEntry> captured_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("verbose"), LogLevel::Info);
}

TEST_F(LoggingTest, Singleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, AddRemoveSink) {
    auto sink = CaptureSink();
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);

    Logger::Instance().RemoveSink(sink);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Info, LogCategory::LEDGER));
    EXPECT_TRUE(Logger::Instance().WillLog(LogLevel::Error, LogCategory::LEDGER));
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Off, LogCategory::LEDGER));

    CaptureSink();
    LOG_INFO(LogCategory::LEDGER) << "dropped";
    LOG_WARN(LogCategory::LEDGER) << "kept";
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "kept");
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger::Instance().EnableCategory(LogCategory::MARKET);
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::MARKET));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::INCOME));

    CaptureSink();
    LOG_INFO(LogCategory::INCOME) << "income";
    LOG_INFO(LogCategory::MARKET) << "market";
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].category, LogCategory::MARKET);

    Logger::Instance().EnableAllCategories();
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::INCOME));
}

TEST_F(LoggingTest, CallbackSinkCapturesMacroOutput) {
    CaptureSink();
    LOG_INFO(LogCategory::GOVERNANCE) << "proposal " << 7 << " executed";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::Info);
    EXPECT_EQ(captured_[0].category, LogCategory::GOVERNANCE);
    EXPECT_EQ(captured_[0].message, "proposal 7 executed");
    EXPECT_EQ(GetBasename(captured_[0].file), "test_logging.cpp");
    EXPECT_GT(captured_[0].line, 0);
}

TEST_F(LoggingTest, SinkLevelFiltering) {
    CaptureSink(LogLevel::Error);
    LOG_WARN(LogCategory::AUDIT) << "below sink level";
    LOG_ERROR(LogCategory::AUDIT) << "at sink level";
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "at sink level");
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    char filename[] = "/tmp/propshare_log_test_XXXXXX";
    int fd = mkstemp(filename);
    ASSERT_GE(fd, 0);
    close(fd);

    {
        auto sink = std::make_shared<FileSink>(filename, LogLevel::Info);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);
        LOG_INFO(LogCategory::REGISTRY) << "registered property 1";
        Logger::Instance().Flush();
        Logger::Instance().ClearSinks();
    }

    std::ifstream file(filename);
    std::stringstream content;
    content << file.rdbuf();
    std::string text = content.str();

    EXPECT_NE(text.find("registered property 1"), std::string::npos);
    EXPECT_NE(text.find("[registry]"), std::string::npos);
    EXPECT_NE(text.find("INFO"), std::string::npos);

    std::remove(filename);
}

TEST_F(LoggingTest, InitializeAddsConsoleSinkOnce) {
    Logger::Instance().Initialize();
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    Logger::Instance().Initialize();
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
}

TEST_F(LoggingTest, InitializeKeepsExistingSinks) {
    CaptureSink();
    Logger::Instance().Initialize();
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
}

TEST_F(LoggingTest, GetBasename) {
    EXPECT_EQ(GetBasename("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(GetBasename("c.cpp"), "c.cpp");
}

} // namespace test
} // namespace util
} // namespace propshare
