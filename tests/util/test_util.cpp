// VALSET - Util Module Tests
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <gtest/gtest.h>

#include <valset/util/logging.h>
#include <valset/util/time.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace valset {
namespace util {
namespace test {

// ============================================================================
// Logging
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Trace);
        Logger::Instance().EnableAllCategories();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); }, LogLevel::Trace);
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, StreamMacroFormatsMessage) {
    LOG_INFO(LogCategory::VALIDATOR) << "weight " << 500 << " nonce " << 2;
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "weight 500 nonce 2");
    EXPECT_EQ(entries_[0].category, "validator");
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, EntriesCarryMockTime) {
    SetMockTime(1700000000);
    LOG_INFO(LogCategory::CHURN) << "window";
    DisableMockTime();
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].timestamp, FromUnixTime(1700000000));
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::STAKING) << "hidden";
    LOG_INFO(LogCategory::STAKING) << "hidden";
    LOG_WARN(LogCategory::STAKING) << "shown";
    LOG_ERROR(LogCategory::STAKING) << "shown";
    EXPECT_EQ(entries_.size(), 2u);

    Logger::Instance().SetLevel(LogLevel::Off);
    LOG_ERROR(LogCategory::STAKING) << "hidden";
    EXPECT_EQ(entries_.size(), 2u);
}

TEST_F(LoggingTest, SinkLevelFiltering) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::DB) << "below the sink level";
    EXPECT_TRUE(entries_.empty());
    LOG_ERROR(LogCategory::DB) << "kept";
    EXPECT_EQ(entries_.size(), 1u);
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger::Instance().DisableCategory(LogCategory::CHURN);
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Info, LogCategory::CHURN));
    EXPECT_TRUE(Logger::Instance().WillLog(LogLevel::Info, LogCategory::WARP));
    LOG_INFO(LogCategory::CHURN) << "hidden";
    LOG_INFO(LogCategory::WARP) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "warp");

    Logger::Instance().EnableAllCategories();
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::CHURN));
}

TEST_F(LoggingTest, DisabledStreamIsNotEvaluated) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };
    LOG_DEBUG(LogCategory::DEFAULT) << count();
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggingTest, SinkManagement) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    Logger::Instance().RemoveSink(sink_);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    LOG_ERROR(LogCategory::DEFAULT) << "nowhere";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    std::filesystem::path path =
        std::filesystem::temp_directory_path() / "valset_logging_test.log";
    std::filesystem::remove(path);
    {
        auto file = std::make_shared<FileSink>(path.string(), LogLevel::Info);
        ASSERT_TRUE(file->IsOpen());
        Logger::Instance().AddSink(file);
        LOG_INFO(LogCategory::CONFIG) << "written to file";
        Logger::Instance().Flush();
        Logger::Instance().RemoveSink(file);
    }
    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("written to file"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(LogLevelTest, Parsing) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

// ============================================================================
// Time
// ============================================================================

class MockTimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(MockTimeTest, SetAndAdvance) {
    SetMockTime(1700000000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1700000000);
    EXPECT_EQ(GetSystemTime(), FromUnixTime(1700000000));

    AdvanceMockTime(Seconds(3600));
    EXPECT_EQ(GetTime(), 1700003600);
    EXPECT_EQ(GetMockTime(), 1700003600);
}

TEST_F(MockTimeTest, DisableReturnsToWallClock) {
    SetMockTime(1000);
    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 1700000000);
}

} // namespace test
} // namespace util
} // namespace valset
