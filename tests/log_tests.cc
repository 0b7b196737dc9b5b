#include <gtest/gtest.h>

#include <iostream>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include "core/log.h"

namespace {

struct CapturedRecord {
    bimview::core::LogLevel level;
    std::string category;
    std::string message;
};

// Installs a capturing sink for the lifetime of the fixture and restores the
// console sink and previous level afterwards.
class LogCaptureTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_previousLevel = bimview::core::logLevel();
        bimview::core::setLogSink([this](bimview::core::LogLevel level, std::string_view category, std::string_view message) {
            m_records.push_back(CapturedRecord{level, std::string(category), std::string(message)});
        });
    }

    void TearDown() override {
        bimview::core::setLogSink({});
        bimview::core::setLogLevel(m_previousLevel);
    }

    std::vector<CapturedRecord> m_records;
    bimview::core::LogLevel m_previousLevel = bimview::core::LogLevel::Info;
};

} // namespace

TEST(LogTest, ParseLogLevelAcceptsNamesAliasesAndDigits) {
    using bimview::core::LogLevel;
    using bimview::core::parseLogLevel;

    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("ERR"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("3"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST(LogTest, LevelNamesRoundTripThroughParser) {
    using bimview::core::LogLevel;
    for (const LogLevel level : {LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug, LogLevel::Trace}) {
        EXPECT_EQ(bimview::core::parseLogLevel(bimview::core::logLevelName(level)), level);
    }
}

TEST_F(LogCaptureTest, SinkReceivesCategoryAndMessage) {
    bimview::core::setLogLevel(bimview::core::LogLevel::Info);
    BIM_LOGW("render") << "frame " << 7 << " late\n";

    ASSERT_EQ(m_records.size(), 1u);
    EXPECT_EQ(m_records[0].level, bimview::core::LogLevel::Warn);
    EXPECT_EQ(m_records[0].category, "render");
    EXPECT_EQ(m_records[0].message, "frame 7 late");
}

TEST_F(LogCaptureTest, RecordsAboveTheLevelAreDropped) {
    bimview::core::setLogLevel(bimview::core::LogLevel::Warn);
    BIM_LOGI("geometry") << "not shown";
    BIM_LOGD("geometry") << "not shown either";
    BIM_LOGE("geometry") << "shown";

    ASSERT_EQ(m_records.size(), 1u);
    EXPECT_EQ(m_records[0].message, "shown");
    EXPECT_TRUE(bimview::core::shouldLog(bimview::core::LogLevel::Error));
    EXPECT_FALSE(bimview::core::shouldLog(bimview::core::LogLevel::Info));
}

TEST_F(LogCaptureTest, DisabledLevelsDoNotEvaluateTheStream) {
    bimview::core::setLogLevel(bimview::core::LogLevel::Error);
    int evaluations = 0;
    const auto count = [&evaluations]() {
        ++evaluations;
        return evaluations;
    };
    BIM_LOGT("frame") << count();
    EXPECT_EQ(evaluations, 0);
    EXPECT_TRUE(m_records.empty());
}

TEST(LogTest, ConsoleLinesStartWithLocalTimestamp) {
    const bimview::core::LogLevel previousLevel = bimview::core::logLevel();
    bimview::core::setLogLevel(bimview::core::LogLevel::Info);
    bimview::core::setLogSink({});

    std::ostringstream captured;
    std::streambuf* previous = std::cerr.rdbuf(captured.rdbuf());
    BIM_LOGW("render") << "late";
    std::cerr.rdbuf(previous);
    bimview::core::setLogLevel(previousLevel);

    const std::regex line(R"(\[\d{2}:\d{2}:\d{2}\.\d{3}\]\[render\]\[warn\] late\n)");
    EXPECT_TRUE(std::regex_match(captured.str(), line)) << captured.str();
}
