#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "cuedisplay/Logging.h"

using namespace cuedisplay;

namespace {
    // Restores the process-wide logger after each test
    class LoggingTest : public ::testing::Test {
       protected:
        void SetUp() override {
            previousLevel_ = getLogLevel();
            clearLogHistory();
        }

        void TearDown() override {
            setLogSink(nullptr);
            setLogFile(std::string());
            setLogLevel(previousLevel_);
            clearLogHistory();
        }

       private:
        LogLevel previousLevel_ = LogLevel::Info;
    };
}  // namespace

TEST_F(LoggingTest, LevelFiltering) {
    setLogLevel(LogLevel::Info);

    EXPECT_TRUE(isLogEnabled(LogLevel::Error));
    EXPECT_TRUE(isLogEnabled(LogLevel::Warning));
    EXPECT_TRUE(isLogEnabled(LogLevel::Info));
    EXPECT_FALSE(isLogEnabled(LogLevel::Debug));

    setLogLevel(LogLevel::Error);
    EXPECT_TRUE(isLogEnabled(LogLevel::Warning));
    EXPECT_FALSE(isLogEnabled(LogLevel::Info));
}

TEST_F(LoggingTest, SinkReceivesFormattedLines) {
    setLogLevel(LogLevel::Info);

    std::vector<std::string> lines;
    std::vector<LogLevel> levels;
    setLogSink([&](LogLevel level, const std::string &line) {
        levels.push_back(level);
        lines.push_back(line);
    });

    LogInfo("listener started");
    LogDebug("not shown");
    LogWarning("port busy");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(levels[0], LogLevel::Info);
    EXPECT_NE(lines[0].find("[INFO] listener started"), std::string::npos);
    EXPECT_EQ(lines[0].front(), '[');
    EXPECT_EQ(levels[1], LogLevel::Warning);
    EXPECT_NE(lines[1].find("[WARNING] port busy"), std::string::npos);
}

TEST_F(LoggingTest, RecentMessagesOldestFirst) {
    setLogLevel(LogLevel::Debug);

    LogDebug("one");
    LogDebug("two");
    LogDebug("three");

    auto recent = recentLogMessages(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_NE(recent[0].find("two"), std::string::npos);
    EXPECT_NE(recent[1].find("three"), std::string::npos);

    EXPECT_EQ(recentLogMessages(100).size(), 3u);
}

TEST_F(LoggingTest, HistoryIsBounded) {
    setLogLevel(LogLevel::Debug);
    for (int i = 0; i < 1000; ++i) {
        LogDebug("line " + std::to_string(i));
    }

    auto recent = recentLogMessages(10000);
    EXPECT_LT(recent.size(), 1000u);
    EXPECT_NE(recent.back().find("line 999"), std::string::npos);
}

TEST_F(LoggingTest, WritesToFile) {
    auto path = std::filesystem::temp_directory_path() / "cuedisplay_logging_test.log";
    std::filesystem::remove(path);

    ASSERT_TRUE(setLogFile(path.string()));
    LogError("socket closed");
    ASSERT_TRUE(setLogFile(std::string()));

    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("[ERROR] socket closed"), std::string::npos);

    file.close();
    std::filesystem::remove(path);
}

TEST(Logging, ParseLevelNames) {
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_FALSE(parseLogLevel("trace"));

    EXPECT_STREQ(logLevelName(LogLevel::Debug), "DEBUG");
}
