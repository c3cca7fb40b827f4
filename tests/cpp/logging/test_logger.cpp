#include "logging/logger.h"

#include "test_support.h"

#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace audio_segmenter;
using namespace audio_segmenter::logging;

TEST(Logging, ParsesLevelNames) {
    EXPECT_EQ(parseLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("ERROR"), LogLevel::Error);
    EXPECT_EQ(parseLevel("fatal"), LogLevel::Critical);
    EXPECT_EQ(parseLevel("none"), LogLevel::Off);
    EXPECT_EQ(parseLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("unknown"), LogLevel::Info);
}

TEST(Logging, LevelNamesRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parseLevel(levelName(level)), level);
    }
}

TEST(Logging, LoggerIsAvailableBeforeInitialization) {
    ASSERT_NE(logger(), nullptr);
}

// ============================================================
// Config-driven setup, observed through the log file
// ============================================================

class LoggingConfigTest : public test::TempDirTest {
   protected:
    void TearDown() override {
        // Back to stderr only before the log directory goes away
        initializeEarly();
        test::TempDirTest::TearDown();
    }

    std::filesystem::path configWithLogFile(const std::string& level) {
        logPath = tempDir / "segmenter.log";
        return writeFile("config.json", R"({"logging": {"level": ")" + level +
                                             R"(", "consoleOutput": false, "filePath": ")" +
                                             logPath.string() + R"("}})");
    }

    std::string logText() {
        flush();
        std::ifstream file(logPath);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path logPath;
};

TEST_F(LoggingConfigTest, FileSinkHonorsConfiguredLevel) {
    ASSERT_TRUE(initializeFromConfig(configWithLogFile("warn").string()));

    LOG_INFO("range {} planned", 1);
    LOG_WARN("range {} fell back to wav", 2);

    const std::string text = logText();
    EXPECT_EQ(text.find("range 1 planned"), std::string::npos);
    EXPECT_NE(text.find("range 2 fell back to wav"), std::string::npos);
}

TEST_F(LoggingConfigTest, SetLevelReachesFileSink) {
    ASSERT_TRUE(initializeFromConfig(configWithLogFile("error").string()));

    LOG_DEBUG("hidden {}", 1);
    setLevel(LogLevel::Debug);
    LOG_DEBUG("visible {}", 2);

    const std::string text = logText();
    EXPECT_EQ(text.find("hidden 1"), std::string::npos);
    EXPECT_NE(text.find("visible 2"), std::string::npos);
}

TEST_F(LoggingConfigTest, MissingFileFallsBackToStderr) {
    EXPECT_TRUE(initializeFromConfig((tempDir / "absent.json").string()));
    LOG_INFO("still logging");
}

TEST_F(LoggingConfigTest, MalformedConfigFallsBackToStderr) {
    auto path = writeFile("config.json", "{ not json");
    EXPECT_TRUE(initializeFromConfig(path.string()));
}

TEST_F(LoggingConfigTest, UnwritableLogFileIsReported) {
    // A regular file cannot act as the log directory
    const auto blocker = writeFile("plain", "x");
    auto path = writeFile("config.json", R"({"logging": {"filePath": ")" +
                                             (blocker / "a.log").string() + R"("}})");
    EXPECT_FALSE(initializeFromConfig(path.string()));
    LOG_INFO("previous logger still usable");
}
