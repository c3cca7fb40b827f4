/**
 * @file test_config_loader.cpp
 * @brief Unit tests for config loader (JSON configuration)
 */

#include "core/config_loader.h"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace audio_segmenter;

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path testConfigPath;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "unknown_test";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("audio_segmenter_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
        testConfigPath = tempDir / "test_config.json";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }
};

// ============================================================
// loadSegmenterConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalse) {
    SegmenterConfig config;
    bool result = loadSegmenterConfig("/nonexistent/path/config.json", config, false);

    EXPECT_FALSE(result);
}

TEST_F(ConfigLoaderTest, LoadNonExistentFileUsesDefaults) {
    SegmenterConfig config;
    config.workers.maxWorkers = 99;
    loadSegmenterConfig("/nonexistent/path/config.json", config, false);

    EXPECT_EQ(config.limits.maxTargetSeconds, 3600);
    EXPECT_EQ(config.limits.maxTargetMegabytes, 100);
    EXPECT_EQ(config.limits.maxInputBytes, 200 * kBytesPerMegabyte);
    EXPECT_EQ(config.limits.allowedExtensions.size(), 7u);
    EXPECT_EQ(config.planner.minSegmentMs, 1000);
    EXPECT_EQ(config.planner.minSizeSegmentMs, 5000);
    EXPECT_EQ(config.planner.largeFileThresholdBytes, 30 * kBytesPerMegabyte);
    EXPECT_EQ(config.planner.largeFileSegmentCap, 6);
    EXPECT_DOUBLE_EQ(config.planner.sizeSafetyMargin, 0.9);
    EXPECT_EQ(config.planner.defaultBitrate, 128000);
    EXPECT_EQ(config.encoder.ffmpegPath, "ffmpeg");
    EXPECT_EQ(config.encoder.ffprobePath, "ffprobe");
    EXPECT_TRUE(config.encoder.nativePcmFallback);
    EXPECT_EQ(config.workers.maxWorkers, 0);
}

TEST_F(ConfigLoaderTest, LoadEmptyJsonReturnsTrue) {
    writeConfig("{}");

    SegmenterConfig config;
    bool result = loadSegmenterConfig(testConfigPath, config, false);

    EXPECT_TRUE(result);
}

TEST_F(ConfigLoaderTest, LoadFullConfig) {
    writeConfig(R"({
        "limits": {
            "maxTargetSeconds": 600,
            "maxTargetMegabytes": 25,
            "maxInputBytes": 1048576,
            "allowedExtensions": [".MP3", "wav"]
        },
        "planner": {
            "minSegmentMs": 2000,
            "minSizeSegmentMs": 8000,
            "largeFileThresholdBytes": 1000000,
            "largeFileSegmentCap": 4,
            "sizeSafetyMargin": 0.8,
            "defaultBitrate": 64000
        },
        "encoder": {
            "ffmpegPath": "/opt/ffmpeg/bin/ffmpeg",
            "ffprobePath": "/opt/ffmpeg/bin/ffprobe",
            "largeInputThresholdBytes": 2000000,
            "standardBitrateKbps": 192,
            "largeInputBitrateKbps": 48,
            "largeInputSampleRate": 22050,
            "nativePcmFallback": false,
            "segmentTimeoutMs": 60000,
            "probeTimeoutMs": 5000
        },
        "workers": {
            "maxWorkers": 3,
            "jobTimeoutMs": 900000
        }
    })");

    SegmenterConfig config;
    ASSERT_TRUE(loadSegmenterConfig(testConfigPath, config, false));

    EXPECT_EQ(config.limits.maxTargetSeconds, 600);
    EXPECT_EQ(config.limits.maxTargetMegabytes, 25);
    EXPECT_EQ(config.limits.maxInputBytes, 1048576u);
    EXPECT_EQ(config.limits.allowedExtensions, (std::vector<std::string>{"mp3", "wav"}));
    EXPECT_EQ(config.planner.minSegmentMs, 2000);
    EXPECT_EQ(config.planner.minSizeSegmentMs, 8000);
    EXPECT_EQ(config.planner.largeFileThresholdBytes, 1000000u);
    EXPECT_EQ(config.planner.largeFileSegmentCap, 4);
    EXPECT_DOUBLE_EQ(config.planner.sizeSafetyMargin, 0.8);
    EXPECT_EQ(config.planner.defaultBitrate, 64000);
    EXPECT_EQ(config.encoder.ffmpegPath, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(config.encoder.ffprobePath, "/opt/ffmpeg/bin/ffprobe");
    EXPECT_EQ(config.encoder.largeInputThresholdBytes, 2000000u);
    EXPECT_EQ(config.encoder.standardBitrateKbps, 192);
    EXPECT_EQ(config.encoder.largeInputBitrateKbps, 48);
    EXPECT_EQ(config.encoder.largeInputSampleRate, 22050);
    EXPECT_FALSE(config.encoder.nativePcmFallback);
    EXPECT_EQ(config.encoder.segmentTimeoutMs, 60000);
    EXPECT_EQ(config.encoder.probeTimeoutMs, 5000);
    EXPECT_EQ(config.workers.maxWorkers, 3);
    EXPECT_EQ(config.workers.jobTimeoutMs, 900000);
}

TEST_F(ConfigLoaderTest, PartialConfigKeepsOtherDefaults) {
    writeConfig(R"({"planner": {"largeFileSegmentCap": 10}})");

    SegmenterConfig config;
    ASSERT_TRUE(loadSegmenterConfig(testConfigPath, config, false));

    EXPECT_EQ(config.planner.largeFileSegmentCap, 10);
    EXPECT_EQ(config.planner.minSegmentMs, 1000);
    EXPECT_EQ(config.encoder.ffmpegPath, "ffmpeg");
}

TEST_F(ConfigLoaderTest, InvalidJsonReturnsFalseWithDefaults) {
    writeConfig("{ invalid json }");

    SegmenterConfig config;
    bool result = loadSegmenterConfig(testConfigPath, config, false);

    EXPECT_FALSE(result);
    EXPECT_EQ(config.planner.largeFileSegmentCap, 6);
}

TEST_F(ConfigLoaderTest, WrongTypeReturnsFalseWithDefaults) {
    writeConfig(R"({"limits": {"maxTargetSeconds": "lots"}})");

    SegmenterConfig config;
    bool result = loadSegmenterConfig(testConfigPath, config, false);

    EXPECT_FALSE(result);
    EXPECT_EQ(config.limits.maxTargetSeconds, 3600);
}

TEST_F(ConfigLoaderTest, LoggingSectionIsIgnoredBySegmenterConfig) {
    writeConfig(R"({"logging": {"level": "debug"}, "workers": {"maxWorkers": 2}})");

    SegmenterConfig config;
    ASSERT_TRUE(loadSegmenterConfig(testConfigPath, config, false));
    EXPECT_EQ(config.workers.maxWorkers, 2);
}

// ============================================================
// sanitizeSegmenterConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, OutOfRangeValuesAreCorrected) {
    writeConfig(R"({
        "limits": {"maxTargetSeconds": 0, "allowedExtensions": []},
        "planner": {"minSegmentMs": -1, "sizeSafetyMargin": 1.5, "largeFileSegmentCap": 0},
        "encoder": {"ffmpegPath": "", "largeInputSampleRate": 100, "segmentTimeoutMs": -3},
        "workers": {"maxWorkers": -2, "jobTimeoutMs": -1}
    })");

    SegmenterConfig config;
    ASSERT_TRUE(loadSegmenterConfig(testConfigPath, config, false));

    EXPECT_EQ(config.limits.maxTargetSeconds, 3600);
    EXPECT_EQ(config.limits.allowedExtensions.size(), 7u);
    EXPECT_EQ(config.planner.minSegmentMs, 1000);
    EXPECT_DOUBLE_EQ(config.planner.sizeSafetyMargin, 0.9);
    EXPECT_EQ(config.planner.largeFileSegmentCap, 6);
    EXPECT_EQ(config.encoder.ffmpegPath, "ffmpeg");
    EXPECT_EQ(config.encoder.largeInputSampleRate, 16000);
    EXPECT_EQ(config.encoder.segmentTimeoutMs, 300000);
    EXPECT_EQ(config.workers.maxWorkers, 0);
    EXPECT_EQ(config.workers.jobTimeoutMs, 0);
}

TEST(SanitizeSegmenterConfig, DefaultsNeedNoCorrection) {
    SegmenterConfig config;
    EXPECT_EQ(sanitizeSegmenterConfig(config, false), 0);
}

TEST(SanitizeSegmenterConfig, SizeFloorNeverBelowMinimumSegment) {
    SegmenterConfig config;
    config.planner.minSegmentMs = 7000;
    config.planner.minSizeSegmentMs = 5000;

    EXPECT_EQ(sanitizeSegmenterConfig(config, false), 1);
    EXPECT_EQ(config.planner.minSizeSegmentMs, 7000);
}
