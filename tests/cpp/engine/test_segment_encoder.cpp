/**
 * @file test_segment_encoder.cpp
 * @brief Unit tests for the per-segment fallback ladder (fake backends)
 */

#include "engine/segment_encoder.h"
#include "test_support.h"

#include <gtest/gtest.h>
#include <memory>

using namespace audio_segmenter;
using audio_segmenter::test::FakeBackend;

namespace fs = std::filesystem;

class SegmentEncoderTest : public audio_segmenter::test::TempDirTest {
   protected:
    SourceAudio source;
    SegmentRange range{2, 20000, 30000};

    void SetUp() override {
        TempDirTest::SetUp();
        source.path = "/uploads/My Talk (final).mp3";
        source.totalDurationMs = 60000;
        source.sizeBytes = 960000;
    }

    size_t countFiles() const {
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(tempDir)) {
            (void)entry;
            ++count;
        }
        return count;
    }
};

// ============================================================
// Naming
// ============================================================

TEST(SegmentNaming, SanitizeBaseName) {
    EXPECT_EQ(sanitizeBaseName("/uploads/My Talk (final).mp3"), "My_Talk__final_");
    EXPECT_EQ(sanitizeBaseName("lecture-01.v2.wav"), "lecture-01.v2");
    EXPECT_EQ(sanitizeBaseName("/tmp/.mp3"), ".mp3");
    EXPECT_EQ(sanitizeBaseName(""), "audio");
    EXPECT_EQ(sanitizeBaseName("/tmp/dir/"), "audio");
}

TEST(SegmentNaming, FormatSegmentFileName) {
    EXPECT_EQ(formatSegmentFileName("talk", 1, "mp3"), "talk_part01.mp3");
    EXPECT_EQ(formatSegmentFileName("talk", 12, "wav"), "talk_part12.wav");
    EXPECT_EQ(formatSegmentFileName("talk", 123, "mp3"), "talk_part123.mp3");
}

// ============================================================
// Ladder walking
// ============================================================

TEST_F(SegmentEncoderTest, FirstRungSucceeds) {
    auto ffmpeg = std::make_shared<FakeBackend>(EncoderKind::Ffmpeg);
    SegmentEncoder encoder(SegmenterConfig::EncoderConfig{}, {ffmpeg});

    auto result = encoder.encode(source, range, tempDir);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.segment->fileName, "My_Talk__final__part03.mp3");
    EXPECT_EQ(result.segment->strategyIndex, 0);
    EXPECT_EQ(result.segment->strategyName, "mp3_standard");
    EXPECT_EQ(result.segment->format, "mp3");
    EXPECT_EQ(result.segment->sizeBytes, 7u);
    EXPECT_EQ(result.segment->range, range);
    EXPECT_TRUE(fs::exists(tempDir / "My_Talk__final__part03.mp3"));
    EXPECT_TRUE(result.causes.empty());
    EXPECT_EQ(countFiles(), 1u);
}

TEST_F(SegmentEncoderTest, WritesThroughPartialFile) {
    auto ffmpeg = std::make_shared<FakeBackend>(EncoderKind::Ffmpeg);
    SegmentEncoder encoder(SegmenterConfig::EncoderConfig{}, {ffmpeg});

    ASSERT_TRUE(encoder.encode(source, range, tempDir).ok());

    ASSERT_EQ(ffmpeg->outputPaths().size(), 1u);
    EXPECT_EQ(ffmpeg->outputPaths()[0],
              (tempDir / "My_Talk__final__part03.mp3.partial").string());
    EXPECT_FALSE(fs::exists(tempDir / "My_Talk__final__part03.mp3.partial"));
}

TEST_F(SegmentEncoderTest, CompressedFailuresFallBackToWav) {
    auto ffmpeg = std::make_shared<FakeBackend>(
        EncoderKind::Ffmpeg, [](const SegmentRange&, const EncodeStrategy& strategy,
                                const std::string& out, const AttemptControl&) {
            if (strategy.format == OutputFormat::Mp3) {
                // Leave garbage behind to check cleanup
                FakeBackend::writeOutput(out, "half");
                return FakeBackend::failWith(AttemptStatus::Failed, "Unknown encoder");
            }
            return FakeBackend::writeOutput(out);
        });
    SegmentEncoder encoder(SegmenterConfig::EncoderConfig{}, {ffmpeg});

    auto result = encoder.encode(source, range, tempDir);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.segment->format, "wav");
    EXPECT_EQ(result.segment->fileName, "My_Talk__final__part03.wav");
    EXPECT_EQ(result.segment->strategyName, "wav_pcm");
    EXPECT_EQ(result.segment->strategyIndex, 2);
    ASSERT_EQ(result.causes.size(), 2u);
    EXPECT_EQ(result.causes[0].strategy, "mp3_standard");
    EXPECT_EQ(result.causes[0].reason, "Unknown encoder");
    EXPECT_EQ(result.causes[1].strategy, "mp3_basic");
    // Only the final WAV remains
    EXPECT_EQ(countFiles(), 1u);
}

TEST_F(SegmentEncoderTest, NativeRungUsedWhenFfmpegFailsEverywhere) {
    auto ffmpeg = std::make_shared<FakeBackend>(
        EncoderKind::Ffmpeg, [](const SegmentRange&, const EncodeStrategy&, const std::string&,
                                const AttemptControl&) {
            return FakeBackend::failWith(AttemptStatus::Failed, "spawn failed");
        });
    auto native = std::make_shared<FakeBackend>(EncoderKind::Native);
    SegmentEncoder encoder(SegmenterConfig::EncoderConfig{}, {ffmpeg, native});

    auto result = encoder.encode(source, range, tempDir);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.segment->strategyName, "wav_native");
    EXPECT_EQ(ffmpeg->attempts().size(), 3u);
    EXPECT_EQ(native->attempts().size(), 1u);
}

TEST_F(SegmentEncoderTest, AllRungsFail) {
    auto ffmpeg = std::make_shared<FakeBackend>(
        EncoderKind::Ffmpeg, [](const SegmentRange&, const EncodeStrategy&, const std::string& out,
                                const AttemptControl&) {
            FakeBackend::writeOutput(out, "junk");
            return FakeBackend::failWith(AttemptStatus::Failed, "boom");
        });
    SegmentEncoder encoder(SegmenterConfig::EncoderConfig{}, {ffmpeg});

    auto result = encoder.encode(source, range, tempDir);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status, EncodeStatus::AllStrategiesFailed);
    EXPECT_EQ(toErrorCode(result.status), ErrorCode::ENCODE_ALL_STRATEGIES_FAILED);
    // Three ffmpeg rungs plus the native rung with no backend
    ASSERT_EQ(result.causes.size(), 4u);
    EXPECT_EQ(result.causes[3].code, ErrorCode::ENCODE_BACKEND_UNAVAILABLE);
    EXPECT_EQ(countFiles(), 0u);
}

TEST_F(SegmentEncoderTest, EmptyOutputCountsAsFailure) {
    auto ffmpeg = std::make_shared<FakeBackend>(
        EncoderKind::Ffmpeg, [](const SegmentRange&, const EncodeStrategy& strategy,
                                const std::string& out, const AttemptControl&) {
            return FakeBackend::writeOutput(out, strategy.name == "mp3_standard" ? "" : "data");
        });
    SegmentEncoder encoder(SegmenterConfig::EncoderConfig{}, {ffmpeg});

    auto result = encoder.encode(source, range, tempDir);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.segment->strategyName, "mp3_basic");
    ASSERT_EQ(result.causes.size(), 1u);
    EXPECT_EQ(result.causes[0].code, ErrorCode::ENCODE_OUTPUT_EMPTY);
}

TEST_F(SegmentEncoderTest, TimeoutStopsLadder) {
    auto ffmpeg = std::make_shared<FakeBackend>(
        EncoderKind::Ffmpeg, [](const SegmentRange&, const EncodeStrategy&, const std::string& out,
                                const AttemptControl&) {
            FakeBackend::writeOutput(out, "partial");
            return FakeBackend::failWith(AttemptStatus::TimedOut, "killed");
        });
    SegmentEncoder encoder(SegmenterConfig::EncoderConfig{}, {ffmpeg});

    auto result = encoder.encode(source, range, tempDir);

    EXPECT_EQ(result.status, EncodeStatus::TimedOut);
    EXPECT_EQ(ffmpeg->attempts().size(), 1u);
    ASSERT_EQ(result.causes.size(), 1u);
    EXPECT_EQ(result.causes[0].code, ErrorCode::ENCODE_TIMEOUT);
    EXPECT_EQ(countFiles(), 0u);
}

TEST_F(SegmentEncoderTest, AttemptReceivesRemainingBudget) {
    SegmenterConfig::EncoderConfig config;
    config.segmentTimeoutMs = 60000;
    int observed = -1;
    auto ffmpeg = std::make_shared<FakeBackend>(
        EncoderKind::Ffmpeg, [&observed](const SegmentRange&, const EncodeStrategy&,
                                         const std::string& out, const AttemptControl& control) {
            observed = control.timeoutMs;
            return FakeBackend::writeOutput(out);
        });
    SegmentEncoder encoder(config, {ffmpeg});

    ASSERT_TRUE(encoder.encode(source, range, tempDir).ok());
    EXPECT_GT(observed, 0);
    EXPECT_LE(observed, 60000);
}

TEST_F(SegmentEncoderTest, CancelledBeforeStart) {
    auto ffmpeg = std::make_shared<FakeBackend>(EncoderKind::Ffmpeg);
    SegmentEncoder encoder(SegmenterConfig::EncoderConfig{}, {ffmpeg});
    std::atomic<bool> cancel{true};

    auto result = encoder.encode(source, range, tempDir, &cancel);

    EXPECT_EQ(result.status, EncodeStatus::Cancelled);
    EXPECT_TRUE(ffmpeg->attempts().empty());
    EXPECT_EQ(countFiles(), 0u);
}

TEST_F(SegmentEncoderTest, CancelledDuringAttempt) {
    auto ffmpeg = std::make_shared<FakeBackend>(
        EncoderKind::Ffmpeg, [](const SegmentRange&, const EncodeStrategy&, const std::string& out,
                                const AttemptControl&) {
            FakeBackend::writeOutput(out, "partial");
            return FakeBackend::failWith(AttemptStatus::Cancelled, "cancelled");
        });
    SegmentEncoder encoder(SegmenterConfig::EncoderConfig{}, {ffmpeg});

    auto result = encoder.encode(source, range, tempDir);

    EXPECT_EQ(result.status, EncodeStatus::Cancelled);
    EXPECT_EQ(ffmpeg->attempts().size(), 1u);
    EXPECT_EQ(countFiles(), 0u);
}
