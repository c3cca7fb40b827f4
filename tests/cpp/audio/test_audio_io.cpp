/**
 * @file test_audio_io.cpp
 * @brief Unit tests for libsndfile reader/writer and the native WAV encode backend
 */

#include "audio/audio_io.h"
#include "engine/encode_backend.h"
#include "test_support.h"

#include <gtest/gtest.h>
#include <vector>

using namespace audio_segmenter;

namespace fs = std::filesystem;

class AudioIOTest : public audio_segmenter::test::TempDirTest {
   protected:
    fs::path tone;

    void SetUp() override {
        TempDirTest::SetUp();
        tone = tempDir / "tone.wav";
        ASSERT_TRUE(audio_segmenter::test::writeSineWav(tone, 4000, 8000, 2));
    }

    SourceAudio toneSource() const {
        SourceAudio source;
        source.path = tone.string();
        source.totalDurationMs = 4000;
        source.sizeBytes = fs::file_size(tone);
        source.channels = 2;
        source.sampleRate = 8000;
        return source;
    }

    EncodeStrategy nativeStrategy(int channels) const {
        EncodeStrategy strategy;
        strategy.name = "wav_native";
        strategy.backend = EncoderKind::Native;
        strategy.format = OutputFormat::Wav;
        strategy.channels = channels;
        return strategy;
    }
};

// ============================================================
// Reader / writer
// ============================================================

TEST_F(AudioIOTest, ReaderReportsLayout) {
    AudioIO::SndfileReader reader;
    ASSERT_TRUE(reader.open(tone.string()));

    EXPECT_EQ(reader.getSampleRate(), 8000);
    EXPECT_EQ(reader.getChannels(), 2);
    EXPECT_EQ(reader.getFrames(), 32000);
    EXPECT_EQ(reader.getDurationMs(), 4000);
    EXPECT_EQ(reader.formatExtension(), "wav");
}

TEST_F(AudioIOTest, ReaderSeeksAndReads) {
    AudioIO::SndfileReader reader;
    ASSERT_TRUE(reader.open(tone.string()));
    ASSERT_TRUE(reader.seekFrame(31000));

    std::vector<float> buffer(4096 * 2);
    EXPECT_EQ(reader.readBlock(buffer.data(), 4096), 1000);
    EXPECT_EQ(reader.readBlock(buffer.data(), 4096), 0);
}

TEST_F(AudioIOTest, ReaderRejectsNonAudio) {
    const auto path = writeFile("text.wav", "definitely not RIFF");
    AudioIO::SndfileReader reader;

    EXPECT_FALSE(reader.open(path.string()));
    EXPECT_FALSE(reader.lastError().empty());
    EXPECT_EQ(reader.readBlock(nullptr, 10), -1);
}

TEST(AudioIOUtils, DownmixAveragesChannels) {
    const float stereo[] = {1.0f, 0.0f, 0.5f, 0.5f, -1.0f, 1.0f};
    float mono[3] = {};

    AudioIO::Utils::downmixToMono(stereo, mono, 3, 2);

    EXPECT_FLOAT_EQ(mono[0], 0.5f);
    EXPECT_FLOAT_EQ(mono[1], 0.5f);
    EXPECT_FLOAT_EQ(mono[2], 0.0f);
}

TEST(AudioIOUtils, MsToFrames) {
    EXPECT_EQ(AudioIO::Utils::msToFrames(1000, 44100), 44100);
    EXPECT_EQ(AudioIO::Utils::msToFrames(1500, 8000), 12000);
    EXPECT_EQ(AudioIO::Utils::msToFrames(-1, 8000), 0);
}

// ============================================================
// Native encode backend
// ============================================================

TEST_F(AudioIOTest, NativeBackendWritesRange) {
    auto backend = createSndfileEncodeBackend();
    const auto out = tempDir / "tone_part02.wav.partial";

    auto result = backend->encode(toneSource(), SegmentRange{1, 1000, 2500}, nativeStrategy(0),
                                  out.string(), AttemptControl{});

    ASSERT_EQ(result.status, AttemptStatus::Ok) << result.message;
    AudioIO::SndfileReader reader;
    ASSERT_TRUE(reader.open(out.string()));
    EXPECT_EQ(reader.getFrames(), 12000);
    EXPECT_EQ(reader.getChannels(), 2);
    EXPECT_EQ(reader.getSampleRate(), 8000);
}

TEST_F(AudioIOTest, NativeBackendDownmixes) {
    auto backend = createSndfileEncodeBackend();
    const auto out = tempDir / "mono.wav";

    auto result = backend->encode(toneSource(), SegmentRange{0, 0, 4000}, nativeStrategy(1),
                                  out.string(), AttemptControl{});

    ASSERT_EQ(result.status, AttemptStatus::Ok) << result.message;
    AudioIO::SndfileReader reader;
    ASSERT_TRUE(reader.open(out.string()));
    EXPECT_EQ(reader.getChannels(), 1);
    EXPECT_EQ(reader.getFrames(), 32000);
}

TEST_F(AudioIOTest, NativeBackendRangePastEndFails) {
    auto backend = createSndfileEncodeBackend();

    auto result = backend->encode(toneSource(), SegmentRange{5, 5000, 6000}, nativeStrategy(0),
                                  (tempDir / "late.wav").string(), AttemptControl{});

    EXPECT_EQ(result.status, AttemptStatus::Failed);
}

TEST_F(AudioIOTest, NativeBackendHonoursCancel) {
    auto backend = createSndfileEncodeBackend();
    std::atomic<bool> cancel{true};
    AttemptControl control;
    control.cancelFlag = &cancel;

    auto result = backend->encode(toneSource(), SegmentRange{0, 0, 4000}, nativeStrategy(0),
                                  (tempDir / "cancelled.wav").string(), control);

    EXPECT_EQ(result.status, AttemptStatus::Cancelled);
}

TEST_F(AudioIOTest, NativeBackendCannotDecodeGarbage) {
    auto backend = createSndfileEncodeBackend();
    SourceAudio source = toneSource();
    source.path = writeFile("garbage.mp3", std::string(2048, 'z')).string();

    auto result = backend->encode(source, SegmentRange{0, 0, 1000}, nativeStrategy(0),
                                  (tempDir / "x.wav").string(), AttemptControl{});

    EXPECT_EQ(result.status, AttemptStatus::Failed);
    EXPECT_FALSE(result.message.empty());
}
