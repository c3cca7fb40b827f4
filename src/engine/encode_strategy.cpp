#include "engine/encode_strategy.h"

#include <algorithm>

namespace audio_segmenter {

namespace {

constexpr int kBasicMonoMinBitrateKbps = 96;
constexpr int kBasicMonoSampleRate = 22050;

EncodeStrategy ffmpegPcmWav(const char* name, int channels, int sampleRate) {
    EncodeStrategy strategy;
    strategy.name = name;
    strategy.format = OutputFormat::Wav;
    strategy.codec = "pcm_s16le";
    strategy.channels = channels;
    strategy.sampleRate = sampleRate;
    return strategy;
}

EncodeStrategy nativeWav(int channels) {
    EncodeStrategy strategy;
    strategy.name = "wav_native";
    strategy.backend = EncoderKind::Native;
    strategy.format = OutputFormat::Wav;
    strategy.channels = channels;
    return strategy;
}

}  // namespace

const char* encoderKindToString(EncoderKind kind) {
    switch (kind) {
    case EncoderKind::Ffmpeg:
        return "ffmpeg";
    case EncoderKind::Native:
        return "native";
    }
    return "unknown";
}

const char* outputFormatExtension(OutputFormat format) {
    switch (format) {
    case OutputFormat::Mp3:
        return "mp3";
    case OutputFormat::Wav:
        return "wav";
    }
    return "bin";
}

bool isLargeInput(const SourceAudio& source, const SegmenterConfig::EncoderConfig& config) {
    return source.sizeBytes > config.largeInputThresholdBytes;
}

EncodeLadder buildEncodeLadder(const SourceAudio& source,
                               const SegmenterConfig::EncoderConfig& config) {
    EncodeLadder ladder;

    if (isLargeInput(source, config)) {
        EncodeStrategy fast;
        fast.name = "mp3_fast_mono";
        fast.codec = "libmp3lame";
        fast.bitrateKbps = config.largeInputBitrateKbps;
        fast.channels = 1;
        fast.sampleRate = config.largeInputSampleRate;
        fast.extraArgs = {"-compression_level", "9"};
        ladder.push_back(fast);

        EncodeStrategy basic;
        basic.name = "mp3_basic_mono";
        basic.bitrateKbps = std::max(config.largeInputBitrateKbps, kBasicMonoMinBitrateKbps);
        basic.channels = 1;
        basic.sampleRate = kBasicMonoSampleRate;
        ladder.push_back(basic);

        ladder.push_back(ffmpegPcmWav("wav_pcm_mono", 1, config.largeInputSampleRate));
        if (config.nativePcmFallback) {
            ladder.push_back(nativeWav(1));
        }
        return ladder;
    }

    EncodeStrategy standard;
    standard.name = "mp3_standard";
    standard.codec = "libmp3lame";
    standard.bitrateKbps = config.standardBitrateKbps;
    standard.extraArgs = {"-q:a", "4"};
    ladder.push_back(standard);

    EncodeStrategy basic;
    basic.name = "mp3_basic";
    basic.bitrateKbps = config.standardBitrateKbps;
    ladder.push_back(basic);

    ladder.push_back(ffmpegPcmWav("wav_pcm", 0, 0));
    if (config.nativePcmFallback) {
        ladder.push_back(nativeWav(0));
    }
    return ladder;
}

std::string describeLadder(const EncodeLadder& ladder) {
    std::string out;
    for (const auto& strategy : ladder) {
        if (!out.empty()) {
            out += " > ";
        }
        out += strategy.name;
    }
    return out;
}

}  // namespace audio_segmenter
