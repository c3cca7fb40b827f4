#include "engine/ffmpeg_command_builder.h"

#include <cstdio>

namespace audio_segmenter {

std::vector<std::string> FfmpegCommandBuilder::build(const std::string& ffmpegPath,
                                                     const EncodeStrategy& strategy,
                                                     const std::string& inputPath,
                                                     const SegmentRange& range,
                                                     const std::string& outputPath) {
    // Input-side -ss seeks before decoding; -t bounds the output length
    std::vector<std::string> args = {ffmpegPath,
                                     "-hide_banner",
                                     "-nostdin",
                                     "-loglevel",
                                     "error",
                                     "-y",
                                     "-ss",
                                     formatSeconds(range.startMs),
                                     "-t",
                                     formatSeconds(range.durationMs()),
                                     "-i",
                                     inputPath,
                                     "-vn",
                                     "-map",
                                     "0:a:0"};

    if (!strategy.codec.empty()) {
        args.push_back("-c:a");
        args.push_back(strategy.codec);
    }
    if (strategy.bitrateKbps > 0) {
        args.push_back("-b:a");
        args.push_back(std::to_string(strategy.bitrateKbps) + "k");
    }
    if (strategy.channels > 0) {
        args.push_back("-ac");
        args.push_back(std::to_string(strategy.channels));
    }
    if (strategy.sampleRate > 0) {
        args.push_back("-ar");
        args.push_back(std::to_string(strategy.sampleRate));
    }
    args.insert(args.end(), strategy.extraArgs.begin(), strategy.extraArgs.end());

    // Explicit muxer: the output path ends in ".partial"
    args.push_back("-f");
    args.push_back(muxerName(strategy.format));
    args.push_back(outputPath);
    return args;
}

std::string FfmpegCommandBuilder::formatSeconds(int64_t ms) {
    if (ms < 0) {
        ms = 0;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%lld.%03lld", static_cast<long long>(ms / 1000),
                  static_cast<long long>(ms % 1000));
    return buffer;
}

const char* FfmpegCommandBuilder::muxerName(OutputFormat format) {
    switch (format) {
    case OutputFormat::Mp3:
        return "mp3";
    case OutputFormat::Wav:
        return "wav";
    }
    return "mp3";
}

}  // namespace audio_segmenter
