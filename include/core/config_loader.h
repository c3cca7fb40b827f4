#ifndef CORE_CONFIG_LOADER_H
#define CORE_CONFIG_LOADER_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

namespace audio_segmenter {

constexpr uint64_t kBytesPerMegabyte = 1024ULL * 1024ULL;

struct SegmenterConfig {
    // Request/input policy limits
    struct LimitsConfig {
        int maxTargetSeconds = 3600;
        int maxTargetMegabytes = 100;
        uint64_t maxInputBytes = 200 * kBytesPerMegabyte;  // 0 = unlimited
        std::vector<std::string> allowedExtensions = {"mp3", "wav", "ogg", "m4a",
                                                      "flac", "aac", "wma"};
    } limits;

    // Segment planner
    struct PlannerConfig {
        int64_t minSegmentMs = 1000;      // Ranges shorter than this are dropped
        int64_t minSizeSegmentMs = 5000;  // Floor for size-derived segment length
        uint64_t largeFileThresholdBytes = 30 * kBytesPerMegabyte;
        int largeFileSegmentCap = 6;
        double sizeSafetyMargin = 0.9;  // Applied to size-derived lengths, in (0, 1]
        int64_t defaultBitrate = 128000;
    } planner;

    // Segment encoder and external tools
    struct EncoderConfig {
        std::string ffmpegPath = "ffmpeg";
        std::string ffprobePath = "ffprobe";
        uint64_t largeInputThresholdBytes = 30 * kBytesPerMegabyte;
        int standardBitrateKbps = 128;
        int largeInputBitrateKbps = 64;
        int largeInputSampleRate = 16000;
        bool nativePcmFallback = true;  // libsndfile rung at the bottom of the ladder
        int segmentTimeoutMs = 300000;  // 0 = no per-segment timeout
        int probeTimeoutMs = 30000;
    } encoder;

    // Orchestrator scheduling
    struct WorkerConfig {
        int maxWorkers = 0;    // 0 = hardware concurrency
        int jobTimeoutMs = 0;  // 0 = no job budget
    } workers;
};

bool loadSegmenterConfig(const std::filesystem::path& configPath, SegmenterConfig& outConfig,
                         bool verbose = true);

// Clamp out-of-range values back to usable ones; returns number of corrections made
int sanitizeSegmenterConfig(SegmenterConfig& config, bool verbose = true);

}  // namespace audio_segmenter

#endif  // CORE_CONFIG_LOADER_H
