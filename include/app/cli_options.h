#pragma once

#include "core/config_loader.h"
#include "engine/segment_types.h"

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace audio_segmenter {

struct CliOptions {
    std::string inputPath;
    std::string outputDir{"splits"};
    SplitRequest request{};
    std::string configPath{DEFAULT_CONFIG_FILE};
    std::optional<int> jobs;
    std::optional<int> segmentTimeoutMs;
    std::optional<std::string> logLevel;
    std::optional<std::string> ffmpegPath;
    std::optional<std::string> ffprobePath;
    bool pretty{false};
};

struct ParseOptionsResult {
    std::optional<CliOptions> options;
    bool showHelp{false};
    bool showVersion{false};
    bool hasError{false};
    std::string errorMessage;
};

ParseOptionsResult parseOptions(
    int argc, char **argv, std::string_view programName,
    const std::function<const char *(const char *)> &getenvFn = ::getenv);

// CLI flags and environment take precedence over the config file
void applyOptionOverrides(const CliOptions &options, SegmenterConfig &config);

void printHelp(std::string_view programName);
void printVersion(std::string_view programName);

}  // namespace audio_segmenter
