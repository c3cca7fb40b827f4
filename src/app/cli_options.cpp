#include "app/cli_options.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

namespace audio_segmenter {

namespace {

constexpr const char *kVersion = "0.1.0";

std::string toLower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<int> parseIntValue(std::string_view value, int minValue) {
    const std::string buffer{value};
    if (buffer.empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    long parsed = std::strtol(buffer.c_str(), &end, 10);
    if (!end || *end != '\0' || parsed < minValue || parsed > 1000000000L) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

bool isValidLogLevel(std::string_view value) {
    const std::string lower = toLower(value);
    return lower == "trace" || lower == "debug" || lower == "info" || lower == "warn" ||
           lower == "warning" || lower == "error" || lower == "critical" || lower == "off";
}

bool applyEnvOverrides(CliOptions &opt, ParseOptionsResult &result,
                       const std::function<const char *(const char *)> &getenvFn) {
    if (const char *ffmpeg = getenvFn("AUDIO_SEGMENTER_FFMPEG")) {
        opt.ffmpegPath = std::string{ffmpeg};
    }
    if (const char *ffprobe = getenvFn("AUDIO_SEGMENTER_FFPROBE")) {
        opt.ffprobePath = std::string{ffprobe};
    }
    if (const char *logLevel = getenvFn("AUDIO_SEGMENTER_LOG_LEVEL")) {
        if (!isValidLogLevel(logLevel)) {
            result.hasError = true;
            result.errorMessage =
                "Unsupported AUDIO_SEGMENTER_LOG_LEVEL. Use one of: "
                "trace|debug|info|warn|error|critical|off";
            return false;
        }
        opt.logLevel = toLower(logLevel);
    }
    return true;
}

}  // namespace

void printHelp(std::string_view programName) {
    std::cout << "Usage: " << programName
              << " [--output-dir DIR] (--seconds N | --megabytes N) [--config FILE]"
              << " [--jobs N] [--segment-timeout-ms MS] [--log-level info] [--pretty] <input>"
              << std::endl
              << std::endl
              << "Split an audio file into numbered segments by duration or approximate size."
              << std::endl
              << "  -o, --output-dir       Directory for segment files (default: splits)"
              << std::endl
              << "  -s, --seconds          Target segment length in seconds (1-3600)" << std::endl
              << "  -m, --megabytes        Target segment size in megabytes (1-100)" << std::endl
              << "  -c, --config           JSON config file (default: config.json)" << std::endl
              << "  -j, --jobs             Parallel encode workers (0 = CPU count)" << std::endl
              << "  --segment-timeout-ms   Time budget per segment (0 = unlimited)" << std::endl
              << "  --log-level            trace | debug | info | warn | error | critical | off"
              << std::endl
              << "  --pretty               Indent the JSON printed on stdout" << std::endl
              << "  -h, --help             Show this help and exit" << std::endl
              << "  -V, --version          Show version and exit" << std::endl
              << std::endl
              << "Environment overrides: AUDIO_SEGMENTER_FFMPEG, AUDIO_SEGMENTER_FFPROBE, "
                 "AUDIO_SEGMENTER_LOG_LEVEL"
              << std::endl
              << "Exit codes: 0 success, 1 split failed, 2 usage error" << std::endl;
}

void printVersion(std::string_view programName) {
    std::cout << programName << " version " << kVersion << std::endl;
}

ParseOptionsResult parseOptions(int argc, char **argv, std::string_view programName,
                                const std::function<const char *(const char *)> &getenvFn) {
    CliOptions opt{};
    ParseOptionsResult result{};
    bool unitGiven = false;

    auto fail = [&](const std::string &message) {
        result.hasError = true;
        result.errorMessage = message;
        return result;
    };

    if (!applyEnvOverrides(opt, result, getenvFn)) {
        return result;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "-h" || arg == "--help") {
            printHelp(programName);
            result.showHelp = true;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            printVersion(programName);
            result.showVersion = true;
            return result;
        } else if ((arg == "-o" || arg == "--output-dir") && i + 1 < argc) {
            opt.outputDir = argv[++i];
        } else if ((arg == "-s" || arg == "--seconds" || arg == "-m" || arg == "--megabytes") &&
                   i + 1 < argc) {
            if (unitGiven) {
                return fail("Specify only one of --seconds or --megabytes");
            }
            auto parsed = parseIntValue(argv[++i], 1);
            if (!parsed) {
                return fail(std::string(arg) + " requires a positive integer");
            }
            opt.request.unit = (arg == "-s" || arg == "--seconds") ? SplitUnit::Seconds
                                                                   : SplitUnit::Megabytes;
            opt.request.targetValue = *parsed;
            unitGiven = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            opt.configPath = argv[++i];
        } else if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
            auto parsed = parseIntValue(argv[++i], 0);
            if (!parsed) {
                return fail("--jobs must be a non-negative integer");
            }
            opt.jobs = *parsed;
        } else if (arg == "--segment-timeout-ms" && i + 1 < argc) {
            auto parsed = parseIntValue(argv[++i], 0);
            if (!parsed) {
                return fail("--segment-timeout-ms must be a non-negative integer");
            }
            opt.segmentTimeoutMs = *parsed;
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto lvl = toLower(argv[++i]);
            if (!isValidLogLevel(lvl)) {
                return fail(
                    "Unsupported log level. Use one of: trace|debug|info|warn|error|critical|off");
            }
            opt.logLevel = lvl;
        } else if (arg == "--pretty") {
            opt.pretty = true;
        } else if (!arg.empty() && arg.front() != '-' && opt.inputPath.empty()) {
            opt.inputPath = std::string(arg);
        } else {
            return fail(std::string("Unknown argument: ") + std::string(arg));
        }
    }

    if (opt.inputPath.empty()) {
        return fail("Missing input file");
    }
    if (!unitGiven) {
        return fail("One of --seconds or --megabytes is required");
    }

    result.options = opt;
    return result;
}

void applyOptionOverrides(const CliOptions &options, SegmenterConfig &config) {
    if (options.jobs) {
        config.workers.maxWorkers = *options.jobs;
    }
    if (options.segmentTimeoutMs) {
        config.encoder.segmentTimeoutMs = *options.segmentTimeoutMs;
    }
    if (options.ffmpegPath && !options.ffmpegPath->empty()) {
        config.encoder.ffmpegPath = *options.ffmpegPath;
    }
    if (options.ffprobePath && !options.ffprobePath->empty()) {
        config.encoder.ffprobePath = *options.ffprobePath;
    }
}

}  // namespace audio_segmenter
