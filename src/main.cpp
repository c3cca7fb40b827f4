// Entry point for audio_segmenter
#include "app/cli_options.h"
#include "core/config_loader.h"
#include "engine/manifest_json.h"
#include "engine/segmentation_orchestrator.h"
#include "logging/logger.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

std::atomic<bool> gCancelRequested{false};

void handleSignal(int /*signum*/) {
    gCancelRequested.store(true);
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace audio_segmenter;

    logging::initializeEarly();

    const auto parsed = parseOptions(argc, argv, "audio_segmenter");
    if (parsed.showHelp || parsed.showVersion) {
        return kExitOk;
    }
    if (parsed.hasError || !parsed.options) {
        std::cerr << "audio_segmenter: " << parsed.errorMessage << std::endl;
        std::cerr << "Try 'audio_segmenter --help' for more information." << std::endl;
        return kExitUsage;
    }
    const CliOptions& options = *parsed.options;

    if (!logging::initializeFromConfig(options.configPath)) {
        std::cerr << "audio_segmenter: logging setup failed, continuing with stderr" << std::endl;
    }
    if (options.logLevel) {
        logging::setLevel(logging::parseLevel(*options.logLevel));
    }

    SegmenterConfig config;
    if (!loadSegmenterConfig(options.configPath, config)) {
        LOG_INFO("Using built-in configuration defaults");
    }
    applyOptionOverrides(options, config);
    if (const int corrected = sanitizeSegmenterConfig(config); corrected > 0) {
        LOG_WARN("{} option value(s) replaced by defaults", corrected);
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    SegmentationOrchestrator orchestrator(config);
    orchestrator.setStateCallback([](JobState state, const std::string& detail) {
        LOG_INFO("[{}] {}", jobStateToString(state), detail);
    });

    const SplitOutcome outcome = orchestrator.split(options.inputPath, options.outputDir,
                                                    options.request, &gCancelRequested);

    std::cout << JSON::buildOutcomeResponse(outcome, options.pretty ? 2 : -1) << std::endl;
    logging::flush();
    logging::shutdown();
    return outcome.ok() ? kExitOk : kExitFailed;
}
