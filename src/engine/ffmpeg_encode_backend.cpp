#include "engine/encode_backend.h"
#include "engine/ffmpeg_command_builder.h"
#include "logging/logger.h"
#include "process/process_runner.h"

#include <utility>

namespace audio_segmenter {

namespace {

class FfmpegEncodeBackend final : public EncodeBackend {
   public:
    explicit FfmpegEncodeBackend(std::string ffmpegPath) : ffmpegPath_(std::move(ffmpegPath)) {}

    const char* name() const override {
        return "ffmpeg";
    }

    EncoderKind kind() const override {
        return EncoderKind::Ffmpeg;
    }

    AttemptResult encode(const SourceAudio& source, const SegmentRange& range,
                         const EncodeStrategy& strategy, const std::string& outputPath,
                         const AttemptControl& control) const override {
        const auto args =
            FfmpegCommandBuilder::build(ffmpegPath_, strategy, source.path, range, outputPath);
        LOG_DEBUG("[ffmpeg] #{} {}: {}", range.index + 1, strategy.name,
                  process::toCommandString(args));

        process::ProcessOptions options;
        options.timeoutMs = control.timeoutMs;
        options.cancelFlag = control.cancelFlag;
        options.maxCaptureBytes = 64 * 1024;
        const auto run = process::runProcess(args, options);

        AttemptResult result;
        result.exitCode = run.status == process::ProcessStatus::Exited ? run.exitCode : -1;
        switch (run.status) {
        case process::ProcessStatus::Exited:
            if (run.exitCode == 0) {
                result.status = AttemptStatus::Ok;
                return result;
            }
            result.status = AttemptStatus::Failed;
            result.message = "ffmpeg exited with code " + std::to_string(run.exitCode);
            if (const auto detail = process::lastLine(run.stderrData); !detail.empty()) {
                result.message += ": " + detail;
            }
            return result;
        case process::ProcessStatus::TimedOut:
            result.status = AttemptStatus::TimedOut;
            break;
        case process::ProcessStatus::Cancelled:
            result.status = AttemptStatus::Cancelled;
            break;
        case process::ProcessStatus::SpawnFailed:
        case process::ProcessStatus::Signaled:
            result.status = AttemptStatus::Failed;
            break;
        }
        result.message = run.message;
        return result;
    }

   private:
    std::string ffmpegPath_;
};

}  // namespace

const char* attemptStatusToString(AttemptStatus status) {
    switch (status) {
    case AttemptStatus::Ok:
        return "ok";
    case AttemptStatus::Failed:
        return "failed";
    case AttemptStatus::TimedOut:
        return "timed_out";
    case AttemptStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

std::shared_ptr<EncodeBackend> createFfmpegEncodeBackend(
    const SegmenterConfig::EncoderConfig& config) {
    return std::make_shared<FfmpegEncodeBackend>(config.ffmpegPath);
}

std::vector<std::shared_ptr<EncodeBackend>> createEncodeBackends(
    const SegmenterConfig::EncoderConfig& config) {
    std::vector<std::shared_ptr<EncodeBackend>> backends;
    backends.push_back(createFfmpegEncodeBackend(config));
    if (config.nativePcmFallback) {
        backends.push_back(createSndfileEncodeBackend());
    }
    return backends;
}

}  // namespace audio_segmenter
