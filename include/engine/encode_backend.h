#pragma once

#include "core/config_loader.h"
#include "engine/encode_strategy.h"
#include "engine/segment_types.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace audio_segmenter {

enum class AttemptStatus {
    Ok,
    Failed,
    TimedOut,
    Cancelled,
};

const char* attemptStatusToString(AttemptStatus status);

struct AttemptResult {
    AttemptStatus status = AttemptStatus::Failed;
    std::string message;
    int exitCode = -1;  // External tool exit code, -1 if not applicable
};

struct AttemptControl {
    int timeoutMs = 0;  // 0 = no limit
    const std::atomic<bool>* cancelFlag = nullptr;

    bool cancelled() const {
        return cancelFlag != nullptr && cancelFlag->load();
    }
};

class EncodeBackend {
   public:
    virtual ~EncodeBackend() = default;

    virtual const char* name() const = 0;
    virtual EncoderKind kind() const = 0;

    // Write the range of the source to outputPath using the strategy.
    // Called concurrently from encode workers.
    virtual AttemptResult encode(const SourceAudio& source, const SegmentRange& range,
                                 const EncodeStrategy& strategy, const std::string& outputPath,
                                 const AttemptControl& control) const = 0;
};

std::shared_ptr<EncodeBackend> createFfmpegEncodeBackend(
    const SegmenterConfig::EncoderConfig& config);

// libsndfile decode + 16-bit PCM WAV; ignores strategy.sampleRate
std::shared_ptr<EncodeBackend> createSndfileEncodeBackend();

std::vector<std::shared_ptr<EncodeBackend>> createEncodeBackends(
    const SegmenterConfig::EncoderConfig& config);

}  // namespace audio_segmenter
