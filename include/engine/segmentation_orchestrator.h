#ifndef ENGINE_SEGMENTATION_ORCHESTRATOR_H
#define ENGINE_SEGMENTATION_ORCHESTRATOR_H

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "engine/duration_prober.h"
#include "engine/segment_encoder.h"
#include "engine/segment_types.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace audio_segmenter {

enum class JobState { Probing, Planning, Encoding, Aggregating, Done, Error };

const char* jobStateToString(JobState state);

struct SplitOutcome {
    ErrorCode code = ErrorCode::INTERNAL_UNKNOWN;
    std::optional<SplitManifest> manifest;
    std::string message;  // Safe to show to end users
    InnerError inner;     // Diagnostic detail for logs and API clients
    JobState finalState = JobState::Error;

    bool ok() const {
        return code == ErrorCode::OK && manifest.has_value();
    }
};

// Invoked on the calling thread at every state transition
using StateCallback = std::function<void(JobState state, const std::string& detail)>;

/**
 * @brief Runs one split job: validate, probe, plan, encode ranges in parallel, aggregate.
 *
 * A job succeeds when at least one range produced a file; failed ranges are listed
 * in the manifest. Instances hold no per-job state and may run several jobs at once.
 */
class SegmentationOrchestrator {
   public:
    SegmentationOrchestrator(SegmenterConfig config, std::shared_ptr<AudioProber> prober,
                             std::shared_ptr<SegmentEncoder> encoder);

    // ffprobe/libsndfile prober and ffmpeg/libsndfile encoders from config
    explicit SegmentationOrchestrator(SegmenterConfig config);

    void setStateCallback(StateCallback callback);

    SplitOutcome split(const std::string& sourcePath, const std::string& outputDir,
                       const SplitRequest& request,
                       const std::atomic<bool>* cancelFlag = nullptr) const;

    // Unit given as text ("seconds", "megabytes", ...); unknown units are invalid parameters
    SplitOutcome split(const std::string& sourcePath, const std::string& outputDir,
                       int targetValue, const std::string& unit,
                       const std::atomic<bool>* cancelFlag = nullptr) const;

    // maxWorkers (or hardware concurrency when 0), never more than rangeCount, at least 1
    int workerCountFor(size_t rangeCount) const;

    const SegmenterConfig& config() const {
        return config_;
    }

   private:
    void notify(JobState state, const std::string& detail) const;
    SplitOutcome fail(ErrorCode code, const InnerError& inner,
                      const std::string& message = std::string()) const;

    SegmenterConfig config_;
    std::shared_ptr<AudioProber> prober_;
    std::shared_ptr<SegmentEncoder> encoder_;
    StateCallback stateCallback_;
};

}  // namespace audio_segmenter

#endif  // ENGINE_SEGMENTATION_ORCHESTRATOR_H
