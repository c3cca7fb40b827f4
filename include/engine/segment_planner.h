#ifndef ENGINE_SEGMENT_PLANNER_H
#define ENGINE_SEGMENT_PLANNER_H

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "engine/segment_types.h"

#include <cstdint>
#include <string>

namespace audio_segmenter {

enum class PlanStatus {
    Ok,
    InvalidRequest,    // Non-positive duration or segment length
    NoViableSegments,  // Every computed range fell below the minimum length
};

const char* planStatusToString(PlanStatus status);
ErrorCode toErrorCode(PlanStatus status);

struct PlanResult {
    PlanStatus status = PlanStatus::InvalidRequest;
    SegmentPlan plan;
    std::string message;

    bool ok() const {
        return status == PlanStatus::Ok;
    }
};

/**
 * @brief Nominal segment length for a request, before counting.
 *
 * Seconds: targetValue * 1000.
 * Megabytes: target bits divided by the source bitrate (or the observed bytes/ms
 * when the bitrate is unknown), scaled by the safety margin and floored at
 * minSizeSegmentMs.
 */
int64_t computeNominalSegmentMs(const SourceAudio& source, const SplitRequest& request,
                                const SegmenterConfig::PlannerConfig& config);

/**
 * @brief Cut [0, totalDurationMs) into ranges of about segmentMs.
 *
 * Inputs larger than largeFileThresholdBytes are capped at largeFileSegmentCap
 * ranges. With more than one range, boundaries are spread evenly unless the even
 * length would fall below minSegmentMs. Ranges shorter than minSegmentMs are dropped.
 */
PlanResult planRanges(int64_t totalDurationMs, int64_t segmentMs, uint64_t sizeBytes,
                      const SegmenterConfig::PlannerConfig& config);

PlanResult planSegments(const SourceAudio& source, const SplitRequest& request,
                        const SegmenterConfig::PlannerConfig& config);

}  // namespace audio_segmenter

#endif  // ENGINE_SEGMENT_PLANNER_H
