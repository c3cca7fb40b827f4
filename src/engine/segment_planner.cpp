#include "engine/segment_planner.h"

#include "logging/logger.h"

#include <algorithm>

namespace audio_segmenter {

const char* planStatusToString(PlanStatus status) {
    switch (status) {
    case PlanStatus::Ok:
        return "ok";
    case PlanStatus::InvalidRequest:
        return "invalid_request";
    case PlanStatus::NoViableSegments:
        return "no_viable_segments";
    }
    return "unknown";
}

ErrorCode toErrorCode(PlanStatus status) {
    switch (status) {
    case PlanStatus::Ok:
        return ErrorCode::OK;
    case PlanStatus::NoViableSegments:
        return ErrorCode::PLAN_NO_VIABLE_SEGMENTS;
    case PlanStatus::InvalidRequest:
        return ErrorCode::PLAN_INVALID_REQUEST;
    }
    return ErrorCode::PLAN_INVALID_REQUEST;
}

int64_t computeNominalSegmentMs(const SourceAudio& source, const SplitRequest& request,
                                const SegmenterConfig::PlannerConfig& config) {
    if (request.unit == SplitUnit::Seconds) {
        return static_cast<int64_t>(request.targetValue) * 1000;
    }

    const double targetBytes =
        static_cast<double>(request.targetValue) * static_cast<double>(kBytesPerMegabyte);
    double segmentMs = 0.0;
    if (source.bitrate > 0) {
        segmentMs = targetBytes * 8.0 / static_cast<double>(source.bitrate) * 1000.0;
    } else if (source.sizeBytes > 0 && source.totalDurationMs > 0) {
        const double bytesPerMs = static_cast<double>(source.sizeBytes) /
                                  static_cast<double>(source.totalDurationMs);
        segmentMs = targetBytes / bytesPerMs;
    } else {
        segmentMs = targetBytes * 8.0 / static_cast<double>(config.defaultBitrate) * 1000.0;
    }
    segmentMs *= config.sizeSafetyMargin;

    return std::max(static_cast<int64_t>(segmentMs), config.minSizeSegmentMs);
}

PlanResult planRanges(int64_t totalDurationMs, int64_t segmentMs, uint64_t sizeBytes,
                      const SegmenterConfig::PlannerConfig& config) {
    PlanResult result;
    if (totalDurationMs <= 0 || segmentMs <= 0) {
        result.status = PlanStatus::InvalidRequest;
        result.message = "cannot plan " + std::to_string(totalDurationMs) + " ms in " +
                         std::to_string(segmentMs) + " ms segments";
        return result;
    }

    SegmentPlan& plan = result.plan;
    plan.totalDurationMs = totalDurationMs;
    plan.nominalSegmentMs = segmentMs;

    int64_t count = (totalDurationMs + segmentMs - 1) / segmentMs;
    count = std::max<int64_t>(count, 1);

    if (sizeBytes > config.largeFileThresholdBytes && count > config.largeFileSegmentCap) {
        LOG_DEBUG("Planner: {} bytes exceeds {}, capping {} segments to {}", sizeBytes,
                  config.largeFileThresholdBytes, count, config.largeFileSegmentCap);
        count = config.largeFileSegmentCap;
        plan.largeFileCapApplied = true;
    }

    // Even spread keeps every range within 1 ms of total/count
    const bool even = count > 1 && totalDurationMs / count >= config.minSegmentMs;
    plan.evenlyDistributed = even;
    plan.plannedCount = static_cast<int>(count);

    auto boundary = [&](int64_t i) -> int64_t {
        if (i >= count) {
            return totalDurationMs;
        }
        if (even) {
            // round(i * total / count) in integer arithmetic
            return (2 * i * totalDurationMs + count) / (2 * count);
        }
        return std::min(i * segmentMs, totalDurationMs);
    };

    for (int64_t i = 0; i < count; ++i) {
        SegmentRange range;
        range.index = static_cast<int>(i);
        range.startMs = boundary(i);
        range.endMs = boundary(i + 1);
        if (range.durationMs() < config.minSegmentMs) {
            LOG_DEBUG("Planner: dropping range #{} [{}, {}) shorter than {} ms", i + 1,
                      range.startMs, range.endMs, config.minSegmentMs);
            ++plan.droppedCount;
            continue;
        }
        plan.ranges.push_back(range);
    }

    if (plan.ranges.empty()) {
        result.status = PlanStatus::NoViableSegments;
        result.message = "no range of " + std::to_string(totalDurationMs) +
                         " ms reaches the " + std::to_string(config.minSegmentMs) +
                         " ms minimum";
        return result;
    }

    result.status = PlanStatus::Ok;
    return result;
}

PlanResult planSegments(const SourceAudio& source, const SplitRequest& request,
                        const SegmenterConfig::PlannerConfig& config) {
    if (request.targetValue <= 0) {
        PlanResult result;
        result.status = PlanStatus::InvalidRequest;
        result.message = "target value must be positive";
        return result;
    }

    const int64_t segmentMs = computeNominalSegmentMs(source, request, config);
    PlanResult result = planRanges(source.totalDurationMs, segmentMs, source.sizeBytes, config);
    if (result.ok()) {
        LOG_INFO("Planner: {} {} -> {}", request.targetValue, splitUnitToString(request.unit),
                 result.plan.describe());
    }
    return result;
}

}  // namespace audio_segmenter
