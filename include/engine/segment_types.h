#ifndef ENGINE_SEGMENT_TYPES_H
#define ENGINE_SEGMENT_TYPES_H

#include "core/error_codes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace audio_segmenter {

// Unit of the requested segment size
enum class SplitUnit { Seconds, Megabytes };

// Convert string to SplitUnit ("seconds"/"s"/"sec", "megabytes"/"mb"/"m"), case-insensitive
std::optional<SplitUnit> parseSplitUnit(std::string_view str);

// Convert SplitUnit to string ("seconds", "megabytes")
const char* splitUnitToString(SplitUnit unit);

/**
 * @brief Immutable description of one input file, produced by the prober.
 */
struct SourceAudio {
    std::string path;
    int64_t totalDurationMs = 0;
    uint64_t sizeBytes = 0;
    std::string containerFormat;  // e.g. "mp3", "wav", "mov" (first ffprobe format name)
    std::string codecName;        // e.g. "mp3", "pcm_s16le"; empty if unknown
    int channels = 0;
    int sampleRate = 0;
    int64_t bitrate = 0;  // bits per second, 0 = unknown
};

struct SplitRequest {
    SplitUnit unit = SplitUnit::Seconds;
    int targetValue = 0;  // seconds or megabytes depending on unit
};

struct SegmentRange {
    int index = 0;  // 0-based position in the plan
    int64_t startMs = 0;
    int64_t endMs = 0;

    int64_t durationMs() const {
        return endMs - startMs;
    }

    bool operator==(const SegmentRange& other) const {
        return index == other.index && startMs == other.startMs && endMs == other.endMs;
    }
    bool operator!=(const SegmentRange& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Ordered time ranges covering the source, computed before any encoding.
 */
struct SegmentPlan {
    std::vector<SegmentRange> ranges;
    int64_t totalDurationMs = 0;
    int64_t nominalSegmentMs = 0;  // From the request, before count capping/redistribution
    int plannedCount = 0;          // Ranges computed before dropping short ones
    int droppedCount = 0;          // Ranges discarded for being below the floor
    bool largeFileCapApplied = false;
    bool evenlyDistributed = false;

    std::string describe() const;
};

struct EncodedSegment {
    std::string fileName;  // e.g. "talk_part01.mp3"
    std::string path;      // outputDir / fileName
    uint64_t sizeBytes = 0;
    int strategyIndex = 0;  // Position in the ladder that succeeded
    std::string strategyName;
    std::string format;  // Extension actually produced ("mp3", "wav")
    SegmentRange range;
};

// One failed rung of the ladder
struct AttemptFailure {
    std::string strategy;
    ErrorCode code = ErrorCode::ENCODE_ATTEMPT_FAILED;
    std::string reason;
};

// A range that produced no output
struct SegmentFailure {
    SegmentRange range;
    ErrorCode code = ErrorCode::ENCODE_ALL_STRATEGIES_FAILED;
    std::vector<AttemptFailure> causes;
};

enum class ManifestStatus { Complete, Empty };

const char* manifestStatusToString(ManifestStatus status);

/**
 * @brief Final result of one split job.
 *
 * Segments are sorted by range index regardless of encode completion order.
 */
struct SplitManifest {
    ManifestStatus status = ManifestStatus::Empty;
    std::vector<EncodedSegment> segments;
    std::vector<SegmentFailure> failures;
    uint64_t totalSizeBytes = 0;
    int segmentCount = 0;
    int plannedCount = 0;
    int64_t processingDurationMs = 0;

    std::vector<std::string> fileNames() const;
};

}  // namespace audio_segmenter

#endif  // ENGINE_SEGMENT_TYPES_H
