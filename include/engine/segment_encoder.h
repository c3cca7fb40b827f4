#ifndef ENGINE_SEGMENT_ENCODER_H
#define ENGINE_SEGMENT_ENCODER_H

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "engine/encode_backend.h"
#include "engine/encode_strategy.h"
#include "engine/segment_types.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace audio_segmenter {

enum class EncodeStatus {
    Ok,
    AllStrategiesFailed,
    TimedOut,   // Segment time budget exhausted; remaining rungs skipped
    Cancelled,  // Job cancellation observed; remaining rungs skipped
};

const char* encodeStatusToString(EncodeStatus status);
ErrorCode toErrorCode(EncodeStatus status);

struct SegmentEncodeResult {
    EncodeStatus status = EncodeStatus::AllStrategiesFailed;
    std::optional<EncodedSegment> segment;
    std::vector<AttemptFailure> causes;  // One entry per failed rung, in ladder order

    bool ok() const {
        return status == EncodeStatus::Ok && segment.has_value();
    }
};

// File stem with anything outside [A-Za-z0-9_.-] replaced by '_'; "audio" if nothing is left
std::string sanitizeBaseName(const std::string& fileNameOrPath);

// ("talk", 3, "mp3") -> "talk_part03.mp3"
std::string formatSegmentFileName(const std::string& baseName, int partNumber,
                                  const std::string& extension);

/**
 * @brief Encodes one range by walking the fallback ladder.
 *
 * Each rung writes to "<final>.partial", which is renamed to the final name only
 * after the backend reports success and the file is non-empty. Partial files are
 * removed on every failure path.
 */
class SegmentEncoder {
   public:
    SegmentEncoder(SegmenterConfig::EncoderConfig config,
                   std::vector<std::shared_ptr<EncodeBackend>> backends);

    EncodeLadder ladderFor(const SourceAudio& source) const;

    SegmentEncodeResult encode(const SourceAudio& source, const SegmentRange& range,
                               const std::filesystem::path& outputDir,
                               const std::atomic<bool>* cancelFlag = nullptr) const;

    SegmentEncodeResult encodeWithLadder(const SourceAudio& source, const SegmentRange& range,
                                         const std::filesystem::path& outputDir,
                                         const EncodeLadder& ladder,
                                         const std::atomic<bool>* cancelFlag = nullptr) const;

   private:
    const EncodeBackend* backendFor(EncoderKind kind) const;

    SegmenterConfig::EncoderConfig config_;
    std::vector<std::shared_ptr<EncodeBackend>> backends_;
};

}  // namespace audio_segmenter

#endif  // ENGINE_SEGMENT_ENCODER_H
