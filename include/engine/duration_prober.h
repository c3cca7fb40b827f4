#pragma once

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "engine/segment_types.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace audio_segmenter {

enum class ProbeStatus {
    Ok,
    Unreadable,    // Missing, empty, not audio, or every probe tool failed
    ZeroDuration,  // Decodable container with no playable audio
};

const char* probeStatusToString(ProbeStatus status);
ErrorCode toErrorCode(ProbeStatus status);

struct ProbeResult {
    ProbeStatus status = ProbeStatus::Unreadable;
    std::optional<SourceAudio> source;
    std::string message;
    InnerError inner;

    bool ok() const {
        return status == ProbeStatus::Ok && source.has_value();
    }
};

class AudioProber {
   public:
    virtual ~AudioProber() = default;

    virtual const char* name() const = 0;

    // Must be safe to call from several threads
    virtual ProbeResult probe(const std::string& path) const = 0;
};

/**
 * @brief Parse `ffprobe -print_format json -show_format -show_streams` output.
 *
 * Duration comes from format.duration, falling back to the first audio stream.
 * Bitrate prefers the audio stream bit_rate, then format.bit_rate, then 0 (unknown).
 */
ProbeResult parseFfprobeOutput(const std::string& jsonText, const std::string& path,
                               uint64_t sizeBytes);

// Read duration and layout through libsndfile
ProbeResult probeWithSndfile(const std::string& path, uint64_t sizeBytes);

// ffprobe first, libsndfile when ffprobe is missing or cannot make sense of the file
class DurationProber final : public AudioProber {
   public:
    explicit DurationProber(SegmenterConfig::EncoderConfig config);

    const char* name() const override {
        return "ffprobe+sndfile";
    }

    ProbeResult probe(const std::string& path) const override;

   private:
    ProbeResult probeWithFfprobe(const std::string& path, uint64_t sizeBytes) const;

    SegmenterConfig::EncoderConfig config_;
};

std::shared_ptr<AudioProber> createDurationProber(const SegmenterConfig::EncoderConfig& config);

}  // namespace audio_segmenter
