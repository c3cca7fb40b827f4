#ifndef ENGINE_INPUT_VALIDATION_H
#define ENGINE_INPUT_VALIDATION_H

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "engine/segment_types.h"

#include <filesystem>
#include <string>

namespace audio_segmenter {

struct ValidationResult {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const {
        return code == ErrorCode::OK;
    }
};

// Target value must be 1..maxTargetSeconds (Seconds) or 1..maxTargetMegabytes (Megabytes)
ValidationResult validateSplitRequest(const SplitRequest& request,
                                      const SegmenterConfig::LimitsConfig& limits);

/**
 * @brief Check that the input is an existing, non-empty regular file with an allowed extension.
 *
 * Checks run in order: existence, emptiness, extension, size limit. A zero-byte file
 * is reported as empty whatever its extension.
 */
ValidationResult validateInputFile(const std::filesystem::path& path,
                                   const SegmenterConfig::LimitsConfig& limits);

// Lowercase extension without the leading dot ("Talk.MP3" -> "mp3")
std::string fileExtensionLower(const std::filesystem::path& path);

}  // namespace audio_segmenter

#endif  // ENGINE_INPUT_VALIDATION_H
