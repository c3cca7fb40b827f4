#ifndef ENGINE_MANIFEST_JSON_H
#define ENGINE_MANIFEST_JSON_H

#include "core/error_codes.h"
#include "engine/segment_types.h"
#include "engine/segmentation_orchestrator.h"

#include <string>

namespace audio_segmenter {
namespace JSON {

// Manifest object: status, counts, sizes, per-segment entries and per-range failures
std::string manifestToJson(const SplitManifest& manifest, int indent = -1);

// {"status":"ok","message":...,"data":<manifest>}
std::string buildOkResponse(const SplitManifest& manifest, const std::string& message,
                            int indent = -1);

// {"status":"error","error_code":...,"http_status":...,"message":...,"inner_error":{...}}
std::string buildErrorResponse(ErrorCode code, const std::string& message,
                               const InnerError& innerError = InnerError(), int indent = -1);

// Ok response for successful outcomes, error response otherwise
std::string buildOutcomeResponse(const SplitOutcome& outcome, int indent = -1);

}  // namespace JSON
}  // namespace audio_segmenter

#endif  // ENGINE_MANIFEST_JSON_H
