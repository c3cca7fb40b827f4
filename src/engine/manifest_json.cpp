#include "engine/manifest_json.h"

#include <nlohmann/json.hpp>

namespace audio_segmenter {
namespace JSON {

using json = nlohmann::json;

namespace {

json rangeToJson(const SegmentRange& range) {
    return json{{"index", range.index},
                {"start_ms", range.startMs},
                {"end_ms", range.endMs},
                {"duration_ms", range.durationMs()}};
}

json manifestObject(const SplitManifest& manifest) {
    json j;
    j["status"] = manifestStatusToString(manifest.status);
    j["segment_count"] = manifest.segmentCount;
    j["planned_count"] = manifest.plannedCount;
    j["total_size_bytes"] = manifest.totalSizeBytes;
    j["processing_duration_ms"] = manifest.processingDurationMs;
    j["files"] = manifest.fileNames();

    json segments = json::array();
    for (const auto& segment : manifest.segments) {
        json entry = rangeToJson(segment.range);
        entry["file_name"] = segment.fileName;
        entry["path"] = segment.path;
        entry["size_bytes"] = segment.sizeBytes;
        entry["format"] = segment.format;
        entry["strategy"] = segment.strategyName;
        entry["strategy_index"] = segment.strategyIndex;
        segments.push_back(entry);
    }
    j["segments"] = segments;

    json failures = json::array();
    for (const auto& failure : manifest.failures) {
        json entry = rangeToJson(failure.range);
        entry["error_code"] = errorCodeToString(failure.code);
        json causes = json::array();
        for (const auto& cause : failure.causes) {
            causes.push_back({{"strategy", cause.strategy},
                              {"error_code", errorCodeToString(cause.code)},
                              {"reason", cause.reason}});
        }
        entry["causes"] = causes;
        failures.push_back(entry);
    }
    j["failures"] = failures;
    return j;
}

}  // namespace

std::string manifestToJson(const SplitManifest& manifest, int indent) {
    return manifestObject(manifest).dump(indent);
}

std::string buildOkResponse(const SplitManifest& manifest, const std::string& message,
                            int indent) {
    json j;
    j["status"] = "ok";
    if (!message.empty()) {
        j["message"] = message;
    }
    j["data"] = manifestObject(manifest);
    return j.dump(indent);
}

std::string buildErrorResponse(ErrorCode code, const std::string& message,
                               const InnerError& innerError, int indent) {
    json j;
    j["status"] = "error";
    j["error_code"] = errorCodeToString(code);
    j["category"] = getErrorCategory(code);
    j["http_status"] = toHttpStatus(code);
    j["message"] = message;

    // Build inner_error object
    json inner;
    if (!innerError.cpp_code.empty()) {
        inner["cpp_code"] = innerError.cpp_code;
    } else {
        inner["cpp_code"] = errorCodeToHex(code);
    }
    if (!innerError.cpp_message.empty()) {
        inner["cpp_message"] = innerError.cpp_message;
    }
    if (innerError.tool.has_value()) {
        inner["tool"] = innerError.tool.value();
    } else {
        inner["tool"] = nullptr;
    }
    if (innerError.exit_code.has_value()) {
        inner["exit_code"] = innerError.exit_code.value();
    } else {
        inner["exit_code"] = nullptr;
    }
    if (innerError.strategy.has_value()) {
        inner["strategy"] = innerError.strategy.value();
    } else {
        inner["strategy"] = nullptr;
    }
    j["inner_error"] = inner;

    return j.dump(indent);
}

std::string buildOutcomeResponse(const SplitOutcome& outcome, int indent) {
    if (outcome.ok()) {
        return buildOkResponse(*outcome.manifest, outcome.message, indent);
    }
    return buildErrorResponse(outcome.code, outcome.message, outcome.inner, indent);
}

}  // namespace JSON
}  // namespace audio_segmenter
