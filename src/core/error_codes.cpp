#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace audio_segmenter {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Input validation
    {ErrorCode::INPUT_INVALID_PARAMETERS, "INPUT_INVALID_PARAMETERS"},
    {ErrorCode::INPUT_UNSUPPORTED_FORMAT, "INPUT_UNSUPPORTED_FORMAT"},
    {ErrorCode::INPUT_EMPTY_FILE, "INPUT_EMPTY_FILE"},
    {ErrorCode::INPUT_FILE_TOO_LARGE, "INPUT_FILE_TOO_LARGE"},
    {ErrorCode::INPUT_FILE_NOT_FOUND, "INPUT_FILE_NOT_FOUND"},

    // Probe
    {ErrorCode::PROBE_UNREADABLE, "PROBE_UNREADABLE"},
    {ErrorCode::PROBE_ZERO_DURATION, "PROBE_ZERO_DURATION"},

    // Plan
    {ErrorCode::PLAN_INVALID_REQUEST, "PLAN_INVALID_REQUEST"},
    {ErrorCode::PLAN_NO_VIABLE_SEGMENTS, "PLAN_NO_VIABLE_SEGMENTS"},

    // Encode
    {ErrorCode::ENCODE_ATTEMPT_FAILED, "ENCODE_ATTEMPT_FAILED"},
    {ErrorCode::ENCODE_ALL_STRATEGIES_FAILED, "ENCODE_ALL_STRATEGIES_FAILED"},
    {ErrorCode::ENCODE_TIMEOUT, "ENCODE_TIMEOUT"},
    {ErrorCode::ENCODE_CANCELLED, "ENCODE_CANCELLED"},
    {ErrorCode::ENCODE_OUTPUT_EMPTY, "ENCODE_OUTPUT_EMPTY"},
    {ErrorCode::ENCODE_BACKEND_UNAVAILABLE, "ENCODE_BACKEND_UNAVAILABLE"},

    // Split job
    {ErrorCode::SPLIT_INVALID_PARAMETERS, "SPLIT_INVALID_PARAMETERS"},
    {ErrorCode::SPLIT_PROBE_FAILED, "SPLIT_PROBE_FAILED"},
    {ErrorCode::SPLIT_FILE_TOO_SHORT, "SPLIT_FILE_TOO_SHORT"},
    {ErrorCode::SPLIT_NO_SEGMENTS_PRODUCED, "SPLIT_NO_SEGMENTS_PRODUCED"},
    {ErrorCode::SPLIT_OUTPUT_UNAVAILABLE, "SPLIT_OUTPUT_UNAVAILABLE"},
    {ErrorCode::SPLIT_CANCELLED, "SPLIT_CANCELLED"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// Error code to HTTP status mapping
static const std::unordered_map<ErrorCode, int> kHttpStatusMap = {
    {ErrorCode::OK, 200},

    // Input validation
    {ErrorCode::INPUT_INVALID_PARAMETERS, 400},
    {ErrorCode::INPUT_UNSUPPORTED_FORMAT, 415},
    {ErrorCode::INPUT_EMPTY_FILE, 400},
    {ErrorCode::INPUT_FILE_TOO_LARGE, 413},
    {ErrorCode::INPUT_FILE_NOT_FOUND, 404},

    // Probe
    {ErrorCode::PROBE_UNREADABLE, 422},
    {ErrorCode::PROBE_ZERO_DURATION, 422},

    // Plan
    {ErrorCode::PLAN_INVALID_REQUEST, 400},
    {ErrorCode::PLAN_NO_VIABLE_SEGMENTS, 422},

    // Encode
    {ErrorCode::ENCODE_ATTEMPT_FAILED, 500},
    {ErrorCode::ENCODE_ALL_STRATEGIES_FAILED, 500},
    {ErrorCode::ENCODE_TIMEOUT, 504},
    {ErrorCode::ENCODE_CANCELLED, 499},
    {ErrorCode::ENCODE_OUTPUT_EMPTY, 500},
    {ErrorCode::ENCODE_BACKEND_UNAVAILABLE, 503},

    // Split job
    {ErrorCode::SPLIT_INVALID_PARAMETERS, 400},
    {ErrorCode::SPLIT_PROBE_FAILED, 422},
    {ErrorCode::SPLIT_FILE_TOO_SHORT, 422},
    {ErrorCode::SPLIT_NO_SEGMENTS_PRODUCED, 500},
    {ErrorCode::SPLIT_OUTPUT_UNAVAILABLE, 503},
    {ErrorCode::SPLIT_CANCELLED, 499},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, 500},
};

static const std::unordered_map<ErrorCode, const char*> kUserMessages = {
    {ErrorCode::OK, "Audio file was split successfully."},
    {ErrorCode::INPUT_INVALID_PARAMETERS,
     "Segment size must be between 1 and 3600 seconds, or between 1 and 100 megabytes."},
    {ErrorCode::INPUT_UNSUPPORTED_FORMAT,
     "Unsupported file type. Please upload mp3, wav, ogg, m4a, flac, aac or wma."},
    {ErrorCode::INPUT_EMPTY_FILE, "The uploaded file is empty."},
    {ErrorCode::INPUT_FILE_TOO_LARGE, "The uploaded file exceeds the maximum allowed size."},
    {ErrorCode::INPUT_FILE_NOT_FOUND, "The audio file could not be found. Please upload it again."},
    {ErrorCode::PROBE_UNREADABLE,
     "The file could not be read as audio. Please try a different file."},
    {ErrorCode::PROBE_ZERO_DURATION, "The audio file contains no playable audio."},
    {ErrorCode::PLAN_INVALID_REQUEST, "The requested segment size is not valid for this file."},
    {ErrorCode::PLAN_NO_VIABLE_SEGMENTS,
     "The audio file is too short to split with the requested segment size."},
    {ErrorCode::ENCODE_ATTEMPT_FAILED, "An encoding attempt failed."},
    {ErrorCode::ENCODE_ALL_STRATEGIES_FAILED, "A segment could not be encoded in any format."},
    {ErrorCode::ENCODE_TIMEOUT, "A segment took too long to encode."},
    {ErrorCode::ENCODE_CANCELLED, "Encoding was cancelled."},
    {ErrorCode::ENCODE_OUTPUT_EMPTY, "Encoding produced an empty file."},
    {ErrorCode::ENCODE_BACKEND_UNAVAILABLE, "No audio encoder is available on the server."},
    {ErrorCode::SPLIT_INVALID_PARAMETERS,
     "Invalid split parameters. Use 1-3600 seconds or 1-100 megabytes."},
    {ErrorCode::SPLIT_PROBE_FAILED,
     "The file could not be read as audio. Please check the file and try again."},
    {ErrorCode::SPLIT_FILE_TOO_SHORT,
     "The audio file is too short to split with the requested segment size."},
    {ErrorCode::SPLIT_NO_SEGMENTS_PRODUCED,
     "Processing produced no segments. Please try again or use a different file."},
    {ErrorCode::SPLIT_OUTPUT_UNAVAILABLE,
     "The server could not store the split files. Please try again later."},
    {ErrorCode::SPLIT_CANCELLED, "Processing was cancelled before it finished."},
    {ErrorCode::INTERNAL_UNKNOWN, "An unexpected error occurred."},
};

static std::unordered_map<std::string, ErrorCode> buildStringToErrorCode() {
    std::unordered_map<std::string, ErrorCode> map;
    for (const auto& entry : kErrorCodeStrings) {
        map.emplace(entry.second, entry.first);
    }
    return map;
}

// String to error code mapping (reverse of kErrorCodeStrings)
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode =
    buildStringToErrorCode();

InnerError::InnerError(ErrorCode code, const std::string& message)
    : cpp_code(errorCodeToHex(code)), cpp_message(message) {}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isInputError(code)) {
        return "input";
    }
    if (isProbeError(code)) {
        return "probe";
    }
    if (isPlanError(code)) {
        return "plan";
    }
    if (isEncodeError(code)) {
        return "encode";
    }
    if (isSplitError(code)) {
        return "split";
    }
    return "internal";
}

int toHttpStatus(ErrorCode code) {
    auto it = kHttpStatusMap.find(code);
    if (it != kHttpStatusMap.end()) {
        return it->second;
    }
    return 500;  // Default to Internal Server Error
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

const char* userMessage(ErrorCode code) {
    auto it = kUserMessages.find(code);
    if (it != kUserMessages.end()) {
        return it->second;
    }
    return "An unexpected error occurred.";
}

}  // namespace audio_segmenter
