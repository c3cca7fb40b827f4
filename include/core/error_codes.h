#ifndef CORE_ERROR_CODES_H
#define CORE_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <string>

namespace audio_segmenter {

/**
 * @brief Error codes for the segmentation engine.
 *
 * Categories use upper 4 bits of the low 16 (0xF000 mask):
 * - 0x1xxx: Input validation
 * - 0x2xxx: Probe
 * - 0x3xxx: Plan
 * - 0x4xxx: Encode (per segment)
 * - 0x5xxx: Split job (what the caller sees)
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Input validation (0x1000)
    INPUT_INVALID_PARAMETERS = 0x1001,
    INPUT_UNSUPPORTED_FORMAT = 0x1002,
    INPUT_EMPTY_FILE = 0x1003,
    INPUT_FILE_TOO_LARGE = 0x1004,
    INPUT_FILE_NOT_FOUND = 0x1005,

    // Probe (0x2000)
    PROBE_UNREADABLE = 0x2001,
    PROBE_ZERO_DURATION = 0x2002,

    // Plan (0x3000)
    PLAN_INVALID_REQUEST = 0x3001,
    PLAN_NO_VIABLE_SEGMENTS = 0x3002,

    // Encode (0x4000)
    ENCODE_ATTEMPT_FAILED = 0x4001,
    ENCODE_ALL_STRATEGIES_FAILED = 0x4002,
    ENCODE_TIMEOUT = 0x4003,
    ENCODE_CANCELLED = 0x4004,
    ENCODE_OUTPUT_EMPTY = 0x4005,
    ENCODE_BACKEND_UNAVAILABLE = 0x4006,

    // Split job (0x5000)
    SPLIT_INVALID_PARAMETERS = 0x5001,
    SPLIT_PROBE_FAILED = 0x5002,
    SPLIT_FILE_TOO_SHORT = 0x5003,
    SPLIT_NO_SEGMENTS_PRODUCED = 0x5004,
    SPLIT_OUTPUT_UNAVAILABLE = 0x5005,
    SPLIT_CANCELLED = 0x5006,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Inner error details from lower layers.
 *
 * Used to propagate detailed error information from ffmpeg/ffprobe, libsndfile, etc.
 * Never shown to end users as-is; see userMessage() for the user-facing text.
 */
struct InnerError {
    std::string cpp_code;                 // Error code as hex string (e.g., "0x2001")
    std::string cpp_message;              // Detailed C++ error message
    std::optional<std::string> tool;      // External tool or library ("ffprobe", "libsndfile")
    std::optional<int> exit_code;         // Exit status of the external tool
    std::optional<std::string> strategy;  // Ladder rung that produced the error

    // Default constructor
    InnerError() = default;

    // Convenience constructor for simple errors
    InnerError(ErrorCode code, const std::string& message);
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "SPLIT_FILE_TOO_SHORT"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "probe"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to HTTP status code.
 * @param code The error code
 * @return HTTP status code (e.g., 400, 422, 500), or 500 for unknown codes
 */
int toHttpStatus(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x5003")
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @param str Error code string (e.g., "SPLIT_PROBE_FAILED")
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

/**
 * @brief Actionable, user-facing reason for an error code.
 *
 * Safe to return to clients; contains no paths or tool output.
 */
const char* userMessage(ErrorCode code);

// Category check helpers
constexpr bool isInputError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isProbeError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isPlanError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isEncodeError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isSplitError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if error is retryable.
 * @param code Error code
 * @return true if submitting the same job again may succeed
 *
 * Retryable errors:
 * - ENCODE_TIMEOUT
 * - SPLIT_NO_SEGMENTS_PRODUCED
 * - SPLIT_OUTPUT_UNAVAILABLE
 * - SPLIT_CANCELLED
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::ENCODE_TIMEOUT || code == ErrorCode::SPLIT_NO_SEGMENTS_PRODUCED ||
           code == ErrorCode::SPLIT_OUTPUT_UNAVAILABLE || code == ErrorCode::SPLIT_CANCELLED;
}

}  // namespace audio_segmenter

#endif  // CORE_ERROR_CODES_H
