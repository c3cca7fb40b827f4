#include "engine/input_validation.h"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace audio_segmenter {

namespace fs = std::filesystem;

std::string fileExtensionLower(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

ValidationResult validateSplitRequest(const SplitRequest& request,
                                      const SegmenterConfig::LimitsConfig& limits) {
    const int maxValue = request.unit == SplitUnit::Seconds ? limits.maxTargetSeconds
                                                            : limits.maxTargetMegabytes;
    if (request.targetValue < 1 || request.targetValue > maxValue) {
        return {ErrorCode::INPUT_INVALID_PARAMETERS,
                "target value " + std::to_string(request.targetValue) + " " +
                    splitUnitToString(request.unit) + " is outside 1.." +
                    std::to_string(maxValue)};
    }
    return {};
}

ValidationResult validateInputFile(const fs::path& path,
                                   const SegmenterConfig::LimitsConfig& limits) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return {ErrorCode::INPUT_FILE_NOT_FOUND, "input file not found: " + path.string()};
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return {ErrorCode::INPUT_FILE_NOT_FOUND,
                "cannot stat " + path.string() + ": " + ec.message()};
    }
    if (size == 0) {
        return {ErrorCode::INPUT_EMPTY_FILE, "input file is empty: " + path.string()};
    }

    const std::string ext = fileExtensionLower(path);
    const auto& allowed = limits.allowedExtensions;
    if (ext.empty() || std::find(allowed.begin(), allowed.end(), ext) == allowed.end()) {
        return {ErrorCode::INPUT_UNSUPPORTED_FORMAT,
                "unsupported file extension '" + ext + "': " + path.filename().string()};
    }
    if (limits.maxInputBytes > 0 && size > limits.maxInputBytes) {
        return {ErrorCode::INPUT_FILE_TOO_LARGE, "input file is " + std::to_string(size) +
                                                     " bytes, limit is " +
                                                     std::to_string(limits.maxInputBytes)};
    }
    return {};
}

}  // namespace audio_segmenter
