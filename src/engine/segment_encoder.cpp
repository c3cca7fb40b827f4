#include "engine/segment_encoder.h"

#include "logging/logger.h"

#include <chrono>
#include <cstdio>
#include <system_error>
#include <utility>

namespace audio_segmenter {

namespace fs = std::filesystem;

namespace {

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARN("Encoder: could not remove {}: {}", path.string(), ec.message());
    }
}

}  // namespace

const char* encodeStatusToString(EncodeStatus status) {
    switch (status) {
    case EncodeStatus::Ok:
        return "ok";
    case EncodeStatus::AllStrategiesFailed:
        return "all_strategies_failed";
    case EncodeStatus::TimedOut:
        return "timed_out";
    case EncodeStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

ErrorCode toErrorCode(EncodeStatus status) {
    switch (status) {
    case EncodeStatus::Ok:
        return ErrorCode::OK;
    case EncodeStatus::TimedOut:
        return ErrorCode::ENCODE_TIMEOUT;
    case EncodeStatus::Cancelled:
        return ErrorCode::ENCODE_CANCELLED;
    case EncodeStatus::AllStrategiesFailed:
        return ErrorCode::ENCODE_ALL_STRATEGIES_FAILED;
    }
    return ErrorCode::ENCODE_ALL_STRATEGIES_FAILED;
}

std::string sanitizeBaseName(const std::string& fileNameOrPath) {
    std::string stem = fs::path(fileNameOrPath).stem().string();
    for (char& c : stem) {
        const bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                             (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
        if (!allowed) {
            c = '_';
        }
    }
    if (stem.empty() || stem.find_first_not_of('.') == std::string::npos) {
        return "audio";
    }
    return stem;
}

std::string formatSegmentFileName(const std::string& baseName, int partNumber,
                                  const std::string& extension) {
    char part[16];
    std::snprintf(part, sizeof(part), "%02d", partNumber);
    return baseName + "_part" + part + "." + extension;
}

SegmentEncoder::SegmentEncoder(SegmenterConfig::EncoderConfig config,
                               std::vector<std::shared_ptr<EncodeBackend>> backends)
    : config_(std::move(config)), backends_(std::move(backends)) {}

EncodeLadder SegmentEncoder::ladderFor(const SourceAudio& source) const {
    return buildEncodeLadder(source, config_);
}

const EncodeBackend* SegmentEncoder::backendFor(EncoderKind kind) const {
    for (const auto& backend : backends_) {
        if (backend && backend->kind() == kind) {
            return backend.get();
        }
    }
    return nullptr;
}

SegmentEncodeResult SegmentEncoder::encode(const SourceAudio& source, const SegmentRange& range,
                                           const fs::path& outputDir,
                                           const std::atomic<bool>* cancelFlag) const {
    return encodeWithLadder(source, range, outputDir, ladderFor(source), cancelFlag);
}

SegmentEncodeResult SegmentEncoder::encodeWithLadder(const SourceAudio& source,
                                                     const SegmentRange& range,
                                                     const fs::path& outputDir,
                                                     const EncodeLadder& ladder,
                                                     const std::atomic<bool>* cancelFlag) const {
    SegmentEncodeResult result;
    const std::string baseName = sanitizeBaseName(source.path);
    const int partNumber = range.index + 1;

    const bool hasBudget = config_.segmentTimeoutMs > 0;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.segmentTimeoutMs);

    for (size_t rung = 0; rung < ladder.size(); ++rung) {
        const EncodeStrategy& strategy = ladder[rung];

        if (cancelFlag && cancelFlag->load()) {
            result.status = EncodeStatus::Cancelled;
            result.causes.push_back({strategy.name, ErrorCode::ENCODE_CANCELLED,
                                     "cancelled before attempt"});
            return result;
        }

        AttemptControl control;
        control.cancelFlag = cancelFlag;
        if (hasBudget) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  deadline - std::chrono::steady_clock::now())
                                  .count();
            if (left <= 0) {
                result.status = EncodeStatus::TimedOut;
                result.causes.push_back({strategy.name, ErrorCode::ENCODE_TIMEOUT,
                                         "segment time budget exhausted"});
                return result;
            }
            control.timeoutMs = static_cast<int>(left);
        }

        const EncodeBackend* backend = backendFor(strategy.backend);
        if (!backend) {
            result.causes.push_back({strategy.name, ErrorCode::ENCODE_BACKEND_UNAVAILABLE,
                                     std::string("no ") + encoderKindToString(strategy.backend) +
                                         " backend configured"});
            continue;
        }

        const std::string extension = outputFormatExtension(strategy.format);
        const std::string fileName = formatSegmentFileName(baseName, partNumber, extension);
        const fs::path finalPath = outputDir / fileName;
        const fs::path partialPath = fs::path(finalPath.string() + ".partial");
        removeQuietly(partialPath);

        const AttemptResult attempt =
            backend->encode(source, range, strategy, partialPath.string(), control);

        if (attempt.status == AttemptStatus::Cancelled) {
            removeQuietly(partialPath);
            result.status = EncodeStatus::Cancelled;
            result.causes.push_back({strategy.name, ErrorCode::ENCODE_CANCELLED, attempt.message});
            return result;
        }
        if (attempt.status == AttemptStatus::TimedOut) {
            removeQuietly(partialPath);
            LOG_WARN("Encoder: #{} {} timed out: {}", partNumber, strategy.name, attempt.message);
            result.status = EncodeStatus::TimedOut;
            result.causes.push_back({strategy.name, ErrorCode::ENCODE_TIMEOUT, attempt.message});
            return result;
        }
        if (attempt.status != AttemptStatus::Ok) {
            removeQuietly(partialPath);
            LOG_WARN("Encoder: #{} {} failed: {}", partNumber, strategy.name, attempt.message);
            result.causes.push_back(
                {strategy.name, ErrorCode::ENCODE_ATTEMPT_FAILED, attempt.message});
            continue;
        }

        std::error_code ec;
        const auto size = fs::file_size(partialPath, ec);
        if (ec || size == 0) {
            removeQuietly(partialPath);
            const std::string reason = ec ? "output missing: " + ec.message() : "output is empty";
            LOG_WARN("Encoder: #{} {} {}", partNumber, strategy.name, reason);
            result.causes.push_back({strategy.name, ErrorCode::ENCODE_OUTPUT_EMPTY, reason});
            continue;
        }

        fs::rename(partialPath, finalPath, ec);
        if (ec) {
            removeQuietly(partialPath);
            const std::string reason = "rename failed: " + ec.message();
            LOG_WARN("Encoder: #{} {} {}", partNumber, strategy.name, reason);
            result.causes.push_back({strategy.name, ErrorCode::ENCODE_ATTEMPT_FAILED, reason});
            continue;
        }

        if (rung > 0) {
            LOG_INFO("Encoder: #{} succeeded with fallback {} after {} failed attempt(s)",
                     partNumber, strategy.name, result.causes.size());
        }

        EncodedSegment segment;
        segment.fileName = fileName;
        segment.path = finalPath.string();
        segment.sizeBytes = size;
        segment.strategyIndex = static_cast<int>(rung);
        segment.strategyName = strategy.name;
        segment.format = extension;
        segment.range = range;

        result.status = EncodeStatus::Ok;
        result.segment = segment;
        return result;
    }

    result.status = EncodeStatus::AllStrategiesFailed;
    return result;
}

}  // namespace audio_segmenter
