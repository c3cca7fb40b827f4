#include "engine/duration_prober.h"

#include "audio/audio_io.h"
#include "logging/logger.h"
#include "process/process_runner.h"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

namespace audio_segmenter {

namespace {

// ffprobe emits most numbers as strings ("65.018776"); accept both
std::optional<double> numberField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) {
        return std::nullopt;
    }
    const auto& value = obj[key];
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (end != text.c_str() && *end == '\0' && std::isfinite(parsed)) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::string stringField(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

ProbeResult failure(ProbeStatus status, ErrorCode code, const std::string& message) {
    ProbeResult result;
    result.status = status;
    result.message = message;
    result.inner = InnerError(code, message);
    return result;
}

}  // namespace

const char* probeStatusToString(ProbeStatus status) {
    switch (status) {
    case ProbeStatus::Ok:
        return "ok";
    case ProbeStatus::Unreadable:
        return "unreadable";
    case ProbeStatus::ZeroDuration:
        return "zero_duration";
    }
    return "unknown";
}

ErrorCode toErrorCode(ProbeStatus status) {
    switch (status) {
    case ProbeStatus::Ok:
        return ErrorCode::OK;
    case ProbeStatus::ZeroDuration:
        return ErrorCode::PROBE_ZERO_DURATION;
    case ProbeStatus::Unreadable:
        return ErrorCode::PROBE_UNREADABLE;
    }
    return ErrorCode::PROBE_UNREADABLE;
}

ProbeResult parseFfprobeOutput(const std::string& jsonText, const std::string& path,
                               uint64_t sizeBytes) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        return failure(ProbeStatus::Unreadable, ErrorCode::PROBE_UNREADABLE,
                       std::string("invalid ffprobe output: ") + e.what());
    }

    const nlohmann::json* audioStream = nullptr;
    if (root.contains("streams") && root["streams"].is_array()) {
        for (const auto& stream : root["streams"]) {
            if (stringField(stream, "codec_type") == "audio") {
                audioStream = &stream;
                break;
            }
        }
    }
    if (!audioStream) {
        return failure(ProbeStatus::Unreadable, ErrorCode::PROBE_UNREADABLE,
                       "no audio stream in " + path);
    }

    const nlohmann::json format =
        root.contains("format") ? root["format"] : nlohmann::json::object();

    std::optional<double> durationSec = numberField(format, "duration");
    if (!durationSec) {
        durationSec = numberField(*audioStream, "duration");
    }

    SourceAudio source;
    source.path = path;
    source.sizeBytes = sizeBytes;
    source.totalDurationMs =
        durationSec ? static_cast<int64_t>(std::llround(*durationSec * 1000.0)) : 0;

    // format_name may be a list ("mov,mp4,m4a,3gp,3g2,mj2"); keep the first entry
    const std::string formatName = stringField(format, "format_name");
    source.containerFormat = formatName.substr(0, formatName.find(','));
    source.codecName = stringField(*audioStream, "codec_name");
    source.channels = static_cast<int>(numberField(*audioStream, "channels").value_or(0.0));
    source.sampleRate = static_cast<int>(numberField(*audioStream, "sample_rate").value_or(0.0));

    std::optional<double> bitrate = numberField(*audioStream, "bit_rate");
    if (!bitrate || *bitrate <= 0.0) {
        bitrate = numberField(format, "bit_rate");
    }
    source.bitrate = bitrate && *bitrate > 0.0 ? static_cast<int64_t>(*bitrate) : 0;

    if (source.totalDurationMs <= 0) {
        return failure(ProbeStatus::ZeroDuration, ErrorCode::PROBE_ZERO_DURATION,
                       "ffprobe reports zero duration for " + path);
    }

    ProbeResult result;
    result.status = ProbeStatus::Ok;
    result.source = source;
    return result;
}

ProbeResult probeWithSndfile(const std::string& path, uint64_t sizeBytes) {
    AudioIO::SndfileReader reader;
    if (!reader.open(path)) {
        return failure(ProbeStatus::Unreadable, ErrorCode::PROBE_UNREADABLE,
                       "libsndfile cannot decode " + path + ": " + reader.lastError());
    }

    SourceAudio source;
    source.path = path;
    source.sizeBytes = sizeBytes;
    source.totalDurationMs = reader.getDurationMs();
    source.containerFormat = reader.formatExtension();
    source.codecName = reader.subtypeName();
    source.channels = reader.getChannels();
    source.sampleRate = reader.getSampleRate();

    if (source.totalDurationMs <= 0) {
        return failure(ProbeStatus::ZeroDuration, ErrorCode::PROBE_ZERO_DURATION,
                       "no audio frames in " + path);
    }
    source.bitrate = static_cast<int64_t>(sizeBytes * 8ULL * 1000ULL /
                                          static_cast<uint64_t>(source.totalDurationMs));

    ProbeResult result;
    result.status = ProbeStatus::Ok;
    result.source = source;
    return result;
}

DurationProber::DurationProber(SegmenterConfig::EncoderConfig config)
    : config_(std::move(config)) {}

ProbeResult DurationProber::probeWithFfprobe(const std::string& path, uint64_t sizeBytes) const {
    const std::vector<std::string> args = {config_.ffprobePath, "-v",          "error",
                                           "-print_format",     "json",        "-show_format",
                                           "-show_streams",     path};

    process::ProcessOptions options;
    options.timeoutMs = config_.probeTimeoutMs;
    const auto run = process::runProcess(args, options);
    if (!run.succeeded()) {
        std::string reason = run.message;
        if (run.status == process::ProcessStatus::Exited) {
            reason = config_.ffprobePath + " exited with code " + std::to_string(run.exitCode);
            const std::string detail = process::lastLine(run.stderrData);
            if (!detail.empty()) {
                reason += ": " + detail;
            }
        }
        ProbeResult result =
            failure(ProbeStatus::Unreadable, ErrorCode::PROBE_UNREADABLE, reason);
        result.inner.tool = config_.ffprobePath;
        if (run.status == process::ProcessStatus::Exited) {
            result.inner.exit_code = run.exitCode;
        }
        return result;
    }
    return parseFfprobeOutput(run.stdoutData, path, sizeBytes);
}

ProbeResult DurationProber::probe(const std::string& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return failure(ProbeStatus::Unreadable, ErrorCode::PROBE_UNREADABLE,
                       "file not found: " + path);
    }
    const uint64_t sizeBytes = std::filesystem::file_size(path, ec);
    if (ec) {
        return failure(ProbeStatus::Unreadable, ErrorCode::PROBE_UNREADABLE,
                       "cannot stat " + path + ": " + ec.message());
    }
    if (sizeBytes == 0) {
        return failure(ProbeStatus::Unreadable, ErrorCode::PROBE_UNREADABLE,
                       "file is empty: " + path);
    }

    ProbeResult primary = probeWithFfprobe(path, sizeBytes);
    if (primary.ok()) {
        LOG_DEBUG("Probe: {} -> {} ms, {} bytes, {} bps ({}/{})", path,
                  primary.source->totalDurationMs, sizeBytes, primary.source->bitrate,
                  primary.source->containerFormat, primary.source->codecName);
        return primary;
    }

    LOG_DEBUG("Probe: ffprobe failed for {} ({}), trying libsndfile", path, primary.message);
    ProbeResult fallback = probeWithSndfile(path, sizeBytes);
    if (fallback.ok()) {
        LOG_DEBUG("Probe: {} -> {} ms via libsndfile", path, fallback.source->totalDurationMs);
        return fallback;
    }

    // A zero-duration verdict from either tool is more specific than "unreadable"
    if (fallback.status == ProbeStatus::ZeroDuration &&
        primary.status != ProbeStatus::ZeroDuration) {
        return fallback;
    }
    return primary;
}

std::shared_ptr<AudioProber> createDurationProber(const SegmenterConfig::EncoderConfig& config) {
    return std::make_shared<DurationProber>(config);
}

}  // namespace audio_segmenter
