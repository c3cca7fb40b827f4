#include "core/config_loader.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace audio_segmenter {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Normalize ".MP3" / "Mp3" to "mp3"
static std::string normalizeExtension(const std::string& ext) {
    std::string lower = toLower(ext);
    if (!lower.empty() && lower.front() == '.') {
        lower.erase(0, 1);
    }
    return lower;
}

static void loadLimits(const nlohmann::json& section, SegmenterConfig::LimitsConfig& limits) {
    if (section.contains("maxTargetSeconds")) {
        limits.maxTargetSeconds = section["maxTargetSeconds"].get<int>();
    }
    if (section.contains("maxTargetMegabytes")) {
        limits.maxTargetMegabytes = section["maxTargetMegabytes"].get<int>();
    }
    if (section.contains("maxInputBytes")) {
        limits.maxInputBytes = section["maxInputBytes"].get<uint64_t>();
    }
    if (section.contains("allowedExtensions") && section["allowedExtensions"].is_array()) {
        limits.allowedExtensions.clear();
        for (const auto& ext : section["allowedExtensions"]) {
            if (ext.is_string()) {
                limits.allowedExtensions.push_back(normalizeExtension(ext.get<std::string>()));
            }
        }
    }
}

static void loadPlanner(const nlohmann::json& section, SegmenterConfig::PlannerConfig& planner) {
    if (section.contains("minSegmentMs")) {
        planner.minSegmentMs = section["minSegmentMs"].get<int64_t>();
    }
    if (section.contains("minSizeSegmentMs")) {
        planner.minSizeSegmentMs = section["minSizeSegmentMs"].get<int64_t>();
    }
    if (section.contains("largeFileThresholdBytes")) {
        planner.largeFileThresholdBytes = section["largeFileThresholdBytes"].get<uint64_t>();
    }
    if (section.contains("largeFileSegmentCap")) {
        planner.largeFileSegmentCap = section["largeFileSegmentCap"].get<int>();
    }
    if (section.contains("sizeSafetyMargin")) {
        planner.sizeSafetyMargin = section["sizeSafetyMargin"].get<double>();
    }
    if (section.contains("defaultBitrate")) {
        planner.defaultBitrate = section["defaultBitrate"].get<int64_t>();
    }
}

static void loadEncoder(const nlohmann::json& section, SegmenterConfig::EncoderConfig& encoder) {
    if (section.contains("ffmpegPath") && section["ffmpegPath"].is_string()) {
        encoder.ffmpegPath = section["ffmpegPath"].get<std::string>();
    }
    if (section.contains("ffprobePath") && section["ffprobePath"].is_string()) {
        encoder.ffprobePath = section["ffprobePath"].get<std::string>();
    }
    if (section.contains("largeInputThresholdBytes")) {
        encoder.largeInputThresholdBytes = section["largeInputThresholdBytes"].get<uint64_t>();
    }
    if (section.contains("standardBitrateKbps")) {
        encoder.standardBitrateKbps = section["standardBitrateKbps"].get<int>();
    }
    if (section.contains("largeInputBitrateKbps")) {
        encoder.largeInputBitrateKbps = section["largeInputBitrateKbps"].get<int>();
    }
    if (section.contains("largeInputSampleRate")) {
        encoder.largeInputSampleRate = section["largeInputSampleRate"].get<int>();
    }
    if (section.contains("nativePcmFallback")) {
        encoder.nativePcmFallback = section["nativePcmFallback"].get<bool>();
    }
    if (section.contains("segmentTimeoutMs")) {
        encoder.segmentTimeoutMs = section["segmentTimeoutMs"].get<int>();
    }
    if (section.contains("probeTimeoutMs")) {
        encoder.probeTimeoutMs = section["probeTimeoutMs"].get<int>();
    }
}

static void loadWorkers(const nlohmann::json& section, SegmenterConfig::WorkerConfig& workers) {
    if (section.contains("maxWorkers")) {
        workers.maxWorkers = section["maxWorkers"].get<int>();
    }
    if (section.contains("jobTimeoutMs")) {
        workers.jobTimeoutMs = section["jobTimeoutMs"].get<int>();
    }
}

int sanitizeSegmenterConfig(SegmenterConfig& config, bool verbose) {
    const SegmenterConfig defaults;
    int corrections = 0;

    auto correct = [&](const char* key, auto& field, const auto& fallback) {
        if (verbose) {
            LOG_WARN("Config: {} out of range, using default {}", key, fallback);
        }
        field = fallback;
        ++corrections;
    };

    if (config.limits.maxTargetSeconds <= 0) {
        correct("limits.maxTargetSeconds", config.limits.maxTargetSeconds,
                defaults.limits.maxTargetSeconds);
    }
    if (config.limits.maxTargetMegabytes <= 0) {
        correct("limits.maxTargetMegabytes", config.limits.maxTargetMegabytes,
                defaults.limits.maxTargetMegabytes);
    }
    if (config.limits.allowedExtensions.empty()) {
        if (verbose) {
            LOG_WARN("Config: limits.allowedExtensions is empty, using defaults");
        }
        config.limits.allowedExtensions = defaults.limits.allowedExtensions;
        ++corrections;
    }
    if (config.planner.minSegmentMs <= 0) {
        correct("planner.minSegmentMs", config.planner.minSegmentMs,
                defaults.planner.minSegmentMs);
    }
    if (config.planner.minSizeSegmentMs < config.planner.minSegmentMs) {
        correct("planner.minSizeSegmentMs", config.planner.minSizeSegmentMs,
                std::max(defaults.planner.minSizeSegmentMs, config.planner.minSegmentMs));
    }
    if (config.planner.largeFileSegmentCap <= 0) {
        correct("planner.largeFileSegmentCap", config.planner.largeFileSegmentCap,
                defaults.planner.largeFileSegmentCap);
    }
    if (!(config.planner.sizeSafetyMargin > 0.0 && config.planner.sizeSafetyMargin <= 1.0)) {
        correct("planner.sizeSafetyMargin", config.planner.sizeSafetyMargin,
                defaults.planner.sizeSafetyMargin);
    }
    if (config.planner.defaultBitrate <= 0) {
        correct("planner.defaultBitrate", config.planner.defaultBitrate,
                defaults.planner.defaultBitrate);
    }
    if (config.encoder.ffmpegPath.empty()) {
        correct("encoder.ffmpegPath", config.encoder.ffmpegPath, defaults.encoder.ffmpegPath);
    }
    if (config.encoder.ffprobePath.empty()) {
        correct("encoder.ffprobePath", config.encoder.ffprobePath, defaults.encoder.ffprobePath);
    }
    if (config.encoder.standardBitrateKbps <= 0) {
        correct("encoder.standardBitrateKbps", config.encoder.standardBitrateKbps,
                defaults.encoder.standardBitrateKbps);
    }
    if (config.encoder.largeInputBitrateKbps <= 0) {
        correct("encoder.largeInputBitrateKbps", config.encoder.largeInputBitrateKbps,
                defaults.encoder.largeInputBitrateKbps);
    }
    if (config.encoder.largeInputSampleRate < 8000) {
        correct("encoder.largeInputSampleRate", config.encoder.largeInputSampleRate,
                defaults.encoder.largeInputSampleRate);
    }
    if (config.encoder.segmentTimeoutMs < 0) {
        correct("encoder.segmentTimeoutMs", config.encoder.segmentTimeoutMs,
                defaults.encoder.segmentTimeoutMs);
    }
    if (config.encoder.probeTimeoutMs <= 0) {
        correct("encoder.probeTimeoutMs", config.encoder.probeTimeoutMs,
                defaults.encoder.probeTimeoutMs);
    }
    if (config.workers.maxWorkers < 0) {
        correct("workers.maxWorkers", config.workers.maxWorkers, defaults.workers.maxWorkers);
    }
    if (config.workers.jobTimeoutMs < 0) {
        correct("workers.jobTimeoutMs", config.workers.jobTimeoutMs,
                defaults.workers.jobTimeoutMs);
    }

    return corrections;
}

bool loadSegmenterConfig(const std::filesystem::path& configPath, SegmenterConfig& outConfig,
                         bool verbose) {
    outConfig = SegmenterConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cerr << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("limits") && j["limits"].is_object()) {
            loadLimits(j["limits"], outConfig.limits);
        }
        if (j.contains("planner") && j["planner"].is_object()) {
            loadPlanner(j["planner"], outConfig.planner);
        }
        if (j.contains("encoder") && j["encoder"].is_object()) {
            loadEncoder(j["encoder"], outConfig.encoder);
        }
        if (j.contains("workers") && j["workers"].is_object()) {
            loadWorkers(j["workers"], outConfig.workers);
        }
    } catch (const nlohmann::json::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = SegmenterConfig{};
        return false;
    }

    sanitizeSegmenterConfig(outConfig, verbose);

    if (verbose) {
        LOG_INFO(
            "Config: loaded {} (limits {}s/{}MB, large file > {} bytes capped at {} segments, "
            "workers={})",
            configPath.string(), outConfig.limits.maxTargetSeconds,
            outConfig.limits.maxTargetMegabytes, outConfig.planner.largeFileThresholdBytes,
            outConfig.planner.largeFileSegmentCap, outConfig.workers.maxWorkers);
    }
    return true;
}

}  // namespace audio_segmenter
