#include "engine/segmentation_orchestrator.h"

#include "engine/encode_backend.h"
#include "engine/input_validation.h"
#include "engine/segment_planner.h"
#include "logging/logger.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace audio_segmenter {

namespace fs = std::filesystem;

const char* jobStateToString(JobState state) {
    switch (state) {
    case JobState::Probing:
        return "probing";
    case JobState::Planning:
        return "planning";
    case JobState::Encoding:
        return "encoding";
    case JobState::Aggregating:
        return "aggregating";
    case JobState::Done:
        return "done";
    case JobState::Error:
        return "error";
    }
    return "unknown";
}

SegmentationOrchestrator::SegmentationOrchestrator(SegmenterConfig config,
                                                   std::shared_ptr<AudioProber> prober,
                                                   std::shared_ptr<SegmentEncoder> encoder)
    : config_(std::move(config)), prober_(std::move(prober)), encoder_(std::move(encoder)) {}

SegmentationOrchestrator::SegmentationOrchestrator(SegmenterConfig config)
    : config_(std::move(config)),
      prober_(createDurationProber(config_.encoder)),
      encoder_(std::make_shared<SegmentEncoder>(config_.encoder,
                                                createEncodeBackends(config_.encoder))) {}

void SegmentationOrchestrator::setStateCallback(StateCallback callback) {
    stateCallback_ = std::move(callback);
}

void SegmentationOrchestrator::notify(JobState state, const std::string& detail) const {
    LOG_DEBUG("Job: {} {}", jobStateToString(state), detail);
    if (stateCallback_) {
        stateCallback_(state, detail);
    }
}

SplitOutcome SegmentationOrchestrator::fail(ErrorCode code, const InnerError& inner,
                                            const std::string& message) const {
    SplitOutcome outcome;
    outcome.code = code;
    outcome.message = message.empty() ? userMessage(code) : message;
    outcome.inner = inner;
    outcome.finalState = JobState::Error;
    LOG_ERROR("Job failed: {} ({}): {}", errorCodeToString(code), inner.cpp_code,
              inner.cpp_message);
    notify(JobState::Error, errorCodeToString(code));
    return outcome;
}

int SegmentationOrchestrator::workerCountFor(size_t rangeCount) const {
    int workers = config_.workers.maxWorkers;
    if (workers <= 0) {
        workers = static_cast<int>(std::thread::hardware_concurrency());
    }
    workers = std::max(workers, 1);
    if (rangeCount > 0 && static_cast<size_t>(workers) > rangeCount) {
        workers = static_cast<int>(rangeCount);
    }
    return workers;
}

SplitOutcome SegmentationOrchestrator::split(const std::string& sourcePath,
                                             const std::string& outputDir, int targetValue,
                                             const std::string& unit,
                                             const std::atomic<bool>* cancelFlag) const {
    const auto parsed = parseSplitUnit(unit);
    if (!parsed) {
        return fail(ErrorCode::SPLIT_INVALID_PARAMETERS,
                    InnerError(ErrorCode::INPUT_INVALID_PARAMETERS, "unknown unit '" + unit + "'"));
    }
    SplitRequest request;
    request.unit = *parsed;
    request.targetValue = targetValue;
    return split(sourcePath, outputDir, request, cancelFlag);
}

SplitOutcome SegmentationOrchestrator::split(const std::string& sourcePath,
                                             const std::string& outputDir,
                                             const SplitRequest& request,
                                             const std::atomic<bool>* cancelFlag) const {
    const auto jobStart = std::chrono::steady_clock::now();
    LOG_INFO("Job: split {} into {} {} segments -> {}", sourcePath, request.targetValue,
             splitUnitToString(request.unit), outputDir);

    // Validation
    const auto requestCheck = validateSplitRequest(request, config_.limits);
    if (!requestCheck.ok()) {
        return fail(ErrorCode::SPLIT_INVALID_PARAMETERS,
                    InnerError(requestCheck.code, requestCheck.message));
    }
    const auto fileCheck = validateInputFile(sourcePath, config_.limits);
    if (!fileCheck.ok()) {
        const InnerError inner(fileCheck.code, fileCheck.message);
        // Missing or empty files cannot be probed; everything else is a bad request
        if (fileCheck.code == ErrorCode::INPUT_FILE_NOT_FOUND ||
            fileCheck.code == ErrorCode::INPUT_EMPTY_FILE) {
            return fail(ErrorCode::SPLIT_PROBE_FAILED, inner);
        }
        return fail(ErrorCode::SPLIT_INVALID_PARAMETERS, inner, userMessage(fileCheck.code));
    }

    // Probe
    notify(JobState::Probing, sourcePath);
    if (!prober_) {
        return fail(ErrorCode::SPLIT_PROBE_FAILED,
                    InnerError(ErrorCode::PROBE_UNREADABLE, "no prober configured"));
    }
    const ProbeResult probe = prober_->probe(sourcePath);
    if (!probe.ok()) {
        InnerError inner = probe.inner;
        if (inner.cpp_code.empty()) {
            inner = InnerError(toErrorCode(probe.status), probe.message);
        }
        return fail(ErrorCode::SPLIT_PROBE_FAILED, inner);
    }
    const SourceAudio& source = *probe.source;

    // Plan
    notify(JobState::Planning, std::to_string(source.totalDurationMs) + " ms");
    const PlanResult plan = planSegments(source, request, config_.planner);
    if (!plan.ok()) {
        const ErrorCode code = plan.status == PlanStatus::NoViableSegments
                                   ? ErrorCode::SPLIT_FILE_TOO_SHORT
                                   : ErrorCode::SPLIT_INVALID_PARAMETERS;
        return fail(code, InnerError(toErrorCode(plan.status), plan.message));
    }
    const auto& ranges = plan.plan.ranges;

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec || !fs::is_directory(outputDir)) {
        const std::string reason =
            "cannot create output directory " + outputDir + (ec ? ": " + ec.message() : "");
        return fail(ErrorCode::SPLIT_OUTPUT_UNAVAILABLE,
                    InnerError(ErrorCode::SPLIT_OUTPUT_UNAVAILABLE, reason));
    }
    if (!encoder_) {
        return fail(ErrorCode::SPLIT_NO_SEGMENTS_PRODUCED,
                    InnerError(ErrorCode::ENCODE_BACKEND_UNAVAILABLE, "no encoder configured"));
    }

    // Encode
    const int workerCount = workerCountFor(ranges.size());
    notify(JobState::Encoding, std::to_string(ranges.size()) + " range(s) on " +
                                   std::to_string(workerCount) + " worker(s)");

    const bool hasJobBudget = config_.workers.jobTimeoutMs > 0;
    const auto jobDeadline = jobStart + std::chrono::milliseconds(config_.workers.jobTimeoutMs);

    std::vector<SegmentEncodeResult> results(ranges.size());
    std::atomic<size_t> nextRange{0};

    auto worker = [&]() {
        while (true) {
            const size_t i = nextRange.fetch_add(1);
            if (i >= ranges.size()) {
                return;
            }
            SegmentEncodeResult& slot = results[i];
            if (hasJobBudget && std::chrono::steady_clock::now() >= jobDeadline) {
                slot.status = EncodeStatus::TimedOut;
                slot.causes.push_back(
                    {"", ErrorCode::ENCODE_TIMEOUT, "job time budget exhausted before start"});
                continue;
            }
            try {
                slot = encoder_->encode(source, ranges[i], outputDir, cancelFlag);
            } catch (const std::exception& e) {
                LOG_ERROR("Job: range #{} raised: {}", ranges[i].index + 1, e.what());
                slot = SegmentEncodeResult{};
                slot.causes.push_back({"", ErrorCode::INTERNAL_UNKNOWN, e.what()});
            }
        }
    };

    if (workerCount <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(workerCount));
        try {
            for (int t = 0; t < workerCount; ++t) {
                threads.emplace_back(worker);
            }
        } catch (const std::system_error& e) {
            // Ranges left over are picked up by the calling thread
            LOG_WARN("Job: started {} of {} worker thread(s): {}", threads.size(), workerCount,
                     e.what());
            worker();
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    // Aggregate in plan order, whatever order workers finished in
    notify(JobState::Aggregating, std::string());
    SplitManifest manifest;
    manifest.plannedCount = static_cast<int>(ranges.size());
    for (size_t i = 0; i < ranges.size(); ++i) {
        SegmentEncodeResult& result = results[i];
        if (result.ok()) {
            manifest.totalSizeBytes += result.segment->sizeBytes;
            manifest.segments.push_back(std::move(*result.segment));
            continue;
        }
        SegmentFailure failure;
        failure.range = ranges[i];
        failure.code = toErrorCode(result.status);
        failure.causes = std::move(result.causes);
        LOG_WARN("Job: range #{} [{}, {}) produced no output ({})", ranges[i].index + 1,
                 ranges[i].startMs, ranges[i].endMs, errorCodeToString(failure.code));
        manifest.failures.push_back(std::move(failure));
    }
    manifest.segmentCount = static_cast<int>(manifest.segments.size());
    manifest.status =
        manifest.segments.empty() ? ManifestStatus::Empty : ManifestStatus::Complete;
    manifest.processingDurationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - jobStart)
                                        .count();

    if (cancelFlag && cancelFlag->load()) {
        return fail(ErrorCode::SPLIT_CANCELLED,
                    InnerError(ErrorCode::ENCODE_CANCELLED,
                               "cancelled with " + std::to_string(manifest.segmentCount) + "/" +
                                   std::to_string(manifest.plannedCount) + " segment(s) written"));
    }

    if (manifest.segments.empty()) {
        InnerError inner(ErrorCode::ENCODE_ALL_STRATEGIES_FAILED,
                         "none of " + std::to_string(manifest.plannedCount) +
                             " range(s) could be encoded");
        if (!manifest.failures.empty() && !manifest.failures.front().causes.empty()) {
            const auto& last = manifest.failures.front().causes.back();
            inner.strategy = last.strategy;
            inner.cpp_message += "; last error: " + last.reason;
        }
        return fail(ErrorCode::SPLIT_NO_SEGMENTS_PRODUCED, inner);
    }

    LOG_INFO("Job: wrote {}/{} segment(s), {} bytes in {} ms", manifest.segmentCount,
             manifest.plannedCount, manifest.totalSizeBytes, manifest.processingDurationMs);

    SplitOutcome outcome;
    outcome.code = ErrorCode::OK;
    outcome.message = userMessage(ErrorCode::OK);
    outcome.manifest = std::move(manifest);
    outcome.finalState = JobState::Done;
    notify(JobState::Done, std::to_string(outcome.manifest->segmentCount) + " segment(s)");
    return outcome;
}

}  // namespace audio_segmenter
