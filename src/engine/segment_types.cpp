#include "engine/segment_types.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace audio_segmenter {

namespace {

std::string toLower(std::string_view value) {
    std::string out{value};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::optional<SplitUnit> parseSplitUnit(std::string_view str) {
    const std::string lower = toLower(str);
    if (lower == "seconds" || lower == "second" || lower == "sec" || lower == "s") {
        return SplitUnit::Seconds;
    }
    if (lower == "megabytes" || lower == "megabyte" || lower == "mb" || lower == "m") {
        return SplitUnit::Megabytes;
    }
    return std::nullopt;
}

const char* splitUnitToString(SplitUnit unit) {
    switch (unit) {
    case SplitUnit::Megabytes:
        return "megabytes";
    case SplitUnit::Seconds:
    default:
        return "seconds";
    }
}

const char* manifestStatusToString(ManifestStatus status) {
    switch (status) {
    case ManifestStatus::Complete:
        return "complete";
    case ManifestStatus::Empty:
    default:
        return "empty";
    }
}

std::string SegmentPlan::describe() const {
    if (ranges.empty()) {
        return "empty plan";
    }

    std::ostringstream oss;
    oss << ranges.size() << " segment(s) over " << totalDurationMs << " ms (nominal "
        << nominalSegmentMs << " ms";
    if (largeFileCapApplied) {
        oss << ", capped";
    }
    if (evenlyDistributed) {
        oss << ", even";
    }
    if (droppedCount > 0) {
        oss << ", " << droppedCount << " dropped";
    }
    oss << "): ";

    for (size_t i = 0; i < ranges.size(); ++i) {
        if (i > 0) {
            oss << " | ";
        }
        oss << "#" << ranges[i].index + 1 << " [" << ranges[i].startMs << "," << ranges[i].endMs
            << ")";
    }
    return oss.str();
}

std::vector<std::string> SplitManifest::fileNames() const {
    std::vector<std::string> names;
    names.reserve(segments.size());
    for (const auto& segment : segments) {
        names.push_back(segment.fileName);
    }
    return names;
}

}  // namespace audio_segmenter
