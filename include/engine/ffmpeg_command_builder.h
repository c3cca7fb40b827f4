// Build ffmpeg argv for one segment attempt
#pragma once

#include "engine/encode_strategy.h"
#include "engine/segment_types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace audio_segmenter {

class FfmpegCommandBuilder {
   public:
    static std::vector<std::string> build(const std::string& ffmpegPath,
                                          const EncodeStrategy& strategy,
                                          const std::string& inputPath, const SegmentRange& range,
                                          const std::string& outputPath);

    // 1500 -> "1.500"
    static std::string formatSeconds(int64_t ms);

   private:
    static const char* muxerName(OutputFormat format);
};

}  // namespace audio_segmenter
