#include "audio/audio_io.h"
#include "engine/encode_backend.h"
#include "logging/logger.h"

#include <algorithm>
#include <chrono>
#include <vector>

namespace audio_segmenter {

namespace {

constexpr sf_count_t kBlockFrames = 4096;

class SndfileEncodeBackend final : public EncodeBackend {
   public:
    const char* name() const override {
        return "libsndfile";
    }

    EncoderKind kind() const override {
        return EncoderKind::Native;
    }

    AttemptResult encode(const SourceAudio& source, const SegmentRange& range,
                         const EncodeStrategy& strategy, const std::string& outputPath,
                         const AttemptControl& control) const override {
        AttemptResult result;
        const auto started = std::chrono::steady_clock::now();

        AudioIO::SndfileReader reader;
        if (!reader.open(source.path)) {
            result.message = "libsndfile cannot decode source: " + reader.lastError();
            return result;
        }

        const int inChannels = reader.getChannels();
        const int sampleRate = reader.getSampleRate();
        const bool downmix = strategy.channels == 1 && inChannels > 1;
        const int outChannels = downmix ? 1 : inChannels;

        const sf_count_t startFrame = AudioIO::Utils::msToFrames(range.startMs, sampleRate);
        const sf_count_t endFrame =
            std::min(AudioIO::Utils::msToFrames(range.endMs, sampleRate), reader.getFrames());
        if (endFrame <= startFrame) {
            result.message = "range lies beyond the decodable audio";
            return result;
        }
        if (!reader.seekFrame(startFrame)) {
            result.message = "seek failed: " + reader.lastError();
            return result;
        }

        AudioIO::WavWriter writer;
        if (!writer.open(outputPath, sampleRate, outChannels)) {
            result.message = "cannot create output: " + writer.lastError();
            return result;
        }

        std::vector<float> block(static_cast<size_t>(kBlockFrames) * inChannels);
        std::vector<float> mono(downmix ? static_cast<size_t>(kBlockFrames) : 0);
        sf_count_t remaining = endFrame - startFrame;

        while (remaining > 0) {
            if (control.cancelled()) {
                writer.close();
                result.status = AttemptStatus::Cancelled;
                result.message = "cancelled";
                return result;
            }
            if (control.timeoutMs > 0 &&
                std::chrono::steady_clock::now() - started >
                    std::chrono::milliseconds(control.timeoutMs)) {
                writer.close();
                result.status = AttemptStatus::TimedOut;
                result.message =
                    "native encode exceeded " + std::to_string(control.timeoutMs) + " ms";
                return result;
            }

            const sf_count_t wanted = std::min(remaining, kBlockFrames);
            const sf_count_t got = reader.readBlock(block.data(), wanted);
            if (got <= 0) {
                break;
            }
            bool written = false;
            if (downmix) {
                AudioIO::Utils::downmixToMono(block.data(), mono.data(),
                                              static_cast<size_t>(got), inChannels);
                written = writer.writeBlock(mono.data(), got);
            } else {
                written = writer.writeBlock(block.data(), got);
            }
            if (!written) {
                writer.close();
                result.message = "write failed: " + writer.lastError();
                return result;
            }
            remaining -= got;
        }

        if (!writer.close()) {
            result.message = "cannot finalize output: " + writer.lastError();
            return result;
        }
        if (remaining == endFrame - startFrame) {
            result.message = "no frames decoded for range";
            return result;
        }
        if (remaining > 0) {
            LOG_DEBUG("[libsndfile] #{} ended {} frames early", range.index + 1,
                      static_cast<int64_t>(remaining));
        }
        result.status = AttemptStatus::Ok;
        return result;
    }
};

}  // namespace

std::shared_ptr<EncodeBackend> createSndfileEncodeBackend() {
    return std::make_shared<SndfileEncodeBackend>();
}

}  // namespace audio_segmenter
