#ifndef ENGINE_ENCODE_STRATEGY_H
#define ENGINE_ENCODE_STRATEGY_H

#include "core/config_loader.h"
#include "engine/segment_types.h"

#include <string>
#include <vector>

namespace audio_segmenter {

enum class EncoderKind { Ffmpeg, Native };
enum class OutputFormat { Mp3, Wav };

const char* encoderKindToString(EncoderKind kind);
const char* outputFormatExtension(OutputFormat format);

/**
 * @brief One rung of the fallback ladder.
 *
 * Zero for bitrate/channels/sampleRate means "leave to the encoder / keep source".
 */
struct EncodeStrategy {
    std::string name;
    EncoderKind backend = EncoderKind::Ffmpeg;
    OutputFormat format = OutputFormat::Mp3;
    std::string codec;  // ffmpeg codec name; empty = muxer default
    int bitrateKbps = 0;
    int channels = 0;
    int sampleRate = 0;
    std::vector<std::string> extraArgs;
};

using EncodeLadder = std::vector<EncodeStrategy>;

bool isLargeInput(const SourceAudio& source, const SegmenterConfig::EncoderConfig& config);

/**
 * @brief Ordered strategies to try for every segment of this source.
 *
 * Large inputs start with cheap mono MP3; normal inputs start with full-quality
 * MP3. Both end in uncompressed WAV, with the libsndfile rung last when enabled.
 */
EncodeLadder buildEncodeLadder(const SourceAudio& source,
                               const SegmenterConfig::EncoderConfig& config);

// "mp3_standard > mp3_basic > wav_pcm > wav_native"
std::string describeLadder(const EncodeLadder& ladder);

}  // namespace audio_segmenter

#endif  // ENGINE_ENCODE_STRATEGY_H
