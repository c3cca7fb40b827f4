#ifndef AUDIO_IO_H
#define AUDIO_IO_H

#include <cstddef>
#include <cstdint>
#include <sndfile.h>
#include <string>

namespace audio_segmenter {
namespace AudioIO {

// Any container libsndfile can decode (WAV, FLAC, OGG, AIFF, and MP3 on 1.1+)
class SndfileReader {
   public:
    SndfileReader();
    ~SndfileReader();

    SndfileReader(const SndfileReader&) = delete;
    SndfileReader& operator=(const SndfileReader&) = delete;

    bool open(const std::string& filename);
    void close();

    bool isOpen() const {
        return file_ != nullptr;
    }
    int getSampleRate() const {
        return info_.samplerate;
    }
    int getChannels() const {
        return info_.channels;
    }
    sf_count_t getFrames() const {
        return info_.frames;
    }
    int64_t getDurationMs() const;

    // Major format extension reported by libsndfile ("wav", "flac", ...); empty if unknown
    std::string formatExtension() const;
    std::string subtypeName() const;

    const std::string& lastError() const {
        return lastError_;
    }

    bool seekFrame(sf_count_t frame);

    // Returns frames actually read (0 at end of file, -1 if not open)
    sf_count_t readBlock(float* buffer, sf_count_t frames);

   private:
    SNDFILE* file_;
    SF_INFO info_;
    std::string lastError_;
};

// 16-bit PCM WAV writer
class WavWriter {
   public:
    WavWriter();
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    bool open(const std::string& filename, int sampleRate, int channels);
    // Returns false if the file could not be finalized
    bool close();

    bool writeBlock(const float* buffer, sf_count_t frames);

    const std::string& lastError() const {
        return lastError_;
    }

   private:
    SNDFILE* file_;
    SF_INFO info_;
    std::string lastError_;
};

// Utility functions
namespace Utils {
// Average all channels of an interleaved buffer into one
void downmixToMono(const float* interleaved, float* mono, size_t frames, int channels);

// Milliseconds to frame index, rounded down
sf_count_t msToFrames(int64_t ms, int sampleRate);
}  // namespace Utils

}  // namespace AudioIO
}  // namespace audio_segmenter

#endif  // AUDIO_IO_H
