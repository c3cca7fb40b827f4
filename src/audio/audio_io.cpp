#include "audio/audio_io.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace audio_segmenter {
namespace AudioIO {

// SndfileReader implementation
SndfileReader::SndfileReader() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

SndfileReader::~SndfileReader() {
    close();
}

bool SndfileReader::open(const std::string& filename) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filename.c_str(), SFM_READ, &info_);
    if (!file_) {
        lastError_ = sf_strerror(nullptr);
        LOG_DEBUG("libsndfile cannot open {}: {}", filename, lastError_);
        return false;
    }

    LOG_DEBUG("Opened {} ({} Hz, {} ch, {} frames)", filename, info_.samplerate, info_.channels,
              static_cast<int64_t>(info_.frames));
    return true;
}

void SndfileReader::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

int64_t SndfileReader::getDurationMs() const {
    if (!file_ || info_.samplerate <= 0 || info_.frames <= 0) {
        return 0;
    }
    return static_cast<int64_t>(info_.frames) * 1000 / info_.samplerate;
}

std::string SndfileReader::formatExtension() const {
    if (!file_) {
        return {};
    }
    SF_FORMAT_INFO formatInfo;
    std::memset(&formatInfo, 0, sizeof(formatInfo));
    formatInfo.format = info_.format & SF_FORMAT_TYPEMASK;
    if (sf_command(nullptr, SFC_GET_FORMAT_INFO, &formatInfo, sizeof(formatInfo)) != 0 ||
        formatInfo.extension == nullptr) {
        return {};
    }
    std::string ext{formatInfo.extension};
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string SndfileReader::subtypeName() const {
    if (!file_) {
        return {};
    }
    switch (info_.format & SF_FORMAT_SUBMASK) {
    case SF_FORMAT_PCM_S8:
    case SF_FORMAT_PCM_U8:
        return "pcm_8";
    case SF_FORMAT_PCM_16:
        return "pcm_s16le";
    case SF_FORMAT_PCM_24:
        return "pcm_s24le";
    case SF_FORMAT_PCM_32:
        return "pcm_s32le";
    case SF_FORMAT_FLOAT:
        return "pcm_f32le";
    case SF_FORMAT_DOUBLE:
        return "pcm_f64le";
    case SF_FORMAT_VORBIS:
        return "vorbis";
    default:
        return {};
    }
}

bool SndfileReader::seekFrame(sf_count_t frame) {
    if (!file_) {
        return false;
    }
    if (sf_seek(file_, frame, SEEK_SET) < 0) {
        lastError_ = sf_strerror(file_);
        return false;
    }
    return true;
}

sf_count_t SndfileReader::readBlock(float* buffer, sf_count_t frames) {
    if (!file_) {
        return -1;
    }
    return sf_readf_float(file_, buffer, frames);
}

// WavWriter implementation
WavWriter::WavWriter() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

WavWriter::~WavWriter() {
    close();
}

bool WavWriter::open(const std::string& filename, int sampleRate, int channels) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    info_.samplerate = sampleRate;
    info_.channels = channels;
    info_.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    file_ = sf_open(filename.c_str(), SFM_WRITE, &info_);
    if (!file_) {
        lastError_ = sf_strerror(nullptr);
        LOG_WARN("libsndfile cannot create {}: {}", filename, lastError_);
        return false;
    }
    // Clip instead of wrapping when float samples exceed [-1, 1]
    sf_command(file_, SFC_SET_CLIPPING, nullptr, SF_TRUE);
    return true;
}

bool WavWriter::close() {
    if (!file_) {
        return true;
    }
    const int rc = sf_close(file_);
    file_ = nullptr;
    if (rc != 0) {
        lastError_ = sf_error_number(rc);
        return false;
    }
    return true;
}

bool WavWriter::writeBlock(const float* buffer, sf_count_t frames) {
    if (!file_) {
        lastError_ = "file not opened";
        return false;
    }

    sf_count_t framesWritten = sf_writef_float(file_, buffer, frames);
    if (framesWritten != frames) {
        lastError_ = sf_strerror(file_);
        return false;
    }
    return true;
}

// Utility functions
namespace Utils {

void downmixToMono(const float* interleaved, float* mono, size_t frames, int channels) {
    if (channels <= 1) {
        std::copy(interleaved, interleaved + frames, mono);
        return;
    }
    const float scale = 1.0f / static_cast<float>(channels);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[i * channels + ch];
        }
        mono[i] = sum * scale;
    }
}

sf_count_t msToFrames(int64_t ms, int sampleRate) {
    if (ms <= 0 || sampleRate <= 0) {
        return 0;
    }
    return static_cast<sf_count_t>(ms * sampleRate / 1000);
}

}  // namespace Utils

}  // namespace AudioIO
}  // namespace audio_segmenter
