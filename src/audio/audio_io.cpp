#include "audio/audio_io.h"

#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>

namespace podium {
namespace audio {

// WavReader implementation
WavReader::WavReader() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

WavReader::~WavReader() {
    close();
}

bool WavReader::open(const std::string& filename) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filename.c_str(), SFM_READ, &info_);
    if (!file_) {
        LOG_ERROR("Error opening input file: {} (libsndfile: {})", filename, sf_strerror(nullptr));
        return false;
    }

    LOG_DEBUG("Opened: {} ({} Hz, {} ch, {} frames, {:.2f} s)", filename, info_.samplerate,
              info_.channels, static_cast<long long>(info_.frames),
              info_.samplerate > 0 ? static_cast<double>(info_.frames) / info_.samplerate : 0.0);
    return true;
}

void WavReader::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

bool WavReader::readMono(Waveform& output) {
    if (!file_) {
        LOG_ERROR("WavReader: file not opened");
        return false;
    }
    if (info_.channels <= 0) {
        LOG_ERROR("WavReader: invalid channel count {}", info_.channels);
        return false;
    }

    const std::size_t frames = static_cast<std::size_t>(info_.frames);
    std::vector<float> interleaved(frames * static_cast<std::size_t>(info_.channels));
    sf_count_t framesRead = sf_readf_float(file_, interleaved.data(), info_.frames);
    if (framesRead != info_.frames) {
        LOG_ERROR("WavReader: incomplete read, expected {} frames, read {}",
                  static_cast<long long>(info_.frames), static_cast<long long>(framesRead));
        return false;
    }

    output.sampleRate = info_.samplerate;
    if (info_.channels == 1) {
        output.samples = std::move(interleaved);
    } else {
        output.samples.assign(frames, 0.0f);
        Utils::downmixToMono(interleaved.data(), frames, info_.channels, output.samples.data());
    }
    return true;
}

// WavWriter implementation
WavWriter::WavWriter() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

WavWriter::~WavWriter() {
    close();
}

bool WavWriter::open(const std::string& filename, int sampleRate) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    info_.samplerate = sampleRate;
    info_.channels = 1;
    info_.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    file_ = sf_open(filename.c_str(), SFM_WRITE, &info_);
    if (!file_) {
        LOG_ERROR("Error opening output file: {} (libsndfile: {})", filename,
                  sf_strerror(nullptr));
        return false;
    }
    // Keep float input in [-1, 1] from wrapping when converted to 16-bit
    sf_command(file_, SFC_SET_CLIPPING, nullptr, SF_TRUE);
    return true;
}

void WavWriter::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

bool WavWriter::writeAll(const float* samples, std::size_t count) {
    if (!file_) {
        LOG_ERROR("WavWriter: file not opened");
        return false;
    }

    sf_count_t written = sf_writef_float(file_, samples, static_cast<sf_count_t>(count));
    if (written != static_cast<sf_count_t>(count)) {
        LOG_ERROR("WavWriter: expected to write {} frames, wrote {}", count,
                  static_cast<long long>(written));
        return false;
    }
    return true;
}

ErrorCode loadMono(const std::string& path, int expectedSampleRate, Waveform& output,
                   std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error = "audio file not found: " + path;
        return ErrorCode::INPUT_AUDIO_NOT_FOUND;
    }

    WavReader reader;
    if (!reader.open(path)) {
        error = "unsupported or corrupt audio file: " + path;
        return ErrorCode::INPUT_UNSUPPORTED_FORMAT;
    }
    if (expectedSampleRate > 0 && reader.getSampleRate() != expectedSampleRate) {
        error = "sample rate " + std::to_string(reader.getSampleRate()) + " Hz does not match " +
                std::to_string(expectedSampleRate) + " Hz (convert the input first)";
        return ErrorCode::INPUT_SAMPLE_RATE_MISMATCH;
    }
    if (!reader.readMono(output)) {
        error = "failed to read samples from " + path;
        return ErrorCode::INPUT_AUDIO_UNREADABLE;
    }
    if (output.empty()) {
        error = "audio file contains no samples: " + path;
        return ErrorCode::INPUT_AUDIO_EMPTY;
    }
    return ErrorCode::OK;
}

bool writeMono(const std::string& path, const float* samples, std::size_t count, int sampleRate) {
    WavWriter writer;
    if (!writer.open(path, sampleRate)) {
        return false;
    }
    bool ok = writer.writeAll(samples, count);
    writer.close();
    return ok;
}

bool writeMono(const std::string& path, const Waveform& waveform) {
    return writeMono(path, waveform.samples.data(), waveform.size(), waveform.sampleRate);
}

// Utility functions
namespace Utils {

void downmixToMono(const float* interleaved, std::size_t frames, int channels, float* mono) {
    const float scale = 1.0f / static_cast<float>(channels);
    for (std::size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * static_cast<std::size_t>(channels) + static_cast<std::size_t>(c)];
        }
        mono[i] = sum * scale;
    }
}

std::size_t secondsToSample(double seconds, int sampleRate, std::size_t total) {
    if (!(seconds > 0.0) || sampleRate <= 0) {
        return 0;
    }
    double index = std::round(seconds * static_cast<double>(sampleRate));
    if (index >= static_cast<double>(total)) {
        return total;
    }
    return static_cast<std::size_t>(index);
}

}  // namespace Utils

}  // namespace audio
}  // namespace podium
