#ifndef PODIUM_AUDIO_IO_H
#define PODIUM_AUDIO_IO_H

#include "core/error_codes.h"

#include <cstddef>
#include <sndfile.h>
#include <string>
#include <vector>

namespace podium {
namespace audio {

// Mono waveform at a fixed sample rate
struct Waveform {
    std::vector<float> samples;
    int sampleRate;

    Waveform() : sampleRate(0) {}
    Waveform(std::vector<float> data, int rate) : samples(std::move(data)), sampleRate(rate) {}

    std::size_t size() const {
        return samples.size();
    }
    bool empty() const {
        return samples.empty();
    }
    double durationSec() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

class WavReader {
   public:
    WavReader();
    ~WavReader();

    WavReader(const WavReader&) = delete;
    WavReader& operator=(const WavReader&) = delete;

    bool open(const std::string& filename);
    void close();

    int getSampleRate() const {
        return info_.samplerate;
    }
    int getChannels() const {
        return info_.channels;
    }
    sf_count_t getFrames() const {
        return info_.frames;
    }

    // Read all frames, averaging channels down to mono
    bool readMono(Waveform& output);

   private:
    SNDFILE* file_;
    SF_INFO info_;
};

class WavWriter {
   public:
    WavWriter();
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    // 16-bit PCM mono WAV
    bool open(const std::string& filename, int sampleRate);
    void close();

    bool writeAll(const float* samples, std::size_t count);

   private:
    SNDFILE* file_;
    SF_INFO info_;
};

/**
 * @brief Load a mono waveform and check its sample rate.
 *
 * @param expectedSampleRate Required rate; 0 accepts any rate
 * @param error Human-readable reason on failure
 * @return ErrorCode::OK or an input error code
 */
ErrorCode loadMono(const std::string& path, int expectedSampleRate, Waveform& output,
                   std::string& error);

bool writeMono(const std::string& path, const Waveform& waveform);
bool writeMono(const std::string& path, const float* samples, std::size_t count, int sampleRate);

namespace Utils {
// Average interleaved channels down to mono
void downmixToMono(const float* interleaved, std::size_t frames, int channels, float* mono);

// Sample index for a time in seconds, clamped to [0, total]
std::size_t secondsToSample(double seconds, int sampleRate, std::size_t total);
}  // namespace Utils

}  // namespace audio
}  // namespace podium

#endif  // PODIUM_AUDIO_IO_H
