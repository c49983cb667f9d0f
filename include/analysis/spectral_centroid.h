#ifndef PODIUM_SPECTRAL_CENTROID_H
#define PODIUM_SPECTRAL_CENTROID_H

#include <cstddef>
#include <fftw3.h>
#include <vector>

namespace podium {
namespace analysis {

/**
 * @brief Frame-wise spectral centroid over a Hann-windowed real FFT (FFTW, single precision).
 *
 * Owns its plan and buffers. FFTW planning is not thread safe, so plan creation and
 * destruction are serialized internally; execution is per instance and needs no lock.
 * Use one instance per thread.
 */
class SpectralCentroid {
   public:
    SpectralCentroid(std::size_t fftSize, std::size_t hop);
    ~SpectralCentroid();

    SpectralCentroid(const SpectralCentroid&) = delete;
    SpectralCentroid& operator=(const SpectralCentroid&) = delete;

    // False when FFTW could not build a plan
    bool valid() const {
        return plan_ != nullptr;
    }

    /**
     * @brief Centroid in Hz for each non-centred frame (zero padded tail).
     *
     * All-zero frames report 0 Hz and are counted in @p silentFrames when provided.
     */
    std::vector<double> compute(const float* samples, std::size_t count, int sampleRate,
                                std::size_t* silentFrames = nullptr);

    std::size_t fftSize() const {
        return fftSize_;
    }

   private:
    std::size_t fftSize_;
    std::size_t hop_;
    std::vector<float> window_;
    float* input_ = nullptr;
    fftwf_complex* output_ = nullptr;
    fftwf_plan plan_ = nullptr;
};

}  // namespace analysis
}  // namespace podium

#endif  // PODIUM_SPECTRAL_CENTROID_H
