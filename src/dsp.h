#pragma once

#include "types.h"

#include <cstddef>
#include <vector>

namespace stemscan {

// Soft masks of a median-filtering harmonic/percussive separation
// (Fitzgerald 2010). Matrices are row-major (frames x bins).
struct HpssMasks {
    std::vector<float> harmonic;
    std::vector<float> percussive;
};

// Median along time (harmonic) and along frequency (percussive), windows
// clipped at the borders. Kernel sizes should be odd.
std::vector<float> median_filter_time(const std::vector<float>& mag, size_t frames, size_t bins,
                                      size_t kernel);
std::vector<float> median_filter_freq(const std::vector<float>& mag, size_t frames, size_t bins,
                                      size_t kernel);

// M = X^p / (X^p + R^p). Where both are ~0 the mask is 0.5.
std::vector<float> soft_mask(const std::vector<float>& x, const std::vector<float>& ref, float power);

HpssMasks hpss_masks(const std::vector<float>& mag, size_t frames, size_t bins,
                     size_t kernel = 31, float power = 2.0f);

// Chroma Energy Normalized Statistics: per-frame L1 normalization,
// quantization at 0.4/0.2/0.1/0.05, Hann smoothing over `smooth` frames,
// per-frame L2 normalization.
std::vector<ChromaVector> chroma_cens(const std::vector<ChromaVector>& chroma, size_t smooth = 41);

} // namespace stemscan
