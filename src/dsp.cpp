#include "dsp.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace stemscan {

static float window_median(std::vector<float>& buf) {
    auto mid = buf.begin() + static_cast<std::ptrdiff_t>(buf.size() / 2);
    std::nth_element(buf.begin(), mid, buf.end());
    float upper = *mid;
    if (buf.size() % 2 == 1) return upper;
    float lower = *std::max_element(buf.begin(), mid);
    return 0.5f * (lower + upper);
}

std::vector<float> median_filter_time(const std::vector<float>& mag, size_t frames, size_t bins,
                                      size_t kernel) {
    std::vector<float> out(mag.size(), 0.0f);
    if (frames == 0 || bins == 0 || mag.size() != frames * bins) return out;

    size_t half = kernel / 2;
    std::vector<float> buf;
    buf.reserve(kernel);
    for (size_t b = 0; b < bins; ++b) {
        for (size_t t = 0; t < frames; ++t) {
            size_t lo = t >= half ? t - half : 0;
            size_t hi = std::min(frames, t + half + 1);
            buf.clear();
            for (size_t k = lo; k < hi; ++k) buf.push_back(mag[k * bins + b]);
            out[t * bins + b] = window_median(buf);
        }
    }
    return out;
}

std::vector<float> median_filter_freq(const std::vector<float>& mag, size_t frames, size_t bins,
                                      size_t kernel) {
    std::vector<float> out(mag.size(), 0.0f);
    if (frames == 0 || bins == 0 || mag.size() != frames * bins) return out;

    size_t half = kernel / 2;
    std::vector<float> buf;
    buf.reserve(kernel);
    for (size_t t = 0; t < frames; ++t) {
        const float* row = mag.data() + t * bins;
        for (size_t b = 0; b < bins; ++b) {
            size_t lo = b >= half ? b - half : 0;
            size_t hi = std::min(bins, b + half + 1);
            buf.assign(row + lo, row + hi);
            out[t * bins + b] = window_median(buf);
        }
    }
    return out;
}

std::vector<float> soft_mask(const std::vector<float>& x, const std::vector<float>& ref, float power) {
    std::vector<float> mask(x.size(), 0.0f);
    size_t n = std::min(x.size(), ref.size());
    for (size_t i = 0; i < n; ++i) {
        float z = std::max(x[i], ref[i]);
        if (z > std::numeric_limits<float>::epsilon()) {
            // Rescale relative to the larger value to keep the powers finite
            float xp = std::pow(x[i] / z, power);
            float rp = std::pow(ref[i] / z, power);
            mask[i] = xp / (xp + rp);
        } else {
            mask[i] = 0.5f;
        }
    }
    return mask;
}

HpssMasks hpss_masks(const std::vector<float>& mag, size_t frames, size_t bins,
                     size_t kernel, float power) {
    std::vector<float> harm = median_filter_time(mag, frames, bins, kernel);
    std::vector<float> perc = median_filter_freq(mag, frames, bins, kernel);

    HpssMasks masks;
    masks.harmonic   = soft_mask(harm, perc, power);
    masks.percussive = soft_mask(perc, harm, power);
    return masks;
}

std::vector<ChromaVector> chroma_cens(const std::vector<ChromaVector>& chroma, size_t smooth) {
    static const double steps[] = {0.4, 0.2, 0.1, 0.05};

    const size_t n = chroma.size();
    std::vector<ChromaVector> quant(n, ChromaVector{});
    for (size_t t = 0; t < n; ++t) {
        double l1 = 0.0;
        for (double v : chroma[t]) l1 += std::abs(v);
        if (l1 <= 0.0) continue;
        for (int c = 0; c < kPitchClasses; ++c) {
            double v = chroma[t][c] / l1;
            for (double s : steps) {
                if (v > s) quant[t][c] += 0.25;
            }
        }
    }

    if (smooth < 1) smooth = 1;
    std::vector<double> win(smooth, 1.0);
    if (smooth > 1) {
        // Hann window without the zero endpoints
        double wsum = 0.0;
        for (size_t i = 0; i < smooth; ++i) {
            win[i] = 0.5 - 0.5 * std::cos(2.0 * M_PI * static_cast<double>(i + 1) /
                                          static_cast<double>(smooth + 1));
            wsum += win[i];
        }
        for (double& w : win) w /= wsum;
    }

    const std::ptrdiff_t half = static_cast<std::ptrdiff_t>(smooth / 2);
    std::vector<ChromaVector> out(n, ChromaVector{});
    for (size_t t = 0; t < n; ++t) {
        for (size_t k = 0; k < smooth; ++k) {
            std::ptrdiff_t src = static_cast<std::ptrdiff_t>(t) + static_cast<std::ptrdiff_t>(k) - half;
            if (src < 0 || src >= static_cast<std::ptrdiff_t>(n)) continue;
            for (int c = 0; c < kPitchClasses; ++c) {
                out[t][c] += win[k] * quant[static_cast<size_t>(src)][c];
            }
        }
        double l2 = 0.0;
        for (double v : out[t]) l2 += v * v;
        l2 = std::sqrt(l2);
        if (l2 > 0.0) {
            for (double& v : out[t]) v /= l2;
        }
    }
    return out;
}

} // namespace stemscan
