#include "signal_math.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace stemscan {

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) return values[mid];
    return 0.5 * (values[mid - 1] + values[mid]);
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double population_stddev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double m = mean(values);
    double acc = 0.0;
    for (double v : values) acc += (v - m) * (v - m);
    return std::sqrt(acc / static_cast<double>(values.size()));
}

std::optional<double> weighted_average(const std::vector<double>& values,
                                       const std::vector<double>& weights) {
    double num = 0.0, den = 0.0;
    size_t n = std::min(values.size(), weights.size());
    for (size_t i = 0; i < n; ++i) {
        num += values[i] * weights[i];
        den += weights[i];
    }
    if (den <= 0.0) return std::nullopt;
    return num / den;
}

std::optional<double> pearson(const ChromaVector& a, const ChromaVector& b) {
    double ma = 0.0, mb = 0.0;
    for (int i = 0; i < kPitchClasses; ++i) {
        ma += a[i];
        mb += b[i];
    }
    ma /= kPitchClasses;
    mb /= kPitchClasses;

    double cov = 0.0, va = 0.0, vb = 0.0;
    for (int i = 0; i < kPitchClasses; ++i) {
        double da = a[i] - ma;
        double db = b[i] - mb;
        cov += da * db;
        va  += da * da;
        vb  += db * db;
    }
    if (va <= 0.0 || vb <= 0.0) return std::nullopt;
    double r = cov / std::sqrt(va * vb);
    if (!std::isfinite(r)) return std::nullopt;
    return std::clamp(r, -1.0, 1.0);
}

std::optional<ChromaVector> mean_chroma(const std::vector<ChromaVector>& frames) {
    if (frames.empty()) return std::nullopt;

    ChromaVector acc{};
    for (const auto& f : frames) {
        for (int i = 0; i < kPitchClasses; ++i) acc[i] += f[i];
    }
    double total = 0.0;
    for (double& v : acc) {
        v /= static_cast<double>(frames.size());
        total += v;
    }
    if (!(total > 0.0) || !std::isfinite(total)) return std::nullopt;
    for (double& v : acc) v /= total;
    return acc;
}

std::vector<double> autocorrelate(const std::vector<double>& x, size_t max_lag) {
    size_t n = x.size();
    if (max_lag == 0 || max_lag > n) max_lag = n;
    std::vector<double> r(max_lag, 0.0);
    for (size_t k = 0; k < max_lag; ++k) {
        double acc = 0.0;
        for (size_t i = 0; i + k < n; ++i) acc += x[i] * x[i + k];
        r[k] = acc;
    }
    return r;
}

std::vector<size_t> peak_pick(const std::vector<double>& x, const PeakPickParams& p) {
    std::vector<size_t> peaks;
    const size_t n = x.size();
    bool have_previous = false;
    size_t previous = 0;

    for (size_t i = 0; i < n; ++i) {
        size_t max_lo = i >= p.pre_max ? i - p.pre_max : 0;
        size_t max_hi = std::min(n, i + std::max<size_t>(p.post_max, 1));
        double local_max = *std::max_element(x.begin() + static_cast<std::ptrdiff_t>(max_lo),
                                              x.begin() + static_cast<std::ptrdiff_t>(max_hi));
        if (x[i] != local_max) continue;

        size_t avg_lo = i >= p.pre_avg ? i - p.pre_avg : 0;
        size_t avg_hi = std::min(n, i + std::max<size_t>(p.post_avg, 1));
        double local_mean = std::accumulate(x.begin() + static_cast<std::ptrdiff_t>(avg_lo),
                                            x.begin() + static_cast<std::ptrdiff_t>(avg_hi), 0.0)
                            / static_cast<double>(avg_hi - avg_lo);
        if (x[i] < local_mean + p.delta) continue;

        if (have_previous && i - previous <= p.wait) continue;

        peaks.push_back(i);
        previous = i;
        have_previous = true;
    }
    return peaks;
}

double lag_to_bpm(double lag, int sample_rate, int hop_length) {
    if (lag <= 0.0 || hop_length <= 0) return 0.0;
    return 60.0 * sample_rate / (lag * hop_length);
}

std::optional<double> prior_weighted_tempo(const std::vector<double>& onset_strength,
                                           int sample_rate, int hop_length,
                                           double max_bpm, double center_bpm) {
    if (onset_strength.size() < 2 || sample_rate <= 0 || hop_length <= 0 || center_bpm <= 0.0)
        return std::nullopt;

    // 8 second autocorrelation window
    size_t window = static_cast<size_t>(std::lround(8.0 * sample_rate / hop_length));
    std::vector<double> ac = autocorrelate(onset_strength, std::max<size_t>(window, 2));
    if (!(ac[0] > 0.0)) return std::nullopt;

    const double log_center = std::log2(center_bpm);
    double best_score = -std::numeric_limits<double>::infinity();
    size_t best_lag = 0;

    for (size_t lag = 1; lag < ac.size(); ++lag) {
        double bpm = lag_to_bpm(static_cast<double>(lag), sample_rate, hop_length);
        if (bpm > max_bpm) continue;

        double strength = std::max(0.0, ac[lag] / ac[0]);
        double d = std::log2(bpm) - log_center;
        double score = std::log1p(1e6 * strength) - 0.5 * d * d;
        if (score > best_score) {
            best_score = score;
            best_lag = lag;
        }
    }
    if (best_lag == 0 || ac[best_lag] <= 0.0) return std::nullopt;
    return lag_to_bpm(static_cast<double>(best_lag), sample_rate, hop_length);
}

} // namespace stemscan
