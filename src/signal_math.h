#pragma once

#include "types.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace stemscan {

// Median of a copy of values (mean of the two middle values for even sizes).
// Empty input returns 0.
double median(std::vector<double> values);

double mean(const std::vector<double>& values);

// Population standard deviation (divides by N).
double population_stddev(const std::vector<double>& values);

// sum(v*w) / sum(w). Empty optional if the weights sum to zero.
std::optional<double> weighted_average(const std::vector<double>& values,
                                       const std::vector<double>& weights);

// Pearson correlation. Empty optional when either side has zero variance.
std::optional<double> pearson(const ChromaVector& a, const ChromaVector& b);

// Time-mean of chroma frames, normalized to sum 1.
// Empty optional if there are no frames or the mean has no energy.
std::optional<ChromaVector> mean_chroma(const std::vector<ChromaVector>& frames);

// Full autocorrelation r[k] = sum_n x[n] x[n+k], for k in [0, max_lag).
// max_lag == 0 means the whole signal length.
std::vector<double> autocorrelate(const std::vector<double>& x, size_t max_lag = 0);

struct PeakPickParams {
    size_t pre_max  = 3;
    size_t post_max = 3;
    size_t pre_avg  = 3;
    size_t post_avg = 5;
    double delta    = 0.1;
    size_t wait     = 10;
};

// Peak picking: x[n] is a peak when
//   x[n] == max(x[n - pre_max, n + post_max))
//   x[n] >= mean(x[n - pre_avg, n + post_avg)) + delta
//   n - previous_peak > wait
// Windows are clipped at the signal borders.
std::vector<size_t> peak_pick(const std::vector<double>& x, const PeakPickParams& p = {});

// BPM of an onset-strength frame lag.
double lag_to_bpm(double lag, int sample_rate, int hop_length);

// Global tempo from an onset-strength curve weighted by a log-normal prior
// centred on center_bpm (one octave deviation). Lags faster than max_bpm are
// excluded. Empty optional when the curve carries no periodic energy.
std::optional<double> prior_weighted_tempo(const std::vector<double>& onset_strength,
                                           int sample_rate, int hop_length,
                                           double max_bpm, double center_bpm);

} // namespace stemscan
