#pragma once

#include "config.h"
#include "ensemble.h"
#include "feature_provider.h"
#include "types.h"

#include <optional>
#include <vector>

namespace stemscan {

using TempoStrategy = Strategy<std::optional<TempoCandidate>>;

// --- Single strategies over provider outputs ---

// Median inter-onset interval. Needs more than 3 onsets and a result
// inside [cfg.min_bpm, cfg.max_bpm].
std::optional<TempoCandidate> tempo_from_onsets(const std::vector<double>& onset_times,
                                                const Config& cfg);

// First surviving peak of the onset-strength autocorrelation. Nothing when
// that peak sits at lag 0 or its tempo lies outside [cfg.min_bpm, cfg.max_bpm].
std::optional<TempoCandidate> tempo_from_autocorrelation(const std::vector<double>& onset_strength,
                                                         int sample_rate, const Config& cfg);

// Onset-strength tempo weighted by a tempo prior, bins limited to cfg.prior_max_bpm.
std::optional<TempoCandidate> tempo_from_prior(const std::vector<double>& onset_strength,
                                               int sample_rate, const Config& cfg);

// --- Ensemble ---

// The enabled tempo strategies for one waveform, in a fixed order. The
// waveform and provider must outlive the returned list.
std::vector<TempoStrategy> build_tempo_strategies(const Waveform& wf,
                                                  const FeatureProvider& provider,
                                                  const Config& cfg);

std::vector<TempoCandidate> estimate_tempo_candidates(const Waveform& wf,
                                                      const FeatureProvider& provider,
                                                      const Config& cfg);

// --- Aggregation ---

// Halve above 160 when the half lies in [80, 140]; double below 80 when the
// double lies in [120, 160]. Applied once.
double correct_octave(double bpm);

// Outlier rejection (> 2 std from the median, only with more than 2
// candidates), weighted mean of values, mean of weights as confidence,
// octave correction. Empty input gives (null, 0).
TempoEstimate aggregate_tempo(const std::vector<TempoCandidate>& candidates);

} // namespace stemscan
