#include "tempo.h"
#include "signal_math.h"

#include <cmath>
#include <string>

namespace stemscan {

static bool in_range(double bpm, const Config& cfg) {
    return bpm >= cfg.min_bpm && bpm <= cfg.max_bpm;
}

static TempoCandidate make_candidate(double bpm, double weight, StrategyType type) {
    return TempoCandidate{bpm, weight, strategy_name(type)};
}

// --- Strategies ---

std::optional<TempoCandidate> tempo_from_onsets(const std::vector<double>& onset_times,
                                                const Config& cfg) {
    if (onset_times.size() <= 3) return std::nullopt;

    std::vector<double> intervals;
    intervals.reserve(onset_times.size() - 1);
    for (size_t i = 1; i < onset_times.size(); ++i) {
        intervals.push_back(onset_times[i] - onset_times[i - 1]);
    }
    double interval = median(intervals);
    if (interval <= 0.0) return std::nullopt;

    double bpm = 60.0 / interval;
    if (!in_range(bpm, cfg)) return std::nullopt;
    return make_candidate(bpm, cfg.weights.onset_interval, StrategyType::TEMPO_ONSET_INTERVAL);
}

std::optional<TempoCandidate> tempo_from_autocorrelation(const std::vector<double>& onset_strength,
                                                         int sample_rate, const Config& cfg) {
    if (onset_strength.empty() || sample_rate <= 0 || cfg.onset_hop <= 0) return std::nullopt;

    // Lags up to half the slowest accepted tempo, plus room for the peak windows
    const PeakPickParams params;
    double slowest_lag = 60.0 * sample_rate / (cfg.onset_hop * (cfg.min_bpm / 2.0));
    size_t max_lag = static_cast<size_t>(std::ceil(slowest_lag)) + params.post_avg + 1;

    std::vector<double> ac = autocorrelate(onset_strength, max_lag);
    std::vector<size_t> peaks = peak_pick(ac, params);

    // Only the first surviving peak counts; a lag-0 peak means no tempo
    if (peaks.empty() || peaks.front() == 0) return std::nullopt;

    double bpm = lag_to_bpm(static_cast<double>(peaks.front()), sample_rate, cfg.onset_hop);
    if (!in_range(bpm, cfg)) return std::nullopt;
    return make_candidate(bpm, cfg.weights.autocorrelation, StrategyType::TEMPO_AUTOCORRELATION);
}

std::optional<TempoCandidate> tempo_from_prior(const std::vector<double>& onset_strength,
                                               int sample_rate, const Config& cfg) {
    auto bpm = prior_weighted_tempo(onset_strength, sample_rate, cfg.onset_hop,
                                    cfg.prior_max_bpm, cfg.prior_center_bpm);
    if (!bpm || *bpm <= 0.0) return std::nullopt;
    return make_candidate(*bpm, cfg.weights.prior, StrategyType::TEMPO_PRIOR);
}

// --- Ensemble ---

std::vector<TempoStrategy> build_tempo_strategies(const Waveform& wf,
                                                  const FeatureProvider& provider,
                                                  const Config& cfg) {
    std::vector<TempoStrategy> list;
    const auto& enabled = cfg.enabled_strategies;

    if (enabled.count(StrategyType::TEMPO_BEAT_TRACK)) {
        for (int hop : cfg.beat_hops) {
            list.push_back({StrategyType::TEMPO_BEAT_TRACK,
                            strategy_name(StrategyType::TEMPO_BEAT_TRACK) + "@" + std::to_string(hop),
                            [&wf, &provider, &cfg, hop]() -> std::optional<TempoCandidate> {
                double bpm = provider.beat_track_bpm(wf, hop);
                if (!(bpm > 0.0)) return std::nullopt;
                return make_candidate(bpm, cfg.weights.beat_track, StrategyType::TEMPO_BEAT_TRACK);
            }});
        }
    }

    if (enabled.count(StrategyType::TEMPO_ONSET_INTERVAL)) {
        list.push_back({StrategyType::TEMPO_ONSET_INTERVAL,
                        strategy_name(StrategyType::TEMPO_ONSET_INTERVAL),
                        [&wf, &provider, &cfg] {
            return tempo_from_onsets(provider.onset_times(wf), cfg);
        }});
    }

    if (enabled.count(StrategyType::TEMPO_HISTOGRAM)) {
        list.push_back({StrategyType::TEMPO_HISTOGRAM,
                        strategy_name(StrategyType::TEMPO_HISTOGRAM),
                        [&wf, &provider, &cfg]() -> std::optional<TempoCandidate> {
            auto bpm = provider.tempo_histogram_bpm(wf);
            if (!bpm || !(*bpm > 0.0)) return std::nullopt;
            return make_candidate(*bpm, cfg.weights.histogram, StrategyType::TEMPO_HISTOGRAM);
        }});
    }

    if (enabled.count(StrategyType::TEMPO_AUTOCORRELATION)) {
        list.push_back({StrategyType::TEMPO_AUTOCORRELATION,
                        strategy_name(StrategyType::TEMPO_AUTOCORRELATION),
                        [&wf, &provider, &cfg] {
            return tempo_from_autocorrelation(provider.onset_strength(wf, cfg.onset_hop),
                                              wf.sample_rate, cfg);
        }});
    }

    if (enabled.count(StrategyType::TEMPO_PRIOR)) {
        list.push_back({StrategyType::TEMPO_PRIOR,
                        strategy_name(StrategyType::TEMPO_PRIOR),
                        [&wf, &provider, &cfg] {
            return tempo_from_prior(provider.onset_strength(wf, cfg.onset_hop),
                                    wf.sample_rate, cfg);
        }});
    }

    return list;
}

std::vector<TempoCandidate> estimate_tempo_candidates(const Waveform& wf,
                                                      const FeatureProvider& provider,
                                                      const Config& cfg) {
    auto results = run_strategies(build_tempo_strategies(wf, provider, cfg),
                                  cfg.parallel_strategies, cfg.verbose);

    std::vector<TempoCandidate> candidates;
    for (auto& r : results) {
        if (r && std::isfinite(r->value)) candidates.push_back(std::move(*r));
    }
    return candidates;
}

// --- Aggregation ---

double correct_octave(double bpm) {
    if (bpm > 160.0) {
        double half = bpm / 2.0;
        if (half >= 80.0 && half <= 140.0) return half;
    } else if (bpm < 80.0) {
        double twice = bpm * 2.0;
        if (twice >= 120.0 && twice <= 160.0) return twice;
    }
    return bpm;
}

TempoEstimate aggregate_tempo(const std::vector<TempoCandidate>& candidates) {
    if (candidates.empty()) return {};

    std::vector<double> values, weights;
    values.reserve(candidates.size());
    weights.reserve(candidates.size());
    for (const auto& c : candidates) {
        values.push_back(c.value);
        weights.push_back(c.weight);
    }

    if (values.size() > 2) {
        double med = median(values);
        double limit = 2.0 * population_stddev(values);

        std::vector<double> kept_values, kept_weights;
        for (size_t i = 0; i < values.size(); ++i) {
            if (std::abs(values[i] - med) <= limit) {
                kept_values.push_back(values[i]);
                kept_weights.push_back(weights[i]);
            }
        }
        values.swap(kept_values);
        weights.swap(kept_weights);
    }

    if (values.empty()) return {};

    auto avg = weighted_average(values, weights);
    if (!avg) return {};

    TempoEstimate est;
    est.bpm = round_to(correct_octave(*avg), 1);
    est.confidence = round_to(mean(weights), 2);
    return est;
}

} // namespace stemscan
