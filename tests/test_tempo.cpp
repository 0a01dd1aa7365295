#include "tempo.h"
#include "fake_provider.h"
#include "signal_math.h"

#include <gtest/gtest.h>

#include <cmath>

namespace stemscan {
namespace {

TempoCandidate candidate(double bpm, double weight) {
    return TempoCandidate{bpm, weight, "test"};
}

// ===========================================================================
// Octave correction
// ===========================================================================

TEST(CorrectOctave, HalvesAndDoubles) {
    EXPECT_DOUBLE_EQ(correct_octave(170.0), 85.0);
    EXPECT_DOUBLE_EQ(correct_octave(300.0), 300.0);   // 150 is outside 80..140
    EXPECT_DOUBLE_EQ(correct_octave(70.0), 140.0);
    EXPECT_DOUBLE_EQ(correct_octave(50.0), 50.0);     // 100 is outside 120..160
    EXPECT_DOUBLE_EQ(correct_octave(120.0), 120.0);
    EXPECT_DOUBLE_EQ(correct_octave(160.0), 160.0);
}

// ===========================================================================
// Aggregation
// ===========================================================================

TEST(AggregateTempo, EmptyIsUnknown) {
    TempoEstimate est = aggregate_tempo({});
    EXPECT_FALSE(est.bpm.has_value());
    EXPECT_DOUBLE_EQ(est.confidence, 0.0);
}

TEST(AggregateTempo, ZeroWeightsAreUnknown) {
    TempoEstimate est = aggregate_tempo({candidate(120.0, 0.0), candidate(122.0, 0.0)});
    EXPECT_FALSE(est.bpm.has_value());
    EXPECT_DOUBLE_EQ(est.confidence, 0.0);
}

TEST(AggregateTempo, SingleCandidateIsOctaveCorrected) {
    TempoEstimate est = aggregate_tempo({candidate(170.0, 0.7)});
    ASSERT_TRUE(est.bpm.has_value());
    EXPECT_DOUBLE_EQ(*est.bpm, 85.0);
    EXPECT_DOUBLE_EQ(est.confidence, 0.7);
}

TEST(AggregateTempo, RejectsOutlier) {
    std::vector<TempoCandidate> clean = {
        candidate(120.0, 0.70), candidate(121.0, 0.60),
        candidate(119.0, 0.80), candidate(122.0, 0.65),
    };
    std::vector<TempoCandidate> noisy = clean;
    noisy.push_back(candidate(400.0, 0.75));

    TempoEstimate with_outlier = aggregate_tempo(noisy);
    TempoEstimate without = aggregate_tempo(clean);

    ASSERT_TRUE(with_outlier.bpm.has_value());
    ASSERT_TRUE(without.bpm.has_value());
    EXPECT_DOUBLE_EQ(*with_outlier.bpm, 120.4);
    EXPECT_DOUBLE_EQ(*with_outlier.bpm, *without.bpm);
    EXPECT_DOUBLE_EQ(with_outlier.confidence, without.confidence);
    EXPECT_DOUBLE_EQ(without.confidence, 0.69);
}

TEST(AggregateTempo, TwoCandidatesAreNeverFiltered) {
    TempoEstimate est = aggregate_tempo({candidate(100.0, 0.5), candidate(140.0, 0.5)});
    ASSERT_TRUE(est.bpm.has_value());
    EXPECT_DOUBLE_EQ(*est.bpm, 120.0);
    EXPECT_DOUBLE_EQ(est.confidence, 0.5);
}

TEST(AggregateTempo, Deterministic) {
    std::vector<TempoCandidate> c = {
        candidate(127.8, 0.7), candidate(128.2, 0.6), candidate(128.0, 0.8),
        candidate(256.0, 0.7), candidate(129.1, 0.65),
    };
    TempoEstimate a = aggregate_tempo(c);
    TempoEstimate b = aggregate_tempo(c);
    EXPECT_EQ(a.bpm, b.bpm);
    EXPECT_EQ(a.confidence, b.confidence);
}

// ===========================================================================
// Single strategies
// ===========================================================================

TEST(TempoFromOnsets, MedianInterval) {
    Config cfg;
    auto c = tempo_from_onsets(fakes::onset_train(0.46875, 20), cfg);
    ASSERT_TRUE(c.has_value());
    EXPECT_NEAR(c->value, 128.0, 1e-9);
    EXPECT_DOUBLE_EQ(c->weight, cfg.weights.onset_interval);
    EXPECT_EQ(c->method, "tempo.onset_interval");
}

TEST(TempoFromOnsets, TooFewOnsets) {
    Config cfg;
    EXPECT_FALSE(tempo_from_onsets(fakes::onset_train(0.5, 3), cfg).has_value());
    EXPECT_TRUE(tempo_from_onsets(fakes::onset_train(0.5, 4), cfg).has_value());
}

TEST(TempoFromOnsets, OutOfRange) {
    Config cfg;
    EXPECT_FALSE(tempo_from_onsets(fakes::onset_train(0.24, 20), cfg).has_value());   // 250 bpm
    EXPECT_FALSE(tempo_from_onsets(fakes::onset_train(2.0, 20), cfg).has_value());    // 30 bpm
}

TEST(TempoFromAutocorrelation, LagZeroFirstGivesNothing) {
    // Unit impulses: the lag-0 peak clears delta and comes first
    Config cfg;
    EXPECT_FALSE(tempo_from_autocorrelation(fakes::impulse_train(43, 40), 44100, cfg));
}

TEST(TempoFromAutocorrelation, WeakLagZeroPeakYieldsPeriod) {
    // With h^2 = 0.003 the lag-0 excess over its window mean stays below
    // delta while the lag-43 excess clears it.
    Config cfg;
    std::vector<double> onsets = fakes::impulse_train(43, 40);
    const double h = std::sqrt(0.003);
    for (double& v : onsets) v *= h;

    auto c = tempo_from_autocorrelation(onsets, 44100, cfg);
    ASSERT_TRUE(c.has_value());
    EXPECT_NEAR(c->value, lag_to_bpm(43.0, 44100, cfg.onset_hop), 1e-9);
    EXPECT_DOUBLE_EQ(c->weight, cfg.weights.autocorrelation);
    EXPECT_EQ(c->method, "tempo.autocorrelation");
}

TEST(TempoFromAutocorrelation, FlatCurveGivesNothing) {
    Config cfg;
    EXPECT_FALSE(tempo_from_autocorrelation(std::vector<double>(500, 0.0), 44100, cfg));
    EXPECT_FALSE(tempo_from_autocorrelation({}, 44100, cfg));
}

TEST(TempoFromPrior, ImpulseTrain) {
    Config cfg;
    auto c = tempo_from_prior(fakes::impulse_train(43, 40), 44100, cfg);
    ASSERT_TRUE(c.has_value());
    EXPECT_NEAR(c->value, 120.19, 0.01);
    EXPECT_DOUBLE_EQ(c->weight, cfg.weights.prior);
}

// ===========================================================================
// Ensemble
// ===========================================================================

TEST(TempoEnsemble, OneBeatTrackerPerHop) {
    Config cfg;
    fakes::FakeFeatureProvider provider;
    Waveform wf = fakes::silent_waveform(1.0);
    auto list = build_tempo_strategies(wf, provider, cfg);

    ASSERT_EQ(list.size(), cfg.beat_hops.size() + 4);
    EXPECT_EQ(list[0].tag, "tempo.beat_track@512");
    EXPECT_EQ(list[2].tag, "tempo.beat_track@2048");
}

TEST(TempoEnsemble, FilterDisablesStrategies) {
    Config cfg;
    cfg.enabled_strategies = {StrategyType::TEMPO_HISTOGRAM};
    fakes::FakeFeatureProvider provider;
    Waveform wf = fakes::silent_waveform(1.0);
    auto list = build_tempo_strategies(wf, provider, cfg);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].type, StrategyType::TEMPO_HISTOGRAM);
}

TEST(TempoEnsemble, CollectsOnlyPresentResults) {
    Config cfg;
    fakes::FakeFeatureProvider provider;
    provider.beat_bpm = {{512, 128.0}, {1024, 127.5}};   // 2048 finds no beat
    provider.histogram_bpm = 0.0;                         // histogram finds nothing
    provider.onsets = fakes::onset_train(0.46875, 16);
    Waveform wf = fakes::silent_waveform(8.0);

    auto candidates = estimate_tempo_candidates(wf, provider, cfg);
    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0].method, "tempo.beat_track");
    EXPECT_EQ(candidates[2].method, "tempo.onset_interval");
}

TEST(TempoEnsemble, FailingPrimitivesContributeNothing) {
    Config cfg;
    fakes::FakeFeatureProvider provider;
    provider.fail_estimators = true;
    Waveform wf = fakes::silent_waveform(1.0);
    EXPECT_TRUE(estimate_tempo_candidates(wf, provider, cfg).empty());
}

} // namespace
} // namespace stemscan
