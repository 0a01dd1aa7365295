#pragma once

#include "config.h"
#include "ensemble.h"
#include "feature_provider.h"
#include "types.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace stemscan {

using KeyStrategy = Strategy<std::vector<KeyCandidate>>;

// Krumhansl-Kessler probe-tone profiles, each normalized to sum 1.
struct KeyProfiles {
    ChromaVector major;
    ChromaVector minor;
};

const KeyProfiles& key_profiles();

// out[n] = profile[(n - shift) mod 12]
ChromaVector rotate_profile(const ChromaVector& profile, int shift);

// Pearson correlation of `chroma` against all 24 rotated profiles, each
// defined correlation scaled by `weight`. Order: pitch class 0..11, major
// then minor.
std::vector<KeyCandidate> score_key_hypotheses(const ChromaVector& chroma, double weight,
                                               const std::string& method);

// Time-mean of the frames, normalized, then score_key_hypotheses.
// No candidates when the frames carry no energy.
std::vector<KeyCandidate> score_chroma_frames(const std::vector<ChromaVector>& frames,
                                              double weight, const std::string& method);

// One candidate at strength * cfg.weights.extractor when the strength
// exceeds cfg.weights.extractor_min_strength.
std::optional<KeyCandidate> key_from_extractor(const std::optional<ExternalKey>& key,
                                               const Config& cfg);

// The enabled key strategies for one waveform, in a fixed order. The
// waveform and provider must outlive the returned list.
std::vector<KeyStrategy> build_key_strategies(const Waveform& wf,
                                              const FeatureProvider& provider,
                                              const Config& cfg);

std::vector<KeyCandidate> estimate_key_candidates(const Waveform& wf,
                                                  const FeatureProvider& provider,
                                                  const Config& cfg);

// Accumulated score per (pitch class, mode). Slot = pitch_class * 2 + mode.
class KeyScoreTable {
public:
    static int slot(int pitch_class, Mode mode) {
        return wrap_pitch_class(pitch_class) * 2 + (mode == Mode::MAJOR ? 0 : 1);
    }

    void add(const KeyCandidate& c);
    double score(int pitch_class, Mode mode) const { return scores_[slot(pitch_class, mode)]; }
    size_t candidate_count() const { return count_; }

    // Highest slot among those that received a candidate; ties go to the
    // lower pitch class, then major. ("Unknown", 0) when nothing was added.
    KeyEstimate best() const;

private:
    std::array<double, kKeyHypotheses> scores_{};
    std::array<bool, kKeyHypotheses>   seen_{};
    size_t count_ = 0;
};

KeyEstimate aggregate_key(const std::vector<KeyCandidate>& candidates);

} // namespace stemscan
