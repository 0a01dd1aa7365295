#include "key.h"
#include "signal_math.h"

#include <algorithm>
#include <cmath>

namespace stemscan {

static ChromaVector normalized(ChromaVector v) {
    double sum = 0.0;
    for (double x : v) sum += x;
    for (double& x : v) x /= sum;
    return v;
}

const KeyProfiles& key_profiles() {
    static const KeyProfiles profiles = {
        normalized({6.35, 2.23, 3.48, 2.33, 4.38, 4.09, 2.52, 5.19, 2.39, 3.66, 2.29, 2.88}),
        normalized({6.33, 2.68, 3.52, 5.38, 2.60, 3.53, 2.54, 4.75, 3.98, 2.69, 3.34, 3.17}),
    };
    return profiles;
}

ChromaVector rotate_profile(const ChromaVector& profile, int shift) {
    ChromaVector out{};
    for (int n = 0; n < kPitchClasses; ++n) {
        out[n] = profile[wrap_pitch_class(n - shift)];
    }
    return out;
}

std::vector<KeyCandidate> score_key_hypotheses(const ChromaVector& chroma, double weight,
                                               const std::string& method) {
    const auto& profiles = key_profiles();
    std::vector<KeyCandidate> out;
    out.reserve(kKeyHypotheses);

    for (int pc = 0; pc < kPitchClasses; ++pc) {
        if (auto r = pearson(chroma, rotate_profile(profiles.major, pc))) {
            out.push_back({pc, Mode::MAJOR, *r * weight, method});
        }
        if (auto r = pearson(chroma, rotate_profile(profiles.minor, pc))) {
            out.push_back({pc, Mode::MINOR, *r * weight, method});
        }
    }
    return out;
}

std::vector<KeyCandidate> score_chroma_frames(const std::vector<ChromaVector>& frames,
                                              double weight, const std::string& method) {
    auto chroma = mean_chroma(frames);
    if (!chroma) return {};
    return score_key_hypotheses(*chroma, weight, method);
}

std::optional<KeyCandidate> key_from_extractor(const std::optional<ExternalKey>& key,
                                               const Config& cfg) {
    if (!key || !(key->strength > cfg.weights.extractor_min_strength)) return std::nullopt;
    return KeyCandidate{wrap_pitch_class(key->pitch_class), key->mode,
                        key->strength * cfg.weights.extractor,
                        strategy_name(StrategyType::KEY_EXTRACTOR)};
}

// --- Ensemble ---

std::vector<KeyStrategy> build_key_strategies(const Waveform& wf,
                                              const FeatureProvider& provider,
                                              const Config& cfg) {
    std::vector<KeyStrategy> list;
    const auto& enabled = cfg.enabled_strategies;

    if (enabled.count(StrategyType::KEY_CHROMA)) {
        struct Source { ChromaVariant variant; const char* suffix; double weight; };
        const Source sources[] = {
            {ChromaVariant::STFT, ".stft", cfg.weights.chroma_stft},
            {ChromaVariant::CQT,  ".cqt",  cfg.weights.chroma_cqt},
            {ChromaVariant::CENS, ".cens", cfg.weights.chroma_cens},
        };
        for (const auto& src : sources) {
            std::string tag = strategy_name(StrategyType::KEY_CHROMA) + src.suffix;
            list.push_back({StrategyType::KEY_CHROMA, tag,
                            [&wf, &provider, src, tag] {
                return score_chroma_frames(provider.chroma(wf, src.variant), src.weight, tag);
            }});
        }
    }

    if (enabled.count(StrategyType::KEY_EXTRACTOR)) {
        list.push_back({StrategyType::KEY_EXTRACTOR,
                        strategy_name(StrategyType::KEY_EXTRACTOR),
                        [&wf, &provider, &cfg] {
            std::vector<KeyCandidate> out;
            if (auto c = key_from_extractor(provider.extract_key(wf), cfg)) {
                out.push_back(std::move(*c));
            }
            return out;
        }});
    }

    if (enabled.count(StrategyType::KEY_HARMONIC)) {
        list.push_back({StrategyType::KEY_HARMONIC,
                        strategy_name(StrategyType::KEY_HARMONIC),
                        [&wf, &provider, &cfg] {
            HarmonicPercussive hp = provider.harmonic_percussive(wf);
            return score_chroma_frames(provider.chroma(hp.harmonic, ChromaVariant::CQT),
                                       cfg.weights.harmonic,
                                       strategy_name(StrategyType::KEY_HARMONIC));
        }});
    }

    return list;
}

std::vector<KeyCandidate> estimate_key_candidates(const Waveform& wf,
                                                  const FeatureProvider& provider,
                                                  const Config& cfg) {
    auto results = run_strategies(build_key_strategies(wf, provider, cfg),
                                  cfg.parallel_strategies, cfg.verbose);

    std::vector<KeyCandidate> candidates;
    for (auto& r : results) {
        for (auto& c : r) {
            if (std::isfinite(c.score)) candidates.push_back(std::move(c));
        }
    }
    return candidates;
}

// --- Aggregation ---

void KeyScoreTable::add(const KeyCandidate& c) {
    int s = slot(c.pitch_class, c.mode);
    scores_[s] += c.score;
    seen_[s] = true;
    ++count_;
}

KeyEstimate KeyScoreTable::best() const {
    if (count_ == 0) return {};

    int best_slot = -1;
    for (int s = 0; s < kKeyHypotheses; ++s) {
        if (!seen_[s]) continue;
        if (best_slot < 0 || scores_[s] > scores_[best_slot]) best_slot = s;
    }

    KeyEstimate est;
    est.key = KeySignature{best_slot / 2, best_slot % 2 == 0 ? Mode::MAJOR : Mode::MINOR};
    est.confidence = round_to(std::clamp(scores_[best_slot], 0.0, 1.0), 2);
    return est;
}

KeyEstimate aggregate_key(const std::vector<KeyCandidate>& candidates) {
    KeyScoreTable table;
    for (const auto& c : candidates) table.add(c);
    return table.best();
}

} // namespace stemscan
