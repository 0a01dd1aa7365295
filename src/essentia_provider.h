#pragma once

#include "feature_provider.h"

namespace stemscan {

// FeatureProvider backed by Essentia standard-mode algorithms.
// essentia::init() must have been called before the first use. Each call
// creates its own algorithm instances, so one provider can serve several
// threads.
class EssentiaFeatureProvider : public FeatureProvider {
public:
    Waveform decode(const std::string& path, int sample_rate) const override;
    std::vector<ChromaVector> chroma(const Waveform& wf, ChromaVariant variant) const override;
    std::vector<double> onset_times(const Waveform& wf) const override;
    double beat_track_bpm(const Waveform& wf, int hop_size) const override;
    std::vector<double> onset_strength(const Waveform& wf, int hop_size) const override;
    HarmonicPercussive harmonic_percussive(const Waveform& wf) const override;
    std::optional<double> tempo_histogram_bpm(const Waveform& wf) const override;
    std::optional<ExternalKey> extract_key(const Waveform& wf) const override;
    FrameFeatures frame_features(const Waveform& wf, int frame_size, int hop_size) const override;
};

} // namespace stemscan
