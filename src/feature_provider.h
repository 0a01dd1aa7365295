#pragma once

#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace stemscan {

enum class ChromaVariant {
    STFT,   // HPCP over spectral peaks
    CQT,    // constant-Q chromagram
    CENS,   // quantized, smoothed constant-Q chroma
};

struct ExternalKey {
    int    pitch_class = 0;
    Mode   mode        = Mode::MAJOR;
    double strength    = 0.0;
};

struct HarmonicPercussive {
    Waveform harmonic;
    Waveform percussive;
};

// Frame-wise low-level descriptors, one entry per analysis frame.
struct FrameFeatures {
    std::vector<double> centroid;            // Hz
    std::vector<double> rolloff;             // Hz
    std::vector<double> bandwidth;           // Hz
    std::vector<double> zero_crossing_rate;
    std::vector<double> rms;
    std::vector<std::array<double, kMfccCoefficients>> mfcc;
};

// Source of the spectral primitives the estimators are built on.
// Every call is a pure function of its arguments and may throw
// std::exception on failure. Implementations must tolerate concurrent calls.
class FeatureProvider {
public:
    virtual ~FeatureProvider() = default;

    // Decode an audio file to mono at sample_rate, keeping the file's own rate
    // in native_sample_rate.
    virtual Waveform decode(const std::string& path, int sample_rate) const = 0;

    // Chroma frames, index 0 = C.
    virtual std::vector<ChromaVector> chroma(const Waveform& wf, ChromaVariant variant) const = 0;

    // Onset positions in seconds.
    virtual std::vector<double> onset_times(const Waveform& wf) const = 0;

    // Global tempo of a beat tracker running at hop_size. 0 when no beat is found.
    virtual double beat_track_bpm(const Waveform& wf, int hop_size) const = 0;

    // Onset-strength curve, one value per hop_size samples.
    virtual std::vector<double> onset_strength(const Waveform& wf, int hop_size) const = 0;

    virtual HarmonicPercussive harmonic_percussive(const Waveform& wf) const = 0;

    // First peak of the tempo histogram descriptor; empty when the descriptor
    // is not available.
    virtual std::optional<double> tempo_histogram_bpm(const Waveform& wf) const = 0;

    // Empty when no key extractor is available.
    virtual std::optional<ExternalKey> extract_key(const Waveform& wf) const = 0;

    virtual FrameFeatures frame_features(const Waveform& wf, int frame_size, int hop_size) const = 0;
};

} // namespace stemscan
