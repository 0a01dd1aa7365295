#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace stemscan {

constexpr int kPitchClasses = 12;
constexpr int kKeyHypotheses = 2 * kPitchClasses;
constexpr int kMfccCoefficients = 13;

// Decoded mono audio. Never modified once decoded.
struct Waveform {
    std::vector<float> samples;
    int                sample_rate        = 0;
    int                native_sample_rate = 0;  // rate of the source file, 0 when unknown

    double duration() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

enum class Mode { MAJOR, MINOR };

using ChromaVector = std::array<double, kPitchClasses>;

struct KeySignature {
    int  pitch_class = 0;   // 0 = C ... 11 = B
    Mode mode        = Mode::MAJOR;

    bool operator==(const KeySignature& o) const {
        return pitch_class == o.pitch_class && mode == o.mode;
    }
};

struct TempoCandidate {
    double      value  = 0.0;  // BPM
    double      weight = 0.0;  // [0, 1]
    std::string method;
};

struct KeyCandidate {
    int         pitch_class = 0;
    Mode        mode        = Mode::MAJOR;
    double      score       = 0.0;
    std::string method;
};

struct TempoEstimate {
    std::optional<double> bpm;
    double                confidence = 0.0;
};

struct KeyEstimate {
    std::optional<KeySignature> key;
    double                      confidence = 0.0;
};

// Output of one analysis call. Built once, then only read.
struct AnalysisResult {
    std::optional<double>       bpm;
    double                      bpm_confidence = 0.0;
    std::optional<KeySignature> key;
    double                      key_confidence = 0.0;

    double duration           = 0.0;
    double spectral_centroid  = 0.0;
    double spectral_rolloff   = 0.0;
    double spectral_bandwidth = 0.0;
    double zero_crossing_rate = 0.0;
    double dynamic_range      = 0.0;
    std::array<double, kMfccCoefficients> mfcc_mean{};
    int    sample_rate        = 0;

    bool        success = false;
    std::string error;
};

// Wraps a pitch class into 0..11.
inline int wrap_pitch_class(int pc) {
    int r = pc % kPitchClasses;
    return r < 0 ? r + kPitchClasses : r;
}

const std::string& pitch_class_name(int pc);
const std::string& mode_name(Mode mode);

// "C major", "F# minor", or "Unknown" when absent.
std::string key_label(const std::optional<KeySignature>& key);

// Accepts sharp and flat spellings ("C#", "Db", "Bb", "E#"...).
// Returns -1 for anything else.
int parse_pitch_class(const std::string& name);

// "major"/"minor" (case-insensitive). Empty optional otherwise.
std::optional<Mode> parse_mode(const std::string& name);

// Display colour for a key, grey when unknown.
std::string key_color(const std::optional<KeySignature>& key);

// "128.0 BPM (Fast)", or "Unknown tempo".
std::string bpm_description(const std::optional<double>& bpm);

// Rounds half away from zero to the given number of decimals.
double round_to(double value, int decimals);

} // namespace stemscan
