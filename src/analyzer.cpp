#include "analyzer.h"
#include "key.h"
#include "signal_math.h"
#include "tempo.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace stemscan {

// --- Helpers ---

static double finite_mean(const std::vector<double>& values) {
    double m = mean(values);
    return std::isfinite(m) ? m : 0.0;
}

static double dynamic_range(const std::vector<double>& rms) {
    if (rms.empty()) return 0.0;
    auto [lo, hi] = std::minmax_element(rms.begin(), rms.end());
    return *hi - *lo;
}

static std::array<double, kMfccCoefficients>
mean_mfcc(const std::vector<std::array<double, kMfccCoefficients>>& frames) {
    std::array<double, kMfccCoefficients> acc{};
    if (frames.empty()) return acc;
    for (const auto& f : frames) {
        for (int i = 0; i < kMfccCoefficients; ++i) acc[i] += f[i];
    }
    for (double& v : acc) {
        v /= static_cast<double>(frames.size());
        if (!std::isfinite(v)) v = 0.0;
    }
    return acc;
}

static void log_line(const Config& cfg, const std::string& line) {
    if (!cfg.verbose) return;
    std::cout << line + "\n";
}

AnalysisResult failed_result(const std::string& error) {
    AnalysisResult r;
    r.success = false;
    r.error = error.empty() ? "analysis failed" : error;
    return r;
}

// --- Main entry points ---

AnalysisResult analyze_waveform(const Waveform& wf, const FeatureProvider& provider,
                                const Config& cfg) {
    try {
        if (wf.sample_rate <= 0) {
            throw std::invalid_argument("invalid sample rate " + std::to_string(wf.sample_rate));
        }
        if (wf.samples.empty()) {
            throw std::invalid_argument("waveform is empty");
        }

        log_line(cfg, "  Analyzing tempo...");
        auto tempo_candidates = estimate_tempo_candidates(wf, provider, cfg);
        TempoEstimate tempo = aggregate_tempo(tempo_candidates);

        log_line(cfg, "  Analyzing key...");
        auto key_candidates = estimate_key_candidates(wf, provider, cfg);
        KeyEstimate key = aggregate_key(key_candidates);

        log_line(cfg, "  Analyzing spectral features...");
        FrameFeatures ff = provider.frame_features(wf, cfg.frame_size, cfg.hop_size);

        AnalysisResult r;
        r.bpm                = tempo.bpm;
        r.bpm_confidence     = tempo.bpm ? tempo.confidence : 0.0;
        r.key                = key.key;
        r.key_confidence     = key.confidence;
        r.duration           = round_to(wf.duration(), 2);
        r.spectral_centroid  = round_to(finite_mean(ff.centroid), 1);
        r.spectral_rolloff   = round_to(finite_mean(ff.rolloff), 1);
        r.spectral_bandwidth = round_to(finite_mean(ff.bandwidth), 1);
        r.zero_crossing_rate = round_to(finite_mean(ff.zero_crossing_rate), 4);
        r.dynamic_range      = round_to(dynamic_range(ff.rms), 4);
        r.mfcc_mean          = mean_mfcc(ff.mfcc);
        r.sample_rate        = wf.native_sample_rate > 0 ? wf.native_sample_rate : wf.sample_rate;
        r.success            = true;

        std::ostringstream os;
        os << "    " << tempo_candidates.size() << " tempo candidates, "
           << key_candidates.size() << " key candidates";
        log_line(cfg, os.str());
        return r;
    } catch (const std::exception& e) {
        return failed_result(e.what());
    }
}

AnalysisResult analyze_file(const std::string& path, const FeatureProvider& provider,
                            const Config& cfg) {
    Waveform wf;
    try {
        wf = provider.decode(path, cfg.sample_rate);
    } catch (const std::exception& e) {
        return failed_result("cannot decode " + path + ": " + e.what());
    }
    return analyze_waveform(wf, provider, cfg);
}

} // namespace stemscan
