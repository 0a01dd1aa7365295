#pragma once

#include "strategies.h"
#include <string>
#include <vector>

namespace stemscan {

// Per-strategy confidence weights. The defaults are the tuned heuristic
// values; every one can be overridden from the `weights:` YAML section,
// where a value outside [0, 1] is a config error.
struct StrategyWeights {
    // tempo
    double beat_track      = 0.70;
    double onset_interval  = 0.60;
    double histogram       = 0.80;
    double autocorrelation = 0.65;
    double prior           = 0.75;

    // key
    double chroma_stft            = 0.4;
    double chroma_cqt             = 0.4;
    double chroma_cens            = 0.2;
    double extractor              = 0.8;   // multiplied by the extractor's strength
    double extractor_min_strength = 0.1;
    double harmonic               = 0.6;
};

struct Config {
    // analysis
    int    sample_rate = 44100;
    int    frame_size  = 2048;
    int    hop_size    = 512;
    int    onset_hop   = 512;       // hop of the onset-strength curve
    std::vector<int> beat_hops = {512, 1024, 2048};
    double min_bpm          = 40.0;
    double max_bpm          = 200.0;
    double prior_max_bpm    = 240.0;
    double prior_center_bpm = 120.0;

    StrategyWeights weights;
    StrategyFilter  enabled_strategies = all_strategies();

    // runtime
    int  jobs                = 1;
    bool parallel_strategies = false;
    bool verbose             = false;

    // input / output
    std::vector<std::string> input_files;
    std::string              output_file;
};

// Apply a YAML config file on top of cfg.
// Returns false if the file cannot be opened; throws YAML::Exception on bad content.
bool load_yaml_config(Config& cfg, const std::string& path);

// Load config: YAML file first, then CLI args override.
// Returns true on success, false on error (e.g. --help requested).
bool load_config(Config& cfg, int argc, char* argv[]);

} // namespace stemscan
