#pragma once

#include "config.h"
#include "feature_provider.h"
#include "types.h"
#include <string>

namespace stemscan {

// Runs the tempo and key ensembles over a decoded waveform and merges them
// with the spectral summary statistics. Never throws: a failure while
// extracting features yields success == false and an error message.
AnalysisResult analyze_waveform(const Waveform& wf, const FeatureProvider& provider,
                                const Config& cfg);

// Decodes the file at cfg.sample_rate, then analyze_waveform.
// Decode failures are reported the same way.
AnalysisResult analyze_file(const std::string& path, const FeatureProvider& provider,
                            const Config& cfg);

// The result reported for a failed analysis: every numeric field zero.
AnalysisResult failed_result(const std::string& error);

} // namespace stemscan
