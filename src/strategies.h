#pragma once

#include <set>
#include <string>
#include <unordered_map>

namespace stemscan {

// All estimation strategies of the tempo and key ensembles
enum class StrategyType {
    // Tempo
    TEMPO_BEAT_TRACK,
    TEMPO_ONSET_INTERVAL,
    TEMPO_HISTOGRAM,
    TEMPO_AUTOCORRELATION,
    TEMPO_PRIOR,

    // Key
    KEY_CHROMA,
    KEY_EXTRACTOR,
    KEY_HARMONIC,
};

using StrategyFilter = std::set<StrategyType>;

// Name-to-enum mapping (dotted names like "tempo.histogram", "key.chroma")
const std::unordered_map<std::string, StrategyType>& strategy_name_map();

// Enum-to-name mapping
const std::string& strategy_name(StrategyType st);

bool is_tempo_strategy(StrategyType st);

// Predefined filter sets
StrategyFilter all_strategies();
StrategyFilter tempo_strategies();
StrategyFilter key_strategies();

// Parse comma-separated strategy names into a filter.
// Unknown names are reported on stderr and skipped.
StrategyFilter parse_strategy_filter(const std::string& csv);

} // namespace stemscan
