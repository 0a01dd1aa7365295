#include "strategies.h"

#include <iostream>
#include <sstream>
#include <vector>

namespace stemscan {

struct StrategyNameEntry {
    StrategyType type;
    std::string  name;
};

static const std::vector<StrategyNameEntry>& all_entries() {
    static const std::vector<StrategyNameEntry> entries = {
        {StrategyType::TEMPO_BEAT_TRACK,      "tempo.beat_track"},
        {StrategyType::TEMPO_ONSET_INTERVAL,  "tempo.onset_interval"},
        {StrategyType::TEMPO_HISTOGRAM,       "tempo.histogram"},
        {StrategyType::TEMPO_AUTOCORRELATION, "tempo.autocorrelation"},
        {StrategyType::TEMPO_PRIOR,           "tempo.prior"},
        {StrategyType::KEY_CHROMA,            "key.chroma"},
        {StrategyType::KEY_EXTRACTOR,         "key.extractor"},
        {StrategyType::KEY_HARMONIC,          "key.harmonic"},
    };
    return entries;
}

const std::unordered_map<std::string, StrategyType>& strategy_name_map() {
    static const std::unordered_map<std::string, StrategyType> map = [] {
        std::unordered_map<std::string, StrategyType> m;
        for (const auto& e : all_entries()) m[e.name] = e.type;
        return m;
    }();
    return map;
}

const std::string& strategy_name(StrategyType st) {
    for (const auto& e : all_entries()) {
        if (e.type == st) return e.name;
    }
    static const std::string unknown = "unknown";
    return unknown;
}

bool is_tempo_strategy(StrategyType st) {
    return st == StrategyType::TEMPO_BEAT_TRACK ||
           st == StrategyType::TEMPO_ONSET_INTERVAL ||
           st == StrategyType::TEMPO_HISTOGRAM ||
           st == StrategyType::TEMPO_AUTOCORRELATION ||
           st == StrategyType::TEMPO_PRIOR;
}

StrategyFilter all_strategies() {
    StrategyFilter filter;
    for (const auto& e : all_entries()) filter.insert(e.type);
    return filter;
}

StrategyFilter tempo_strategies() {
    StrategyFilter filter;
    for (const auto& e : all_entries()) {
        if (is_tempo_strategy(e.type)) filter.insert(e.type);
    }
    return filter;
}

StrategyFilter key_strategies() {
    StrategyFilter filter;
    for (const auto& e : all_entries()) {
        if (!is_tempo_strategy(e.type)) filter.insert(e.type);
    }
    return filter;
}

StrategyFilter parse_strategy_filter(const std::string& csv) {
    StrategyFilter filter;
    const auto& names = strategy_name_map();
    std::istringstream stream(csv);
    std::string token;

    while (std::getline(stream, token, ',')) {
        // Trim whitespace
        size_t start = token.find_first_not_of(" \t");
        size_t end   = token.find_last_not_of(" \t");
        if (start == std::string::npos) continue;
        token = token.substr(start, end - start + 1);

        // Group names
        if (token == "tempo") {
            auto t = tempo_strategies();
            filter.insert(t.begin(), t.end());
            continue;
        }
        if (token == "key") {
            auto k = key_strategies();
            filter.insert(k.begin(), k.end());
            continue;
        }

        auto it = names.find(token);
        if (it == names.end()) {
            std::cerr << "Warning: unknown strategy '" << token << "', skipping\n";
            continue;
        }
        filter.insert(it->second);
    }
    return filter;
}

} // namespace stemscan
