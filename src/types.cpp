#include "types.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <unordered_map>

namespace stemscan {

static const std::array<std::string, kPitchClasses>& pitch_names() {
    static const std::array<std::string, kPitchClasses> names = {
        "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
    };
    return names;
}

const std::string& pitch_class_name(int pc) {
    return pitch_names()[static_cast<size_t>(wrap_pitch_class(pc))];
}

const std::string& mode_name(Mode mode) {
    static const std::string major = "major";
    static const std::string minor = "minor";
    return mode == Mode::MAJOR ? major : minor;
}

std::string key_label(const std::optional<KeySignature>& key) {
    if (!key) return "Unknown";
    return pitch_class_name(key->pitch_class) + " " + mode_name(key->mode);
}

int parse_pitch_class(const std::string& name) {
    if (name.empty()) return -1;

    static const std::unordered_map<char, int> naturals = {
        {'C', 0}, {'D', 2}, {'E', 4}, {'F', 5}, {'G', 7}, {'A', 9}, {'B', 11}
    };
    auto it = naturals.find(static_cast<char>(std::toupper(static_cast<unsigned char>(name[0]))));
    if (it == naturals.end()) return -1;

    int pc = it->second;
    for (size_t i = 1; i < name.size(); ++i) {
        char c = name[i];
        if (c == '#')      pc += 1;
        else if (c == 'b') pc -= 1;
        else return -1;
    }
    return wrap_pitch_class(pc);
}

std::optional<Mode> parse_mode(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "major") return Mode::MAJOR;
    if (lower == "minor") return Mode::MINOR;
    return std::nullopt;
}

std::string key_color(const std::optional<KeySignature>& key) {
    // Indexed by pitch class, {major, minor}
    static const char* colors[kPitchClasses][2] = {
        {"#FF6B6B", "#FF8E8E"},  // C
        {"#FF9F43", "#FFB366"},  // C#
        {"#FFA726", "#FFCC80"},  // D
        {"#FFEB3B", "#FFF176"},  // D#
        {"#8BC34A", "#AED581"},  // E
        {"#4CAF50", "#81C784"},  // F
        {"#26A69A", "#4DB6AC"},  // F#
        {"#29B6F6", "#64B5F6"},  // G
        {"#3F51B5", "#7986CB"},  // G#
        {"#9C27B0", "#BA68C8"},  // A
        {"#E91E63", "#F06292"},  // A#
        {"#F44336", "#EF5350"},  // B
    };
    if (!key) return "#9E9E9E";
    return colors[wrap_pitch_class(key->pitch_class)][key->mode == Mode::MAJOR ? 0 : 1];
}

std::string bpm_description(const std::optional<double>& bpm) {
    if (!bpm) return "Unknown tempo";

    double v = *bpm;
    const char* label;
    if (v < 60.0)       label = "Very Slow";
    else if (v < 80.0)  label = "Slow";
    else if (v < 100.0) label = "Moderate";
    else if (v < 120.0) label = "Medium";
    else if (v < 140.0) label = "Fast";
    else if (v < 160.0) label = "Very Fast";
    else                label = "Extremely Fast";

    char buf[64];
    snprintf(buf, sizeof(buf), "%.1f BPM (%s)", v, label);
    return buf;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace stemscan
