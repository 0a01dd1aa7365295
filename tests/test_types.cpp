#include "types.h"

#include <gtest/gtest.h>

namespace stemscan {
namespace {

TEST(KeyLabel, NamesWithSharps) {
    EXPECT_EQ(key_label(KeySignature{0, Mode::MAJOR}), "C major");
    EXPECT_EQ(key_label(KeySignature{6, Mode::MINOR}), "F# minor");
    EXPECT_EQ(key_label(KeySignature{10, Mode::MAJOR}), "A# major");
}

TEST(KeyLabel, AbsentKeyIsUnknown) {
    EXPECT_EQ(key_label(std::nullopt), "Unknown");
}

TEST(ParsePitchClass, SharpsAndFlatsShareSlots) {
    EXPECT_EQ(parse_pitch_class("C"), 0);
    EXPECT_EQ(parse_pitch_class("C#"), 1);
    EXPECT_EQ(parse_pitch_class("Db"), 1);
    EXPECT_EQ(parse_pitch_class("Bb"), 10);
    EXPECT_EQ(parse_pitch_class("A#"), 10);
    EXPECT_EQ(parse_pitch_class("Cb"), 11);
    EXPECT_EQ(parse_pitch_class("E#"), 5);
}

TEST(ParsePitchClass, RejectsGarbage) {
    EXPECT_EQ(parse_pitch_class(""), -1);
    EXPECT_EQ(parse_pitch_class("H"), -1);
    EXPECT_EQ(parse_pitch_class("C major"), -1);
}

TEST(ParseMode, CaseInsensitive) {
    EXPECT_EQ(parse_mode("major"), Mode::MAJOR);
    EXPECT_EQ(parse_mode("Minor"), Mode::MINOR);
    EXPECT_FALSE(parse_mode("dorian").has_value());
}

TEST(KeyColor, GreyWhenUnknown) {
    EXPECT_EQ(key_color(std::nullopt), "#9E9E9E");
    EXPECT_NE(key_color(KeySignature{9, Mode::MAJOR}), key_color(KeySignature{9, Mode::MINOR}));
}

TEST(BpmDescription, Buckets) {
    EXPECT_EQ(bpm_description(128.0), "128.0 BPM (Fast)");
    EXPECT_EQ(bpm_description(59.9), "59.9 BPM (Very Slow)");
    EXPECT_EQ(bpm_description(80.0), "80.0 BPM (Moderate)");
    EXPECT_EQ(bpm_description(175.0), "175.0 BPM (Extremely Fast)");
    EXPECT_EQ(bpm_description(std::nullopt), "Unknown tempo");
}

TEST(RoundTo, HalfAwayFromZero) {
    EXPECT_DOUBLE_EQ(round_to(1.25, 1), 1.3);
    EXPECT_DOUBLE_EQ(round_to(-1.25, 1), -1.3);
    EXPECT_DOUBLE_EQ(round_to(127.96, 1), 128.0);
    EXPECT_DOUBLE_EQ(round_to(0.6, 2), 0.6);
}

TEST(Waveform, Duration) {
    Waveform wf;
    EXPECT_DOUBLE_EQ(wf.duration(), 0.0);
    wf.sample_rate = 22050;
    wf.samples.resize(44100);
    EXPECT_DOUBLE_EQ(wf.duration(), 2.0);
}

} // namespace
} // namespace stemscan
