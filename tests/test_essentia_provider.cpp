#include "essentia_provider.h"
#include "signal_math.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include <essentia/algorithmfactory.h>
#include <essentia/essentia.h>
#include <gtest/gtest.h>

namespace stemscan {
namespace {

// ===========================================================================
// Test helpers
// ===========================================================================

constexpr int kRate = 44100;

constexpr double kC4 = 261.6256;
constexpr double kE4 = 329.6276;
constexpr double kG4 = 391.9954;

Waveform tones(std::initializer_list<double> freqs, double seconds, int sample_rate = kRate) {
    Waveform wf;
    wf.sample_rate = sample_rate;
    wf.samples.resize(static_cast<size_t>(seconds * sample_rate));
    const double amp = 0.8 / static_cast<double>(freqs.size());
    for (size_t i = 0; i < wf.samples.size(); ++i) {
        double t = static_cast<double>(i) / sample_rate;
        double v = 0.0;
        for (double f : freqs) v += amp * std::sin(2.0 * M_PI * f * t);
        wf.samples[i] = static_cast<float>(v);
    }
    return wf;
}

int strongest_bin(const ChromaVector& c) {
    return static_cast<int>(std::max_element(c.begin(), c.end()) - c.begin());
}

ChromaVector mean_of(const EssentiaFeatureProvider& provider, const Waveform& wf,
                     ChromaVariant variant) {
    auto mean = mean_chroma(provider.chroma(wf, variant));
    EXPECT_TRUE(mean.has_value());
    return mean.value_or(ChromaVector{});
}

// Bins 0, 4 and 7 (C, E, G) must each beat every other bin
void expect_c_major_triad(const ChromaVector& c) {
    double weakest_triad = std::min({c[0], c[4], c[7]});
    for (int i = 0; i < kPitchClasses; ++i) {
        if (i == 0 || i == 4 || i == 7) continue;
        EXPECT_GT(weakest_triad, c[i]) << "bin " << i;
    }
}

// ===========================================================================
// Chroma bin alignment
// ===========================================================================

TEST(EssentiaChroma, PureCLandsInBinZero) {
    EssentiaFeatureProvider provider;
    Waveform wf = tones({kC4}, 6.0);
    EXPECT_EQ(strongest_bin(mean_of(provider, wf, ChromaVariant::STFT)), 0);
    EXPECT_EQ(strongest_bin(mean_of(provider, wf, ChromaVariant::CQT)), 0);
}

TEST(EssentiaChroma, PureALandsInBinNine) {
    EssentiaFeatureProvider provider;
    Waveform wf = tones({440.0}, 6.0);
    EXPECT_EQ(strongest_bin(mean_of(provider, wf, ChromaVariant::STFT)), 9);
    EXPECT_EQ(strongest_bin(mean_of(provider, wf, ChromaVariant::CQT)), 9);
}

TEST(EssentiaChroma, CMajorTriad) {
    EssentiaFeatureProvider provider;
    Waveform wf = tones({kC4, kE4, kG4}, 6.0);
    expect_c_major_triad(mean_of(provider, wf, ChromaVariant::STFT));
    expect_c_major_triad(mean_of(provider, wf, ChromaVariant::CQT));
}

// ===========================================================================
// Tempo histogram
// ===========================================================================

TEST(EssentiaTempoHistogram, SilenceHasNoHistogram) {
    EssentiaFeatureProvider provider;
    Waveform silence;
    silence.sample_rate = kRate;
    silence.samples.assign(10 * kRate, 0.0f);
    EXPECT_FALSE(provider.tempo_histogram_bpm(silence).has_value());
}

// ===========================================================================
// Decode
// ===========================================================================

TEST(EssentiaDecode, KeepsNativeRate) {
    const std::string path =
        (std::filesystem::temp_directory_path() / "stemscan_decode_48k.wav").string();
    Waveform source = tones({kC4}, 1.0, 48000);
    {
        auto writer = std::unique_ptr<essentia::standard::Algorithm>(
            essentia::standard::AlgorithmFactory::create("MonoWriter",
                "filename", path,
                "format", std::string("wav"),
                "sampleRate", essentia::Real(48000)));
        writer->input("audio").set(source.samples);
        writer->compute();
    }

    EssentiaFeatureProvider provider;
    Waveform wf = provider.decode(path, kRate);
    std::remove(path.c_str());

    EXPECT_EQ(wf.sample_rate, kRate);
    EXPECT_EQ(wf.native_sample_rate, 48000);
    EXPECT_NEAR(wf.duration(), 1.0, 0.02);
}

TEST(EssentiaDecode, MissingFileThrows) {
    EssentiaFeatureProvider provider;
    EXPECT_THROW(provider.decode("/nonexistent/stemscan.wav", kRate), std::exception);
}

} // namespace
} // namespace stemscan

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    essentia::init();
    int rc = RUN_ALL_TESTS();
    essentia::shutdown();
    return rc;
}
