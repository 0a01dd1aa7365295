#include "essentia_provider.h"
#include "dsp.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <functional>
#include <memory>
#include <stdexcept>

#include <essentia/algorithmfactory.h>

using namespace essentia;
using namespace essentia::standard;

namespace stemscan {

using AlgorithmPtr = std::unique_ptr<standard::Algorithm>;

// OnsetRate and RhythmExtractor2013 only run at this rate
static const int  kFixedRate        = 44100;
static const int  kTonalFrameSize   = 4096;
static const int  kTonalHopSize     = 2048;
static const int  kCqtHopSize       = 4096;
static const int  kOnsetFrameSize   = 2048;
static const int  kHpssFrameSize    = 2048;
static const int  kHpssHopSize      = 1024;
static const Real kChromaMinFreq    = 32.7032f;   // C1
static const Real kReferenceC       = 261.6256f;  // C4, puts C at HPCP bin 0

// --- Helpers ---

template <typename... Args>
static AlgorithmPtr make_algorithm(const std::string& name, Args&&... params) {
    auto& factory = standard::AlgorithmFactory::instance();
    return AlgorithmPtr(factory.create(name, std::forward<Args>(params)...));
}

static void for_each_frame(const std::vector<Real>& signal, int frame_size, int hop_size,
                           const std::function<void(const std::vector<Real>&)>& fn) {
    auto cutter = make_algorithm("FrameCutter",
        "frameSize", frame_size,
        "hopSize", hop_size,
        "startFromZero", true,
        "silentFrames", std::string("keep"));

    std::vector<Real> frame;
    cutter->input("signal").set(signal);
    cutter->output("frame").set(frame);
    for (;;) {
        cutter->compute();
        if (frame.empty()) break;
        fn(frame);
    }
}

static std::vector<Real> resampled(const Waveform& wf, int rate) {
    if (wf.sample_rate == rate) return wf.samples;

    auto resample = make_algorithm("Resample",
        "inputSampleRate", Real(wf.sample_rate),
        "outputSampleRate", Real(rate));
    std::vector<Real> out;
    resample->input("signal").set(wf.samples);
    resample->output("signal").set(out);
    resample->compute();
    return out;
}

static bool has_energy(const std::vector<Real>& v) {
    return std::any_of(v.begin(), v.end(), [](Real x) { return x != 0.0f; });
}

static ChromaVector to_chroma(const std::vector<Real>& v) {
    ChromaVector c{};
    for (int i = 0; i < kPitchClasses && i < static_cast<int>(v.size()); ++i) {
        c[i] = std::isfinite(v[i]) ? std::max(0.0, static_cast<double>(v[i])) : 0.0;
    }
    return c;
}

// Longest constant-Q kernel (lowest bin), rounded up to a power of two
static int cqt_frame_size(int sample_rate) {
    double q = 1.0 / (std::pow(2.0, 1.0 / 12.0) - 1.0);
    double len = q * sample_rate / kChromaMinFreq;
    int size = 1;
    while (size < len) size <<= 1;
    return size;
}

// --- Chroma ---

static std::vector<ChromaVector> hpcp_chroma(const Waveform& wf) {
    auto window   = make_algorithm("Windowing", "type", std::string("blackmanharris62"));
    auto spectrum = make_algorithm("Spectrum");
    auto peaks    = make_algorithm("SpectralPeaks",
        "orderBy", std::string("magnitude"),
        "magnitudeThreshold", Real(1e-5),
        "minFrequency", Real(20.0),
        "maxFrequency", Real(3500.0),
        "maxPeaks", 60,
        "sampleRate", Real(wf.sample_rate));
    auto hpcp     = make_algorithm("HPCP",
        "size", 12,
        "referenceFrequency", kReferenceC,
        "harmonics", 8,
        "minFrequency", Real(20.0),
        "maxFrequency", Real(3500.0),
        "normalized", std::string("unitMax"),
        "sampleRate", Real(wf.sample_rate));

    std::vector<Real> windowed, spec, freqs, mags, pcp;
    window->output("frame").set(windowed);
    spectrum->input("frame").set(windowed);
    spectrum->output("spectrum").set(spec);
    peaks->input("spectrum").set(spec);
    peaks->output("frequencies").set(freqs);
    peaks->output("magnitudes").set(mags);
    hpcp->input("frequencies").set(freqs);
    hpcp->input("magnitudes").set(mags);
    hpcp->output("hpcp").set(pcp);

    std::vector<ChromaVector> out;
    for_each_frame(wf.samples, kTonalFrameSize, kTonalHopSize, [&](const std::vector<Real>& frame) {
        window->input("frame").set(frame);
        window->compute();
        spectrum->compute();
        peaks->compute();
        if (freqs.empty()) {
            out.push_back(ChromaVector{});
            return;
        }
        hpcp->compute();
        out.push_back(to_chroma(pcp));
    });
    return out;
}

static std::vector<ChromaVector> cqt_chroma(const Waveform& wf) {
    auto chromagram = make_algorithm("Chromagram",
        "sampleRate", Real(wf.sample_rate),
        "minFrequency", kChromaMinFreq,
        "binsPerOctave", 12,
        "numberBins", 84,
        "normalizeType", std::string("unit_max"));

    std::vector<Real> chroma;
    chromagram->output("chromagram").set(chroma);

    std::vector<ChromaVector> out;
    for_each_frame(wf.samples, cqt_frame_size(wf.sample_rate), kCqtHopSize,
                   [&](const std::vector<Real>& frame) {
        if (!has_energy(frame)) {
            out.push_back(ChromaVector{});
            return;
        }
        chromagram->input("frame").set(frame);
        chromagram->compute();
        out.push_back(to_chroma(chroma));
    });
    return out;
}

// --- FeatureProvider ---

Waveform EssentiaFeatureProvider::decode(const std::string& path, int sample_rate) const {
    auto loader = make_algorithm("AudioLoader", "filename", path);

    std::vector<StereoSample> stereo;
    Real native_rate = 0.0f;
    int channels = 0, bit_rate = 0;
    std::string md5, codec;
    loader->output("audio").set(stereo);
    loader->output("sampleRate").set(native_rate);
    loader->output("numberChannels").set(channels);
    loader->output("md5").set(md5);
    loader->output("bit_rate").set(bit_rate);
    loader->output("codec").set(codec);
    loader->compute();

    auto mixer = make_algorithm("MonoMixer", "type", std::string("mix"));
    Waveform native;
    native.sample_rate = static_cast<int>(std::lround(native_rate));
    mixer->input("audio").set(stereo);
    mixer->input("numberChannels").set(channels);
    mixer->output("audio").set(native.samples);
    mixer->compute();

    // Analysis runs at the configured rate; the source rate is reported
    Waveform wf;
    wf.samples            = resampled(native, sample_rate);
    wf.sample_rate        = sample_rate;
    wf.native_sample_rate = native.sample_rate;
    return wf;
}

std::vector<ChromaVector> EssentiaFeatureProvider::chroma(const Waveform& wf,
                                                          ChromaVariant variant) const {
    switch (variant) {
        case ChromaVariant::STFT: return hpcp_chroma(wf);
        case ChromaVariant::CQT:  return cqt_chroma(wf);
        case ChromaVariant::CENS: return chroma_cens(cqt_chroma(wf));
    }
    throw std::invalid_argument("unknown chroma variant");
}

std::vector<double> EssentiaFeatureProvider::onset_times(const Waveform& wf) const {
    std::vector<Real> signal = resampled(wf, kFixedRate);

    auto onset_rate = make_algorithm("OnsetRate");
    std::vector<Real> onsets;
    Real rate = 0.0f;
    onset_rate->input("signal").set(signal);
    onset_rate->output("onsets").set(onsets);
    onset_rate->output("onsetRate").set(rate);
    onset_rate->compute();

    return std::vector<double>(onsets.begin(), onsets.end());
}

double EssentiaFeatureProvider::beat_track_bpm(const Waveform& wf, int hop_size) const {
    auto rhythm = make_algorithm("RhythmExtractor",
        "sampleRate", Real(wf.sample_rate),
        "frameSize", 2 * hop_size,
        "hopSize", hop_size);

    Real bpm = 0.0f;
    std::vector<Real> ticks, estimates, intervals;
    rhythm->input("signal").set(wf.samples);
    rhythm->output("bpm").set(bpm);
    rhythm->output("ticks").set(ticks);
    rhythm->output("estimates").set(estimates);
    rhythm->output("bpmIntervals").set(intervals);
    rhythm->compute();

    return static_cast<double>(bpm);
}

std::vector<double> EssentiaFeatureProvider::onset_strength(const Waveform& wf, int hop_size) const {
    auto window   = make_algorithm("Windowing", "type", std::string("hann"));
    auto spectrum = make_algorithm("Spectrum");
    auto onset    = make_algorithm("OnsetDetection",
        "method", std::string("melflux"),
        "sampleRate", Real(wf.sample_rate));

    std::vector<Real> windowed, spec, phase;
    Real value = 0.0f;
    window->output("frame").set(windowed);
    spectrum->input("frame").set(windowed);
    spectrum->output("spectrum").set(spec);
    onset->input("spectrum").set(spec);
    onset->input("phase").set(phase);
    onset->output("onsetDetection").set(value);

    std::vector<double> curve;
    for_each_frame(wf.samples, std::max(kOnsetFrameSize, 2 * hop_size), hop_size,
                   [&](const std::vector<Real>& frame) {
        window->input("frame").set(frame);
        window->compute();
        spectrum->compute();
        phase.assign(spec.size(), 0.0f);
        onset->compute();
        curve.push_back(std::isfinite(value) ? static_cast<double>(value) : 0.0);
    });
    return curve;
}

HarmonicPercussive EssentiaFeatureProvider::harmonic_percussive(const Waveform& wf) const {
    const size_t n    = kHpssFrameSize;
    const size_t hop  = kHpssHopSize;
    const size_t bins = n / 2 + 1;

    auto window = make_algorithm("Windowing",
        "type", std::string("hann"),
        "zeroPhase", false);
    auto fft  = make_algorithm("FFT", "size", static_cast<int>(n));
    auto ifft = make_algorithm("IFFT", "size", static_cast<int>(n));

    // Forward STFT
    std::vector<Real> windowed;
    std::vector<std::complex<Real>> spectrum;
    window->output("frame").set(windowed);
    fft->input("frame").set(windowed);
    fft->output("fft").set(spectrum);

    std::vector<std::vector<std::complex<Real>>> stft;
    std::vector<float> mag;
    for_each_frame(wf.samples, static_cast<int>(n), static_cast<int>(hop),
                   [&](const std::vector<Real>& frame) {
        window->input("frame").set(frame);
        window->compute();
        fft->compute();
        stft.push_back(spectrum);
        for (const auto& c : spectrum) mag.push_back(std::abs(c));
    });

    const size_t frames = stft.size();
    HpssMasks masks = hpss_masks(mag, frames, bins);

    // Masked inverse STFT with weighted overlap-add
    std::vector<Real> synth(n);
    for (size_t i = 0; i < n; ++i) {
        synth[i] = static_cast<Real>(0.5 - 0.5 * std::cos(2.0 * M_PI * i / n));
    }

    const size_t length = frames == 0 ? 0 : std::max(wf.samples.size(), (frames - 1) * hop + n);
    std::vector<double> harm(length, 0.0), perc(length, 0.0), norm(length, 0.0);

    std::vector<std::complex<Real>> masked(bins);
    std::vector<Real> frame_out;
    ifft->input("fft").set(masked);
    ifft->output("frame").set(frame_out);

    auto overlap_add = [&](const std::vector<float>& mask, size_t t, std::vector<double>& dst) {
        for (size_t b = 0; b < bins; ++b) masked[b] = stft[t][b] * mask[t * bins + b];
        ifft->compute();
        size_t offset = t * hop;
        for (size_t i = 0; i < n && i < frame_out.size(); ++i) {
            dst[offset + i] += static_cast<double>(frame_out[i]) * synth[i];
        }
    };

    for (size_t t = 0; t < frames; ++t) {
        overlap_add(masks.harmonic, t, harm);
        overlap_add(masks.percussive, t, perc);
        for (size_t i = 0; i < n; ++i) norm[t * hop + i] += static_cast<double>(synth[i]) * synth[i];
    }

    HarmonicPercussive hp;
    hp.harmonic.sample_rate = wf.sample_rate;
    hp.percussive.sample_rate = wf.sample_rate;
    hp.harmonic.samples.resize(wf.samples.size(), 0.0f);
    hp.percussive.samples.resize(wf.samples.size(), 0.0f);
    for (size_t i = 0; i < wf.samples.size() && i < length; ++i) {
        if (norm[i] > 1e-8) {
            hp.harmonic.samples[i]   = static_cast<float>(harm[i] / norm[i]);
            hp.percussive.samples[i] = static_cast<float>(perc[i] / norm[i]);
        }
    }
    return hp;
}

std::optional<double> EssentiaFeatureProvider::tempo_histogram_bpm(const Waveform& wf) const {
    std::vector<Real> signal = resampled(wf, kFixedRate);

    auto rhythm = make_algorithm("RhythmExtractor2013", "method", std::string("multifeature"));
    Real bpm = 0.0f, confidence = 0.0f;
    std::vector<Real> ticks, estimates, intervals;
    rhythm->input("signal").set(signal);
    rhythm->output("bpm").set(bpm);
    rhythm->output("ticks").set(ticks);
    rhythm->output("confidence").set(confidence);
    rhythm->output("estimates").set(estimates);
    rhythm->output("bpmIntervals").set(intervals);
    rhythm->compute();

    if (intervals.empty()) return std::nullopt;

    auto descriptors = make_algorithm("BpmHistogramDescriptors");
    Real first_bpm = 0.0f, first_weight = 0.0f, first_spread = 0.0f;
    Real second_bpm = 0.0f, second_weight = 0.0f, second_spread = 0.0f;
    std::vector<Real> histogram;
    descriptors->input("bpmIntervals").set(intervals);
    descriptors->output("firstPeakBPM").set(first_bpm);
    descriptors->output("firstPeakWeight").set(first_weight);
    descriptors->output("firstPeakSpread").set(first_spread);
    descriptors->output("secondPeakBPM").set(second_bpm);
    descriptors->output("secondPeakWeight").set(second_weight);
    descriptors->output("secondPeakSpread").set(second_spread);
    descriptors->output("histogram").set(histogram);
    descriptors->compute();

    return static_cast<double>(first_bpm);
}

std::optional<ExternalKey> EssentiaFeatureProvider::extract_key(const Waveform& wf) const {
    auto extractor = make_algorithm("KeyExtractor", "sampleRate", Real(wf.sample_rate));

    std::string key, scale;
    Real strength = 0.0f;
    extractor->input("audio").set(wf.samples);
    extractor->output("key").set(key);
    extractor->output("scale").set(scale);
    extractor->output("strength").set(strength);
    extractor->compute();

    int pc = parse_pitch_class(key);
    auto mode = parse_mode(scale);
    if (pc < 0 || !mode) {
        throw std::runtime_error("unrecognized key '" + key + " " + scale + "'");
    }
    return ExternalKey{pc, *mode, static_cast<double>(strength)};
}

FrameFeatures EssentiaFeatureProvider::frame_features(const Waveform& wf, int frame_size,
                                                      int hop_size) const {
    const Real nyquist = Real(wf.sample_rate) / 2.0f;

    auto window   = make_algorithm("Windowing", "type", std::string("hann"));
    auto spectrum = make_algorithm("Spectrum");
    auto centroid = make_algorithm("Centroid", "range", nyquist);
    auto rolloff  = make_algorithm("RollOff", "sampleRate", Real(wf.sample_rate));
    auto moments  = make_algorithm("CentralMoments", "range", nyquist);
    auto shape    = make_algorithm("DistributionShape");
    auto zcr      = make_algorithm("ZeroCrossingRate");
    auto rms      = make_algorithm("RMS");
    auto mfcc     = make_algorithm("MFCC",
        "inputSize", frame_size / 2 + 1,
        "sampleRate", Real(wf.sample_rate),
        "numberCoefficients", kMfccCoefficients);

    std::vector<Real> windowed, spec, cm, bands, coeffs;
    Real centroid_v = 0.0f, rolloff_v = 0.0f, spread = 0.0f, skewness = 0.0f, kurtosis = 0.0f;
    Real zcr_v = 0.0f, rms_v = 0.0f;

    window->output("frame").set(windowed);
    spectrum->input("frame").set(windowed);
    spectrum->output("spectrum").set(spec);
    centroid->input("array").set(spec);
    centroid->output("centroid").set(centroid_v);
    rolloff->input("spectrum").set(spec);
    rolloff->output("rollOff").set(rolloff_v);
    moments->input("array").set(spec);
    moments->output("centralMoments").set(cm);
    shape->input("centralMoments").set(cm);
    shape->output("spread").set(spread);
    shape->output("skewness").set(skewness);
    shape->output("kurtosis").set(kurtosis);
    zcr->output("zeroCrossingRate").set(zcr_v);
    rms->output("rms").set(rms_v);
    mfcc->input("spectrum").set(spec);
    mfcc->output("bands").set(bands);
    mfcc->output("mfcc").set(coeffs);

    FrameFeatures ff;
    for_each_frame(wf.samples, frame_size, hop_size, [&](const std::vector<Real>& frame) {
        zcr->input("signal").set(frame);
        zcr->compute();
        rms->input("array").set(frame);
        rms->compute();
        ff.zero_crossing_rate.push_back(zcr_v);
        ff.rms.push_back(rms_v);

        window->input("frame").set(frame);
        window->compute();
        spectrum->compute();

        // Distribution descriptors are undefined on a silent spectrum
        if (has_energy(spec)) {
            centroid->compute();
            rolloff->compute();
            moments->compute();
            shape->compute();
            ff.centroid.push_back(centroid_v);
            ff.rolloff.push_back(rolloff_v);
            ff.bandwidth.push_back(std::sqrt(std::max(0.0, static_cast<double>(spread))));
        } else {
            ff.centroid.push_back(0.0);
            ff.rolloff.push_back(0.0);
            ff.bandwidth.push_back(0.0);
        }

        mfcc->compute();
        std::array<double, kMfccCoefficients> c{};
        for (int i = 0; i < kMfccCoefficients && i < static_cast<int>(coeffs.size()); ++i) {
            c[i] = std::isfinite(coeffs[i]) ? static_cast<double>(coeffs[i]) : 0.0;
        }
        ff.mfcc.push_back(c);
    });
    return ff;
}

} // namespace stemscan
