#include "report.h"

#include <fstream>

namespace stemscan {

void to_proto(const AnalysisResult& r, pb::AnalysisResult* out) {
    out->set_success(r.success);
    out->set_error(r.error);

    out->set_has_bpm(r.bpm.has_value());
    out->set_bpm(r.bpm.value_or(0.0));
    out->set_bpm_confidence(r.bpm_confidence);

    if (r.key) {
        auto* key = out->mutable_key();
        key->set_pitch_class(static_cast<uint32_t>(r.key->pitch_class));
        key->set_minor(r.key->mode == Mode::MINOR);
    }
    out->set_key_confidence(r.key_confidence);

    out->set_duration(r.duration);
    out->set_spectral_centroid(r.spectral_centroid);
    out->set_spectral_rolloff(r.spectral_rolloff);
    out->set_spectral_bandwidth(r.spectral_bandwidth);
    out->set_zero_crossing_rate(r.zero_crossing_rate);
    out->set_dynamic_range(r.dynamic_range);
    for (double v : r.mfcc_mean) out->add_mfcc_mean(v);
    out->set_sample_rate(r.sample_rate);
}

AnalysisResult from_proto(const pb::AnalysisResult& msg) {
    AnalysisResult r;
    r.success = msg.success();
    r.error   = msg.error();

    if (msg.has_bpm()) r.bpm = msg.bpm();
    r.bpm_confidence = msg.bpm_confidence();

    if (msg.has_key()) {
        r.key = KeySignature{wrap_pitch_class(static_cast<int>(msg.key().pitch_class())),
                             msg.key().minor() ? Mode::MINOR : Mode::MAJOR};
    }
    r.key_confidence = msg.key_confidence();

    r.duration           = msg.duration();
    r.spectral_centroid  = msg.spectral_centroid();
    r.spectral_rolloff   = msg.spectral_rolloff();
    r.spectral_bandwidth = msg.spectral_bandwidth();
    r.zero_crossing_rate = msg.zero_crossing_rate();
    r.dynamic_range      = msg.dynamic_range();
    for (int i = 0; i < msg.mfcc_mean_size() && i < kMfccCoefficients; ++i) {
        r.mfcc_mean[i] = msg.mfcc_mean(i);
    }
    r.sample_rate = msg.sample_rate();
    return r;
}

pb::Report build_report(const std::vector<FileResult>& results) {
    pb::Report report;
    for (const auto& [path, result] : results) {
        auto* file = report.add_files();
        file->set_path(path);
        to_proto(result, file->mutable_result());
    }
    return report;
}

bool write_report(const pb::Report& report, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;
    return report.SerializeToOstream(&out) && out.good();
}

bool read_report(pb::Report& report, const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    return report.ParseFromIstream(&in);
}

} // namespace stemscan
