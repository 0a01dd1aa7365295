#include "report.h"

#include <boost/program_options.hpp>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace po = boost::program_options;

static std::string format_floats(const google::protobuf::RepeatedField<double>& vals, int max_show = 4) {
    std::ostringstream os;
    os << "[";
    int n = vals.size();
    for (int i = 0; i < n && i < max_show; ++i) {
        if (i > 0) os << ",";
        char buf[24];
        snprintf(buf, sizeof(buf), "%.3f", vals[i]);
        os << buf;
    }
    if (n > max_show) os << ",..." << n << " total";
    os << "]";
    return os.str();
}

static std::string format_file(const stemscan::pb::FileAnalysis& file, bool full) {
    const auto& msg = file.result();
    stemscan::AnalysisResult r = stemscan::from_proto(msg);

    std::string result = file.path() + "\n";
    char buf[256];

    if (!r.success) {
        snprintf(buf, sizeof(buf), "  failed            error=%s\n", r.error.c_str());
        return result + buf;
    }

    snprintf(buf, sizeof(buf), "  tempo             %s confidence=%.2f\n",
             stemscan::bpm_description(r.bpm).c_str(), r.bpm_confidence);
    result += buf;
    snprintf(buf, sizeof(buf), "  key               %s color=%s confidence=%.2f\n",
             stemscan::key_label(r.key).c_str(), stemscan::key_color(r.key).c_str(),
             r.key_confidence);
    result += buf;
    snprintf(buf, sizeof(buf), "  duration          %.2fs sr=%d\n", r.duration, r.sample_rate);
    result += buf;
    snprintf(buf, sizeof(buf), "  spectral.centroid value=%.1fHz\n", r.spectral_centroid);
    result += buf;
    snprintf(buf, sizeof(buf), "  spectral.rolloff  value=%.1fHz\n", r.spectral_rolloff);
    result += buf;
    snprintf(buf, sizeof(buf), "  spectral.bandwidth value=%.1fHz\n", r.spectral_bandwidth);
    result += buf;
    snprintf(buf, sizeof(buf), "  zcr               value=%.4f\n", r.zero_crossing_rate);
    result += buf;
    snprintf(buf, sizeof(buf), "  dynamic.range     value=%.4f\n", r.dynamic_range);
    result += buf;
    result += "  mfcc              values="
            + format_floats(msg.mfcc_mean(), full ? msg.mfcc_mean_size() : 4) + "\n";
    return result;
}

int main(int argc, char* argv[]) {
    std::string report_file;
    bool full = false;

    po::options_description desc("STEMSCAN Report Inspector");
    desc.add_options()
        ("help,h", "Show help")
        ("report", po::value<std::string>(&report_file), "Report file written by stemscan --output")
        ("full", po::bool_switch(&full), "Print every MFCC coefficient")
    ;

    po::positional_options_description pos;
    pos.add("report", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
            .options(desc).positional(pos).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << "\n";
        return 1;
    }
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }
    if (report_file.empty()) {
        std::cerr << "Error: no report file specified\n" << desc << "\n";
        return 1;
    }

    stemscan::pb::Report report;
    if (!stemscan::read_report(report, report_file)) {
        std::cerr << "failed to parse report " << report_file << std::endl;
        return 1;
    }

    std::cout << "STEMSCAN Report - " << report.files_size() << " file(s)\n" << std::endl;
    for (const auto& file : report.files()) {
        std::cout << format_file(file, full) << std::endl;
    }
    return 0;
}
