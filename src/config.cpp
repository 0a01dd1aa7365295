#include "config.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>
#include <yaml-cpp/yaml.h>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace stemscan {

// Weights scale confidences, so anything outside [0, 1] is rejected
static void read_weight(const YAML::Node& node, const char* key, double& dst) {
    if (!node[key]) return;
    double v = node[key].as<double>();
    if (!(v >= 0.0 && v <= 1.0)) {
        throw YAML::Exception(node[key].Mark(),
                              std::string("weight '") + key + "' must be in [0, 1]");
    }
    dst = v;
}

static void read_weights(StrategyWeights& w, const YAML::Node& node) {
    read_weight(node, "beat_track",             w.beat_track);
    read_weight(node, "onset_interval",         w.onset_interval);
    read_weight(node, "histogram",              w.histogram);
    read_weight(node, "autocorrelation",        w.autocorrelation);
    read_weight(node, "prior",                  w.prior);
    read_weight(node, "chroma_stft",            w.chroma_stft);
    read_weight(node, "chroma_cqt",             w.chroma_cqt);
    read_weight(node, "chroma_cens",            w.chroma_cens);
    read_weight(node, "extractor",              w.extractor);
    read_weight(node, "extractor_min_strength", w.extractor_min_strength);
    read_weight(node, "harmonic",               w.harmonic);
}

bool load_yaml_config(Config& cfg, const std::string& path) {
    std::ifstream fin(path);
    if (!fin.is_open()) return false;

    YAML::Node root = YAML::Load(fin);

    if (auto an = root["analysis"]) {
        if (an["sample_rate"])      cfg.sample_rate      = an["sample_rate"].as<int>();
        if (an["frame_size"])       cfg.frame_size       = an["frame_size"].as<int>();
        if (an["hop_size"])         cfg.hop_size         = an["hop_size"].as<int>();
        if (an["onset_hop"])        cfg.onset_hop        = an["onset_hop"].as<int>();
        if (an["beat_hops"])        cfg.beat_hops        = an["beat_hops"].as<std::vector<int>>();
        if (an["min_bpm"])          cfg.min_bpm          = an["min_bpm"].as<double>();
        if (an["max_bpm"])          cfg.max_bpm          = an["max_bpm"].as<double>();
        if (an["prior_max_bpm"])    cfg.prior_max_bpm    = an["prior_max_bpm"].as<double>();
        if (an["prior_center_bpm"]) cfg.prior_center_bpm = an["prior_center_bpm"].as<double>();
    }
    if (auto w = root["weights"]) {
        read_weights(cfg.weights, w);
    }
    if (auto st = root["strategies"]) {
        StrategyFilter filter;
        for (const auto& item : st) {
            auto parsed = parse_strategy_filter(item.as<std::string>());
            filter.insert(parsed.begin(), parsed.end());
        }
        cfg.enabled_strategies = filter;
    }
    if (auto rt = root["runtime"]) {
        if (rt["jobs"])                cfg.jobs                = rt["jobs"].as<int>();
        if (rt["parallel_strategies"]) cfg.parallel_strategies = rt["parallel_strategies"].as<bool>();
        if (rt["verbose"])             cfg.verbose             = rt["verbose"].as<bool>();
    }
    return true;
}

static void print_available_strategies() {
    std::cout << "\nAvailable strategies:\n";
    std::vector<std::string> sorted_names;
    for (const auto& [name, type] : strategy_name_map()) {
        sorted_names.push_back(name);
    }
    std::sort(sorted_names.begin(), sorted_names.end());
    for (const auto& name : sorted_names) {
        std::cout << "  " << name << "\n";
    }
    std::cout << "  (groups: tempo, key)\n";
}

bool load_config(Config& cfg, int argc, char* argv[]) {
    po::options_description desc("STEMSCAN - tempo and key analysis");
    desc.add_options()
        ("help,h",       "Show help")
        ("input,i",      po::value<std::vector<std::string>>(), "Input audio file(s) (required)")
        ("config,c",     po::value<std::string>(), "Config YAML file")
        ("output,o",     po::value<std::string>(), "Write a protobuf report to this file")
        ("jobs,j",       po::value<int>(),         "Number of files analyzed concurrently")
        ("sample-rate",  po::value<int>(),         "Analysis sample rate")
        ("frame-size",   po::value<int>(),         "Analysis frame size")
        ("hop-size",     po::value<int>(),         "Analysis hop size")
        ("strategies,s", po::value<std::string>(), "Comma-separated strategies (e.g. tempo.histogram,key)")
        ("all",          "Enable all strategies")
        ("parallel-strategies", "Run the strategies of one file concurrently")
        ("verbose,v",    "Report failing strategies")
        ("list-strategies", "List all available strategies and exit")
    ;

    po::positional_options_description pos;
    pos.add("input", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
            .options(desc).positional(pos).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << "\n";
        return false;
    }

    if (vm.count("help")) {
        std::cout << desc << "\n";
        return false;
    }

    if (vm.count("list-strategies")) {
        print_available_strategies();
        return false;
    }

    // Load YAML config (default or specified)
    try {
        if (vm.count("config")) {
            const auto& path = vm["config"].as<std::string>();
            if (!load_yaml_config(cfg, path)) {
                std::cerr << "Error: cannot open config file " << path << "\n";
                return false;
            }
        } else {
            // Try default locations
            if (!load_yaml_config(cfg, "config/stemscan-default.yaml")) {
                load_yaml_config(cfg, "stemscan-default.yaml");
            }
        }
    } catch (const YAML::Exception& e) {
        std::cerr << "Error: invalid config: " << e.what() << "\n";
        return false;
    }

    // CLI overrides
    if (vm.count("input"))       cfg.input_files = vm["input"].as<std::vector<std::string>>();
    if (vm.count("output"))      cfg.output_file = vm["output"].as<std::string>();
    if (vm.count("jobs"))        cfg.jobs        = vm["jobs"].as<int>();
    if (vm.count("sample-rate")) cfg.sample_rate = vm["sample-rate"].as<int>();
    if (vm.count("frame-size"))  cfg.frame_size  = vm["frame-size"].as<int>();
    if (vm.count("hop-size"))    cfg.hop_size    = vm["hop-size"].as<int>();
    if (vm.count("parallel-strategies")) cfg.parallel_strategies = true;
    if (vm.count("verbose"))     cfg.verbose     = true;

    // Strategy filter: --all > --strategies > config file
    if (vm.count("all")) {
        cfg.enabled_strategies = all_strategies();
    } else if (vm.count("strategies")) {
        cfg.enabled_strategies = parse_strategy_filter(vm["strategies"].as<std::string>());
        if (cfg.enabled_strategies.empty()) {
            std::cerr << "Error: no valid strategies specified\n";
            return false;
        }
    }

    if (cfg.jobs < 1) cfg.jobs = 1;

    if (cfg.input_files.empty()) {
        std::cerr << "Error: no input file specified\n" << desc << "\n";
        return false;
    }

    return true;
}

} // namespace stemscan
