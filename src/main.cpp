#include "config.h"
#include "analyzer.h"
#include "essentia_provider.h"
#include "report.h"

#include <essentia/algorithmfactory.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <mutex>

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int) {
    g_interrupted.store(true, std::memory_order_relaxed);
}

static void print_result(const std::string& path, const stemscan::AnalysisResult& r) {
    char buf[256];
    std::cout << path << std::endl;
    if (!r.success) {
        std::cout << "  FAILED: " << r.error << std::endl;
        return;
    }

    snprintf(buf, sizeof(buf), "  tempo     %-24s confidence=%.2f",
             stemscan::bpm_description(r.bpm).c_str(), r.bpm_confidence);
    std::cout << buf << std::endl;

    snprintf(buf, sizeof(buf), "  key       %-14s %-9s confidence=%.2f",
             stemscan::key_label(r.key).c_str(), stemscan::key_color(r.key).c_str(),
             r.key_confidence);
    std::cout << buf << std::endl;

    snprintf(buf, sizeof(buf), "  spectral  centroid=%.1fHz rolloff=%.1fHz bandwidth=%.1fHz",
             r.spectral_centroid, r.spectral_rolloff, r.spectral_bandwidth);
    std::cout << buf << std::endl;

    snprintf(buf, sizeof(buf), "  signal    duration=%.2fs sr=%d zcr=%.4f dynamic_range=%.4f",
             r.duration, r.sample_rate, r.zero_crossing_rate, r.dynamic_range);
    std::cout << buf << std::endl;
}

int main(int argc, char* argv[]) {
    stemscan::Config cfg;
    if (!stemscan::load_config(cfg, argc, argv)) {
        return 1;
    }

    std::cout << "STEMSCAN - Tempo and Key Analysis" << std::endl;
    std::cout << "Inputs: " << cfg.input_files.size() << " file(s), "
              << cfg.jobs << " job(s)" << std::endl;
    std::cout << "Strategies: " << cfg.enabled_strategies.size() << " enabled" << std::endl;

    std::signal(SIGINT,  signal_handler);
    std::signal(SIGTERM, signal_handler);

    essentia::init();

    // --- Analysis Phase ---
    std::cout << "\n--- Analysis Phase ---" << std::endl;
    stemscan::EssentiaFeatureProvider provider;
    const size_t n = cfg.input_files.size();
    std::vector<stemscan::FileResult> results(n);
    std::vector<char> done(n, 0);
    std::mutex log_mutex;

    {
        boost::asio::thread_pool pool(static_cast<size_t>(cfg.jobs));
        for (size_t i = 0; i < n; ++i) {
            boost::asio::post(pool, [&, i] {
                if (g_interrupted.load(std::memory_order_relaxed)) return;
                const std::string& path = cfg.input_files[i];
                {
                    std::lock_guard<std::mutex> lock(log_mutex);
                    std::cout << "  [" << (i + 1) << "/" << n << "] Analyzing "
                              << path << "..." << std::endl;
                }
                results[i] = {path, stemscan::analyze_file(path, provider, cfg)};
                done[i] = 1;
            });
        }
        pool.join();
    }

    if (g_interrupted.load()) {
        std::cout << "\nInterrupted during analysis." << std::endl;
        essentia::shutdown();
        return 130;
    }

    // --- Results ---
    std::cout << "\n--- Results ---" << std::endl;
    std::vector<stemscan::FileResult> finished;
    int failures = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!done[i]) continue;
        print_result(results[i].first, results[i].second);
        if (!results[i].second.success) ++failures;
        finished.push_back(results[i]);
    }

    if (!cfg.output_file.empty()) {
        auto report = stemscan::build_report(finished);
        if (!stemscan::write_report(report, cfg.output_file)) {
            std::cerr << "Error: cannot write report " << cfg.output_file << std::endl;
            essentia::shutdown();
            return 1;
        }
        std::cout << "\nReport written to " << cfg.output_file << std::endl;
    }

    essentia::shutdown();

    if (failures > 0) {
        std::cout << "\n" << failures << " file(s) failed." << std::endl;
        return 1;
    }
    std::cout << "\nDone." << std::endl;
    return 0;
}
