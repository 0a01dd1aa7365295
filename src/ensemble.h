#pragma once

#include "strategies.h"

#include <algorithm>
#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace stemscan {

// One independent estimator. `run` may throw; a throwing strategy is
// treated as having produced nothing.
template <typename Result>
struct Strategy {
    StrategyType                type;
    std::string                 tag;
    std::function<Result()>     run;
};

template <typename Result>
Result invoke_strategy(const Strategy<Result>& s, bool verbose) {
    try {
        return s.run();
    } catch (const std::exception& e) {
        if (verbose) {
            std::ostringstream msg;
            msg << "    strategy " << s.tag << " failed: " << e.what() << "\n";
            std::cerr << msg.str();
        }
    }
    return Result{};
}

// Runs every strategy and returns their results in list order. Failed
// strategies leave a default-constructed Result in their slot, so the output
// is the same whether the strategies ran sequentially or on a thread pool.
template <typename Result>
std::vector<Result> run_strategies(const std::vector<Strategy<Result>>& strategies,
                                   bool parallel, bool verbose) {
    std::vector<Result> results(strategies.size());

    if (!parallel || strategies.size() < 2) {
        for (size_t i = 0; i < strategies.size(); ++i) {
            results[i] = invoke_strategy(strategies[i], verbose);
        }
        return results;
    }

    size_t threads = std::min<size_t>(strategies.size(),
                                      std::max(1u, std::thread::hardware_concurrency()));
    boost::asio::thread_pool pool(threads);
    for (size_t i = 0; i < strategies.size(); ++i) {
        boost::asio::post(pool, [&strategies, &results, i, verbose] {
            results[i] = invoke_strategy(strategies[i], verbose);
        });
    }
    pool.join();
    return results;
}

} // namespace stemscan
