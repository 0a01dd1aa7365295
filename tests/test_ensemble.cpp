#include "ensemble.h"

#include <atomic>
#include <optional>
#include <stdexcept>

#include <gtest/gtest.h>

namespace stemscan {
namespace {

std::vector<Strategy<std::optional<int>>> numbered(size_t n, size_t failing) {
    std::vector<Strategy<std::optional<int>>> list;
    for (size_t i = 0; i < n; ++i) {
        list.push_back({StrategyType::TEMPO_PRIOR, "s" + std::to_string(i),
                        [i, failing]() -> std::optional<int> {
            if (i == failing) throw std::runtime_error("boom");
            return static_cast<int>(i * 10);
        }});
    }
    return list;
}

TEST(RunStrategies, ResultsKeepListOrder) {
    auto results = run_strategies(numbered(5, 99), false, false);
    ASSERT_EQ(results.size(), 5u);
    for (size_t i = 0; i < results.size(); ++i) {
        ASSERT_TRUE(results[i].has_value());
        EXPECT_EQ(*results[i], static_cast<int>(i * 10));
    }
}

TEST(RunStrategies, FailureLeavesEmptySlot) {
    auto results = run_strategies(numbered(4, 2), false, true);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_FALSE(results[2].has_value());
    EXPECT_EQ(results[3], 30);
}

TEST(RunStrategies, ParallelMatchesSequential) {
    auto list = numbered(16, 7);
    EXPECT_EQ(run_strategies(list, true, false), run_strategies(list, false, false));
}

TEST(RunStrategies, ParallelRunsEveryStrategyOnce) {
    std::atomic<int> calls{0};
    std::vector<Strategy<int>> list;
    for (int i = 0; i < 32; ++i) {
        list.push_back({StrategyType::KEY_CHROMA, "k", [&calls, i] {
            ++calls;
            return i;
        }});
    }
    auto results = run_strategies(list, true, false);
    EXPECT_EQ(calls.load(), 32);
    for (int i = 0; i < 32; ++i) EXPECT_EQ(results[static_cast<size_t>(i)], i);
}

TEST(RunStrategies, EmptyList) {
    EXPECT_TRUE(run_strategies(std::vector<Strategy<int>>{}, true, false).empty());
}

} // namespace
} // namespace stemscan
