// =============================================================================
// sweep_runner_test.cpp
// =============================================================================
// Unit tests for stratlab::SweepRunner.
//
// Validates:
//   - Parallel results equal sequential BacktestEngine runs, in job order
//   - A rejected config is reported in its own slot only
//   - Null series and empty job lists
// =============================================================================

#include "stratlab/engine/backtest_engine.hpp"
#include "stratlab/engine/sweep_runner.hpp"
#include "stratlab/indicators/technical_indicators.hpp"
#include "stratlab/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

class SweepRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::vector<stratlab::domain::PriceBar> bars;
    const auto start = stratlab::make_timestamp(2023, 1, 2);
    for (int i = 0; i < 250; ++i) {
      stratlab::domain::PriceBar b;
      b.timestamp = start + std::chrono::hours(24 * i);
      b.close = 100.0 + 20.0 * std::sin(i / 9.0) + 0.05 * i;
      b.open = b.high = b.low = b.close;
      bars.push_back(b);
    }
    series = std::make_shared<const stratlab::domain::PriceSeries>(
        std::move(bars));
  }

  static stratlab::BacktestConfig maConfig(int short_window, int long_window) {
    stratlab::BacktestConfig config;
    config.name = "ma_" + std::to_string(short_window) + "_" +
                  std::to_string(long_window);
    config.strategy =
        stratlab::MovingAverageCrossParams{short_window, long_window};
    return config;
  }

  stratlab::TechnicalIndicators indicators;
  std::shared_ptr<const stratlab::domain::PriceSeries> series;
};

// -----------------------------------------------------------------------------
// 1. Every slot matches the sequential result for the same config.
// -----------------------------------------------------------------------------
TEST_F(SweepRunnerTest, MatchesSequentialRuns) {
  std::vector<stratlab::BacktestConfig> configs;
  for (int s = 2; s <= 10; s += 2) {
    for (int l = 15; l <= 45; l += 10) {
      configs.push_back(maConfig(s, l));
    }
  }
  stratlab::BacktestConfig rsi;
  rsi.name = "rsi";
  rsi.strategy = stratlab::RsiParams{};
  configs.push_back(rsi);

  const stratlab::SweepRunner runner(indicators, 4);
  const auto results = runner.run(configs, series);

  const stratlab::BacktestEngine engine(indicators);
  ASSERT_EQ(results.size(), configs.size());
  for (std::size_t i = 0; i < configs.size(); ++i) {
    ASSERT_TRUE(results[i].run.has_value()) << results[i].error;
    EXPECT_TRUE(results[i].error.empty());
    EXPECT_EQ(results[i].config.name, configs[i].name);

    const auto expected = engine.run(configs[i], *series);
    const auto& got = *results[i].run;
    ASSERT_EQ(got.history.size(), expected.history.size());
    EXPECT_EQ(got.history.back().total, expected.history.back().total);
    EXPECT_EQ(got.metrics.total_trades, expected.metrics.total_trades);
    EXPECT_EQ(got.trades.size(), expected.trades.size());
  }
}

// -----------------------------------------------------------------------------
// 2. An invalid config fails alone.
// -----------------------------------------------------------------------------
TEST_F(SweepRunnerTest, ReportsInvalidConfigInItsSlot) {
  const std::vector<stratlab::BacktestConfig> configs{
      maConfig(5, 20), maConfig(30, 10), maConfig(10, 40)};

  const auto results = stratlab::SweepRunner(indicators, 2).run(configs, series);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].run.has_value());
  EXPECT_FALSE(results[1].run.has_value());
  EXPECT_FALSE(results[1].error.empty());
  EXPECT_TRUE(results[2].run.has_value());
}

// -----------------------------------------------------------------------------
// 3. Degenerate calls.
// -----------------------------------------------------------------------------
TEST_F(SweepRunnerTest, EmptyJobsAndNullSeries) {
  const stratlab::SweepRunner runner(indicators);
  EXPECT_GE(runner.workers(), 1u);
  EXPECT_TRUE(runner.run({}, series).empty());
  EXPECT_THROW(runner.run({maConfig(5, 20)}, nullptr), std::invalid_argument);
}
