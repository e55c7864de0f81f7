// =============================================================================
// signal_generator_test.cpp
// =============================================================================
// Unit tests for stratlab::SignalGenerator and positionChanges().
//
// Validates:
//   - MA crossover on a steadily rising series: one buy, no sell
//   - RSI thresholds hold the last signal between levels, both with a
//     pre-computed RSI column and with RSI computed from closes
//   - MACD crossover fires only on the crossing bar
//   - MA-with-RSI-filter needs both conditions
//   - Parameter validation and strategy keys
// =============================================================================

#include "stratlab/indicators/technical_indicators.hpp"
#include "stratlab/strategy/signal_generator.hpp"
#include "stratlab/strategy/strategy_config.hpp"
#include "stratlab/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

using stratlab::domain::PriceBar;
using stratlab::domain::PriceSeries;
using stratlab::domain::Signal;
using stratlab::domain::SignalSeries;

namespace {

PriceSeries dailySeries(const std::vector<double>& closes) {
  std::vector<PriceBar> bars;
  const auto start = stratlab::make_timestamp(2024, 1, 1);
  for (std::size_t i = 0; i < closes.size(); ++i) {
    PriceBar b;
    b.timestamp = start + std::chrono::hours(24 * static_cast<int>(i));
    b.open = b.high = b.low = b.close = closes[i];
    bars.push_back(b);
  }
  return PriceSeries(std::move(bars));
}

long countIf(const std::vector<int>& changes, bool positive) {
  return std::count_if(changes.begin(), changes.end(), [positive](int c) {
    return positive ? c > 0 : c < 0;
  });
}

}  // namespace

class SignalGeneratorTest : public ::testing::Test {
 protected:
  stratlab::TechnicalIndicators indicators;
  const double nan = std::numeric_limits<double>::quiet_NaN();
};

// -----------------------------------------------------------------------------
// 1. MA(2, 3) on closes 10..19: short > long from bar 2 on, giving one buy
// change and no sell.
// -----------------------------------------------------------------------------
TEST_F(SignalGeneratorTest, MovingAverageCrossOnRisingSeries) {
  std::vector<double> closes;
  for (int i = 10; i < 20; ++i) {
    closes.push_back(i);
  }
  stratlab::SignalGenerator gen(stratlab::MovingAverageCrossParams{2, 3},
                                indicators);
  const SignalSeries signals = gen.generateSignals(dailySeries(closes));

  ASSERT_EQ(signals.size(), 10u);
  EXPECT_EQ(signals[0], Signal::Flat);
  EXPECT_EQ(signals[1], Signal::Flat);
  for (std::size_t i = 2; i < signals.size(); ++i) {
    EXPECT_EQ(signals[i], Signal::Buy) << "bar " << i;
  }

  const auto changes = stratlab::positionChanges(signals);
  EXPECT_EQ(countIf(changes, true), 1);
  EXPECT_EQ(countIf(changes, false), 0);
  EXPECT_EQ(changes[2], 1);
}

// -----------------------------------------------------------------------------
// 2. RSI column 20 → 80: exactly one buy then one sell transition. Readings
// between the thresholds keep the previous signal.
// -----------------------------------------------------------------------------
TEST_F(SignalGeneratorTest, RsiColumnOneBuyThenOneSell) {
  PriceSeries series = dailySeries({100, 99, 98, 99, 101, 103, 106, 105});
  series.setColumn("RSI", {nan, 50, 20, 25, 40, 60, 80, 75});

  stratlab::SignalGenerator gen(stratlab::RsiParams{14, 70.0, 30.0},
                                indicators);
  const SignalSeries signals = gen.generateSignals(series);

  const SignalSeries expected{Signal::Flat, Signal::Flat, Signal::Buy,
                              Signal::Buy,  Signal::Buy,  Signal::Buy,
                              Signal::Sell, Signal::Sell};
  EXPECT_EQ(signals, expected);

  const auto changes = stratlab::positionChanges(signals);
  EXPECT_EQ(countIf(changes, true), 1);
  EXPECT_EQ(countIf(changes, false), 1);
  EXPECT_EQ(changes[2], 1);
  EXPECT_EQ(changes[6], -2);
}

// -----------------------------------------------------------------------------
// 3. Same scenario with RSI computed from closes: a fall pins RSI at 0,
// a long rise lifts it past 70.
// -----------------------------------------------------------------------------
TEST_F(SignalGeneratorTest, ComputedRsiOneBuyThenOneSell) {
  std::vector<double> closes;
  for (int i = 0; i < 15; ++i) {
    closes.push_back(200.0 - i);
  }
  for (int i = 1; i <= 30; ++i) {
    closes.push_back(186.0 + i);
  }

  stratlab::SignalGenerator gen(stratlab::RsiParams{}, indicators);
  const auto changes =
      stratlab::positionChanges(gen.generateSignals(dailySeries(closes)));

  ASSERT_EQ(countIf(changes, true), 1);
  ASSERT_EQ(countIf(changes, false), 1);
  const auto buy = std::find_if(changes.begin(), changes.end(),
                                [](int c) { return c > 0; });
  const auto sell = std::find_if(changes.begin(), changes.end(),
                                 [](int c) { return c < 0; });
  EXPECT_LT(buy - changes.begin(), sell - changes.begin());
  EXPECT_EQ(buy - changes.begin(), 14);
}

// -----------------------------------------------------------------------------
// 4. MACD crossover is edge-triggered.
// -----------------------------------------------------------------------------
TEST_F(SignalGeneratorTest, MacdFiresOnlyOnCrossingBar) {
  PriceSeries series = dailySeries({10, 11, 12, 13, 14, 15});
  series.setColumn("MACD", {1.0, 0.0, -1.0, 0.0, 1.0, 2.0});
  series.setColumn("Signal", {0.0, 0.0, 0.0, 0.0, 0.0, 0.0});

  stratlab::SignalGenerator gen(stratlab::MacdParams{}, indicators);
  const SignalSeries expected{Signal::Flat, Signal::Flat, Signal::Sell,
                              Signal::Flat, Signal::Buy,  Signal::Flat};
  EXPECT_EQ(gen.generateSignals(series), expected);
}

// -----------------------------------------------------------------------------
// 5. MA filter: uptrend alone is not enough, RSI must also be below rsi_buy.
// -----------------------------------------------------------------------------
TEST_F(SignalGeneratorTest, MaRsiFilterNeedsBothConditions) {
  PriceSeries rising = dailySeries({10, 11, 12, 13, 14});
  rising.setColumn("RSI", {nan, 50, 20, 50, 25});

  stratlab::MaRsiFilterParams params;
  params.short_window = 2;
  params.long_window = 3;
  stratlab::SignalGenerator gen(params, indicators);

  const SignalSeries up{Signal::Flat, Signal::Flat, Signal::Buy, Signal::Flat,
                        Signal::Buy};
  EXPECT_EQ(gen.generateSignals(rising), up);

  PriceSeries falling = dailySeries({14, 13, 12, 11, 10});
  falling.setColumn("RSI", {nan, 50, 80, 60, 90});
  const SignalSeries down{Signal::Flat, Signal::Flat, Signal::Sell,
                          Signal::Flat, Signal::Sell};
  EXPECT_EQ(gen.generateSignals(falling), down);
}

// -----------------------------------------------------------------------------
// 6. Too few bars for the lookback: every signal is Flat, nothing throws.
// -----------------------------------------------------------------------------
TEST_F(SignalGeneratorTest, ShortSeriesStaysFlat) {
  stratlab::SignalGenerator gen(stratlab::MovingAverageCrossParams{}, indicators);
  const SignalSeries signals = gen.generateSignals(dailySeries({1, 2, 3}));
  EXPECT_EQ(signals, SignalSeries(3, Signal::Flat));
  EXPECT_TRUE(gen.generateSignals(PriceSeries{}).empty());
}

// -----------------------------------------------------------------------------
// 7. Invalid parameters and unknown keys fail fast.
// -----------------------------------------------------------------------------
TEST_F(SignalGeneratorTest, RejectsInvalidParameters) {
  EXPECT_THROW(stratlab::SignalGenerator(
                   stratlab::MovingAverageCrossParams{50, 20}, indicators),
               std::invalid_argument);
  EXPECT_THROW(stratlab::SignalGenerator(
                   stratlab::MovingAverageCrossParams{0, 20}, indicators),
               std::invalid_argument);
  EXPECT_THROW(stratlab::SignalGenerator(stratlab::RsiParams{14, 30.0, 70.0},
                                         indicators),
               std::invalid_argument);

  stratlab::MaRsiFilterParams filter;
  filter.rsi_buy = 80.0;
  EXPECT_THROW(stratlab::SignalGenerator(filter, indicators),
               std::invalid_argument);

  EXPECT_THROW(stratlab::makeDefaultStrategy("bollinger"),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 8. Keys, names and parameter maps.
// -----------------------------------------------------------------------------
TEST(StrategyConfigTest, KeysAndParameters) {
  EXPECT_EQ(stratlab::strategyKey(stratlab::makeDefaultStrategy("ma_cross")),
            "ma_cross");
  EXPECT_EQ(stratlab::strategyKey(stratlab::makeDefaultStrategy("ma_rsi")),
            "ma_rsi");
  EXPECT_EQ(stratlab::strategyName(stratlab::RsiParams{}), "RSI Strategy");

  const auto params = stratlab::strategyParameters(stratlab::RsiParams{});
  EXPECT_DOUBLE_EQ(params.at("rsi_period"), 14.0);
  EXPECT_DOUBLE_EQ(params.at("overbought"), 70.0);
  EXPECT_DOUBLE_EQ(params.at("oversold"), 30.0);
}

// -----------------------------------------------------------------------------
// 9. positionChanges is the first difference with bar 0 pinned to 0.
// -----------------------------------------------------------------------------
TEST(PositionChangesTest, FirstDifference) {
  const SignalSeries signals{Signal::Buy, Signal::Buy, Signal::Sell,
                             Signal::Flat, Signal::Buy};
  EXPECT_EQ(stratlab::positionChanges(signals),
            (std::vector<int>{0, 0, -2, 1, 1}));
  EXPECT_TRUE(stratlab::positionChanges({}).empty());
}
