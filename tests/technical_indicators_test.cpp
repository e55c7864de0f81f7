// =============================================================================
// technical_indicators_test.cpp
// =============================================================================
// Unit tests for stratlab::TechnicalIndicators and rsiRecommendation().
//
// Validates:
//   - SMA lookback and NaN handling
//   - EMA seeding and recursion
//   - Wilder RSI on hand-computed values and degenerate windows
//   - MACD histogram consistency
// =============================================================================

#include "stratlab/indicators/technical_indicators.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

class TechnicalIndicatorsTest : public ::testing::Test {
 protected:
  stratlab::TechnicalIndicators indicators;
  const double nan = std::numeric_limits<double>::quiet_NaN();
};

// -----------------------------------------------------------------------------
// 1. SMA is undefined for the first window-1 bars.
// -----------------------------------------------------------------------------
TEST_F(TechnicalIndicatorsTest, SmaTrailingMean) {
  const auto sma = indicators.sma({1.0, 2.0, 3.0, 4.0}, 2);
  ASSERT_EQ(sma.size(), 4u);
  EXPECT_TRUE(std::isnan(sma[0]));
  EXPECT_DOUBLE_EQ(sma[1], 1.5);
  EXPECT_DOUBLE_EQ(sma[2], 2.5);
  EXPECT_DOUBLE_EQ(sma[3], 3.5);
}

// -----------------------------------------------------------------------------
// 2. A NaN close poisons only the windows that contain it.
// -----------------------------------------------------------------------------
TEST_F(TechnicalIndicatorsTest, SmaSkipsWindowsWithNaN) {
  const auto sma = indicators.sma({1.0, nan, 3.0, 5.0, 7.0}, 2);
  EXPECT_TRUE(std::isnan(sma[1]));
  EXPECT_TRUE(std::isnan(sma[2]));
  EXPECT_DOUBLE_EQ(sma[3], 4.0);
  EXPECT_DOUBLE_EQ(sma[4], 6.0);
}

// -----------------------------------------------------------------------------
// 3. EMA starts from the SMA of the first period values.
// -----------------------------------------------------------------------------
TEST_F(TechnicalIndicatorsTest, EmaSeededWithSma) {
  const auto ema = indicators.ema({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
  EXPECT_TRUE(std::isnan(ema[1]));
  EXPECT_DOUBLE_EQ(ema[2], 2.0);
  EXPECT_DOUBLE_EQ(ema[3], 3.0);  // 0.5 * 4 + 0.5 * 2
  EXPECT_DOUBLE_EQ(ema[4], 4.0);
}

// -----------------------------------------------------------------------------
// 4. Wilder RSI, period 2, computed by hand:
//      changes +1, -1       → avg gain 0.5, avg loss 0.5 → 50
//      change +1            → gain 0.75, loss 0.25       → 75
// -----------------------------------------------------------------------------
TEST_F(TechnicalIndicatorsTest, RsiWilderSmoothing) {
  const auto rsi = indicators.rsi({1.0, 2.0, 1.0, 2.0}, 2);
  ASSERT_EQ(rsi.size(), 4u);
  EXPECT_TRUE(std::isnan(rsi[0]));
  EXPECT_TRUE(std::isnan(rsi[1]));
  EXPECT_NEAR(rsi[2], 50.0, 1e-12);
  EXPECT_NEAR(rsi[3], 75.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 5. Only gains → 100; no movement at all → undefined.
// -----------------------------------------------------------------------------
TEST_F(TechnicalIndicatorsTest, RsiDegenerateWindows) {
  std::vector<double> rising;
  std::vector<double> flat;
  for (int i = 0; i < 20; ++i) {
    rising.push_back(100.0 + i);
    flat.push_back(100.0);
  }
  const auto up = indicators.rsi(rising, 14);
  EXPECT_TRUE(std::isnan(up[13]));
  EXPECT_DOUBLE_EQ(up[14], 100.0);
  EXPECT_DOUBLE_EQ(up[19], 100.0);

  const auto still = indicators.rsi(flat, 14);
  for (double v : still) {
    EXPECT_TRUE(std::isnan(v));
  }

  // Fewer bars than the period: nothing defined.
  const auto short_series = indicators.rsi({1.0, 2.0, 3.0}, 14);
  for (double v : short_series) {
    EXPECT_TRUE(std::isnan(v));
  }
}

// -----------------------------------------------------------------------------
// 6. histogram == macd - signal wherever both are defined.
// -----------------------------------------------------------------------------
TEST_F(TechnicalIndicatorsTest, MacdHistogramIsSpread) {
  std::vector<double> closes;
  for (int i = 0; i < 60; ++i) {
    closes.push_back(100.0 + 10.0 * std::sin(i / 5.0));
  }
  const auto m = indicators.macd(closes, 12, 26, 9);
  ASSERT_EQ(m.macd.size(), closes.size());

  // MACD needs the slow EMA (index 25); the signal needs 9 MACD values more.
  EXPECT_TRUE(std::isnan(m.macd[24]));
  EXPECT_FALSE(std::isnan(m.macd[25]));
  EXPECT_TRUE(std::isnan(m.signal[32]));
  EXPECT_FALSE(std::isnan(m.signal[33]));

  for (std::size_t i = 33; i < closes.size(); ++i) {
    EXPECT_NEAR(m.histogram[i], m.macd[i] - m.signal[i], 1e-12);
  }
}

// -----------------------------------------------------------------------------
// 7. Label thresholds.
// -----------------------------------------------------------------------------
TEST(RsiRecommendationTest, MapsReadingToLabel) {
  EXPECT_EQ(stratlab::rsiRecommendation(25.0), "STRONG BUY");
  EXPECT_EQ(stratlab::rsiRecommendation(40.0), "BUY");
  EXPECT_EQ(stratlab::rsiRecommendation(50.0), "HOLD");
  EXPECT_EQ(stratlab::rsiRecommendation(60.0), "SELL");
  EXPECT_EQ(stratlab::rsiRecommendation(75.0), "STRONG SELL");
  EXPECT_EQ(stratlab::rsiRecommendation(
                std::numeric_limits<double>::quiet_NaN()),
            "UNKNOWN");
  EXPECT_EQ(stratlab::rsiRecommendation(35.0, 40.0, 60.0), "STRONG BUY");
}
