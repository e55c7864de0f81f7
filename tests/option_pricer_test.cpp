// =============================================================================
// option_pricer_test.cpp
// =============================================================================
// Unit tests for the Black-Scholes and binomial-tree pricers and the payoff
// helpers.
//
// Validates:
//   - Reference Black-Scholes prices and put-call parity
//   - Greeks relationships between calls and puts
//   - Binomial convergence to Black-Scholes and early-exercise ordering
//   - Degenerate inputs → NaN
//   - P/L curve, breakeven and chain pricing
// =============================================================================

#include "stratlab/options/option_pricer.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using stratlab::binomialOptionPrice;
using stratlab::blackScholesGreeks;
using stratlab::domain::OptionQuote;
using stratlab::domain::OptionType;

class OptionPricerTest : public ::testing::Test {
 protected:
  // S=100, K=100, T=1y, r=5%, sigma=20%.
  OptionQuote call{100.0, 100.0, 1.0, 0.05, 0.2, OptionType::Call};
  OptionQuote put{100.0, 100.0, 1.0, 0.05, 0.2, OptionType::Put};
};

// -----------------------------------------------------------------------------
// 1. Textbook values for the at-the-money case.
// -----------------------------------------------------------------------------
TEST_F(OptionPricerTest, BlackScholesReferencePrices) {
  EXPECT_NEAR(blackScholesGreeks(call).price, 10.4506, 1e-4);
  EXPECT_NEAR(blackScholesGreeks(put).price, 5.5735, 1e-4);
  EXPECT_NEAR(blackScholesGreeks(call).delta, 0.6368, 1e-4);
}

// -----------------------------------------------------------------------------
// 2. C - P = S - K e^{-rT} across strikes and maturities.
// -----------------------------------------------------------------------------
TEST_F(OptionPricerTest, PutCallParity) {
  for (double strike : {80.0, 95.0, 100.0, 120.0}) {
    for (double t : {0.1, 0.5, 2.0}) {
      OptionQuote c{100.0, strike, t, 0.03, 0.35, OptionType::Call};
      OptionQuote p = c;
      p.type = OptionType::Put;
      const double lhs = blackScholesGreeks(c).price - blackScholesGreeks(p).price;
      const double rhs = 100.0 - strike * std::exp(-0.03 * t);
      EXPECT_NEAR(lhs, rhs, 1e-6) << "K=" << strike << " T=" << t;
    }
  }
}

// -----------------------------------------------------------------------------
// 3. Greeks shared by calls and puts, and the delta offset.
// -----------------------------------------------------------------------------
TEST_F(OptionPricerTest, GreeksRelationships) {
  const auto c = blackScholesGreeks(call);
  const auto p = blackScholesGreeks(put);

  EXPECT_GT(c.delta, 0.0);
  EXPECT_LT(c.delta, 1.0);
  EXPECT_NEAR(p.delta, c.delta - 1.0, 1e-12);
  EXPECT_NEAR(c.gamma, p.gamma, 1e-12);
  EXPECT_NEAR(c.vega, p.vega, 1e-12);
  EXPECT_GT(c.gamma, 0.0);
  EXPECT_LT(c.theta, 0.0);
  EXPECT_GT(c.rho, 0.0);
  EXPECT_LT(p.rho, 0.0);
}

// -----------------------------------------------------------------------------
// 4. European binomial price converges to Black-Scholes.
// -----------------------------------------------------------------------------
TEST_F(OptionPricerTest, BinomialConvergesToBlackScholes) {
  const double bs_call = blackScholesGreeks(call).price;
  const double bs_put = blackScholesGreeks(put).price;

  EXPECT_NEAR(binomialOptionPrice(call, 100, false), bs_call, 0.05);
  EXPECT_NEAR(binomialOptionPrice(call, 500, false), bs_call, 0.01);
  EXPECT_NEAR(binomialOptionPrice(put, 500, false), bs_put, 0.01);
}

// -----------------------------------------------------------------------------
// 5. Early exercise: American put >= European put; American call on a
// non-dividend stock equals the European call.
// -----------------------------------------------------------------------------
TEST_F(OptionPricerTest, AmericanEarlyExercise) {
  const double euro_put = binomialOptionPrice(put, 200, false);
  const double amer_put = binomialOptionPrice(put, 200, true);
  EXPECT_GT(amer_put, euro_put);

  OptionQuote deep_put = put;
  deep_put.strike = 150.0;
  EXPECT_GE(binomialOptionPrice(deep_put, 200, true), 50.0 - 1e-9);

  EXPECT_NEAR(binomialOptionPrice(call, 200, true),
              binomialOptionPrice(call, 200, false), 1e-9);
}

// -----------------------------------------------------------------------------
// 6. Non-positive S, K, T or sigma, and steps < 1, give NaN.
// -----------------------------------------------------------------------------
TEST_F(OptionPricerTest, DegenerateInputsGiveNaN) {
  std::vector<OptionQuote> bad(4, call);
  bad[0].spot = 0.0;
  bad[1].strike = -1.0;
  bad[2].time_to_expiry = 0.0;
  bad[3].volatility = 0.0;

  for (const auto& q : bad) {
    const auto g = blackScholesGreeks(q);
    EXPECT_TRUE(std::isnan(g.price));
    EXPECT_TRUE(std::isnan(g.delta));
    EXPECT_TRUE(std::isnan(g.gamma));
    EXPECT_TRUE(std::isnan(g.theta));
    EXPECT_TRUE(std::isnan(g.vega));
    EXPECT_TRUE(std::isnan(g.rho));
    EXPECT_TRUE(std::isnan(binomialOptionPrice(q, 50, true)));
  }
  EXPECT_TRUE(std::isnan(binomialOptionPrice(call, 0, false)));
}

// -----------------------------------------------------------------------------
// 7. Expiry P/L curve and breakeven.
// -----------------------------------------------------------------------------
TEST(OptionPayoffTest, ProfitLossCurve) {
  const auto curve =
      stratlab::optionProfitLoss(100.0, 100.0, 5.0, OptionType::Call);
  ASSERT_EQ(curve.size(), 100u);
  EXPECT_NEAR(curve.front().underlying_price, 70.0, 1e-9);
  EXPECT_NEAR(curve.back().underlying_price, 130.0, 1e-9);
  EXPECT_NEAR(curve.front().payoff_per_share, -5.0, 1e-9);
  EXPECT_NEAR(curve.back().payoff_per_share, 25.0, 1e-9);
  EXPECT_NEAR(curve.back().total_payoff, 2500.0, 1e-6);

  const auto puts =
      stratlab::optionProfitLoss(100.0, 100.0, 4.0, OptionType::Put, 10.0, 3);
  ASSERT_EQ(puts.size(), 3u);
  EXPECT_NEAR(puts[0].payoff_per_share, 26.0, 1e-9);
  EXPECT_NEAR(puts[0].total_payoff, 260.0, 1e-9);
  EXPECT_NEAR(puts[1].payoff_per_share, -4.0, 1e-9);

  EXPECT_THROW(stratlab::optionProfitLoss(100, 100, 5, OptionType::Call, 100, 1),
               std::invalid_argument);

  EXPECT_DOUBLE_EQ(stratlab::optionBreakeven(100.0, 5.0, OptionType::Call), 105.0);
  EXPECT_DOUBLE_EQ(stratlab::optionBreakeven(100.0, 5.0, OptionType::Put), 95.0);
}

// -----------------------------------------------------------------------------
// 8. Chain rows priced with their own IV; a missing IV gives NaN Greeks.
// -----------------------------------------------------------------------------
TEST(OptionChainTest, PricesEveryRow) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const std::vector<stratlab::domain::OptionChainRow> rows{
      {"XYZ240621C00095000", 95.0, 0.25},
      {"XYZ240621C00100000", 100.0, nan},
  };
  const auto priced =
      stratlab::priceOptionChain(100.0, 0.5, 0.04, OptionType::Call, rows);

  ASSERT_EQ(priced.size(), 2u);
  EXPECT_EQ(priced[0].row.contract_symbol, "XYZ240621C00095000");
  const OptionQuote q{100.0, 95.0, 0.5, 0.04, 0.25, OptionType::Call};
  EXPECT_DOUBLE_EQ(priced[0].greeks.price, blackScholesGreeks(q).price);
  EXPECT_TRUE(std::isnan(priced[1].greeks.price));
}

// -----------------------------------------------------------------------------
// 9. Option type keys are case-insensitive.
// -----------------------------------------------------------------------------
TEST(OptionTypeTest, ParsesKeys) {
  EXPECT_EQ(stratlab::parseOptionType("call"), OptionType::Call);
  EXPECT_EQ(stratlab::parseOptionType("PUT"), OptionType::Put);
  EXPECT_EQ(stratlab::optionTypeKey(OptionType::Put), "put");
  EXPECT_THROW(stratlab::parseOptionType("straddle"), std::invalid_argument);
}
