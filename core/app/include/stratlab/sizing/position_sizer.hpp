#pragma once

#include <string>

namespace stratlab {

// -----------------------------------------------------------------------------
// SizingMethod
// -----------------------------------------------------------------------------
// How many shares an order moves. Config key in parentheses.
//   FixedDollar   (fixed_dollar)  floor(value / price)
//   Percentage    (percentage)    floor(prior_total * value / 100 / price)
//   FixedRisk     (fixed_risk)    same formula as Percentage; no stop-loss
//                                 distance is modelled
//   FixedShares   (fixed_shares)  value, independent of price
// -----------------------------------------------------------------------------
enum class SizingMethod {
  FixedDollar,
  Percentage,
  FixedRisk,
  FixedShares,
};

// Throws std::invalid_argument naming the bad key and the accepted ones.
SizingMethod parseSizingMethod(const std::string& key);

std::string sizingMethodKey(SizingMethod method);

// -------------------------------------------------------------------------
// computeShares
// -------------------------------------------------------------------------
// @brief  Share quantity for one order.
//
// @param  method       Sizing rule.
// @param  value        Dollars, percent or shares depending on `method`.
// @param  price        Fill price (the bar's close).
// @param  prior_total  Total portfolio value at the previous bar.
//
// @return A whole, non-negative number of shares, or NaN when the inputs
//         needed by `method` are not finite or price <= 0. The caller
//         treats NaN as "no order".
//
// Capping a sell at the current position is the Backtester's job, not this
// function's.
// -------------------------------------------------------------------------
double computeShares(SizingMethod method, double value, double price,
                     double prior_total);

}  // namespace stratlab
