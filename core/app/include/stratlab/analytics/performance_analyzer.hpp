#pragma once

#include "stratlab/domain/performance_metrics.hpp"
#include "stratlab/domain/portfolio_state.hpp"
#include "stratlab/domain/trade.hpp"

#include <cstdint>
#include <vector>

namespace stratlab {

// -----------------------------------------------------------------------------
// PerformanceAnalyzer — summary statistics of a finished backtest
// -----------------------------------------------------------------------------
//
// @brief  Reduces a completed portfolio history to PerformanceMetrics.
//
// @details
// All formulas assume daily bars (the sqrt(252) Sharpe factor and the
// 365-day annualisation). Nothing here checks the bar interval.
//
//   total_return       (final_total / initial_capital - 1) * 100
//   annualized_return  ((1 + total_return/100)^(365/days) - 1) * 100,
//                      0 when the history spans zero calendar days
//   sharpe_ratio       sqrt(252) * mean(r) / sample_stdev(r) over the finite
//                      period returns, including the seed row's 0
//   max_drawdown       min(cumprod(1+r) / running_max - 1) * 100
//
// Degenerate statistics are sentinels (see PerformanceMetrics), never 0.
//
// Thread-safety: Stateless apart from the capital passed at construction;
// all methods are const or static.
// -----------------------------------------------------------------------------
class PerformanceAnalyzer {
 public:
  explicit PerformanceAnalyzer(double initial_capital);

  domain::PerformanceMetrics analyze(
      const std::vector<domain::PortfolioState>& history) const;

  // -------------------------------------------------------------------------
  // extractTrades(history)
  // -------------------------------------------------------------------------
  // @brief  Pairs PositionChange events into round trips.
  //
  // @details
  // Scans in order. A positive change while no trade is open opens one at
  // that bar's close; the next negative change while open closes it. A buy
  // while already open is ignored. A trade still open at the last bar is
  // not returned.
  //
  // Rows with a non-finite close carry no order and are skipped, as are
  // buys rejected by the cash floor (order_rejected).
  // -------------------------------------------------------------------------
  static std::vector<domain::Trade> extractTrades(
      const std::vector<domain::PortfolioState>& history);

  // NaN for fewer than two finite returns or zero standard deviation.
  static double sharpeRatio(const std::vector<double>& returns);

  // Percentage, <= 0. Non-finite returns are treated as no change.
  static double maxDrawdown(const std::vector<double>& returns);

  // Per-bar equity / running_max - 1 (fraction, not percent). NaN equity
  // rows stay NaN and do not move the running max.
  static std::vector<double> drawdownSeries(const std::vector<double>& equity);

  static double annualizedReturn(double total_return_pct,
                                 std::int64_t calendar_days);

 private:
  double initial_capital_;
};

}  // namespace stratlab
