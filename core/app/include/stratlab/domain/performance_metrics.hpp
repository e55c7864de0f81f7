#pragma once

#include <cstddef>

namespace stratlab {
namespace domain {

// -----------------------------------------------------------------------------
// PerformanceMetrics — summary statistics of a finished backtest
// -----------------------------------------------------------------------------
//
// @brief  Computed once by PerformanceAnalyzer from a completed portfolio
//         history; read-only afterwards.
//
// @details
// Units follow the reporting convention of the dashboard this engine feeds:
// every return-like field is a percentage (12.5 means +12.5%), max_drawdown
// is a non-positive percentage, sharpe_ratio and profit_factor are plain
// ratios.
//
// Degenerate arithmetic is never reported as zero:
//   sharpe_ratio   NaN   when the return series has zero (or undefined)
//                        standard deviation
//   profit_factor  +inf  when trades exist but none of them lost
//                  NaN   when no trade was closed at all
// An empty history produces NaN for every floating-point field.
// -----------------------------------------------------------------------------
struct PerformanceMetrics {
  double total_return{0.0};       // %
  double annualized_return{0.0};  // %
  double sharpe_ratio{0.0};
  double max_drawdown{0.0};       // %, <= 0
  double final_equity{0.0};

  // PositionChange event counts (not round trips). Changes that placed no
  // order (rejected buy, non-finite close) are excluded.
  std::size_t total_trades{0};
  std::size_t buy_trades{0};
  std::size_t sell_trades{0};

  // Closed round trips.
  std::size_t trade_count{0};
  std::size_t winning_trades{0};
  std::size_t losing_trades{0};
  double win_rate{0.0};       // %
  double profit_factor{0.0};
  double avg_win{0.0};        // % per winning trade
  double avg_loss{0.0};       // % per losing trade (<= 0)
};

}  // namespace domain
}  // namespace stratlab
