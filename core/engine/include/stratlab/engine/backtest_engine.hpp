#pragma once

#include "stratlab/config/backtest_config.hpp"
#include "stratlab/domain/performance_metrics.hpp"
#include "stratlab/domain/portfolio_state.hpp"
#include "stratlab/domain/price_series.hpp"
#include "stratlab/domain/trade.hpp"
#include "stratlab/indicators/i_indicator_provider.hpp"
#include "stratlab/persistence/backtest_record.hpp"

#include <string>
#include <vector>

namespace stratlab {

// RSI period behind BacktestRun::rsi_recommendation when the series carries
// no RSI column.
inline constexpr int kRecommendationRsiPeriod = 14;

// -----------------------------------------------------------------------------
// BacktestRun — everything one backtest produced
// -----------------------------------------------------------------------------
struct BacktestRun {
  std::vector<domain::PortfolioState> history;
  std::vector<domain::Trade> trades;
  domain::PerformanceMetrics metrics;
  BacktestRecord record;

  // Per-bar drawdown of `total` from its running peak, as a fraction (<= 0).
  // NaN on rows whose total is NaN.
  std::vector<double> drawdown;

  // rsiRecommendation() of the last bar's RSI; "UNKNOWN" if it is NaN or the
  // series is empty.
  std::string rsi_recommendation{"UNKNOWN"};
};

// -----------------------------------------------------------------------------
// BacktestEngine
// -----------------------------------------------------------------------------
//
// @brief  Wires SignalGenerator, Backtester and PerformanceAnalyzer for one
//         BacktestConfig and returns the full result.
//
// @details
// Pipeline:
//
//   PriceSeries ─► SignalGenerator ─► Backtester ─► history
//                                                     │
//                          PerformanceAnalyzer ◄──────┘
//                                  │
//                          metrics + trades ─► BacktestRecord
//
// The record's start/end dates are the first and last bar timestamps in
// ISO-8601, or empty strings for an empty series. The run also carries the
// equity drawdown series and the RSI label for the last bar (series "RSI"
// column if present, else RSI(14) from the provider).
//
// Thread model:
//   run() is const and keeps all per-run state on its own stack, so several
//   threads may call it on one engine (SweepRunner does) provided the
//   indicator provider is thread-safe.
//
// Ownership:
//   Holds the IIndicatorProvider by reference; it must outlive the engine.
// -----------------------------------------------------------------------------
class BacktestEngine {
 public:
  explicit BacktestEngine(const IIndicatorProvider& indicators);

  BacktestEngine(const BacktestEngine&) = delete;
  BacktestEngine& operator=(const BacktestEngine&) = delete;

  // -------------------------------------------------------------------------
  // run(config, series)
  // -------------------------------------------------------------------------
  // @throws std::invalid_argument if the strategy parameters or settings in
  //         `config` are invalid. Data problems never throw; they show up
  //         as NaN rows and metrics.
  // -------------------------------------------------------------------------
  BacktestRun run(const BacktestConfig& config,
                  const domain::PriceSeries& series) const;

 private:
  const IIndicatorProvider& indicators_;
};

}  // namespace stratlab
