#pragma once

#include "stratlab/domain/portfolio_state.hpp"
#include "stratlab/domain/price_series.hpp"
#include "stratlab/domain/signal.hpp"
#include "stratlab/sizing/position_sizer.hpp"
#include "stratlab/strategy/signal_generator.hpp"

#include <vector>

namespace stratlab {

// -----------------------------------------------------------------------------
// BacktestSettings
// -----------------------------------------------------------------------------
// Account and order parameters of one run. Checked by the Backtester
// constructor.
// -----------------------------------------------------------------------------
struct BacktestSettings {
  double initial_capital{100000.0};
  double commission{0.001};  // Fraction of notional, charged on both sides
  SizingMethod sizing_method{SizingMethod::FixedDollar};
  double sizing_value{10000.0};

  // When true, a buy costing more than the available cash is skipped and
  // the row is flagged order_rejected. Off by default: cash may go negative.
  bool enforce_cash_floor{false};
};

// Throws std::invalid_argument unless initial_capital > 0,
// 0 <= commission < 1 and sizing_value is finite and >= 0.
void validateSettings(const BacktestSettings& settings);

// -----------------------------------------------------------------------------
// Backtester — bar-by-bar portfolio simulation
// -----------------------------------------------------------------------------
//
// @brief  Replays a PriceSeries through a strategy and returns one
//         PortfolioState per bar.
//
// @details
// Row 0 is the seed: no position, cash = total = initial_capital, return 0.
// For each later bar t:
//   1. position and cash carry over from row t-1.
//   2. If the signal changed (PositionChange != 0), size an order at
//      close[t]:
//        buy   position += shares;  cash -= shares * close * (1 + commission)
//        sell  sold = min(shares, position[t-1]);
//              position -= sold;    cash += sold * close * (1 - commission)
//      A sell while flat does nothing.
//   3. holdings = position * close, total = holdings + cash,
//      period_return = total[t] / total[t-1] - 1.
//
// Every row is appended once and never modified afterwards.
//
// Bad data is not fatal. A non-finite close produces NaN holdings, total
// and return on that row, and no order is placed there. A warning goes to
// std::cerr.
//
// Ownership:
//   Holds the SignalGenerator by reference. The returned history is owned
//   by the caller.
//
// Thread-safety: run() and replay() are const and allocate their own
// history; concurrent calls on one instance are safe.
// -----------------------------------------------------------------------------
class Backtester {
 public:
  // Throws std::invalid_argument if validateSettings() rejects `settings`.
  Backtester(const SignalGenerator& signals, BacktestSettings settings);

  // Generates signals for `series` and simulates them.
  std::vector<domain::PortfolioState> run(
      const domain::PriceSeries& series) const;

  // -------------------------------------------------------------------------
  // replay(series, signals)
  // -------------------------------------------------------------------------
  // @brief  Simulates an externally produced signal series.
  //
  // @throws std::invalid_argument if signals.size() != series.size().
  // -------------------------------------------------------------------------
  std::vector<domain::PortfolioState> replay(
      const domain::PriceSeries& series,
      const domain::SignalSeries& signals) const;

  const BacktestSettings& settings() const { return settings_; }

 private:
  domain::PortfolioState step(const domain::PortfolioState& prev,
                              const domain::PriceBar& bar, domain::Signal signal,
                              domain::PositionChange change) const;

  const SignalGenerator& signals_;
  BacktestSettings settings_;
};

}  // namespace stratlab
