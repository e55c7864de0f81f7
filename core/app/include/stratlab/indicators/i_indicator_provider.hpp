#pragma once

#include <vector>

namespace stratlab {

// -----------------------------------------------------------------------------
// IIndicatorProvider — technical-indicator collaborator
// -----------------------------------------------------------------------------
//
// @brief  Computes the indicator columns a strategy needs when the market
//         data did not arrive pre-annotated with them.
//
// @details
// Strategies never fail because a column is missing; they ask this
// collaborator instead. Every method returns a vector aligned with the input
// closes, NaN where the indicator is undefined (lookback window, NaN input).
//
// Implementations must be stateless or internally synchronised: one provider
// is shared by every backtest of a parameter sweep.
//
// Ownership:
//   Held by reference by SignalGenerator. The caller (BacktestEngine,
//   SweepRunner or a test) owns it and must keep it alive for the run.
// -----------------------------------------------------------------------------
class IIndicatorProvider {
 public:
  struct MacdColumns {
    std::vector<double> macd;
    std::vector<double> signal;
    std::vector<double> histogram;
  };

  virtual ~IIndicatorProvider() = default;

  // Trailing simple mean over `window` bars.
  virtual std::vector<double> sma(const std::vector<double>& closes,
                                  int window) const = 0;

  // Relative Strength Index on a 0-100 scale.
  virtual std::vector<double> rsi(const std::vector<double>& closes,
                                  int period) const = 0;

  // MACD line, its signal line and the histogram (macd - signal).
  virtual MacdColumns macd(const std::vector<double>& closes, int fast_period,
                           int slow_period, int signal_period) const = 0;
};

}  // namespace stratlab
