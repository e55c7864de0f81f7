#pragma once

#include "stratlab/indicators/i_indicator_provider.hpp"

#include <string>
#include <vector>

namespace stratlab {

// -----------------------------------------------------------------------------
// TechnicalIndicators — default indicator collaborator
// -----------------------------------------------------------------------------
//
// @brief  Stateless implementation of IIndicatorProvider.
//
// @details
// Conventions:
//   sma   NaN for the first window-1 bars and for any window containing NaN.
//   ema   Seeded with the SMA of the first `period` values, then
//         ema[t] = alpha * x[t] + (1 - alpha) * ema[t-1], alpha = 2/(n+1).
//   rsi   Wilder smoothing. First average gain/loss is the simple mean of
//         the first `period` changes, so the first defined value sits at
//         index `period`. avg_loss == 0 gives 100; a window with no movement
//         at all gives NaN.
//   macd  ema(fast) - ema(slow); signal = ema(signal_period) of the defined
//         part of the MACD line.
//
// Invalid periods (< 1) yield an all-NaN column; the strategy layer has
// already rejected such parameters, so this only guards direct callers.
//
// Thread-safety: All methods are const and touch no shared state.
// -----------------------------------------------------------------------------
class TechnicalIndicators final : public IIndicatorProvider {
 public:
  std::vector<double> sma(const std::vector<double>& closes,
                          int window) const override;

  std::vector<double> rsi(const std::vector<double>& closes,
                          int period) const override;

  MacdColumns macd(const std::vector<double>& closes, int fast_period,
                   int slow_period, int signal_period) const override;

  std::vector<double> ema(const std::vector<double>& values, int period) const;
};

// -----------------------------------------------------------------------------
// rsiRecommendation
// -----------------------------------------------------------------------------
// Maps one RSI reading to the label shown next to a ticker:
//   rsi < rsi_buy        → "STRONG BUY"
//   rsi < 45             → "BUY"
//   rsi > rsi_sell       → "STRONG SELL"
//   rsi > 55             → "SELL"
//   otherwise            → "HOLD"
//   NaN                  → "UNKNOWN"
// -----------------------------------------------------------------------------
std::string rsiRecommendation(double rsi, double rsi_buy = 30.0,
                              double rsi_sell = 70.0);

}  // namespace stratlab
