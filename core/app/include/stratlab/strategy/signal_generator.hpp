#pragma once

#include "stratlab/domain/price_series.hpp"
#include "stratlab/domain/signal.hpp"
#include "stratlab/indicators/i_indicator_provider.hpp"
#include "stratlab/strategy/strategy_config.hpp"

#include <vector>

namespace stratlab {

// -----------------------------------------------------------------------------
// SignalGenerator — strategy evaluation
// -----------------------------------------------------------------------------
//
// @brief  Pure function from a PriceSeries to one Signal per bar, for the
//         strategy variant held in its StrategyConfig.
//
// @details
// Variant rules:
//   ma_cross  Buy where sma(short) > sma(long), both defined; Flat otherwise.
//   rsi       Buy when RSI < oversold, Sell when RSI > overbought. Between the
//             thresholds (or while RSI is undefined) the previous signal is
//             kept, starting from Flat.
//   macd      Buy only on the bar where MACD crosses above its signal line,
//             Sell only on the bar where it crosses below; Flat elsewhere.
//   ma_rsi    Buy when short > long AND RSI < rsi_buy; Sell when
//             short < long AND RSI > rsi_sell; Flat otherwise.
//
// Indicator columns already present on the series (RSI, MACD, Signal) are
// used as-is; anything missing is computed through the IIndicatorProvider.
// Undefined indicator values (NaN) never produce Buy or Sell.
//
// The configuration is validated in the constructor, so a SignalGenerator
// that exists can always evaluate any series.
//
// Ownership:
//   Holds the provider by reference. The provider must outlive this object.
//
// Thread-safety: generateSignals() is const; one instance may serve several
// threads if the provider is thread-safe.
// -----------------------------------------------------------------------------
class SignalGenerator {
 public:
  // Throws std::invalid_argument if `config` fails validateStrategy().
  SignalGenerator(StrategyConfig config, const IIndicatorProvider& indicators);

  // One Signal per bar of `series`; empty for an empty series.
  domain::SignalSeries generateSignals(const domain::PriceSeries& series) const;

  const StrategyConfig& config() const { return config_; }

 private:
  domain::SignalSeries movingAverageCross(
      const domain::PriceSeries& series,
      const MovingAverageCrossParams& params) const;
  domain::SignalSeries rsiThreshold(const domain::PriceSeries& series,
                                    const RsiParams& params) const;
  domain::SignalSeries macdCrossover(const domain::PriceSeries& series,
                                     const MacdParams& params) const;
  domain::SignalSeries maWithRsiFilter(const domain::PriceSeries& series,
                                       const MaRsiFilterParams& params) const;

  std::vector<double> rsiColumn(const domain::PriceSeries& series,
                                int period) const;

  StrategyConfig config_;
  const IIndicatorProvider& indicators_;
};

// -----------------------------------------------------------------------------
// positionChanges
// -----------------------------------------------------------------------------
// First difference of the signal series: change[t] = signal[t] - signal[t-1],
// change[0] = 0. This, not the signal level, is what triggers orders.
// -----------------------------------------------------------------------------
std::vector<domain::PositionChange> positionChanges(
    const domain::SignalSeries& signals);

}  // namespace stratlab
