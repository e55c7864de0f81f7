#include "stratlab/strategy/signal_generator.hpp"

#include <cmath>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace stratlab {

using domain::PriceSeries;
using domain::Signal;
using domain::SignalSeries;

namespace {

bool defined(double x) { return std::isfinite(x); }

}  // namespace

SignalGenerator::SignalGenerator(StrategyConfig config,
                                 const IIndicatorProvider& indicators)
    : config_(std::move(config)), indicators_(indicators) {
  validateStrategy(config_);
}

SignalSeries SignalGenerator::generateSignals(const PriceSeries& series) const {
  if (series.empty()) {
    return {};
  }
  return std::visit(
      [this, &series](const auto& params) -> SignalSeries {
        using T = std::decay_t<decltype(params)>;
        if constexpr (std::is_same_v<T, MovingAverageCrossParams>) {
          return movingAverageCross(series, params);
        } else if constexpr (std::is_same_v<T, RsiParams>) {
          return rsiThreshold(series, params);
        } else if constexpr (std::is_same_v<T, MacdParams>) {
          return macdCrossover(series, params);
        } else {
          return maWithRsiFilter(series, params);
        }
      },
      config_);
}

std::vector<double> SignalGenerator::rsiColumn(const PriceSeries& series,
                                               int period) const {
  if (series.hasColumn(domain::columns::kRsi)) {
    return series.column(domain::columns::kRsi);
  }
  return indicators_.rsi(series.closes(), period);
}

// -----------------------------------------------------------------------------
// Moving-average crossover (level-triggered)
// -----------------------------------------------------------------------------
SignalSeries SignalGenerator::movingAverageCross(
    const PriceSeries& series, const MovingAverageCrossParams& params) const {
  const std::vector<double> closes = series.closes();
  const std::vector<double> short_ma = indicators_.sma(closes, params.short_window);
  const std::vector<double> long_ma = indicators_.sma(closes, params.long_window);

  SignalSeries signals(series.size(), Signal::Flat);
  for (std::size_t i = 0; i < signals.size(); ++i) {
    if (defined(short_ma[i]) && defined(long_ma[i]) && short_ma[i] > long_ma[i]) {
      signals[i] = Signal::Buy;
    }
  }
  return signals;
}

// -----------------------------------------------------------------------------
// RSI thresholds (latched)
// -----------------------------------------------------------------------------
SignalSeries SignalGenerator::rsiThreshold(const PriceSeries& series,
                                           const RsiParams& params) const {
  const std::vector<double> rsi = rsiColumn(series, params.rsi_period);

  SignalSeries signals(series.size(), Signal::Flat);
  Signal current = Signal::Flat;
  for (std::size_t i = 0; i < signals.size(); ++i) {
    if (defined(rsi[i])) {
      if (rsi[i] < params.oversold) {
        current = Signal::Buy;
      }
      // Checked second so a sell wins if the thresholds ever overlap.
      if (rsi[i] > params.overbought) {
        current = Signal::Sell;
      }
    }
    signals[i] = current;
  }
  return signals;
}

// -----------------------------------------------------------------------------
// MACD crossover (edge-triggered)
// -----------------------------------------------------------------------------
SignalSeries SignalGenerator::macdCrossover(const PriceSeries& series,
                                            const MacdParams& params) const {
  std::vector<double> macd;
  std::vector<double> signal_line;
  if (series.hasColumn(domain::columns::kMacd) &&
      series.hasColumn(domain::columns::kMacdSignal)) {
    macd = series.column(domain::columns::kMacd);
    signal_line = series.column(domain::columns::kMacdSignal);
  } else {
    auto computed = indicators_.macd(series.closes(), params.fast_period,
                                     params.slow_period, params.signal_period);
    macd = std::move(computed.macd);
    signal_line = std::move(computed.signal);
  }

  SignalSeries signals(series.size(), Signal::Flat);
  for (std::size_t i = 1; i < signals.size(); ++i) {
    if (!defined(macd[i]) || !defined(signal_line[i]) ||
        !defined(macd[i - 1]) || !defined(signal_line[i - 1])) {
      continue;
    }
    const bool above_now = macd[i] > signal_line[i];
    const bool above_before = macd[i - 1] > signal_line[i - 1];
    const bool below_now = macd[i] < signal_line[i];
    const bool below_before = macd[i - 1] < signal_line[i - 1];
    if (above_now && !above_before) {
      signals[i] = Signal::Buy;
    } else if (below_now && !below_before) {
      signals[i] = Signal::Sell;
    }
  }
  return signals;
}

// -----------------------------------------------------------------------------
// Moving average confirmed by RSI
// -----------------------------------------------------------------------------
SignalSeries SignalGenerator::maWithRsiFilter(
    const PriceSeries& series, const MaRsiFilterParams& params) const {
  const std::vector<double> closes = series.closes();
  const std::vector<double> short_ma = indicators_.sma(closes, params.short_window);
  const std::vector<double> long_ma = indicators_.sma(closes, params.long_window);
  const std::vector<double> rsi = rsiColumn(series, params.rsi_period);

  SignalSeries signals(series.size(), Signal::Flat);
  for (std::size_t i = 0; i < signals.size(); ++i) {
    if (!defined(short_ma[i]) || !defined(long_ma[i]) || !defined(rsi[i])) {
      continue;
    }
    if (short_ma[i] > long_ma[i] && rsi[i] < params.rsi_buy) {
      signals[i] = Signal::Buy;
    } else if (short_ma[i] < long_ma[i] && rsi[i] > params.rsi_sell) {
      signals[i] = Signal::Sell;
    }
  }
  return signals;
}

std::vector<domain::PositionChange> positionChanges(const SignalSeries& signals) {
  std::vector<domain::PositionChange> changes(signals.size(), 0);
  for (std::size_t i = 1; i < signals.size(); ++i) {
    changes[i] = domain::toInt(signals[i]) - domain::toInt(signals[i - 1]);
  }
  return changes;
}

}  // namespace stratlab
