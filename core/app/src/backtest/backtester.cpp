#include "stratlab/backtest/backtester.hpp"

#include "stratlab/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace stratlab {

using domain::PortfolioState;
using domain::PositionChange;
using domain::PriceBar;
using domain::PriceSeries;
using domain::Signal;
using domain::SignalSeries;

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}  // namespace

void validateSettings(const BacktestSettings& settings) {
  if (!std::isfinite(settings.initial_capital) ||
      settings.initial_capital <= 0.0) {
    throw std::invalid_argument("initial_capital must be a positive number");
  }
  if (!std::isfinite(settings.commission) || settings.commission < 0.0 ||
      settings.commission >= 1.0) {
    throw std::invalid_argument("commission must be in [0, 1)");
  }
  if (!std::isfinite(settings.sizing_value) || settings.sizing_value < 0.0) {
    throw std::invalid_argument(
        "position sizing value must be a non-negative number");
  }
}

Backtester::Backtester(const SignalGenerator& signals, BacktestSettings settings)
    : signals_(signals), settings_(std::move(settings)) {
  validateSettings(settings_);
}

std::vector<PortfolioState> Backtester::run(const PriceSeries& series) const {
  return replay(series, signals_.generateSignals(series));
}

// -----------------------------------------------------------------------------
// replay
// -----------------------------------------------------------------------------
std::vector<PortfolioState> Backtester::replay(const PriceSeries& series,
                                               const SignalSeries& signals) const {
  if (signals.size() != series.size()) {
    throw std::invalid_argument(
        "signal series has " + std::to_string(signals.size()) +
        " entries but price series has " + std::to_string(series.size()));
  }

  std::vector<PortfolioState> history;
  if (series.empty()) {
    return history;
  }
  history.reserve(series.size());

  const std::vector<PositionChange> changes = positionChanges(signals);

  // Seed row. PositionChange at bar 0 is always 0, so nothing trades here.
  const PriceBar& first = series.at(0);
  PortfolioState seed;
  seed.timestamp = first.timestamp;
  seed.close = first.close;
  seed.signal = signals[0];
  seed.cash = settings_.initial_capital;
  seed.total = settings_.initial_capital;
  if (!std::isfinite(first.close)) {
    std::cerr << "[Backtester] Non-finite close at "
              << to_iso8601(first.timestamp) << "\n";
  }
  history.push_back(seed);

  for (std::size_t t = 1; t < series.size(); ++t) {
    history.push_back(step(history.back(), series.at(t), signals[t], changes[t]));
  }
  return history;
}

// -----------------------------------------------------------------------------
// step: row t from row t-1 and bar t
// -----------------------------------------------------------------------------
PortfolioState Backtester::step(const PortfolioState& prev, const PriceBar& bar,
                                Signal signal, PositionChange change) const {
  PortfolioState next;
  next.timestamp = bar.timestamp;
  next.close = bar.close;
  next.signal = signal;
  next.position_change = change;
  next.position = prev.position;
  next.cash = prev.cash;

  const double price = bar.close;
  if (!std::isfinite(price)) {
    std::cerr << "[Backtester] Non-finite close at " << to_iso8601(bar.timestamp)
              << (change != 0 ? ", order skipped" : "") << "\n";
    next.holdings = kNaN;
    next.total = kNaN;
    next.period_return = kNaN;
    return next;
  }

  if (change != 0) {
    const double shares = computeShares(settings_.sizing_method,
                                        settings_.sizing_value, price, prev.total);
    if (std::isnan(shares)) {
      std::cerr << "[Backtester] Could not size order at "
                << to_iso8601(bar.timestamp) << ", order skipped\n";
    } else if (change > 0) {
      const double cost = shares * price * (1.0 + settings_.commission);
      if (settings_.enforce_cash_floor && cost > prev.cash) {
        std::cerr << "[Backtester] Insufficient cash at "
                  << to_iso8601(bar.timestamp) << ": need " << cost
                  << ", have " << prev.cash << ", buy rejected\n";
        next.order_rejected = true;
      } else {
        next.position += shares;
        next.cash -= cost;
        next.shares_traded = shares;
      }
    } else if (prev.position > 0.0) {
      const double sold = std::min(shares, prev.position);
      next.position -= sold;
      next.cash += sold * price * (1.0 - settings_.commission);
      next.shares_traded = -sold;
    }
  }

  next.holdings = next.position * price;
  next.total = next.holdings + next.cash;
  next.period_return = next.total / prev.total - 1.0;
  return next;
}

}  // namespace stratlab
