#include "stratlab/analytics/performance_analyzer.hpp"

#include "stratlab/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace stratlab {

using domain::PerformanceMetrics;
using domain::PortfolioState;
using domain::Trade;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kTradingDaysPerYear = 252.0;
constexpr double kCalendarDaysPerYear = 365.0;

double mean(const std::vector<double>& values) {
  double sum = 0.0;
  for (double v : values) {
    sum += v;
  }
  return sum / static_cast<double>(values.size());
}

}  // namespace

PerformanceAnalyzer::PerformanceAnalyzer(double initial_capital)
    : initial_capital_(initial_capital) {}

// -----------------------------------------------------------------------------
// analyze
// -----------------------------------------------------------------------------
PerformanceMetrics PerformanceAnalyzer::analyze(
    const std::vector<PortfolioState>& history) const {
  PerformanceMetrics m;
  if (history.empty()) {
    m.total_return = kNaN;
    m.annualized_return = kNaN;
    m.sharpe_ratio = kNaN;
    m.max_drawdown = kNaN;
    m.final_equity = kNaN;
    m.win_rate = kNaN;
    m.profit_factor = kNaN;
    m.avg_win = kNaN;
    m.avg_loss = kNaN;
    return m;
  }

  std::vector<double> returns;
  returns.reserve(history.size());
  for (const PortfolioState& row : history) {
    returns.push_back(row.period_return);
    if (!std::isfinite(row.close)) {
      continue;
    }
    if (row.position_change > 0 && !row.order_rejected) {
      ++m.buy_trades;
    } else if (row.position_change < 0) {
      ++m.sell_trades;
    }
  }
  m.total_trades = m.buy_trades + m.sell_trades;

  m.final_equity = history.back().total;
  m.total_return = (m.final_equity / initial_capital_ - 1.0) * 100.0;
  m.annualized_return = annualizedReturn(
      m.total_return,
      calendar_days_between(history.front().timestamp, history.back().timestamp));
  m.sharpe_ratio = sharpeRatio(returns);
  m.max_drawdown = maxDrawdown(returns);

  const std::vector<Trade> trades = extractTrades(history);
  m.trade_count = trades.size();

  double win_sum = 0.0;
  double loss_sum = 0.0;
  for (const Trade& trade : trades) {
    if (trade.profitable) {
      ++m.winning_trades;
      win_sum += trade.return_pct;
    } else {
      ++m.losing_trades;
      loss_sum += trade.return_pct;
    }
  }
  m.avg_win = m.winning_trades > 0
                  ? win_sum / static_cast<double>(m.winning_trades)
                  : 0.0;
  m.avg_loss = m.losing_trades > 0
                   ? loss_sum / static_cast<double>(m.losing_trades)
                   : 0.0;

  if (trades.empty()) {
    m.win_rate = 0.0;
    m.profit_factor = kNaN;
  } else {
    m.win_rate = static_cast<double>(m.winning_trades) /
                 static_cast<double>(m.trade_count) * 100.0;
    if (m.losing_trades == 0 || m.avg_loss == 0.0) {
      m.profit_factor = kInf;
    } else {
      m.profit_factor =
          std::fabs(m.avg_win * static_cast<double>(m.winning_trades) /
                    (m.avg_loss * static_cast<double>(m.losing_trades)));
    }
  }
  return m;
}

std::vector<Trade> PerformanceAnalyzer::extractTrades(
    const std::vector<PortfolioState>& history) {
  std::vector<Trade> trades;
  bool in_trade = false;
  Trade open;
  for (const PortfolioState& row : history) {
    // The Backtester places no order on a non-finite close.
    if (!std::isfinite(row.close)) {
      continue;
    }
    if (row.position_change > 0 && !row.order_rejected && !in_trade) {
      open = Trade{};
      open.entry_time = row.timestamp;
      open.entry_price = row.close;
      in_trade = true;
    } else if (row.position_change < 0 && in_trade) {
      open.exit_time = row.timestamp;
      open.exit_price = row.close;
      open.return_pct = (open.exit_price / open.entry_price - 1.0) * 100.0;
      open.profitable = open.return_pct > 0.0;
      trades.push_back(open);
      in_trade = false;
    }
  }
  return trades;
}

double PerformanceAnalyzer::sharpeRatio(const std::vector<double>& returns) {
  std::vector<double> finite;
  finite.reserve(returns.size());
  for (double r : returns) {
    if (std::isfinite(r)) {
      finite.push_back(r);
    }
  }
  if (finite.size() < 2) {
    return kNaN;
  }

  const double mu = mean(finite);
  double sq = 0.0;
  for (double r : finite) {
    sq += (r - mu) * (r - mu);
  }
  const double stdev = std::sqrt(sq / static_cast<double>(finite.size() - 1));
  if (stdev == 0.0) {
    return kNaN;
  }
  return std::sqrt(kTradingDaysPerYear) * mu / stdev;
}

double PerformanceAnalyzer::maxDrawdown(const std::vector<double>& returns) {
  if (returns.empty()) {
    return kNaN;
  }
  double cumulative = 1.0;
  double peak = 1.0;
  double worst = 0.0;
  for (double r : returns) {
    if (std::isfinite(r)) {
      cumulative *= 1.0 + r;
    }
    peak = std::max(peak, cumulative);
    worst = std::min(worst, cumulative / peak - 1.0);
  }
  return worst * 100.0;
}

std::vector<double> PerformanceAnalyzer::drawdownSeries(
    const std::vector<double>& equity) {
  std::vector<double> out(equity.size(), kNaN);
  double peak = -kInf;
  for (std::size_t i = 0; i < equity.size(); ++i) {
    if (!std::isfinite(equity[i])) {
      continue;
    }
    peak = std::max(peak, equity[i]);
    out[i] = equity[i] / peak - 1.0;
  }
  return out;
}

double PerformanceAnalyzer::annualizedReturn(double total_return_pct,
                                             std::int64_t calendar_days) {
  if (calendar_days == 0) {
    return 0.0;
  }
  const double growth = 1.0 + total_return_pct / 100.0;
  return (std::pow(growth, kCalendarDaysPerYear /
                               static_cast<double>(calendar_days)) -
          1.0) *
         100.0;
}

}  // namespace stratlab
