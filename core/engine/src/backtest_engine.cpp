#include "stratlab/engine/backtest_engine.hpp"

#include "stratlab/analytics/performance_analyzer.hpp"
#include "stratlab/backtest/backtester.hpp"
#include "stratlab/indicators/technical_indicators.hpp"
#include "stratlab/strategy/signal_generator.hpp"
#include "stratlab/time/time_utils.hpp"

#include <iostream>
#include <vector>

namespace stratlab {

BacktestEngine::BacktestEngine(const IIndicatorProvider& indicators)
    : indicators_(indicators) {}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
BacktestRun BacktestEngine::run(const BacktestConfig& config,
                                const domain::PriceSeries& series) const {
  // Both constructors validate and throw before any work is done.
  const SignalGenerator generator(config.strategy, indicators_);
  const Backtester backtester(generator, config.settings);
  const PerformanceAnalyzer analyzer(config.settings.initial_capital);

  BacktestRun result;
  result.history = backtester.run(series);
  result.trades = PerformanceAnalyzer::extractTrades(result.history);
  result.metrics = analyzer.analyze(result.history);

  std::vector<double> equity;
  equity.reserve(result.history.size());
  for (const domain::PortfolioState& row : result.history) {
    equity.push_back(row.total);
  }
  result.drawdown = PerformanceAnalyzer::drawdownSeries(equity);

  if (!series.empty()) {
    const std::vector<double> rsi =
        series.hasColumn(domain::columns::kRsi)
            ? series.column(domain::columns::kRsi)
            : indicators_.rsi(series.closes(), kRecommendationRsiPeriod);
    result.rsi_recommendation = rsiRecommendation(rsi.back());
  }

  BacktestRecord& record = result.record;
  record.name = config.name;
  record.ticker = config.ticker;
  record.strategy_type = strategyKey(config.strategy);
  record.parameters = strategyParametersJson(config.strategy);
  record.results = result.metrics;
  if (!series.empty()) {
    record.start_date = to_iso8601(series.bars().front().timestamp);
    record.end_date = to_iso8601(series.bars().back().timestamp);
  }

  std::cout << "[BacktestEngine] " << config.name << " ("
            << strategyName(config.strategy) << "): " << series.size()
            << " bars, " << result.metrics.total_trades << " orders, "
            << result.trades.size() << " closed trades\n";
  return result;
}

}  // namespace stratlab
