#include "stratlab/persistence/backtest_record.hpp"

#include <cmath>

namespace stratlab {

nlohmann::json jsonNumber(double value) {
  if (std::isnan(value)) {
    return nullptr;
  }
  if (std::isinf(value)) {
    return value > 0.0 ? kPositiveInfinity : kNegativeInfinity;
  }
  return value;
}

// -----------------------------------------------------------------------------
// metricsToJson()
// -----------------------------------------------------------------------------
nlohmann::json metricsToJson(const domain::PerformanceMetrics& m) {
  nlohmann::json j;
  j["total_return"] = jsonNumber(m.total_return);
  j["annualized_return"] = jsonNumber(m.annualized_return);
  j["sharpe_ratio"] = jsonNumber(m.sharpe_ratio);
  j["max_drawdown"] = jsonNumber(m.max_drawdown);
  j["final_equity"] = jsonNumber(m.final_equity);
  j["total_trades"] = m.total_trades;
  j["buy_trades"] = m.buy_trades;
  j["sell_trades"] = m.sell_trades;
  j["trade_count"] = m.trade_count;
  j["winning_trades"] = m.winning_trades;
  j["losing_trades"] = m.losing_trades;
  j["win_rate"] = jsonNumber(m.win_rate);
  j["profit_factor"] = jsonNumber(m.profit_factor);
  j["avg_win"] = jsonNumber(m.avg_win);
  j["avg_loss"] = jsonNumber(m.avg_loss);
  return j;
}

void to_json(nlohmann::json& j, const BacktestRecord& record) {
  j = nlohmann::json{
      {"name", record.name},
      {"ticker", record.ticker},
      {"start_date", record.start_date},
      {"end_date", record.end_date},
      {"strategy_type", record.strategy_type},
      {"parameters", record.parameters},
      {"results", metricsToJson(record.results)},
  };
}

}  // namespace stratlab
