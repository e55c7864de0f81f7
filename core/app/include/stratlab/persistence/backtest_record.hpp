#pragma once

#include "stratlab/domain/performance_metrics.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace stratlab {

// -----------------------------------------------------------------------------
// BacktestRecord — result handed to the persistence collaborator
// -----------------------------------------------------------------------------
//
// @brief  Serialisable summary of one backtest.
//
// @details
// JSON shape:
//   {
//     "name": "...", "ticker": "...",
//     "start_date": "YYYY-MM-DDTHH:MM:SS", "end_date": "...",
//     "strategy_type": "ma_cross" | "rsi" | "macd" | "ma_rsi",
//     "parameters": { "<key>": <number>, ... },
//     "results": { "total_return": ..., ..., "avg_loss": ... }
//   }
// JSON has no NaN or infinity. An undefined metric (NaN, e.g. Sharpe with
// zero variance, or profit factor with no trades) is written as null; an
// infinite one (profit factor with no losing trades) as the string "inf"
// ("-inf" if negative), so the two cases stay distinguishable.
// -----------------------------------------------------------------------------
struct BacktestRecord {
  std::string name;
  std::string ticker;
  std::string start_date;  // ISO-8601; empty for an empty series
  std::string end_date;
  std::string strategy_type;
  nlohmann::json parameters = nlohmann::json::object();
  domain::PerformanceMetrics results;
};

inline constexpr const char* kPositiveInfinity = "inf";
inline constexpr const char* kNegativeInfinity = "-inf";

// A finite double as a number, NaN as null, +/-infinity as "inf" / "-inf".
nlohmann::json jsonNumber(double value);

nlohmann::json metricsToJson(const domain::PerformanceMetrics& metrics);

// Found by nlohmann::json through ADL: `nlohmann::json j = record;`
void to_json(nlohmann::json& j, const BacktestRecord& record);

}  // namespace stratlab
