#pragma once

#include "stratlab/backtest/backtester.hpp"
#include "stratlab/strategy/strategy_config.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace stratlab {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown when a configuration document cannot be read or does not have the
// expected shape (unreadable file, malformed JSON, missing "strategy" or
// "strategy.type", wrong value types).
//
// Well-formed documents with out-of-range values (short_window >= long_window,
// unknown sizing method or strategy type) raise std::invalid_argument from
// the component that owns the rule.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// BacktestConfig — everything needed to run one backtest
// -----------------------------------------------------------------------------
struct BacktestConfig {
  std::string name{"Backtest"};
  std::string ticker;
  BacktestSettings settings;
  StrategyConfig strategy{MovingAverageCrossParams{}};
};

// -------------------------------------------------------------------------
// parseStrategyConfig(j)
// -------------------------------------------------------------------------
// @brief  Reads a {"type": "...", <params>} object. Parameters not present
//         keep their defaults; keys that do not apply to the type are
//         ignored.
//
// @throws ConfigError            missing "type" or a value of the wrong type
// @throws std::invalid_argument  unknown type or invalid parameters
// -------------------------------------------------------------------------
StrategyConfig parseStrategyConfig(const nlohmann::json& j);

// -------------------------------------------------------------------------
// parseBacktestConfig(j)
// -------------------------------------------------------------------------
// @brief  Reads a full backtest document:
//
//   {
//     "name": "MA test",               (optional, default "Backtest")
//     "ticker": "AAPL",                (optional)
//     "initial_capital": 100000,       (optional)
//     "commission": 0.001,             (optional)
//     "enforce_cash_floor": false,     (optional)
//     "position_sizing": {             (optional)
//       "method": "fixed_dollar",
//       "value": 10000
//     },
//     "strategy": { "type": "ma_cross", "short_window": 20, ... }
//   }
//
// @throws ConfigError, std::invalid_argument (see parseStrategyConfig).
// -------------------------------------------------------------------------
BacktestConfig parseBacktestConfig(const nlohmann::json& j);

// Reads and parses a JSON file. Throws ConfigError if it cannot be opened
// or parsed.
BacktestConfig loadBacktestConfig(const std::string& path);

// The parameters of `config` as a JSON object, for saved records.
nlohmann::json strategyParametersJson(const StrategyConfig& config);

}  // namespace stratlab
