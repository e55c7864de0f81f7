#pragma once

#include <map>
#include <string>
#include <variant>

namespace stratlab {

// -----------------------------------------------------------------------------
// Strategy parameter structs
// -----------------------------------------------------------------------------
// One struct per strategy variant. Defaults are the values the dashboard
// pre-fills. Validation happens in validateStrategy(), not in the structs,
// so they stay aggregates.
// -----------------------------------------------------------------------------

// Long when the short trailing mean of close is above the long one.
struct MovingAverageCrossParams {
  int short_window{20};
  int long_window{50};
};

// Long below `oversold`, short-biased above `overbought`, otherwise the
// previous signal is held.
struct RsiParams {
  int rsi_period{14};
  double overbought{70.0};
  double oversold{30.0};
};

// Edge-triggered MACD / signal-line crossover.
struct MacdParams {
  int fast_period{12};
  int slow_period{26};
  int signal_period{9};
};

// Moving-average relationship confirmed by an RSI threshold.
struct MaRsiFilterParams {
  int short_window{20};
  int long_window{50};
  double rsi_buy{30.0};
  double rsi_sell{70.0};
  int rsi_period{14};
};

// -----------------------------------------------------------------------------
// StrategyConfig
// -----------------------------------------------------------------------------
// Responsibility: Closed set of strategy variants, each with its parameters.
//
// Every dispatch site uses std::visit. Unknown strategy keys are rejected
// by makeDefaultStrategy() / parseStrategyConfig(), before any run starts.
// -----------------------------------------------------------------------------
using StrategyConfig = std::variant<MovingAverageCrossParams, RsiParams,
                                    MacdParams, MaRsiFilterParams>;

// Stable key used in configs and saved records:
// "ma_cross" | "rsi" | "macd" | "ma_rsi".
std::string strategyKey(const StrategyConfig& config);

// Human-readable name, e.g. "Moving Average Crossover".
std::string strategyName(const StrategyConfig& config);

// -------------------------------------------------------------------------
// makeDefaultStrategy(key)
// -------------------------------------------------------------------------
// @brief  Returns the variant selected by `key` with default parameters.
// @throws std::invalid_argument for an unknown key.
// -------------------------------------------------------------------------
StrategyConfig makeDefaultStrategy(const std::string& key);

// -------------------------------------------------------------------------
// validateStrategy(config)
// -------------------------------------------------------------------------
// @brief  Rejects parameter sets that cannot produce meaningful signals.
//
// @throws std::invalid_argument when
//   - a window or period is < 1,
//   - short_window >= long_window,
//   - oversold >= overbought (RSI),
//   - rsi_buy >= rsi_sell (MA with RSI filter),
//   - fast_period >= slow_period (MACD).
// -------------------------------------------------------------------------
void validateStrategy(const StrategyConfig& config);

// Flat key → value view of the parameters, for the saved record.
std::map<std::string, double> strategyParameters(const StrategyConfig& config);

}  // namespace stratlab
