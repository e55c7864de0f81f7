#include "stratlab/config/backtest_config.hpp"

#include "stratlab/sizing/position_sizer.hpp"

#include <fstream>
#include <type_traits>

namespace stratlab {

namespace {

// Overwrites `field` with j[key] if the key is present.
template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& field) {
  if (j.contains(key)) {
    field = j.at(key).get<T>();
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parseStrategyConfig()
// -----------------------------------------------------------------------------
StrategyConfig parseStrategyConfig(const nlohmann::json& j) {
  StrategyConfig config;
  try {
    if (!j.is_object()) {
      throw ConfigError("\"strategy\" must be a JSON object");
    }
    // at() throws nlohmann::json::out_of_range if "type" is missing.
    config = makeDefaultStrategy(j.at("type").get<std::string>());

    std::visit(
        [&j](auto& p) {
          using T = std::decay_t<decltype(p)>;
          if constexpr (std::is_same_v<T, MovingAverageCrossParams>) {
            readOptional(j, "short_window", p.short_window);
            readOptional(j, "long_window", p.long_window);
          } else if constexpr (std::is_same_v<T, RsiParams>) {
            readOptional(j, "rsi_period", p.rsi_period);
            readOptional(j, "overbought", p.overbought);
            readOptional(j, "oversold", p.oversold);
          } else if constexpr (std::is_same_v<T, MacdParams>) {
            readOptional(j, "fast_period", p.fast_period);
            readOptional(j, "slow_period", p.slow_period);
            readOptional(j, "signal_period", p.signal_period);
          } else {
            readOptional(j, "short_window", p.short_window);
            readOptional(j, "long_window", p.long_window);
            readOptional(j, "rsi_buy", p.rsi_buy);
            readOptional(j, "rsi_sell", p.rsi_sell);
            readOptional(j, "rsi_period", p.rsi_period);
          }
        },
        config);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid strategy configuration: ") +
                      e.what());
  }

  validateStrategy(config);
  return config;
}

// -----------------------------------------------------------------------------
// parseBacktestConfig()
// -----------------------------------------------------------------------------
BacktestConfig parseBacktestConfig(const nlohmann::json& j) {
  BacktestConfig config;
  try {
    if (!j.is_object()) {
      throw ConfigError("Backtest configuration must be a JSON object");
    }
    readOptional(j, "name", config.name);
    readOptional(j, "ticker", config.ticker);
    readOptional(j, "initial_capital", config.settings.initial_capital);
    readOptional(j, "commission", config.settings.commission);
    readOptional(j, "enforce_cash_floor", config.settings.enforce_cash_floor);

    if (j.contains("position_sizing")) {
      const auto& sizing = j.at("position_sizing");
      if (sizing.contains("method")) {
        config.settings.sizing_method =
            parseSizingMethod(sizing.at("method").get<std::string>());
      }
      readOptional(sizing, "value", config.settings.sizing_value);
    }

    if (!j.contains("strategy")) {
      throw ConfigError("Backtest configuration is missing \"strategy\"");
    }
    config.strategy = parseStrategyConfig(j.at("strategy"));
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid backtest configuration: ") +
                      e.what());
  }

  validateSettings(config.settings);
  return config;
}

BacktestConfig loadBacktestConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    // parse() throws nlohmann::json::parse_error on malformed input.
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("Malformed JSON in " + path + ": " + e.what());
  }
  return parseBacktestConfig(j);
}

nlohmann::json strategyParametersJson(const StrategyConfig& config) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [key, value] : strategyParameters(config)) {
    j[key] = value;
  }
  return j;
}

}  // namespace stratlab
