#include "stratlab/strategy/strategy_config.hpp"

#include <stdexcept>
#include <type_traits>

namespace stratlab {

namespace {

// Helper for std::visit over a fixed set of lambdas.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void requirePositive(int value, const char* what) {
  if (value < 1) {
    throw std::invalid_argument(std::string(what) + " must be >= 1, got " +
                                std::to_string(value));
  }
}

void requireWindows(int short_window, int long_window) {
  requirePositive(short_window, "short_window");
  requirePositive(long_window, "long_window");
  if (short_window >= long_window) {
    throw std::invalid_argument("short_window (" + std::to_string(short_window) +
                                ") must be less than long_window (" +
                                std::to_string(long_window) + ")");
  }
}

}  // namespace

std::string strategyKey(const StrategyConfig& config) {
  return std::visit(
      Overloaded{
          [](const MovingAverageCrossParams&) { return std::string("ma_cross"); },
          [](const RsiParams&) { return std::string("rsi"); },
          [](const MacdParams&) { return std::string("macd"); },
          [](const MaRsiFilterParams&) { return std::string("ma_rsi"); },
      },
      config);
}

std::string strategyName(const StrategyConfig& config) {
  return std::visit(
      Overloaded{
          [](const MovingAverageCrossParams&) {
            return std::string("Moving Average Crossover");
          },
          [](const RsiParams&) { return std::string("RSI Strategy"); },
          [](const MacdParams&) { return std::string("MACD Strategy"); },
          [](const MaRsiFilterParams&) {
            return std::string("MA with RSI Filter");
          },
      },
      config);
}

StrategyConfig makeDefaultStrategy(const std::string& key) {
  if (key == "ma_cross") {
    return MovingAverageCrossParams{};
  }
  if (key == "rsi") {
    return RsiParams{};
  }
  if (key == "macd") {
    return MacdParams{};
  }
  if (key == "ma_rsi") {
    return MaRsiFilterParams{};
  }
  throw std::invalid_argument("Unknown strategy type: '" + key +
                              "' (expected ma_cross, rsi, macd or ma_rsi)");
}

// -----------------------------------------------------------------------------
// validateStrategy
// -----------------------------------------------------------------------------
void validateStrategy(const StrategyConfig& config) {
  std::visit(
      Overloaded{
          [](const MovingAverageCrossParams& p) {
            requireWindows(p.short_window, p.long_window);
          },
          [](const RsiParams& p) {
            requirePositive(p.rsi_period, "rsi_period");
            if (!(p.oversold < p.overbought)) {
              throw std::invalid_argument(
                  "RSI oversold level must be below overbought level");
            }
          },
          [](const MacdParams& p) {
            requirePositive(p.fast_period, "fast_period");
            requirePositive(p.slow_period, "slow_period");
            requirePositive(p.signal_period, "signal_period");
            if (p.fast_period >= p.slow_period) {
              throw std::invalid_argument(
                  "MACD fast_period must be less than slow_period");
            }
          },
          [](const MaRsiFilterParams& p) {
            requireWindows(p.short_window, p.long_window);
            requirePositive(p.rsi_period, "rsi_period");
            if (!(p.rsi_buy < p.rsi_sell)) {
              throw std::invalid_argument(
                  "RSI buy level must be below RSI sell level");
            }
          },
      },
      config);
}

std::map<std::string, double> strategyParameters(const StrategyConfig& config) {
  return std::visit(
      Overloaded{
          [](const MovingAverageCrossParams& p) {
            return std::map<std::string, double>{
                {"short_window", p.short_window},
                {"long_window", p.long_window}};
          },
          [](const RsiParams& p) {
            return std::map<std::string, double>{
                {"rsi_period", p.rsi_period},
                {"overbought", p.overbought},
                {"oversold", p.oversold}};
          },
          [](const MacdParams& p) {
            return std::map<std::string, double>{
                {"fast_period", p.fast_period},
                {"slow_period", p.slow_period},
                {"signal_period", p.signal_period}};
          },
          [](const MaRsiFilterParams& p) {
            return std::map<std::string, double>{
                {"short_window", p.short_window},
                {"long_window", p.long_window},
                {"rsi_buy", p.rsi_buy},
                {"rsi_sell", p.rsi_sell},
                {"rsi_period", p.rsi_period}};
          },
      },
      config);
}

}  // namespace stratlab
