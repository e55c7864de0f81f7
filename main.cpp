// -----------------------------------------------------------------------------
// stratlab_cli — command-line entry point.
//
//   stratlab_cli backtest <config.json> <bars.csv>
//       1) Load the BacktestConfig (nlohmann/json).
//       2) Load the bars through CsvMarketDataSource.
//       3) Run BacktestEngine with the built-in TechnicalIndicators.
//       4) Print the BacktestRecord as JSON on stdout, with the last bar's
//          "rsi_recommendation" and the per-bar "drawdown" added.
//
//   stratlab_cli option <S> <K> <T> <r> <sigma> <call|put> [steps] [american]
//       Prints Black-Scholes price + Greeks and the binomial-tree price as
//       JSON. steps defaults to 100; american is "true"/"false" (default
//       false).
//
// Log lines go to stdout/stderr with a [Component] prefix; JSON output is the
// last thing written to stdout. Any std::exception ends the program with a
// message on stderr and exit code 1.
// -----------------------------------------------------------------------------

#include "stratlab/cli/argument_parsing.hpp"
#include "stratlab/config/backtest_config.hpp"
#include "stratlab/engine/backtest_engine.hpp"
#include "stratlab/indicators/technical_indicators.hpp"
#include "stratlab/market/csv_market_data_source.hpp"
#include "stratlab/options/option_pricer.hpp"
#include "stratlab/persistence/backtest_record.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

void printUsage() {
  std::cerr << "usage:\n"
            << "  stratlab_cli backtest <config.json> <bars.csv>\n"
            << "  stratlab_cli option <S> <K> <T> <r> <sigma> <call|put> "
               "[steps] [american]\n";
}

int runBacktest(const std::vector<std::string>& args) {
  if (args.size() != 2) {
    printUsage();
    return 1;
  }
  const stratlab::BacktestConfig config = stratlab::loadBacktestConfig(args[0]);
  stratlab::CsvMarketDataSource source(args[1]);
  const stratlab::domain::PriceSeries series = source.load();

  const stratlab::TechnicalIndicators indicators{};
  const stratlab::BacktestEngine engine(indicators);
  const stratlab::BacktestRun run = engine.run(config, series);

  nlohmann::json out = run.record;
  out["rsi_recommendation"] = run.rsi_recommendation;
  nlohmann::json drawdown = nlohmann::json::array();
  for (double d : run.drawdown) {
    drawdown.push_back(stratlab::jsonNumber(d));
  }
  out["drawdown"] = std::move(drawdown);
  std::cout << out.dump(2) << "\n";
  return 0;
}

int runOption(const std::vector<std::string>& args) {
  if (args.size() < 6 || args.size() > 8) {
    printUsage();
    return 1;
  }
  stratlab::domain::OptionQuote quote;
  quote.spot = stratlab::parseDoubleArgument(args[0], "spot");
  quote.strike = stratlab::parseDoubleArgument(args[1], "strike");
  quote.time_to_expiry =
      stratlab::parseDoubleArgument(args[2], "time to expiry");
  quote.risk_free_rate =
      stratlab::parseDoubleArgument(args[3], "risk-free rate");
  quote.volatility = stratlab::parseDoubleArgument(args[4], "volatility");
  quote.type = stratlab::parseOptionType(args[5]);
  const int steps =
      args.size() > 6 ? stratlab::parseIntArgument(args[6], "steps") : 100;
  const bool american =
      args.size() > 7 && stratlab::parseBoolArgument(args[7], "exercise style");

  const auto greeks = stratlab::blackScholesGreeks(quote);
  const double tree = stratlab::binomialOptionPrice(quote, steps, american);

  using stratlab::jsonNumber;
  nlohmann::json out;
  out["type"] = stratlab::optionTypeKey(quote.type);
  out["black_scholes"] = {
      {"price", jsonNumber(greeks.price)},
      {"delta", jsonNumber(greeks.delta)},
      {"gamma", jsonNumber(greeks.gamma)},
      {"theta", jsonNumber(greeks.theta)},
      {"vega", jsonNumber(greeks.vega)},
      {"rho", jsonNumber(greeks.rho)},
  };
  out["binomial"] = {
      {"steps", steps},
      {"american", american},
      {"price", jsonNumber(tree)},
  };
  out["breakeven"] = jsonNumber(
      stratlab::optionBreakeven(quote.strike, greeks.price, quote.type));
  std::cout << out.dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    printUsage();
    return 1;
  }
  const std::string command = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);

  try {
    if (command == "backtest") {
      return runBacktest(args);
    }
    if (command == "option") {
      return runOption(args);
    }
    std::cerr << "[main] Unknown command: " << command << "\n";
    printUsage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] Error: " << e.what() << "\n";
    return 1;
  }
}
