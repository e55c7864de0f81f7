#pragma once

#include <string>

namespace stratlab {
namespace domain {

enum class OptionType {
  Call,
  Put,
};

// -----------------------------------------------------------------------------
// OptionQuote
// -----------------------------------------------------------------------------
// Pricing inputs for a single contract. Volatility is usually the implied
// volatility quoted for the contract by an external chain provider.
// -----------------------------------------------------------------------------
struct OptionQuote {
  double spot{0.0};            // S
  double strike{0.0};          // K
  double time_to_expiry{0.0};  // T, in years
  double risk_free_rate{0.0};  // r, annual, decimal
  double volatility{0.0};      // sigma, annual, decimal
  OptionType type{OptionType::Call};
};

// -----------------------------------------------------------------------------
// OptionGreeks
// -----------------------------------------------------------------------------
// Black-Scholes price and sensitivities. theta is per calendar day, vega
// and rho are per 1% move. All six fields are NaN for degenerate inputs.
// -----------------------------------------------------------------------------
struct OptionGreeks {
  double delta{0.0};
  double gamma{0.0};
  double theta{0.0};
  double vega{0.0};
  double rho{0.0};
  double price{0.0};
};

// One row of an option chain as delivered by the chain provider. A missing
// implied volatility is stored as NaN.
struct OptionChainRow {
  std::string contract_symbol;
  double strike{0.0};
  double implied_volatility{0.0};
};

struct OptionChainGreeks {
  OptionChainRow row;
  OptionGreeks greeks;
};

// Profit/loss of one long option position at expiry, for one underlying price.
struct PayoffPoint {
  double underlying_price{0.0};
  double payoff_per_share{0.0};
  double total_payoff{0.0};  // payoff_per_share * contract_size
};

}  // namespace domain
}  // namespace stratlab
