#include "stratlab/options/option_pricer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace stratlab {

using domain::OptionChainGreeks;
using domain::OptionChainRow;
using domain::OptionGreeks;
using domain::OptionQuote;
using domain::OptionType;
using domain::PayoffPoint;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kPi = 3.14159265358979323846;

bool degenerate(const OptionQuote& q) {
  if (!std::isfinite(q.spot) || !std::isfinite(q.strike) ||
      !std::isfinite(q.time_to_expiry) || !std::isfinite(q.volatility) ||
      !std::isfinite(q.risk_free_rate)) {
    return true;
  }
  return q.time_to_expiry <= 0.0 || q.volatility <= 0.0 || q.spot <= 0.0 ||
         q.strike <= 0.0;
}

OptionGreeks allNaN() {
  return OptionGreeks{kNaN, kNaN, kNaN, kNaN, kNaN, kNaN};
}

double intrinsic(OptionType type, double spot, double strike) {
  return type == OptionType::Call ? std::max(spot - strike, 0.0)
                                  : std::max(strike - spot, 0.0);
}

}  // namespace

OptionType parseOptionType(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "call") {
    return OptionType::Call;
  }
  if (lower == "put") {
    return OptionType::Put;
  }
  throw std::invalid_argument("Unknown option type: '" + text +
                              "' (expected call or put)");
}

std::string optionTypeKey(OptionType type) {
  return type == OptionType::Call ? "call" : "put";
}

double normalCdf(double x) { return 0.5 * std::erfc(-x / std::sqrt(2.0)); }

double normalPdf(double x) {
  return std::exp(-0.5 * x * x) / std::sqrt(2.0 * kPi);
}

// -----------------------------------------------------------------------------
// blackScholesGreeks
// -----------------------------------------------------------------------------
OptionGreeks blackScholesGreeks(const OptionQuote& q) {
  if (degenerate(q)) {
    return allNaN();
  }

  const double S = q.spot;
  const double K = q.strike;
  const double T = q.time_to_expiry;
  const double r = q.risk_free_rate;
  const double sigma = q.volatility;

  const double sqrt_t = std::sqrt(T);
  const double d1 = (std::log(S / K) + (r + 0.5 * sigma * sigma) * T) /
                    (sigma * sqrt_t);
  const double d2 = d1 - sigma * sqrt_t;
  const double discount = std::exp(-r * T);
  const double pdf_d1 = normalPdf(d1);

  OptionGreeks g;
  g.gamma = pdf_d1 / (S * sigma * sqrt_t);
  g.vega = S * pdf_d1 * sqrt_t / 100.0;

  const double decay = -S * pdf_d1 * sigma / (2.0 * sqrt_t);
  if (q.type == OptionType::Call) {
    g.delta = normalCdf(d1);
    g.price = S * normalCdf(d1) - K * discount * normalCdf(d2);
    g.theta = (decay - r * K * discount * normalCdf(d2)) / 365.0;
    g.rho = K * T * discount * normalCdf(d2) / 100.0;
  } else {
    g.delta = -normalCdf(-d1);
    g.price = K * discount * normalCdf(-d2) - S * normalCdf(-d1);
    g.theta = (decay + r * K * discount * normalCdf(-d2)) / 365.0;
    g.rho = -K * T * discount * normalCdf(-d2) / 100.0;
  }
  return g;
}

// -----------------------------------------------------------------------------
// binomialOptionPrice
// -----------------------------------------------------------------------------
double binomialOptionPrice(const OptionQuote& q, int steps, bool american) {
  if (degenerate(q) || steps < 1) {
    return kNaN;
  }

  const double dt = q.time_to_expiry / static_cast<double>(steps);
  const double u = std::exp(q.volatility * std::sqrt(dt));
  const double d = 1.0 / u;
  const double growth = std::exp(q.risk_free_rate * dt);
  const double p = (growth - d) / (u - d);
  const double discount = 1.0 / growth;

  // values[j] holds the node with j up-moves at the current level.
  const auto n = static_cast<std::size_t>(steps);
  std::vector<double> values(n + 1);
  for (std::size_t j = 0; j <= n; ++j) {
    const double spot = q.spot * std::pow(u, static_cast<double>(j)) *
                        std::pow(d, static_cast<double>(n - j));
    values[j] = intrinsic(q.type, spot, q.strike);
  }

  for (std::size_t level = n; level-- > 0;) {
    for (std::size_t j = 0; j <= level; ++j) {
      const double continuation =
          discount * (p * values[j + 1] + (1.0 - p) * values[j]);
      if (american) {
        const double spot = q.spot * std::pow(u, static_cast<double>(j)) *
                            std::pow(d, static_cast<double>(level - j));
        values[j] = std::max(continuation, intrinsic(q.type, spot, q.strike));
      } else {
        values[j] = continuation;
      }
    }
  }
  return values[0];
}

std::vector<PayoffPoint> optionProfitLoss(double spot, double strike,
                                          double premium, OptionType type,
                                          double contract_size, int points) {
  if (points < 2) {
    throw std::invalid_argument("optionProfitLoss needs at least 2 points");
  }
  const double low = 0.7 * spot;
  const double high = 1.3 * spot;
  const double step = (high - low) / static_cast<double>(points - 1);

  std::vector<PayoffPoint> curve;
  curve.reserve(static_cast<std::size_t>(points));
  for (int i = 0; i < points; ++i) {
    PayoffPoint point;
    point.underlying_price = low + step * static_cast<double>(i);
    point.payoff_per_share =
        intrinsic(type, point.underlying_price, strike) - premium;
    point.total_payoff = point.payoff_per_share * contract_size;
    curve.push_back(point);
  }
  return curve;
}

double optionBreakeven(double strike, double premium, OptionType type) {
  return type == OptionType::Call ? strike + premium : strike - premium;
}

std::vector<OptionChainGreeks> priceOptionChain(
    double spot, double time_to_expiry, double risk_free_rate, OptionType type,
    const std::vector<OptionChainRow>& rows) {
  std::vector<OptionChainGreeks> out;
  out.reserve(rows.size());
  for (const OptionChainRow& row : rows) {
    OptionQuote quote{spot, row.strike, time_to_expiry, risk_free_rate,
                      row.implied_volatility, type};
    out.push_back(OptionChainGreeks{row, blackScholesGreeks(quote)});
  }
  return out;
}

}  // namespace stratlab
