#include "stratlab/sizing/position_sizer.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace stratlab {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}  // namespace

SizingMethod parseSizingMethod(const std::string& key) {
  if (key == "fixed_dollar") {
    return SizingMethod::FixedDollar;
  }
  if (key == "percentage") {
    return SizingMethod::Percentage;
  }
  if (key == "fixed_risk") {
    return SizingMethod::FixedRisk;
  }
  if (key == "fixed_shares") {
    return SizingMethod::FixedShares;
  }
  throw std::invalid_argument(
      "Unknown position sizing method: '" + key +
      "' (expected fixed_dollar, percentage, fixed_risk or fixed_shares)");
}

std::string sizingMethodKey(SizingMethod method) {
  switch (method) {
    case SizingMethod::FixedDollar:
      return "fixed_dollar";
    case SizingMethod::Percentage:
      return "percentage";
    case SizingMethod::FixedRisk:
      return "fixed_risk";
    case SizingMethod::FixedShares:
      return "fixed_shares";
  }
  return "unknown";
}

double computeShares(SizingMethod method, double value, double price,
                     double prior_total) {
  if (!std::isfinite(value)) {
    return kNaN;
  }
  if (method == SizingMethod::FixedShares) {
    return std::floor(value);
  }
  if (!std::isfinite(price) || price <= 0.0) {
    return kNaN;
  }

  double dollars = 0.0;
  switch (method) {
    case SizingMethod::FixedDollar:
      dollars = value;
      break;
    case SizingMethod::Percentage:
    case SizingMethod::FixedRisk:
      if (!std::isfinite(prior_total)) {
        return kNaN;
      }
      dollars = prior_total * value / 100.0;
      break;
    case SizingMethod::FixedShares:
      break;
  }

  const double shares = std::floor(dollars / price);
  return shares > 0.0 ? shares : 0.0;
}

}  // namespace stratlab
