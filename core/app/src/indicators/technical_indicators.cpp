#include "stratlab/indicators/technical_indicators.hpp"

#include <cmath>
#include <cstddef>
#include <limits>

namespace stratlab {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double rsiFromAverages(double avg_gain, double avg_loss) {
  if (avg_loss == 0.0) {
    return avg_gain == 0.0 ? kNaN : 100.0;
  }
  const double rs = avg_gain / avg_loss;
  return 100.0 - 100.0 / (1.0 + rs);
}

}  // namespace

// -----------------------------------------------------------------------------
// sma: trailing simple mean
// -----------------------------------------------------------------------------
std::vector<double> TechnicalIndicators::sma(const std::vector<double>& closes,
                                             int window) const {
  std::vector<double> out(closes.size(), kNaN);
  if (window < 1) {
    return out;
  }
  const auto w = static_cast<std::size_t>(window);

  // Recompute the window sum instead of sliding it: a single NaN would
  // otherwise poison every later value.
  for (std::size_t i = w - 1; i < closes.size(); ++i) {
    double sum = 0.0;
    bool finite = true;
    for (std::size_t j = i + 1 - w; j <= i; ++j) {
      if (!std::isfinite(closes[j])) {
        finite = false;
        break;
      }
      sum += closes[j];
    }
    if (finite) {
      out[i] = sum / static_cast<double>(w);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// ema: SMA-seeded exponential mean over the first finite run of values
// -----------------------------------------------------------------------------
std::vector<double> TechnicalIndicators::ema(const std::vector<double>& values,
                                             int period) const {
  std::vector<double> out(values.size(), kNaN);
  if (period < 1) {
    return out;
  }
  const auto p = static_cast<std::size_t>(period);

  std::size_t start = 0;
  while (start < values.size() && !std::isfinite(values[start])) {
    ++start;
  }
  if (start + p > values.size()) {
    return out;
  }

  double seed = 0.0;
  for (std::size_t i = start; i < start + p; ++i) {
    if (!std::isfinite(values[i])) {
      return out;
    }
    seed += values[i];
  }

  const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
  double prev = seed / static_cast<double>(p);
  out[start + p - 1] = prev;
  for (std::size_t i = start + p; i < values.size(); ++i) {
    if (!std::isfinite(values[i])) {
      break;
    }
    prev = alpha * values[i] + (1.0 - alpha) * prev;
    out[i] = prev;
  }
  return out;
}

// -----------------------------------------------------------------------------
// rsi: Wilder-smoothed relative strength
// -----------------------------------------------------------------------------
std::vector<double> TechnicalIndicators::rsi(const std::vector<double>& closes,
                                             int period) const {
  std::vector<double> out(closes.size(), kNaN);
  if (period < 1 || closes.size() <= static_cast<std::size_t>(period)) {
    return out;
  }
  const auto p = static_cast<std::size_t>(period);
  const double n = static_cast<double>(period);

  double gain_sum = 0.0;
  double loss_sum = 0.0;
  for (std::size_t i = 1; i <= p; ++i) {
    const double change = closes[i] - closes[i - 1];
    if (!std::isfinite(change)) {
      return out;
    }
    if (change > 0.0) {
      gain_sum += change;
    } else {
      loss_sum -= change;
    }
  }

  double avg_gain = gain_sum / n;
  double avg_loss = loss_sum / n;
  out[p] = rsiFromAverages(avg_gain, avg_loss);

  for (std::size_t i = p + 1; i < closes.size(); ++i) {
    const double change = closes[i] - closes[i - 1];
    if (!std::isfinite(change)) {
      break;
    }
    const double gain = change > 0.0 ? change : 0.0;
    const double loss = change < 0.0 ? -change : 0.0;
    avg_gain = (avg_gain * (n - 1.0) + gain) / n;
    avg_loss = (avg_loss * (n - 1.0) + loss) / n;
    out[i] = rsiFromAverages(avg_gain, avg_loss);
  }
  return out;
}

// -----------------------------------------------------------------------------
// macd: fast/slow EMA spread, its signal line and histogram
// -----------------------------------------------------------------------------
IIndicatorProvider::MacdColumns TechnicalIndicators::macd(
    const std::vector<double>& closes, int fast_period, int slow_period,
    int signal_period) const {
  MacdColumns result;
  const std::vector<double> fast = ema(closes, fast_period);
  const std::vector<double> slow = ema(closes, slow_period);

  result.macd.assign(closes.size(), kNaN);
  for (std::size_t i = 0; i < closes.size(); ++i) {
    if (std::isfinite(fast[i]) && std::isfinite(slow[i])) {
      result.macd[i] = fast[i] - slow[i];
    }
  }

  result.signal = ema(result.macd, signal_period);

  result.histogram.assign(closes.size(), kNaN);
  for (std::size_t i = 0; i < closes.size(); ++i) {
    if (std::isfinite(result.macd[i]) && std::isfinite(result.signal[i])) {
      result.histogram[i] = result.macd[i] - result.signal[i];
    }
  }
  return result;
}

std::string rsiRecommendation(double rsi, double rsi_buy, double rsi_sell) {
  if (std::isnan(rsi)) {
    return "UNKNOWN";
  }
  if (rsi < rsi_buy) {
    return "STRONG BUY";
  }
  if (rsi < 45.0) {
    return "BUY";
  }
  if (rsi > rsi_sell) {
    return "STRONG SELL";
  }
  if (rsi > 55.0) {
    return "SELL";
  }
  return "HOLD";
}

}  // namespace stratlab
