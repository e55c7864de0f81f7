#pragma once

#include <chrono>

namespace stratlab {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Bar time. Timezone-naive input is interpreted as UTC when parsed, so two
// timestamps can always be subtracted to get a calendar span.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

namespace domain {

// -----------------------------------------------------------------------------
// PriceBar
// -----------------------------------------------------------------------------
// Responsibility: One OHLCV-aggregated period of market data.
//
// Plain value type. Indicator values are not stored on the bar; they live in
// named columns on the owning PriceSeries so a strategy can ask whether a
// column exists at all, not just whether one bar has it.
// -----------------------------------------------------------------------------
struct PriceBar {
  Timestamp timestamp{};  // Start of the period
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};      // Fill price for every simulated order on this bar
  double volume{0.0};
};

}  // namespace domain
}  // namespace stratlab
