#pragma once

#include <vector>

namespace stratlab {
namespace domain {

// -----------------------------------------------------------------------------
// Signal
// -----------------------------------------------------------------------------
// Responsibility: Directional indication a strategy attaches to each bar.
//
// The underlying integer values are part of the contract: the backtester
// trades on the first difference of the signal series (PositionChange), so
// Buy - Sell == 2 and Flat - Buy == -1 must hold.
// -----------------------------------------------------------------------------
enum class Signal : int {
  Sell = -1,
  Flat = 0,
  Buy = 1,
};

using SignalSeries = std::vector<Signal>;

// -----------------------------------------------------------------------------
// PositionChange
// -----------------------------------------------------------------------------
// Difference between consecutive signals, in [-2, 2]. Positive → buy,
// negative → sell, zero → no order. Bar 0 always carries 0.
// -----------------------------------------------------------------------------
using PositionChange = int;

inline int toInt(Signal signal) { return static_cast<int>(signal); }

}  // namespace domain
}  // namespace stratlab
