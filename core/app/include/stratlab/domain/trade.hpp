#pragma once

#include "stratlab/domain/price_bar.hpp"

namespace stratlab {
namespace domain {

// -----------------------------------------------------------------------------
// Trade
// -----------------------------------------------------------------------------
// Responsibility: A realized entry → exit round trip reconstructed from the
// portfolio history after the run.
//
// Only one trade may be open at a time. A second buy while a trade is open
// does not start a new one, and an open trade at the end of the series is
// not reported.
// -----------------------------------------------------------------------------
struct Trade {
  Timestamp entry_time{};
  double entry_price{0.0};
  Timestamp exit_time{};
  double exit_price{0.0};
  double return_pct{0.0};  // (exit / entry - 1) * 100
  bool profitable{false};  // return_pct > 0
};

}  // namespace domain
}  // namespace stratlab
