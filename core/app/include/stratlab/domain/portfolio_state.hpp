#pragma once

#include "stratlab/domain/price_bar.hpp"
#include "stratlab/domain/signal.hpp"

namespace stratlab {
namespace domain {

// -----------------------------------------------------------------------------
// PortfolioState — one row of the portfolio history
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of the simulated account at the close of one bar.
//
// @details
// The Backtester appends exactly one PortfolioState per input bar and never
// touches it again. Row t is computed only from row t-1 and bar t.
//
// Invariants (for finite closes):
//   total == holdings + cash
//   position >= 0                (long-only)
//
// cash is NOT floored at zero unless the cash-floor option is enabled:
// percentage sizing can buy more than the account holds.
//
// A non-finite close makes holdings, total and period_return NaN on that
// row. That is how missing data is surfaced to the caller.
// -----------------------------------------------------------------------------
struct PortfolioState {
  Timestamp timestamp{};
  double close{0.0};
  Signal signal{Signal::Flat};
  PositionChange position_change{0};
  double shares_traded{0.0};  // Signed: +bought, -sold, 0 = no fill
  double position{0.0};       // Shares held after this bar's order
  double cash{0.0};
  double holdings{0.0};       // position * close
  double total{0.0};          // holdings + cash
  double period_return{0.0};  // total / previous total - 1
  bool order_rejected{false}; // Buy skipped by the cash floor
};

}  // namespace domain
}  // namespace stratlab
