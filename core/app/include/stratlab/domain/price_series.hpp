#pragma once

#include "stratlab/domain/price_bar.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace stratlab {
namespace domain {

// -----------------------------------------------------------------------------
// Well-known indicator column names
// -----------------------------------------------------------------------------
// Market data may arrive pre-annotated with these columns. Strategies look
// them up by name before falling back to the indicator collaborator.
// -----------------------------------------------------------------------------
namespace columns {
inline constexpr const char* kRsi = "RSI";
inline constexpr const char* kMacd = "MACD";
inline constexpr const char* kMacdSignal = "Signal";
}  // namespace columns

// -----------------------------------------------------------------------------
// PriceSeries — ordered bars plus optional indicator columns
// -----------------------------------------------------------------------------
//
// @brief  Time-ordered OHLCV table, one entry per period, with zero or more
//         named numeric columns aligned to the bars.
//
// @details
// Construction validates that timestamps are strictly increasing; an
// out-of-order or duplicated timestamp is a malformed input and throws
// std::invalid_argument. Indicator columns must have exactly size() values
// (NaN where the indicator is undefined, e.g. during a lookback window).
//
// Once built and handed to the engine the series is treated as read-only.
// Several backtests may share one series across threads as long as nobody
// calls setColumn() concurrently.
// -----------------------------------------------------------------------------
class PriceSeries {
 public:
  PriceSeries() = default;

  // Throws std::invalid_argument if timestamps are not strictly increasing.
  explicit PriceSeries(std::vector<PriceBar> bars);

  const std::vector<PriceBar>& bars() const { return bars_; }
  std::size_t size() const { return bars_.size(); }
  bool empty() const { return bars_.empty(); }

  // Bounds-checked; throws std::out_of_range.
  const PriceBar& at(std::size_t i) const { return bars_.at(i); }

  // Close prices as a plain vector, the input to every indicator.
  std::vector<double> closes() const;

  // -------------------------------------------------------------------------
  // setColumn(name, values)
  // -------------------------------------------------------------------------
  // @brief  Adds or replaces an indicator column.
  //
  // @param  name    Column name, case-sensitive (see columns::k*).
  // @param  values  One value per bar.
  //
  // @throws std::invalid_argument if values.size() != size().
  // -------------------------------------------------------------------------
  void setColumn(const std::string& name, std::vector<double> values);

  bool hasColumn(const std::string& name) const;

  // Throws std::out_of_range if the column does not exist.
  const std::vector<double>& column(const std::string& name) const;

  std::vector<std::string> columnNames() const;

 private:
  std::vector<PriceBar> bars_;
  std::map<std::string, std::vector<double>> columns_;
};

}  // namespace domain
}  // namespace stratlab
