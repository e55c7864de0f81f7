#pragma once

#include "stratlab/market/i_market_data_source.hpp"

#include <cstddef>
#include <string>

namespace stratlab {

// -----------------------------------------------------------------------------
// CsvMarketDataSource — OHLCV bars from a comma-separated file
// -----------------------------------------------------------------------------
//
// @brief  Reads one instrument's bars from a CSV file with a header row.
//
// @details
// Header names are matched case-insensitively:
//   required  timestamp | date | datetime, open, high, low, close
//   optional  volume (0 when absent)
// Every other column is read as a numeric indicator column and keeps its
// header spelling (so "RSI", "MACD", "Signal" are picked up by strategies).
// An empty or non-numeric indicator cell becomes NaN.
//
// Timestamps: see parse_timestamp() (UTC, date or date-time).
//
// Rows with an unparseable timestamp or OHLC value are skipped with a
// warning on std::cerr. Rows are sorted by time; a repeated timestamp keeps
// the first row and warns.
//
// @throws std::runtime_error from load() if the file cannot be opened, is
//         empty, or lacks a required column.
// -----------------------------------------------------------------------------
class CsvMarketDataSource : public IMarketDataSource {
 public:
  explicit CsvMarketDataSource(std::string path);

  domain::PriceSeries load() override;

  // Rows dropped by the last load().
  std::size_t skippedRows() const { return skipped_rows_; }

 private:
  std::string path_;
  std::size_t skipped_rows_{0};
};

}  // namespace stratlab
