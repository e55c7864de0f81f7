#pragma once

#include "stratlab/domain/price_series.hpp"

#include <utility>

namespace stratlab {

// -----------------------------------------------------------------------------
// IMarketDataSource — market-data collaborator
// -----------------------------------------------------------------------------
//
// @brief  Opaque provider of a time-indexed OHLCV table for one instrument.
//
// @details
// The engine never fetches data itself; whatever sits behind this interface
// (a CSV file, a vendor API, a test fixture) runs before the backtest and
// hands over a complete series.
//
// load() throws std::runtime_error when no series can be produced at all.
// Partial problems (a malformed row) are the implementation's to report.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual domain::PriceSeries load() = 0;
};

// -----------------------------------------------------------------------------
// InMemoryMarketDataSource — returns a prepared series
// -----------------------------------------------------------------------------
// Used by tests and by callers that already hold the data.
// -----------------------------------------------------------------------------
class InMemoryMarketDataSource : public IMarketDataSource {
 public:
  explicit InMemoryMarketDataSource(domain::PriceSeries series)
      : series_(std::move(series)) {}

  domain::PriceSeries load() override { return series_; }

 private:
  domain::PriceSeries series_;
};

}  // namespace stratlab
