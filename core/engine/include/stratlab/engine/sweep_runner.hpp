#pragma once

#include "stratlab/config/backtest_config.hpp"
#include "stratlab/domain/price_series.hpp"
#include "stratlab/engine/backtest_engine.hpp"
#include "stratlab/indicators/i_indicator_provider.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stratlab {

// One slot per submitted config, in submission order. Exactly one of `run`
// and `error` is set.
struct SweepResult {
  BacktestConfig config;
  std::optional<BacktestRun> run;
  std::string error;
};

// -----------------------------------------------------------------------------
// SweepRunner
// -----------------------------------------------------------------------------
//
// @brief  Runs many independent backtests over one price series on a fixed
//         pool of worker threads.
//
// @details
// run() fills one result slot per config, starts the workers and joins
// them before returning. Workers claim job indices from a shared JobCursor
// until it runs dry and write only into the claimed job's slot, so the
// slots need no locking.
//
// A job whose config is rejected (std::exception from BacktestEngine::run)
// records the message in SweepResult::error and the other jobs carry on.
//
// Thread layout:
//   caller thread   → fills slots, spawns workers, joins, returns
//   worker 0..N-1   → BacktestEngine::run on a shared const PriceSeries
//
// Ownership:
//   The series is shared read-only through shared_ptr<const PriceSeries>.
//   The indicator provider is held by reference and must be thread-safe.
// -----------------------------------------------------------------------------
class SweepRunner {
 public:
  // workers == 0 picks std::thread::hardware_concurrency() (at least 1).
  SweepRunner(const IIndicatorProvider& indicators, std::size_t workers = 0);

  SweepRunner(const SweepRunner&) = delete;
  SweepRunner& operator=(const SweepRunner&) = delete;

  // Throws std::invalid_argument if `series` is null.
  std::vector<SweepResult> run(
      const std::vector<BacktestConfig>& configs,
      std::shared_ptr<const domain::PriceSeries> series) const;

  std::size_t workers() const { return workers_; }

 private:
  BacktestEngine engine_;
  std::size_t workers_;
};

}  // namespace stratlab
