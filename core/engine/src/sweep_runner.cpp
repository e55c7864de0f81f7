#include "stratlab/engine/sweep_runner.hpp"

#include "stratlab/concurrent/job_cursor.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace stratlab {

SweepRunner::SweepRunner(const IIndicatorProvider& indicators,
                         std::size_t workers)
    : engine_(indicators), workers_(workers) {
  if (workers_ == 0) {
    workers_ = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
std::vector<SweepResult> SweepRunner::run(
    const std::vector<BacktestConfig>& configs,
    std::shared_ptr<const domain::PriceSeries> series) const {
  if (!series) {
    throw std::invalid_argument("SweepRunner::run: price series is null");
  }

  std::vector<SweepResult> results(configs.size());
  for (std::size_t i = 0; i < configs.size(); ++i) {
    results[i].config = configs[i];
  }
  JobCursor jobs(configs.size());

  const std::size_t thread_count = std::min(workers_, configs.size());
  std::cout << "[SweepRunner] " << configs.size() << " jobs on "
            << thread_count << " workers\n";

  auto worker = [this, &jobs, &results, &series] {
    while (auto index = jobs.next()) {
      SweepResult& slot = results[*index];
      try {
        slot.run = engine_.run(slot.config, *series);
      } catch (const std::exception& e) {
        slot.error = e.what();
        std::cerr << "[SweepRunner] Job " << *index << " (" << slot.config.name
                  << ") failed: " << e.what() << "\n";
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (std::size_t t = 0; t < thread_count; ++t) {
    threads.emplace_back(worker);
  }
  for (auto& th : threads) {
    th.join();
  }
  return results;
}

}  // namespace stratlab
