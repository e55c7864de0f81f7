#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

namespace stratlab {

// -----------------------------------------------------------------------------
// JobCursor — hands out job indices 0..count-1 to competing workers
// -----------------------------------------------------------------------------
//
// @brief  Each call to next() claims the lowest index nobody has claimed yet,
//         or returns std::nullopt once all `count` indices are gone.
//
// @details
// A single std::atomic<std::size_t> advanced with fetch_add. Every index is
// returned exactly once across all threads. Once the cursor has run past
// `count` it keeps returning nullopt. memory_order_relaxed is enough: the
// index is the only thing being agreed on, and the job data it refers to
// was written before the workers were started.
//
// Thread model:
//   next() may be called concurrently from any number of threads.
//
// Ownership:
//   Lives on the stack of SweepRunner::run() and is shared by reference
//   with the workers it joins before returning.
// -----------------------------------------------------------------------------
class JobCursor {
 public:
  explicit JobCursor(std::size_t count) : count_(count) {}

  JobCursor(const JobCursor&) = delete;
  JobCursor& operator=(const JobCursor&) = delete;
  JobCursor(JobCursor&&) = delete;
  JobCursor& operator=(JobCursor&&) = delete;

  std::optional<std::size_t> next() {
    const std::size_t index = next_.fetch_add(1, std::memory_order_relaxed);
    if (index >= count_) {
      return std::nullopt;
    }
    return index;
  }

  std::size_t count() const { return count_; }

 private:
  const std::size_t count_;
  std::atomic<std::size_t> next_{0};
};

}  // namespace stratlab
