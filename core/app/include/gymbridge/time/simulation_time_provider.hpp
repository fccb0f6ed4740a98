#pragma once

#include "gymbridge/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace gymbridge {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" only moves when advance_time()
//         or sleep_ms() is called.
//
// @details
// sleep_ms() does not block: it adds the requested duration to the clock and
// to a running total (total_slept_ms()). Tests use the total to check that
// the data acquisition loop waited at least as long as its back-off schedule
// claims, and that it gave up only after the wait budget was spent.
//
// Internal storage:
//   std::atomic<int64_t> for both counters, so a test thread may read them
//   while the session thread is sleeping.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  std::int64_t now_ms() const override;

  void sleep_ms(std::int64_t duration_ms) override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to new_time_ms. Monotonicity is the caller's
  //         responsibility.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  std::int64_t total_slept_ms() const { return total_slept_ms_.load(); }
  int sleep_count() const { return sleep_count_.load(); }

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
  std::atomic<std::int64_t> total_slept_ms_{0};
  std::atomic<int> sleep_count_{0};
};

}  // namespace gymbridge
