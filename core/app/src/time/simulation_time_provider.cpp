#include "gymbridge/time/simulation_time_provider.hpp"

namespace gymbridge {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// sleep_ms(): jump the clock forward instead of blocking
// -----------------------------------------------------------------------------
void SimulationTimeProvider::sleep_ms(std::int64_t duration_ms) {
  sleep_count_.fetch_add(1);
  if (duration_ms <= 0) {
    return;
  }
  current_time_ms_.fetch_add(duration_ms);
  total_slept_ms_.fetch_add(duration_ms);
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

}  // namespace gymbridge
