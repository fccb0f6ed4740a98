#pragma once

#include "gymbridge/time/i_time_provider.hpp"

namespace gymbridge {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Reads std::chrono::system_clock and sleeps the calling thread.
//
// @details
// Used by the executables. Tests inject SimulationTimeProvider instead so the
// data acquisition back-off does not cost real time.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;

  void sleep_ms(std::int64_t duration_ms) override;
};

}  // namespace gymbridge
