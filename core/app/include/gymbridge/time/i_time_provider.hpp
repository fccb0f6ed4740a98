#pragma once

#include <cstdint>

namespace gymbridge {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract clock used for elapsed time and back-off waits
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "what time is it" and "wait
//         this long" away from std::chrono and std::this_thread.
//
// @details
// Two places in the server care about wall-clock time:
//   - DataAcquisition sleeps a jittered interval between "dataset not ready"
//     polls and accumulates the total wait against a fixed budget.
//   - EpisodeRunner measures how long an episode took.
//
// Both receive an ITimeProvider by reference:
//   - LiveTimeProvider       → system_clock + std::this_thread::sleep_for.
//   - SimulationTimeProvider → a manual clock; sleep_ms() advances it
//                              instantly, so a 300 s back-off budget can be
//                              exhausted in a unit test without waiting.
//
// Thread-safety contract:
//   now_ms() must be safe for concurrent reads. sleep_ms() is called from the
//   session thread only.
//
// Ownership:
//   Components hold a reference; they do NOT own the provider.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Milliseconds since the Unix epoch (live) or since the manual
  //         clock's origin (simulation).
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;

  // -------------------------------------------------------------------------
  // sleep_ms(duration_ms)
  // -------------------------------------------------------------------------
  // @brief  Blocks the caller for duration_ms (live) or advances the clock by
  //         duration_ms (simulation). Non-positive durations return at once.
  // -------------------------------------------------------------------------
  virtual void sleep_ms(std::int64_t duration_ms) = 0;
};

}  // namespace gymbridge
