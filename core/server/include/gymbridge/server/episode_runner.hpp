#pragma once

#include "gymbridge/data/data_acquisition.hpp"
#include "gymbridge/data/data_sample.hpp"
#include "gymbridge/log/logger.hpp"
#include "gymbridge/network/bounded_channel.hpp"
#include "gymbridge/render/i_renderer.hpp"
#include "gymbridge/sim/i_backtest_engine.hpp"
#include "gymbridge/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>

namespace gymbridge {

// -----------------------------------------------------------------------------
// EpisodeResult - what getstat reports about the last finished episode
// -----------------------------------------------------------------------------
struct EpisodeResult {
  int episode{0};
  double runtime_s{0.0};
  std::size_t length{0};
  bool done{true};
  /// analyzer name → analysis(), the step hook excluded
  nlohmann::json analyzers = nlohmann::json::object();

  nlohmann::json toJson() const;
};

// -----------------------------------------------------------------------------
// EpisodeRunner - one full episode, from sample to result
// -----------------------------------------------------------------------------
//
// @brief  Clones the template engine, wires the step hook into the copy,
//         runs it to termination and harvests the result.
//
// @details
// run(episode, kwargs):
//   1. Read trial_config and episode_config from kwargs. A missing key falls
//      back to SampleConfig defaults and is logged at debug level.
//   2. Trial: reuse the cached trial unless trial_config.get_new is set or
//      nothing is cached yet; otherwise DataAcquisition::acquire() with
//      trial_config as get_data kwargs.
//   3. Episode sample: trial->sample(episode_config).
//   4. Engine copy: template.clone(), logger injected, auxiliary observers
//      added once each (every kind when the renderer is enabled, DrawDown
//      only otherwise; an observer already present is left alone), the step
//      hook registered under kStepHookName.
//   5. Strategy params: trial_stat, trial_metadata, dataset_stat,
//      episode_stat, metadata.
//   6. Feed the episode sample, run() to completion, renderEpisode().
//   7. Result: runtime (ITimeProvider), length, analyzers except the hook.
//   8. Release the engine copy and the episode sample before returning.
//
// Errors:
//   DataError and ProtocolError propagate unchanged, as does anything the
//   engine throws. std::invalid_argument on a sampling configuration the
//   trial cannot satisfy.
//
// Ownership:
//   Owns the cached trial (it outlives episodes) and, for the duration of
//   run(), the engine copy. Holds references to everything else; EnvServer
//   owns those.
// -----------------------------------------------------------------------------
class EpisodeRunner {
 public:
  EpisodeRunner(const IBacktestEngine& engine_template,
                BoundedChannel& controller, DataAcquisition& data,
                IRenderer& renderer, Logger& log, ITimeProvider& clock,
                bool send_full_info = false);

  EpisodeRunner(const EpisodeRunner&) = delete;
  EpisodeRunner& operator=(const EpisodeRunner&) = delete;

  EpisodeResult run(int episode, const nlohmann::json& kwargs);

  bool hasTrial() const { return trial_ != nullptr; }
  const DataSample* trial() const { return trial_.get(); }
  int trialsAcquired() const { return trials_acquired_; }

 private:
  nlohmann::json configSection(const nlohmann::json& kwargs,
                               const char* key) const;
  void resolveTrial(const nlohmann::json& trial_config, bool get_new);
  void attachObservers(IBacktestEngine& engine) const;

  const IBacktestEngine& template_;
  BoundedChannel& controller_;
  DataAcquisition& data_;
  IRenderer& renderer_;
  Logger& log_;
  ITimeProvider& clock_;
  bool send_full_info_;

  std::unique_ptr<DataSample> trial_;
  nlohmann::json trial_stat_;
  nlohmann::json dataset_stat_;
  int trials_acquired_{0};
};

}  // namespace gymbridge
