#include "gymbridge/server/episode_runner.hpp"
#include "gymbridge/data/sample_config.hpp"
#include "gymbridge/server/step_exchange.hpp"
#include "gymbridge/sim/observer.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gymbridge {

nlohmann::json EpisodeResult::toJson() const {
  return {{"episode", episode},
          {"runtime", runtime_s},
          {"length", length},
          {"done", done},
          {"analyzers", analyzers}};
}

EpisodeRunner::EpisodeRunner(const IBacktestEngine& engine_template,
                             BoundedChannel& controller, DataAcquisition& data,
                             IRenderer& renderer, Logger& log,
                             ITimeProvider& clock, bool send_full_info)
    : template_(engine_template),
      controller_(controller),
      data_(data),
      renderer_(renderer),
      log_(log),
      clock_(clock),
      send_full_info_(send_full_info) {}

nlohmann::json EpisodeRunner::configSection(const nlohmann::json& kwargs,
                                            const char* key) const {
  if (kwargs.is_object()) {
    auto it = kwargs.find(key);
    if (it != kwargs.end() && it->is_object()) {
      return *it;
    }
  }
  log_.debug(std::string("No <") + key + "> in reset kwargs, using " +
             SampleConfig{}.toJson().dump());
  return nlohmann::json::object();
}

// -----------------------------------------------------------------------------
// resolveTrial(): cached trial or a fresh one from the data provider
// -----------------------------------------------------------------------------
void EpisodeRunner::resolveTrial(const nlohmann::json& trial_config,
                                 bool get_new) {
  if (!get_new && trial_) {
    log_.debug("Reusing trial " + trial_->filename());
    return;
  }

  // The previous trial goes before the new one arrives.
  trial_.reset();

  AcquiredTrial acquired = data_.acquire(trial_config);
  trial_ = std::move(acquired.sample);
  trial_stat_ = std::move(acquired.trial_stat);
  dataset_stat_ = std::move(acquired.dataset_stat);
  ++trials_acquired_;

  log_.info("Got new trial " + trial_->filename() + " after " +
            std::to_string(data_.attempts()) + " request(s)");
}

void EpisodeRunner::attachObservers(IBacktestEngine& engine) const {
  std::vector<ObserverKind> wanted{ObserverKind::DrawDown};
  if (renderer_.enabled()) {
    wanted = {ObserverKind::DrawDown, ObserverKind::NormPnL,
              ObserverKind::Position, ObserverKind::Reward};
  }
  for (ObserverKind kind : wanted) {
    if (!engine.hasObserver(kind)) {
      engine.addObserver(kind);
    }
  }
}

// -----------------------------------------------------------------------------
// run(): one episode
// -----------------------------------------------------------------------------
EpisodeResult EpisodeRunner::run(int episode, const nlohmann::json& kwargs) {
  nlohmann::json trial_config = configSection(kwargs, "trial_config");
  nlohmann::json episode_config = configSection(kwargs, "episode_config");

  SampleConfig trial_cfg = SampleConfig::fromJson(trial_config);
  SampleConfig episode_cfg = SampleConfig::fromJson(episode_config);

  resolveTrial(trial_config, trial_cfg.get_new);

  std::unique_ptr<DataSample> episode_sample = trial_->sample(episode_cfg);
  if (episode_sample->size() <= template_.warmUpBars()) {
    std::string msg = "Episode of " + std::to_string(episode_sample->size()) +
                      " bars is all warm-up (" +
                      std::to_string(template_.warmUpBars()) +
                      " bars); no step would reach the controller";
    log_.error(msg);
    throw std::invalid_argument(msg);
  }

  std::unique_ptr<IBacktestEngine> engine = template_.clone();
  engine->setLogger(&log_);
  attachObservers(*engine);
  engine->addAnalyzer(kStepHookName,
                      std::make_unique<StepExchange>(controller_, log_,
                                                     renderer_,
                                                     send_full_info_));

  engine->setStrategyParam("trial_stat", trial_stat_);
  engine->setStrategyParam("trial_metadata", trial_->metadata());
  engine->setStrategyParam("dataset_stat", dataset_stat_);
  engine->setStrategyParam("episode_stat", episode_sample->describe());
  engine->setStrategyParam("metadata", episode_sample->metadata());

  engine->addData(episode_sample->toFeed(), episode_sample->filename());

  log_.info("Episode " + std::to_string(episode) + " started on " +
            episode_sample->filename());

  std::int64_t started_ms = clock_.now_ms();
  engine->run();

  renderer_.renderEpisode(*engine);

  EpisodeResult result;
  result.episode = episode;
  result.runtime_s = static_cast<double>(clock_.now_ms() - started_ms) / 1000.0;
  result.length = engine->length();
  result.done = true;
  for (const auto& name : engine->analyzerNames()) {
    if (name != kStepHookName) {
      result.analyzers[name] = engine->analysis(name);
    }
  }

  log_.info("Episode " + std::to_string(episode) + " finished: " +
            std::to_string(result.length) + " bars in " +
            std::to_string(result.runtime_s) + " s");

  engine.reset();
  episode_sample.reset();
  return result;
}

}  // namespace gymbridge
