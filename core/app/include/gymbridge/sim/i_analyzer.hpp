#pragma once

#include <nlohmann/json.hpp>

#include <memory>

namespace gymbridge {

class IBacktestEngine;

// -----------------------------------------------------------------------------
// IAnalyzer - per-tick callback attached to a backtest engine
// -----------------------------------------------------------------------------
//
// @brief  The engine calls start() once before the first tick, next() once
//         per tick after warm-up, and stop() once after the last tick.
//
// @details
// Two kinds of analyzers exist:
//   - real analyzers (TradeStatsAnalyzer) that accumulate statistics and
//     report them through analysis(); the episode runner copies every
//     analysis() into the episode result;
//   - the step hook (StepExchange), registered under kStepHookName, which
//     uses next() to synchronize the engine with the controller and reports
//     nothing.
//
// clone() produces a fresh copy for a new engine; template engines are
// deep-copied once per episode.
// -----------------------------------------------------------------------------
class IAnalyzer {
 public:
  virtual ~IAnalyzer() = default;

  virtual void start(IBacktestEngine& /*engine*/) {}
  virtual void next(IBacktestEngine& engine) = 0;
  virtual void stop(IBacktestEngine& /*engine*/) {}

  virtual nlohmann::json analysis() const = 0;

  virtual std::unique_ptr<IAnalyzer> clone() const = 0;
};

// Name the step hook is registered under; excluded from episode results.
inline constexpr const char* kStepHookName = "_env_analyzer";

}  // namespace gymbridge
