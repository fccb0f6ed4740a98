#pragma once

#include "gymbridge/data/bar.hpp"
#include "gymbridge/sim/i_analyzer.hpp"
#include "gymbridge/sim/observer.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace gymbridge {

class Logger;

// -----------------------------------------------------------------------------
// IBacktestEngine - what the server needs from a simulation engine
// -----------------------------------------------------------------------------
//
// @brief  Abstract engine the episode runner deep-copies, wires and runs
//         once per episode.
//
// @details
// The server never drives the engine tick by tick. run() owns the loop and
// calls every attached analyzer once per tick; the step hook is one of
// those analyzers and it is where the controller gets to act. This is the
// only inversion of control in the system.
//
// Surface used by the episode runner (configuration):
//   clone, setLogger, addData, hasObserver/addObserver, addAnalyzer,
//   setStrategyParam, run, length, analyzerNames/analysis, observerSummary.
//
// Surface used by the step hook (per tick, from inside run()):
//   isDone, info, rawState, state, reward, setAction, setLastAction,
//   iteration, skipFrame, requestStop.
//
// Ownership:
//   The template engine is owned by EnvServer. Each clone() is owned by the
//   EpisodeRunner for exactly one episode and then discarded.
// -----------------------------------------------------------------------------
class IBacktestEngine {
 public:
  virtual ~IBacktestEngine() = default;

  // Deep copy of configuration, observers, analyzers and strategy params.
  // Data feeds and run state are not part of the configuration.
  virtual std::unique_ptr<IBacktestEngine> clone() const = 0;

  virtual void setLogger(Logger* log) = 0;

  virtual void addData(std::vector<Bar> feed, std::string name) = 0;

  virtual bool hasObserver(ObserverKind kind) const = 0;
  virtual void addObserver(ObserverKind kind) = 0;

  virtual void addAnalyzer(const std::string& name,
                           std::unique_ptr<IAnalyzer> analyzer) = 0;
  virtual std::vector<std::string> analyzerNames() const = 0;
  virtual nlohmann::json analysis(const std::string& name) const = 0;

  virtual void setStrategyParam(const std::string& key,
                                nlohmann::json value) = 0;
  virtual const nlohmann::json& strategyParams() const = 0;

  // Runs synchronously to completion. Returns the number of bars consumed.
  virtual std::size_t run() = 0;
  virtual std::size_t length() const = 0;

  virtual nlohmann::json observerSummary() const = 0;

  // --- per-tick surface ----------------------------------------------------
  virtual bool isDone() const = 0;
  virtual nlohmann::json info() const = 0;
  virtual nlohmann::json rawState() const = 0;
  virtual nlohmann::json state() const = 0;
  virtual double reward() const = 0;

  // Pending action, executed on the next tick.
  virtual void setAction(const std::string& action) = 0;
  // Last action the agent took, reported in info records.
  virtual void setLastAction(const std::string& action) = 0;

  virtual std::size_t iteration() const = 0;
  virtual int skipFrame() const = 0;
  // Bars replayed before the first tick. A shorter or equal feed never ticks.
  virtual std::size_t warmUpBars() const = 0;

  // Halts run() after the current tick.
  virtual void requestStop() = 0;
  virtual bool stopRequested() const = 0;
};

}  // namespace gymbridge
