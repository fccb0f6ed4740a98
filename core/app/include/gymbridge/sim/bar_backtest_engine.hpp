#pragma once

#include "gymbridge/sim/broker.hpp"
#include "gymbridge/sim/engine_params.hpp"
#include "gymbridge/sim/i_backtest_engine.hpp"
#include "gymbridge/sim/observer.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gymbridge {

// -----------------------------------------------------------------------------
// BarBacktestEngine - reference single-instrument bar replay engine
// -----------------------------------------------------------------------------
//
// @brief  Replays one OHLCV feed, executes agent actions through a Broker and
//         calls its analyzers once per tick.
//
// @details
// run() loop, for bar i of the feed:
//   1. Warm-up: while fewer than state_window bars have been seen, only mark
//      the book to market. No analyzer is called.
//   2. Execute the pending action at the bar's open; the pending action then
//      falls back to "hold".
//   3. Mark to market at the close, record broker value, update observers.
//   4. Call next() on every analyzer in registration order. The step hook
//      may set the pending action or request a stop here.
//   5. Leave the loop if a stop was requested or isDone() holds; otherwise
//      advance the iteration counter (which starts at 1).
//
// Termination (isDone):
//   last bar reached, drawdown from peak >= drawdown_call, broker value
//   <= 0, or requestStop() called.
//
// Observation:
//   rawState() - the last state_window bars as [o, h, l, c, v] rows.
//   state()    - window closes relative to the last close; scaled by the
//                episode close std when an "episode_stat" strategy param
//                carries one, otherwise divided by the last close.
//   reward()   - broker value change over the last skip_frame ticks,
//                divided by start cash.
//
// Thread model: single-threaded; run() executes on the caller's thread.
// -----------------------------------------------------------------------------
class BarBacktestEngine final : public IBacktestEngine {
 public:
  explicit BarBacktestEngine(EngineParams params = EngineParams{});

  std::unique_ptr<IBacktestEngine> clone() const override;

  void setLogger(Logger* log) override { log_ = log; }

  void addData(std::vector<Bar> feed, std::string name) override;

  bool hasObserver(ObserverKind kind) const override;
  void addObserver(ObserverKind kind) override;

  void addAnalyzer(const std::string& name,
                   std::unique_ptr<IAnalyzer> analyzer) override;
  std::vector<std::string> analyzerNames() const override;
  nlohmann::json analysis(const std::string& name) const override;

  void setStrategyParam(const std::string& key, nlohmann::json value) override;
  const nlohmann::json& strategyParams() const override { return params_json_; }

  std::size_t run() override;
  std::size_t length() const override { return length_; }

  nlohmann::json observerSummary() const override;

  bool isDone() const override;
  nlohmann::json info() const override;
  nlohmann::json rawState() const override;
  nlohmann::json state() const override;
  double reward() const override;

  void setAction(const std::string& action) override {
    pending_action_ = action;
  }
  void setLastAction(const std::string& action) override {
    last_action_ = action;
  }

  std::size_t iteration() const override { return iteration_; }
  int skipFrame() const override { return params_.skip_frame; }
  std::size_t warmUpBars() const override {
    return params_.state_window > 0 ? params_.state_window - 1 : 0;
  }

  void requestStop() override { stop_requested_ = true; }
  bool stopRequested() const override { return stop_requested_; }

  const EngineParams& params() const { return params_; }
  const Broker& broker() const { return broker_; }
  const std::string& feedName() const { return feed_name_; }
  const std::string& pendingAction() const { return pending_action_; }

 private:
  void resetRunState();
  double drawdown() const;

  EngineParams params_;
  Logger* log_{nullptr};

  std::vector<Bar> feed_;
  std::string feed_name_;
  std::vector<Observer> observers_;
  std::vector<std::pair<std::string, std::unique_ptr<IAnalyzer>>> analyzers_;
  nlohmann::json params_json_ = nlohmann::json::object();

  // --- run state -----------------------------------------------------------
  Broker broker_;
  std::vector<double> values_;
  double peak_value_{0.0};
  std::size_t current_{0};
  std::size_t length_{0};
  std::size_t iteration_{1};
  std::string pending_action_{"hold"};
  std::string last_action_{"hold"};
  std::string broker_message_{"-"};
  bool stop_requested_{false};
};

}  // namespace gymbridge
