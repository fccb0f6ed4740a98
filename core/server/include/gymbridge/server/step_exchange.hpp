#pragma once

#include "gymbridge/log/logger.hpp"
#include "gymbridge/network/bounded_channel.hpp"
#include "gymbridge/render/i_renderer.hpp"
#include "gymbridge/render/step_snapshot.hpp"
#include "gymbridge/sim/i_analyzer.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace gymbridge {

// -----------------------------------------------------------------------------
// StepExchange - per-tick hook synchronizing the engine with the controller
// -----------------------------------------------------------------------------
//
// @brief  Registered on the episode's engine copy as an analyzer; the engine
//         calls next() once per tick and this is where the controller acts.
//
// @details
// next(engine):
//   1. Read the termination flag and the info record; append the record to
//      the current batch.
//   2. Reset the engine's pending action to "hold".
//   3. Talk to the controller only on ticks where iteration % skip_frame == 0
//      or when the termination flag is set. Other ticks return here.
//   4. Snapshot raw state, state and reward, then block on receive() (the
//      controller channel waits without a bound).
//   5. While the request carries a ctrl:
//        render → reply with the rendering, receive again. The action turn
//                 is not consumed and the snapshot is not refreshed.
//        done   → reply "_DONE SIGNAL RECEIVED", run the early-stop path,
//                 return.
//        other  → diagnostic reply, then ProtocolError{UnknownControl}.
//   6. No ctrl and no action → diagnostic reply, then
//      ProtocolError{MissingAction}.
//   7. Record the action as pending and as last action, reply with
//      [state, reward, done, info], clear the batch.
//   8. If the termination flag was set, run the early-stop path.
//
// Early-stop path:
//   Refresh every non-episode rendering without sending it, then ask the
//   engine to halt after the current tick.
//
// info in the reply is a one-element array holding the newest record of the
// batch, or the whole batch when send_full_info is set.
//
// Thread model:
//   Runs inside IBacktestEngine::run() on the session thread.
//
// Ownership:
//   Holds references to the controller channel, the logger and the renderer;
//   all three are owned by EnvServer and outlive the episode. One instance
//   per episode; it is never cloned.
// -----------------------------------------------------------------------------
class StepExchange final : public IAnalyzer {
 public:
  static constexpr const char* kDoneAck = "_DONE SIGNAL RECEIVED";

  StepExchange(BoundedChannel& channel, Logger& log, IRenderer& renderer,
               bool send_full_info = false);

  void start(IBacktestEngine& engine) override;
  void next(IBacktestEngine& engine) override;

  // {exchanges, render_requests, info_records, forced_done}
  nlohmann::json analysis() const override;

  // Throws std::logic_error: the hook is bound to one session's channel.
  std::unique_ptr<IAnalyzer> clone() const override;

  const StepSnapshot& stepToRender() const { return step_to_render_; }
  const nlohmann::json& lastMessage() const { return last_message_; }
  std::size_t exchanges() const { return exchanges_; }
  bool forcedDone() const { return forced_done_; }

 private:
  nlohmann::json receiveRequest();
  void reply(const nlohmann::json& message);
  void earlyStop(IBacktestEngine& engine);
  std::vector<std::string> modesOf(const nlohmann::json& mode) const;

  BoundedChannel& channel_;
  Logger& log_;
  IRenderer& renderer_;
  bool send_full_info_;

  nlohmann::json last_message_;
  StepSnapshot step_to_render_;
  std::vector<nlohmann::json> info_batch_;

  std::size_t exchanges_{0};
  std::size_t render_requests_{0};
  std::size_t info_records_{0};
  bool forced_done_{false};
};

}  // namespace gymbridge
