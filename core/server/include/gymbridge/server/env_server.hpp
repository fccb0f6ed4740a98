#pragma once

#include "gymbridge/config/server_config.hpp"
#include "gymbridge/data/data_acquisition.hpp"
#include "gymbridge/log/logger.hpp"
#include "gymbridge/network/bounded_channel.hpp"
#include "gymbridge/render/i_renderer.hpp"
#include "gymbridge/server/episode_runner.hpp"
#include "gymbridge/sim/i_backtest_engine.hpp"
#include "gymbridge/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>

namespace gymbridge {

enum class SessionState { Control, Episode, Terminated };

const char* sessionStateToString(SessionState state);

// Reply to one control-mode request and the state it leads to.
struct ControlOutcome {
  nlohmann::json reply;
  SessionState next{SessionState::Control};
  /// reset kwargs; null unless next == Episode
  nlohmann::json kwargs;
};

// -----------------------------------------------------------------------------
// EnvServer - session root and outer control loop
// -----------------------------------------------------------------------------
//
// @brief  Owns both channels, the data acquisition loop, the episode runner,
//         the template engine and the renderer, and multiplexes control
//         commands and episodes over the controller channel.
//
// @details
// run():
//   open both channels → ping the data provider (failure is fatal) → loop:
//
//   Control state, per request:
//     stop        → "Exiting.", close both channels, Terminated
//     reset       → "Preparing new episode with kwargs: ...", Episode
//     getstat     → last EpisodeResult ({} before the first episode)
//     render+mode → renderer output for the mode
//     other ctrl  → {"ctrl": "send control keys: ..."}
//     no ctrl     → "No <ctrl> key received: ... Hint: forgot to call
//                   reset()?"
//   Episode state:
//     EpisodeRunner::run(); the result becomes the getstat answer, the
//     episode counter advances, back to Control.
//
// Channel errors in Control state are answered with a diagnostic reply
// when one is owed and the loop continues. A failed reply resets the
// controller socket so the next request can be received.
//
// Fatal errors (DataError, ProtocolError, engine faults) propagate out of
// run() after both channels are closed. When data acquisition gives up the
// controller channel is closed before DataError{Timeout} is thrown.
//
// Thread model:
//   run() executes on the caller's thread and blocks until stop or a fatal
//   error. handleControl() performs no I/O and is safe to call from tests
//   without opening the channels.
//
// Ownership:
//   Owns channels, acquisition, runner, template engine and renderer. The
//   logger and the clock are borrowed and must outlive the server.
// -----------------------------------------------------------------------------
class EnvServer {
 public:
  static constexpr const char* kExiting = "Exiting.";

  EnvServer(ServerConfig config,
            std::unique_ptr<IBacktestEngine> engine_template,
            std::unique_ptr<IRenderer> renderer, Logger& log,
            ITimeProvider& clock);

  ~EnvServer();

  EnvServer(const EnvServer&) = delete;
  EnvServer& operator=(const EnvServer&) = delete;
  EnvServer(EnvServer&&) = delete;
  EnvServer& operator=(EnvServer&&) = delete;

  // Blocks until stop. Throws DataError / ProtocolError on fatal errors.
  void run();

  // Computes the reply to a control-mode request. No socket I/O.
  ControlOutcome handleControl(const nlohmann::json& request);

  // Closes both channels. Idempotent.
  void shutdown();

  SessionState state() const { return state_; }
  int episodesCompleted() const { return episodes_completed_; }
  const std::optional<EpisodeResult>& lastResult() const {
    return last_result_;
  }
  const ServerConfig& config() const { return config_; }

 private:
  void serveControl();
  void runEpisode(const nlohmann::json& kwargs);
  void recoverController();
  void notifyDataProvider();

  ServerConfig config_;
  Logger& log_;
  ITimeProvider& clock_;

  std::unique_ptr<IBacktestEngine> engine_template_;
  std::unique_ptr<IRenderer> renderer_;

  BoundedChannel controller_;
  BoundedChannel data_channel_;
  DataAcquisition acquisition_;
  EpisodeRunner runner_;

  SessionState state_{SessionState::Control};
  int episodes_completed_{0};
  std::optional<EpisodeResult> last_result_;
};

}  // namespace gymbridge
