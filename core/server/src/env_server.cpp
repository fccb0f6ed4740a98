#include "gymbridge/server/env_server.hpp"
#include "gymbridge/protocol/errors.hpp"
#include "gymbridge/protocol/message.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gymbridge {

namespace {

ChannelOptions controllerOptions(const ServerConfig& config) {
  ChannelOptions options;
  options.send_timeout_ms = config.connectTimeoutMs();
  options.receive_timeout_ms = ChannelOptions::kUnbounded;
  return options;
}

ChannelOptions dataOptions(const ServerConfig& config) {
  ChannelOptions options;
  options.send_timeout_ms = config.connectTimeoutMs();
  options.receive_timeout_ms = config.connectTimeoutMs();
  return options;
}

AcquisitionPolicy acquisitionPolicy(const ServerConfig& config) {
  AcquisitionPolicy policy;
  policy.wait_budget_s = config.wait_for_data_reset_s;
  policy.max_backoff_s = config.max_backoff_s;
  return policy;
}

ServerConfig validated(ServerConfig config) {
  config.validate();
  return config;
}

template <typename T>
T& required(const std::unique_ptr<T>& ptr, const char* what) {
  if (!ptr) {
    throw std::invalid_argument(std::string("EnvServer: missing ") + what);
  }
  return *ptr;
}

}  // namespace

const char* sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::Control:
      return "control";
    case SessionState::Episode:
      return "episode";
    case SessionState::Terminated:
      return "terminated";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
EnvServer::EnvServer(ServerConfig config,
                     std::unique_ptr<IBacktestEngine> engine_template,
                     std::unique_ptr<IRenderer> renderer, Logger& log,
                     ITimeProvider& clock)
    : config_(validated(std::move(config))),
      log_(log),
      clock_(clock),
      engine_template_(std::move(engine_template)),
      renderer_(std::move(renderer)),
      controller_(ChannelRole::Reply, config_.network_address,
                  controllerOptions(config_)),
      data_channel_(ChannelRole::Request, config_.data_network_address,
                    dataOptions(config_)),
      acquisition_(data_channel_, log_, clock_, acquisitionPolicy(config_)),
      runner_(required(engine_template_, "engine template"), controller_,
              acquisition_, required(renderer_, "renderer"), log_, clock_,
              config_.send_full_info) {
  acquisition_.setGiveUpHook([this]() { controller_.close(); });
}

EnvServer::~EnvServer() { shutdown(); }

void EnvServer::shutdown() {
  controller_.close();
  data_channel_.close();
}

// -----------------------------------------------------------------------------
// handleControl(): control-mode dispatch
// -----------------------------------------------------------------------------
ControlOutcome EnvServer::handleControl(const nlohmann::json& request) {
  ControlOutcome out;
  Message msg = Message::fromJson(request);

  if (!msg.hasCtrl()) {
    out.reply = "No <ctrl> key received: " + request.dump() +
                ". Hint: forgot to call reset()?";
    return out;
  }

  switch (msg.controlCode()) {
    case ControlCode::Stop:
      out.reply = kExiting;
      out.next = SessionState::Terminated;
      return out;

    case ControlCode::Reset:
      out.kwargs = msg.kwargs.is_null() ? nlohmann::json::object() : msg.kwargs;
      out.reply = "Preparing new episode with kwargs: " + out.kwargs.dump();
      out.next = SessionState::Episode;
      return out;

    case ControlCode::GetStat:
      out.reply = last_result_ ? last_result_->toJson()
                               : nlohmann::json::object();
      return out;

    case ControlCode::Render:
      if (msg.hasMode()) {
        std::vector<std::string> modes;
        if (msg.mode.is_array()) {
          for (const auto& m : msg.mode) {
            modes.push_back(m.is_string() ? m.get<std::string>() : m.dump());
          }
        } else {
          modes.push_back(msg.mode.is_string() ? msg.mode.get<std::string>()
                                               : msg.mode.dump());
        }
        out.reply = renderer_->render(modes);
        return out;
      }
      break;

    default:
      break;
  }

  out.reply = {{"ctrl",
                "send control keys: <reset>, <getstat>, <render>, <stop>."}};
  return out;
}

void EnvServer::recoverController() {
  log_.warning("Resetting controller channel at " + config_.network_address);
  controller_.close();
  controller_.open();
}

// -----------------------------------------------------------------------------
// serveControl(): one control-mode request
// -----------------------------------------------------------------------------
void EnvServer::serveControl() {
  ReceiveResult received = controller_.receive();
  if (!received.ok()) {
    log_.warning(std::string("Control receive failed: ") +
                 channelStatusToString(received.status));
    if (controller_.replyPending()) {
      ChannelStatus sent = controller_.send(
          "Request is not a JSON document: " + received.message.dump());
      if (sent != ChannelStatus::Ok) {
        recoverController();
      }
    } else if (!controller_.isOpen()) {
      recoverController();
    }
    return;
  }

  log_.debug("Control message received: " + received.message.dump());

  ControlOutcome outcome = handleControl(received.message);
  ChannelStatus sent = controller_.send(outcome.reply);
  if (sent != ChannelStatus::Ok) {
    log_.warning(std::string("Control reply failed: ") +
                 channelStatusToString(sent));
    recoverController();
    return;
  }

  if (outcome.next != state_) {
    log_.debug(std::string("Session state: ") + sessionStateToString(state_) +
               " -> " + sessionStateToString(outcome.next));
  }

  switch (outcome.next) {
    case SessionState::Terminated:
      if (config_.stop_data_on_exit && !acquisition_.sendStop()) {
        log_.warning("Data provider did not acknowledge stop");
      }
      shutdown();
      state_ = SessionState::Terminated;
      log_.info("Session terminated by controller");
      break;

    case SessionState::Episode:
      state_ = SessionState::Episode;
      runEpisode(outcome.kwargs);
      state_ = SessionState::Control;
      log_.debug(std::string("Session state: ") +
                 sessionStateToString(SessionState::Episode) + " -> " +
                 sessionStateToString(state_));
      break;

    case SessionState::Control:
      break;
  }
}

void EnvServer::runEpisode(const nlohmann::json& kwargs) {
  EpisodeResult result = runner_.run(episodes_completed_, kwargs);
  last_result_ = std::move(result);
  ++episodes_completed_;
}

// -----------------------------------------------------------------------------
// notifyDataProvider(): best-effort stop on a fatal exit
// -----------------------------------------------------------------------------
// Skipped when the acquisition loop already sent one (data timeout). A fault
// while stopping is logged; the session's own error is what propagates.
void EnvServer::notifyDataProvider() {
  if (!config_.stop_data_on_exit || !data_channel_.isOpen() ||
      acquisition_.stopSent()) {
    return;
  }
  try {
    if (!acquisition_.sendStop()) {
      log_.warning("Data provider did not acknowledge stop");
    }
  } catch (const std::exception& e) {
    log_.warning(std::string("Stopping data provider failed: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// run(): session lifetime
// -----------------------------------------------------------------------------
void EnvServer::run() {
  try {
    controller_.open();
    data_channel_.open();
    log_.info("Listening for controller at " + config_.network_address);

    nlohmann::json pong = acquisition_.ping();
    log_.info("Data provider at " + config_.data_network_address +
              " answered ping: " + pong.dump());

    while (state_ != SessionState::Terminated) {
      serveControl();
    }
  } catch (...) {
    notifyDataProvider();
    shutdown();
    throw;
  }
}

}  // namespace gymbridge
