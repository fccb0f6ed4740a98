#include "gymbridge/server/step_exchange.hpp"
#include "gymbridge/protocol/errors.hpp"
#include "gymbridge/protocol/message.hpp"
#include "gymbridge/sim/i_backtest_engine.hpp"

#include <stdexcept>
#include <string>

namespace gymbridge {

StepExchange::StepExchange(BoundedChannel& channel, Logger& log,
                           IRenderer& renderer, bool send_full_info)
    : channel_(channel),
      log_(log),
      renderer_(renderer),
      send_full_info_(send_full_info) {}

void StepExchange::start(IBacktestEngine& /*engine*/) {
  last_message_ = nullptr;
  step_to_render_ = StepSnapshot{};
  info_batch_.clear();
  exchanges_ = 0;
  render_requests_ = 0;
  info_records_ = 0;
  forced_done_ = false;
}

std::unique_ptr<IAnalyzer> StepExchange::clone() const {
  throw std::logic_error("StepExchange: a step hook cannot be cloned");
}

nlohmann::json StepExchange::analysis() const {
  return {{"exchanges", exchanges_},
          {"render_requests", render_requests_},
          {"info_records", info_records_},
          {"forced_done", forced_done_}};
}

// -----------------------------------------------------------------------------
// receiveRequest(): one controller request, answering unreadable frames
// -----------------------------------------------------------------------------
nlohmann::json StepExchange::receiveRequest() {
  for (;;) {
    ReceiveResult received = channel_.receive();
    if (received.ok()) {
      last_message_ = received.message;
      return received.message;
    }
    if (!channel_.replyPending()) {
      throw std::runtime_error(
          std::string("StepExchange: controller channel failed: ") +
          channelStatusToString(received.status));
    }
    log_.warning("Unreadable request during episode: " +
                 received.message.dump());
    reply("Request is not a JSON document: " + received.message.dump());
  }
}

void StepExchange::reply(const nlohmann::json& message) {
  ChannelStatus status = channel_.send(message);
  if (status != ChannelStatus::Ok) {
    throw std::runtime_error(
        std::string("StepExchange: reply to controller failed: ") +
        channelStatusToString(status));
  }
}

std::vector<std::string> StepExchange::modesOf(
    const nlohmann::json& mode) const {
  std::vector<std::string> modes;
  if (mode.is_string()) {
    modes.push_back(mode.get<std::string>());
  } else if (mode.is_array()) {
    for (const auto& m : mode) {
      modes.push_back(m.is_string() ? m.get<std::string>() : m.dump());
    }
  } else {
    modes = renderer_.renderModes();
  }
  return modes;
}

// -----------------------------------------------------------------------------
// earlyStop(): final non-episode renderings, then halt the engine
// -----------------------------------------------------------------------------
void StepExchange::earlyStop(IBacktestEngine& engine) {
  if (renderer_.enabled()) {
    std::vector<std::string> modes;
    for (const auto& mode : renderer_.renderModes()) {
      if (mode != "episode") {
        modes.push_back(mode);
      }
    }
    if (!modes.empty()) {
      renderer_.render(modes, &step_to_render_, false);
    }
  }
  engine.requestStop();
}

// -----------------------------------------------------------------------------
// next(): one engine tick
// -----------------------------------------------------------------------------
void StepExchange::next(IBacktestEngine& engine) {
  bool done = engine.isDone();
  info_batch_.push_back(engine.info());
  ++info_records_;

  engine.setAction("hold");

  int skip = engine.skipFrame();
  if (!done && skip > 0 && engine.iteration() % skip != 0) {
    return;
  }

  step_to_render_.raw_state = engine.rawState();
  step_to_render_.state = engine.state();
  step_to_render_.reward = engine.reward();
  step_to_render_.done = done;
  step_to_render_.info = info_batch_.back();

  Message msg = Message::fromJson(receiveRequest());

  while (msg.hasCtrl()) {
    switch (msg.controlCode()) {
      case ControlCode::Render:
        ++render_requests_;
        reply(renderer_.render(modesOf(msg.mode), &step_to_render_));
        msg = Message::fromJson(receiveRequest());
        continue;

      case ControlCode::Done:
        reply(kDoneAck);
        log_.info("Episode terminated by controller at step " +
                  std::to_string(engine.iteration()));
        forced_done_ = true;
        earlyStop(engine);
        return;

      default:
        reply("Unexpected control key <" + *msg.ctrl +
              "> during episode; send <action>, <render> or <done>.");
        throw ProtocolError(ProtocolError::Kind::UnknownControl,
                            "Unexpected control key during episode: " +
                                *msg.ctrl);
    }
  }

  if (!msg.hasAction()) {
    reply("No <action> key received: " + last_message_.dump());
    throw ProtocolError(ProtocolError::Kind::MissingAction,
                        "No <action> key received: " + last_message_.dump());
  }

  engine.setAction(*msg.action);
  engine.setLastAction(*msg.action);

  nlohmann::json info = nlohmann::json::array();
  if (send_full_info_) {
    for (auto& record : info_batch_) {
      info.push_back(std::move(record));
    }
  } else {
    info.push_back(std::move(info_batch_.back()));
  }
  info_batch_.clear();

  reply(nlohmann::json::array({step_to_render_.state, step_to_render_.reward,
                               done, std::move(info)}));
  ++exchanges_;

  if (done) {
    earlyStop(engine);
  }
}

}  // namespace gymbridge
