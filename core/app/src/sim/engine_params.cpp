#include "gymbridge/sim/engine_params.hpp"

#include <stdexcept>

namespace gymbridge {

void EngineParams::validate() const {
  if (state_window == 0) {
    throw std::invalid_argument("EngineParams: state_window must be > 0");
  }
  if (skip_frame <= 0) {
    throw std::invalid_argument("EngineParams: skip_frame must be > 0");
  }
  if (!(start_cash > 0.0) || !(stake > 0.0)) {
    throw std::invalid_argument(
        "EngineParams: start_cash and stake must be positive");
  }
  if (commission < 0.0) {
    throw std::invalid_argument("EngineParams: commission must be >= 0");
  }
  if (!(drawdown_call > 0.0 && drawdown_call <= 1.0)) {
    throw std::invalid_argument(
        "EngineParams: drawdown_call must be in (0, 1]");
  }
}

nlohmann::json EngineParams::toJson() const {
  return {{"state_window", state_window}, {"skip_frame", skip_frame},
          {"start_cash", start_cash},     {"stake", stake},
          {"commission", commission},     {"drawdown_call", drawdown_call}};
}

EngineParams EngineParams::fromJson(const nlohmann::json& j,
                                    const EngineParams& defaults) {
  EngineParams p = defaults;
  if (j.is_object()) {
    p.state_window = j.value("state_window", p.state_window);
    p.skip_frame = j.value("skip_frame", p.skip_frame);
    p.start_cash = j.value("start_cash", p.start_cash);
    p.stake = j.value("stake", p.stake);
    p.commission = j.value("commission", p.commission);
    p.drawdown_call = j.value("drawdown_call", p.drawdown_call);
  }
  p.validate();
  return p;
}

}  // namespace gymbridge
