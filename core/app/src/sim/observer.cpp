#include "gymbridge/sim/observer.hpp"

#include <algorithm>

namespace gymbridge {

const char* observerName(ObserverKind kind) {
  switch (kind) {
    case ObserverKind::DrawDown: return "drawdown";
    case ObserverKind::NormPnL:  return "norm_pnl";
    case ObserverKind::Position: return "position";
    case ObserverKind::Reward:   return "reward";
  }
  return "unknown";
}

void Observer::next(const ObserverInput& input) {
  switch (kind_) {
    case ObserverKind::DrawDown:
      peak_ = std::max(peak_, input.broker_value);
      line_.push_back(peak_ > 0.0 ? (peak_ - input.broker_value) / peak_
                                  : 0.0);
      break;
    case ObserverKind::NormPnL:
      line_.push_back(input.start_cash > 0.0
                          ? (input.broker_value - input.start_cash) /
                                input.start_cash
                          : 0.0);
      break;
    case ObserverKind::Position:
      line_.push_back(input.position);
      break;
    case ObserverKind::Reward:
      line_.push_back(input.reward);
      break;
  }
}

nlohmann::json Observer::summary() const {
  nlohmann::json j;
  j["points"] = line_.size();
  if (line_.empty()) {
    return j;
  }
  auto [lo, hi] = std::minmax_element(line_.begin(), line_.end());
  j["last"] = line_.back();
  j["min"] = *lo;
  j["max"] = *hi;
  return j;
}

}  // namespace gymbridge
