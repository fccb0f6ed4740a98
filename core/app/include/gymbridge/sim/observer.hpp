#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace gymbridge {

enum class ObserverKind { DrawDown, NormPnL, Position, Reward };

const char* observerName(ObserverKind kind);

// Values an observer may record on one tick.
struct ObserverInput {
  double broker_value{0.0};
  double start_cash{0.0};
  double position{0.0};
  double reward{0.0};
};

// -----------------------------------------------------------------------------
// Observer - one per-tick series recorded by the engine
// -----------------------------------------------------------------------------
//
// @details
//   DrawDown - (peak value - value) / peak value
//   NormPnL  - (value - start cash) / start cash
//   Position - signed net position
//   Reward   - the reward the engine would report on that tick
//
// The renderer reads the series through summary() when it draws an episode.
// -----------------------------------------------------------------------------
class Observer {
 public:
  explicit Observer(ObserverKind kind) : kind_(kind) {}

  ObserverKind kind() const { return kind_; }
  const std::vector<double>& line() const { return line_; }

  void next(const ObserverInput& input);

  // {points, last, min, max}; {points: 0} when nothing was recorded.
  nlohmann::json summary() const;

 private:
  ObserverKind kind_;
  std::vector<double> line_;
  double peak_{0.0};
};

}  // namespace gymbridge
