#pragma once

#include <nlohmann/json.hpp>

namespace gymbridge {

// Everything the renderer needs from one exchanged tick.
struct StepSnapshot {
  nlohmann::json raw_state;
  nlohmann::json state;
  double reward{0.0};
  bool done{false};
  nlohmann::json info;
};

}  // namespace gymbridge
