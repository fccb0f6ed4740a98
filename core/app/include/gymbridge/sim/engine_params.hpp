#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>

namespace gymbridge {

// -----------------------------------------------------------------------------
// EngineParams - configuration of the reference backtest engine
// -----------------------------------------------------------------------------
struct EngineParams {
  /// Bars in the observation window; also the warm-up length.
  std::size_t state_window{10};
  /// The controller is consulted every skip_frame ticks.
  int skip_frame{1};
  double start_cash{10000.0};
  /// Units per buy / sell.
  double stake{1.0};
  /// Fraction of notional charged per fill.
  double commission{0.0};
  /// Episode ends once drawdown from peak value reaches this fraction.
  double drawdown_call{0.9};

  // Throws std::invalid_argument on a zero window, non-positive skip frame,
  // cash or stake, negative commission, or drawdown_call outside (0, 1].
  void validate() const;

  nlohmann::json toJson() const;
  static EngineParams fromJson(const nlohmann::json& j);
  static EngineParams fromJson(const nlohmann::json& j, const EngineParams& defaults);
};

inline EngineParams EngineParams::fromJson(const nlohmann::json& j) {
  return fromJson(j, EngineParams{});
}

}  // namespace gymbridge
