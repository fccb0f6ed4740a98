#pragma once

#include "gymbridge/sim/i_analyzer.hpp"

#include <cstddef>

namespace gymbridge {

// -----------------------------------------------------------------------------
// TradeStatsAnalyzer - per-episode trading statistics
// -----------------------------------------------------------------------------
//
// @brief  Reads the engine's info record on every tick and accumulates
//         order, trade and value statistics.
//
// @details
// Works against any IBacktestEngine whose info() carries broker_message,
// broker_value, realized_pnl, closed_trades and drawdown.
//   orders  - ticks whose broker message reports a fill
//   trades  - closed_trades as last reported by the broker
//   wins / losses - ticks closing a trade, by the sign of the realized PnL
//            change; a break-even close is neither
//
// analysis():
//   {ticks, orders, trades, wins, losses, realized_pnl, final_value,
//    max_drawdown}
// -----------------------------------------------------------------------------
class TradeStatsAnalyzer final : public IAnalyzer {
 public:
  void start(IBacktestEngine& engine) override;
  void next(IBacktestEngine& engine) override;

  nlohmann::json analysis() const override;

  std::unique_ptr<IAnalyzer> clone() const override;

 private:
  std::size_t ticks_{0};
  std::size_t orders_{0};
  std::size_t trades_{0};
  std::size_t wins_{0};
  std::size_t losses_{0};
  double realized_pnl_{0.0};
  double final_value_{0.0};
  double max_drawdown_{0.0};
};

}  // namespace gymbridge
