#include "gymbridge/sim/trade_stats_analyzer.hpp"
#include "gymbridge/sim/i_backtest_engine.hpp"

#include <algorithm>
#include <string>

namespace gymbridge {

namespace {

bool isFill(const std::string& message) {
  return message.rfind("BUY", 0) == 0 || message.rfind("SELL", 0) == 0 ||
         (message.rfind("CLOSE", 0) == 0 &&
          message.find("ignored") == std::string::npos);
}

}  // namespace

void TradeStatsAnalyzer::start(IBacktestEngine& /*engine*/) {
  *this = TradeStatsAnalyzer{};
}

void TradeStatsAnalyzer::next(IBacktestEngine& engine) {
  const nlohmann::json record = engine.info();
  ++ticks_;

  if (isFill(record.value("broker_message", std::string{}))) {
    ++orders_;
  }

  // A trade closed at break-even counts as a trade, neither win nor loss.
  double pnl = record.value("realized_pnl", realized_pnl_);
  std::size_t closed = record.value("closed_trades", trades_);
  if (closed > trades_) {
    trades_ = closed;
    if (pnl > realized_pnl_) {
      ++wins_;
    } else if (pnl < realized_pnl_) {
      ++losses_;
    }
  }
  realized_pnl_ = pnl;

  final_value_ = record.value("broker_value", final_value_);
  max_drawdown_ = std::max(max_drawdown_, record.value("drawdown", 0.0));
}

nlohmann::json TradeStatsAnalyzer::analysis() const {
  return {{"ticks", ticks_},
          {"orders", orders_},
          {"trades", trades_},
          {"wins", wins_},
          {"losses", losses_},
          {"realized_pnl", realized_pnl_},
          {"final_value", final_value_},
          {"max_drawdown", max_drawdown_}};
}

std::unique_ptr<IAnalyzer> TradeStatsAnalyzer::clone() const {
  return std::make_unique<TradeStatsAnalyzer>();
}

}  // namespace gymbridge
