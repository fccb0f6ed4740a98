#pragma once

#include <string>

namespace gymbridge {

// Single-instrument position: signed quantity, weighted entry, realized PnL.
struct Position {
  double net_quantity{0.0};    // +long, -short, 0 flat
  double average_price{0.0};   // weighted avg entry price of current position
  double realized_pnl{0.0};    // cumulative
};

// -----------------------------------------------------------------------------
// Broker - cash and position book for the reference backtest engine
// -----------------------------------------------------------------------------
//
// @brief  Turns agent actions into fills at a given price and keeps cash,
//         position and realized PnL consistent.
//
// @details
// Actions:
//   "buy"   → +stake units
//   "sell"  → -stake units
//   "close" → flatten the current position
//   "hold"  → nothing
//   other   → nothing; reported in the returned broker message
//
// Position arithmetic:
//   Increasing   - weighted average entry, no realized PnL.
//   Decreasing   - realized PnL = closed_qty * (price - avg) * direction.
//   Crossing zero- close the old side in full, open the remainder at price.
//
// Commission is charged on every fill as |qty| * price * commission and
// comes out of cash. value() is cash plus the position marked at the last
// markToMarket() price.
//
// Thread model: single-threaded; owned by one engine run.
// -----------------------------------------------------------------------------
class Broker {
 public:
  explicit Broker(double start_cash = 10000.0, double commission = 0.0);

  // Executes an action at price and returns the broker message for the
  // tick ("-" when nothing happened).
  std::string execute(const std::string& action, double stake, double price);

  void markToMarket(double price) { last_price_ = price; }

  double cash() const { return cash_; }
  double value() const { return cash_ + position_.net_quantity * last_price_; }
  double startCash() const { return start_cash_; }
  const Position& position() const { return position_; }

  int fills() const { return fills_; }
  int closedTrades() const { return closed_trades_; }
  int winningTrades() const { return winning_trades_; }

 private:
  // Returns realized PnL produced by this fill.
  static double applyFill(Position& pos, double signed_fill_qty,
                          double fill_price);

  void fill(double signed_qty, double price);

  double start_cash_;
  double commission_;
  double cash_;
  double last_price_{0.0};
  Position position_;

  int fills_{0};
  int closed_trades_{0};
  int winning_trades_{0};
};

}  // namespace gymbridge
