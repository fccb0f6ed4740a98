#include "gymbridge/sim/broker.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace gymbridge {

Broker::Broker(double start_cash, double commission)
    : start_cash_(start_cash), commission_(commission), cash_(start_cash) {
  if (!(start_cash > 0.0)) {
    throw std::invalid_argument("Broker: start cash must be positive");
  }
  if (commission < 0.0) {
    throw std::invalid_argument("Broker: commission must be non-negative");
  }
}

// -----------------------------------------------------------------------------
// execute(): map an action to a signed fill
// -----------------------------------------------------------------------------
std::string Broker::execute(const std::string& action, double stake,
                            double price) {
  std::ostringstream os;

  if (action == "hold") {
    return "-";
  }

  double signed_qty = 0.0;
  if (action == "buy") {
    signed_qty = stake;
  } else if (action == "sell") {
    signed_qty = -stake;
  } else if (action == "close") {
    if (position_.net_quantity == 0.0) {
      return "CLOSE ignored: no open position";
    }
    signed_qty = -position_.net_quantity;
  } else {
    return "UNKNOWN action <" + action + "> ignored";
  }

  double pnl_before = position_.realized_pnl;
  fill(signed_qty, price);

  os << (action == "buy" ? "BUY" : action == "sell" ? "SELL" : "CLOSE")
     << " " << std::abs(signed_qty) << " @ " << price;
  if (position_.realized_pnl != pnl_before) {
    os << ", realized " << (position_.realized_pnl - pnl_before);
  }
  return os.str();
}

// -----------------------------------------------------------------------------
// fill(): cash, commission, position and trade counters
// -----------------------------------------------------------------------------
void Broker::fill(double signed_qty, double price) {
  double was = position_.net_quantity;

  cash_ -= signed_qty * price;
  cash_ -= std::abs(signed_qty) * price * commission_;
  last_price_ = price;
  ++fills_;

  double realized = applyFill(position_, signed_qty, price);

  // A trade closes whenever the fill reduces (or flips) an open position.
  bool reduced = was != 0.0 && ((was > 0.0) != (signed_qty > 0.0));
  if (reduced) {
    ++closed_trades_;
    if (realized > 0.0) {
      ++winning_trades_;
    }
  }
}

// -----------------------------------------------------------------------------
// applyFill(): position / PnL arithmetic
// -----------------------------------------------------------------------------
double Broker::applyFill(Position& pos, double signed_fill_qty,
                         double fill_price) {
  double current_qty = pos.net_quantity;

  if (current_qty == 0.0) {
    pos.net_quantity = signed_fill_qty;
    pos.average_price = fill_price;
    return 0.0;
  }

  bool same_direction = (current_qty > 0.0) == (signed_fill_qty > 0.0);
  if (same_direction) {
    double new_total = current_qty + signed_fill_qty;
    pos.average_price = (current_qty * pos.average_price +
                         signed_fill_qty * fill_price) /
                        new_total;
    pos.net_quantity = new_total;
    return 0.0;
  }

  double abs_current = std::abs(current_qty);
  double abs_fill = std::abs(signed_fill_qty);
  double direction_sign = (current_qty > 0.0) ? 1.0 : -1.0;

  if (abs_fill <= abs_current) {
    double pnl = abs_fill * (fill_price - pos.average_price) * direction_sign;
    pos.realized_pnl += pnl;
    pos.net_quantity = current_qty + signed_fill_qty;
    if (pos.net_quantity == 0.0) {
      pos.average_price = 0.0;
    }
    return pnl;
  }

  // Reversal: close everything, open the remainder on the other side.
  double pnl = abs_current * (fill_price - pos.average_price) * direction_sign;
  pos.realized_pnl += pnl;
  double new_direction_sign = (signed_fill_qty > 0.0) ? 1.0 : -1.0;
  pos.net_quantity = new_direction_sign * (abs_fill - abs_current);
  pos.average_price = fill_price;
  return pnl;
}

}  // namespace gymbridge
