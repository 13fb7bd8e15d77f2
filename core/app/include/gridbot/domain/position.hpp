#pragma once

#include <cmath>
#include <string>

namespace gridbot {
namespace domain {

// -----------------------------------------------------------------------------
// Position
// -----------------------------------------------------------------------------
// Responsibility: Net position in one perpetual contract as reported by the
// venue, plus the mark price the venue values it at.
//
// net_quantity is signed (+long, -short, 0 flat). Exposure is always
// measured on the absolute size, so a short counts against the exposure cap
// exactly like a long of the same size.
//
// Plain value type: safe to copy across threads.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;          // Instrument identifier (e.g. "BTCUSDT")
  double net_quantity{0.0};    // Signed: +long, -short, 0=flat
  double average_price{0.0};   // Weighted avg entry price of current position
  double mark_price{0.0};      // Venue mark price used for valuation
  double realized_pnl{0.0};    // Cumulative realized profit/loss
  double unrealized_pnl{0.0};  // (mark - avg) * net_quantity

  double size() const { return std::abs(net_quantity); }
  double notional() const { return size() * mark_price; }
};

}  // namespace domain
}  // namespace gridbot
