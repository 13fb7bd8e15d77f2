#pragma once

#include <string>

namespace gridbot {
namespace domain {

// -----------------------------------------------------------------------------
// InstrumentSpec
// -----------------------------------------------------------------------------
//
// @brief  Exchange trading rules for one contract: the increments the venue
//         accepts and the smallest order it will take.
//
// @details
// Every price the grid sends is floored to tick_size and every quantity to
// qty_step; an order below min_order_qty or whose price * quantity is below
// min_notional is rejected by the venue, so the grid never builds one.
//
// Loaded once per symbol by InstrumentSpecResolver at engine initialization
// and treated as immutable afterwards.
// -----------------------------------------------------------------------------
struct InstrumentSpec {
  std::string symbol;
  double min_order_qty{0.0};
  double qty_step{0.0};
  double tick_size{0.0};
  double min_notional{0.0};

  bool isValid() const {
    return qty_step > 0.0 && tick_size > 0.0 && min_order_qty >= 0.0 &&
           min_notional >= 0.0;
  }
};

}  // namespace domain
}  // namespace gridbot
