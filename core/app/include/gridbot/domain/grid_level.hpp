#pragma once

#include "gridbot/domain/order.hpp"

#include <vector>

namespace gridbot {
namespace domain {

// -----------------------------------------------------------------------------
// GridLevel
// -----------------------------------------------------------------------------
//
// @brief  One rung of the ladder: a price, a size, and which side of the
//         center it sits on.
//
// @details
// level_index is signed: -1, -2, ... for buys (below center), +1, +2, ...
// for sells (above center). Its magnitude is the distance from center in
// units of grid spacing. Because levels that fail the notional check are
// skipped rather than replaced, indices in a ladder may have gaps.
//
// Invariants (established by GridEngine::calculateGridLevels):
//   - notional == price * quantity >= InstrumentSpec::min_notional
//   - Buy  => price < center
//   - Sell => price > center
// -----------------------------------------------------------------------------
struct GridLevel {
  int level_index{0};
  double price{0.0};
  double quantity{0.0};
  Side side{Side::Buy};
  double notional{0.0};
};

using GridLadder = std::vector<GridLevel>;

}  // namespace domain
}  // namespace gridbot
