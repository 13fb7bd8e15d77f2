#pragma once

namespace gridbot {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits
// -----------------------------------------------------------------------------
// Account-level thresholds enforced by RiskController. All three are
// fractions of total equity (0.10 == 10 %).
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Cap on sum(|position size| * mark price) / equity. Breaching it blocks
  /// recenters and new placements; it does not trip the kill switch.
  double max_exposure_pct{0.80};

  /// Drawdown from the day's equity high that latches the kill switch.
  double kill_switch_drawdown_pct{0.10};

  /// Largest single order notional allowed, as a fraction of equity.
  double max_position_size_pct{0.25};
};

}  // namespace domain
}  // namespace gridbot
