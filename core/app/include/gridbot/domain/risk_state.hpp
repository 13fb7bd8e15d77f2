#pragma once

#include <cstdint>
#include <string>

namespace gridbot {
namespace domain {

// -----------------------------------------------------------------------------
// KillSwitchState
// -----------------------------------------------------------------------------
//
//   Normal ──(drawdown >= limit | manual HALT)──> Triggered
//   Triggered ──(explicit deactivateKillSwitch())──> Normal
//
// There is no automatic Triggered -> Normal edge: recovering equity does not
// clear the latch.
// -----------------------------------------------------------------------------
enum class KillSwitchState {
  Normal,
  Triggered,
};

// -----------------------------------------------------------------------------
// RiskState
// -----------------------------------------------------------------------------
//
// @details
// daily_max_equity is reset to the observed equity once per UTC calendar day
// (tracked by last_equity_check_day = epoch days) and only ever rises within
// that day. It is the reference the drawdown is measured against.
//
// Owned by RiskController; copies handed out by RiskController::state() are
// snapshots.
// -----------------------------------------------------------------------------
struct RiskState {
  KillSwitchState kill_switch{KillSwitchState::Normal};
  std::string kill_switch_reason;
  double daily_max_equity{0.0};
  std::int64_t last_equity_check_day{-1};
  double current_exposure{0.0};
  double total_equity{0.0};

  bool killSwitchActive() const {
    return kill_switch == KillSwitchState::Triggered;
  }
};

// -----------------------------------------------------------------------------
// RiskMetrics: derived view reported over IPC and in the status frame
// -----------------------------------------------------------------------------
struct RiskMetrics {
  double total_equity{0.0};
  double current_exposure{0.0};
  double exposure_pct{0.0};
  double max_exposure_pct{0.0};
  double daily_max_equity{0.0};
  double drawdown_pct{0.0};
  double kill_switch_threshold_pct{0.0};
  double available_for_trading{0.0};
  bool kill_switch_active{false};
  std::string kill_switch_reason;
  bool within_limits{false};
};

}  // namespace domain
}  // namespace gridbot
