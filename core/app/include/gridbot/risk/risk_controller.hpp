#pragma once

#include "gridbot/domain/account.hpp"
#include "gridbot/domain/order.hpp"
#include "gridbot/domain/risk_limits.hpp"
#include "gridbot/domain/risk_state.hpp"
#include "gridbot/gateway/i_exchange_gateway.hpp"
#include "gridbot/store/i_state_store.hpp"
#include "gridbot/time/i_time_provider.hpp"

#include <functional>
#include <mutex>
#include <string>

namespace gridbot {

// -----------------------------------------------------------------------------
// RiskController
// -----------------------------------------------------------------------------
//
// @brief  Capital-preservation rules that sit beside the grid strategy:
//         a drawdown kill switch, an exposure cap, a per-order size cap, and
//         a maker (post-only) pre-check.
//
// @details
// Kill switch (latched):
//
//   Normal ──(drawdown >= kill_switch_drawdown_pct | manual HALT)──> Triggered
//   Triggered ──(deactivateKillSwitch())──> Normal
//
//   drawdown = (dailyMaxEquity - equity) / dailyMaxEquity, dailyMax > 0.
//   dailyMaxEquity resets to the observed equity on the first update of each
//   UTC day (and on the very first update) and only rises within a day.
//
//   The Normal -> Triggered edge cancels every open order and persists a
//   CRITICAL "kill_switch" event. The check-and-set happens under the
//   controller's mutex, so concurrent triggers cancel exactly once and the
//   first reason is kept.
//
//   Deactivation resets dailyMaxEquity to the current equity so the stale
//   high does not immediately re-trigger.
//
// Exposure cap: sum(size * mark) / equity > max_exposure_pct blocks recenter
// and new placements. It never touches the kill switch.
//
// Thread model:
//   Called from the risk monitor, grid monitor, fill monitor and the IPC
//   thread. The mutex guards RiskState only and is never held across a
//   gateway or store call.
//
// Ownership:
//   Owns RiskState. Holds references to the gateway, store and clock.
// -----------------------------------------------------------------------------
class RiskController {
 public:
  // Called once per Normal -> Triggered transition, after the cancel.
  using KillSwitchListener = std::function<void(const std::string& reason)>;

  RiskController(IExchangeGateway& gateway, IStateStore& store,
                 const ITimeProvider& time, const domain::RiskLimits& limits,
                 std::string symbol);

  RiskController(const RiskController&) = delete;
  RiskController& operator=(const RiskController&) = delete;
  RiskController(RiskController&&) = delete;
  RiskController& operator=(RiskController&&) = delete;

  void setKillSwitchListener(KillSwitchListener listener);

  // -------------------------------------------------------------------------
  // updateEquityTracking()
  // -------------------------------------------------------------------------
  // @brief  Refreshes equity from the wallet, rolls the daily high, and
  //         evaluates the drawdown rule.
  //
  // @return false when the wallet could not be fetched (state unchanged).
  //
  // Side-effects: may trigger the kill switch.
  // -------------------------------------------------------------------------
  bool updateEquityTracking();

  // -------------------------------------------------------------------------
  // triggerKillSwitch(reason)
  // -------------------------------------------------------------------------
  // @return true if this call performed the Normal -> Triggered transition;
  //         false if the switch was already latched (no cancel, reason kept).
  // -------------------------------------------------------------------------
  bool triggerKillSwitch(const std::string& reason);

  // Returns true if the switch was active. No-op (false) otherwise.
  bool deactivateKillSwitch();

  bool isKillSwitchActive() const;
  std::string killSwitchReason() const;

  // -------------------------------------------------------------------------
  // checkMaxExposure()
  // -------------------------------------------------------------------------
  // @return true when exposure is within max_exposure_pct. false on breach
  //         (a WARNING "max_exposure" event is persisted), when equity is not
  //         positive, or when positions cannot be fetched.
  // -------------------------------------------------------------------------
  bool checkMaxExposure();

  // false if a buy at `price` would reach the best ask or a sell the best
  // bid. A side whose quote is missing (<= 0) is not checked.
  static bool isMakerSafe(domain::Side side, double price,
                          const domain::Ticker& ticker);

  // isMakerSafe() against a fresh ticker. A ticker failure returns true:
  // the order is PostOnly and the venue rejects it rather than take.
  bool checkOrderAsMaker(domain::Side side, double price);

  // false if qty * price exceeds max_position_size_pct of equity, or if
  // equity is unknown and cannot be fetched.
  bool validateOrderSize(double qty, double price);

  // Derived view of the last observed state. No I/O.
  domain::RiskMetrics metrics() const;

  // sum(position value) * 0.0001 * 3: a nominal 0.01% funding rate over
  // three funding intervals per day. 0 when positions are unavailable.
  double estimateDailyFundingCost();

  domain::RiskState state() const;
  const domain::RiskLimits& limits() const { return limits_; }

 private:
  // Refreshes total equity if the wallet answers.
  bool refreshEquity();

  IExchangeGateway& gateway_;
  IStateStore& store_;
  const ITimeProvider& time_;
  const domain::RiskLimits limits_;
  const std::string symbol_;

  mutable std::mutex mutex_;
  domain::RiskState state_;
  KillSwitchListener listener_;
};

}  // namespace gridbot
