#include "gridbot/risk/risk_controller.hpp"

#include "gridbot/time/time_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace gridbot {

namespace {

constexpr double kNominalFundingRate = 0.0001;
constexpr int kFundingIntervalsPerDay = 3;

double drawdownOf(const domain::RiskState& s) {
  if (s.daily_max_equity <= 0.0) {
    return 0.0;
  }
  return (s.daily_max_equity - s.total_equity) / s.daily_max_equity;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskController::RiskController(IExchangeGateway& gateway, IStateStore& store,
                               const ITimeProvider& time,
                               const domain::RiskLimits& limits,
                               std::string symbol)
    : gateway_(gateway),
      store_(store),
      time_(time),
      limits_(limits),
      symbol_(std::move(symbol)) {}

void RiskController::setKillSwitchListener(KillSwitchListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

// -----------------------------------------------------------------------------
// updateEquityTracking: daily high, then drawdown rule
// -----------------------------------------------------------------------------
bool RiskController::updateEquityTracking() {
  auto wallet = gateway_.getWalletBalance();
  if (!wallet.ok()) {
    std::cerr << "[RiskController] Wallet unavailable: "
              << wallet.error().describe() << "\n";
    return false;
  }
  const double equity = wallet.value().total_equity;
  const std::int64_t today = utc_day_index(time_.now_ms());

  double drawdown = 0.0;
  double daily_max = 0.0;
  {
    std::lock_guard lock(mutex_);
    if (today != state_.last_equity_check_day) {
      state_.daily_max_equity = equity;
      state_.last_equity_check_day = today;
      std::cout << "[RiskController] New UTC day, daily max equity reset to "
                << equity << "\n";
    } else if (equity > state_.daily_max_equity) {
      state_.daily_max_equity = equity;
    }
    state_.total_equity = equity;
    drawdown = drawdownOf(state_);
    daily_max = state_.daily_max_equity;
  }

  if (daily_max > 0.0 && drawdown >= limits_.kill_switch_drawdown_pct) {
    std::ostringstream reason;
    reason << std::fixed << std::setprecision(2) << "Drawdown "
           << drawdown * 100.0 << "% exceeds threshold "
           << limits_.kill_switch_drawdown_pct * 100.0 << "% (Max: "
           << daily_max << ", Current: " << equity << ")";
    triggerKillSwitch(reason.str());
  }
  return true;
}

// -----------------------------------------------------------------------------
// triggerKillSwitch: latch once, cancel once, record once
// -----------------------------------------------------------------------------
bool RiskController::triggerKillSwitch(const std::string& reason) {
  domain::RiskState snapshot;
  KillSwitchListener listener;
  {
    std::lock_guard lock(mutex_);
    if (state_.killSwitchActive()) {
      return false;
    }
    state_.kill_switch = domain::KillSwitchState::Triggered;
    state_.kill_switch_reason = reason;
    snapshot = state_;
    listener = listener_;
  }

  std::cerr << "[RiskController] CRITICAL: KILL SWITCH ACTIVATED: " << reason
            << "\n";

  auto cancelled = gateway_.cancelAllOrders(symbol_);
  if (cancelled.ok()) {
    std::cout << "[RiskController] All orders cancelled\n";
  } else {
    std::cerr << "[RiskController] Cancel after kill switch failed: "
              << cancelled.error().describe() << "\n";
  }

  store_.logEvent("kill_switch", Severity::Critical,
                  "Kill-switch activated: " + reason,
                  {{"equity", snapshot.total_equity},
                   {"daily_max", snapshot.daily_max_equity},
                   {"drawdown_pct", drawdownOf(snapshot) * 100.0},
                   {"orders_cancelled", cancelled.ok()}});

  if (listener) {
    listener(reason);
  }
  return true;
}

bool RiskController::deactivateKillSwitch() {
  double equity = 0.0;
  {
    std::lock_guard lock(mutex_);
    if (!state_.killSwitchActive()) {
      return false;
    }
    state_.kill_switch = domain::KillSwitchState::Normal;
    state_.kill_switch_reason.clear();
    state_.daily_max_equity = state_.total_equity;
    equity = state_.total_equity;
  }
  std::cout << "[RiskController] Kill switch manually deactivated, daily max "
               "equity reset to "
            << equity << "\n";
  store_.logEvent("kill_switch_reset", Severity::Warning,
                  "Kill-switch manually deactivated",
                  {{"daily_max", equity}});
  return true;
}

bool RiskController::isKillSwitchActive() const {
  std::lock_guard lock(mutex_);
  return state_.killSwitchActive();
}

std::string RiskController::killSwitchReason() const {
  std::lock_guard lock(mutex_);
  return state_.kill_switch_reason;
}

// -----------------------------------------------------------------------------
// checkMaxExposure
// -----------------------------------------------------------------------------
bool RiskController::checkMaxExposure() {
  auto positions = gateway_.getPositions(symbol_);
  if (!positions.ok()) {
    std::cerr << "[RiskController] Positions unavailable: "
              << positions.error().describe() << "\n";
    return false;
  }

  double exposure = 0.0;
  for (const auto& p : positions.value()) {
    if (p.size() > 0.0) {
      exposure += p.size() * p.mark_price;
    }
  }

  refreshEquity();

  double equity = 0.0;
  {
    std::lock_guard lock(mutex_);
    state_.current_exposure = exposure;
    equity = state_.total_equity;
  }

  if (equity <= 0.0) {
    std::cerr << "[RiskController] WARNING: total equity is 0, cannot check "
                 "exposure\n";
    return false;
  }

  const double pct = exposure / equity;
  if (pct > limits_.max_exposure_pct) {
    std::cerr << "[RiskController] WARNING: max exposure exceeded: "
              << pct * 100.0 << "% > " << limits_.max_exposure_pct * 100.0
              << "% (" << exposure << " / " << equity << ")\n";
    std::ostringstream msg;
    msg << std::fixed << std::setprecision(1)
        << "Maximum exposure exceeded: " << pct * 100.0 << "%";
    store_.logEvent("max_exposure", Severity::Warning, msg.str(),
                    {{"exposure_usdt", exposure},
                     {"total_equity", equity},
                     {"exposure_pct", pct * 100.0}});
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// Maker check
// -----------------------------------------------------------------------------
bool RiskController::isMakerSafe(domain::Side side, double price,
                                 const domain::Ticker& ticker) {
  if (side == domain::Side::Buy) {
    return ticker.ask <= 0.0 || price < ticker.ask;
  }
  return ticker.bid <= 0.0 || price > ticker.bid;
}

bool RiskController::checkOrderAsMaker(domain::Side side, double price) {
  auto ticker = gateway_.getTicker(symbol_);
  if (!ticker.ok()) {
    std::cerr << "[RiskController] Ticker unavailable, relying on PostOnly: "
              << ticker.error().describe() << "\n";
    return true;
  }
  if (!isMakerSafe(side, price, ticker.value())) {
    std::cerr << "[RiskController] WARNING: " << domain::toString(side)
              << " at " << price << " would cross the spread (bid="
              << ticker.value().bid << ", ask=" << ticker.value().ask
              << ")\n";
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// validateOrderSize
// -----------------------------------------------------------------------------
bool RiskController::validateOrderSize(double qty, double price) {
  double equity = 0.0;
  {
    std::lock_guard lock(mutex_);
    equity = state_.total_equity;
  }
  if (equity <= 0.0 && refreshEquity()) {
    std::lock_guard lock(mutex_);
    equity = state_.total_equity;
  }
  if (equity <= 0.0) {
    return false;
  }

  const double pct = (qty * price) / equity;
  if (pct > limits_.max_position_size_pct) {
    std::cerr << "[RiskController] Order size " << pct * 100.0
              << "% exceeds max " << limits_.max_position_size_pct * 100.0
              << "%\n";
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// metrics / funding / state
// -----------------------------------------------------------------------------
domain::RiskMetrics RiskController::metrics() const {
  std::lock_guard lock(mutex_);
  domain::RiskMetrics m;
  m.total_equity = state_.total_equity;
  m.current_exposure = state_.current_exposure;
  m.exposure_pct = state_.total_equity > 0.0
                       ? state_.current_exposure / state_.total_equity
                       : 0.0;
  m.max_exposure_pct = limits_.max_exposure_pct;
  m.daily_max_equity = state_.daily_max_equity;
  m.drawdown_pct = drawdownOf(state_);
  m.kill_switch_threshold_pct = limits_.kill_switch_drawdown_pct;
  m.available_for_trading =
      std::max(0.0, state_.total_equity * limits_.max_exposure_pct -
                        state_.current_exposure);
  m.kill_switch_active = state_.killSwitchActive();
  m.kill_switch_reason = state_.kill_switch_reason;
  m.within_limits = m.exposure_pct <= limits_.max_exposure_pct &&
                    m.drawdown_pct < limits_.kill_switch_drawdown_pct;
  return m;
}

double RiskController::estimateDailyFundingCost() {
  auto positions = gateway_.getPositions(symbol_);
  if (!positions.ok()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto& p : positions.value()) {
    if (p.size() > 0.0) {
      total += p.notional() * kNominalFundingRate * kFundingIntervalsPerDay;
    }
  }
  return total;
}

domain::RiskState RiskController::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool RiskController::refreshEquity() {
  auto wallet = gateway_.getWalletBalance();
  if (!wallet.ok()) {
    return false;
  }
  std::lock_guard lock(mutex_);
  state_.total_equity = wallet.value().total_equity;
  return true;
}

}  // namespace gridbot
