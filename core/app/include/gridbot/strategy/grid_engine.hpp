#pragma once

#include "gridbot/config/bot_config.hpp"
#include "gridbot/domain/grid_level.hpp"
#include "gridbot/domain/instrument_spec.hpp"
#include "gridbot/domain/order.hpp"
#include "gridbot/gateway/i_exchange_gateway.hpp"
#include "gridbot/instrument/instrument_spec_resolver.hpp"
#include "gridbot/store/i_state_store.hpp"
#include "gridbot/strategy/price_history.hpp"
#include "gridbot/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gridbot {

// -----------------------------------------------------------------------------
// Ladder computation result
// -----------------------------------------------------------------------------
enum class GridBuildStatus {
  Ok,
  InsufficientCapital,  // capital cannot fund two levels at minNotional * 1.1
  NoValidLevels,        // every candidate level failed the notional check
};

inline const char* toString(GridBuildStatus s) {
  switch (s) {
    case GridBuildStatus::Ok:                  return "Ok";
    case GridBuildStatus::InsufficientCapital: return "InsufficientCapital";
    case GridBuildStatus::NoValidLevels:       return "NoValidLevels";
  }
  return "Unknown";
}

struct GridLevelsResult {
  GridBuildStatus status{GridBuildStatus::Ok};
  double spacing{0.0};
  domain::GridLadder buy_levels;   // closest to center first
  domain::GridLadder sell_levels;  // closest to center first

  bool ok() const { return status == GridBuildStatus::Ok; }
};

// -----------------------------------------------------------------------------
// Recenter decision
// -----------------------------------------------------------------------------
// Triggers in priority order; the first one that fires wins.
// -----------------------------------------------------------------------------
enum class RecenterTrigger {
  None,
  NoActiveOrders,
  PriceDeviation,
  TimeElapsed,
  OneSided,
  PumpDump,
};

inline const char* toString(RecenterTrigger t) {
  switch (t) {
    case RecenterTrigger::None:           return "None";
    case RecenterTrigger::NoActiveOrders: return "NoActiveOrders";
    case RecenterTrigger::PriceDeviation: return "PriceDeviation";
    case RecenterTrigger::TimeElapsed:    return "TimeElapsed";
    case RecenterTrigger::OneSided:       return "OneSided";
    case RecenterTrigger::PumpDump:       return "PumpDump";
  }
  return "Unknown";
}

struct RecenterDecision {
  bool trigger{false};
  RecenterTrigger kind{RecenterTrigger::None};
  std::string reason;
  // Quantity the trigger measured: band margin, hours elapsed, share of
  // samples on the dominant side of center, or hourly range. 0 when nothing
  // fired.
  double measured{0.0};
};

// Snapshot reported by STATUS.
struct GridStats {
  double center_price{0.0};
  int num_buy_levels{0};
  int num_sell_levels{0};
  double lowest_buy{0.0};
  double highest_sell{0.0};
  std::size_t active_orders{0};
  std::int64_t last_recenter_ms{0};
  double grid_spacing{0.0};
  std::string profile;
};

// -----------------------------------------------------------------------------
// GridEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns the single grid of the bot: computes ladders, decides when the
//         ladder has drifted away from the market, and replaces it.
//
// @details
// State owned here (one instance per symbol, never copied):
//   center price, buy/sell ladders, active orders (order id -> level),
//   last recenter time, bounded price history.
//
// Setup is split into two phases so that a rebuild is never started from a
// position it cannot finish:
//
//   plan:  fetch mark price -> record sample -> calculateGridLevels()
//          -> require buys and sells       (no venue side effects)
//   apply: cancelAllOrders -> settle delay -> place each level PostOnly
//          -> persist orders, grid snapshot, event
//
// recenterGrid() plans first and only cancels when the plan succeeded, so a
// price-fetch or capital failure leaves the existing ladder resting.
//
// Every placement carries an order_link_id "grid-<planMs>-<gen>-<B|S><n>",
// which makes a retried placement idempotent at the venue.
//
// Thread model:
//   setupGrid()/recenterGrid() are serialized by the caller (GridBot holds
//   its order-flow mutex around them). Accessors and the decision functions
//   may be called from any thread; an internal mutex guards the grid state
//   and is never held across a gateway call.
//
// Ownership:
//   Holds non-owning references to the gateway, store, resolver, clock and
//   config; all outlive the engine.
// -----------------------------------------------------------------------------
class GridEngine {
 public:
  GridEngine(IExchangeGateway& gateway, IStateStore& store,
             InstrumentSpecResolver& resolver, const ITimeProvider& time,
             const BotConfig& config);

  GridEngine(const GridEngine&) = delete;
  GridEngine& operator=(const GridEngine&) = delete;
  GridEngine(GridEngine&&) = delete;
  GridEngine& operator=(GridEngine&&) = delete;

  // -------------------------------------------------------------------------
  // initialize()
  // -------------------------------------------------------------------------
  // @brief  Loads the instrument spec and adopts the last persisted center.
  //
  // @details
  // The last recenter time starts at "now", so the time-based trigger first
  // fires time_based_hours after startup.
  //
  // @throws InstrumentSpecError if the venue cannot supply a usable spec.
  // -------------------------------------------------------------------------
  void initialize();

  // -------------------------------------------------------------------------
  // calculateGridLevels(center, profile, capital)
  // -------------------------------------------------------------------------
  //
  // @brief  Computes the ladder for a center price without touching the
  //         venue.
  //
  // @param  center_price       > 0.
  // @param  profile            Name of a configured GridProfile.
  // @param  available_capital  Quote currency to spread across the levels.
  //
  // @return Levels closest to center first, or a non-Ok status with both
  //         ladders empty.
  //
  // @details
  //   1. spacing = gridSpacing(profile)
  //   2. maxLevels = floor(capital / (minNotional * 1.1)); < 2 fails with
  //      InsufficientCapital; < 2*target splits maxLevels/2 per side.
  //   3. budget = capital / (buys + sells)
  //   4. buy i:  price = floorToTick(center * (1 - spacing*i))
  //      sell i: price = floorToTick(center * (1 + spacing*i))
  //      qty = floorToStep(max(budget/price, minQty, minNotional/price))
  //      A level with qty <= 0 or qty*price < minNotional is skipped, as
  //      is one the tick floor puts on the wrong side of center or on the
  //      previous rung's price.
  //   5. Both ladders empty -> NoValidLevels.
  //
  // @throws std::invalid_argument for an unknown profile.
  // -------------------------------------------------------------------------
  GridLevelsResult calculateGridLevels(double center_price,
                                       const std::string& profile,
                                       double available_capital) const;

  // -------------------------------------------------------------------------
  // gridSpacing(profile)
  // -------------------------------------------------------------------------
  // Profile base spacing, widened by volatility_multiplier (capped at
  // grid_spacing_max) while volatilityProxy() exceeds volatility_threshold.
  // Throws std::invalid_argument for an unknown profile.
  // -------------------------------------------------------------------------
  double gridSpacing(const std::string& profile) const;

  // Mean |consecutive price delta| over the last 2 * volatility_period
  // samples as a fraction of the current center. 0 until enough samples
  // exist or while no center is set.
  double volatilityProxy() const;

  // Appends a sample stamped with the engine clock.
  void recordPrice(double price);

  // -------------------------------------------------------------------------
  // evaluateRecenter(price, open_orders)
  // -------------------------------------------------------------------------
  //
  // @brief  Pure recenter decision over a fresh price and the venue's live
  //         order set.
  //
  // @details
  // Priority:
  //   1. no open orders
  //   2. price > highestSell * (1 + dev)  or  price < lowestBuy * (1 - dev)
  //      (a side without resting orders contributes no band edge)
  //   3. hours since last recenter >= time_based_hours
  //   4. >= 60 samples and the share of samples above center within the last
  //      one_side_hours is > 0.8 or < 0.2
  //   5. >= 60 samples and (max - min) / min over the last hour >=
  //      pump_dump_pct
  // -------------------------------------------------------------------------
  RecenterDecision evaluateRecenter(
      double price, const std::vector<domain::OpenOrder>& open_orders) const;

  // Fetches mark price (recording it) and open orders, then forwards to
  // evaluateRecenter(). A gateway failure yields no trigger.
  RecenterDecision shouldRecenter();

  // -------------------------------------------------------------------------
  // setupGrid(profile)
  // -------------------------------------------------------------------------
  // @brief  Builds a fresh ladder around the current mark price.
  //
  // @return true when at least one order rests after the call.
  //
  // @throws std::invalid_argument for an unknown profile (before any I/O).
  // Side-effects: cancels every open order for the symbol; on success
  // lastRecenterMs() restarts from now.
  // -------------------------------------------------------------------------
  bool setupGrid(const std::string& profile);

  // -------------------------------------------------------------------------
  // recenterGrid(reason, profile)
  // -------------------------------------------------------------------------
  // @brief  Replaces the ladder. Logs a "recenter" event first.
  //
  // @details
  // The new ladder is planned before anything is cancelled. A failed plan
  // logs an ERROR "recenter_failed" event and keeps the old orders. If the
  // plan succeeded but no order could be placed after cancelling, an ERROR
  // event is logged and the next grid cycle recovers through the
  // no-active-orders trigger. lastRecenterMs() moves only on success.
  //
  // @throws std::invalid_argument for an unknown profile (before any I/O).
  // -------------------------------------------------------------------------
  bool recenterGrid(const std::string& reason, const std::string& profile);

  GridStats stats() const;
  double centerPrice() const;
  std::int64_t lastRecenterMs() const;
  std::size_t activeOrderCount() const;
  std::size_t historySize() const;

  // Ladder level an order was placed for, if it belongs to the current grid
  // or to the ladder the last setup or recenter cancelled (a fill can land
  // between the venue match and the cancel).
  std::optional<domain::GridLevel> levelForOrder(
      const std::string& order_id) const;

  // Valid after initialize().
  domain::InstrumentSpec instrumentSpec() const;

 private:
  struct GridPlan {
    std::string profile;
    double center_price{0.0};
    GridLevelsResult levels;
    std::int64_t planned_ms{0};
  };

  // Phase 1: fresh price + ladder. nullopt (with a log line in *why) on
  // failure; no venue side effects.
  std::optional<GridPlan> planGrid(const std::string& profile,
                                   std::string* why);

  // Phase 2: cancel, settle, place, persist. Returns the number of orders
  // placed, 0 when every placement failed, -1 when the cancel failed (the
  // grid is then left untouched).
  int applyPlan(const GridPlan& plan, int settle_delay_ms,
                const std::string& reason);

  bool placeLevel(const GridPlan& plan, int generation,
                  const domain::GridLevel& level);

  // Both measure volatility against reference_price (the candidate center
  // while planning, the current center otherwise).
  double gridSpacingLocked(const GridProfile& profile,
                           double reference_price) const;
  double volatilityProxyLocked(double reference_price) const;
  void sleepMs(int ms) const;

  IExchangeGateway& gateway_;
  IStateStore& store_;
  InstrumentSpecResolver& resolver_;
  const ITimeProvider& time_;
  const BotConfig& config_;

  mutable std::mutex mutex_;
  domain::InstrumentSpec spec_;
  double center_price_{0.0};
  domain::GridLadder buy_levels_;
  domain::GridLadder sell_levels_;
  std::map<std::string, domain::GridLevel> active_orders_;
  std::map<std::string, domain::GridLevel> retired_orders_;
  std::int64_t last_recenter_ms_{0};
  std::string profile_;
  double spacing_{0.0};
  int generation_{0};
  PriceHistory history_;
};

}  // namespace gridbot
