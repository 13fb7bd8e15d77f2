#include "gridbot/strategy/grid_engine.hpp"

#include "gridbot/gateway/price_format.hpp"
#include "gridbot/time/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace gridbot {

namespace {

// History needed before the one-sided and pump/dump checks run (one hour of
// one-minute samples).
constexpr std::size_t kMinSamplesForTrend = 60;
constexpr double kOneSidedUpper = 0.8;
constexpr double kOneSidedLower = 0.2;

// Per-level notional headroom over the venue minimum.
constexpr double kNotionalBuffer = 1.1;

std::string fixed4(double v) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << v;
  return out.str();
}

std::string percent(double fraction, int decimals) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(decimals) << fraction * 100.0 << "%";
  return out.str();
}

std::string linkId(std::int64_t planned_ms, int generation,
                   const domain::GridLevel& level) {
  std::ostringstream out;
  out << "grid-" << planned_ms << "-" << generation << "-"
      << (level.side == domain::Side::Buy ? "B" : "S")
      << std::abs(level.level_index);
  return out.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
GridEngine::GridEngine(IExchangeGateway& gateway, IStateStore& store,
                       InstrumentSpecResolver& resolver,
                       const ITimeProvider& time, const BotConfig& config)
    : gateway_(gateway),
      store_(store),
      resolver_(resolver),
      time_(time),
      config_(config),
      history_(config.grid.max_history_points) {}

// -----------------------------------------------------------------------------
// initialize: instrument spec, last persisted center, recenter clock
// -----------------------------------------------------------------------------
void GridEngine::initialize() {
  domain::InstrumentSpec spec = resolver_.resolve(config_.trading.symbol);
  std::optional<GridSnapshot> last = store_.getLatestGrid();

  std::lock_guard lock(mutex_);
  spec_ = spec;
  last_recenter_ms_ = time_.now_ms();
  if (last && last->center_price > 0.0) {
    center_price_ = last->center_price;
    std::cout << "[GridEngine] Restored center " << fixed4(center_price_)
              << " from grid history\n";
  }
  std::cout << "[GridEngine] Initialized for " << config_.trading.symbol
            << "\n";
}

// -----------------------------------------------------------------------------
// Volatility / spacing
// -----------------------------------------------------------------------------
double GridEngine::volatilityProxyLocked(double reference_price) const {
  const std::size_t window =
      static_cast<std::size_t>(std::max(config_.grid.volatility_period, 1)) * 2;
  if (history_.size() < window || reference_price <= 0.0) {
    return 0.0;
  }
  std::vector<double> prices = history_.lastPrices(window);
  double sum = 0.0;
  for (std::size_t i = 1; i < prices.size(); ++i) {
    sum += std::abs(prices[i] - prices[i - 1]);
  }
  const double mean = sum / static_cast<double>(prices.size() - 1);
  return mean / reference_price;
}

double GridEngine::gridSpacingLocked(const GridProfile& profile,
                                     double reference_price) const {
  const double vol = volatilityProxyLocked(reference_price);
  if (vol > config_.grid.volatility_threshold) {
    return std::min(profile.grid_spacing * config_.grid.volatility_multiplier,
                    config_.grid.grid_spacing_max);
  }
  return profile.grid_spacing;
}

double GridEngine::volatilityProxy() const {
  std::lock_guard lock(mutex_);
  return volatilityProxyLocked(center_price_);
}

double GridEngine::gridSpacing(const std::string& profile) const {
  const GridProfile& p = config_.grid.profile(profile);
  std::lock_guard lock(mutex_);
  return gridSpacingLocked(p, center_price_);
}

void GridEngine::recordPrice(double price) {
  std::lock_guard lock(mutex_);
  history_.record(price, time_.now_ms());
}

// -----------------------------------------------------------------------------
// calculateGridLevels
// -----------------------------------------------------------------------------
GridLevelsResult GridEngine::calculateGridLevels(
    double center_price, const std::string& profile,
    double available_capital) const {
  const GridProfile& p = config_.grid.profile(profile);

  domain::InstrumentSpec spec;
  GridLevelsResult result;
  {
    std::lock_guard lock(mutex_);
    spec = spec_;
    result.spacing = gridSpacingLocked(p, center_price);
  }

  if (center_price <= 0.0) {
    result.status = GridBuildStatus::NoValidLevels;
    return result;
  }

  // --- Achievable level count -----------------------------------------------
  const double min_budget = spec.min_notional * kNotionalBuffer;
  const int max_levels =
      min_budget > 0.0
          ? static_cast<int>(std::floor(available_capital / min_budget))
          : 2 * p.target_levels;
  if (max_levels < 2) {
    std::cerr << "[GridEngine] Capital " << available_capital
              << " too small; need at least " << min_budget * 2.0 << "\n";
    result.status = GridBuildStatus::InsufficientCapital;
    return result;
  }

  int per_side = p.target_levels;
  if (max_levels < 2 * p.target_levels) {
    per_side = max_levels / 2;
    std::cerr << "[GridEngine] WARNING: capital limited, using " << per_side
              << " levels per side\n";
  }

  const double budget = available_capital / static_cast<double>(2 * per_side);

  // --- Rungs --------------------------------------------------------------
  auto build = [&](domain::Side side, int i) -> std::optional<domain::GridLevel> {
    const double factor = side == domain::Side::Buy
                              ? 1.0 - result.spacing * i
                              : 1.0 + result.spacing * i;
    const double price = floorToStep(center_price * factor, spec.tick_size);
    // A coarse tick can floor a rung onto (or across) the center.
    const bool wrong_side = side == domain::Side::Buy ? price >= center_price
                                                      : price <= center_price;
    if (price <= 0.0 || wrong_side) {
      return std::nullopt;
    }
    double qty = std::max({budget / price, spec.min_order_qty,
                           spec.min_notional / price});
    qty = floorToStep(qty, spec.qty_step);
    if (qty <= 0.0 || qty * price < spec.min_notional) {
      std::cerr << "[GridEngine] WARNING: skipping " << domain::toString(side)
                << " level " << i << ": qty=" << qty
                << " notional=" << qty * price << " < " << spec.min_notional
                << "\n";
      return std::nullopt;
    }
    domain::GridLevel level;
    level.level_index = side == domain::Side::Buy ? -i : i;
    level.price = price;
    level.quantity = qty;
    level.side = side;
    level.notional = qty * price;
    return level;
  };

  // Rungs that floor onto the previous rung's price are dropped.
  auto append = [](domain::GridLadder& ladder, const domain::GridLevel& level) {
    if (ladder.empty() || ladder.back().price != level.price) {
      ladder.push_back(level);
    }
  };
  for (int i = 1; i <= per_side; ++i) {
    if (auto level = build(domain::Side::Buy, i)) {
      append(result.buy_levels, *level);
    }
  }
  for (int i = 1; i <= per_side; ++i) {
    if (auto level = build(domain::Side::Sell, i)) {
      append(result.sell_levels, *level);
    }
  }

  if (result.buy_levels.empty() && result.sell_levels.empty()) {
    std::cerr << "[GridEngine] No valid levels with capital "
              << available_capital << "\n";
    result.status = GridBuildStatus::NoValidLevels;
    return result;
  }

  std::cout << "[GridEngine] Ladder: center=" << fixed4(center_price)
            << " spacing=" << percent(result.spacing, 2) << " "
            << result.buy_levels.size() << " buy + "
            << result.sell_levels.size() << " sell, budget/level=" << budget
            << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// evaluateRecenter: first satisfied trigger wins
// -----------------------------------------------------------------------------
RecenterDecision GridEngine::evaluateRecenter(
    double price, const std::vector<domain::OpenOrder>& open_orders) const {
  RecenterDecision d;

  // --- 1. No resting orders ------------------------------------------------
  if (open_orders.empty()) {
    d.trigger = true;
    d.kind = RecenterTrigger::NoActiveOrders;
    d.reason = "No active orders found";
    return d;
  }

  // --- 2. Band deviation ---------------------------------------------------
  std::optional<double> lowest_buy;
  std::optional<double> highest_sell;
  for (const auto& o : open_orders) {
    if (o.side == domain::Side::Buy) {
      lowest_buy = lowest_buy ? std::min(*lowest_buy, o.price) : o.price;
    } else {
      highest_sell = highest_sell ? std::max(*highest_sell, o.price) : o.price;
    }
  }

  const RecenterConfig& rc = config_.recenter;
  const double dev = rc.price_deviation_pct;
  if (highest_sell && price > *highest_sell * (1.0 + dev)) {
    d.trigger = true;
    d.kind = RecenterTrigger::PriceDeviation;
    d.measured = price / *highest_sell - 1.0;
    d.reason = "Price " + fixed4(price) + " > highest sell " +
               fixed4(*highest_sell) + " + " + percent(dev, 1) +
               " (margin " + percent(d.measured, 2) + ")";
    return d;
  }
  if (lowest_buy && price < *lowest_buy * (1.0 - dev)) {
    d.trigger = true;
    d.kind = RecenterTrigger::PriceDeviation;
    d.measured = 1.0 - price / *lowest_buy;
    d.reason = "Price " + fixed4(price) + " < lowest buy " +
               fixed4(*lowest_buy) + " - " + percent(dev, 1) + " (margin " +
               percent(d.measured, 2) + ")";
    return d;
  }

  const std::int64_t now = time_.now_ms();
  std::lock_guard lock(mutex_);

  // --- 3. Time since last recenter -------------------------------------------
  const double hours = ms_to_hours(now - last_recenter_ms_);
  if (hours >= rc.time_based_hours) {
    std::ostringstream reason;
    reason << "Time-based recenter: " << std::fixed << std::setprecision(1)
           << hours << "h >= " << rc.time_based_hours << "h";
    d.trigger = true;
    d.kind = RecenterTrigger::TimeElapsed;
    d.measured = hours;
    d.reason = reason.str();
    return d;
  }

  if (history_.size() < kMinSamplesForTrend) {
    return d;
  }

  // --- 4. One-sided dominance ------------------------------------------------
  if (center_price_ > 0.0) {
    std::vector<PricePoint> window =
        history_.since(now - hours_to_ms(rc.one_side_hours));
    if (!window.empty()) {
      const auto above = std::count_if(
          window.begin(), window.end(),
          [this](const PricePoint& p) { return p.price > center_price_; });
      const double above_pct =
          static_cast<double>(above) / static_cast<double>(window.size());
      std::ostringstream hrs;
      hrs << rc.one_side_hours;
      if (above_pct > kOneSidedUpper) {
        d.trigger = true;
        d.kind = RecenterTrigger::OneSided;
        d.measured = above_pct;
        d.reason = "Price above center " + percent(above_pct, 0) +
                   " of last " + hrs.str() + "h";
        return d;
      }
      if (above_pct < kOneSidedLower) {
        d.trigger = true;
        d.kind = RecenterTrigger::OneSided;
        d.measured = 1.0 - above_pct;
        d.reason = "Price below center " + percent(1.0 - above_pct, 0) +
                   " of last " + hrs.str() + "h";
        return d;
      }
    }
  }

  // --- 5. Pump / dump within the last hour -------------------------------------
  std::vector<PricePoint> hour = history_.since(now - kMsPerHour);
  if (!hour.empty()) {
    auto [lo, hi] = std::minmax_element(
        hour.begin(), hour.end(), [](const PricePoint& a, const PricePoint& b) {
          return a.price < b.price;
        });
    if (lo->price > 0.0) {
      const double range = (hi->price - lo->price) / lo->price;
      if (range >= rc.pump_dump_pct) {
        d.trigger = true;
        d.kind = RecenterTrigger::PumpDump;
        d.measured = range;
        d.reason = "Pump/dump detected: " + percent(range, 1) + " in 1h";
        return d;
      }
    }
  }

  return d;
}

// -----------------------------------------------------------------------------
// shouldRecenter: fresh venue state, then the pure decision
// -----------------------------------------------------------------------------
RecenterDecision GridEngine::shouldRecenter() {
  const std::string& symbol = config_.trading.symbol;

  auto price = gateway_.getMarkPrice(symbol);
  if (!price.ok() || price.value() <= 0.0) {
    std::cerr << "[GridEngine] Recenter check skipped: no mark price"
              << (price.ok() ? std::string() : ": " + price.error().describe())
              << "\n";
    return {};
  }
  recordPrice(price.value());

  auto orders = gateway_.getOpenOrders(symbol);
  if (!orders.ok()) {
    std::cerr << "[GridEngine] Recenter check skipped: open orders: "
              << orders.error().describe() << "\n";
    return {};
  }

  return evaluateRecenter(price.value(), orders.value());
}

// -----------------------------------------------------------------------------
// planGrid: fresh price and a two-sided ladder, nothing sent to the venue
// -----------------------------------------------------------------------------
std::optional<GridEngine::GridPlan> GridEngine::planGrid(
    const std::string& profile, std::string* why) {
  const std::string& symbol = config_.trading.symbol;

  auto price = gateway_.getMarkPrice(symbol);
  if (!price.ok()) {
    *why = "mark price unavailable: " + price.error().describe();
    return std::nullopt;
  }
  if (price.value() <= 0.0) {
    *why = "non-positive mark price " + fixed4(price.value());
    return std::nullopt;
  }
  recordPrice(price.value());

  const double capital = config_.trading.initial_capital;
  auto wallet = gateway_.getWalletBalance();
  if (wallet.ok() && wallet.value().available_balance < capital) {
    std::cerr << "[GridEngine] WARNING: available balance "
              << wallet.value().available_balance
              << " below configured capital " << capital << "\n";
  }

  GridPlan plan;
  plan.profile = profile;
  plan.center_price = price.value();
  plan.planned_ms = time_.now_ms();
  plan.levels = calculateGridLevels(plan.center_price, profile, capital);

  if (!plan.levels.ok()) {
    *why = std::string("ladder not computable: ") +
           toString(plan.levels.status);
    return std::nullopt;
  }
  if (plan.levels.buy_levels.empty() || plan.levels.sell_levels.empty()) {
    *why = "ladder is one-sided (" +
           std::to_string(plan.levels.buy_levels.size()) + " buy, " +
           std::to_string(plan.levels.sell_levels.size()) + " sell)";
    return std::nullopt;
  }
  return plan;
}

// -----------------------------------------------------------------------------
// applyPlan: cancel, settle, place, persist
// -----------------------------------------------------------------------------
int GridEngine::applyPlan(const GridPlan& plan, int settle_delay_ms,
                          const std::string& reason) {
  const std::string& symbol = config_.trading.symbol;

  auto cancelled = gateway_.cancelAllOrders(symbol);
  if (!cancelled.ok()) {
    std::cerr << "[GridEngine] cancelAllOrders failed, keeping grid: "
              << cancelled.error().describe() << "\n";
    return -1;
  }

  int generation = 0;
  std::vector<std::string> cancelled_ids;
  {
    std::lock_guard lock(mutex_);
    for (const auto& entry : active_orders_) {
      cancelled_ids.push_back(entry.first);
    }
    retired_orders_ = std::move(active_orders_);
    active_orders_.clear();
    center_price_ = plan.center_price;
    buy_levels_ = plan.levels.buy_levels;
    sell_levels_ = plan.levels.sell_levels;
    spacing_ = plan.levels.spacing;
    profile_ = plan.profile;
    generation = ++generation_;
  }
  for (const auto& id : cancelled_ids) {
    store_.updateOrderStatus(id, domain::OrderStatus::Canceled, std::nullopt);
  }

  sleepMs(settle_delay_ms);

  int buys = 0;
  int sells = 0;
  for (const auto& level : plan.levels.buy_levels) {
    if (placeLevel(plan, generation, level)) {
      ++buys;
    }
    sleepMs(config_.grid.order_spacing_ms);
  }
  for (const auto& level : plan.levels.sell_levels) {
    if (placeLevel(plan, generation, level)) {
      ++sells;
    }
    sleepMs(config_.grid.order_spacing_ms);
  }

  std::cout << "[GridEngine] Placed " << buys << " buy + " << sells
            << " sell orders around " << fixed4(plan.center_price) << "\n";

  if (buys + sells == 0) {
    return 0;
  }

  GridSnapshot snap;
  snap.center_price = plan.center_price;
  snap.lowest_buy = plan.levels.buy_levels.back().price;
  snap.highest_sell = plan.levels.sell_levels.back().price;
  snap.num_buy_levels = static_cast<int>(plan.levels.buy_levels.size());
  snap.num_sell_levels = static_cast<int>(plan.levels.sell_levels.size());
  snap.grid_spacing = plan.levels.spacing;
  snap.profile = plan.profile;
  snap.reason = reason;
  snap.created_ms = time_.now_ms();
  store_.saveGridHistory(snap);

  store_.logEvent(
      "grid_setup", Severity::Info,
      "Grid initialized with " + std::to_string(snap.num_buy_levels) +
          " BUY + " + std::to_string(snap.num_sell_levels) + " SELL levels",
      {{"center_price", plan.center_price},
       {"profile", plan.profile},
       {"orders_placed", buys + sells}});
  return buys + sells;
}

bool GridEngine::placeLevel(const GridPlan& plan, int generation,
                            const domain::GridLevel& level) {
  domain::OrderRequest req;
  req.symbol = config_.trading.symbol;
  req.side = level.side;
  req.type = domain::OrderType::Limit;
  req.quantity = level.quantity;
  req.price = level.price;
  req.time_in_force = domain::TimeInForce::PostOnly;
  req.order_link_id = linkId(plan.planned_ms, generation, level);

  auto placed = gateway_.placeOrder(req);
  if (!placed.ok()) {
    std::cerr << "[GridEngine] " << domain::toString(level.side)
              << " level " << level.level_index << " @ " << level.price
              << " rejected: " << placed.error().describe() << "\n";
    return false;
  }

  {
    std::lock_guard lock(mutex_);
    active_orders_[placed.value()] = level;
  }

  OrderRecord rec;
  rec.order_id = placed.value();
  rec.order_link_id = req.order_link_id;
  rec.symbol = req.symbol;
  rec.side = level.side;
  rec.price = level.price;
  rec.quantity = level.quantity;
  rec.status = domain::OrderStatus::New;
  rec.grid_level = level.level_index;
  rec.created_ms = time_.now_ms();
  store_.saveOrder(rec);
  return true;
}

// -----------------------------------------------------------------------------
// setupGrid
// -----------------------------------------------------------------------------
bool GridEngine::setupGrid(const std::string& profile) {
  config_.grid.profile(profile);  // unknown names throw before any I/O

  std::string why;
  auto plan = planGrid(profile, &why);
  if (!plan) {
    std::cerr << "[GridEngine] Grid setup failed: " << why << "\n";
    store_.logEvent("grid_setup_failed", Severity::Error,
                    "Grid setup failed: " + why, {{"profile", profile}});
    return false;
  }

  const int placed = applyPlan(*plan, config_.grid.settle_delay_ms,
                               "Initial setup with " + profile + " profile");
  if (placed <= 0) {
    store_.logEvent("grid_setup_failed", Severity::Error,
                    placed < 0 ? "Grid setup failed: could not cancel "
                                 "existing orders"
                               : "Grid setup placed no orders",
                    {{"profile", profile},
                     {"center_price", plan->center_price}});
    return false;
  }

  {
    std::lock_guard lock(mutex_);
    last_recenter_ms_ = time_.now_ms();
  }
  return true;
}

// -----------------------------------------------------------------------------
// recenterGrid: plan, then cancel and rebuild
// -----------------------------------------------------------------------------
bool GridEngine::recenterGrid(const std::string& reason,
                              const std::string& profile) {
  config_.grid.profile(profile);  // unknown names throw before any I/O

  const double old_center = centerPrice();
  std::cout << "[GridEngine] Recentering grid. Reason: " << reason << "\n";
  store_.logEvent("recenter", Severity::Info,
                  "Grid recenter triggered: " + reason,
                  {{"old_center", old_center}, {"profile", profile}});

  std::string why;
  auto plan = planGrid(profile, &why);
  if (!plan) {
    std::cerr << "[GridEngine] Recenter aborted, existing orders kept: "
              << why << "\n";
    store_.logEvent("recenter_failed", Severity::Error,
                    "Recenter aborted before cancelling: " + why,
                    {{"old_center", old_center}, {"reason", reason}});
    return false;
  }

  const int placed =
      applyPlan(*plan, config_.grid.recenter_settle_delay_ms, reason);
  if (placed < 0) {
    store_.logEvent("recenter_failed", Severity::Error,
                    "Recenter aborted: cancel failed, existing orders kept",
                    {{"old_center", old_center}, {"reason", reason}});
    return false;
  }
  if (placed == 0) {
    std::cerr << "[GridEngine] Recenter left the grid empty\n";
    store_.logEvent("recenter_failed", Severity::Error,
                    "Orders cancelled but no replacement could be placed",
                    {{"old_center", old_center},
                     {"new_center", plan->center_price},
                     {"reason", reason}});
    return false;
  }

  {
    std::lock_guard lock(mutex_);
    last_recenter_ms_ = time_.now_ms();
  }
  std::cout << "[GridEngine] Grid recentered at " << fixed4(plan->center_price)
            << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
GridStats GridEngine::stats() const {
  std::lock_guard lock(mutex_);
  GridStats s;
  s.center_price = center_price_;
  s.num_buy_levels = static_cast<int>(buy_levels_.size());
  s.num_sell_levels = static_cast<int>(sell_levels_.size());
  s.lowest_buy = buy_levels_.empty() ? 0.0 : buy_levels_.back().price;
  s.highest_sell = sell_levels_.empty() ? 0.0 : sell_levels_.back().price;
  s.active_orders = active_orders_.size();
  s.last_recenter_ms = last_recenter_ms_;
  s.grid_spacing = spacing_;
  s.profile = profile_;
  return s;
}

double GridEngine::centerPrice() const {
  std::lock_guard lock(mutex_);
  return center_price_;
}

std::int64_t GridEngine::lastRecenterMs() const {
  std::lock_guard lock(mutex_);
  return last_recenter_ms_;
}

std::size_t GridEngine::activeOrderCount() const {
  std::lock_guard lock(mutex_);
  return active_orders_.size();
}

std::size_t GridEngine::historySize() const {
  std::lock_guard lock(mutex_);
  return history_.size();
}

std::optional<domain::GridLevel> GridEngine::levelForOrder(
    const std::string& order_id) const {
  std::lock_guard lock(mutex_);
  auto it = active_orders_.find(order_id);
  if (it != active_orders_.end()) {
    return it->second;
  }
  auto retired = retired_orders_.find(order_id);
  if (retired != retired_orders_.end()) {
    return retired->second;
  }
  return std::nullopt;
}

domain::InstrumentSpec GridEngine::instrumentSpec() const {
  std::lock_guard lock(mutex_);
  return spec_;
}

void GridEngine::sleepMs(int ms) const {
  if (ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
}

}  // namespace gridbot
