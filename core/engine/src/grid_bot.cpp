#include "gridbot/engine/grid_bot.hpp"

#include "gridbot/gateway/price_format.hpp"
#include "gridbot/time/time_utils.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

namespace gridbot {

namespace {

constexpr std::size_t kExecutionFetchLimit = 20;

constexpr std::chrono::milliseconds kFillKilledInterval{10000};
constexpr std::chrono::milliseconds kFillErrorBackoff{10000};
constexpr std::chrono::milliseconds kGridKilledInterval{30000};
constexpr std::chrono::milliseconds kGridErrorBackoff{60000};
constexpr std::chrono::milliseconds kRiskErrorBackoff{60000};
constexpr std::chrono::milliseconds kSnapshotErrorBackoff{300000};

// Take-profit price nudge when the target would cross the book.
constexpr double kMakerBuyAdjust = 0.9999;
constexpr double kMakerSellAdjust = 1.0001;

std::chrono::milliseconds seconds(int s) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(s) * 1000);
}

nlohmann::json toJson(const GridStats& s) {
  return {{"center_price", s.center_price},
          {"num_buy_levels", s.num_buy_levels},
          {"num_sell_levels", s.num_sell_levels},
          {"lowest_buy", s.lowest_buy},
          {"highest_sell", s.highest_sell},
          {"active_orders", s.active_orders},
          {"last_recenter", format_iso8601_utc(s.last_recenter_ms)},
          {"grid_spacing", s.grid_spacing},
          {"profile", s.profile}};
}

nlohmann::json toJson(const domain::RiskMetrics& m) {
  return {{"total_equity", m.total_equity},
          {"current_exposure", m.current_exposure},
          {"exposure_pct", m.exposure_pct * 100.0},
          {"max_exposure_pct", m.max_exposure_pct * 100.0},
          {"daily_max_equity", m.daily_max_equity},
          {"drawdown_pct", m.drawdown_pct * 100.0},
          {"kill_switch_threshold_pct", m.kill_switch_threshold_pct * 100.0},
          {"available_for_trading", m.available_for_trading},
          {"kill_switch_active", m.kill_switch_active},
          {"kill_switch_reason", m.kill_switch_reason},
          {"within_limits", m.within_limits}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
GridBot::GridBot(BotConfig config, IExchangeGateway& gateway,
                 IStateStore& store, const ITimeProvider& time)
    : config_(std::move(config)),
      gateway_(gateway),
      store_(store),
      time_(time),
      resolver_(gateway_),
      grid_(gateway_, store_, resolver_, time_, config_),
      risk_(gateway_, store_, time_, config_.risk, config_.trading.symbol),
      profile_(config_.grid.default_profile) {
  fill_loop_ = std::make_unique<PollingLoop>(
      "fill-monitor", running_, [this] { return runFillMonitorCycle(); },
      kFillErrorBackoff);
  grid_loop_ = std::make_unique<PollingLoop>(
      "grid-monitor", running_, [this] { return runGridMonitorCycle(); },
      kGridErrorBackoff);
  risk_loop_ = std::make_unique<PollingLoop>(
      "risk-monitor", running_, [this] { return runRiskMonitorCycle(); },
      kRiskErrorBackoff);
  snapshot_loop_ = std::make_unique<PollingLoop>(
      "snapshots", running_, [this] { return runSnapshotCycle(); },
      kSnapshotErrorBackoff);
}

// -----------------------------------------------------------------------------
// Destructor: RAII shutdown
// -----------------------------------------------------------------------------
GridBot::~GridBot() { shutdown(); }

// -----------------------------------------------------------------------------
// initialize()
// -----------------------------------------------------------------------------
void GridBot::initialize() {
  if (initialized_.load()) {
    return;
  }

  std::cout << "[GridBot] Initializing for " << config_.trading.symbol
            << "\n";

  // ---  1) Instrument spec + persisted center (throws on spec failure) -------
  grid_.initialize();

  // ---  2) Operator profile ---------------------------------------------------
  std::optional<ActiveConfig> active = store_.getActiveConfig();
  if (active && config_.grid.hasProfile(active->profile_name)) {
    {
      std::lock_guard lock(state_mutex_);
      profile_ = active->profile_name;
    }
    std::cout << "[GridBot] Restored profile " << active->profile_name
              << "\n";
  } else {
    if (active) {
      std::cerr << "[GridBot] WARNING: stored profile '"
                << active->profile_name << "' is not configured, using "
                << config_.grid.default_profile << "\n";
    }
    {
      std::lock_guard lock(state_mutex_);
      profile_ = config_.grid.default_profile;
    }
    saveActiveConfig(config_.grid.default_profile);
  }

  // ---  3) First equity reading ---------------------------------------------
  if (!risk_.updateEquityTracking()) {
    std::cerr << "[GridBot] WARNING: initial equity reading failed\n";
  }

  // ---  4) Operator IPC -------------------------------------------------------
  if (!config_.ipc.cmd_endpoint.empty() && !config_.ipc.pub_endpoint.empty()) {
    ipc_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.cmd_endpoint, config_.ipc.pub_endpoint);
    ipc_->start();

    risk_.setKillSwitchListener([this](const std::string& reason) {
      ipc_->pushTelemetry({{"type", "kill_switch"},
                           {"symbol", config_.trading.symbol},
                           {"reason", reason},
                           {"timestamp", format_iso8601_utc(time_.now_ms())}});
    });
  }

  initialized_ = true;
  store_.logEvent("bot_initialized", Severity::Info,
                  "Bot initialized for " + config_.trading.symbol,
                  {{"profile", activeProfile()}});
}

// -----------------------------------------------------------------------------
// startTrading()
// -----------------------------------------------------------------------------
bool GridBot::startTrading() {
  std::lock_guard life(lifecycle_mutex_);

  if (!initialized_.load()) {
    std::cerr << "[GridBot] Cannot start: not initialized\n";
    return false;
  }
  if (risk_.isKillSwitchActive()) {
    std::cerr << "[GridBot] Cannot start: kill switch active ("
              << risk_.killSwitchReason() << ")\n";
    return false;
  }
  if (running_.load()) {
    return true;
  }

  // Loops left over from a previous run exit on the cleared flag.
  joinLoops();

  const std::string profile = activeProfile();
  bool built = false;
  {
    std::lock_guard lock(order_flow_mutex_);
    built = grid_.setupGrid(profile);
  }
  if (!built) {
    std::cerr << "[GridBot] Cannot start: grid setup failed\n";
    return false;
  }

  running_.store(true);
  fill_loop_->start();
  grid_loop_->start();
  risk_loop_->start();
  snapshot_loop_->start();

  std::cout << "[GridBot] Trading started with " << profile
            << " profile. Threads: fill, grid, risk, snapshots.\n";
  store_.logEvent("bot_started", Severity::Info,
                  "Trading started with " + profile + " profile",
                  {{"center_price", grid_.centerPrice()}});
  return true;
}

// -----------------------------------------------------------------------------
// stopTrading(reason)
// -----------------------------------------------------------------------------
bool GridBot::stopTrading(const std::string& reason) {
  const bool was_running = running_.exchange(false);
  wakeLoops();

  Status cancelled = okStatus();
  {
    std::lock_guard lock(order_flow_mutex_);
    cancelled = gateway_.cancelAllOrders(config_.trading.symbol);
  }
  if (!cancelled.ok()) {
    std::cerr << "[GridBot] cancelAllOrders on stop failed: "
              << cancelled.error().describe() << "\n";
  }

  if (was_running) {
    std::cout << "[GridBot] Trading stopped: " << reason << "\n";
    store_.logEvent("bot_stopped", Severity::Warning,
                    "Trading stopped: " + reason,
                    {{"orders_cancelled", cancelled.ok()}});
  }
  return was_running;
}

// -----------------------------------------------------------------------------
// shutdown()
// -----------------------------------------------------------------------------
// IPC goes first, outside the lifecycle lock, so a START being served on the
// IPC thread finishes before the join below.
// -----------------------------------------------------------------------------
void GridBot::shutdown() {
  if (ipc_) {
    ipc_->stop();
  }

  std::lock_guard life(lifecycle_mutex_);
  if (running_.load()) {
    stopTrading("shutdown");
  }
  joinLoops();
}

// -----------------------------------------------------------------------------
// Profile management
// -----------------------------------------------------------------------------
bool GridBot::changeProfile(const std::string& name) {
  if (!config_.grid.hasProfile(name)) {
    std::cerr << "[GridBot] Unknown profile: " << name << "\n";
    return false;
  }

  std::string old;
  {
    std::lock_guard lock(state_mutex_);
    old = profile_;
    profile_ = name;
  }
  saveActiveConfig(name);
  std::cout << "[GridBot] Profile changed " << old << " -> " << name << "\n";
  store_.logEvent("profile_change", Severity::Info,
                  "Profile changed from " + old + " to " + name,
                  {{"old_profile", old}, {"new_profile", name}});

  if (running_.load()) {
    std::lock_guard lock(order_flow_mutex_);
    if (running_.load() && !risk_.isKillSwitchActive()) {
      grid_.recenterGrid("Profile changed to " + name, name);
    }
  }
  return true;
}

std::string GridBot::activeProfile() const {
  std::lock_guard lock(state_mutex_);
  return profile_;
}

void GridBot::saveActiveConfig(const std::string& profile) {
  const GridProfile& p = config_.grid.profile(profile);
  ActiveConfig ac;
  ac.profile_name = p.name.empty() ? profile : p.name;
  ac.symbol = config_.trading.symbol;
  ac.grid_spacing = p.grid_spacing;
  ac.target_levels = p.target_levels;
  ac.profit_target = p.profit_target;
  ac.max_exposure_pct = config_.risk.max_exposure_pct;
  ac.leverage = config_.trading.leverage;
  ac.saved_ms = time_.now_ms();
  store_.saveConfig(ac);
}

// -----------------------------------------------------------------------------
// Kill switch controls
// -----------------------------------------------------------------------------
bool GridBot::halt(const std::string& reason) {
  bool triggered = false;
  {
    std::lock_guard lock(order_flow_mutex_);
    triggered = risk_.triggerKillSwitch(reason);
  }
  stopTrading("kill switch: " + reason);
  return triggered;
}

bool GridBot::deactivateKillSwitch() { return risk_.deactivateKillSwitch(); }

// -----------------------------------------------------------------------------
// Fill monitor
// -----------------------------------------------------------------------------
std::chrono::milliseconds GridBot::runFillMonitorCycle() {
  if (risk_.isKillSwitchActive()) {
    return kFillKilledInterval;
  }

  const std::string& symbol = config_.trading.symbol;
  auto executions = gateway_.getExecutions(symbol, kExecutionFetchLimit);
  if (!executions.ok()) {
    std::cerr << "[GridBot] Executions unavailable: "
              << executions.error().describe() << "\n";
    return kFillErrorBackoff;
  }

  // Venue returns newest first; record in fill order.
  const auto& fills = executions.value();
  for (auto it = fills.rbegin(); it != fills.rend(); ++it) {
    const domain::Execution& e = *it;
    std::optional<domain::GridLevel> level = grid_.levelForOrder(e.order_id);

    TradeRecord trade;
    trade.exec_id = e.exec_id;
    trade.order_id = e.order_id;
    trade.symbol = e.symbol.empty() ? symbol : e.symbol;
    trade.side = e.side;
    trade.price = e.price;
    trade.quantity = e.quantity;
    trade.fee = e.fee;
    trade.is_maker = e.is_maker;
    trade.profit = e.closed_pnl;
    if (level) {
      trade.grid_level = level->level_index;
    }
    trade.executed_ms = e.exec_time_ms;

    if (!store_.saveTrade(trade)) {
      continue;  // already recorded
    }
    store_.updateOrderStatus(e.order_id, domain::OrderStatus::Filled,
                             e.exec_time_ms);

    std::cout << "[GridBot] Fill: " << domain::toString(e.side) << " "
              << e.quantity << " @ " << e.price << " (order " << e.order_id
              << ")\n";

    if (config_.trading.take_profit_enabled && level) {
      std::lock_guard lock(order_flow_mutex_);
      if (running_.load() && !risk_.isKillSwitchActive()) {
        placeTakeProfit(e);
      }
    }
  }

  return seconds(config_.monitoring.fill_poll_interval_sec);
}

bool GridBot::placeTakeProfit(const domain::Execution& fill) {
  const GridProfile& p = config_.grid.profile(activeProfile());
  const domain::InstrumentSpec spec = grid_.instrumentSpec();
  const domain::Side tp_side = domain::opposite(fill.side);

  double price = fill.side == domain::Side::Buy
                     ? fill.price * (1.0 + p.profit_target)
                     : fill.price * (1.0 - p.profit_target);
  price = floorToStep(price, spec.tick_size);
  const double qty = floorToStep(fill.quantity, spec.qty_step);

  if (qty <= 0.0 || qty * price < spec.min_notional) {
    std::cerr << "[GridBot] Take-profit skipped: notional " << qty * price
              << " < " << spec.min_notional << "\n";
    return false;
  }

  if (!risk_.checkOrderAsMaker(tp_side, price)) {
    auto ticker = gateway_.getTicker(config_.trading.symbol);
    if (!ticker.ok()) {
      std::cerr << "[GridBot] Take-profit skipped: ticker unavailable: "
                << ticker.error().describe() << "\n";
      return false;
    }
    price = tp_side == domain::Side::Buy
                ? ticker.value().bid * kMakerBuyAdjust
                : ticker.value().ask * kMakerSellAdjust;
    price = floorToStep(price, spec.tick_size);
    std::cout << "[GridBot] Take-profit price adjusted to "
              << formatPrice(price, spec.tick_size) << " to stay maker\n";
  }

  if (!risk_.validateOrderSize(qty, price)) {
    std::cerr << "[GridBot] Take-profit skipped: size check failed\n";
    return false;
  }

  domain::OrderRequest req;
  req.symbol = config_.trading.symbol;
  req.side = tp_side;
  req.type = domain::OrderType::Limit;
  req.quantity = qty;
  req.price = price;
  req.time_in_force = domain::TimeInForce::PostOnly;
  req.order_link_id = "tp-" + fill.exec_id;

  auto placed = gateway_.placeOrder(req);
  if (!placed.ok()) {
    std::cerr << "[GridBot] Take-profit rejected: "
              << placed.error().describe() << "\n";
    return false;
  }

  OrderRecord rec;
  rec.order_id = placed.value();
  rec.order_link_id = req.order_link_id;
  rec.symbol = req.symbol;
  rec.side = tp_side;
  rec.price = price;
  rec.quantity = qty;
  rec.status = domain::OrderStatus::New;
  rec.grid_level = 0;
  rec.created_ms = time_.now_ms();
  store_.saveOrder(rec);

  std::cout << "[GridBot] Take-profit " << domain::toString(tp_side) << " "
            << formatQuantity(qty, spec.qty_step) << " @ "
            << formatPrice(price, spec.tick_size) << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// Grid monitor
// -----------------------------------------------------------------------------
std::chrono::milliseconds GridBot::runGridMonitorCycle() {
  if (risk_.isKillSwitchActive()) {
    return kGridKilledInterval;
  }

  RecenterDecision decision = grid_.shouldRecenter();
  if (decision.trigger) {
    std::cout << "[GridBot] Recenter triggered (" << toString(decision.kind)
              << "): " << decision.reason << "\n";

    if (!risk_.checkMaxExposure()) {
      std::cerr << "[GridBot] Recenter skipped: exposure gate closed\n";
      return seconds(config_.monitoring.grid_check_interval_sec);
    }

    std::lock_guard lock(order_flow_mutex_);
    if (running_.load() && !risk_.isKillSwitchActive()) {
      grid_.recenterGrid(decision.reason, activeProfile());
    }
  }

  return seconds(config_.monitoring.grid_check_interval_sec);
}

// -----------------------------------------------------------------------------
// Risk monitor
// -----------------------------------------------------------------------------
std::chrono::milliseconds GridBot::runRiskMonitorCycle() {
  {
    std::lock_guard lock(order_flow_mutex_);
    if (!risk_.updateEquityTracking()) {
      return kRiskErrorBackoff;
    }
    risk_.checkMaxExposure();
  }

  if (risk_.isKillSwitchActive() && running_.load()) {
    std::cerr << "[GridBot] Kill switch active, stopping trading\n";
    stopTrading("kill switch: " + risk_.killSwitchReason());
  }

  return seconds(config_.monitoring.health_check_interval_sec);
}

// -----------------------------------------------------------------------------
// Snapshots
// -----------------------------------------------------------------------------
std::chrono::milliseconds GridBot::runSnapshotCycle() {
  const std::string& symbol = config_.trading.symbol;

  auto wallet = gateway_.getWalletBalance();
  if (!wallet.ok()) {
    std::cerr << "[GridBot] Snapshot skipped: wallet unavailable: "
              << wallet.error().describe() << "\n";
    return kSnapshotErrorBackoff;
  }
  auto positions = gateway_.getPositions(symbol);
  if (!positions.ok()) {
    std::cerr << "[GridBot] Snapshot skipped: positions unavailable: "
              << positions.error().describe() << "\n";
    return kSnapshotErrorBackoff;
  }

  EquitySnapshot snap;
  snap.total_equity = wallet.value().total_equity;
  snap.available_balance = wallet.value().available_balance;
  for (const auto& p : positions.value()) {
    if (p.size() > 0.0) {
      snap.unrealized_pnl += p.unrealized_pnl;
      snap.positions_value += p.notional();
    }
  }
  snap.created_ms = time_.now_ms();
  store_.saveEquitySnapshot(snap);

  if (auto pnl = store_.calculateAndSavePnl(24)) {
    std::cout << "[GridBot] 24h PnL: " << pnl->realized_pnl << " over "
              << pnl->total_trades << " trades\n";
  }

  if (ipc_) {
    nlohmann::json frame = status();
    frame["type"] = "status";
    ipc_->pushTelemetry(std::move(frame));
  }

  return seconds(config_.monitoring.snapshot_interval_minutes * 60);
}

// -----------------------------------------------------------------------------
// status()
// -----------------------------------------------------------------------------
nlohmann::json GridBot::status() {
  const std::string& symbol = config_.trading.symbol;
  const std::int64_t now = time_.now_ms();

  nlohmann::json out;
  out["running"] = running_.load();
  out["initialized"] = initialized_.load();
  out["profile"] = activeProfile();
  out["symbol"] = symbol;

  auto wallet = gateway_.getWalletBalance();
  if (wallet.ok()) {
    out["balance"] = {{"available", wallet.value().available_balance},
                      {"equity", wallet.value().total_equity}};
  } else {
    out["balance"] = nullptr;
  }

  int open_positions = 0;
  auto positions = gateway_.getPositions(symbol);
  if (positions.ok()) {
    for (const auto& p : positions.value()) {
      if (p.size() > 0.0) {
        ++open_positions;
      }
    }
  }
  out["positions"] = open_positions;

  out["grid"] = toJson(grid_.stats());
  out["risk"] = toJson(risk_.metrics());
  out["trades_24h"] = store_.countTradesSince(now - kMsPerDay);
  out["funding_estimate_daily"] = risk_.estimateDailyFundingCost();

  if (auto pnl = store_.getPnlSummary(24)) {
    out["pnl_24h"] = {{"realized_pnl", pnl->realized_pnl},
                      {"total_trades", pnl->total_trades},
                      {"winning_trades", pnl->winning_trades},
                      {"losing_trades", pnl->losing_trades},
                      {"total_fees", pnl->total_fees}};
  }

  out["timestamp"] = format_iso8601_utc(now);
  return out;
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string GridBot::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  std::string arg;
  in >> verb >> arg;

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    response = status();
    response["status"] = "ok";
  } else if (verb == "HALT") {
    const bool triggered = halt("Manual halt via IPC");
    response["status"] = "ok";
    response["response"] =
        triggered ? "Trading halted" : "Kill switch already active";
  } else if (verb == "RESUME") {
    if (deactivateKillSwitch()) {
      response["status"] = "ok";
      response["response"] = "Kill switch deactivated. Send START to trade";
    } else {
      response["status"] = "error";
      response["response"] = "Kill switch is not active";
    }
  } else if (verb == "PROFILE") {
    if (arg.empty()) {
      response["status"] = "error";
      response["response"] = "Usage: PROFILE <name>";
    } else if (changeProfile(arg)) {
      response["status"] = "ok";
      response["response"] = "Profile set to " + arg;
    } else {
      response["status"] = "error";
      response["response"] = "Unknown profile: " + arg;
    }
  } else if (verb == "START") {
    if (startTrading()) {
      response["status"] = "ok";
      response["response"] = "Trading running";
    } else {
      response["status"] = "error";
      response["response"] = risk_.isKillSwitchActive()
                                 ? "Kill switch active: " +
                                       risk_.killSwitchReason()
                                 : std::string("Grid setup failed");
    }
  } else if (verb == "STOP") {
    stopTrading("Stopped via IPC");
    response["status"] = "ok";
    response["response"] = "Trading stopped";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Loop helpers
// -----------------------------------------------------------------------------
void GridBot::wakeLoops() {
  fill_loop_->wake();
  grid_loop_->wake();
  risk_loop_->wake();
  snapshot_loop_->wake();
}

void GridBot::joinLoops() {
  fill_loop_->stop();
  grid_loop_->stop();
  risk_loop_->stop();
  snapshot_loop_->stop();
}

}  // namespace gridbot
