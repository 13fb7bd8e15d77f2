#include "gridbot/store/journal_state_store.hpp"

#include "gridbot/time/time_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <utility>

namespace gridbot {

namespace {

using json = nlohmann::json;

// -----------------------------------------------------------------------------
// Record <-> JSON
// -----------------------------------------------------------------------------
json optionalToJson(const std::optional<std::int64_t>& v) {
  return v ? json(*v) : json(nullptr);
}

std::optional<std::int64_t> optionalMs(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::int64_t>();
}

domain::Side sideFrom(const json& j) {
  auto side = domain::sideFromString(j.at("side").get<std::string>());
  if (!side) {
    throw StateStoreError("bad side value in journal record");
  }
  return *side;
}

domain::OrderStatus statusFrom(const json& j) {
  auto status =
      domain::orderStatusFromString(j.at("status").get<std::string>());
  if (!status) {
    throw StateStoreError("bad status value in journal record");
  }
  return *status;
}

json toJson(const OrderRecord& o) {
  return json{{"order_id", o.order_id},
              {"order_link_id", o.order_link_id},
              {"symbol", o.symbol},
              {"side", domain::toString(o.side)},
              {"price", o.price},
              {"quantity", o.quantity},
              {"status", domain::toString(o.status)},
              {"grid_level", o.grid_level},
              {"created_ms", o.created_ms},
              {"filled_ms", optionalToJson(o.filled_ms)}};
}

OrderRecord orderFromJson(const json& j) {
  OrderRecord o;
  o.order_id = j.at("order_id").get<std::string>();
  o.order_link_id = j.value("order_link_id", "");
  o.symbol = j.at("symbol").get<std::string>();
  o.side = sideFrom(j);
  o.price = j.at("price").get<double>();
  o.quantity = j.at("quantity").get<double>();
  o.status = statusFrom(j);
  o.grid_level = j.value("grid_level", 0);
  o.created_ms = j.value("created_ms", std::int64_t{0});
  o.filled_ms = optionalMs(j, "filled_ms");
  return o;
}

json toJson(const TradeRecord& t) {
  return json{{"exec_id", t.exec_id},
              {"order_id", t.order_id},
              {"symbol", t.symbol},
              {"side", domain::toString(t.side)},
              {"price", t.price},
              {"quantity", t.quantity},
              {"fee", t.fee},
              {"is_maker", t.is_maker},
              {"profit", t.profit ? json(*t.profit) : json(nullptr)},
              {"grid_level", t.grid_level ? json(*t.grid_level) : json(nullptr)},
              {"executed_ms", t.executed_ms}};
}

TradeRecord tradeFromJson(const json& j) {
  TradeRecord t;
  t.exec_id = j.at("exec_id").get<std::string>();
  t.order_id = j.at("order_id").get<std::string>();
  t.symbol = j.at("symbol").get<std::string>();
  t.side = sideFrom(j);
  t.price = j.at("price").get<double>();
  t.quantity = j.at("quantity").get<double>();
  t.fee = j.value("fee", 0.0);
  t.is_maker = j.value("is_maker", true);
  if (j.contains("profit") && !j["profit"].is_null()) {
    t.profit = j["profit"].get<double>();
  }
  if (j.contains("grid_level") && !j["grid_level"].is_null()) {
    t.grid_level = j["grid_level"].get<int>();
  }
  t.executed_ms = j.at("executed_ms").get<std::int64_t>();
  return t;
}

json toJson(const GridSnapshot& g) {
  return json{{"center_price", g.center_price},
              {"lowest_buy", g.lowest_buy},
              {"highest_sell", g.highest_sell},
              {"num_buy_levels", g.num_buy_levels},
              {"num_sell_levels", g.num_sell_levels},
              {"grid_spacing", g.grid_spacing},
              {"profile", g.profile},
              {"reason", g.reason},
              {"created_ms", g.created_ms}};
}

GridSnapshot gridFromJson(const json& j) {
  GridSnapshot g;
  g.center_price = j.at("center_price").get<double>();
  g.lowest_buy = j.value("lowest_buy", 0.0);
  g.highest_sell = j.value("highest_sell", 0.0);
  g.num_buy_levels = j.value("num_buy_levels", 0);
  g.num_sell_levels = j.value("num_sell_levels", 0);
  g.grid_spacing = j.value("grid_spacing", 0.0);
  g.profile = j.value("profile", "");
  g.reason = j.value("reason", "");
  g.created_ms = j.value("created_ms", std::int64_t{0});
  return g;
}

json toJson(const EquitySnapshot& e) {
  return json{{"total_equity", e.total_equity},
              {"available_balance", e.available_balance},
              {"unrealized_pnl", e.unrealized_pnl},
              {"positions_value", e.positions_value},
              {"created_ms", e.created_ms}};
}

EquitySnapshot equityFromJson(const json& j) {
  EquitySnapshot e;
  e.total_equity = j.at("total_equity").get<double>();
  e.available_balance = j.value("available_balance", 0.0);
  e.unrealized_pnl = j.value("unrealized_pnl", 0.0);
  e.positions_value = j.value("positions_value", 0.0);
  e.created_ms = j.value("created_ms", std::int64_t{0});
  return e;
}

json toJson(const EventRecord& e) {
  return json{{"type", e.type},
              {"severity", toString(e.severity)},
              {"message", e.message},
              {"details", e.details},
              {"created_ms", e.created_ms}};
}

EventRecord eventFromJson(const json& j) {
  EventRecord e;
  e.type = j.at("type").get<std::string>();
  e.severity = severityFromString(j.value("severity", "INFO"))
                   .value_or(Severity::Info);
  e.message = j.value("message", "");
  e.details = j.value("details", json::object());
  e.created_ms = j.value("created_ms", std::int64_t{0});
  return e;
}

json toJson(const ActiveConfig& c) {
  return json{{"profile_name", c.profile_name},
              {"symbol", c.symbol},
              {"grid_spacing", c.grid_spacing},
              {"target_levels", c.target_levels},
              {"profit_target", c.profit_target},
              {"max_exposure_pct", c.max_exposure_pct},
              {"leverage", c.leverage},
              {"saved_ms", c.saved_ms}};
}

ActiveConfig configFromJson(const json& j) {
  ActiveConfig c;
  c.profile_name = j.at("profile_name").get<std::string>();
  c.symbol = j.value("symbol", "");
  c.grid_spacing = j.value("grid_spacing", 0.0);
  c.target_levels = j.value("target_levels", 0);
  c.profit_target = j.value("profit_target", 0.0);
  c.max_exposure_pct = j.value("max_exposure_pct", 0.0);
  c.leverage = j.value("leverage", 1);
  c.saved_ms = j.value("saved_ms", std::int64_t{0});
  return c;
}

json toJson(const PnlSummary& p) {
  return json{{"period_hours", p.period_hours},
              {"realized_pnl", p.realized_pnl},
              {"total_trades", p.total_trades},
              {"winning_trades", p.winning_trades},
              {"losing_trades", p.losing_trades},
              {"total_fees", p.total_fees},
              {"calculated_ms", p.calculated_ms}};
}

PnlSummary pnlFromJson(const json& j) {
  PnlSummary p;
  p.period_hours = j.at("period_hours").get<int>();
  p.realized_pnl = j.value("realized_pnl", 0.0);
  p.total_trades = j.value("total_trades", 0);
  p.winning_trades = j.value("winning_trades", 0);
  p.losing_trades = j.value("losing_trades", 0);
  p.total_fees = j.value("total_fees", 0.0);
  p.calculated_ms = j.value("calculated_ms", std::int64_t{0});
  return p;
}

bool isActive(domain::OrderStatus s) {
  return s == domain::OrderStatus::New ||
         s == domain::OrderStatus::PartiallyFilled;
}

// Filled is final. Canceled is what a recenter infers for the ladder it
// tore down, so a fill reported afterwards by the venue still wins.
bool acceptsStatus(domain::OrderStatus current, domain::OrderStatus next) {
  if (isActive(current)) {
    return true;
  }
  return current == domain::OrderStatus::Canceled &&
         next == domain::OrderStatus::Filled;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: replay the existing journal, then open it for append
// -----------------------------------------------------------------------------
JournalStateStore::JournalStateStore(std::string path,
                                     const ITimeProvider& time)
    : path_(std::move(path)), time_(time) {
  if (path_.empty()) {
    std::cout << "[JournalStateStore] memory-only mode\n";
    return;
  }

  const std::filesystem::path file(path_);
  if (file.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
      throw StateStoreError("cannot create journal directory " +
                            file.parent_path().string() + ": " + ec.message());
    }
  }

  replay();

  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_) {
    throw StateStoreError("cannot open journal for append: " + path_);
  }

  std::cout << "[JournalStateStore] " << path_ << " opened, " << replayed_
            << " record(s) replayed\n";
}

// -----------------------------------------------------------------------------
// replay(): feed every parsable journal line through applyLocked()
// -----------------------------------------------------------------------------
void JournalStateStore::replay() {
  std::ifstream in(path_);
  if (!in) {
    return;  // first run: nothing to replay
  }

  std::lock_guard lock(mutex_);
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    try {
      json record = json::parse(line);
      applyLocked(record.at("kind").get<std::string>(), record.at("data"));
      ++replayed_;
    } catch (const json::exception& e) {
      std::cerr << "[JournalStateStore] WARNING: skipping line " << line_no
                << " of " << path_ << ": " << e.what() << "\n";
    } catch (const StateStoreError& e) {
      std::cerr << "[JournalStateStore] WARNING: skipping line " << line_no
                << " of " << path_ << ": " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// appendLocked(): one line, flushed, verified
// -----------------------------------------------------------------------------
void JournalStateStore::appendLocked(const char* kind, const json& data) {
  if (path_.empty()) {
    return;
  }
  json record{{"kind", kind}, {"data", data}};
  out_ << record.dump() << '\n';
  out_.flush();
  if (!out_) {
    throw StateStoreError(std::string("journal write failed (") + kind +
                          ") on " + path_);
  }
}

// -----------------------------------------------------------------------------
// applyLocked(): update in-memory state from one record
// -----------------------------------------------------------------------------
void JournalStateStore::applyLocked(const std::string& kind, const json& data) {
  if (kind == "order") {
    OrderRecord o = orderFromJson(data);
    orders_[o.order_id] = std::move(o);
  } else if (kind == "order_status") {
    auto it = orders_.find(data.at("order_id").get<std::string>());
    const domain::OrderStatus next = statusFrom(data);
    if (it != orders_.end() && acceptsStatus(it->second.status, next)) {
      it->second.status = next;
      auto filled = optionalMs(data, "filled_ms");
      if (filled) {
        it->second.filled_ms = filled;
      }
    }
  } else if (kind == "trade") {
    TradeRecord t = tradeFromJson(data);
    if (trade_ids_.insert(t.exec_id).second) {
      trades_.push_back(std::move(t));
    }
  } else if (kind == "grid") {
    latest_grid_ = gridFromJson(data);
  } else if (kind == "equity") {
    equity_.push_back(equityFromJson(data));
    if (equity_.size() > kMaxEquitySnapshots) {
      equity_.pop_front();
    }
  } else if (kind == "event") {
    events_.push_front(eventFromJson(data));
    if (events_.size() > kMaxEvents) {
      events_.pop_back();
    }
  } else if (kind == "config") {
    active_config_ = configFromJson(data);
  } else if (kind == "pnl") {
    PnlSummary p = pnlFromJson(data);
    pnl_[p.period_hours] = p;
  } else {
    std::cerr << "[JournalStateStore] WARNING: unknown record kind '" << kind
              << "'\n";
  }
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
void JournalStateStore::saveOrder(const OrderRecord& order) {
  std::lock_guard lock(mutex_);
  json data = toJson(order);
  appendLocked("order", data);
  applyLocked("order", data);
}

void JournalStateStore::updateOrderStatus(
    const std::string& order_id, domain::OrderStatus status,
    std::optional<std::int64_t> filled_ms) {
  std::lock_guard lock(mutex_);
  json data{{"order_id", order_id},
            {"status", domain::toString(status)},
            {"filled_ms", optionalToJson(filled_ms)}};
  appendLocked("order_status", data);
  applyLocked("order_status", data);
}

std::vector<OrderRecord> JournalStateStore::getActiveOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<OrderRecord> active;
  for (const auto& [id, order] : orders_) {
    if (isActive(order.status)) {
      active.push_back(order);
    }
  }
  std::sort(active.begin(), active.end(),
            [](const OrderRecord& a, const OrderRecord& b) {
              return a.created_ms < b.created_ms;
            });
  return active;
}

std::optional<OrderRecord> JournalStateStore::findOrder(
    const std::string& order_id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Trades
// -----------------------------------------------------------------------------
bool JournalStateStore::saveTrade(const TradeRecord& trade) {
  std::lock_guard lock(mutex_);
  if (trade_ids_.count(trade.exec_id) != 0) {
    return false;
  }
  json data = toJson(trade);
  appendLocked("trade", data);
  applyLocked("trade", data);
  return true;
}

std::vector<TradeRecord> JournalStateStore::getTradesSince(
    std::int64_t since_ms) const {
  std::lock_guard lock(mutex_);
  std::vector<TradeRecord> out;
  for (const auto& t : trades_) {
    if (t.executed_ms >= since_ms) {
      out.push_back(t);
    }
  }
  return out;
}

std::size_t JournalStateStore::countTradesSince(std::int64_t since_ms) const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(trades_.begin(), trades_.end(),
                    [since_ms](const TradeRecord& t) {
                      return t.executed_ms >= since_ms;
                    }));
}

// -----------------------------------------------------------------------------
// Grid history
// -----------------------------------------------------------------------------
void JournalStateStore::saveGridHistory(const GridSnapshot& snapshot) {
  std::lock_guard lock(mutex_);
  json data = toJson(snapshot);
  appendLocked("grid", data);
  applyLocked("grid", data);
}

std::optional<GridSnapshot> JournalStateStore::getLatestGrid() const {
  std::lock_guard lock(mutex_);
  return latest_grid_;
}

// -----------------------------------------------------------------------------
// Equity
// -----------------------------------------------------------------------------
void JournalStateStore::saveEquitySnapshot(const EquitySnapshot& snapshot) {
  std::lock_guard lock(mutex_);
  json data = toJson(snapshot);
  appendLocked("equity", data);
  applyLocked("equity", data);
}

std::vector<EquitySnapshot> JournalStateStore::getEquitySnapshotsSince(
    std::int64_t since_ms) const {
  std::lock_guard lock(mutex_);
  std::vector<EquitySnapshot> out;
  for (const auto& e : equity_) {
    if (e.created_ms >= since_ms) {
      out.push_back(e);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// Events
// -----------------------------------------------------------------------------
void JournalStateStore::logEvent(const std::string& type, Severity severity,
                                 const std::string& message,
                                 const json& details) {
  EventRecord e;
  e.type = type;
  e.severity = severity;
  e.message = message;
  e.details = details.is_null() ? json::object() : details;
  e.created_ms = time_.now_ms();

  std::lock_guard lock(mutex_);
  json data = toJson(e);
  appendLocked("event", data);
  applyLocked("event", data);
}

std::vector<EventRecord> JournalStateStore::recentEvents(
    std::size_t limit) const {
  std::lock_guard lock(mutex_);
  const std::size_t n = std::min(limit, events_.size());
  return std::vector<EventRecord>(events_.begin(), events_.begin() + n);
}

// -----------------------------------------------------------------------------
// Operator configuration
// -----------------------------------------------------------------------------
void JournalStateStore::saveConfig(const ActiveConfig& config) {
  std::lock_guard lock(mutex_);
  json data = toJson(config);
  appendLocked("config", data);
  applyLocked("config", data);
}

std::optional<ActiveConfig> JournalStateStore::getActiveConfig() const {
  std::lock_guard lock(mutex_);
  return active_config_;
}

// -----------------------------------------------------------------------------
// PnL
// -----------------------------------------------------------------------------
std::optional<PnlSummary> JournalStateStore::calculateAndSavePnl(
    int period_hours) {
  const std::int64_t now = time_.now_ms();
  const std::int64_t cutoff = now - period_hours * kMsPerHour;

  std::lock_guard lock(mutex_);
  PnlSummary summary;
  summary.period_hours = period_hours;
  summary.calculated_ms = now;
  for (const auto& t : trades_) {
    if (t.executed_ms < cutoff) {
      continue;
    }
    ++summary.total_trades;
    summary.total_fees += t.fee;
    if (t.profit) {
      summary.realized_pnl += *t.profit;
      if (*t.profit > 0.0) {
        ++summary.winning_trades;
      } else if (*t.profit < 0.0) {
        ++summary.losing_trades;
      }
    }
  }

  if (summary.total_trades == 0) {
    return std::nullopt;
  }

  json data = toJson(summary);
  appendLocked("pnl", data);
  applyLocked("pnl", data);
  return summary;
}

std::optional<PnlSummary> JournalStateStore::getPnlSummary(
    int period_hours) const {
  std::lock_guard lock(mutex_);
  auto it = pnl_.find(period_hours);
  if (it == pnl_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace gridbot
