#include "gridbot/config/bot_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace gridbot {

namespace {

using json = nlohmann::json;

// -----------------------------------------------------------------------------
// readField: copy obj[key] into out if present, naming the key on type error
// -----------------------------------------------------------------------------
template <typename T>
void readField(const json& obj, const std::string& path, const char* key,
               T& out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(path + "." + key + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// section: fetch a nested object, or an empty one if the section is absent
// -----------------------------------------------------------------------------
const json& section(const json& root, const char* name) {
  static const json kEmpty = json::object();
  auto it = root.find(name);
  if (it == root.end()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string(name) + ": expected an object");
  }
  return *it;
}

void warnUnknownKeys(const json& obj, const std::string& path,
                     const std::set<std::string>& known) {
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (known.count(it.key()) == 0) {
      std::cerr << "[BotConfig] WARNING: ignoring unknown key " << path
                << (path.empty() ? "" : ".") << it.key() << "\n";
    }
  }
}

void parseTrading(const json& s, TradingConfig& t) {
  warnUnknownKeys(s, "trading",
                  {"symbol", "category", "initial_capital", "leverage",
                   "take_profit_enabled"});
  readField(s, "trading", "symbol", t.symbol);
  readField(s, "trading", "category", t.category);
  readField(s, "trading", "initial_capital", t.initial_capital);
  readField(s, "trading", "leverage", t.leverage);
  readField(s, "trading", "take_profit_enabled", t.take_profit_enabled);
}

void parseGrid(const json& s, GridConfig& g) {
  warnUnknownKeys(s, "grid",
                  {"grid_spacing_max", "volatility_threshold",
                   "volatility_multiplier", "volatility_period",
                   "max_history_points", "settle_delay_ms",
                   "recenter_settle_delay_ms", "order_spacing_ms",
                   "default_profile", "profiles"});
  readField(s, "grid", "grid_spacing_max", g.grid_spacing_max);
  readField(s, "grid", "volatility_threshold", g.volatility_threshold);
  readField(s, "grid", "volatility_multiplier", g.volatility_multiplier);
  readField(s, "grid", "volatility_period", g.volatility_period);
  readField(s, "grid", "max_history_points", g.max_history_points);
  readField(s, "grid", "settle_delay_ms", g.settle_delay_ms);
  readField(s, "grid", "recenter_settle_delay_ms", g.recenter_settle_delay_ms);
  readField(s, "grid", "order_spacing_ms", g.order_spacing_ms);
  readField(s, "grid", "default_profile", g.default_profile);

  auto it = s.find("profiles");
  if (it == s.end()) {
    return;
  }
  if (!it->is_object()) {
    throw ConfigError("grid.profiles: expected an object");
  }
  // A profiles section replaces the built-in set: a profile the operator did
  // not list is not selectable.
  std::map<std::string, GridProfile> profiles;
  for (auto p = it->begin(); p != it->end(); ++p) {
    const std::string path = "grid.profiles." + p.key();
    if (!p->is_object()) {
      throw ConfigError(path + ": expected an object");
    }
    auto builtin = g.profiles.find(p.key());
    GridProfile profile =
        builtin != g.profiles.end() ? builtin->second : GridProfile{};
    profile.name = p.key();
    warnUnknownKeys(*p, path,
                    {"grid_spacing", "target_levels", "profit_target"});
    readField(*p, path, "grid_spacing", profile.grid_spacing);
    readField(*p, path, "target_levels", profile.target_levels);
    readField(*p, path, "profit_target", profile.profit_target);
    profiles[p.key()] = profile;
  }
  g.profiles = std::move(profiles);
}

void parseRecenter(const json& s, RecenterConfig& r) {
  warnUnknownKeys(s, "recenter",
                  {"price_deviation_pct", "time_based_hours",
                   "one_side_hours", "pump_dump_pct"});
  readField(s, "recenter", "price_deviation_pct", r.price_deviation_pct);
  readField(s, "recenter", "time_based_hours", r.time_based_hours);
  readField(s, "recenter", "one_side_hours", r.one_side_hours);
  readField(s, "recenter", "pump_dump_pct", r.pump_dump_pct);
}

void parseRisk(const json& s, domain::RiskLimits& r) {
  warnUnknownKeys(s, "risk",
                  {"max_exposure_pct", "kill_switch_drawdown_pct",
                   "max_position_size_pct"});
  readField(s, "risk", "max_exposure_pct", r.max_exposure_pct);
  readField(s, "risk", "kill_switch_drawdown_pct", r.kill_switch_drawdown_pct);
  readField(s, "risk", "max_position_size_pct", r.max_position_size_pct);
}

void parseMonitoring(const json& s, MonitoringConfig& m) {
  warnUnknownKeys(s, "monitoring",
                  {"fill_poll_interval_sec", "grid_check_interval_sec",
                   "health_check_interval_sec", "snapshot_interval_minutes"});
  readField(s, "monitoring", "fill_poll_interval_sec", m.fill_poll_interval_sec);
  readField(s, "monitoring", "grid_check_interval_sec",
            m.grid_check_interval_sec);
  readField(s, "monitoring", "health_check_interval_sec",
            m.health_check_interval_sec);
  readField(s, "monitoring", "snapshot_interval_minutes",
            m.snapshot_interval_minutes);
}

void parseGateway(const json& s, GatewayConfig& g) {
  warnUnknownKeys(s, "gateway", {"max_attempts", "base_backoff_ms"});
  readField(s, "gateway", "max_attempts", g.max_attempts);
  readField(s, "gateway", "base_backoff_ms", g.base_backoff_ms);
}

void parsePaper(const json& s, PaperConfig& p) {
  warnUnknownKeys(s, "paper",
                  {"initial_balance", "initial_price", "maker_fee_rate",
                   "spread_ticks", "min_order_qty", "qty_step", "tick_size",
                   "min_notional", "feed_endpoint"});
  readField(s, "paper", "initial_balance", p.initial_balance);
  readField(s, "paper", "initial_price", p.initial_price);
  readField(s, "paper", "maker_fee_rate", p.maker_fee_rate);
  readField(s, "paper", "spread_ticks", p.spread_ticks);
  readField(s, "paper", "min_order_qty", p.min_order_qty);
  readField(s, "paper", "qty_step", p.qty_step);
  readField(s, "paper", "tick_size", p.tick_size);
  readField(s, "paper", "min_notional", p.min_notional);
  readField(s, "paper", "feed_endpoint", p.feed_endpoint);
}

bool isFraction(double v) { return v > 0.0 && v <= 1.0; }

}  // namespace

// -----------------------------------------------------------------------------
// GridConfig::profile
// -----------------------------------------------------------------------------
const GridProfile& GridConfig::profile(const std::string& name) const {
  auto it = profiles.find(name);
  if (it == profiles.end()) {
    throw std::invalid_argument("Unknown grid profile: " + name);
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// parseBotConfig
// -----------------------------------------------------------------------------
BotConfig parseBotConfig(const std::string& json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("malformed JSON: ") + e.what());
  }
  if (!root.is_object()) {
    throw ConfigError("top level must be a JSON object");
  }

  warnUnknownKeys(root, "",
                  {"trading", "grid", "recenter", "risk", "monitoring",
                   "gateway", "paper", "storage", "ipc"});

  BotConfig config;
  parseTrading(section(root, "trading"), config.trading);
  parseGrid(section(root, "grid"), config.grid);
  parseRecenter(section(root, "recenter"), config.recenter);
  parseRisk(section(root, "risk"), config.risk);
  parseMonitoring(section(root, "monitoring"), config.monitoring);
  parseGateway(section(root, "gateway"), config.gateway);
  parsePaper(section(root, "paper"), config.paper);

  const json& storage = section(root, "storage");
  warnUnknownKeys(storage, "storage", {"journal_path"});
  readField(storage, "storage", "journal_path", config.storage.journal_path);

  const json& ipc = section(root, "ipc");
  warnUnknownKeys(ipc, "ipc", {"cmd_endpoint", "pub_endpoint"});
  readField(ipc, "ipc", "cmd_endpoint", config.ipc.cmd_endpoint);
  readField(ipc, "ipc", "pub_endpoint", config.ipc.pub_endpoint);

  validateBotConfig(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadBotConfig
// -----------------------------------------------------------------------------
BotConfig loadBotConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  BotConfig config = parseBotConfig(buffer.str());
  std::cout << "[BotConfig] loaded " << path << " (symbol="
            << config.trading.symbol << ", profile="
            << config.grid.default_profile << ")\n";
  return config;
}

// -----------------------------------------------------------------------------
// validateBotConfig
// -----------------------------------------------------------------------------
void validateBotConfig(const BotConfig& c) {
  std::vector<std::string> errors;
  auto require = [&errors](bool ok, const std::string& msg) {
    if (!ok) {
      errors.push_back(msg);
    }
  };

  require(!c.trading.symbol.empty(), "trading.symbol must not be empty");
  require(!c.trading.category.empty(), "trading.category must not be empty");
  require(c.trading.initial_capital >= 0.0,
          "trading.initial_capital must be >= 0");
  require(c.trading.leverage >= 1, "trading.leverage must be >= 1");

  require(isFraction(c.grid.grid_spacing_max),
          "grid.grid_spacing_max must be in (0, 1]");
  require(c.grid.volatility_threshold > 0.0,
          "grid.volatility_threshold must be > 0");
  require(c.grid.volatility_multiplier >= 1.0,
          "grid.volatility_multiplier must be >= 1");
  require(c.grid.volatility_period >= 1, "grid.volatility_period must be >= 1");
  require(c.grid.max_history_points >= 1,
          "grid.max_history_points must be >= 1");
  require(c.grid.settle_delay_ms >= 0, "grid.settle_delay_ms must be >= 0");
  require(c.grid.recenter_settle_delay_ms >= 0,
          "grid.recenter_settle_delay_ms must be >= 0");
  require(c.grid.order_spacing_ms >= 0, "grid.order_spacing_ms must be >= 0");
  require(!c.grid.profiles.empty(), "grid.profiles must not be empty");
  require(c.grid.hasProfile(c.grid.default_profile),
          "grid.default_profile '" + c.grid.default_profile +
              "' is not a configured profile");
  for (const auto& [name, p] : c.grid.profiles) {
    const std::string path = "grid.profiles." + name;
    require(isFraction(p.grid_spacing), path + ".grid_spacing must be in (0, 1]");
    require(p.target_levels >= 1, path + ".target_levels must be >= 1");
    require(isFraction(p.profit_target),
            path + ".profit_target must be in (0, 1]");
  }

  require(isFraction(c.recenter.price_deviation_pct),
          "recenter.price_deviation_pct must be in (0, 1]");
  require(c.recenter.time_based_hours > 0.0,
          "recenter.time_based_hours must be > 0");
  require(c.recenter.one_side_hours > 0.0,
          "recenter.one_side_hours must be > 0");
  require(isFraction(c.recenter.pump_dump_pct),
          "recenter.pump_dump_pct must be in (0, 1]");

  require(isFraction(c.risk.max_exposure_pct),
          "risk.max_exposure_pct must be in (0, 1]");
  require(isFraction(c.risk.kill_switch_drawdown_pct),
          "risk.kill_switch_drawdown_pct must be in (0, 1]");
  require(isFraction(c.risk.max_position_size_pct),
          "risk.max_position_size_pct must be in (0, 1]");

  require(c.monitoring.fill_poll_interval_sec > 0,
          "monitoring.fill_poll_interval_sec must be > 0");
  require(c.monitoring.grid_check_interval_sec > 0,
          "monitoring.grid_check_interval_sec must be > 0");
  require(c.monitoring.health_check_interval_sec > 0,
          "monitoring.health_check_interval_sec must be > 0");
  require(c.monitoring.snapshot_interval_minutes > 0,
          "monitoring.snapshot_interval_minutes must be > 0");

  require(c.gateway.max_attempts >= 1 &&
              c.gateway.max_attempts <= GatewayConfig::kMaxAttempts,
          "gateway.max_attempts must be in [1, " +
              std::to_string(GatewayConfig::kMaxAttempts) + "]");
  require(c.gateway.base_backoff_ms >= 0,
          "gateway.base_backoff_ms must be >= 0");

  require(c.paper.initial_balance >= 0.0, "paper.initial_balance must be >= 0");
  require(c.paper.initial_price > 0.0, "paper.initial_price must be > 0");
  require(c.paper.maker_fee_rate >= 0.0, "paper.maker_fee_rate must be >= 0");
  require(c.paper.spread_ticks >= 1, "paper.spread_ticks must be >= 1");
  require(c.paper.qty_step > 0.0, "paper.qty_step must be > 0");
  require(c.paper.tick_size > 0.0, "paper.tick_size must be > 0");
  require(c.paper.min_order_qty >= 0.0, "paper.min_order_qty must be >= 0");
  require(c.paper.min_notional >= 0.0, "paper.min_notional must be >= 0");

  require(c.ipc.cmd_endpoint.empty() == c.ipc.pub_endpoint.empty(),
          "ipc.cmd_endpoint and ipc.pub_endpoint must both be set or both "
          "be empty");

  if (!errors.empty()) {
    std::string message = "invalid configuration:";
    for (const auto& e : errors) {
      message += "\n  - " + e;
    }
    throw ConfigError(message);
  }
}

}  // namespace gridbot
