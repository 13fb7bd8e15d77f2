#pragma once

#include "gridbot/domain/risk_limits.hpp"

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

namespace gridbot {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown by loadBotConfig()/parseBotConfig() when the file cannot be read,
// is not valid JSON, holds a value of the wrong type, or fails validation.
// what() names every offending key.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// GridProfile: a named trading temperament
// -----------------------------------------------------------------------------
struct GridProfile {
  std::string name;
  double grid_spacing{0.01};   // fractional distance between rungs
  int target_levels{5};        // rungs per side when capital allows
  double profit_target{0.01};  // take-profit distance from a fill
};

struct TradingConfig {
  std::string symbol{"BTCUSDT"};
  std::string category{"linear"};
  double initial_capital{100.0};
  int leverage{1};
  bool take_profit_enabled{false};
};

struct GridConfig {
  double grid_spacing_max{0.03};
  double volatility_threshold{0.005};
  double volatility_multiplier{1.2};
  int volatility_period{14};
  std::size_t max_history_points{720};
  int settle_delay_ms{1000};
  int recenter_settle_delay_ms{2000};
  int order_spacing_ms{100};
  std::string default_profile{"Normal"};
  std::map<std::string, GridProfile> profiles{
      {"Conservative", {"Conservative", 0.015, 3, 0.015}},
      {"Normal", {"Normal", 0.010, 5, 0.010}},
      {"Aggressive", {"Aggressive", 0.006, 8, 0.006}},
  };

  bool hasProfile(const std::string& name) const {
    return profiles.find(name) != profiles.end();
  }

  // Throws std::invalid_argument for an unknown name.
  const GridProfile& profile(const std::string& name) const;
};

struct RecenterConfig {
  double price_deviation_pct{0.02};
  double time_based_hours{48.0};
  double one_side_hours{24.0};
  double pump_dump_pct{0.05};
};

struct MonitoringConfig {
  int fill_poll_interval_sec{5};
  int grid_check_interval_sec{60};
  int health_check_interval_sec{30};
  int snapshot_interval_minutes{15};
};

struct GatewayConfig {
  static constexpr int kMaxAttempts = 10;

  int max_attempts{3};
  int base_backoff_ms{1000};
};

// Parameters of the in-process simulated venue.
struct PaperConfig {
  double initial_balance{100.0};
  double initial_price{100.0};
  double maker_fee_rate{0.0002};
  int spread_ticks{1};
  double min_order_qty{0.001};
  double qty_step{0.001};
  double tick_size{0.1};
  double min_notional{5.0};
  std::string feed_endpoint;  // empty = no ZeroMQ tick feed
};

struct StorageConfig {
  std::string journal_path{"data/gridbot.journal"};  // empty = memory only
};

struct IpcConfig {
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};  // empty = disabled
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// BotConfig
// -----------------------------------------------------------------------------
//
// @brief  Every recognized option with its default. A default-constructed
//         BotConfig is a valid configuration.
//
// @details
// JSON layout mirrors the struct layout one-to-one:
//   { "trading": {...}, "grid": {..., "profiles": {"Normal": {...}}},
//     "recenter": {...}, "risk": {...}, "monitoring": {...},
//     "gateway": {...}, "paper": {...}, "storage": {...}, "ipc": {...} }
// Missing keys keep their defaults. Unknown keys are reported on stderr and
// otherwise ignored.
// -----------------------------------------------------------------------------
struct BotConfig {
  TradingConfig trading;
  GridConfig grid;
  RecenterConfig recenter;
  domain::RiskLimits risk;
  MonitoringConfig monitoring;
  GatewayConfig gateway;
  PaperConfig paper;
  StorageConfig storage;
  IpcConfig ipc;
};

// -----------------------------------------------------------------------------
// parseBotConfig(json_text)
// -----------------------------------------------------------------------------
//
// @brief  Builds a BotConfig from JSON text and validates it.
//
// @throws ConfigError on malformed JSON, wrong value types, or any
//         validation failure (see validateBotConfig()).
// -----------------------------------------------------------------------------
BotConfig parseBotConfig(const std::string& json_text);

// Reads the file at path and forwards to parseBotConfig().
BotConfig loadBotConfig(const std::string& path);

// -----------------------------------------------------------------------------
// validateBotConfig(config)
// -----------------------------------------------------------------------------
//
// @brief  Checks ranges and cross-field consistency.
//
// @details
// Fractions (spacings, targets, risk limits, recenter thresholds) must lie in
// (0, 1]; counts and intervals must be positive; delays non-negative; the
// default profile must exist. All problems are collected into one
// ConfigError so an operator sees every bad key at once.
// -----------------------------------------------------------------------------
void validateBotConfig(const BotConfig& config);

}  // namespace gridbot
