#pragma once

#include "gridbot/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace gridbot {

// -----------------------------------------------------------------------------
// Severity of a persisted event record
// -----------------------------------------------------------------------------
enum class Severity {
  Info,
  Warning,
  Error,
  Critical,
};

inline const char* toString(Severity s) {
  switch (s) {
    case Severity::Info:     return "INFO";
    case Severity::Warning:  return "WARNING";
    case Severity::Error:    return "ERROR";
    case Severity::Critical: return "CRITICAL";
  }
  return "UNKNOWN";
}

inline std::optional<Severity> severityFromString(const std::string& s) {
  if (s == "INFO") return Severity::Info;
  if (s == "WARNING") return Severity::Warning;
  if (s == "ERROR") return Severity::Error;
  if (s == "CRITICAL") return Severity::Critical;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Records written through IStateStore
// -----------------------------------------------------------------------------
// All timestamps are epoch milliseconds UTC taken from the ITimeProvider of
// whoever builds the record.
// -----------------------------------------------------------------------------

// One grid order as placed.
struct OrderRecord {
  std::string order_id;
  std::string order_link_id;
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  double price{0.0};
  double quantity{0.0};
  domain::OrderStatus status{domain::OrderStatus::New};
  int grid_level{0};  // 0 = not part of the ladder (e.g. take-profit)
  std::int64_t created_ms{0};
  std::optional<std::int64_t> filled_ms;
};

// One execution. exec_id is the uniqueness key.
struct TradeRecord {
  std::string exec_id;
  std::string order_id;
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  double price{0.0};
  double quantity{0.0};
  double fee{0.0};
  bool is_maker{true};
  std::optional<double> profit;
  std::optional<int> grid_level;
  std::int64_t executed_ms{0};
};

// Summary of a ladder as built by setup/recenter.
struct GridSnapshot {
  double center_price{0.0};
  double lowest_buy{0.0};
  double highest_sell{0.0};
  int num_buy_levels{0};
  int num_sell_levels{0};
  double grid_spacing{0.0};
  std::string profile;
  std::string reason;
  std::int64_t created_ms{0};
};

struct EquitySnapshot {
  double total_equity{0.0};
  double available_balance{0.0};
  double unrealized_pnl{0.0};
  double positions_value{0.0};
  std::int64_t created_ms{0};
};

// The profile the operator last selected, with the parameters it implied.
struct ActiveConfig {
  std::string profile_name;
  std::string symbol;
  double grid_spacing{0.0};
  int target_levels{0};
  double profit_target{0.0};
  double max_exposure_pct{0.0};
  int leverage{1};
  std::int64_t saved_ms{0};
};

struct EventRecord {
  std::string type;
  Severity severity{Severity::Info};
  std::string message;
  nlohmann::json details = nlohmann::json::object();
  std::int64_t created_ms{0};
};

struct PnlSummary {
  int period_hours{24};
  double realized_pnl{0.0};
  int total_trades{0};
  int winning_trades{0};
  int losing_trades{0};
  double total_fees{0.0};
  std::int64_t calculated_ms{0};
};

}  // namespace gridbot
