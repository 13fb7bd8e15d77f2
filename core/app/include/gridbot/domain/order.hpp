#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gridbot {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Trading side of an order, an execution, or a grid level.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderType / TimeInForce
// -----------------------------------------------------------------------------
// The grid only ever rests limit orders; Market exists so that the paper
// venue can represent taker flow and so that requests are self-describing.
//
// PostOnly is the maker guarantee: the venue must reject (not fill) a
// PostOnly order that would cross the spread on arrival.
// -----------------------------------------------------------------------------
enum class OrderType {
  Limit,
  Market,
};

enum class TimeInForce {
  GoodTillCancel,
  ImmediateOrCancel,
  PostOnly,
};

// -----------------------------------------------------------------------------
// OrderStatus: lifecycle of a resting grid order as seen by the store
// -----------------------------------------------------------------------------
//
// @details
// The bot does not run its own order state machine; the venue is the source
// of truth. These values are what the State Store records:
//
//   New ──> PartiallyFilled ──> Filled
//    │              │
//    └──> Canceled  └──> Canceled
//    └──> Rejected
//
// Terminal states: Filled, Canceled, Rejected.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  New,
  PartiallyFilled,
  Filled,
  Canceled,
  Rejected,
};

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
//
// @brief  Everything the Exchange Gateway needs to place one order.
//
// @details
// price and quantity are already floored to the instrument's tick and step
// by the caller (see gateway/price_format.hpp).
//
// order_link_id is a client-assigned id. When non-empty, the venue
// deduplicates on it, which is what makes a retried placement safe. The
// grid derives it from the ladder generation and level index so that a
// retried request for the same level carries the same id.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  double quantity{0.0};
  double price{0.0};
  TimeInForce time_in_force{TimeInForce::PostOnly};
  std::string order_link_id;
};

// -----------------------------------------------------------------------------
// OpenOrder: a resting order as reported by the venue
// -----------------------------------------------------------------------------
struct OpenOrder {
  std::string order_id;
  std::string order_link_id;
  std::string symbol;
  Side side{Side::Buy};
  double price{0.0};
  double quantity{0.0};
  double filled_quantity{0.0};
  OrderStatus status{OrderStatus::New};
  std::int64_t created_ms{0};
};

// -----------------------------------------------------------------------------
// Execution: one fill reported by the venue
// -----------------------------------------------------------------------------
//
// exec_id is unique per fill and is the deduplication key for the trade
// journal; a single order may produce several executions.
// -----------------------------------------------------------------------------
struct Execution {
  std::string exec_id;
  std::string order_id;
  std::string symbol;
  Side side{Side::Buy};
  double price{0.0};
  double quantity{0.0};
  double fee{0.0};
  double closed_pnl{0.0};  // realized PnL of the part that reduced a position
  bool is_maker{true};
  std::int64_t exec_time_ms{0};
};

// -----------------------------------------------------------------------------
// String conversions used by the journal, IPC responses and log lines.
// -----------------------------------------------------------------------------
inline const char* toString(Side s) {
  switch (s) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

inline const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::New:             return "New";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::Canceled:        return "Canceled";
    case OrderStatus::Rejected:        return "Rejected";
  }
  return "Unknown";
}

inline std::optional<Side> sideFromString(const std::string& s) {
  if (s == "Buy") {
    return Side::Buy;
  }
  if (s == "Sell") {
    return Side::Sell;
  }
  return std::nullopt;
}

inline std::optional<OrderStatus> orderStatusFromString(const std::string& s) {
  if (s == "New") return OrderStatus::New;
  if (s == "PartiallyFilled") return OrderStatus::PartiallyFilled;
  if (s == "Filled") return OrderStatus::Filled;
  if (s == "Canceled") return OrderStatus::Canceled;
  if (s == "Rejected") return OrderStatus::Rejected;
  return std::nullopt;
}

inline Side opposite(Side s) {
  return s == Side::Buy ? Side::Sell : Side::Buy;
}

}  // namespace domain
}  // namespace gridbot
