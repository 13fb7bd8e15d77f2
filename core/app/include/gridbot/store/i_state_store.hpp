#pragma once

#include "gridbot/store/records.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gridbot {

// Thrown when a record cannot be made durable.
class StateStoreError : public std::runtime_error {
 public:
  explicit StateStoreError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// IStateStore: persistence contract of the grid bot
// -----------------------------------------------------------------------------
//
// @brief  Durable record of orders, trades, grid history, equity snapshots,
//         operator configuration, and the event log.
//
// @details
// The engines only depend on these operations, never on a storage schema.
// Every write is durable when it returns; a write that cannot be made
// durable throws StateStoreError. Reads never throw.
//
// Writers: GridEngine (orders, grid history, events), RiskController
// (events), GridBot loops (trades, order status, equity, config, PnL).
//
// Thread-safety contract:
//   Implementations MUST accept concurrent calls from every polling loop
//   and the IPC thread.
// -----------------------------------------------------------------------------
class IStateStore {
 public:
  virtual ~IStateStore() = default;

  // --- Orders ----------------------------------------------------------------
  virtual void saveOrder(const OrderRecord& order) = 0;
  // Unknown ids are ignored. Filled is final; Canceled yields only to Filled.
  virtual void updateOrderStatus(const std::string& order_id,
                                 domain::OrderStatus status,
                                 std::optional<std::int64_t> filled_ms) = 0;
  // Orders whose last recorded status is New or PartiallyFilled.
  virtual std::vector<OrderRecord> getActiveOrders() const = 0;

  // --- Trades ----------------------------------------------------------------

  // Returns false (and writes nothing) when exec_id is already stored.
  virtual bool saveTrade(const TradeRecord& trade) = 0;
  virtual std::vector<TradeRecord> getTradesSince(
      std::int64_t since_ms) const = 0;
  virtual std::size_t countTradesSince(std::int64_t since_ms) const = 0;

  // --- Grid history ----------------------------------------------------------
  virtual void saveGridHistory(const GridSnapshot& snapshot) = 0;
  virtual std::optional<GridSnapshot> getLatestGrid() const = 0;

  // --- Equity ----------------------------------------------------------------
  virtual void saveEquitySnapshot(const EquitySnapshot& snapshot) = 0;
  virtual std::vector<EquitySnapshot> getEquitySnapshotsSince(
      std::int64_t since_ms) const = 0;

  // --- Events ----------------------------------------------------------------
  virtual void logEvent(const std::string& type, Severity severity,
                        const std::string& message,
                        const nlohmann::json& details) = 0;

  void logEvent(const std::string& type, Severity severity,
                const std::string& message) {
    logEvent(type, severity, message, nlohmann::json::object());
  }

  // Newest first.
  virtual std::vector<EventRecord> recentEvents(std::size_t limit) const = 0;

  // --- Operator configuration ------------------------------------------------
  virtual void saveConfig(const ActiveConfig& config) = 0;
  virtual std::optional<ActiveConfig> getActiveConfig() const = 0;

  // --- PnL -------------------------------------------------------------------

  // Aggregates trades of the last period_hours and persists the summary.
  // Returns nullopt (and persists nothing) when there were no trades.
  virtual std::optional<PnlSummary> calculateAndSavePnl(int period_hours) = 0;
  virtual std::optional<PnlSummary> getPnlSummary(int period_hours) const = 0;
};

}  // namespace gridbot
