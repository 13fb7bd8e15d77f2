#pragma once

#include "gridbot/config/bot_config.hpp"
#include "gridbot/gateway/i_exchange_gateway.hpp"
#include "gridbot/time/i_time_provider.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gridbot {

// -----------------------------------------------------------------------------
// PaperExchangeGateway: in-process simulated perpetual-futures venue
// -----------------------------------------------------------------------------
//
// @brief  IExchangeGateway implementation that keeps a simulated order book
//         edge, resting limit orders, one net position and a wallet, and
//         fills resting orders as the mark price moves through them.
//
// @details
// Price model:
//   A single mark price drives everything. Best bid/ask sit spread_ticks
//   ticks either side of it unless a tick supplies explicit values.
//
// Order entry (placeOrder):
//   - Symbol must match the simulated instrument (NotFound otherwise).
//   - Quantity must be >= min_order_qty and price * qty >= min_notional
//     (Rejected otherwise).
//   - PostOnly limit orders that would cross (buy >= ask, sell <= bid) are
//     Rejected instead of filled.
//   - A repeated order_link_id returns the id of the order already placed
//     with it, which is what makes RetryingGateway's placement retries safe.
//
// Matching (onTick / setMarkPrice):
//   A resting buy fills in full at its own price once mark <= price; a
//   resting sell once mark >= price. Fills are maker fills and pay
//   maker_fee_rate on notional. Market orders fill immediately at the
//   touch as taker.
//
// Position accounting (applyFill):
//   Net signed quantity with a weighted average entry. Reducing fills realize
//   PnL; a fill that crosses zero closes the old position and opens the
//   remainder at the fill price. A net quantity within
//   qty_step * kFloorEpsilon of zero is booked as flat.
//
// Wallet:
//   equity    = initial balance + realized PnL + unrealized PnL - fees
//   available = equity - |position| * mark - resting order notional
//   (1x leverage model), floored at 0.
//
// Thread model:
//   Called concurrently from the polling loops, the IPC thread and the
//   market-data thread. One mutex guards all state.
//
// Ownership:
//   Owned by main() (or a test); holds a reference to the time provider.
// -----------------------------------------------------------------------------
class PaperExchangeGateway final : public IExchangeGateway {
 public:
  // Paper-venue error codes.
  static constexpr int kErrUnknownSymbol = 40001;
  static constexpr int kErrInvalidQuantity = 40002;
  static constexpr int kErrMinNotional = 40003;
  static constexpr int kErrPostOnlyCross = 40004;
  static constexpr int kErrInvalidPrice = 40005;

  PaperExchangeGateway(domain::InstrumentSpec spec, const PaperConfig& config,
                       const ITimeProvider& time);

  PaperExchangeGateway(const PaperExchangeGateway&) = delete;
  PaperExchangeGateway& operator=(const PaperExchangeGateway&) = delete;
  PaperExchangeGateway(PaperExchangeGateway&&) = delete;
  PaperExchangeGateway& operator=(PaperExchangeGateway&&) = delete;

  // --- IExchangeGateway ------------------------------------------------------
  Result<double> getMarkPrice(const std::string& symbol) override;
  Result<domain::Ticker> getTicker(const std::string& symbol) override;
  Result<domain::InstrumentSpec> getInstrumentSpec(
      const std::string& symbol) override;
  Result<std::string> placeOrder(const domain::OrderRequest& request) override;
  Status cancelAllOrders(const std::string& symbol) override;
  Result<std::vector<domain::OpenOrder>> getOpenOrders(
      const std::string& symbol) override;
  Result<std::vector<domain::Execution>> getExecutions(
      const std::string& symbol, std::size_t limit) override;
  Result<std::vector<domain::Position>> getPositions(
      const std::string& symbol) override;
  Result<domain::WalletBalance> getWalletBalance() override;

  // -------------------------------------------------------------------------
  // onTick(tick)
  // -------------------------------------------------------------------------
  // @brief  Applies a tick from the market-data feed: updates mark/bid/ask
  //         and fills every resting order the new price reached.
  //
  // Ticks for other symbols are ignored.
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void onTick(const domain::MarketTick& tick);

  // Shorthand for onTick() with derived bid/ask.
  void setMarkPrice(double price);

  std::size_t openOrderCount() const;

 private:
  static constexpr std::size_t kMaxExecutionHistory = 500;

  // All private helpers expect mutex_ to be held.
  void setPricesLocked(double mark, double bid, double ask);
  void matchRestingOrdersLocked();
  void fillLocked(const domain::OpenOrder& order, double fill_price,
                  bool is_maker);
  double equityLocked() const;
  double restingNotionalLocked() const;
  bool symbolMatches(const std::string& symbol) const;

  // Weighted-average position math; returns the PnL realized by this fill.
  // |net| <= flat_qty counts as no position.
  static double applyFill(domain::Position& pos, double signed_fill_qty,
                          double fill_price, double flat_qty);

  const domain::InstrumentSpec spec_;
  const double initial_balance_;
  const double maker_fee_rate_;
  const double taker_fee_rate_;
  const int spread_ticks_;
  const ITimeProvider& time_;

  mutable std::mutex mutex_;
  double mark_{0.0};
  double bid_{0.0};
  double ask_{0.0};
  std::vector<domain::OpenOrder> open_orders_;
  std::unordered_map<std::string, std::string> link_to_order_;
  domain::Position position_;
  std::deque<domain::Execution> executions_;  // newest at the front
  double fees_paid_{0.0};
  std::uint64_t next_order_id_{1};
  std::uint64_t next_exec_id_{1};
};

}  // namespace gridbot
