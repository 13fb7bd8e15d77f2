#pragma once

// =============================================================================
// fake_exchange_gateway.hpp
// =============================================================================
// Scripted IExchangeGateway for unit tests.
//
//   - Every call is counted by operation name ("mark", "ticker", "spec",
//     "place", "cancel", "open", "exec", "positions", "wallet").
//   - failNext(op, error, times) makes the next `times` calls of that
//     operation return `error` (times < 0 = until clearFailures()).
//   - Placed orders rest in the open-order list until cancelAllOrders().
//
// All members are guarded by one mutex, so the double can be shared with
// GridBot's loop threads.
// =============================================================================

#include "gridbot/gateway/i_exchange_gateway.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gridbot {
namespace test {

class FakeExchangeGateway final : public IExchangeGateway {
 public:
  FakeExchangeGateway() {
    spec_.symbol = "BTCUSDT";
    spec_.min_order_qty = 0.001;
    spec_.qty_step = 0.001;
    spec_.tick_size = 0.01;
    spec_.min_notional = 5.0;
    ticker_.symbol = "BTCUSDT";
    ticker_.bid = 99.99;
    ticker_.ask = 100.01;
  }

  // --- Scripting -------------------------------------------------------------
  void setMarkPrice(double price) {
    std::lock_guard lock(mutex_);
    mark_ = price;
  }

  void setTicker(double bid, double ask) {
    std::lock_guard lock(mutex_);
    ticker_.bid = bid;
    ticker_.ask = ask;
  }

  void setSpec(const domain::InstrumentSpec& spec) {
    std::lock_guard lock(mutex_);
    spec_ = spec;
  }

  void setWallet(double equity, double available) {
    std::lock_guard lock(mutex_);
    wallet_.total_equity = equity;
    wallet_.available_balance = available;
  }

  void setPositions(std::vector<domain::Position> positions) {
    std::lock_guard lock(mutex_);
    positions_ = std::move(positions);
  }

  // Newest first, as a venue reports them.
  void setExecutions(std::vector<domain::Execution> executions) {
    std::lock_guard lock(mutex_);
    executions_ = std::move(executions);
  }

  void addOpenOrder(const domain::OpenOrder& order) {
    std::lock_guard lock(mutex_);
    open_orders_.push_back(order);
  }

  void failNext(const std::string& op, GatewayError error, int times = 1) {
    std::lock_guard lock(mutex_);
    failures_[op] = {std::move(error), times};
  }

  void clearFailures() {
    std::lock_guard lock(mutex_);
    failures_.clear();
  }

  // --- Inspection ------------------------------------------------------------
  int calls(const std::string& op) const {
    std::lock_guard lock(mutex_);
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
  }

  std::vector<domain::OrderRequest> placed() const {
    std::lock_guard lock(mutex_);
    return placed_;
  }

  std::size_t openOrderCount() const {
    std::lock_guard lock(mutex_);
    return open_orders_.size();
  }

  // --- IExchangeGateway ------------------------------------------------------
  Result<double> getMarkPrice(const std::string&) override {
    std::lock_guard lock(mutex_);
    if (auto e = takeFailureLocked("mark")) {
      return *e;
    }
    return mark_;
  }

  Result<domain::Ticker> getTicker(const std::string&) override {
    std::lock_guard lock(mutex_);
    if (auto e = takeFailureLocked("ticker")) {
      return *e;
    }
    return ticker_;
  }

  Result<domain::InstrumentSpec> getInstrumentSpec(
      const std::string&) override {
    std::lock_guard lock(mutex_);
    if (auto e = takeFailureLocked("spec")) {
      return *e;
    }
    return spec_;
  }

  Result<std::string> placeOrder(const domain::OrderRequest& request) override {
    std::lock_guard lock(mutex_);
    if (auto e = takeFailureLocked("place")) {
      return *e;
    }
    placed_.push_back(request);
    domain::OpenOrder o;
    o.order_id = "ord-" + std::to_string(++next_id_);
    o.order_link_id = request.order_link_id;
    o.symbol = request.symbol;
    o.side = request.side;
    o.price = request.price;
    o.quantity = request.quantity;
    open_orders_.push_back(o);
    return o.order_id;
  }

  Status cancelAllOrders(const std::string&) override {
    std::lock_guard lock(mutex_);
    if (auto e = takeFailureLocked("cancel")) {
      return *e;
    }
    open_orders_.clear();
    return okStatus();
  }

  Result<std::vector<domain::OpenOrder>> getOpenOrders(
      const std::string&) override {
    std::lock_guard lock(mutex_);
    if (auto e = takeFailureLocked("open")) {
      return *e;
    }
    return open_orders_;
  }

  Result<std::vector<domain::Execution>> getExecutions(
      const std::string&, std::size_t limit) override {
    std::lock_guard lock(mutex_);
    if (auto e = takeFailureLocked("exec")) {
      return *e;
    }
    std::vector<domain::Execution> out = executions_;
    if (out.size() > limit) {
      out.resize(limit);
    }
    return out;
  }

  Result<std::vector<domain::Position>> getPositions(
      const std::string&) override {
    std::lock_guard lock(mutex_);
    if (auto e = takeFailureLocked("positions")) {
      return *e;
    }
    return positions_;
  }

  Result<domain::WalletBalance> getWalletBalance() override {
    std::lock_guard lock(mutex_);
    if (auto e = takeFailureLocked("wallet")) {
      return *e;
    }
    return wallet_;
  }

 private:
  // Counts the call and consumes one scripted failure, if any.
  std::optional<GatewayError> takeFailureLocked(const std::string& op) {
    ++calls_[op];
    auto it = failures_.find(op);
    if (it == failures_.end()) {
      return std::nullopt;
    }
    GatewayError error = it->second.first;
    if (it->second.second > 0 && --it->second.second == 0) {
      failures_.erase(it);
    }
    return error;
  }

  mutable std::mutex mutex_;
  double mark_{100.0};
  domain::Ticker ticker_;
  domain::InstrumentSpec spec_;
  domain::WalletBalance wallet_{1000.0, 1000.0, 0.0};
  std::vector<domain::Position> positions_;
  std::vector<domain::Execution> executions_;
  std::vector<domain::OpenOrder> open_orders_;
  std::vector<domain::OrderRequest> placed_;
  std::map<std::string, std::pair<GatewayError, int>> failures_;
  std::map<std::string, int> calls_;
  int next_id_{0};
};

// Convenience error values.
inline GatewayError networkError(const std::string& msg = "timeout") {
  return GatewayError{ErrorKind::Network, 0, msg};
}

inline GatewayError rejectedError(const std::string& msg = "rejected") {
  return GatewayError{ErrorKind::Rejected, 10001, msg};
}

}  // namespace test
}  // namespace gridbot
