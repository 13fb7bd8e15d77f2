#pragma once

#include "gridbot/domain/account.hpp"
#include "gridbot/domain/instrument_spec.hpp"
#include "gridbot/domain/order.hpp"
#include "gridbot/domain/position.hpp"
#include "gridbot/gateway/gateway_result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gridbot {

// -----------------------------------------------------------------------------
// IExchangeGateway: venue abstraction consumed by the grid and risk engines
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface over a derivatives venue: market data,
//         account state, and order entry for one product category.
//
// @details
// Implementations:
//   - PaperExchangeGateway: in-process simulated venue (default binary).
//   - RetryingGateway:      decorator adding bounded exponential backoff.
//   - FakeExchangeGateway:  scripted double used by the unit tests.
//
// Every call returns Result<T>; implementations must not throw for I/O
// outcomes. All calls are safe to retry except placeOrder(), which is only
// safe when the request carries an order_link_id the venue deduplicates on.
//
// Thread-safety contract:
//   Implementations MUST tolerate concurrent calls from the four polling
//   loops and the IPC thread.
//
// Ownership:
//   Engines hold a non-owning reference; the gateway outlives them.
// -----------------------------------------------------------------------------
class IExchangeGateway {
 public:
  virtual ~IExchangeGateway() = default;

  // --- Market data -----------------------------------------------------------
  virtual Result<double> getMarkPrice(const std::string& symbol) = 0;
  virtual Result<domain::Ticker> getTicker(const std::string& symbol) = 0;
  virtual Result<domain::InstrumentSpec> getInstrumentSpec(
      const std::string& symbol) = 0;

  // --- Orders ----------------------------------------------------------------

  // Returns the venue-assigned order id.
  virtual Result<std::string> placeOrder(
      const domain::OrderRequest& request) = 0;
  virtual Status cancelAllOrders(const std::string& symbol) = 0;
  virtual Result<std::vector<domain::OpenOrder>> getOpenOrders(
      const std::string& symbol) = 0;

  // Most recent executions first, at most `limit` of them.
  virtual Result<std::vector<domain::Execution>> getExecutions(
      const std::string& symbol, std::size_t limit) = 0;

  // --- Account ---------------------------------------------------------------
  virtual Result<std::vector<domain::Position>> getPositions(
      const std::string& symbol) = 0;
  virtual Result<domain::WalletBalance> getWalletBalance() = 0;
};

}  // namespace gridbot
