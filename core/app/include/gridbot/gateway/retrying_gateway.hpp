#pragma once

#include "gridbot/gateway/i_exchange_gateway.hpp"

#include <chrono>
#include <functional>

namespace gridbot {

// -----------------------------------------------------------------------------
// RetryPolicy
// -----------------------------------------------------------------------------
// Attempt k (0-based) that fails with a retryable error is followed by a
// sleep of base_backoff * 2^k before attempt k+1. With the defaults a call
// is tried three times, waiting 1 s and then 2 s. The exponent stops growing
// at kMaxBackoffDoublings.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  static constexpr int kMaxBackoffDoublings = 10;

  int max_attempts{3};
  std::chrono::milliseconds base_backoff{1000};
};

// -----------------------------------------------------------------------------
// RetryingGateway: bounded exponential backoff around another gateway
// -----------------------------------------------------------------------------
//
// @brief  Decorator that re-issues calls failing with a retryable error
//         (Network, RateLimited) and converts exhaustion into a
//         RetriesExhausted error result.
//
// @details
// Terminal errors (Rejected, NotFound) are returned on the first attempt;
// retrying them cannot succeed.
//
// placeOrder() is only retried when the request carries an order_link_id.
// Without one the venue cannot tell a retry from a second order, so a
// transient failure is returned to the caller as-is.
//
// The sleeper is injectable so that tests can record backoff delays
// instead of waiting them out.
//
// Thread model:
//   Stateless apart from configuration; every call runs entirely on the
//   calling loop's thread, including its backoff sleeps.
//
// Ownership:
//   Holds a non-owning reference to the wrapped gateway, which must outlive
//   this decorator.
// -----------------------------------------------------------------------------
class RetryingGateway final : public IExchangeGateway {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  RetryingGateway(IExchangeGateway& inner, RetryPolicy policy,
                  Sleeper sleeper = {});

  RetryingGateway(const RetryingGateway&) = delete;
  RetryingGateway& operator=(const RetryingGateway&) = delete;
  RetryingGateway(RetryingGateway&&) = delete;
  RetryingGateway& operator=(RetryingGateway&&) = delete;

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

  // Delay slept after the given failed attempt (0-based).
  std::chrono::milliseconds backoffFor(int attempt) const;

 private:
  template <typename T, typename Call>
  Result<T> withRetry(const char* operation, Call&& call);

  IExchangeGateway& inner_;
  RetryPolicy policy_;
  Sleeper sleeper_;
};

}  // namespace gridbot
