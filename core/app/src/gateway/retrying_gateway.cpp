#include "gridbot/gateway/retrying_gateway.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace gridbot {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RetryingGateway::RetryingGateway(IExchangeGateway& inner, RetryPolicy policy,
                                 Sleeper sleeper)
    : inner_(inner), policy_(policy), sleeper_(std::move(sleeper)) {
  if (policy_.max_attempts < 1) {
    policy_.max_attempts = 1;
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) {
      std::this_thread::sleep_for(d);
    };
  }
}

// -----------------------------------------------------------------------------
// backoffFor: base * 2^min(attempt, kMaxBackoffDoublings)
// -----------------------------------------------------------------------------
std::chrono::milliseconds RetryingGateway::backoffFor(int attempt) const {
  const int doublings =
      std::clamp(attempt, 0, RetryPolicy::kMaxBackoffDoublings);
  return policy_.base_backoff * (1LL << doublings);
}

// -----------------------------------------------------------------------------
// withRetry: shared retry loop for every forwarded call
// -----------------------------------------------------------------------------
template <typename T, typename Call>
Result<T> RetryingGateway::withRetry(const char* operation, Call&& call) {
  GatewayError last;
  for (int attempt = 0; attempt < policy_.max_attempts; ++attempt) {
    Result<T> result = call();
    if (result.ok() || !result.error().retryable()) {
      return result;
    }
    last = result.error();

    if (attempt + 1 < policy_.max_attempts) {
      const auto delay = backoffFor(attempt);
      std::cerr << "[RetryingGateway] " << operation << " failed: "
                << last.describe() << ". Retry " << (attempt + 1) << "/"
                << (policy_.max_attempts - 1) << " in " << delay.count()
                << " ms\n";
      sleeper_(delay);
    }
  }

  std::cerr << "[RetryingGateway] " << operation << " gave up after "
            << policy_.max_attempts << " attempt(s): " << last.describe()
            << "\n";
  return GatewayError{ErrorKind::RetriesExhausted, last.code,
                      std::string(operation) + ": " + last.message};
}

// -----------------------------------------------------------------------------
// Forwarded calls
// -----------------------------------------------------------------------------
Result<double> RetryingGateway::getMarkPrice(const std::string& symbol) {
  return withRetry<double>("getMarkPrice",
                           [&] { return inner_.getMarkPrice(symbol); });
}

Result<domain::Ticker> RetryingGateway::getTicker(const std::string& symbol) {
  return withRetry<domain::Ticker>("getTicker",
                                   [&] { return inner_.getTicker(symbol); });
}

Result<domain::InstrumentSpec> RetryingGateway::getInstrumentSpec(
    const std::string& symbol) {
  return withRetry<domain::InstrumentSpec>(
      "getInstrumentSpec", [&] { return inner_.getInstrumentSpec(symbol); });
}

Result<std::string> RetryingGateway::placeOrder(
    const domain::OrderRequest& request) {
  if (request.order_link_id.empty()) {
    return inner_.placeOrder(request);
  }
  return withRetry<std::string>("placeOrder",
                                [&] { return inner_.placeOrder(request); });
}

Status RetryingGateway::cancelAllOrders(const std::string& symbol) {
  return withRetry<std::monostate>(
      "cancelAllOrders", [&] { return inner_.cancelAllOrders(symbol); });
}

Result<std::vector<domain::OpenOrder>> RetryingGateway::getOpenOrders(
    const std::string& symbol) {
  return withRetry<std::vector<domain::OpenOrder>>(
      "getOpenOrders", [&] { return inner_.getOpenOrders(symbol); });
}

Result<std::vector<domain::Execution>> RetryingGateway::getExecutions(
    const std::string& symbol, std::size_t limit) {
  return withRetry<std::vector<domain::Execution>>(
      "getExecutions", [&] { return inner_.getExecutions(symbol, limit); });
}

Result<std::vector<domain::Position>> RetryingGateway::getPositions(
    const std::string& symbol) {
  return withRetry<std::vector<domain::Position>>(
      "getPositions", [&] { return inner_.getPositions(symbol); });
}

Result<domain::WalletBalance> RetryingGateway::getWalletBalance() {
  return withRetry<domain::WalletBalance>(
      "getWalletBalance", [&] { return inner_.getWalletBalance(); });
}

}  // namespace gridbot
