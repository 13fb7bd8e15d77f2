#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace gridbot {

// -----------------------------------------------------------------------------
// ErrorKind
// -----------------------------------------------------------------------------
//
// @details
// Splits gateway failures into the two classes callers act on differently:
//
//   retryable (transport):   Network, RateLimited
//   terminal  (validation):  Rejected, NotFound, RetriesExhausted
//
// RetryingGateway retries only the first class. RetriesExhausted is what a
// caller sees once the retry budget for a retryable fault is spent.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  Network,
  RateLimited,
  Rejected,
  NotFound,
  RetriesExhausted,
};

inline const char* toString(ErrorKind k) {
  switch (k) {
    case ErrorKind::Network:          return "Network";
    case ErrorKind::RateLimited:      return "RateLimited";
    case ErrorKind::Rejected:         return "Rejected";
    case ErrorKind::NotFound:         return "NotFound";
    case ErrorKind::RetriesExhausted: return "RetriesExhausted";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// GatewayError
// -----------------------------------------------------------------------------
// code is the venue's numeric error code (0 when the failure never reached
// the venue). message is human-readable and goes straight into log lines.
// -----------------------------------------------------------------------------
struct GatewayError {
  ErrorKind kind{ErrorKind::Network};
  int code{0};
  std::string message;

  bool retryable() const {
    return kind == ErrorKind::Network || kind == ErrorKind::RateLimited;
  }

  std::string describe() const {
    return std::string(toString(kind)) + " (code " + std::to_string(code) +
           "): " + message;
  }
};

// -----------------------------------------------------------------------------
// Result<T>: value or GatewayError
// -----------------------------------------------------------------------------
//
// @brief  Return type of every IExchangeGateway call.
//
// @details
// Gateway I/O never reports failure by throwing. Callers must test ok()
// before touching value(); value() on a failed result throws
// std::logic_error because that is a programming error, not an I/O outcome.
//
// Both constructors are implicit so implementations can write
// `return price;` or `return GatewayError{...};`.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : data_(std::move(value)) {}                 // NOLINT
  Result(GatewayError error) : data_(std::move(error)) {}      // NOLINT

  bool ok() const { return std::holds_alternative<T>(data_); }
  explicit operator bool() const { return ok(); }

  const T& value() const {
    if (!ok()) {
      throw std::logic_error("Result::value() on error: " +
                             std::get<GatewayError>(data_).describe());
    }
    return std::get<T>(data_);
  }

  T& value() {
    if (!ok()) {
      throw std::logic_error("Result::value() on error: " +
                             std::get<GatewayError>(data_).describe());
    }
    return std::get<T>(data_);
  }

  const GatewayError& error() const {
    if (ok()) {
      throw std::logic_error("Result::error() on success");
    }
    return std::get<GatewayError>(data_);
  }

 private:
  std::variant<T, GatewayError> data_;
};

// Result of calls that carry no payload (e.g. cancelAllOrders).
using Status = Result<std::monostate>;

inline Status okStatus() { return Status(std::monostate{}); }

}  // namespace gridbot
