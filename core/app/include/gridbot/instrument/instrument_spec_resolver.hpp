#pragma once

#include "gridbot/domain/instrument_spec.hpp"
#include "gridbot/gateway/i_exchange_gateway.hpp"

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace gridbot {

// Thrown when a spec cannot be fetched or the venue returns an unusable one.
class InstrumentSpecError : public std::runtime_error {
 public:
  explicit InstrumentSpecError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// InstrumentSpecResolver: fetch-once cache of exchange trading rules
// -----------------------------------------------------------------------------
//
// @brief  Returns tick size, quantity step, minimum quantity and minimum
//         notional for a symbol, asking the gateway only the first time.
//
// @details
// The spec is fetched during engine initialization and is immutable for the
// rest of the run. A bot that cannot learn its instrument's increments
// cannot size or price a single order, so a fetch failure is an
// unrecoverable startup error and is thrown rather than returned.
//
// Thread-safety: resolve()/refresh() lock an internal mutex; the returned
//                copy is safe to keep.
// Ownership:     Holds a non-owning reference to the gateway.
// -----------------------------------------------------------------------------
class InstrumentSpecResolver {
 public:
  explicit InstrumentSpecResolver(IExchangeGateway& gateway);

  InstrumentSpecResolver(const InstrumentSpecResolver&) = delete;
  InstrumentSpecResolver& operator=(const InstrumentSpecResolver&) = delete;

  // -------------------------------------------------------------------------
  // resolve(symbol)
  // -------------------------------------------------------------------------
  // @brief  Cached spec for symbol; fetched on first use.
  //
  // @throws InstrumentSpecError if the gateway call fails or the spec has a
  //         non-positive tick size or quantity step.
  // -------------------------------------------------------------------------
  domain::InstrumentSpec resolve(const std::string& symbol);

  // Drops the cached entry and fetches again. Same failure contract.
  domain::InstrumentSpec refresh(const std::string& symbol);

  bool isCached(const std::string& symbol) const;

 private:
  domain::InstrumentSpec fetchLocked(const std::string& symbol);

  IExchangeGateway& gateway_;
  mutable std::mutex mutex_;
  std::map<std::string, domain::InstrumentSpec> cache_;
};

}  // namespace gridbot
