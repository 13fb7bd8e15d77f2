#include "gridbot/instrument/instrument_spec_resolver.hpp"

#include <iostream>

namespace gridbot {

InstrumentSpecResolver::InstrumentSpecResolver(IExchangeGateway& gateway)
    : gateway_(gateway) {}

domain::InstrumentSpec InstrumentSpecResolver::resolve(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto it = cache_.find(symbol);
  if (it != cache_.end()) {
    return it->second;
  }
  return fetchLocked(symbol);
}

domain::InstrumentSpec InstrumentSpecResolver::refresh(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  cache_.erase(symbol);
  return fetchLocked(symbol);
}

bool InstrumentSpecResolver::isCached(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  return cache_.count(symbol) != 0;
}

// -----------------------------------------------------------------------------
// fetchLocked: ask the venue, validate, cache
// -----------------------------------------------------------------------------
domain::InstrumentSpec InstrumentSpecResolver::fetchLocked(
    const std::string& symbol) {
  auto result = gateway_.getInstrumentSpec(symbol);
  if (!result.ok()) {
    throw InstrumentSpecError("cannot load instrument spec for " + symbol +
                              ": " + result.error().describe());
  }

  domain::InstrumentSpec spec = result.value();
  if (spec.symbol.empty()) {
    spec.symbol = symbol;
  }
  if (!spec.isValid()) {
    throw InstrumentSpecError("venue returned an unusable spec for " + symbol);
  }

  cache_[symbol] = spec;
  std::cout << "[InstrumentSpecResolver] " << symbol
            << ": tick=" << spec.tick_size << " step=" << spec.qty_step
            << " minQty=" << spec.min_order_qty
            << " minNotional=" << spec.min_notional << "\n";
  return spec;
}

}  // namespace gridbot
