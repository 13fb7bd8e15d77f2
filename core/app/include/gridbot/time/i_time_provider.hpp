#pragma once

#include <cstdint>

namespace gridbot {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Every time-dependent decision in the bot reads the clock through this
// interface:
//   - GridEngine: time-based recenter, price-history windows, timestamps on
//     persisted orders and grid snapshots.
//   - RiskController: UTC day rollover of the daily equity high.
//   - GridBot: fill times, equity snapshot times, status timestamps.
//
// Two implementations:
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → a value the caller sets or advances. Tests use
//     it to cross a 48 h recenter threshold or a UTC midnight without
//     sleeping.
//
// Time is int64_t milliseconds since the Unix epoch, UTC. That matches the
// venue's timestamps and the JSON tick feed without chrono conversions.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from every polling
//   loop thread. Writers synchronize internally.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since 1970-01-01 00:00:00 UTC.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace gridbot
