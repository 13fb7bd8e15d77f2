#pragma once

#include "gridbot/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace gridbot {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the caller last set.
//
// @details
// Used by tests to make time-dependent grid and risk rules deterministic:
// a test can record 60 price samples one minute apart, jump 48 hours to
// force a time-based recenter, or step across UTC midnight to reset the
// daily equity high, all without sleeping.
//
// Internal storage is a std::atomic<int64_t> so that polling-loop threads
// may read while a test thread advances it.
//
// Ownership:
//   Owned by the test fixture (or harness); passed by reference.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute epoch-millisecond value.
  //
  // Monotonicity is not enforced; tests occasionally rewind on purpose.
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // advance_by(delta_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by delta_ms and returns the new time.
  //
  // Thread-safety: Atomic read-modify-write; safe from any thread.
  // -------------------------------------------------------------------------
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace gridbot
