#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace gridbot {

// One mark-price observation.
struct PricePoint {
  double price{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PriceHistory: bounded FIFO of mark-price samples
// -----------------------------------------------------------------------------
//
// @brief  Keeps the most recent max_points samples, oldest first, and answers
//         the window queries the grid engine needs for its volatility proxy
//         and its one-sided / pump-dump recenter checks.
//
// @details
// The default capacity (720) is twelve hours at one sample per minute.
// Once full, every record() evicts the oldest sample.
//
// Thread-safety: None. GridEngine guards its instance with its own mutex.
// -----------------------------------------------------------------------------
class PriceHistory {
 public:
  explicit PriceHistory(std::size_t max_points = 720);

  void record(double price, std::int64_t timestamp_ms);
  void clear() { points_.clear(); }

  std::size_t size() const { return points_.size(); }
  bool empty() const { return points_.empty(); }
  std::size_t capacity() const { return max_points_; }

  // The newest n prices (fewer if not available), oldest of them first.
  std::vector<double> lastPrices(std::size_t n) const;

  // Samples with timestamp_ms >= cutoff_ms, oldest first.
  std::vector<PricePoint> since(std::int64_t cutoff_ms) const;

 private:
  std::size_t max_points_;
  std::deque<PricePoint> points_;
};

}  // namespace gridbot
