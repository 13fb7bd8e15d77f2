#include "gridbot/strategy/price_history.hpp"

#include <algorithm>

namespace gridbot {

PriceHistory::PriceHistory(std::size_t max_points)
    : max_points_(std::max<std::size_t>(max_points, 1)) {}

void PriceHistory::record(double price, std::int64_t timestamp_ms) {
  points_.push_back(PricePoint{price, timestamp_ms});
  while (points_.size() > max_points_) {
    points_.pop_front();
  }
}

std::vector<double> PriceHistory::lastPrices(std::size_t n) const {
  const std::size_t count = std::min(n, points_.size());
  std::vector<double> out;
  out.reserve(count);
  for (auto it = points_.end() - static_cast<std::ptrdiff_t>(count);
       it != points_.end(); ++it) {
    out.push_back(it->price);
  }
  return out;
}

std::vector<PricePoint> PriceHistory::since(std::int64_t cutoff_ms) const {
  std::vector<PricePoint> out;
  for (const auto& p : points_) {
    if (p.timestamp_ms >= cutoff_ms) {
      out.push_back(p);
    }
  }
  return out;
}

}  // namespace gridbot
