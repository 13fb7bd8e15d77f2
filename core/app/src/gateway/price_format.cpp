#include "gridbot/gateway/price_format.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace gridbot {

namespace {

constexpr int kMaxDecimals = 12;

double roundToDecimals(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

std::string render(double value, int decimals) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(decimals) << value;
  return out.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// stepDecimals: smallest d such that step * 10^d is an integer
// -----------------------------------------------------------------------------
int stepDecimals(double step) {
  if (step <= 0.0) {
    return 0;
  }
  for (int d = 0; d < kMaxDecimals; ++d) {
    const double scaled = step * std::pow(10.0, d);
    if (std::abs(scaled - std::round(scaled)) <
        1e-9 * std::max(1.0, scaled)) {
      return d;
    }
  }
  return kMaxDecimals;
}

// -----------------------------------------------------------------------------
// floorToStep: floor onto the step grid, then strip binary noise
// -----------------------------------------------------------------------------
double floorToStep(double value, double step) {
  if (step <= 0.0) {
    return value;
  }
  const double units = std::floor(value / step + kFloorEpsilon);
  return roundToDecimals(units * step, stepDecimals(step));
}

// -----------------------------------------------------------------------------
// formatPrice / formatQuantity
// -----------------------------------------------------------------------------
std::string formatPrice(double price, double tick_size) {
  return render(floorToStep(price, tick_size), stepDecimals(tick_size));
}

std::string formatQuantity(double qty, double qty_step) {
  return render(floorToStep(qty, qty_step), stepDecimals(qty_step));
}

}  // namespace gridbot
