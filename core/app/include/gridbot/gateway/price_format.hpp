#pragma once

#include <string>

namespace gridbot {

// -----------------------------------------------------------------------------
// Price / quantity formatting
// -----------------------------------------------------------------------------
//
// @brief  Snap values onto an instrument's tick or quantity grid, always
//         flooring, and render them with exactly the step's precision.
//
// @details
// The venue rejects prices that are not a multiple of tick_size and
// quantities that are not a multiple of qty_step. Flooring keeps every order
// within the capital it was sized against.
//
// A value that already sits on the grid but is represented as
// 2.9999999999 * step in binary is treated as 3 * step: the division is
// nudged by kFloorEpsilon (in units of one step) before flooring. Without
// it, formatting an already-formatted value could drop a whole step. The
// price of that nudge: a value less than kFloorEpsilon * step below a grid
// point rounds up onto it (99.99999999995 -> 100.00 on a 0.01 tick). Anything
// further below floors as usual.
//
// All functions are idempotent: f(f(x)) == f(x).
//
// Thread-safety: Stateless; safe from any thread.
// -----------------------------------------------------------------------------

constexpr double kFloorEpsilon = 1e-8;

// Number of decimal places needed to print `step` exactly (0.001 -> 3,
// 0.5 -> 1, 1 -> 0). Capped at 12.
int stepDecimals(double step);

// Largest multiple of `step` that is <= value + kFloorEpsilon * step.
// Returns value unchanged when step <= 0.
double floorToStep(double value, double step);

// floorToStep(price, tick_size) rendered with stepDecimals(tick_size).
std::string formatPrice(double price, double tick_size);

// floorToStep(qty, qty_step) rendered with stepDecimals(qty_step).
std::string formatQuantity(double qty, double qty_step);

}  // namespace gridbot
