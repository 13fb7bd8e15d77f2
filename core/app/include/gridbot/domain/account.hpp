#pragma once

#include <cstdint>
#include <string>

namespace gridbot {
namespace domain {

// -----------------------------------------------------------------------------
// WalletBalance
// -----------------------------------------------------------------------------
// Settlement-coin balance of the trading account (USDT for linear perps).
//
// total_equity includes unrealized PnL and is what the drawdown kill switch
// tracks. available_balance is what can still be committed as margin.
// -----------------------------------------------------------------------------
struct WalletBalance {
  double total_equity{0.0};
  double available_balance{0.0};
  double unrealized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// Ticker
// -----------------------------------------------------------------------------
// Top of book plus last and mark price. bid/ask drive the maker-safety
// check; mark drives the grid center and position valuation.
// -----------------------------------------------------------------------------
struct Ticker {
  std::string symbol;
  double bid{0.0};
  double ask{0.0};
  double last{0.0};
  double mark{0.0};
};

// -----------------------------------------------------------------------------
// MarketTick: one price update from the tick feed
// -----------------------------------------------------------------------------
// bid/ask are optional on the wire; 0 means "derive from price".
// -----------------------------------------------------------------------------
struct MarketTick {
  std::int64_t timestamp_ms{0};
  std::string symbol;
  double price{0.0};
  double bid{0.0};
  double ask{0.0};
};

}  // namespace domain
}  // namespace gridbot
