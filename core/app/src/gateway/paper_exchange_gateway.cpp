#include "gridbot/gateway/paper_exchange_gateway.hpp"

#include "gridbot/gateway/price_format.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace gridbot {

namespace {

constexpr double kTakerFeeRate = 0.00055;

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: seed prices from the configured initial mark
// -----------------------------------------------------------------------------
PaperExchangeGateway::PaperExchangeGateway(domain::InstrumentSpec spec,
                                           const PaperConfig& config,
                                           const ITimeProvider& time)
    : spec_(std::move(spec)),
      initial_balance_(config.initial_balance),
      maker_fee_rate_(config.maker_fee_rate),
      taker_fee_rate_(kTakerFeeRate),
      spread_ticks_(config.spread_ticks),
      time_(time) {
  position_.symbol = spec_.symbol;
  std::lock_guard lock(mutex_);
  setPricesLocked(config.initial_price, 0.0, 0.0);
  std::cout << "[PaperExchange] " << spec_.symbol << " ready: mark=" << mark_
            << " balance=" << initial_balance_ << "\n";
}

// -----------------------------------------------------------------------------
// Market data
// -----------------------------------------------------------------------------
Result<double> PaperExchangeGateway::getMarkPrice(const std::string& symbol) {
  if (!symbolMatches(symbol)) {
    return GatewayError{ErrorKind::NotFound, kErrUnknownSymbol,
                        "unknown symbol " + symbol};
  }
  std::lock_guard lock(mutex_);
  return mark_;
}

Result<domain::Ticker> PaperExchangeGateway::getTicker(
    const std::string& symbol) {
  if (!symbolMatches(symbol)) {
    return GatewayError{ErrorKind::NotFound, kErrUnknownSymbol,
                        "unknown symbol " + symbol};
  }
  std::lock_guard lock(mutex_);
  domain::Ticker t;
  t.symbol = spec_.symbol;
  t.bid = bid_;
  t.ask = ask_;
  t.last = mark_;
  t.mark = mark_;
  return t;
}

Result<domain::InstrumentSpec> PaperExchangeGateway::getInstrumentSpec(
    const std::string& symbol) {
  if (!symbolMatches(symbol)) {
    return GatewayError{ErrorKind::NotFound, kErrUnknownSymbol,
                        "unknown symbol " + symbol};
  }
  return spec_;
}

// -----------------------------------------------------------------------------
// placeOrder: validate, dedupe on link id, rest or fill
// -----------------------------------------------------------------------------
Result<std::string> PaperExchangeGateway::placeOrder(
    const domain::OrderRequest& request) {
  if (!symbolMatches(request.symbol)) {
    return GatewayError{ErrorKind::NotFound, kErrUnknownSymbol,
                        "unknown symbol " + request.symbol};
  }

  std::lock_guard lock(mutex_);

  if (!request.order_link_id.empty()) {
    auto dup = link_to_order_.find(request.order_link_id);
    if (dup != link_to_order_.end()) {
      return dup->second;
    }
  }

  const bool is_market = request.type == domain::OrderType::Market;
  const bool is_buy = request.side == domain::Side::Buy;
  const double touch = is_buy ? ask_ : bid_;
  const double price = is_market ? touch : request.price;

  if (!is_market && price <= 0.0) {
    return GatewayError{ErrorKind::Rejected, kErrInvalidPrice,
                        "limit price must be positive"};
  }
  if (request.quantity <= 0.0 || request.quantity < spec_.min_order_qty) {
    return GatewayError{ErrorKind::Rejected, kErrInvalidQuantity,
                        "quantity " + formatQuantity(request.quantity,
                                                     spec_.qty_step) +
                            " below minimum"};
  }
  if (request.quantity * price < spec_.min_notional) {
    return GatewayError{ErrorKind::Rejected, kErrMinNotional,
                        "order notional below minimum"};
  }

  const bool crosses = is_buy ? price >= ask_ : price <= bid_;
  if (!is_market && crosses &&
      request.time_in_force == domain::TimeInForce::PostOnly) {
    return GatewayError{ErrorKind::Rejected, kErrPostOnlyCross,
                        "post-only order would take liquidity"};
  }

  domain::OpenOrder order;
  order.order_id = "paper-" + std::to_string(next_order_id_++);
  order.order_link_id = request.order_link_id;
  order.symbol = spec_.symbol;
  order.side = request.side;
  order.price = price;
  order.quantity = request.quantity;
  order.created_ms = time_.now_ms();

  if (!request.order_link_id.empty()) {
    link_to_order_[request.order_link_id] = order.order_id;
  }

  if (is_market || crosses) {
    fillLocked(order, touch, false);
    return order.order_id;
  }

  open_orders_.push_back(order);
  return order.order_id;
}

// -----------------------------------------------------------------------------
// cancelAllOrders
// -----------------------------------------------------------------------------
Status PaperExchangeGateway::cancelAllOrders(const std::string& symbol) {
  if (!symbolMatches(symbol)) {
    return GatewayError{ErrorKind::NotFound, kErrUnknownSymbol,
                        "unknown symbol " + symbol};
  }
  std::lock_guard lock(mutex_);
  if (!open_orders_.empty()) {
    std::cout << "[PaperExchange] cancelled " << open_orders_.size()
              << " order(s)\n";
  }
  open_orders_.clear();
  return okStatus();
}

Result<std::vector<domain::OpenOrder>> PaperExchangeGateway::getOpenOrders(
    const std::string& symbol) {
  if (!symbolMatches(symbol)) {
    return GatewayError{ErrorKind::NotFound, kErrUnknownSymbol,
                        "unknown symbol " + symbol};
  }
  std::lock_guard lock(mutex_);
  return open_orders_;
}

Result<std::vector<domain::Execution>> PaperExchangeGateway::getExecutions(
    const std::string& symbol, std::size_t limit) {
  if (!symbolMatches(symbol)) {
    return GatewayError{ErrorKind::NotFound, kErrUnknownSymbol,
                        "unknown symbol " + symbol};
  }
  std::lock_guard lock(mutex_);
  const std::size_t n = std::min(limit, executions_.size());
  return std::vector<domain::Execution>(executions_.begin(),
                                        executions_.begin() + n);
}

// -----------------------------------------------------------------------------
// Account
// -----------------------------------------------------------------------------
Result<std::vector<domain::Position>> PaperExchangeGateway::getPositions(
    const std::string& symbol) {
  if (!symbolMatches(symbol)) {
    return GatewayError{ErrorKind::NotFound, kErrUnknownSymbol,
                        "unknown symbol " + symbol};
  }
  std::lock_guard lock(mutex_);
  domain::Position pos = position_;
  pos.mark_price = mark_;
  pos.unrealized_pnl = (mark_ - pos.average_price) * pos.net_quantity;
  return std::vector<domain::Position>{pos};
}

Result<domain::WalletBalance> PaperExchangeGateway::getWalletBalance() {
  std::lock_guard lock(mutex_);
  domain::WalletBalance w;
  w.unrealized_pnl = (mark_ - position_.average_price) * position_.net_quantity;
  w.total_equity = equityLocked();
  w.available_balance =
      std::max(0.0, w.total_equity - position_.size() * mark_ -
                        restingNotionalLocked());
  return w;
}

// -----------------------------------------------------------------------------
// Simulation controls
// -----------------------------------------------------------------------------
void PaperExchangeGateway::onTick(const domain::MarketTick& tick) {
  if (!tick.symbol.empty() && tick.symbol != spec_.symbol) {
    return;
  }
  if (tick.price <= 0.0) {
    std::cerr << "[PaperExchange] ignoring tick with non-positive price\n";
    return;
  }
  std::lock_guard lock(mutex_);
  setPricesLocked(tick.price, tick.bid, tick.ask);
  matchRestingOrdersLocked();
}

void PaperExchangeGateway::setMarkPrice(double price) {
  domain::MarketTick tick;
  tick.symbol = spec_.symbol;
  tick.price = price;
  onTick(tick);
}

std::size_t PaperExchangeGateway::openOrderCount() const {
  std::lock_guard lock(mutex_);
  return open_orders_.size();
}

// -----------------------------------------------------------------------------
// setPricesLocked: explicit bid/ask when given, otherwise mark +/- spread
// -----------------------------------------------------------------------------
void PaperExchangeGateway::setPricesLocked(double mark, double bid,
                                           double ask) {
  const double half_spread = spread_ticks_ * spec_.tick_size;
  mark_ = mark;
  bid_ = bid > 0.0 ? bid : mark - half_spread;
  ask_ = ask > 0.0 ? ask : mark + half_spread;
}

// -----------------------------------------------------------------------------
// matchRestingOrdersLocked: fill every order the mark has traded through
// -----------------------------------------------------------------------------
void PaperExchangeGateway::matchRestingOrdersLocked() {
  std::vector<domain::OpenOrder> filled;
  auto it = std::remove_if(
      open_orders_.begin(), open_orders_.end(),
      [this, &filled](const domain::OpenOrder& o) {
        const bool hit = o.side == domain::Side::Buy ? mark_ <= o.price
                                                     : mark_ >= o.price;
        if (hit) {
          filled.push_back(o);
        }
        return hit;
      });
  open_orders_.erase(it, open_orders_.end());

  for (const auto& order : filled) {
    fillLocked(order, order.price, true);
  }
}

// -----------------------------------------------------------------------------
// fillLocked: book an execution, update position and fees
// -----------------------------------------------------------------------------
void PaperExchangeGateway::fillLocked(const domain::OpenOrder& order,
                                      double fill_price, bool is_maker) {
  const double signed_qty = order.side == domain::Side::Buy ? order.quantity
                                                            : -order.quantity;
  const double realized = applyFill(position_, signed_qty, fill_price,
                                    spec_.qty_step * kFloorEpsilon);
  position_.realized_pnl += realized;

  const double fee = order.quantity * fill_price *
                     (is_maker ? maker_fee_rate_ : taker_fee_rate_);
  fees_paid_ += fee;

  domain::Execution exec;
  exec.exec_id = "exec-" + std::to_string(next_exec_id_++);
  exec.order_id = order.order_id;
  exec.symbol = spec_.symbol;
  exec.side = order.side;
  exec.price = fill_price;
  exec.quantity = order.quantity;
  exec.fee = fee;
  exec.closed_pnl = realized;
  exec.is_maker = is_maker;
  exec.exec_time_ms = time_.now_ms();

  executions_.push_front(exec);
  if (executions_.size() > kMaxExecutionHistory) {
    executions_.pop_back();
  }

  std::cout << "[PaperExchange] fill " << domain::toString(order.side) << " "
            << order.quantity << " @ " << fill_price
            << (is_maker ? " (maker)" : " (taker)")
            << " net=" << position_.net_quantity << "\n";
}

double PaperExchangeGateway::equityLocked() const {
  const double unrealized =
      (mark_ - position_.average_price) * position_.net_quantity;
  return initial_balance_ + position_.realized_pnl + unrealized - fees_paid_;
}

double PaperExchangeGateway::restingNotionalLocked() const {
  double total = 0.0;
  for (const auto& o : open_orders_) {
    total += o.price * o.quantity;
  }
  return total;
}

bool PaperExchangeGateway::symbolMatches(const std::string& symbol) const {
  return symbol == spec_.symbol;
}

// -----------------------------------------------------------------------------
// applyFill: weighted-average position math
// -----------------------------------------------------------------------------
//   same direction  → new avg = (q*avg + f*p) / (q + f), nothing realized
//   reducing        → realize |f| * (p - avg) * dir, avg unchanged
//   crossing zero   → realize |q| * (p - avg) * dir, remainder opens at p
// -----------------------------------------------------------------------------
double PaperExchangeGateway::applyFill(domain::Position& pos,
                                       double signed_fill_qty,
                                       double fill_price, double flat_qty) {
  const double current_qty = pos.net_quantity;
  double realized = 0.0;

  if (std::abs(current_qty) <= flat_qty) {
    pos.net_quantity = signed_fill_qty;
    pos.average_price = fill_price;
  } else if ((current_qty > 0.0) == (signed_fill_qty > 0.0)) {
    const double new_total = current_qty + signed_fill_qty;
    pos.average_price =
        (current_qty * pos.average_price + signed_fill_qty * fill_price) /
        new_total;
    pos.net_quantity = new_total;
  } else {
    const double abs_current = std::abs(current_qty);
    const double abs_fill = std::abs(signed_fill_qty);
    const double direction = current_qty > 0.0 ? 1.0 : -1.0;

    if (abs_fill <= abs_current) {
      realized = abs_fill * (fill_price - pos.average_price) * direction;
      pos.net_quantity = current_qty + signed_fill_qty;
    } else {
      realized = abs_current * (fill_price - pos.average_price) * direction;
      pos.net_quantity = (signed_fill_qty > 0.0 ? 1.0 : -1.0) *
                         (abs_fill - abs_current);
      pos.average_price = fill_price;
    }
  }

  // 0.1 + 0.2 - 0.3 leaves binary dust, not a position.
  if (std::abs(pos.net_quantity) <= flat_qty) {
    pos.net_quantity = 0.0;
    pos.average_price = 0.0;
  }
  return realized;
}

}  // namespace gridbot
