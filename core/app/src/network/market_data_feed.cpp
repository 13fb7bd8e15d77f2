#include "gridbot/network/market_data_feed.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace gridbot {

// -----------------------------------------------------------------------------
// Constructor: subscribe to everything, bounded receive
// -----------------------------------------------------------------------------
MarketDataFeed::MarketDataFeed(TickSink sink, std::string endpoint,
                               std::string symbol_filter)
    : sink_(std::move(sink)),
      endpoint_(std::move(endpoint)),
      symbol_filter_(std::move(symbol_filter)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
}

MarketDataFeed::~MarketDataFeed() { stop(); }

void MarketDataFeed::start() {
  if (running_.load()) {
    return;
  }
  socket_.connect(endpoint_);
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[MarketDataFeed] connected to " << endpoint_ << "\n";
}

void MarketDataFeed::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[MarketDataFeed] stopped after " << ticks_.load()
              << " tick(s)\n";
  }
}

// -----------------------------------------------------------------------------
// parseTick
// -----------------------------------------------------------------------------
std::optional<domain::MarketTick> MarketDataFeed::parseTick(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    domain::MarketTick tick;
    tick.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    tick.symbol = json.at("symbol").get<std::string>();
    tick.price = json.at("price").get<double>();
    tick.bid = json.value("bid", 0.0);
    tick.ask = json.value("ask", 0.0);

    if (tick.price <= 0.0) {
      std::cerr << "[MarketDataFeed] non-positive price, payload: " << payload
                << "\n";
      return std::nullopt;
    }
    return tick;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataFeed] JSON parse error: " << e.what()
              << ", payload: " << payload << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// run(): receive loop
// -----------------------------------------------------------------------------
void MarketDataFeed::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[MarketDataFeed] recv failed: " << e.what() << "\n";
      break;
    }
    if (!result.has_value()) {
      continue;  // timeout; re-check running_
    }

    auto tick = parseTick(msg.to_string());
    if (!tick) {
      continue;
    }
    if (!symbol_filter_.empty() && tick->symbol != symbol_filter_) {
      continue;
    }
    ticks_.fetch_add(1);
    sink_(*tick);
  }
}

}  // namespace gridbot
