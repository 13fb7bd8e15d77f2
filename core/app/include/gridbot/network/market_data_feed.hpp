#pragma once

#include "gridbot/domain/account.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace gridbot {

// -----------------------------------------------------------------------------
// MarketDataFeed: ZeroMQ SUB bridge for mark-price ticks
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON ticks on a SUB socket and hands each decoded tick to
//         a sink, typically PaperExchangeGateway::onTick().
//
// @details
// Expected frame:
//   {
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "symbol":       "BTCUSDT",
//     "price":        43125.5,         // mark price
//     "bid":          43125.4,         // optional
//     "ask":          43125.6          // optional
//   }
// A frame with a missing or mistyped required field, or a non-positive
// price, is logged and skipped.
//
// Frames for other symbols are dropped when a symbol filter is set.
//
// The feed does not touch the engine clock; timestamps travel with the
// tick for the sink to use.
//
// Thread model:
//   start() spawns the receive thread; stop() clears the flag and joins.
//   ZMQ_RCVTIMEO bounds every recv() so the flag is re-checked at least
//   every kRecvTimeoutMs. The sink runs on the feed thread.
//
// Ownership:
//   Owns the ZMQ context, socket and thread. Holds a copy of the sink.
// -----------------------------------------------------------------------------
class MarketDataFeed {
 public:
  using TickSink = std::function<void(const domain::MarketTick&)>;

  MarketDataFeed(TickSink sink, std::string endpoint,
                 std::string symbol_filter = "");

  ~MarketDataFeed();

  MarketDataFeed(const MarketDataFeed&) = delete;
  MarketDataFeed& operator=(const MarketDataFeed&) = delete;
  MarketDataFeed(MarketDataFeed&&) = delete;
  MarketDataFeed& operator=(MarketDataFeed&&) = delete;

  // Connects and starts receiving. No-op if running.
  void start();
  void stop();

  std::uint64_t ticksReceived() const { return ticks_.load(); }

  // -------------------------------------------------------------------------
  // parseTick(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one frame. Missing bid/ask stay 0 so the sink derives
  //         its own quotes.
  //
  // @return nullopt (with a log line) for malformed frames.
  // -------------------------------------------------------------------------
  static std::optional<domain::MarketTick> parseTick(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void run();

  TickSink sink_;
  std::string endpoint_;
  std::string symbol_filter_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};
  std::thread thread_;
};

}  // namespace gridbot
