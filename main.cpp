// -----------------------------------------------------------------------------
// gridbot: single executable entry point.
//
// Paper trading mode:
//   1) Load and validate the JSON config (argv[1], default
//      config/gridbot.json).
//   2) Open the journal state store (restart continuity).
//   3) Create the paper venue with the configured instrument rules and wrap
//      it in the retrying gateway decorator.
//   4) Optionally subscribe to a ZeroMQ tick feed that moves the paper
//      venue's mark price (paper.feed_endpoint).
//   5) Create the GridBot, initialize it, and start trading.
//   6) Wait for Ctrl-C / SIGTERM, then shut down cleanly (cancels every
//      open order and joins all threads).
//
// Thread layout:
//   main thread        → waits for a shutdown signal
//   market data thread → MarketDataFeed recv loop -> paper.onTick()
//   fill/grid/risk/snapshot threads → GridBot polling loops
//   ipc thread         → operator commands + telemetry
// -----------------------------------------------------------------------------

#include "gridbot/config/bot_config.hpp"
#include "gridbot/engine/grid_bot.hpp"
#include "gridbot/gateway/paper_exchange_gateway.hpp"
#include "gridbot/gateway/retrying_gateway.hpp"
#include "gridbot/network/market_data_feed.hpp"
#include "gridbot/store/journal_state_store.hpp"
#include "gridbot/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag set by the signal handler. The only global in the program;
// an atomic store is async-signal-safe, so the handler does nothing else.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void signal_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/gridbot.json";

  try {
    // -------------------------------------------------------------------------
    // 1) Configuration (ConfigError lists every bad key).
    // -------------------------------------------------------------------------
    const gridbot::BotConfig config = gridbot::loadBotConfig(config_path);
    std::cout << "[main] Loaded " << config_path << " for "
              << config.trading.symbol << "\n";

    // -------------------------------------------------------------------------
    // 2) Clock and persistence.
    // -------------------------------------------------------------------------
    gridbot::LiveTimeProvider clock;
    gridbot::JournalStateStore store(config.storage.journal_path, clock);

    // -------------------------------------------------------------------------
    // 3) Paper venue behind the retry decorator.
    // -------------------------------------------------------------------------
    gridbot::domain::InstrumentSpec spec;
    spec.symbol = config.trading.symbol;
    spec.min_order_qty = config.paper.min_order_qty;
    spec.qty_step = config.paper.qty_step;
    spec.tick_size = config.paper.tick_size;
    spec.min_notional = config.paper.min_notional;

    gridbot::PaperExchangeGateway paper(spec, config.paper, clock);

    gridbot::RetryPolicy policy;
    policy.max_attempts = config.gateway.max_attempts;
    policy.base_backoff =
        std::chrono::milliseconds(config.gateway.base_backoff_ms);
    gridbot::RetryingGateway gateway(paper, policy);

    // -------------------------------------------------------------------------
    // 4) Optional tick feed. Started before the bot so the first grid is
    //    built around a live price when a feeder is already publishing.
    // -------------------------------------------------------------------------
    std::unique_ptr<gridbot::MarketDataFeed> feed;
    if (!config.paper.feed_endpoint.empty()) {
      feed = std::make_unique<gridbot::MarketDataFeed>(
          [&paper](const gridbot::domain::MarketTick& tick) {
            paper.onTick(tick);
          },
          config.paper.feed_endpoint, config.trading.symbol);
      feed->start();
    }

    // -------------------------------------------------------------------------
    // 5) Bot lifecycle.
    // -------------------------------------------------------------------------
    gridbot::GridBot bot(config, gateway, store, clock);
    bot.initialize();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!bot.startTrading()) {
      std::cerr << "[main] Trading did not start; waiting for operator "
                   "commands (START/RESUME) over IPC\n";
    }

    std::cout << "[main] Running. Press Ctrl-C to shut down.\n";
    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // -------------------------------------------------------------------------
    // 6) Clean shutdown: bot first (cancels orders), then the feed.
    // -------------------------------------------------------------------------
    std::cout << "\n[main] Shutdown requested. Stopping bot...\n";
    bot.shutdown();
    if (feed) {
      feed->stop();
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] Fatal: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] Bye.\n";
  return 0;
}
