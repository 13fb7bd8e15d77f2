// =============================================================================
// grid_bot_test.cpp
// =============================================================================
// Tests for GridBot: lifecycle, operator commands, and the monitor cycles.
//
// Validates:
//   - initialize() persists the default profile or restores a stored one
//   - startTrading() builds the grid and refuses while the kill switch is set
//   - executeCommand() answers PING/STATUS/HALT/RESUME/PROFILE/unknown with
//     {"status": ..., "response": ...} JSON
//   - The fill cycle records each execution once and marks the order filled,
//     including orders a recenter already cancelled
//   - Take-profit orders are placed PostOnly for grid fills
//   - The risk cycle stops trading when drawdown fires the kill switch
//   - The snapshot cycle persists equity
//
// Design: Most tests drive the run*Cycle() methods directly without starting
// the loops. Tests that do start trading only assert outcomes the loop
// threads cannot change, or wait for them with a bounded poll.
// =============================================================================

#include "gridbot/engine/grid_bot.hpp"
#include "gridbot/store/journal_state_store.hpp"
#include "gridbot/time/simulation_time_provider.hpp"
#include "support/fake_exchange_gateway.hpp"
#include "support/test_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

gridbot::domain::Execution execution(const std::string& exec_id,
                                     const std::string& order_id,
                                     gridbot::domain::Side side, double price,
                                     double qty, std::int64_t at_ms) {
  gridbot::domain::Execution e;
  e.exec_id = exec_id;
  e.order_id = order_id;
  e.symbol = "BTCUSDT";
  e.side = side;
  e.price = price;
  e.quantity = qty;
  e.fee = price * qty * 0.0002;
  e.exec_time_ms = at_ms;
  return e;
}

}  // namespace

class GridBotTestFixture : public ::testing::Test {
 protected:
  nlohmann::json command(const std::string& cmd) {
    return nlohmann::json::parse(bot->executeCommand(cmd));
  }

  std::string lastEventType() const {
    auto events = store.recentEvents(1);
    return events.empty() ? std::string() : events.front().type;
  }

  void makeBot() {
    bot = std::make_unique<gridbot::GridBot>(config, gateway, store, clock);
  }

  void SetUp() override { makeBot(); }
  void TearDown() override { bot.reset(); }

  gridbot::SimulationTimeProvider clock{1700000000000};
  gridbot::BotConfig config = gridbot::test::testConfig();
  gridbot::test::FakeExchangeGateway gateway;
  gridbot::JournalStateStore store{"", clock};
  std::unique_ptr<gridbot::GridBot> bot;
};

// -----------------------------------------------------------------------------
// 1. Initialization
// -----------------------------------------------------------------------------
TEST_F(GridBotTestFixture, InitializeSavesDefaultProfile) {
  bot->initialize();

  EXPECT_TRUE(bot->isInitialized());
  EXPECT_FALSE(bot->isRunning());
  EXPECT_EQ(bot->activeProfile(), "Normal");

  auto active = store.getActiveConfig();
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->profile_name, "Normal");
  EXPECT_EQ(active->target_levels, 3);
  EXPECT_EQ(lastEventType(), "bot_initialized");
}

TEST_F(GridBotTestFixture, InitializeRestoresStoredProfile) {
  gridbot::ActiveConfig stored;
  stored.profile_name = "Aggressive";
  store.saveConfig(stored);

  bot->initialize();

  EXPECT_EQ(bot->activeProfile(), "Aggressive");
}

TEST_F(GridBotTestFixture, UnconfiguredStoredProfileFallsBack) {
  gridbot::ActiveConfig stored;
  stored.profile_name = "Turbo";
  store.saveConfig(stored);

  bot->initialize();

  EXPECT_EQ(bot->activeProfile(), "Normal");
  EXPECT_EQ(store.getActiveConfig()->profile_name, "Normal");
}

TEST_F(GridBotTestFixture, SpecFailurePropagates) {
  gateway.failNext("spec", gridbot::test::networkError(), -1);

  EXPECT_THROW(bot->initialize(), gridbot::InstrumentSpecError);
  EXPECT_FALSE(bot->isInitialized());
}

// -----------------------------------------------------------------------------
// 2. Lifecycle
// -----------------------------------------------------------------------------
TEST_F(GridBotTestFixture, StartRequiresInitialize) {
  EXPECT_FALSE(bot->startTrading());
  EXPECT_TRUE(gateway.placed().empty());
}

TEST_F(GridBotTestFixture, StartPlacesGridAndStopCancels) {
  bot->initialize();

  ASSERT_TRUE(bot->startTrading());
  EXPECT_TRUE(bot->isRunning());
  EXPECT_EQ(gateway.placed().size(), 6u);
  EXPECT_TRUE(bot->startTrading());  // already running
  EXPECT_EQ(gateway.placed().size(), 6u);

  EXPECT_TRUE(bot->stopTrading("test"));
  EXPECT_FALSE(bot->isRunning());
  EXPECT_EQ(gateway.openOrderCount(), 0u);
  EXPECT_FALSE(bot->stopTrading("again"));
}

TEST_F(GridBotTestFixture, StartRefusedWhileKillSwitchActive) {
  bot->initialize();
  EXPECT_TRUE(bot->halt("test halt"));

  EXPECT_FALSE(bot->startTrading());
  EXPECT_TRUE(gateway.placed().empty());

  EXPECT_TRUE(bot->deactivateKillSwitch());
  EXPECT_TRUE(bot->startTrading());
}

TEST_F(GridBotTestFixture, StartFailsWhenGridCannotBeBuilt) {
  bot->initialize();
  gateway.failNext("mark", gridbot::test::networkError());

  EXPECT_FALSE(bot->startTrading());
  EXPECT_FALSE(bot->isRunning());
}

TEST_F(GridBotTestFixture, ShutdownIsIdempotent) {
  bot->initialize();
  ASSERT_TRUE(bot->startTrading());

  bot->shutdown();
  EXPECT_FALSE(bot->isRunning());
  EXPECT_EQ(lastEventType(), "bot_stopped");
  bot->shutdown();
}

// -----------------------------------------------------------------------------
// 3. Operator commands
// -----------------------------------------------------------------------------
TEST_F(GridBotTestFixture, PingAndUnknown) {
  bot->initialize();

  auto pong = command("PING");
  EXPECT_EQ(pong["status"], "ok");
  EXPECT_EQ(pong["response"], "PONG");

  auto unknown = command("FLY");
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["response"], "Unknown command: FLY");
}

TEST_F(GridBotTestFixture, StatusReportsState) {
  bot->initialize();

  auto s = command("STATUS");

  EXPECT_EQ(s["status"], "ok");
  EXPECT_EQ(s["running"], false);
  EXPECT_EQ(s["initialized"], true);
  EXPECT_EQ(s["profile"], "Normal");
  EXPECT_EQ(s["symbol"], "BTCUSDT");
  EXPECT_DOUBLE_EQ(s["balance"]["equity"].get<double>(), 1000.0);
  EXPECT_EQ(s["positions"], 0);
  EXPECT_TRUE(s["grid"].is_object());
  EXPECT_EQ(s["risk"]["kill_switch_active"], false);
  EXPECT_EQ(s["trades_24h"], 0);
  EXPECT_FALSE(s.contains("pnl_24h"));
  EXPECT_EQ(s["timestamp"], "2023-11-14T22:13:20Z");
}

TEST_F(GridBotTestFixture, StatusOverIpcAfterInitialize) {
  const std::string base =
      "ipc:///tmp/gridbot_bot_test_" + std::to_string(::getpid());
  config.ipc.cmd_endpoint = base + "_cmd";
  config.ipc.pub_endpoint = base + "_pub";
  makeBot();
  bot->initialize();

  zmq::context_t ctx{1};
  zmq::socket_t req(ctx, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect(config.ipc.cmd_endpoint);
  req.send(zmq::str_buffer("STATUS"), zmq::send_flags::none);

  zmq::message_t reply;
  ASSERT_TRUE(req.recv(reply, zmq::recv_flags::none).has_value());
  auto s = nlohmann::json::parse(reply.to_string());
  EXPECT_EQ(s["status"], "ok");
  EXPECT_EQ(s["initialized"], true);

  req.close();
  bot->shutdown();
}

TEST_F(GridBotTestFixture, StatusSurvivesWalletFailure) {
  bot->initialize();
  gateway.failNext("wallet", gridbot::test::networkError());

  auto s = bot->status();

  EXPECT_TRUE(s["balance"].is_null());
}

TEST_F(GridBotTestFixture, HaltAndResume) {
  bot->initialize();

  auto halted = command("HALT");
  EXPECT_EQ(halted["status"], "ok");
  EXPECT_EQ(halted["response"], "Trading halted");
  EXPECT_TRUE(bot->riskController().isKillSwitchActive());
  EXPECT_EQ(command("HALT")["response"], "Kill switch already active");

  auto start = command("START");
  EXPECT_EQ(start["status"], "error");
  EXPECT_NE(start["response"].get<std::string>().find("Kill switch active"),
            std::string::npos);

  EXPECT_EQ(command("RESUME")["status"], "ok");
  EXPECT_FALSE(bot->riskController().isKillSwitchActive());
  EXPECT_EQ(command("RESUME")["status"], "error");
}

TEST_F(GridBotTestFixture, ProfileCommand) {
  bot->initialize();

  auto ok = command("PROFILE Aggressive");
  EXPECT_EQ(ok["status"], "ok");
  EXPECT_EQ(ok["response"], "Profile set to Aggressive");
  EXPECT_EQ(bot->activeProfile(), "Aggressive");
  EXPECT_EQ(store.getActiveConfig()->profile_name, "Aggressive");
  EXPECT_EQ(lastEventType(), "profile_change");

  // Not running: no orders are touched.
  EXPECT_TRUE(gateway.placed().empty());

  auto unknown = command("PROFILE Turbo");
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(bot->activeProfile(), "Aggressive");

  EXPECT_EQ(command("PROFILE")["response"], "Usage: PROFILE <name>");
}

TEST_F(GridBotTestFixture, ProfileChangeWhileRunningRebuildsGrid) {
  bot->initialize();
  ASSERT_TRUE(bot->startTrading());

  ASSERT_TRUE(bot->changeProfile("Aggressive"));

  EXPECT_EQ(bot->gridEngine().stats().profile, "Aggressive");
  EXPECT_TRUE(waitFor([this] { return gateway.openOrderCount() == 8u; }));
}

TEST_F(GridBotTestFixture, StartAndStopCommands) {
  bot->initialize();

  EXPECT_EQ(command("START")["response"], "Trading running");
  EXPECT_TRUE(bot->isRunning());
  EXPECT_EQ(command("STOP")["response"], "Trading stopped");
  EXPECT_FALSE(bot->isRunning());
}

// -----------------------------------------------------------------------------
// 4. Fill monitor
// -----------------------------------------------------------------------------
TEST_F(GridBotTestFixture, FillCycleRecordsEachExecutionOnce) {
  using gridbot::domain::Side;
  bot->initialize();
  ASSERT_TRUE(bot->gridEngine().setupGrid("Normal"));

  const auto now = clock.now_ms();
  auto sell = execution("e2", "ord-4", Side::Sell, 101.0, 0.168, now);
  sell.closed_pnl = 0.336;
  gateway.setExecutions(
      {sell, execution("e1", "ord-1", Side::Buy, 99.0, 0.168, now - 1000)});

  EXPECT_EQ(bot->runFillMonitorCycle(), 5s);
  EXPECT_EQ(store.countTradesSince(0), 2u);

  auto trades = store.getTradesSince(0);
  ASSERT_EQ(trades.size(), 2u);
  EXPECT_EQ(trades[0].exec_id, "e1");  // oldest recorded first
  ASSERT_TRUE(trades[0].grid_level.has_value());
  EXPECT_EQ(*trades[0].grid_level, -1);
  ASSERT_TRUE(trades[1].profit.has_value());
  EXPECT_DOUBLE_EQ(*trades[1].profit, 0.336);

  EXPECT_EQ(store.findOrder("ord-1")->status,
            gridbot::domain::OrderStatus::Filled);

  bot->runFillMonitorCycle();
  EXPECT_EQ(store.countTradesSince(0), 2u);

  // Take-profit is off in this configuration.
  EXPECT_EQ(gateway.placed().size(), 6u);
}

TEST_F(GridBotTestFixture, FillCycleBacksOffOnGatewayError) {
  bot->initialize();
  gateway.failNext("exec", gridbot::test::networkError());

  EXPECT_EQ(bot->runFillMonitorCycle(), 10s);
  EXPECT_EQ(store.countTradesSince(0), 0u);
}

TEST_F(GridBotTestFixture, FillCyclePausedByKillSwitch) {
  bot->initialize();
  bot->halt("test");
  gateway.setExecutions({execution("e1", "x", gridbot::domain::Side::Buy,
                                   99.0, 0.1, clock.now_ms())});

  EXPECT_EQ(bot->runFillMonitorCycle(), 10s);
  EXPECT_EQ(gateway.calls("exec"), 0);
}

TEST_F(GridBotTestFixture, TakeProfitForGridFill) {
  config.trading.take_profit_enabled = true;
  makeBot();
  bot->initialize();
  ASSERT_TRUE(bot->startTrading());

  // Price fell through the first buy rung.
  gateway.setTicker(98.5, 98.6);
  gateway.setExecutions({execution("e1", "ord-1", gridbot::domain::Side::Buy,
                                   99.0, 0.168, clock.now_ms())});
  bot->runFillMonitorCycle();

  gridbot::domain::OrderRequest tp;
  ASSERT_TRUE(waitFor([&] {
    for (const auto& req : gateway.placed()) {
      if (req.order_link_id == "tp-e1") {
        tp = req;
        return true;
      }
    }
    return false;
  }));
  EXPECT_EQ(tp.side, gridbot::domain::Side::Sell);
  EXPECT_EQ(tp.time_in_force, gridbot::domain::TimeInForce::PostOnly);
  EXPECT_NEAR(tp.price, 99.99, 1e-9);
  EXPECT_NEAR(tp.quantity, 0.168, 1e-12);

  // One take-profit per execution, however often the fill is seen.
  bot->runFillMonitorCycle();
  int tp_count = 0;
  for (const auto& req : gateway.placed()) {
    if (req.order_link_id == "tp-e1") {
      ++tp_count;
    }
  }
  EXPECT_EQ(tp_count, 1);
}

TEST_F(GridBotTestFixture, FillSeenAfterRecenterEndsFilled) {
  using gridbot::domain::Side;
  bot->initialize();
  ASSERT_TRUE(bot->gridEngine().setupGrid("Normal"));

  // ord-1 filled at the venue, but the grid was rebuilt before the next poll.
  clock.advance_by(2000);
  ASSERT_TRUE(bot->gridEngine().recenterGrid("Price moved", "Normal"));
  EXPECT_EQ(store.findOrder("ord-1")->status,
            gridbot::domain::OrderStatus::Canceled);

  const auto filled_at = clock.now_ms() - 1000;
  gateway.setExecutions(
      {execution("e1", "ord-1", Side::Buy, 99.0, 0.168, filled_at)});
  bot->runFillMonitorCycle();

  auto order = store.findOrder("ord-1");
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, gridbot::domain::OrderStatus::Filled);
  ASSERT_TRUE(order->filled_ms.has_value());
  EXPECT_EQ(*order->filled_ms, filled_at);

  auto trades = store.getTradesSince(0);
  ASSERT_EQ(trades.size(), 1u);
  ASSERT_TRUE(trades[0].grid_level.has_value());
  EXPECT_EQ(*trades[0].grid_level, -1);
}

TEST_F(GridBotTestFixture, TakeProfitForFillFromReplacedLadder) {
  config.trading.take_profit_enabled = true;
  makeBot();
  bot->initialize();
  ASSERT_TRUE(bot->startTrading());
  ASSERT_TRUE(bot->changeProfile("Normal"));  // rebuilds: ord-1 is gone

  gateway.setTicker(98.5, 98.6);
  gateway.setExecutions({execution("e1", "ord-1", gridbot::domain::Side::Buy,
                                   99.0, 0.168, clock.now_ms())});
  bot->runFillMonitorCycle();

  EXPECT_TRUE(waitFor([&] {
    for (const auto& req : gateway.placed()) {
      if (req.order_link_id == "tp-e1") {
        return true;
      }
    }
    return false;
  }));
  EXPECT_EQ(store.findOrder("ord-1")->status,
            gridbot::domain::OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// 5. Grid, risk and snapshot cycles
// -----------------------------------------------------------------------------
TEST_F(GridBotTestFixture, GridCycleDoesNotTradeWhileStopped) {
  bot->initialize();
  ASSERT_TRUE(bot->gridEngine().setupGrid("Normal"));
  gateway.setMarkPrice(110.0);

  EXPECT_EQ(bot->runGridMonitorCycle(), 60s);
  EXPECT_EQ(gateway.placed().size(), 6u);
  EXPECT_DOUBLE_EQ(bot->gridEngine().centerPrice(), 100.0);
}

TEST_F(GridBotTestFixture, GridCycleRecentersWhileRunning) {
  bot->initialize();
  ASSERT_TRUE(bot->startTrading());
  gateway.setMarkPrice(110.0);

  bot->runGridMonitorCycle();

  EXPECT_TRUE(waitFor(
      [this] { return bot->gridEngine().centerPrice() == 110.0; }));
  EXPECT_TRUE(waitFor([this] { return gateway.openOrderCount() == 6u; }));
}

TEST_F(GridBotTestFixture, RiskCycleStopsTradingOnDrawdown) {
  bot->initialize();
  ASSERT_TRUE(bot->startTrading());

  gateway.setWallet(850.0, 850.0);
  bot->runRiskMonitorCycle();

  EXPECT_TRUE(bot->riskController().isKillSwitchActive());
  EXPECT_TRUE(waitFor([this] { return !bot->isRunning(); }));
  EXPECT_EQ(gateway.openOrderCount(), 0u);
  EXPECT_FALSE(bot->startTrading());
}

TEST_F(GridBotTestFixture, RiskCycleBacksOffWithoutEquity) {
  bot->initialize();
  gateway.failNext("wallet", gridbot::test::networkError());

  EXPECT_EQ(bot->runRiskMonitorCycle(), 60s);
  EXPECT_FALSE(bot->riskController().isKillSwitchActive());
}

TEST_F(GridBotTestFixture, SnapshotCyclePersistsEquity) {
  bot->initialize();
  gridbot::domain::Position pos;
  pos.symbol = "BTCUSDT";
  pos.net_quantity = -0.5;
  pos.mark_price = 100.0;
  pos.unrealized_pnl = 1.5;
  gateway.setPositions({pos});

  EXPECT_EQ(bot->runSnapshotCycle(), std::chrono::minutes(15));

  auto snaps = store.getEquitySnapshotsSince(0);
  ASSERT_EQ(snaps.size(), 1u);
  EXPECT_DOUBLE_EQ(snaps[0].total_equity, 1000.0);
  EXPECT_DOUBLE_EQ(snaps[0].positions_value, 50.0);
  EXPECT_DOUBLE_EQ(snaps[0].unrealized_pnl, 1.5);

  EXPECT_EQ(bot->status()["positions"], 1);
}

TEST_F(GridBotTestFixture, SnapshotCycleSummarizesPnl) {
  bot->initialize();
  auto e = execution("e1", "x", gridbot::domain::Side::Sell, 101.0, 0.1,
                     clock.now_ms());
  e.closed_pnl = 0.2;
  gateway.setExecutions({e});
  bot->runFillMonitorCycle();

  bot->runSnapshotCycle();

  auto s = bot->status();
  ASSERT_TRUE(s.contains("pnl_24h"));
  EXPECT_EQ(s["pnl_24h"]["total_trades"], 1);
  EXPECT_DOUBLE_EQ(s["pnl_24h"]["realized_pnl"].get<double>(), 0.2);
  EXPECT_EQ(s["trades_24h"], 1);
}
