// =============================================================================
// journal_state_store_test.cpp
// =============================================================================
// Unit tests for gridbot::JournalStateStore.
//
// Validates:
//   - Trades are deduplicated by exec_id, including across a restart
//   - Active orders follow the last recorded status; terminal statuses stick
//   - Grid, active config and events survive a restart via replay
//   - A corrupt journal line is skipped, the rest still replays
//   - PnL summaries aggregate trades inside the window only
//
// Design: Each test writes its own journal under the system temp directory
// and removes it in TearDown().
// =============================================================================

#include "gridbot/store/journal_state_store.hpp"
#include "gridbot/time/simulation_time_provider.hpp"
#include "gridbot/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

namespace {

gridbot::OrderRecord order(const std::string& id, std::int64_t created_ms) {
  gridbot::OrderRecord o;
  o.order_id = id;
  o.order_link_id = "link-" + id;
  o.symbol = "BTCUSDT";
  o.side = gridbot::domain::Side::Buy;
  o.price = 99.0;
  o.quantity = 0.1;
  o.grid_level = -1;
  o.created_ms = created_ms;
  return o;
}

gridbot::TradeRecord trade(const std::string& exec_id, std::int64_t at_ms,
                           double fee, std::optional<double> profit) {
  gridbot::TradeRecord t;
  t.exec_id = exec_id;
  t.order_id = "ord-" + exec_id;
  t.symbol = "BTCUSDT";
  t.side = gridbot::domain::Side::Sell;
  t.price = 101.0;
  t.quantity = 0.1;
  t.fee = fee;
  t.profit = profit;
  t.executed_ms = at_ms;
  return t;
}

}  // namespace

class JournalStateStoreTestFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path = std::filesystem::temp_directory_path() / "gridbot_journal_tests" /
           (std::string(info->name()) + ".journal");
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }

  void TearDown() override {
    store.reset();
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }

  gridbot::JournalStateStore& open() {
    store = std::make_unique<gridbot::JournalStateStore>(path.string(), clock);
    return *store;
  }

  // Closes the current store and replays the journal into a fresh one.
  gridbot::JournalStateStore& reopen() {
    store.reset();
    return open();
  }

  gridbot::SimulationTimeProvider clock{1700000000000};
  std::filesystem::path path;
  std::unique_ptr<gridbot::JournalStateStore> store;
};

// -----------------------------------------------------------------------------
// 1. Trades
// -----------------------------------------------------------------------------
TEST_F(JournalStateStoreTestFixture, TradeDedupSurvivesRestart) {
  auto& s = open();
  EXPECT_TRUE(s.saveTrade(trade("e1", clock.now_ms(), 0.01, 0.2)));
  EXPECT_FALSE(s.saveTrade(trade("e1", clock.now_ms(), 0.01, 0.2)));
  EXPECT_EQ(s.countTradesSince(0), 1u);

  auto& replayed = reopen();
  EXPECT_FALSE(replayed.saveTrade(trade("e1", clock.now_ms(), 0.01, 0.2)));
  EXPECT_TRUE(replayed.saveTrade(trade("e2", clock.now_ms(), 0.01, 0.2)));
  EXPECT_EQ(replayed.countTradesSince(0), 2u);

  auto trades = replayed.getTradesSince(0);
  ASSERT_EQ(trades.size(), 2u);
  ASSERT_TRUE(trades[0].profit.has_value());
  EXPECT_DOUBLE_EQ(*trades[0].profit, 0.2);
}

// -----------------------------------------------------------------------------
// 2. Orders
// -----------------------------------------------------------------------------
TEST_F(JournalStateStoreTestFixture, ActiveOrdersFollowStatus) {
  auto& s = open();
  s.saveOrder(order("a", 1));
  s.saveOrder(order("b", 2));
  s.saveOrder(order("c", 3));

  s.updateOrderStatus("a", gridbot::domain::OrderStatus::Filled, 500);
  s.updateOrderStatus("b", gridbot::domain::OrderStatus::Canceled,
                      std::nullopt);

  auto active = s.getActiveOrders();
  ASSERT_EQ(active.size(), 1u);
  EXPECT_EQ(active[0].order_id, "c");

  auto filled = s.findOrder("a");
  ASSERT_TRUE(filled.has_value());
  ASSERT_TRUE(filled->filled_ms.has_value());
  EXPECT_EQ(*filled->filled_ms, 500);

  auto& replayed = reopen();
  ASSERT_EQ(replayed.getActiveOrders().size(), 1u);
  EXPECT_EQ(replayed.findOrder("b")->status,
            gridbot::domain::OrderStatus::Canceled);
}

TEST_F(JournalStateStoreTestFixture, TerminalStatusIsSticky) {
  auto& s = open();
  s.saveOrder(order("a", 1));
  s.updateOrderStatus("a", gridbot::domain::OrderStatus::Filled, 500);
  s.updateOrderStatus("a", gridbot::domain::OrderStatus::Canceled,
                      std::nullopt);

  EXPECT_EQ(s.findOrder("a")->status, gridbot::domain::OrderStatus::Filled);
}

TEST_F(JournalStateStoreTestFixture, LateFillOverridesInferredCancel) {
  auto& s = open();
  s.saveOrder(order("a", 1));
  s.updateOrderStatus("a", gridbot::domain::OrderStatus::Canceled,
                      std::nullopt);
  s.updateOrderStatus("a", gridbot::domain::OrderStatus::Filled, 700);

  auto filled = s.findOrder("a");
  ASSERT_TRUE(filled.has_value());
  EXPECT_EQ(filled->status, gridbot::domain::OrderStatus::Filled);
  ASSERT_TRUE(filled->filled_ms.has_value());
  EXPECT_EQ(*filled->filled_ms, 700);

  auto& replayed = reopen();
  EXPECT_EQ(replayed.findOrder("a")->status,
            gridbot::domain::OrderStatus::Filled);
  EXPECT_EQ(*replayed.findOrder("a")->filled_ms, 700);
}

TEST_F(JournalStateStoreTestFixture, StatusForUnknownOrderIsIgnored) {
  auto& s = open();
  s.updateOrderStatus("ghost", gridbot::domain::OrderStatus::Filled, 1);

  EXPECT_FALSE(s.findOrder("ghost").has_value());
  EXPECT_TRUE(s.getActiveOrders().empty());
}

// -----------------------------------------------------------------------------
// 3. Grid, config and events replay
// -----------------------------------------------------------------------------
TEST_F(JournalStateStoreTestFixture, StateReplaysAfterRestart) {
  auto& s = open();
  EXPECT_FALSE(s.getLatestGrid().has_value());
  EXPECT_FALSE(s.getActiveConfig().has_value());

  gridbot::GridSnapshot first;
  first.center_price = 100.0;
  s.saveGridHistory(first);
  gridbot::GridSnapshot second;
  second.center_price = 105.0;
  second.profile = "Aggressive";
  second.reason = "Price moved";
  s.saveGridHistory(second);

  gridbot::ActiveConfig cfg;
  cfg.profile_name = "Aggressive";
  cfg.symbol = "BTCUSDT";
  cfg.target_levels = 4;
  s.saveConfig(cfg);

  s.logEvent("first", gridbot::Severity::Info, "one");
  s.logEvent("second", gridbot::Severity::Warning, "two",
             nlohmann::json{{"k", 1}});

  auto& replayed = reopen();
  EXPECT_EQ(replayed.replayedRecords(), 5u);

  auto grid = replayed.getLatestGrid();
  ASSERT_TRUE(grid.has_value());
  EXPECT_DOUBLE_EQ(grid->center_price, 105.0);
  EXPECT_EQ(grid->reason, "Price moved");

  auto active = replayed.getActiveConfig();
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->profile_name, "Aggressive");
  EXPECT_EQ(active->target_levels, 4);

  auto events = replayed.recentEvents(10);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type, "second");
  EXPECT_EQ(events[0].severity, gridbot::Severity::Warning);
  EXPECT_EQ(events[0].details.at("k").get<int>(), 1);
  EXPECT_EQ(events[0].created_ms, clock.now_ms());
  EXPECT_EQ(events[1].type, "first");

  EXPECT_EQ(replayed.recentEvents(1).size(), 1u);
}

TEST_F(JournalStateStoreTestFixture, CorruptLineIsSkipped) {
  {
    auto& s = open();
    s.saveOrder(order("a", 1));
    store.reset();
  }
  {
    std::ofstream out(path, std::ios::app);
    out << "{\"kind\":\"order\",\"data\":{\"order_id\":\n";
    out << "{\"kind\":\"order\",\"data\":{\"order_id\":\"bad\",\"symbol\":"
           "\"BTCUSDT\",\"side\":\"Sideways\",\"price\":1,\"quantity\":1,"
           "\"status\":\"New\"}}\n";
  }

  auto& s = open();
  EXPECT_EQ(s.replayedRecords(), 1u);
  EXPECT_EQ(s.getActiveOrders().size(), 1u);
  EXPECT_FALSE(s.findOrder("bad").has_value());

  // The store stays writable after a bad tail.
  s.saveOrder(order("b", 2));
  EXPECT_EQ(reopen().getActiveOrders().size(), 2u);
}

// -----------------------------------------------------------------------------
// 4. PnL
// -----------------------------------------------------------------------------
TEST_F(JournalStateStoreTestFixture, PnlAggregatesWindow) {
  auto& s = open();
  const auto now = clock.now_ms();
  EXPECT_FALSE(s.calculateAndSavePnl(24).has_value());

  s.saveTrade(trade("old", now - 25 * gridbot::kMsPerHour, 1.0, 5.0));
  s.saveTrade(trade("win", now - gridbot::kMsPerHour, 0.01, 0.3));
  s.saveTrade(trade("loss", now - gridbot::kMsPerMinute, 0.02, -0.1));
  s.saveTrade(trade("open", now, 0.03, std::nullopt));

  auto pnl = s.calculateAndSavePnl(24);
  ASSERT_TRUE(pnl.has_value());
  EXPECT_EQ(pnl->total_trades, 3);
  EXPECT_EQ(pnl->winning_trades, 1);
  EXPECT_EQ(pnl->losing_trades, 1);
  EXPECT_NEAR(pnl->realized_pnl, 0.2, 1e-12);
  EXPECT_NEAR(pnl->total_fees, 0.06, 1e-12);
  EXPECT_EQ(pnl->calculated_ms, now);

  auto stored = reopen().getPnlSummary(24);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->total_trades, 3);
  EXPECT_FALSE(store->getPnlSummary(1).has_value());
}

TEST(JournalStateStoreMemoryTest, EmptyPathKeepsStateInMemory) {
  gridbot::SimulationTimeProvider clock{0};
  gridbot::JournalStateStore s{"", clock};

  s.saveOrder(order("a", 1));
  EXPECT_EQ(s.getActiveOrders().size(), 1u);
  EXPECT_EQ(s.replayedRecords(), 0u);
}
