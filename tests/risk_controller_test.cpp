// =============================================================================
// risk_controller_test.cpp
// =============================================================================
// Unit tests for gridbot::RiskController.
//
// Validates:
//   - Drawdown kill switch: 1000 -> 900 at a 5% threshold triggers
//   - Kill switch latch: idempotent trigger, single cancel, first reason kept,
//     no recovery on equity rebound, no-op deactivate when Normal
//   - Daily high: rises within a UTC day, resets on rollover and on
//     deactivation
//   - Exposure cap, order size cap, maker pre-check, funding estimate
// =============================================================================

#include "gridbot/risk/risk_controller.hpp"
#include "gridbot/store/journal_state_store.hpp"
#include "gridbot/time/simulation_time_provider.hpp"
#include "gridbot/time/time_utils.hpp"
#include "support/fake_exchange_gateway.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

gridbot::domain::Position position(double net_qty, double mark) {
  gridbot::domain::Position p;
  p.symbol = "BTCUSDT";
  p.net_quantity = net_qty;
  p.average_price = mark;
  p.mark_price = mark;
  return p;
}

}  // namespace

class RiskControllerTestFixture : public ::testing::Test {
 protected:
  // 2023-11-14 22:13:20 UTC; two hours later is the next UTC day.
  gridbot::SimulationTimeProvider clock{1700000000000};
  gridbot::test::FakeExchangeGateway gateway;
  gridbot::JournalStateStore store{"", clock};
  gridbot::domain::RiskLimits limits;

  std::string lastEventType() const {
    auto events = store.recentEvents(1);
    return events.empty() ? std::string() : events.front().type;
  }
};

// -----------------------------------------------------------------------------
// 1. Drawdown kill switch
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTestFixture, TenPercentDrawdownTriggersAtFivePercent) {
  limits.kill_switch_drawdown_pct = 0.05;
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");

  gateway.setWallet(1000.0, 1000.0);
  ASSERT_TRUE(risk.updateEquityTracking());
  EXPECT_FALSE(risk.isKillSwitchActive());

  gateway.setWallet(900.0, 900.0);
  ASSERT_TRUE(risk.updateEquityTracking());

  EXPECT_TRUE(risk.isKillSwitchActive());
  EXPECT_EQ(gateway.calls("cancel"), 1);
  EXPECT_NE(risk.killSwitchReason().find("Drawdown"), std::string::npos);

  auto events = store.recentEvents(1);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "kill_switch");
  EXPECT_EQ(events[0].severity, gridbot::Severity::Critical);
}

TEST_F(RiskControllerTestFixture, DrawdownBelowThresholdDoesNotTrigger) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");

  gateway.setWallet(1000.0, 1000.0);
  ASSERT_TRUE(risk.updateEquityTracking());
  gateway.setWallet(950.0, 950.0);
  ASSERT_TRUE(risk.updateEquityTracking());

  EXPECT_FALSE(risk.isKillSwitchActive());
  EXPECT_NEAR(risk.metrics().drawdown_pct, 0.05, 1e-12);
  EXPECT_TRUE(risk.metrics().within_limits);
  EXPECT_EQ(gateway.calls("cancel"), 0);
}

TEST_F(RiskControllerTestFixture, WalletFailureLeavesStateUnchanged) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.setWallet(1000.0, 1000.0);
  ASSERT_TRUE(risk.updateEquityTracking());

  gateway.failNext("wallet", gridbot::test::networkError());
  EXPECT_FALSE(risk.updateEquityTracking());
  EXPECT_DOUBLE_EQ(risk.state().total_equity, 1000.0);
}

// -----------------------------------------------------------------------------
// 2. Latch semantics
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTestFixture, TriggerIsIdempotent) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  int notified = 0;
  risk.setKillSwitchListener([&notified](const std::string&) { ++notified; });

  EXPECT_TRUE(risk.triggerKillSwitch("first"));
  EXPECT_FALSE(risk.triggerKillSwitch("second"));

  EXPECT_TRUE(risk.isKillSwitchActive());
  EXPECT_EQ(risk.killSwitchReason(), "first");
  EXPECT_EQ(gateway.calls("cancel"), 1);
  EXPECT_EQ(notified, 1);
}

TEST_F(RiskControllerTestFixture, DeactivateWhenNormalIsNoop) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");

  EXPECT_FALSE(risk.deactivateKillSwitch());
  EXPECT_FALSE(risk.isKillSwitchActive());
  EXPECT_TRUE(store.recentEvents(10).empty());
}

TEST_F(RiskControllerTestFixture, EquityReboundDoesNotClearLatch) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.setWallet(1000.0, 1000.0);
  ASSERT_TRUE(risk.updateEquityTracking());
  gateway.setWallet(850.0, 850.0);
  ASSERT_TRUE(risk.updateEquityTracking());
  ASSERT_TRUE(risk.isKillSwitchActive());

  gateway.setWallet(1000.0, 1000.0);
  ASSERT_TRUE(risk.updateEquityTracking());

  EXPECT_TRUE(risk.isKillSwitchActive());
}

TEST_F(RiskControllerTestFixture, DeactivateResetsDailyHigh) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.setWallet(1000.0, 1000.0);
  ASSERT_TRUE(risk.updateEquityTracking());
  gateway.setWallet(850.0, 850.0);
  ASSERT_TRUE(risk.updateEquityTracking());
  ASSERT_TRUE(risk.isKillSwitchActive());

  EXPECT_TRUE(risk.deactivateKillSwitch());
  EXPECT_FALSE(risk.isKillSwitchActive());
  EXPECT_DOUBLE_EQ(risk.state().daily_max_equity, 850.0);
  EXPECT_EQ(lastEventType(), "kill_switch_reset");

  // Same equity again: no re-trigger from the stale 1000 high.
  ASSERT_TRUE(risk.updateEquityTracking());
  EXPECT_FALSE(risk.isKillSwitchActive());
}

// -----------------------------------------------------------------------------
// 3. Daily high tracking
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTestFixture, DailyHighOnlyRisesWithinDay) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");

  gateway.setWallet(1000.0, 1000.0);
  ASSERT_TRUE(risk.updateEquityTracking());
  gateway.setWallet(1100.0, 1100.0);
  ASSERT_TRUE(risk.updateEquityTracking());
  gateway.setWallet(1050.0, 1050.0);
  ASSERT_TRUE(risk.updateEquityTracking());

  EXPECT_DOUBLE_EQ(risk.state().daily_max_equity, 1100.0);
}

TEST_F(RiskControllerTestFixture, UtcRolloverResetsDailyHigh) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");

  gateway.setWallet(1000.0, 1000.0);
  ASSERT_TRUE(risk.updateEquityTracking());

  clock.advance_by(2 * gridbot::kMsPerHour);
  gateway.setWallet(880.0, 880.0);
  ASSERT_TRUE(risk.updateEquityTracking());

  EXPECT_FALSE(risk.isKillSwitchActive());
  EXPECT_DOUBLE_EQ(risk.state().daily_max_equity, 880.0);
  EXPECT_EQ(risk.state().last_equity_check_day,
            gridbot::utc_day_index(clock.now_ms()));
}

// -----------------------------------------------------------------------------
// 4. Exposure cap
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTestFixture, ExposureWithinCap) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.setWallet(100.0, 100.0);
  gateway.setPositions({position(0.5, 100.0)});

  EXPECT_TRUE(risk.checkMaxExposure());
  EXPECT_DOUBLE_EQ(risk.state().current_exposure, 50.0);
}

TEST_F(RiskControllerTestFixture, ExposureBreachLogsWarning) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.setWallet(100.0, 100.0);
  gateway.setPositions({position(-0.9, 100.0)});

  EXPECT_FALSE(risk.checkMaxExposure());
  EXPECT_FALSE(risk.isKillSwitchActive());

  auto events = store.recentEvents(1);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "max_exposure");
  EXPECT_EQ(events[0].severity, gridbot::Severity::Warning);
}

TEST_F(RiskControllerTestFixture, ExposureUnknownWhenPositionsFail) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.failNext("positions", gridbot::test::networkError());

  EXPECT_FALSE(risk.checkMaxExposure());
}

// -----------------------------------------------------------------------------
// 5. Order size cap
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTestFixture, OrderSizeCap) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.setWallet(100.0, 100.0);

  // Equity is fetched on first use.
  EXPECT_TRUE(risk.validateOrderSize(0.2, 100.0));   // 20%
  EXPECT_TRUE(risk.validateOrderSize(0.25, 100.0));  // 25%
  EXPECT_FALSE(risk.validateOrderSize(0.3, 100.0));  // 30%
}

TEST_F(RiskControllerTestFixture, OrderSizeRejectedWithoutEquity) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.failNext("wallet", gridbot::test::networkError());

  EXPECT_FALSE(risk.validateOrderSize(0.01, 100.0));
}

// -----------------------------------------------------------------------------
// 6. Maker pre-check
// -----------------------------------------------------------------------------
TEST(RiskMakerTest, CrossingPricesAreNotMakerSafe) {
  gridbot::domain::Ticker t;
  t.bid = 99.99;
  t.ask = 100.01;
  using gridbot::RiskController;
  using gridbot::domain::Side;

  EXPECT_TRUE(RiskController::isMakerSafe(Side::Buy, 100.0, t));
  EXPECT_FALSE(RiskController::isMakerSafe(Side::Buy, 100.01, t));
  EXPECT_FALSE(RiskController::isMakerSafe(Side::Buy, 100.5, t));
  EXPECT_TRUE(RiskController::isMakerSafe(Side::Sell, 100.0, t));
  EXPECT_FALSE(RiskController::isMakerSafe(Side::Sell, 99.99, t));

  t.ask = 0.0;
  EXPECT_TRUE(RiskController::isMakerSafe(Side::Buy, 1000.0, t));
}

TEST_F(RiskControllerTestFixture, TickerFailureDefersToPostOnly) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.setTicker(99.99, 100.01);

  EXPECT_FALSE(risk.checkOrderAsMaker(gridbot::domain::Side::Buy, 100.02));

  gateway.failNext("ticker", gridbot::test::networkError());
  EXPECT_TRUE(risk.checkOrderAsMaker(gridbot::domain::Side::Buy, 100.02));
}

// -----------------------------------------------------------------------------
// 7. Funding estimate
// -----------------------------------------------------------------------------
TEST_F(RiskControllerTestFixture, FundingEstimate) {
  gridbot::RiskController risk(gateway, store, clock, limits, "BTCUSDT");
  gateway.setPositions({position(10.0, 100.0), position(0.0, 100.0)});

  EXPECT_NEAR(risk.estimateDailyFundingCost(), 1000.0 * 0.0001 * 3, 1e-12);

  gateway.failNext("positions", gridbot::test::networkError());
  EXPECT_DOUBLE_EQ(risk.estimateDailyFundingCost(), 0.0);
}
