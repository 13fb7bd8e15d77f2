#pragma once

#include "gridbot/concurrent/polling_loop.hpp"
#include "gridbot/config/bot_config.hpp"
#include "gridbot/domain/order.hpp"
#include "gridbot/gateway/i_exchange_gateway.hpp"
#include "gridbot/instrument/instrument_spec_resolver.hpp"
#include "gridbot/network/ipc_server.hpp"
#include "gridbot/risk/risk_controller.hpp"
#include "gridbot/store/i_state_store.hpp"
#include "gridbot/strategy/grid_engine.hpp"
#include "gridbot/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace gridbot {

// -----------------------------------------------------------------------------
// GridBot
// -----------------------------------------------------------------------------
//
// @brief  Supervisor that owns the grid and risk engines, runs the four
//         monitoring loops, and answers operator commands.
//
// @details
// Lifecycle:
//
//   construct ──> initialize() ──> startTrading() ──> stopTrading()
//                                       ^                  │
//                                       └──── START ───────┘
//   shutdown() (or the destructor) from any state.
//
// Thread layout while trading:
//
//   fill monitor thread      → executions -> trades, order status, take-profit
//   grid monitor thread      → shouldRecenter() -> recenterGrid()
//   risk monitor thread      → equity tracking, exposure, kill-switch stop
//   snapshot thread          → equity snapshot, 24h PnL, status telemetry
//   ipc thread               → executeCommand() (PING/STATUS/HALT/...)
//
//   main thread              → initialize(), startTrading(), shutdown()
//
// Order flow:
//   order_flow_mutex_ serializes every operation that cancels or places
//   orders: recenter (cancel -> rebuild), the risk update that may fire the
//   kill switch, take-profit placement, and the cancel-all of stopTrading().
//   stopTrading() never runs while the mutex is held by its caller.
//
// Loop threads are only joined from startTrading() and shutdown(), which run
// on the main or IPC thread, never from a loop body. A loop that observes
// running_ == false exits after its current iteration.
//
// Thread model:
//   executeCommand() and the run*Cycle() methods are safe from any thread.
//   initialize()/shutdown() from the owning thread only.
//
// Ownership:
//   GridBot
//    ├── config_            (BotConfig, value member, immutable)
//    ├── gateway_/store_/time_  (non-owning references)
//    ├── resolver_, grid_, risk_  (value members)
//    ├── fill/grid/risk/snapshot loops  (unique_ptr<PollingLoop>)
//    └── ipc_               (unique_ptr<IpcServer>, only when configured)
//
// Loops are declared after the engines so they are destroyed first.
// -----------------------------------------------------------------------------
class GridBot {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config   Copied. Must already be validated.
  // @param  gateway  Venue access. Must outlive this bot and tolerate calls
  //                  from every loop thread.
  // @param  store    Persistence. Same lifetime and threading contract.
  // @param  time     Clock for every timestamp the bot produces.
  //
  // No threads are spawned and no sockets are opened in the constructor.
  // -------------------------------------------------------------------------
  GridBot(BotConfig config, IExchangeGateway& gateway, IStateStore& store,
          const ITimeProvider& time);

  // Destructor calls shutdown() for RAII safety.
  ~GridBot();

  GridBot(const GridBot&) = delete;
  GridBot& operator=(const GridBot&) = delete;
  GridBot(GridBot&&) = delete;
  GridBot& operator=(GridBot&&) = delete;

  // -------------------------------------------------------------------------
  // initialize()
  // -------------------------------------------------------------------------
  //
  // @brief  Loads the instrument spec, restores the operator's profile, takes
  //         a first equity reading, and starts the IPC server.
  //
  // @details
  // The profile stored by the last changeProfile() wins over the configured
  // default when it still names a configured profile; otherwise the default
  // is used and persisted.
  //
  // Idempotent.
  //
  // @throws InstrumentSpecError when the venue cannot describe the symbol.
  // @throws zmq::error_t when an IPC endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void initialize();

  // -------------------------------------------------------------------------
  // startTrading()
  // -------------------------------------------------------------------------
  //
  // @brief  Builds the initial grid and starts the monitoring loops.
  //
  // @return false when the kill switch is active, the bot is not
  //         initialized, or the grid could not be built. true if trading is
  //         running after the call.
  // -------------------------------------------------------------------------
  bool startTrading();

  // -------------------------------------------------------------------------
  // stopTrading(reason)
  // -------------------------------------------------------------------------
  //
  // @brief  Clears the running flag, wakes every loop, and cancels all open
  //         orders. Does not join the loops.
  //
  // @return true if trading was running.
  //
  // Thread-safety: Safe from any thread, loop bodies included.
  // -------------------------------------------------------------------------
  bool stopTrading(const std::string& reason);

  // Stops trading, joins the loops, and stops IPC. Idempotent.
  void shutdown();

  // -------------------------------------------------------------------------
  // changeProfile(name)
  // -------------------------------------------------------------------------
  // @brief  Switches the active profile, persists it, and recenters the grid
  //         with the new parameters when trading is running.
  //
  // @return false (nothing changed) for an unknown profile name.
  // -------------------------------------------------------------------------
  bool changeProfile(const std::string& name);

  // Manual kill switch: trigger it, then stop trading. Returns false when the
  // switch was already latched.
  bool halt(const std::string& reason);

  // Clears the kill switch. Trading stays stopped until startTrading().
  bool deactivateKillSwitch();

  // -------------------------------------------------------------------------
  // status()
  // -------------------------------------------------------------------------
  //
  // @brief  Snapshot for the STATUS command and the telemetry frame.
  //
  // @details
  // {
  //   "running", "initialized", "profile", "symbol",
  //   "balance": {"available", "equity"} | null,
  //   "positions": <count with non-zero size>,
  //   "grid": {...}, "risk": {...},
  //   "trades_24h", "funding_estimate_daily", "pnl_24h" (if any),
  //   "timestamp": ISO-8601 UTC
  // }
  // -------------------------------------------------------------------------
  nlohmann::json status();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one operator command and returns a JSON reply.
  //
  // @details
  // Supported commands:
  //   "PING"           → {"status":"ok","response":"PONG"}
  //   "STATUS"         → {"status":"ok", ...status()}
  //   "HALT"           → manual kill switch + stop
  //   "RESUME"         → deactivate the kill switch
  //   "PROFILE <name>" → changeProfile(name)
  //   "START"          → startTrading()
  //   "STOP"           → stopTrading()
  //   other            → {"status":"error","response":"Unknown command: ..."}
  //
  // Thread model: Called on the IPC server thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // -------------------------------------------------------------------------
  // Loop bodies
  // -------------------------------------------------------------------------
  // One iteration each; the return value is the delay before the next. The
  // PollingLoop error boundary covers exceptions. Public so tests can drive
  // single iterations without spawning threads.
  // -------------------------------------------------------------------------
  std::chrono::milliseconds runFillMonitorCycle();
  std::chrono::milliseconds runGridMonitorCycle();
  std::chrono::milliseconds runRiskMonitorCycle();
  std::chrono::milliseconds runSnapshotCycle();

  bool isRunning() const { return running_.load(); }
  bool isInitialized() const { return initialized_.load(); }
  std::string activeProfile() const;

  GridEngine& gridEngine() { return grid_; }
  RiskController& riskController() { return risk_; }
  const BotConfig& config() const { return config_; }

 private:
  // Places the opposite-side PostOnly order profit_target away from a grid
  // fill. Caller holds order_flow_mutex_.
  bool placeTakeProfit(const domain::Execution& fill);

  void saveActiveConfig(const std::string& profile);
  void wakeLoops();
  void joinLoops();

  const BotConfig config_;
  IExchangeGateway& gateway_;
  IStateStore& store_;
  const ITimeProvider& time_;

  InstrumentSpecResolver resolver_;
  GridEngine grid_;
  RiskController risk_;

  std::atomic<bool> running_{false};
  std::atomic<bool> initialized_{false};  // read by the IPC thread

  mutable std::mutex state_mutex_;  // guards profile_
  std::string profile_;

  std::mutex order_flow_mutex_;
  std::mutex lifecycle_mutex_;  // startTrading() vs shutdown()

  std::unique_ptr<PollingLoop> fill_loop_;
  std::unique_ptr<PollingLoop> grid_loop_;
  std::unique_ptr<PollingLoop> risk_loop_;
  std::unique_ptr<PollingLoop> snapshot_loop_;

  std::unique_ptr<IpcServer> ipc_;
};

}  // namespace gridbot
