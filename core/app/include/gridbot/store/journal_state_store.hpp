#pragma once

#include "gridbot/store/i_state_store.hpp"
#include "gridbot/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace gridbot {

// -----------------------------------------------------------------------------
// JournalStateStore: append-only JSON-lines implementation of IStateStore
// -----------------------------------------------------------------------------
//
// @brief  Writes every record as one JSON object per line to a journal file
//         and keeps the queryable state in memory.
//
// @details
// Line format:
//   {"kind":"order","data":{...}}
//   {"kind":"order_status","data":{"order_id":...,"status":...}}
//   {"kind":"trade"|"grid"|"equity"|"event"|"config"|"pnl","data":{...}}
//
// Durability: each write appends its line, flushes the stream, and checks
// the stream state before updating memory. A failed write throws
// StateStoreError and leaves the in-memory view unchanged.
//
// Recovery: the constructor replays an existing journal through the same
// apply path used by live writes, so the latest grid, active config, order
// statuses and known execution ids survive a restart. A line that does not
// parse (for example a tail cut short by a crash) is skipped with a warning.
//
// Memory-only mode: an empty path disables the file entirely. Tests use it.
//
// Retention in memory: events keep the newest kMaxEvents, equity snapshots
// the newest kMaxEquitySnapshots. The file keeps everything.
//
// Thread model:
//   One mutex guards the stream and all in-memory state.
//
// Ownership:
//   Owns the output stream. Holds a reference to the time provider used to
//   stamp events and PnL summaries.
// -----------------------------------------------------------------------------
class JournalStateStore final : public IStateStore {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  path  Journal file; created (with parent directories) if absent.
  //               Empty = memory only.
  // @param  time  Clock for event and PnL timestamps.
  //
  // @throws StateStoreError if the file cannot be opened for append.
  // -------------------------------------------------------------------------
  JournalStateStore(std::string path, const ITimeProvider& time);

  JournalStateStore(const JournalStateStore&) = delete;
  JournalStateStore& operator=(const JournalStateStore&) = delete;
  JournalStateStore(JournalStateStore&&) = delete;
  JournalStateStore& operator=(JournalStateStore&&) = delete;

  using IStateStore::logEvent;

  void saveOrder(const OrderRecord& order) override;
  void updateOrderStatus(const std::string& order_id,
                         domain::OrderStatus status,
                         std::optional<std::int64_t> filled_ms) override;
  std::vector<OrderRecord> getActiveOrders() const override;

  bool saveTrade(const TradeRecord& trade) override;
  std::vector<TradeRecord> getTradesSince(std::int64_t since_ms) const override;
  std::size_t countTradesSince(std::int64_t since_ms) const override;

  void saveGridHistory(const GridSnapshot& snapshot) override;
  std::optional<GridSnapshot> getLatestGrid() const override;

  void saveEquitySnapshot(const EquitySnapshot& snapshot) override;
  std::vector<EquitySnapshot> getEquitySnapshotsSince(
      std::int64_t since_ms) const override;

  void logEvent(const std::string& type, Severity severity,
                const std::string& message,
                const nlohmann::json& details) override;
  std::vector<EventRecord> recentEvents(std::size_t limit) const override;

  void saveConfig(const ActiveConfig& config) override;
  std::optional<ActiveConfig> getActiveConfig() const override;

  std::optional<PnlSummary> calculateAndSavePnl(int period_hours) override;
  std::optional<PnlSummary> getPnlSummary(int period_hours) const override;

  // Order as last recorded, for inspection.
  std::optional<OrderRecord> findOrder(const std::string& order_id) const;

  // Number of journal lines replayed by the constructor.
  std::size_t replayedRecords() const { return replayed_; }

 private:
  static constexpr std::size_t kMaxEvents = 1000;
  static constexpr std::size_t kMaxEquitySnapshots = 10000;

  void replay();
  void appendLocked(const char* kind, const nlohmann::json& data);
  void applyLocked(const std::string& kind, const nlohmann::json& data);

  const std::string path_;
  const ITimeProvider& time_;

  mutable std::mutex mutex_;
  std::ofstream out_;
  std::size_t replayed_{0};

  std::unordered_map<std::string, OrderRecord> orders_;
  std::set<std::string> trade_ids_;
  std::vector<TradeRecord> trades_;
  std::optional<GridSnapshot> latest_grid_;
  std::deque<EquitySnapshot> equity_;
  std::deque<EventRecord> events_;  // newest at the front
  std::optional<ActiveConfig> active_config_;
  std::map<int, PnlSummary> pnl_;
};

}  // namespace gridbot
