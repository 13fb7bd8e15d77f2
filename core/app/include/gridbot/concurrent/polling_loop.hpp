#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace gridbot {

// -----------------------------------------------------------------------------
// PollingLoop
// -----------------------------------------------------------------------------
//
// @brief  Owns one worker thread that runs a body, sleeps for the delay the
//         body returns, and repeats while a shared run flag is set.
//
// @details
// Each of the bot's four monitors (fill, grid, risk, snapshot) is one
// PollingLoop. Iteration contract:
//
//   while (run_flag && !stop requested):
//       delay = body()                  // error boundary around this call
//       on std::exception: log, delay = error_backoff
//       interruptible sleep(delay)
//
// The run flag is checked at the top of every iteration; clearing it lets
// the current iteration finish and the loop exit on the next check. An
// in-flight body is never interrupted. wake() (or stop()) cuts a sleep
// short, so shutdown does not wait out a five-minute snapshot interval.
//
// A failing body never takes down the thread or the other loops: every
// std::exception is caught at the iteration boundary, logged with the loop
// name, counted, and followed by the error backoff.
//
// Thread model:
//   start()/stop()/wake() may be called from any thread other than the
//   worker. The body runs only on the worker thread.
//
// Ownership:
//   Owns the thread. Holds a reference to the run flag, which belongs to
//   the orchestrator and must outlive the loop.
// -----------------------------------------------------------------------------
class PollingLoop {
 public:
  using Body = std::function<std::chrono::milliseconds()>;

  PollingLoop(std::string name, const std::atomic<bool>& run_flag, Body body,
              std::chrono::milliseconds error_backoff);

  // Stops and joins the worker.
  ~PollingLoop();

  PollingLoop(const PollingLoop&) = delete;
  PollingLoop& operator=(const PollingLoop&) = delete;
  PollingLoop(PollingLoop&&) = delete;
  PollingLoop& operator=(PollingLoop&&) = delete;

  // Starts the worker. No-op if it is already running.
  void start();

  // Requests exit, wakes the worker, and joins it. Idempotent.
  void stop();

  // Interrupts the current sleep; the worker re-checks the run flag.
  void wake();

  bool running() const { return thread_.joinable() && !finished_.load(); }
  const std::string& name() const { return name_; }
  std::uint64_t iterations() const { return iterations_.load(); }
  std::uint64_t failures() const { return failures_.load(); }

 private:
  void run();
  bool shouldContinue() const;
  void sleepFor(std::chrono::milliseconds delay);

  const std::string name_;
  const std::atomic<bool>& run_flag_;
  Body body_;
  const std::chrono::milliseconds error_backoff_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> finished_{false};
  std::atomic<std::uint64_t> iterations_{0};
  std::atomic<std::uint64_t> failures_{0};

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  bool wake_pending_{false};

  std::thread thread_;
};

}  // namespace gridbot
