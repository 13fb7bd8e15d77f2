#include "gridbot/concurrent/polling_loop.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace gridbot {

PollingLoop::PollingLoop(std::string name, const std::atomic<bool>& run_flag,
                         Body body, std::chrono::milliseconds error_backoff)
    : name_(std::move(name)),
      run_flag_(run_flag),
      body_(std::move(body)),
      error_backoff_(error_backoff) {}

PollingLoop::~PollingLoop() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PollingLoop::start() {
  if (thread_.joinable()) {
    return;
  }
  stop_requested_.store(false);
  finished_.store(false);
  {
    std::lock_guard lock(wake_mutex_);
    wake_pending_ = false;
  }
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
// No lock is held across join(); the worker needs wake_mutex_ to leave its
// sleep.
// -----------------------------------------------------------------------------
void PollingLoop::stop() {
  if (!thread_.joinable()) {
    return;
  }
  stop_requested_.store(true);
  wake();
  thread_.join();
}

void PollingLoop::wake() {
  {
    std::lock_guard lock(wake_mutex_);
    wake_pending_ = true;
  }
  wake_cv_.notify_all();
}

bool PollingLoop::shouldContinue() const {
  return run_flag_.load() && !stop_requested_.load();
}

// -----------------------------------------------------------------------------
// run(): worker loop with a per-iteration error boundary
// -----------------------------------------------------------------------------
void PollingLoop::run() {
  std::cout << "[PollingLoop] " << name_ << " started\n";

  while (shouldContinue()) {
    std::chrono::milliseconds delay = error_backoff_;
    try {
      delay = body_();
    } catch (const std::exception& e) {
      failures_.fetch_add(1);
      std::cerr << "[PollingLoop] " << name_ << " iteration failed: "
                << e.what() << ". Backing off " << error_backoff_.count()
                << " ms\n";
      delay = error_backoff_;
    }
    iterations_.fetch_add(1);
    sleepFor(delay);
  }

  finished_.store(true);
  std::cout << "[PollingLoop] " << name_ << " stopped\n";
}

void PollingLoop::sleepFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(wake_mutex_);
  wake_cv_.wait_for(lock, delay, [this] {
    return wake_pending_ || !shouldContinue();
  });
  wake_pending_ = false;
}

}  // namespace gridbot
