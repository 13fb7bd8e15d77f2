#pragma once

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace gridbot {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ operator channel: commands in, telemetry out
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread serving a REP socket for operator commands
//         and a PUB socket for status frames and kill-switch notices.
//
// @details
// Two sockets on one thread:
//
//   1. REP (cmd_endpoint, default tcp://127.0.0.1:5556)
//      Receives a command string (PING, STATUS, HALT, RESUME,
//      PROFILE <name>, START, STOP), hands it to the command handler, and
//      sends the handler's JSON reply. ZMQ_RCVTIMEO bounds each receive so
//      the thread alternates between commands and telemetry.
//
//   2. PUB (pub_endpoint, default tcp://127.0.0.1:5557)
//      Publishes every JSON frame queued by pushTelemetry(). Sends use
//      dontwait; a frame with no subscriber is dropped by ZeroMQ.
//
// The outbound buffer is capped at kMaxPending frames; when the IPC thread
// falls behind, the oldest frame is discarded first.
//
// Thread model:
//   start()/stop() from the owning thread (GridBot::initialize/shutdown).
//   pushTelemetry() from any thread. The command handler runs on the IPC
//   thread and must be thread-safe with respect to the polling loops.
//
// Ownership:
//   Owned by GridBot via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry buffer, and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker. No-op when running.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, publishes nothing further. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // Queues one frame for the PUB socket. Safe from any thread.
  void pushTelemetry(nlohmann::json frame);

  std::size_t pendingTelemetry() const;

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr std::size_t kMaxPending = 1024;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  mutable std::mutex telemetry_mutex_;
  std::deque<nlohmann::json> telemetry_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace gridbot
