#include "gridbot/network/ipc_server.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace gridbot {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close sockets
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(nlohmann::json frame) {
  std::lock_guard lock(telemetry_mutex_);
  telemetry_.push_back(std::move(frame));
  while (telemetry_.size() > kMaxPending) {
    telemetry_.pop_front();
  }
}

std::size_t IpcServer::pendingTelemetry() const {
  std::lock_guard lock(telemetry_mutex_);
  return telemetry_.size();
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and command poll
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    try {
      processTelemetry();
      processCommands();
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] socket error: " << e.what() << "\n";
    }
  }
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): publish everything queued so far
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  std::deque<nlohmann::json> batch;
  {
    std::lock_guard lock(telemetry_mutex_);
    batch.swap(telemetry_);
  }
  for (const auto& frame : batch) {
    const std::string text = frame.dump();
    zmq::message_t msg(text.data(), text.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request, one reply
// -----------------------------------------------------------------------------
// A REP socket must answer every request it receives, so a handler that
// throws still produces an error reply.
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command '" << cmd << "' failed: " << e.what()
              << "\n";
    response = nlohmann::json{{"status", "error"}, {"response", e.what()}}
                   .dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace gridbot
