#pragma once

#include "trustflow/concurrent/thread_safe_queue.hpp"
#include "trustflow/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace trustflow {

// -----------------------------------------------------------------------------
// IpcServer — dual-socket ZeroMQ gateway for commands and telemetry
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that accepts JSON command requests from
//         external clients (REP socket) and broadcasts order workflow
//         telemetry to subscribers (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (port 5556 by default):
//      Each received request is forwarded to the command handler (bound
//      to ServiceContext::executeCommand()) and its JSON reply is sent
//      back. ZMQ_RCVTIMEO keeps recv() from blocking indefinitely so the
//      thread alternates between command polling and telemetry draining.
//
//      Commands run on this thread. An approval or submission blocks the
//      command socket until its receipt arrives or its wait times out;
//      telemetry for that command is flushed right after the reply.
//
//   2. PUB socket (port 5557 by default):
//      Broadcasts one JSON message per OrderUpdateEvent ("order_update"),
//      TransactionEvent ("transaction") and ProposalEvent ("proposal").
//      Events arrive through a ThreadSafeQueue fed by EventBus bridges,
//      so serialization and socket I/O never run on the publishing thread.
//
// Thread model:
//   Constructed and destroyed on the owning thread (ServiceContext).
//   start() spawns the worker; stop() sets an atomic flag and joins.
//   pushTelemetry() is safe from any thread.
//
// Ownership:
//   Owned by ServiceContext via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  command_handler  Invoked for each request on the REP socket;
  //                          returns the reply string.
  // @param  cmd_endpoint     ZMQ endpoint for the REP command socket.
  // @param  pub_endpoint     ZMQ endpoint for the PUB telemetry socket.
  //
  // No sockets are opened and no threads are spawned here.
  // -------------------------------------------------------------------------
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
  //
  // @brief  Binds both sockets and spawns the worker thread.
  //
  // Idempotent. Throws zmq::error_t when an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Signals the worker to exit, joins it, closes the sockets.
  //
  // The worker notices within kPollTimeoutMs unless a command is running,
  // in which case stop() waits for that command to finish. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues an event for broadcast on the PUB socket.
  void pushTelemetry(Event event);

  bool isRunning() const noexcept { return running_.load(); }

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  //
  // @brief  Serialises an Event into its telemetry JSON message.
  //
  // @return std::nullopt for event types that are not broadcast.
  //
  // Pure function; public so the message layout can be tested without
  // opening sockets.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  // Drains the telemetry queue onto the PUB socket without blocking.
  void processTelemetry();

  // Waits up to kPollTimeoutMs for one request and answers it.
  void processCommands();

  static std::string formatOrderUpdate(const OrderUpdateEvent& e);
  static std::string formatTransaction(const TransactionEvent& e);
  static std::string formatProposal(const ProposalEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace trustflow
