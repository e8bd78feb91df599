// -----------------------------------------------------------------------------
// trustflow_service — single executable entry point.
//
//   1) Load AppConfig from the environment, then overlay the JSON file given
//      as argv[1] (if any).
//   2) Build the ServiceContext: chain client (connects to the RPC endpoint
//      and reads chain id and pending nonce), governance, store,
//      orchestrator.
//   3) Start the IPC server and log workflow events to stdout.
//   4) Sleep on the main thread until Ctrl-C, then shut down cleanly.
//
// Exit codes: 0 clean shutdown, 1 configuration, chain connection or IPC
// bind error.
//
// Thread layout:
//   main thread   -> waits for SIGINT
//   ipc thread    -> command handling (order workflow runs here) and
//                    telemetry broadcast
// -----------------------------------------------------------------------------

#include "trustflow/config/app_config.hpp"
#include "trustflow/domain/order_status.hpp"
#include "trustflow/engine/service_context.hpp"
#include "trustflow/errors.hpp"
#include "trustflow/events/order_update_event.hpp"
#include "trustflow/events/transaction_event.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag, the only global in the program. Set from the SIGINT
// handler; lock-free atomic stores are async-signal-safe.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char* argv[]) {
  std::unique_ptr<trustflow::ServiceContext> service;

  // -------------------------------------------------------------------------
  // 1) + 2) Configuration and wiring. Failures here are fatal.
  // -------------------------------------------------------------------------
  try {
    trustflow::AppConfig config = trustflow::AppConfig::fromEnvironment();
    if (argc > 1) {
      config.overlayFile(argv[1]);
    }
    service = trustflow::ServiceContext::fromConfig(config);
  } catch (const trustflow::Error& e) {
    std::cerr << "[main] " << e.typeName() << ": " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] Startup failed: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Observe the workflow on stdout, then open the IPC sockets.
  // -------------------------------------------------------------------------
  service->eventBus().subscribe<trustflow::OrderUpdateEvent>(
      [](const trustflow::OrderUpdateEvent& e) {
        std::cout << "[OrderUpdate] order_id=" << e.order.id << " "
                  << trustflow::domain::toString(e.previous_status) << " -> "
                  << trustflow::domain::toString(e.order.status) << " ("
                  << e.reason << ")\n";
      });
  service->eventBus().subscribe<trustflow::TransactionEvent>(
      [](const trustflow::TransactionEvent& e) {
        std::cout << "[Transaction] order_id=" << e.order_id << " "
                  << e.label << " " << trustflow::toString(e.stage)
                  << (e.tx_hash.empty() ? "" : " tx=" + e.tx_hash) << "\n";
      });

  try {
    service->start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Cannot open IPC sockets: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Wait for Ctrl-C.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  std::cout << "[main] trustflow service running. Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping service...\n";
  service->stop();

  return 0;
}
