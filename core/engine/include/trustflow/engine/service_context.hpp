#pragma once

#include "trustflow/advisory/i_rule_checker.hpp"
#include "trustflow/advisory/i_source_generator.hpp"
#include "trustflow/chain/i_chain_client.hpp"
#include "trustflow/config/app_config.hpp"
#include "trustflow/domain/token_registry.hpp"
#include "trustflow/engine/order_orchestrator.hpp"
#include "trustflow/eventbus/event_bus.hpp"
#include "trustflow/governance/i_governance.hpp"
#include "trustflow/network/ipc_server.hpp"
#include "trustflow/store/order_store.hpp"
#include "trustflow/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace trustflow {

// -----------------------------------------------------------------------------
// ServiceContext
// -----------------------------------------------------------------------------
//
// @brief  Application root: owns every long-lived component of the order
//         service and exposes it to the outside over the IPC server.
//
// @details
// Replaces process-wide singletons: main() builds exactly one context from
// AppConfig and everything else reaches its collaborators through it.
// Tests build one from injected fakes.
//
// Ownership:
//   ServiceContext
//    ├── clock_             (unique_ptr<ITimeProvider>)
//    ├── chain_             (unique_ptr<chain::IChainClient>)
//    ├── governance_        (unique_ptr<IGovernance>)
//    ├── source_generator_  (unique_ptr<ISourceGenerator>)
//    ├── rule_checker_      (unique_ptr<IRuleChecker>)
//    ├── store_             (OrderStore — value member)
//    ├── bus_               (EventBus — value member)
//    ├── orchestrator_      (unique_ptr<OrderOrchestrator>)
//    └── ipc_server_        (unique_ptr<IpcServer>, only between start/stop)
//
// Members are declared in dependency order so the orchestrator and the
// IPC server are destroyed before what they reference.
//
// Thread model:
//   start()/stop() from the owning thread. executeCommand() runs on the
//   IPC worker thread (or the test thread) and is safe to call
//   concurrently; the store and the chain client serialise internally.
// -----------------------------------------------------------------------------
class ServiceContext {
 public:
  struct Components {
    std::unique_ptr<ITimeProvider> clock;
    std::unique_ptr<chain::IChainClient> chain;
    std::unique_ptr<IGovernance> governance;
    std::unique_ptr<ISourceGenerator> source_generator;
    std::unique_ptr<IRuleChecker> rule_checker;
    domain::TokenRegistry tokens;
    OrchestratorOptions options;
  };

  // -------------------------------------------------------------------------
  // fromConfig(config)
  // -------------------------------------------------------------------------
  //
  // @brief  Builds the production context: live clock, curl JSON-RPC
  //         transport, ChainClient, simulated governance, placeholder
  //         source generator, static rule checker, Sepolia token table.
  //
  // @throws ConfigError       invalid settings or private key.
  // @throws ChainUnavailable  the RPC endpoint does not answer the
  //                           chain-id / nonce queries.
  // -------------------------------------------------------------------------
  static std::unique_ptr<ServiceContext> fromConfig(const AppConfig& config);

  // Every component pointer must be non-null.
  explicit ServiceContext(Components components,
                          std::string ipc_cmd_endpoint = "tcp://127.0.0.1:5556",
                          std::string ipc_pub_endpoint = "tcp://127.0.0.1:5557");

  ~ServiceContext();

  ServiceContext(const ServiceContext&) = delete;
  ServiceContext& operator=(const ServiceContext&) = delete;
  ServiceContext(ServiceContext&&) = delete;
  ServiceContext& operator=(ServiceContext&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Brings the IPC server online and bridges workflow events to
  //         its telemetry queue.
  //
  // No-op when either endpoint is empty (tests drive executeCommand()
  // directly) or when already started.
  // -------------------------------------------------------------------------
  void start();

  // Disconnects the telemetry bridges and stops the IPC server. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one IPC request and returns the JSON reply.
  //
  // @param  cmd  JSON object {"command": <name>, ...arguments}.
  //
  // @details
  // Commands and their arguments:
  //   ping                                        -> {"response":"pong"}
  //   create_order   prompt, from_token, to_token, amount, price
  //                                               -> {"order":{...}}
  //   retry_approval       order_id               -> {"approval":{...}}
  //   initiate_governance  order_id               -> {"proposal":{...}}
  //   submit_order         order_id               -> {"execution":{...}}
  //   cancel_order         order_id               -> {"cancellation":{...}}
  //   get_order            order_id               -> {"order":{...}}
  //   list_orders                                 -> {"orders":[...]}
  //   audit_order          order_id               -> {"audit":{...}}
  //   get_proposal         proposal_id            -> {"proposal":{...}}
  //   chain_status                                -> wallet, contract, fees
  //
  // Successful replies carry "status":"ok". Failures never escape: they
  // are returned as {"status":"error","error_type":<name>,"message":...}
  // where error_type is the trustflow::Error type name, "BadRequest" for
  // malformed requests, or "UnknownCommand".
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  OrderOrchestrator& orchestrator() { return *orchestrator_; }
  EventBus& eventBus() { return bus_; }
  chain::IChainClient& chainClient() { return *chain_; }

 private:
  nlohmann::json dispatch(const nlohmann::json& request);
  nlohmann::json chainStatus();

  std::unique_ptr<ITimeProvider> clock_;
  std::unique_ptr<chain::IChainClient> chain_;
  std::unique_ptr<IGovernance> governance_;
  std::unique_ptr<ISourceGenerator> source_generator_;
  std::unique_ptr<IRuleChecker> rule_checker_;
  OrderStore store_;
  EventBus bus_;
  std::unique_ptr<OrderOrchestrator> orchestrator_;

  std::string ipc_cmd_endpoint_;
  std::string ipc_pub_endpoint_;
  std::vector<EventBus::SubscriptionId> telemetry_subscriptions_;
  std::unique_ptr<IpcServer> ipc_server_;
};

}  // namespace trustflow
