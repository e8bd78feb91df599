#include "trustflow/engine/service_context.hpp"
#include "trustflow/advisory/placeholder_source_generator.hpp"
#include "trustflow/chain/chain_client.hpp"
#include "trustflow/chain/chain_identity.hpp"
#include "trustflow/chain/curl_rpc_transport.hpp"
#include "trustflow/chain/quantity.hpp"
#include "trustflow/domain/json_codec.hpp"
#include "trustflow/errors.hpp"
#include "trustflow/governance/simulated_governance.hpp"
#include "trustflow/time/live_time_provider.hpp"

#include <iostream>
#include <utility>

namespace trustflow {

// -----------------------------------------------------------------------------
// fromConfig(): production wiring
// -----------------------------------------------------------------------------
std::unique_ptr<ServiceContext> ServiceContext::fromConfig(
    const AppConfig& config) {
  config.validate();
  std::cout << "[ServiceContext] Configuration: " << config.describe() << "\n";

  chain::ChainClientOptions chain_options;
  chain_options.priority_fee =
      chain::toBaseUnits(config.priority_fee_gwei, 9);
  chain_options.poll_interval_ms = config.poll_interval_ms;

  auto transport = std::make_unique<chain::CurlRpcTransport>(
      config.rpc_url, config.rpc_timeout_ms);
  auto identity = chain::ChainIdentity::fromPrivateKeyHex(config.private_key);

  Components components;
  components.clock = std::make_unique<LiveTimeProvider>();
  components.chain = std::make_unique<chain::ChainClient>(
      std::move(transport), std::move(identity), config.contract_address,
      chain_options);
  components.governance =
      std::make_unique<SimulatedGovernance>(*components.clock);
  components.source_generator =
      std::make_unique<PlaceholderSourceGenerator>(*components.clock);
  components.rule_checker = std::make_unique<StaticRuleChecker>();
  components.tokens = domain::TokenRegistry::withSepoliaDefaults();
  components.options.approval_timeout_ms = config.approval_timeout_ms;
  components.options.submission_timeout_ms = config.submission_timeout_ms;

  return std::make_unique<ServiceContext>(std::move(components),
                                          config.ipc_cmd_endpoint,
                                          config.ipc_pub_endpoint);
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ServiceContext::ServiceContext(Components components,
                               std::string ipc_cmd_endpoint,
                               std::string ipc_pub_endpoint)
    : clock_(std::move(components.clock)),
      chain_(std::move(components.chain)),
      governance_(std::move(components.governance)),
      source_generator_(std::move(components.source_generator)),
      rule_checker_(std::move(components.rule_checker)),
      ipc_cmd_endpoint_(std::move(ipc_cmd_endpoint)),
      ipc_pub_endpoint_(std::move(ipc_pub_endpoint)) {
  orchestrator_ = std::make_unique<OrderOrchestrator>(
      *chain_, *governance_, *source_generator_, *rule_checker_, store_, bus_,
      *clock_, std::move(components.tokens), components.options);
}

ServiceContext::~ServiceContext() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ServiceContext::start() {
  if (ipc_server_ || ipc_cmd_endpoint_.empty() || ipc_pub_endpoint_.empty()) {
    return;
  }

  ipc_server_ = std::make_unique<IpcServer>(
      [this](const std::string& cmd) { return executeCommand(cmd); },
      ipc_cmd_endpoint_, ipc_pub_endpoint_);
  ipc_server_->start();

  // Telemetry bridges: forward workflow events to the IPC server queue.
  telemetry_subscriptions_.push_back(bus_.subscribe<OrderUpdateEvent>(
      [this](const OrderUpdateEvent& e) { ipc_server_->pushTelemetry(e); }));
  telemetry_subscriptions_.push_back(bus_.subscribe<TransactionEvent>(
      [this](const TransactionEvent& e) { ipc_server_->pushTelemetry(e); }));
  telemetry_subscriptions_.push_back(bus_.subscribe<ProposalEvent>(
      [this](const ProposalEvent& e) { ipc_server_->pushTelemetry(e); }));

  std::cout << "[ServiceContext] started. Wallet " << chain_->address()
            << ", contract " << chain_->contractAddress()
            << (chain_->hasUsableContract() ? "" : " (not configured)")
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ServiceContext::stop() {
  if (!ipc_server_) {
    return;
  }

  for (EventBus::SubscriptionId id : telemetry_subscriptions_) {
    bus_.unsubscribe(id);
  }
  telemetry_subscriptions_.clear();

  ipc_server_.reset();

  std::cout << "[ServiceContext] stopped.\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, translate failures into replies
// -----------------------------------------------------------------------------
std::string ServiceContext::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  try {
    nlohmann::json request = nlohmann::json::parse(cmd);
    response = dispatch(request);
  } catch (const Error& e) {
    response = nlohmann::json::object();
    response["status"] = "error";
    response["error_type"] = e.typeName();
    response["message"] = e.what();
  } catch (const nlohmann::json::exception& e) {
    response = nlohmann::json::object();
    response["status"] = "error";
    response["error_type"] = "BadRequest";
    response["message"] = e.what();
  } catch (const std::exception& e) {
    std::cerr << "[ServiceContext] Command failed unexpectedly: " << e.what()
              << "\n";
    response = nlohmann::json::object();
    response["status"] = "error";
    response["error_type"] = "InternalError";
    response["message"] = e.what();
  }

  return response.dump();
}

nlohmann::json ServiceContext::dispatch(const nlohmann::json& request) {
  if (!request.is_object() || !request.contains("command")) {
    nlohmann::json response;
    response["status"] = "error";
    response["error_type"] = "BadRequest";
    response["message"] = "request must be a JSON object with a \"command\"";
    return response;
  }

  const std::string command = request.at("command").get<std::string>();
  nlohmann::json response;
  response["status"] = "ok";

  if (command == "ping") {
    response["response"] = "pong";
  } else if (command == "create_order") {
    domain::Order order = orchestrator_->createLimitOrder(
        request.value("prompt", std::string()),
        request.at("from_token").get<std::string>(),
        request.at("to_token").get<std::string>(),
        request.at("amount").get<double>(), request.at("price").get<double>());
    response["order"] = domain::toJson(order);
  } else if (command == "retry_approval") {
    response["approval"] = domain::toJson(orchestrator_->retryApproval(
        request.at("order_id").get<domain::OrderId>()));
  } else if (command == "initiate_governance") {
    response["proposal"] =
        domain::toJson(orchestrator_->initiateGovernanceApproval(
            request.at("order_id").get<domain::OrderId>()));
  } else if (command == "submit_order") {
    response["execution"] = domain::toJson(orchestrator_->submitAndExecute(
        request.at("order_id").get<domain::OrderId>()));
  } else if (command == "cancel_order") {
    response["cancellation"] = domain::toJson(
        orchestrator_->cancel(request.at("order_id").get<domain::OrderId>()));
  } else if (command == "get_order") {
    response["order"] = domain::toJson(orchestrator_->getOrder(
        request.at("order_id").get<domain::OrderId>()));
  } else if (command == "list_orders") {
    nlohmann::json orders = nlohmann::json::array();
    for (const auto& order : orchestrator_->listOrders()) {
      orders.push_back(domain::toJson(order));
    }
    response["orders"] = std::move(orders);
  } else if (command == "audit_order") {
    response["audit"] = domain::toJson(orchestrator_->auditOrder(
        request.at("order_id").get<domain::OrderId>()));
  } else if (command == "get_proposal") {
    response["proposal"] = domain::toJson(orchestrator_->getProposal(
        request.at("proposal_id").get<domain::ProposalId>()));
  } else if (command == "chain_status") {
    response["chain"] = chainStatus();
  } else {
    response["status"] = "error";
    response["error_type"] = "UnknownCommand";
    response["message"] = "Unknown command: " + command;
  }

  return response;
}

nlohmann::json ServiceContext::chainStatus() {
  nlohmann::json j;
  j["wallet"] = chain_->address();
  j["contract_address"] = chain_->contractAddress();
  j["contract_usable"] = chain_->hasUsableContract();

  chain::FeeQuote fees = chain_->estimateFees();
  if (fees.kind == chain::FeeQuote::Kind::Eip1559) {
    j["fee_mode"] = "eip1559";
    j["max_fee_per_gas"] = chain::toDecimalString(fees.max_fee_per_gas);
    j["max_priority_fee_per_gas"] =
        chain::toDecimalString(fees.max_priority_fee_per_gas);
  } else {
    j["fee_mode"] = "legacy";
    j["gas_price"] = chain::toDecimalString(fees.gas_price);
  }
  return j;
}

}  // namespace trustflow
