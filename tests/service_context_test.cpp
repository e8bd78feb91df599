// =============================================================================
// service_context_test.cpp
// =============================================================================
// Tests for trustflow::ServiceContext command handling.
//
// Validates:
//   - Every command name dispatches to the matching workflow operation
//   - Reply envelope: "status" is "ok" or "error"; errors carry
//     error_type and message
//   - Malformed requests are BadRequest, unknown names UnknownCommand
//   - Domain failures report the concrete error kind
//   - start() with empty endpoints opens no sockets
//
// Setup:
//   Components built from FakeChainClient and the simulated collaborators;
//   commands go through executeCommand() directly, no IPC involved.
// =============================================================================

#include "trustflow/advisory/i_rule_checker.hpp"
#include "trustflow/advisory/placeholder_source_generator.hpp"
#include "trustflow/engine/service_context.hpp"
#include "trustflow/governance/simulated_governance.hpp"
#include "trustflow/time/simulation_time_provider.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

using nlohmann::json;

class ServiceContextTest : public ::testing::Test {
 protected:
  void SetUp() override {
    trustflow::ServiceContext::Components components;
    auto clock =
        std::make_unique<trustflow::SimulationTimeProvider>(1753926014000);
    components.governance =
        std::make_unique<trustflow::SimulatedGovernance>(*clock);
    components.source_generator =
        std::make_unique<trustflow::PlaceholderSourceGenerator>(*clock);
    components.clock = std::move(clock);
    components.chain = std::make_unique<trustflow::fakes::FakeChainClient>();
    components.rule_checker = std::make_unique<trustflow::StaticRuleChecker>();
    components.tokens = trustflow::domain::TokenRegistry::withSepoliaDefaults();

    context = std::make_unique<trustflow::ServiceContext>(std::move(components),
                                                          "", "");
  }

  json run(const json& request) {
    return json::parse(context->executeCommand(request.dump()));
  }

  json createOrder() {
    return run({{"command", "create_order"},
                {"prompt", "sell 0.01 WETH at 3000"},
                {"from_token", "WETH"},
                {"to_token", "USDC"},
                {"amount", 0.01},
                {"price", 3000.0}});
  }

  std::unique_ptr<trustflow::ServiceContext> context;
};

// -----------------------------------------------------------------------------
// 1. ping answers pong.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, Ping) {
  json r = run({{"command", "ping"}});
  EXPECT_EQ(r["status"], "ok");
  EXPECT_EQ(r["response"], "pong");
}

// -----------------------------------------------------------------------------
// 2. create_order returns the order after the approval step.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, CreateOrder) {
  json r = createOrder();
  ASSERT_EQ(r["status"], "ok") << r.dump();
  EXPECT_EQ(r["order"]["id"], 1);
  EXPECT_EQ(r["order"]["from_token"], "WETH");
  EXPECT_EQ(r["order"]["status"], "APPROVED");
  EXPECT_EQ(r["order"]["approval_tx_hash"], "0xfeed0");
}

// -----------------------------------------------------------------------------
// 3. The full workflow driven by commands alone.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, WorkflowThroughCommands) {
  createOrder();

  json gov = run({{"command", "initiate_governance"}, {"order_id", 1}});
  ASSERT_EQ(gov["status"], "ok") << gov.dump();
  EXPECT_EQ(gov["proposal"]["order_id"], 1);
  EXPECT_EQ(gov["proposal"]["status"], "approved");

  json prop = run({{"command", "get_proposal"},
                   {"proposal_id", gov["proposal"]["id"]}});
  ASSERT_EQ(prop["status"], "ok") << prop.dump();
  EXPECT_EQ(prop["proposal"]["title"], gov["proposal"]["title"]);

  json exec = run({{"command", "submit_order"}, {"order_id", 1}});
  ASSERT_EQ(exec["status"], "ok") << exec.dump();
  EXPECT_EQ(exec["execution"]["status"], "EXECUTED");
  EXPECT_EQ(exec["execution"]["tx_hash"], "0xfeed1");
  EXPECT_EQ(exec["execution"]["block_number"], 1001);

  json got = run({{"command", "get_order"}, {"order_id", 1}});
  EXPECT_EQ(got["order"]["status"], "EXECUTED");
  EXPECT_EQ(got["order"]["order_tx_hash"], "0xfeed1");
}

// -----------------------------------------------------------------------------
// 4. list_orders, audit_order and cancel_order.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, ListAuditCancel) {
  createOrder();
  createOrder();

  json list = run({{"command", "list_orders"}});
  ASSERT_EQ(list["status"], "ok");
  ASSERT_EQ(list["orders"].size(), 2u);
  EXPECT_EQ(list["orders"][1]["id"], 2);

  json audit = run({{"command", "audit_order"}, {"order_id", 2}});
  ASSERT_EQ(audit["status"], "ok") << audit.dump();
  ASSERT_EQ(audit["audit"]["findings"].size(), 1u);
  EXPECT_EQ(audit["audit"]["findings"][0]["severity"], "info");

  json cancel = run({{"command", "cancel_order"}, {"order_id", 2}});
  ASSERT_EQ(cancel["status"], "ok") << cancel.dump();
  EXPECT_EQ(cancel["cancellation"]["status"], "CANCELED");
  EXPECT_EQ(cancel["cancellation"]["canceled_at"], 1753926014);
}

// -----------------------------------------------------------------------------
// 5. retry_approval on an order that is not CREATED is an InvalidTransition.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, RetryApprovalReportsInvalidTransition) {
  createOrder();
  json r = run({{"command", "retry_approval"}, {"order_id", 1}});
  EXPECT_EQ(r["status"], "error");
  EXPECT_EQ(r["error_type"], "InvalidTransition");
  EXPECT_FALSE(r["message"].get<std::string>().empty());
}

// -----------------------------------------------------------------------------
// 6. Unknown ids surface as OrderNotFound / ProposalNotFound.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, NotFoundErrors) {
  json order = run({{"command", "get_order"}, {"order_id", 42}});
  EXPECT_EQ(order["status"], "error");
  EXPECT_EQ(order["error_type"], "OrderNotFound");

  json proposal = run({{"command", "get_proposal"}, {"proposal_id", 7}});
  EXPECT_EQ(proposal["error_type"], "ProposalNotFound");
}

// -----------------------------------------------------------------------------
// 7. Invalid order requests are reported, not thrown.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, InvalidOrderRequest) {
  json r = run({{"command", "create_order"},
                {"from_token", "WETH"},
                {"to_token", "USDC"},
                {"amount", -1.0},
                {"price", 1.0}});
  EXPECT_EQ(r["status"], "error");
  EXPECT_EQ(r["error_type"], "InvalidOrderRequest");
}

// -----------------------------------------------------------------------------
// 8. Malformed requests.
// Why: The IPC thread must always get a reply string back, whatever the
//      client sent.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, MalformedRequests) {
  json not_json = json::parse(context->executeCommand("{not json"));
  EXPECT_EQ(not_json["status"], "error");
  EXPECT_EQ(not_json["error_type"], "BadRequest");

  json no_command = run({{"order_id", 1}});
  EXPECT_EQ(no_command["error_type"], "BadRequest");

  json array = run(json::array({1, 2}));
  EXPECT_EQ(array["error_type"], "BadRequest");

  json missing_field = run({{"command", "get_order"}});
  EXPECT_EQ(missing_field["error_type"], "BadRequest");

  json wrong_type = run({{"command", "get_order"}, {"order_id", "one"}});
  EXPECT_EQ(wrong_type["error_type"], "BadRequest");
}

TEST_F(ServiceContextTest, UnknownCommand) {
  json r = run({{"command", "launch_rocket"}});
  EXPECT_EQ(r["status"], "error");
  EXPECT_EQ(r["error_type"], "UnknownCommand");
  EXPECT_EQ(r["message"], "Unknown command: launch_rocket");
}

// -----------------------------------------------------------------------------
// 9. chain_status reports wallet, contract and the fee quote.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, ChainStatus) {
  json r = run({{"command", "chain_status"}});
  ASSERT_EQ(r["status"], "ok") << r.dump();
  EXPECT_EQ(r["chain"]["wallet"], trustflow::fakes::FakeChainClient::kWallet);
  EXPECT_EQ(r["chain"]["contract_address"],
            trustflow::fakes::FakeChainClient::kContract);
  EXPECT_EQ(r["chain"]["contract_usable"], true);
  EXPECT_EQ(r["chain"]["fee_mode"], "eip1559");
  EXPECT_EQ(r["chain"]["max_priority_fee_per_gas"], "1000000000");
  EXPECT_EQ(r["chain"]["max_fee_per_gas"], "41000000000");
}

// -----------------------------------------------------------------------------
// 10. start()/stop() with empty endpoints are no-ops.
// -----------------------------------------------------------------------------
TEST_F(ServiceContextTest, StartWithoutEndpointsOpensNothing) {
  context->start();
  json r = run({{"command", "ping"}});
  EXPECT_EQ(r["response"], "pong");
  context->stop();
}
