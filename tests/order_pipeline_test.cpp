// =============================================================================
// order_pipeline_test.cpp
// =============================================================================
// Integration tests for the full order pipeline over the real chain client:
//   createLimitOrder -> ERC-20 approve -> governance -> submitLimitOrder
//     -> receipt -> EXECUTED | FAILED_ONCHAIN
//
// Validates:
//   - The default token table holds valid checksummed addresses, so the
//     approval and submission calldata encode without AbiError
//   - Approval: signed type-2 transaction to the token, spender and amount
//     in the calldata, hash recorded on the order, nonce consumed
//   - Governance: a numeric proposal id lands on the order
//   - Submission: EXECUTED with hash and block number; a reverted receipt
//     ends in FAILED_ONCHAIN
//   - Token addresses given in any letter case resolve to the registry
//     entry and its decimals
//
// Design:
//   OrderOrchestrator is wired the way ServiceContext::fromConfig() wires
//   it, except that ChainClient talks to a FakeRpcTransport scripted like a
//   Sepolia node. Everything runs on the test thread; the raw transactions
//   the node receives are read back from the transport's call log.
// =============================================================================

#include "trustflow/advisory/i_rule_checker.hpp"
#include "trustflow/advisory/placeholder_source_generator.hpp"
#include "trustflow/chain/address.hpp"
#include "trustflow/chain/chain_client.hpp"
#include "trustflow/chain/hex.hpp"
#include "trustflow/chain/keccak.hpp"
#include "trustflow/domain/token_registry.hpp"
#include "trustflow/engine/order_orchestrator.hpp"
#include "trustflow/errors.hpp"
#include "trustflow/eventbus/event_bus.hpp"
#include "trustflow/governance/simulated_governance.hpp"
#include "trustflow/store/order_store.hpp"
#include "trustflow/time/simulation_time_provider.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace chain = trustflow::chain;
namespace domain = trustflow::domain;
using domain::OrderStatus;
using nlohmann::json;
using trustflow::fakes::FakeRpcTransport;

namespace {

const char* kKeyOne =
    "0x0000000000000000000000000000000000000000000000000000000000000001";
const char* kWallet = "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf";
const char* kContract = "0x1111111111111111111111111111111111111111";
const char* kWeth = "0xfFF9976782D46CC05630D1f6EB9BC98210FBfcc5";
const char* kUsdc = "0x56AD9fB23C8A0B2c9030a9086A0f174a7d4E708e";

json hashOfRaw(const json& params) {
  chain::Bytes raw = chain::fromHex(params.at(0).get<std::string>());
  return chain::toHex(chain::keccak256(raw));
}

// 32-byte ABI word holding `hex_digits`, left-padded with zeros.
std::string abiWord(const std::string& hex_digits) {
  return std::string(64 - hex_digits.size(), '0') + hex_digits;
}

// Address as it appears inside an ABI word: lower-case, no prefix.
std::string addressWord(const std::string& address) {
  return abiWord(chain::toHex(chain::addressBytes(address), false));
}

bool contains(const std::string& text, const std::string& part) {
  return text.find(part) != std::string::npos;
}

}  // namespace

// =============================================================================
// Test fixture: one orchestrator over a real ChainClient.
//
// The transport is scripted before the client is built because the
// constructor reads the chain id and pending nonce. Handlers can be
// replaced afterwards; `rpc` stays valid for the client's lifetime.
// =============================================================================
class OrderPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto transport = std::make_unique<FakeRpcTransport>();
    rpc = transport.get();

    rpc->reply("eth_chainId", "0xaa36a7");
    rpc->reply("eth_getTransactionCount", "0x5");
    rpc->reply("eth_getBalance", "0xde0b6b3a7640000");  // 1 ETH
    rpc->reply("eth_getBlockByNumber", json{{"baseFeePerGas", "0x3b9aca00"}});
    rpc->reply("eth_gasPrice", "0x4a817c800");
    rpc->on("eth_sendRawTransaction", hashOfRaw);
    rpc->reply("eth_getTransactionReceipt",
               json{{"status", "0x1"}, {"blockNumber", "0x10"},
                    {"gasUsed", "0x5208"}});

    chain::ChainClientOptions options;
    options.poll_interval_ms = 5;
    client = std::make_unique<chain::ChainClient>(
        std::move(transport), chain::ChainIdentity::fromPrivateKeyHex(kKeyOne),
        kContract, options);

    trustflow::OrchestratorOptions timeouts;
    timeouts.approval_timeout_ms = 1000;
    timeouts.submission_timeout_ms = 1000;
    orchestrator = std::make_unique<trustflow::OrderOrchestrator>(
        *client, governance, source_generator, rule_checker, store, bus, clock,
        domain::TokenRegistry::withSepoliaDefaults(), timeouts);
  }

  // Raw transactions in the order the node received them.
  std::vector<std::string> sentRaw() const {
    std::vector<std::string> out;
    for (const auto& call : rpc->calls()) {
      if (call.method == "eth_sendRawTransaction") {
        out.push_back(call.params.at(0).get<std::string>());
      }
    }
    return out;
  }

  trustflow::SimulationTimeProvider clock{1753926014000};
  trustflow::SimulatedGovernance governance{clock};
  trustflow::PlaceholderSourceGenerator source_generator{clock};
  trustflow::StaticRuleChecker rule_checker;
  trustflow::OrderStore store;
  trustflow::EventBus bus;

  FakeRpcTransport* rpc{nullptr};
  std::unique_ptr<chain::ChainClient> client;
  std::unique_ptr<trustflow::OrderOrchestrator> orchestrator;
};

// -----------------------------------------------------------------------------
// 1. Approval: CREATED -> APPROVED with a real signed approve().
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, CreateApprovesOnChain) {
  domain::Order order = orchestrator->createLimitOrder(
      "Sell 0.01 WETH for USDC at 3500", "WETH", "USDC", 0.01, 3500.0);

  ASSERT_EQ(order.status, OrderStatus::Approved)
      << order.last_error.value_or("");
  EXPECT_EQ(order.from_token_address, kWeth);
  EXPECT_EQ(order.to_token_address, kUsdc);
  EXPECT_EQ(order.wallet, kWallet);
  EXPECT_FALSE(order.last_error.has_value());

  std::vector<std::string> raw = sentRaw();
  ASSERT_EQ(raw.size(), 1u);
  EXPECT_EQ(order.approval_tx_hash.value_or(""),
            chain::toHex(chain::keccak256(chain::fromHex(raw[0]))));
  EXPECT_EQ(raw[0].substr(0, 4), "0x02");
  // Sent to the token; approve(contract, 0.01 * 10^18).
  EXPECT_TRUE(contains(raw[0], chain::toHex(chain::addressBytes(kWeth), false)));
  EXPECT_TRUE(contains(raw[0], "095ea7b3" + addressWord(kContract) +
                                   abiWord("2386f26fc10000")));
  EXPECT_EQ(client->nextNonce(), 6u);
}

// -----------------------------------------------------------------------------
// 2. Governance on an approved order records the proposal id.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, GovernanceApprovesApprovedOrder) {
  domain::Order order = orchestrator->createLimitOrder(
      "Sell 0.01 WETH for USDC at 3500", "WETH", "USDC", 0.01, 3500.0);
  ASSERT_EQ(order.status, OrderStatus::Approved);

  domain::GovernanceProposal proposal =
      orchestrator->initiateGovernanceApproval(order.id);
  EXPECT_EQ(proposal.id, trustflow::SimulatedGovernance::kFirstProposalId);
  EXPECT_EQ(proposal.status, domain::ProposalStatus::Approved);
  EXPECT_EQ(proposal.proposer, kWallet);

  domain::Order stored = orchestrator->getOrder(order.id);
  EXPECT_EQ(stored.status, OrderStatus::GovernanceApproved);
  EXPECT_EQ(stored.governance_proposal_id.value_or(0), proposal.id);
}

// -----------------------------------------------------------------------------
// 3. Submission: EXECUTED with the hash and block of the mined receipt.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, SubmitExecutesOnChain) {
  domain::Order order = orchestrator->createLimitOrder(
      "Sell 0.01 WETH for USDC at 3500", "WETH", "USDC", 0.01, 3500.0);
  orchestrator->initiateGovernanceApproval(order.id);

  domain::ExecutionResult result = orchestrator->submitAndExecute(order.id);
  ASSERT_EQ(result.status, OrderStatus::Executed) << result.error.value_or("");
  EXPECT_EQ(result.block_number.value_or(0), 16u);
  EXPECT_FALSE(result.error.has_value());

  std::vector<std::string> raw = sentRaw();
  ASSERT_EQ(raw.size(), 2u);
  EXPECT_EQ(result.tx_hash.value_or(""),
            chain::toHex(chain::keccak256(chain::fromHex(raw[1]))));
  // submitLimitOrder(WETH, USDC, amount, price, wallet) sent to the contract.
  EXPECT_TRUE(
      contains(raw[1], chain::toHex(chain::addressBytes(kContract), false)));
  EXPECT_TRUE(contains(raw[1], addressWord(kWeth) + addressWord(kUsdc) +
                                   abiWord("2386f26fc10000") +
                                   abiWord("bdbc41e0348b300000") +
                                   addressWord(kWallet)));

  domain::Order stored = orchestrator->getOrder(order.id);
  EXPECT_EQ(stored.status, OrderStatus::Executed);
  EXPECT_EQ(stored.order_tx_hash, result.tx_hash);
  EXPECT_EQ(client->nextNonce(), 7u);
}

// -----------------------------------------------------------------------------
// 4. A reverted submission ends in FAILED_ONCHAIN with the hash kept.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, RevertedSubmissionFailsOnchain) {
  domain::Order order = orchestrator->createLimitOrder(
      "Sell 0.01 WETH for USDC at 3500", "WETH", "USDC", 0.01, 3500.0);
  orchestrator->initiateGovernanceApproval(order.id);

  rpc->reply("eth_getTransactionReceipt",
             json{{"status", "0x0"}, {"blockNumber", "0x11"}});
  domain::ExecutionResult result = orchestrator->submitAndExecute(order.id);

  EXPECT_EQ(result.status, OrderStatus::FailedOnchain);
  ASSERT_TRUE(result.tx_hash.has_value());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_TRUE(contains(*result.error, "OnchainExecutionFailed"));

  domain::Order stored = orchestrator->getOrder(order.id);
  EXPECT_EQ(stored.status, OrderStatus::FailedOnchain);
  EXPECT_EQ(stored.order_tx_hash, result.tx_hash);
}

// -----------------------------------------------------------------------------
// 5. Token addresses in any letter case reach the same registry entry.
// Why: Addresses copied from explorers are often lower-case, and a
//      mistyped checksum must not make a known token unusable.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, TokenAddressesInAnyCase) {
  const std::vector<std::string> spellings = {
      "0xfff9976782d46cc05630d1f6eb9bc98210fbfcc5",
      "0xFFF9976782D46CC05630D1F6EB9BC98210FBFCC5",
      "0xfFf9976782d46CC05630D1f6eB9Bc98210fBfCc5",  // wrong checksum
  };
  for (const auto& spelling : spellings) {
    domain::Order order = orchestrator->createLimitOrder(
        "sell", spelling, "usdc", 0.01, 3500.0);
    EXPECT_EQ(order.status, OrderStatus::Approved)
        << spelling << ": " << order.last_error.value_or("");
    EXPECT_EQ(order.from_token_address, kWeth);
    EXPECT_EQ(order.to_token_address, kUsdc);
  }

  // USDC by lower-case address: six decimals in the approved amount.
  domain::Order usdc = orchestrator->createLimitOrder(
      "sell", "0x56ad9fb23c8a0b2c9030a9086a0f174a7d4e708e", "WETH", 25.5,
      0.0003);
  ASSERT_EQ(usdc.status, OrderStatus::Approved);
  EXPECT_EQ(usdc.from_token_address, kUsdc);
  std::vector<std::string> raw = sentRaw();
  ASSERT_EQ(raw.size(), spellings.size() + 1);
  EXPECT_TRUE(contains(raw.back(), abiWord("1851960")));
}

// -----------------------------------------------------------------------------
// TokenRegistry
// -----------------------------------------------------------------------------

TEST(TokenRegistry, DefaultsCarryValidChecksums) {
  auto registry = domain::TokenRegistry::withSepoliaDefaults();
  for (const char* symbol : {"WETH", "USDC"}) {
    domain::TokenInfo token = registry.resolve(symbol);
    EXPECT_TRUE(chain::isValidAddress(token.address)) << token.address;
    EXPECT_EQ(token.address, chain::toChecksumAddress(token.address));
  }
  EXPECT_EQ(registry.resolve("weth").decimals, 18u);
  EXPECT_EQ(registry.resolve("Usdc").decimals, 6u);
}

TEST(TokenRegistry, ResolvesAddressesWhateverTheirCase) {
  auto registry = domain::TokenRegistry::withSepoliaDefaults();
  domain::TokenInfo lower =
      registry.resolve("0x56ad9fb23c8a0b2c9030a9086a0f174a7d4e708e");
  EXPECT_EQ(lower.symbol, "USDC");
  EXPECT_EQ(lower.address, kUsdc);
  EXPECT_EQ(lower.decimals, 6u);
  EXPECT_EQ(registry.decimalsFor("0x56AD9FB23C8A0B2C9030A9086A0F174A7D4E708E"),
            6u);
}

// Unregistered values pass through; address-shaped ones are checksummed.
TEST(TokenRegistry, UnknownValuesAreOpaque) {
  auto registry = domain::TokenRegistry::withSepoliaDefaults();

  domain::TokenInfo other =
      registry.resolve("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
  EXPECT_EQ(other.address, "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
  EXPECT_EQ(other.decimals, 18u);

  domain::TokenInfo symbol = registry.resolve("DOGE");
  EXPECT_EQ(symbol.address, "DOGE");
  EXPECT_EQ(symbol.decimals, 18u);

  // Entries added with a lower-case address are stored checksummed.
  registry.add({"LINK", "Chainlink",
                "0x779877a7b0d9e8603169ddbd7836e478b4624789", 18});
  EXPECT_TRUE(chain::isValidAddress(registry.resolve("LINK").address));
}
