// =============================================================================
// abi_codec_test.cpp
// =============================================================================
// Unit tests for the Solidity ABI encoder.
//
// Validates:
//   - Canonical signatures and selectors of the contract functions we call
//   - Static argument layout (address, uint, int, bool, bytesN)
//   - Dynamic argument layout (string / bytes offsets and padding)
//   - Function lookup by name and arity
//   - Rejection of arrays, tuples, bad addresses and out-of-range integers
// =============================================================================

#include "trustflow/chain/abi_codec.hpp"
#include "trustflow/chain/contract_abis.hpp"
#include "trustflow/chain/hex.hpp"
#include "trustflow/errors.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>

namespace chain = trustflow::chain;
using nlohmann::json;

namespace {

const char* kSpender = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";

std::string word(const chain::Bytes& data, std::size_t index) {
  return chain::toHex(data.data() + index * 32, 32, false);
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. The functions the service calls resolve to the well-known selectors.
// Why: A wrong selector makes every approval revert with no useful reason.
// -----------------------------------------------------------------------------
TEST(AbiCodec, SelectorsOfServiceFunctions) {
  chain::AbiFunction approve =
      chain::findFunction(chain::erc20Abi(), "approve", 2);
  EXPECT_EQ(approve.signature(), "approve(address,uint256)");
  EXPECT_EQ(chain::toHex(approve.selector(), false), "095ea7b3");

  chain::AbiFunction submit =
      chain::findFunction(chain::limitOrderContractAbi(), "submitLimitOrder", 5);
  EXPECT_EQ(submit.signature(),
            "submitLimitOrder(address,address,uint256,uint256,address)");
  EXPECT_EQ(submit.selector().size(), 4u);

  chain::AbiFunction transfer{"transfer", {"address", "uint256"}};
  EXPECT_EQ(chain::toHex(transfer.selector(), false), "a9059cbb");
}

// -----------------------------------------------------------------------------
// 2. approve(spender, amount) calldata: selector + two left-padded words.
// -----------------------------------------------------------------------------
TEST(AbiCodec, ApproveCalldataLayout) {
  chain::Bytes data = chain::encodeFunctionCall(
      chain::erc20Abi(), "approve",
      json::array({kSpender, "100000000000000000"}));

  ASSERT_EQ(data.size(), 4u + 2 * 32u);
  EXPECT_EQ(chain::toHex(data.data(), 4, false), "095ea7b3");
  EXPECT_EQ(chain::toHex(data.data() + 4, 32, false),
            "0000000000000000000000005aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
  EXPECT_EQ(chain::toHex(data.data() + 36, 32, false),
            "000000000000000000000000000000000000000000000000016345785d8a0000");
}

// -----------------------------------------------------------------------------
// 3. baz(uint32,bool) with (69, true) from the Solidity ABI documentation.
// -----------------------------------------------------------------------------
TEST(AbiCodec, DocumentationExampleStaticArguments) {
  chain::AbiFunction baz{"baz", {"uint32", "bool"}};
  EXPECT_EQ(chain::toHex(baz.selector(), false), "cdcd77c0");

  chain::Bytes args = chain::encodeArguments(baz.input_types,
                                             json::array({69, true}));
  ASSERT_EQ(args.size(), 64u);
  EXPECT_EQ(word(args, 0),
            "0000000000000000000000000000000000000000000000000000000000000045");
  EXPECT_EQ(word(args, 1),
            "0000000000000000000000000000000000000000000000000000000000000001");
}

// -----------------------------------------------------------------------------
// 4. Dynamic values are referenced by offset from the start of the heads.
// -----------------------------------------------------------------------------
TEST(AbiCodec, DynamicStringLayout) {
  chain::Bytes args = chain::encodeArguments({"uint256", "string"},
                                             json::array({1, "dave"}));
  ASSERT_EQ(args.size(), 4u * 32u);
  EXPECT_EQ(word(args, 0),
            "0000000000000000000000000000000000000000000000000000000000000001");
  EXPECT_EQ(word(args, 1),
            "0000000000000000000000000000000000000000000000000000000000000040");
  EXPECT_EQ(word(args, 2),
            "0000000000000000000000000000000000000000000000000000000000000004");
  EXPECT_EQ(word(args, 3),
            "6461766500000000000000000000000000000000000000000000000000000000");
}

// -----------------------------------------------------------------------------
// 5. Signed integers use 256-bit two's complement; bytesN pads right.
// -----------------------------------------------------------------------------
TEST(AbiCodec, SignedIntegersAndFixedBytes) {
  chain::Bytes neg = chain::encodeArguments({"int256"}, json::array({-1}));
  EXPECT_EQ(word(neg, 0), std::string(64, 'f'));

  chain::Bytes fixed = chain::encodeArguments({"bytes4"},
                                              json::array({"0xdeadbeef"}));
  EXPECT_EQ(word(fixed, 0),
            "deadbeef00000000000000000000000000000000000000000000000000000000");
}

// -----------------------------------------------------------------------------
// 6. Lookup failures name the problem.
// -----------------------------------------------------------------------------
TEST(AbiCodec, FindFunctionErrors) {
  EXPECT_THROW(chain::findFunction(chain::erc20Abi(), "transferFrom", 3),
               trustflow::AbiError);
  EXPECT_THROW(chain::findFunction(chain::erc20Abi(), "approve", 1),
               trustflow::AbiError);
  EXPECT_THROW(chain::findFunction(json::object(), "approve", 2),
               trustflow::AbiError);
}

// -----------------------------------------------------------------------------
// 7. Invalid arguments raise AbiError before anything is signed.
// Why: A malformed token address must fail the approval step locally rather
//      than broadcast a transaction that reverts and burns gas.
// -----------------------------------------------------------------------------
TEST(AbiCodec, RejectsInvalidArguments) {
  EXPECT_THROW(chain::encodeArguments({"address"}, json::array({"0x1234"})),
               trustflow::AbiError);
  EXPECT_THROW(chain::encodeArguments({"uint256[]"},
                                      json::array({json::array({1, 2})})),
               trustflow::AbiError);
  EXPECT_THROW(chain::encodeArguments({"uint8"}, json::array({256})),
               trustflow::AbiError);
  EXPECT_THROW(chain::encodeArguments({"uint256"}, json::array({-5})),
               trustflow::AbiError);
  EXPECT_THROW(chain::encodeArguments({"uint256"}, json::array({"12abc"})),
               trustflow::AbiError);
  EXPECT_THROW(chain::encodeArguments({"uint256", "bool"}, json::array({1})),
               trustflow::AbiError);
  EXPECT_THROW(chain::encodeFunctionCall(chain::erc20Abi(), "approve",
                                         json::object()),
               trustflow::AbiError);
}
