#include "trustflow/chain/chain_client.hpp"
#include "trustflow/chain/abi_codec.hpp"
#include "trustflow/chain/address.hpp"
#include "trustflow/chain/contract_abis.hpp"
#include "trustflow/chain/transaction_codec.hpp"
#include "trustflow/errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>

namespace trustflow {
namespace chain {

namespace {

constexpr std::int64_t kLoopbackPollMs = 100;
constexpr std::int64_t kRemotePollMs = 5000;

bool isLoopback(const std::string& endpoint) {
  return endpoint.find("localhost") != std::string::npos ||
         endpoint.find("127.0.0.1") != std::string::npos;
}

std::uint64_t toU64(Quantity q) {
  if (q > std::numeric_limits<std::uint64_t>::max()) {
    throw std::overflow_error("value exceeds 64 bits");
  }
  return static_cast<std::uint64_t>(q);
}

std::uint64_t receiptField(const nlohmann::json& receipt, const char* name) {
  if (!receipt.contains(name) || !receipt[name].is_string()) return 0;
  try {
    return toU64(parseQuantity(receipt[name].get<std::string>()));
  } catch (const std::exception& e) {
    throw RpcError(std::string("eth_getTransactionReceipt: bad ") + name +
                   ": " + e.what());
  }
}

}  // namespace

// ---- Construction ----

ChainClient::ChainClient(std::unique_ptr<IRpcTransport> transport,
                         ChainIdentity identity,
                         const std::string& contract_address,
                         ChainClientOptions options)
    : transport_(std::move(transport)),
      identity_(std::move(identity)),
      options_(std::move(options)) {
  if (!transport_) {
    throw ConfigError("ChainClient requires an RPC transport");
  }

  const std::string endpoint = transport_->endpoint();
  try {
    chain_id_ = toU64(callQuantity("eth_chainId", nlohmann::json::array()));
    next_nonce_ = toU64(callQuantity(
        "eth_getTransactionCount",
        nlohmann::json::array({identity_.address(), "pending"})));
  } catch (const RpcError& e) {
    throw ChainUnavailable("cannot reach ledger node at " + endpoint + ": " +
                           e.what());
  } catch (const std::overflow_error& e) {
    throw ChainUnavailable("ledger node at " + endpoint +
                           " returned an out-of-range value: " + e.what());
  }

  if (isValidAddress(contract_address)) {
    contract_address_ = toChecksumAddress(contract_address);
    contract_usable_ = !sameAddress(contract_address_, kSentinelAddress);
  } else {
    std::cerr << "[ChainClient] WARNING: order contract address '"
              << contract_address
              << "' is not a valid address; approvals and submissions are "
                 "disabled.\n";
    contract_address_ = kSentinelAddress;
    contract_usable_ = false;
  }

  poll_interval_ms_ = options_.poll_interval_ms.value_or(
      isLoopback(endpoint) ? kLoopbackPollMs : kRemotePollMs);

  std::cout << "[ChainClient] Connected to chain " << chain_id_ << " as "
            << identity_.address() << " (nonce " << next_nonce_
            << ", contract " << contract_address_ << ")\n";
}

// ---- callQuantity ----

Quantity ChainClient::callQuantity(const std::string& method,
                                   const nlohmann::json& params) {
  nlohmann::json result = transport_->call(method, params);
  if (!result.is_string()) {
    throw RpcError(method + ": expected quantity, got " + result.dump());
  }
  try {
    return parseQuantity(result.get<std::string>());
  } catch (const std::invalid_argument& e) {
    throw RpcError(method + ": " + e.what());
  } catch (const std::overflow_error& e) {
    throw RpcError(method + ": " + e.what());
  }
}

// ---- estimateFees ----

FeeQuote ChainClient::estimateFees() {
  try {
    nlohmann::json block = transport_->call(
        "eth_getBlockByNumber", nlohmann::json::array({"latest", false}));
    if (block.is_object() && block.contains("baseFeePerGas") &&
        block["baseFeePerGas"].is_string()) {
      Quantity base = parseQuantity(block["baseFeePerGas"].get<std::string>());
      Quantity tip = options_.priority_fee;
      return FeeQuote::eip1559(tip, base * 2 + tip);
    }
    std::cerr << "[ChainClient] Latest block has no baseFeePerGas; using "
                 "legacy gas price.\n";
  } catch (const std::exception& e) {
    std::cerr << "[ChainClient] Dynamic fee estimation failed: " << e.what()
              << ". Falling back to eth_gasPrice.\n";
  }

  try {
    return FeeQuote::legacy(
        callQuantity("eth_gasPrice", nlohmann::json::array()));
  } catch (const std::exception& e) {
    std::cerr << "[ChainClient] eth_gasPrice failed: " << e.what()
              << ". Using default gas price "
              << formatUnits(options_.fallback_gas_price, 9) << " gwei.\n";
  }
  return FeeQuote::legacy(options_.fallback_gas_price);
}

// ---- Transaction building ----

TxIntent ChainClient::buildApprovalTransaction(const std::string& token,
                                               const std::string& spender,
                                               Quantity amount) {
  TxIntent intent = buildGenericCallTransaction(
      token, erc20Abi(), "approve",
      nlohmann::json::array({spender, toDecimalString(amount)}), 0,
      options_.approval_gas_limit);
  intent.label = "approve";
  return intent;
}

TxIntent ChainClient::buildGenericCallTransaction(
    const std::string& contract, const nlohmann::json& abi,
    const std::string& function, const nlohmann::json& args, Quantity value,
    std::uint64_t gas_limit) {
  if (!isValidAddress(contract)) {
    throw AbiError("invalid contract address: " + contract);
  }

  TxIntent intent;
  intent.label = function;
  intent.to = toChecksumAddress(contract);
  intent.data = encodeFunctionCall(abi, function, args);
  intent.value = value;
  intent.gas_limit = gas_limit;
  intent.fee = estimateFees();
  intent.nonce_hint = nextNonce();
  return intent;
}

// ---- signAndBroadcast ----

TransactionHandle ChainClient::signAndBroadcast(const TxIntent& intent) {
  const Quantity cost =
      static_cast<Quantity>(intent.gas_limit) * intent.fee.pricePerGas() +
      intent.value;
  const Quantity available = balance();
  if (available < cost) {
    throw InsufficientFunds("balance " + formatUnits(available, 18) +
                            " ETH is below the worst-case cost " +
                            formatUnits(cost, 18) + " ETH of '" +
                            intent.label + "'");
  }

  std::lock_guard<std::mutex> lock(nonce_mutex_);

  UnsignedTransaction tx;
  tx.chain_id = chain_id_;
  tx.nonce = next_nonce_;
  tx.intent = intent;

  Signature sig = identity_.sign(signingHash(tx));
  Bytes raw = encodeSigned(tx, sig);
  std::string raw_hex = toHex(raw);
  std::string local_hash = toHex(transactionHash(raw));

  nlohmann::json result;
  try {
    result = transport_->call("eth_sendRawTransaction",
                              nlohmann::json::array({raw_hex}));
  } catch (const RpcError& e) {
    std::cerr << "[ChainClient] Broadcast of '" << intent.label
              << "' (nonce " << tx.nonce << ") rejected: " << e.what()
              << "\n";
    throw BroadcastError(e.what());
  }

  ++next_nonce_;

  TransactionHandle handle;
  handle.tx_hash = result.is_string() ? result.get<std::string>() : local_hash;
  handle.nonce = tx.nonce;
  handle.raw_transaction = raw_hex;
  handle.label = intent.label;

  std::cout << "[ChainClient] Sent '" << intent.label << "' tx "
            << handle.tx_hash << " (nonce " << handle.nonce << ")\n";
  return handle;
}

// ---- awaitConfirmation ----

Receipt ChainClient::awaitConfirmation(const TransactionHandle& handle,
                                       std::int64_t timeout_ms) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

  while (true) {
    try {
      nlohmann::json receipt = transport_->call(
          "eth_getTransactionReceipt",
          nlohmann::json::array({handle.tx_hash}));
      if (receipt.is_object()) {
        Receipt out;
        out.tx_hash = handle.tx_hash;
        out.block_number = receiptField(receipt, "blockNumber");
        out.gas_used = receiptField(receipt, "gasUsed");
        out.success = !receipt.contains("status") ||
                      receiptField(receipt, "status") != 0;
        if (!out.success) {
          throw OnchainExecutionFailed(handle.tx_hash, out.block_number);
        }
        std::cout << "[ChainClient] '" << handle.label << "' tx "
                  << handle.tx_hash << " confirmed in block "
                  << out.block_number << "\n";
        return out;
      }
    } catch (const RpcError& e) {
      std::cerr << "[ChainClient] Receipt poll for " << handle.tx_hash
                << " failed: " << e.what() << "\n";
    }

    const auto now = Clock::now();
    if (now >= deadline) {
      throw ConfirmationTimeout(handle.tx_hash, timeout_ms);
    }
    auto wait = std::min<Clock::duration>(
        std::chrono::milliseconds(poll_interval_ms_), deadline - now);
    std::this_thread::sleep_for(wait);
  }
}

// ---- Accessors ----

Quantity ChainClient::balance() {
  return callQuantity("eth_getBalance",
                      nlohmann::json::array({identity_.address(), "latest"}));
}

std::uint64_t ChainClient::nextNonce() const {
  std::lock_guard<std::mutex> lock(nonce_mutex_);
  return next_nonce_;
}

}  // namespace chain
}  // namespace trustflow
