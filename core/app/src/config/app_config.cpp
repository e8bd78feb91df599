#include "trustflow/config/app_config.hpp"
#include "trustflow/errors.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace trustflow {

namespace {

// A tip above a million gwei is a typo, not a fee.
constexpr double kMaxPriorityFeeGwei = 1e6;

std::int64_t parseInteger(const std::string& name, const std::string& text) {
  try {
    std::size_t used = 0;
    long long value = std::stoll(text, &used);
    if (used != text.size()) {
      throw ConfigError(name + " is not an integer: '" + text + "'");
    }
    return value;
  } catch (const std::invalid_argument&) {
    throw ConfigError(name + " is not an integer: '" + text + "'");
  } catch (const std::out_of_range&) {
    throw ConfigError(name + " is out of range: '" + text + "'");
  }
}

double parseDecimal(const std::string& name, const std::string& text) {
  try {
    std::size_t used = 0;
    double value = std::stod(text, &used);
    if (used != text.size()) {
      throw ConfigError(name + " is not a number: '" + text + "'");
    }
    return value;
  } catch (const std::invalid_argument&) {
    throw ConfigError(name + " is not a number: '" + text + "'");
  } catch (const std::out_of_range&) {
    throw ConfigError(name + " is out of range: '" + text + "'");
  }
}

template <typename T>
void readField(const nlohmann::json& doc, const char* key, T& out) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("config field '") + key +
                      "' has the wrong type: " + e.what());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// fromEnvironment()
// -----------------------------------------------------------------------------
AppConfig AppConfig::fromEnvironment(const Lookup& lookup) {
  AppConfig config;

  if (auto v = lookup("WEB3_RPC_URL_SEPOLIA")) config.rpc_url = *v;
  if (auto v = lookup("WALLET_PRIVATE_KEY")) config.private_key = *v;
  if (auto v = lookup("DUMMY_LOP_CONTRACT_ADDRESS")) {
    config.contract_address = *v;
  }
  if (auto v = lookup("TRUSTFLOW_IPC_CMD_ENDPOINT")) {
    config.ipc_cmd_endpoint = *v;
  }
  if (auto v = lookup("TRUSTFLOW_IPC_PUB_ENDPOINT")) {
    config.ipc_pub_endpoint = *v;
  }
  if (auto v = lookup("TRUSTFLOW_POLL_INTERVAL_MS")) {
    config.poll_interval_ms = parseInteger("TRUSTFLOW_POLL_INTERVAL_MS", *v);
  }
  if (auto v = lookup("TRUSTFLOW_PRIORITY_FEE_GWEI")) {
    config.priority_fee_gwei = parseDecimal("TRUSTFLOW_PRIORITY_FEE_GWEI", *v);
  }
  return config;
}

std::optional<std::string> AppConfig::processEnvironment(
    const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

// -----------------------------------------------------------------------------
// overlayFile() / overlayJson()
// -----------------------------------------------------------------------------
void AppConfig::overlayFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("config file " + path + " is not valid JSON: " +
                      e.what());
  }
  overlayJson(doc);
}

void AppConfig::overlayJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("config document must be a JSON object");
  }
  readField(doc, "rpc_url", rpc_url);
  readField(doc, "private_key", private_key);
  readField(doc, "contract_address", contract_address);
  readField(doc, "ipc_cmd_endpoint", ipc_cmd_endpoint);
  readField(doc, "ipc_pub_endpoint", ipc_pub_endpoint);
  readField(doc, "priority_fee_gwei", priority_fee_gwei);
  readField(doc, "rpc_timeout_ms", rpc_timeout_ms);
  readField(doc, "approval_timeout_ms", approval_timeout_ms);
  readField(doc, "submission_timeout_ms", submission_timeout_ms);

  std::int64_t poll = 0;
  if (doc.contains("poll_interval_ms") && !doc["poll_interval_ms"].is_null()) {
    readField(doc, "poll_interval_ms", poll);
    poll_interval_ms = poll;
  }
}

// -----------------------------------------------------------------------------
// validate()
// -----------------------------------------------------------------------------
void AppConfig::validate() const {
  if (rpc_url.empty()) {
    throw ConfigError("WEB3_RPC_URL_SEPOLIA (rpc_url) is not set");
  }
  if (private_key.empty()) {
    throw ConfigError("WALLET_PRIVATE_KEY (private_key) is not set");
  }
  if (poll_interval_ms && *poll_interval_ms <= 0) {
    throw ConfigError("poll_interval_ms must be positive");
  }
  if (!(priority_fee_gwei >= 0.0)) {
    throw ConfigError("priority_fee_gwei must not be negative");
  }
  if (!std::isfinite(priority_fee_gwei) ||
      priority_fee_gwei > kMaxPriorityFeeGwei) {
    throw ConfigError("priority_fee_gwei must be a finite value of at most " +
                      std::to_string(static_cast<long>(kMaxPriorityFeeGwei)));
  }
  if (rpc_timeout_ms <= 0 || approval_timeout_ms <= 0 ||
      submission_timeout_ms <= 0) {
    throw ConfigError("timeouts must be positive");
  }
}

std::string AppConfig::describe() const {
  std::ostringstream out;
  out << "rpc=" << rpc_url << " contract="
      << (contract_address.empty() ? "<unset>" : contract_address)
      << " key=" << (private_key.empty() ? "<unset>" : "<redacted>")
      << " cmd=" << ipc_cmd_endpoint << " pub=" << ipc_pub_endpoint;
  if (poll_interval_ms) {
    out << " poll_ms=" << *poll_interval_ms;
  }
  return out.str();
}

}  // namespace trustflow
