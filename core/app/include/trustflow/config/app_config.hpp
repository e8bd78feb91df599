#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace trustflow {

// -----------------------------------------------------------------------------
// AppConfig
// -----------------------------------------------------------------------------
// Responsibility: Service settings, read once at startup.
//
// Sources, later ones overriding earlier ones:
//   1. Built-in defaults (IPC endpoints, fee and timeout values).
//   2. Environment:
//        WEB3_RPC_URL_SEPOLIA         rpc_url
//        WALLET_PRIVATE_KEY           private_key
//        DUMMY_LOP_CONTRACT_ADDRESS   contract_address
//        TRUSTFLOW_IPC_CMD_ENDPOINT   ipc_cmd_endpoint
//        TRUSTFLOW_IPC_PUB_ENDPOINT   ipc_pub_endpoint
//        TRUSTFLOW_POLL_INTERVAL_MS   poll_interval_ms
//        TRUSTFLOW_PRIORITY_FEE_GWEI  priority_fee_gwei
//   3. A JSON file whose keys are the field names above.
//
// private_key is never printed; describe() redacts it.
// -----------------------------------------------------------------------------
struct AppConfig {
  using Lookup =
      std::function<std::optional<std::string>(const std::string& name)>;

  std::string rpc_url;
  std::string private_key;
  std::string contract_address;  // Empty: order contract not deployed

  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  std::optional<std::int64_t> poll_interval_ms;  // Unset: chosen from rpc_url
  double priority_fee_gwei{1.0};
  long rpc_timeout_ms{15000};

  std::int64_t approval_timeout_ms{180000};
  std::int64_t submission_timeout_ms{300000};

  // Reads the variables listed above through `lookup`. Throws ConfigError
  // for values that do not parse.
  static AppConfig fromEnvironment(const Lookup& lookup = processEnvironment);

  static std::optional<std::string> processEnvironment(
      const std::string& name);

  // Overrides fields present in the JSON file. Throws ConfigError when
  // the file cannot be read or parsed, or a value has the wrong type.
  void overlayFile(const std::string& path);
  void overlayJson(const nlohmann::json& doc);

  // Throws ConfigError when rpc_url or private_key is missing, or a
  // numeric setting is out of range.
  void validate() const;

  // One-line summary for the startup log.
  std::string describe() const;
};

}  // namespace trustflow
