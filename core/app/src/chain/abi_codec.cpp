#include "trustflow/chain/abi_codec.hpp"
#include "trustflow/chain/address.hpp"
#include "trustflow/chain/keccak.hpp"
#include "trustflow/chain/quantity.hpp"
#include "trustflow/errors.hpp"

#include <stdexcept>
#include <utility>

namespace trustflow {
namespace chain {

namespace {

constexpr std::size_t kWordSize = 32;

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

// Returns the bit width of "uint<N>" / "int<N>", 256 for the bare forms.
unsigned integerBits(const std::string& type, std::size_t prefix_len) {
  if (type.size() == prefix_len) return 256;
  unsigned bits = 0;
  try {
    bits = static_cast<unsigned>(std::stoul(type.substr(prefix_len)));
  } catch (const std::exception&) {
    throw AbiError("malformed integer type: " + type);
  }
  if (bits == 0 || bits > 256 || bits % 8 != 0) {
    throw AbiError("malformed integer type: " + type);
  }
  return bits;
}

bool isDynamic(const std::string& type) {
  return type == "string" || type == "bytes";
}

Bytes padRight(const Bytes& data) {
  Bytes out(data);
  std::size_t rem = out.size() % kWordSize;
  if (rem != 0) out.resize(out.size() + (kWordSize - rem), 0);
  return out;
}

// Integer argument as (magnitude, negative). Accepts JSON numbers and
// decimal or 0x-hex strings with an optional leading '-'.
std::pair<Quantity, bool> integerArgument(const nlohmann::json& value,
                                          const std::string& type) {
  try {
    if (value.is_number_unsigned()) {
      return {static_cast<Quantity>(value.get<std::uint64_t>()), false};
    }
    if (value.is_number_integer()) {
      std::int64_t v = value.get<std::int64_t>();
      if (v < 0) {
        return {static_cast<Quantity>(-(v + 1)) + 1, true};
      }
      return {static_cast<Quantity>(v), false};
    }
    if (value.is_string()) {
      std::string text = value.get<std::string>();
      bool negative = !text.empty() && text[0] == '-';
      if (negative) text = text.substr(1);
      return {parseQuantity(text), negative};
    }
  } catch (const std::invalid_argument& e) {
    throw AbiError("bad " + type + " argument: " + e.what());
  } catch (const std::overflow_error& e) {
    throw AbiError("bad " + type + " argument: " + e.what());
  }
  throw AbiError("expected integer for " + type + ", got " + value.dump());
}

Bytes encodeInteger(const nlohmann::json& value, const std::string& type) {
  bool is_signed = startsWith(type, "int");
  unsigned bits = integerBits(type, is_signed ? 3 : 4);
  auto arg = integerArgument(value, type);
  Quantity magnitude = arg.first;
  bool negative = arg.second;

  if (negative && !is_signed) {
    throw AbiError("negative value for " + type);
  }
  if (bits < 128) {
    Quantity limit = static_cast<Quantity>(1) << (is_signed ? bits - 1 : bits);
    bool fits = negative ? magnitude <= limit : magnitude < limit;
    if (!fits) throw AbiError("value out of range for " + type);
  } else if (is_signed && bits == 128) {
    Quantity limit = static_cast<Quantity>(1) << 127;
    bool fits = negative ? magnitude <= limit : magnitude < limit;
    if (!fits) throw AbiError("value out of range for " + type);
  }

  if (!negative) return toWord(magnitude);

  // Two's complement over 256 bits: high 16 bytes all ones, low 16 bytes
  // are the 128-bit two's complement of the magnitude.
  Bytes word = toWord(~magnitude + 1);
  for (std::size_t i = 0; i < 16; ++i) word[i] = 0xff;
  return word;
}

Bytes hexArgument(const nlohmann::json& value, const std::string& type) {
  if (!value.is_string()) {
    throw AbiError("expected hex string for " + type + ", got " + value.dump());
  }
  try {
    return fromHex(value.get<std::string>());
  } catch (const std::invalid_argument& e) {
    throw AbiError("bad " + type + " argument: " + e.what());
  }
}

Bytes encodeStatic(const std::string& type, const nlohmann::json& value) {
  if (type == "address") {
    if (!value.is_string() || !isValidAddress(value.get<std::string>())) {
      throw AbiError("invalid address argument: " + value.dump());
    }
    Bytes raw = addressBytes(value.get<std::string>());
    Bytes word(kWordSize - raw.size(), 0);
    word.insert(word.end(), raw.begin(), raw.end());
    return word;
  }
  if (type == "bool") {
    if (!value.is_boolean()) {
      throw AbiError("expected boolean, got " + value.dump());
    }
    return toWord(value.get<bool>() ? 1 : 0);
  }
  if (startsWith(type, "uint") || startsWith(type, "int")) {
    return encodeInteger(value, type);
  }
  if (startsWith(type, "bytes")) {
    unsigned n = 0;
    try {
      n = static_cast<unsigned>(std::stoul(type.substr(5)));
    } catch (const std::exception&) {
      throw AbiError("malformed type: " + type);
    }
    if (n == 0 || n > 32) throw AbiError("malformed type: " + type);
    Bytes raw = hexArgument(value, type);
    if (raw.size() > n) {
      throw AbiError("value longer than " + type);
    }
    raw.resize(kWordSize, 0);
    return raw;
  }
  throw AbiError("unsupported ABI type: " + type);
}

Bytes encodeDynamic(const std::string& type, const nlohmann::json& value) {
  Bytes payload;
  if (type == "string") {
    if (!value.is_string()) {
      throw AbiError("expected string, got " + value.dump());
    }
    std::string s = value.get<std::string>();
    payload.assign(s.begin(), s.end());
  } else {
    payload = hexArgument(value, type);
  }
  Bytes out = toWord(static_cast<Quantity>(payload.size()));
  Bytes body = padRight(payload);
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

}  // namespace

// ---- AbiFunction ----

std::string AbiFunction::signature() const {
  std::string sig = name + "(";
  for (std::size_t i = 0; i < input_types.size(); ++i) {
    if (i > 0) sig += ",";
    sig += input_types[i];
  }
  return sig + ")";
}

Bytes AbiFunction::selector() const {
  Hash32 hash = keccak256(signature());
  return Bytes(hash.begin(), hash.begin() + 4);
}

// ---- findFunction ----

AbiFunction findFunction(const nlohmann::json& abi, const std::string& name,
                         std::size_t arg_count) {
  if (!abi.is_array()) {
    throw AbiError("ABI must be a JSON array");
  }
  bool name_seen = false;
  for (const auto& entry : abi) {
    if (entry.value("type", std::string("function")) != "function") continue;
    if (entry.value("name", std::string()) != name) continue;
    name_seen = true;

    const auto inputs = entry.value("inputs", nlohmann::json::array());
    if (inputs.size() != arg_count) continue;

    AbiFunction fn;
    fn.name = name;
    for (const auto& input : inputs) {
      fn.input_types.push_back(input.at("type").get<std::string>());
    }
    return fn;
  }
  if (name_seen) {
    throw AbiError("function " + name + " does not take " +
                   std::to_string(arg_count) + " arguments");
  }
  throw AbiError("function " + name + " not found in ABI");
}

// ---- encodeArguments ----

Bytes encodeArguments(const std::vector<std::string>& types,
                      const nlohmann::json& args) {
  if (!args.is_array() || args.size() != types.size()) {
    throw AbiError("expected " + std::to_string(types.size()) +
                   " arguments, got " + args.dump());
  }

  // Heads are fixed 32-byte slots; dynamic values store an offset into
  // the tail region, measured from the start of the head block.
  Bytes head;
  Bytes tail;
  const std::size_t head_size = types.size() * kWordSize;
  for (std::size_t i = 0; i < types.size(); ++i) {
    const std::string& type = types[i];
    if (type.find('[') != std::string::npos || startsWith(type, "tuple") ||
        startsWith(type, "(")) {
      throw AbiError("unsupported ABI type: " + type);
    }
    if (isDynamic(type)) {
      Bytes offset = toWord(static_cast<Quantity>(head_size + tail.size()));
      head.insert(head.end(), offset.begin(), offset.end());
      Bytes encoded = encodeDynamic(type, args[i]);
      tail.insert(tail.end(), encoded.begin(), encoded.end());
    } else {
      Bytes encoded = encodeStatic(type, args[i]);
      head.insert(head.end(), encoded.begin(), encoded.end());
    }
  }
  head.insert(head.end(), tail.begin(), tail.end());
  return head;
}

// ---- encodeFunctionCall ----

Bytes encodeFunctionCall(const nlohmann::json& abi, const std::string& name,
                         const nlohmann::json& args) {
  if (!args.is_array()) {
    throw AbiError("call arguments must be a JSON array");
  }
  AbiFunction fn = findFunction(abi, name, args.size());
  Bytes calldata = fn.selector();
  Bytes encoded = encodeArguments(fn.input_types, args);
  calldata.insert(calldata.end(), encoded.begin(), encoded.end());
  return calldata;
}

}  // namespace chain
}  // namespace trustflow
