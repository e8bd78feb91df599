#include "trustflow/chain/curl_rpc_transport.hpp"
#include "trustflow/errors.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace trustflow {
namespace chain {

namespace {

std::once_flag g_curl_init;

struct EasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::size_t writeCallback(void* contents, std::size_t size, std::size_t nmemb,
                          void* userdata) {
  std::size_t total = size * nmemb;
  static_cast<std::string*>(userdata)->append(static_cast<char*>(contents),
                                              total);
  return total;
}

}  // namespace

CurlRpcTransport::CurlRpcTransport(std::string url, long timeout_ms)
    : url_(std::move(url)), timeout_ms_(timeout_ms) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

nlohmann::json CurlRpcTransport::call(const std::string& method,
                                      const nlohmann::json& params) {
  nlohmann::json request;
  request["jsonrpc"] = "2.0";
  request["method"] = method;
  request["params"] = params;
  request["id"] = next_id_.fetch_add(1);
  const std::string body = request.dump();

  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw RpcError(method + ": failed to initialise curl handle");
  }

  curl_slist* raw_headers =
      curl_slist_append(nullptr, "Content-Type: application/json");
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  std::string response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw RpcError(method + ": " + curl_easy_strerror(res));
  }

  long http_status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
  if (http_status >= 400) {
    throw RpcError(method + ": HTTP " + std::to_string(http_status),
                   static_cast<int>(http_status));
  }

  return unwrapRpcReply(method,
                        nlohmann::json::parse(response, nullptr, false));
}

nlohmann::json unwrapRpcReply(const std::string& method,
                              const nlohmann::json& reply) {
  if (reply.is_discarded() || !reply.is_object()) {
    throw RpcError(method + ": malformed JSON-RPC reply");
  }
  auto err = reply.find("error");
  if (err != reply.end() && !err->is_null()) {
    if (!err->is_object()) {
      throw RpcError(method + ": " + err->dump());
    }
    auto message = err->find("message");
    auto code = err->find("code");
    std::string text = (message != err->end() && message->is_string())
                           ? message->get<std::string>()
                           : err->dump();
    int code_value = 0;
    if (code != err->end() && code->is_number_integer()) {
      code_value = code->get<int>();
    }
    throw RpcError(method + ": " + text, code_value);
  }
  auto result = reply.find("result");
  if (result == reply.end()) {
    throw RpcError(method + ": reply has no result");
  }
  return *result;
}

}  // namespace chain
}  // namespace trustflow
