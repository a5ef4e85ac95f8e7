// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "rpc/json_rpc_client.hpp"
#include "util/logging.hpp"

namespace bridgerelay {
namespace rpc {

using json = nlohmann::json;

JsonRpcClient::JsonRpcClient(std::unique_ptr<RpcTransport> transport)
    : transport_(std::move(transport)) {}

json JsonRpcClient::Call(const std::string &method, const json &params) {
  const uint64_t id = next_id_++;

  json request;
  request["jsonrpc"] = "2.0";
  request["id"] = id;
  request["method"] = method;
  request["params"] = params;

  LOG_RPC_TRACE("-> {} {}", Describe(), request.dump());
  std::string raw = transport_->Post(request.dump());
  LOG_RPC_TRACE("<- {} {} bytes", Describe(), raw.size());

  json reply;
  try {
    reply = json::parse(raw);
  } catch (const json::parse_error &e) {
    throw RpcTransportError("malformed JSON-RPC reply to " + method + ": " +
                            e.what());
  }

  if (!reply.is_object()) {
    throw RpcTransportError("JSON-RPC reply to " + method +
                            " is not an object");
  }

  if (reply.contains("error") && !reply["error"].is_null()) {
    const json &err = reply["error"];
    int64_t code = 0;
    std::string message = "unknown error";
    if (err.is_object()) {
      if (err.contains("code") && err["code"].is_number_integer()) {
        code = err["code"].get<int64_t>();
      }
      if (err.contains("message") && err["message"].is_string()) {
        message = err["message"].get<std::string>();
      }
    }
    LOG_RPC_DEBUG("{} returned error {}: {}", method, code, message);
    throw RpcError(code, message);
  }

  if (!reply.contains("result")) {
    throw RpcTransportError("JSON-RPC reply to " + method + " has no result");
  }
  if (reply.contains("id") && reply["id"] != json(id)) {
    throw RpcTransportError("JSON-RPC reply id mismatch for " + method);
  }

  return reply["result"];
}

} // namespace rpc
} // namespace bridgerelay
