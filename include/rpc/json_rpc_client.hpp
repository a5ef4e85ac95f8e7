// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_RPC_JSON_RPC_CLIENT_HPP
#define BRIDGERELAY_RPC_JSON_RPC_CLIENT_HPP

#include "rpc/http_client.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace bridgerelay {
namespace rpc {

// The node answered with a JSON-RPC error object
class RpcError : public std::runtime_error {
public:
  RpcError(int64_t code, const std::string &message)
      : std::runtime_error("RPC error " + std::to_string(code) + ": " + message),
        code_(code) {}

  int64_t code() const { return code_; }

private:
  int64_t code_;
};

/**
 * JSON-RPC 2.0 client
 *
 * Call() throws RpcTransportError when the exchange fails or the reply is
 * not a JSON-RPC response, and RpcError when the node returns an error.
 */
class JsonRpcClient {
public:
  explicit JsonRpcClient(std::unique_ptr<RpcTransport> transport);

  nlohmann::json Call(const std::string &method,
                      const nlohmann::json &params = nlohmann::json::array());

  std::string Describe() const { return transport_->Describe(); }

private:
  std::unique_ptr<RpcTransport> transport_;
  std::atomic<uint64_t> next_id_{1};
};

} // namespace rpc
} // namespace bridgerelay

#endif // BRIDGERELAY_RPC_JSON_RPC_CLIENT_HPP
