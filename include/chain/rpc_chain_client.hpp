// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_CHAIN_RPC_CHAIN_CLIENT_HPP
#define BRIDGERELAY_CHAIN_RPC_CHAIN_CLIENT_HPP

#include "chain/abi.hpp"
#include "chain/chain_client.hpp"
#include "rpc/json_rpc_client.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace bridgerelay {
namespace chain {

/**
 * Destination-side call parameters (unused for a source client)
 */
struct MintCallConfig {
  Address bridge_contract;
  FunctionSelector mint_selector{};
  uint64_t gas_limit{200000};
};

/**
 * Decode one eth_getLogs entry
 * nullopt if a mandatory field (address, topics, data) is missing or not
 * valid hex. Optional fields that fail to parse are left empty.
 */
std::optional<RawLog> DecodeLogEntry(const nlohmann::json &entry);

/**
 * RpcChainClient - ChainClient over Ethereum-style JSON-RPC
 *
 *   GetChainId   -> eth_chainId
 *   GetTipHeight -> eth_blockNumber
 *   GetLogs      -> eth_getLogs {fromBlock, toBlock, address, topics:[t0]}
 *   Sign         -> eth_signTransaction with the relayer account as `from`
 *                   (the key never leaves the node's signer)
 *   Submit       -> eth_sendRawTransaction
 */
class RpcChainClient : public ChainClient {
public:
  RpcChainClient(std::string name, std::unique_ptr<rpc::RpcTransport> transport,
                 MintCallConfig mint = {});

  uint64_t GetChainId() override;
  uint64_t GetTipHeight() override;
  std::vector<RawLog> GetLogs(uint64_t from_block, uint64_t to_block,
                              const LogFilter &filter) override;
  SignedAction Sign(const RelayAction &action, const std::string &key) override;
  SubmissionHandle Submit(const SignedAction &signed_action) override;

  const std::string &name() const { return name_; }

private:
  // Read-side call: every failure becomes TransientFetchError
  nlohmann::json FetchCall(const std::string &method,
                           const nlohmann::json &params);
  // Write-side call: every failure becomes SubmissionError
  nlohmann::json SubmitCall(const std::string &method,
                            const nlohmann::json &params);

  std::string name_;
  rpc::JsonRpcClient rpc_;
  MintCallConfig mint_;
};

} // namespace chain
} // namespace bridgerelay

#endif // BRIDGERELAY_CHAIN_RPC_CHAIN_CLIENT_HPP
