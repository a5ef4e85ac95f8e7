// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_CHAIN_CHAIN_CLIENT_HPP
#define BRIDGERELAY_CHAIN_CHAIN_CLIENT_HPP

#include "chain/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bridgerelay {
namespace chain {

/**
 * Abstract chain access interface
 *
 * One instance talks to the source chain (tip + logs), another to the
 * destination chain (sign + submit). Implementations:
 * - RpcChainClient: Ethereum-style JSON-RPC over HTTP
 * - DryRunChainClient: decorator that signs but never submits
 * - MockChainClient (tests): in-memory chain with failure injection
 *
 * All calls block. Errors are reported by exception:
 * - GetChainId/GetTipHeight/GetLogs throw TransientFetchError
 * - Sign/Submit throw SubmissionError
 */
class ChainClient {
public:
  virtual ~ChainClient() = default;

  // Chain id reported by the node (used for the startup check)
  virtual uint64_t GetChainId() = 0;

  virtual uint64_t GetTipHeight() = 0;

  /**
   * Logs emitted in [from_block, to_block] matching the filter
   * No ordering guarantee; callers sort.
   */
  virtual std::vector<RawLog> GetLogs(uint64_t from_block, uint64_t to_block,
                                      const LogFilter &filter) = 0;

  /**
   * Authorize an action with the relayer key
   * @param key Key handle (the relayer account)
   */
  virtual SignedAction Sign(const RelayAction &action,
                            const std::string &key) = 0;

  virtual SubmissionHandle Submit(const SignedAction &signed_action) = 0;
};

} // namespace chain
} // namespace bridgerelay

#endif // BRIDGERELAY_CHAIN_CHAIN_CLIENT_HPP
