// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_CHAIN_DRY_RUN_CLIENT_HPP
#define BRIDGERELAY_CHAIN_DRY_RUN_CLIENT_HPP

#include "chain/chain_client.hpp"

#include <atomic>
#include <memory>

namespace bridgerelay {
namespace chain {

/**
 * DryRunChainClient - decorator that never broadcasts
 *
 * Reads and signing go to the wrapped client; Submit() only logs the
 * action and returns a synthetic handle "dry-run-<n>". Checkpoints still
 * advance, so a dry run against a live deployment should use its own
 * datadir.
 */
class DryRunChainClient : public ChainClient {
public:
  explicit DryRunChainClient(std::unique_ptr<ChainClient> inner);

  uint64_t GetChainId() override { return inner_->GetChainId(); }
  uint64_t GetTipHeight() override { return inner_->GetTipHeight(); }
  std::vector<RawLog> GetLogs(uint64_t from_block, uint64_t to_block,
                              const LogFilter &filter) override {
    return inner_->GetLogs(from_block, to_block, filter);
  }
  SignedAction Sign(const RelayAction &action, const std::string &key) override {
    return inner_->Sign(action, key);
  }
  SubmissionHandle Submit(const SignedAction &signed_action) override;

  uint64_t submitted() const { return submitted_.load(); }

private:
  std::unique_ptr<ChainClient> inner_;
  std::atomic<uint64_t> submitted_{0};
};

} // namespace chain
} // namespace bridgerelay

#endif // BRIDGERELAY_CHAIN_DRY_RUN_CLIENT_HPP
