// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "chain/dry_run_client.hpp"
#include "util/logging.hpp"

namespace bridgerelay {
namespace chain {

DryRunChainClient::DryRunChainClient(std::unique_ptr<ChainClient> inner)
    : inner_(std::move(inner)) {}

SubmissionHandle DryRunChainClient::Submit(const SignedAction &signed_action) {
  const auto &action = signed_action.action;
  uint64_t n = ++submitted_;

  LOG_RELAY_WARN("[DRY RUN] not broadcasting mint of {} ({}) to {} on chain "
                 "{} for {} ({} signed bytes)",
                 action.amount.GetHex(), action.asset_id.GetHex(),
                 action.recipient.GetHex(), action.destination_chain_id,
                 action.idempotency_key.ToString(),
                 signed_action.payload.size());

  return SubmissionHandle{"dry-run-" + std::to_string(n)};
}

} // namespace chain
} // namespace bridgerelay
