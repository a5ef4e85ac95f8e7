// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/action_builder.hpp"
#include "util/errors.hpp"

namespace bridgerelay {
namespace relay {

ActionBuilder::ActionBuilder(uint64_t destination_chain_id)
    : destination_chain_id_(destination_chain_id) {}

uint64_t ActionBuilder::NonceHint(uint64_t block_number, uint32_t log_index) {
  return (block_number << 32) | log_index;
}

chain::RelayAction ActionBuilder::Build(const chain::DomainEvent &event) const {
  const std::string id = event.Id().ToString();

  if (event.amount.IsNull()) {
    throw MalformedEventError("event " + id + " has zero amount");
  }
  if (event.recipient.IsNull()) {
    throw MalformedEventError("event " + id + " has null recipient");
  }
  if (event.asset_id.IsNull()) {
    throw MalformedEventError("event " + id + " has null asset");
  }
  if (event.source_tx_hash.IsNull()) {
    throw MalformedEventError("event " + id + " has null transaction hash");
  }
  if (event.destination_chain_id != destination_chain_id_) {
    throw MalformedEventError("event " + id + " targets chain " +
                              std::to_string(event.destination_chain_id) +
                              ", expected " +
                              std::to_string(destination_chain_id_));
  }

  chain::RelayAction action;
  action.destination_chain_id = destination_chain_id_;
  action.recipient = event.recipient;
  action.amount = event.amount;
  action.asset_id = event.asset_id;
  action.idempotency_key = event.Id();
  action.nonce_hint = NonceHint(event.source_block_number, event.log_index);
  return action;
}

} // namespace relay
} // namespace bridgerelay
