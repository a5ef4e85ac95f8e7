// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_RELAY_ACTION_BUILDER_HPP
#define BRIDGERELAY_RELAY_ACTION_BUILDER_HPP

#include "chain/types.hpp"

#include <cstdint>

namespace bridgerelay {
namespace relay {

/**
 * ActionBuilder - DomainEvent -> RelayAction (mint instruction)
 *
 * Pure: no I/O, no state beyond the destination chain id, so the same
 * event always yields a byte-identical action. Throws MalformedEventError
 * for events that would produce a degenerate mint (zero amount, null
 * recipient/asset/tx hash, wrong destination chain).
 */
class ActionBuilder {
public:
  explicit ActionBuilder(uint64_t destination_chain_id);

  chain::RelayAction Build(const chain::DomainEvent &event) const;

  /**
   * Ordering hint for destination-side sequencing:
   * (block_number << 32) | log_index, which preserves scan order.
   */
  static uint64_t NonceHint(uint64_t block_number, uint32_t log_index);

  uint64_t destination_chain_id() const { return destination_chain_id_; }

private:
  uint64_t destination_chain_id_;
};

} // namespace relay
} // namespace bridgerelay

#endif // BRIDGERELAY_RELAY_ACTION_BUILDER_HPP
