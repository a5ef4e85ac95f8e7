// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_CHAIN_TYPES_HPP
#define BRIDGERELAY_CHAIN_TYPES_HPP

#include "chain/uint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bridgerelay {
namespace chain {

/**
 * RawLog - one log entry as returned by eth_getLogs
 *
 * Nothing here is trusted: the Range Scanner validates and normalizes
 * entries into DomainEvents and drops whatever does not fit.
 */
struct RawLog {
  Address address;             // Emitting contract
  std::vector<uint256> topics; // topic0 = event signature hash
  std::vector<uint8_t> data;   // Non-indexed arguments, 32-byte words
  std::optional<uint64_t> block_number;
  std::optional<uint256> tx_hash;
  std::optional<uint32_t> log_index;
  bool removed{false}; // Set by the node when a reorg dropped the log
};

/**
 * LogFilter - server-side eth_getLogs filter
 */
struct LogFilter {
  Address contract;
  uint256 event_topic;
};

/**
 * EventId - identity of one source log entry
 *
 * (source_chain_id, tx_hash, log_index) is unique per log and is the
 * idempotency key of the action built from it.
 */
struct EventId {
  uint64_t source_chain_id{0};
  uint256 tx_hash;
  uint32_t log_index{0};

  // Canonical form "<chain_id>:<0xtxhash>:<log_index>", used in the
  // checkpoint file and logs
  std::string ToString() const;
  static std::optional<EventId> FromString(const std::string &str);

  friend bool operator==(const EventId &a, const EventId &b) {
    return a.source_chain_id == b.source_chain_id && a.tx_hash == b.tx_hash &&
           a.log_index == b.log_index;
  }
  friend bool operator!=(const EventId &a, const EventId &b) {
    return !(a == b);
  }
};

struct EventIdHasher {
  size_t operator()(const EventId &id) const noexcept;
};

/**
 * DomainEvent - a validated TokensLocked log
 */
struct DomainEvent {
  uint64_t source_chain_id{0};
  uint64_t source_block_number{0};
  uint256 source_tx_hash;
  uint32_t log_index{0};
  Address sender;
  Address recipient;
  uint256 amount;
  Address asset_id; // Token contract on the source chain
  uint64_t destination_chain_id{0};

  EventId Id() const { return EventId{source_chain_id, source_tx_hash, log_index}; }
};

/**
 * RelayAction - the mint instruction for the destination chain
 *
 * Built from exactly one DomainEvent; equal events give equal actions.
 */
struct RelayAction {
  uint64_t destination_chain_id{0};
  Address recipient;
  uint256 amount;
  Address asset_id;
  EventId idempotency_key;
  uint64_t nonce_hint{0};

  /**
   * Canonical byte encoding (fixed layout, big-endian integers).
   * Two actions are identical iff their encodings are identical.
   */
  std::vector<uint8_t> Serialize() const;

  friend bool operator==(const RelayAction &a, const RelayAction &b) {
    return a.Serialize() == b.Serialize();
  }
};

/**
 * SignedAction - an action plus the authorization produced by
 * ChainClient::Sign (for the RPC client: a raw signed transaction)
 */
struct SignedAction {
  RelayAction action;
  std::vector<uint8_t> payload;
};

/**
 * SubmissionHandle - what the destination returned on acceptance
 * (transaction hash for the RPC client)
 */
struct SubmissionHandle {
  std::string id;
};

} // namespace chain
} // namespace bridgerelay

#endif // BRIDGERELAY_CHAIN_TYPES_HPP
